#include "moodcam/config.hpp"

#include <cstdlib>
#include <cstring>

namespace moodcam {

static bool arg_eq(const char* a, const char* b) {
    return std::strcmp(a, b) == 0;
}

const char* usage() {
    return "Usage: moodcam [--source <index|url>] [--cascade <haarcascade.xml>]\n"
           "               [--emotion-model <onnx>] [--use-ort|--no-ort] [--help]\n";
}

AppConfig parse_args(int argc, char** argv) {
    AppConfig cfg;

    if (const char* env_src = std::getenv("VIDEO_SOURCE")) cfg.source = env_src;
    if (const char* env_haar = std::getenv("OPENCV_HAAR")) cfg.cascade_path = env_haar;
    if (const char* env_model = std::getenv("EMOTION_MODEL")) cfg.emotion_model_path = env_model;

    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];
        auto next = [&]() -> const char* {
            if (i + 1 < argc) return argv[i + 1];
            return nullptr;
        };

        if (arg_eq(arg, "--source") && next()) {
            cfg.source = next();
            i++;
        } else if (arg_eq(arg, "--cascade") && next()) {
            cfg.cascade_path = next();
            i++;
        } else if (arg_eq(arg, "--emotion-model") && next()) {
            cfg.emotion_model_path = next();
            i++;
        } else if (arg_eq(arg, "--no-ort")) {
            cfg.use_ort = false;
        } else if (arg_eq(arg, "--use-ort")) {
            cfg.use_ort = true;
        } else if (arg_eq(arg, "--help") || arg_eq(arg, "-h")) {
            cfg.show_help = true;
        }
    }

    return cfg;
}

}  // namespace moodcam
