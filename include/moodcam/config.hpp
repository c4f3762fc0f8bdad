#pragma once

#include <string>

namespace moodcam {

struct AppConfig {
    std::string source{"0"};          // camera index as string or URL/file
    std::string cascade_path{};       // empty: OPENCV_HAAR or system install
    std::string emotion_model_path{"models/emotion_mini_xception.onnx"};
    bool use_ort{true};               // use ONNX Runtime when built with it
    int tick_ms{33};
    bool show_help{false};
};

// Environment first, then flags. Unrecognised arguments are left alone so
// the GUI toolkit can consume its own.
AppConfig parse_args(int argc, char** argv);

const char* usage();

}  // namespace moodcam
