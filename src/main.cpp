#include <iostream>

#include <QApplication>

#include "moodcam/camera.hpp"
#include "moodcam/capture_controller.hpp"
#include "moodcam/config.hpp"
#include "moodcam/emotion_classifier.hpp"
#include "moodcam/face_detector.hpp"
#include "moodcam/main_window.hpp"
#include "moodcam/qt_tick_timer.hpp"

int main(int argc, char** argv) {
    moodcam::AppConfig cfg = moodcam::parse_args(argc, argv);
    if (cfg.show_help) {
        std::cout << moodcam::usage();
        return 0;
    }

    QApplication app(argc, argv);

    std::cout << "[INFO] Starting moodcam\n";
    std::cout << "       source : " << cfg.source << "\n";
    std::cout << "       model  : " << cfg.emotion_model_path << "\n";
    std::cout << "       ORT    : " << (cfg.use_ort ? "requested" : "disabled (OpenCV DNN)") << "\n";

    moodcam::HaarFaceDetector detector;
    if (!detector.init(cfg.cascade_path)) {
        std::cerr << "[WARN] Running without face detection" << std::endl;
    }

    moodcam::DnnEmotionClassifier classifier(cfg.emotion_model_path, cfg.use_ort);
    if (!classifier.ready()) {
        std::cerr << "[WARN] Running without emotion classification" << std::endl;
    } else {
        std::cout << "[INFO] Emotion backend: " << classifier.backend_name() << std::endl;
    }

    moodcam::VideoCaptureDevice camera;
    moodcam::MainWindow window;
    moodcam::QtTickTimer timer;

    moodcam::CaptureController::Options opts;
    opts.source = cfg.source;
    opts.tick_ms = cfg.tick_ms;
    moodcam::CaptureController controller(camera, detector, classifier, window, timer, opts);

    window.on_toggle([&controller] { controller.on_toggle(); });
    window.on_close([&controller] { controller.shutdown(); });
    window.show();

    const int rc = app.exec();
    controller.shutdown();
    std::cout << "[INFO] Stopped moodcam" << std::endl;
    return rc;
}
