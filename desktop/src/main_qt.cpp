#include <QApplication>
#include <QDebug>
#include <QMainWindow>
#include <QStatusBar>
#include <QTimer>
#include <cstdlib>
#include "motive/runner_config.hpp"
#include "preview/PreviewWidget.hpp"

class MainWindow : public QMainWindow {
public:
    MainWindow(motive::AnimationOptions options, int fps) {
        setWindowTitle("Motive Preview");
        preview_ = new PreviewWidget(std::move(options), fps, this);
        setCentralWidget(preview_);
        statusBar()->showMessage(preview_->statusText());

        // Status line follows the run
        auto* statusTimer = new QTimer(this);
        statusTimer->setInterval(250);
        connect(statusTimer, &QTimer::timeout, this, [this]() { statusBar()->showMessage(preview_->statusText()); });
        statusTimer->start();
    }

private:
    PreviewWidget* preview_ {nullptr};
};

static int fps_from_env() {
    const char* env = std::getenv("MOTIVE_PREVIEW_FPS");
    if (!env || !*env) return 60;
    int fps = std::atoi(env);
    return fps > 0 ? fps : 60;
}

int main(int argc, char** argv) {
    QApplication app(argc, argv);

    motive::RunnerConfig cfg;
    try {
        cfg = motive::parseRunnerConfig(argc, argv);
    } catch (const std::exception& e) {
        qCritical() << "motive_preview:" << e.what();
        return 2;
    }
    if (argc <= 1) {
        // Default showcase: a springy value bouncing back and forth
        cfg.animation.type = "spring";
        cfg.animation.keyframes = {0.0, 100.0};
        cfg.animation.repeat = motive::kRepeatForever;
        cfg.animation.repeatType = motive::RepeatType::Reverse;
        cfg.animation.repeatDelay = 250.0;
    }

    MainWindow w(std::move(cfg.animation), fps_from_env());
    w.resize(960, 540);
    w.show();
    return app.exec();
}
