#pragma once

#include <QElapsedTimer>
#include <QPointF>
#include <QTimer>
#include <QWidget>
#include <deque>
#include <optional>
#include "motive/animation.hpp"

// Plays one animation on the shared frame loop and plots its values.
// A QTimer pumps motive::FrameLoop::shared() with QElapsedTimer timestamps.
class PreviewWidget : public QWidget {
    Q_OBJECT
public:
    explicit PreviewWidget(motive::AnimationOptions options, int fps = 60, QWidget* parent = nullptr);
    ~PreviewWidget() override;

    void restart();
    void togglePlayback();
    // Replace the live run with a headless sample at t ms
    void sampleAt(double t);

    QString statusText() const;

protected:
    void paintEvent(QPaintEvent* e) override;
    void keyPressEvent(QKeyEvent* e) override;

private:
    struct TracePoint {
        double t;     // ms since the run started
        double value; // numeric value, or the colour's luminance
    };

    void onFrame();
    void record(const motive::Value& v);
    void drawGrid(QPainter& p);
    void drawTrace(QPainter& p);
    void drawHud(QPainter& p);
    void updateFps();

    motive::AnimationOptions options_;
    std::optional<motive::AnimationControls> animation_;
    QTimer* frameTimer_ {nullptr};
    QElapsedTimer clock_;
    double runStartMs_ {0.0};
    qint64 lastFrameNs_ {0};
    std::deque<double> frameTimesMs_;
    double fps_ {0.0};

    std::deque<TracePoint> trace_;
    std::optional<motive::Color> swatch_;
    int repeats_ {0};
    bool complete_ {false};
    bool playing_ {false};
    double minValue_ {0.0};
    double maxValue_ {1.0};
};
