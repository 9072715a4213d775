#include "preview/PreviewWidget.hpp"

#include <QDebug>
#include <QKeyEvent>
#include <QPainter>
#include <QPainterPath>
#include <algorithm>
#include <cmath>

namespace {

constexpr size_t kMaxTracePoints = 4096;
constexpr size_t kFpsWindow = 60;

double luminance(const motive::Color& c) {
    return (0.2126 * c.r + 0.7152 * c.g + 0.0722 * c.b) / 255.0;
}

} // namespace

PreviewWidget::PreviewWidget(motive::AnimationOptions options, int fps, QWidget* parent)
    : QWidget(parent), options_(std::move(options)) {
    setFocusPolicy(Qt::StrongFocus);
    setMinimumSize(480, 320);
    clock_.start();
    lastFrameNs_ = clock_.nsecsElapsed();

    frameTimer_ = new QTimer(this);
    frameTimer_->setInterval(std::max(1, 1000 / std::max(1, fps)));
    connect(frameTimer_, &QTimer::timeout, this, [this]() { onFrame(); });
    frameTimer_->start();

    restart();
}

PreviewWidget::~PreviewWidget() {
    // Detach from the shared loop before the callbacks' target goes away
    animation_.reset();
}

void PreviewWidget::restart() {
    animation_.reset();
    trace_.clear();
    swatch_.reset();
    repeats_ = 0;
    complete_ = false;
    minValue_ = 0.0;
    maxValue_ = 1.0;
    runStartMs_ = clock_.nsecsElapsed() / 1e6;

    motive::AnimationOptions o = options_;
    o.driver = motive::frameLoopDriver();
    o.autoplay = true;
    o.onPlay = [this]() {
        playing_ = true;
        qDebug() << "Preview: play" << QString::fromStdString(options_.type);
    };
    o.onStop = [this]() {
        playing_ = false;
        qDebug() << "Preview: stop";
    };
    o.onRepeat = [this]() {
        ++repeats_;
        qDebug() << "Preview: repeat" << repeats_;
    };
    o.onComplete = [this]() {
        complete_ = true;
        playing_ = false;
        qDebug() << "Preview: complete after" << repeats_ << "repeats";
    };
    o.onUpdate = [this](const motive::Value& v) { record(v); };

    try {
        animation_.emplace(motive::animateValue(std::move(o)));
    } catch (const std::invalid_argument& e) {
        qWarning() << "Preview: cannot animate:" << e.what();
        playing_ = false;
    }
    update();
}

void PreviewWidget::togglePlayback() {
    if (!animation_) return;
    if (playing_) {
        animation_->stop();
    } else if (complete_) {
        restart();
    } else {
        animation_->play();
    }
}

void PreviewWidget::sampleAt(double t) {
    motive::AnimationOptions o = options_;
    o.autoplay = false;
    try {
        motive::AnimationControls headless(std::move(o));
        motive::AnimationState s = headless.sample(t);
        qDebug() << "Preview: sample at" << t << "ms ->" << QString::fromStdString(motive::toString(s.value))
                 << (s.done ? "(done)" : "");
    } catch (const std::invalid_argument& e) {
        qWarning() << "Preview: cannot sample:" << e.what();
    }
}

void PreviewWidget::onFrame() {
    motive::FrameLoop::shared().process(clock_.nsecsElapsed() / 1e6);
    updateFps();
    update();
}

void PreviewWidget::record(const motive::Value& v) {
    double y = 0.0;
    if (auto* n = std::get_if<double>(&v)) {
        y = *n;
    } else {
        const motive::Color& c = std::get<motive::Color>(v);
        swatch_ = c;
        y = luminance(c);
    }
    minValue_ = std::min(minValue_, y);
    maxValue_ = std::max(maxValue_, y);
    trace_.push_back(TracePoint{clock_.nsecsElapsed() / 1e6 - runStartMs_, y});
    if (trace_.size() > kMaxTracePoints) trace_.pop_front();
}

void PreviewWidget::updateFps() {
    qint64 now = clock_.nsecsElapsed();
    frameTimesMs_.push_back(double(now - lastFrameNs_) / 1e6);
    lastFrameNs_ = now;
    if (frameTimesMs_.size() > kFpsWindow) frameTimesMs_.pop_front();
    double sum = 0.0;
    for (double ms : frameTimesMs_) sum += ms;
    fps_ = sum > 0.0 ? 1000.0 * double(frameTimesMs_.size()) / sum : 0.0;
}

void PreviewWidget::paintEvent(QPaintEvent*) {
    QPainter p(this);
    p.fillRect(rect(), QColor(24, 24, 24));
    drawGrid(p);
    drawTrace(p);
    drawHud(p);
}

void PreviewWidget::drawGrid(QPainter& p) {
    p.save();
    p.setRenderHint(QPainter::Antialiasing, false);
    p.setPen(QPen(QColor(60, 60, 60)));
    const int columns = 10;
    const int rows = 8;
    for (int i = 0; i <= columns; ++i) {
        double x = width() * double(i) / columns;
        p.drawLine(QPointF(x, 0), QPointF(x, height()));
    }
    for (int i = 0; i <= rows; ++i) {
        double y = height() * double(i) / rows;
        p.drawLine(QPointF(0, y), QPointF(width(), y));
    }
    p.restore();
}

void PreviewWidget::drawTrace(QPainter& p) {
    if (trace_.size() < 2) return;
    p.save();
    p.setRenderHint(QPainter::Antialiasing, true);

    const double span = std::max(1.0, trace_.back().t - trace_.front().t);
    const double range = std::max(1e-6, maxValue_ - minValue_);
    const double margin = 24.0;
    auto toScreen = [&](const TracePoint& tp) {
        double x = margin + (tp.t - trace_.front().t) / span * (width() - 2 * margin);
        double y = height() - margin - (tp.value - minValue_) / range * (height() - 2 * margin);
        return QPointF(x, y);
    };

    QPainterPath path(toScreen(trace_.front()));
    for (size_t i = 1; i < trace_.size(); ++i) path.lineTo(toScreen(trace_[i]));
    p.setPen(QPen(QColor(90, 200, 255), 1.5));
    p.drawPath(path);

    // Current value marker
    p.setBrush(QColor(255, 200, 80));
    p.setPen(Qt::NoPen);
    p.drawEllipse(toScreen(trace_.back()), 4.0, 4.0);
    p.restore();

    if (swatch_) {
        QColor c = QColor::fromRgbF(std::clamp(swatch_->r / 255.0, 0.0, 1.0), std::clamp(swatch_->g / 255.0, 0.0, 1.0),
                                    std::clamp(swatch_->b / 255.0, 0.0, 1.0), std::clamp(swatch_->a, 0.0, 1.0));
        p.fillRect(QRectF(width() - 72, 12, 56, 56), c);
    }
}

void PreviewWidget::drawHud(QPainter& p) {
    p.save();
    p.setPen(QColor(220, 220, 220));
    p.drawText(QPointF(12, 20), statusText());
    p.drawText(QPointF(12, 38), QString("FPS %1").arg(fps_, 0, 'f', 1));
    if (animation_) {
        p.drawText(QPointF(12, 56), QString("value %1").arg(QString::fromStdString(motive::toString(animation_->state().value))));
    }
    p.drawText(QPointF(12, height() - 8), "R restart   Space play/stop   S sample at 500ms");
    p.restore();
}

QString PreviewWidget::statusText() const {
    QString direction = "forward";
    if (animation_ && !animation_->isForwardPlayback()) direction = "reverse";
    QString stateText = complete_ ? "complete" : (playing_ ? "playing" : "stopped");
    return QString("%1 | %2 | %3 | repeats %4")
        .arg(QString::fromStdString(options_.type))
        .arg(motive::repeatTypeName(options_.repeatType))
        .arg(stateText + ", " + direction)
        .arg(repeats_);
}

void PreviewWidget::keyPressEvent(QKeyEvent* e) {
    switch (e->key()) {
    case Qt::Key_R: restart(); break;
    case Qt::Key_Space: togglePlayback(); break;
    case Qt::Key_S: sampleAt(500.0); break;
    default: QWidget::keyPressEvent(e); return;
    }
    update();
}
