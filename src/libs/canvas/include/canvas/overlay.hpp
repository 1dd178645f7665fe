#pragma once

#include <animation/value_animator.hpp>
#include <canvas/task_scheduler.hpp>
#include <functional>
#include <string>
#include <vector>

namespace canvas {

// Transient hint shown on top of the chart.
class Overlay {
public:
    virtual ~Overlay() = default;

    // Fades in over duration_ms, then calls on_shown.
    virtual void show(const std::string& text, int duration_ms = 0, std::function<void()> on_shown = {}) = 0;
    // Waits delay_ms, then fades out over duration_ms.
    virtual void hide(int delay_ms = 0, int duration_ms = 0) = 0;
};

class HintOverlay : public Overlay {
public:
    explicit HintOverlay(TaskScheduler& scheduler);
    ~HintOverlay() override;

    HintOverlay(const HintOverlay&) = delete;
    HintOverlay& operator=(const HintOverlay&) = delete;

    void show(const std::string& text, int duration_ms = 0, std::function<void()> on_shown = {}) override;
    void hide(int delay_ms = 0, int duration_ms = 0) override;

    void tick(float dt) { animator_.tick(dt); }

    const std::string& text() const { return text_; }
    double opacity() const;
    bool visible() const { return visible_; }

private:
    void cancel_pending();
    void fade_out(int duration_ms);

    TaskScheduler& scheduler_;
    animation::ValueAnimator animator_;
    std::vector<TaskScheduler::TaskId> pending_;
    std::string text_;
    bool visible_ = false;
};

} // namespace canvas
