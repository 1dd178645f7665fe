#include <canvas/overlay.hpp>

namespace canvas {

namespace {

const char* const opacity_key = "opacity";

float seconds(int ms) {
    return ms > 0 ? static_cast<float>(ms) / 1000.0f : 0.0f;
}

std::uint64_t millis(int ms) {
    return ms > 0 ? static_cast<std::uint64_t>(ms) : 0;
}

} // namespace

HintOverlay::HintOverlay(TaskScheduler& scheduler)
    : scheduler_(scheduler)
{
    animator_.set_value(opacity_key, 0.0);
}

HintOverlay::~HintOverlay() {
    cancel_pending();
}

double HintOverlay::opacity() const {
    return animator_.get_current(opacity_key);
}

void HintOverlay::cancel_pending() {
    for (auto id : pending_)
        scheduler_.cancel(id);
    pending_.clear();
}

void HintOverlay::show(const std::string& text, int duration_ms, std::function<void()> on_shown) {
    // A newer show/hide supersedes any step still waiting from an older one.
    cancel_pending();
    text_ = text;
    visible_ = true;
    animator_.set_target(opacity_key, 1.0, seconds(duration_ms));
    if (on_shown) {
        pending_.push_back(scheduler_.schedule(millis(duration_ms), std::move(on_shown)));
    }
}

void HintOverlay::hide(int delay_ms, int duration_ms) {
    cancel_pending();
    if (delay_ms <= 0) {
        fade_out(duration_ms);
        return;
    }
    pending_.push_back(scheduler_.schedule(millis(delay_ms), [this, duration_ms] { fade_out(duration_ms); }));
}

void HintOverlay::fade_out(int duration_ms) {
    animator_.set_target(opacity_key, 0.0, seconds(duration_ms));
    if (duration_ms <= 0) {
        visible_ = false;
        return;
    }
    pending_.push_back(scheduler_.schedule(millis(duration_ms), [this] { visible_ = false; }));
}

} // namespace canvas
