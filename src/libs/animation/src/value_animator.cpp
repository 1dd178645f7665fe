#include <animation/value_animator.hpp>
#include <algorithm>

namespace animation {

ValueAnimator::ValueAnimator() = default;

void ValueAnimator::set_target(const std::string& id, double target, float duration_seconds) {
    State& s = state_[id];
    s.from = s.current;
    s.target = target;
    s.elapsed = 0.0f;
    s.duration = std::max(0.0f, duration_seconds);
    if (s.duration == 0.0f)
        s.current = target;
}

void ValueAnimator::set_value(const std::string& id, double value) {
    State& s = state_[id];
    s.from = s.current = s.target = value;
    s.elapsed = s.duration = 0.0f;
}

static double ease_out(double t) {
    if (t >= 1.0) return 1.0;
    return 1.0 - (1.0 - t) * (1.0 - t);
}

void ValueAnimator::tick(float dt) {
    if (dt <= 0.f) return;
    for (auto& [id, s] : state_) {
        if (s.current == s.target) continue;
        s.elapsed += dt;
        if (s.elapsed >= s.duration) {
            s.current = s.target;
            continue;
        }
        const double t = ease_out(static_cast<double>(s.elapsed) / static_cast<double>(s.duration));
        s.current = s.from + (s.target - s.from) * t;
    }
}

double ValueAnimator::get_current(const std::string& id, double fallback) const {
    auto it = state_.find(id);
    if (it == state_.end()) return fallback;
    return it->second.current;
}

double ValueAnimator::get_target(const std::string& id, double fallback) const {
    auto it = state_.find(id);
    if (it == state_.end()) return fallback;
    return it->second.target;
}

bool ValueAnimator::is_settled(const std::string& id) const {
    auto it = state_.find(id);
    return it == state_.end() || it->second.current == it->second.target;
}

bool ValueAnimator::is_settled() const {
    return std::all_of(state_.begin(), state_.end(),
        [](const auto& entry) { return entry.second.current == entry.second.target; });
}

} // namespace animation
