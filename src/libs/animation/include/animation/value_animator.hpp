#pragma once

#include <string>
#include <unordered_map>

namespace animation {

// Steps named scalar values towards their targets, each over its own duration.
class ValueAnimator {
public:
    ValueAnimator();

    // Starts a transition from the current value. A zero duration jumps.
    void set_target(const std::string& id, double target, float duration_seconds);
    void set_value(const std::string& id, double value);
    void tick(float dt);

    double get_current(const std::string& id, double fallback = 0.0) const;
    double get_target(const std::string& id, double fallback = 0.0) const;
    bool is_settled(const std::string& id) const;
    bool is_settled() const;

private:
    struct State {
        double from = 0.0;
        double current = 0.0;
        double target = 0.0;
        float elapsed = 0.0f;
        float duration = 0.0f;
    };
    std::unordered_map<std::string, State> state_;
};

} // namespace animation
