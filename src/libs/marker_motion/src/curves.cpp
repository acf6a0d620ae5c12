#include <marker_motion/curves.hpp>
#include <algorithm>
#include <cmath>
#include <utility>

namespace marker_motion {

namespace {

constexpr double kCubicErrorBound = 0.001;

double evaluate_cubic(double a, double b, double m) {
    return 3.0 * a * (1.0 - m) * (1.0 - m) * m + 3.0 * b * (1.0 - m) * m * m + m * m * m;
}

} // namespace

Curve::Curve() : Curve(linear()) {}

Curve::Curve(std::string name, Fn fn) : name_(std::move(name)), fn_(std::move(fn)) {}

double Curve::transform(double t) const {
    if (t <= 0.0) return 0.0;
    if (t >= 1.0) return 1.0;
    if (linear_ || !fn_) return t;
    return fn_(t);
}

Curve Curve::linear() {
    Curve c("linear", [](double t) { return t; });
    c.linear_ = true;
    return c;
}

// Control points (a, b) and (c, d); the curve starts at (0, 0) and ends at (1, 1).
// x(m) is inverted by bisection, then y(m) is returned.
Curve Curve::cubic(double a, double b, double c, double d) {
    return Curve("cubic", [a, b, c, d](double t) {
        double start = 0.0;
        double end = 1.0;
        for (int i = 0; i < 64; ++i) {
            const double midpoint = (start + end) / 2.0;
            const double estimate = evaluate_cubic(a, c, midpoint);
            if (std::abs(t - estimate) < kCubicErrorBound)
                return evaluate_cubic(b, d, midpoint);
            if (estimate < t)
                start = midpoint;
            else
                end = midpoint;
        }
        return evaluate_cubic(b, d, (start + end) / 2.0);
    });
}

namespace curves {

namespace {

Curve named(std::string name, Curve curve) {
    return Curve(std::move(name), [curve](double t) { return curve.transform(t); });
}

} // namespace

Curve linear() { return Curve::linear(); }
Curve ease() { return named("ease", Curve::cubic(0.25, 0.1, 0.25, 1.0)); }
Curve ease_in() { return named("ease_in", Curve::cubic(0.42, 0.0, 1.0, 1.0)); }
Curve ease_out() { return named("ease_out", Curve::cubic(0.0, 0.0, 0.58, 1.0)); }
Curve ease_in_out() { return named("ease_in_out", Curve::cubic(0.42, 0.0, 0.58, 1.0)); }
Curve fast_out_slow_in() { return named("fast_out_slow_in", Curve::cubic(0.4, 0.0, 0.2, 1.0)); }

Curve decelerate() {
    return Curve("decelerate", [](double t) {
        const double inv = 1.0 - t;
        return 1.0 - inv * inv;
    });
}

std::optional<Curve> from_name(const std::string& name) {
    if (name == "linear") return linear();
    if (name == "ease") return ease();
    if (name == "ease_in") return ease_in();
    if (name == "ease_out") return ease_out();
    if (name == "ease_in_out") return ease_in_out();
    if (name == "fast_out_slow_in") return fast_out_slow_in();
    if (name == "decelerate") return decelerate();
    return std::nullopt;
}

} // namespace curves

} // namespace marker_motion
