#pragma once

#include <functional>
#include <optional>
#include <string>

namespace marker_motion {

// Easing applied to the leg fraction before interpolation.
// transform(0) == 0 and transform(1) == 1 always hold; values in between come
// from the wrapped function.
class Curve {
public:
    using Fn = std::function<double(double)>;

    Curve();
    Curve(std::string name, Fn fn);

    double transform(double t) const;
    const std::string& name() const { return name_; }
    bool is_linear() const { return linear_; }

    static Curve linear();
    static Curve cubic(double a, double b, double c, double d);

private:
    std::string name_;
    Fn fn_;
    bool linear_ = false;
};

namespace curves {

Curve linear();
Curve ease();
Curve ease_in();
Curve ease_out();
Curve ease_in_out();
Curve fast_out_slow_in();
Curve decelerate();

// Looks up one of the named presets above.
std::optional<Curve> from_name(const std::string& name);

} // namespace curves

} // namespace marker_motion
