#include <fxgen/series/pattern.hpp>

#include <algorithm>
#include <cmath>
#include <numbers>

namespace fxgen::series {

auto make_pattern_context(const GenerationConfig& config, std::int64_t steps) -> PatternContext {
    PatternContext context;
    context.steps = steps;
    context.delta = config.end_price - config.start_price;
    context.volatility = config.volatility;
    context.shape = config.shape;
    context.curvature = config.volatility;
    const double mean_price = (config.start_price + config.end_price) / 2.0;
    context.amplitude = config.volatility * config.shape.amplitude_ratio * mean_price;
    const double per_step =
        steps > 1 ? std::abs(context.delta) / static_cast<double>(steps - 1) : 0.0;
    context.walk_step = std::max(per_step, point_size(config.digits));
    return context;
}

auto progress(std::int64_t t, std::int64_t steps) noexcept -> double {
    if (steps <= 1) {
        return 0.0;
    }
    return static_cast<double>(t) / static_cast<double>(steps - 1);
}

auto baseline(const GenerationConfig& config, std::int64_t t, std::int64_t steps) noexcept
    -> double {
    const double x = progress(t, steps);
    // Exact at both ends; std::lerp(a, b, 1) == b.
    return std::lerp(config.start_price, config.end_price, x);
}

auto triangle_wave(double phase) noexcept -> double {
    double frac = phase - std::floor(phase);
    if (frac < 0.25) {
        return 4.0 * frac;
    }
    if (frac < 0.75) {
        return 2.0 - 4.0 * frac;
    }
    return 4.0 * frac - 4.0;
}

auto deterministic_offset(Pattern pattern, const PatternContext& context, std::int64_t t) noexcept
    -> double {
    const double x = progress(t, context.steps);
    switch (pattern) {
        case Pattern::None:
        case Pattern::Random:
            return 0.0;
        case Pattern::Curve: {
            const double k = context.curvature;
            if (k == 0.0 || x <= 0.0 || x >= 1.0) {
                return 0.0;
            }
            // (e^{kx} - 1) / (e^k - 1), rewritten to stay finite for large k.
            const double eased = std::exp(k * (x - 1.0)) * std::expm1(-k * x) / std::expm1(-k);
            return context.delta * (eased - x);
        }
        case Pattern::Wave:
            return context.amplitude *
                   std::sin(2.0 * std::numbers::pi * context.shape.wave_cycles * x);
        case Pattern::Zigzag:
            return context.amplitude * triangle_wave(context.shape.zigzag_cycles * x);
    }
    return 0.0;
}

auto random_walk_increment(const PatternContext& context, double draw) noexcept -> double {
    return context.walk_step * context.volatility * (draw - 0.5);
}

}  // namespace fxgen::series
