#pragma once

#include <fxgen/series/config.hpp>

#include <cstdint>

namespace fxgen::series {

/// Per-run constants shared by every step of a pattern.
struct PatternContext {
    std::int64_t steps = 0;      ///< Total number of steps N.
    double delta = 0.0;          ///< end_price - start_price.
    double amplitude = 0.0;      ///< Oscillation amplitude A for wave/zigzag.
    double curvature = 0.0;      ///< Exponent k of the curve easing.
    double walk_step = 0.0;      ///< Per-step magnitude of the random walk.
    double volatility = 0.0;
    PatternShape shape;
};

/// Derive the per-run pattern constants from a validated config and step count.
[[nodiscard]] auto make_pattern_context(const GenerationConfig& config, std::int64_t steps)
    -> PatternContext;

/// Run position in [0, 1] of step `t`; 0 for single-step runs.
[[nodiscard]] auto progress(std::int64_t t, std::int64_t steps) noexcept -> double;

/// Straight-line trend between start and end price at step `t`.
[[nodiscard]] auto baseline(const GenerationConfig& config, std::int64_t t,
                            std::int64_t steps) noexcept -> double;

/// Symmetric triangle wave with period 1: 0 at 0, +1 at 1/4, -1 at 3/4.
[[nodiscard]] auto triangle_wave(double phase) noexcept -> double;

/// Deterministic offset of `pattern` at step `t`. `Random` has no closed form and yields 0;
/// its walk is advanced by the generator.
[[nodiscard]] auto deterministic_offset(Pattern pattern, const PatternContext& context,
                                        std::int64_t t) noexcept -> double;

/// Increment of the random walk for one uniform draw in [0, 1).
[[nodiscard]] auto random_walk_increment(const PatternContext& context, double draw) noexcept
    -> double;

}  // namespace fxgen::series
