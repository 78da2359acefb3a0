#pragma once

#include <fxgen/core/time.hpp>

#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>

namespace fxgen::series {

/// Modeling pattern shaping how the price deviates from the straight-line trend.
enum class Pattern : std::uint8_t {
    None,
    Curve,
    Random,
    Wave,
    Zigzag,
};

/// Tuning constants for the deterministic pattern shapes.
struct PatternShape {
    /// Number of sine periods spanned by the whole run (`wave`).
    double wave_cycles = 1.5;
    /// Number of triangle periods spanned by the whole run (`zigzag`).
    double zigzag_cycles = 6.0;
    /// Baseline oscillation amplitude as a fraction of the mean envelope price.
    double amplitude_ratio = 0.05;
};

/// Largest supported `digits`; beyond this a double no longer holds the rounded price exactly.
inline constexpr int kMaxDigits = 15;

/// Parameters of one generation run.
struct GenerationConfig {
    Date start_date;
    Date end_date;
    double start_price = 1.0;
    double end_price = 2.0;
    int digits = 5;
    std::int64_t spread_points = 10;
    double density_per_minute = 1.0;
    Pattern pattern = Pattern::None;
    double volatility = 1.0;
    std::optional<std::uint64_t> seed;
    PatternShape shape;
};

enum class ConfigErrorKind : std::uint8_t {
    InvalidConfiguration,
    UnsupportedPattern,
};

/// Configuration failure, always reported before any record is produced.
struct ConfigError {
    ConfigErrorKind kind = ConfigErrorKind::InvalidConfiguration;
    std::string message;

    [[nodiscard]] auto format() const -> std::string;
};

/// Check every invariant of `config`. Returns the first violation found.
[[nodiscard]] auto validate(const GenerationConfig& config) -> std::expected<void, ConfigError>;

/// Look up a pattern by name (`none`, `curve`, `random`, `wave`, `zigzag`), ignoring case.
[[nodiscard]] auto parse_pattern(std::string_view name) -> std::expected<Pattern, ConfigError>;

[[nodiscard]] auto pattern_name(Pattern pattern) noexcept -> std::string_view;

/// Size of one point (`10^-digits`).
[[nodiscard]] auto point_size(int digits) -> double;

}  // namespace fxgen::series
