#include <fxgen/series/config.hpp>

#include <fmt/core.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <cmath>
#include <utility>

namespace fxgen::series {

namespace {

constexpr std::array<std::pair<std::string_view, Pattern>, 5> kPatternNames = {{
    {"none", Pattern::None},
    {"curve", Pattern::Curve},
    {"random", Pattern::Random},
    {"wave", Pattern::Wave},
    {"zigzag", Pattern::Zigzag},
}};

auto invalid(std::string message) -> std::unexpected<ConfigError> {
    return std::unexpected(ConfigError{
        .kind = ConfigErrorKind::InvalidConfiguration,
        .message = std::move(message),
    });
}

auto iequals(std::string_view lhs, std::string_view rhs) -> bool {
    return std::ranges::equal(lhs, rhs, [](char a, char b) {
        return std::tolower(static_cast<unsigned char>(a)) ==
               std::tolower(static_cast<unsigned char>(b));
    });
}

}  // namespace

auto ConfigError::format() const -> std::string {
    switch (kind) {
        case ConfigErrorKind::InvalidConfiguration:
            return fmt::format("invalid configuration: {}", message);
        case ConfigErrorKind::UnsupportedPattern:
            return fmt::format("unsupported pattern: {}", message);
    }
    return message;
}

auto validate(const GenerationConfig& config) -> std::expected<void, ConfigError> {
    if (config.end_date < config.start_date) {
        return invalid(fmt::format("end date {} precedes start date {}",
                                   format_date(config.end_date), format_date(config.start_date)));
    }
    if (!std::isfinite(config.start_price) || config.start_price <= 0.0) {
        return invalid(fmt::format("start price must be larger than zero (got {})",
                                   config.start_price));
    }
    if (!std::isfinite(config.end_price) || config.end_price <= 0.0) {
        return invalid(fmt::format("end price must be larger than zero (got {})",
                                   config.end_price));
    }
    if (config.digits < 0 || config.digits > kMaxDigits) {
        return invalid(
            fmt::format("digits must be between 0 and {} (got {})", kMaxDigits, config.digits));
    }
    if (config.spread_points < 0) {
        return invalid(fmt::format("spread must not be negative (got {})", config.spread_points));
    }
    if (!std::isfinite(config.density_per_minute) || config.density_per_minute < 0.0) {
        return invalid(fmt::format("density must not be negative (got {})",
                                   config.density_per_minute));
    }
    if (!std::isfinite(config.volatility) || config.volatility < 0.0) {
        return invalid(
            fmt::format("volatility must not be negative (got {})", config.volatility));
    }
    const auto& shape = config.shape;
    if (!std::isfinite(shape.wave_cycles) || shape.wave_cycles < 0.0 ||
        !std::isfinite(shape.zigzag_cycles) || shape.zigzag_cycles < 0.0 ||
        !std::isfinite(shape.amplitude_ratio) || shape.amplitude_ratio < 0.0) {
        return invalid("pattern shape parameters must be finite and non-negative");
    }
    return {};
}

auto parse_pattern(std::string_view name) -> std::expected<Pattern, ConfigError> {
    for (const auto& [key, pattern] : kPatternNames) {
        if (iequals(key, name)) {
            return pattern;
        }
    }
    return std::unexpected(ConfigError{
        .kind = ConfigErrorKind::UnsupportedPattern,
        .message = fmt::format("'{}' (expected one of none, curve, random, wave, zigzag)", name),
    });
}

auto pattern_name(Pattern pattern) noexcept -> std::string_view {
    for (const auto& [key, value] : kPatternNames) {
        if (value == pattern) {
            return key;
        }
    }
    return "none";
}

auto point_size(int digits) -> double {
    return std::pow(10.0, -static_cast<double>(digits));
}

}  // namespace fxgen::series
