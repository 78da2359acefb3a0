#pragma once

#include <compare>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace fxgen {

inline constexpr std::int64_t kNanosPerSecond = 1'000'000'000;
inline constexpr std::int64_t kNanosPerMinute = 60 * kNanosPerSecond;
inline constexpr std::int64_t kNanosPerDay = 86'400 * kNanosPerSecond;
inline constexpr std::int64_t kMinutesPerDay = 1'440;

/// Calendar date in days since 1970-01-01 (Unix epoch).
struct Date {
    std::int32_t days = 0;
    auto operator<=>(const Date&) const = default;
};

/// Instant in nanoseconds since 1970-01-01T00:00:00Z (Unix epoch).
struct Timestamp {
    std::int64_t nanos = 0;
    auto operator<=>(const Timestamp&) const = default;
};

/// Midnight (00:00:00 UTC) at the start of `date`.
[[nodiscard]] constexpr auto start_of(Date date) noexcept -> Timestamp {
    return Timestamp{static_cast<std::int64_t>(date.days) * kNanosPerDay};
}

/// Number of calendar days in the inclusive range [first, last].
[[nodiscard]] constexpr auto days_inclusive(Date first, Date last) noexcept -> std::int64_t {
    return static_cast<std::int64_t>(last.days) - static_cast<std::int64_t>(first.days) + 1;
}

/// Parse a `yyyy.mm.dd` date. Returns nullopt on malformed or impossible dates.
[[nodiscard]] auto parse_date(std::string_view text) -> std::optional<Date>;

/// Build a date from calendar fields. Returns nullopt when the fields are not a valid date.
[[nodiscard]] auto make_date(int year, unsigned month, unsigned day) -> std::optional<Date>;

/// Format as `yyyy.mm.dd`.
[[nodiscard]] auto format_date(Date date) -> std::string;

/// Format as `yyyy.mm.dd HH:MM:SS.mmm` (millisecond precision, truncated).
[[nodiscard]] auto format_timestamp(Timestamp ts) -> std::string;

/// Parse the `yyyy.mm.dd HH:MM:SS[.fff]` form written by format_timestamp().
[[nodiscard]] auto parse_timestamp(std::string_view text) -> std::optional<Timestamp>;

}  // namespace fxgen

namespace std {

template <>
struct hash<fxgen::Date> {
    auto operator()(const fxgen::Date& d) const noexcept -> std::size_t {
        return std::hash<std::int32_t>{}(d.days);
    }
};

template <>
struct hash<fxgen::Timestamp> {
    auto operator()(const fxgen::Timestamp& ts) const noexcept -> std::size_t {
        return std::hash<std::int64_t>{}(ts.nanos);
    }
};

}  // namespace std
