#include <fxgen/core/time.hpp>

#include <fmt/core.h>

#include <cctype>
#include <charconv>
#include <chrono>
#include <limits>

namespace fxgen {

namespace {

auto parse_int(std::string_view part) -> std::optional<int> {
    if (part.empty()) {
        return std::nullopt;
    }
    for (char ch : part) {
        if (std::isdigit(static_cast<unsigned char>(ch)) == 0) {
            return std::nullopt;
        }
    }
    int value = 0;
    auto result = std::from_chars(part.data(), part.data() + part.size(), value);
    if (result.ec != std::errc() || result.ptr != part.data() + part.size()) {
        return std::nullopt;
    }
    return value;
}

}  // namespace

auto make_date(int year, unsigned month, unsigned day) -> std::optional<Date> {
    using namespace std::chrono;
    year_month_day ymd{std::chrono::year{year}, std::chrono::month{month}, std::chrono::day{day}};
    if (!ymd.ok()) {
        return std::nullopt;
    }
    sys_days days_since = sys_days{ymd};
    auto days = days_since.time_since_epoch().count();
    if (days < std::numeric_limits<std::int32_t>::min() ||
        days > std::numeric_limits<std::int32_t>::max()) {
        return std::nullopt;
    }
    return Date{static_cast<std::int32_t>(days)};
}

auto parse_date(std::string_view text) -> std::optional<Date> {
    auto first_dot = text.find('.');
    if (first_dot == std::string_view::npos) {
        return std::nullopt;
    }
    auto second_dot = text.find('.', first_dot + 1);
    if (second_dot == std::string_view::npos) {
        return std::nullopt;
    }
    auto year_part = text.substr(0, first_dot);
    auto month_part = text.substr(first_dot + 1, second_dot - first_dot - 1);
    auto day_part = text.substr(second_dot + 1);
    if (year_part.size() != 4 || month_part.size() > 2 || day_part.size() > 2) {
        return std::nullopt;
    }
    auto year = parse_int(year_part);
    auto month = parse_int(month_part);
    auto day = parse_int(day_part);
    if (!year || !month || !day) {
        return std::nullopt;
    }
    return make_date(*year, static_cast<unsigned>(*month), static_cast<unsigned>(*day));
}

auto format_date(Date date) -> std::string {
    using namespace std::chrono;
    sys_days day = sys_days{days{date.days}};
    year_month_day ymd{day};
    return fmt::format("{:04}.{:02}.{:02}", static_cast<int>(ymd.year()),
                       static_cast<unsigned>(ymd.month()), static_cast<unsigned>(ymd.day()));
}

auto format_timestamp(Timestamp ts) -> std::string {
    using namespace std::chrono;
    sys_time<nanoseconds> tp{nanoseconds{ts.nanos}};
    auto day = floor<days>(tp);
    year_month_day ymd{day};
    hh_mm_ss<nanoseconds> hms{tp - day};
    auto millis = duration_cast<milliseconds>(hms.subseconds()).count();
    return fmt::format("{:04}.{:02}.{:02} {:02}:{:02}:{:02}.{:03}", static_cast<int>(ymd.year()),
                       static_cast<unsigned>(ymd.month()), static_cast<unsigned>(ymd.day()),
                       hms.hours().count(), hms.minutes().count(), hms.seconds().count(), millis);
}

auto parse_timestamp(std::string_view text) -> std::optional<Timestamp> {
    if (text.size() < 19 || text[10] != ' ' || text[13] != ':' || text[16] != ':') {
        return std::nullopt;
    }
    auto date = parse_date(text.substr(0, 10));
    auto hour = parse_int(text.substr(11, 2));
    auto minute = parse_int(text.substr(14, 2));
    auto second = parse_int(text.substr(17, 2));
    if (!date || !hour || !minute || !second) {
        return std::nullopt;
    }
    if (*hour > 23 || *minute > 59 || *second > 59) {
        return std::nullopt;
    }
    std::int64_t nanos = 0;
    if (text.size() > 19) {
        if (text[19] != '.') {
            return std::nullopt;
        }
        auto fraction = text.substr(20);
        if (fraction.empty() || fraction.size() > 9) {
            return std::nullopt;
        }
        auto frac = parse_int(fraction);
        if (!frac) {
            return std::nullopt;
        }
        nanos = *frac;
        for (std::size_t i = fraction.size(); i < 9; ++i) {
            nanos *= 10;
        }
    }
    const auto time_of_day =
        ((static_cast<std::int64_t>(*hour) * 3600 + static_cast<std::int64_t>(*minute) * 60 +
          static_cast<std::int64_t>(*second)) *
         kNanosPerSecond) +
        nanos;
    return Timestamp{start_of(*date).nanos + time_of_day};
}

}  // namespace fxgen
