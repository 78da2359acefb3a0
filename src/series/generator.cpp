#include <fxgen/series/generator.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <limits>
#include <string>
#include <tuple>

namespace fxgen::series {

namespace {

// Beyond 2^53 a double no longer counts every step or point exactly.
constexpr double kMaxExact = 9'007'199'254'740'992.0;

constexpr std::int64_t kVolumeCeiling = 1'000;

}  // namespace

auto step_timestamp(const GenerationConfig& config, std::int64_t t) -> Timestamp {
    const auto offset = static_cast<long double>(t) * static_cast<long double>(kNanosPerMinute) /
                        static_cast<long double>(config.density_per_minute);
    return Timestamp{start_of(config.start_date).nanos +
                     static_cast<std::int64_t>(std::floor(offset))};
}

auto step_count(const GenerationConfig& config) -> std::int64_t {
    if (config.density_per_minute <= 0.0 || config.end_date < config.start_date) {
        return 0;
    }
    const auto minutes = days_inclusive(config.start_date, config.end_date) * kMinutesPerDay;
    const double raw = std::ceil(static_cast<double>(minutes) * config.density_per_minute);
    if (raw >= kMaxExact) {
        return std::numeric_limits<std::int64_t>::max();
    }
    auto steps = static_cast<std::int64_t>(raw);
    // ceil() of a product can land one off either way; settle on the exact boundary.
    const auto end_exclusive = start_of(config.end_date).nanos + kNanosPerDay;
    while (steps > 0 && step_timestamp(config, steps - 1).nanos >= end_exclusive) {
        --steps;
    }
    while (step_timestamp(config, steps).nanos < end_exclusive) {
        ++steps;
    }
    return steps;
}

auto volumes_at(Timestamp ts, std::int64_t spread_points) -> std::pair<std::int64_t, std::int64_t> {
    const double seconds = static_cast<double>(ts.nanos) / static_cast<double>(kNanosPerSecond);
    const auto minutes = static_cast<std::int64_t>(std::floor(seconds / 60.0));
    const auto divisor = ((minutes % 1000) + 1000) % 1000 + 1;
    const auto modulus = std::max<std::int64_t>(kVolumeCeiling - spread_points, 1);
    double bid = std::fmod(seconds / static_cast<double>(divisor), static_cast<double>(modulus));
    if (bid < 0.0) {
        bid += static_cast<double>(modulus);
    }
    const auto bid_volume = static_cast<std::int64_t>(bid);
    return {bid_volume, bid_volume + spread_points};
}

SeriesGenerator::SeriesGenerator(GenerationConfig config, std::int64_t steps)
    : config_(std::move(config)),
      context_(make_pattern_context(config_, steps)),
      steps_(steps),
      scale_(std::pow(10.0, config_.digits)) {
    if (config_.pattern == Pattern::Random) {
        stream_ = config_.seed ? PriceStream{*config_.seed} : PriceStream::from_entropy();
    }
}

auto SeriesGenerator::seed() const noexcept -> std::optional<std::uint64_t> {
    if (stream_) {
        return stream_->seed();
    }
    return std::nullopt;
}

auto SeriesGenerator::to_points(double price) const noexcept -> double {
    return std::max(std::round(price * scale_), 1.0);
}

auto SeriesGenerator::next() -> std::optional<PriceRecord> {
    if (cursor_ >= steps_) {
        return std::nullopt;
    }
    const auto t = cursor_++;

    double offset = 0.0;
    if (config_.pattern == Pattern::Random) {
        if (t > 0) {
            walk_ += random_walk_increment(context_, stream_->uniform());
        }
        // The walk always lands on the configured end price.
        offset = t + 1 == steps_ ? 0.0 : walk_;
    } else {
        offset = deterministic_offset(config_.pattern, context_, t);
    }

    const double bid_points = to_points(baseline(config_, t, steps_) + offset);
    const double ask_points = bid_points + static_cast<double>(config_.spread_points);

    PriceRecord record;
    record.timestamp = step_timestamp(config_, t);
    record.bid = bid_points / scale_;
    record.ask = ask_points / scale_;
    if (t == 0) {
        record.bid_volume = 1;
        record.ask_volume = 1 + config_.spread_points;
    } else {
        std::tie(record.bid_volume, record.ask_volume) =
            volumes_at(record.timestamp, config_.spread_points);
    }
    return record;
}

auto make_generator(const GenerationConfig& config) -> std::expected<SeriesGenerator, ConfigError> {
    if (auto valid = validate(config); !valid) {
        return std::unexpected(valid.error());
    }
    const double scale = std::pow(10.0, config.digits);
    if (std::max(config.start_price, config.end_price) * scale >= kMaxExact) {
        return std::unexpected(ConfigError{
            .kind = ConfigErrorKind::InvalidConfiguration,
            .message = "prices are too large to be represented with the requested digits",
        });
    }
    const auto steps = step_count(config);
    if (steps == std::numeric_limits<std::int64_t>::max()) {
        return std::unexpected(ConfigError{
            .kind = ConfigErrorKind::InvalidConfiguration,
            .message = "date range and density imply too many data points",
        });
    }

    SeriesGenerator generator{config, steps};
    spdlog::debug("series: pattern={} steps={} digits={} spread={} seed={}",
                  pattern_name(config.pattern), steps, config.digits, config.spread_points,
                  generator.seed() ? std::to_string(*generator.seed()) : std::string("-"));
    return generator;
}

}  // namespace fxgen::series
