#pragma once

#include <fxgen/core/time.hpp>
#include <fxgen/series/config.hpp>
#include <fxgen/series/pattern.hpp>
#include <fxgen/series/random.hpp>

#include <cstddef>
#include <cstdint>
#include <expected>
#include <iterator>
#include <optional>
#include <utility>

namespace fxgen::series {

/// One generated quote.
struct PriceRecord {
    Timestamp timestamp;
    double bid = 0.0;
    double ask = 0.0;
    std::int64_t bid_volume = 0;
    std::int64_t ask_volume = 0;
};

/// Number of steps N implied by the date range and density of `config`.
///
/// Every step's timestamp lies strictly before midnight after `end_date`.
[[nodiscard]] auto step_count(const GenerationConfig& config) -> std::int64_t;

/// Timestamp of step `t`: start_date 00:00 plus t * (60 / density) seconds, floored to ns.
[[nodiscard]] auto step_timestamp(const GenerationConfig& config, std::int64_t t) -> Timestamp;

/// Deterministic pseudo-volumes derived from a record timestamp.
[[nodiscard]] auto volumes_at(Timestamp ts, std::int64_t spread_points)
    -> std::pair<std::int64_t, std::int64_t>;

/// Lazy, finite, single-pass producer of the price series for one config.
///
/// Records are computed on demand by next() and are not retained. The
/// generator cannot be rewound or copied; build a new one with
/// make_generator() (same config and seed) to reproduce the sequence.
class SeriesGenerator {
   public:
    class Iterator {
       public:
        using iterator_category = std::input_iterator_tag;
        using value_type = PriceRecord;
        using difference_type = std::ptrdiff_t;
        using pointer = const PriceRecord*;
        using reference = const PriceRecord&;

        Iterator() = default;
        explicit Iterator(SeriesGenerator* generator) : generator_(generator) { advance(); }

        [[nodiscard]] auto operator*() const -> const PriceRecord& { return *current_; }
        [[nodiscard]] auto operator->() const -> const PriceRecord* { return &*current_; }

        auto operator++() -> Iterator& {
            advance();
            return *this;
        }
        void operator++(int) { advance(); }

        friend auto operator==(const Iterator& it, std::default_sentinel_t) -> bool {
            return !it.current_.has_value();
        }

       private:
        void advance() {
            if (generator_ != nullptr) {
                current_ = generator_->next();
            }
        }

        SeriesGenerator* generator_ = nullptr;
        std::optional<PriceRecord> current_;
    };

    SeriesGenerator(const SeriesGenerator&) = delete;
    auto operator=(const SeriesGenerator&) -> SeriesGenerator& = delete;
    SeriesGenerator(SeriesGenerator&&) noexcept = default;
    auto operator=(SeriesGenerator&&) noexcept -> SeriesGenerator& = default;
    ~SeriesGenerator() = default;

    /// Produce the next record, or nullopt once the series is exhausted.
    [[nodiscard]] auto next() -> std::optional<PriceRecord>;

    /// Total number of steps N of the run.
    [[nodiscard]] auto size() const noexcept -> std::int64_t { return steps_; }

    /// Steps not yet produced.
    [[nodiscard]] auto remaining() const noexcept -> std::int64_t { return steps_ - cursor_; }

    [[nodiscard]] auto config() const noexcept -> const GenerationConfig& { return config_; }

    /// Seed of the random stream; set only for the `random` pattern.
    [[nodiscard]] auto seed() const noexcept -> std::optional<std::uint64_t>;

    /// Begin single-pass iteration. Computes the first record.
    [[nodiscard]] auto begin() -> Iterator { return Iterator{this}; }
    [[nodiscard]] auto end() const noexcept -> std::default_sentinel_t { return {}; }

   private:
    SeriesGenerator(GenerationConfig config, std::int64_t steps);

    friend auto make_generator(const GenerationConfig& config)
        -> std::expected<SeriesGenerator, ConfigError>;

    [[nodiscard]] auto to_points(double price) const noexcept -> double;

    GenerationConfig config_;
    PatternContext context_;
    std::int64_t steps_ = 0;
    std::int64_t cursor_ = 0;
    double scale_ = 1.0;
    double walk_ = 0.0;
    std::optional<PriceStream> stream_;
};

/// Validate `config` and build a fresh generator for it.
///
/// All failures are reported here, before the first record is produced.
[[nodiscard]] auto make_generator(const GenerationConfig& config)
    -> std::expected<SeriesGenerator, ConfigError>;

}  // namespace fxgen::series
