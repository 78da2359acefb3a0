#pragma once

#include <cstdint>
#include <random>

namespace fxgen::series {

/// Pseudo-random stream owned by a single generation run.
///
/// Two streams built from the same seed yield the same sequence of draws.
/// There is no process-wide generator: every run constructs its own stream.
class PriceStream {
   public:
    explicit PriceStream(std::uint64_t seed) : engine_(seed), seed_(seed) {}

    /// Seed from the platform entropy source (non-reproducible runs).
    [[nodiscard]] static auto from_entropy() -> PriceStream {
        std::random_device device;
        const auto high = static_cast<std::uint64_t>(device());
        const auto low = static_cast<std::uint64_t>(device());
        return PriceStream{(high << 32U) ^ low};
    }

    /// Next uniform draw in [0, 1).
    [[nodiscard]] auto uniform() -> double { return uniform_(engine_); }

    [[nodiscard]] auto seed() const noexcept -> std::uint64_t { return seed_; }

   private:
    std::mt19937_64 engine_;
    std::uniform_real_distribution<double> uniform_{0.0, 1.0};
    std::uint64_t seed_;
};

}  // namespace fxgen::series
