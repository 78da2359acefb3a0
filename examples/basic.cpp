#include <fxgen/fxgen.hpp>

#include <fmt/core.h>

auto main() -> int {
    // One trading day of EUR/USD-like quotes, five points per minute, wave-shaped
    fxgen::series::GenerationConfig config;
    config.start_date = fxgen::parse_date("2021.03.01").value();
    config.end_date = config.start_date;
    config.start_price = 1.2050;
    config.end_price = 1.2110;
    config.density_per_minute = 5;
    config.pattern = fxgen::series::Pattern::Wave;
    config.volatility = 0.05;

    auto generator = fxgen::series::make_generator(config);
    if (!generator) {
        fmt::print("error: {}\n", generator.error().format());
        return 1;
    }

    fmt::print("=== Lazy generation ===\n");
    fmt::print("steps: {}\n", generator->size());
    int shown = 0;
    for (const auto& record : *generator) {
        fmt::print("{}\n", fxgen::io::format_record(record, config.digits));
        if (++shown == 5) {
            break;
        }
    }

    fmt::print("\n=== Columnar collection ===\n");
    auto table = fxgen::series::collect(*generator);
    auto above = table.bid.filter([&](double bid) { return bid > config.end_price; });
    fmt::print("remaining rows: {}\n", table.rows());
    fmt::print("bids above end price: {}\n", above.size());
    fmt::print("last quote: {}\n", fxgen::io::format_record(table.record(table.rows() - 1),
                                                             config.digits));
    return 0;
}
