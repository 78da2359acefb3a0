#include <fxgen/cli/params.hpp>

#include <CLI/CLI.hpp>
#include <fmt/core.h>

#include <charconv>
#include <cstdint>
#include <cstdlib>
#include <memory>
#include <optional>
#include <string_view>

namespace fxgen::cli {

namespace {

auto trim(std::string_view text) -> std::string_view {
    auto begin = text.find_first_not_of(" \t\r\n");
    if (begin == std::string_view::npos) {
        return {};
    }
    auto end = text.find_last_not_of(" \t\r\n");
    return text.substr(begin, end - begin + 1);
}

template <typename Int>
auto try_parse_int(std::string_view text) -> std::optional<Int> {
    text = trim(text);
    Int value{};
    auto result = std::from_chars(text.data(), text.data() + text.size(), value);
    if (text.empty() || result.ec != std::errc() || result.ptr != text.data() + text.size()) {
        return std::nullopt;
    }
    return value;
}

auto try_parse_double(std::string_view text) -> std::optional<double> {
    std::string owned{trim(text)};
    char* end = nullptr;
    double value = std::strtod(owned.c_str(), &end);
    if (owned.empty() || end != owned.c_str() + owned.size()) {
        return std::nullopt;
    }
    return value;
}

auto invalid(std::string_view name, std::string_view value, std::string_view expected)
    -> std::unexpected<series::ConfigError> {
    return std::unexpected(series::ConfigError{
        .kind = series::ConfigErrorKind::InvalidConfiguration,
        .message = fmt::format("{} '{}' is not {}", name, value, expected),
    });
}

}  // namespace

void add_options(CLI::App& app, Parameters& params) {
    app.option_defaults()->ignore_case();
    app.config_formatter(std::make_shared<CLI::ConfigINI>());
    app.set_config("--config", "", "Read parameters from an INI file (Name=value lines)");

    app.add_option("StartDate,--StartDate", params.start_date,
                   "Starting date of generated data (yyyy.mm.dd)")
        ->capture_default_str();
    app.add_option("EndDate,--EndDate", params.end_date,
                   "Ending date of generated data, inclusive (yyyy.mm.dd)")
        ->capture_default_str();
    app.add_option("StartPrice,--StartPrice", params.start_price, "Starting bid price")
        ->capture_default_str();
    app.add_option("EndPrice,--EndPrice", params.end_price, "Ending bid price")
        ->capture_default_str();
    app.add_option("-o,--OutputFile", params.output_file,
                   "Write generated data to this file ('-' for stdout)")
        ->capture_default_str();
    app.add_option("--Digits", params.digits, "Decimal digits of prices")->capture_default_str();
    app.add_option("-s,--Spread", params.spread, "Spread between bid and ask in points")
        ->capture_default_str();
    app.add_option("--Density", params.density, "Data points per minute")->capture_default_str();
    app.add_option("-p,--Pattern", params.pattern,
                   "Modeling pattern: none, curve, random, wave, zigzag")
        ->capture_default_str();
    app.add_option("--Volatility", params.volatility,
                   "Volatility factor (higher values give larger deviations)")
        ->capture_default_str();
    app.add_option("--Seed", params.seed, "Random seed for reproducible 'random' runs");
    app.add_flag("-v,--Verbose", params.verbose, "Enable verbose logging");
}

auto to_config(const Parameters& params)
    -> std::expected<series::GenerationConfig, series::ConfigError> {
    series::GenerationConfig config;

    auto start = parse_date(trim(params.start_date));
    if (!start) {
        return invalid("StartDate", params.start_date, "a yyyy.mm.dd date");
    }
    auto end = parse_date(trim(params.end_date));
    if (!end) {
        return invalid("EndDate", params.end_date, "a yyyy.mm.dd date");
    }
    config.start_date = *start;
    config.end_date = *end;

    auto start_price = try_parse_double(params.start_price);
    if (!start_price) {
        return invalid("StartPrice", params.start_price, "a number");
    }
    auto end_price = try_parse_double(params.end_price);
    if (!end_price) {
        return invalid("EndPrice", params.end_price, "a number");
    }
    config.start_price = *start_price;
    config.end_price = *end_price;

    auto digits = try_parse_int<int>(params.digits);
    if (!digits) {
        return invalid("Digits", params.digits, "an integer");
    }
    config.digits = *digits;

    auto spread = try_parse_int<std::int64_t>(params.spread);
    if (!spread) {
        return invalid("Spread", params.spread, "an integer");
    }
    config.spread_points = *spread;

    auto density = try_parse_double(params.density);
    if (!density) {
        return invalid("Density", params.density, "a number");
    }
    config.density_per_minute = *density;

    auto volatility = try_parse_double(params.volatility);
    if (!volatility) {
        return invalid("Volatility", params.volatility, "a number");
    }
    config.volatility = *volatility;

    auto pattern = series::parse_pattern(trim(params.pattern));
    if (!pattern) {
        return std::unexpected(pattern.error());
    }
    config.pattern = *pattern;

    if (!trim(params.seed).empty()) {
        auto seed = try_parse_int<std::uint64_t>(params.seed);
        if (!seed) {
            return invalid("Seed", params.seed, "an unsigned integer");
        }
        config.seed = *seed;
    }

    if (auto valid = series::validate(config); !valid) {
        return std::unexpected(valid.error());
    }
    return config;
}

}  // namespace fxgen::cli
