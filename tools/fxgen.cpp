#include <fxgen/cli/params.hpp>
#include <fxgen/io/csv.hpp>
#include <fxgen/series/generator.hpp>

#include <CLI/CLI.hpp>
#include <fmt/core.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <iostream>

auto main(int argc, char** argv) -> int {
    CLI::App app{"fxgen: synthetic FX tick data generator"};
    app.set_version_flag("--version", "fxgen 0.1.0");

    fxgen::cli::Parameters params;
    fxgen::cli::add_options(app, params);

    CLI11_PARSE(app, argc, argv);

    // Logs go to stderr so that '-o -' output stays clean.
    spdlog::set_default_logger(spdlog::stderr_color_mt("fxgen"));
    if (params.verbose) {
        spdlog::set_level(spdlog::level::debug);
    } else {
        spdlog::set_level(spdlog::level::info);
    }

    auto config = fxgen::cli::to_config(params);
    if (!config) {
        fmt::print(stderr, "fxgen: {}\n", config.error().format());
        return 1;
    }

    auto generator = fxgen::series::make_generator(*config);
    if (!generator) {
        fmt::print(stderr, "fxgen: {}\n", generator.error().format());
        return 1;
    }

    spdlog::debug("Spread: {} points", config->spread_points);
    spdlog::debug("Pattern: {}", fxgen::series::pattern_name(config->pattern));

    auto rows = fxgen::cli::writes_to_stdout(params)
                    ? fxgen::io::write_series(std::cout, *generator)
                    : fxgen::io::write_series(params.output_file, *generator);
    if (!rows) {
        fmt::print(stderr, "fxgen: {}\n", rows.error());
        return 1;
    }

    spdlog::info("Generated rows: {}", *rows);
    if (!fxgen::cli::writes_to_stdout(params)) {
        spdlog::info("Output file: {}", params.output_file);
    }
    return 0;
}
