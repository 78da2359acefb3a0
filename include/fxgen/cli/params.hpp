#pragma once

#include <fxgen/series/config.hpp>

#include <expected>
#include <string>

namespace CLI {
class App;
}  // namespace CLI

namespace fxgen::cli {

/// Raw generation parameters as supplied on the command line or in an INI file.
///
/// Values stay textual until to_config() so that malformed numbers and dates
/// are reported as configuration errors rather than parser failures.
struct Parameters {
    std::string output_file = "data.csv";
    std::string start_date = "2020.01.01";
    std::string end_date = "2020.01.31";
    std::string start_price = "1.00";
    std::string end_price = "2.00";
    std::string digits = "5";
    std::string spread = "10";
    std::string density = "1";
    std::string pattern = "none";
    std::string volatility = "1.0";
    /// Empty means no seed: the random pattern draws from the entropy source.
    std::string seed;
    bool verbose = false;
};

/// Register every parameter on `app`. Long names are case-insensitive, the four
/// range values are also accepted as positionals, and `--config` reads an INI file.
void add_options(CLI::App& app, Parameters& params);

/// Convert and validate raw parameters.
[[nodiscard]] auto to_config(const Parameters& params)
    -> std::expected<series::GenerationConfig, series::ConfigError>;

/// True when the output file designates standard output.
[[nodiscard]] inline auto writes_to_stdout(const Parameters& params) -> bool {
    return params.output_file == "-";
}

}  // namespace fxgen::cli
