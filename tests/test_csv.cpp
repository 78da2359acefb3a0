#include <fxgen/io/csv.hpp>
#include <fxgen/series/generator.hpp>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

using Catch::Approx;

namespace {

auto write_file(const std::filesystem::path& path, const char* content) {
    std::ofstream out(path);
    out << content;
}

auto tmp(const char* name) -> std::filesystem::path {
    return std::filesystem::temp_directory_path() / name;
}

auto single_day_config() -> fxgen::series::GenerationConfig {
    fxgen::series::GenerationConfig config;
    config.start_date = fxgen::parse_date("2020.01.01").value();
    config.end_date = config.start_date;
    config.start_price = 1.0;
    config.end_price = 1.0;
    config.digits = 5;
    config.spread_points = 10;
    return config;
}

}  // namespace

TEST_CASE("Format a record as a CSV line", "[io][csv]") {
    fxgen::series::PriceRecord record;
    record.timestamp = fxgen::start_of(fxgen::parse_date("2020.01.01").value());
    record.timestamp.nanos += 61 * fxgen::kNanosPerSecond + 5'000'000;
    record.bid = 1.23456;
    record.ask = 1.23466;
    record.bid_volume = 42;
    record.ask_volume = 52;

    REQUIRE(fxgen::io::format_record(record, 5) ==
            "2020.01.01 00:01:01.005,1.23456,1.23466,42.00000,52.00000");
    REQUIRE(fxgen::io::format_record(record, 2) == "2020.01.01 00:01:01.005,1.23,1.23,42.00,52.00");
}

TEST_CASE("Write a series to a stream", "[io][csv]") {
    auto generator = fxgen::series::make_generator(single_day_config());
    REQUIRE(generator.has_value());

    std::ostringstream out;
    auto rows = fxgen::io::write_series(out, *generator);
    REQUIRE(rows.has_value());
    REQUIRE(*rows == 1440);
    REQUIRE(generator->remaining() == 0);

    std::istringstream in(out.str());
    std::string line;
    REQUIRE(std::getline(in, line));
    REQUIRE(line == "2020.01.01 00:00:00.000,1.00000,1.00010,1.00000,11.00000");
    REQUIRE(std::getline(in, line));
    REQUIRE(line.starts_with("2020.01.01 00:01:00.000,1.00000,1.00010,"));

    std::size_t count = 2;
    std::string last;
    while (std::getline(in, line)) {
        last = line;
        ++count;
    }
    REQUIRE(count == 1440);
    REQUIRE(last.starts_with("2020.01.01 23:59:00.000,"));
}

TEST_CASE("Empty series writes an empty file", "[io][csv]") {
    auto config = single_day_config();
    config.density_per_minute = 0.0;
    auto generator = fxgen::series::make_generator(config);
    REQUIRE(generator.has_value());

    auto path = tmp("fxgen_test_empty.csv");
    auto rows = fxgen::io::write_series(path.string(), *generator);
    REQUIRE(rows.has_value());
    REQUIRE(*rows == 0);
    REQUIRE(std::filesystem::file_size(path) == 0);

    auto table = fxgen::io::read_series_csv(path.string());
    REQUIRE(table.has_value());
    REQUIRE(table->rows() == 0);
}

TEST_CASE("Written file reads back", "[io][csv]") {
    auto config = single_day_config();
    config.end_price = 1.5;
    config.pattern = fxgen::series::Pattern::Zigzag;
    config.density_per_minute = 2.0;

    auto generator = fxgen::series::make_generator(config);
    REQUIRE(generator.has_value());
    auto path = tmp("fxgen_test_roundtrip.csv");
    auto rows = fxgen::io::write_series(path.string(), *generator);
    REQUIRE(rows.has_value());

    auto again = fxgen::series::make_generator(config);
    REQUIRE(again.has_value());
    auto expected = fxgen::series::collect(*again);

    auto table = fxgen::io::read_series_csv(path.string());
    REQUIRE(table.has_value());
    REQUIRE(table->rows() == *rows);
    REQUIRE(table->rows() == expected.rows());
    for (std::size_t i = 0; i < table->rows(); i += 97) {
        REQUIRE(table->timestamp[i] == expected.timestamp[i]);
        REQUIRE(table->bid[i] == Approx(expected.bid[i]).margin(1e-9));
        REQUIRE(table->ask[i] == Approx(expected.ask[i]).margin(1e-9));
        REQUIRE(table->bid_volume[i] == expected.bid_volume[i]);
        REQUIRE(table->ask_volume[i] == expected.ask_volume[i]);
    }
}

TEST_CASE("Read three-column files", "[io][csv]") {
    auto path = tmp("fxgen_test_three.csv");
    write_file(path,
               "2014.01.01 00:00:00.000,2.00000,2.00010\n"
               "2014.01.01 00:01:00.000,2.00100,2.00110\n");

    auto table = fxgen::io::read_series_csv(path.string());
    REQUIRE(table.has_value());
    REQUIRE(table->rows() == 2);
    REQUIRE(table->bid[1] == Approx(2.001));
    REQUIRE(table->ask[0] == Approx(2.0001));
    REQUIRE(table->bid_volume[0] == 0);
    REQUIRE(table->timestamp[1].nanos - table->timestamp[0].nanos == fxgen::kNanosPerMinute);
}

TEST_CASE("Reader reports malformed input", "[io][csv]") {
    SECTION("bad timestamp") {
        auto path = tmp("fxgen_test_bad_ts.csv");
        write_file(path, "2014-01-01 00:00:00.000,2.0,2.1\n");
        auto table = fxgen::io::read_series_csv(path.string());
        REQUIRE_FALSE(table.has_value());
        REQUIRE(table.error().find("bad timestamp") != std::string::npos);
    }

    SECTION("bad number") {
        auto path = tmp("fxgen_test_bad_num.csv");
        write_file(path, "2014.01.01 00:00:00.000,two,2.1\n");
        auto table = fxgen::io::read_series_csv(path.string());
        REQUIRE_FALSE(table.has_value());
        REQUIRE(table.error().find("bad number") != std::string::npos);
    }

    SECTION("wrong column count") {
        auto path = tmp("fxgen_test_cols.csv");
        write_file(path, "2014.01.01 00:00:00.000,2.0\n");
        auto table = fxgen::io::read_series_csv(path.string());
        REQUIRE_FALSE(table.has_value());
    }

    SECTION("missing file") {
        auto table = fxgen::io::read_series_csv(tmp("fxgen_test_missing_file.csv").string());
        REQUIRE_FALSE(table.has_value());
    }
}

TEST_CASE("Writer reports unopenable paths", "[io][csv]") {
    auto generator = fxgen::series::make_generator(single_day_config());
    REQUIRE(generator.has_value());
    auto rows = fxgen::io::write_series("/nonexistent-fxgen-dir/out.csv", *generator);
    REQUIRE_FALSE(rows.has_value());
    REQUIRE(rows.error().find("failed to open") != std::string::npos);
    // Nothing was consumed.
    REQUIRE(generator->remaining() == 1440);
}
