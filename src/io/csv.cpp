#include <fxgen/io/csv.hpp>

#include <fmt/core.h>
#include <fmt/format.h>
#include <rapidcsv.h>
#include <spdlog/spdlog.h>

#include <cmath>
#include <cstdlib>
#include <exception>
#include <fstream>
#include <iterator>
#include <ostream>
#include <vector>

namespace fxgen::io {

namespace {

auto try_parse_double(const std::string& text, double& out) -> bool {
    char* end = nullptr;
    out = std::strtod(text.c_str(), &end);
    return end != text.c_str() && *end == '\0';
}

}  // namespace

auto format_record(const series::PriceRecord& record, int digits) -> std::string {
    return fmt::format("{},{:.{}f},{:.{}f},{:.{}f},{:.{}f}", format_timestamp(record.timestamp),
                       record.bid, digits, record.ask, digits,
                       static_cast<double>(record.bid_volume), digits,
                       static_cast<double>(record.ask_volume), digits);
}

auto write_series(std::ostream& out, series::SeriesGenerator& generator)
    -> std::expected<std::size_t, std::string> {
    const int digits = generator.config().digits;
    std::size_t rows = 0;
    fmt::memory_buffer buffer;
    for (const auto& record : generator) {
        buffer.clear();
        fmt::format_to(std::back_inserter(buffer), "{}\n", format_record(record, digits));
        out.write(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        if (!out) {
            return std::unexpected(fmt::format("write failed after {} rows", rows));
        }
        ++rows;
    }
    out.flush();
    if (!out) {
        return std::unexpected("failed to flush output");
    }
    spdlog::debug("csv: wrote {} rows", rows);
    return rows;
}

auto write_series(std::string_view path, series::SeriesGenerator& generator)
    -> std::expected<std::size_t, std::string> {
    std::ofstream output{std::string(path), std::ios::out | std::ios::trunc};
    if (!output) {
        return std::unexpected("failed to open output file: " + std::string(path));
    }
    auto rows = write_series(output, generator);
    if (!rows) {
        return std::unexpected(fmt::format("{}: {}", path, rows.error()));
    }
    return rows;
}

auto read_series_csv(std::string_view path) -> std::expected<series::SeriesTable, std::string> {
    try {
        rapidcsv::Document doc(std::string(path),
                               rapidcsv::LabelParams(-1, -1),  // no header row, no row labels
                               rapidcsv::SeparatorParams(','));

        const auto columns = doc.GetColumnCount();
        if (doc.GetRowCount() > 0 && columns != 3 && columns != 5) {
            return std::unexpected(
                fmt::format("{}: expected 3 or 5 columns, found {}", path, columns));
        }

        series::SeriesTable table;
        const auto rows = doc.GetRowCount();
        table.reserve(rows);
        for (std::size_t row = 0; row < rows; ++row) {
            auto fields = doc.GetRow<std::string>(row);
            if (fields.size() != columns) {
                return std::unexpected(fmt::format("{}: row {} has {} columns", path, row + 1,
                                                   fields.size()));
            }
            auto ts = parse_timestamp(fields[0]);
            if (!ts) {
                return std::unexpected(
                    fmt::format("{}: row {}: bad timestamp '{}'", path, row + 1, fields[0]));
            }
            std::vector<double> numbers(fields.size() - 1, 0.0);
            for (std::size_t i = 1; i < fields.size(); ++i) {
                if (!try_parse_double(fields[i], numbers[i - 1])) {
                    return std::unexpected(
                        fmt::format("{}: row {}: bad number '{}'", path, row + 1, fields[i]));
                }
            }
            series::PriceRecord record;
            record.timestamp = *ts;
            record.bid = numbers[0];
            record.ask = numbers[1];
            if (numbers.size() == 4) {
                record.bid_volume = std::llround(numbers[2]);
                record.ask_volume = std::llround(numbers[3]);
            }
            table.append(record);
        }
        return table;
    } catch (const std::exception& e) {
        return std::unexpected(fmt::format("{}: {}", path, e.what()));
    }
}

}  // namespace fxgen::io
