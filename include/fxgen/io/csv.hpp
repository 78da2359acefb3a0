#pragma once

#include <fxgen/series/generator.hpp>
#include <fxgen/series/table.hpp>

#include <cstddef>
#include <expected>
#include <iosfwd>
#include <string>
#include <string_view>

namespace fxgen::io {

/// Format one record as a CSV line (without newline):
/// `yyyy.mm.dd HH:MM:SS.mmm,bid,ask,bid_volume,ask_volume`, numbers with `digits` decimals.
[[nodiscard]] auto format_record(const series::PriceRecord& record, int digits) -> std::string;

/// Drain `generator` into `out`, one line per record. Returns the number of rows written.
[[nodiscard]] auto write_series(std::ostream& out, series::SeriesGenerator& generator)
    -> std::expected<std::size_t, std::string>;

/// Drain `generator` into the file at `path` (created or truncated).
[[nodiscard]] auto write_series(std::string_view path, series::SeriesGenerator& generator)
    -> std::expected<std::size_t, std::string>;

/// Read a file written by write_series() back into columnar form.
/// Three-column files (timestamp,bid,ask) are accepted; their volumes read as zero.
[[nodiscard]] auto read_series_csv(std::string_view path)
    -> std::expected<series::SeriesTable, std::string>;

}  // namespace fxgen::io
