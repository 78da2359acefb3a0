#pragma once

#include <fxgen/core/column.hpp>
#include <fxgen/core/time.hpp>
#include <fxgen/series/generator.hpp>

#include <cstdint>

namespace fxgen::series {

/// Columnar copy of a generated (or re-read) price series.
struct SeriesTable {
    Column<Timestamp> timestamp;
    Column<double> bid;
    Column<double> ask;
    Column<std::int64_t> bid_volume;
    Column<std::int64_t> ask_volume;

    void append(const PriceRecord& record);
    void reserve(std::size_t rows);

    [[nodiscard]] auto rows() const noexcept -> std::size_t { return timestamp.size(); }
    [[nodiscard]] auto record(std::size_t row) const -> PriceRecord;
};

/// Drain the remaining records of `generator` into a table.
[[nodiscard]] auto collect(SeriesGenerator& generator) -> SeriesTable;

}  // namespace fxgen::series
