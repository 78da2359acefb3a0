#include <fxgen/series/table.hpp>

#include <limits>

namespace fxgen::series {

void SeriesTable::append(const PriceRecord& record) {
    timestamp.push_back(record.timestamp);
    bid.push_back(record.bid);
    ask.push_back(record.ask);
    bid_volume.push_back(record.bid_volume);
    ask_volume.push_back(record.ask_volume);
}

void SeriesTable::reserve(std::size_t rows) {
    timestamp.reserve(rows);
    bid.reserve(rows);
    ask.reserve(rows);
    bid_volume.reserve(rows);
    ask_volume.reserve(rows);
}

auto SeriesTable::record(std::size_t row) const -> PriceRecord {
    return PriceRecord{
        .timestamp = timestamp.at(row),
        .bid = bid.at(row),
        .ask = ask.at(row),
        .bid_volume = bid_volume.at(row),
        .ask_volume = ask_volume.at(row),
    };
}

auto collect(SeriesGenerator& generator) -> SeriesTable {
    SeriesTable table;
    const auto remaining = generator.remaining();
    if (remaining > 0 &&
        static_cast<std::uint64_t>(remaining) <= std::numeric_limits<std::size_t>::max()) {
        table.reserve(static_cast<std::size_t>(remaining));
    }
    while (auto record = generator.next()) {
        table.append(*record);
    }
    return table;
}

}  // namespace fxgen::series
