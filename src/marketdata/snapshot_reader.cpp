// src/marketdata/snapshot_reader.cpp

#include "optwatch/marketdata/snapshot_reader.hpp"
#include <arrow/array/concatenate.h>
#include "optwatch/marketdata/field_coercion.hpp"

namespace optwatch {

std::shared_ptr<arrow::Array> SnapshotReader::column(const std::shared_ptr<arrow::Table>& table,
                                                     const std::string& name) {
    auto chunked = table->GetColumnByName(name);
    if (!chunked || chunked->num_chunks() == 0) {
        return nullptr;
    }
    if (chunked->num_chunks() == 1) {
        return chunked->chunk(0);
    }

    auto combined = arrow::Concatenate(chunked->chunks());
    if (!combined.ok()) {
        return nullptr;
    }
    return *combined;
}

Result<std::vector<OptionSnapshot>> SnapshotReader::read_option_snapshots(
    const std::shared_ptr<arrow::Table>& table, const Timestamp& observed_at) {
    if (!table) {
        return make_error<std::vector<OptionSnapshot>>(ErrorCode::INVALID_ARGUMENT,
                                                       "Table pointer is null", "SnapshotReader");
    }

    auto code = column(table, "code");
    if (!code) {
        return make_error<std::vector<OptionSnapshot>>(
            ErrorCode::INVALID_DATA, "Missing required column: code", "SnapshotReader");
    }

    auto last_price = column(table, "last_price");
    auto volume = column(table, "volume");
    auto turnover = column(table, "turnover");
    auto change_rate = column(table, "change_rate");
    auto update_time = column(table, "update_time");
    auto open_interest = column(table, "option_open_interest");
    auto net_open_interest = column(table, "option_net_open_interest");
    auto option_strike = column(table, "option_strike_price");
    auto chain_strike = column(table, "strike_price");
    auto option_type = column(table, "option_type");

    std::vector<OptionSnapshot> rows;
    rows.reserve(static_cast<size_t>(table->num_rows()));

    for (int64_t i = 0; i < table->num_rows(); ++i) {
        OptionSnapshot row;
        row.option_code = FieldCoercion::cell_string(code, i);
        if (row.option_code.empty()) {
            continue;
        }
        row.last_price = FieldCoercion::cell_double(last_price, i);
        row.volume = FieldCoercion::cell_count(volume, i);
        row.turnover = FieldCoercion::cell_double(turnover, i);
        row.change_rate = FieldCoercion::cell_double(change_rate, i);
        row.update_time = FieldCoercion::cell_string(update_time, i);
        row.open_interest = FieldCoercion::cell_count(open_interest, i);
        row.net_open_interest = FieldCoercion::cell_count(net_open_interest, i);

        row.api_strike_price = FieldCoercion::cell_double(option_strike, i);
        if (row.api_strike_price <= 0.0) {
            row.api_strike_price = FieldCoercion::cell_double(chain_strike, i);
        }
        row.api_option_type = FieldCoercion::cell_string(option_type, i);
        row.observed_at = observed_at;
        rows.push_back(std::move(row));
    }

    return Result<std::vector<OptionSnapshot>>(std::move(rows));
}

Result<std::vector<UnderlyingQuote>> SnapshotReader::read_underlying_quotes(
    const std::shared_ptr<arrow::Table>& table, const Timestamp& observed_at) {
    if (!table) {
        return make_error<std::vector<UnderlyingQuote>>(ErrorCode::INVALID_ARGUMENT,
                                                        "Table pointer is null", "SnapshotReader");
    }

    auto code = column(table, "code");
    if (!code) {
        return make_error<std::vector<UnderlyingQuote>>(
            ErrorCode::INVALID_DATA, "Missing required column: code", "SnapshotReader");
    }
    auto name = column(table, "name");
    auto stock_name = column(table, "stock_name");
    auto last_price = column(table, "last_price");

    std::vector<UnderlyingQuote> quotes;
    for (int64_t i = 0; i < table->num_rows(); ++i) {
        UnderlyingQuote quote;
        quote.code = FieldCoercion::cell_string(code, i);
        if (quote.code.empty()) {
            continue;
        }
        quote.name = FieldCoercion::cell_string(name, i);
        if (quote.name.empty()) {
            quote.name = FieldCoercion::cell_string(stock_name, i);
        }
        quote.last_price = FieldCoercion::cell_double(last_price, i);
        quote.observed_at = observed_at;
        quotes.push_back(std::move(quote));
    }

    return Result<std::vector<UnderlyingQuote>>(std::move(quotes));
}

Result<std::vector<ChainEntry>> SnapshotReader::read_chain(
    const std::shared_ptr<arrow::Table>& table) {
    if (!table) {
        return make_error<std::vector<ChainEntry>>(ErrorCode::INVALID_ARGUMENT,
                                                   "Table pointer is null", "SnapshotReader");
    }

    auto code = column(table, "code");
    auto strike = column(table, "strike_price");
    if (!code || !strike) {
        return make_error<std::vector<ChainEntry>>(
            ErrorCode::INVALID_DATA, "Option chain requires code and strike_price columns",
            "SnapshotReader");
    }

    std::vector<ChainEntry> entries;
    entries.reserve(static_cast<size_t>(table->num_rows()));
    for (int64_t i = 0; i < table->num_rows(); ++i) {
        ChainEntry entry;
        entry.option_code = FieldCoercion::cell_string(code, i);
        entry.strike_price = FieldCoercion::cell_double(strike, i);
        if (!entry.option_code.empty()) {
            entries.push_back(std::move(entry));
        }
    }

    return Result<std::vector<ChainEntry>>(std::move(entries));
}

Result<std::vector<std::string>> SnapshotReader::read_expiration_dates(
    const std::shared_ptr<arrow::Table>& table) {
    if (!table) {
        return make_error<std::vector<std::string>>(ErrorCode::INVALID_ARGUMENT,
                                                    "Table pointer is null", "SnapshotReader");
    }

    auto strike_time = column(table, "strike_time");
    if (!strike_time) {
        return make_error<std::vector<std::string>>(
            ErrorCode::INVALID_DATA, "Missing required column: strike_time", "SnapshotReader");
    }

    std::vector<std::string> dates;
    for (int64_t i = 0; i < table->num_rows(); ++i) {
        std::string date = FieldCoercion::cell_string(strike_time, i);
        // Gateways sometimes append a time part
        if (date.size() > 10) {
            date = date.substr(0, 10);
        }
        if (!date.empty()) {
            dates.push_back(std::move(date));
        }
    }

    return Result<std::vector<std::string>>(std::move(dates));
}

}  // namespace optwatch
