// include/optwatch/marketdata/snapshot_reader.hpp
#pragma once

#include <arrow/api.h>
#include <memory>
#include <string>
#include <vector>
#include "optwatch/core/error.hpp"
#include "optwatch/core/types.hpp"

namespace optwatch {

/**
 * @brief Converts gateway tables into typed records
 *
 * Only the identifying column is mandatory; every other field is coerced and
 * falls back to zero or empty when absent or malformed.
 */
class SnapshotReader {
public:
    static Result<std::vector<OptionSnapshot>> read_option_snapshots(
        const std::shared_ptr<arrow::Table>& table, const Timestamp& observed_at);

    static Result<std::vector<UnderlyingQuote>> read_underlying_quotes(
        const std::shared_ptr<arrow::Table>& table, const Timestamp& observed_at);

    static Result<std::vector<ChainEntry>> read_chain(const std::shared_ptr<arrow::Table>& table);

    /**
     * @brief Expiry dates (YYYY-MM-DD) in gateway order, blanks dropped
     */
    static Result<std::vector<std::string>> read_expiration_dates(
        const std::shared_ptr<arrow::Table>& table);

private:
    static std::shared_ptr<arrow::Array> column(const std::shared_ptr<arrow::Table>& table,
                                                const std::string& name);
};

}  // namespace optwatch
