#pragma once

#include <string>
#include <vector>

#include <sqlite3.h> // Standard C header

#include "datatypes.hpp" // Keep core types

namespace data {

// Local SQLite store of historical candles, the input side of a backtest.
// Timestamps are stored as ISO 8601 UTC text so they sort chronologically.
class DatabaseManager {
public:
    explicit DatabaseManager(const std::string& db_path);
    ~DatabaseManager();

    // Owns the connection handle
    DatabaseManager(const DatabaseManager&) = delete;
    DatabaseManager& operator=(const DatabaseManager&) = delete;

    bool connect();
    void disconnect();
    bool isConnected() const;

    // Creates historical_candles and its index if missing
    bool initializeSchema();

    bool executeSQL(const std::string& sql);

    // INSERT OR IGNORE inside one transaction, rolled back on the first failure
    bool saveCandles(const core::TimeSeries<core::Candle>& candles,
                     const std::string& instrument_key,
                     const std::string& interval);

    // Candles in [start_time, end_time], oldest first.
    // Throws core::DataLoadException when not connected or the query fails.
    core::TimeSeries<core::Candle> queryCandles(
        const std::string& instrument_key,
        const std::string& interval,
        core::Timestamp start_time,
        core::Timestamp end_time);

    const std::string& getDatabasePath() const { return database_path_; }

private:
    std::string database_path_;
    sqlite3* db_ = nullptr; // SQLite database connection handle
    bool connected_ = false;
};

} // namespace data
