#include "database_manager.hpp"
#include "logging.hpp"
#include "exceptions.hpp"
#include "utils.hpp" // For timestampToString/stringToTimestamp
#include <spdlog/fmt/fmt.h>
#include <vector>
#include <stdexcept>

namespace data
{

    namespace
    {
        // Finalizes a prepared statement on every exit path
        struct StatementGuard
        {
            sqlite3_stmt *stmt = nullptr;
            ~StatementGuard() { sqlite3_finalize(stmt); }
        };
    } // anonymous namespace

    DatabaseManager::DatabaseManager(const std::string &db_path)
        : database_path_(db_path), db_(nullptr), connected_(false)
    {
        core::logging::getLogger()->debug("DatabaseManager (SQLite) created for path: {}", db_path);
    }

    DatabaseManager::~DatabaseManager()
    {
        disconnect(); // Ensure disconnection
    }

    bool DatabaseManager::connect()
    {
        if (connected_)
        {
            core::logging::getLogger()->warn("Already connected to SQLite database {}.", database_path_);
            return true;
        }

        core::logging::getLogger()->info("Connecting to SQLite database: {}", database_path_);

        int rc = sqlite3_open_v2(database_path_.c_str(), &db_,
                                 SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_NOMUTEX,
                                 nullptr);

        if (rc != SQLITE_OK)
        {
            core::logging::getLogger()->error("Cannot open SQLite database '{}': {}", database_path_,
                                              db_ ? sqlite3_errmsg(db_) : sqlite3_errstr(rc));
            sqlite3_close(db_); // Close handle even if open failed (as per docs)
            db_ = nullptr;
            return false;
        }

        connected_ = true;
        core::logging::getLogger()->info("Successfully connected to SQLite database: {}", database_path_);
        return true;
    }

    void DatabaseManager::disconnect()
    {
        if (!connected_)
        {
            return;
        }
        core::logging::getLogger()->info("Disconnecting from SQLite database: {}", database_path_);
        int rc = sqlite3_close(db_);
        if (rc != SQLITE_OK)
        {
            // This usually happens if prepared statements are not finalized
            core::logging::getLogger()->error("Error disconnecting from SQLite database: {}", sqlite3_errmsg(db_));
        }
        db_ = nullptr;
        connected_ = false;
    }

    bool DatabaseManager::isConnected() const
    {
        return connected_ && (db_ != nullptr);
    }

    bool DatabaseManager::executeSQL(const std::string &sql)
    {
        if (!isConnected())
        {
            core::logging::getLogger()->error("Cannot execute SQL: Not connected to database.");
            return false;
        }

        core::logging::getLogger()->trace("Executing SQL (SQLite): {}", sql);

        char *error_msg = nullptr;
        int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &error_msg);

        if (rc != SQLITE_OK)
        {
            core::logging::getLogger()->error("SQL error: {}", error_msg ? error_msg : sqlite3_errstr(rc));
            sqlite3_free(error_msg); // Must free error message memory
            return false;
        }
        return true;
    }

    bool DatabaseManager::initializeSchema()
    {
        if (!isConnected())
        {
            core::logging::getLogger()->error("Cannot initialize schema: Not connected to database.");
            return false;
        }
        core::logging::getLogger()->info("Initializing SQLite database schema if needed...");

        const std::string create_candles_sql = R"(
        CREATE TABLE IF NOT EXISTS historical_candles (
            instrument_key TEXT NOT NULL,
            interval TEXT NOT NULL,
            timestamp TEXT NOT NULL, -- ISO 8601 UTC, e.g. 2024-03-01T00:00:00Z
            open REAL,
            high REAL,
            low REAL,
            close REAL,
            volume INTEGER,
            PRIMARY KEY (instrument_key, interval, timestamp)
        );
    )";
        const std::string create_candles_index_sql = R"(
        CREATE INDEX IF NOT EXISTS idx_candles_timestamp
        ON historical_candles (instrument_key, interval, timestamp);
     )";

        bool success = executeSQL(create_candles_sql) && executeSQL(create_candles_index_sql);

        if (success)
        {
            core::logging::getLogger()->info("SQLite database schema initialization check complete.");
        }
        else
        {
            core::logging::getLogger()->error("SQLite database schema initialization failed.");
        }
        return success;
    }

    core::TimeSeries<core::Candle> DatabaseManager::queryCandles(
        const std::string& instrument_key,
        const std::string& interval,
        core::Timestamp start_time,
        core::Timestamp end_time)
    {
        auto logger = core::logging::getLogger();
        if (!isConnected()) {
            throw core::DataLoadException("Cannot query candles: Not connected to database.");
        }

        const std::string start_str = core::utils::timestampToString(start_time);
        const std::string end_str = core::utils::timestampToString(end_time);

        logger->debug("Querying candles for {} ({}) between '{}' and '{}'",
                      instrument_key, interval, start_str, end_str);

        // Timestamps share one fixed-width UTC format, so TEXT comparison is chronological
        const char* sql = R"(
            SELECT timestamp, open, high, low, close, volume
            FROM historical_candles
            WHERE instrument_key = ?
              AND interval = ?
              AND timestamp >= ?
              AND timestamp <= ?
            ORDER BY timestamp ASC;
        )";

        StatementGuard guard;
        int rc = sqlite3_prepare_v2(db_, sql, -1, &guard.stmt, nullptr);
        if (rc != SQLITE_OK) {
            throw core::DataLoadException(fmt::format("Failed to prepare candle query [{}]: {}", rc, sqlite3_errmsg(db_)));
        }

        // Index is 1-based
        sqlite3_bind_text(guard.stmt, 1, instrument_key.c_str(), -1, SQLITE_STATIC);
        sqlite3_bind_text(guard.stmt, 2, interval.c_str(), -1, SQLITE_STATIC);
        sqlite3_bind_text(guard.stmt, 3, start_str.c_str(), -1, SQLITE_STATIC);
        sqlite3_bind_text(guard.stmt, 4, end_str.c_str(), -1, SQLITE_STATIC);

        core::TimeSeries<core::Candle> candles;
        int row_count = 0;
        while ((rc = sqlite3_step(guard.stmt)) == SQLITE_ROW) {
            row_count++;
            const unsigned char *ts_text = sqlite3_column_text(guard.stmt, 0);
            if (!ts_text) {
                logger->warn("NULL timestamp found in query result (row {}), skipping row.", row_count);
                continue;
            }

            core::Candle candle;
            try {
                candle.timestamp = core::utils::stringToTimestamp(reinterpret_cast<const char*>(ts_text));
            } catch (const std::runtime_error& e) {
                throw core::DataLoadException(fmt::format("Row {} of {} ({}) has a bad timestamp: {}",
                                                          row_count, instrument_key, interval, e.what()));
            }
            candle.open = sqlite3_column_double(guard.stmt, 1);
            candle.high = sqlite3_column_double(guard.stmt, 2);
            candle.low = sqlite3_column_double(guard.stmt, 3);
            candle.close = sqlite3_column_double(guard.stmt, 4);
            candle.volume = sqlite3_column_int64(guard.stmt, 5);
            candles.push_back(candle);
        }

        if (rc != SQLITE_DONE) {
            throw core::DataLoadException(fmt::format("Error stepping through candle query [{}]: {}", rc, sqlite3_errmsg(db_)));
        }

        logger->debug("Loaded {} candles for {} ({}).", candles.size(), instrument_key, interval);
        return candles;
    }

    bool DatabaseManager::saveCandles(const core::TimeSeries<core::Candle> &candles,
                                      const std::string &instrument_key,
                                      const std::string &interval)
    {
        auto logger = core::logging::getLogger();
        if (!isConnected())
        {
            logger->error("Cannot save candles: Not connected to database.");
            return false;
        }
        if (candles.empty())
        {
            logger->debug("No candles provided to save for {} ({}).", instrument_key, interval);
            return true; // Nothing to do, report success
        }

        const char *sql = R"(
INSERT OR IGNORE INTO historical_candles
(instrument_key, interval, timestamp, open, high, low, close, volume)
VALUES (?, ?, ?, ?, ?, ?, ?, ?);
)";

        bool success = true;
        int saved_count = 0;
        {
            StatementGuard guard;
            int rc = sqlite3_prepare_v2(db_, sql, -1, &guard.stmt, nullptr);
            if (rc != SQLITE_OK)
            {
                logger->error("Failed to prepare INSERT statement [{}]: {}", rc, sqlite3_errmsg(db_));
                return false;
            }

            if (!executeSQL("BEGIN TRANSACTION;"))
            {
                logger->error("Failed to begin transaction for saving candles.");
                return false;
            }

            for (const auto &candle : candles)
            {
                const std::string timestamp_str = core::utils::timestampToString(candle.timestamp);
                sqlite3_bind_text(guard.stmt, 1, instrument_key.c_str(), -1, SQLITE_STATIC);
                sqlite3_bind_text(guard.stmt, 2, interval.c_str(), -1, SQLITE_STATIC);
                sqlite3_bind_text(guard.stmt, 3, timestamp_str.c_str(), -1, SQLITE_TRANSIENT);
                sqlite3_bind_double(guard.stmt, 4, candle.open);
                sqlite3_bind_double(guard.stmt, 5, candle.high);
                sqlite3_bind_double(guard.stmt, 6, candle.low);
                sqlite3_bind_double(guard.stmt, 7, candle.close);
                sqlite3_bind_int64(guard.stmt, 8, candle.volume);

                rc = sqlite3_step(guard.stmt);
                if (rc != SQLITE_DONE)
                {
                    logger->error("Failed to execute insert step [{}]: {}", rc, sqlite3_errmsg(db_));
                    success = false;
                    break;
                }
                if (sqlite3_changes(db_) > 0)
                {
                    saved_count++; // Not ignored as a duplicate
                }

                rc = sqlite3_reset(guard.stmt);
                if (rc != SQLITE_OK)
                {
                    logger->error("Failed to reset prepared statement [{}]: {}", rc, sqlite3_errmsg(db_));
                    success = false;
                    break;
                }
            }
        } // Statement finalized before commit/rollback

        if (success)
        {
            if (!executeSQL("COMMIT;"))
            {
                logger->error("Failed to COMMIT transaction for saving candles.");
                if (!executeSQL("ROLLBACK;"))
                {
                    logger->error("Failed to ROLLBACK after the failed COMMIT.");
                }
                return false;
            }
            logger->info("Saved {} new candles (duplicates ignored) for {} ({}).", saved_count, instrument_key, interval);
            return true;
        }

        if (!executeSQL("ROLLBACK;"))
        {
            logger->error("Failed to ROLLBACK transaction for saving candles.");
        }
        logger->warn("Transaction rolled back due to error during candle save for {} ({}).", instrument_key, interval);
        return false;
    }

} // namespace data
