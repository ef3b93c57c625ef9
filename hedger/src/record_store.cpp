#include "record_store.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>
#include <sqlite3.h>
#include <algorithm>
#include <mutex>

namespace {
constexpr size_t kInsertBatchSize = 1000;
constexpr size_t kLookupChunkSize = 500;

std::string column_text(sqlite3_stmt* stmt, int col) {
    const char* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, col));
    return text ? std::string(text) : std::string();
}
}

class RecordStore::Impl {
public:
    explicit Impl(const std::string& db_path) : db_path_(db_path), db_(nullptr) {
        if (!initialize()) {
            if (db_) {
                sqlite3_close(db_);
                db_ = nullptr;
            }
            throw std::runtime_error("Failed to initialize record store at " + db_path_);
        }
    }

    ~Impl() {
        if (db_) {
            sqlite3_close(db_);
        }
    }

    bool initialize() {
        int rc = sqlite3_open(db_path_.c_str(), &db_);
        if (rc != SQLITE_OK) {
            spdlog::error("Cannot open database: {}", sqlite3_errmsg(db_));
            return false;
        }

        if (!create_tables()) {
            return false;
        }

        spdlog::debug("Record store initialized at: {}", db_path_);
        return true;
    }

    bool replace_all(const std::vector<MarketRecord>& records) {
        std::lock_guard<std::mutex> lock(db_mutex_);
        spdlog::info("Saving {} markets to cache...", records.size());
        auto start = std::chrono::steady_clock::now();

        if (!exec("BEGIN IMMEDIATE TRANSACTION")) {
            return false;
        }

        if (!exec("DELETE FROM markets")) {
            exec("ROLLBACK");
            return false;
        }

        const char* sql =
            "INSERT OR REPLACE INTO markets "
            "(id, question, description, outcomes, liquidity, volume, end_date, active, data, cached_at) "
            "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?)";
        sqlite3_stmt* stmt;
        if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            spdlog::error("Failed to prepare statement: {}", sqlite3_errmsg(db_));
            exec("ROLLBACK");
            return false;
        }

        double cached_at = util::unix_seconds_now();

        for (size_t i = 0; i < records.size(); ++i) {
            const auto& record = records[i];
            auto payload = record.to_json();

            std::string outcomes;
            if (!record.outcomes.empty()) {
                outcomes = payload["outcomes"].dump();
            }
            std::string data = payload.dump();

            sqlite3_bind_text(stmt, 1, record.id.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_text(stmt, 2, record.question.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_text(stmt, 3, record.description.c_str(), -1, SQLITE_TRANSIENT);
            if (outcomes.empty()) {
                sqlite3_bind_null(stmt, 4);
            } else {
                sqlite3_bind_text(stmt, 4, outcomes.c_str(), -1, SQLITE_TRANSIENT);
            }
            sqlite3_bind_double(stmt, 5, record.liquidity);
            sqlite3_bind_double(stmt, 6, record.volume);
            if (record.end_date) {
                sqlite3_bind_text(stmt, 7, record.end_date->c_str(), -1, SQLITE_TRANSIENT);
            } else {
                sqlite3_bind_null(stmt, 7);
            }
            sqlite3_bind_int(stmt, 8, record.active ? 1 : 0);
            sqlite3_bind_text(stmt, 9, data.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_double(stmt, 10, cached_at);

            int rc = sqlite3_step(stmt);
            if (rc != SQLITE_DONE) {
                spdlog::error("Failed to insert market {}: {}", record.id, sqlite3_errmsg(db_));
                sqlite3_finalize(stmt);
                exec("ROLLBACK");
                return false;
            }
            sqlite3_reset(stmt);
            sqlite3_clear_bindings(stmt);

            if ((i + 1) % kInsertBatchSize == 0 || i + 1 == records.size()) {
                spdlog::debug("Saved batch {} ({} markets so far)", (i / kInsertBatchSize) + 1, i + 1);
            }
        }

        sqlite3_finalize(stmt);

        if (!exec("COMMIT")) {
            exec("ROLLBACK");
            return false;
        }

        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start).count();
        spdlog::info("Cache save complete in {} ms", elapsed);
        return true;
    }

    std::vector<MarketRecord> get_all() const {
        std::lock_guard<std::mutex> lock(db_mutex_);
        std::vector<MarketRecord> records;

        const char* sql = "SELECT id, data, cached_at FROM markets";
        sqlite3_stmt* stmt;
        if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            spdlog::error("Failed to prepare statement: {}", sqlite3_errmsg(db_));
            return records;
        }

        size_t rows = 0;
        size_t malformed = 0;
        size_t inactive = 0;
        double cached_at = 0.0;

        int rc;
        while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
            ++rows;
            cached_at = sqlite3_column_double(stmt, 2);
            std::string id = column_text(stmt, 0);
            try {
                auto record = decode(column_text(stmt, 1));
                if (!record.active) {
                    ++inactive;
                    continue;
                }
                records.push_back(std::move(record));
            } catch (const DeserializationError& e) {
                ++malformed;
                spdlog::debug("Skipping market {}: {}", id, e.what());
            }
        }
        sqlite3_finalize(stmt);

        if (rc != SQLITE_DONE) {
            spdlog::error("Failed to read markets: {}", sqlite3_errmsg(db_));
            return {};
        }

        if (rows == 0) {
            spdlog::info("Cache miss: no cached markets found");
            return records;
        }

        if (malformed > 0) {
            spdlog::error("Cache parse errors: decoded {} of {} rows", rows - malformed, rows);
        }
        if (inactive > 0) {
            spdlog::debug("Filtered out {} inactive markets from cache", inactive);
        }

        double age_minutes = (util::unix_seconds_now() - cached_at) / 60.0;
        spdlog::info("Cache hit: {} markets (cached {:.1f} min ago)", records.size(), age_minutes);
        return records;
    }

    std::unordered_map<std::string, MarketRecord> get_by_ids(const std::vector<std::string>& ids) const {
        std::lock_guard<std::mutex> lock(db_mutex_);
        std::unordered_map<std::string, MarketRecord> result;

        for (size_t offset = 0; offset < ids.size(); offset += kLookupChunkSize) {
            size_t end = std::min(offset + kLookupChunkSize, ids.size());

            std::string sql = "SELECT id, data FROM markets WHERE id IN (";
            for (size_t i = offset; i < end; ++i) {
                sql += (i == offset) ? "?" : ",?";
            }
            sql += ")";

            sqlite3_stmt* stmt;
            if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
                spdlog::error("Failed to prepare statement: {}", sqlite3_errmsg(db_));
                return result;
            }

            for (size_t i = offset; i < end; ++i) {
                sqlite3_bind_text(stmt, static_cast<int>(i - offset + 1), ids[i].c_str(), -1, SQLITE_TRANSIENT);
            }

            while (sqlite3_step(stmt) == SQLITE_ROW) {
                std::string id = column_text(stmt, 0);
                try {
                    result.emplace(id, decode(column_text(stmt, 1)));
                } catch (const DeserializationError& e) {
                    spdlog::error("Failed to parse market {}: {}", id, e.what());
                }
            }
            sqlite3_finalize(stmt);
        }

        return result;
    }

    size_t count() const {
        std::lock_guard<std::mutex> lock(db_mutex_);
        return static_cast<size_t>(query_double("SELECT COUNT(*) FROM markets").value_or(0.0));
    }

    std::optional<std::chrono::seconds> cache_age() const {
        std::lock_guard<std::mutex> lock(db_mutex_);
        auto cached_at = query_double("SELECT MAX(cached_at) FROM markets");
        if (!cached_at) {
            return std::nullopt;
        }
        auto age = static_cast<long long>(util::unix_seconds_now() - *cached_at);
        return std::chrono::seconds(std::max(0LL, age));
    }

    bool is_healthy() const {
        std::lock_guard<std::mutex> lock(db_mutex_);

        if (!db_) {
            return false;
        }

        const char* sql = "SELECT name FROM sqlite_master WHERE type='table' LIMIT 1";
        sqlite3_stmt* stmt;

        if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            return false;
        }

        int rc = sqlite3_step(stmt);
        sqlite3_finalize(stmt);

        return rc == SQLITE_ROW || rc == SQLITE_DONE;
    }

private:
    static MarketRecord decode(const std::string& data) {
        nlohmann::json payload;
        try {
            payload = nlohmann::json::parse(data);
        } catch (const nlohmann::json::parse_error& e) {
            throw DeserializationError(std::string("Invalid JSON payload: ") + e.what());
        }
        return MarketRecord::from_json(payload);
    }

    // Single-value query; nullopt when the value is NULL or the query fails
    std::optional<double> query_double(const char* sql) const {
        sqlite3_stmt* stmt;
        if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            spdlog::error("Failed to prepare statement: {}", sqlite3_errmsg(db_));
            return std::nullopt;
        }

        std::optional<double> value;
        if (sqlite3_step(stmt) == SQLITE_ROW && sqlite3_column_type(stmt, 0) != SQLITE_NULL) {
            value = sqlite3_column_double(stmt, 0);
        }
        sqlite3_finalize(stmt);
        return value;
    }

    bool exec(const char* sql) {
        char* err_msg = nullptr;
        if (sqlite3_exec(db_, sql, nullptr, nullptr, &err_msg) != SQLITE_OK) {
            spdlog::error("SQL '{}' failed: {}", sql, err_msg ? err_msg : "unknown error");
            sqlite3_free(err_msg);
            return false;
        }
        return true;
    }

    bool create_tables() {
        const char* create_markets = R"(
            CREATE TABLE IF NOT EXISTS markets (
                id TEXT PRIMARY KEY,
                question TEXT NOT NULL,
                description TEXT,
                outcomes TEXT,
                liquidity REAL,
                volume REAL,
                end_date TEXT,
                active INTEGER,
                data TEXT NOT NULL,
                cached_at REAL NOT NULL
            )
        )";

        const char* create_indices = R"(
            CREATE INDEX IF NOT EXISTS idx_markets_liquidity ON markets(liquidity);
            CREATE INDEX IF NOT EXISTS idx_markets_question ON markets(question);
        )";

        if (!exec(create_markets)) {
            return false;
        }

        if (!exec(create_indices)) {
            return false;
        }

        return true;
    }

    std::string db_path_;
    sqlite3* db_;
    mutable std::mutex db_mutex_;
};

// Public interface implementation
RecordStore::RecordStore(const std::string& db_path)
    : pImpl_(std::make_unique<Impl>(db_path)) {}

RecordStore::~RecordStore() = default;

bool RecordStore::replace_all(const std::vector<MarketRecord>& records) {
    return pImpl_->replace_all(records);
}

std::vector<MarketRecord> RecordStore::get_all() const {
    return pImpl_->get_all();
}

std::unordered_map<std::string, MarketRecord> RecordStore::get_by_ids(const std::vector<std::string>& ids) const {
    return pImpl_->get_by_ids(ids);
}

size_t RecordStore::count() const {
    return pImpl_->count();
}

std::optional<std::chrono::seconds> RecordStore::cache_age() const {
    return pImpl_->cache_age();
}

bool RecordStore::is_healthy() const {
    return pImpl_->is_healthy();
}
