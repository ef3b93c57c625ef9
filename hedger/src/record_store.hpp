#pragma once
#include "types.hpp"
#include <string>
#include <vector>
#include <unordered_map>
#include <optional>
#include <chrono>
#include <memory>

// SQLite cache of market records. A refresh replaces the whole table in one transaction.
class RecordStore {
public:
    explicit RecordStore(const std::string& db_path);
    ~RecordStore();

    // Clears the table and bulk-inserts records, stamping every row with the same fetch time.
    // Returns false (and leaves the previous contents intact) on failure.
    bool replace_all(const std::vector<MarketRecord>& records);

    // Active records only. Rows that fail to decode are skipped.
    std::vector<MarketRecord> get_all() const;

    std::unordered_map<std::string, MarketRecord> get_by_ids(const std::vector<std::string>& ids) const;

    size_t count() const;

    // Time since the last refresh, if the store holds any rows
    std::optional<std::chrono::seconds> cache_age() const;

    bool is_healthy() const;

    // Non-copyable
    RecordStore(const RecordStore&) = delete;
    RecordStore& operator=(const RecordStore&) = delete;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl_;
};
