#include "similarity_index.hpp"
#include "errors.hpp"
#include <spdlog/spdlog.h>
#include <sqlite3.h>
#include <algorithm>
#include <cmath>
#include <mutex>
#include <stdexcept>

class SimilarityIndex::Impl {
public:
    Impl(const std::string& db_path, Embedder& embedder)
        : db_path_(db_path), embedder_(embedder), db_(nullptr) {
        if (!initialize()) {
            if (db_) {
                sqlite3_close(db_);
                db_ = nullptr;
            }
            throw std::runtime_error("Failed to initialize similarity index at " + db_path_);
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
            spdlog::error("Cannot open vector database: {}", sqlite3_errmsg(db_));
            return false;
        }

        const char* create_embeddings = R"(
            CREATE TABLE IF NOT EXISTS embeddings (
                id TEXT PRIMARY KEY,
                embedding BLOB NOT NULL,
                document TEXT NOT NULL,
                question TEXT NOT NULL,
                liquidity REAL NOT NULL,
                volume REAL NOT NULL,
                active INTEGER NOT NULL
            );
            CREATE INDEX IF NOT EXISTS idx_embeddings_liquidity ON embeddings(liquidity);
        )";

        if (!exec(create_embeddings)) {
            return false;
        }

        spdlog::info("Similarity index initialized at {} (dimension: {})", db_path_, embedder_.dimension());
        return true;
    }

    size_t upsert(const std::vector<MarketRecord>& input, bool resume, size_t batch_size,
                  const ProgressCallback& progress) {
        if (batch_size == 0) {
            throw std::invalid_argument("batch_size must be positive");
        }

        if (input.empty()) {
            spdlog::warn("No markets to add to similarity index");
            return 0;
        }

        std::vector<const MarketRecord*> records;
        records.reserve(input.size());

        if (resume) {
            auto existing = existing_ids();
            for (const auto& record : input) {
                if (existing.find(record.id) == existing.end()) {
                    records.push_back(&record);
                }
            }
            if (records.size() < input.size()) {
                spdlog::info("Resume mode: skipping {} existing markets", input.size() - records.size());
            }
        } else {
            for (const auto& record : input) {
                records.push_back(&record);
            }
        }

        if (records.empty()) {
            spdlog::info("All markets already exist in similarity index, nothing to add");
            return 0;
        }

        size_t total_batches = (records.size() + batch_size - 1) / batch_size;
        spdlog::info("Adding {} markets to similarity index in batches of {}", records.size(), batch_size);

        for (size_t batch_num = 0; batch_num < total_batches; ++batch_num) {
            size_t start = batch_num * batch_size;
            size_t end = std::min(start + batch_size, records.size());

            spdlog::info("Processing batch {}/{} ({} markets)", batch_num + 1, total_batches, end - start);

            std::vector<std::string> documents;
            documents.reserve(end - start);
            for (size_t i = start; i < end; ++i) {
                documents.push_back(SimilarityIndex::document_text(*records[i]));
            }

            auto embeddings = embedder_.embed(documents);
            if (embeddings.size() != documents.size()) {
                throw std::runtime_error(fmt::format(
                    "Embedder returned {} vectors for {} documents", embeddings.size(), documents.size()));
            }

            write_batch(records, start, end, documents, embeddings);
            spdlog::info("Batch {}/{} added successfully", batch_num + 1, total_batches);

            if (progress) {
                try {
                    progress(static_cast<int>(batch_num + 1), static_cast<int>(total_batches));
                } catch (const std::exception& e) {
                    spdlog::warn("Progress callback failed: {}", e.what());
                } catch (...) {
                    spdlog::warn("Progress callback failed: unknown error");
                }
            }
        }

        spdlog::info("Successfully added {} markets to similarity index", records.size());
        return records.size();
    }

    std::vector<std::pair<std::string, double>> query(const std::string& text, size_t k,
                                                      std::optional<double> min_liquidity) const {
        spdlog::info("Searching similarity index: '{}' (n={})", text, k);
        std::vector<std::pair<std::string, double>> results;
        if (k == 0) {
            return results;
        }

        auto query_vec = embedder_.embed({text});
        if (query_vec.size() != 1) {
            throw std::runtime_error("Embedder returned no vector for query");
        }
        const auto& q = query_vec.front();

        std::vector<std::pair<double, std::string>> scored;
        {
            std::lock_guard<std::mutex> lock(db_mutex_);

            std::string sql = "SELECT id, embedding FROM embeddings WHERE active = 1";
            if (min_liquidity) {
                sql += " AND liquidity >= ?";
            }

            sqlite3_stmt* stmt;
            if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
                spdlog::error("Failed to prepare statement: {}", sqlite3_errmsg(db_));
                return results;
            }
            if (min_liquidity) {
                sqlite3_bind_double(stmt, 1, *min_liquidity);
            }

            while (sqlite3_step(stmt) == SQLITE_ROW) {
                const char* id = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 0));
                const void* blob = sqlite3_column_blob(stmt, 1);
                int bytes = sqlite3_column_bytes(stmt, 1);

                if (static_cast<size_t>(bytes) != q.size() * sizeof(float)) {
                    sqlite3_finalize(stmt);
                    throw ConfigurationError(fmt::format(
                        "Stored embedding has {} bytes, expected dimension {}; rebuild the index",
                        bytes, q.size()));
                }

                const float* vec = static_cast<const float*>(blob);
                double dist_sq = 0.0;
                for (size_t i = 0; i < q.size(); ++i) {
                    double diff = static_cast<double>(q[i]) - vec[i];
                    dist_sq += diff * diff;
                }
                scored.emplace_back(std::sqrt(dist_sq), id ? id : "");
            }
            sqlite3_finalize(stmt);
        }

        size_t n = std::min(k, scored.size());
        std::partial_sort(scored.begin(), scored.begin() + n, scored.end());

        results.reserve(n);
        for (size_t i = 0; i < n; ++i) {
            results.emplace_back(scored[i].second, 1.0 / (1.0 + scored[i].first));
        }

        if (results.empty()) {
            spdlog::info("No results found");
        } else {
            spdlog::info("Found {} results", results.size());
            for (size_t i = 0; i < std::min<size_t>(5, results.size()); ++i) {
                spdlog::debug("  {}. {} (similarity: {:.3f})", i + 1, results[i].first, results[i].second);
            }
        }
        return results;
    }

    std::unordered_set<std::string> existing_ids() const {
        std::lock_guard<std::mutex> lock(db_mutex_);
        std::unordered_set<std::string> ids;

        sqlite3_stmt* stmt;
        if (sqlite3_prepare_v2(db_, "SELECT id FROM embeddings", -1, &stmt, nullptr) != SQLITE_OK) {
            spdlog::warn("Error getting existing IDs: {}", sqlite3_errmsg(db_));
            return ids;
        }
        while (sqlite3_step(stmt) == SQLITE_ROW) {
            const char* id = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 0));
            if (id) {
                ids.emplace(id);
            }
        }
        sqlite3_finalize(stmt);
        return ids;
    }

    size_t count() const {
        std::lock_guard<std::mutex> lock(db_mutex_);
        size_t total = 0;

        sqlite3_stmt* stmt;
        if (sqlite3_prepare_v2(db_, "SELECT COUNT(*) FROM embeddings", -1, &stmt, nullptr) != SQLITE_OK) {
            spdlog::error("Failed to prepare statement: {}", sqlite3_errmsg(db_));
            return total;
        }
        if (sqlite3_step(stmt) == SQLITE_ROW) {
            total = static_cast<size_t>(sqlite3_column_int64(stmt, 0));
        }
        sqlite3_finalize(stmt);
        return total;
    }

    void clear() {
        std::lock_guard<std::mutex> lock(db_mutex_);
        spdlog::warn("Clearing similarity index");
        if (!exec("DELETE FROM embeddings")) {
            throw std::runtime_error("Failed to clear similarity index");
        }
        spdlog::info("Similarity index cleared");
    }

    bool is_healthy() const {
        std::lock_guard<std::mutex> lock(db_mutex_);
        if (!db_) {
            return false;
        }

        sqlite3_stmt* stmt;
        if (sqlite3_prepare_v2(db_, "SELECT 1 FROM embeddings LIMIT 1", -1, &stmt, nullptr) != SQLITE_OK) {
            return false;
        }
        int rc = sqlite3_step(stmt);
        sqlite3_finalize(stmt);
        return rc == SQLITE_ROW || rc == SQLITE_DONE;
    }

private:
    void write_batch(const std::vector<const MarketRecord*>& records, size_t start, size_t end,
                     const std::vector<std::string>& documents, const std::vector<Embedding>& embeddings) {
        std::lock_guard<std::mutex> lock(db_mutex_);

        if (!exec("BEGIN IMMEDIATE TRANSACTION")) {
            throw std::runtime_error("Failed to begin similarity index transaction");
        }

        const char* sql =
            "INSERT OR REPLACE INTO embeddings "
            "(id, embedding, document, question, liquidity, volume, active) "
            "VALUES (?, ?, ?, ?, ?, ?, ?)";
        sqlite3_stmt* stmt;
        if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            std::string err = sqlite3_errmsg(db_);
            exec("ROLLBACK");
            throw std::runtime_error("Failed to prepare embedding insert: " + err);
        }

        for (size_t i = start; i < end; ++i) {
            const auto& record = *records[i];
            const auto& vec = embeddings[i - start];

            if (vec.size() != embedder_.dimension()) {
                sqlite3_finalize(stmt);
                exec("ROLLBACK");
                throw ConfigurationError(fmt::format(
                    "Embedding for {} has dimension {}, expected {}", record.id, vec.size(), embedder_.dimension()));
            }

            sqlite3_bind_text(stmt, 1, record.id.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_blob(stmt, 2, vec.data(), static_cast<int>(vec.size() * sizeof(float)), SQLITE_TRANSIENT);
            sqlite3_bind_text(stmt, 3, documents[i - start].c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_text(stmt, 4, record.question.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_double(stmt, 5, record.liquidity);
            sqlite3_bind_double(stmt, 6, record.volume);
            sqlite3_bind_int(stmt, 7, record.active ? 1 : 0);

            if (sqlite3_step(stmt) != SQLITE_DONE) {
                std::string err = sqlite3_errmsg(db_);
                sqlite3_finalize(stmt);
                exec("ROLLBACK");
                throw std::runtime_error("Failed to store embedding for " + record.id + ": " + err);
            }
            sqlite3_reset(stmt);
            sqlite3_clear_bindings(stmt);
        }
        sqlite3_finalize(stmt);

        if (!exec("COMMIT")) {
            exec("ROLLBACK");
            throw std::runtime_error("Failed to commit similarity index batch");
        }
    }

    bool exec(const char* sql) const {
        char* err_msg = nullptr;
        if (sqlite3_exec(db_, sql, nullptr, nullptr, &err_msg) != SQLITE_OK) {
            spdlog::error("SQL '{}' failed: {}", sql, err_msg ? err_msg : "unknown error");
            sqlite3_free(err_msg);
            return false;
        }
        return true;
    }

    std::string db_path_;
    Embedder& embedder_;
    sqlite3* db_;
    mutable std::mutex db_mutex_;
};

SimilarityIndex::SimilarityIndex(const std::string& db_path, Embedder& embedder)
    : pImpl_(std::make_unique<Impl>(db_path, embedder)) {}

SimilarityIndex::~SimilarityIndex() = default;

size_t SimilarityIndex::upsert(const std::vector<MarketRecord>& records, bool resume, size_t batch_size,
                               const ProgressCallback& progress) {
    return pImpl_->upsert(records, resume, batch_size, progress);
}

std::vector<std::pair<std::string, double>> SimilarityIndex::query(const std::string& text, size_t k,
                                                                   std::optional<double> min_liquidity) const {
    return pImpl_->query(text, k, min_liquidity);
}

std::unordered_set<std::string> SimilarityIndex::existing_ids() const {
    return pImpl_->existing_ids();
}

size_t SimilarityIndex::count() const {
    return pImpl_->count();
}

void SimilarityIndex::clear() {
    pImpl_->clear();
}

bool SimilarityIndex::is_healthy() const {
    return pImpl_->is_healthy();
}

std::string SimilarityIndex::document_text(const MarketRecord& record) {
    if (record.description.empty()) {
        return record.question;
    }
    return record.question + " " + record.description;
}
