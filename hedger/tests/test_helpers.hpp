#pragma once

#include "capabilities.hpp"
#include "errors.hpp"
#include "types.hpp"
#include <atomic>
#include <filesystem>
#include <unistd.h>
#include <string>
#include <vector>

namespace test_helpers {

// SQLite file under the temp directory, removed with its journal files on destruction
class TempDbPath {
public:
    explicit TempDbPath(const std::string& stem) {
        static std::atomic<int> counter{0};
        path_ = (std::filesystem::temp_directory_path() /
                 (stem + "_" + std::to_string(::getpid()) + "_" + std::to_string(counter++) + ".db")).string();
        remove_files();
    }

    ~TempDbPath() { remove_files(); }

    const std::string& str() const { return path_; }

private:
    void remove_files() {
        std::error_code ec;
        for (const char* suffix : {"", "-journal", "-wal", "-shm"}) {
            std::filesystem::remove(path_ + suffix, ec);
        }
    }

    std::string path_;
};

inline MarketRecord make_record(const std::string& id,
                                const std::string& question,
                                double liquidity = 5000.0,
                                std::vector<Outcome> outcomes = {{"Yes", 0.5}, {"No", 0.5}}) {
    MarketRecord record;
    record.id = id;
    record.question = question;
    record.description = "";
    record.outcomes = std::move(outcomes);
    record.liquidity = liquidity;
    record.volume = 1000.0;
    record.active = true;
    return record;
}

inline ScoredRecord make_scored(const MarketRecord& record, double score, const std::string& outcome = "Yes") {
    ScoredRecord sr;
    sr.record = record;
    sr.relevance_score = score;
    sr.adjusted_score = score;
    sr.recommended_outcome = outcome;
    sr.correlation_explanation = "hedges the concern";
    return sr;
}

// Returns a fixed id list, or throws when configured to fail
class FakeRanker : public RankingCapability {
public:
    std::vector<std::string> ids;
    bool fail = false;
    int calls = 0;

    std::vector<std::string> rank(const std::vector<MarketRecord>&,
                                  const std::string&,
                                  const std::string&,
                                  size_t) override {
        ++calls;
        if (fail) {
            throw CapabilityFailure("ranking unavailable");
        }
        return ids;
    }
};

// Echoes the first top_k ids of every batch in input order
class PassThroughRanker : public RankingCapability {
public:
    std::vector<std::string> rank(const std::vector<MarketRecord>& batch,
                                  const std::string&,
                                  const std::string&,
                                  size_t top_k) override {
        std::vector<std::string> out;
        for (size_t i = 0; i < batch.size() && i < top_k; ++i) {
            out.push_back(batch[i].id);
        }
        return out;
    }
};

class FakeClassifier : public ThemeClassifier {
public:
    std::vector<Theme> themes;
    bool fail = false;
    int calls = 0;

    std::vector<Theme> classify(const std::vector<MarketRecord>&,
                                const std::string&,
                                const std::string&) override {
        ++calls;
        if (fail) {
            throw CapabilityFailure("classification timed out");
        }
        return themes;
    }
};

inline ThemeEntry entry(int index, double correlation, const std::string& outcome = "Yes") {
    ThemeEntry e;
    e.index = index;
    e.correlation_score = correlation;
    e.explanation = "correlated";
    e.recommended_outcome = outcome;
    return e;
}

} // namespace test_helpers
