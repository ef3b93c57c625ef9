#include "cache_refresher.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>

using json = nlohmann::json;

void emit_progress(const ProgressEmitter& progress, const std::string& type, json data) {
    if (!progress) {
        return;
    }
    try {
        progress({{"type", type}, {"data", std::move(data)}});
    } catch (const std::exception& e) {
        spdlog::warn("Progress callback failed on '{}' event: {}", type, e.what());
    } catch (...) {
        spdlog::warn("Progress callback failed on '{}' event: unknown error", type);
    }
}

json RefreshReport::to_json() const {
    return {
        {"success", success},
        {"fetched", fetched},
        {"indexed", indexed}
    };
}

CacheRefresher::CacheRefresher(const Config& config, RecordStore& store, SimilarityIndex* index, MarketFeedClient* feed)
    : config_(config), store_(store), index_(index), feed_(feed) {}

RefreshReport CacheRefresher::refresh_cache(bool resume, const ProgressEmitter& progress) {
    if (!feed_) {
        throw ConfigurationError("No market feed configured");
    }

    RefreshReport report;
    emit_progress(progress, "refresh_started", {{"resume", resume}});

    auto records = feed_->fetch_all();
    report.fetched = records.size();
    emit_progress(progress, "fetch_complete", {{"fetched", report.fetched}});

    if (records.empty()) {
        spdlog::error("Feed returned no markets, keeping existing cache");
        emit_progress(progress, "error", {{"message", "Feed returned no markets"}});
        return report;
    }

    if (!store_.replace_all(records)) {
        spdlog::error("Failed to store {} fetched markets", records.size());
        emit_progress(progress, "error", {{"message", "Failed to store fetched markets"}});
        return report;
    }
    spdlog::info("Cached {} markets", records.size());

    report.indexed = index_stored(resume, progress);
    report.success = true;
    emit_progress(progress, "complete", report.to_json());
    return report;
}

RefreshReport CacheRefresher::update_index(bool resume, const ProgressEmitter& progress) {
    RefreshReport report;
    emit_progress(progress, "refresh_started", {{"resume", resume}});
    report.indexed = index_stored(resume, progress);
    report.success = true;
    emit_progress(progress, "complete", report.to_json());
    return report;
}

size_t CacheRefresher::index_stored(bool resume, const ProgressEmitter& progress) {
    if (!index_) {
        throw ConfigurationError("No similarity index configured");
    }

    auto records = store_.get_all();
    spdlog::info("Indexing {} markets (resume: {})", records.size(), resume);

    ProgressCallback on_batch = [&progress](int done, int total) {
        emit_progress(progress, "progress",
                      {{"step", "index"}, {"completed_batches", done}, {"total_batches", total}});
    };

    size_t written = index_->upsert(records, resume, static_cast<size_t>(config_.index_batch_size), on_batch);
    spdlog::info("Indexed {} markets, index now holds {}", written, index_->count());
    return written;
}

json CacheRefresher::cache_status() const {
    json status;
    status["markets_cached"] = store_.count();
    auto age = store_.cache_age();
    status["cache_age_seconds"] = age ? json(age->count()) : json(nullptr);
    status["store_healthy"] = store_.is_healthy();
    status["index_configured"] = index_ != nullptr;
    if (index_) {
        status["markets_indexed"] = index_->count();
        status["index_healthy"] = index_->is_healthy();
    }
    status["timestamp"] = util::current_iso8601();
    return status;
}
