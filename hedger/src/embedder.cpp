#include "embedder.hpp"
#include "util.hpp"
#include <cpr/cpr.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdint>
#include <stdexcept>

namespace {

uint64_t fnv1a(const std::string& text) {
    uint64_t hash = 14695981039346656037ULL;
    for (unsigned char c : text) {
        hash ^= c;
        hash *= 1099511628211ULL;
    }
    return hash;
}

std::vector<std::string> tokenize(const std::string& text) {
    std::vector<std::string> tokens;
    std::string current;
    for (unsigned char c : text) {
        if (std::isalnum(c)) {
            current.push_back(static_cast<char>(std::tolower(c)));
        } else if (!current.empty()) {
            tokens.push_back(current);
            current.clear();
        }
    }
    if (!current.empty()) {
        tokens.push_back(current);
    }
    return tokens;
}

} // namespace

HashingEmbedder::HashingEmbedder(size_t dimension) : dimension_(dimension) {
    if (dimension_ == 0) {
        throw std::invalid_argument("Embedding dimension must be positive");
    }
}

std::vector<Embedding> HashingEmbedder::embed(const std::vector<std::string>& texts) {
    std::vector<Embedding> embeddings;
    embeddings.reserve(texts.size());
    for (const auto& text : texts) {
        embeddings.push_back(embed_one(text));
    }
    return embeddings;
}

Embedding HashingEmbedder::embed_one(const std::string& text) const {
    Embedding vec(dimension_, 0.0f);
    auto tokens = tokenize(text);

    auto add_feature = [&](const std::string& feature, float weight) {
        uint64_t h = fnv1a(feature);
        size_t slot = static_cast<size_t>(h % dimension_);
        float sign = ((h >> 63) & 1ULL) ? -1.0f : 1.0f;
        vec[slot] += sign * weight;
    };

    for (size_t i = 0; i < tokens.size(); ++i) {
        add_feature(tokens[i], 1.0f);
        if (i + 1 < tokens.size()) {
            add_feature(tokens[i] + " " + tokens[i + 1], 0.5f);
        }
    }

    double norm = 0.0;
    for (float v : vec) {
        norm += static_cast<double>(v) * v;
    }
    if (norm > 0.0) {
        float inv = static_cast<float>(1.0 / std::sqrt(norm));
        for (auto& v : vec) {
            v *= inv;
        }
    }
    return vec;
}

class HttpEmbedder::Impl {
public:
    explicit Impl(const Config& config)
        : url_(config.embedding_api_url),
          api_key_(config.embedding_api_key),
          model_(config.embedding_model),
          dimension_(static_cast<size_t>(config.embedding_dimension)),
          timeout_ms_(config.http_timeout_ms) {
        spdlog::info("Using embedding endpoint {} (model: {}, dimension: {})", url_, model_, dimension_);
    }

    std::vector<Embedding> embed(const std::vector<std::string>& texts) {
        if (texts.empty()) {
            return {};
        }
        spdlog::debug("Generating embeddings for {} texts", texts.size());

        nlohmann::json body;
        body["model"] = model_;
        body["input"] = texts;

        cpr::Header headers{{"Content-Type", "application/json"}, {"User-Agent", "PolyHedge/1.0"}};
        if (!api_key_.empty()) {
            headers["Authorization"] = "Bearer " + api_key_;
        }

        auto response = cpr::Post(
            cpr::Url{url_},
            headers,
            cpr::Body{body.dump()},
            cpr::Timeout{timeout_ms_}
        );

        if (response.error) {
            throw std::runtime_error("Embedding request failed: " + response.error.message);
        }
        if (response.status_code != 200) {
            throw std::runtime_error(fmt::format("Embedding request failed with status {}", response.status_code));
        }

        try {
            auto json_res = nlohmann::json::parse(response.text);
            const auto& data = json_res.at("data");

            std::vector<Embedding> embeddings(texts.size());
            size_t position = 0;
            for (const auto& item : data) {
                size_t index = item.contains("index") ? item["index"].get<size_t>() : position;
                if (index >= embeddings.size()) {
                    throw std::runtime_error("Embedding index out of range");
                }
                embeddings[index] = item.at("embedding").get<Embedding>();
                if (embeddings[index].size() != dimension_) {
                    throw std::runtime_error(fmt::format(
                        "Embedding dimension {} does not match configured {}", embeddings[index].size(), dimension_));
                }
                ++position;
            }

            if (position != texts.size()) {
                throw std::runtime_error(fmt::format(
                    "Expected {} embeddings, received {}", texts.size(), position));
            }
            return embeddings;
        } catch (const nlohmann::json::exception& e) {
            throw std::runtime_error(std::string("Unexpected embedding response format: ") + e.what());
        }
    }

    size_t dimension() const { return dimension_; }

private:
    std::string url_;
    std::string api_key_;
    std::string model_;
    size_t dimension_;
    int timeout_ms_;
};

HttpEmbedder::HttpEmbedder(const Config& config)
    : pImpl_(std::make_unique<Impl>(config)) {}

HttpEmbedder::~HttpEmbedder() = default;

std::vector<Embedding> HttpEmbedder::embed(const std::vector<std::string>& texts) {
    return pImpl_->embed(texts);
}

size_t HttpEmbedder::dimension() const {
    return pImpl_->dimension();
}

std::unique_ptr<Embedder> make_embedder(const Config& config) {
    if (config.embedding_api_url.empty()) {
        spdlog::info("No embedding endpoint configured, using hashing embedder (dimension: {})",
                     config.embedding_dimension);
        return std::make_unique<HashingEmbedder>(static_cast<size_t>(config.embedding_dimension));
    }
    return std::make_unique<HttpEmbedder>(config);
}
