#pragma once
#include "config.hpp"
#include <string>
#include <vector>
#include <memory>

using Embedding = std::vector<float>;

class Embedder {
public:
    virtual ~Embedder() = default;

    // One vector per input text, in input order. Throws on failure.
    virtual std::vector<Embedding> embed(const std::vector<std::string>& texts) = 0;

    virtual size_t dimension() const = 0;
};

// Deterministic local embedder: signed feature hashing of word unigrams and bigrams, L2-normalized.
class HashingEmbedder : public Embedder {
public:
    explicit HashingEmbedder(size_t dimension = 384);

    std::vector<Embedding> embed(const std::vector<std::string>& texts) override;
    size_t dimension() const override { return dimension_; }

private:
    Embedding embed_one(const std::string& text) const;

    size_t dimension_;
};

// Remote embedder speaking the OpenAI-compatible /embeddings protocol
class HttpEmbedder : public Embedder {
public:
    explicit HttpEmbedder(const Config& config);
    ~HttpEmbedder() override;

    std::vector<Embedding> embed(const std::vector<std::string>& texts) override;
    size_t dimension() const override;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl_;
};

// HttpEmbedder when an endpoint is configured, HashingEmbedder otherwise
std::unique_ptr<Embedder> make_embedder(const Config& config);
