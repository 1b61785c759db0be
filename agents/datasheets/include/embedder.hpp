#pragma once
#include <atomic>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

// A model that maps text to fixed-width vectors.
class TextEncoder {
public:
    virtual ~TextEncoder() = default;
    virtual std::string name() const = 0;
    virtual std::size_t dimension() = 0;
    // One vector per input, in input order.
    virtual std::vector<std::vector<float>> encode(const std::vector<std::string>& texts) = 0;
};

struct OllamaEncoderConfig {
    std::string ollama_url{"http://localhost:11434"};
    std::string embed_model{"all-minilm"};
    long timeout_ms{30000};
};

// Embeddings served by an Ollama instance (POST /api/embed).
class OllamaEncoder : public TextEncoder {
public:
    explicit OllamaEncoder(OllamaEncoderConfig cfg);
    std::string name() const override;
    // Probes the model with one request the first time it is called.
    std::size_t dimension() override;
    std::vector<std::vector<float>> encode(const std::vector<std::string>& texts) override;

private:
    OllamaEncoderConfig cfg_;
    std::size_t dim_{0};
};

// Hashing-trick bag of words: lower-cased alphanumeric tokens hashed into
// `dim` buckets, L2-normalized. Needs no model and is stable across runs.
class HashingEncoder : public TextEncoder {
public:
    explicit HashingEncoder(std::size_t dim = 384);
    std::string name() const override;
    std::size_t dimension() override { return dim_; }
    std::vector<std::vector<float>> encode(const std::vector<std::string>& texts) override;

    std::vector<float> encode_one(const std::string& text) const;

private:
    std::size_t dim_;
};

using EncoderFactory = std::function<std::unique_ptr<TextEncoder>()>;

// Owns a lazily loaded encoder. The factory runs once, on first use, even
// when several threads race for it; if it fails the next call tries again.
class EmbeddingProvider {
public:
    // encoder_id names the model (e.g. "ollama:all-minilm") and is what a
    // collection is bound to; it must be known without loading the model.
    EmbeddingProvider(std::string encoder_id, EncoderFactory factory, std::size_t batch_size = 32);

    EmbeddingProvider(const EmbeddingProvider&) = delete;
    EmbeddingProvider& operator=(const EmbeddingProvider&) = delete;

    // Throws EmptyInput for blank text.
    std::vector<float> embed_one(const std::string& text);

    // Result i belongs to texts[i]; blank entries are std::nullopt and never
    // reach the encoder. Throws AllInputsEmpty if every entry is blank.
    std::vector<std::optional<std::vector<float>>> embed_many(const std::vector<std::string>& texts);

    std::size_t dimension();
    const std::string& encoder_id() const { return encoder_id_; }
    bool initialized() const { return ready_.load(std::memory_order_acquire); }

private:
    TextEncoder& encoder();
    std::vector<std::vector<float>> encode_checked(const std::vector<std::string>& texts);

    std::string encoder_id_;
    EncoderFactory factory_;
    std::size_t batch_size_;

    std::mutex init_mtx_;
    std::atomic<bool> ready_{false};
    std::unique_ptr<TextEncoder> encoder_;
    std::size_t dim_{0};
};
