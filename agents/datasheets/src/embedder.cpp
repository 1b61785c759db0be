#include "../include/embedder.hpp"
#include "../include/errors.hpp"
#include "../include/http.hpp"
#include "../include/util.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <chrono>
#include <cmath>
#include <stdexcept>

using json = nlohmann::json;

OllamaEncoder::OllamaEncoder(OllamaEncoderConfig cfg) : cfg_(std::move(cfg)) {
    if (!cfg_.ollama_url.empty() && cfg_.ollama_url.back() == '/') cfg_.ollama_url.pop_back();
}

std::string OllamaEncoder::name() const {
    return "ollama:" + cfg_.embed_model;
}

std::size_t OllamaEncoder::dimension() {
    if (dim_ == 0) {
        auto probe = encode({"dimension probe"});
        dim_ = probe.at(0).size();
    }
    return dim_;
}

std::vector<std::vector<float>> OllamaEncoder::encode(const std::vector<std::string>& texts) {
    if (texts.empty()) return {};
    json body = {
        {"model", cfg_.embed_model},
        {"input", texts}
    };
    HttpResponse r;
    try {
        r = http_post_json(cfg_.ollama_url + "/api/embed", body.dump(), cfg_.timeout_ms);
    } catch (const std::exception& e) {
        throw EncoderUnavailable(std::string("embedding request failed: ") + e.what());
    }
    if (r.status < 200 || r.status >= 300) {
        throw EncoderUnavailable("embedding failed: status " + std::to_string(r.status) + " " +
                                 r.body.substr(0, 200));
    }

    std::vector<std::vector<float>> out;
    try {
        auto data = json::parse(r.body);
        for (auto& e : data.at("embeddings")) {
            std::vector<float> vec;
            vec.reserve(e.size());
            for (auto& v : e) vec.push_back(v.get<float>());
            out.push_back(std::move(vec));
        }
    } catch (const json::exception& e) {
        throw EncoderUnavailable(std::string("malformed embedding response: ") + e.what());
    }
    if (out.size() != texts.size()) {
        throw EncoderUnavailable("embedding response has " + std::to_string(out.size()) +
                                 " vectors for " + std::to_string(texts.size()) + " inputs");
    }
    if (dim_ == 0 && !out.empty()) dim_ = out.front().size();
    return out;
}

HashingEncoder::HashingEncoder(std::size_t dim) : dim_(dim) {
    if (dim_ == 0) throw std::invalid_argument("hashing encoder dimension must be positive");
}

std::string HashingEncoder::name() const {
    return "hashing:" + std::to_string(dim_);
}

std::vector<float> HashingEncoder::encode_one(const std::string& text) const {
    std::vector<float> vec(dim_, 0.0f);
    std::string token;
    auto flush = [&]() {
        if (token.empty()) return;
        vec[fnv1a_64(token) % dim_] += 1.0f;
        token.clear();
    };
    for (char c : text) {
        if (std::isalnum(static_cast<unsigned char>(c))) {
            token += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        } else {
            flush();
        }
    }
    flush();

    float norm = 0.0f;
    for (float v : vec) norm += v * v;
    if (norm > 0.0f) {
        norm = std::sqrt(norm);
        for (float& v : vec) v /= norm;
    }
    return vec;
}

std::vector<std::vector<float>> HashingEncoder::encode(const std::vector<std::string>& texts) {
    std::vector<std::vector<float>> out;
    out.reserve(texts.size());
    for (const auto& t : texts) out.push_back(encode_one(t));
    return out;
}

EmbeddingProvider::EmbeddingProvider(std::string encoder_id, EncoderFactory factory, std::size_t batch_size)
    : encoder_id_(std::move(encoder_id)), factory_(std::move(factory)), batch_size_(std::max<std::size_t>(1, batch_size)) {
    if (!factory_) throw std::invalid_argument("embedding provider needs an encoder factory");
}

TextEncoder& EmbeddingProvider::encoder() {
    if (ready_.load(std::memory_order_acquire)) return *encoder_;

    std::lock_guard<std::mutex> lock(init_mtx_);
    if (ready_.load(std::memory_order_relaxed)) return *encoder_;

    log_info("loading text encoder " + encoder_id_);
    auto t0 = std::chrono::steady_clock::now();
    std::unique_ptr<TextEncoder> enc;
    std::size_t dim = 0;
    try {
        enc = factory_();
        if (!enc) throw EncoderUnavailable("encoder factory returned nothing for " + encoder_id_);
        dim = enc->dimension();
    } catch (const EncoderUnavailable& e) {
        log_error(std::string("failed to load text encoder: ") + e.what());
        throw;
    } catch (const std::exception& e) {
        log_error(std::string("failed to load text encoder: ") + e.what());
        throw EncoderUnavailable("failed to load encoder " + encoder_id_ + ": " + e.what());
    }
    if (dim == 0) throw EncoderUnavailable("encoder " + encoder_id_ + " reports zero dimension");
    if (enc->name() != encoder_id_) {
        log_warn("encoder loaded as " + encoder_id_ + " reports itself as " + enc->name() +
                 "; collections stay bound to " + encoder_id_);
    }

    encoder_ = std::move(enc);
    dim_ = dim;
    ready_.store(true, std::memory_order_release);

    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - t0).count();
    log_info("text encoder " + encoder_id_ + " ready (dim " + std::to_string(dim_) + ", " +
             std::to_string(ms) + " ms)");
    return *encoder_;
}

std::vector<std::vector<float>> EmbeddingProvider::encode_checked(const std::vector<std::string>& texts) {
    TextEncoder& enc = encoder();
    std::vector<std::vector<float>> out;
    try {
        out = enc.encode(texts);
    } catch (const EncoderUnavailable&) {
        throw;
    } catch (const std::exception& e) {
        throw EncoderUnavailable(std::string("encode failed: ") + e.what());
    }
    if (out.size() != texts.size()) {
        throw EncoderUnavailable("encoder returned " + std::to_string(out.size()) + " vectors for " +
                                 std::to_string(texts.size()) + " inputs");
    }
    for (const auto& v : out) {
        if (v.size() != dim_) {
            throw EncoderUnavailable("encoder returned a " + std::to_string(v.size()) +
                                     "-wide vector, expected " + std::to_string(dim_));
        }
    }
    return out;
}

std::vector<float> EmbeddingProvider::embed_one(const std::string& text) {
    if (is_blank(text)) throw EmptyInput("text cannot be empty");
    return std::move(encode_checked({text}).front());
}

std::vector<std::optional<std::vector<float>>> EmbeddingProvider::embed_many(const std::vector<std::string>& texts) {
    std::vector<std::optional<std::vector<float>>> out(texts.size());
    if (texts.empty()) return out;

    std::vector<std::size_t> live;
    for (std::size_t i = 0; i < texts.size(); ++i) {
        if (!is_blank(texts[i])) live.push_back(i);
    }
    if (live.empty()) throw AllInputsEmpty("all texts are empty");

    for (std::size_t b = 0; b < live.size(); b += batch_size_) {
        std::size_t e = std::min(live.size(), b + batch_size_);
        std::vector<std::string> batch;
        batch.reserve(e - b);
        for (std::size_t j = b; j < e; ++j) batch.push_back(texts[live[j]]);
        auto vecs = encode_checked(batch);
        for (std::size_t j = b; j < e; ++j) out[live[j]] = std::move(vecs[j - b]);
    }
    if (live.size() < texts.size()) {
        log_debug("skipped " + std::to_string(texts.size() - live.size()) + " blank texts while embedding");
    }
    return out;
}

std::size_t EmbeddingProvider::dimension() {
    encoder();
    return dim_;
}
