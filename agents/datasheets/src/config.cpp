#include "../include/config.hpp"
#include "../include/util.hpp"
#include <stdexcept>

EmbedConfig embed_config_from_env() {
    EmbedConfig c;
    c.encoder = getenv_or("DATASHEETS_ENCODER", c.encoder);
    c.ollama_url = getenv_or("OLLAMA_URL", c.ollama_url);
    c.embed_model = getenv_or("DATASHEETS_EMBED_MODEL", c.embed_model);
    c.timeout_ms = getenv_long_or("DATASHEETS_EMBED_TIMEOUT_MS", c.timeout_ms);
    long batch = getenv_long_or("DATASHEETS_EMBED_BATCH", (long)c.batch_size);
    if (batch > 0) c.batch_size = (std::size_t)batch;
    long dim = getenv_long_or("DATASHEETS_HASH_DIM", (long)c.hashing_dim);
    if (dim > 0) c.hashing_dim = (std::size_t)dim;
    return c;
}

StoreConfig store_config_from_env() {
    StoreConfig c;
    c.persist_dir = getenv_or("DATASHEETS_DB_DIR", c.persist_dir.string());
    c.collection_name = getenv_or("DATASHEETS_COLLECTION", c.collection_name);
    return c;
}

std::string encoder_id_for(const EmbedConfig& cfg) {
    if (cfg.encoder == "ollama") return "ollama:" + cfg.embed_model;
    if (cfg.encoder == "hashing") return "hashing:" + std::to_string(cfg.hashing_dim);
    throw std::invalid_argument("unknown encoder: " + cfg.encoder);
}

EncoderFactory make_encoder_factory(const EmbedConfig& cfg) {
    if (cfg.encoder == "ollama") {
        OllamaEncoderConfig oc{cfg.ollama_url, cfg.embed_model, cfg.timeout_ms};
        return [oc]() -> std::unique_ptr<TextEncoder> { return std::make_unique<OllamaEncoder>(oc); };
    }
    if (cfg.encoder == "hashing") {
        std::size_t dim = cfg.hashing_dim;
        return [dim]() -> std::unique_ptr<TextEncoder> { return std::make_unique<HashingEncoder>(dim); };
    }
    throw std::invalid_argument("unknown encoder: " + cfg.encoder);
}
