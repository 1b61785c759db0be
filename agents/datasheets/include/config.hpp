#pragma once
#include <cstddef>
#include <filesystem>
#include <string>
#include "embedder.hpp"

struct EmbedConfig {
    std::string encoder{"ollama"}; // ollama | hashing
    std::string ollama_url{"http://localhost:11434"};
    std::string embed_model{"all-minilm"};
    long timeout_ms{30000};
    std::size_t batch_size{32};
    std::size_t hashing_dim{384};
};

struct StoreConfig {
    std::filesystem::path persist_dir{"./data/vector_db"};
    std::string collection_name{"component_datasheets"};
    // Hold an advisory lock on the directory so a second process cannot open it.
    bool exclusive_lock{true};
};

// Defaults overridden by DATASHEETS_* / OLLAMA_URL environment variables.
EmbedConfig embed_config_from_env();
StoreConfig store_config_from_env();

// Identity string the collection is bound to, e.g. "ollama:all-minilm".
std::string encoder_id_for(const EmbedConfig& cfg);

// Throws std::invalid_argument for an unknown encoder kind.
EncoderFactory make_encoder_factory(const EmbedConfig& cfg);
