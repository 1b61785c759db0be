#pragma once
#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

// Provenance of a source document, attached to every chunk cut from it.
struct SourceMetadata {
    std::string mpn;
    std::string manufacturer;
    std::string category;
    std::string description;
    std::string source_file;
    std::string source_path;
    std::string datasheet_url;
    std::string ingestion_timestamp;
    std::string file_hash;
    // Keys with no first-class field. Must be a JSON object (or null).
    nlohmann::json extra = nlohmann::json::object();
};

struct ChunkInfo {
    std::size_t chunk_index{0};
    std::size_t chunk_start{0};
    std::size_t chunk_end{0};
    std::size_t chunk_length{0}; // trimmed text length
    std::size_t total_text_length{0};
};

struct RecordMetadata {
    SourceMetadata source;
    std::optional<ChunkInfo> chunk;
};

// Conjunction of exact-match predicates over flattened record metadata.
struct MetadataFilter {
    std::map<std::string, nlohmann::json> equals;

    static MetadataFilter field_equals(const std::string& key, nlohmann::json value);
    bool empty() const { return equals.empty(); }
    bool matches(const nlohmann::json& flat) const;
};

// Flat object: known fields (non-empty ones only), extra keys, chunk fields.
nlohmann::json metadata_to_json(const RecordMetadata& m);
RecordMetadata metadata_from_json(const nlohmann::json& j);

void to_json(nlohmann::json& j, const SourceMetadata& m);
void from_json(const nlohmann::json& j, SourceMetadata& m);
