#include "../include/metadata.hpp"
#include <utility>

using json = nlohmann::json;

struct KnownField {
    const char* key;
    std::string SourceMetadata::*member;
};

static const KnownField kKnownFields[] = {
    {"mpn", &SourceMetadata::mpn},
    {"manufacturer", &SourceMetadata::manufacturer},
    {"category", &SourceMetadata::category},
    {"description", &SourceMetadata::description},
    {"source_file", &SourceMetadata::source_file},
    {"source_path", &SourceMetadata::source_path},
    {"datasheet_url", &SourceMetadata::datasheet_url},
    {"ingestion_timestamp", &SourceMetadata::ingestion_timestamp},
    {"file_hash", &SourceMetadata::file_hash},
};

static const char* kChunkKeys[] = {
    "chunk_index", "chunk_start", "chunk_end", "chunk_length", "total_text_length"
};

static bool is_chunk_key(const std::string& k) {
    for (const char* c : kChunkKeys) {
        if (k == c) return true;
    }
    return false;
}

MetadataFilter MetadataFilter::field_equals(const std::string& key, json value) {
    MetadataFilter f;
    f.equals.emplace(key, std::move(value));
    return f;
}

bool MetadataFilter::matches(const json& flat) const {
    if (!flat.is_object()) return equals.empty();
    for (const auto& kv : equals) {
        auto it = flat.find(kv.first);
        if (it == flat.end() || *it != kv.second) return false;
    }
    return true;
}

void to_json(json& j, const SourceMetadata& m) {
    j = m.extra.is_object() ? m.extra : json::object();
    for (const auto& f : kKnownFields) {
        const std::string& v = m.*(f.member);
        if (!v.empty()) j[f.key] = v;
    }
}

void from_json(const json& j, SourceMetadata& m) {
    m = SourceMetadata{};
    if (!j.is_object()) return;
    for (auto it = j.begin(); it != j.end(); ++it) {
        bool taken = false;
        if (it.value().is_string()) {
            for (const auto& f : kKnownFields) {
                if (it.key() == f.key) {
                    m.*(f.member) = it.value().get<std::string>();
                    taken = true;
                    break;
                }
            }
        }
        if (!taken) m.extra[it.key()] = it.value();
    }
}

json metadata_to_json(const RecordMetadata& m) {
    json j = m.source;
    if (m.chunk) {
        j["chunk_index"] = m.chunk->chunk_index;
        j["chunk_start"] = m.chunk->chunk_start;
        j["chunk_end"] = m.chunk->chunk_end;
        j["chunk_length"] = m.chunk->chunk_length;
        j["total_text_length"] = m.chunk->total_text_length;
    }
    return j;
}

RecordMetadata metadata_from_json(const json& j) {
    RecordMetadata m;
    if (!j.is_object()) return m;

    bool has_chunk = true;
    for (const char* k : kChunkKeys) {
        auto it = j.find(k);
        if (it == j.end() || !it->is_number_unsigned()) { has_chunk = false; break; }
    }

    json source = json::object();
    for (auto it = j.begin(); it != j.end(); ++it) {
        if (has_chunk && is_chunk_key(it.key())) continue;
        source[it.key()] = it.value();
    }
    m.source = source.get<SourceMetadata>();

    if (has_chunk) {
        ChunkInfo c;
        c.chunk_index = j.at("chunk_index").get<std::size_t>();
        c.chunk_start = j.at("chunk_start").get<std::size_t>();
        c.chunk_end = j.at("chunk_end").get<std::size_t>();
        c.chunk_length = j.at("chunk_length").get<std::size_t>();
        c.total_text_length = j.at("total_text_length").get<std::size_t>();
        m.chunk = c;
    }
    return m;
}
