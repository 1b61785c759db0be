#pragma once
#include <filesystem>
#include <functional>
#include <map>
#include <string>
#include <vector>
#include "chunker.hpp"
#include "metadata.hpp"
#include "store.hpp"
#include "util.hpp"

// Turns a document on disk into text. Throws SourceUnreadable on failure.
using TextExtractor = std::function<std::string(const std::filesystem::path&)>;

struct IngestConfig {
    std::filesystem::path path;
    SourceMetadata component_info;
};

// Normalizes extracted datasheet text: drops "Page N" header lines and bare
// URLs, replaces characters outside a conservative allow-list with spaces and
// collapses whitespace. Never throws.
std::string clean_text(const std::string& raw);

// Reads a JSON array of {"path" | "pdf_path", "component_info": {...}}.
// Throws SourceUnreadable if the file is missing or malformed.
std::vector<IngestConfig> load_manifest(const std::filesystem::path& manifest);

class IngestionPipeline {
public:
    explicit IngestionPipeline(VectorCollection& collection, ChunkOptions opts = {},
                               TextExtractor extractor = read_text_file);

    // Cleans, chunks and stores raw_text. Every chunk carries component_info,
    // with mpn/manufacturer/category defaulting to "unknown" and file_hash to
    // the SHA-256 of raw_text. Blank text stores nothing. Documents already
    // seen are not skipped; callers check file_hash themselves.
    std::vector<std::string> ingest(const std::string& raw_text, const SourceMetadata& component_info);

    // ingest() on the extractor's output for path, with source_file,
    // source_path and the file's SHA-256 ("unknown" if unreadable) filled in.
    std::vector<std::string> ingest_file(const std::filesystem::path& path, const SourceMetadata& component_info);

    // Each entry is ingested on its own; a missing or failing entry maps to
    // an empty id list and the rest still run.
    std::map<std::string, std::vector<std::string>> batch_ingest(const std::vector<IngestConfig>& configs);

    const ChunkOptions& options() const { return opts_; }

private:
    VectorCollection& collection_;
    ChunkOptions opts_;
    TextExtractor extractor_;
};
