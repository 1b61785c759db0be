#include "../include/ingest.hpp"
#include "../include/errors.hpp"
#include "../include/util.hpp"
#include <nlohmann/json.hpp>
#include <cctype>
#include <cstring>
#include <fstream>
#include <sstream>
#include <system_error>

using json = nlohmann::json;

static bool starts_with_icase(const std::string& s, size_t pos, const char* prefix) {
    size_t n = std::strlen(prefix);
    if (pos + n > s.size()) return false;
    for (size_t i = 0; i < n; ++i) {
        if (std::tolower(static_cast<unsigned char>(s[pos + i])) != prefix[i]) return false;
    }
    return true;
}

// "Page 3", "PAGE 12 of 40", ...
static bool is_page_header(const std::string& line) {
    std::string t = trim(line);
    if (!starts_with_icase(t, 0, "page")) return false;
    size_t i = 4;
    size_t spaces = 0;
    while (i < t.size() && (t[i] == ' ' || t[i] == '\t')) { ++i; ++spaces; }
    return spaces > 0 && i < t.size() && std::isdigit(static_cast<unsigned char>(t[i]));
}

static bool is_allowed(unsigned char c) {
    if (c >= 0x80) return false;
    if (std::isalnum(c) || std::isspace(c) || c == '_') return true;
    return std::strchr(".,;:!?-()[]/+=<>@#$%^&*", c) != nullptr;
}

static bool url_starts_at(const std::string& s, size_t i) {
    if (i > 0 && std::isalnum(static_cast<unsigned char>(s[i - 1]))) return false;
    return starts_with_icase(s, i, "www.") || starts_with_icase(s, i, "http://") ||
           starts_with_icase(s, i, "https://");
}

std::string clean_text(const std::string& raw) {
    std::string kept;
    kept.reserve(raw.size());
    {
        std::istringstream ss(raw);
        std::string line;
        while (std::getline(ss, line)) {
            if (is_page_header(line)) continue;
            kept += line;
            kept += '\n';
        }
    }

    std::string out;
    out.reserve(kept.size());
    bool pending_space = false;
    size_t i = 0;
    while (i < kept.size()) {
        if (url_starts_at(kept, i)) {
            while (i < kept.size() && !std::isspace(static_cast<unsigned char>(kept[i]))) ++i;
            pending_space = true;
            continue;
        }
        unsigned char c = static_cast<unsigned char>(kept[i++]);
        if (!is_allowed(c) || std::isspace(c)) {
            pending_space = true;
            continue;
        }
        if (pending_space && !out.empty()) out += ' ';
        pending_space = false;
        out += static_cast<char>(c);
    }
    return out;
}

std::vector<IngestConfig> load_manifest(const std::filesystem::path& manifest) {
    std::string body = read_text_file(manifest);
    json j = json::parse(body, nullptr, false);
    if (j.is_discarded() || !j.is_array()) {
        throw SourceUnreadable("manifest " + manifest.string() + " is not a JSON array");
    }
    std::vector<IngestConfig> out;
    for (const auto& entry : j) {
        if (!entry.is_object()) throw SourceUnreadable("manifest entries must be objects");
        IngestConfig cfg;
        if (entry.contains("path") && entry["path"].is_string()) {
            cfg.path = entry["path"].get<std::string>();
        } else if (entry.contains("pdf_path") && entry["pdf_path"].is_string()) {
            cfg.path = entry["pdf_path"].get<std::string>();
        }
        if (entry.contains("component_info")) cfg.component_info = entry["component_info"].get<SourceMetadata>();
        out.push_back(std::move(cfg));
    }
    return out;
}

IngestionPipeline::IngestionPipeline(VectorCollection& collection, ChunkOptions opts, TextExtractor extractor)
    : collection_(collection), opts_(opts), extractor_(std::move(extractor)) {}

std::vector<std::string> IngestionPipeline::ingest(const std::string& raw_text, const SourceMetadata& component_info) {
    if (is_blank(raw_text)) {
        log_warn("no text to ingest for " + (component_info.mpn.empty() ? std::string("<unnamed>") : component_info.mpn));
        return {};
    }

    SourceMetadata source = component_info;
    for (std::string* f : {&source.mpn, &source.manufacturer, &source.category}) {
        if (f->empty()) *f = "unknown";
    }
    if (source.file_hash.empty()) source.file_hash = sha256_hex(raw_text);

    auto chunks = chunk_with_metadata(clean_text(raw_text), source, opts_);
    if (chunks.empty()) {
        log_warn("no chunks created for " + source.mpn);
        return {};
    }

    std::vector<std::string> texts;
    std::vector<RecordMetadata> metas;
    texts.reserve(chunks.size());
    metas.reserve(chunks.size());
    for (auto& c : chunks) {
        texts.push_back(std::move(c.first));
        metas.push_back(std::move(c.second));
    }
    auto ids = collection_.add(texts, metas);
    log_info("ingested " + source.mpn + " as " + std::to_string(ids.size()) + " chunks");
    return ids;
}

std::vector<std::string> IngestionPipeline::ingest_file(const std::filesystem::path& path,
                                                        const SourceMetadata& component_info) {
    SourceMetadata source = component_info;
    source.source_file = path.filename().string();
    source.source_path = path.string();
    source.file_hash = sha256_file(path);
    return ingest(extractor_(path), source);
}

std::map<std::string, std::vector<std::string>> IngestionPipeline::batch_ingest(const std::vector<IngestConfig>& configs) {
    std::map<std::string, std::vector<std::string>> results;
    for (const auto& cfg : configs) {
        const std::string key = cfg.path.string();
        std::error_code ec;
        if (key.empty() || !std::filesystem::exists(cfg.path, ec)) {
            log_error("datasheet not found: " + (key.empty() ? std::string("<empty path>") : key));
            results[key].clear();
            continue;
        }
        try {
            results[key] = ingest_file(cfg.path, cfg.component_info);
        } catch (const std::exception& e) {
            log_error("failed to ingest " + key + ": " + e.what());
            results[key].clear();
        }
    }
    return results;
}
