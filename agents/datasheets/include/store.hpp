#pragma once
#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "config.hpp"
#include "embedder.hpp"
#include "metadata.hpp"

struct sqlite3;
struct sqlite3_stmt;

struct StoredRecord {
    std::string id;
    std::string text;
    std::vector<float> embedding;
    RecordMetadata metadata;
};

struct SearchResult {
    std::string id;
    std::string text;
    RecordMetadata metadata;
    float distance{0.0f}; // 1 - cosine similarity; lower is closer
};

struct CollectionStats {
    std::size_t total_records{0};
    std::string collection_name;
    std::string storage_location;
};

// A named collection of embedded text chunks persisted in SQLite under
// StoreConfig::persist_dir. The collection row is created by the first add()
// and remembers which encoder produced its vectors; using it through a
// different encoder raises EncoderMismatch.
//
// Assumes one owning process per directory; with exclusive_lock set a second
// process fails to open it with StoreUnavailable.
class VectorCollection {
public:
    VectorCollection(StoreConfig cfg, EmbeddingProvider& embedder);
    ~VectorCollection();

    VectorCollection(const VectorCollection&) = delete;
    VectorCollection& operator=(const VectorCollection&) = delete;

    // Embeds and stores each text with its metadata in one transaction.
    // Returns a fresh UUID per text, in input order.
    std::vector<std::string> add(const std::vector<std::string>& texts,
                                 const std::vector<RecordMetadata>& metadata);

    // Up to k records ordered by ascending distance to the query; ties keep
    // insertion order.
    std::vector<SearchResult> search(const std::string& query, std::size_t k,
                                     const std::optional<MetadataFilter>& filter = std::nullopt);
    std::vector<SearchResult> search_by_category(const std::string& query, const std::string& category,
                                                 std::size_t k = 5);

    // Records in the order of ids; unknown ids are skipped.
    std::vector<StoredRecord> get(const std::vector<std::string>& ids);

    std::size_t count();
    CollectionStats stats();

    // Drops every record and the collection itself. The next add() recreates it.
    void delete_collection();

    const std::string& name() const { return cfg_.collection_name; }

private:
    struct Binding {
        std::string encoder;
        std::size_t dimension{0};
    };

    void init();
    void exec(const std::string& sql);
    void prepare(const char* sql, struct sqlite3_stmt** st);
    void prepare_statements();
    void close_statements();
    void release();
    void acquire_lock();

    std::optional<Binding> find_binding();
    void check_binding(const Binding& b, std::size_t dim);
    [[noreturn]] void fail(const std::string& what);

    StoreConfig cfg_;
    EmbeddingProvider& embedder_;
    std::mutex mtx_;
    int lock_fd_{-1};

    struct sqlite3* db_ {nullptr};
    struct sqlite3_stmt* insert_stmt_ {nullptr};
    struct sqlite3_stmt* scan_stmt_ {nullptr};
    struct sqlite3_stmt* get_stmt_ {nullptr};
    struct sqlite3_stmt* count_stmt_ {nullptr};
    struct sqlite3_stmt* binding_stmt_ {nullptr};
    struct sqlite3_stmt* create_stmt_ {nullptr};
    struct sqlite3_stmt* delete_records_stmt_ {nullptr};
    struct sqlite3_stmt* delete_collection_stmt_ {nullptr};
};
