#include "../include/store.hpp"
#include "../include/errors.hpp"
#include "../include/util.hpp"
#include <sqlite3.h>
#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>
#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstring>

using json = nlohmann::json;

static void bind_text(sqlite3_stmt* st, int idx, const std::string& v) {
    sqlite3_bind_text(st, idx, v.c_str(), (int)v.size(), SQLITE_TRANSIENT);
}

static void bind_blob(sqlite3_stmt* st, int idx, const std::vector<float>& v) {
    sqlite3_bind_blob(st, idx, v.data(), (int)(v.size() * sizeof(float)), SQLITE_TRANSIENT);
}

static std::string column_text(sqlite3_stmt* st, int idx) {
    const unsigned char* p = sqlite3_column_text(st, idx);
    return p ? std::string(reinterpret_cast<const char*>(p), (size_t)sqlite3_column_bytes(st, idx)) : std::string();
}

static std::vector<float> column_vector(sqlite3_stmt* st, int idx) {
    const void* blob = sqlite3_column_blob(st, idx);
    int bytes = sqlite3_column_bytes(st, idx);
    std::vector<float> vec(bytes / (int)sizeof(float));
    if (blob && !vec.empty()) std::memcpy(vec.data(), blob, vec.size() * sizeof(float));
    return vec;
}

// Resets a statement when the scope ends, also on the error path.
struct StmtScope {
    sqlite3_stmt* st;
    explicit StmtScope(sqlite3_stmt* s) : st(s) { sqlite3_reset(st); sqlite3_clear_bindings(st); }
    ~StmtScope() { sqlite3_reset(st); }
};

// Rolls back unless commit() was reached.
class Transaction {
public:
    explicit Transaction(sqlite3* db) : db_(db) {
        char* err = nullptr;
        if (sqlite3_exec(db_, "BEGIN IMMEDIATE;", nullptr, nullptr, &err) != SQLITE_OK) {
            std::string msg = err ? err : "unknown";
            sqlite3_free(err);
            throw StoreUnavailable("SQLite begin failed: " + msg);
        }
    }
    ~Transaction() {
        if (!done_) sqlite3_exec(db_, "ROLLBACK;", nullptr, nullptr, nullptr);
    }
    void commit() {
        char* err = nullptr;
        if (sqlite3_exec(db_, "COMMIT;", nullptr, nullptr, &err) != SQLITE_OK) {
            std::string msg = err ? err : "unknown";
            sqlite3_free(err);
            throw StoreUnavailable("SQLite commit failed: " + msg);
        }
        done_ = true;
    }

private:
    sqlite3* db_;
    bool done_{false};
};

struct Candidate {
    sqlite3_int64 seq;
    std::string id;
    std::string text;
    std::string meta_raw;
    std::optional<json> meta;
    float distance;
};

VectorCollection::VectorCollection(StoreConfig cfg, EmbeddingProvider& embedder)
    : cfg_(std::move(cfg)), embedder_(embedder) {
    try {
        std::filesystem::create_directories(cfg_.persist_dir);
    } catch (const std::filesystem::filesystem_error& e) {
        throw StoreUnavailable("cannot create store directory " + cfg_.persist_dir.string() + ": " + e.what());
    }
    try {
        if (cfg_.exclusive_lock) acquire_lock();
        auto db_path = (cfg_.persist_dir / "collections.sqlite3").string();
        int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
        if (sqlite3_open_v2(db_path.c_str(), &db_, flags, nullptr) != SQLITE_OK) {
            std::string msg = db_ ? sqlite3_errmsg(db_) : "out of memory";
            throw StoreUnavailable("failed to open SQLite DB " + db_path + ": " + msg);
        }
        sqlite3_busy_timeout(db_, 5000);
        init();
        prepare_statements();
    } catch (const std::exception&) {
        release();
        throw;
    }
    log_info("opened collection " + cfg_.collection_name + " in " + cfg_.persist_dir.string());
}

VectorCollection::~VectorCollection() {
    release();
}

void VectorCollection::release() {
    close_statements();
    if (db_) { sqlite3_close(db_); db_ = nullptr; }
    if (lock_fd_ >= 0) {
        flock(lock_fd_, LOCK_UN);
        close(lock_fd_);
        lock_fd_ = -1;
    }
}

void VectorCollection::acquire_lock() {
    auto lock_path = (cfg_.persist_dir / ".lock").string();
    lock_fd_ = open(lock_path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
    if (lock_fd_ < 0) {
        throw StoreUnavailable("cannot open lock file " + lock_path + ": " + std::strerror(errno));
    }
    if (flock(lock_fd_, LOCK_EX | LOCK_NB) == -1) {
        int err = errno;
        close(lock_fd_);
        lock_fd_ = -1;
        if (err == EWOULDBLOCK) {
            throw StoreUnavailable("store directory " + cfg_.persist_dir.string() + " is in use by another process");
        }
        throw StoreUnavailable("cannot lock " + lock_path + ": " + std::strerror(err));
    }
}

void VectorCollection::init() {
    exec("PRAGMA journal_mode=WAL;");
    exec("CREATE TABLE IF NOT EXISTS collections (\n"
         "  name TEXT PRIMARY KEY,\n"
         "  encoder TEXT NOT NULL,\n"
         "  dimension INTEGER NOT NULL,\n"
         "  created_at INTEGER NOT NULL\n"
         ");");
    exec("CREATE TABLE IF NOT EXISTS records (\n"
         "  seq INTEGER PRIMARY KEY AUTOINCREMENT,\n"
         "  id TEXT NOT NULL UNIQUE,\n"
         "  collection TEXT NOT NULL,\n"
         "  text TEXT NOT NULL,\n"
         "  metadata TEXT NOT NULL,\n"
         "  vector BLOB NOT NULL\n"
         ");");
    exec("CREATE INDEX IF NOT EXISTS idx_records_collection ON records(collection, seq);");
}

void VectorCollection::exec(const std::string& sql) {
    char* err = nullptr;
    if (sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err) != SQLITE_OK) {
        std::string msg = err ? err : "unknown";
        sqlite3_free(err);
        throw StoreUnavailable("SQLite error: " + msg);
    }
}

void VectorCollection::fail(const std::string& what) {
    throw StoreUnavailable(what + ": " + (db_ ? sqlite3_errmsg(db_) : "no database"));
}

void VectorCollection::prepare(const char* sql, sqlite3_stmt** st) {
    if (sqlite3_prepare_v2(db_, sql, -1, st, nullptr) != SQLITE_OK) {
        fail(std::string("prepare failed for `") + sql + "`");
    }
}

void VectorCollection::prepare_statements() {
    prepare("INSERT INTO records (id, collection, text, metadata, vector) VALUES (?, ?, ?, ?, ?);",
            &insert_stmt_);
    prepare("SELECT seq, id, text, metadata, vector FROM records WHERE collection = ? ORDER BY seq;",
            &scan_stmt_);
    prepare("SELECT id, text, metadata, vector FROM records WHERE collection = ? AND id = ?;",
            &get_stmt_);
    prepare("SELECT COUNT(*) FROM records WHERE collection = ?;", &count_stmt_);
    prepare("SELECT encoder, dimension FROM collections WHERE name = ?;", &binding_stmt_);
    prepare("INSERT INTO collections (name, encoder, dimension, created_at) VALUES (?, ?, ?, ?);",
            &create_stmt_);
    prepare("DELETE FROM records WHERE collection = ?;", &delete_records_stmt_);
    prepare("DELETE FROM collections WHERE name = ?;", &delete_collection_stmt_);
}

void VectorCollection::close_statements() {
    for (sqlite3_stmt** st : {&insert_stmt_, &scan_stmt_, &get_stmt_, &count_stmt_, &binding_stmt_,
                              &create_stmt_, &delete_records_stmt_, &delete_collection_stmt_}) {
        if (*st) { sqlite3_finalize(*st); *st = nullptr; }
    }
}

std::optional<VectorCollection::Binding> VectorCollection::find_binding() {
    StmtScope s(binding_stmt_);
    bind_text(binding_stmt_, 1, cfg_.collection_name);
    int rc = sqlite3_step(binding_stmt_);
    if (rc == SQLITE_DONE) return std::nullopt;
    if (rc != SQLITE_ROW) fail("reading collection " + cfg_.collection_name);
    Binding b;
    b.encoder = column_text(binding_stmt_, 0);
    b.dimension = (std::size_t)sqlite3_column_int64(binding_stmt_, 1);
    return b;
}

void VectorCollection::check_binding(const Binding& b, std::size_t dim) {
    if (b.encoder != embedder_.encoder_id()) {
        throw EncoderMismatch("collection " + cfg_.collection_name + " was created with encoder " + b.encoder +
                              ", not " + embedder_.encoder_id());
    }
    if (dim != 0 && b.dimension != dim) {
        throw EncoderMismatch("collection " + cfg_.collection_name + " holds " + std::to_string(b.dimension) +
                              "-wide vectors, encoder produces " + std::to_string(dim));
    }
}

std::vector<std::string> VectorCollection::add(const std::vector<std::string>& texts,
                                               const std::vector<RecordMetadata>& metadata) {
    if (texts.size() != metadata.size()) {
        throw LengthMismatch("number of texts (" + std::to_string(texts.size()) +
                             ") must match number of metadata entries (" + std::to_string(metadata.size()) + ")");
    }
    if (texts.empty()) return {};
    for (std::size_t i = 0; i < texts.size(); ++i) {
        if (is_blank(texts[i])) throw EmptyInput("text " + std::to_string(i) + " is empty");
    }

    auto vectors = embedder_.embed_many(texts);
    const std::size_t dim = embedder_.dimension();

    std::vector<std::string> ids;
    ids.reserve(texts.size());
    for (std::size_t i = 0; i < texts.size(); ++i) ids.push_back(generate_uuid());

    std::lock_guard<std::mutex> lock(mtx_);
    Transaction txn(db_);
    if (auto b = find_binding()) {
        check_binding(*b, dim);
    } else {
        StmtScope s(create_stmt_);
        bind_text(create_stmt_, 1, cfg_.collection_name);
        bind_text(create_stmt_, 2, embedder_.encoder_id());
        sqlite3_bind_int64(create_stmt_, 3, (sqlite3_int64)dim);
        sqlite3_bind_int64(create_stmt_, 4, (sqlite3_int64)std::chrono::duration_cast<std::chrono::seconds>(
                                                std::chrono::system_clock::now().time_since_epoch()).count());
        if (sqlite3_step(create_stmt_) != SQLITE_DONE) fail("create collection " + cfg_.collection_name);
        log_info("created collection " + cfg_.collection_name + " (" + embedder_.encoder_id() + ", dim " +
                 std::to_string(dim) + ")");
    }

    for (std::size_t i = 0; i < texts.size(); ++i) {
        StmtScope s(insert_stmt_);
        bind_text(insert_stmt_, 1, ids[i]);
        bind_text(insert_stmt_, 2, cfg_.collection_name);
        bind_text(insert_stmt_, 3, texts[i]);
        bind_text(insert_stmt_, 4, metadata_to_json(metadata[i]).dump());
        bind_blob(insert_stmt_, 5, *vectors[i]);
        if (sqlite3_step(insert_stmt_) != SQLITE_DONE) fail("insert record");
    }
    txn.commit();

    log_info("added " + std::to_string(texts.size()) + " document chunks to " + cfg_.collection_name);
    return ids;
}

std::vector<SearchResult> VectorCollection::search(const std::string& query, std::size_t k,
                                                   const std::optional<MetadataFilter>& filter) {
    if (k == 0) return {};
    auto qvec = embedder_.embed_one(query);

    std::vector<Candidate> cands;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        auto b = find_binding();
        if (!b) return {};
        check_binding(*b, qvec.size());

        StmtScope s(scan_stmt_);
        bind_text(scan_stmt_, 1, cfg_.collection_name);
        int rc;
        while ((rc = sqlite3_step(scan_stmt_)) == SQLITE_ROW) {
            Candidate c;
            c.seq = sqlite3_column_int64(scan_stmt_, 0);
            c.meta_raw = column_text(scan_stmt_, 3);
            if (filter && !filter->empty()) {
                json meta = json::parse(c.meta_raw, nullptr, false);
                if (meta.is_discarded()) {
                    log_warn("skipping record with unreadable metadata (seq " + std::to_string(c.seq) + ")");
                    continue;
                }
                if (!filter->matches(meta)) continue;
                c.meta = std::move(meta);
            }
            c.id = column_text(scan_stmt_, 1);
            c.text = column_text(scan_stmt_, 2);
            c.distance = cosine_distance(column_vector(scan_stmt_, 4), qvec);
            cands.push_back(std::move(c));
        }
        if (rc != SQLITE_DONE) fail("scan collection " + cfg_.collection_name);
    }

    auto closer = [](const Candidate& a, const Candidate& b) {
        if (a.distance != b.distance) return a.distance < b.distance;
        return a.seq < b.seq;
    };
    std::size_t n = std::min(k, cands.size());
    std::partial_sort(cands.begin(), cands.begin() + n, cands.end(), closer);

    std::vector<SearchResult> out;
    out.reserve(n);
    for (std::size_t i = 0; i < n; ++i) {
        auto& c = cands[i];
        json meta = c.meta ? std::move(*c.meta) : json::parse(c.meta_raw, nullptr, false);
        SearchResult r;
        r.id = std::move(c.id);
        r.text = std::move(c.text);
        r.metadata = metadata_from_json(meta);
        r.distance = c.distance;
        out.push_back(std::move(r));
    }
    log_debug("found " + std::to_string(out.size()) + " similar chunks for query");
    return out;
}

std::vector<SearchResult> VectorCollection::search_by_category(const std::string& query,
                                                               const std::string& category, std::size_t k) {
    return search(query, k, MetadataFilter::field_equals("category", category));
}

std::vector<StoredRecord> VectorCollection::get(const std::vector<std::string>& ids) {
    std::vector<StoredRecord> out;
    std::lock_guard<std::mutex> lock(mtx_);
    for (const auto& id : ids) {
        StmtScope s(get_stmt_);
        bind_text(get_stmt_, 1, cfg_.collection_name);
        bind_text(get_stmt_, 2, id);
        int rc = sqlite3_step(get_stmt_);
        if (rc == SQLITE_DONE) continue;
        if (rc != SQLITE_ROW) fail("read record " + id);
        StoredRecord r;
        r.id = column_text(get_stmt_, 0);
        r.text = column_text(get_stmt_, 1);
        r.metadata = metadata_from_json(json::parse(column_text(get_stmt_, 2), nullptr, false));
        r.embedding = column_vector(get_stmt_, 3);
        out.push_back(std::move(r));
    }
    return out;
}

std::size_t VectorCollection::count() {
    std::lock_guard<std::mutex> lock(mtx_);
    StmtScope s(count_stmt_);
    bind_text(count_stmt_, 1, cfg_.collection_name);
    if (sqlite3_step(count_stmt_) != SQLITE_ROW) fail("count records");
    return (std::size_t)sqlite3_column_int64(count_stmt_, 0);
}

CollectionStats VectorCollection::stats() {
    CollectionStats s;
    s.total_records = count();
    s.collection_name = cfg_.collection_name;
    s.storage_location = cfg_.persist_dir.string();
    return s;
}

void VectorCollection::delete_collection() {
    std::lock_guard<std::mutex> lock(mtx_);
    Transaction txn(db_);
    {
        StmtScope s(delete_records_stmt_);
        bind_text(delete_records_stmt_, 1, cfg_.collection_name);
        if (sqlite3_step(delete_records_stmt_) != SQLITE_DONE) fail("delete records");
    }
    {
        StmtScope s(delete_collection_stmt_);
        bind_text(delete_collection_stmt_, 1, cfg_.collection_name);
        if (sqlite3_step(delete_collection_stmt_) != SQLITE_DONE) fail("delete collection");
    }
    txn.commit();
    log_info("deleted collection " + cfg_.collection_name);
}
