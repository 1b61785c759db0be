#include "../include/config.hpp"
#include "../include/embedder.hpp"
#include "../include/ingest.hpp"
#include "../include/store.hpp"
#include "../include/util.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <iomanip>
#include <iostream>
#include <optional>

using json = nlohmann::json;

static void usage() {
    std::cerr << "datasheets_cli usage:\n"
              << "  ingest --file <path> [--mpn X] [--manufacturer X] [--category X] [--description X] [--url X]\n"
              << "  batch --manifest <json>\n"
              << "  search --query \"...\" [--category X] [--top-k N]\n"
              << "  stats\n"
              << "  delete\n"
              << "common: [--db-dir <dir>] [--encoder ollama|hashing] [--ollama <url>] [--embed-model <name>]\n";
}

int main(int argc, char** argv) {
    if (argc < 2) { usage(); return 1; }
    std::string cmd = argv[1];

    EmbedConfig embed = embed_config_from_env();
    StoreConfig store = store_config_from_env();
    std::string file, manifest, query;
    std::optional<std::string> only_category;
    SourceMetadata info;
    int top_k = 5;

    try {
        for (int i = 2; i < argc; ++i) {
            std::string a = argv[i];
            bool has_value = i + 1 < argc;
            if (a == "--db-dir" && has_value) store.persist_dir = argv[++i];
            else if (a == "--encoder" && has_value) embed.encoder = argv[++i];
            else if (a == "--ollama" && has_value) embed.ollama_url = argv[++i];
            else if (a == "--embed-model" && has_value) embed.embed_model = argv[++i];
            else if (a == "--file" && has_value) file = argv[++i];
            else if (a == "--manifest" && has_value) manifest = argv[++i];
            else if (a == "--query" && has_value) query = argv[++i];
            else if (a == "--category" && has_value) { info.category = argv[++i]; only_category = info.category; }
            else if (a == "--mpn" && has_value) info.mpn = argv[++i];
            else if (a == "--manufacturer" && has_value) info.manufacturer = argv[++i];
            else if (a == "--description" && has_value) info.description = argv[++i];
            else if (a == "--url" && has_value) info.datasheet_url = argv[++i];
            else if (a == "--top-k" && has_value) top_k = std::stoi(argv[++i]);
            else { std::cerr << "[ERROR] unknown argument: " << a << "\n"; usage(); return 2; }
        }

        if (cmd == "ingest" && file.empty()) { usage(); return 2; }
        if (cmd == "batch" && manifest.empty()) { usage(); return 2; }
        if (cmd == "search" && query.empty()) { usage(); return 2; }
        if (cmd != "ingest" && cmd != "batch" && cmd != "search" && cmd != "stats" && cmd != "delete") {
            usage();
            return 1;
        }

        EmbeddingProvider embedder(encoder_id_for(embed), make_encoder_factory(embed), embed.batch_size);
        VectorCollection collection(store, embedder);

        if (cmd == "ingest") {
            IngestionPipeline pipeline(collection);
            auto ids = pipeline.ingest_file(file, info);
            std::cout << "[OK] Ingested chunks: " << ids.size() << "\n";
        } else if (cmd == "batch") {
            IngestionPipeline pipeline(collection);
            auto results = pipeline.batch_ingest(load_manifest(manifest));
            std::size_t failed = 0;
            for (const auto& kv : results) {
                std::cout << (kv.second.empty() ? "[FAIL] " : "[OK] ") << kv.first << ": "
                          << kv.second.size() << " chunks\n";
                if (kv.second.empty()) ++failed;
            }
            return failed == 0 ? 0 : 1;
        } else if (cmd == "search") {
            auto results = only_category
                ? collection.search_by_category(query, *only_category, (std::size_t)std::max(0, top_k))
                : collection.search(query, (std::size_t)std::max(0, top_k));
            std::cout << "==== Results ====\n";
            int i = 1;
            for (const auto& r : results) {
                const auto& src = r.metadata.source;
                std::cout << "[" << i++ << "] " << std::fixed << std::setprecision(4) << r.distance << "  "
                          << src.mpn << " (" << src.category << ") " << src.source_file << "\n"
                          << "    " << r.text.substr(0, 160) << (r.text.size() > 160 ? "..." : "") << "\n";
            }
        } else if (cmd == "stats") {
            auto s = collection.stats();
            json j = {
                {"total_documents", s.total_records},
                {"collection_name", s.collection_name},
                {"persist_directory", s.storage_location}
            };
            std::cout << j.dump(2) << "\n";
        } else if (cmd == "delete") {
            collection.delete_collection();
            std::cout << "[OK] Deleted collection " << collection.name() << "\n";
        }
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "[ERROR] " << e.what() << "\n";
        return 1;
    }
}
