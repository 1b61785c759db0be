#pragma once
#include "../include/embedder.hpp"
#include "../include/util.hpp"
#include <atomic>
#include <filesystem>
#include <fstream>
#include <memory>
#include <mutex>
#include <string>
#include <system_error>
#include <vector>

namespace testsupport {

// Fresh directory under the system temp dir, removed on destruction.
struct TempDir {
    std::filesystem::path path;
    TempDir() {
        path = std::filesystem::temp_directory_path() / ("datasheets-test-" + generate_uuid());
        std::filesystem::create_directories(path);
    }
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
    }
};

inline void write_file(const std::filesystem::path& p, const std::string& body) {
    std::ofstream f(p, std::ios::binary);
    f << body;
}

inline std::string repeat(const std::string& s, int n) {
    std::string out;
    for (int i = 0; i < n; ++i) out += s;
    return out;
}

// Hashing encoder that records every batch it is handed.
class RecordingEncoder : public TextEncoder {
public:
    explicit RecordingEncoder(std::size_t dim = 64) : inner_(dim) {}
    std::string name() const override { return "recording"; }
    std::size_t dimension() override { return inner_.dimension(); }
    std::vector<std::vector<float>> encode(const std::vector<std::string>& texts) override {
        {
            std::lock_guard<std::mutex> lock(mtx_);
            batches.push_back(texts);
        }
        return inner_.encode(texts);
    }

    std::mutex mtx_;
    std::vector<std::vector<std::string>> batches;

private:
    HashingEncoder inner_;
};

// Returns one vector too few, whatever it is asked.
class ShortEncoder : public TextEncoder {
public:
    std::string name() const override { return "short"; }
    std::size_t dimension() override { return 4; }
    std::vector<std::vector<float>> encode(const std::vector<std::string>& texts) override {
        return std::vector<std::vector<float>>(texts.empty() ? 0 : texts.size() - 1, std::vector<float>(4, 1.0f));
    }
};

inline std::unique_ptr<EmbeddingProvider> hashing_provider(std::size_t dim = 256) {
    return std::make_unique<EmbeddingProvider>(
        "hashing:" + std::to_string(dim),
        [dim]() -> std::unique_ptr<TextEncoder> { return std::make_unique<HashingEncoder>(dim); });
}

} // namespace testsupport
