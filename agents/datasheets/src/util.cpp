#include "../include/util.hpp"
#include "../include/errors.hpp"
#include <openssl/evp.h>
#include <atomic>
#include <cctype>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <mutex>
#include <random>
#include <sstream>

static std::mutex g_log_mtx;
static std::atomic<int> g_log_level{-1};

static const char* level_tag(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info: return "INFO";
        case LogLevel::Warn: return "WARN";
        case LogLevel::Error: return "ERROR";
        default: return "";
    }
}

static void log_at(LogLevel level, const std::string& msg) {
    if (level < log_level()) return;
    std::lock_guard<std::mutex> lock(g_log_mtx);
    std::cerr << "[datasheets] [" << level_tag(level) << "] " << msg << std::endl;
}

static std::string to_hex(const unsigned char* md, unsigned int len) {
    std::ostringstream oss;
    for (unsigned int i = 0; i < len; ++i) {
        oss << std::hex << std::nouppercase << ((md[i] >> 4) & 0xF) << (md[i] & 0xF);
    }
    return oss.str();
}

struct DigestCtx {
    EVP_MD_CTX* ctx{nullptr};
    DigestCtx() : ctx(EVP_MD_CTX_new()) {}
    ~DigestCtx() { if (ctx) EVP_MD_CTX_free(ctx); }
};

LogLevel parse_log_level(const std::string& name, LogLevel def) {
    std::string n;
    for (char c : name) n += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (n == "debug") return LogLevel::Debug;
    if (n == "info") return LogLevel::Info;
    if (n == "warn" || n == "warning") return LogLevel::Warn;
    if (n == "error") return LogLevel::Error;
    if (n == "off" || n == "none") return LogLevel::Off;
    return def;
}

LogLevel log_level() {
    int lv = g_log_level.load();
    if (lv < 0) {
        lv = static_cast<int>(parse_log_level(getenv_or("DATASHEETS_LOG_LEVEL", "info"), LogLevel::Info));
        g_log_level.store(lv);
    }
    return static_cast<LogLevel>(lv);
}

void set_log_level(LogLevel level) {
    g_log_level.store(static_cast<int>(level));
}

void log_debug(const std::string& msg) { log_at(LogLevel::Debug, msg); }
void log_info(const std::string& msg) { log_at(LogLevel::Info, msg); }
void log_warn(const std::string& msg) { log_at(LogLevel::Warn, msg); }
void log_error(const std::string& msg) { log_at(LogLevel::Error, msg); }

std::string getenv_or(const char* key, const std::string& def) {
    const char* v = std::getenv(key);
    return v ? std::string(v) : def;
}

long getenv_long_or(const char* key, long def) {
    const char* v = std::getenv(key);
    if (!v || !*v) return def;
    char* end = nullptr;
    long n = std::strtol(v, &end, 10);
    if (end == v || *end != '\0') {
        log_warn(std::string("ignoring non-numeric ") + key + "=" + v);
        return def;
    }
    return n;
}

std::string sha256_hex(const std::string& bytes) {
    DigestCtx d;
    unsigned char md[EVP_MAX_MD_SIZE];
    unsigned int len = 0;
    if (!d.ctx ||
        EVP_DigestInit_ex(d.ctx, EVP_sha256(), nullptr) != 1 ||
        EVP_DigestUpdate(d.ctx, bytes.data(), bytes.size()) != 1 ||
        EVP_DigestFinal_ex(d.ctx, md, &len) != 1) {
        throw std::runtime_error("SHA-256 digest failed");
    }
    return to_hex(md, len);
}

std::string sha256_file(const std::filesystem::path& p) {
    std::ifstream f(p, std::ios::binary);
    if (!f) {
        log_error("failed to calculate hash for " + p.string() + ": cannot open file");
        return "unknown";
    }
    DigestCtx d;
    if (!d.ctx || EVP_DigestInit_ex(d.ctx, EVP_sha256(), nullptr) != 1) {
        log_error("failed to calculate hash for " + p.string() + ": digest init failed");
        return "unknown";
    }
    char buf[1 << 16];
    while (f) {
        f.read(buf, sizeof(buf));
        std::streamsize n = f.gcount();
        if (n > 0 && EVP_DigestUpdate(d.ctx, buf, (size_t)n) != 1) {
            log_error("failed to calculate hash for " + p.string() + ": digest update failed");
            return "unknown";
        }
    }
    if (f.bad()) {
        log_error("failed to calculate hash for " + p.string() + ": read error");
        return "unknown";
    }
    unsigned char md[EVP_MAX_MD_SIZE];
    unsigned int len = 0;
    if (EVP_DigestFinal_ex(d.ctx, md, &len) != 1) {
        log_error("failed to calculate hash for " + p.string() + ": digest final failed");
        return "unknown";
    }
    return to_hex(md, len);
}

std::string read_text_file(const std::filesystem::path& p) {
    std::ifstream f(p, std::ios::binary);
    if (!f) throw SourceUnreadable("cannot open " + p.string());
    std::ostringstream ss;
    ss << f.rdbuf();
    if (f.bad()) throw SourceUnreadable("read failed for " + p.string());
    return ss.str();
}

std::string generate_uuid() {
    static thread_local std::mt19937_64 rng{std::random_device{}()};
    std::uniform_int_distribution<std::uint64_t> dist;
    std::uint64_t a = dist(rng);
    std::uint64_t b = dist(rng);

    // version 4 and RFC 4122 variant bits
    a = (a & 0xFFFFFFFFFFFF0FFFull) | 0x0000000000004000ull;
    b = (b & 0x3FFFFFFFFFFFFFFFull) | 0x8000000000000000ull;

    char buf[37];
    std::snprintf(buf, sizeof(buf), "%08x-%04x-%04x-%04x-%012llx",
                  static_cast<unsigned>(a >> 32),
                  static_cast<unsigned>((a >> 16) & 0xFFFF),
                  static_cast<unsigned>(a & 0xFFFF),
                  static_cast<unsigned>(b >> 48),
                  static_cast<unsigned long long>(b & 0x0000FFFFFFFFFFFFull));
    return std::string(buf);
}

std::uint64_t fnv1a_64(const std::string& s) {
    std::uint64_t h = 1469598103934665603ull;
    for (unsigned char c : s) {
        h ^= static_cast<std::uint64_t>(c);
        h *= 1099511628211ull;
    }
    return h;
}

std::string trim(const std::string& s) {
    size_t b = 0, e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
    return s.substr(b, e - b);
}

bool is_blank(const std::string& s) {
    for (char c : s) {
        if (!std::isspace(static_cast<unsigned char>(c))) return false;
    }
    return true;
}

float cosine_distance(const std::vector<float>& a, const std::vector<float>& b) {
    if (a.size() != b.size() || a.empty()) return 1.0f;
    double dot = 0.0, na = 0.0, nb = 0.0;
    for (size_t i = 0; i < a.size(); ++i) {
        dot += (double)a[i] * (double)b[i];
        na += (double)a[i] * (double)a[i];
        nb += (double)b[i] * (double)b[i];
    }
    if (na == 0.0 || nb == 0.0) return 1.0f;
    return (float)(1.0 - dot / (std::sqrt(na) * std::sqrt(nb)));
}
