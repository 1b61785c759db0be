#pragma once
#include <cstdint>
#include <string>
#include <vector>
#include <filesystem>

enum class LogLevel { Debug = 0, Info = 1, Warn = 2, Error = 3, Off = 4 };

// Threshold is read once from DATASHEETS_LOG_LEVEL unless set explicitly.
LogLevel log_level();
void set_log_level(LogLevel level);
LogLevel parse_log_level(const std::string& name, LogLevel def);

void log_debug(const std::string& msg);
void log_info(const std::string& msg);
void log_warn(const std::string& msg);
void log_error(const std::string& msg);

std::string getenv_or(const char* key, const std::string& def);
long getenv_long_or(const char* key, long def);

// Lower-case hex SHA-256 of a byte string.
std::string sha256_hex(const std::string& bytes);
// Lower-case hex SHA-256 of a file's bytes, or "unknown" if it cannot be read.
std::string sha256_file(const std::filesystem::path& p);

// Throws SourceUnreadable when the file cannot be opened.
std::string read_text_file(const std::filesystem::path& p);

// Random RFC 4122 version 4 identifier, lower-case hex with dashes.
std::string generate_uuid();

// FNV-1a 64-bit.
std::uint64_t fnv1a_64(const std::string& s);

std::string trim(const std::string& s);
bool is_blank(const std::string& s);

// 1 - cosine similarity; 1.0 when either vector has zero norm or sizes differ.
float cosine_distance(const std::vector<float>& a, const std::vector<float>& b);
