#include <gtest/gtest.h>
#include "../include/config.hpp"
#include "../include/errors.hpp"
#include "../include/util.hpp"
#include "test_support.hpp"
#include <cstdlib>
#include <regex>
#include <set>

TEST(UtilTest, Sha256KnownVectors) {
    EXPECT_EQ(sha256_hex(""), "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
    EXPECT_EQ(sha256_hex("abc"), "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST(UtilTest, Sha256FileMatchesContentOrUnknown) {
    testsupport::TempDir dir;
    auto p = dir.path / "doc.txt";
    testsupport::write_file(p, "abc");
    EXPECT_EQ(sha256_file(p), sha256_hex("abc"));

    set_log_level(LogLevel::Off);
    EXPECT_EQ(sha256_file(dir.path / "missing.pdf"), "unknown");
    set_log_level(LogLevel::Warn);
}

TEST(UtilTest, ReadTextFile) {
    testsupport::TempDir dir;
    auto p = dir.path / "doc.txt";
    testsupport::write_file(p, "line one\nline two\n");
    EXPECT_EQ(read_text_file(p), "line one\nline two\n");
    EXPECT_THROW(read_text_file(dir.path / "absent.txt"), SourceUnreadable);
}

TEST(UtilTest, UuidsAreVersion4AndUnique) {
    const std::regex v4("^[0-9a-f]{8}-[0-9a-f]{4}-4[0-9a-f]{3}-[89ab][0-9a-f]{3}-[0-9a-f]{12}$");
    std::set<std::string> seen;
    for (int i = 0; i < 200; ++i) {
        auto id = generate_uuid();
        EXPECT_TRUE(std::regex_match(id, v4)) << id;
        seen.insert(id);
    }
    EXPECT_EQ(seen.size(), 200u);
}

TEST(UtilTest, TrimAndBlank) {
    EXPECT_EQ(trim("  a b \n"), "a b");
    EXPECT_EQ(trim("\t\n "), "");
    EXPECT_TRUE(is_blank(""));
    EXPECT_TRUE(is_blank(" \r\n\t"));
    EXPECT_FALSE(is_blank(" x "));
}

TEST(UtilTest, CosineDistance) {
    EXPECT_NEAR(cosine_distance({1, 0}, {1, 0}), 0.0f, 1e-6);
    EXPECT_NEAR(cosine_distance({1, 0}, {0, 1}), 1.0f, 1e-6);
    EXPECT_NEAR(cosine_distance({1, 0}, {-1, 0}), 2.0f, 1e-6);
    EXPECT_NEAR(cosine_distance({3, 4}, {6, 8}), 0.0f, 1e-6);
    EXPECT_FLOAT_EQ(cosine_distance({0, 0}, {1, 0}), 1.0f);
    EXPECT_FLOAT_EQ(cosine_distance({1, 0, 0}, {1, 0}), 1.0f);
    EXPECT_FLOAT_EQ(cosine_distance({}, {}), 1.0f);
}

TEST(UtilTest, Fnv1aKnownValues) {
    EXPECT_EQ(fnv1a_64(""), 0xcbf29ce484222325ULL);
    EXPECT_EQ(fnv1a_64("a"), 0xaf63dc4c8601ec8cULL);
}

TEST(UtilTest, ParseLogLevel) {
    EXPECT_EQ(parse_log_level("DEBUG", LogLevel::Info), LogLevel::Debug);
    EXPECT_EQ(parse_log_level("warning", LogLevel::Info), LogLevel::Warn);
    EXPECT_EQ(parse_log_level("off", LogLevel::Info), LogLevel::Off);
    EXPECT_EQ(parse_log_level("chatty", LogLevel::Error), LogLevel::Error);
}

TEST(UtilTest, EnvFallbacks) {
    EXPECT_EQ(getenv_or("DATASHEETS_TEST_SURELY_UNSET", "dflt"), "dflt");
    EXPECT_EQ(getenv_long_or("DATASHEETS_TEST_SURELY_UNSET", 42), 42);
}

TEST(UtilTest, ConfigFromEnvironment) {
    setenv("DATASHEETS_DB_DIR", "/tmp/datasheets-env-db", 1);
    setenv("DATASHEETS_ENCODER", "hashing", 1);
    setenv("DATASHEETS_HASH_DIM", "128", 1);
    setenv("DATASHEETS_EMBED_BATCH", "not-a-number", 1);

    StoreConfig store = store_config_from_env();
    EmbedConfig embed = embed_config_from_env();
    EXPECT_EQ(store.persist_dir, std::filesystem::path("/tmp/datasheets-env-db"));
    EXPECT_EQ(store.collection_name, "component_datasheets");
    EXPECT_EQ(embed.encoder, "hashing");
    EXPECT_EQ(embed.hashing_dim, 128u);
    EXPECT_EQ(embed.batch_size, 32u);
    EXPECT_EQ(encoder_id_for(embed), "hashing:128");

    for (const char* k : {"DATASHEETS_DB_DIR", "DATASHEETS_ENCODER", "DATASHEETS_HASH_DIM", "DATASHEETS_EMBED_BATCH"}) {
        unsetenv(k);
    }
}
