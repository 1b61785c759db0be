#include <gtest/gtest.h>
#include "../include/metadata.hpp"

using json = nlohmann::json;

TEST(MetadataTest, RoundTripThroughFlatJson) {
    RecordMetadata m;
    m.source.mpn = "TMP117";
    m.source.manufacturer = "Texas Instruments";
    m.source.category = "sensor";
    m.source.file_hash = "abc123";
    m.source.extra["interface"] = "I2C";
    m.source.extra["pins"] = 6;
    m.chunk = ChunkInfo{2, 1800, 3750, 1949, 3750};

    json flat = metadata_to_json(m);
    EXPECT_EQ(flat.at("mpn"), "TMP117");
    EXPECT_EQ(flat.at("interface"), "I2C");
    EXPECT_EQ(flat.at("chunk_index"), 2);
    EXPECT_EQ(flat.at("total_text_length"), 3750);

    RecordMetadata back = metadata_from_json(flat);
    EXPECT_EQ(back.source.mpn, "TMP117");
    EXPECT_EQ(back.source.manufacturer, "Texas Instruments");
    EXPECT_EQ(back.source.category, "sensor");
    EXPECT_EQ(back.source.file_hash, "abc123");
    EXPECT_EQ(back.source.extra.at("interface"), "I2C");
    EXPECT_EQ(back.source.extra.at("pins"), 6);
    EXPECT_FALSE(back.source.extra.contains("chunk_index"));
    ASSERT_TRUE(back.chunk.has_value());
    EXPECT_EQ(back.chunk->chunk_start, 1800u);
    EXPECT_EQ(back.chunk->chunk_end, 3750u);
    EXPECT_EQ(back.chunk->chunk_length, 1949u);
}

TEST(MetadataTest, EmptyFieldsAreOmitted) {
    RecordMetadata m;
    m.source.category = "power";
    json flat = metadata_to_json(m);
    EXPECT_EQ(flat.size(), 1u);
    EXPECT_FALSE(flat.contains("mpn"));
    EXPECT_FALSE(flat.contains("chunk_index"));
}

TEST(MetadataTest, PartialChunkKeysStayInExtra) {
    json flat = {{"mpn", "X1"}, {"chunk_index", 3}};
    RecordMetadata m = metadata_from_json(flat);
    EXPECT_FALSE(m.chunk.has_value());
    EXPECT_EQ(m.source.extra.at("chunk_index"), 3);
}

TEST(MetadataTest, NonStringKnownFieldGoesToExtra) {
    json flat = {{"mpn", 42}, {"category", "sensor"}};
    RecordMetadata m = metadata_from_json(flat);
    EXPECT_TRUE(m.source.mpn.empty());
    EXPECT_EQ(m.source.extra.at("mpn"), 42);
    EXPECT_EQ(m.source.category, "sensor");
}

TEST(MetadataTest, NonObjectParsesToEmpty) {
    RecordMetadata m = metadata_from_json(json::array({1, 2}));
    EXPECT_TRUE(m.source.mpn.empty());
    EXPECT_FALSE(m.chunk.has_value());
}

TEST(MetadataFilterTest, ExactMatchOnEveryPredicate) {
    json flat = {{"category", "sensor"}, {"interface", "I2C"}, {"chunk_index", 0}};

    EXPECT_TRUE(MetadataFilter::field_equals("category", "sensor").matches(flat));
    EXPECT_FALSE(MetadataFilter::field_equals("category", "Sensor").matches(flat));
    EXPECT_FALSE(MetadataFilter::field_equals("package", "QFN").matches(flat));
    EXPECT_TRUE(MetadataFilter::field_equals("chunk_index", 0).matches(flat));

    MetadataFilter both;
    both.equals["category"] = "sensor";
    both.equals["interface"] = "SPI";
    EXPECT_FALSE(both.matches(flat));
    both.equals["interface"] = "I2C";
    EXPECT_TRUE(both.matches(flat));

    EXPECT_TRUE(MetadataFilter{}.matches(flat));
    EXPECT_TRUE(MetadataFilter{}.empty());
}
