#pragma once
#include <cstddef>
#include <string>
#include <utility>
#include <vector>
#include "metadata.hpp"

struct ChunkOptions {
    std::size_t min_size{1000};
    std::size_t max_size{2000};
    std::size_t overlap{200};
    // How far back from the tentative end to look for a sentence break.
    std::size_t boundary_window{200};
};

struct Segment {
    std::string text;   // trimmed
    std::size_t start{0};
    std::size_t end{0};
    std::size_t index{0};
    std::size_t length{0}; // end - start, before trimming
    std::size_t total_source_length{0};
};

using ChunkWithMetadata = std::pair<std::string, RecordMetadata>;

// Splits text into overlapping segments that end on sentence boundaries where
// one exists near the size limit. Blank text yields no segments, and no
// segment is ever blank.
// A window that trims below min_size before the end of the text is dropped;
// when a window is mostly whitespace, the text in front of that whitespace
// belongs to no segment. Collapse whitespace first (clean_text does) to keep
// every word.
// Throws std::invalid_argument if min_size is 0 or max_size < min_size.
std::vector<Segment> chunk_text(const std::string& text, const ChunkOptions& opts = {});

// chunk_text, with the source metadata and chunk offsets attached to each piece.
std::vector<ChunkWithMetadata> chunk_with_metadata(const std::string& text,
                                                   const SourceMetadata& source,
                                                   const ChunkOptions& opts = {});
