#include "../include/chunker.hpp"
#include "../include/util.hpp"
#include <algorithm>
#include <stdexcept>

static const char* const kSentenceEnds[] = {". ", "! ", "? ", ".\n", "!\n", "?\n"};

// Position just past the latest sentence delimiter lying wholly inside
// [lo, hi), or npos.
static size_t last_sentence_end(const std::string& text, size_t lo, size_t hi) {
    size_t best = std::string::npos;
    for (const char* pat : kSentenceEnds) {
        const size_t plen = 2;
        if (hi < lo + plen) continue;
        size_t pos = text.rfind(pat, hi - plen, plen);
        if (pos == std::string::npos || pos < lo) continue;
        if (best == std::string::npos || pos + plen > best) best = pos + plen;
    }
    return best;
}

std::vector<Segment> chunk_text(const std::string& text, const ChunkOptions& opts) {
    if (opts.min_size == 0) throw std::invalid_argument("chunk min_size must be positive");
    if (opts.max_size < opts.min_size) throw std::invalid_argument("chunk max_size must be >= min_size");

    std::vector<Segment> out;
    if (is_blank(text)) return out;

    const size_t n = text.size();
    size_t start = 0;
    size_t index = 0;
    while (start < n) {
        size_t end = std::min(start + opts.max_size, n);

        if (end < n) {
            size_t window_lo = std::max(start + opts.min_size,
                                        end > opts.boundary_window ? end - opts.boundary_window : 0);
            size_t brk = last_sentence_end(text, window_lo, end);
            if (brk != std::string::npos) end = brk;
        }

        std::string piece = trim(text.substr(start, end - start));
        if (!piece.empty() && (piece.size() >= opts.min_size || end == n)) {
            Segment s;
            s.text = std::move(piece);
            s.start = start;
            s.end = end;
            s.index = index++;
            s.length = end - start;
            s.total_source_length = n;
            out.push_back(std::move(s));
        }

        size_t next = std::max(start + opts.min_size, end > opts.overlap ? end - opts.overlap : 0);
        if (next <= start) next = start + opts.min_size;
        start = next;
    }

    log_debug("created " + std::to_string(out.size()) + " text chunks from " +
              std::to_string(n) + " characters");
    return out;
}

std::vector<ChunkWithMetadata> chunk_with_metadata(const std::string& text,
                                                   const SourceMetadata& source,
                                                   const ChunkOptions& opts) {
    std::vector<ChunkWithMetadata> out;
    for (auto& seg : chunk_text(text, opts)) {
        RecordMetadata m;
        m.source = source;
        ChunkInfo c;
        c.chunk_index = seg.index;
        c.chunk_start = seg.start;
        c.chunk_end = seg.end;
        c.chunk_length = seg.text.size();
        c.total_text_length = seg.total_source_length;
        m.chunk = c;
        out.emplace_back(std::move(seg.text), std::move(m));
    }
    return out;
}
