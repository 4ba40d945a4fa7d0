#pragma once
#include <cstdint>
#include <string>
#include <vector>

// [offsetStart, offsetEnd) of the upload range
struct ChunkBounds {
    uint64_t offsetStart;
    uint64_t offsetEnd;

    uint64_t length() const { return offsetEnd - offsetStart; }
};

// min(cursor + chunk_size, range_end), without wrapping around on huge chunk sizes
uint64_t next_chunk_end(uint64_t cursor, uint64_t range_end, uint64_t chunk_size);

// Materialized chunk plan for [start, end)
std::vector<ChunkBounds> plan_chunks(uint64_t start, uint64_t end, uint64_t chunk_size);

// "bytes <start>-<end>/<range_end>"
std::string format_content_range(const ChunkBounds& bounds, uint64_t range_end);

class RangePlanner {
public:
    RangePlanner(uint64_t start, uint64_t end, uint64_t chunkSize);

    bool hasNext() const;
    ChunkBounds next();

    uint64_t cursor() const;
    uint64_t rangeStart() const;
    uint64_t rangeEnd() const;
    uint64_t chunkSize() const;

private:
    uint64_t start_;
    uint64_t end_;
    uint64_t chunkSize_;
    uint64_t cursor_;
};
