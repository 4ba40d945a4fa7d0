#include "RangePlanner.hpp"
#include <stdexcept>

uint64_t next_chunk_end(uint64_t cursor, uint64_t range_end, uint64_t chunk_size) {
    if (cursor >= range_end) {
        return range_end;
    }
    if (chunk_size >= range_end - cursor) {
        return range_end;
    }
    return cursor + chunk_size;
}

std::vector<ChunkBounds> plan_chunks(uint64_t start, uint64_t end, uint64_t chunk_size) {
    std::vector<ChunkBounds> chunks;
    RangePlanner planner(start, end, chunk_size);
    if (end > start) {
        chunks.reserve(static_cast<size_t>((end - start) / chunk_size) + 1);
    }
    while (planner.hasNext()) {
        chunks.push_back(planner.next());
    }
    return chunks;
}

std::string format_content_range(const ChunkBounds& bounds, uint64_t range_end) {
    return "bytes " + std::to_string(bounds.offsetStart) + "-" + std::to_string(bounds.offsetEnd) + "/" + std::to_string(range_end);
}

RangePlanner::RangePlanner(uint64_t start, uint64_t end, uint64_t chunkSize)
    : start_(start), end_(end), chunkSize_(chunkSize), cursor_(start) {
    if (chunkSize_ == 0) {
        throw std::invalid_argument("chunk size must be > 0");
    }
}

bool RangePlanner::hasNext() const {
    return cursor_ < end_;
}

ChunkBounds RangePlanner::next() {
    if (!hasNext()) {
        throw std::out_of_range("range exhausted at offset " + std::to_string(cursor_));
    }
    ChunkBounds bounds{cursor_, next_chunk_end(cursor_, end_, chunkSize_)};
    cursor_ = bounds.offsetEnd;
    return bounds;
}

uint64_t RangePlanner::cursor() const {
    return cursor_;
}

uint64_t RangePlanner::rangeStart() const {
    return start_;
}

uint64_t RangePlanner::rangeEnd() const {
    return end_;
}

uint64_t RangePlanner::chunkSize() const {
    return chunkSize_;
}
