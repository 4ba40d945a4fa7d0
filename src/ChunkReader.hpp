#pragma once
#include <cstddef>
#include <string>
#include "ByteSource.hpp"
#include "RangePlanner.hpp"

struct ChunkPayload {
    ChunkBounds bounds;
    std::string data;   // always bounds.length() bytes, zero past bytesRead
    size_t bytesRead;

    bool isShort() const { return bytesRead < data.size(); }
};

class ChunkReader {
public:
    explicit ChunkReader(ByteSource& source);

    // One absolute seek before the first chunk; reads after it are sequential.
    void seekTo(uint64_t offset);

    ChunkPayload read(const ChunkBounds& bounds);

private:
    ByteSource& source_;
};
