#include "ChunkReader.hpp"
#include <exception>

ChunkReader::ChunkReader(ByteSource& source) : source_(source) {}

void ChunkReader::seekTo(uint64_t offset) {
    try {
        source_.seek(offset);
    } catch (const SourceIoError&) {
        throw;
    } catch (const std::exception& e) {
        throw SourceIoError(e.what());
    }
}

ChunkPayload ChunkReader::read(const ChunkBounds& bounds) {
    ChunkPayload payload{bounds, std::string(), 0};
    try {
        payload.data.assign(static_cast<size_t>(bounds.length()), '\0');
    } catch (const std::exception& e) {
        throw SourceIoError("cannot allocate a " + std::to_string(bounds.length()) + " byte chunk buffer: " + e.what());
    }
    try {
        // Sources may hand back less than asked for; only 0 means the store is exhausted
        while (payload.bytesRead < payload.data.size()) {
            size_t n = source_.read(&payload.data[payload.bytesRead], payload.data.size() - payload.bytesRead);
            if (n == 0) {
                break;
            }
            payload.bytesRead += n;
        }
    } catch (const SourceIoError&) {
        throw;
    } catch (const std::exception& e) {
        throw SourceIoError(e.what());
    }
    return payload;
}
