#pragma once
#include <functional>
#include <json/json.h>
#include "ChunkTransport.hpp"
#include "TransferOutcome.hpp"
#include "UploadRequest.hpp"

class ChunkUploader {
public:
    explicit ChunkUploader(ChunkTransport& transport);

    // Uploads [rangeStart, rangeEnd) one chunk per request. Stops at the first
    // short read, failed read, transport error or non-200 reply.
    // progress (optional) receives { chunk, range_start, range_end, content_range,
    // bytes_sent, total_bytes, progress } after every chunk answered with 200.
    TransferOutcome upload(const UploadRequest& request, std::function<void(const Json::Value&)> progress = nullptr);

private:
    ChunkTransport& transport_;
};
