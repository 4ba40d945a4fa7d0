#pragma once
#include <cstdint>
#include <string>
#include <drogon/HttpTypes.h>
#include "ByteSource.hpp"

// Built once by the caller and consumed by a single ChunkUploader::upload run.
// The caller guarantees rangeStart <= rangeEnd <= source.length() and chunkSize > 0.
struct UploadRequest {
    ByteSource& source;
    uint64_t rangeStart;
    uint64_t rangeEnd;
    uint64_t chunkSize;
    std::string destinationUrl;
    drogon::HttpMethod httpMethod = drogon::Put;
};

// Accepts the standard verbs (GET, POST, HEAD, PUT, DELETE, OPTIONS, PATCH), case-sensitive.
bool parse_http_method(const std::string& name, drogon::HttpMethod& method);

std::string http_method_name(drogon::HttpMethod method);
