#pragma once
#include <stdexcept>
#include <string>
#include <drogon/HttpTypes.h>

class TransportError : public std::runtime_error {
public:
    explicit TransportError(const std::string& message) : std::runtime_error(message) {}
};

struct ChunkRequest {
    drogon::HttpMethod method;
    std::string contentRange;
    std::string body;
};

struct ChunkReply {
    int statusCode;
    std::string body;
};

// Bound to one destination URL for a whole run. Sends one chunk and waits for the reply. Anything that keeps a reply from
// arriving (refused connection, DNS, timeout, TLS) is thrown as TransportError.
class ChunkTransport {
public:
    virtual ~ChunkTransport() = default;

    virtual ChunkReply send(ChunkRequest request) = 0;
};
