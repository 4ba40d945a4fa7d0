#pragma once
#include <string>
#include <drogon/HttpClient.h>
#include <trantor/net/EventLoopThread.h>
#include "ChunkTransport.hpp"

// "http://host:port" for HttpClient plus the path and query sent with every request
struct UploadTarget {
    std::string hostString;
    std::string pathAndQuery;
};

// Throws std::invalid_argument unless the URL is http(s)://host[...]
UploadTarget split_upload_url(const std::string& url);

std::string describe_req_result(drogon::ReqResult result);

// One HttpClient and its event loop thread, alive for a single upload run.
class HttpChunkTransport : public ChunkTransport {
public:
    explicit HttpChunkTransport(const std::string& url);
    ~HttpChunkTransport() override;

    ChunkReply send(ChunkRequest request) override;

    const UploadTarget& target() const;

private:
    std::string url_;
    UploadTarget target_;
    trantor::EventLoopThread loopThread_;
    drogon::HttpClientPtr client_;
};
