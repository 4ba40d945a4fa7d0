#include "HttpChunkTransport.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <trantor/utils/Logger.h>

UploadTarget split_upload_url(const std::string& url) {
    auto schemeEnd = url.find("://");
    if (schemeEnd == std::string::npos) {
        throw std::invalid_argument("URL has no scheme: " + url);
    }
    std::string scheme = url.substr(0, schemeEnd);
    std::transform(scheme.begin(), scheme.end(), scheme.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (scheme != "http" && scheme != "https") {
        throw std::invalid_argument("unsupported URL scheme '" + scheme + "' in " + url);
    }

    auto authorityStart = schemeEnd + 3;
    auto authorityEnd = url.find_first_of("/?#", authorityStart);
    std::string authority = url.substr(authorityStart, authorityEnd == std::string::npos ? std::string::npos : authorityEnd - authorityStart);
    if (authority.empty()) {
        throw std::invalid_argument("URL has no host: " + url);
    }

    UploadTarget target;
    target.hostString = scheme + "://" + authority;
    if (authorityEnd != std::string::npos) {
        std::string rest = url.substr(authorityEnd);
        // fragments never go on the wire
        rest = rest.substr(0, rest.find('#'));
        target.pathAndQuery = rest;
    }
    if (target.pathAndQuery.empty() || target.pathAndQuery[0] != '/') {
        target.pathAndQuery = "/" + target.pathAndQuery;
    }
    return target;
}

std::string describe_req_result(drogon::ReqResult result) {
    switch (result) {
        case drogon::ReqResult::Ok:
            return "ok";
        case drogon::ReqResult::BadResponse:
            return "bad response from server";
        case drogon::ReqResult::NetworkFailure:
            return "network failure";
        case drogon::ReqResult::BadServerAddress:
            return "bad server address";
        case drogon::ReqResult::Timeout:
            return "request timed out";
        case drogon::ReqResult::HandshakeError:
            return "TLS handshake failed";
        case drogon::ReqResult::InvalidCertificate:
            return "invalid server certificate";
        default:
            return "request failed (result " + std::to_string(static_cast<int>(result)) + ")";
    }
}

HttpChunkTransport::HttpChunkTransport(const std::string& url)
    : url_(url),
      target_(split_upload_url(url)),
      loopThread_("ChunkUploadLoop") {
    loopThread_.run();
    client_ = drogon::HttpClient::newHttpClient(target_.hostString, loopThread_.getLoop());
    LOG_DEBUG << "HTTP client for " << target_.hostString << " path " << target_.pathAndQuery;
}

HttpChunkTransport::~HttpChunkTransport() {
    // the client has to go before its loop thread stops
    client_.reset();
}

ChunkReply HttpChunkTransport::send(ChunkRequest request) {
    auto req = drogon::HttpRequest::newHttpRequest();
    req->setMethod(request.method);
    req->setPathEncode(false);
    req->setPath(target_.pathAndQuery);
    req->addHeader("Content-Range", request.contentRange);
    req->setBody(std::move(request.body));

    auto [result, response] = client_->sendRequest(req);
    if (result != drogon::ReqResult::Ok || !response) {
        throw TransportError(describe_req_result(result) + " while sending to " + url_);
    }
    ChunkReply reply;
    reply.statusCode = static_cast<int>(response->getStatusCode());
    reply.body = std::string(response->body());
    LOG_TRACE << request.contentRange << " -> " << reply.statusCode;
    return reply;
}

const UploadTarget& HttpChunkTransport::target() const {
    return target_;
}
