#include "UploadRequest.hpp"

bool parse_http_method(const std::string& name, drogon::HttpMethod& method) {
    if (name == "GET") {
        method = drogon::Get;
    } else if (name == "POST") {
        method = drogon::Post;
    } else if (name == "HEAD") {
        method = drogon::Head;
    } else if (name == "PUT") {
        method = drogon::Put;
    } else if (name == "DELETE") {
        method = drogon::Delete;
    } else if (name == "OPTIONS") {
        method = drogon::Options;
    } else if (name == "PATCH") {
        method = drogon::Patch;
    } else {
        return false;
    }
    return true;
}

std::string http_method_name(drogon::HttpMethod method) {
    switch (method) {
        case drogon::Get:
            return "GET";
        case drogon::Post:
            return "POST";
        case drogon::Head:
            return "HEAD";
        case drogon::Put:
            return "PUT";
        case drogon::Delete:
            return "DELETE";
        case drogon::Options:
            return "OPTIONS";
        case drogon::Patch:
            return "PATCH";
        default:
            return "INVALID";
    }
}
