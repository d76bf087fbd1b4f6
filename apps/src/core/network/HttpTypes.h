#pragma once

#include <chrono>
#include <map>
#include <string>

namespace ArcticLink {
namespace Network {

struct HttpRequest {
    std::string method = "GET";
    std::string url;
    std::map<std::string, std::string> headers;
    std::string body;
    std::chrono::milliseconds timeout{ 10000 };
};

struct HttpResponse {
    long status = 0;
    // Keys are lower-cased.
    std::map<std::string, std::string> headers;
    std::string body;

    bool isSuccess() const { return status >= 200 && status < 300; }
};

struct HttpError {
    enum class Kind { Timeout, Cancelled, Connection };

    Kind kind = Kind::Connection;
    std::string message;
};

inline const char* toString(HttpError::Kind kind)
{
    switch (kind) {
        case HttpError::Kind::Timeout:
            return "Timeout";
        case HttpError::Kind::Cancelled:
            return "Cancelled";
        case HttpError::Kind::Connection:
            return "Connection";
    }
    return "Unknown";
}

} // namespace Network
} // namespace ArcticLink
