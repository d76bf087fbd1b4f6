#pragma once

#include "core/network/HttpTransport.h"
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace ArcticLink::Tests {

/**
 * @brief Scripted transport. Outcomes are queued per "METHOD url"; once a
 * queue is down to one entry that entry repeats. Unscripted requests fail
 * with a Connection error. Every request is recorded in order.
 */
class MockHttpTransport : public Network::HttpTransport {
public:
    using Outcome = Result<Network::HttpResponse, Network::HttpError>;

    void respond(const std::string& method, const std::string& url, long status, std::string body);
    void fail(
        const std::string& method,
        const std::string& url,
        Network::HttpError::Kind kind,
        std::string message = "scripted failure");

    // Runs before each scripted outcome is returned, on the sending thread.
    void setBeforeSend(std::function<void(const Network::HttpRequest&)> hook);

    Outcome send(const Network::HttpRequest& request, const CancellationToken& token) override;

    std::vector<Network::HttpRequest> requests() const;
    std::vector<std::string> requestedUrls() const;
    size_t countRequests(const std::string& method, const std::string& url) const;
    void clearRequests();

private:
    static std::string key(const std::string& method, const std::string& url);

    mutable std::mutex mutex_;
    std::map<std::string, std::deque<Outcome>> scripts_;
    std::vector<Network::HttpRequest> requests_;
    std::function<void(const Network::HttpRequest&)> beforeSend_;
};

} // namespace ArcticLink::Tests
