#include "CurlHttpTransport.h"
#include "core/LoggingChannels.h"
#include <algorithm>
#include <cctype>
#include <curl/curl.h>
#include <memory>

namespace ArcticLink {
namespace Network {

namespace {

struct EasyDeleter {
    void operator()(CURL* curl) const { curl_easy_cleanup(curl); }
};

struct SlistDeleter {
    void operator()(curl_slist* list) const { curl_slist_free_all(list); }
};

using EasyHandle = std::unique_ptr<CURL, EasyDeleter>;
using HeaderList = std::unique_ptr<curl_slist, SlistDeleter>;

size_t writeCallback(char* data, size_t size, size_t nmemb, void* userp)
{
    auto* body = static_cast<std::string*>(userp);
    body->append(data, size * nmemb);
    return size * nmemb;
}

std::string trim(const std::string& text)
{
    const auto begin = text.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return "";
    }
    const auto end = text.find_last_not_of(" \t\r\n");
    return text.substr(begin, end - begin + 1);
}

size_t headerCallback(char* data, size_t size, size_t nmemb, void* userp)
{
    auto* headers = static_cast<std::map<std::string, std::string>*>(userp);
    const std::string line(data, size * nmemb);
    const auto colon = line.find(':');
    if (colon != std::string::npos) {
        std::string key = trim(line.substr(0, colon));
        std::transform(key.begin(), key.end(), key.begin(), [](unsigned char c) {
            return static_cast<char>(std::tolower(c));
        });
        (*headers)[key] = trim(line.substr(colon + 1));
    }
    return size * nmemb;
}

// Returning non-zero aborts the transfer with CURLE_ABORTED_BY_CALLBACK.
int progressCallback(void* clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t)
{
    const auto* token = static_cast<const CancellationToken*>(clientp);
    return token->shouldAbort() ? 1 : 0;
}

HttpError makeError(HttpError::Kind kind, std::string message)
{
    return HttpError{ .kind = kind, .message = std::move(message) };
}

} // namespace

CurlHttpTransport::CurlHttpTransport(Options options) : options_(std::move(options))
{}

bool CurlHttpTransport::globalInit()
{
    const CURLcode res = curl_global_init(CURL_GLOBAL_DEFAULT);
    if (res != CURLE_OK) {
        LOG_ERROR(Network, "curl_global_init failed: {}", curl_easy_strerror(res));
        return false;
    }
    return true;
}

void CurlHttpTransport::globalCleanup()
{
    curl_global_cleanup();
}

Result<HttpResponse, HttpError> CurlHttpTransport::send(
    const HttpRequest& request, const CancellationToken& token)
{
    using R = Result<HttpResponse, HttpError>;

    if (token.isCancelled()) {
        return R::error(makeError(HttpError::Kind::Cancelled, "Cancelled before send"));
    }

    // The request timeout is enforced through the token as well as by curl.
    const CancellationToken bounded = token.child(request.timeout);

    EasyHandle curl(curl_easy_init());
    if (!curl) {
        return R::error(makeError(HttpError::Kind::Connection, "curl_easy_init failed"));
    }

    HttpResponse response;
    CURL* h = curl.get();

    curl_easy_setopt(h, CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(h, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(h, CURLOPT_TIMEOUT_MS, static_cast<long>(request.timeout.count()));
    curl_easy_setopt(
        h,
        CURLOPT_CONNECTTIMEOUT_MS,
        static_cast<long>(std::min(options_.connectTimeout, request.timeout).count()));
    curl_easy_setopt(h, CURLOPT_FOLLOWLOCATION, 0L);
    curl_easy_setopt(h, CURLOPT_SSL_VERIFYPEER, options_.verifyTls ? 1L : 0L);
    curl_easy_setopt(h, CURLOPT_SSL_VERIFYHOST, options_.verifyTls ? 2L : 0L);
    if (!options_.userAgent.empty()) {
        curl_easy_setopt(h, CURLOPT_USERAGENT, options_.userAgent.c_str());
    }

    curl_easy_setopt(h, CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(h, CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(h, CURLOPT_HEADERFUNCTION, headerCallback);
    curl_easy_setopt(h, CURLOPT_HEADERDATA, &response.headers);

    curl_easy_setopt(h, CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(h, CURLOPT_XFERINFOFUNCTION, progressCallback);
    curl_easy_setopt(h, CURLOPT_XFERINFODATA, &bounded);

    std::map<std::string, std::string> headers = options_.defaultHeaders;
    for (const auto& [key, value] : request.headers) {
        headers[key] = value;
    }
    HeaderList headerList;
    for (const auto& [key, value] : headers) {
        curl_slist* appended = curl_slist_append(headerList.get(), (key + ": " + value).c_str());
        if (!appended) {
            return R::error(makeError(HttpError::Kind::Connection, "curl_slist_append failed"));
        }
        headerList.release();
        headerList.reset(appended);
    }
    if (headerList) {
        curl_easy_setopt(h, CURLOPT_HTTPHEADER, headerList.get());
    }

    if (request.method == "POST") {
        curl_easy_setopt(h, CURLOPT_POST, 1L);
        curl_easy_setopt(h, CURLOPT_POSTFIELDS, request.body.c_str());
        curl_easy_setopt(h, CURLOPT_POSTFIELDSIZE, static_cast<long>(request.body.size()));
    }
    else if (request.method != "GET") {
        curl_easy_setopt(h, CURLOPT_CUSTOMREQUEST, request.method.c_str());
        if (!request.body.empty()) {
            curl_easy_setopt(h, CURLOPT_POSTFIELDS, request.body.c_str());
            curl_easy_setopt(h, CURLOPT_POSTFIELDSIZE, static_cast<long>(request.body.size()));
        }
    }

    LOG_DEBUG(Network, "{} {}", request.method, request.url);
    const CURLcode res = curl_easy_perform(h);

    if (res == CURLE_ABORTED_BY_CALLBACK) {
        if (token.isCancelled()) {
            LOG_DEBUG(Network, "{} {} cancelled", request.method, request.url);
            return R::error(makeError(HttpError::Kind::Cancelled, "Request cancelled"));
        }
        return R::error(makeError(HttpError::Kind::Timeout, "Deadline exceeded"));
    }
    if (res == CURLE_OPERATION_TIMEDOUT) {
        return R::error(makeError(HttpError::Kind::Timeout, curl_easy_strerror(res)));
    }
    if (res != CURLE_OK) {
        LOG_DEBUG(Network, "{} {} failed: {}", request.method, request.url, curl_easy_strerror(res));
        return R::error(makeError(HttpError::Kind::Connection, curl_easy_strerror(res)));
    }

    curl_easy_getinfo(h, CURLINFO_RESPONSE_CODE, &response.status);
    LOG_DEBUG(Network, "{} {} -> {}", request.method, request.url, response.status);
    return R::okay(std::move(response));
}

} // namespace Network
} // namespace ArcticLink
