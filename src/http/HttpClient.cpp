#include "http/HttpClient.hpp"
#include <curl/curl.h>
#include <algorithm>

namespace reeldrop {
namespace http {

namespace {
    size_t writeCallback(void* contents, size_t size, size_t nmemb, std::string* userp) {
        size_t totalSize = size * nmemb;
        userp->append(static_cast<char*>(contents), totalSize);
        return totalSize;
    }

    struct BodySource {
        std::istream* stream = nullptr;
        std::uint64_t total = 0;
        std::uint64_t reported = 0;
        bool readFailed = false;
        const ProgressCallback* onProgress = nullptr;
        const AbortCheck* shouldAbort = nullptr;
    };

    size_t readCallback(char* buffer, size_t size, size_t nitems, void* userdata) {
        auto* source = static_cast<BodySource*>(userdata);
        source->stream->read(buffer, static_cast<std::streamsize>(size * nitems));
        if (source->stream->bad()) {
            source->readFailed = true;
            return CURL_READFUNC_ABORT;
        }
        return static_cast<size_t>(source->stream->gcount());
    }

    int progressCallback(void* clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t ulnow) {
        auto* source = static_cast<BodySource*>(clientp);
        if (*source->shouldAbort && (*source->shouldAbort)()) {
            return 1;
        }

        auto sent = std::min(static_cast<std::uint64_t>(ulnow), source->total);
        if (sent > source->reported) {
            source->reported = sent;
            if (*source->onProgress) {
                (*source->onProgress)(sent, source->total);
            }
        }
        return 0;
    }

    // Runs the prepared handle and always releases it
    Response perform(CURL* curl, const std::string& url, const std::vector<std::string>& headers,
                     const Timeouts& timeouts) {
        std::string response;
        struct curl_slist* headerList = nullptr;

        for (const auto& header : headers) {
            headerList = curl_slist_append(headerList, header.c_str());
        }

        curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headerList);
        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, writeCallback);
        curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response);
        curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
        curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, timeouts.connectSeconds);
        curl_easy_setopt(curl, CURLOPT_TIMEOUT, timeouts.totalSeconds);
        if (timeouts.stallSeconds > 0) {
            curl_easy_setopt(curl, CURLOPT_LOW_SPEED_LIMIT, 1L);
            curl_easy_setopt(curl, CURLOPT_LOW_SPEED_TIME, timeouts.stallSeconds);
        }

        CURLcode res = curl_easy_perform(curl);

        long httpCode = 0;
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &httpCode);

        curl_slist_free_all(headerList);
        curl_easy_cleanup(curl);

        if (res != CURLE_OK) {
            throw RequestError(std::string("CURL error: ") + curl_easy_strerror(res),
                               res == CURLE_OPERATION_TIMEDOUT);
        }

        return Response{httpCode, response};
    }

    CURL* openHandle() {
        CURL* curl = curl_easy_init();
        if (!curl) {
            throw RequestError("Failed to initialize CURL", false);
        }
        return curl;
    }
}

HttpClient::HttpClient(Timeouts timeouts) : timeouts_(timeouts) {}

Response HttpClient::get(const std::string& url, const std::vector<std::string>& headers) const {
    CURL* curl = openHandle();
    curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
    return perform(curl, url, headers, timeouts_);
}

Response HttpClient::postJson(const std::string& url, const std::string& body,
                              const std::vector<std::string>& headers) const {
    std::vector<std::string> allHeaders = headers;
    allHeaders.push_back("Content-Type: application/json");

    CURL* curl = openHandle();
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(body.size()));
    return perform(curl, url, allHeaders, timeouts_);
}

Response HttpClient::put(const std::string& url, std::istream& body, std::uint64_t size,
                         const std::vector<std::string>& headers,
                         const ProgressCallback& onProgress,
                         const AbortCheck& shouldAbort) const {
    std::vector<std::string> allHeaders = headers;
    // No 100-continue round trip; the storage endpoint accepts the body straight away
    allHeaders.push_back("Expect:");

    BodySource source;
    source.stream = &body;
    source.total = size;
    source.onProgress = &onProgress;
    source.shouldAbort = &shouldAbort;

    CURL* curl = openHandle();
    curl_easy_setopt(curl, CURLOPT_UPLOAD, 1L);
    curl_easy_setopt(curl, CURLOPT_READFUNCTION, readCallback);
    curl_easy_setopt(curl, CURLOPT_READDATA, &source);
    curl_easy_setopt(curl, CURLOPT_INFILESIZE_LARGE, static_cast<curl_off_t>(size));
    curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, progressCallback);
    curl_easy_setopt(curl, CURLOPT_XFERINFODATA, &source);

    try {
        return perform(curl, url, allHeaders, timeouts_);
    } catch (const RequestError& e) {
        if (source.readFailed) {
            throw RequestError(std::string("Failed reading request body (") + e.what() + ")", false);
        }
        throw;
    }
}

} // namespace http
} // namespace reeldrop
