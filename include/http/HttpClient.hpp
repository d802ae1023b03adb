#pragma once

#include <cstdint>
#include <functional>
#include <istream>
#include <stdexcept>
#include <string>
#include <vector>
#include "const/rest_enums.hpp"

namespace reeldrop {
namespace http {

/**
 * Status and body of a completed HTTP exchange
 */
struct Response {
    long status = 0;
    std::string body;

    bool ok() const { return is_success(status); }
};

/**
 * Raised when no HTTP response was obtained (DNS, connect, timeout, aborted body)
 */
class RequestError : public std::runtime_error {
public:
    RequestError(const std::string& message, bool timedOut)
        : std::runtime_error(message), timedOut_(timedOut) {}

    bool timedOut() const { return timedOut_; }

private:
    bool timedOut_;
};

struct Timeouts {
    long connectSeconds = 10;
    long totalSeconds = 30;
    long stallSeconds = 0;    // abort when under 1 byte/s for this long; 0 disables
};

// Called with bytes sent so far and the body size
using ProgressCallback = std::function<void(std::uint64_t sent, std::uint64_t total)>;
// Polled during a transfer; returning true aborts it
using AbortCheck = std::function<bool()>;

/**
 * Blocking libcurl client. Each call uses its own easy handle, so one instance
 * may be shared between threads.
 */
class HttpClient {
public:
    explicit HttpClient(Timeouts timeouts = Timeouts());

    Response get(const std::string& url, const std::vector<std::string>& headers) const;

    Response postJson(const std::string& url, const std::string& body,
                      const std::vector<std::string>& headers) const;

    // Streams size bytes from body as a PUT request
    Response put(const std::string& url, std::istream& body, std::uint64_t size,
                 const std::vector<std::string>& headers,
                 const ProgressCallback& onProgress = ProgressCallback(),
                 const AbortCheck& shouldAbort = AbortCheck()) const;

    const Timeouts& timeouts() const { return timeouts_; }

private:
    Timeouts timeouts_;
};

} // namespace http
} // namespace reeldrop
