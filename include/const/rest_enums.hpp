#pragma once

#include <string>
#include <stdexcept>

namespace reeldrop {
namespace http {

enum class HttpRequest {
    GET,
    POST,
    PUT,
};


inline const char* to_string(HttpRequest method) {
    switch(method) {
        case HttpRequest::GET: return "GET";
        case HttpRequest::POST: return "POST";
        case HttpRequest::PUT: return "PUT";
        default: return "UNKNOWN";
    }
}


inline HttpRequest from_string(const std::string& method) {
    if (method == "GET") return HttpRequest::GET;
    else if (method == "POST") return HttpRequest::POST;
    else if (method == "PUT") return HttpRequest::PUT;
    else throw std::invalid_argument("Invalid HTTP method string: " + method);
}

inline const char* status_text(long status) {
    switch (status) {
        case 200: return "OK";
        case 201: return "Created";
        case 204: return "No Content";
        case 400: return "Bad Request";
        case 401: return "Unauthorized";
        case 403: return "Forbidden";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 408: return "Request Timeout";
        case 409: return "Conflict";
        case 429: return "Too Many Requests";
        case 500: return "Internal Server Error";
        case 502: return "Bad Gateway";
        case 503: return "Service Unavailable";
        default:  return "Unknown";
    }
}

inline bool is_success(long status) {
    return status >= 200 && status < 300;
}

inline bool is_auth_failure(long status) {
    return status == 401 || status == 403;
}

// Statuses a storage endpoint returns for conditions that may clear on a fresh attempt
inline bool is_transient(long status) {
    return status == 408 || status == 429 || status >= 500;
}

} // namespace http
} // namespace reeldrop
