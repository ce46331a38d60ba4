#pragma once

#include <cstddef>
#include <map>
#include <string>

namespace camrelay {

struct HttpRequest {
    std::string method;
    std::string target;   // as sent, including any query string
    std::string path;     // target without query
    std::string query;
    std::string version;
    std::map<std::string, std::string> headers;  // keys lower-cased
    std::string client_address;
};

// Parses the request line and headers of a raw HTTP/1.x request head.
bool parseHttpRequest(const std::string& raw, HttpRequest& out, std::string& error);

const char* httpReasonPhrase(int status);

// Complete non-streaming response with Content-Length and Connection: close.
std::string makeHttpResponse(int status, const std::string& content_type, const std::string& body);
std::string makeHttpErrorResponse(int status, const std::string& message);

// Byte sink for one client connection.
class ResponseWriter {
public:
    virtual ~ResponseWriter() = default;

    // Writes all bytes or returns false; a false return means the peer is gone.
    virtual bool write(const void* data, std::size_t size) = 0;

    // True once the server is shutting down and long-lived handlers should return.
    virtual bool cancelled() const { return false; }
};

bool writeString(ResponseWriter& writer, const std::string& s);

// One implementation per route, composed through Router.
class RouteHandler {
public:
    virtual ~RouteHandler() = default;
    virtual void handle(const HttpRequest& request, ResponseWriter& writer) = 0;
};

}  // namespace camrelay
