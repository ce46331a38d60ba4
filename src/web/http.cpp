#include "web/http.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace camrelay {

namespace {

std::string trim(const std::string& s) {
    const auto b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) {
        return {};
    }
    const auto e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return s;
}

}  // namespace

bool parseHttpRequest(const std::string& raw, HttpRequest& out, std::string& error) {
    // Minimal parser for: METHOD /path?query HTTP/1.1 followed by headers
    const std::size_t line_end = raw.find("\r\n");
    const std::string request_line = raw.substr(0, line_end);
    if (request_line.empty()) {
        error = "empty request line";
        return false;
    }

    const std::size_t method_end = request_line.find(' ');
    if (method_end == std::string::npos || method_end == 0) {
        error = "malformed request line";
        return false;
    }
    const std::size_t target_start = method_end + 1;
    const std::size_t target_end = request_line.find(' ', target_start);
    if (target_end == std::string::npos || target_end <= target_start) {
        error = "malformed request line";
        return false;
    }

    out.method = request_line.substr(0, method_end);
    out.target = request_line.substr(target_start, target_end - target_start);
    out.version = trim(request_line.substr(target_end + 1));
    if (out.version.compare(0, 5, "HTTP/") != 0) {
        error = "unsupported protocol: " + out.version;
        return false;
    }
    if (out.target.empty() || out.target[0] != '/') {
        error = "request target must be an absolute path";
        return false;
    }

    const std::size_t query_pos = out.target.find('?');
    if (query_pos != std::string::npos) {
        out.path = out.target.substr(0, query_pos);
        out.query = out.target.substr(query_pos + 1);
    } else {
        out.path = out.target;
        out.query.clear();
    }

    out.headers.clear();
    if (line_end != std::string::npos) {
        std::istringstream iss(raw.substr(line_end + 2));
        std::string line;
        while (std::getline(iss, line)) {
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            if (line.empty()) {
                break;
            }
            const std::size_t colon = line.find(':');
            if (colon == std::string::npos) {
                continue;
            }
            out.headers[toLower(trim(line.substr(0, colon)))] = trim(line.substr(colon + 1));
        }
    }

    error.clear();
    return true;
}

const char* httpReasonPhrase(int status) {
    switch (status) {
    case 200:
        return "OK";
    case 400:
        return "Bad Request";
    case 404:
        return "Not Found";
    case 405:
        return "Method Not Allowed";
    case 500:
        return "Internal Server Error";
    case 503:
        return "Service Unavailable";
    default:
        return "Unknown";
    }
}

std::string makeHttpResponse(int status, const std::string& content_type, const std::string& body) {
    std::string out;
    out.reserve(body.size() + 160U);
    out += "HTTP/1.1 " + std::to_string(status) + " " + httpReasonPhrase(status) + "\r\n";
    out += "Content-Type: " + content_type + "\r\n";
    out += "Content-Length: " + std::to_string(body.size()) + "\r\n";
    out += "Connection: close\r\n\r\n";
    out += body;
    return out;
}

std::string makeHttpErrorResponse(int status, const std::string& message) {
    const std::string code = std::to_string(status) + " " + httpReasonPhrase(status);
    const std::string body =
        "<html><head><title>" + code + "</title></head><body><h1>" + code + "</h1><p>" + message + "</p></body></html>\n";
    return makeHttpResponse(status, "text/html; charset=utf-8", body);
}

bool writeString(ResponseWriter& writer, const std::string& s) {
    return writer.write(s.data(), s.size());
}

}  // namespace camrelay
