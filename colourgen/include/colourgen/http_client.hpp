#ifndef COLOURGEN_HTTP_CLIENT_HPP
#define COLOURGEN_HTTP_CLIENT_HPP

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace colourgen {

struct Url {
    std::string scheme;   // Lowercase, e.g. "http"
    std::string host;
    uint16_t port = 80;
    std::string target = "/";  // Path plus query

    // Parses "scheme://host[:port][/path]". Returns nullopt when malformed.
    static std::optional<Url> parse(std::string_view text);

    // "scheme://host:port/target"
    std::string to_string() const;
};

inline bool looks_like_url(std::string_view text) {
    return text.find("://") != std::string_view::npos;
}

struct HttpResponse {
    int status = 0;
    std::string reason;
    std::map<std::string, std::string> headers;  // Keys lowercased
    std::string body;

    bool is_success() const { return status >= 200 && status < 300; }
};

// Fetch timeout as whole milliseconds in [1, INT_MAX]
long clamp_timeout_ms(std::chrono::milliseconds timeout);

/**
 * Blocking GET. Implementations throw SourceUnavailableError on connection
 * failure or timeout; non-2xx responses are returned, not thrown.
 */
class HttpTransport {
public:
    virtual ~HttpTransport() = default;
    virtual HttpResponse get(const Url& url, std::chrono::milliseconds timeout) = 0;
};

/**
 * http and https through libcurl. Redirects are followed and bodies are
 * capped at MAX_RESPONSE_BYTES (MalformedSourceError beyond that). Other
 * schemes are rejected with SourceUnavailableError.
 */
class CurlHttpTransport : public HttpTransport {
private:
    std::string user_agent_;

public:
    static constexpr std::size_t MAX_RESPONSE_BYTES = 16 * 1024 * 1024;

    explicit CurlHttpTransport(std::string user_agent = "colourgen/1.0");

    HttpResponse get(const Url& url, std::chrono::milliseconds timeout) override;
};

} // namespace colourgen

#endif // COLOURGEN_HTTP_CLIENT_HPP
