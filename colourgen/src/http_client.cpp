#include <colourgen/http_client.hpp>
#include <colourgen/debug_log.hpp>
#include <colourgen/errors.hpp>
#include <algorithm>
#include <cctype>
#include <charconv>
#include <climits>
#include <memory>

#include <curl/curl.h>

namespace colourgen {

namespace {

std::string lowercase(std::string_view text) {
    std::string result(text);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

std::string_view trim(std::string_view text) {
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) {
        text.remove_prefix(1);
    }
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) {
        text.remove_suffix(1);
    }
    return text;
}

void ensure_curl_initialised() {
    static const CURLcode init = curl_global_init(CURL_GLOBAL_DEFAULT);
    if (init != CURLE_OK) {
        throw SourceUnavailableError(std::string("libcurl initialisation failed: ") + curl_easy_strerror(init));
    }
}

// State shared with the libcurl callbacks for one transfer
struct Transfer {
    HttpResponse response;
    bool overflowed = false;
};

std::size_t on_body(char* data, std::size_t size, std::size_t count, void* user) {
    auto* transfer = static_cast<Transfer*>(user);
    const std::size_t bytes = size * count;
    if (transfer->response.body.size() + bytes > CurlHttpTransport::MAX_RESPONSE_BYTES) {
        transfer->overflowed = true;
        return 0;
    }
    transfer->response.body.append(data, bytes);
    return bytes;
}

// Called once per header line, status lines included. A redirect starts a
// new status line, so only the final response's headers are kept.
std::size_t on_header(char* data, std::size_t size, std::size_t count, void* user) {
    auto* transfer = static_cast<Transfer*>(user);
    const std::size_t bytes = size * count;
    std::string_view line = trim(std::string_view(data, bytes));

    if (line.substr(0, 5) == "HTTP/") {
        transfer->response.headers.clear();
        transfer->response.reason.clear();
        std::size_t code = line.find(' ');
        if (code != std::string_view::npos) {
            std::size_t reason = line.find(' ', code + 1);
            if (reason != std::string_view::npos) {
                transfer->response.reason = std::string(trim(line.substr(reason + 1)));
            }
        }
        return bytes;
    }

    std::size_t colon = line.find(':');
    if (colon != std::string_view::npos) {
        transfer->response.headers[lowercase(trim(line.substr(0, colon)))] =
            std::string(trim(line.substr(colon + 1)));
    }
    return bytes;
}

} // namespace

std::optional<Url> Url::parse(std::string_view text) {
    text = trim(text);
    std::size_t scheme_end = text.find("://");
    if (scheme_end == std::string_view::npos || scheme_end == 0) {
        return std::nullopt;
    }

    Url url;
    url.scheme = lowercase(text.substr(0, scheme_end));
    std::string_view rest = text.substr(scheme_end + 3);

    std::size_t path_start = rest.find_first_of("/?#");
    std::string_view authority = rest.substr(0, path_start);
    if (path_start != std::string_view::npos) {
        std::string_view target = rest.substr(path_start);
        target = target.substr(0, target.find('#'));
        url.target = std::string(target);
        if (url.target.empty() || url.target.front() != '/') {
            url.target.insert(url.target.begin(), '/');
        }
    }

    url.port = url.scheme == "https" ? 443 : 80;
    std::size_t colon = authority.rfind(':');
    if (colon != std::string_view::npos && authority.find(']') == std::string_view::npos) {
        std::string_view port_text = authority.substr(colon + 1);
        unsigned int port = 0;
        auto [ptr, ec] = std::from_chars(port_text.data(), port_text.data() + port_text.size(), port);
        if (ec != std::errc() || ptr != port_text.data() + port_text.size() || port == 0 || port > 65535) {
            return std::nullopt;
        }
        url.port = static_cast<uint16_t>(port);
        authority = authority.substr(0, colon);
    }
    if (authority.empty()) {
        return std::nullopt;
    }
    url.host = std::string(authority);
    return url;
}

std::string Url::to_string() const {
    return scheme + "://" + host + ":" + std::to_string(port) + target;
}

long clamp_timeout_ms(std::chrono::milliseconds timeout) {
    return static_cast<long>(std::clamp<std::chrono::milliseconds::rep>(timeout.count(), 1, INT_MAX));
}

CurlHttpTransport::CurlHttpTransport(std::string user_agent)
    : user_agent_(std::move(user_agent)) {
    ensure_curl_initialised();
}

HttpResponse CurlHttpTransport::get(const Url& url, std::chrono::milliseconds timeout) {
    if (url.scheme != "http" && url.scheme != "https") {
        throw SourceUnavailableError("Unsupported URL scheme '" + url.scheme + "'");
    }

    std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> handle(curl_easy_init(), &curl_easy_cleanup);
    if (!handle) {
        throw SourceUnavailableError("curl_easy_init failed");
    }

    const std::string address = url.to_string();
    Transfer transfer;
    char error_buffer[CURL_ERROR_SIZE] = {0};

    CURL* curl = handle.get();
    curl_easy_setopt(curl, CURLOPT_URL, address.c_str());
    curl_easy_setopt(curl, CURLOPT_PROTOCOLS_STR, "http,https");
    curl_easy_setopt(curl, CURLOPT_REDIR_PROTOCOLS_STR, "http,https");
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_MAXREDIRS, 5L);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, clamp_timeout_ms(timeout));
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_USERAGENT, user_agent_.c_str());
    curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, error_buffer);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, on_body);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &transfer);
    curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, on_header);
    curl_easy_setopt(curl, CURLOPT_HEADERDATA, &transfer);

    COLOURGEN_DEBUG_LOG("GET %s", address.c_str());
    CURLcode rc = curl_easy_perform(curl);
    if (rc != CURLE_OK) {
        if (transfer.overflowed) {
            throw MalformedSourceError("Response from " + url.host + " exceeds size limit");
        }
        std::string detail = error_buffer[0] != '\0' ? error_buffer : curl_easy_strerror(rc);
        throw SourceUnavailableError("GET " + address + " failed: " + detail);
    }

    long status = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
    transfer.response.status = static_cast<int>(status);

    COLOURGEN_DEBUG_LOG("HTTP %d from %s (%zu body bytes)", transfer.response.status, url.host.c_str(),
                        transfer.response.body.size());
    return std::move(transfer.response);
}

} // namespace colourgen
