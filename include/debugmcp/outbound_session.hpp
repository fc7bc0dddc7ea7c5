#pragma once

#include <curl/curl.h>
#include <array>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <stdexcept>
#include <string>

namespace debug_mcp {

// Header names compare case-insensitively
struct CaseInsensitiveLess {
    bool operator()(const std::string& lhs, const std::string& rhs) const;
};

using HeaderMap = std::map<std::string, std::string, CaseInsensitiveLess>;

struct HttpRequest {
    std::string method = "GET";
    std::string url;
    HeaderMap headers;
    std::string body;
    bool has_body = false;
};

struct HttpResponse {
    long status_code = 0;
    HeaderMap headers;     // repeated names folded into one comma-separated value
    std::string body;
    std::string url;       // effective URL after redirects
};

// Transport-level failure: DNS, refused connection, timeout, TLS, bad URL,
// or use of a closed session. The remote server never produced a response.
class HttpClientError : public std::runtime_error {
public:
    explicit HttpClientError(const std::string& message, int curl_code = 0)
        : std::runtime_error(message), curl_code_(curl_code) {}

    int curl_code() const { return curl_code_; }

private:
    int curl_code_;
};

struct SessionOptions {
    long timeout_seconds = 30;
    bool verify_tls = true;
    long max_redirects = 10;
    std::string user_agent = "debug-mcp-server/0.1.0";
};

/**
 * One reusable outbound HTTP client. Requests share a libcurl connection
 * cache and DNS cache, so consecutive calls to the same host reuse the
 * connection. Safe to use from several threads at once.
 */
class OutboundSession {
public:
    explicit OutboundSession(const SessionOptions& options);
    ~OutboundSession();

    OutboundSession(const OutboundSession&) = delete;
    OutboundSession& operator=(const OutboundSession&) = delete;

    // Any completed response is returned, whatever its status code.
    // Throws HttpClientError when no response could be obtained.
    HttpResponse perform(const HttpRequest& request);

    // Waits for in-flight requests, then releases the connection pool.
    // Idempotent.
    void close();
    bool closed() const;

    const SessionOptions& options() const { return options_; }
    std::uint64_t id() const { return id_; }

    // Percent-encodes a query string component
    static std::string url_encode(const std::string& value);

private:
    static void lock_share(CURL* handle, curl_lock_data data, curl_lock_access access, void* userptr);
    static void unlock_share(CURL* handle, curl_lock_data data, void* userptr);

    SessionOptions options_;
    std::uint64_t id_;
    CURLSH* share_;
    std::array<std::mutex, CURL_LOCK_DATA_LAST> share_locks_;

    // Shared by requests, exclusive for close()
    mutable std::shared_mutex lifecycle_mutex_;
    bool closed_;
};

/**
 * Owner of the process-wide outbound session. The session is created on the
 * first acquire(), recreated when found closed, and closed exactly once by
 * shutdown() or the destructor.
 */
class SharedOutboundSession {
public:
    explicit SharedOutboundSession(const SessionOptions& options = SessionOptions());
    ~SharedOutboundSession();

    SharedOutboundSession(const SharedOutboundSession&) = delete;
    SharedOutboundSession& operator=(const SharedOutboundSession&) = delete;

    // Throws HttpClientError after shutdown()
    std::shared_ptr<OutboundSession> acquire();

    void shutdown();
    bool is_shut_down() const;

    // Number of sessions constructed so far
    std::size_t sessions_created() const;

    const SessionOptions& options() const { return options_; }

private:
    SessionOptions options_;
    mutable std::mutex mutex_;
    std::shared_ptr<OutboundSession> session_;
    std::size_t created_;
    bool shut_down_;
};

} // namespace debug_mcp
