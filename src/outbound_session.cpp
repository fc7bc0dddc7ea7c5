#include <debugmcp/outbound_session.hpp>
#include <debugmcp/logging.hpp>
#include <algorithm>
#include <atomic>
#include <cctype>
#include <cstring>

namespace debug_mcp {

namespace {

std::once_flag curl_init_flag;
std::atomic<std::uint64_t> next_session_id{1};

struct ResponseCollector {
    std::string body;
    HeaderMap headers;
};

size_t write_callback(void* contents, size_t size, size_t nmemb, void* userp) {
    static_cast<ResponseCollector*>(userp)->body.append(static_cast<char*>(contents), size * nmemb);
    return size * nmemb;
}

std::string trim(const std::string& text) {
    size_t begin = 0;
    size_t end = text.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(text[begin]))) ++begin;
    while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1]))) --end;
    return text.substr(begin, end - begin);
}

size_t header_callback(char* buffer, size_t size, size_t nitems, void* userdata) {
    auto* collector = static_cast<ResponseCollector*>(userdata);
    size_t length = size * nitems;
    std::string line(buffer, length);

    // Each status line starts a new response (redirect hop or 100 Continue);
    // only the headers of the final one are reported.
    if (line.compare(0, 5, "HTTP/") == 0) {
        collector->headers.clear();
        return length;
    }

    size_t colon = line.find(':');
    if (colon == std::string::npos) {
        return length;
    }

    std::string name = trim(line.substr(0, colon));
    std::string value = trim(line.substr(colon + 1));
    if (name.empty()) {
        return length;
    }

    auto it = collector->headers.find(name);
    if (it == collector->headers.end()) {
        collector->headers[name] = value;
    } else {
        it->second += ", " + value;
    }
    return length;
}

bool has_http_scheme(const std::string& url) {
    std::string prefix = url.substr(0, 8);
    std::transform(prefix.begin(), prefix.end(), prefix.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return prefix.compare(0, 7, "http://") == 0 || prefix.compare(0, 8, "https://") == 0;
}

// Frees the easy handle and header list on every exit path
struct EasyHandle {
    CURL* curl = nullptr;
    curl_slist* headers = nullptr;

    ~EasyHandle() {
        if (headers) {
            curl_slist_free_all(headers);
        }
        if (curl) {
            curl_easy_cleanup(curl);
        }
    }
};

} // namespace

bool CaseInsensitiveLess::operator()(const std::string& lhs, const std::string& rhs) const {
    return std::lexicographical_compare(lhs.begin(), lhs.end(), rhs.begin(), rhs.end(),
        [](unsigned char a, unsigned char b) { return std::tolower(a) < std::tolower(b); });
}

// ==================== OUTBOUND SESSION ====================

OutboundSession::OutboundSession(const SessionOptions& options)
    : options_(options)
    , id_(next_session_id++)
    , share_(nullptr)
    , closed_(false) {
    std::call_once(curl_init_flag, []() {
        curl_global_init(CURL_GLOBAL_DEFAULT);
    });

    share_ = curl_share_init();
    if (!share_) {
        throw HttpClientError("Failed to initialize CURL share handle");
    }

    curl_share_setopt(share_, CURLSHOPT_LOCKFUNC, &OutboundSession::lock_share);
    curl_share_setopt(share_, CURLSHOPT_UNLOCKFUNC, &OutboundSession::unlock_share);
    curl_share_setopt(share_, CURLSHOPT_USERDATA, this);
    curl_share_setopt(share_, CURLSHOPT_SHARE, CURL_LOCK_DATA_CONNECT);
    curl_share_setopt(share_, CURLSHOPT_SHARE, CURL_LOCK_DATA_DNS);
    curl_share_setopt(share_, CURLSHOPT_SHARE, CURL_LOCK_DATA_SSL_SESSION);

    logging::debug("Outbound session #" + std::to_string(id_) + " created (timeout "
                   + std::to_string(options_.timeout_seconds) + "s, TLS verification "
                   + (options_.verify_tls ? "on" : "off") + ")");
}

OutboundSession::~OutboundSession() {
    close();
}

void OutboundSession::lock_share(CURL*, curl_lock_data data, curl_lock_access, void* userptr) {
    auto* self = static_cast<OutboundSession*>(userptr);
    self->share_locks_[static_cast<size_t>(data)].lock();
}

void OutboundSession::unlock_share(CURL*, curl_lock_data data, void* userptr) {
    auto* self = static_cast<OutboundSession*>(userptr);
    self->share_locks_[static_cast<size_t>(data)].unlock();
}

void OutboundSession::close() {
    std::unique_lock<std::shared_mutex> lock(lifecycle_mutex_);
    if (closed_) {
        return;
    }
    closed_ = true;

    if (share_) {
        CURLSHcode rc = curl_share_cleanup(share_);
        if (rc != CURLSHE_OK) {
            logging::warning(std::string("CURL share cleanup failed: ") + curl_share_strerror(rc));
        }
        share_ = nullptr;
    }
    logging::debug("Outbound session #" + std::to_string(id_) + " closed");
}

bool OutboundSession::closed() const {
    std::shared_lock<std::shared_mutex> lock(lifecycle_mutex_);
    return closed_;
}

HttpResponse OutboundSession::perform(const HttpRequest& request) {
    std::shared_lock<std::shared_mutex> lock(lifecycle_mutex_);
    if (closed_) {
        throw HttpClientError("Session is closed");
    }

    if (!has_http_scheme(request.url)) {
        throw HttpClientError("Invalid URL (expected http:// or https://): " + request.url,
                              CURLE_UNSUPPORTED_PROTOCOL);
    }

    EasyHandle handle;
    handle.curl = curl_easy_init();
    if (!handle.curl) {
        throw HttpClientError("Failed to initialize CURL");
    }
    CURL* curl = handle.curl;

    ResponseCollector collector;
    char error_buffer[CURL_ERROR_SIZE];
    error_buffer[0] = '\0';

    curl_easy_setopt(curl, CURLOPT_SHARE, share_);
    curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, error_buffer);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, options_.timeout_seconds);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_MAXREDIRS, options_.max_redirects);
    curl_easy_setopt(curl, CURLOPT_ACCEPT_ENCODING, "");
    curl_easy_setopt(curl, CURLOPT_USERAGENT, options_.user_agent.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &collector);
    curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, header_callback);
    curl_easy_setopt(curl, CURLOPT_HEADERDATA, &collector);

    if (!options_.verify_tls) {
        curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 0L);
        curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, 0L);
    }

    // Set method and body
    bool sends_body = false;
    if (request.method == "GET") {
        curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
    } else if (request.method == "POST" || request.method == "PUT") {
        if (request.method == "POST") {
            curl_easy_setopt(curl, CURLOPT_POST, 1L);
        } else {
            curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, "PUT");
        }
        if (request.has_body) {
            curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(request.body.size()));
            curl_easy_setopt(curl, CURLOPT_POSTFIELDS, request.body.c_str());
            sends_body = true;
        } else if (request.method == "POST") {
            curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, 0L);
            curl_easy_setopt(curl, CURLOPT_POSTFIELDS, "");
            sends_body = true;
        }
    } else {
        curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, request.method.c_str());
    }

    // Set headers
    for (const auto& [name, value] : request.headers) {
        // "Name:" with nothing after it tells curl to drop the header; "Name;" sends it empty
        std::string header = value.empty() ? name + ";" : name + ": " + value;
        handle.headers = curl_slist_append(handle.headers, header.c_str());
    }
    if (sends_body) {
        // An empty value removes the header curl would add on its own
        if (!request.headers.count("Content-Type")) {
            handle.headers = curl_slist_append(handle.headers, "Content-Type:");
        }
        handle.headers = curl_slist_append(handle.headers, "Expect:");
    }
    if (handle.headers) {
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, handle.headers);
    }

    CURLcode res = curl_easy_perform(curl);
    if (res != CURLE_OK) {
        std::string detail = error_buffer[0] != '\0' ? error_buffer : curl_easy_strerror(res);
        throw HttpClientError(std::string(curl_easy_strerror(res)) + ": " + detail,
                              static_cast<int>(res));
    }

    HttpResponse response;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status_code);

    char* effective_url = nullptr;
    curl_easy_getinfo(curl, CURLINFO_EFFECTIVE_URL, &effective_url);
    response.url = effective_url ? effective_url : request.url;

    response.headers = std::move(collector.headers);
    response.body = std::move(collector.body);
    return response;
}

std::string OutboundSession::url_encode(const std::string& value) {
    std::call_once(curl_init_flag, []() {
        curl_global_init(CURL_GLOBAL_DEFAULT);
    });

    EasyHandle handle;
    handle.curl = curl_easy_init();
    if (!handle.curl) {
        throw HttpClientError("Failed to initialize CURL");
    }

    char* escaped = curl_easy_escape(handle.curl, value.c_str(), static_cast<int>(value.size()));
    if (!escaped) {
        throw HttpClientError("Failed to URL-encode value");
    }
    std::string result(escaped);
    curl_free(escaped);
    return result;
}

// ==================== SHARED OUTBOUND SESSION ====================

SharedOutboundSession::SharedOutboundSession(const SessionOptions& options)
    : options_(options)
    , created_(0)
    , shut_down_(false) {
}

SharedOutboundSession::~SharedOutboundSession() {
    shutdown();
}

std::shared_ptr<OutboundSession> SharedOutboundSession::acquire() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (shut_down_) {
        throw HttpClientError("Outbound session has been shut down");
    }

    if (!session_ || session_->closed()) {
        if (session_) {
            logging::info("HTTP session was closed, creating a new one");
        }
        session_ = std::make_shared<OutboundSession>(options_);
        ++created_;
    }
    return session_;
}

void SharedOutboundSession::shutdown() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (shut_down_) {
        return;
    }
    shut_down_ = true;

    if (session_ && !session_->closed()) {
        session_->close();
        logging::info("HTTP session closed");
    }
    session_.reset();
}

bool SharedOutboundSession::is_shut_down() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return shut_down_;
}

std::size_t SharedOutboundSession::sessions_created() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return created_;
}

} // namespace debug_mcp
