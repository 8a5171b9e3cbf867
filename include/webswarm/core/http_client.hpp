#ifndef WEBSWARM_CORE_HTTP_CLIENT_HPP
#define WEBSWARM_CORE_HTTP_CLIENT_HPP

#include "json.hpp"
#include <string>
#include <map>
#include <mutex>
#include <functional>
#include <curl/curl.h>

namespace webswarm {

typedef std::map<std::string, std::string> HttpHeaders;

// HTTP response structure
struct HttpResponse {
    long status_code;
    std::string body;
    HttpHeaders headers;      // keys lower-cased
    std::string error;
    bool timed_out;

    HttpResponse() : status_code(0), timed_out(false) {}

    bool ok() const { return status_code >= 200 && status_code < 300; }

    // True when the request never produced an HTTP status
    bool transport_failed() const { return status_code == 0; }

    // Case-insensitive header lookup
    std::string header(const std::string& name) const;

    // Parsed body, or a discarded value if the body is not JSON
    Json json() const { return parse_json_lenient(body); }
};

// Receives streamed body bytes. Return false to stop reading.
typedef std::function<bool(const std::string& chunk)> ChunkCallback;

// Outbound HTTP seam. The pool, the automation client, the oracle provider
// and the agent's claim requests all talk through this interface.
class HttpTransport {
public:
    virtual ~HttpTransport() {}

    // timeout_ms <= 0 uses the transport default
    virtual HttpResponse get(const std::string& url,
                             const HttpHeaders& headers = HttpHeaders(),
                             long timeout_ms = 0) = 0;

    virtual HttpResponse post_json(const std::string& url,
                                   const std::string& body,
                                   const HttpHeaders& headers = HttpHeaders(),
                                   long timeout_ms = 0) = 0;

    // GET whose body is delivered incrementally (server-sent events).
    // The returned response carries status and headers; body holds
    // whatever was received.
    virtual HttpResponse get_stream(const std::string& url,
                                    const HttpHeaders& headers,
                                    long timeout_ms,
                                    const ChunkCallback& on_chunk) = 0;
};

// libcurl implementation. One instance is shared by a whole service: each
// request uses its own easy handle, connections and DNS are pooled through
// a curl share handle, so concurrent calls are safe.
class HttpClient : public HttpTransport {
public:
    HttpClient();
    virtual ~HttpClient();

    void set_timeout(long ms);
    long timeout() const { return timeout_ms_; }

    virtual HttpResponse get(const std::string& url,
                             const HttpHeaders& headers = HttpHeaders(),
                             long timeout_ms = 0);

    virtual HttpResponse post_json(const std::string& url,
                                   const std::string& body,
                                   const HttpHeaders& headers = HttpHeaders(),
                                   long timeout_ms = 0);

    virtual HttpResponse get_stream(const std::string& url,
                                    const HttpHeaders& headers,
                                    long timeout_ms,
                                    const ChunkCallback& on_chunk);

private:
    HttpClient(const HttpClient&);
    HttpClient& operator=(const HttpClient&);

    CURLSH* share_;
    long timeout_ms_;
    std::mutex share_locks_[CURL_LOCK_DATA_LAST];

    HttpResponse perform_request(const std::string& method,
                                 const std::string& url,
                                 const std::string& body,
                                 const HttpHeaders& headers,
                                 long timeout_ms,
                                 const ChunkCallback* on_chunk);

    static size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata);
    static size_t header_callback(char* buffer, size_t size, size_t nitems, void* userdata);
    static void lock_callback(CURL* handle, curl_lock_data data, curl_lock_access access, void* userptr);
    static void unlock_callback(CURL* handle, curl_lock_data data, void* userptr);
};

} // namespace webswarm

#endif // WEBSWARM_CORE_HTTP_CLIENT_HPP
