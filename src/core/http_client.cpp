#include <webswarm/core/http_client.hpp>
#include <webswarm/core/utils.hpp>
#include <sstream>

namespace webswarm {

namespace {

struct WriteTarget {
    std::string* body;
    const ChunkCallback* on_chunk;
    bool stopped;

    WriteTarget() : body(nullptr), on_chunk(nullptr), stopped(false) {}
};

} // namespace

std::string HttpResponse::header(const std::string& name) const {
    HttpHeaders::const_iterator it = headers.find(to_lower(name));
    return it != headers.end() ? it->second : std::string();
}

HttpClient::HttpClient() : share_(nullptr), timeout_ms_(60000) {
    share_ = curl_share_init();
    if (share_) {
        curl_share_setopt(share_, CURLSHOPT_LOCKFUNC, lock_callback);
        curl_share_setopt(share_, CURLSHOPT_UNLOCKFUNC, unlock_callback);
        curl_share_setopt(share_, CURLSHOPT_USERDATA, this);
        curl_share_setopt(share_, CURLSHOPT_SHARE, CURL_LOCK_DATA_DNS);
        curl_share_setopt(share_, CURLSHOPT_SHARE, CURL_LOCK_DATA_CONNECT);
    }
}

HttpClient::~HttpClient() {
    if (share_) {
        curl_share_cleanup(share_);
        share_ = nullptr;
    }
}

void HttpClient::set_timeout(long ms) {
    timeout_ms_ = ms;
}

HttpResponse HttpClient::get(const std::string& url,
                             const HttpHeaders& headers,
                             long timeout_ms) {
    return perform_request("GET", url, "", headers, timeout_ms, nullptr);
}

HttpResponse HttpClient::post_json(const std::string& url,
                                   const std::string& body,
                                   const HttpHeaders& extra_headers,
                                   long timeout_ms) {
    HttpHeaders headers = extra_headers;
    if (headers.find("Content-Type") == headers.end()) {
        headers["Content-Type"] = "application/json";
    }
    return perform_request("POST", url, body, headers, timeout_ms, nullptr);
}

HttpResponse HttpClient::get_stream(const std::string& url,
                                    const HttpHeaders& headers,
                                    long timeout_ms,
                                    const ChunkCallback& on_chunk) {
    return perform_request("GET", url, "", headers, timeout_ms, &on_chunk);
}

void HttpClient::lock_callback(CURL* handle, curl_lock_data data,
                               curl_lock_access access, void* userptr) {
    (void)handle;
    (void)access;
    HttpClient* self = static_cast<HttpClient*>(userptr);
    self->share_locks_[data].lock();
}

void HttpClient::unlock_callback(CURL* handle, curl_lock_data data, void* userptr) {
    (void)handle;
    HttpClient* self = static_cast<HttpClient*>(userptr);
    self->share_locks_[data].unlock();
}

size_t HttpClient::write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    size_t total = size * nmemb;
    WriteTarget* target = static_cast<WriteTarget*>(userdata);
    target->body->append(ptr, total);

    if (target->on_chunk && !(*target->on_chunk)(std::string(ptr, total))) {
        target->stopped = true;
        return 0;  // aborts the transfer with CURLE_WRITE_ERROR
    }
    return total;
}

size_t HttpClient::header_callback(char* buffer, size_t size, size_t nitems, void* userdata) {
    size_t total = size * nitems;
    HttpHeaders* headers = static_cast<HttpHeaders*>(userdata);

    std::string line(buffer, total);
    while (!line.empty() && (line.back() == '\r' || line.back() == '\n')) {
        line.pop_back();
    }

    size_t colon = line.find(':');
    if (colon != std::string::npos) {
        std::string key = to_lower(line.substr(0, colon));
        (*headers)[key] = trim(line.substr(colon + 1));
    }

    return total;
}

HttpResponse HttpClient::perform_request(const std::string& method,
                                         const std::string& url,
                                         const std::string& body,
                                         const HttpHeaders& headers,
                                         long timeout_ms,
                                         const ChunkCallback* on_chunk) {
    HttpResponse resp;

    CURL* curl = curl_easy_init();
    if (!curl) {
        resp.error = "CURL not initialized";
        return resp;
    }

    long effective_timeout = timeout_ms > 0 ? timeout_ms : timeout_ms_;

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    if (share_) {
        curl_easy_setopt(curl, CURLOPT_SHARE, share_);
    }

    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, effective_timeout);
    long connect_timeout = effective_timeout / 2 < 10000 ? effective_timeout / 2 : 10000;
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, connect_timeout);

    if (method == "POST") {
        curl_easy_setopt(curl, CURLOPT_POST, 1L);
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());
        curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.length()));
    } else if (method != "GET") {
        curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, method.c_str());
    }

    struct curl_slist* header_list = nullptr;
    for (HttpHeaders::const_iterator it = headers.begin(); it != headers.end(); ++it) {
        std::string header = it->first + ": " + it->second;
        header_list = curl_slist_append(header_list, header.c_str());
    }
    if (header_list) {
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list);
    }

    std::string response_body;
    WriteTarget target;
    target.body = &response_body;
    target.on_chunk = on_chunk;
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &target);

    HttpHeaders response_headers;
    curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, header_callback);
    curl_easy_setopt(curl, CURLOPT_HEADERDATA, &response_headers);

    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_MAXREDIRS, 5L);

    CURLcode res = curl_easy_perform(curl);

    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &resp.status_code);
    resp.body = response_body;
    resp.headers = response_headers;

    if (header_list) {
        curl_slist_free_all(header_list);
    }
    curl_easy_cleanup(curl);

    // A callback-requested stop is a normal end of stream
    if (res != CURLE_OK && !(res == CURLE_WRITE_ERROR && target.stopped)) {
        resp.timed_out = (res == CURLE_OPERATION_TIMEDOUT);
        std::ostringstream oss;
        oss << curl_easy_strerror(res);
        if (resp.timed_out) {
            oss << " (after " << effective_timeout << " ms)";
        }
        resp.error = oss.str();
        if (!on_chunk) {
            resp.status_code = 0;
        }
        return resp;
    }

    if (!resp.ok() && resp.error.empty()) {
        std::ostringstream oss;
        oss << "HTTP " << resp.status_code;
        if (!resp.body.empty()) {
            oss << ": " << truncate_safe(resp.body, 512);
            if (resp.body.size() > 512) oss << "...";
        }
        resp.error = oss.str();
    }

    return resp;
}

} // namespace webswarm
