#ifndef DOCGATE_CORE_HTTP_CLIENT_HPP
#define DOCGATE_CORE_HTTP_CLIENT_HPP

#include <string>
#include <map>
#include <atomic>

namespace docgate {

typedef std::map<std::string, std::string> HttpHeaders;

// Per-request knobs
struct HttpRequestOptions {
    long timeout_ms;
    size_t max_body_bytes;                 // 0 = unlimited
    const std::atomic<bool>* cancelled;    // polled during the transfer, may be NULL

    HttpRequestOptions() : timeout_ms(10000), max_body_bytes(0), cancelled(NULL) {}
};

// HTTP response structure. Header names are stored lower-case.
struct HttpResponse {
    long status_code;
    std::string body;
    HttpHeaders headers;
    std::string error;          // transport-level failure, empty on success
    std::string redirect_url;   // target of a 3xx, never followed by the transport
    bool timed_out;
    bool cancelled;
    bool too_large;

    HttpResponse()
        : status_code(0), timed_out(false), cancelled(false), too_large(false) {}

    bool ok() const { return error.empty() && status_code >= 200 && status_code < 300; }
    bool is_redirect() const {
        return error.empty() && status_code >= 300 && status_code < 400 && !redirect_url.empty();
    }

    std::string header(const std::string& name) const;
    std::string content_type() const { return header("content-type"); }
};

// Seam between the fetch pipeline and the network
class HttpTransport {
public:
    virtual ~HttpTransport() {}

    virtual HttpResponse get(const std::string& url,
                             const HttpHeaders& headers,
                             const HttpRequestOptions& options) = 0;
};

// libcurl transport. Redirects are reported, not followed, so the caller
// can vet every hop. Each request uses its own easy handle, which makes a
// single instance safe to share between worker threads.
class HttpClient : public HttpTransport {
public:
    HttpClient();
    virtual ~HttpClient();

    void set_user_agent(const std::string& ua) { user_agent_ = ua; }

    virtual HttpResponse get(const std::string& url,
                             const HttpHeaders& headers,
                             const HttpRequestOptions& options);

private:
    std::string user_agent_;
};

} // namespace docgate

#endif // DOCGATE_CORE_HTTP_CLIENT_HPP
