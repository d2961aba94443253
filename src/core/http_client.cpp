#include <docgate/core/http_client.hpp>
#include <docgate/core/logger.hpp>
#include <docgate/core/utils.hpp>
#include <curl/curl.h>
#include <sstream>

namespace docgate {

namespace {

struct TransferState {
    std::string body;
    size_t max_body_bytes;
    bool too_large;
    const std::atomic<bool>* cancelled;

    TransferState() : max_body_bytes(0), too_large(false), cancelled(NULL) {}
};

// Owns one easy handle and the header list for the duration of a request
class CurlRequest {
public:
    CurlRequest() : curl_(curl_easy_init()), header_list_(NULL) {}
    ~CurlRequest() {
        if (header_list_) curl_slist_free_all(header_list_);
        if (curl_) curl_easy_cleanup(curl_);
    }

    CURL* handle() const { return curl_; }

    void add_header(const std::string& line) {
        header_list_ = curl_slist_append(header_list_, line.c_str());
    }
    curl_slist* headers() const { return header_list_; }

private:
    CurlRequest(const CurlRequest&);
    CurlRequest& operator=(const CurlRequest&);

    CURL* curl_;
    curl_slist* header_list_;
};

size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    size_t total = size * nmemb;
    TransferState* state = static_cast<TransferState*>(userdata);
    if (state->max_body_bytes > 0 && state->body.size() + total > state->max_body_bytes) {
        state->too_large = true;
        return 0;  // aborts the transfer with CURLE_WRITE_ERROR
    }
    state->body.append(ptr, total);
    return total;
}

size_t header_callback(char* buffer, size_t size, size_t nitems, void* userdata) {
    size_t total = size * nitems;
    HttpHeaders* headers = static_cast<HttpHeaders*>(userdata);

    std::string line = rtrim(std::string(buffer, total));

    // A new status line starts a fresh header block (e.g. after 100 Continue)
    if (starts_with(line, "HTTP/")) {
        headers->clear();
        return total;
    }

    size_t colon = line.find(':');
    if (colon != std::string::npos) {
        std::string key = to_lower(trim(line.substr(0, colon)));
        (*headers)[key] = trim(line.substr(colon + 1));
    }

    return total;
}

int progress_callback(void* userdata, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    const TransferState* state = static_cast<const TransferState*>(userdata);
    if (state->cancelled && state->cancelled->load()) {
        return 1;  // CURLE_ABORTED_BY_CALLBACK
    }
    return 0;
}

} // namespace

std::string HttpResponse::header(const std::string& name) const {
    HttpHeaders::const_iterator it = headers.find(to_lower(name));
    return it != headers.end() ? it->second : std::string();
}

HttpClient::HttpClient() : user_agent_("docgate/1.0") {}

HttpClient::~HttpClient() {}

HttpResponse HttpClient::get(const std::string& url,
                             const HttpHeaders& headers,
                             const HttpRequestOptions& options) {
    HttpResponse resp;

    CurlRequest req;
    CURL* curl = req.handle();
    if (!curl) {
        resp.error = "CURL not initialized";
        return resp;
    }

    TransferState state;
    state.max_body_bytes = options.max_body_bytes;
    state.cancelled = options.cancelled;

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, options.timeout_ms);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, options.timeout_ms / 2);

    curl_easy_setopt(curl, CURLOPT_USERAGENT, user_agent_.c_str());
    for (HttpHeaders::const_iterator it = headers.begin(); it != headers.end(); ++it) {
        req.add_header(it->first + ": " + it->second);
    }
    if (req.headers()) {
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, req.headers());
    }

    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &state);
    curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, header_callback);
    curl_easy_setopt(curl, CURLOPT_HEADERDATA, &resp.headers);

    curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, progress_callback);
    curl_easy_setopt(curl, CURLOPT_XFERINFODATA, &state);

    // Redirects are surfaced through redirect_url instead
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 0L);

    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 1L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, 2L);

    LOG_DEBUG("HTTP GET %s (timeout=%ldms)", url.c_str(), options.timeout_ms);

    CURLcode res = curl_easy_perform(curl);

    if (res != CURLE_OK) {
        resp.timed_out = (res == CURLE_OPERATION_TIMEDOUT);
        resp.cancelled = (res == CURLE_ABORTED_BY_CALLBACK);
        resp.too_large = state.too_large;
        if (resp.too_large) {
            std::ostringstream oss;
            oss << "response exceeds " << options.max_body_bytes << " bytes";
            resp.error = oss.str();
        } else if (resp.cancelled) {
            resp.error = "request cancelled";
        } else {
            resp.error = curl_easy_strerror(res);
        }
        return resp;
    }

    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &resp.status_code);

    char* location = NULL;
    if (curl_easy_getinfo(curl, CURLINFO_REDIRECT_URL, &location) == CURLE_OK && location) {
        resp.redirect_url = location;
    }

    resp.body.swap(state.body);
    return resp;
}

} // namespace docgate
