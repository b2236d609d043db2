#include "http.hpp"

#include <curl/curl.h>

using namespace dsum;

struct CurlInit {
    CurlInit() noexcept { curl_global_init(CURL_GLOBAL_ALL); }
    ~CurlInit() noexcept { curl_global_cleanup(); }
};

struct HttpFetcher::Context {
    Transfer const* transfer;
    CURL* handle;
    bool head = false;
    char error[CURL_ERROR_SIZE] = {};
    std::string thrown = {};

    auto on_head() -> void {
        head = true;
        long status = 0;
        curl_easy_getinfo(handle, CURLINFO_RESPONSE_CODE, &status);
        char* content_type = nullptr;
        curl_easy_getinfo(handle, CURLINFO_CONTENT_TYPE, &content_type);
        char* location = nullptr;
        curl_easy_getinfo(handle, CURLINFO_EFFECTIVE_URL, &location);
        transfer->on_head(status, content_type ? content_type : "", location ? location : "");
    }

    static auto recv_data(char* data, size_t size, size_t ncount, void* userdata) noexcept -> size_t {
        auto self = (Context*)userdata;
        try {
            if (!self->head) {
                self->on_head();
            }
            if (self->transfer->on_data({data, size * ncount})) {
                return size * ncount;
            }
        } catch (std::exception const& e) {
            self->thrown = e.what();
        }
        return 0;
    }

    static auto progress(void* userdata, curl_off_t, curl_off_t, curl_off_t, curl_off_t) noexcept -> int {
        auto self = (Context*)userdata;
        auto cancel = self->transfer->cancel;
        return (cancel && *cancel) ? 1 : 0;
    }
};

// Timeouts and dropped connections are worth another attempt, resolver failures are not.
static auto is_transient(CURLcode code) noexcept -> bool {
    switch (code) {
        case CURLE_OPERATION_TIMEDOUT:
        case CURLE_COULDNT_CONNECT:
        case CURLE_RECV_ERROR:
        case CURLE_SEND_ERROR:
        case CURLE_GOT_NOTHING:
        case CURLE_PARTIAL_FILE:
        case CURLE_HTTP2:
        case CURLE_HTTP2_STREAM:
            return true;
        default:
            return false;
    }
}

HttpFetcher::HttpFetcher(Options const& options) : Fetcher(options) { static auto init = CurlInit{}; }

HttpFetcher::~HttpFetcher() noexcept {
    for (auto handle : free_) {
        curl_easy_cleanup(handle);
    }
}

auto HttpFetcher::acquire() -> void* {
    {
        auto lock = std::lock_guard<std::mutex>(mutex_);
        if (!free_.empty()) {
            auto handle = free_.back();
            free_.pop_back();
            return handle;
        }
    }
    auto handle = curl_easy_init();
    dsum_assert(handle);
    return handle;
}

auto HttpFetcher::release(void* handle) noexcept -> void {
    curl_easy_reset(handle);
    auto lock = std::lock_guard<std::mutex>(mutex_);
    free_.push_back(handle);
}

auto HttpFetcher::setup(void* handle, Context& context) const -> void {
    auto const& options = this->options();
    dsum_assert_easy_curl(curl_easy_setopt(handle, CURLOPT_VERBOSE, (options.verbose ? 1L : 0L)));
    dsum_assert_easy_curl(curl_easy_setopt(handle, CURLOPT_NOSIGNAL, 1L));
    dsum_assert_easy_curl(curl_easy_setopt(handle, CURLOPT_ERRORBUFFER, context.error));
    dsum_assert_easy_curl(curl_easy_setopt(handle, CURLOPT_NOPROGRESS, 0L));
    dsum_assert_easy_curl(curl_easy_setopt(handle, CURLOPT_XFERINFOFUNCTION, &Context::progress));
    dsum_assert_easy_curl(curl_easy_setopt(handle, CURLOPT_XFERINFODATA, &context));
    dsum_assert_easy_curl(curl_easy_setopt(handle, CURLOPT_WRITEFUNCTION, &Context::recv_data));
    dsum_assert_easy_curl(curl_easy_setopt(handle, CURLOPT_WRITEDATA, &context));
    dsum_assert_easy_curl(curl_easy_setopt(handle, CURLOPT_FOLLOWLOCATION, 1L));
    dsum_assert_easy_curl(curl_easy_setopt(handle, CURLOPT_MAXREDIRS, (long)options.max_redirects));
    dsum_assert_easy_curl(curl_easy_setopt(handle, CURLOPT_REDIR_PROTOCOLS_STR, "http,https"));
    if (options.timeout) {
        dsum_assert_easy_curl(curl_easy_setopt(handle, CURLOPT_TIMEOUT_MS, (long)options.timeout));
    }
    if (options.connect_timeout) {
        dsum_assert_easy_curl(curl_easy_setopt(handle, CURLOPT_CONNECTTIMEOUT_MS, (long)options.connect_timeout));
    }
    if (options.low_speed_time) {
        dsum_assert_easy_curl(curl_easy_setopt(handle, CURLOPT_LOW_SPEED_LIMIT, (long)options.low_speed_limit));
        dsum_assert_easy_curl(curl_easy_setopt(handle, CURLOPT_LOW_SPEED_TIME, (long)options.low_speed_time));
    }
    if (options.buffer) {
        dsum_assert_easy_curl(curl_easy_setopt(handle, CURLOPT_BUFFERSIZE, options.buffer));
    }
    if (!options.proxy.empty()) {
        dsum_assert_easy_curl(curl_easy_setopt(handle, CURLOPT_PROXY, options.proxy.c_str()));
    }
    if (!options.useragent.empty()) {
        dsum_assert_easy_curl(curl_easy_setopt(handle, CURLOPT_USERAGENT, options.useragent.c_str()));
    }
    if (options.cookiefile != "-") {
        dsum_assert_easy_curl(curl_easy_setopt(handle, CURLOPT_COOKIEFILE, options.cookiefile.c_str()));
    }
    if (!options.cookielist.empty()) {
        dsum_assert_easy_curl(curl_easy_setopt(handle, CURLOPT_COOKIELIST, options.cookielist.c_str()));
    }
}

auto HttpFetcher::transfer(std::string const& url, Transfer const& transfer) -> Outcome {
    struct Lease {
        HttpFetcher* fetcher;
        void* handle;
        ~Lease() noexcept { fetcher->release(handle); }
    } lease = {this, acquire()};

    dsum_trace("url: %s", url.c_str());
    auto context = Context{&transfer, lease.handle};
    setup(lease.handle, context);
    dsum_assert_easy_curl(curl_easy_setopt(lease.handle, CURLOPT_URL, url.c_str()));

    auto const code = curl_easy_perform(lease.handle);
    if (code == CURLE_OK) {
        if (!context.head) {
            context.on_head();
        }
        return {};
    }
    auto reason = std::string(context.error[0] ? context.error : curl_easy_strerror(code));
    switch (code) {
        case CURLE_ABORTED_BY_CALLBACK:
            return {Outcome::Cancelled, std::move(reason)};
        case CURLE_WRITE_ERROR:
            return {Outcome::Aborted, context.thrown.empty() ? std::move(reason) : std::move(context.thrown)};
        default:
            return {Outcome::Error, std::move(reason), is_transient(code)};
    }
}
