#include "mirror/net/curl_remote_source.hpp"

#include <spdlog/spdlog.h>

#include <optional>

namespace mirror::net {
namespace {

std::once_flag g_curl_init_flag;

class CurlEasy {
public:
    CurlEasy() : handle_(curl_easy_init()) {}
    ~CurlEasy() {
        if (handle_) {
            curl_easy_cleanup(handle_);
        }
    }

    CurlEasy(const CurlEasy&) = delete;
    CurlEasy& operator=(const CurlEasy&) = delete;

    CURL* get() const { return handle_; }
    explicit operator bool() const { return handle_ != nullptr; }

private:
    CURL* handle_;
};

struct TransferState {
    const ChunkSink* sink = nullptr;
    const std::atomic<bool>* abort_flag = nullptr;
    std::optional<Error> sink_error;
};

size_t on_write(char* data, size_t size, size_t count, void* user) {
    auto* state = static_cast<TransferState*>(user);
    const size_t bytes = size * count;
    auto result = (*state->sink)(data, bytes);
    if (result.is_error()) {
        state->sink_error = result.error();
        return 0;
    }
    return bytes;
}

int on_progress(void* user, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    const auto* state = static_cast<const TransferState*>(user);
    if (state->abort_flag != nullptr && state->abort_flag->load()) {
        return 1;
    }
    return 0;
}

} // namespace

CurlRemoteSource::CurlRemoteSource(CurlOptions options) : options_(std::move(options)) {
    std::call_once(g_curl_init_flag, []() {
        curl_global_init(CURL_GLOBAL_DEFAULT);
    });

    share_ = curl_share_init();
    if (share_ != nullptr) {
        curl_share_setopt(share_, CURLSHOPT_LOCKFUNC, &CurlRemoteSource::lock_share);
        curl_share_setopt(share_, CURLSHOPT_UNLOCKFUNC, &CurlRemoteSource::unlock_share);
        curl_share_setopt(share_, CURLSHOPT_USERDATA, this);
        curl_share_setopt(share_, CURLSHOPT_SHARE, CURL_LOCK_DATA_DNS);
        curl_share_setopt(share_, CURLSHOPT_SHARE, CURL_LOCK_DATA_CONNECT);
    } else {
        spdlog::warn("curl_share_init failed; connections will not be reused");
    }
}

CurlRemoteSource::~CurlRemoteSource() {
    if (share_ != nullptr) {
        curl_share_cleanup(share_);
    }
}

Result<std::string> CurlRemoteSource::fetch_text(const std::string& url) {
    std::string body;
    auto result = stream(url, [&body](const char* data, std::size_t size) -> Result<void> {
        body.append(data, size);
        return Ok();
    });
    if (result.is_error()) {
        return Err<std::string>(result.error());
    }
    return Ok(std::move(body));
}

Result<void> CurlRemoteSource::stream(const std::string& url, const ChunkSink& sink) {
    CurlEasy easy;
    if (!easy) {
        return Err<void>(ErrorKind::Transfer, "curl_easy_init failed for " + url);
    }

    TransferState state;
    state.sink = &sink;
    state.abort_flag = options_.abort_flag;

    char error_buffer[CURL_ERROR_SIZE] = {0};
    const long timeout = static_cast<long>(options_.timeout.count());

    CURL* handle = easy.get();
    curl_easy_setopt(handle, CURLOPT_URL, url.c_str());
    curl_easy_setopt(handle, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(handle, CURLOPT_FAILONERROR, 1L);
    curl_easy_setopt(handle, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(handle, CURLOPT_ERRORBUFFER, error_buffer);
    curl_easy_setopt(handle, CURLOPT_CONNECTTIMEOUT, timeout);
    // Stall timeout: abort when fewer than 1 byte/s arrives for `timeout` seconds
    curl_easy_setopt(handle, CURLOPT_LOW_SPEED_LIMIT, 1L);
    curl_easy_setopt(handle, CURLOPT_LOW_SPEED_TIME, timeout);
    curl_easy_setopt(handle, CURLOPT_WRITEFUNCTION, &on_write);
    curl_easy_setopt(handle, CURLOPT_WRITEDATA, &state);
    curl_easy_setopt(handle, CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(handle, CURLOPT_XFERINFOFUNCTION, &on_progress);
    curl_easy_setopt(handle, CURLOPT_XFERINFODATA, &state);
    if (!options_.user_agent.empty()) {
        curl_easy_setopt(handle, CURLOPT_USERAGENT, options_.user_agent.c_str());
    }
    if (share_ != nullptr) {
        curl_easy_setopt(handle, CURLOPT_SHARE, share_);
    }

    const CURLcode code = curl_easy_perform(handle);
    if (code == CURLE_OK) {
        return Ok();
    }

    if (state.sink_error) {
        return Err<void>(*state.sink_error);
    }

    if (code == CURLE_ABORTED_BY_CALLBACK) {
        return Err<void>(ErrorKind::Cancelled, "transfer aborted: " + url);
    }

    if (code == CURLE_HTTP_RETURNED_ERROR) {
        long status = 0;
        curl_easy_getinfo(handle, CURLINFO_RESPONSE_CODE, &status);
        return Err<void>(ErrorKind::Transfer, "HTTP " + std::to_string(status) + " for " + url);
    }

    if (code == CURLE_OPERATION_TIMEDOUT) {
        return Err<void>(ErrorKind::Transfer, "timed out after " + std::to_string(timeout) + "s: " + url);
    }

    std::string detail = error_buffer[0] != '\0' ? std::string(error_buffer) : std::string(curl_easy_strerror(code));
    return Err<void>(ErrorKind::Transfer, detail + " (" + url + ")");
}

std::mutex& CurlRemoteSource::mutex_for(curl_lock_data data) {
    switch (data) {
        case CURL_LOCK_DATA_DNS: return dns_mutex_;
        case CURL_LOCK_DATA_CONNECT: return connect_mutex_;
        default: return share_mutex_;
    }
}

void CurlRemoteSource::lock_share(CURL*, curl_lock_data data, curl_lock_access, void* user) {
    static_cast<CurlRemoteSource*>(user)->mutex_for(data).lock();
}

void CurlRemoteSource::unlock_share(CURL*, curl_lock_data data, void* user) {
    static_cast<CurlRemoteSource*>(user)->mutex_for(data).unlock();
}

} // namespace mirror::net
