#pragma once

#include "mirror/net/remote_source.hpp"

#include <atomic>
#include <chrono>
#include <mutex>
#include <string>

#include <curl/curl.h>

namespace mirror::net {

struct CurlOptions {
    std::string user_agent;
    std::chrono::seconds timeout{20};                ///< Connect timeout and maximum stall time
    const std::atomic<bool>* abort_flag = nullptr;   ///< Checked at every progress callback
};

/**
 * @brief RemoteSource backed by libcurl easy handles
 *
 * One easy handle per request; DNS results and connections are shared across
 * worker threads through a CURLSH handle guarded by per-data-kind mutexes.
 */
class CurlRemoteSource : public RemoteSource {
public:
    explicit CurlRemoteSource(CurlOptions options);
    ~CurlRemoteSource() override;

    CurlRemoteSource(const CurlRemoteSource&) = delete;
    CurlRemoteSource& operator=(const CurlRemoteSource&) = delete;

    Result<std::string> fetch_text(const std::string& url) override;
    Result<void> stream(const std::string& url, const ChunkSink& sink) override;

private:
    static void lock_share(CURL* handle, curl_lock_data data, curl_lock_access access, void* user);
    static void unlock_share(CURL* handle, curl_lock_data data, void* user);

    std::mutex& mutex_for(curl_lock_data data);

    CurlOptions options_;
    CURLSH* share_ = nullptr;
    std::mutex share_mutex_;
    std::mutex dns_mutex_;
    std::mutex connect_mutex_;
};

} // namespace mirror::net
