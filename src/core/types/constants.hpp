#pragma once
#include <chrono>
#include <cstddef>
#include <string>
#include <vector>

namespace Spoor {
namespace Core {

struct Constants {
    static constexpr int         DEFAULT_THREADS = 2;  // IO Threads
    static constexpr int         DEFAULT_WORKERS = 8;  // Coroutines
    static constexpr const char* DEFAULT_OUTPUT  = "output/hosts.json";
    static constexpr const char* VERSION         = "0.1.0";

    static constexpr unsigned DEFAULT_MAX_DEPTH          = 100;
    static constexpr unsigned DEFAULT_MAX_PAGES          = 100;
    static constexpr unsigned DEFAULT_EMPTY_PAGE_LIMIT   = 3;
    static constexpr size_t   DEFAULT_MAX_FRONTIER_ITEMS = 100000;

    static constexpr int         MAX_RETRIES             = 3;
    static constexpr int         BACKOFF_BASE_MS         = 1000;
    static constexpr double      BACKOFF_JITTER          = 0.5;
    static constexpr int         MIN_HOST_INTERVAL_MS    = 2000;
    static constexpr int         REQUEST_TIMEOUT_SECONDS = 30;
    static constexpr int         CONNECT_TIMEOUT_MS      = 5000;
    static constexpr int         MAX_REDIRECTS           = 5;
    static constexpr const char* USER_AGENT              = "Spoor/0.1 (+discovery)";

    static constexpr const char* DEFAULT_FINGERPRINT = "myshopify.com";
    static constexpr size_t      MIN_KEY_LENGTH      = 2;
    static constexpr size_t      MAX_KEY_LENGTH      = 63;
};

inline const std::vector<std::string>& get_reserved_keys() {
    static const std::vector<std::string> reserved = {
        "www", "admin", "cdn", "login", "api", "shop", "store", "app", "mail", "ftp", "test"};
    return reserved;
}

}  // namespace Core
}  // namespace Spoor
