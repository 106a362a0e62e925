#ifndef CONFIG_HPP
#define CONFIG_HPP

#include <cstddef>
#include <cstdint>
#include <string>

constexpr int BUFFER_SIZE = 16384;
constexpr int MAX_EVENTS = 64;

constexpr uint32_t MAX_FRAME_PAYLOAD = 1 << 20;
constexpr int FRAME_STALL_TIMEOUT_MS = 10000;
constexpr uint32_t INITIAL_WINDOW = 256 * 1024;

constexpr size_t LINK_HIGH_WATERMARK = 1 << 20;
constexpr size_t LINK_LOW_WATERMARK = 256 * 1024;

constexpr size_t MAX_REQUEST_HEAD = 64 * 1024;
constexpr int CLIENT_LINGER_MS = 2000;

constexpr int LINK_CONNECT_TIMEOUT_MS = 5000;
constexpr int RECONNECT_INITIAL_BACKOFF_MS = 250;
constexpr int RECONNECT_MAX_BACKOFF_MS = 8000;
constexpr int RECONNECT_ATTEMPTS = 10;

constexpr int TARGET_CONNECT_TIMEOUT_MS = 10000;
constexpr int RESPONSE_IDLE_TIMEOUT_MS = 60000;
constexpr int RESOLVER_THREADS = 4;

struct ShipOptions
{
    std::string listen_host = "0.0.0.0";
    uint16_t listen_port = 8080;
    std::string offshore_host = "127.0.0.1";
    uint16_t offshore_port = 9000;
    int reconnect_attempts = RECONNECT_ATTEMPTS; // 0 = retry forever
    int reconnect_initial_backoff_ms = RECONNECT_INITIAL_BACKOFF_MS;
    int reconnect_max_backoff_ms = RECONNECT_MAX_BACKOFF_MS;
    int link_connect_timeout_ms = LINK_CONNECT_TIMEOUT_MS;
    int open_timeout_ms = TARGET_CONNECT_TIMEOUT_MS + LINK_CONNECT_TIMEOUT_MS;
    int frame_stall_timeout_ms = FRAME_STALL_TIMEOUT_MS;
};

struct OffshoreOptions
{
    std::string listen_host = "0.0.0.0";
    uint16_t listen_port = 9000;
    int connect_timeout_ms = TARGET_CONNECT_TIMEOUT_MS;
    int response_idle_timeout_ms = RESPONSE_IDLE_TIMEOUT_MS;
    int resolver_threads = RESOLVER_THREADS;
    int frame_stall_timeout_ms = FRAME_STALL_TIMEOUT_MS;
};

#endif
