#ifndef MESHCORE_STORE_REDIS_CONNECTION_H
#define MESHCORE_STORE_REDIS_CONNECTION_H

#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <vector>

struct redisContext;
struct redisReply;

namespace meshcore {

/**
 * @brief Redis server settings ("store.redis" section)
 */
struct RedisConfig {
    std::string host = "127.0.0.1";

    int port = 6379;

    /**
     * @brief Logical database selected after connecting
     */
    int db = 0;

    /**
     * @brief Sent with AUTH when not empty
     */
    std::string password;

    std::chrono::milliseconds connect_timeout{2000};

    /**
     * @brief Socket timeout of a single command round trip
     */
    std::chrono::milliseconds command_timeout{2000};
};

struct RedisReplyDeleter {
    void operator()(redisReply* reply) const;
};

using RedisReplyPtr = std::unique_ptr<redisReply, RedisReplyDeleter>;

/**
 * @brief One hiredis connection with lazy reconnect
 *
 * Not thread-safe: callers serialize access. interrupt() is the only
 * member that may be called concurrently with a blocked readReply().
 *
 * Connection and I/O failures throw MeshException(DEPENDENCY_UNAVAILABLE)
 * and drop the connection; the next command reconnects. A WRONGTYPE error
 * reply throws std::logic_error, any other error reply throws
 * MeshException(DEPENDENCY_UNAVAILABLE).
 */
class RedisConnection {
public:
    /**
     * @param blocking Reads wait forever instead of honouring command_timeout
     *                 (subscriber connections)
     */
    explicit RedisConnection(const RedisConfig& config, bool blocking = false);

    ~RedisConnection();

    RedisConnection(const RedisConnection&) = delete;
    RedisConnection& operator=(const RedisConnection&) = delete;

    void connect();

    void disconnect();

    bool isConnected() const { return context_ != nullptr; }

    /**
     * @brief Send a command and read its reply, connecting first if needed
     */
    RedisReplyPtr command(const std::vector<std::string>& args);

    /**
     * @brief Read the next reply pushed by the server (pub/sub messages)
     */
    RedisReplyPtr readReply();

    /**
     * @brief Shut down the socket so a blocked readReply() returns
     */
    void interrupt();

    const RedisConfig& config() const { return config_; }

private:
    [[noreturn]] void fail(const std::string& what);

    RedisReplyPtr checkReply(RedisReplyPtr reply);

    RedisConfig config_;
    bool blocking_;
    redisContext* context_;
    std::atomic<int> fd_;
};

/**
 * @brief Render "host:port" for log lines
 */
std::string describe(const RedisConfig& config);

} // namespace meshcore

#endif // MESHCORE_STORE_REDIS_CONNECTION_H
