#ifndef MESHCORE_CORE_REDIS_MESSAGE_BUS_H
#define MESHCORE_CORE_REDIS_MESSAGE_BUS_H

#include "core/event_dispatcher.h"
#include "store/redis_connection.h"

#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace meshcore {

/**
 * @brief IMessageBus over Redis pub/sub
 *
 * publish() sends the JSON-encoded event with PUBLISH on a channel named
 * after its topic. A reader thread holds a PSUBSCRIBE on the channel
 * pattern and hands every received event to a local EventDispatcher, which
 * owns the subscriptions. A process therefore receives its own events back
 * through the server, in the order the server relays them.
 *
 * The reader reconnects and resubscribes after a connection loss; events
 * published while it is disconnected are lost, as with any Redis pub/sub
 * client.
 */
class RedisMessageBus : public IMessageBus {
public:
    /**
     * @param local Dispatcher that delivers received events; started by the caller
     * @param channelPattern Redis glob matching every mesh topic
     */
    RedisMessageBus(const RedisConfig& config, std::shared_ptr<EventDispatcher> local,
                    std::string channelPattern = "mesh.*");

    ~RedisMessageBus() override;

    RedisMessageBus(const RedisMessageBus&) = delete;
    RedisMessageBus& operator=(const RedisMessageBus&) = delete;

    /**
     * @brief Subscribe on the server and start the reader thread
     * @throws MeshException(DEPENDENCY_UNAVAILABLE) if the server is unreachable
     */
    void start();

    void stop();

    bool isRunning() const { return running_; }

    bool publish(const Event& event) override;

    SubscriptionId subscribe(const std::string& pattern,
                             std::shared_ptr<IEventListener> listener,
                             bool synchronous = false) override;

    bool unsubscribe(SubscriptionId id) override;

    /**
     * @brief Events received from the server and handed to the dispatcher
     */
    uint64_t getReceivedCount() const { return received_; }

private:
    void subscribeOnServer();

    void readLoop();

    void handleReply(const redisReply& reply);

    std::shared_ptr<EventDispatcher> local_;
    std::string channelPattern_;

    std::mutex publishMutex_;
    RedisConnection publisher_;
    RedisConnection subscriber_;

    std::atomic<bool> running_;
    std::atomic<uint64_t> received_;
    std::mutex waitMutex_;
    std::condition_variable waitCv_;
    std::thread readerThread_;
};

} // namespace meshcore

#endif // MESHCORE_CORE_REDIS_MESSAGE_BUS_H
