#include "core/redis_message_bus.h"
#include "core/event_codec.h"
#include "core/mesh_error.h"
#include "utils/log.h"

#include <hiredis/hiredis.h>

#include <chrono>
#include <stdexcept>

namespace meshcore {

namespace {
constexpr std::chrono::seconds RECONNECT_DELAY{1};
}

RedisMessageBus::RedisMessageBus(const RedisConfig& config, std::shared_ptr<EventDispatcher> local,
                                 std::string channelPattern)
    : local_(std::move(local))
    , channelPattern_(std::move(channelPattern))
    , publisher_(config)
    , subscriber_(config, true)
    , running_(false)
    , received_(0) {
    if (!local_) {
        throw std::invalid_argument("RedisMessageBus requires a local dispatcher");
    }
}

RedisMessageBus::~RedisMessageBus() {
    stop();
}

void RedisMessageBus::start() {
    if (running_) {
        return;
    }

    subscribeOnServer();
    {
        std::lock_guard<std::mutex> lock(publishMutex_);
        publisher_.connect();
    }

    running_ = true;
    readerThread_ = std::thread(&RedisMessageBus::readLoop, this);
    LOGI_FMT("Redis message bus subscribed to '" << channelPattern_ << "' on "
             << describe(subscriber_.config()));
}

void RedisMessageBus::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    waitCv_.notify_all();
    subscriber_.interrupt();
    if (readerThread_.joinable()) {
        readerThread_.join();
    }
    subscriber_.disconnect();

    std::lock_guard<std::mutex> lock(publishMutex_);
    publisher_.disconnect();
    LOGD("Redis message bus stopped");
}

bool RedisMessageBus::publish(const Event& event) {
    std::string payload = encodeEvent(event);

    std::lock_guard<std::mutex> lock(publishMutex_);
    try {
        publisher_.command({"PUBLISH", event.getTopic(), payload});
        return true;
    } catch (const MeshException& e) {
        LOGW_FMT("Failed to publish " << event.getTopic() << ": " << e.what());
        return false;
    }
}

SubscriptionId RedisMessageBus::subscribe(const std::string& pattern,
                                          std::shared_ptr<IEventListener> listener,
                                          bool synchronous) {
    return local_->subscribe(pattern, std::move(listener), synchronous);
}

bool RedisMessageBus::unsubscribe(SubscriptionId id) {
    return local_->unsubscribe(id);
}

void RedisMessageBus::subscribeOnServer() {
    subscriber_.connect();
    subscriber_.command({"PSUBSCRIBE", channelPattern_});
}

void RedisMessageBus::readLoop() {
    while (running_) {
        try {
            if (!subscriber_.isConnected()) {
                subscribeOnServer();
                LOGI_FMT("Redis message bus resubscribed to '" << channelPattern_ << "'");
                if (!running_) {
                    break;
                }
            }
            auto reply = subscriber_.readReply();
            handleReply(*reply);

        } catch (const MeshException& e) {
            subscriber_.disconnect();
            if (!running_) {
                break;
            }
            LOGW_FMT("Redis message bus connection lost: " << e.what()
                     << ", reconnecting in " << RECONNECT_DELAY.count() << "s");

            std::unique_lock<std::mutex> lock(waitMutex_);
            waitCv_.wait_for(lock, RECONNECT_DELAY, [this]() { return !running_; });
        }
    }
}

void RedisMessageBus::handleReply(const redisReply& reply) {
    // pmessage replies are [ "pmessage", pattern, channel, payload ]
    if (reply.type != REDIS_REPLY_ARRAY || reply.elements != 4) {
        return;
    }
    const redisReply* kind = reply.element[0];
    const redisReply* payload = reply.element[3];
    if (kind->type != REDIS_REPLY_STRING || std::string(kind->str, kind->len) != "pmessage" ||
        payload->type != REDIS_REPLY_STRING) {
        return;
    }

    auto event = decodeEvent(std::string(payload->str, payload->len));
    if (!event) {
        return;
    }
    ++received_;
    if (!local_->publish(*event)) {
        LOGD_FMT("Local dispatcher rejected " << event->getTopic());
    }
}

} // namespace meshcore
