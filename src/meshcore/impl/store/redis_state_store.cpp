#include "store/redis_state_store.h"
#include "core/mesh_error.h"
#include "utils/log.h"

#include <hiredis/hiredis.h>

#include <algorithm>

namespace meshcore {

namespace {

std::optional<std::string> stringReply(const redisReply& reply) {
    if (reply.type == REDIS_REPLY_STRING) {
        return std::string(reply.str, reply.len);
    }
    return std::nullopt;
}

bool integerReply(const redisReply& reply) {
    return reply.type == REDIS_REPLY_INTEGER && reply.integer > 0;
}

} // anonymous namespace

RedisStateStore::RedisStateStore(const RedisConfig& config)
    : connection_(config) {
}

void RedisStateStore::connect() {
    std::lock_guard<std::mutex> lock(mutex_);
    connection_.connect();
    LOGI_FMT("Redis state store connected to " << describe(connection_.config()));
}

std::optional<std::string> RedisStateStore::get(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto reply = connection_.command({"GET", key});
    return stringReply(*reply);
}

void RedisStateStore::set(const std::string& key, const std::string& value,
                          std::optional<std::chrono::milliseconds> ttl) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!ttl) {
        connection_.command({"SET", key, value});
    } else if (ttl->count() > 0) {
        connection_.command({"SET", key, value, "PX", std::to_string(ttl->count())});
    } else {
        // Already expired
        connection_.command({"DEL", key});
    }
}

bool RedisStateStore::remove(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    return integerReply(*connection_.command({"DEL", key}));
}

bool RedisStateStore::expire(const std::string& key, std::chrono::milliseconds ttl) {
    std::lock_guard<std::mutex> lock(mutex_);
    return integerReply(*connection_.command({"PEXPIRE", key, std::to_string(ttl.count())}));
}

bool RedisStateStore::setAdd(const std::string& key, const std::string& member) {
    std::lock_guard<std::mutex> lock(mutex_);
    return integerReply(*connection_.command({"SADD", key, member}));
}

bool RedisStateStore::setRemove(const std::string& key, const std::string& member) {
    std::lock_guard<std::mutex> lock(mutex_);
    return integerReply(*connection_.command({"SREM", key, member}));
}

std::vector<std::string> RedisStateStore::setMembers(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto reply = connection_.command({"SMEMBERS", key});

    std::vector<std::string> members;
    if (reply->type == REDIS_REPLY_ARRAY) {
        members.reserve(reply->elements);
        for (size_t i = 0; i < reply->elements; ++i) {
            if (auto member = stringReply(*reply->element[i])) {
                members.push_back(std::move(*member));
            }
        }
    }
    std::sort(members.begin(), members.end());
    return members;
}

std::optional<std::string> RedisStateStore::atomicUpdate(const std::string& key,
                                                         const UpdateFunction& update) {
    std::lock_guard<std::mutex> lock(mutex_);

    for (int attempt = 1; attempt <= MAX_UPDATE_ATTEMPTS; ++attempt) {
        connection_.command({"WATCH", key});

        std::optional<std::string> current;
        std::optional<std::string> next;
        try {
            current = stringReply(*connection_.command({"GET", key}));
            next = update(current);
        } catch (...) {
            unwatch();
            throw;
        }

        if (!next) {
            unwatch();
            return current;
        }

        connection_.command({"MULTI"});
        if (current) {
            connection_.command({"SET", key, *next, "KEEPTTL"});
        } else {
            connection_.command({"SET", key, *next});
        }
        auto result = connection_.command({"EXEC"});

        // A nil EXEC reply means the key changed after WATCH
        if (result->type != REDIS_REPLY_NIL) {
            return next;
        }
        LOGV_FMT("Concurrent write on " << key << ", retrying update (attempt " << attempt << ")");
    }

    throw MeshException(MeshErrorCode::DEPENDENCY_UNAVAILABLE,
                        "update of " + key + " kept conflicting after " +
                        std::to_string(MAX_UPDATE_ATTEMPTS) + " attempts");
}

void RedisStateStore::unwatch() {
    try {
        connection_.command({"UNWATCH"});
    } catch (const MeshException& e) {
        // The WATCH went away with the connection
        LOGD_FMT("UNWATCH failed: " << e.what());
    }
}

bool RedisStateStore::ping() {
    std::lock_guard<std::mutex> lock(mutex_);
    try {
        auto reply = connection_.command({"PING"});
        return reply->type == REDIS_REPLY_STATUS;
    } catch (const MeshException& e) {
        LOGD_FMT("Redis ping failed: " << e.what());
        return false;
    }
}

} // namespace meshcore
