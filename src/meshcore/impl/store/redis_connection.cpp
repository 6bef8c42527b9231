#include "store/redis_connection.h"
#include "core/mesh_error.h"
#include "utils/log.h"

#include <hiredis/hiredis.h>

#include <sys/socket.h>
#include <sys/time.h>

#include <cerrno>
#include <stdexcept>

namespace meshcore {

namespace {

timeval toTimeval(std::chrono::milliseconds ms) {
    timeval tv;
    tv.tv_sec = static_cast<time_t>(ms.count() / 1000);
    tv.tv_usec = static_cast<suseconds_t>((ms.count() % 1000) * 1000);
    return tv;
}

} // anonymous namespace

void RedisReplyDeleter::operator()(redisReply* reply) const {
    if (reply) {
        freeReplyObject(reply);
    }
}

std::string describe(const RedisConfig& config) {
    return config.host + ":" + std::to_string(config.port);
}

RedisConnection::RedisConnection(const RedisConfig& config, bool blocking)
    : config_(config)
    , blocking_(blocking)
    , context_(nullptr)
    , fd_(-1) {
}

RedisConnection::~RedisConnection() {
    disconnect();
}

void RedisConnection::connect() {
    disconnect();

    redisContext* context = redisConnectWithTimeout(config_.host.c_str(), config_.port,
                                                    toTimeval(config_.connect_timeout));
    if (!context) {
        throw MeshException(MeshErrorCode::DEPENDENCY_UNAVAILABLE,
                            "cannot allocate redis context for " + describe(config_));
    }
    if (context->err) {
        std::string error = context->errstr;
        redisFree(context);
        throw MeshException(MeshErrorCode::DEPENDENCY_UNAVAILABLE,
                            "cannot connect to redis at " + describe(config_) + ": " + error);
    }

    if (!blocking_ && redisSetTimeout(context, toTimeval(config_.command_timeout)) != REDIS_OK) {
        std::string error = context->errstr;
        redisFree(context);
        throw MeshException(MeshErrorCode::DEPENDENCY_UNAVAILABLE,
                            "cannot set redis command timeout: " + error);
    }

    context_ = context;
    fd_ = context->fd;

    try {
        if (!config_.password.empty()) {
            command({"AUTH", config_.password});
        }
        if (config_.db != 0) {
            command({"SELECT", std::to_string(config_.db)});
        }
    } catch (const MeshException&) {
        disconnect();
        throw;
    }

    LOGD_FMT("Connected to redis at " << describe(config_));
}

void RedisConnection::disconnect() {
    if (context_) {
        fd_ = -1;
        redisFree(context_);
        context_ = nullptr;
    }
}

void RedisConnection::fail(const std::string& what) {
    std::string error = context_ && context_->errstr[0] ? context_->errstr : "connection lost";
    disconnect();
    throw MeshException(MeshErrorCode::DEPENDENCY_UNAVAILABLE,
                        what + " on redis " + describe(config_) + ": " + error);
}

RedisReplyPtr RedisConnection::checkReply(RedisReplyPtr reply) {
    if (reply->type == REDIS_REPLY_ERROR) {
        std::string error(reply->str, reply->len);
        if (error.compare(0, 9, "WRONGTYPE") == 0) {
            throw std::logic_error(error);
        }
        throw MeshException(MeshErrorCode::DEPENDENCY_UNAVAILABLE, "redis error: " + error);
    }
    return reply;
}

RedisReplyPtr RedisConnection::command(const std::vector<std::string>& args) {
    if (!context_) {
        connect();
    }

    std::vector<const char*> argv;
    std::vector<size_t> argvlen;
    argv.reserve(args.size());
    argvlen.reserve(args.size());
    for (const auto& arg : args) {
        argv.push_back(arg.data());
        argvlen.push_back(arg.size());
    }

    void* raw = redisCommandArgv(context_, static_cast<int>(args.size()), argv.data(), argvlen.data());
    if (!raw) {
        fail(args.empty() ? "empty command" : args.front() + " failed");
    }
    return checkReply(RedisReplyPtr(static_cast<redisReply*>(raw)));
}

RedisReplyPtr RedisConnection::readReply() {
    if (!context_) {
        throw MeshException(MeshErrorCode::DEPENDENCY_UNAVAILABLE,
                            "not connected to redis " + describe(config_));
    }

    void* raw = nullptr;
    if (redisGetReply(context_, &raw) != REDIS_OK || !raw) {
        fail("read failed");
    }
    return checkReply(RedisReplyPtr(static_cast<redisReply*>(raw)));
}

void RedisConnection::interrupt() {
    int fd = fd_.load();
    if (fd >= 0 && ::shutdown(fd, SHUT_RDWR) != 0) {
        LOGD_FMT("Redis socket shutdown failed, errno " << errno);
    }
}

} // namespace meshcore
