#include "blobrelay/transport/loopback_transport.hpp"

#include <spdlog/spdlog.h>

namespace blobrelay::transport {

LoopbackBroker::LoopbackBroker(const LoopbackBrokerConfig& config)
    : config_(config) {
}

PublishStatus LoopbackBroker::publish(const std::string& topic,
                                      std::span<const uint8_t> message,
                                      std::chrono::milliseconds /*ack_deadline*/) {
    std::vector<MessageHandler> handlers;
    FaultHook hook;
    uint64_t number = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        number = ++publish_attempts_;
        hook = fault_hook_;
        auto it = subscribers_.find(topic);
        if (it != subscribers_.end()) {
            handlers = it->second;
        }
    }

    if (message.size() > config_.max_message_size) {
        spdlog::debug("Loopback publish of {} bytes exceeds {} byte limit",
                      message.size(), config_.max_message_size);
        return PublishStatus::FAILED;
    }

    if (hook) {
        PublishStatus injected = hook(number, message);
        if (injected != PublishStatus::OK) {
            return injected;
        }
    }

    // Deliver outside the lock so handlers may publish
    for (auto& handler : handlers) {
        handler(message);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    ++messages_delivered_;
    return PublishStatus::OK;
}

void LoopbackBroker::subscribe(const std::string& topic, MessageHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    subscribers_[topic].push_back(std::move(handler));
}

void LoopbackBroker::set_fault_hook(FaultHook hook) {
    std::lock_guard<std::mutex> lock(mutex_);
    fault_hook_ = std::move(hook);
}

uint64_t LoopbackBroker::publish_attempts() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return publish_attempts_;
}

uint64_t LoopbackBroker::messages_delivered() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return messages_delivered_;
}

int LoopbackEndpoint::request(const std::string& endpoint, std::span<const uint8_t> payload) {
    MessageHandler handler;
    FaultHook hook;
    uint64_t number = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        number = ++requests_received_;
        hook = fault_hook_;
        auto it = routes_.find(endpoint);
        if (it != routes_.end()) {
            handler = it->second;
        }
    }

    if (hook) {
        int injected = hook(number);
        if (!is_success_status(injected)) {
            return injected;
        }
    }

    if (!handler) {
        return 404;
    }
    handler(payload);
    return 202;
}

void LoopbackEndpoint::route(const std::string& endpoint, MessageHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    routes_[endpoint] = std::move(handler);
}

void LoopbackEndpoint::set_fault_hook(FaultHook hook) {
    std::lock_guard<std::mutex> lock(mutex_);
    fault_hook_ = std::move(hook);
}

uint64_t LoopbackEndpoint::requests_received() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return requests_received_;
}

}  // namespace blobrelay::transport
