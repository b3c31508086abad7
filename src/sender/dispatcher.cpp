#include "blobrelay/sender/dispatcher.hpp"

#include <algorithm>
#include <cmath>
#include <spdlog/spdlog.h>

#include "blobrelay/protocol/wire.hpp"

namespace blobrelay::sender {

const char* delivery_result_to_string(DeliveryResult result) {
    switch (result) {
        case DeliveryResult::ACKED: return "acked";
        case DeliveryResult::SENT_UNCONFIRMED: return "sent unconfirmed";
        case DeliveryResult::FAILED: return "failed";
    }
    return "unknown";
}

const char* transport_path_to_string(TransportPath path) {
    switch (path) {
        case TransportPath::PRIMARY: return "primary";
        case TransportPath::SECONDARY: return "secondary";
    }
    return "unknown";
}

TransportDispatcher::TransportDispatcher(const DispatcherConfig& config,
                                         transport::PrimaryTransport& primary,
                                         transport::SecondaryTransport* secondary,
                                         utils::SleepFn sleep)
    : config_(config),
      primary_(primary),
      secondary_(secondary),
      sleep_(std::move(sleep)) {
}

void TransportDispatcher::begin_transfer() {
    path_ = TransportPath::PRIMARY;
}

bool TransportDispatcher::path_supports_ack() const {
    // A 2xx response is itself the acknowledgment
    return path_ == TransportPath::SECONDARY || primary_.supports_ack();
}

std::chrono::milliseconds TransportDispatcher::backoff_for(uint32_t retry) const {
    const double base = static_cast<double>(config_.initial_backoff.count());
    const double scaled = base * std::pow(config_.backoff_factor, static_cast<double>(retry));
    const double capped = std::min(scaled, static_cast<double>(config_.max_backoff.count()));
    return std::chrono::milliseconds(static_cast<int64_t>(capped));
}

DeliveryResult TransportDispatcher::send(const protocol::Message& message) {
    auto bytes = protocol::serialize_message(message);
    if (bytes.empty()) {
        spdlog::error("Failed to serialize message for transfer {}",
                      protocol::message_transfer_id(message));
        return record(DeliveryResult::FAILED);
    }
    return send_bytes(bytes);
}

DeliveryResult TransportDispatcher::send_bytes(std::span<const uint8_t> bytes) {
    DeliveryResult result = DeliveryResult::FAILED;

    if (path_ == TransportPath::PRIMARY) {
        if (try_primary(bytes, result)) {
            return record(result);
        }
        if (secondary_ == nullptr) {
            spdlog::error("Primary transport exhausted {} retries and no fallback is configured",
                          config_.max_retries);
            return record(DeliveryResult::FAILED);
        }
        spdlog::warn("Primary transport exhausted {} retries, failing over to {}",
                     config_.max_retries, secondary_->name());
        path_ = TransportPath::SECONDARY;
        ++stats_.failovers;
    }

    if (try_secondary(bytes, result)) {
        return record(result);
    }
    spdlog::error("Secondary transport exhausted {} retries", config_.max_retries);
    return record(DeliveryResult::FAILED);
}

bool TransportDispatcher::try_primary(std::span<const uint8_t> bytes, DeliveryResult& result) {
    for (uint32_t attempt = 0; attempt <= config_.max_retries; ++attempt) {
        if (attempt > 0) {
            ++stats_.retries;
            sleep_(backoff_for(attempt - 1));
        }
        ++stats_.attempts;

        auto status = primary_.publish(config_.topic, bytes, config_.ack_deadline);
        if (status == transport::PublishStatus::OK) {
            result = primary_.supports_ack() ? DeliveryResult::ACKED
                                             : DeliveryResult::SENT_UNCONFIRMED;
            return true;
        }
        spdlog::debug("Publish attempt {} on {} failed: {}", attempt + 1, primary_.name(),
                      transport::publish_status_to_string(status));
    }
    return false;
}

bool TransportDispatcher::try_secondary(std::span<const uint8_t> bytes, DeliveryResult& result) {
    for (uint32_t attempt = 0; attempt <= config_.max_retries; ++attempt) {
        if (attempt > 0) {
            ++stats_.retries;
            sleep_(backoff_for(attempt - 1));
        }
        ++stats_.attempts;

        int status_code = secondary_->request(config_.endpoint, bytes);
        if (transport::is_success_status(status_code)) {
            result = DeliveryResult::ACKED;
            return true;
        }
        spdlog::debug("Request attempt {} on {} failed with status {}", attempt + 1,
                      secondary_->name(), status_code);
    }
    return false;
}

DeliveryResult TransportDispatcher::record(DeliveryResult result) {
    switch (result) {
        case DeliveryResult::ACKED: ++stats_.acked; break;
        case DeliveryResult::SENT_UNCONFIRMED: ++stats_.unconfirmed; break;
        case DeliveryResult::FAILED: ++stats_.failed; break;
    }
    return result;
}

}  // namespace blobrelay::sender
