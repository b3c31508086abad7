#include "blobrelay/protocol/message.hpp"

#include <type_traits>

namespace blobrelay::protocol {

MessageType get_message_type(const Message& message) {
    return std::visit([](const auto& m) -> MessageType {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, EnvelopeMessage>) {
            return MessageType::ENVELOPE;
        } else {
            return MessageType::FRAGMENT;
        }
    }, message);
}

const std::string& message_transfer_id(const Message& message) {
    return std::visit([](const auto& m) -> const std::string& {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, EnvelopeMessage>) {
            return m.envelope.transfer_id;
        } else {
            return m.transfer_id;
        }
    }, message);
}

uint64_t fragment_count_for(uint64_t total_size, uint32_t fragment_size) {
    if (fragment_size == 0) {
        return 0;
    }
    return (total_size + fragment_size - 1) / fragment_size;
}

}  // namespace blobrelay::protocol
