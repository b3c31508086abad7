#include "blobrelay/transport/transport.hpp"

namespace blobrelay::transport {

const char* publish_status_to_string(PublishStatus status) {
    switch (status) {
        case PublishStatus::OK: return "ok";
        case PublishStatus::FAILED: return "failed";
        case PublishStatus::ACK_TIMEOUT: return "ack timeout";
    }
    return "unknown";
}

}  // namespace blobrelay::transport
