#include <gtest/gtest.h>

#include <mutex>
#include <thread>

#include "blobrelay/crypto/random.hpp"
#include "blobrelay/protocol/wire.hpp"
#include "blobrelay/receiver/reassembler.hpp"
#include "blobrelay/receiver/sweep_timer.hpp"
#include "blobrelay/sender/transfer_sender.hpp"
#include "blobrelay/transport/loopback_transport.hpp"
#include "blobrelay/utils/logging.hpp"

namespace blobrelay {
namespace {

// Sender and receiver wired through in-process transports
class RelayIntegrationTest : public ::testing::Test {
protected:
    void SetUp() override {
        utils::init_logging(utils::LogLevel::WARN);
        ASSERT_TRUE(crypto::init());

        auto deliver = [this](std::span<const uint8_t> message) {
            reassembler.on_message(message);
        };
        broker.subscribe(dispatcher_config.topic, [this, deliver](std::span<const uint8_t> m) {
            ++via_primary;
            deliver(m);
        });
        endpoint.route(dispatcher_config.endpoint, [this, deliver](std::span<const uint8_t> m) {
            {
                std::lock_guard<std::mutex> lock(mutex);
                auto parsed = protocol::parse_message(m);
                if (parsed && std::holds_alternative<protocol::FragmentMessage>(*parsed)) {
                    secondary_indices.push_back(
                        std::get<protocol::FragmentMessage>(*parsed).sequence_index);
                }
            }
            deliver(m);
        });

        reassembler.set_persist_callback(
            [this](const protocol::TransferEnvelope& envelope, const std::vector<uint8_t>& blob) {
                std::lock_guard<std::mutex> lock(mutex);
                persisted.emplace_back(envelope, blob);
                return true;
            });
    }

    static std::vector<uint8_t> make_blob(size_t size) {
        std::vector<uint8_t> blob(size);
        crypto::random_bytes(blob);
        return blob;
    }

    sender::DispatcherConfig dispatcher_config{.max_retries = 2};
    sender::FragmenterConfig fragmenter_config{.fragment_size = 1500,
                                               .max_message_size = 2048,
                                               .encoding = codec::PayloadEncoding::IDENTITY};
    transport::LoopbackBroker broker{{.max_message_size = 2048}};
    transport::LoopbackEndpoint endpoint;
    receiver::Reassembler reassembler;
    sender::TransportDispatcher dispatcher{dispatcher_config, broker, &endpoint,
                                           [](std::chrono::milliseconds) {}};
    sender::TransferSender sender{fragmenter_config, dispatcher};

    std::mutex mutex;
    int via_primary = 0;
    std::vector<uint32_t> secondary_indices;
    std::vector<std::pair<protocol::TransferEnvelope, std::vector<uint8_t>>> persisted;
};

TEST_F(RelayIntegrationTest, BlobArrivesOverPrimary) {
    auto blob = make_blob(10000);
    auto outcome = sender.send_blob(blob, "cam-3", {{"content-type", "image/jpeg"}});

    ASSERT_TRUE(outcome.ok());
    EXPECT_EQ(outcome.fragment_count, 7u);
    EXPECT_TRUE(outcome.fully_acked);
    EXPECT_FALSE(outcome.failed_over);

    EXPECT_EQ(via_primary, 8);
    ASSERT_EQ(persisted.size(), 1u);
    EXPECT_EQ(persisted[0].second, blob);
    EXPECT_EQ(persisted[0].first.source_id, "cam-3");
    EXPECT_EQ(persisted[0].first.attributes.at("content-type"), "image/jpeg");
    EXPECT_EQ(reassembler.status(outcome.transfer_id), receiver::TransferStatus::COMPLETE);
}

TEST_F(RelayIntegrationTest, PrimaryFailureMidTransferFailsOver) {
    // Publish 1 is the envelope, 2..5 carry fragments 0..3
    broker.set_fault_hook([](uint64_t number, std::span<const uint8_t>) {
        return number >= 6 ? transport::PublishStatus::ACK_TIMEOUT
                           : transport::PublishStatus::OK;
    });

    auto blob = make_blob(10000);
    auto outcome = sender.send_blob(blob, "cam-3");

    ASSERT_TRUE(outcome.ok()) << protocol::to_string(outcome.error);
    EXPECT_TRUE(outcome.failed_over);
    EXPECT_EQ(outcome.fragments_sent, 7u);
    EXPECT_EQ(secondary_indices, (std::vector<uint32_t>{4, 5, 6}));
    EXPECT_EQ(dispatcher.stats().failovers, 1u);

    ASSERT_EQ(persisted.size(), 1u);
    EXPECT_EQ(persisted[0].second, blob);
}

TEST_F(RelayIntegrationTest, BothPathsDownAbandonsTransfer) {
    broker.set_fault_hook([](uint64_t number, std::span<const uint8_t>) {
        return number >= 3 ? transport::PublishStatus::FAILED : transport::PublishStatus::OK;
    });
    endpoint.set_fault_hook([](uint64_t) { return 503; });

    auto outcome = sender.send_blob(make_blob(10000), "cam-3");
    EXPECT_EQ(outcome.error, protocol::TransferError::TRANSFER_ABANDONED);
    EXPECT_EQ(outcome.fragments_sent, 1u);
    EXPECT_TRUE(persisted.empty());
    EXPECT_EQ(reassembler.status(outcome.transfer_id), receiver::TransferStatus::COLLECTING);
}

TEST_F(RelayIntegrationTest, ReplayedStreamIsDiscarded) {
    std::vector<std::vector<uint8_t>> wire;
    broker.set_fault_hook([&wire](uint64_t, std::span<const uint8_t> message) {
        wire.emplace_back(message.begin(), message.end());
        return transport::PublishStatus::OK;
    });

    auto outcome = sender.send_blob(make_blob(4000), "cam-3");
    ASSERT_TRUE(outcome.ok());

    for (const auto& message : wire) {
        EXPECT_EQ(reassembler.on_message(message), receiver::IngestResult::DISCARDED);
    }
    EXPECT_EQ(persisted.size(), 1u);
}

TEST_F(RelayIntegrationTest, SweeperExpiresAbandonedTransfers) {
    receiver::Reassembler short_lived({.idle_timeout = std::chrono::milliseconds(20),
                                       .transfer_timeout = std::chrono::milliseconds(1000)});
    receiver::SweepTimer sweeper(short_lived, std::chrono::milliseconds(5));
    ASSERT_TRUE(sweeper.start());
    EXPECT_FALSE(sweeper.start());

    sender::Fragmenter fragmenter(fragmenter_config);
    auto prepared = fragmenter.prepare(make_blob(5000), "cam-3");
    ASSERT_TRUE(prepared.has_value());
    short_lived.on_fragment(*prepared->fragment(0));

    for (int i = 0; i < 200; ++i) {
        if (short_lived.status(prepared->transfer_id()) == receiver::TransferStatus::EXPIRED) {
            break;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    EXPECT_EQ(short_lived.status(prepared->transfer_id()), receiver::TransferStatus::EXPIRED);
    EXPECT_EQ(short_lived.buffered_bytes(), 0u);

    sweeper.stop();
    EXPECT_FALSE(sweeper.running());
    EXPECT_GT(sweeper.sweeps_run(), 0u);
}

}  // namespace
}  // namespace blobrelay
