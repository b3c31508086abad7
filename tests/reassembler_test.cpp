#include <gtest/gtest.h>

#include <algorithm>
#include <condition_variable>
#include <mutex>
#include <random>
#include <stdexcept>
#include <thread>

#include "blobrelay/crypto/random.hpp"
#include "blobrelay/protocol/wire.hpp"
#include "blobrelay/receiver/reassembler.hpp"
#include "blobrelay/sender/fragmenter.hpp"

namespace blobrelay::receiver {
namespace {

using protocol::TransferError;
using std::chrono::milliseconds;

// Clock reads made by the current thread once it arms counting; -1 means not counting
thread_local int clock_reads = -1;

class ReassemblerTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(crypto::init());
        reset();
    }

    void reset(utils::NowFn now_fn = nullptr) {
        reassembler = std::make_unique<Reassembler>(
            config, now_fn ? std::move(now_fn) : clock.as_now_fn());
        reassembler->set_persist_callback(
            [this](const protocol::TransferEnvelope& envelope, const std::vector<uint8_t>& blob) {
                std::lock_guard<std::mutex> lock(mutex);
                persisted.emplace_back(envelope, blob);
                return persist_result;
            });
        reassembler->set_outcome_callback([this](const TransferOutcome& outcome) {
            std::lock_guard<std::mutex> lock(mutex);
            outcomes.push_back(outcome);
        });
    }

    static std::vector<uint8_t> make_blob(size_t size) {
        std::vector<uint8_t> blob(size);
        crypto::random_bytes(blob);
        return blob;
    }

    static sender::PreparedTransfer prepare(
        const std::vector<uint8_t>& blob, uint32_t fragment_size,
        codec::PayloadEncoding encoding = codec::PayloadEncoding::BASE64,
        const protocol::Attributes& attributes = {}) {
        sender::Fragmenter fragmenter({.fragment_size = fragment_size,
                                       .max_message_size = 4096,
                                       .encoding = encoding});
        auto prepared = fragmenter.prepare(blob, "src-1", attributes);
        if (!prepared) {
            throw std::runtime_error("prepare failed");
        }
        return *prepared;
    }

    IngestResult deliver(const protocol::Message& message) {
        return reassembler->on_message(protocol::serialize_message(message));
    }

    IngestResult deliver_envelope(const sender::PreparedTransfer& transfer) {
        return deliver(transfer.envelope_message());
    }

    IngestResult deliver_fragment(const sender::PreparedTransfer& transfer, uint32_t index) {
        return deliver(*transfer.fragment(index));
    }

    ReassemblerConfig config{
        .idle_timeout = milliseconds(1000),
        .transfer_timeout = milliseconds(10000),
        .grace_window = milliseconds(5000),
        .max_transfer_size = 1024 * 1024,
        .max_transfers = 64
    };
    utils::ManualClock clock;
    std::unique_ptr<Reassembler> reassembler;

    std::mutex mutex;
    bool persist_result = true;
    std::vector<std::pair<protocol::TransferEnvelope, std::vector<uint8_t>>> persisted;
    std::vector<TransferOutcome> outcomes;
};

TEST_F(ReassemblerTest, InOrderDeliveryCompletes) {
    auto blob = make_blob(3000);
    auto transfer = prepare(blob, 1000);
    ASSERT_EQ(transfer.fragment_count(), 4u);

    EXPECT_EQ(deliver_envelope(transfer), IngestResult::ACCEPTED);
    for (uint32_t i = 0; i + 1 < transfer.fragment_count(); ++i) {
        EXPECT_EQ(deliver_fragment(transfer, i), IngestResult::ACCEPTED);
    }
    EXPECT_EQ(deliver_fragment(transfer, 3), IngestResult::COMPLETED);

    ASSERT_EQ(persisted.size(), 1u);
    EXPECT_EQ(persisted[0].first, transfer.envelope());
    EXPECT_EQ(persisted[0].second, blob);
    EXPECT_EQ(reassembler->status(transfer.transfer_id()), TransferStatus::COMPLETE);
    EXPECT_EQ(reassembler->buffered_bytes(), 0u);

    ASSERT_EQ(outcomes.size(), 1u);
    EXPECT_EQ(outcomes[0].status, TransferStatus::COMPLETE);
    EXPECT_EQ(outcomes[0].reason, TransferError::NONE);
    EXPECT_EQ(outcomes[0].blob_size, blob.size());
}

TEST_F(ReassemblerTest, AnyPermutationWithDuplicatesYieldsBlobOnce) {
    auto blob = make_blob(5000);
    auto transfer = prepare(blob, 700);
    const uint32_t count = transfer.fragment_count();

    std::mt19937 rng(1234);
    for (int round = 0; round < 20; ++round) {
        persisted.clear();
        outcomes.clear();
        transfer = prepare(blob, 700);

        // Every fragment at least once, some twice, envelope anywhere
        std::vector<int64_t> order;
        for (uint32_t i = 0; i < count; ++i) {
            order.push_back(i);
            if (rng() % 3 == 0) {
                order.push_back(i);
            }
        }
        order.push_back(-1);
        order.push_back(-1);
        std::shuffle(order.begin(), order.end(), rng);

        int completed = 0;
        for (auto item : order) {
            auto result = item < 0 ? deliver_envelope(transfer)
                                   : deliver_fragment(transfer, static_cast<uint32_t>(item));
            EXPECT_NE(result, IngestResult::FAILED) << "round " << round;
            EXPECT_NE(result, IngestResult::REJECTED) << "round " << round;
            if (result == IngestResult::COMPLETED) {
                ++completed;
            }
        }

        EXPECT_EQ(completed, 1) << "round " << round;
        ASSERT_EQ(persisted.size(), 1u) << "round " << round;
        EXPECT_EQ(persisted[0].second, blob);
        ASSERT_EQ(outcomes.size(), 1u);
        EXPECT_EQ(outcomes[0].status, TransferStatus::COMPLETE);
    }
}

TEST_F(ReassemblerTest, DoubleDeliveryPersistsOnce) {
    auto blob = make_blob(2500);
    auto transfer = prepare(blob, 1000);

    for (int pass = 0; pass < 2; ++pass) {
        deliver_envelope(transfer);
        for (uint32_t i = 0; i < transfer.fragment_count(); ++i) {
            auto result = deliver_fragment(transfer, i);
            if (pass == 1) {
                EXPECT_EQ(result, IngestResult::DISCARDED);
            }
        }
    }

    EXPECT_EQ(persisted.size(), 1u);
    EXPECT_EQ(outcomes.size(), 1u);
    EXPECT_GT(reassembler->stats().discarded, 0u);
}

TEST_F(ReassemblerTest, TenThousandBytesInSevenFragments) {
    auto blob = make_blob(10000);
    auto transfer = prepare(blob, 1500, codec::PayloadEncoding::IDENTITY);
    ASSERT_EQ(transfer.fragment_count(), 7u);

    EXPECT_EQ(deliver_envelope(transfer), IngestResult::ACCEPTED);
    const std::vector<uint32_t> order = {3, 1, 0, 2, 4, 6};
    for (auto index : order) {
        EXPECT_EQ(deliver_fragment(transfer, index), IngestResult::ACCEPTED) << index;
    }
    EXPECT_EQ(deliver_fragment(transfer, 2), IngestResult::DUPLICATE);
    EXPECT_EQ(deliver_fragment(transfer, 5), IngestResult::COMPLETED);

    ASSERT_EQ(persisted.size(), 1u);
    EXPECT_EQ(persisted[0].second, blob);
    EXPECT_EQ(persisted[0].first.total_size, 10000u);
    EXPECT_EQ(reassembler->stats().duplicates, 1u);
}

TEST_F(ReassemblerTest, EnvelopeArrivingLastCompletes) {
    auto blob = make_blob(1200);
    auto transfer = prepare(blob, 500);

    for (uint32_t i = 0; i < transfer.fragment_count(); ++i) {
        EXPECT_EQ(deliver_fragment(transfer, i), IngestResult::ACCEPTED);
    }
    EXPECT_EQ(reassembler->status(transfer.transfer_id()), TransferStatus::COLLECTING);
    EXPECT_EQ(deliver_envelope(transfer), IngestResult::COMPLETED);
    ASSERT_EQ(persisted.size(), 1u);
    EXPECT_EQ(persisted[0].second, blob);
}

TEST_F(ReassemblerTest, ConflictingFragmentFailsWithoutPersist) {
    auto blob = make_blob(3000);
    auto transfer = prepare(blob, 1000);

    deliver_envelope(transfer);
    deliver_fragment(transfer, 0);
    deliver_fragment(transfer, 2);

    auto conflicting = *transfer.fragment(2);
    conflicting.payload_chunk[0] = conflicting.payload_chunk[0] == 'A' ? 'B' : 'A';
    EXPECT_EQ(deliver(conflicting), IngestResult::FAILED);

    EXPECT_EQ(reassembler->status(transfer.transfer_id()), TransferStatus::FAILED);
    EXPECT_EQ(reassembler->failure_reason(transfer.transfer_id()),
              TransferError::FRAGMENT_MISMATCH);
    EXPECT_EQ(reassembler->buffered_bytes(), 0u);

    // The rest of the transfer cannot revive it
    for (uint32_t i = 0; i < transfer.fragment_count(); ++i) {
        EXPECT_EQ(deliver_fragment(transfer, i), IngestResult::DISCARDED);
    }
    EXPECT_TRUE(persisted.empty());
    ASSERT_EQ(outcomes.size(), 1u);
    EXPECT_EQ(outcomes[0].reason, TransferError::FRAGMENT_MISMATCH);
}

TEST_F(ReassemblerTest, ConflictingEnvelopeFails) {
    auto transfer = prepare(make_blob(1000), 500);
    deliver_envelope(transfer);
    EXPECT_EQ(deliver_envelope(transfer), IngestResult::DUPLICATE);

    auto other = transfer.envelope();
    other.source_id = "someone-else";
    EXPECT_EQ(deliver(protocol::EnvelopeMessage{other}), IngestResult::FAILED);
    EXPECT_EQ(reassembler->failure_reason(transfer.transfer_id()),
              TransferError::ENVELOPE_MISMATCH);
    EXPECT_TRUE(persisted.empty());
}

TEST_F(ReassemblerTest, EnvelopeContradictingBufferedFragmentsFails) {
    auto transfer = prepare(make_blob(3000), 1000);
    deliver_fragment(transfer, 3);  // is_last at index 3

    auto shorter = transfer.envelope();
    shorter.fragment_count = 2;
    EXPECT_EQ(deliver(protocol::EnvelopeMessage{shorter}), IngestResult::FAILED);
    EXPECT_EQ(reassembler->failure_reason(transfer.transfer_id()),
              TransferError::ENVELOPE_MISMATCH);
}

TEST_F(ReassemblerTest, FragmentOutsideEnvelopeShapeFails) {
    auto transfer = prepare(make_blob(3000), 1000);
    deliver_envelope(transfer);

    protocol::FragmentMessage stray{.transfer_id = transfer.transfer_id(),
                                    .sequence_index = 9,
                                    .payload_chunk = "abcd",
                                    .is_last = false};
    EXPECT_EQ(deliver(stray), IngestResult::FAILED);
    EXPECT_EQ(reassembler->failure_reason(transfer.transfer_id()),
              TransferError::ENVELOPE_MISMATCH);
}

TEST_F(ReassemblerTest, TwoLastFlagsFail) {
    auto transfer = prepare(make_blob(3000), 1000);
    deliver_fragment(transfer, 3);

    auto early_last = *transfer.fragment(1);
    early_last.is_last = true;
    EXPECT_EQ(deliver(early_last), IngestResult::FAILED);
    EXPECT_EQ(reassembler->failure_reason(transfer.transfer_id()),
              TransferError::ENVELOPE_MISMATCH);
}

TEST_F(ReassemblerTest, ZeroLengthBlobCompletesOnEnvelope) {
    auto transfer = prepare({}, 1000);
    ASSERT_EQ(transfer.fragment_count(), 0u);

    EXPECT_EQ(deliver_envelope(transfer), IngestResult::COMPLETED);
    ASSERT_EQ(persisted.size(), 1u);
    EXPECT_TRUE(persisted[0].second.empty());
    EXPECT_EQ(deliver_envelope(transfer), IngestResult::DISCARDED);
    EXPECT_EQ(persisted.size(), 1u);
}

TEST_F(ReassemblerTest, IdleTransferExpiresAndReleasesMemory) {
    auto transfer = prepare(make_blob(3000), 1000);
    deliver_envelope(transfer);
    deliver_fragment(transfer, 0);
    deliver_fragment(transfer, 1);
    EXPECT_EQ(reassembler->buffered_bytes(), 2000u);

    // Exactly at the timeout is not yet idle
    clock.advance(milliseconds(1000));
    EXPECT_EQ(reassembler->sweep().expired, 0u);

    clock.advance(milliseconds(1));
    auto swept = reassembler->sweep();
    EXPECT_EQ(swept.expired, 1u);
    EXPECT_EQ(reassembler->status(transfer.transfer_id()), TransferStatus::EXPIRED);
    EXPECT_EQ(reassembler->failure_reason(transfer.transfer_id()), TransferError::IDLE_TIMEOUT);
    EXPECT_EQ(reassembler->buffered_bytes(), 0u);

    ASSERT_EQ(outcomes.size(), 1u);
    EXPECT_EQ(outcomes[0].status, TransferStatus::EXPIRED);
    EXPECT_TRUE(persisted.empty());
}

TEST_F(ReassemblerTest, ExpiredTransferIsNotResurrected) {
    auto transfer = prepare(make_blob(3000), 1000);
    deliver_fragment(transfer, 0);
    clock.advance(milliseconds(1500));
    reassembler->sweep();
    ASSERT_EQ(reassembler->status(transfer.transfer_id()), TransferStatus::EXPIRED);

    EXPECT_EQ(deliver_envelope(transfer), IngestResult::DISCARDED);
    for (uint32_t i = 0; i < transfer.fragment_count(); ++i) {
        EXPECT_EQ(deliver_fragment(transfer, i), IngestResult::DISCARDED);
    }
    EXPECT_EQ(reassembler->status(transfer.transfer_id()), TransferStatus::EXPIRED);
    EXPECT_TRUE(persisted.empty());
}

TEST_F(ReassemblerTest, SlowButActiveTransferHitsTransferTimeout) {
    auto transfer = prepare(make_blob(20000), 1000);
    deliver_envelope(transfer);

    // One fragment every 900ms stays under the idle timeout
    for (uint32_t i = 0; i < 12; ++i) {
        clock.advance(milliseconds(900));
        deliver_fragment(transfer, i);
        reassembler->sweep();
    }
    EXPECT_EQ(reassembler->status(transfer.transfer_id()), TransferStatus::EXPIRED);
    EXPECT_EQ(reassembler->failure_reason(transfer.transfer_id()),
              TransferError::TRANSFER_TIMEOUT);
}

TEST_F(ReassemblerTest, TombstonesArePurgedAfterGraceWindow) {
    auto transfer = prepare(make_blob(100), 1000);
    deliver_envelope(transfer);
    deliver_fragment(transfer, 0);
    ASSERT_EQ(reassembler->status(transfer.transfer_id()), TransferStatus::COMPLETE);

    clock.advance(milliseconds(5000));
    EXPECT_EQ(reassembler->sweep().purged, 0u);
    clock.advance(milliseconds(1));
    EXPECT_EQ(reassembler->sweep().purged, 1u);

    EXPECT_FALSE(reassembler->status(transfer.transfer_id()).has_value());
    EXPECT_EQ(reassembler->transfer_count(), 0u);
}

TEST_F(ReassemblerTest, MissingRequiredAttributeFailsValidation) {
    config.required_attributes = {"content-type"};
    reset();

    auto transfer = prepare(make_blob(500), 1000);
    deliver_envelope(transfer);
    EXPECT_EQ(deliver_fragment(transfer, 0), IngestResult::FAILED);
    EXPECT_EQ(reassembler->failure_reason(transfer.transfer_id()),
              TransferError::VALIDATION_ERROR);
    EXPECT_TRUE(persisted.empty());

    auto labelled = prepare(make_blob(500), 1000, codec::PayloadEncoding::BASE64,
                            {{"content-type", "image/png"}});
    deliver_envelope(labelled);
    EXPECT_EQ(deliver_fragment(labelled, 0), IngestResult::COMPLETED);
}

TEST_F(ReassemblerTest, UndecodablePayloadFails) {
    protocol::TransferEnvelope envelope{.transfer_id = "t-codec",
                                        .source_id = "src",
                                        .total_size = 8,
                                        .fragment_count = 2,
                                        .fragment_size = 4,
                                        .encoding = codec::PayloadEncoding::BASE64};
    EXPECT_EQ(reassembler->on_envelope(envelope), IngestResult::ACCEPTED);
    EXPECT_EQ(reassembler->on_fragment({"t-codec", 0, "Zm9v", false}), IngestResult::ACCEPTED);
    EXPECT_EQ(reassembler->on_fragment({"t-codec", 1, "Z!!v", true}), IngestResult::FAILED);
    EXPECT_EQ(reassembler->failure_reason("t-codec"), TransferError::CODEC_ERROR);
    EXPECT_TRUE(persisted.empty());
}

TEST_F(ReassemblerTest, SinkFailureIsReported) {
    persist_result = false;
    auto transfer = prepare(make_blob(100), 1000);
    deliver_envelope(transfer);
    EXPECT_EQ(deliver_fragment(transfer, 0), IngestResult::COMPLETED);

    ASSERT_EQ(outcomes.size(), 1u);
    EXPECT_EQ(outcomes[0].status, TransferStatus::COMPLETE);
    EXPECT_EQ(outcomes[0].reason, TransferError::SINK_ERROR);
    EXPECT_EQ(reassembler->stats().persist_failures, 1u);

    // Still persisted at most once
    deliver_fragment(transfer, 0);
    EXPECT_EQ(persisted.size(), 1u);
}

TEST_F(ReassemblerTest, ThrowingSinkDoesNotEscape) {
    reassembler->set_persist_callback(
        [](const protocol::TransferEnvelope&, const std::vector<uint8_t>&) -> bool {
            throw std::runtime_error("disk full");
        });
    auto transfer = prepare(make_blob(100), 1000);
    deliver_envelope(transfer);
    EXPECT_EQ(deliver_fragment(transfer, 0), IngestResult::COMPLETED);
    ASSERT_EQ(outcomes.size(), 1u);
    EXPECT_EQ(outcomes[0].reason, TransferError::SINK_ERROR);
}

TEST_F(ReassemblerTest, OversizedTransferIsRefused) {
    config.max_transfer_size = 1000;
    reset();

    auto transfer = prepare(make_blob(3000), 1000);
    EXPECT_EQ(deliver_envelope(transfer), IngestResult::FAILED);
    EXPECT_EQ(reassembler->failure_reason(transfer.transfer_id()),
              TransferError::PAYLOAD_TOO_LARGE);

    // Without an envelope the buffered bytes are bounded too
    auto headless = prepare(make_blob(3000), 600);
    EXPECT_EQ(deliver_fragment(headless, 0), IngestResult::ACCEPTED);
    EXPECT_EQ(deliver_fragment(headless, 1), IngestResult::FAILED);
    EXPECT_EQ(reassembler->failure_reason(headless.transfer_id()),
              TransferError::PAYLOAD_TOO_LARGE);
}

TEST_F(ReassemblerTest, MalformedMessagesAreRejected) {
    std::vector<uint8_t> junk = {'n', 'o', 'p', 'e', 0, 1, 2};
    EXPECT_EQ(reassembler->on_message(junk), IngestResult::REJECTED);
    EXPECT_EQ(reassembler->on_fragment({"", 0, "abcd", true}), IngestResult::REJECTED);
    EXPECT_EQ(reassembler->stats().messages_rejected, 2u);
    EXPECT_EQ(reassembler->transfer_count(), 0u);
}

TEST_F(ReassemblerTest, RegistryCapacityRejectsNewTransfers) {
    config.max_transfers = 2;
    reset();

    auto a = prepare(make_blob(2000), 1000);
    auto b = prepare(make_blob(2000), 1000);
    auto c = prepare(make_blob(2000), 1000);
    EXPECT_EQ(deliver_fragment(a, 0), IngestResult::ACCEPTED);
    EXPECT_EQ(deliver_fragment(b, 0), IngestResult::ACCEPTED);
    EXPECT_EQ(deliver_fragment(c, 0), IngestResult::REJECTED);

    // Known transfers keep flowing
    EXPECT_EQ(deliver_fragment(a, 1), IngestResult::ACCEPTED);
}

TEST_F(ReassemblerTest, ConcurrentIngestPersistsEachTransferOnce) {
    constexpr int kTransfers = 16;
    constexpr int kThreads = 6;

    std::vector<std::vector<uint8_t>> blobs;
    std::vector<std::vector<uint8_t>> messages;
    for (int t = 0; t < kTransfers; ++t) {
        blobs.push_back(make_blob(4000 + static_cast<size_t>(t) * 37));
        auto transfer = prepare(blobs.back(), 512);
        messages.push_back(protocol::serialize_message(transfer.envelope_message()));
        for (uint32_t i = 0; i < transfer.fragment_count(); ++i) {
            messages.push_back(protocol::serialize_message(*transfer.fragment(i)));
        }
    }

    // Every thread delivers everything, each in its own order
    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([this, messages, t]() mutable {
            std::mt19937 rng(static_cast<uint32_t>(t));
            std::shuffle(messages.begin(), messages.end(), rng);
            for (const auto& message : messages) {
                reassembler->on_message(message);
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    ASSERT_EQ(persisted.size(), static_cast<size_t>(kTransfers));
    for (const auto& [envelope, blob] : persisted) {
        EXPECT_NE(std::find(blobs.begin(), blobs.end(), blob), blobs.end());
    }
    EXPECT_EQ(outcomes.size(), static_cast<size_t>(kTransfers));
    EXPECT_EQ(reassembler->stats().transfers_completed, static_cast<uint64_t>(kTransfers));
    EXPECT_EQ(reassembler->stats().transfers_failed, 0u);
}

TEST_F(ReassemblerTest, MessagesDuringFinalizeCannotChangeOutcome) {
    // The finalizing thread parks on its second clock read, which is taken after
    // decode and validation and before the terminal status is committed
    std::mutex gate_mutex;
    std::condition_variable gate;
    bool parked = false;
    bool released = false;
    reset([&]() {
        if (clock_reads >= 0 && ++clock_reads == 2) {
            std::unique_lock<std::mutex> lock(gate_mutex);
            parked = true;
            gate.notify_all();
            gate.wait(lock, [&] { return released; });
        }
        return clock.now();
    });

    auto blob = make_blob(2000);
    auto transfer = prepare(blob, 1000, codec::PayloadEncoding::IDENTITY);
    ASSERT_EQ(deliver_envelope(transfer), IngestResult::ACCEPTED);
    ASSERT_EQ(deliver_fragment(transfer, 0), IngestResult::ACCEPTED);

    IngestResult finalizer_result = IngestResult::REJECTED;
    std::thread finalizer([&] {
        clock_reads = 0;
        finalizer_result = deliver_fragment(transfer, 1);
    });
    {
        std::unique_lock<std::mutex> lock(gate_mutex);
        gate.wait(lock, [&] { return parked; });
    }

    protocol::FragmentMessage stray{.transfer_id = transfer.transfer_id(),
                                    .sequence_index = 1,
                                    .payload_chunk = "y",
                                    .is_last = false};
    EXPECT_EQ(deliver(stray), IngestResult::DISCARDED);
    stray.sequence_index = 7;
    EXPECT_EQ(deliver(stray), IngestResult::DISCARDED);
    EXPECT_EQ(deliver_fragment(transfer, 0), IngestResult::DUPLICATE);

    auto other = transfer.envelope();
    other.source_id = "someone-else";
    EXPECT_EQ(deliver(protocol::EnvelopeMessage{other}), IngestResult::DISCARDED);

    {
        std::lock_guard<std::mutex> lock(gate_mutex);
        released = true;
    }
    gate.notify_all();
    finalizer.join();

    EXPECT_EQ(finalizer_result, IngestResult::COMPLETED);
    EXPECT_EQ(reassembler->status(transfer.transfer_id()), TransferStatus::COMPLETE);
    ASSERT_EQ(persisted.size(), 1u);
    EXPECT_EQ(persisted[0].second, blob);
    ASSERT_EQ(outcomes.size(), 1u);
    EXPECT_EQ(outcomes[0].status, TransferStatus::COMPLETE);
    EXPECT_EQ(reassembler->stats().transfers_completed, 1u);
    EXPECT_EQ(reassembler->stats().transfers_failed, 0u);
}

TEST_F(ReassemblerTest, IngestResultNames) {
    EXPECT_STREQ(ingest_result_to_string(IngestResult::DUPLICATE), "duplicate");
    EXPECT_STREQ(transfer_status_to_string(TransferStatus::EXPIRED), "expired");
}

}  // namespace
}  // namespace blobrelay::receiver
