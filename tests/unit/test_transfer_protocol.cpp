#include <gtest/gtest.h>
#include "peerlink/transfer/outgoing_transfer.hpp"
#include "peerlink/transfer/incoming_transfer.hpp"
#include "peerlink/crypto/hash.hpp"
#include "support/test_support.hpp"
#include <algorithm>
#include <atomic>
#include <future>
#include <set>

using namespace peerlink::transfer;
using peerlink::network::Frame;
using peerlink::network::MessageType;
using peerlink::network::ReasonCode;
using peerlink::storage::FileStore;
using peerlink::storage::HistoryStatus;
using peerlink::test::FrameAction;
using peerlink::test::MemoryPipe;
using peerlink::test::wait_until;

namespace {

constexpr std::uint32_t CHUNK = 4096;
constexpr std::uint64_t FILE_SIZE = 64 * CHUNK - 100;
constexpr std::uint64_t CHUNK_COUNT = 64;

// Both directions of one session between a sender and a receiver.
struct Session {
    MemoryPipe to_receiver;
    MemoryPipe to_sender;
    std::unique_ptr<OutgoingTransfer> outgoing;
    std::unique_ptr<IncomingTransfer> incoming;

    std::mutex mutex;
    std::optional<JobStatus> finished_status;
    ReasonCode finished_reason = ReasonCode::NONE;
    TransferJob finished_job;

    std::optional<JobStatus> status() {
        std::lock_guard<std::mutex> lock(mutex);
        return finished_status;
    }
};

}

class TransferProtocolTest : public ::testing::Test {
protected:
    void SetUp() override {
        source_ = dir_ / "payload.bin";
        peerlink::test::write_random_file(source_, FILE_SIZE, 7);

        database_ = std::make_unique<peerlink::storage::Database>(dir_ / "peerlink.db");
        ASSERT_TRUE(database_->open());
        ledger_ = std::make_unique<peerlink::storage::ResumeLedger>(*database_);
        ASSERT_TRUE(ledger_->initialize());
        history_ = std::make_unique<peerlink::storage::TransferHistory>(*database_);
        ASSERT_TRUE(history_->initialize());
        store_ = std::make_unique<FileStore>(dir_ / "received");
        ASSERT_TRUE(store_->prepare());

        settings_.chunk_size = CHUNK;
        settings_.ack_timeout = std::chrono::milliseconds(2000);
        settings_.start_timeout = std::chrono::milliseconds(2000);
        settings_.complete_timeout = std::chrono::milliseconds(2000);
        settings_.durable_writes = false;

        job_.id.fill(0x5A);
        job_.key = "payload-key";
        job_.direction = Direction::OUTGOING;
        job_.peer = "bob";
        job_.path = source_;
        job_.filename = "payload.bin";
        job_.total_size = FILE_SIZE;
        job_.chunk_size = CHUNK;
    }

    std::unique_ptr<Session> make_session() {
        auto session = std::make_unique<Session>();
        session->outgoing = std::make_unique<OutgoingTransfer>(job_, session->to_receiver, settings_);
        session->incoming = std::make_unique<IncomingTransfer>(
            job_.id, "alice", session->to_sender, settings_,
            IncomingContext{*ledger_, *history_, *store_, queue_});

        auto* raw = session.get();
        session->incoming->on_finished([raw](const TransferJob& job, JobStatus status, ReasonCode reason) {
            std::lock_guard<std::mutex> lock(raw->mutex);
            raw->finished_status = status;
            raw->finished_reason = reason;
            raw->finished_job = job;
        });

        session->to_receiver.attach(session->incoming.get());
        session->to_sender.attach(session->outgoing.get());
        return session;
    }

    TransferOutcome run(Session& session) {
        auto future = std::async(std::launch::async, [&session] { return session.outgoing->run(); });
        if (future.wait_for(std::chrono::seconds(20)) != std::future_status::ready) {
            ADD_FAILURE() << "sender did not finish";
            session.outgoing->request_stop(ReasonCode::CANCELLED);
        }
        return future.get();
    }

    std::string source_checksum() {
        peerlink::crypto::Blake2bHash digest{};
        EXPECT_TRUE(peerlink::crypto::Blake2bHasher::hash_file(source_, digest));
        return peerlink::crypto::hash_utils::to_hex(digest);
    }

    std::filesystem::path partial_file() {
        return FileStore::partial_path(dir_ / "received" / "payload.bin");
    }

    // Lets the first `keep` chunks through and drops the rest.
    static void drop_chunks_after(Session& session, int keep) {
        auto seen = std::make_shared<std::atomic<int>>(0);
        session.to_receiver.set_interceptor([seen, keep](Frame& frame) {
            if (frame.type() == MessageType::CHUNK && ++*seen > keep) {
                return FrameAction::DROP;
            }
            return FrameAction::DELIVER;
        });
    }

    peerlink::test::TempDir dir_;
    std::filesystem::path source_;
    std::unique_ptr<peerlink::storage::Database> database_;
    std::unique_ptr<peerlink::storage::ResumeLedger> ledger_;
    std::unique_ptr<peerlink::storage::TransferHistory> history_;
    std::unique_ptr<FileStore> store_;
    TransferQueue queue_;
    ProtocolSettings settings_;
    TransferJob job_;
};

TEST_F(TransferProtocolTest, TransfersWholeFile) {
    auto session = make_session();

    std::vector<std::uint64_t> reported;
    session->outgoing->set_progress_callback([&](const TransferJob&, std::uint64_t bytes) {
        reported.push_back(bytes);
    });

    EXPECT_EQ(run(*session), TransferOutcome::COMPLETED);
    ASSERT_TRUE(wait_until([&] { return session->status().has_value(); }));
    EXPECT_EQ(*session->status(), JobStatus::COMPLETED);

    EXPECT_TRUE(peerlink::test::files_equal(source_, session->finished_job.path));
    EXPECT_FALSE(std::filesystem::exists(FileStore::partial_path(session->finished_job.path)));
    EXPECT_EQ(session->outgoing->chunks_sent(), CHUNK_COUNT);
    EXPECT_EQ(session->outgoing->retransmissions(), 0u);

    EXPECT_FALSE(ledger_->load(job_.id).has_value());
    auto archived = history_->find(job_.id);
    ASSERT_TRUE(archived.has_value());
    EXPECT_EQ(archived->status, HistoryStatus::COMPLETED);
    EXPECT_EQ(archived->checksum, source_checksum());
    EXPECT_EQ(session->outgoing->whole_file_checksum(), source_checksum());

    auto queued = queue_.find(job_.id);
    ASSERT_TRUE(queued.has_value());
    EXPECT_EQ(queued->status, JobStatus::COMPLETED);
    EXPECT_EQ(queued->direction, Direction::INCOMING);

    ASSERT_FALSE(reported.empty());
    EXPECT_TRUE(std::is_sorted(reported.begin(), reported.end()));
    EXPECT_EQ(reported.back(), FILE_SIZE);
}

TEST_F(TransferProtocolTest, ReassemblesOutOfOrderChunks) {
    auto session = make_session();

    auto held = std::make_shared<std::set<std::uint64_t>>();
    session->to_receiver.set_interceptor([held](Frame& frame) {
        if (frame.type() != MessageType::CHUNK) {
            return FrameAction::DELIVER;
        }
        auto sequence = peerlink::test::chunk_sequence(frame);
        if (sequence % 2 == 0 && held->insert(sequence).second) {
            return FrameAction::HOLD;
        }
        return FrameAction::DELIVER;
    });

    EXPECT_EQ(run(*session), TransferOutcome::COMPLETED);
    ASSERT_TRUE(wait_until([&] { return session->status().has_value(); }));
    EXPECT_EQ(*session->status(), JobStatus::COMPLETED);

    EXPECT_TRUE(peerlink::test::files_equal(source_, session->finished_job.path));
    EXPECT_EQ(session->to_receiver.chunk_sequences().size(), CHUNK_COUNT);
    EXPECT_EQ(session->outgoing->retransmissions(), 0u);
}

TEST_F(TransferProtocolTest, CorruptChunkIsRetriedThenFails) {
    auto session = make_session();

    session->to_receiver.set_interceptor([](Frame& frame) {
        if (frame.type() == MessageType::CHUNK && peerlink::test::chunk_sequence(frame) == 2) {
            auto chunk = frame.decode<peerlink::network::ChunkMessage>();
            chunk.payload[10] ^= 0x01;
            frame.payload = chunk.serialize();
        }
        return FrameAction::DELIVER;
    });

    EXPECT_EQ(run(*session), TransferOutcome::FAILED);
    EXPECT_EQ(session->outgoing->failure_reason(), ReasonCode::RETRIES_EXHAUSTED);
    EXPECT_EQ(session->outgoing->retransmissions(), 3u);

    auto sequences = session->to_receiver.chunk_sequences();
    EXPECT_EQ(std::count(sequences.begin(), sequences.end(), 2u), 4);

    ASSERT_TRUE(wait_until([&] { return session->status().has_value(); }));
    EXPECT_EQ(*session->status(), JobStatus::FAILED);
    EXPECT_EQ(session->finished_reason, ReasonCode::RETRIES_EXHAUSTED);

    auto archived = history_->find(job_.id);
    ASSERT_TRUE(archived.has_value());
    EXPECT_EQ(archived->status, HistoryStatus::FAILED);

    // The good chunks stay for a retry.
    auto record = ledger_->load(job_.id);
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->next_sequence, 2u);
    EXPECT_FALSE(record->is_confirmed(2));
}

TEST_F(TransferProtocolTest, ResumesAfterConnectionLoss) {
    auto first = make_session();

    auto acks = std::make_shared<std::atomic<int>>(0);
    auto cut = std::make_shared<std::atomic<bool>>(false);
    first->to_sender.set_interceptor([acks, cut](Frame& frame) {
        if (*cut) {
            return FrameAction::DROP;
        }
        if (frame.type() == MessageType::CHUNK_ACK && ++*acks == 10) {
            *cut = true;
        }
        return FrameAction::DELIVER;
    });
    first->to_receiver.set_interceptor([cut](Frame&) {
        return *cut ? FrameAction::DROP : FrameAction::DELIVER;
    });

    auto interrupted = std::async(std::launch::async, [&first] { return first->outgoing->run(); });
    ASSERT_TRUE(wait_until([&] { return first->to_receiver.count(MessageType::CHUNK) >= CHUNK_COUNT; }));

    first->to_receiver.disconnect();
    first->to_sender.disconnect();
    first->outgoing->on_connection_lost();
    first->incoming->on_connection_lost();

    ASSERT_EQ(interrupted.wait_for(std::chrono::seconds(10)), std::future_status::ready);
    EXPECT_EQ(interrupted.get(), TransferOutcome::INTERRUPTED);
    ASSERT_TRUE(wait_until([&] { return first->status().has_value(); }));
    EXPECT_EQ(*first->status(), JobStatus::QUEUED);

    auto record = ledger_->load(job_.id);
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->next_sequence, 10u);
    EXPECT_TRUE(std::filesystem::exists(partial_file()));

    auto requeued = queue_.find(job_.id);
    ASSERT_TRUE(requeued.has_value());
    EXPECT_EQ(requeued->status, JobStatus::QUEUED);
    EXPECT_TRUE(requeued->resumed);

    auto second = make_session();
    EXPECT_EQ(run(*second), TransferOutcome::COMPLETED);
    EXPECT_TRUE(second->outgoing->job().resumed);

    auto resent = second->to_receiver.chunk_sequences();
    EXPECT_EQ(resent.size(), CHUNK_COUNT - 10);
    for (auto sequence : resent) {
        EXPECT_GE(sequence, 10u);
    }

    ASSERT_TRUE(wait_until([&] { return second->status().has_value(); }));
    EXPECT_EQ(*second->status(), JobStatus::COMPLETED);
    EXPECT_TRUE(peerlink::test::files_equal(source_, second->finished_job.path));
    EXPECT_FALSE(ledger_->load(job_.id).has_value());
}

TEST_F(TransferProtocolTest, ResumeSkipsChunksConfirmedPastTheGap) {
    auto first = make_session();

    // Chunk 2 never arrives, so 3 and 4 are held out of order.
    const std::set<std::uint64_t> delivered{0, 1, 3, 4};
    first->to_receiver.set_interceptor([delivered](Frame& frame) {
        if (frame.type() == MessageType::CHUNK &&
            delivered.count(peerlink::test::chunk_sequence(frame)) == 0) {
            return FrameAction::DROP;
        }
        return FrameAction::DELIVER;
    });

    auto interrupted = std::async(std::launch::async, [&first] { return first->outgoing->run(); });
    ASSERT_TRUE(wait_until([&] { return first->to_sender.count(MessageType::CHUNK_ACK) >= 4; }));

    first->to_receiver.disconnect();
    first->to_sender.disconnect();
    first->outgoing->on_connection_lost();
    first->incoming->on_connection_lost();

    ASSERT_EQ(interrupted.wait_for(std::chrono::seconds(10)), std::future_status::ready);
    EXPECT_EQ(interrupted.get(), TransferOutcome::INTERRUPTED);
    ASSERT_TRUE(wait_until([&] { return first->status().has_value(); }));

    auto record = ledger_->load(job_.id);
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->next_sequence, 2u);
    EXPECT_FALSE(record->is_confirmed(2));
    EXPECT_TRUE(record->is_confirmed(3));
    EXPECT_TRUE(record->is_confirmed(4));

    auto second = make_session();
    EXPECT_EQ(run(*second), TransferOutcome::COMPLETED);
    EXPECT_TRUE(second->outgoing->job().resumed);

    auto resent = second->to_receiver.chunk_sequences();
    ASSERT_EQ(resent.size(), CHUNK_COUNT - 4);
    EXPECT_EQ(resent.front(), 2u);
    for (auto sequence : resent) {
        EXPECT_EQ(delivered.count(sequence), 0u) << "chunk " << sequence << " sent again";
    }

    ASSERT_TRUE(wait_until([&] { return second->status().has_value(); }));
    EXPECT_EQ(*second->status(), JobStatus::COMPLETED);
    EXPECT_TRUE(peerlink::test::files_equal(source_, second->finished_job.path));
}

TEST_F(TransferProtocolTest, ReceiverCancelStopsSender) {
    auto session = make_session();
    drop_chunks_after(*session, 3);

    auto outcome = std::async(std::launch::async, [&session] { return session->outgoing->run(); });
    ASSERT_TRUE(wait_until([&] {
        return session->to_sender.count(MessageType::CHUNK_ACK) >= 3 &&
               session->to_receiver.count(MessageType::CHUNK) >= CHUNK_COUNT;
    }));
    EXPECT_TRUE(std::filesystem::exists(partial_file()));

    session->incoming->cancel();

    ASSERT_EQ(outcome.wait_for(std::chrono::seconds(10)), std::future_status::ready);
    EXPECT_EQ(outcome.get(), TransferOutcome::CANCELLED);
    EXPECT_EQ(session->outgoing->failure_reason(), ReasonCode::CANCELLED);

    EXPECT_EQ(*session->status(), JobStatus::CANCELLED);
    EXPECT_TRUE(session->incoming->finished());
    EXPECT_FALSE(std::filesystem::exists(partial_file()));
    EXPECT_FALSE(ledger_->load(job_.id).has_value());

    auto archived = history_->find(job_.id);
    ASSERT_TRUE(archived.has_value());
    EXPECT_EQ(archived->status, HistoryStatus::CANCELLED);
    EXPECT_EQ(queue_.find(job_.id)->status, JobStatus::CANCELLED);
}

TEST_F(TransferProtocolTest, SenderCancelDiscardsPartialData) {
    auto session = make_session();
    drop_chunks_after(*session, 3);

    auto outcome = std::async(std::launch::async, [&session] { return session->outgoing->run(); });
    ASSERT_TRUE(wait_until([&] { return session->to_receiver.count(MessageType::CHUNK) >= CHUNK_COUNT; }));

    session->outgoing->request_stop(ReasonCode::CANCELLED);

    ASSERT_EQ(outcome.wait_for(std::chrono::seconds(10)), std::future_status::ready);
    EXPECT_EQ(outcome.get(), TransferOutcome::CANCELLED);
    EXPECT_EQ(session->to_receiver.count(MessageType::FILE_ABORT), 1u);

    ASSERT_TRUE(wait_until([&] { return session->status().has_value(); }));
    EXPECT_EQ(*session->status(), JobStatus::CANCELLED);
    EXPECT_FALSE(std::filesystem::exists(partial_file()));
    EXPECT_FALSE(ledger_->load(job_.id).has_value());
}

TEST_F(TransferProtocolTest, SenderPauseKeepsPartialData) {
    auto session = make_session();
    drop_chunks_after(*session, 3);

    auto outcome = std::async(std::launch::async, [&session] { return session->outgoing->run(); });
    ASSERT_TRUE(wait_until([&] { return session->to_receiver.count(MessageType::CHUNK) >= CHUNK_COUNT; }));

    session->outgoing->request_stop(ReasonCode::PAUSED);

    ASSERT_EQ(outcome.wait_for(std::chrono::seconds(10)), std::future_status::ready);
    EXPECT_EQ(outcome.get(), TransferOutcome::PAUSED);

    ASSERT_TRUE(wait_until([&] { return session->status().has_value(); }));
    EXPECT_EQ(*session->status(), JobStatus::PAUSED);
    EXPECT_TRUE(std::filesystem::exists(partial_file()));

    auto record = ledger_->load(job_.id);
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->next_sequence, 3u);
    EXPECT_EQ(queue_.find(job_.id)->status, JobStatus::PAUSED);
}

TEST_F(TransferProtocolTest, AlreadyReceivedJobSendsNoChunks) {
    peerlink::storage::HistoryEntry entry;
    entry.job_id = job_.id;
    entry.direction = Direction::INCOMING;
    entry.peer = "alice";
    entry.filename = "payload.bin";
    entry.size = FILE_SIZE;
    entry.status = HistoryStatus::COMPLETED;
    entry.checksum = source_checksum();
    entry.finished_at = std::chrono::system_clock::now();
    ASSERT_TRUE(history_->archive(entry));

    auto session = make_session();
    EXPECT_EQ(run(*session), TransferOutcome::COMPLETED);
    EXPECT_EQ(session->outgoing->chunks_sent(), 0u);
    EXPECT_EQ(session->to_receiver.count(MessageType::CHUNK), 0u);
    EXPECT_EQ(session->outgoing->whole_file_checksum(), source_checksum());
}

TEST_F(TransferProtocolTest, UnansweredOfferTimesOut) {
    settings_.start_timeout = std::chrono::milliseconds(100);
    MemoryPipe nowhere;
    OutgoingTransfer outgoing(job_, nowhere, settings_);

    EXPECT_EQ(outgoing.run(), TransferOutcome::FAILED);
    EXPECT_EQ(outgoing.failure_reason(), ReasonCode::TIMEOUT);
    EXPECT_EQ(outgoing.state(), ProtocolState::DONE);
}

TEST_F(TransferProtocolTest, ChangedSourceFailsBeforeOffer) {
    job_.total_size = FILE_SIZE + 1;
    MemoryPipe nowhere;
    OutgoingTransfer outgoing(job_, nowhere, settings_);

    EXPECT_EQ(outgoing.run(), TransferOutcome::FAILED);
    EXPECT_EQ(outgoing.failure_reason(), ReasonCode::READ_FAILED);
    EXPECT_EQ(nowhere.count(MessageType::FILE_START), 0u);
}

TEST_F(TransferProtocolTest, OfflinePeerInterruptsImmediately) {
    MemoryPipe offline;
    offline.disconnect();
    OutgoingTransfer outgoing(job_, offline, settings_);

    EXPECT_EQ(outgoing.run(), TransferOutcome::INTERRUPTED);
}
