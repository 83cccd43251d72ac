#include <gtest/gtest.h>
#include "peerlink/engine/engine.hpp"
#include "peerlink/crypto/hash.hpp"
#include "support/test_support.hpp"
#include <algorithm>
#include <atomic>

using namespace peerlink::engine;
using peerlink::network::ConnectionState;
using peerlink::network::DisconnectReason;
using peerlink::transfer::JobStatus;
using peerlink::test::wait_until;

namespace {

class EventLog {
public:
    void record(const Event& event) {
        std::lock_guard<std::mutex> lock(mutex_);
        events_.push_back(event);
    }

    std::vector<Event> events() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return events_;
    }

    std::optional<TransferTerminal> terminal(const std::string& filename) const {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& event : events_) {
            if (auto terminal = std::get_if<TransferTerminal>(&event); terminal && terminal->filename == filename) {
                return *terminal;
            }
        }
        return std::nullopt;
    }

    std::size_t terminal_count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return static_cast<std::size_t>(std::count_if(events_.begin(), events_.end(), [](const Event& event) {
            return std::holds_alternative<TransferTerminal>(event);
        }));
    }

    bool saw_connection(ConnectionState state, DisconnectReason reason) const {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& event : events_) {
            if (auto change = std::get_if<ConnectionStateChanged>(&event);
                change && change->state == state && change->reason == reason) {
                return true;
            }
        }
        return false;
    }

private:
    mutable std::mutex mutex_;
    std::vector<Event> events_;
};

// One peer: its storage, queue, engine and what it reported.
struct Node {
    std::string name;
    peerlink::test::TempDir dir{"peerlink_node"};
    std::unique_ptr<peerlink::storage::Database> database;
    std::unique_ptr<peerlink::storage::ResumeLedger> ledger;
    std::unique_ptr<peerlink::storage::TransferHistory> history;
    std::unique_ptr<peerlink::transfer::TransferQueue> queue;
    std::unique_ptr<Engine> engine;
    EventLog log;

    std::filesystem::path save_directory() const { return dir.path() / "received"; }
};

std::string file_checksum(const std::filesystem::path& path) {
    peerlink::crypto::Blake2bHash digest{};
    EXPECT_TRUE(peerlink::crypto::Blake2bHasher::hash_file(path, digest));
    return peerlink::crypto::hash_utils::to_hex(digest);
}

}

class EngineTransferTest : public ::testing::Test {
protected:
    void TearDown() override {
        for (auto* node : {&alice_, &bob_}) {
            if (node->engine) {
                node->engine->stop();
            }
        }
    }

    EngineSettings settings_for(const Node& node, std::uint16_t port) {
        EngineSettings settings;
        settings.node_name = node.name;
        settings.listen_address = "127.0.0.1";
        settings.listen_port = port;
        settings.save_directory = node.save_directory();
        settings.data_directory = node.dir.path() / "data";
        settings.protocol.chunk_size = 64 * 1024;
        settings.protocol.window_bytes = 4 * 64 * 1024;
        settings.protocol.ack_timeout = std::chrono::milliseconds(3000);
        settings.protocol.durable_writes = false;
        settings.progress_interval = std::chrono::milliseconds(0);
        settings.io_threads = 2;
        settings.connection.connect_timeout = std::chrono::milliseconds(1000);
        settings.connection.heartbeat_interval = std::chrono::milliseconds(200);
        settings.connection.idle_timeout = std::chrono::milliseconds(5000);
        settings.connection.reconnect.initial_delay = std::chrono::milliseconds(50);
        settings.connection.reconnect.max_delay = std::chrono::milliseconds(200);
        settings.connection.reconnect.window = reconnect_window_;
        return settings;
    }

    // (Re)starts the node's engine on `port`, keeping its database.
    void start(Node& node, std::uint16_t port = 0) {
        auto settings = settings_for(node, port);
        if (!node.database) {
            std::filesystem::create_directories(settings.data_directory);
            node.database = std::make_unique<peerlink::storage::Database>(settings.database_path());
            ASSERT_TRUE(node.database->open());
            node.ledger = std::make_unique<peerlink::storage::ResumeLedger>(*node.database);
            ASSERT_TRUE(node.ledger->initialize());
            node.history = std::make_unique<peerlink::storage::TransferHistory>(*node.database);
            ASSERT_TRUE(node.history->initialize());
        }

        node.engine.reset();
        node.queue = std::make_unique<peerlink::transfer::TransferQueue>();
        node.engine = std::make_unique<Engine>(settings, *node.ledger, *node.queue, *node.history);

        auto* log = &node.log;
        node.engine->on_event([log](const Event& event) { log->record(event); });
        ASSERT_TRUE(node.engine->start());
    }

    void start_pair() {
        alice_.name = "alice";
        bob_.name = "bob";
        start(bob_);
        start(alice_);
        alice_.engine->peers().add({"bob", "127.0.0.1", bob_.engine->listen_port()});
    }

    Node alice_;
    Node bob_;
    std::chrono::milliseconds reconnect_window_{20000};
};

TEST_F(EngineTransferTest, ResumesAfterReceiverRestart) {
    start_pair();
    auto bob_port = bob_.engine->listen_port();

    auto source = alice_.dir / "movie.bin";
    peerlink::test::write_random_file(source, 10 * 1024 * 1024, 11);

    // Takes the receiver down once 40% has been confirmed.
    auto triggered = std::make_shared<std::atomic<bool>>(false);
    auto stopped = std::make_shared<std::atomic<bool>>(false);
    auto* receiver = bob_.engine.get();
    alice_.engine->on_event([triggered, stopped, receiver](const Event& event) {
        auto progress = std::get_if<TransferProgress>(&event);
        if (progress && progress->percent() >= 40.0 && !triggered->exchange(true)) {
            receiver->stop();
            *stopped = true;
        }
    });

    std::string job_id;
    ASSERT_TRUE(alice_.engine->send(source, "bob", job_id));
    ASSERT_TRUE(wait_until([&] { return stopped->load(); }, std::chrono::seconds(30)));

    ASSERT_TRUE(wait_until([&] {
        return alice_.log.saw_connection(ConnectionState::DISCONNECTED, DisconnectReason::CONNECTION_LOST);
    }));
    EXPECT_FALSE(alice_.log.terminal("movie.bin").has_value());

    auto partial = bob_.ledger->list();
    ASSERT_EQ(partial.size(), 1u);
    EXPECT_GT(partial[0].next_sequence, 0u);

    start(bob_, bob_port);

    ASSERT_TRUE(wait_until([&] { return alice_.log.terminal("movie.bin").has_value(); }, std::chrono::seconds(30)));
    auto done = *alice_.log.terminal("movie.bin");
    EXPECT_EQ(done.status, JobStatus::COMPLETED);
    EXPECT_EQ(done.job_id, job_id);

    // Finished jobs leave the queue; the history keeps them.
    EXPECT_TRUE(alice_.engine->jobs("bob").empty());

    auto expected = file_checksum(source);
    auto sent = alice_.engine->history();
    ASSERT_EQ(sent.size(), 1u);
    EXPECT_EQ(sent[0].checksum, expected);

    ASSERT_TRUE(wait_until([&] { return bob_.log.terminal("movie.bin").has_value(); }));
    auto received = *bob_.log.terminal("movie.bin");
    EXPECT_EQ(received.status, JobStatus::COMPLETED);
    EXPECT_TRUE(peerlink::test::files_equal(source, received.path));
    EXPECT_EQ(bob_.history->recent(10).at(0).checksum, expected);
    EXPECT_TRUE(bob_.engine->jobs("alice").empty());
    EXPECT_TRUE(bob_.ledger->list().empty());
    EXPECT_TRUE(alice_.ledger->list().empty());
}

TEST_F(EngineTransferTest, QueuedFilesGoOneAtATime) {
    start_pair();

    auto first = alice_.dir / "first.bin";
    auto second = alice_.dir / "second.bin";
    peerlink::test::write_random_file(first, 3 * 64 * 1024 + 17, 1);
    peerlink::test::write_random_file(second, 2 * 64 * 1024 + 5, 2);

    std::string first_id;
    std::string second_id;
    ASSERT_TRUE(alice_.engine->send(first, "bob", first_id));
    ASSERT_TRUE(alice_.engine->send(second, "bob", second_id));
    EXPECT_NE(first_id, second_id);

    ASSERT_TRUE(wait_until([&] { return alice_.log.terminal_count() == 2; }, std::chrono::seconds(20)));
    ASSERT_TRUE(alice_.engine->flush_events());

    // Nothing of the second file is confirmed before the first one finished.
    auto events = alice_.log.events();
    std::optional<std::size_t> first_done;
    std::optional<std::size_t> second_started;
    for (std::size_t i = 0; i < events.size(); ++i) {
        if (auto terminal = std::get_if<TransferTerminal>(&events[i]); terminal && terminal->filename == "first.bin") {
            first_done = i;
        }
        if (auto progress = std::get_if<TransferProgress>(&events[i]);
            progress && progress->filename == "second.bin" && progress->bytes_done > 0 && !second_started) {
            second_started = i;
        }
    }
    ASSERT_TRUE(first_done.has_value());
    ASSERT_TRUE(second_started.has_value());
    EXPECT_LT(*first_done, *second_started);

    EXPECT_EQ(alice_.log.terminal("first.bin")->status, JobStatus::COMPLETED);
    EXPECT_EQ(alice_.log.terminal("second.bin")->status, JobStatus::COMPLETED);

    ASSERT_TRUE(wait_until([&] { return bob_.log.terminal_count() == 2; }));
    EXPECT_TRUE(peerlink::test::files_equal(first, bob_.save_directory() / "first.bin"));
    EXPECT_TRUE(peerlink::test::files_equal(second, bob_.save_directory() / "second.bin"));
}

TEST_F(EngineTransferTest, SendingSameFileTwiceIsRejected) {
    start_pair();

    auto source = alice_.dir / "twice.bin";
    peerlink::test::write_random_file(source, 1024, 3);

    // Nothing listens on carol's port, so the job stays queued.
    alice_.engine->peers().add({"carol", "127.0.0.1", 1});

    std::string job_id;
    ASSERT_TRUE(alice_.engine->send(source, "carol", job_id));

    std::string again;
    auto duplicate = alice_.engine->send(source, "carol", again);
    EXPECT_EQ(duplicate.error, peerlink::core::ErrorCode::DUPLICATE_JOB);
    EXPECT_EQ(again, job_id);

    std::string unknown;
    EXPECT_EQ(alice_.engine->send(source, "dave", unknown).error, peerlink::core::ErrorCode::NOT_FOUND);
    EXPECT_FALSE(alice_.engine->send(alice_.dir / "missing.bin", "carol", unknown));
}

TEST_F(EngineTransferTest, CancelThenResendStartsFresh) {
    start_pair();

    auto source = alice_.dir / "report.pdf";
    peerlink::test::write_random_file(source, 200 * 1024, 4);
    alice_.engine->peers().add({"carol", "127.0.0.1", 1});

    std::string job_id;
    ASSERT_TRUE(alice_.engine->send(source, "carol", job_id));
    ASSERT_TRUE(wait_until([&] {
        return alice_.log.saw_connection(ConnectionState::DISCONNECTED, DisconnectReason::CONNECT_FAILED);
    }));

    ASSERT_TRUE(alice_.engine->cancel(job_id));
    ASSERT_TRUE(wait_until([&] { return alice_.log.terminal("report.pdf").has_value(); }));
    EXPECT_EQ(alice_.log.terminal("report.pdf")->status, JobStatus::CANCELLED);
    EXPECT_FALSE(alice_.engine->cancel(job_id));

    std::string fresh_id;
    ASSERT_TRUE(alice_.engine->send(source, "carol", fresh_id));
    EXPECT_NE(fresh_id, job_id);

    EXPECT_EQ(alice_.engine->cancel("not-hex").error, peerlink::core::ErrorCode::INVALID_ARGUMENT);
}

TEST_F(EngineTransferTest, PauseAndResumeQueuedJob) {
    start_pair();

    auto source = alice_.dir / "notes.txt";
    peerlink::test::write_random_file(source, 4096, 5);
    alice_.engine->peers().add({"carol", "127.0.0.1", 1});

    std::string job_id;
    ASSERT_TRUE(alice_.engine->send(source, "carol", job_id));
    ASSERT_TRUE(alice_.engine->pause(job_id));

    auto jobs = alice_.engine->jobs("carol");
    ASSERT_EQ(jobs.size(), 1u);
    EXPECT_EQ(jobs[0].status, JobStatus::PAUSED);

    // Sending a paused file again resumes it under the same id.
    std::string again;
    ASSERT_TRUE(alice_.engine->send(source, "carol", again));
    EXPECT_EQ(again, job_id);
    EXPECT_EQ(alice_.engine->jobs("carol")[0].status, JobStatus::QUEUED);

    ASSERT_TRUE(alice_.engine->pause(job_id));
    ASSERT_TRUE(alice_.engine->resume(job_id));
    EXPECT_FALSE(alice_.engine->retry(job_id));
}

TEST_F(EngineTransferTest, GivesUpWhenPeerStaysAway) {
    reconnect_window_ = std::chrono::milliseconds(500);
    start_pair();

    ASSERT_TRUE(alice_.engine->connect("bob"));
    ASSERT_TRUE(wait_until([&] { return alice_.engine->connection_state("bob") == ConnectionState::CONNECTED; }));

    bob_.engine->stop();

    ASSERT_TRUE(wait_until([&] {
        return alice_.log.saw_connection(ConnectionState::DISCONNECTED, DisconnectReason::RECONNECT_EXHAUSTED);
    }));
    EXPECT_TRUE(alice_.log.saw_connection(ConnectionState::DISCONNECTED, DisconnectReason::CONNECTION_LOST));
    EXPECT_EQ(alice_.engine->connection_state("bob"), ConnectionState::DISCONNECTED);
}

TEST_F(EngineTransferTest, InboundPeerIsLearned) {
    start_pair();

    ASSERT_TRUE(alice_.engine->connect("bob"));
    ASSERT_TRUE(wait_until([&] { return bob_.engine->connection_state("alice") == ConnectionState::CONNECTED; }));

    auto learned = bob_.engine->peers().find("alice");
    ASSERT_TRUE(learned.has_value());
    EXPECT_EQ(learned->port, alice_.engine->listen_port());
}
