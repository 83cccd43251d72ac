#include "peerlink/core/command_handler.hpp"
#include "peerlink/core/logger.hpp"
#include "peerlink/core/utils.hpp"
#include <boost/asio.hpp>
#include <atomic>
#include <csignal>
#include <functional>
#include <mutex>
#include <iostream>
#include <iomanip>
#include <set>

namespace peerlink::core {

namespace {

// Runs until SIGINT/SIGTERM or until `done` returns true.
bool wait_for(const std::function<bool()>& done) {
    boost::asio::io_context signals_context;
    boost::asio::signal_set signals(signals_context, SIGINT, SIGTERM);
    std::atomic<bool> interrupted{false};

    signals.async_wait([&interrupted](const boost::system::error_code& ec, int signal_number) {
        if (!ec) {
            LOG_INFO("Received signal {}, shutting down", signal_number);
            interrupted = true;
        }
    });

    while (!interrupted && !done()) {
        signals_context.run_for(std::chrono::milliseconds(200));
    }

    signals.cancel();
    return !interrupted;
}

void print_event(const engine::Event& event) {
    std::cout << engine::describe(event) << std::endl;
}

}

NodeCommandHandler::NodeCommandHandler(const Config& config)
    : config_(config) {
}

NodeCommandHandler::~NodeCommandHandler() {
    stop_engine();
}

Result NodeCommandHandler::open_storage() {
    if (database_) {
        return Result();
    }

    settings_ = engine::EngineSettings::from_config(config_);
    auto valid = settings_.validate();
    if (!valid) {
        return valid;
    }

    if (!utils::FileUtils::create_directories(settings_.data_directory)) {
        return Result(ErrorCode::FILE_WRITE_ERROR, "Cannot create " + settings_.data_directory.string());
    }

    database_ = std::make_unique<storage::Database>(settings_.database_path());
    auto opened = database_->open();
    if (!opened) {
        database_.reset();
        return opened;
    }

    ledger_ = std::make_unique<storage::ResumeLedger>(*database_);
    history_ = std::make_unique<storage::TransferHistory>(*database_);

    auto ledger_ready = ledger_->initialize();
    if (!ledger_ready) {
        return ledger_ready;
    }
    return history_->initialize();
}

Result NodeCommandHandler::start_engine() {
    auto ready = open_storage();
    if (!ready) {
        return ready;
    }

    queue_ = std::make_unique<transfer::TransferQueue>();
    engine_ = std::make_unique<engine::Engine>(settings_, *ledger_, *queue_, *history_);
    engine_->peers().load(config_);
    engine_->on_event(print_event);
    return engine_->start();
}

void NodeCommandHandler::stop_engine() {
    if (engine_) {
        engine_->stop();
        engine_.reset();
    }
}

CommandResult ServeCommandHandler::execute(const std::vector<std::string>& args) {
    auto started = start_engine();
    if (!started) {
        return CommandResult::error("Cannot start: " + started.message);
    }

    std::cout << "Node '" << settings_.node_name << "' listening on port " << engine_->listen_port()
              << ", saving into " << settings_.save_directory.string() << "\n";
    std::cout << "Press Ctrl+C to stop.\n";

    for (std::size_t i = 1; i < args.size(); ++i) {
        auto connected = engine_->connect(args[i]);
        if (!connected) {
            std::cerr << "Cannot connect to " << args[i] << ": " << connected.message << "\n";
        }
    }

    wait_for([] { return false; });
    stop_engine();
    return CommandResult::ok("Stopped");
}

CommandResult SendCommandHandler::execute(const std::vector<std::string>& args) {
    if (args.size() < 3) {
        return CommandResult::error("Usage: " + get_usage());
    }

    auto started = start_engine();
    if (!started) {
        return CommandResult::error("Cannot start: " + started.message);
    }

    const std::string& peer = args[1];

    std::mutex mutex;
    std::set<std::string> pending;
    std::size_t failures = 0;
    bool peer_gone = false;

    engine_->on_event([&](const engine::Event& event) {
        std::lock_guard<std::mutex> lock(mutex);
        if (auto terminal = std::get_if<engine::TransferTerminal>(&event)) {
            if (pending.erase(terminal->job_id) > 0 && terminal->status != transfer::JobStatus::COMPLETED) {
                ++failures;
            }
        } else if (auto state = std::get_if<engine::ConnectionStateChanged>(&event)) {
            if (state->peer == peer && (state->reason == network::DisconnectReason::RECONNECT_EXHAUSTED ||
                                        state->reason == network::DisconnectReason::CONNECT_FAILED)) {
                peer_gone = true;
            }
        }
    });

    for (std::size_t i = 2; i < args.size(); ++i) {
        std::string job_id;
        auto queued = engine_->send(args[i], peer, job_id);
        if (!queued) {
            std::cerr << "Cannot send " << args[i] << " (" << to_string(queued.error) << "): "
                      << queued.message << "\n";
            std::lock_guard<std::mutex> lock(mutex);
            ++failures;
            continue;
        }
        std::cout << "Queued " << args[i] << " as " << job_id << "\n";
        std::lock_guard<std::mutex> lock(mutex);
        pending.insert(job_id);
    }

    bool finished = wait_for([&] {
        std::lock_guard<std::mutex> lock(mutex);
        return pending.empty() || peer_gone;
    });
    stop_engine();

    std::lock_guard<std::mutex> lock(mutex);
    if (!finished) {
        return CommandResult::error("Interrupted; unfinished transfers resume on the next send", 130);
    }
    if (peer_gone && !pending.empty()) {
        return CommandResult::error("Peer " + peer + " unreachable; " + std::to_string(pending.size()) +
                                    " transfer(s) left to resume", 2);
    }
    if (failures > 0) {
        return CommandResult::error(std::to_string(failures) + " transfer(s) failed");
    }
    return CommandResult::ok("All files delivered");
}

CommandResult HistoryCommandHandler::execute(const std::vector<std::string>& args) {
    auto opened = open_storage();
    if (!opened) {
        return CommandResult::error("Cannot open history: " + opened.message);
    }

    std::size_t limit = 50;
    if (args.size() > 1) {
        try {
            limit = std::stoul(args[1]);
        } catch (const std::exception&) {
            return CommandResult::error("Usage: " + get_usage());
        }
    }

    auto entries = history_->recent(limit);
    if (entries.empty()) {
        std::cout << "No finished transfers.\n";
        return CommandResult::ok();
    }

    for (const auto& entry : entries) {
        std::cout << utils::TimeUtils::to_iso_string(entry.finished_at) << "  "
                  << std::left << std::setw(9) << storage::to_string(entry.status) << " "
                  << std::setw(8) << storage::to_string(entry.direction) << " "
                  << std::setw(12) << entry.peer << " "
                  << entry.filename << " (" << utils::StringUtils::format_bytes(entry.size) << ")";
        if (entry.reason != network::ReasonCode::NONE) {
            std::cout << " " << network::to_string(entry.reason);
        }
        std::cout << "\n";
    }
    return CommandResult::ok();
}

CommandResult PendingCommandHandler::execute(const std::vector<std::string>& /*args*/) {
    auto opened = open_storage();
    if (!opened) {
        return CommandResult::error("Cannot open ledger: " + opened.message);
    }

    auto records = ledger_->list();
    if (records.empty()) {
        std::cout << "Nothing to resume.\n";
        return CommandResult::ok();
    }

    for (const auto& record : records) {
        double percent = record.total_size == 0 ? 100.0
            : 100.0 * static_cast<double>(record.confirmed_bytes()) / static_cast<double>(record.total_size);
        std::cout << network::to_hex(record.job_id) << "  "
                  << std::left << std::setw(8) << storage::to_string(record.direction) << " "
                  << std::setw(12) << record.peer << " "
                  << record.filename << " " << std::fixed << std::setprecision(1) << percent << "%\n";
    }
    return CommandResult::ok();
}

CommandResult PeersCommandHandler::execute(const std::vector<std::string>& /*args*/) {
    engine::PeerDirectory directory;
    directory.load(config_);

    auto peers = directory.list();
    if (peers.empty()) {
        std::cout << "No peers configured. Add lines like 'peer.alice=192.168.1.20:12345'.\n";
        return CommandResult::ok();
    }

    for (const auto& peer : peers) {
        std::cout << std::left << std::setw(16) << peer.name << peer.host << ":" << peer.port << "\n";
    }
    return CommandResult::ok();
}

}
