#pragma once

#include "peerlink/core/config.hpp"
#include "peerlink/core/result.hpp"
#include "peerlink/engine/engine.hpp"
#include "peerlink/storage/database.hpp"
#include <memory>
#include <string>
#include <vector>

namespace peerlink::core {

struct CommandResult {
    bool success;
    std::string message;
    int exit_code;

    static CommandResult ok(const std::string& message = "") {
        return CommandResult{true, message, 0};
    }

    static CommandResult error(const std::string& message, int exit_code = 1) {
        return CommandResult{false, message, exit_code};
    }
};

class CommandHandler {
public:
    virtual ~CommandHandler() = default;

    // args[0] is the command name.
    virtual CommandResult execute(const std::vector<std::string>& args) = 0;
    virtual std::string get_description() const = 0;
    virtual std::string get_usage() const = 0;
};

// Base for commands that need the database and, optionally, a running engine.
class NodeCommandHandler : public CommandHandler {
protected:
    explicit NodeCommandHandler(const Config& config);
    ~NodeCommandHandler() override;

    Result open_storage();
    Result start_engine();
    void stop_engine();

    const Config& config_;
    engine::EngineSettings settings_;
    std::unique_ptr<storage::Database> database_;
    std::unique_ptr<storage::ResumeLedger> ledger_;
    std::unique_ptr<storage::TransferHistory> history_;
    std::unique_ptr<transfer::TransferQueue> queue_;
    std::unique_ptr<engine::Engine> engine_;
};

class ServeCommandHandler : public NodeCommandHandler {
public:
    explicit ServeCommandHandler(const Config& config) : NodeCommandHandler(config) {}

    CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "Accept incoming files until interrupted"; }
    std::string get_usage() const override { return "peerlink serve [peer...]"; }
};

class SendCommandHandler : public NodeCommandHandler {
public:
    explicit SendCommandHandler(const Config& config) : NodeCommandHandler(config) {}

    CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "Send files to a peer and wait until they are delivered"; }
    std::string get_usage() const override { return "peerlink send <peer> <file> [file...]"; }
};

class HistoryCommandHandler : public NodeCommandHandler {
public:
    explicit HistoryCommandHandler(const Config& config) : NodeCommandHandler(config) {}

    CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "Show finished transfers"; }
    std::string get_usage() const override { return "peerlink history [limit]"; }
};

class PendingCommandHandler : public NodeCommandHandler {
public:
    explicit PendingCommandHandler(const Config& config) : NodeCommandHandler(config) {}

    CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "Show unfinished transfers that can be resumed"; }
    std::string get_usage() const override { return "peerlink pending"; }
};

class PeersCommandHandler : public CommandHandler {
public:
    explicit PeersCommandHandler(const Config& config) : config_(config) {}

    CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "List configured peers"; }
    std::string get_usage() const override { return "peerlink peers"; }

private:
    const Config& config_;
};

}
