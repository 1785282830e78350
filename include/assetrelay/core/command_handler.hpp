#pragma once

#include "assetrelay/core/config.hpp"
#include <atomic>
#include <cstdint>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace assetrelay::core {

struct CommandResult {
    bool success;
    std::string message;
    int exit_code;

    static CommandResult ok(const std::string& msg = "") {
        return {true, msg, 0};
    }

    static CommandResult error(const std::string& msg, int code = 1) {
        return {false, msg, code};
    }

    static CommandResult usage(const std::string& msg) {
        return {false, msg, 2};
    }

    static CommandResult cancelled(const std::string& msg = "Transfer cancelled") {
        return {false, msg, 3};
    }
};

// Everything a command needs beyond its positional arguments.
struct CommandContext {
    Config& config;
    const std::atomic<bool>* interrupted = nullptr;
    std::optional<uint64_t> declared_size;
    bool replace_existing = true;
    std::string label;
    std::ostream* out = &std::cout;
    std::ostream* err = &std::cerr;
};

class CommandHandler {
public:
    explicit CommandHandler(CommandContext& context) : context_(context) {}
    virtual ~CommandHandler() = default;

    // args[0] is the command name.
    virtual CommandResult execute(const std::vector<std::string>& args) = 0;
    virtual std::string get_description() const = 0;
    virtual std::string get_usage() const = 0;

protected:
    CommandContext& context_;
};

class UploadCommandHandler : public CommandHandler {
public:
    using CommandHandler::CommandHandler;

    CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "Upload a local file or stdin as release assets"; }
    std::string get_usage() const override { return "assetrelay upload <path|-> [asset-name]"; }
};

class FetchCommandHandler : public CommandHandler {
public:
    using CommandHandler::CommandHandler;

    CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "Stream a remote URL into release assets"; }
    std::string get_usage() const override { return "assetrelay fetch <url> [asset-name]"; }
};

class AssetsCommandHandler : public CommandHandler {
public:
    using CommandHandler::CommandHandler;

    CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "List the assets of the configured release"; }
    std::string get_usage() const override { return "assetrelay assets"; }
};

class DeleteCommandHandler : public CommandHandler {
public:
    using CommandHandler::CommandHandler;

    CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "Delete a release asset by name"; }
    std::string get_usage() const override { return "assetrelay delete <asset-name>"; }
};

} // namespace assetrelay::core
