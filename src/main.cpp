#include <atomic>
#include <csignal>
#include <iostream>
#include <string>
#include <vector>
#include "assetrelay/core/logger.hpp"
#include "assetrelay/core/config.hpp"
#include "assetrelay/core/cli.hpp"
#include "assetrelay/core/utils.hpp"
#include "assetrelay/core/command_registry.hpp"

namespace {

std::atomic<bool> g_interrupted{false};

extern "C" void handle_interrupt(int) {
    g_interrupted.store(true);
}

bool parse_size(const std::string& text, uint64_t& size) {
    if (text.empty() || text.find_first_not_of("0123456789") != std::string::npos) {
        return false;
    }
    try {
        size = std::stoull(text);
    } catch (const std::exception&) {
        return false;
    }
    return true;
}

}

int main(int argc, char* argv[]) {
    using namespace assetrelay::core;

    CommandLineParser parser("assetrelay");

    if (!parser.parse(argc, argv)) {
        std::cerr << "Error: " << parser.get_error() << "\n\n";
        parser.print_help(std::cerr);
        return 2;
    }

    if (parser.has_option("help")) {
        parser.print_help();
        Config help_config;
        CommandContext help_context{help_config};
        CommandRegistry help_registry(help_context);
        help_registry.print_help();
        return 0;
    }

    if (parser.has_option("version")) {
        parser.print_version();
        return 0;
    }

    auto& config = Config::instance();
    config.set_defaults();

    std::string config_file = utils::FileUtils::expand_user(parser.get_option("config")).string();
    if (utils::FileUtils::exists(config_file)) {
        if (!config.load_from_file(config_file)) {
            std::cerr << "Error: cannot read " << config_file << "\n";
            return 2;
        }
    } else if (parser.has_option("config")) {
        std::cerr << "Error: config file not found: " << config_file << "\n";
        return 2;
    }
    config.load_from_env();

    for (const auto& [key, value] : parser.get_overrides()) {
        config.set(key, value);
    }
    if (parser.has_option("release-tag")) {
        config.set("github.release_tag", parser.get_option("release-tag"));
    }

    CommandContext context{config};
    context.interrupted = &g_interrupted;
    context.replace_existing = !parser.has_option("keep-existing");
    context.label = parser.get_option("label");
    if (parser.has_option("size")) {
        uint64_t size = 0;
        if (!parse_size(parser.get_option("size"), size)) {
            std::cerr << "Error: --size expects a byte count\n";
            return 2;
        }
        context.declared_size = size;
    }

    auto log_level = parser.has_option("verbose")
        ? LogLevel::Debug
        : Logger::parse_level(config.get_string("log.level", "info"));
    Logger::initialize(utils::FileUtils::expand_user(config.get_string("log.file", "assetrelay.log")).string(),
                       log_level);

    LOG_DEBUG("AssetRelay starting up");

    std::signal(SIGINT, handle_interrupt);
    std::signal(SIGTERM, handle_interrupt);

    CommandRegistry command_registry(context);

    auto& args = parser.get_positional_args();
    if (args.empty()) {
        parser.print_help();
        command_registry.print_help();
        Logger::shutdown();
        return 0;
    }

    std::string command = args[0];

    auto result = command_registry.execute_command(command, args);

    if (!result.success) {
        std::cerr << "Error: " << result.message << "\n";
        if (!command_registry.has_command(command)) {
            command_registry.print_help(std::cerr);
        }
    }

    Logger::shutdown();
    return result.exit_code;
}
