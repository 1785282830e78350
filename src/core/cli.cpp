#include "assetrelay/core/cli.hpp"
#include "assetrelay/core/utils.hpp"
#include <iomanip>
#include <iostream>

namespace assetrelay::core {

CommandLineParser::CommandLineParser(const std::string& program_name)
    : program_name_(program_name) {

    add_option("h", "help", "Show this help message");
    add_option("v", "version", "Show version information");
    add_option("c", "config", "Configuration file path", true, "~/.assetrelay.conf");
    add_option("", "verbose", "Enable debug logging");
    add_option("r", "release-tag", "Release tag to upload into", true);
    add_option("s", "size", "Declared size in bytes of the source", true);
    add_option("", "keep-existing", "Fail instead of replacing an asset with the same name");
    add_option("", "label", "Label used for this transfer in logs", true);
    add_option("", "set", "Override a configuration key (key=value)", true);
}

void CommandLineParser::add_option(const std::string& short_name, const std::string& long_name,
                                   const std::string& description, bool has_value,
                                   const std::string& default_value) {
    Option option{long_name, description, has_value, default_value};

    if (!long_name.empty()) {
        options_[long_name] = option;
    }

    if (!short_name.empty()) {
        short_to_long_[short_name] = long_name;
        if (long_name.empty()) {
            options_[short_name] = option;
        }
    }
}

bool CommandLineParser::store_option(const std::string& name, const std::string& value) {
    if (name != "set") {
        parsed_options_[name] = value;
        return true;
    }

    auto eq_pos = value.find('=');
    if (eq_pos == std::string::npos || eq_pos == 0) {
        error_ = "Option --set expects key=value, got: " + value;
        return false;
    }
    overrides_.emplace_back(utils::StringUtils::trim(value.substr(0, eq_pos)),
                            utils::StringUtils::trim(value.substr(eq_pos + 1)));
    parsed_options_[name] = value;
    return true;
}

bool CommandLineParser::parse(int argc, char* argv[]) {
    positional_args_.clear();
    parsed_options_.clear();
    overrides_.clear();
    error_.clear();

    bool options_done = false;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (options_done) {
            positional_args_.push_back(arg);
        }
        else if (arg == "--") {
            options_done = true;
        }
        else if (arg.starts_with("--")) {
            auto eq_pos = arg.find('=');
            std::string option_name = arg.substr(2, eq_pos - 2);

            auto it = options_.find(option_name);
            if (it == options_.end()) {
                error_ = "Unknown option: --" + option_name;
                return false;
            }

            if (it->second.has_value) {
                std::string value;
                if (eq_pos != std::string::npos) {
                    value = arg.substr(eq_pos + 1);
                } else if (i + 1 < argc) {
                    value = argv[++i];
                } else {
                    error_ = "Option --" + option_name + " requires a value";
                    return false;
                }
                if (!store_option(option_name, value)) {
                    return false;
                }
            } else {
                parsed_options_[option_name] = "true";
            }
        }
        // A lone "-" names stdin and is positional.
        else if (arg.starts_with("-") && arg.length() > 1) {
            for (size_t j = 1; j < arg.length(); ++j) {
                std::string short_opt(1, arg[j]);

                auto long_it = short_to_long_.find(short_opt);
                if (long_it == short_to_long_.end()) {
                    error_ = "Unknown option: -" + short_opt;
                    return false;
                }

                std::string long_name = long_it->second;
                auto opt_it = options_.find(long_name);

                if (opt_it->second.has_value) {
                    std::string value;
                    if (j == arg.length() - 1) {
                        if (i + 1 < argc) {
                            value = argv[++i];
                        } else {
                            error_ = "Option -" + short_opt + " requires a value";
                            return false;
                        }
                    } else {
                        value = arg.substr(j + 1);
                    }
                    if (!store_option(long_name, value)) {
                        return false;
                    }
                    break;
                }
                parsed_options_[long_name] = "true";
            }
        }
        else {
            positional_args_.push_back(arg);
        }
    }

    return true;
}

bool CommandLineParser::has_option(const std::string& name) const {
    std::string normalized = normalize_option_name(name);
    return parsed_options_.find(normalized) != parsed_options_.end();
}

std::string CommandLineParser::get_option(const std::string& name, const std::string& default_value) const {
    std::string normalized = normalize_option_name(name);
    auto it = parsed_options_.find(normalized);
    if (it != parsed_options_.end()) {
        return it->second;
    }

    auto opt_it = options_.find(normalized);
    if (opt_it != options_.end() && !opt_it->second.default_value.empty()) {
        return opt_it->second.default_value;
    }

    return default_value;
}

int CommandLineParser::get_int_option(const std::string& name, int default_value) const {
    auto value = get_option(name);
    if (value.empty()) return default_value;

    try {
        return std::stoi(value);
    } catch (const std::exception&) {
        return default_value;
    }
}

bool CommandLineParser::get_bool_option(const std::string& name, bool default_value) const {
    if (!has_option(name)) return default_value;

    auto value = utils::StringUtils::to_lower(get_option(name));
    return value == "true" || value == "1" || value == "yes" || value.empty();
}

void CommandLineParser::print_help(std::ostream& out) const {
    out << "Usage: " << program_name_ << " [options] <command> [args...]\n\n";
    out << "Options:\n";

    for (const auto& [name, option] : options_) {
        std::string flags = "--" + name;
        for (const auto& [short_name, long_name] : short_to_long_) {
            if (long_name == name) {
                flags = "-" + short_name + ", " + flags;
                break;
            }
        }
        if (option.has_value) {
            flags += name == "set" ? " <key=value>" : " <value>";
        }

        out << "  " << std::left << std::setw(28) << flags << option.description;
        if (!option.default_value.empty()) {
            out << " (default: " << option.default_value << ")";
        }
        out << "\n";
    }

    out << "\nEnvironment:\n"
        << "  GITHUB_TOKEN, GITHUB_REPO, GITHUB_RELEASE_TAG, LOG_LEVEL\n"
        << "  override the config file; --set and --release-tag override both.\n";
}

void CommandLineParser::print_version(std::ostream& out) const {
    out << program_name_ << " 1.0.0\n";
}

std::string CommandLineParser::normalize_option_name(const std::string& name) const {
    auto it = short_to_long_.find(name);
    return it != short_to_long_.end() ? it->second : name;
}

}
