#include "assetrelay/core/config.hpp"
#include <algorithm>
#include <array>
#include <cctype>
#include <cstdlib>
#include <utility>

namespace assetrelay::core {

Config& Config::instance() {
    static Config instance;
    return instance;
}

bool Config::load_from_file(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        return false;
    }

    std::string line;
    while (std::getline(file, line)) {
        line = trim(line);

        if (line.empty() || line[0] == '#') {
            continue;
        }

        auto eq_pos = line.find('=');
        if (eq_pos == std::string::npos) {
            continue;
        }

        std::string key = trim(line.substr(0, eq_pos));
        std::string value = trim(line.substr(eq_pos + 1));

        if (!key.empty()) {
            values_[key] = value;
        }
    }

    return true;
}

bool Config::save_to_file(const std::string& filename) const {
    std::ofstream file(filename);
    if (!file.is_open()) {
        return false;
    }

    file << "# AssetRelay Configuration\n\n";

    for (const auto& [key, value] : values_) {
        file << key << "=" << value << "\n";
    }

    return file.good();
}

void Config::load_from_env() {
    static const std::array<std::pair<const char*, const char*>, 4> mapping{{
        {"GITHUB_TOKEN", "github.token"},
        {"GITHUB_REPO", "github.repo"},
        {"GITHUB_RELEASE_TAG", "github.release_tag"},
        {"LOG_LEVEL", "log.level"},
    }};

    for (const auto& [variable, key] : mapping) {
        const char* value = std::getenv(variable);
        if (value && *value) {
            values_[key] = trim(value);
        }
    }
}

void Config::set(const std::string& key, const std::string& value) {
    values_[key] = value;
}

std::optional<std::string> Config::get(const std::string& key) const {
    auto it = values_.find(key);
    if (it != values_.end()) {
        return it->second;
    }
    return std::nullopt;
}

bool Config::has(const std::string& key) const {
    return values_.find(key) != values_.end();
}

bool Config::get_bool(const std::string& key, bool default_value) const {
    auto value = get(key);
    if (!value) return default_value;

    std::string lower = *value;
    std::transform(lower.begin(), lower.end(), lower.begin(), ::tolower);
    return lower == "true" || lower == "1" || lower == "yes";
}

int Config::get_int(const std::string& key, int default_value) const {
    auto value = get_as<int>(key);
    return value ? *value : default_value;
}

std::uint64_t Config::get_uint64(const std::string& key, std::uint64_t default_value) const {
    auto value = get_as<std::uint64_t>(key);
    return value ? *value : default_value;
}

double Config::get_double(const std::string& key, double default_value) const {
    auto value = get_as<double>(key);
    return value ? *value : default_value;
}

std::string Config::get_string(const std::string& key, const std::string& default_value) const {
    auto value = get(key);
    return value ? *value : default_value;
}

void Config::set_defaults() {
    values_["sink.max_asset_bytes"] = "2147483648";
    values_["progress.min_interval_ms"] = "1000";
    values_["retry.max_retries"] = "3";
    values_["retry.base_delay_ms"] = "1000";
    values_["retry.factor"] = "2";
    values_["retry.max_delay_ms"] = "30000";
    values_["network.idle_timeout_s"] = "60";
    values_["transfer.chunk_size"] = "1048576";
    values_["transfer.max_file_size"] = "4294967296";
    values_["transfer.cleanup_on_failure"] = "false";
    values_["github.api_url"] = "https://api.github.com";
    values_["github.upload_url"] = "https://uploads.github.com";
    values_["http.user_agent"] = "assetrelay/1.0";
    values_["log.level"] = "info";
    values_["log.file"] = "assetrelay.log";
}

std::string Config::trim(const std::string& str) const {
    auto start = str.begin();
    while (start != str.end() && std::isspace(static_cast<unsigned char>(*start))) {
        start++;
    }

    auto end = str.end();
    while (end != start && std::isspace(static_cast<unsigned char>(*(end - 1)))) {
        end--;
    }

    return std::string(start, end);
}

}
