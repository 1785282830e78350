#pragma once

#include <cstdint>
#include <fstream>
#include <map>
#include <optional>
#include <sstream>
#include <string>
#include <type_traits>

namespace assetrelay::core {

class Config {
public:
    static Config& instance();

    Config() = default;

    bool load_from_file(const std::string& filename);
    bool save_to_file(const std::string& filename) const;

    // Maps GITHUB_TOKEN, GITHUB_REPO, GITHUB_RELEASE_TAG and LOG_LEVEL onto
    // their config keys. Unset or empty variables leave the current value.
    void load_from_env();

    void set(const std::string& key, const std::string& value);
    std::optional<std::string> get(const std::string& key) const;
    bool has(const std::string& key) const;
    void clear() { values_.clear(); }

    template <typename T>
    std::optional<T> get_as(const std::string& key) const {
        auto value = get(key);
        if (!value || value->empty()) {
            return std::nullopt;
        }
        if constexpr (std::is_unsigned_v<T>) {
            if ((*value)[0] == '-') {
                return std::nullopt;
            }
        }

        std::istringstream iss(*value);
        T result{};
        iss >> result;
        if (iss.fail()) {
            return std::nullopt;
        }
        iss >> std::ws;
        if (!iss.eof()) {
            return std::nullopt;
        }
        return result;
    }

    bool get_bool(const std::string& key, bool default_value = false) const;
    int get_int(const std::string& key, int default_value = 0) const;
    std::uint64_t get_uint64(const std::string& key, std::uint64_t default_value = 0) const;
    double get_double(const std::string& key, double default_value = 0.0) const;
    std::string get_string(const std::string& key, const std::string& default_value = "") const;

    void set_defaults();

    const std::map<std::string, std::string>& values() const { return values_; }

private:
    std::map<std::string, std::string> values_;

    std::string trim(const std::string& str) const;
};

} // namespace assetrelay::core
