#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace assetrelay::core::utils {

class StringUtils {
public:
    static std::vector<std::string> split(const std::string& str, char delimiter);
    static std::string join(const std::vector<std::string>& parts, const std::string& delimiter);
    static std::string trim(const std::string& str);
    static std::string to_lower(const std::string& str);
    static std::string to_upper(const std::string& str);
    static bool starts_with(const std::string& str, const std::string& prefix);
    static bool ends_with(const std::string& str, const std::string& suffix);

    static std::string format_bytes(std::uint64_t bytes);
    static std::string format_duration(std::chrono::milliseconds duration);

    // RFC 3986 percent-encoding; unreserved characters pass through.
    static std::string url_encode(const std::string& str);

    // Last path segment of `url` with query and fragment removed, or
    // "download_<unix-seconds>" when that segment is empty.
    static std::string filename_from_url(const std::string& url,
                                         std::chrono::system_clock::time_point now =
                                             std::chrono::system_clock::now());
};

class FileUtils {
public:
    static bool exists(const std::filesystem::path& path);
    static bool is_file(const std::filesystem::path& path);
    static std::optional<std::uint64_t> file_size(const std::filesystem::path& path);
    static bool create_directories(const std::filesystem::path& path);
    static std::filesystem::path get_temp_dir();
    static std::filesystem::path get_home_dir();

    // Replaces a leading "~" with the home directory.
    static std::filesystem::path expand_user(const std::string& path);
};

} // namespace assetrelay::core::utils
