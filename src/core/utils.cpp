#include "peerlink/core/utils.hpp"
#include <fmt/format.h>
#include <algorithm>
#include <array>
#include <cctype>
#include <cstdlib>
#include <ctime>

namespace peerlink::core::utils {

std::vector<std::string> StringUtils::split(const std::string& str, char delimiter) {
    std::vector<std::string> parts;
    if (str.empty()) {
        return parts;
    }

    std::string::size_type begin = 0;
    for (;;) {
        auto end = str.find(delimiter, begin);
        if (end == std::string::npos) {
            parts.push_back(str.substr(begin));
            return parts;
        }
        parts.push_back(str.substr(begin, end - begin));
        begin = end + 1;
    }
}

std::string StringUtils::trim(const std::string& str) {
    auto not_space = [](unsigned char c) { return !std::isspace(c); };

    auto first = std::find_if(str.begin(), str.end(), not_space);
    auto last = std::find_if(str.rbegin(), str.rend(), not_space).base();
    return first < last ? std::string(first, last) : std::string();
}

std::string StringUtils::to_lower(const std::string& str) {
    std::string lowered(str.size(), '\0');
    std::transform(str.begin(), str.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lowered;
}

std::string StringUtils::format_bytes(std::uint64_t bytes) {
    static constexpr std::array<const char*, 5> units = {"B", "KB", "MB", "GB", "TB"};

    double value = static_cast<double>(bytes);
    std::size_t unit = 0;
    for (; value >= 1024.0 && unit + 1 < units.size(); ++unit) {
        value /= 1024.0;
    }
    return fmt::format("{:.2f} {}", value, units[unit]);
}

std::string StringUtils::format_duration(std::chrono::milliseconds duration) {
    using namespace std::chrono;

    if (duration < seconds(1)) {
        return fmt::format("{}ms", duration.count());
    }
    if (duration < minutes(1)) {
        return fmt::format("{}s", duration_cast<seconds>(duration).count());
    }
    if (duration < hours(1)) {
        auto whole_minutes = duration_cast<minutes>(duration);
        return fmt::format("{}m {}s", whole_minutes.count(),
                           duration_cast<seconds>(duration - whole_minutes).count());
    }
    auto whole_hours = duration_cast<hours>(duration);
    return fmt::format("{}h {}m", whole_hours.count(),
                       duration_cast<minutes>(duration - whole_hours).count());
}

std::optional<std::uint64_t> FileUtils::file_size(const std::filesystem::path& path) {
    std::error_code ec;
    auto size = std::filesystem::file_size(path, ec);
    if (ec) {
        return std::nullopt;
    }
    return size;
}

bool FileUtils::create_directories(const std::filesystem::path& path) {
    std::error_code ec;
    std::filesystem::create_directories(path, ec);
    return !ec && std::filesystem::is_directory(path, ec);
}

std::filesystem::path FileUtils::get_home_dir() {
    if (const char* home = std::getenv("HOME")) {
        return home;
    }
    return ".";
}

std::filesystem::path FileUtils::expand_home(const std::string& path) {
    if (path == "~") {
        return get_home_dir();
    }
    if (path.starts_with("~/")) {
        return get_home_dir() / path.substr(2);
    }
    return path;
}

std::uint64_t TimeUtils::unix_millis(std::chrono::system_clock::time_point time) {
    using namespace std::chrono;
    return static_cast<std::uint64_t>(duration_cast<milliseconds>(time.time_since_epoch()).count());
}

std::chrono::system_clock::time_point TimeUtils::from_unix_millis(std::uint64_t millis) {
    return std::chrono::system_clock::time_point(std::chrono::milliseconds(millis));
}

std::string TimeUtils::to_iso_string(const std::chrono::system_clock::time_point& time) {
    std::time_t seconds = std::chrono::system_clock::to_time_t(time);
    std::tm utc{};
    gmtime_r(&seconds, &utc);

    char buffer[32];
    auto length = std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%SZ", &utc);
    return std::string(buffer, length);
}

}
