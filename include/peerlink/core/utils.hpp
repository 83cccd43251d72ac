#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include <chrono>
#include <optional>
#include <filesystem>

namespace peerlink::core::utils {

class StringUtils {
public:
    static std::vector<std::string> split(const std::string& str, char delimiter);
    static std::string trim(const std::string& str);
    static std::string to_lower(const std::string& str);
    static std::string format_bytes(std::uint64_t bytes);
    static std::string format_duration(std::chrono::milliseconds duration);
};

class FileUtils {
public:
    static std::optional<std::uint64_t> file_size(const std::filesystem::path& path);
    static bool create_directories(const std::filesystem::path& path);

    // "report.pdf" -> "report_1.pdf", "report_2.pdf", ... until `taken` says no.
    template<typename Predicate>
    static std::filesystem::path unique_path(const std::filesystem::path& desired, Predicate taken) {
        if (!taken(desired)) {
            return desired;
        }

        auto stem = desired.stem().string();
        auto extension = desired.extension().string();
        auto parent = desired.parent_path();

        for (unsigned counter = 1;; ++counter) {
            auto candidate = parent / (stem + "_" + std::to_string(counter) + extension);
            if (!taken(candidate)) {
                return candidate;
            }
        }
    }

    static std::filesystem::path get_home_dir();
    static std::filesystem::path expand_home(const std::string& path);
};

class TimeUtils {
public:
    static std::uint64_t unix_millis(std::chrono::system_clock::time_point time);
    static std::chrono::system_clock::time_point from_unix_millis(std::uint64_t millis);
    static std::string to_iso_string(const std::chrono::system_clock::time_point& time);
};

}
