#include "peerlink/core/config.hpp"
#include "peerlink/core/utils.hpp"
#include <utility>

namespace peerlink::core {

using utils::StringUtils;

namespace {

const std::pair<const char*, const char*> DEFAULTS[] = {
    {"node.name", "peerlink"},
    {"listen.address", "0.0.0.0"},
    {"listen.port", "12345"},
    {"storage.save_directory", "./received"},
    {"storage.data_directory", "./.peerlink"},
    {"transfer.chunk_size", "65536"},
    {"transfer.window_bytes", "1048576"},
    {"transfer.ack_timeout_ms", "5000"},
    {"transfer.max_chunk_retries", "3"},
    {"transfer.start_timeout_ms", "10000"},
    {"transfer.complete_timeout_ms", "30000"},
    {"transfer.progress_interval_ms", "250"},
    {"transfer.checksum", "blake2b"},
    {"transfer.durable_writes", "true"},
    {"transfer.auto_requeue_failed", "false"},
    {"connection.connect_timeout_ms", "10000"},
    {"connection.heartbeat_interval_ms", "15000"},
    {"connection.idle_timeout_ms", "60000"},
    {"reconnect.initial_delay_ms", "1000"},
    {"reconnect.max_delay_ms", "30000"},
    {"reconnect.window_ms", "180000"},
    {"network.io_threads", "2"},
    {"log.level", "info"},
    {"log.file", "peerlink.log"},
    {"log.max_file_bytes", "5242880"},
    {"log.max_files", "3"},
    {"log.console", "true"},
};

}

bool Config::load_from_file(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        return false;
    }

    std::string section;
    for (std::string raw; std::getline(file, raw);) {
        auto line = StringUtils::trim(raw);
        if (line.empty() || line.front() == '#') {
            continue;
        }

        if (line.front() == '[' && line.back() == ']') {
            section = StringUtils::trim(line.substr(1, line.size() - 2));
            continue;
        }

        auto eq = line.find('=');
        if (eq == std::string::npos) {
            continue;
        }

        auto key = StringUtils::trim(line.substr(0, eq));
        if (key.empty()) {
            continue;
        }
        values_[section.empty() ? key : section + "." + key] = StringUtils::trim(line.substr(eq + 1));
    }
    return true;
}

bool Config::save_to_file(const std::string& filename) const {
    std::ofstream file(filename);
    if (!file.is_open()) {
        return false;
    }

    file << "# peerlink configuration\n";

    // Keys without a dot have to come before the first section header.
    for (const auto& [key, value] : values_) {
        if (key.find('.') == std::string::npos) {
            file << key << " = " << value << "\n";
        }
    }

    std::string section;
    for (const auto& [key, value] : values_) {
        auto dot = key.find('.');
        if (dot == std::string::npos) {
            continue;
        }
        if (key.compare(0, dot, section) != 0) {
            section = key.substr(0, dot);
            file << "\n[" << section << "]\n";
        }
        file << key.substr(dot + 1) << " = " << value << "\n";
    }
    return file.good();
}

void Config::set(const std::string& key, const std::string& value) {
    values_[key] = value;
}

std::optional<std::string> Config::get(const std::string& key) const {
    auto it = values_.find(key);
    if (it == values_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool Config::get_bool(const std::string& key, bool default_value) const {
    auto value = get(key);
    if (!value) {
        return default_value;
    }

    auto word = StringUtils::to_lower(*value);
    for (const char* yes : {"true", "1", "yes", "on"}) {
        if (word == yes) {
            return true;
        }
    }
    for (const char* no : {"false", "0", "no", "off"}) {
        if (word == no) {
            return false;
        }
    }
    return default_value;
}

int Config::get_int(const std::string& key, int default_value) const {
    return get_as<int>(key).value_or(default_value);
}

std::uint64_t Config::get_uint64(const std::string& key, std::uint64_t default_value) const {
    // istream would wrap "-5" around to a huge unsigned value.
    auto raw = get(key);
    if (!raw || raw->empty() || raw->front() == '-') {
        return default_value;
    }
    return get_as<std::uint64_t>(key).value_or(default_value);
}

std::string Config::get_string(const std::string& key, const std::string& default_value) const {
    return get(key).value_or(default_value);
}

std::map<std::string, std::string> Config::get_section(const std::string& prefix) const {
    std::map<std::string, std::string> section;
    for (auto it = values_.lower_bound(prefix); it != values_.end() && it->first.starts_with(prefix); ++it) {
        section.emplace(it->first.substr(prefix.size()), it->second);
    }
    return section;
}

void Config::set_defaults() {
    for (const auto& [key, value] : DEFAULTS) {
        values_[key] = value;
    }
}

}
