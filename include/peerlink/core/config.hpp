#pragma once

#include <cstdint>
#include <string>
#include <map>
#include <optional>
#include <sstream>
#include <fstream>

namespace peerlink::core {

// key=value configuration. Lines starting with '#' are comments and a
// "[section]" line prefixes the keys after it with "section.".
// Keys are dotted ("transfer.chunk_size"); peer profiles use "peer.<name>".
class Config {
public:
    Config() = default;

    bool load_from_file(const std::string& filename);
    bool save_to_file(const std::string& filename) const;

    void set(const std::string& key, const std::string& value);
    std::optional<std::string> get(const std::string& key) const;
    bool has(const std::string& key) const { return values_.count(key) > 0; }
    void clear() { values_.clear(); }

    template<typename T>
    std::optional<T> get_as(const std::string& key) const {
        auto value = get(key);
        if (!value) {
            return std::nullopt;
        }

        std::istringstream iss(*value);
        T result;
        if (!(iss >> result) || !(iss >> std::ws).eof()) {
            return std::nullopt;
        }
        return result;
    }

    bool get_bool(const std::string& key, bool default_value = false) const;
    int get_int(const std::string& key, int default_value = 0) const;
    std::uint64_t get_uint64(const std::string& key, std::uint64_t default_value = 0) const;
    std::string get_string(const std::string& key, const std::string& default_value = "") const;

    // Every key that starts with `prefix`, with the prefix stripped.
    std::map<std::string, std::string> get_section(const std::string& prefix) const;

    void set_defaults();

private:
    std::map<std::string, std::string> values_;
};

}
