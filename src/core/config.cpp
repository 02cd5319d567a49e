#include "bgupload/core/config.hpp"
#include "bgupload/core/logger.hpp"
#include "bgupload/core/utils.hpp"
#include <fstream>

namespace bgupload::core {

using utils::StringUtils;

Config& Config::instance() {
    static Config instance;
    return instance;
}

bool Config::load_from_file(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        LOG_WARN("Cannot open configuration file {}", filename);
        return false;
    }
    
    std::string line;
    std::size_t line_number = 0;
    std::size_t loaded = 0;
    while (std::getline(file, line)) {
        ++line_number;
        if (parse_line(line, line_number)) {
            ++loaded;
        }
    }
    
    LOG_DEBUG("Loaded {} settings from {}", loaded, filename);
    return true;
}

bool Config::parse_line(const std::string& raw, std::size_t line_number) {
    auto line = StringUtils::trim(raw);
    if (line.empty() || line[0] == '#') {
        return false;
    }
    
    auto eq_pos = line.find('=');
    auto key = eq_pos == std::string::npos ? std::string() : StringUtils::trim(line.substr(0, eq_pos));
    if (key.empty()) {
        LOG_WARN("Ignoring malformed configuration line {}: '{}'", line_number, line);
        return false;
    }
    
    values_[key] = StringUtils::trim(line.substr(eq_pos + 1));
    return true;
}

bool Config::save_to_file(const std::string& filename) const {
    std::ofstream file(filename);
    if (!file.is_open()) {
        return false;
    }
    
    file << "# bgupload configuration\n";
    
    std::string section;
    for (const auto& [key, value] : values_) {
        auto prefix = key.substr(0, key.find('.'));
        if (prefix != section) {
            file << "\n";
            section = prefix;
        }
        file << key << "=" << value << "\n";
    }
    
    return static_cast<bool>(file);
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
    if (!value) return default_value;
    
    auto lower = StringUtils::to_lower(*value);
    if (lower == "true" || lower == "1" || lower == "yes" || lower == "on") return true;
    if (lower == "false" || lower == "0" || lower == "no" || lower == "off") return false;
    
    LOG_WARN("Setting {}='{}' is not a boolean, using {}", key, *value, default_value);
    return default_value;
}

int Config::get_int(const std::string& key, int default_value) const {
    return get_as<int>(key).value_or(default_value);
}

std::uint64_t Config::get_uint64(const std::string& key, std::uint64_t default_value) const {
    auto value = get(key);
    if (!value || value->starts_with("-")) return default_value;
    return get_as<std::uint64_t>(key).value_or(default_value);
}

std::string Config::get_string(const std::string& key, const std::string& default_value) const {
    return get(key).value_or(default_value);
}

void Config::set_defaults() {
    values_["log.level"] = "info";
    values_["log.file"] = "bgupload.log";
    values_["service.worker_threads"] = "2";
    values_["service.chunk_size"] = "65536";
    values_["service.tick_interval_ms"] = "20";
    values_["upload.remove_on_completion"] = "true";
}

}
