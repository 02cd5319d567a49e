#pragma once

#include <string>
#include <optional>
#include <chrono>
#include <filesystem>
#include <cstdint>

namespace bgupload::core::utils {

class StringUtils {
public:
    static std::string trim(const std::string& str);
    static std::string to_lower(const std::string& str);
    
    static std::string format_bytes(std::uint64_t bytes);
    static std::string format_duration(std::chrono::milliseconds duration);
    static std::string format_percentage(double percentage);
};

class FileUtils {
public:
    static bool exists(const std::filesystem::path& path);
    static std::optional<std::uint64_t> file_size(const std::filesystem::path& path);
    
    static std::filesystem::path get_home_dir();
    // Expands a leading "~/" to the home directory
    static std::filesystem::path expand_user(const std::string& path);
};

}
