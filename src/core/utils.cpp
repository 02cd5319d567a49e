#include "bgupload/core/utils.hpp"
#include <algorithm>
#include <array>
#include <cctype>
#include <cstdlib>
#include <iomanip>
#include <sstream>

namespace bgupload::core::utils {

namespace {

bool is_space(unsigned char c) {
    return std::isspace(c) != 0;
}

}

std::string StringUtils::trim(const std::string& str) {
    auto first = std::find_if_not(str.begin(), str.end(), is_space);
    auto last = std::find_if_not(str.rbegin(), std::string::const_reverse_iterator(first), is_space).base();
    return std::string(first, last);
}

std::string StringUtils::to_lower(const std::string& str) {
    std::string result(str.size(), '\0');
    std::transform(str.begin(), str.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

std::string StringUtils::format_bytes(std::uint64_t bytes) {
    static constexpr std::array<const char*, 5> units{"B", "KB", "MB", "GB", "TB"};
    
    std::size_t unit = 0;
    auto size = static_cast<double>(bytes);
    for (; size >= 1024.0 && unit + 1 < units.size(); ++unit) {
        size /= 1024.0;
    }
    
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << size << " " << units[unit];
    return oss.str();
}

std::string StringUtils::format_duration(std::chrono::milliseconds duration) {
    using namespace std::chrono;
    
    if (duration < seconds(1)) {
        return std::to_string(duration.count()) + "ms";
    }
    
    auto h = duration_cast<hours>(duration);
    auto m = duration_cast<minutes>(duration - h);
    auto s = duration_cast<seconds>(duration - h - m);
    
    if (h.count() > 0) {
        return std::to_string(h.count()) + "h " + std::to_string(m.count()) + "m";
    }
    if (m.count() > 0) {
        return std::to_string(m.count()) + "m " + std::to_string(s.count()) + "s";
    }
    return std::to_string(s.count()) + "s";
}

std::string StringUtils::format_percentage(double percentage) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1) << percentage << "%";
    return oss.str();
}

bool FileUtils::exists(const std::filesystem::path& path) {
    std::error_code ec;
    return std::filesystem::exists(path, ec);
}

std::optional<std::uint64_t> FileUtils::file_size(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        return std::nullopt;
    }
    
    auto size = std::filesystem::file_size(path, ec);
    if (ec) return std::nullopt;
    return static_cast<std::uint64_t>(size);
}

std::filesystem::path FileUtils::get_home_dir() {
    for (const char* variable : {"HOME", "USERPROFILE"}) {
        if (const char* home = std::getenv(variable)) {
            return std::filesystem::path(home);
        }
    }
    return std::filesystem::path(".");
}

std::filesystem::path FileUtils::expand_user(const std::string& path) {
    if (path == "~") {
        return get_home_dir();
    }
    if (path.starts_with("~/")) {
        return get_home_dir() / path.substr(2);
    }
    return std::filesystem::path(path);
}

}
