#include "bgupload/core/cli.hpp"
#include "bgupload/core/utils.hpp"
#include <algorithm>
#include <charconv>
#include <iomanip>
#include <iostream>

namespace bgupload::core {

namespace {

bool parse_integer(const std::string& text, long long& value) {
    const char* first = text.data();
    const char* last = first + text.size();
    auto [ptr, ec] = std::from_chars(first, last, value);
    return ec == std::errc() && ptr == last && !text.empty();
}

}

CommandLineParser::CommandLineParser(std::string program_name)
    : program_name_(std::move(program_name)) {
    add_option("h", "help", "Show this help message");
    add_option("v", "version", "Show version information");
    add_option("c", "config", "Configuration file path", OptionType::Text, "~/.bgupload.conf");
    add_option("", "verbose", "Enable debug logging");
}

void CommandLineParser::add_option(const std::string& short_name, const std::string& long_name,
                                   const std::string& description, OptionType type,
                                   const std::string& default_value) {
    options_[long_name] = Option{long_name, description, type, default_value};
    
    if (!short_name.empty()) {
        short_to_long_[short_name] = long_name;
    }
}

void CommandLineParser::add_command(const std::string& name, const std::string& usage,
                                    const std::string& description) {
    commands_.push_back(Command{name, usage, description});
}

bool CommandLineParser::parse(int argc, char* argv[]) {
    positional_args_.clear();
    parsed_options_.clear();
    error_.clear();
    
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        
        bool ok = true;
        if (arg.starts_with("--")) {
            ok = parse_long(arg, i, argc, argv);
        } else if (arg.starts_with("-") && arg.length() > 1) {
            ok = parse_short(arg, i, argc, argv);
        } else {
            positional_args_.push_back(arg);
        }
        
        if (!ok) {
            return false;
        }
    }
    
    if (!commands_.empty() && !positional_args_.empty()) {
        auto known = std::any_of(commands_.begin(), commands_.end(),
                                 [this](const Command& c) { return c.name == positional_args_.front(); });
        if (!known) {
            return fail("Unknown command: " + positional_args_.front());
        }
    }
    
    return true;
}

bool CommandLineParser::parse_long(const std::string& arg, int& index, int argc, char* argv[]) {
    auto eq_pos = arg.find('=');
    auto name = arg.substr(2, eq_pos == std::string::npos ? std::string::npos : eq_pos - 2);
    
    const Option* option = find_option(name);
    if (!option) {
        return fail("Unknown option: --" + name);
    }
    
    if (option->type == OptionType::Flag) {
        if (eq_pos != std::string::npos) {
            return fail("Option --" + name + " does not take a value");
        }
        return store(*option, "true");
    }
    
    if (eq_pos != std::string::npos) {
        return store(*option, arg.substr(eq_pos + 1));
    }
    if (index + 1 < argc) {
        return store(*option, argv[++index]);
    }
    return fail("Option --" + name + " requires a value");
}

bool CommandLineParser::parse_short(const std::string& arg, int& index, int argc, char* argv[]) {
    // Flags may be grouped ("-hv"); a value option consumes the rest of the
    // group or the next argument.
    for (std::size_t j = 1; j < arg.length(); ++j) {
        std::string short_name(1, arg[j]);
        
        auto it = short_to_long_.find(short_name);
        if (it == short_to_long_.end()) {
            return fail("Unknown option: -" + short_name);
        }
        
        const Option& option = options_.at(it->second);
        if (option.type == OptionType::Flag) {
            if (!store(option, "true")) {
                return false;
            }
            continue;
        }
        
        if (j + 1 < arg.length()) {
            return store(option, arg.substr(j + 1));
        }
        if (index + 1 < argc) {
            return store(option, argv[++index]);
        }
        return fail("Option -" + short_name + " requires a value");
    }
    
    return true;
}

bool CommandLineParser::store(const Option& option, const std::string& value) {
    long long ignored = 0;
    if (option.type == OptionType::Integer && !parse_integer(value, ignored)) {
        return fail("Option --" + option.long_name + " expects an integer, got '" + value + "'");
    }
    
    parsed_options_[option.long_name] = value;
    return true;
}

bool CommandLineParser::fail(std::string message) {
    error_ = std::move(message);
    return false;
}

bool CommandLineParser::has_option(const std::string& name) const {
    return parsed_options_.count(normalize_option_name(name)) > 0;
}

std::string CommandLineParser::get_option(const std::string& name, const std::string& default_value) const {
    auto normalized = normalize_option_name(name);
    
    auto it = parsed_options_.find(normalized);
    if (it != parsed_options_.end()) {
        return it->second;
    }
    
    const Option* option = find_option(normalized);
    if (option && !option->default_value.empty()) {
        return option->default_value;
    }
    
    return default_value;
}

std::optional<long long> CommandLineParser::get_int_option(const std::string& name) const {
    long long value = 0;
    if (!parse_integer(get_option(name), value)) {
        return std::nullopt;
    }
    return value;
}

bool CommandLineParser::get_bool_option(const std::string& name, bool default_value) const {
    if (!has_option(name)) return default_value;
    
    auto value = utils::StringUtils::to_lower(get_option(name));
    return value == "true" || value == "1" || value == "yes";
}

std::string CommandLineParser::command() const {
    return positional_args_.empty() ? std::string() : positional_args_.front();
}

std::vector<std::string> CommandLineParser::command_args() const {
    if (positional_args_.empty()) {
        return {};
    }
    return std::vector<std::string>(positional_args_.begin() + 1, positional_args_.end());
}

void CommandLineParser::print_help() const {
    std::cout << "Usage: " << program_name_ << " [options] <command> [args...]\n\n";
    std::cout << "Options:\n";
    
    for (const auto& [name, option] : options_) {
        std::string label;
        for (const auto& [short_name, long_name] : short_to_long_) {
            if (long_name == name) {
                label = "-" + short_name + ", ";
                break;
            }
        }
        label += "--" + name;
        if (option.type == OptionType::Integer) {
            label += " <n>";
        } else if (option.type == OptionType::Text) {
            label += " <value>";
        }
        
        std::cout << "  " << std::left << std::setw(24) << label << option.description;
        if (!option.default_value.empty()) {
            std::cout << " (default: " << option.default_value << ")";
        }
        std::cout << "\n";
    }
    
    if (!commands_.empty()) {
        std::cout << "\nCommands:\n";
        for (const auto& command : commands_) {
            std::cout << "  " << std::left << std::setw(24) << command.usage << command.description << "\n";
        }
    }
}

void CommandLineParser::print_version() const {
    std::cout << program_name_ << " version 1.0.0\n";
    std::cout << "Built with C++20\n";
}

const CommandLineParser::Option* CommandLineParser::find_option(const std::string& name) const {
    auto it = options_.find(name);
    return it != options_.end() ? &it->second : nullptr;
}

std::string CommandLineParser::normalize_option_name(const std::string& name) const {
    auto it = short_to_long_.find(name);
    return it != short_to_long_.end() ? it->second : name;
}

}
