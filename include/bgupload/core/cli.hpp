#pragma once

#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace bgupload::core {

enum class OptionType {
    Flag,
    Text,
    Integer
};

class CommandLineParser {
public:
    explicit CommandLineParser(std::string program_name);
    
    void add_option(const std::string& short_name, const std::string& long_name,
                    const std::string& description, OptionType type = OptionType::Flag,
                    const std::string& default_value = "");
    
    // Once a command is registered, the first positional argument must name one.
    void add_command(const std::string& name, const std::string& usage, const std::string& description);
    
    bool parse(int argc, char* argv[]);
    
    bool has_option(const std::string& name) const;
    std::string get_option(const std::string& name, const std::string& default_value = "") const;
    std::optional<long long> get_int_option(const std::string& name) const;
    bool get_bool_option(const std::string& name, bool default_value = false) const;
    
    std::string command() const;
    std::vector<std::string> command_args() const;
    
    const std::vector<std::string>& get_positional_args() const { return positional_args_; }
    const std::string& get_error() const { return error_; }
    
    void print_help() const;
    void print_version() const;
    
private:
    struct Option {
        std::string long_name;
        std::string description;
        OptionType type;
        std::string default_value;
    };
    
    struct Command {
        std::string name;
        std::string usage;
        std::string description;
    };
    
    bool parse_long(const std::string& arg, int& index, int argc, char* argv[]);
    bool parse_short(const std::string& arg, int& index, int argc, char* argv[]);
    bool store(const Option& option, const std::string& value);
    bool fail(std::string message);
    
    const Option* find_option(const std::string& name) const;
    std::string normalize_option_name(const std::string& name) const;
    
    std::string program_name_;
    std::map<std::string, Option> options_;
    std::unordered_map<std::string, std::string> short_to_long_;
    std::vector<Command> commands_;
    
    std::unordered_map<std::string, std::string> parsed_options_;
    std::vector<std::string> positional_args_;
    std::string error_;
};

}
