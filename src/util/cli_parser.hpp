#pragma once

#include <string>
#include <unordered_map>
#include <vector>

namespace samstream {

// Command-line parser for "-key value", "--key=value" and bare flag arguments.
class CliParser {
public:
    CliParser(int argc, char* argv[]);

    // Check if a flag/option is present.
    bool has(const std::string& key) const;

    // Get the last value given for a key. Returns default_val if not found.
    std::string get_string(const std::string& key,
                           const std::string& default_val = {}) const;

    // Get every value given for a repeated key, in command-line order.
    std::vector<std::string> get_strings(const std::string& key) const;

    // Get integer value for a key. Returns default_val if not found or invalid.
    int get_int(const std::string& key, int default_val = 0) const;

    const std::string& program() const { return program_; }

    // Arguments not consumed as an option value.
    const std::vector<std::string>& positional() const { return positional_; }

private:
    std::string program_;
    std::unordered_map<std::string, std::vector<std::string>> opts_;
    std::vector<std::string> positional_;
};

} // namespace samstream
