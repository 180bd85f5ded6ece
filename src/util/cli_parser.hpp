#pragma once

#include <string>
#include <unordered_map>
#include <vector>

namespace chunkfwd {

// Command-line parser for "-key value", "--key=value" and bare flags.
// A key may repeat; every occurrence is kept in order.
class CliParser {
public:
    CliParser(int argc, char* argv[]);

    bool has(const std::string& key) const;

    // Last value given for key, or default_val.
    std::string get_string(const std::string& key,
                           const std::string& default_val = {}) const;

    // All values given for a repeatable key, in command-line order.
    std::vector<std::string> get_strings(const std::string& key) const;

    // Returns default_val if missing or not a valid integer.
    int get_int(const std::string& key, int default_val = 0) const;

    const std::vector<std::string>& positional() const { return positional_; }

private:
    std::unordered_map<std::string, std::vector<std::string>> opts_;
    std::vector<std::string> positional_;
};

} // namespace chunkfwd
