#pragma once

#include <string>
#include <unordered_map>
#include <vector>

namespace hufzip {

// Small CLI parser:
//   --key value
//   --flag (treated as "true")
//   anything else is collected as a positional argument, in order
class CliParser {
public:
    void parse(int argc, char** argv);
    bool has(const std::string& key) const;
    std::string get(const std::string& key, const std::string& def = "") const;
    // true for a bare --flag or an explicit true/1/yes value
    bool get_flag(const std::string& key) const;
    const std::vector<std::string>& positionals() const { return positionals_; }
private:
    std::unordered_map<std::string, std::string> kv_;
    std::vector<std::string> positionals_;
};

} // namespace hufzip
