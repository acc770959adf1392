#ifndef NEIGHBORMAP_MANAGEMENT_INTERFACE_HPP
#define NEIGHBORMAP_MANAGEMENT_INTERFACE_HPP

#include <string>
#include <vector>
#include <map>
#include <functional> // For std::function
#include <sstream>    // For std::istringstream
#include <utility>    // For std::move
#include <cstddef>    // For std::ptrdiff_t
#include <algorithm>  // For std::equal

namespace neighbormap {

// Word-sequence command registry. The longest registered prefix of the input
// wins; the remaining words are handed to its handler.
class ManagementInterface {
public:
    ManagementInterface() = default;

    using CliHandler = std::function<std::string(const std::vector<std::string>& args)>;

    void register_command(const std::vector<std::string>& command_parts, CliHandler handler,
                          const std::string& usage = "") {
        if (command_parts.empty()) return;
        cli_commands_[command_parts] = std::move(handler);
        if (!usage.empty()) {
            usage_[command_parts] = usage;
        }
    }

    std::string handle_cli_command(const std::string& command_line) const {
        if (command_line.empty()) {
            return "Error: Empty command.";
        }

        std::vector<std::string> words;
        std::istringstream iss(command_line);
        for (std::string word; iss >> word;) {
            words.push_back(word);
        }
        if (words.empty()) {
            return "Error: Empty command after parsing.";
        }

        auto best = cli_commands_.end();
        for (auto it = cli_commands_.begin(); it != cli_commands_.end(); ++it) {
            const std::vector<std::string>& key = it->first;
            if (key.size() > words.size()) continue;
            if (!std::equal(key.begin(), key.end(), words.begin())) continue;
            if (best == cli_commands_.end() || key.size() > best->first.size()) {
                best = it;
            }
        }

        if (best == cli_commands_.end()) {
            return "Error: Unknown command or prefix: " + command_line + ". Type 'help' for available commands.";
        }
        std::vector<std::string> args(words.begin() + static_cast<std::ptrdiff_t>(best->first.size()), words.end());
        return best->second(args);
    }

    // Usage lines of all commands registered with one, sorted by command words.
    std::vector<std::string> usage_lines() const {
        std::vector<std::string> lines;
        for (const auto& pair : usage_) {
            lines.push_back(pair.second);
        }
        return lines;
    }

    bool has_command(const std::vector<std::string>& command_parts) const {
        return cli_commands_.count(command_parts) > 0;
    }

private:
    std::map<std::vector<std::string>, CliHandler> cli_commands_;
    std::map<std::vector<std::string>, std::string> usage_;
};

} // namespace neighbormap

#endif // NEIGHBORMAP_MANAGEMENT_INTERFACE_HPP
