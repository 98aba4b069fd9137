#pragma once
#include <chrono>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace gitstack::utils {

struct CommandTiming {
    std::uint64_t count = 0;
    std::chrono::nanoseconds total{0};
    std::chrono::nanoseconds max{0};

    void record(std::chrono::nanoseconds elapsed);
    std::chrono::nanoseconds average() const;
};

/**
 * Wall-clock time spent in external commands, keyed by subcommand
 * ("rev-parse", "rebase", ...).
 */
class CommandStats {
public:
    void record(const std::string& command, std::chrono::nanoseconds elapsed);

    const CommandTiming& total() const { return total_; }
    const std::map<std::string, CommandTiming>& byCommand() const { return byCommand_; }

    /**
     * A table with one row per command, largest total first, and a final
     * row for all commands. Empty when nothing was recorded.
     * @param tool prefixed to every command name, e.g. "git"
     */
    std::vector<std::string> summary(const std::string& tool) const;

private:
    CommandTiming total_;
    std::map<std::string, CommandTiming> byCommand_;
};

}
