#include "command_stats.hpp"

#include <algorithm>

#include <spdlog/fmt/fmt.h>

namespace gitstack::utils {

namespace {

double millis(std::chrono::nanoseconds d) {
    return std::chrono::duration<double, std::milli>(d).count();
}

std::string row(const std::string& name, const CommandTiming& timing) {
    return fmt::format("{:<20} {:>6} {:>10.2f}ms {:>10.2f}ms {:>10.2f}ms", name, timing.count,
                       millis(timing.total), millis(timing.average()), millis(timing.max));
}

}

void CommandTiming::record(std::chrono::nanoseconds elapsed) {
    ++count;
    total += elapsed;
    max = std::max(max, elapsed);
}

std::chrono::nanoseconds CommandTiming::average() const {
    if (count == 0) return std::chrono::nanoseconds{0};
    return total / static_cast<std::int64_t>(count);
}

void CommandStats::record(const std::string& command, std::chrono::nanoseconds elapsed) {
    total_.record(elapsed);
    byCommand_[command].record(elapsed);
}

std::vector<std::string> CommandStats::summary(const std::string& tool) const {
    std::vector<std::string> lines;
    if (total_.count == 0) return lines;

    std::vector<std::pair<std::string, CommandTiming>> rows(byCommand_.begin(), byCommand_.end());
    std::stable_sort(rows.begin(), rows.end(), [](const auto& a, const auto& b) {
        return a.second.total > b.second.total;
    });

    lines.push_back(fmt::format("{:<20} {:>6} {:>12} {:>12} {:>12}", "Command", "Count", "Total",
                                "Avg", "Max"));
    for (const auto& [command, timing] : rows) {
        lines.push_back(row(tool + " " + command, timing));
    }
    lines.push_back(row("all", total_));
    return lines;
}

}
