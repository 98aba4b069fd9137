#pragma once
#include <string>
#include <vector>

namespace gitstack::utils {

struct ProcessResult {
    int exitCode = -1;
    std::string output;        // captured stdout
    std::string errorOutput;   // captured stderr

    bool success() const { return exitCode == 0; }
};

/**
 * Run `argv[0]` (looked up on PATH) with the remaining arguments in `workDir`.
 * No shell is involved, so arguments need no quoting.
 * @param passthrough inherit the terminal instead of capturing output
 * @throws std::runtime_error if the process cannot be started
 */
ProcessResult runProcess(const std::vector<std::string>& argv,
                         const std::string& workDir = "",
                         bool passthrough = false);

// Strip trailing whitespace and newlines.
std::string trimOutput(const std::string& text);

}
