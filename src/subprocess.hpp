#pragma once
#include <string>
#include <vector>

namespace karltui {

struct ProcessResult {
    bool spawned = false;   // fork/pipe succeeded
    int exit_code = -1;     // -1 when killed by a signal or not spawned
    std::string out;
    std::string err;

    bool success() const { return spawned && exit_code == 0; }
};

// Run argv[0] (PATH lookup) with stdin closed, capturing stdout and stderr.
ProcessResult run_capture(const std::vector<std::string>& argv);

// Run argv[0] attached to the current terminal and wait for it.
// Returns true on exit status 0.
bool run_interactive(const std::vector<std::string>& argv);

} // namespace karltui
