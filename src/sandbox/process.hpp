#pragma once
#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace voxgate::sandbox {

struct ProcessSpec {
    std::vector<std::string> argv;      // argv[0] resolved through PATH, no shell
    std::string cwd;                    // empty = inherit
    std::chrono::milliseconds timeout{3000};
    size_t max_output_bytes = 1 << 20;  // per stream
    uint64_t max_memory_bytes = 0;      // RLIMIT_AS, 0 = unlimited
};

struct ProcessResult {
    int exit_code = 0;
    bool timed_out = false;
    bool spawn_failed = false;
    bool stdout_truncated = false;
    bool stderr_truncated = false;
    std::string stdout_text;
    std::string stderr_text;
    std::string error_message;
};

// Fork and exec argv in its own session and process group with stdin on
// /dev/null. Blocks until the child exits or the timeout elapses; on timeout
// the whole process group is killed with SIGKILL.
ProcessResult run_process(const ProcessSpec& spec);

} // namespace voxgate::sandbox
