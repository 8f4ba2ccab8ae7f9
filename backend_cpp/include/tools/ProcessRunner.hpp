#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace sdp_assistant {

struct ProcessSpec {
    std::string command;                // absolute or relative executable path, never a shell line
    std::vector<std::string> argv;      // arguments after argv[0]
    std::string cwd;
    std::uint64_t timeout_ms{30000};
    std::size_t max_output_bytes{1 << 20};
    std::vector<std::string> env_exclude;   // variables withheld from the child's inherited environment
};

struct ProcessResult {
    int exit_code{0};
    bool timed_out{false};
    bool stdout_truncated{false};
    bool stderr_truncated{false};
    std::string stdout_text;
    std::string stderr_text;
};

class ProcessRunner {
public:
    // Runs the command directly (fork/exec, stdin from /dev/null) in its own
    // process group and captures both output streams. On deadline the whole
    // group is killed and timed_out is set. On normal exit any processes left
    // in the group are killed as well. Throws ToolNotFoundError when exec
    // reports ENOENT, std::runtime_error for other spawn failures.
    static ProcessResult run(const ProcessSpec& spec);

    // PATH lookup for a bare name; names containing '/' are checked as-is.
    // Returns an empty string when nothing executable is found.
    static std::string find_executable(const std::string& name);
};

} // namespace sdp_assistant
