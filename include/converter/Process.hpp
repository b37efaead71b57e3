#ifndef CONVERTER_PROCESS_HPP
#define CONVERTER_PROCESS_HPP

#include <atomic>
#include <functional>
#include <stdexcept>
#include <string>
#include <vector>

// Raised when the external executable cannot be located or started.
class ToolNotFoundError : public std::runtime_error {
public:
    explicit ToolNotFoundError(const std::string& tool);

    const std::string& Tool() const { return tool_; }

private:
    std::string tool_;
};

struct ProcessResult {
    int exit_code = -1;
    bool cancelled = false;
    std::string standard_output;
    std::string standard_error;
};

// Resolves program against PATH, or checks it directly when it contains a '/'.
// Returns an empty string when nothing executable is found.
std::string FindExecutable(const std::string& program);

// Runs argv[0] with the remaining arguments and blocks until it exits.
// stdin is /dev/null; stdout and stderr are captured. Each complete stdout line
// is also handed to on_stdout_line as it arrives. When cancel_flag becomes true
// the child is sent SIGTERM and the result is marked cancelled.
// Throws ToolNotFoundError if argv[0] cannot be resolved, std::runtime_error on
// pipe/spawn failures.
ProcessResult RunProcess(const std::vector<std::string>& argv,
                         const std::atomic<bool>* cancel_flag = nullptr,
                         const std::function<void(const std::string&)>& on_stdout_line = {});

#endif // CONVERTER_PROCESS_HPP
