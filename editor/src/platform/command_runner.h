#pragma once

// ==============================================================================
// CommandRunner - External Process Invocation
// ==============================================================================
// Runs a command line synchronously and captures its standard output.
// Standard error is discarded. The device configuration layer depends only on
// the abstract interface so tests can script the responses.
// ==============================================================================

#include <string>
#include <vector>

namespace Glide::Editor::Platform {

struct CommandResult {
    bool launched = false;   // false if the executable could not be started
    int exitCode = -1;
    std::string output;      // captured stdout

    [[nodiscard]] bool succeeded() const { return launched && exitCode == 0; }
};

class CommandRunner {
public:
    virtual ~CommandRunner() = default;

    /// Run argv[0] with the remaining arguments (no shell involved).
    virtual CommandResult run(const std::vector<std::string>& argv) = 0;
};

/// fork/execvp based runner. On platforms without POSIX processes every
/// command reports launched == false.
class PosixCommandRunner final : public CommandRunner {
public:
    CommandResult run(const std::vector<std::string>& argv) override;
};

/// "a b 'c d'" style rendering of argv for log messages.
std::string describeCommand(const std::vector<std::string>& argv);

} // namespace Glide::Editor::Platform
