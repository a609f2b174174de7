#ifndef COMMAND_RUNNER_HPP
#define COMMAND_RUNNER_HPP

#include <filesystem>
#include <string>
#include <vector>

#include "cancellation.hpp"

namespace maintbranch {
namespace fs = std::filesystem;

/**
 * @brief Outcome of one external command.
 *
 * `output` holds standard output and standard error interleaved. When
 * `cancelled` is set the command was stopped early and `exit_code` carries
 * no meaning.
 */
struct CommandResult {
    int exit_code = -1;
    std::string output;
    bool cancelled = false;

    bool ok() const { return !cancelled && exit_code == 0; }
};

/**
 * @brief Executes version-control command lines.
 *
 * Implementations block until the command has exited and its output has been
 * drained, or until @p token is cancelled.
 */
class CommandRunner {
  public:
    virtual ~CommandRunner() = default;
    virtual CommandResult run(const std::string& command, const CancellationToken& token) = 0;
};

/**
 * @brief Argument vector executing @p command through the platform shell.
 *
 * Windows family hosts (any @p os_name containing "windows", ignoring case,
 * or an empty name) get `cmd.exe /D /C <command>`: AutoRun disabled, run the
 * string, then exit. Everything else gets `sh -c <command>`.
 */
std::vector<std::string> wrap_command(const std::string& command, const std::string& os_name);

/**
 * @brief Runs commands through the host shell inside a fixed directory.
 *
 * Exit status 127 is reported, with a diagnostic line in the output, when the
 * process cannot be spawned at all.
 */
class ShellCommandRunner : public CommandRunner {
  public:
    explicit ShellCommandRunner(fs::path working_dir);
    ShellCommandRunner(fs::path working_dir, std::string os_name);

    CommandResult run(const std::string& command, const CancellationToken& token) override;

    const fs::path& working_dir() const { return dir_; }

  private:
    fs::path dir_;
    std::string os_name_;
};

} // namespace maintbranch

#endif // COMMAND_RUNNER_HPP
