#ifndef MAINTBRANCH_ERRORS_HPP
#define MAINTBRANCH_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace maintbranch {

/**
 * @brief Process exit statuses reported by the CLI.
 *
 * Each terminal failure kind maps to its own status so wrapper scripts can
 * branch on the failed step without scraping stderr.
 */
enum class ExitCode : int {
    Success = 0,
    Failure = 1,
    Usage = 2,
    InvalidVersion = 3,
    NoReleaseFound = 4,
    DirtyWorkingTree = 5,
    BranchCreation = 6,
    ConfigStep = 7,
    Commit = 8,
    Cancelled = 130,
};

constexpr int to_int(ExitCode code) { return static_cast<int>(code); }

/**
 * @brief Base class of every terminal failure raised by the workflow.
 */
class MaintenanceError : public std::runtime_error {
  public:
    MaintenanceError(const std::string& msg, ExitCode code)
        : std::runtime_error(msg), code_(code) {}

    ExitCode exit_code() const noexcept { return code_; }

  private:
    ExitCode code_;
};

/// The repository's tags could not be read while looking for the release.
class ReleaseLookupError : public MaintenanceError {
  public:
    explicit ReleaseLookupError(const std::string& msg)
        : MaintenanceError(msg, ExitCode::Failure) {}
};

/// Malformed version string, non-integer incremental or unusable ref name.
class InvalidVersionError : public MaintenanceError {
  public:
    explicit InvalidVersionError(const std::string& msg)
        : MaintenanceError(msg, ExitCode::InvalidVersion) {}
};

/// Auto-discovery did not find any released version.
class NoReleaseFoundError : public MaintenanceError {
  public:
    explicit NoReleaseFoundError(const std::string& msg)
        : MaintenanceError(msg, ExitCode::NoReleaseFound) {}
};

/// The working tree or the index holds uncommitted changes.
class DirtyWorkingTreeError : public MaintenanceError {
  public:
    explicit DirtyWorkingTreeError(const std::string& msg)
        : MaintenanceError(msg, ExitCode::DirtyWorkingTree) {}
};

/// Neither the tag nor its truncated fallback could be checked out.
class BranchCreationError : public MaintenanceError {
  public:
    BranchCreationError(const std::string& msg, int status)
        : MaintenanceError(msg, ExitCode::BranchCreation), status_(status) {}

    int status() const noexcept { return status_; }

  private:
    int status_;
};

/// The external "set declared version" step failed.
class ConfigStepError : public MaintenanceError {
  public:
    explicit ConfigStepError(const std::string& msg)
        : MaintenanceError(msg, ExitCode::ConfigStep) {}
};

/// Committing the version bump failed.
class CommitError : public MaintenanceError {
  public:
    CommitError(const std::string& msg, int status)
        : MaintenanceError(msg, ExitCode::Commit), status_(status) {}

    int status() const noexcept { return status_; }

  private:
    int status_;
};

/// Bad command line or configuration file.
class UsageError : public MaintenanceError {
  public:
    explicit UsageError(const std::string& msg) : MaintenanceError(msg, ExitCode::Usage) {}
};

} // namespace maintbranch

#endif // MAINTBRANCH_ERRORS_HPP
