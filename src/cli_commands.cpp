#include <filesystem>
#include <iostream>

#include "cli_commands.hpp"
#include "errors.hpp"
#include "git_utils.hpp"
#include "logger.hpp"
#include "provisioner.hpp"

namespace fs = std::filesystem;
using namespace maintbranch;

namespace cli {

namespace {
int report_failure(const Options& opts, const std::string& step, const MaintenanceError& e) {
    log_error(step + ": " + e.what());
    if (opts.logging.quiet)
        std::cerr << "error: " << step << ": " << e.what() << "\n";
    flush_logger();
    return to_int(e.exit_code());
}

const char* step_name(const MaintenanceError& e) {
    switch (e.exit_code()) {
    case ExitCode::InvalidVersion:
        return "invalid version";
    case ExitCode::NoReleaseFound:
        return "no release found";
    case ExitCode::DirtyWorkingTree:
        return "dirty working tree";
    case ExitCode::BranchCreation:
        return "branch creation failed";
    case ExitCode::ConfigStep:
        return "version bump failed";
    case ExitCode::Commit:
        return "commit failed";
    case ExitCode::Usage:
        return "usage";
    case ExitCode::Failure:
        return "release lookup failed";
    default:
        return "failed";
    }
}
} // namespace

void configure_logging(const LoggingOptions& opts) {
    set_log_level(opts.log_level);
    set_json_logging(opts.json_log);
    set_log_compression(opts.compress_logs);
    set_console_logging(!opts.quiet);
    if (!opts.log_file.empty() &&
        !init_logger(opts.log_file, opts.log_level, opts.max_log_size, opts.max_log_files))
        log_warning("Continuing without log file", {{"path", opts.log_file}});
}

int run_with(const Options& opts, CommandRunner& runner, VersionSetter& setter,
             ReleaseLookup& lookup, const CancellationToken& token) {
    BranchProvisioner provisioner(runner, setter, lookup);
    try {
        if (opts.dry_run) {
            BranchPlan plan = provisioner.plan(opts.project, opts.base_version);
            std::cout << "release-version: " << plan.release_version << "\n"
                      << "tag:             " << plan.tag_name << "\n"
                      << "branch:          " << plan.branch_name << "\n"
                      << "branch-version:  " << plan.branch_version << "\n";
            return to_int(ExitCode::Success);
        }
        ProvisionOutcome outcome = provisioner.provision(opts.project, opts.base_version, token);
        if (outcome == ProvisionOutcome::Cancelled) {
            log_warning("Operation cancelled, remaining steps skipped");
            flush_logger();
            return to_int(ExitCode::Cancelled);
        }
        flush_logger();
        return to_int(ExitCode::Success);
    } catch (const MaintenanceError& e) {
        return report_failure(opts, step_name(e), e);
    }
}

int run_maintenance(const Options& opts, const CancellationToken& token) {
    std::error_code ec;
    if (!fs::is_directory(opts.root, ec))
        return report_failure(opts, "usage",
                              UsageError("Project root is not a directory: " + opts.root.string()));
    if (!git::is_git_repo(opts.root))
        return report_failure(
            opts, "usage", UsageError("Not inside a git working tree: " + opts.root.string()));
    log_debug("Starting", {{"root", opts.root.string()},
                           {"project", opts.project},
                           {"config", opts.config_file.string()}});

    ShellCommandRunner runner(opts.root);
    CommandVersionSetter setter(runner, opts.set_version_command);
    GitTagReleaseLookup lookup(opts.root, opts.project);
    int rc = run_with(opts, runner, setter, lookup, token);
    if (rc == to_int(ExitCode::Success) && !opts.dry_run) {
        std::string err;
        if (auto branch = git::get_current_branch(opts.root, &err))
            log_info("Now on branch " + *branch);
        else
            log_debug("Could not read the current branch", {{"error", err}});
        flush_logger();
    }
    return rc;
}

} // namespace cli
