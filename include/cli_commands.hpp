#pragma once

#include "cancellation.hpp"
#include "command_runner.hpp"
#include "options.hpp"
#include "release_lookup.hpp"
#include "version_setter.hpp"

namespace cli {

/**
 * @brief Apply the logging options: level, format, console and file sinks.
 */
void configure_logging(const LoggingOptions& opts);

/**
 * @brief Run the maintenance workflow with the given collaborators.
 *
 * Handles dry runs, reports the outcome and maps every failure to its exit
 * status. Never throws for workflow failures.
 *
 * @return `0` on success, `130` when cancelled, otherwise the failure's
 *         maintbranch::ExitCode.
 */
int run_with(const Options& opts, maintbranch::CommandRunner& runner,
             maintbranch::VersionSetter& setter, maintbranch::ReleaseLookup& lookup,
             const maintbranch::CancellationToken& token);

/**
 * @brief Validate the project root and run the workflow with the shell
 *        runner, the command based version setter and the tag lookup.
 *
 * Assumes libgit2 has been initialized.
 */
int run_maintenance(const Options& opts, const maintbranch::CancellationToken& token);

} // namespace cli
