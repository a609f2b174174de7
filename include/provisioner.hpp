#ifndef PROVISIONER_HPP
#define PROVISIONER_HPP

#include <optional>
#include <string>

#include "cancellation.hpp"
#include "command_runner.hpp"
#include "release_lookup.hpp"
#include "version_calc.hpp"
#include "version_setter.hpp"

namespace maintbranch {

enum class ProvisionOutcome { Completed, Cancelled };

constexpr const char* COMMIT_MESSAGE = "preparing maintenance branch for development";

/**
 * @brief Creates a maintenance branch from a released tag and opens it for
 *        development.
 *
 * The workflow is strictly sequential:
 *  1. resolve the release (explicit or via the @ref ReleaseLookup),
 *  2. derive names,
 *  3. refuse to continue on a dirty working tree or index,
 *  4. `git checkout -b` from the tag, retrying once from the tag truncated at
 *     its last `.`,
 *  5. set the next development version without backup files,
 *  6. commit the bump.
 *
 * Every failure is terminal and raised as a @ref MaintenanceError subclass.
 * Nothing is rolled back. Cancellation is not a failure: the remaining steps
 * are skipped and ProvisionOutcome::Cancelled is returned.
 */
class BranchProvisioner {
  public:
    BranchProvisioner(CommandRunner& runner, VersionSetter& setter, ReleaseLookup& lookup);

    /**
     * @brief Steps 1 and 2 only; no command is run.
     *
     * @throws NoReleaseFoundError, InvalidVersionError
     */
    BranchPlan plan(const std::string& project, const std::optional<std::string>& base_version);

    /**
     * @brief Run the whole workflow.
     */
    ProvisionOutcome provision(const std::string& project,
                               const std::optional<std::string>& base_version,
                               const CancellationToken& token);

    /**
     * @brief Steps 3 to 6 for an already derived plan.
     */
    ProvisionOutcome execute(const BranchPlan& plan, const CancellationToken& token);

  private:
    ReleaseVersion resolve_release(const std::optional<std::string>& base_version);
    bool ensure_clean_tree(const CancellationToken& token);
    bool create_branch(const BranchPlan& plan, const CancellationToken& token);
    bool commit_bump(const CancellationToken& token);
    CommandResult run_logged(const std::string& label, const std::string& command,
                             const CancellationToken& token);

    CommandRunner& runner_;
    VersionSetter& setter_;
    ReleaseLookup& lookup_;
};

} // namespace maintbranch

#endif // PROVISIONER_HPP
