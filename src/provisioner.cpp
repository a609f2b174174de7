#include "provisioner.hpp"

#include <cctype>

#include "errors.hpp"
#include "logger.hpp"

namespace maintbranch {

namespace {
// Names end up unquoted on a shell command line.
bool is_safe_ref(const std::string& name) {
    if (name.empty() || name[0] == '-')
        return false;
    for (char c : name) {
        unsigned char u = static_cast<unsigned char>(c);
        if (!std::isalnum(u) && c != '.' && c != '_' && c != '-' && c != '/')
            return false;
    }
    return true;
}

void require_safe(const std::string& what, const std::string& name) {
    if (!is_safe_ref(name))
        throw InvalidVersionError("Refusing to use '" + name + "' as " + what);
}
} // namespace

BranchProvisioner::BranchProvisioner(CommandRunner& runner, VersionSetter& setter,
                                     ReleaseLookup& lookup)
    : runner_(runner), setter_(setter), lookup_(lookup) {}

ReleaseVersion BranchProvisioner::resolve_release(const std::optional<std::string>& base_version) {
    if (base_version)
        return parse_release_version(*base_version);
    std::optional<ReleaseVersion> found = lookup_.latest_release();
    if (!found || found->major.empty())
        throw NoReleaseFoundError(
            "No release found for this project, cannot create maintenance branch");
    if (found->minor.empty())
        throw InvalidVersionError("Latest release has no minor version");
    return *found;
}

BranchPlan BranchProvisioner::plan(const std::string& project,
                                   const std::optional<std::string>& base_version) {
    ReleaseVersion v = resolve_release(base_version);
    log_info("Release version is [" + release_version(v) + "]");
    BranchPlan p = make_plan(project, v);
    require_safe("a tag name", p.tag_name);
    require_safe("a branch name", p.branch_name);
    require_safe("a version", p.branch_version);
    log_info("Creating branch from tag [" + p.tag_name + "]");
    log_info("Branch [" + p.branch_name + "] will be created with version [" + p.branch_version +
             "]");
    return p;
}

ProvisionOutcome BranchProvisioner::provision(const std::string& project,
                                              const std::optional<std::string>& base_version,
                                              const CancellationToken& token) {
    if (token.cancelled())
        return ProvisionOutcome::Cancelled;
    BranchPlan p = plan(project, base_version);
    return execute(p, token);
}

ProvisionOutcome BranchProvisioner::execute(const BranchPlan& plan,
                                            const CancellationToken& token) {
    if (!ensure_clean_tree(token))
        return ProvisionOutcome::Cancelled;
    if (!create_branch(plan, token))
        return ProvisionOutcome::Cancelled;
    log_info("Branch [" + plan.branch_name + "] created successfully");

    if (token.cancelled())
        return ProvisionOutcome::Cancelled;
    log_info("Updating project version");
    if (!setter_.set_version(plan.branch_version, false, token))
        return ProvisionOutcome::Cancelled;

    if (!commit_bump(token))
        return ProvisionOutcome::Cancelled;
    log_info("Maintenance branch [" + plan.branch_name + "] ready at version [" +
             plan.branch_version + "]");
    return ProvisionOutcome::Completed;
}

CommandResult BranchProvisioner::run_logged(const std::string& label, const std::string& command,
                                            const CancellationToken& token) {
    CommandResult res = runner_.run(command, token);
    log_debug(label + " output: " + res.output,
              {{"status", std::to_string(res.exit_code)},
               {"cancelled", res.cancelled ? "true" : "false"}});
    return res;
}

bool BranchProvisioner::ensure_clean_tree(const CancellationToken& token) {
    static const char* const checks[][2] = {{"git diff", "git diff --exit-code"},
                                            {"git diff cached", "git diff --cached --exit-code"}};
    for (const auto& check : checks) {
        if (token.cancelled())
            return false;
        CommandResult res = run_logged(check[0], check[1], token);
        if (res.cancelled)
            return false;
        if (res.exit_code != 0)
            throw DirtyWorkingTreeError("There are local modifications, please commit them "
                                        "before creating the maintenance branch");
    }
    return true;
}

bool BranchProvisioner::create_branch(const BranchPlan& plan, const CancellationToken& token) {
    if (token.cancelled())
        return false;
    CommandResult res =
        run_logged("git checkout", "git checkout -b " + plan.branch_name + " " + plan.tag_name,
                   token);
    if (res.cancelled)
        return false;
    if (res.exit_code == 0)
        return true;

    // The release may have been tagged without its incremental segment.
    std::string fallback = fallback_tag_name(plan.tag_name);
    log_warning("Tag [" + plan.tag_name + "] could not be checked out, retrying with [" +
                fallback + "]");
    if (token.cancelled())
        return false;
    res = run_logged("git checkout", "git checkout -b " + plan.branch_name + " " + fallback,
                     token);
    if (res.cancelled)
        return false;
    if (res.exit_code != 0)
        throw BranchCreationError("Could not create branch from tag, status code: " +
                                      std::to_string(res.exit_code),
                                  res.exit_code);
    return true;
}

bool BranchProvisioner::commit_bump(const CancellationToken& token) {
    if (token.cancelled())
        return false;
    CommandResult res = run_logged(
        "git commit", std::string("git commit -am \"") + COMMIT_MESSAGE + "\"", token);
    if (res.cancelled)
        return false;
    if (res.exit_code != 0)
        throw CommitError("Could not commit version change, status code: " +
                              std::to_string(res.exit_code),
                          res.exit_code);
    return true;
}

} // namespace maintbranch
