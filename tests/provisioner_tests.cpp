#include <deque>
#include <map>
#include <vector>
#include "test_common.hpp"
#include "provisioner.hpp"

using namespace maintbranch;
using maintbranch::test_support::LoggerGuard;

namespace {

// Returns scripted results per exact command line; unscripted commands succeed.
class ScriptedRunner : public CommandRunner {
  public:
    std::vector<std::string> commands;
    std::map<std::string, std::deque<CommandResult>> script;
    CancellationToken* cancel_after = nullptr;
    std::string cancel_trigger;

    void on(const std::string& cmd, int exit_code, const std::string& output = "") {
        CommandResult r;
        r.exit_code = exit_code;
        r.output = output;
        script[cmd].push_back(r);
    }

    CommandResult run(const std::string& command, const CancellationToken& token) override {
        commands.push_back(command);
        if (token.cancelled()) {
            CommandResult r;
            r.cancelled = true;
            return r;
        }
        CommandResult r;
        r.exit_code = 0;
        auto it = script.find(command);
        if (it != script.end() && !it->second.empty()) {
            r = it->second.front();
            it->second.pop_front();
        }
        if (cancel_after && command == cancel_trigger)
            cancel_after->request_cancel();
        return r;
    }
};

class RecordingSetter : public VersionSetter {
  public:
    std::vector<std::pair<std::string, bool>> calls;
    bool fail = false;

    bool set_version(const std::string& v, bool keep_backups, const CancellationToken& token) override {
        if (token.cancelled())
            return false;
        calls.emplace_back(v, keep_backups);
        if (fail)
            throw ConfigStepError("set-version failed");
        return true;
    }
};

class FixedLookup : public ReleaseLookup {
  public:
    std::optional<ReleaseVersion> result;
    bool unreadable = false;
    int calls = 0;
    std::optional<ReleaseVersion> latest_release() override {
        ++calls;
        if (unreadable)
            throw ReleaseLookupError("Could not list tags in /repo: corrupt packed-refs");
        return result;
    }
};

const std::string DIFF = "git diff --exit-code";
const std::string DIFF_CACHED = "git diff --cached --exit-code";
const std::string COMMIT = "git commit -am \"preparing maintenance branch for development\"";

} // namespace

TEST_CASE("provision runs the full sequence for an explicit version") {
    LoggerGuard guard;
    ScriptedRunner runner;
    RecordingSetter setter;
    FixedLookup lookup;
    CancellationToken token;
    BranchProvisioner p(runner, setter, lookup);

    REQUIRE(p.provision("foo", std::string("2.3.5"), token) == ProvisionOutcome::Completed);
    std::vector<std::string> expected{DIFF, DIFF_CACHED, "git checkout -b foo-2.3.x foo-2.3.5",
                                      COMMIT};
    REQUIRE(runner.commands == expected);
    REQUIRE(setter.calls.size() == 1);
    REQUIRE(setter.calls[0].first == "2.3.6-SNAPSHOT");
    REQUIRE_FALSE(setter.calls[0].second);
    REQUIRE(lookup.calls == 0);
}

TEST_CASE("provision uses the release lookup without an explicit version") {
    LoggerGuard guard;
    ScriptedRunner runner;
    RecordingSetter setter;
    FixedLookup lookup;
    lookup.result = ReleaseVersion{"2", "3", std::nullopt};
    CancellationToken token;
    BranchProvisioner p(runner, setter, lookup);

    REQUIRE(p.provision("foo", std::nullopt, token) == ProvisionOutcome::Completed);
    REQUIRE(lookup.calls == 1);
    REQUIRE(runner.commands[2] == "git checkout -b foo-2.3.x foo-2.3");
    REQUIRE(setter.calls[0].first == "2.3.1-SNAPSHOT");
}

TEST_CASE("provision fails when no release is found") {
    LoggerGuard guard;
    ScriptedRunner runner;
    RecordingSetter setter;
    FixedLookup lookup;
    CancellationToken token;
    BranchProvisioner p(runner, setter, lookup);

    REQUIRE_THROWS_AS(p.provision("foo", std::nullopt, token), NoReleaseFoundError);
    lookup.result = ReleaseVersion{"", "3", std::nullopt};
    REQUIRE_THROWS_AS(p.provision("foo", std::nullopt, token), NoReleaseFoundError);
    REQUIRE(runner.commands.empty());
    REQUIRE(setter.calls.empty());
}

TEST_CASE("unreadable release history is not reported as a missing release") {
    LoggerGuard guard;
    ScriptedRunner runner;
    RecordingSetter setter;
    FixedLookup lookup;
    lookup.unreadable = true;
    CancellationToken token;
    BranchProvisioner p(runner, setter, lookup);

    try {
        p.provision("foo", std::nullopt, token);
        FAIL("expected ReleaseLookupError");
    } catch (const NoReleaseFoundError&) {
        FAIL("lookup failure reported as no release");
    } catch (const ReleaseLookupError& e) {
        REQUIRE(std::string(e.what()).find("packed-refs") != std::string::npos);
        REQUIRE(e.exit_code() == ExitCode::Failure);
    }
    REQUIRE(runner.commands.empty());
}

TEST_CASE("provision rejects invalid versions before running commands") {
    LoggerGuard guard;
    ScriptedRunner runner;
    RecordingSetter setter;
    FixedLookup lookup;
    CancellationToken token;
    BranchProvisioner p(runner, setter, lookup);

    REQUIRE_THROWS_AS(p.provision("foo", std::string("1"), token), InvalidVersionError);
    REQUIRE_THROWS_AS(p.provision("foo", std::string("1.2.x"), token), InvalidVersionError);
    REQUIRE_THROWS_AS(p.provision("foo", std::string("1;rm.2"), token), InvalidVersionError);
    REQUIRE_THROWS_AS(p.provision("foo bar", std::string("1.2"), token), InvalidVersionError);
    REQUIRE(runner.commands.empty());
}

TEST_CASE("dirty working tree aborts before branching") {
    LoggerGuard guard;
    ScriptedRunner runner;
    RecordingSetter setter;
    FixedLookup lookup;
    CancellationToken token;
    BranchProvisioner p(runner, setter, lookup);
    runner.on(DIFF, 1, " M version.txt");

    REQUIRE_THROWS_AS(p.provision("foo", std::string("2.3"), token), DirtyWorkingTreeError);
    REQUIRE(runner.commands == std::vector<std::string>{DIFF});
    REQUIRE(setter.calls.empty());
}

TEST_CASE("dirty index aborts before branching") {
    LoggerGuard guard;
    ScriptedRunner runner;
    RecordingSetter setter;
    FixedLookup lookup;
    CancellationToken token;
    BranchProvisioner p(runner, setter, lookup);
    runner.on(DIFF_CACHED, 1);

    REQUIRE_THROWS_AS(p.provision("foo", std::string("2.3"), token), DirtyWorkingTreeError);
    REQUIRE(runner.commands == std::vector<std::string>{DIFF, DIFF_CACHED});
    REQUIRE(setter.calls.empty());
}

TEST_CASE("checkout falls back to tag without incremental") {
    LoggerGuard guard;
    ScriptedRunner runner;
    RecordingSetter setter;
    FixedLookup lookup;
    CancellationToken token;
    BranchProvisioner p(runner, setter, lookup);
    runner.on("git checkout -b foo-2.3.x foo-2.3.5", 128,
              "fatal: 'foo-2.3.5' is not a commit");

    REQUIRE(p.provision("foo", std::string("2.3.5"), token) == ProvisionOutcome::Completed);
    std::vector<std::string> expected{DIFF, DIFF_CACHED, "git checkout -b foo-2.3.x foo-2.3.5",
                                      "git checkout -b foo-2.3.x foo-2.3", COMMIT};
    REQUIRE(runner.commands == expected);
    REQUIRE(setter.calls[0].first == "2.3.6-SNAPSHOT");
}

TEST_CASE("fallback truncates even when the release has no incremental") {
    LoggerGuard guard;
    ScriptedRunner runner;
    RecordingSetter setter;
    FixedLookup lookup;
    CancellationToken token;
    BranchProvisioner p(runner, setter, lookup);
    runner.on("git checkout -b foo-2.3.x foo-2.3", 1);

    REQUIRE(p.provision("foo", std::string("2.3"), token) == ProvisionOutcome::Completed);
    REQUIRE(runner.commands[3] == "git checkout -b foo-2.3.x foo-2");
}

TEST_CASE("branch creation error when both checkouts fail") {
    LoggerGuard guard;
    ScriptedRunner runner;
    RecordingSetter setter;
    FixedLookup lookup;
    CancellationToken token;
    BranchProvisioner p(runner, setter, lookup);
    runner.on("git checkout -b foo-2.3.x foo-2.3.5", 128);
    runner.on("git checkout -b foo-2.3.x foo-2.3", 129);

    try {
        p.provision("foo", std::string("2.3.5"), token);
        FAIL("expected BranchCreationError");
    } catch (const BranchCreationError& e) {
        REQUIRE(e.status() == 129);
        REQUIRE(e.exit_code() == ExitCode::BranchCreation);
        REQUIRE(std::string(e.what()).find("129") != std::string::npos);
    }
    REQUIRE(runner.commands.size() == 4);
    REQUIRE(setter.calls.empty());
}

TEST_CASE("version bump failure stops before commit") {
    LoggerGuard guard;
    ScriptedRunner runner;
    RecordingSetter setter;
    setter.fail = true;
    FixedLookup lookup;
    CancellationToken token;
    BranchProvisioner p(runner, setter, lookup);

    REQUIRE_THROWS_AS(p.provision("foo", std::string("2.3"), token), ConfigStepError);
    REQUIRE(runner.commands.size() == 3);
    REQUIRE(runner.commands.back() == "git checkout -b foo-2.3.x foo-2.3");
}

TEST_CASE("commit failure is reported with its status") {
    LoggerGuard guard;
    ScriptedRunner runner;
    RecordingSetter setter;
    FixedLookup lookup;
    CancellationToken token;
    BranchProvisioner p(runner, setter, lookup);
    runner.on(COMMIT, 1, "nothing to commit");

    try {
        p.provision("foo", std::string("2.3"), token);
        FAIL("expected CommitError");
    } catch (const CommitError& e) {
        REQUIRE(e.status() == 1);
    }
    REQUIRE(setter.calls.size() == 1);
}

TEST_CASE("cancellation before start runs nothing") {
    LoggerGuard guard;
    ScriptedRunner runner;
    RecordingSetter setter;
    FixedLookup lookup;
    CancellationToken token;
    token.request_cancel();
    BranchProvisioner p(runner, setter, lookup);

    REQUIRE(p.provision("foo", std::string("2.3"), token) == ProvisionOutcome::Cancelled);
    REQUIRE(runner.commands.empty());
    REQUIRE(lookup.calls == 0);
}

TEST_CASE("cancellation during checkout skips bump and commit") {
    LoggerGuard guard;
    ScriptedRunner runner;
    RecordingSetter setter;
    FixedLookup lookup;
    CancellationToken token;
    runner.cancel_after = &token;
    runner.cancel_trigger = "git checkout -b foo-2.3.x foo-2.3";
    BranchProvisioner p(runner, setter, lookup);

    REQUIRE(p.provision("foo", std::string("2.3"), token) == ProvisionOutcome::Cancelled);
    REQUIRE(runner.commands.size() == 3);
    REQUIRE(setter.calls.empty());
}

TEST_CASE("cancelled command result stops the workflow") {
    LoggerGuard guard;
    ScriptedRunner runner;
    RecordingSetter setter;
    FixedLookup lookup;
    CancellationToken token;
    CommandResult cancelled;
    cancelled.cancelled = true;
    runner.script[DIFF].push_back(cancelled);
    BranchProvisioner p(runner, setter, lookup);

    REQUIRE(p.provision("foo", std::string("2.3"), token) == ProvisionOutcome::Cancelled);
    REQUIRE(runner.commands == std::vector<std::string>{DIFF});
}

TEST_CASE("plan derives names without running commands") {
    LoggerGuard guard;
    ScriptedRunner runner;
    RecordingSetter setter;
    FixedLookup lookup;
    BranchProvisioner p(runner, setter, lookup);

    BranchPlan plan = p.plan("foo", std::string("2.3"));
    REQUIRE(plan.release_version == "2.3");
    REQUIRE(plan.tag_name == "foo-2.3");
    REQUIRE(plan.branch_name == "foo-2.3.x");
    REQUIRE(plan.branch_version == "2.3.1-SNAPSHOT");
    REQUIRE(runner.commands.empty());
}
