#include "test_common.hpp"
#include "command_runner.hpp"
#include "system_utils.hpp"

using namespace maintbranch;
using maintbranch::test_support::LoggerGuard;

TEST_CASE("wrap_command chooses the platform shell") {
    REQUIRE(wrap_command("git status", "Linux") ==
            std::vector<std::string>{"sh", "-c", "git status"});
    REQUIRE(wrap_command("git status", "Mac OS X") ==
            std::vector<std::string>{"sh", "-c", "git status"});
    REQUIRE(wrap_command("git status", "Windows 10") ==
            std::vector<std::string>{"cmd.exe", "/D", "/C", "git status"});
    REQUIRE(wrap_command("git status", "WINDOWS") ==
            std::vector<std::string>{"cmd.exe", "/D", "/C", "git status"});
    REQUIRE(wrap_command("git status", "") ==
            std::vector<std::string>{"cmd.exe", "/D", "/C", "git status"});
}

TEST_CASE("host_os_name is never empty") { REQUIRE_FALSE(procutil::host_os_name().empty()); }

#ifndef _WIN32

TEST_CASE("ShellCommandRunner reports exit status") {
    LoggerGuard guard;
    CancellationToken token;
    ShellCommandRunner runner(fs::temp_directory_path(), "Linux");
    CommandResult ok = runner.run("true", token);
    REQUIRE(ok.ok());
    REQUIRE(ok.exit_code == 0);
    CommandResult bad = runner.run("exit 3", token);
    REQUIRE_FALSE(bad.ok());
    REQUIRE(bad.exit_code == 3);
    REQUIRE_FALSE(bad.cancelled);
}

TEST_CASE("ShellCommandRunner merges stdout and stderr") {
    LoggerGuard guard;
    CancellationToken token;
    ShellCommandRunner runner(fs::temp_directory_path(), "Linux");
    CommandResult r = runner.run("echo out; echo err 1>&2", token);
    REQUIRE(r.exit_code == 0);
    REQUIRE(r.output.find("out") != std::string::npos);
    REQUIRE(r.output.find("err") != std::string::npos);
}

TEST_CASE("ShellCommandRunner drains large output") {
    LoggerGuard guard;
    CancellationToken token;
    ShellCommandRunner runner(fs::temp_directory_path(), "Linux");
    CommandResult r = runner.run("i=0; while [ $i -lt 20000 ]; do echo line$i; i=$((i+1)); done",
                                 token);
    REQUIRE(r.exit_code == 0);
    REQUIRE(r.output.find("line19999") != std::string::npos);
}

TEST_CASE("ShellCommandRunner runs inside its working directory") {
    LoggerGuard guard;
    fs::path dir = fs::temp_directory_path() / "maintbranch_runner_dir";
    FS_REMOVE_ALL(dir);
    fs::create_directories(dir);
    std::ofstream(dir / "marker.txt") << "x";
    CancellationToken token;
    ShellCommandRunner runner(dir, "Linux");
    REQUIRE(runner.working_dir() == dir);
    CommandResult r = runner.run("ls", token);
    REQUIRE(r.exit_code == 0);
    REQUIRE(r.output.find("marker.txt") != std::string::npos);
    FS_REMOVE_ALL(dir);
}

TEST_CASE("ShellCommandRunner fails for a missing working directory") {
    LoggerGuard guard;
    CancellationToken token;
    ShellCommandRunner runner(fs::temp_directory_path() / "maintbranch_no_such_dir", "Linux");
    CommandResult r = runner.run("true", token);
    REQUIRE(r.exit_code == 127);
    REQUIRE_FALSE(r.output.empty());
}

TEST_CASE("ShellCommandRunner skips commands once cancelled") {
    LoggerGuard guard;
    fs::path marker = fs::temp_directory_path() / "maintbranch_cancel_marker";
    fs::remove(marker);
    CancellationToken token;
    token.request_cancel();
    ShellCommandRunner runner(fs::temp_directory_path(), "Linux");
    CommandResult r = runner.run("touch \"" + marker.string() + "\"", token);
    REQUIRE(r.cancelled);
    REQUIRE_FALSE(r.ok());
    REQUIRE_FALSE(fs::exists(marker));
}

TEST_CASE("ShellCommandRunner stops a running command on cancel") {
    LoggerGuard guard;
    CancellationToken token;
    ShellCommandRunner runner(fs::temp_directory_path(), "Linux");
    auto start = std::chrono::steady_clock::now();
    std::thread canceller([&token] {
        std::this_thread::sleep_for(std::chrono::milliseconds(300));
        token.request_cancel();
    });
    CommandResult r = runner.run("sleep 30", token);
    canceller.join();
    auto elapsed = std::chrono::steady_clock::now() - start;
    REQUIRE(r.cancelled);
    REQUIRE_FALSE(r.ok());
    REQUIRE(elapsed < std::chrono::seconds(10));
}

TEST_CASE("ShellCommandRunner gives commands an empty standard input") {
    LoggerGuard guard;
    CancellationToken token;
    ShellCommandRunner runner(fs::temp_directory_path(), "Linux");
    auto start = std::chrono::steady_clock::now();
    CommandResult r =
        runner.run("if read line; then echo got:$line; else echo eof; fi; cat; echo done", token);
    REQUIRE(r.exit_code == 0);
    REQUIRE(r.output.find("eof") != std::string::npos);
    REQUIRE(r.output.find("done") != std::string::npos);
    REQUIRE(std::chrono::steady_clock::now() - start < std::chrono::seconds(10));
}

#else

TEST_CASE("ShellCommandRunner cancel stops grandchildren of the shell") {
    LoggerGuard guard;
    CancellationToken token;
    ShellCommandRunner runner(fs::temp_directory_path(), "Windows");
    auto start = std::chrono::steady_clock::now();
    std::thread canceller([&token] {
        std::this_thread::sleep_for(std::chrono::milliseconds(500));
        token.request_cancel();
    });
    // ping is a child of cmd.exe and inherits the output pipe.
    CommandResult r = runner.run("ping -n 30 127.0.0.1", token);
    canceller.join();
    REQUIRE(r.cancelled);
    REQUIRE(std::chrono::steady_clock::now() - start < std::chrono::seconds(10));
}

TEST_CASE("ShellCommandRunner reports exit status on Windows") {
    LoggerGuard guard;
    CancellationToken token;
    ShellCommandRunner runner(fs::temp_directory_path(), "Windows");
    CommandResult r = runner.run("echo out & exit 3", token);
    REQUIRE(r.exit_code == 3);
    REQUIRE(r.output.find("out") != std::string::npos);
}

#endif // _WIN32
