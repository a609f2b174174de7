#include "command_runner.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <utility>

#include "logger.hpp"
#include "system_utils.hpp"

#ifndef _WIN32
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>
#endif

namespace maintbranch {

namespace {
constexpr int POLL_SLICE_MS = 100;
// Slices to wait for the child after SIGTERM before escalating to SIGKILL.
constexpr int TERM_GRACE_SLICES = 50;
constexpr int SPAWN_FAILURE = 127;

bool is_windows_family(const std::string& os_name) {
    if (os_name.empty())
        return true;
    std::string lower = os_name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower.find("windows") != std::string::npos;
}
} // namespace

std::vector<std::string> wrap_command(const std::string& command, const std::string& os_name) {
    if (is_windows_family(os_name))
        return {"cmd.exe", "/D", "/C", command};
    return {"sh", "-c", command};
}

ShellCommandRunner::ShellCommandRunner(fs::path working_dir)
    : dir_(std::move(working_dir)), os_name_(procutil::host_os_name()) {}

ShellCommandRunner::ShellCommandRunner(fs::path working_dir, std::string os_name)
    : dir_(std::move(working_dir)), os_name_(std::move(os_name)) {}

#ifndef _WIN32

static int decode_wait_status(int status) {
    if (WIFEXITED(status))
        return WEXITSTATUS(status);
    if (WIFSIGNALED(status))
        return 128 + WTERMSIG(status);
    return -1;
}

CommandResult ShellCommandRunner::run(const std::string& command,
                                      const CancellationToken& token) {
    CommandResult result;
    if (token.cancelled()) {
        result.cancelled = true;
        return result;
    }
    std::vector<std::string> args = wrap_command(command, os_name_);

    int fds[2];
    if (pipe(fds) != 0) {
        result.exit_code = SPAWN_FAILURE;
        result.output = std::string("pipe failed: ") + std::strerror(errno);
        return result;
    }
    procutil::UniqueFd read_end(fds[0]);
    procutil::UniqueFd write_end(fds[1]);
    fcntl(read_end.get(), F_SETFD, FD_CLOEXEC);

    std::vector<char*> argv;
    argv.reserve(args.size() + 1);
    for (auto& a : args)
        argv.push_back(const_cast<char*>(a.c_str()));
    argv.push_back(nullptr);
    std::string dir = dir_.string();

    pid_t pid = fork();
    if (pid < 0) {
        result.exit_code = SPAWN_FAILURE;
        result.output = std::string("fork failed: ") + std::strerror(errno);
        return result;
    }
    if (pid == 0) {
        // Own process group so cancellation can stop the shell and whatever it spawned.
        setpgid(0, 0);
        // A background process group reading the terminal would be stopped by
        // SIGTTIN, so the child reads from /dev/null instead.
        int null_in = open("/dev/null", O_RDONLY);
        if (null_in >= 0) {
            dup2(null_in, STDIN_FILENO);
            close(null_in);
        }
        dup2(write_end.get(), STDOUT_FILENO);
        dup2(write_end.get(), STDERR_FILENO);
        if (!dir.empty() && chdir(dir.c_str()) != 0) {
            const char msg[] = "cannot enter working directory\n";
            ssize_t ignored = write(STDERR_FILENO, msg, sizeof(msg) - 1);
            (void)ignored;
            _exit(SPAWN_FAILURE);
        }
        execvp(argv[0], argv.data());
        const char msg[] = "cannot execute shell\n";
        ssize_t ignored = write(STDERR_FILENO, msg, sizeof(msg) - 1);
        (void)ignored;
        _exit(SPAWN_FAILURE);
    }
    setpgid(pid, pid);
    write_end.reset();

    bool terminating = false;
    int grace = 0;
    char buf[4096];
    pollfd pfd{read_end.get(), POLLIN, 0};
    while (true) {
        if (!terminating && token.cancelled()) {
            log_debug("Cancelling command", {{"cmd", command}});
            kill(-pid, SIGTERM);
            terminating = true;
        } else if (terminating && ++grace == TERM_GRACE_SLICES) {
            kill(-pid, SIGKILL);
        }
        int pr = poll(&pfd, 1, POLL_SLICE_MS);
        if (pr < 0) {
            if (errno == EINTR)
                continue;
            break;
        }
        if (pr == 0)
            continue;
        ssize_t n = read(read_end.get(), buf, sizeof(buf));
        if (n > 0) {
            result.output.append(buf, static_cast<size_t>(n));
        } else if (n == 0) {
            break;
        } else if (errno != EINTR) {
            break;
        }
    }
    read_end.reset();

    int status = 0;
    pid_t waited;
    do {
        waited = waitpid(pid, &status, 0);
    } while (waited < 0 && errno == EINTR);
    result.exit_code = waited < 0 ? -1 : decode_wait_status(status);
    result.cancelled = terminating;
    return result;
}

#else

static std::string windows_command_line(const std::vector<std::string>& args) {
    // The interpreter takes everything after /C verbatim.
    std::string line;
    for (size_t i = 0; i < args.size(); ++i) {
        if (i > 0)
            line += ' ';
        line += args[i];
    }
    return line;
}

static void drain_pipe(HANDLE h, std::string& out) {
    char buf[4096];
    DWORD n = 0;
    while (ReadFile(h, buf, sizeof(buf), &n, nullptr) && n > 0)
        out.append(buf, n);
}

CommandResult ShellCommandRunner::run(const std::string& command,
                                      const CancellationToken& token) {
    CommandResult result;
    if (token.cancelled()) {
        result.cancelled = true;
        return result;
    }
    std::string line = windows_command_line(wrap_command(command, os_name_));

    SECURITY_ATTRIBUTES sa{};
    sa.nLength = sizeof(sa);
    sa.bInheritHandle = TRUE;
    HANDLE raw_read = nullptr;
    HANDLE raw_write = nullptr;
    if (!CreatePipe(&raw_read, &raw_write, &sa, 0)) {
        result.exit_code = SPAWN_FAILURE;
        result.output = "CreatePipe failed";
        return result;
    }
    procutil::UniqueHandle read_end(raw_read);
    procutil::UniqueHandle write_end(raw_write);
    SetHandleInformation(read_end.get(), HANDLE_FLAG_INHERIT, 0);

    // Every descendant joins the job, so cancellation can stop the whole tree
    // and closing the job never leaves a child holding the pipe open.
    procutil::UniqueHandle job(CreateJobObjectA(nullptr, nullptr));
    if (!job.get()) {
        result.exit_code = SPAWN_FAILURE;
        result.output = "CreateJobObject failed with error " + std::to_string(GetLastError());
        return result;
    }
    JOBOBJECT_EXTENDED_LIMIT_INFORMATION limits{};
    limits.BasicLimitInformation.LimitFlags = JOB_OBJECT_LIMIT_KILL_ON_JOB_CLOSE;
    SetInformationJobObject(job.get(), JobObjectExtendedLimitInformation, &limits,
                            sizeof(limits));

    SECURITY_ATTRIBUTES nul_sa{};
    nul_sa.nLength = sizeof(nul_sa);
    nul_sa.bInheritHandle = TRUE;
    procutil::UniqueHandle nul_in(CreateFileA("NUL", GENERIC_READ,
                                              FILE_SHARE_READ | FILE_SHARE_WRITE, &nul_sa,
                                              OPEN_EXISTING, 0, nullptr));

    STARTUPINFOA si{};
    si.cb = sizeof(si);
    si.dwFlags = STARTF_USESTDHANDLES;
    si.hStdInput = nul_in.get();
    si.hStdOutput = write_end.get();
    si.hStdError = write_end.get();
    PROCESS_INFORMATION pi{};
    std::string dir = dir_.string();
    if (!CreateProcessA(nullptr, line.data(), nullptr, nullptr, TRUE, CREATE_SUSPENDED, nullptr,
                        dir.empty() ? nullptr : dir.c_str(), &si, &pi)) {
        result.exit_code = SPAWN_FAILURE;
        result.output = "CreateProcess failed with error " + std::to_string(GetLastError());
        return result;
    }
    procutil::UniqueHandle process(pi.hProcess);
    procutil::UniqueHandle thread(pi.hThread);
    if (!AssignProcessToJobObject(job.get(), process.get())) {
        DWORD err = GetLastError();
        TerminateProcess(process.get(), SPAWN_FAILURE);
        WaitForSingleObject(process.get(), INFINITE);
        result.exit_code = SPAWN_FAILURE;
        result.output = "AssignProcessToJobObject failed with error " + std::to_string(err);
        return result;
    }
    ResumeThread(thread.get());
    write_end.reset();
    nul_in.reset();

    char buf[4096];
    while (true) {
        DWORD avail = 0;
        if (!PeekNamedPipe(read_end.get(), nullptr, 0, nullptr, &avail, nullptr))
            break;
        if (avail > 0) {
            DWORD n = 0;
            if (!ReadFile(read_end.get(), buf, sizeof(buf), &n, nullptr) || n == 0)
                break;
            result.output.append(buf, n);
            continue;
        }
        if (WaitForSingleObject(process.get(), POLL_SLICE_MS) == WAIT_OBJECT_0) {
            drain_pipe(read_end.get(), result.output);
            break;
        }
        if (token.cancelled()) {
            log_debug("Cancelling command", {{"cmd", command}});
            TerminateJobObject(job.get(), 1);
            WaitForSingleObject(process.get(), INFINITE);
            drain_pipe(read_end.get(), result.output);
            result.cancelled = true;
            break;
        }
    }
    WaitForSingleObject(process.get(), INFINITE);
    DWORD code = 0;
    if (GetExitCodeProcess(process.get(), &code))
        result.exit_code = static_cast<int>(code);
    return result;
}

#endif // _WIN32

} // namespace maintbranch
