#ifndef SYSTEM_UTILS_HPP
#define SYSTEM_UTILS_HPP
#include <string>
#ifdef _WIN32
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>
#include <io.h>
#else
#include <unistd.h>
#endif

namespace procutil {

/**
 * @brief Name of the running operating system.
 *
 * `"Windows"` on Windows builds, otherwise the `uname` sysname (for example
 * `"Linux"` or `"Darwin"`). Returns `"unknown"` if it cannot be determined.
 */
std::string host_os_name();

#ifdef _WIN32
/**
 * @brief Owning Windows @c HANDLE for pipe ends and spawned processes.
 */
class UniqueHandle {
  public:
    explicit UniqueHandle(HANDLE handle) noexcept : h_(handle) {}
    ~UniqueHandle() { reset(); }
    UniqueHandle(const UniqueHandle&) = delete;
    UniqueHandle& operator=(const UniqueHandle&) = delete;

    HANDLE get() const noexcept { return h_; }
    void reset() noexcept {
        if (h_ != nullptr && h_ != INVALID_HANDLE_VALUE)
            CloseHandle(h_);
        h_ = INVALID_HANDLE_VALUE;
    }

  private:
    HANDLE h_;
};
#endif // _WIN32

/**
 * @brief Owning POSIX file descriptor; closed on scope exit or reset().
 */
class UniqueFd {
  public:
    explicit UniqueFd(int fd) noexcept : fd_(fd) {}
    ~UniqueFd() { reset(); }
    UniqueFd(const UniqueFd&) = delete;
    UniqueFd& operator=(const UniqueFd&) = delete;

    int get() const noexcept { return fd_; }
    void reset() noexcept {
        if (fd_ >= 0) {
#ifdef _WIN32
            _close(fd_);
#else
            close(fd_);
#endif
        }
        fd_ = -1;
    }

  private:
    int fd_;
};

} // namespace procutil

#endif // SYSTEM_UTILS_HPP
