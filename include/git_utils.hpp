#ifndef GIT_UTILS_HPP
#define GIT_UTILS_HPP

#include <git2.h>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace git {
namespace fs = std::filesystem;

/**
 * @brief RAII helper managing global libgit2 initialization.
 *
 * Instantiate once for the lifetime of the application to ensure all libgit2
 * operations are performed after initialization and before shutdown.
 */
struct GitInitGuard {
    GitInitGuard();  ///< Calls `git_libgit2_init()`
    ~GitInitGuard(); ///< Calls `git_libgit2_shutdown()`
    GitInitGuard(const GitInitGuard&) = delete;
    GitInitGuard& operator=(const GitInitGuard&) = delete;
};

// RAII wrappers for libgit2 resources
template <typename T, void (*Free)(T*)> struct GitHandle {
    T* h;
    explicit GitHandle(T* h_ = nullptr) : h(h_) {}
    ~GitHandle() {
        if (h)
            Free(h);
    }
    GitHandle(const GitHandle&) = delete;
    GitHandle& operator=(const GitHandle&) = delete;
    T* get() const { return h; }
};

using repo_ptr = GitHandle<git_repository, git_repository_free>;
using reference_ptr = GitHandle<git_reference, git_reference_free>;

// The utility functions below assume libgit2 is already initialized.

/**
 * @brief Determine whether @a p lies inside a Git working tree.
 *
 * Walks up parent directories the same way `git` itself does.
 */
bool is_git_repo(const fs::path& p);

/**
 * @brief Names of tags matching a glob pattern such as `foo-*`.
 *
 * @param repo    Path inside a Git repository.
 * @param pattern `fnmatch` style pattern; empty matches every tag.
 * @param error   Optional output string receiving a libgit2 error message.
 * @return Tag names without the `refs/tags/` prefix, or `std::nullopt` if the
 *         repository could not be opened or listed.
 */
std::optional<std::vector<std::string>> list_tags(const fs::path& repo, const std::string& pattern,
                                                  std::string* error = nullptr);

/**
 * @brief Retrieve the currently checked out branch name.
 *
 * @param repo  Path inside a Git repository.
 * @param error Optional output string receiving a libgit2 error message.
 * @return Branch name or `std::nullopt` if it cannot be determined (for
 *         example on a detached HEAD).
 */
std::optional<std::string> get_current_branch(const fs::path& repo, std::string* error = nullptr);

} // namespace git

#endif // GIT_UTILS_HPP
