#include "git_utils.hpp"

namespace git {

GitInitGuard::GitInitGuard() { git_libgit2_init(); }

GitInitGuard::~GitInitGuard() { git_libgit2_shutdown(); }

static void set_error(std::string* error) {
    if (!error)
        return;
    const git_error* e = git_error_last();
    *error = e && e->message ? e->message : "unknown libgit2 error";
}

static bool open_repo(const fs::path& p, git_repository** out) {
    return git_repository_open_ext(out, p.string().c_str(), 0, nullptr) == 0;
}

bool is_git_repo(const fs::path& p) {
    git_repository* raw = nullptr;
    if (!open_repo(p, &raw))
        return false;
    repo_ptr r(raw);
    return !git_repository_is_bare(r.get());
}

std::optional<std::vector<std::string>> list_tags(const fs::path& repo, const std::string& pattern,
                                                  std::string* error) {
    git_repository* raw = nullptr;
    if (!open_repo(repo, &raw)) {
        set_error(error);
        return std::nullopt;
    }
    repo_ptr r(raw);
    git_strarray names = {nullptr, 0};
    if (git_tag_list_match(&names, pattern.empty() ? "*" : pattern.c_str(), r.get()) != 0) {
        set_error(error);
        return std::nullopt;
    }
    std::vector<std::string> out;
    out.reserve(names.count);
    for (size_t i = 0; i < names.count; ++i)
        out.emplace_back(names.strings[i]);
    git_strarray_dispose(&names);
    return out;
}

std::optional<std::string> get_current_branch(const fs::path& repo, std::string* error) {
    git_repository* raw = nullptr;
    if (!open_repo(repo, &raw)) {
        set_error(error);
        return std::nullopt;
    }
    repo_ptr r(raw);
    git_reference* head_raw = nullptr;
    if (git_repository_head(&head_raw, r.get()) != 0) {
        set_error(error);
        return std::nullopt;
    }
    reference_ptr head(head_raw);
    if (!git_reference_is_branch(head.get()))
        return std::nullopt;
    const char* name = nullptr;
    if (git_branch_name(&name, head.get()) != 0 || !name) {
        set_error(error);
        return std::nullopt;
    }
    return std::string(name);
}

} // namespace git
