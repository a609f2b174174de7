#include "release_lookup.hpp"

#include <cctype>
#include <tuple>
#include <utility>
#include <vector>

#include "errors.hpp"
#include "git_utils.hpp"
#include "logger.hpp"

namespace maintbranch {

namespace {
bool all_digits(const std::string& s) {
    if (s.empty() || s.size() > 9)
        return false;
    for (char c : s) {
        if (!std::isdigit(static_cast<unsigned char>(c)))
            return false;
    }
    return true;
}

// (major, minor, incremental) with an absent incremental ranked as -1.
std::tuple<long, long, long> sort_key(const ReleaseVersion& v) {
    long inc = v.incremental ? std::stol(*v.incremental) : -1;
    return {std::stol(v.major), std::stol(v.minor), inc};
}
} // namespace

std::optional<ReleaseVersion> parse_release_tag(const std::string& project, const std::string& tag) {
    const std::string prefix = project + "-";
    if (tag.size() <= prefix.size() || tag.compare(0, prefix.size(), prefix) != 0)
        return std::nullopt;
    std::vector<std::string> parts;
    std::string rest = tag.substr(prefix.size());
    size_t start = 0;
    while (true) {
        size_t dot = rest.find('.', start);
        parts.push_back(rest.substr(start, dot - start));
        if (dot == std::string::npos)
            break;
        start = dot + 1;
    }
    if (parts.size() < 2 || parts.size() > 3)
        return std::nullopt;
    for (const auto& p : parts) {
        if (!all_digits(p))
            return std::nullopt;
    }
    ReleaseVersion v;
    v.major = parts[0];
    v.minor = parts[1];
    if (parts.size() == 3)
        v.incremental = parts[2];
    return v;
}

GitTagReleaseLookup::GitTagReleaseLookup(fs::path repo, std::string project)
    : repo_(std::move(repo)), project_(std::move(project)) {}

std::optional<ReleaseVersion> GitTagReleaseLookup::latest_release() {
    std::string err;
    auto tags = git::list_tags(repo_, project_ + "-*", &err);
    if (!tags)
        throw ReleaseLookupError("Could not list tags in " + repo_.string() + ": " + err);
    std::optional<ReleaseVersion> best;
    for (const auto& t : *tags) {
        auto v = parse_release_tag(project_, t);
        if (!v)
            continue;
        if (!best || sort_key(*v) > sort_key(*best))
            best = std::move(v);
    }
    if (best)
        log_debug("Latest release tag found", {{"version", release_version(*best)}});
    return best;
}

} // namespace maintbranch
