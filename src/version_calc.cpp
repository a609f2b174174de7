#include "version_calc.hpp"

#include <cctype>
#include <climits>
#include <vector>

#include "errors.hpp"

namespace maintbranch {

static std::vector<std::string> split_version(const std::string& text) {
    std::vector<std::string> parts;
    std::string cur;
    for (char c : text) {
        if (c == '.') {
            parts.push_back(cur);
            cur.clear();
        } else {
            cur += c;
        }
    }
    parts.push_back(cur);
    while (!parts.empty() && parts.back().empty())
        parts.pop_back();
    return parts;
}

// Signed decimal, no surrounding whitespace, must fit in an int.
static bool parse_incremental(const std::string& s, long long& out) {
    if (s.empty())
        return false;
    size_t i = 0;
    bool neg = false;
    if (s[0] == '+' || s[0] == '-') {
        neg = s[0] == '-';
        i = 1;
    }
    if (i == s.size())
        return false;
    long long v = 0;
    for (; i < s.size(); ++i) {
        unsigned char c = static_cast<unsigned char>(s[i]);
        if (!std::isdigit(c))
            return false;
        v = v * 10 + (c - '0');
        if (v > static_cast<long long>(INT_MAX) + 1)
            return false;
    }
    if (neg)
        v = -v;
    if (v < INT_MIN || v > INT_MAX)
        return false;
    out = v;
    return true;
}

ReleaseVersion parse_release_version(const std::string& text) {
    std::vector<std::string> parts = split_version(text);
    if (parts.size() < 2)
        throw InvalidVersionError("Invalid version: " + text);
    if (parts[0].empty() || parts[1].empty())
        throw InvalidVersionError("Invalid version: " + text);
    ReleaseVersion v;
    v.major = parts[0];
    v.minor = parts[1];
    if (parts.size() > 2)
        v.incremental = parts[2];
    return v;
}

std::string release_version(const ReleaseVersion& v) {
    std::string out = v.major + "." + v.minor;
    if (v.incremental)
        out += "." + *v.incremental;
    return out;
}

std::string tag_name(const std::string& project, const ReleaseVersion& v) {
    return project + "-" + release_version(v);
}

std::string branch_name(const std::string& project, const ReleaseVersion& v) {
    return project + "-" + v.major + "." + v.minor + ".x";
}

std::string branch_version(const ReleaseVersion& v) {
    long long next = 1;
    if (v.incremental) {
        long long cur = 0;
        if (!parse_incremental(*v.incremental, cur))
            throw InvalidVersionError("Invalid incremental version: " + *v.incremental);
        next = cur + 1;
    }
    return v.major + "." + v.minor + "." + std::to_string(next) + "-SNAPSHOT";
}

std::string fallback_tag_name(const std::string& tag) {
    size_t dot = tag.rfind('.');
    if (dot == std::string::npos)
        return tag;
    return tag.substr(0, dot);
}

BranchPlan make_plan(const std::string& project, const ReleaseVersion& v) {
    BranchPlan plan;
    plan.release_version = release_version(v);
    plan.tag_name = tag_name(project, v);
    plan.branch_name = branch_name(project, v);
    plan.branch_version = branch_version(v);
    return plan;
}

} // namespace maintbranch
