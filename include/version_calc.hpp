#ifndef VERSION_CALC_HPP
#define VERSION_CALC_HPP

#include <optional>
#include <string>

namespace maintbranch {

/**
 * @brief A previously released version: major.minor[.incremental].
 *
 * Major and minor are always non-empty. Components are kept as text; only the
 * incremental is interpreted numerically, and only when the next development
 * version is derived.
 */
struct ReleaseVersion {
    std::string major;
    std::string minor;
    std::optional<std::string> incremental;
};

/**
 * @brief Every name derived for one maintenance branch.
 */
struct BranchPlan {
    std::string release_version; ///< e.g. `2.3.5`
    std::string tag_name;        ///< e.g. `foo-2.3.5`
    std::string branch_name;     ///< e.g. `foo-2.3.x`
    std::string branch_version;  ///< e.g. `2.3.6-SNAPSHOT`
};

/**
 * @brief Parse a dotted version string.
 *
 * Trailing empty segments are dropped before counting. Two segments leave the
 * incremental absent; the third segment becomes the incremental and anything
 * after it is ignored.
 *
 * @throws InvalidVersionError on fewer than two segments or an empty major or
 *         minor component.
 */
ReleaseVersion parse_release_version(const std::string& text);

/**
 * @brief `major.minor[.incremental]`.
 */
std::string release_version(const ReleaseVersion& v);

/**
 * @brief `{project}-major.minor[.incremental]`.
 */
std::string tag_name(const std::string& project, const ReleaseVersion& v);

/**
 * @brief `{project}-major.minor.x`, regardless of the incremental.
 */
std::string branch_name(const std::string& project, const ReleaseVersion& v);

/**
 * @brief Next development version on the maintenance branch.
 *
 * `major.minor.1-SNAPSHOT` without an incremental, otherwise the incremental
 * plus one.
 *
 * @throws InvalidVersionError if the incremental is not a 32-bit decimal
 *         integer.
 */
std::string branch_version(const ReleaseVersion& v);

/**
 * @brief Tag name with the segment after its last `.` removed.
 *
 * Used once as a retry when a release was tagged without its incremental.
 * A name without any `.` is returned unchanged.
 */
std::string fallback_tag_name(const std::string& tag);

/**
 * @brief Derive all names at once.
 *
 * @throws InvalidVersionError propagated from branch_version().
 */
BranchPlan make_plan(const std::string& project, const ReleaseVersion& v);

} // namespace maintbranch

#endif // VERSION_CALC_HPP
