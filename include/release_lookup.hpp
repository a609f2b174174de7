#ifndef RELEASE_LOOKUP_HPP
#define RELEASE_LOOKUP_HPP

#include <filesystem>
#include <optional>
#include <string>

#include "version_calc.hpp"

namespace maintbranch {
namespace fs = std::filesystem;

/**
 * @brief Finds the most recent release of the project.
 */
class ReleaseLookup {
  public:
    virtual ~ReleaseLookup() = default;

    /**
     * @return The latest release, or `std::nullopt` if none was published.
     * @throws ReleaseLookupError when the release history cannot be read.
     */
    virtual std::optional<ReleaseVersion> latest_release() = 0;
};

/**
 * @brief Release lookup driven by `{project}-major.minor[.incremental]` tags.
 *
 * Only tags whose suffix consists of two or three purely numeric components
 * count as releases. The highest one wins; a missing incremental sorts below
 * an explicit `0`.
 */
class GitTagReleaseLookup : public ReleaseLookup {
  public:
    GitTagReleaseLookup(fs::path repo, std::string project);

    std::optional<ReleaseVersion> latest_release() override;

  private:
    fs::path repo_;
    std::string project_;
};

/**
 * @brief Parse the version part of a release tag.
 *
 * @return The version if @p tag is `{project}-` followed by two or three
 *         numeric dot-separated components, otherwise `std::nullopt`.
 */
std::optional<ReleaseVersion> parse_release_tag(const std::string& project, const std::string& tag);

} // namespace maintbranch

#endif // RELEASE_LOOKUP_HPP
