#ifndef VERSION_SETTER_HPP
#define VERSION_SETTER_HPP

#include <string>

#include "cancellation.hpp"
#include "command_runner.hpp"

namespace maintbranch {

/**
 * @brief Rewrites the version the project declares for itself.
 */
class VersionSetter {
  public:
    virtual ~VersionSetter() = default;

    /**
     * @brief Set the declared version to @p new_version.
     *
     * @param keep_backups Whether the tool may leave backup copies of the files
     *                     it rewrites.
     * @return `false` if the step was cancelled before completing.
     * @throws ConfigStepError when the step fails.
     */
    virtual bool set_version(const std::string& new_version, bool keep_backups,
                             const CancellationToken& token) = 0;
};

constexpr const char* DEFAULT_SET_VERSION_COMMAND =
    "mvn -q versions:set -DnewVersion={version} -DgenerateBackupPoms={backups}";

/**
 * @brief Replace `{version}` and `{backups}` placeholders in @p templ.
 *
 * `{backups}` becomes `true` or `false`. Every occurrence is replaced.
 */
std::string expand_version_command(const std::string& templ, const std::string& version,
                                   bool keep_backups);

/**
 * @brief Version setter that runs a packaging tool's command line.
 */
class CommandVersionSetter : public VersionSetter {
  public:
    CommandVersionSetter(CommandRunner& runner, std::string command_template);

    bool set_version(const std::string& new_version, bool keep_backups,
                     const CancellationToken& token) override;

  private:
    CommandRunner& runner_;
    std::string templ_;
};

} // namespace maintbranch

#endif // VERSION_SETTER_HPP
