#include "version_setter.hpp"

#include <utility>

#include "errors.hpp"
#include "logger.hpp"

namespace maintbranch {

static void replace_all(std::string& s, const std::string& from, const std::string& to) {
    size_t pos = 0;
    while ((pos = s.find(from, pos)) != std::string::npos) {
        s.replace(pos, from.size(), to);
        pos += to.size();
    }
}

std::string expand_version_command(const std::string& templ, const std::string& version,
                                   bool keep_backups) {
    std::string cmd = templ;
    replace_all(cmd, "{version}", version);
    replace_all(cmd, "{backups}", keep_backups ? "true" : "false");
    return cmd;
}

CommandVersionSetter::CommandVersionSetter(CommandRunner& runner, std::string command_template)
    : runner_(runner), templ_(std::move(command_template)) {}

bool CommandVersionSetter::set_version(const std::string& new_version, bool keep_backups,
                                       const CancellationToken& token) {
    if (templ_.empty())
        throw ConfigStepError("No set-version command configured");
    std::string cmd = expand_version_command(templ_, new_version, keep_backups);
    CommandResult res = runner_.run(cmd, token);
    log_debug("set-version output: " + res.output);
    if (res.cancelled)
        return false;
    if (res.exit_code != 0)
        throw ConfigStepError("Could not set project version to " + new_version +
                              ", status code: " + std::to_string(res.exit_code));
    return true;
}

} // namespace maintbranch
