#include "help_text.hpp"
#include <iomanip>
#include <string>
#include <vector>

namespace {
struct OptionInfo {
    const char* long_flag;
    const char* short_flag;
    const char* arg;
    const char* desc;
    const char* category;
};
} // namespace

void print_help(const char* prog, std::ostream& os) {
    static const std::vector<OptionInfo> opts = {
        {"--base-version", "-b", "<ver>", "Release to branch from (major.minor[.incremental])",
         "Branch"},
        {"--project", "-p", "<id>", "Tag and branch prefix (default: root directory name)",
         "Branch"},
        {"--root", "-o", "<path>", "Project root (default: current directory)", "Branch"},
        {"--set-version-command", "-s", "<cmd>",
         "Version bump command; {version} and {backups} are substituted", "Branch"},
        {"--dry-run", "-n", "", "Print the derived names without running any command", "Branch"},
        {"--config-yaml", "-y", "<file>", "Load options from YAML file", "Config"},
        {"--config-json", "-j", "<file>", "Load options from JSON file", "Config"},
        {"--auto-config", "", "", "Load .maintbranch.yaml or .maintbranch.json", "Config"},
        {"--log-file", "-l", "<file>", "Also write the log to a file", "Logging"},
        {"--log-level", "-L", "<lvl>", "DEBUG, INFO, WARNING or ERROR", "Logging"},
        {"--verbose", "-v", "", "Same as --log-level DEBUG", "Logging"},
        {"--json-log", "", "", "Write log entries as JSON", "Logging"},
        {"--max-log-size", "", "<bytes>", "Rotate the log file past this size", "Logging"},
        {"--max-log-files", "", "<n>", "Rotated log files to keep (default: 3)", "Logging"},
        {"--compress-logs", "", "", "Gzip rotated log files", "Logging"},
        {"--quiet", "-q", "", "No log output on the console", "Logging"},
        {"--help", "-h", "", "Show this message", "Other"},
        {"--version", "-V", "", "Print program version and exit", "Other"},
    };
    static const char* const categories[] = {"Branch", "Config", "Logging", "Other"};

    os << "Usage: " << prog << " [--base-version <major.minor[.incremental]>] [options]\n\n";
    os << "Creates a maintenance branch {project}-major.minor.x from the release tag\n"
          "and commits the next development version on it.\n";
    for (const char* cat : categories) {
        os << "\n" << cat << ":\n";
        for (const auto& o : opts) {
            if (std::string(o.category) != cat)
                continue;
            std::string flags = std::string(o.short_flag).empty()
                                    ? std::string("    ") + o.long_flag
                                    : std::string(o.short_flag) + ", " + o.long_flag;
            if (*o.arg)
                flags += std::string(" ") + o.arg;
            os << "  " << std::left << std::setw(34) << flags << o.desc << "\n";
        }
    }
}
