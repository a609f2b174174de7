#ifndef OPTIONS_HPP
#define OPTIONS_HPP
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include "arg_parser.hpp"
#include "logger.hpp"

struct LoggingOptions {
    LogLevel log_level = LogLevel::INFO;
    std::string log_file;
    size_t max_log_size = 0;
    size_t max_log_files = 3;
    bool json_log = false;
    bool compress_logs = false;
    bool quiet = false;
};

struct Options {
    std::filesystem::path root;
    std::string project;
    std::optional<std::string> base_version;
    std::string set_version_command;
    bool dry_run = false;
    bool show_help = false;
    bool print_version = false;
    std::filesystem::path config_file;
    LoggingOptions logging;
};

/**
 * @brief Every flag the command line accepts.
 */
const std::vector<FlagSpec>& option_specs();

/**
 * @brief Parse command line arguments, merging any configuration file.
 *
 * Values given on the command line override values from `--config-yaml`,
 * `--config-json` or an auto-detected `.maintbranch.yaml`/`.maintbranch.json`.
 *
 * @throws maintbranch::UsageError on unknown flags, missing values, bad
 *         values or unreadable configuration files.
 */
Options parse_options(int argc, char* argv[]);

/**
 * @brief Load the configuration file selected by the command line.
 *
 * Honors `--config-yaml`, `--config-json` and `--auto-config`; the latter
 * searches the `--root` directory and then the current directory.
 *
 * @param cfg_opts    Receives option values keyed by long flag.
 * @param config_file Receives the path of the file that was loaded, if any.
 */
void load_config_and_auto(const ArgParser& parser, std::map<std::string, std::string>& cfg_opts,
                          std::filesystem::path& config_file);

/**
 * @brief Build Options from parsed flags and configuration values.
 *
 * Does not touch the filesystem apart from resolving the root directory.
 */
Options build_options(const ArgParser& parser, const std::map<std::string, std::string>& cfg_opts);

#endif // OPTIONS_HPP
