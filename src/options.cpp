#include <algorithm>
#include <cctype>
#include <filesystem>
#include <map>
#include <string>

#include "config_utils.hpp"
#include "errors.hpp"
#include "options.hpp"
#include "parse_utils.hpp"
#include "version_setter.hpp"

namespace fs = std::filesystem;
using maintbranch::UsageError;

const std::vector<FlagSpec>& option_specs() {
    static const std::vector<FlagSpec> specs = {
        {"--base-version", 'b', true},
        {"--project", 'p', true},
        {"--root", 'o', true},
        {"--set-version-command", 's', true},
        {"--dry-run", 'n', false},
        {"--config-yaml", 'y', true},
        {"--config-json", 'j', true},
        {"--auto-config", 0, false},
        {"--log-file", 'l', true},
        {"--log-level", 'L', true},
        {"--verbose", 'v', false},
        {"--json-log", 0, false},
        {"--max-log-size", 0, true},
        {"--max-log-files", 0, true},
        {"--compress-logs", 0, false},
        {"--quiet", 'q', false},
        {"--help", 'h', false},
        {"--version", 'V', false},
    };
    return specs;
}

static bool is_value_flag(const std::string& key) {
    for (const auto& s : option_specs()) {
        if (s.name == key)
            return s.takes_value;
    }
    return false;
}

static bool truthy(std::string v) {
    std::transform(v.begin(), v.end(), v.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return v.empty() || v == "1" || v == "true" || v == "yes" || v == "on";
}

static void load_file(const fs::path& path, std::map<std::string, std::string>& cfg_opts) {
    std::string err;
    bool ok = path.extension() == ".json" ? load_json_config(path.string(), cfg_opts, err)
                                          : load_yaml_config(path.string(), cfg_opts, err);
    if (!ok)
        throw UsageError("Failed to load config " + path.string() + ": " + err);
}

void load_config_and_auto(const ArgParser& parser, std::map<std::string, std::string>& cfg_opts,
                          fs::path& config_file) {
    if (parser.has_flag("--config-yaml")) {
        std::string cfg = parser.get_option("--config-yaml");
        if (cfg.empty())
            throw UsageError("--config-yaml requires a file");
        std::string err;
        if (!load_yaml_config(cfg, cfg_opts, err))
            throw UsageError("Failed to load config: " + err);
        config_file = cfg;
    }
    if (parser.has_flag("--config-json")) {
        std::string cfg = parser.get_option("--config-json");
        if (cfg.empty())
            throw UsageError("--config-json requires a file");
        std::string err;
        if (!load_json_config(cfg, cfg_opts, err))
            throw UsageError("Failed to load config: " + err);
        config_file = cfg;
    }
    if (!parser.has_flag("--auto-config") || !config_file.empty())
        return;

    auto find_cfg = [](const fs::path& dir) -> fs::path {
        if (dir.empty())
            return {};
        std::error_code ec;
        for (const char* name : {".maintbranch.yaml", ".maintbranch.json"}) {
            fs::path candidate = dir / name;
            if (fs::exists(candidate, ec))
                return candidate;
        }
        return {};
    };
    fs::path found;
    if (parser.has_flag("--root"))
        found = find_cfg(parser.get_option("--root"));
    if (found.empty())
        found = find_cfg(fs::current_path());
    if (!found.empty()) {
        load_file(found, cfg_opts);
        config_file = found;
    }
}

static std::string project_from_root(const fs::path& root) {
    fs::path norm = root.lexically_normal();
    std::string name = norm.filename().string();
    if (name.empty())
        name = norm.parent_path().filename().string();
    return name;
}

Options build_options(const ArgParser& parser, const std::map<std::string, std::string>& cfg_opts) {
    for (const auto& [key, val] : cfg_opts) {
        (void)val;
        auto& specs = option_specs();
        bool known = std::any_of(specs.begin(), specs.end(),
                                 [&](const FlagSpec& s) { return s.name == key; });
        if (!known)
            throw UsageError("Unknown option in config file: " + key.substr(2));
    }
    auto has = [&](const std::string& k) { return parser.has_flag(k) || cfg_opts.count(k) > 0; };
    auto value = [&](const std::string& k) -> std::string {
        if (parser.has_flag(k))
            return parser.get_option(k);
        auto it = cfg_opts.find(k);
        return it == cfg_opts.end() ? std::string() : it->second;
    };
    auto flag = [&](const std::string& k) {
        if (parser.has_flag(k))
            return parser.get_option(k).empty() || truthy(parser.get_option(k));
        auto it = cfg_opts.find(k);
        return it != cfg_opts.end() && truthy(it->second);
    };

    Options opts;
    opts.show_help = flag("--help");
    opts.print_version = flag("--version");
    opts.dry_run = flag("--dry-run");

    if (has("--base-version")) {
        std::string v = value("--base-version");
        if (v.empty())
            throw UsageError("--base-version requires a version");
        opts.base_version = v;
    }

    std::string root = value("--root");
    opts.root = fs::absolute(root.empty() ? fs::current_path() : fs::path(root));

    opts.project = value("--project");
    if (opts.project.empty())
        opts.project = project_from_root(opts.root);

    opts.set_version_command = has("--set-version-command")
                                   ? value("--set-version-command")
                                   : std::string(maintbranch::DEFAULT_SET_VERSION_COMMAND);

    if (has("--log-level")) {
        bool ok = false;
        opts.logging.log_level = parse_log_level(value("--log-level"), ok);
        if (!ok)
            throw UsageError("Invalid value for --log-level: " + value("--log-level"));
    }
    if (flag("--verbose"))
        opts.logging.log_level = LogLevel::DEBUG;
    opts.logging.log_file = value("--log-file");
    if (has("--max-log-size")) {
        bool ok = false;
        opts.logging.max_log_size = parse_bytes(value("--max-log-size"), ok);
        if (!ok)
            throw UsageError("Invalid value for --max-log-size: " + value("--max-log-size"));
    }
    if (has("--max-log-files")) {
        bool ok = false;
        opts.logging.max_log_files =
            static_cast<size_t>(parse_int(value("--max-log-files"), 1, 1000, ok));
        if (!ok)
            throw UsageError("Invalid value for --max-log-files: " + value("--max-log-files"));
    }
    opts.logging.json_log = flag("--json-log");
    opts.logging.compress_logs = flag("--compress-logs");
    opts.logging.quiet = flag("--quiet");
    return opts;
}

Options parse_options(int argc, char* argv[]) {
    ArgParser parser(argc, argv, option_specs());
    if (!parser.unknown_flags().empty())
        throw UsageError("Unknown option: " + parser.unknown_flags().front());
    if (!parser.missing_values().empty())
        throw UsageError(parser.missing_values().front() + " requires a value");
    if (!parser.positional().empty())
        throw UsageError("Unexpected argument: " + parser.positional().front());

    std::map<std::string, std::string> cfg_opts;
    fs::path config_file;
    load_config_and_auto(parser, cfg_opts, config_file);
    for (const auto& [key, val] : cfg_opts) {
        if (is_value_flag(key) && val.empty())
            throw UsageError("Config option " + key.substr(2) + " requires a value");
    }
    Options opts = build_options(parser, cfg_opts);
    opts.config_file = config_file;
    return opts;
}
