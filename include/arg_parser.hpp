#ifndef ARG_PARSER_HPP
#define ARG_PARSER_HPP
#include <map>
#include <set>
#include <string>
#include <vector>

/**
 * @brief Description of one accepted command line flag.
 */
struct FlagSpec {
    std::string name;  ///< Long form including the leading `--`
    char short_name;   ///< Single character alias, or `0` for none
    bool takes_value;  ///< Whether the flag consumes an argument
};

/**
 * @brief Simple command line argument parser.
 *
 * Recognizes long options (`--flag`, `--opt value`, `--opt=value`) and their
 * single character aliases (`-f`, `-o value`, `-ovalue`). Whether a flag
 * consumes a value is fixed by its @ref FlagSpec, so `--dry-run -b 1.2` is
 * read as two flags. Flags missing from the FlagSpec list are collected in
 * unknown_flags(); value flags given without a value are collected in
 * missing_values().
 */
class ArgParser {
    std::set<std::string> flags_;                ///< Flags present on the command line
    std::map<std::string, std::string> options_; ///< Option values keyed by flag
    std::vector<std::string> positional_;        ///< Positional arguments in order
    std::vector<std::string> unknown_flags_;     ///< Flags not present in the FlagSpec list
    std::vector<std::string> missing_values_;    ///< Value flags given without a value
    std::map<std::string, bool> takes_value_;
    std::map<char, std::string> short_map_;

    void record(const std::string& key, const std::string* value) {
        flags_.insert(key);
        if (value)
            options_[key] = *value;
    }

  public:
    ArgParser(int argc, char* argv[], const std::vector<FlagSpec>& specs) {
        for (const auto& s : specs) {
            takes_value_[s.name] = s.takes_value;
            if (s.short_name)
                short_map_[s.short_name] = s.name;
        }
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            std::string key;
            std::string inline_val;
            bool has_inline = false;
            if (arg.rfind("--", 0) == 0 && arg.size() > 2) {
                size_t eq = arg.find('=');
                key = arg.substr(0, eq);
                if (eq != std::string::npos) {
                    inline_val = arg.substr(eq + 1);
                    has_inline = true;
                }
            } else if (arg.size() >= 2 && arg[0] == '-' && arg[1] != '-') {
                auto it = short_map_.find(arg[1]);
                if (it == short_map_.end()) {
                    unknown_flags_.push_back(arg);
                    continue;
                }
                key = it->second;
                if (arg.size() > 2) {
                    inline_val = arg.substr(arg[2] == '=' ? 3 : 2);
                    has_inline = true;
                }
            } else {
                positional_.push_back(arg);
                continue;
            }

            auto spec = takes_value_.find(key);
            if (spec == takes_value_.end()) {
                unknown_flags_.push_back(key);
                continue;
            }
            if (!spec->second) {
                record(key, has_inline ? &inline_val : nullptr);
                continue;
            }
            if (has_inline) {
                record(key, &inline_val);
            } else if (i + 1 < argc) {
                std::string val = argv[++i];
                record(key, &val);
            } else {
                flags_.insert(key);
                missing_values_.push_back(key);
            }
        }
    }

    /**
     * @brief Check whether a flag was provided on the command line.
     *
     * @param flag Flag name including the leading `--`.
     */
    bool has_flag(const std::string& flag) const { return flags_.count(flag) > 0; }

    /**
     * @brief Retrieve the value associated with an option.
     *
     * @return Stored option value or an empty string if missing.
     */
    std::string get_option(const std::string& opt) const {
        auto it = options_.find(opt);
        if (it != options_.end())
            return it->second;
        return "";
    }

    /** @return Map of option names to their parsed values. */
    const std::map<std::string, std::string>& options() const { return options_; }

    /** @return Ordered list of positional arguments. */
    const std::vector<std::string>& positional() const { return positional_; }

    /** @return Flags that were not part of the FlagSpec list. */
    const std::vector<std::string>& unknown_flags() const { return unknown_flags_; }

    /** @return Value-taking flags that appeared last without a value. */
    const std::vector<std::string>& missing_values() const { return missing_values_; }
};

#endif // ARG_PARSER_HPP
