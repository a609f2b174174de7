#ifndef CONFIG_UTILS_HPP
#define CONFIG_UTILS_HPP
#include <map>
#include <string>

/**
 * @brief Load options from a YAML file.
 *
 * Top-level scalar keys map to long flags (`base-version: 1.2` becomes
 * `--base-version` = `1.2`). A top-level map is treated as a category and its
 * scalar children are read the same way, so options may be grouped under
 * headings such as `logging:`.
 *
 * @param path  Filesystem path to the YAML configuration file.
 * @param opts  Map receiving option values keyed by flag name.
 * @param error Output string capturing a human-readable error message on
 *              failure.
 * @return `true` if the configuration was loaded successfully.
 */
bool load_yaml_config(const std::string& path, std::map<std::string, std::string>& opts,
                      std::string& error);

/**
 * @brief Load options from a JSON file.
 *
 * Same layout rules as load_yaml_config(). A fractional number is refused
 * because its original spelling is lost (`2.10` reads as `2.1`); such values
 * must be quoted.
 */
bool load_json_config(const std::string& path, std::map<std::string, std::string>& opts,
                      std::string& error);

#endif // CONFIG_UTILS_HPP
