#include "config_utils.hpp"
#include <yaml-cpp/yaml.h>
#include <fstream>
#include <stdexcept>
#include <string>
#include <nlohmann/json.hpp>

static bool to_string_value(const YAML::Node& node, std::string& out) {
    if (!node.IsDefined() || node.IsSequence() || node.IsMap())
        return false;
    if (node.IsNull()) {
        out.clear();
        return true;
    }
    // Scalars keep their literal spelling so "1.10" stays "1.10".
    out = node.Scalar();
    return true;
}

// A fractional number has already lost its spelling ("2.10" parsed as 2.1),
// so versions must be quoted.
static void reject_float(const std::string& key, const nlohmann::json& v) {
    if (v.is_number_float())
        throw std::runtime_error("Value of '" + key +
                                 "' is a fractional number; write it as a string, for example \"" +
                                 key + "\": \"2.10\"");
}

static bool to_string_value(const nlohmann::json& v, std::string& out) {
    if (v.is_string()) {
        out = v.get<std::string>();
        return true;
    }
    if (v.is_boolean()) {
        out = v.get<bool>() ? "true" : "false";
        return true;
    }
    if (v.is_number_unsigned()) {
        out = std::to_string(v.get<unsigned long long>());
        return true;
    }
    if (v.is_number_integer()) {
        out = std::to_string(v.get<long long>());
        return true;
    }
    if (v.is_null()) {
        out.clear();
        return true;
    }
    return false;
}

bool load_yaml_config(const std::string& path, std::map<std::string, std::string>& opts,
                      std::string& error) {
    try {
        std::ifstream ifs(path);
        if (!ifs) {
            error = "Failed to open file";
            return false;
        }
        YAML::Node root = YAML::Load(ifs);
        if (!root.IsMap()) {
            error = "Root YAML node is not a map";
            return false;
        }
        for (auto it = root.begin(); it != root.end(); ++it) {
            if (!it->first.IsScalar())
                continue;
            const YAML::Node& node = it->second;
            if (node.IsMap()) {
                for (auto sub = node.begin(); sub != node.end(); ++sub) {
                    if (!sub->first.IsScalar())
                        continue;
                    std::string s;
                    if (to_string_value(sub->second, s))
                        opts["--" + sub->first.as<std::string>()] = s;
                }
                continue;
            }
            std::string s;
            if (to_string_value(node, s))
                opts["--" + it->first.as<std::string>()] = s;
        }
        return true;
    } catch (const std::exception& e) {
        error = e.what();
        return false;
    }
}

bool load_json_config(const std::string& path, std::map<std::string, std::string>& opts,
                      std::string& error) {
    try {
        std::ifstream ifs(path);
        if (!ifs) {
            error = "Failed to open file";
            return false;
        }
        nlohmann::json root;
        ifs >> root;
        if (!root.is_object()) {
            error = "Root JSON value is not an object";
            return false;
        }
        for (auto it = root.begin(); it != root.end(); ++it) {
            const auto& val = it.value();
            if (val.is_object()) {
                for (auto sub = val.begin(); sub != val.end(); ++sub) {
                    reject_float(sub.key(), sub.value());
                    std::string s;
                    if (to_string_value(sub.value(), s))
                        opts["--" + sub.key()] = s;
                }
                continue;
            }
            reject_float(it.key(), val);
            std::string s;
            if (to_string_value(val, s))
                opts["--" + it.key()] = s;
        }
        return true;
    } catch (const std::exception& e) {
        error = e.what();
        return false;
    }
}
