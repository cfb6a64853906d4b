#include "config_utils.hpp"
#include <yaml-cpp/yaml.h>
#include <fstream>
#include <string>
#include <sstream>
#include <nlohmann/json.hpp>

static bool to_string_value(const YAML::Node& node, std::string& out) {
    if (!node.IsDefined() || node.IsMap())
        return false;
    if (node.IsNull()) {
        out.clear();
        return true;
    }
    if (node.IsSequence()) {
        std::string joined;
        for (const auto& item : node) {
            if (!item.IsScalar())
                return false;
            if (!joined.empty())
                joined += ',';
            joined += item.Scalar();
        }
        out = joined;
        return true;
    }
    out = node.Scalar();
    return true;
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
    if (v.is_number_integer()) {
        out = std::to_string(v.get<long long>());
        return true;
    }
    if (v.is_number_unsigned()) {
        out = std::to_string(v.get<unsigned long long>());
        return true;
    }
    if (v.is_number_float()) {
        std::ostringstream oss;
        oss << v.get<double>();
        out = oss.str();
        return true;
    }
    if (v.is_null()) {
        out.clear();
        return true;
    }
    if (v.is_array()) {
        std::string joined;
        for (const auto& item : v) {
            std::string s;
            if (item.is_array() || item.is_object() || !to_string_value(item, s))
                return false;
            if (!joined.empty())
                joined += ',';
            joined += s;
        }
        out = joined;
        return true;
    }
    return false;
}

bool load_yaml_config(const std::string& path, std::map<std::string, std::string>& opts,
                      std::map<std::string, std::map<std::string, std::string>>& repo_opts,
                      std::string& error) {
    try {
        std::ifstream ifs(path);
        if (!ifs) {
            error = "Failed to open file";
            return false;
        }
        YAML::Node root = YAML::Load(ifs);
        if (root.IsNull())
            return true;
        if (!root.IsMap()) {
            error = "Root YAML node is not a map";
            return false;
        }
        for (auto it = root.begin(); it != root.end(); ++it) {
            if (!it->first.IsScalar())
                continue;
            const std::string key_name = it->first.as<std::string>();
            const YAML::Node& node = it->second;
            if (key_name == "repositories") {
                if (node.IsNull())
                    continue;
                if (!node.IsMap()) {
                    error = "'repositories' must be a map";
                    return false;
                }
                for (auto it2 = node.begin(); it2 != node.end(); ++it2) {
                    if (!it2->first.IsScalar())
                        continue;
                    const std::string repo_key = it2->first.as<std::string>();
                    const YAML::Node& repo_node = it2->second;
                    auto& m = repo_opts[repo_key];
                    if (repo_node.IsMap()) {
                        for (auto it3 = repo_node.begin(); it3 != repo_node.end(); ++it3) {
                            if (!it3->first.IsScalar())
                                continue;
                            std::string subk = "--" + it3->first.as<std::string>();
                            std::string s;
                            if (!to_string_value(it3->second, s)) {
                                error = "Invalid value for " + repo_key + "." +
                                        it3->first.as<std::string>();
                                return false;
                            }
                            m[subk] = s;
                        }
                    } else if (repo_node.IsNull()) {
                        m.clear();
                    }
                }
            } else if (node.IsMap()) {
                for (auto it2 = node.begin(); it2 != node.end(); ++it2) {
                    if (!it2->first.IsScalar())
                        continue;
                    std::string key = "--" + it2->first.as<std::string>();
                    std::string s;
                    if (!to_string_value(it2->second, s)) {
                        error = "Invalid value for " + key_name + "." +
                                it2->first.as<std::string>();
                        return false;
                    }
                    opts[key] = s;
                }
            } else {
                std::string s;
                if (!to_string_value(node, s)) {
                    error = "Invalid value for " + key_name;
                    return false;
                }
                opts["--" + key_name] = s;
            }
        }
        return true;
    } catch (const std::exception& e) {
        error = e.what();
        return false;
    }
}

bool load_json_config(const std::string& path, std::map<std::string, std::string>& opts,
                      std::map<std::string, std::map<std::string, std::string>>& repo_opts,
                      std::string& error) {
    std::ifstream ifs(path);
    if (!ifs) {
        error = "Failed to open file";
        return false;
    }
    try {
        nlohmann::json j;
        ifs >> j;
        if (!j.is_object()) {
            error = "Root JSON value is not an object";
            return false;
        }
        for (auto it = j.begin(); it != j.end(); ++it) {
            if (it.key() == "repositories") {
                if (it.value().is_null())
                    continue;
                if (!it.value().is_object()) {
                    error = "'repositories' must be an object";
                    return false;
                }
                for (auto rit = it.value().begin(); rit != it.value().end(); ++rit) {
                    auto& m = repo_opts[rit.key()];
                    if (!rit.value().is_object())
                        continue;
                    for (auto vit = rit.value().begin(); vit != rit.value().end(); ++vit) {
                        std::string s;
                        if (!to_string_value(vit.value(), s)) {
                            error = "Invalid value for " + rit.key() + "." + vit.key();
                            return false;
                        }
                        m["--" + vit.key()] = s;
                    }
                }
            } else if (it.value().is_object()) {
                for (auto sit = it.value().begin(); sit != it.value().end(); ++sit) {
                    std::string s;
                    if (!to_string_value(sit.value(), s)) {
                        error = "Invalid value for " + it.key() + "." + sit.key();
                        return false;
                    }
                    opts["--" + sit.key()] = s;
                }
            } else {
                std::string s;
                if (!to_string_value(it.value(), s)) {
                    error = "Invalid value for " + it.key();
                    return false;
                }
                opts["--" + it.key()] = s;
            }
        }
        return true;
    } catch (const std::exception& e) {
        error = e.what();
        return false;
    }
}
