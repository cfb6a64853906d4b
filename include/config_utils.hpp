#ifndef CONFIG_UTILS_HPP
#define CONFIG_UTILS_HPP
#include <map>
#include <string>

/**
 * @brief Load configuration options from a YAML file.
 *
 * Top-level scalar keys become `--key` entries in @p opts. Nested maps other
 * than `repositories` are treated as groups and flattened. The
 * `repositories` map holds overrides keyed by repository directory name.
 * Sequence values are joined with commas.
 *
 * @param path      Filesystem path to the YAML configuration file.
 * @param opts      Map receiving global option values.
 * @param repo_opts Map receiving per-repository option maps keyed by
 *                  directory name.
 * @param error     Output string capturing a human-readable error message on
 *                  failure.
 * @return `true` if the configuration was loaded successfully; `false`
 *         otherwise.
 */
bool load_yaml_config(const std::string& path, std::map<std::string, std::string>& opts,
                      std::map<std::string, std::map<std::string, std::string>>& repo_opts,
                      std::string& error);

/**
 * @brief Load configuration options from a JSON file.
 *
 * Same layout as the YAML variant.
 */
bool load_json_config(const std::string& path, std::map<std::string, std::string>& opts,
                      std::map<std::string, std::map<std::string, std::string>>& repo_opts,
                      std::string& error);

#endif // CONFIG_UTILS_HPP
