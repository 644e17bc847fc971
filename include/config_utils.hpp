#ifndef CONFIG_UTILS_HPP
#define CONFIG_UTILS_HPP
#include <map>
#include <string>

namespace svckit {

/** Flag name (with leading `--`) to raw value. */
using ConfigMap = std::map<std::string, std::string>;

/**
 * @brief Load configuration options from a YAML file.
 *
 * Top-level scalars become `--<key>` entries. Mappings such as `service:`,
 * `logging:` or `termination:` are flattened one level so their scalar
 * members become `--<member>` entries as well. Sequences and deeper nesting
 * are ignored.
 *
 * @param path  Filesystem path to the YAML configuration file.
 * @param opts  Map receiving option values.
 * @param error Output string capturing a human-readable error message on
 *              failure.
 * @return `true` if the configuration was loaded successfully; `false`
 *         otherwise.
 */
bool load_yaml_config(const std::string& path, ConfigMap& opts, std::string& error);

/**
 * @brief Load configuration options from a JSON file.
 *
 * Same flattening rules as load_yaml_config().
 */
bool load_json_config(const std::string& path, ConfigMap& opts, std::string& error);

/**
 * @brief Load @p path as JSON when it ends in `.json`, as YAML otherwise.
 */
bool load_config_file(const std::string& path, ConfigMap& opts, std::string& error);

} // namespace svckit

#endif // CONFIG_UTILS_HPP
