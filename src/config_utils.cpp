#include "config_utils.hpp"
#include <yaml-cpp/yaml.h>
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <optional>
#include <sstream>
#include <string>
#include <nlohmann/json.hpp>

namespace svckit {

namespace {

// Scalar rendering per document model. std::nullopt marks values that are
// not scalars and are skipped.
std::optional<std::string> scalar_text(const YAML::Node& node) {
    if (!node.IsDefined() || node.IsSequence() || node.IsMap())
        return std::nullopt;
    if (node.IsNull())
        return std::string();
    bool flag = false;
    if (YAML::convert<bool>::decode(node, flag))
        return std::string(flag ? "true" : "false");
    return node.Scalar();
}

std::optional<std::string> scalar_text(const nlohmann::json& value) {
    switch (value.type()) {
    case nlohmann::json::value_t::null:
        return std::string();
    case nlohmann::json::value_t::string:
        return value.get<std::string>();
    case nlohmann::json::value_t::boolean:
        return std::string(value.get<bool>() ? "true" : "false");
    case nlohmann::json::value_t::number_integer:
        return std::to_string(value.get<long long>());
    case nlohmann::json::value_t::number_unsigned:
        return std::to_string(value.get<unsigned long long>());
    case nlohmann::json::value_t::number_float: {
        std::ostringstream oss;
        oss << value.get<double>();
        return oss.str();
    }
    default:
        return std::nullopt;
    }
}

void store(ConfigMap& opts, const std::string& key, const std::optional<std::string>& text) {
    if (text)
        opts["--" + key] = *text;
}

// Top-level scalars plus the scalar members of top-level sections.
void flatten(const YAML::Node& root, ConfigMap& opts) {
    for (const auto& entry : root) {
        if (!entry.first.IsScalar())
            continue;
        if (!entry.second.IsMap()) {
            store(opts, entry.first.Scalar(), scalar_text(entry.second));
            continue;
        }
        for (const auto& member : entry.second)
            if (member.first.IsScalar())
                store(opts, member.first.Scalar(), scalar_text(member.second));
    }
}

void flatten(const nlohmann::json& root, ConfigMap& opts) {
    for (auto it = root.begin(); it != root.end(); ++it) {
        if (!it->is_object()) {
            store(opts, it.key(), scalar_text(*it));
            continue;
        }
        for (auto member = it->begin(); member != it->end(); ++member)
            store(opts, member.key(), scalar_text(*member));
    }
}

} // namespace

bool load_yaml_config(const std::string& path, ConfigMap& opts, std::string& error) {
    std::ifstream ifs(path);
    if (!ifs) {
        error = "Failed to open file";
        return false;
    }
    try {
        YAML::Node root = YAML::Load(ifs);
        if (root.IsNull())
            return true;
        if (!root.IsMap()) {
            error = "Root YAML node is not a map";
            return false;
        }
        flatten(root, opts);
    } catch (const YAML::Exception& e) {
        error = e.what();
        return false;
    }
    return true;
}

bool load_json_config(const std::string& path, ConfigMap& opts, std::string& error) {
    std::ifstream ifs(path);
    if (!ifs) {
        error = "Failed to open file";
        return false;
    }
    try {
        nlohmann::json root = nlohmann::json::parse(ifs);
        if (!root.is_object()) {
            error = "Root JSON value is not an object";
            return false;
        }
        flatten(root, opts);
    } catch (const nlohmann::json::exception& e) {
        error = e.what();
        return false;
    }
    return true;
}

bool load_config_file(const std::string& path, ConfigMap& opts, std::string& error) {
    std::string ext = std::filesystem::path(path).extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext == ".json" ? load_json_config(path, opts, error)
                          : load_yaml_config(path, opts, error);
}

} // namespace svckit
