#include "tabula/foundation/config_manager.hpp"

namespace tabula::foundation {

TabulaResult<void> ConfigManager::load(const std::filesystem::path& path) {
    try {
        auto root = YAML::LoadFile(path.string());
        entries_.clear();
        flatten("", root);
        return TabulaResult<void>::ok();
    } catch (const YAML::BadFile&) {
        return TabulaResult<void>::err(
            TabulaError(ErrorCode::ConfigLoadFailed, "failed to open config file: " + path.string()));
    } catch (const YAML::ParserException& e) {
        return TabulaResult<void>::err(
            TabulaError(ErrorCode::ConfigLoadFailed, std::string("YAML parse error: ") + e.what()));
    }
}

TabulaResult<void> ConfigManager::loadString(std::string_view document) {
    try {
        auto root = YAML::Load(std::string(document));
        entries_.clear();
        flatten("", root);
        return TabulaResult<void>::ok();
    } catch (const YAML::ParserException& e) {
        return TabulaResult<void>::err(
            TabulaError(ErrorCode::ConfigLoadFailed, std::string("YAML parse error: ") + e.what()));
    }
}

bool ConfigManager::hasKey(std::string_view key) const {
    return entries_.count(std::string(key)) > 0;
}

void ConfigManager::flatten(const std::string& prefix, const YAML::Node& node) {
    if (node.IsMap()) {
        for (auto it = node.begin(); it != node.end(); ++it) {
            auto childKey = it->first.as<std::string>();
            auto fullKey = prefix.empty() ? childKey : prefix + "." + childKey;
            flatten(fullKey, it->second);
        }
    } else if (!prefix.empty()) {
        // Leaf node (scalar, sequence or null), stored under its dotted key.
        entries_[prefix] = YAML::Clone(node);
    }
}

}  // namespace tabula::foundation
