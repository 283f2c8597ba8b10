#include "flagrun/runtime_registry.h"
#include "flagrun/messages.h"

#include <json/json.h>

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace flagrun {

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

RuntimeRegistry::RuntimeRegistry(const std::vector<RuntimeInfo>& runtimes) {
    // First listed runtime wins when names collide
    for (const auto& runtime : runtimes) {
        if (!runtime.language.empty()) {
            versions_.emplace(to_lower(runtime.language), runtime.version);
        }
        for (const auto& alias : runtime.aliases) {
            if (!alias.empty()) {
                versions_.emplace(to_lower(alias), runtime.version);
            }
        }
    }
}

std::optional<std::string> RuntimeRegistry::version_for(const std::string& language) const {
    auto it = versions_.find(to_lower(language));
    if (it == versions_.end()) return std::nullopt;
    return it->second;
}

std::vector<RuntimeInfo> RuntimeRegistry::parse_runtimes(const std::string& body) {
    Json::Value root;
    std::string errors;
    if (!parse_json(body, root, &errors)) {
        throw std::runtime_error("Runtime list is not valid JSON: " + errors);
    }
    if (!root.isArray()) {
        throw std::runtime_error("Runtime list is not a JSON array");
    }

    std::vector<RuntimeInfo> runtimes;
    for (const auto& entry : root) {
        if (!entry.isObject() || !entry["language"].isString() || !entry["version"].isString()) {
            continue;
        }
        RuntimeInfo info;
        info.language = entry["language"].asString();
        info.version = entry["version"].asString();
        for (const auto& alias : entry["aliases"]) {
            if (alias.isString()) info.aliases.push_back(alias.asString());
        }
        runtimes.push_back(std::move(info));
    }
    return runtimes;
}

} // namespace flagrun
