#pragma once

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace flagrun {

// One entry of the execution engine's runtime list
struct RuntimeInfo {
    std::string language;
    std::string version;
    std::vector<std::string> aliases;
};

// Language name / alias -> engine version. Built once at feeder startup and
// read-only afterwards, so lookups need no locking.
class RuntimeRegistry {
public:
    RuntimeRegistry() = default;
    explicit RuntimeRegistry(const std::vector<RuntimeInfo>& runtimes);

    // Case-insensitive lookup
    std::optional<std::string> version_for(const std::string& language) const;

    size_t size() const { return versions_.size(); }
    bool empty() const { return versions_.empty(); }

    // Parses the JSON array returned by GET /runtimes. Throws std::runtime_error.
    static std::vector<RuntimeInfo> parse_runtimes(const std::string& body);

private:
    std::unordered_map<std::string, std::string> versions_;
};

std::string to_lower(std::string s);

} // namespace flagrun
