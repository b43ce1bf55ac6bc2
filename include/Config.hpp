#pragma once
#include <string>
#include <optional>
#include <filesystem>
#include <nlohmann/json_fwd.hpp>
#include "FilePermissions.hpp"

namespace scsv {

struct WriterConfig {
    std::filesystem::perms filePermissions{FilePermissions::kDefaultMode}; // applied after each write
    std::string rootDir;                        // if non-empty, validated paths must stay under it
    bool advisoryLock{false};                   // flock the target during write/append
    std::string logLevel{"info"};               // spdlog level name
    std::string outputPath{"output.csv"};       // demo default target
};

class ConfigLoader {
public:
    static std::optional<WriterConfig> loadFromFile(const std::string& path, std::string& err);
    static std::optional<WriterConfig> loadFromJson(const nlohmann::json& j, std::string& err);
};

} // namespace scsv
