#include "Config.hpp"
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <fstream>

namespace scsv {

static bool parsePermissions(const nlohmann::json& jp, std::filesystem::perms& out, std::string& err) {
    if (jp.is_string()) {
        auto mode = FilePermissions::parseMode(jp.get<std::string>());
        if (!mode) { err = "file_permissions: expected octal string like \"0644\""; return false; }
        out = *mode;
        return true;
    }
    if (jp.is_number_unsigned() || jp.is_number_integer()) {
        // numeric mode value, e.g. 420 == 0644
        auto v = jp.get<long long>();
        if (v < 0 || v > 0777) { err = "file_permissions out of range"; return false; }
        out = static_cast<std::filesystem::perms>(v);
        return true;
    }
    err = "file_permissions must be a string or integer";
    return false;
}

std::optional<WriterConfig> ConfigLoader::loadFromJson(const nlohmann::json& j, std::string& err) {
    if (!j.is_object()) { err = "Config root must be an object"; return std::nullopt; }
    WriterConfig cfg;
    try {
        if (j.contains("file_permissions")) {
            if (!parsePermissions(j.at("file_permissions"), cfg.filePermissions, err)) return std::nullopt;
        }
        cfg.rootDir = j.value("root_dir", std::string());
        cfg.advisoryLock = j.value("advisory_lock", false);
        cfg.logLevel = j.value("log_level", std::string("info"));
        cfg.outputPath = j.value("output_path", std::string("output.csv"));
    } catch (const std::exception& e) { err = e.what(); return std::nullopt; }

    // from_str maps unknown names to "off"; only accept "off" when asked for explicitly
    if (spdlog::level::from_str(cfg.logLevel) == spdlog::level::off && cfg.logLevel != "off") {
        err = "Unknown log_level: " + cfg.logLevel;
        return std::nullopt;
    }
    return cfg;
}

std::optional<WriterConfig> ConfigLoader::loadFromFile(const std::string& path, std::string& err) {
    std::ifstream ifs(path);
    if(!ifs) { err = "Cannot open config file"; return std::nullopt; }
    nlohmann::json j = nlohmann::json::parse(ifs, nullptr, false);
    if (j.is_discarded()) { err = "Malformed JSON in " + path; return std::nullopt; }
    return loadFromJson(j, err);
}

} // namespace scsv
