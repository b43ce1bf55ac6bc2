#pragma once
#include <filesystem>
#include <optional>
#include <string>

namespace scsv {

class PathValidator {
public:
    PathValidator() = default;
    // Non-empty root confines every validated path to that directory (symlinks resolved).
    explicit PathValidator(std::filesystem::path allowedRoot);

    // Returns the absolute, normalized path, or nullopt with err filled.
    // Rejects blank paths, any ".." substring and extensions other than .csv (case-insensitive).
    std::optional<std::filesystem::path> validate(const std::string& rawPath, std::string& err) const;

    const std::filesystem::path& allowedRoot() const { return m_root; }

private:
    bool withinRoot(const std::filesystem::path& p, std::string& err) const;

    std::filesystem::path m_root;
};

} // namespace scsv
