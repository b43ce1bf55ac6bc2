#pragma once
#include <filesystem>
#include <optional>
#include <string>

namespace scsv {

class FilePermissions {
public:
    // owner rw, group r, others r
    static constexpr std::filesystem::perms kDefaultMode =
        std::filesystem::perms::owner_read | std::filesystem::perms::owner_write |
        std::filesystem::perms::group_read | std::filesystem::perms::others_read;

    // False where the platform has no POSIX-style permission bits (Windows).
    static bool supportsPosixPermissions();

    // Best-effort; never throws. Returns true (no-op) when unsupported.
    static bool apply(const std::filesystem::path& path, std::filesystem::perms mode, std::string& err);

    // Octal text such as "0644" or "600"; anything above 0777 is rejected.
    static std::optional<std::filesystem::perms> parseMode(const std::string& text);
    static std::string toOctal(std::filesystem::perms mode);
};

} // namespace scsv
