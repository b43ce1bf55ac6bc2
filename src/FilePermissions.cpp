#include "FilePermissions.hpp"
#include <cstdio>
#include <system_error>

namespace scsv {

namespace fs = std::filesystem;

bool FilePermissions::supportsPosixPermissions() {
#ifdef _WIN32
    return false;
#else
    return true;
#endif
}

bool FilePermissions::apply(const fs::path& path, fs::perms mode, std::string& err) {
    if (!supportsPosixPermissions()) return true;
    std::error_code ec;
    fs::permissions(path, mode & fs::perms::mask, fs::perm_options::replace, ec);
    if (ec) { err = ec.message(); return false; }
    return true;
}

std::optional<fs::perms> FilePermissions::parseMode(const std::string& text) {
    if (text.empty() || text.size() > 4) return std::nullopt;
    unsigned value = 0;
    for (char c : text) {
        if (c < '0' || c > '7') return std::nullopt;
        value = value * 8 + static_cast<unsigned>(c - '0');
    }
    if (value > 0777) return std::nullopt;
    return static_cast<fs::perms>(value);
}

std::string FilePermissions::toOctal(fs::perms mode) {
    char buf[8];
    std::snprintf(buf, sizeof(buf), "%04o", static_cast<unsigned>(mode & fs::perms::mask));
    return buf;
}

} // namespace scsv
