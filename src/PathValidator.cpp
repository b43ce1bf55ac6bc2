#include "PathValidator.hpp"
#include <algorithm>
#include <cctype>
#include <system_error>
#include <utility>

namespace scsv {

namespace fs = std::filesystem;

PathValidator::PathValidator(fs::path allowedRoot) : m_root(std::move(allowedRoot)) {}

static bool isBlank(const std::string& s) {
    return std::all_of(s.begin(), s.end(), [](unsigned char c){ return std::isspace(c) != 0; });
}

static bool hasCsvExtension(const std::string& s) {
    static const std::string ext = ".csv";
    if (s.size() < ext.size()) return false;
    std::string tail = s.substr(s.size() - ext.size());
    for (auto &ch : tail) ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
    return tail == ext;
}

std::optional<fs::path> PathValidator::validate(const std::string& rawPath, std::string& err) const {
    if (isBlank(rawPath)) { err = "Filepath cannot be empty"; return std::nullopt; }
    // Textual check only: also rejects names like "report..final.csv".
    if (rawPath.find("..") != std::string::npos) { err = "Path traversal detected in filepath"; return std::nullopt; }
    if (!hasCsvExtension(rawPath)) { err = "File must have .csv extension"; return std::nullopt; }

    std::error_code ec;
    fs::path abs = fs::absolute(fs::path(rawPath), ec);
    if (ec) { err = "Cannot resolve path: " + ec.message(); return std::nullopt; }
    abs = abs.lexically_normal();

    if (!m_root.empty() && !withinRoot(abs, err)) return std::nullopt;
    return abs;
}

bool PathValidator::withinRoot(const fs::path& p, std::string& err) const {
    std::error_code ec;
    fs::path root = fs::absolute(m_root, ec);
    if (!ec) root = fs::weakly_canonical(root, ec);
    if (ec) { err = "Cannot resolve root directory: " + ec.message(); return false; }
    if (!root.has_filename() && root.has_relative_path()) root = root.parent_path(); // drop trailing separator
    fs::path target = fs::weakly_canonical(p, ec);
    if (ec) { err = "Cannot resolve path: " + ec.message(); return false; }

    fs::path rel = target.lexically_relative(root);
    if (rel.empty() || rel.begin()->string() == "..") {
        err = "Path escapes configured root directory " + root.string();
        return false;
    }
    return true;
}

} // namespace scsv
