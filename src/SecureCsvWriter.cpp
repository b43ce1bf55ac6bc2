#include "SecureCsvWriter.hpp"
#include "FileLock.hpp"
#include "FilePermissions.hpp"
#include "HeaderTokenizer.hpp"
#include "RowFormatter.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/fmt/ranges.h>
#include <cerrno>
#include <filesystem>
#include <fstream>
#include <system_error>

namespace scsv {

namespace fs = std::filesystem;

static Columns inferColumns(const Record& first) {
    Columns cols;
    if (!first.is_object()) return cols;
    for (auto it = first.begin(); it != first.end(); ++it) cols.push_back(it.key());
    return cols;
}

// One CSV line for rec in the given key order; missing keys become "".
static std::string formatRecord(const Record& rec, const Columns& keys) {
    std::vector<std::string> cells;
    cells.reserve(keys.size());
    for (auto &k : keys) {
        if (rec.is_object()) {
            auto it = rec.find(k);
            if (it != rec.end()) { cells.push_back(CellSanitizer::sanitize(*it)); continue; }
        }
        cells.emplace_back();
    }
    return RowFormatter::format(cells);
}

// errno must be captured by the caller right after the failing call.
static std::string osError(int e) { return std::error_code(e, std::generic_category()).message(); }

SecureCsvWriter::SecureCsvWriter() : SecureCsvWriter(WriterConfig{}) {}

SecureCsvWriter::SecureCsvWriter(WriterConfig cfg)
    : m_cfg(std::move(cfg)), m_validator(fs::path(m_cfg.rootDir)) {}

CsvResult SecureCsvWriter::write(const std::string& path, const std::vector<Record>& records,
                                 const std::optional<Columns>& columns) const {
    if (records.empty()) return CsvResult::failure(CsvErrc::EmptyInput, "Data cannot be empty");

    std::string err;
    auto safePath = m_validator.validate(path, err);
    if (!safePath) return CsvResult::failure(CsvErrc::InvalidPath, err);

    const Columns cols = (columns && !columns->empty()) ? *columns : inferColumns(records.front());
    std::vector<std::string> header;
    header.reserve(cols.size());
    for (auto &c : cols) header.push_back(CellSanitizer::sanitize(c));
    spdlog::debug("Writing {} with {} columns", safePath->string(), cols.size());

    std::error_code ec;
    fs::path parent = safePath->parent_path();
    if (!parent.empty()) {
        fs::create_directories(parent, ec);
        if (ec) return CsvResult::failure(CsvErrc::IOFailure, "Cannot create directory " + parent.string() + ": " + ec.message());
    }

    FileLock lock;
    if (m_cfg.advisoryLock && !lock.acquire(*safePath, true, err))
        return CsvResult::failure(CsvErrc::IOFailure, "Cannot lock " + safePath->string() + ": " + err);

    {
        std::ofstream ofs(*safePath, std::ios::out | std::ios::trunc | std::ios::binary);
        if (!ofs) {
            int e = errno;
            return CsvResult::failure(CsvErrc::IOFailure, "Cannot open " + safePath->string() + " for writing: " + osError(e));
        }
        ofs << RowFormatter::format(header) << '\n';
        for (auto &rec : records) ofs << formatRecord(rec, cols) << '\n';
        ofs.flush();
        if (!ofs) {
            int e = errno;
            return CsvResult::failure(CsvErrc::IOFailure, "Failed to write CSV file " + safePath->string() + ": " + osError(e));
        }
    }

    if (!FilePermissions::apply(*safePath, m_cfg.filePermissions, err)) {
        spdlog::warn("Could not set permissions {} on {}: {}",
                     FilePermissions::toOctal(m_cfg.filePermissions), safePath->string(), err);
    }
    spdlog::info("Wrote {} rows to {}", records.size(), safePath->string());
    return CsvResult::success();
}

CsvResult SecureCsvWriter::append(const std::string& path, const std::vector<Record>& records) const {
    if (records.empty()) return CsvResult::failure(CsvErrc::EmptyInput, "Data cannot be empty");

    std::string err;
    auto safePath = m_validator.validate(path, err);
    if (!safePath) return CsvResult::failure(CsvErrc::InvalidPath, err);

    std::error_code ec;
    bool exists = fs::exists(*safePath, ec);
    if (ec) return CsvResult::failure(CsvErrc::IOFailure, "Cannot stat " + safePath->string() + ": " + ec.message());
    if (!exists) return CsvResult::failure(CsvErrc::FileNotFound, "CSV file does not exist: " + path);
    if (!fs::is_regular_file(*safePath, ec))
        return CsvResult::failure(CsvErrc::IOFailure, safePath->string() + " is not a regular file");

    FileLock lock;
    if (m_cfg.advisoryLock && !lock.acquire(*safePath, false, err))
        return CsvResult::failure(CsvErrc::IOFailure, "Cannot lock " + safePath->string() + ": " + err);

    std::string headerLine;
    bool endsWithNewline = true;
    {
        std::ifstream ifs(*safePath, std::ios::in | std::ios::binary);
        if (!ifs) {
            int e = errno;
            return CsvResult::failure(CsvErrc::IOFailure, "Cannot open " + safePath->string() + " for reading: " + osError(e));
        }
        std::getline(ifs, headerLine);
        if (ifs.bad()) return CsvResult::failure(CsvErrc::IOFailure, "Failed to read header of " + safePath->string());
        ifs.clear();
        ifs.seekg(0, std::ios::end);
        if (ifs.tellg() > 0) {
            char last = '\n';
            ifs.seekg(-1, std::ios::end);
            ifs.get(last);
            endsWithNewline = (last == '\n');
        }
    }
    if (!headerLine.empty() && headerLine.back() == '\r') headerLine.pop_back();
    if (HeaderTokenizer::trim(headerLine).empty())
        return CsvResult::failure(CsvErrc::NoHeader, "Existing CSV file has no headers");

    Columns keys;
    for (auto &tok : HeaderTokenizer::tokenize(headerLine)) keys.push_back(HeaderTokenizer::lookupKey(tok));
    spdlog::debug("Appending to {} with recovered columns [{}]", safePath->string(), fmt::join(keys, ", "));

    std::string content;
    if (!endsWithNewline) content.push_back('\n'); // keep the first new row off the last existing line
    for (auto &rec : records) {
        content += formatRecord(rec, keys);
        content.push_back('\n');
    }

    std::ofstream ofs(*safePath, std::ios::out | std::ios::app | std::ios::binary);
    if (!ofs) {
        int e = errno;
        return CsvResult::failure(CsvErrc::IOFailure, "Cannot open " + safePath->string() + " for append: " + osError(e));
    }
    ofs << content;
    ofs.flush();
    if (!ofs) {
        int e = errno;
        return CsvResult::failure(CsvErrc::IOFailure, "Failed to append to " + safePath->string() + ": " + osError(e));
    }

    spdlog::info("Appended {} rows to {}", records.size(), safePath->string());
    return CsvResult::success();
}

std::future<CsvResult> SecureCsvWriter::writeAsync(std::string path, std::vector<Record> records,
                                                   std::optional<Columns> columns) const {
    return std::async(std::launch::async,
        [self = *this, path = std::move(path), records = std::move(records), columns = std::move(columns)] {
            return self.write(path, records, columns);
        });
}

std::future<CsvResult> SecureCsvWriter::appendAsync(std::string path, std::vector<Record> records) const {
    return std::async(std::launch::async,
        [self = *this, path = std::move(path), records = std::move(records)] {
            return self.append(path, records);
        });
}

CsvResult writeCsvSecure(const std::string& path, const std::vector<Record>& records,
                         const std::optional<Columns>& columns) {
    return SecureCsvWriter().write(path, records, columns);
}

CsvResult appendCsvSecure(const std::string& path, const std::vector<Record>& records) {
    return SecureCsvWriter().append(path, records);
}

} // namespace scsv
