#pragma once
#include <future>
#include <optional>
#include <string>
#include <vector>
#include "CellSanitizer.hpp"
#include "Config.hpp"
#include "CsvResult.hpp"
#include "PathValidator.hpp"

namespace scsv {

using Columns = std::vector<std::string>;

class SecureCsvWriter {
public:
    SecureCsvWriter();
    explicit SecureCsvWriter(WriterConfig cfg);

    // Create or truncate path. Columns default to the keys of the first record;
    // header cells are sanitized like data cells.
    CsvResult write(const std::string& path, const std::vector<Record>& records,
                    const std::optional<Columns>& columns = std::nullopt) const;

    // Append rows to an existing file using the column order of its header line.
    CsvResult append(const std::string& path, const std::vector<Record>& records) const;

    // Same sequence as write/append, run on a worker thread. Arguments are copied.
    std::future<CsvResult> writeAsync(std::string path, std::vector<Record> records,
                                      std::optional<Columns> columns = std::nullopt) const;
    std::future<CsvResult> appendAsync(std::string path, std::vector<Record> records) const;

    const WriterConfig& config() const { return m_cfg; }

private:
    WriterConfig m_cfg;
    PathValidator m_validator;
};

// Convenience entry points with default settings (0644, no root, no locking).
CsvResult writeCsvSecure(const std::string& path, const std::vector<Record>& records,
                         const std::optional<Columns>& columns = std::nullopt);
CsvResult appendCsvSecure(const std::string& path, const std::vector<Record>& records);

} // namespace scsv
