#pragma once
#include <string>
#include <utility>

namespace scsv {

enum class CsvErrc {
    None,
    EmptyInput,    // no records supplied
    InvalidPath,   // blank, traversal, wrong extension or outside root
    FileNotFound,  // append target missing
    NoHeader,      // append target has a blank first line
    IOFailure      // directory/open/lock/read/write failed
};

const char* toString(CsvErrc code);

struct CsvResult {
    CsvErrc code{CsvErrc::None};
    std::string message;

    static CsvResult success() { return {}; }
    static CsvResult failure(CsvErrc c, std::string msg) { return CsvResult{c, std::move(msg)}; }

    bool ok() const { return code == CsvErrc::None; }
    explicit operator bool() const { return ok(); }
};

} // namespace scsv
