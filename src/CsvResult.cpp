#include "CsvResult.hpp"

namespace scsv {

const char* toString(CsvErrc code) {
    switch (code) {
        case CsvErrc::None: return "None";
        case CsvErrc::EmptyInput: return "EmptyInput";
        case CsvErrc::InvalidPath: return "InvalidPath";
        case CsvErrc::FileNotFound: return "FileNotFound";
        case CsvErrc::NoHeader: return "NoHeader";
        case CsvErrc::IOFailure: return "IOFailure";
    }
    return "Unknown";
}

} // namespace scsv
