#pragma once
#include <array>
#include <string>
#include <string_view>
#include <nlohmann/json.hpp>

namespace scsv {

// A row: column name -> scalar, keys kept in insertion order.
using Record = nlohmann::ordered_json;

class CellSanitizer {
public:
    // Leading characters that make spreadsheets evaluate a cell as a formula.
    static constexpr std::array<char, 7> kDangerousPrefixes{'=', '+', '-', '@', '\t', '\r', '\n'};

    static bool hasDangerousPrefix(std::string_view text);

    // Coerce to text (null -> "") and neutralize formula prefixes with a leading apostrophe.
    static std::string sanitize(const Record& value);
    static std::string sanitize(const std::string& text);
    static std::string sanitize(const char* text);

    static std::string toText(const Record& value);
};

} // namespace scsv
