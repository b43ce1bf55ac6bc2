#include "RowFormatter.hpp"

namespace scsv {

std::string RowFormatter::quote(std::string_view value) {
    std::string out;
    out.reserve(value.size() + 2);
    out.push_back('"');
    for (char c : value) {
        if (c == '"') out.push_back('"'); // escape " by doubling
        out.push_back(c);
    }
    out.push_back('"');
    return out;
}

std::string RowFormatter::format(const std::vector<std::string>& values) {
    std::string line;
    for (std::size_t i = 0; i < values.size(); ++i) {
        if (i) line.push_back(',');
        line += quote(values[i]);
    }
    return line;
}

} // namespace scsv
