#pragma once
#include <string>
#include <string_view>
#include <vector>

namespace scsv {

class RowFormatter {
public:
    // Always quoted; embedded '"' doubled.
    static std::string quote(std::string_view value);
    // Quoted fields joined by ',' with no trailing newline.
    static std::string format(const std::vector<std::string>& values);
};

} // namespace scsv
