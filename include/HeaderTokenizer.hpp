#pragma once
#include <string>
#include <string_view>
#include <vector>

namespace scsv {

// Splits a single CSV header line into column names. Quoted fields may contain
// commas and doubled quotes; embedded newlines are not supported.
class HeaderTokenizer {
public:
    static std::vector<std::string> tokenize(std::string_view headerLine);

    // Header tokens can still carry quote artifacts; strip every '"' to get the record key.
    static std::string lookupKey(std::string_view token);

    static std::string trim(std::string_view s);
};

} // namespace scsv
