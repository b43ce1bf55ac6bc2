#include "HeaderTokenizer.hpp"
#include <cctype>

namespace scsv {

std::string HeaderTokenizer::trim(std::string_view s) {
    std::size_t b = 0, e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
    return std::string(s.substr(b, e - b));
}

std::vector<std::string> HeaderTokenizer::tokenize(std::string_view headerLine) {
    std::vector<std::string> fields;
    std::string current;
    bool insideQuotes = false;

    for (std::size_t i = 0; i < headerLine.size(); ++i) {
        char c = headerLine[i];
        if (c == '"') {
            if (insideQuotes && i + 1 < headerLine.size() && headerLine[i + 1] == '"') {
                current.push_back('"');
                ++i;
            } else {
                insideQuotes = !insideQuotes;
            }
        } else if (c == ',' && !insideQuotes) {
            fields.push_back(trim(current));
            current.clear();
        } else {
            current.push_back(c);
        }
    }
    fields.push_back(trim(current)); // unterminated quote ends up here too
    return fields;
}

std::string HeaderTokenizer::lookupKey(std::string_view token) {
    std::string key;
    key.reserve(token.size());
    for (char c : token) if (c != '"') key.push_back(c);
    return key;
}

} // namespace scsv
