#include "CellSanitizer.hpp"
#include <algorithm>

namespace scsv {

bool CellSanitizer::hasDangerousPrefix(std::string_view text) {
    if (text.empty()) return false;
    return std::find(kDangerousPrefixes.begin(), kDangerousPrefixes.end(), text.front()) != kDangerousPrefixes.end();
}

std::string CellSanitizer::toText(const Record& value) {
    switch (value.type()) {
        case Record::value_t::null:
        case Record::value_t::discarded:
            return std::string();
        case Record::value_t::string:
            return value.get_ref<const std::string&>();
        case Record::value_t::boolean:
            return value.get<bool>() ? "true" : "false";
        default:
            // numbers render as their JSON decimal form; objects/arrays as compact JSON
            return value.dump();
    }
}

std::string CellSanitizer::sanitize(const std::string& text) {
    if (!hasDangerousPrefix(text)) return text;
    std::string out;
    out.reserve(text.size() + 1);
    out.push_back('\'');
    out += text;
    return out;
}

std::string CellSanitizer::sanitize(const char* text) {
    return sanitize(std::string(text ? text : ""));
}

std::string CellSanitizer::sanitize(const Record& value) {
    return sanitize(toText(value));
}

} // namespace scsv
