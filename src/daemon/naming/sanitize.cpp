#include "naming/sanitize.hpp"

namespace naming {

namespace {

bool is_name_char(char c) {
    return (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '-';
}

} // namespace

std::string sanitize(std::string_view raw) {
    std::string result;
    result.reserve(raw.size());

    for (char c : raw) {
        if (c >= 'A' && c <= 'Z') c = static_cast<char>(c - 'A' + 'a');
        if (c == '/' || c == '_' || c == '.') c = '-';
        if (!is_name_char(c)) continue;

        // Collapse runs and drop leading hyphens in one pass
        if (c == '-' && (result.empty() || result.back() == '-')) continue;
        result.push_back(c);
    }

    while (!result.empty() && result.back() == '-') {
        result.pop_back();
    }

    if (result.empty()) return std::string(kDefaultName);
    return result;
}

bool is_valid_name(std::string_view name) {
    if (name.empty()) return false;
    if (name.front() < 'a' || name.front() > 'z') return false;

    for (char c : name) {
        if (!is_name_char(c)) return false;
    }

    if (name.back() == '-') return false;
    return name.find("--") == std::string_view::npos;
}

} // namespace naming
