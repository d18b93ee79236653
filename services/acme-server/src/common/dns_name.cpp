/**
 * @file dns_name.cpp
 * @brief DNS identifier helpers
 */

#include "dns_name.h"
#include <algorithm>
#include <cctype>

namespace common {

std::string normalizeDnsName(const std::string& name) {
    std::string out = name;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (!out.empty() && out.back() == '.') {
        out.pop_back();
    }
    return out;
}

bool isValidDnsName(const std::string& name) {
    if (name.empty() || name.size() > 253) {
        return false;
    }

    size_t labels = 0;
    size_t start = 0;
    std::string lastLabel;
    while (start <= name.size()) {
        size_t end = name.find('.', start);
        if (end == std::string::npos) end = name.size();

        std::string label = name.substr(start, end - start);
        if (label.empty() || label.size() > 63) return false;
        if (label.front() == '-' || label.back() == '-') return false;
        for (char c : label) {
            bool ok = (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '-';
            if (!ok) return false;
        }

        ++labels;
        lastLabel = label;
        start = end + 1;
    }

    if (labels < 2) return false;
    return !std::all_of(lastLabel.begin(), lastLabel.end(),
                        [](unsigned char c) { return std::isdigit(c) != 0; });
}

} // namespace common
