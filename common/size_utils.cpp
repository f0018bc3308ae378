#include "size_utils.hpp"
#include <algorithm>
#include <cctype>
#include <limits>

namespace {
    std::string trim(const std::string& s) {
        size_t begin = 0, end = s.size();
        while (begin < end && std::isspace(static_cast<unsigned char>(s[begin]))) begin++;
        while (end > begin && std::isspace(static_cast<unsigned char>(s[end - 1]))) end--;
        return s.substr(begin, end - begin);
    }

    bool endsWith(const std::string& s, const std::string& suffix) {
        return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
    }
}

Result<uint64_t> parseSize(const std::string& text) {
    std::string value = trim(text);
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    uint64_t multiplier = 1;
    if (endsWith(value, "KB")) {
        multiplier = 1024ULL;
        value.resize(value.size() - 2);
    } else if (endsWith(value, "MB")) {
        multiplier = 1024ULL * 1024;
        value.resize(value.size() - 2);
    } else if (endsWith(value, "GB")) {
        multiplier = 1024ULL * 1024 * 1024;
        value.resize(value.size() - 2);
    } else if (endsWith(value, "B")) {
        value.resize(value.size() - 1);
    }
    value = trim(value);

    if (value.empty()) {
        return Result<uint64_t>::Error(ErrorKind::InvalidConfiguration, "Invalid size literal: '" + text + "'");
    }

    uint64_t number = 0;
    for (char c : value) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return Result<uint64_t>::Error(ErrorKind::InvalidConfiguration, "Invalid size literal: '" + text + "'");
        }
        uint64_t digit = static_cast<uint64_t>(c - '0');
        if (number > (std::numeric_limits<uint64_t>::max() - digit) / 10) {
            return Result<uint64_t>::Error(ErrorKind::InvalidConfiguration, "Size literal overflows: '" + text + "'");
        }
        number = number * 10 + digit;
    }

    if (number > std::numeric_limits<uint64_t>::max() / multiplier) {
        return Result<uint64_t>::Error(ErrorKind::InvalidConfiguration, "Size literal overflows: '" + text + "'");
    }
    number *= multiplier;

    if (number == 0) {
        return Result<uint64_t>::Error(ErrorKind::InvalidConfiguration, "Size must be positive: '" + text + "'");
    }
    return Result<uint64_t>::Ok(number);
}

std::string formatWithCommas(uint64_t value) {
    std::string digits = std::to_string(value);
    std::string out;
    int count = 0;
    for (auto it = digits.rbegin(); it != digits.rend(); ++it) {
        if (count > 0 && count % 3 == 0) out.push_back(',');
        out.push_back(*it);
        count++;
    }
    std::reverse(out.begin(), out.end());
    return out;
}
