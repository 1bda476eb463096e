#include "utils.hpp"
#include <unicode/unistr.h>
#include <unicode/uchar.h>
#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>

namespace wordguard {
namespace common {

// StringUtils implementation
std::u32string StringUtils::to_utf32(const std::string& str) {
    icu::UnicodeString ustr = icu::UnicodeString::fromUTF8(str);

    std::u32string result;
    result.reserve(static_cast<size_t>(ustr.countChar32()));
    for (int32_t i = 0; i < ustr.length(); i = ustr.moveIndex32(i, 1)) {
        result.push_back(static_cast<char32_t>(ustr.char32At(i)));
    }
    return result;
}

std::string StringUtils::to_utf8(const std::u32string& str) {
    icu::UnicodeString ustr;
    for (char32_t ch : str) {
        ustr.append(static_cast<UChar32>(ch));
    }

    std::string output;
    ustr.toUTF8String(output);
    return output;
}

std::u32string StringUtils::to_lower(const std::u32string& str) {
    std::u32string result;
    result.reserve(str.size());
    for (char32_t ch : str) {
        result.push_back(static_cast<char32_t>(u_tolower(static_cast<UChar32>(ch))));
    }
    return result;
}

std::string StringUtils::to_lower(const std::string& str) {
    return to_utf8(to_lower(to_utf32(str)));
}

bool StringUtils::equals_ignore_case(const std::u32string& a, const std::u32string& b) {
    if (a.size() != b.size()) {
        return false;
    }
    for (size_t i = 0; i < a.size(); i++) {
        UChar32 lhs = u_foldCase(static_cast<UChar32>(a[i]), U_FOLD_CASE_DEFAULT);
        UChar32 rhs = u_foldCase(static_cast<UChar32>(b[i]), U_FOLD_CASE_DEFAULT);
        if (lhs != rhs) {
            return false;
        }
    }
    return true;
}

std::vector<std::u32string> StringUtils::split(const std::u32string& str, char32_t delimiter) {
    std::vector<std::u32string> tokens;
    size_t start = 0;
    while (true) {
        size_t pos = str.find(delimiter, start);
        if (pos == std::u32string::npos) {
            tokens.push_back(str.substr(start));
            break;
        }
        tokens.push_back(str.substr(start, pos - start));
        start = pos + 1;
    }
    return tokens;
}

std::u32string StringUtils::replace_all(const std::u32string& str,
                                        const std::u32string& from,
                                        const std::u32string& to) {
    if (from.empty()) {
        return str;
    }

    std::u32string result;
    result.reserve(str.size());
    size_t pos = 0;
    while (true) {
        size_t found = str.find(from, pos);
        if (found == std::u32string::npos) {
            result.append(str, pos, std::u32string::npos);
            break;
        }
        result.append(str, pos, found - pos);
        result.append(to);
        pos = found + from.size();
    }
    return result;
}

bool StringUtils::contains(const std::u32string& str, const std::u32string& needle) {
    return !needle.empty() && str.find(needle) != std::u32string::npos;
}

std::string StringUtils::trim(const std::string& str) {
    auto is_space = [](unsigned char c) { return std::isspace(c) != 0; };
    auto start = std::find_if_not(str.begin(), str.end(), is_space);
    auto end = std::find_if_not(str.rbegin(), str.rend(), is_space).base();
    return (start < end ? std::string(start, end) : std::string());
}

// TimeUtils implementation
int64_t TimeUtils::current_time_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

std::string TimeUtils::format_duration(std::chrono::nanoseconds duration) {
    std::stringstream ss;
    ss << std::fixed << std::setprecision(3);

    double ns = static_cast<double>(duration.count());
    if (ns < 1e3) {
        ss << ns << "ns";
    } else if (ns < 1e6) {
        ss << ns / 1e3 << "us";
    } else if (ns < 1e9) {
        ss << ns / 1e6 << "ms";
    } else {
        ss << ns / 1e9 << "s";
    }
    return ss.str();
}

} // namespace common
} // namespace wordguard
