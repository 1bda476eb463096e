#pragma once

#include <string>
#include <vector>
#include <chrono>
#include <cstdint>

namespace wordguard {
namespace common {

// StringUtils class
//
// Text inside the library is handled as UTF-32 code point sequences; these
// helpers convert at the UTF-8 boundary (through ICU) and provide the few
// sequence operations the matcher and censor need.
class StringUtils {
public:
    // UTF-8 <-> code points. Malformed UTF-8 decodes to U+FFFD.
    static std::u32string to_utf32(const std::string& str);
    static std::string to_utf8(const std::u32string& str);

    // Lowercase with ICU simple case mapping, one code point at a time
    static std::u32string to_lower(const std::u32string& str);
    static std::string to_lower(const std::string& str);

    // Case-insensitive comparison using Unicode case folding
    static bool equals_ignore_case(const std::u32string& a, const std::u32string& b);

    // Split on a single delimiter, keeping empty tokens
    static std::vector<std::u32string> split(const std::u32string& str, char32_t delimiter);

    // Replace every non-overlapping occurrence, scanning left to right.
    // An empty `from` leaves the string unchanged.
    static std::u32string replace_all(const std::u32string& str,
                                      const std::u32string& from,
                                      const std::u32string& to);

    static bool contains(const std::u32string& str, const std::u32string& needle);

    static std::string trim(const std::string& str);
};

// TimeUtils class
class TimeUtils {
public:
    static int64_t current_time_ms();

    // Format a duration as e.g. "1.250ms" or "3.400s"
    static std::string format_duration(std::chrono::nanoseconds duration);

    // Timer class
    class Timer {
    public:
        Timer() : start_(std::chrono::steady_clock::now()) {}

        void reset() {
            start_ = std::chrono::steady_clock::now();
        }

        double elapsed_ms() const {
            auto now = std::chrono::steady_clock::now();
            return std::chrono::duration<double, std::milli>(now - start_).count();
        }

        double elapsed_us() const {
            auto now = std::chrono::steady_clock::now();
            return std::chrono::duration<double, std::micro>(now - start_).count();
        }

    private:
        std::chrono::steady_clock::time_point start_;
    };
};

} // namespace common
} // namespace wordguard
