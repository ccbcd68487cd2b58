#include "streamstats/core/duration.h"

#include <cctype>
#include <cstdint>
#include <limits>
#include <sstream>
#include <iomanip>

namespace streamstats {
namespace core {

namespace {

constexpr int64_t kNanosecond = 1;
constexpr int64_t kMicrosecond = 1000 * kNanosecond;
constexpr int64_t kMillisecond = 1000 * kMicrosecond;
constexpr int64_t kSecond = 1000 * kMillisecond;
constexpr int64_t kMinute = 60 * kSecond;
constexpr int64_t kHour = 60 * kMinute;

bool UnitScale(const std::string& unit, int64_t* scale) {
    if (unit == "ns") { *scale = kNanosecond; return true; }
    // "\xC2\xB5" is U+00B5 MICRO SIGN, "\xCE\xBC" is U+03BC GREEK SMALL LETTER MU
    if (unit == "us" || unit == "\xC2\xB5s" || unit == "\xCE\xBCs") { *scale = kMicrosecond; return true; }
    if (unit == "ms") { *scale = kMillisecond; return true; }
    if (unit == "s") { *scale = kSecond; return true; }
    if (unit == "m") { *scale = kMinute; return true; }
    if (unit == "h") { *scale = kHour; return true; }
    return false;
}

std::string TrimNumber(double value) {
    std::ostringstream out;
    out << std::fixed << std::setprecision(9) << value;
    std::string s = out.str();
    if (s.find('.') != std::string::npos) {
        s.erase(s.find_last_not_of('0') + 1, std::string::npos);
        if (s.back() == '.') s.pop_back();
    }
    return s;
}

} // namespace

Result<Duration> ParseDuration(const std::string& text) {
    const std::string invalid = "invalid duration \"" + text + "\"";
    size_t pos = 0;
    bool negative = false;
    if (pos < text.size() && (text[pos] == '-' || text[pos] == '+')) {
        negative = text[pos] == '-';
        ++pos;
    }
    if (text.compare(pos, std::string::npos, "0") == 0) {
        return Result<Duration>(Duration::zero());
    }
    if (pos == text.size()) {
        return Result<Duration>::error(invalid, Error::Code::INVALID_ARGUMENT);
    }

    const uint64_t limit = static_cast<uint64_t>(std::numeric_limits<int64_t>::max());
    uint64_t total = 0;
    while (pos < text.size()) {
        // Integer part
        uint64_t whole = 0;
        bool whole_overflow = false;
        size_t digits = 0;
        while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
            uint64_t digit = static_cast<uint64_t>(text[pos] - '0');
            if (whole > (limit - digit) / 10) {
                whole_overflow = true;
            } else {
                whole = whole * 10 + digit;
            }
            ++pos;
            ++digits;
        }
        // Fraction part
        double fraction = 0.0;
        size_t fraction_digits = 0;
        if (pos < text.size() && text[pos] == '.') {
            ++pos;
            double place = 0.1;
            while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
                fraction += place * (text[pos] - '0');
                place /= 10.0;
                ++pos;
                ++fraction_digits;
            }
        }
        if (digits == 0 && fraction_digits == 0) {
            return Result<Duration>::error(invalid, Error::Code::INVALID_ARGUMENT);
        }
        if (whole_overflow) {
            return Result<Duration>::error(invalid + ": value out of range", Error::Code::INVALID_ARGUMENT);
        }

        size_t unit_start = pos;
        while (pos < text.size() && text[pos] != '.' &&
               !std::isdigit(static_cast<unsigned char>(text[pos]))) {
            ++pos;
        }
        if (unit_start == pos) {
            return Result<Duration>::error("missing unit in duration \"" + text + "\"",
                                           Error::Code::INVALID_ARGUMENT);
        }
        std::string unit = text.substr(unit_start, pos - unit_start);
        int64_t scale = 0;
        if (!UnitScale(unit, &scale)) {
            return Result<Duration>::error("unknown unit \"" + unit + "\" in duration \"" + text + "\"",
                                           Error::Code::INVALID_ARGUMENT);
        }

        uint64_t uscale = static_cast<uint64_t>(scale);
        if (whole > limit / uscale) {
            return Result<Duration>::error(invalid + ": value out of range", Error::Code::INVALID_ARGUMENT);
        }
        uint64_t value = whole * uscale;
        value += static_cast<uint64_t>(fraction * static_cast<double>(uscale) + 0.5);
        if (value > limit || total > limit - value) {
            return Result<Duration>::error(invalid + ": value out of range", Error::Code::INVALID_ARGUMENT);
        }
        total += value;
    }

    int64_t signed_total = static_cast<int64_t>(total);
    return Result<Duration>(Duration(negative ? -signed_total : signed_total));
}

Result<Duration> ParseNonNegativeDuration(const std::string& text) {
    auto parsed = ParseDuration(text);
    if (!parsed.ok()) {
        return parsed;
    }
    if (parsed.value() < Duration::zero()) {
        return Result<Duration>::error(
            "duration must be a non-negative time value but actually is " + FormatDuration(parsed.value()),
            Error::Code::INVALID_ARGUMENT);
    }
    return parsed;
}

std::string FormatDuration(Duration d) {
    int64_t ns = d.count();
    if (ns == 0) {
        return "0s";
    }
    std::string sign;
    uint64_t abs_ns;
    if (ns < 0) {
        sign = "-";
        abs_ns = static_cast<uint64_t>(-(ns + 1)) + 1;
    } else {
        abs_ns = static_cast<uint64_t>(ns);
    }

    if (abs_ns < static_cast<uint64_t>(kMicrosecond)) {
        return sign + std::to_string(abs_ns) + "ns";
    }
    if (abs_ns < static_cast<uint64_t>(kMillisecond)) {
        return sign + TrimNumber(static_cast<double>(abs_ns) / kMicrosecond) + "us";
    }
    if (abs_ns < static_cast<uint64_t>(kSecond)) {
        return sign + TrimNumber(static_cast<double>(abs_ns) / kMillisecond) + "ms";
    }

    std::string out = sign;
    uint64_t hours = abs_ns / kHour;
    uint64_t rest = abs_ns % kHour;
    uint64_t minutes = rest / kMinute;
    rest %= kMinute;
    if (hours > 0) {
        out += std::to_string(hours) + "h";
    }
    if (hours > 0 || minutes > 0) {
        out += std::to_string(minutes) + "m";
    }
    out += TrimNumber(static_cast<double>(rest) / kSecond) + "s";
    return out;
}

} // namespace core
} // namespace streamstats
