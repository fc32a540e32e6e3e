#include "dotenv/core/convert.hpp"
#include "dotenv/core/utils.hpp"

#include <array>
#include <charconv>
#include <cstdlib>
#include <utility>

namespace dotenv::convert {

namespace {

auto conversion_error(std::string message, std::string_view input) -> Error {
    return make_error(ErrorCode::ConversionFailed, std::move(message),
                      "\"" + std::string(input) + "\"");
}

/// Drop a leading '+' unless it would leave another sign behind.
auto strip_plus(std::string_view s) -> std::string_view {
    if (s.size() > 1 && s.front() == '+' && s[1] != '-' && s[1] != '+') {
        return s.substr(1);
    }
    return s;
}

struct DurationUnit {
    std::string_view suffix;
    uint64_t nanos;
};

constexpr std::array<DurationUnit, 8> kDurationUnits = {{
    {"ns", 1ULL},
    {"us", 1000ULL},
    {"\xC2\xB5s", 1000ULL},  // U+00B5 micro sign
    {"\xCE\xBCs", 1000ULL},  // U+03BC Greek mu
    {"ms", 1000000ULL},
    {"s", 1000000000ULL},
    {"m", 60ULL * 1000000000ULL},
    {"h", 3600ULL * 1000000000ULL},
}};

constexpr uint64_t kMaxDuration = 1ULL << 63;

auto is_digit(char c) -> bool { return c >= '0' && c <= '9'; }

/// Consume leading decimal digits into `value`. Returns false on overflow.
auto scan_digits(std::string_view& s, uint64_t& value, size_t& count) -> bool {
    value = 0;
    count = 0;
    while (count < s.size() && is_digit(s[count])) {
        if (value > (kMaxDuration - 1) / 10) return false;
        value = value * 10 + static_cast<uint64_t>(s[count] - '0');
        if (value > kMaxDuration) return false;
        ++count;
    }
    s.remove_prefix(count);
    return true;
}

/// Consume fraction digits, keeping as many as fit in 63 bits.
void scan_fraction(std::string_view& s, uint64_t& value, double& scale, size_t& count) {
    value = 0;
    scale = 1.0;
    count = 0;
    bool overflow = false;
    while (count < s.size() && is_digit(s[count])) {
        if (!overflow) {
            if (value > (kMaxDuration - 1) / 10) {
                overflow = true;
            } else {
                auto next = value * 10 + static_cast<uint64_t>(s[count] - '0');
                if (next > kMaxDuration) {
                    overflow = true;
                } else {
                    value = next;
                    scale *= 10.0;
                }
            }
        }
        ++count;
    }
    s.remove_prefix(count);
}

/// Split `v` into its low `precision` decimal digits (rendered as ".ddd"
/// without trailing zeros) and the remaining high part.
auto format_fraction(uint64_t v, int precision) -> std::pair<std::string, uint64_t> {
    std::string digits;
    bool printed = false;
    for (int i = 0; i < precision; ++i) {
        auto digit = v % 10;
        printed = printed || digit != 0;
        if (printed) {
            digits.insert(digits.begin(), static_cast<char>('0' + digit));
        }
        v /= 10;
    }
    if (printed) {
        digits.insert(digits.begin(), '.');
    }
    return {digits, v};
}

} // anonymous namespace

auto to_int64(std::string_view s) -> Result<int64_t> {
    auto text = strip_plus(s);
    int64_t value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (text.empty() || ec != std::errc{} || ptr != text.data() + text.size()) {
        return std::unexpected(conversion_error("invalid integer", s));
    }
    return value;
}

auto to_uint64(std::string_view s) -> Result<uint64_t> {
    if (s.empty() || s.front() == '-' || s.front() == '+') {
        return std::unexpected(conversion_error("invalid unsigned integer", s));
    }
    uint64_t value = 0;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
    if (ec != std::errc{} || ptr != s.data() + s.size()) {
        return std::unexpected(conversion_error("invalid unsigned integer", s));
    }
    return value;
}

auto to_double(std::string_view s) -> Result<double> {
    auto text = strip_plus(s);
    double value = 0.0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (text.empty() || ec != std::errc{} || ptr != text.data() + text.size()) {
        return std::unexpected(conversion_error("invalid float", s));
    }
    return value;
}

auto to_bool(std::string_view s) -> Result<bool> {
    auto lower = utils::to_lower(s);
    if (lower == "true" || lower == "1" || lower == "yes" || lower == "on" || lower == "t") {
        return true;
    }
    if (lower == "false" || lower == "0" || lower == "no" || lower == "off" || lower == "f") {
        return false;
    }
    return std::unexpected(conversion_error("invalid boolean", s));
}

auto to_duration(std::string_view s) -> Result<std::chrono::nanoseconds> {
    std::string_view rest = s;
    bool negative = false;

    if (!rest.empty() && (rest.front() == '-' || rest.front() == '+')) {
        negative = rest.front() == '-';
        rest.remove_prefix(1);
    }

    if (rest == "0") {
        return std::chrono::nanoseconds{0};
    }
    if (rest.empty()) {
        return std::unexpected(conversion_error("invalid duration", s));
    }

    uint64_t total = 0;
    while (!rest.empty()) {
        if (!is_digit(rest.front()) && rest.front() != '.') {
            return std::unexpected(conversion_error("invalid duration", s));
        }

        uint64_t whole = 0;
        size_t whole_digits = 0;
        if (!scan_digits(rest, whole, whole_digits)) {
            return std::unexpected(conversion_error("duration out of range", s));
        }

        uint64_t frac = 0;
        double scale = 1.0;
        size_t frac_digits = 0;
        bool had_point = !rest.empty() && rest.front() == '.';
        if (had_point) {
            rest.remove_prefix(1);
            scan_fraction(rest, frac, scale, frac_digits);
        }
        if (whole_digits == 0 && frac_digits == 0) {
            return std::unexpected(conversion_error("invalid duration", s));
        }

        size_t unit_len = 0;
        while (unit_len < rest.size() && rest[unit_len] != '.' && !is_digit(rest[unit_len])) {
            ++unit_len;
        }
        if (unit_len == 0) {
            return std::unexpected(conversion_error("missing unit in duration", s));
        }
        auto suffix = rest.substr(0, unit_len);
        rest.remove_prefix(unit_len);

        const DurationUnit* unit = nullptr;
        for (const auto& candidate : kDurationUnits) {
            if (candidate.suffix == suffix) {
                unit = &candidate;
                break;
            }
        }
        if (unit == nullptr) {
            return std::unexpected(conversion_error(
                "unknown unit \"" + std::string(suffix) + "\" in duration", s));
        }

        if (whole > kMaxDuration / unit->nanos) {
            return std::unexpected(conversion_error("duration out of range", s));
        }
        whole *= unit->nanos;
        if (frac > 0) {
            whole += static_cast<uint64_t>(
                static_cast<double>(frac) * (static_cast<double>(unit->nanos) / scale));
            if (whole > kMaxDuration) {
                return std::unexpected(conversion_error("duration out of range", s));
            }
        }
        total += whole;
        if (total > kMaxDuration) {
            return std::unexpected(conversion_error("duration out of range", s));
        }
    }

    if (negative) {
        // -2^63 is representable, +2^63 is not.
        return std::chrono::nanoseconds{static_cast<int64_t>(0 - total)};
    }
    if (total > kMaxDuration - 1) {
        return std::unexpected(conversion_error("duration out of range", s));
    }
    return std::chrono::nanoseconds{static_cast<int64_t>(total)};
}

auto to_list(std::string_view s) -> std::vector<std::string> {
    std::vector<std::string> items;
    if (s.empty()) return items;

    for (auto& part : utils::split(s, ',')) {
        items.push_back(utils::trim(part));
    }
    return items;
}

auto format_bool(bool v) -> std::string {
    return v ? "true" : "false";
}

auto format_float(double v) -> std::string {
    std::array<char, 64> buf{};
    auto [ptr, ec] = std::to_chars(buf.data(), buf.data() + buf.size(), v);
    if (ec != std::errc{}) return std::to_string(v);
    return std::string(buf.data(), ptr);
}

auto format_duration(std::chrono::nanoseconds d) -> std::string {
    auto count = d.count();
    if (count == 0) return "0s";

    bool negative = count < 0;
    // Negate via unsigned arithmetic so INT64_MIN is handled.
    uint64_t u = negative ? 0 - static_cast<uint64_t>(count) : static_cast<uint64_t>(count);
    std::string sign = negative ? "-" : "";

    if (u < 1000000000ULL) {
        if (u < 1000ULL) {
            return sign + std::to_string(u) + "ns";
        }
        if (u < 1000000ULL) {
            auto [frac, high] = format_fraction(u, 3);
            return sign + std::to_string(high) + frac + "\xC2\xB5s";
        }
        auto [frac, high] = format_fraction(u, 6);
        return sign + std::to_string(high) + frac + "ms";
    }

    auto [frac, secs_total] = format_fraction(u, 9);
    auto secs = secs_total % 60;
    auto mins_total = secs_total / 60;
    auto mins = mins_total % 60;
    auto hours = mins_total / 60;

    std::string out = sign;
    if (hours > 0) {
        out += std::to_string(hours) + "h";
    }
    if (hours > 0 || mins > 0) {
        out += std::to_string(mins) + "m";
    }
    out += std::to_string(secs) + frac + "s";
    return out;
}

} // namespace dotenv::convert
