#pragma once
#include <charconv>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace ua::detail {

/// RFC 4648 Base64, standard alphabet with '=' padding, single line.
std::string base64_encode(const uint8_t* data, size_t size);

/// Inverse of base64_encode(). Whitespace between groups is skipped; any
/// other character outside the alphabet yields nullopt.
std::optional<std::vector<uint8_t>> base64_decode(std::string_view text);

/// Number of bytes base64_decode() yields for well-formed text, counted
/// without decoding.
size_t base64_decoded_size(std::string_view text);

bool is_valid_utf8(std::string_view text);

/// Round-trip text for finite values; "NaN", "INF" and "-INF"
/// otherwise (the XML Schema spellings).
std::string format_float(float value);
std::string format_double(double value);
std::optional<double> parse_double(std::string_view text);

/// Whole-string decimal integer parse with range checking.
template <typename T>
std::optional<T> parse_integer(std::string_view text) {
    static_assert(std::is_integral_v<T>, "integral type required");
    while (!text.empty() && (text.front() == ' ' || text.front() == '\t' || text.front() == '\n' || text.front() == '\r')) {
        text.remove_prefix(1);
    }
    while (!text.empty() && (text.back() == ' ' || text.back() == '\t' || text.back() == '\n' || text.back() == '\r')) {
        text.remove_suffix(1);
    }
    if (!text.empty() && text.front() == '+') text.remove_prefix(1);
    if (text.empty()) return std::nullopt;
    T value{};
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc() || ptr != text.data() + text.size()) return std::nullopt;
    return value;
}

} // namespace ua::detail
