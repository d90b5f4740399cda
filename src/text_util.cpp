#include "text_util.hpp"
#include <charconv>
#include <cmath>
#include <limits>

namespace ua::detail {

namespace {

constexpr char BASE64_CHARS[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

// 64 = not in the alphabet
constexpr uint8_t base64_value(char c) {
    if (c >= 'A' && c <= 'Z') return static_cast<uint8_t>(c - 'A');
    if (c >= 'a' && c <= 'z') return static_cast<uint8_t>(c - 'a' + 26);
    if (c >= '0' && c <= '9') return static_cast<uint8_t>(c - '0' + 52);
    if (c == '+') return 62;
    if (c == '/') return 63;
    return 64;
}

bool is_space(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r';
}

std::string format_real(double value, int precision) {
    if (std::isnan(value)) return "NaN";
    if (std::isinf(value)) return value > 0 ? "INF" : "-INF";
    char buf[40];
    auto [end, ec] = std::to_chars(buf, buf + sizeof(buf), value, std::chars_format::general, precision);
    (void)ec; // 40 bytes hold any %g rendering at max_digits10
    return std::string(buf, end);
}

} // anonymous namespace

std::string base64_encode(const uint8_t* data, size_t size) {
    std::string encoded;
    encoded.reserve(((size + 2) / 3) * 4);

    uint32_t value = 0; // rolling 24-bit buffer
    size_t bits = 0;
    for (size_t i = 0; i < size; ++i) {
        value = (value << 8) | data[i];
        bits += 8;
        while (bits >= 6) {
            bits -= 6;
            encoded += BASE64_CHARS[(value >> bits) & 0x3F];
        }
        if (bits > 0) value &= (1u << bits) - 1;
    }
    if (bits > 0) {
        encoded += BASE64_CHARS[(value << (6 - bits)) & 0x3F];
    }
    while (encoded.size() % 4 != 0) {
        encoded += '=';
    }
    return encoded;
}

std::optional<std::vector<uint8_t>> base64_decode(std::string_view text) {
    std::vector<uint8_t> out;
    out.reserve(text.size() / 4 * 3);

    uint32_t value = 0;
    size_t bits = 0;
    size_t symbols = 0;
    size_t padding = 0;
    for (char c : text) {
        if (is_space(c)) continue;
        if (c == '=') {
            ++padding;
            continue;
        }
        if (padding > 0) return std::nullopt; // data after padding
        uint8_t v = base64_value(c);
        if (v == 64) return std::nullopt;
        ++symbols;
        value = (value << 6) | v;
        bits += 6;
        if (bits >= 8) {
            bits -= 8;
            out.push_back(static_cast<uint8_t>((value >> bits) & 0xFF));
            value &= (1u << bits) - 1;
        }
    }
    if (padding > 2 || symbols % 4 == 1) return std::nullopt;
    if (padding > 0 && (symbols + padding) % 4 != 0) return std::nullopt;
    return out;
}

size_t base64_decoded_size(std::string_view text) {
    size_t symbols = 0;
    for (char c : text) {
        if (!is_space(c) && c != '=') ++symbols;
    }
    return symbols / 4 * 3 + (symbols % 4 == 0 ? 0 : symbols % 4 - 1);
}

bool is_valid_utf8(std::string_view text) {
    size_t i = 0;
    const size_t n = text.size();
    while (i < n) {
        auto c = static_cast<uint8_t>(text[i]);
        if (c < 0x80) {
            ++i;
            continue;
        }
        size_t len;
        uint32_t cp;
        if ((c & 0xE0) == 0xC0) {
            len = 2;
            cp = c & 0x1F;
        } else if ((c & 0xF0) == 0xE0) {
            len = 3;
            cp = c & 0x0F;
        } else if ((c & 0xF8) == 0xF0) {
            len = 4;
            cp = c & 0x07;
        } else {
            return false;
        }
        if (i + len > n) return false;
        for (size_t k = 1; k < len; ++k) {
            auto cc = static_cast<uint8_t>(text[i + k]);
            if ((cc & 0xC0) != 0x80) return false;
            cp = (cp << 6) | (cc & 0x3F);
        }
        // overlong forms, surrogates, beyond U+10FFFF
        if ((len == 2 && cp < 0x80) || (len == 3 && cp < 0x800) || (len == 4 && cp < 0x10000)) return false;
        if (cp >= 0xD800 && cp <= 0xDFFF) return false;
        if (cp > 0x10FFFF) return false;
        i += len;
    }
    return true;
}

std::string format_float(float value) {
    return format_real(value, std::numeric_limits<float>::max_digits10);
}

std::string format_double(double value) {
    return format_real(value, std::numeric_limits<double>::max_digits10);
}

std::optional<double> parse_double(std::string_view text) {
    while (!text.empty() && is_space(text.front())) text.remove_prefix(1);
    while (!text.empty() && is_space(text.back())) text.remove_suffix(1);
    if (text.empty()) return std::nullopt;
    if (text == "NaN") return std::numeric_limits<double>::quiet_NaN();
    if (text == "INF" || text == "Infinity") return std::numeric_limits<double>::infinity();
    if (text == "-INF" || text == "-Infinity") return -std::numeric_limits<double>::infinity();

    // from_chars also takes "inf" and "nan"; only decimal text gets this far.
    for (char c : text) {
        bool ok = (c >= '0' && c <= '9') || c == '.' || c == '-' || c == '+' || c == 'e' || c == 'E';
        if (!ok) return std::nullopt;
    }
    if (text.front() == '+') text.remove_prefix(1);
    double value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc() || ptr != text.data() + text.size()) return std::nullopt;
    return value;
}

} // namespace ua::detail
