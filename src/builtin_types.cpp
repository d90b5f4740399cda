#include "ua/builtin_types.hpp"
#include "text_util.hpp"
#include <array>
#include <cstdio>
#include <tuple>

namespace ua {

// ---------- BuiltInType ----------

namespace {

constexpr std::array<std::string_view, 26> TYPE_NAMES{{
    "Null", "Boolean", "SByte", "Byte", "Int16", "UInt16", "Int32", "UInt32", "Int64", "UInt64",
    "Float", "Double", "String", "DateTime", "Guid", "ByteString", "XmlElement", "NodeId",
    "ExpandedNodeId", "StatusCode", "QualifiedName", "LocalizedText", "ExtensionObject",
    "DataValue", "Variant", "DiagnosticInfo",
}};

} // anonymous namespace

std::string_view builtin_type_name(BuiltInType type) {
    auto id = static_cast<size_t>(type);
    if (id < TYPE_NAMES.size()) return TYPE_NAMES[id];
    if (type == BuiltInType::Enumeration) return "Enumeration";
    return {};
}

std::optional<BuiltInType> builtin_type_from_name(std::string_view name) {
    for (size_t i = 0; i < TYPE_NAMES.size(); ++i) {
        if (TYPE_NAMES[i] == name) return static_cast<BuiltInType>(i);
    }
    if (name == "Enumeration") return BuiltInType::Enumeration;
    return std::nullopt;
}

// ---------- DateTime ----------

namespace {

constexpr int64_t TICKS_PER_DAY = 86400LL * DateTime::TICKS_PER_SECOND;
// 9999-12-31T23:59:59Z, the last whole second.
constexpr int64_t LAST_WHOLE_SECOND = DateTime::MAX_TICKS - (DateTime::TICKS_PER_SECOND - 1);

using Ticks = std::chrono::duration<int64_t, std::ratio<1, 10000000>>;

// Days since 1970-01-01 (proleptic Gregorian).
int64_t days_from_civil(int64_t y, unsigned m, unsigned d) {
    y -= m <= 2;
    const int64_t era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<int64_t>(doe) - 719468;
}

void civil_from_days(int64_t z, int64_t& y, unsigned& m, unsigned& d) {
    z += 719468;
    const int64_t era = (z >= 0 ? z : z - 146096) / 146097;
    const unsigned doe = static_cast<unsigned>(z - era * 146097);
    const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    y = static_cast<int64_t>(yoe) + era * 400;
    const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const unsigned mp = (5 * doy + 2) / 153;
    d = doy - (153 * mp + 2) / 5 + 1;
    m = mp < 10 ? mp + 3 : mp - 9;
    y += m <= 2;
}

bool is_leap(int64_t y) { return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0; }

unsigned days_in_month(int64_t y, unsigned m) {
    static constexpr unsigned DAYS[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    return m == 2 && is_leap(y) ? 29 : DAYS[m - 1];
}

DateTime clamp_ticks(int64_t ticks) {
    if (ticks <= 0) return DateTime::min();
    if (ticks >= LAST_WHOLE_SECOND) return DateTime::max();
    return DateTime{static_cast<int64_t>(ticks)};
}

// Parses exactly n digits at text[pos].
bool take_digits(std::string_view text, size_t& pos, size_t n, int64_t& out) {
    if (pos + n > text.size()) return false;
    int64_t v = 0;
    for (size_t i = 0; i < n; ++i) {
        char c = text[pos + i];
        if (c < '0' || c > '9') return false;
        v = v * 10 + (c - '0');
    }
    pos += n;
    out = v;
    return true;
}

bool expect(std::string_view text, size_t& pos, char c) {
    if (pos >= text.size() || text[pos] != c) return false;
    ++pos;
    return true;
}

} // anonymous namespace

DateTime DateTime::now() {
    return from_time_point(std::chrono::system_clock::now());
}

DateTime DateTime::today() {
    DateTime t = now();
    t.ticks -= t.ticks % TICKS_PER_DAY;
    return t;
}

DateTime DateTime::from_time_point(std::chrono::system_clock::time_point tp) {
    auto since_unix = std::chrono::duration_cast<Ticks>(tp.time_since_epoch()).count();
    return clamp_ticks(static_cast<int64_t>(since_unix) + UNIX_EPOCH_TICKS);
}

DateTime DateTime::from_civil(int year, unsigned month, unsigned day,
                              unsigned hour, unsigned minute, unsigned second,
                              int64_t fraction_ticks) {
    int64_t days = days_from_civil(year, month, day);
    int64_t ticks = static_cast<int64_t>(days) * TICKS_PER_DAY
                     + static_cast<int64_t>(hour * 3600 + minute * 60 + second) * TICKS_PER_SECOND
                     + fraction_ticks + UNIX_EPOCH_TICKS;
    if (ticks <= 0) return min();
    if (ticks >= MAX_TICKS) return max();
    return DateTime{static_cast<int64_t>(ticks)};
}

std::chrono::system_clock::time_point DateTime::to_time_point() const {
    using std::chrono::system_clock;
    Ticks since_unix(ticks - UNIX_EPOCH_TICKS);
    auto hi = std::chrono::duration_cast<Ticks>(system_clock::duration::max());
    auto lo = std::chrono::duration_cast<Ticks>(system_clock::duration::min());
    if (since_unix >= hi) return system_clock::time_point::max();
    if (since_unix <= lo) return system_clock::time_point::min();
    return system_clock::time_point(std::chrono::duration_cast<system_clock::duration>(since_unix));
}

std::string DateTime::to_iso8601() const {
    int64_t t = ticks <= 0 ? 0 : (ticks >= MAX_TICKS ? MAX_TICKS : ticks);
    int64_t rel = t - UNIX_EPOCH_TICKS;
    int64_t days = rel / TICKS_PER_DAY;
    int64_t rem = rel % TICKS_PER_DAY;
    if (rem < 0) {
        rem += TICKS_PER_DAY;
        --days;
    }
    int64_t y;
    unsigned m, d;
    civil_from_days(days, y, m, d);
    int64_t secs = rem / TICKS_PER_SECOND;
    int64_t frac = rem % TICKS_PER_SECOND;

    char buf[48];
    std::snprintf(buf, sizeof(buf), "%04lld-%02u-%02uT%02lld:%02lld:%02lld",
                  static_cast<long long>(y), m, d,
                  static_cast<long long>(secs / 3600), static_cast<long long>((secs / 60) % 60),
                  static_cast<long long>(secs % 60));
    std::string out(buf);
    if (frac != 0) {
        char fbuf[16];
        std::snprintf(fbuf, sizeof(fbuf), "%07lld", static_cast<long long>(frac));
        std::string f(fbuf);
        while (!f.empty() && f.back() == '0') f.pop_back();
        out += '.';
        out += f;
    }
    out += 'Z';
    return out;
}

std::optional<DateTime> DateTime::parse_iso8601(std::string_view text) {
    size_t pos = 0;
    int64_t year, month, day, hour = 0, minute = 0, second = 0;
    if (!take_digits(text, pos, 4, year) || !expect(text, pos, '-')
        || !take_digits(text, pos, 2, month) || !expect(text, pos, '-')
        || !take_digits(text, pos, 2, day)) {
        return std::nullopt;
    }
    if (month < 1 || month > 12 || day < 1 || day > days_in_month(year, static_cast<unsigned>(month))) {
        return std::nullopt;
    }
    int64_t fraction = 0;
    if (pos < text.size()) {
        if (text[pos] != 'T' && text[pos] != 't') return std::nullopt;
        ++pos;
        if (!take_digits(text, pos, 2, hour) || !expect(text, pos, ':')
            || !take_digits(text, pos, 2, minute)) {
            return std::nullopt;
        }
        if (pos < text.size() && text[pos] == ':') {
            ++pos;
            if (!take_digits(text, pos, 2, second)) return std::nullopt;
        }
        if (hour > 23 || minute > 59 || second > 60) return std::nullopt;
        if (pos < text.size() && (text[pos] == '.' || text[pos] == ',')) {
            ++pos;
            size_t digits = 0;
            while (pos < text.size() && text[pos] >= '0' && text[pos] <= '9') {
                if (digits < 7) fraction = fraction * 10 + (text[pos] - '0');
                ++digits;
                ++pos;
            }
            if (digits == 0) return std::nullopt;
            for (size_t i = digits; i < 7; ++i) fraction *= 10;
        }
    }
    int64_t offset_minutes = 0;
    if (pos < text.size()) {
        char z = text[pos];
        if (z == 'Z' || z == 'z') {
            ++pos;
        } else if (z == '+' || z == '-') {
            ++pos;
            int64_t oh, om = 0;
            if (!take_digits(text, pos, 2, oh)) return std::nullopt;
            if (pos < text.size() && text[pos] == ':') ++pos;
            if (pos < text.size() && !take_digits(text, pos, 2, om)) return std::nullopt;
            if (oh > 23 || om > 59) return std::nullopt;
            offset_minutes = (oh * 60 + om) * (z == '-' ? -1 : 1);
        } else {
            return std::nullopt;
        }
    }
    if (pos != text.size()) return std::nullopt;

    int64_t days = days_from_civil(year, static_cast<unsigned>(month), static_cast<unsigned>(day));
    int64_t ticks = static_cast<int64_t>(days) * TICKS_PER_DAY
                     + static_cast<int64_t>(hour * 3600 + minute * 60 + second - offset_minutes * 60)
                           * TICKS_PER_SECOND
                     + fraction + UNIX_EPOCH_TICKS;
    return clamp_ticks(ticks);
}

// ---------- Guid ----------

namespace {

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

bool read_hex(std::string_view text, size_t pos, size_t n, uint64_t& out) {
    uint64_t v = 0;
    for (size_t i = 0; i < n; ++i) {
        int h = hex_value(text[pos + i]);
        if (h < 0) return false;
        v = (v << 4) | static_cast<uint64_t>(h);
    }
    out = v;
    return true;
}

} // anonymous namespace

bool Guid::is_null() const {
    if (data1 != 0 || data2 != 0 || data3 != 0) return false;
    for (auto b : data4) {
        if (b != 0) return false;
    }
    return true;
}

std::string Guid::to_string() const {
    char buf[40];
    std::snprintf(buf, sizeof(buf), "%08x-%04x-%04x-%02x%02x-%02x%02x%02x%02x%02x%02x",
                  data1, data2, data3, data4[0], data4[1], data4[2], data4[3],
                  data4[4], data4[5], data4[6], data4[7]);
    return buf;
}

std::optional<Guid> Guid::parse(std::string_view text) {
    if (text.size() == 38 && text.front() == '{' && text.back() == '}') {
        text = text.substr(1, 36);
    }
    if (text.size() != 36 || text[8] != '-' || text[13] != '-' || text[18] != '-' || text[23] != '-') {
        return std::nullopt;
    }
    Guid g;
    uint64_t v;
    if (!read_hex(text, 0, 8, v)) return std::nullopt;
    g.data1 = static_cast<uint32_t>(v);
    if (!read_hex(text, 9, 4, v)) return std::nullopt;
    g.data2 = static_cast<uint16_t>(v);
    if (!read_hex(text, 14, 4, v)) return std::nullopt;
    g.data3 = static_cast<uint16_t>(v);
    static constexpr size_t OFFSETS[8] = {19, 21, 24, 26, 28, 30, 32, 34};
    for (size_t i = 0; i < 8; ++i) {
        if (!read_hex(text, OFFSETS[i], 2, v)) return std::nullopt;
        g.data4[i] = static_cast<uint8_t>(v);
    }
    return g;
}

bool Guid::operator<(const Guid& o) const {
    return std::tie(data1, data2, data3, data4) < std::tie(o.data1, o.data2, o.data3, o.data4);
}

// ---------- NodeId ----------

namespace {

[[noreturn]] void invalid_node_id(std::string_view text) {
    throw UaError(status::BadNodeIdInvalid, "Invalid NodeId: " + std::string(text));
}

NodeId parse_identifier(uint16_t ns, std::string_view text) {
    if (text.size() < 2 || text[1] != '=') invalid_node_id(text);
    std::string_view value = text.substr(2);
    switch (text[0]) {
        case 'i': {
            auto id = detail::parse_integer<uint32_t>(value);
            if (!id) invalid_node_id(text);
            return NodeId(ns, *id);
        }
        case 's':
            return NodeId(ns, std::string(value));
        case 'g': {
            auto g = Guid::parse(value);
            if (!g) invalid_node_id(text);
            return NodeId(ns, *g);
        }
        case 'b': {
            auto bytes = detail::base64_decode(value);
            if (!bytes) invalid_node_id(text);
            return NodeId(ns, ByteString(std::move(*bytes)));
        }
        default:
            invalid_node_id(text);
    }
}

std::string escape_uri(const std::string& uri) {
    std::string out;
    for (char c : uri) {
        if (c == '%') out += "%25";
        else if (c == ';') out += "%3B";
        else out += c;
    }
    return out;
}

std::string unescape_uri(std::string_view uri) {
    std::string out;
    for (size_t i = 0; i < uri.size(); ++i) {
        if (uri[i] == '%' && i + 2 < uri.size()) {
            int hi = hex_value(uri[i + 1]);
            int lo = hex_value(uri[i + 2]);
            if (hi >= 0 && lo >= 0) {
                out += static_cast<char>(hi * 16 + lo);
                i += 2;
                continue;
            }
        }
        out += uri[i];
    }
    return out;
}

} // anonymous namespace

bool NodeId::is_null() const {
    if (namespace_index != 0) return false;
    switch (id_type()) {
        case IdType::Numeric: return std::get<uint32_t>(identifier) == 0;
        case IdType::String:  return std::get<std::string>(identifier).empty();
        case IdType::Guid:    return std::get<Guid>(identifier).is_null();
        case IdType::Opaque:  return std::get<ByteString>(identifier).empty();
    }
    return false;
}

std::string format_identifier(const NodeId& id) {
    switch (id.id_type()) {
        case IdType::Numeric:
            return "i=" + std::to_string(std::get<uint32_t>(id.identifier));
        case IdType::String:
            return "s=" + std::get<std::string>(id.identifier);
        case IdType::Guid:
            return "g=" + std::get<Guid>(id.identifier).to_string();
        case IdType::Opaque: {
            const auto& b = std::get<ByteString>(id.identifier);
            return "b=" + detail::base64_encode(b.bytes(), b.size());
        }
    }
    return {};
}

std::string NodeId::to_string() const {
    std::string out;
    if (namespace_index != 0) {
        out = "ns=" + std::to_string(namespace_index) + ";";
    }
    return out + format_identifier(*this);
}

NodeId NodeId::parse(std::string_view text) {
    uint16_t ns = 0;
    std::string_view rest = text;
    if (rest.substr(0, 3) == "ns=") {
        auto semi = rest.find(';');
        if (semi == std::string_view::npos) invalid_node_id(text);
        auto parsed = detail::parse_integer<uint16_t>(rest.substr(3, semi - 3));
        if (!parsed) invalid_node_id(text);
        ns = *parsed;
        rest = rest.substr(semi + 1);
    }
    return parse_identifier(ns, rest);
}

bool NodeId::operator<(const NodeId& o) const {
    if (namespace_index != o.namespace_index) return namespace_index < o.namespace_index;
    return identifier < o.identifier;
}

// ---------- ExpandedNodeId ----------

std::string ExpandedNodeId::to_string() const {
    std::string out;
    if (server_index != 0) {
        out += "svr=" + std::to_string(server_index) + ";";
    }
    if (!namespace_uri.empty()) {
        out += "nsu=" + escape_uri(namespace_uri) + ";" + format_identifier(node_id);
    } else {
        out += node_id.to_string();
    }
    return out;
}

ExpandedNodeId ExpandedNodeId::parse(std::string_view text) {
    ExpandedNodeId result;
    std::string_view rest = text;
    if (rest.substr(0, 4) == "svr=") {
        auto semi = rest.find(';');
        if (semi == std::string_view::npos) invalid_node_id(text);
        auto parsed = detail::parse_integer<uint32_t>(rest.substr(4, semi - 4));
        if (!parsed) invalid_node_id(text);
        result.server_index = *parsed;
        rest = rest.substr(semi + 1);
    }
    if (rest.substr(0, 4) == "nsu=") {
        auto semi = rest.find(';');
        if (semi == std::string_view::npos || semi == 4) invalid_node_id(text);
        result.namespace_uri = unescape_uri(rest.substr(4, semi - 4));
        result.node_id = parse_identifier(0, rest.substr(semi + 1));
    } else {
        result.node_id = NodeId::parse(rest);
    }
    return result;
}

bool ExpandedNodeId::operator<(const ExpandedNodeId& o) const {
    return std::tie(server_index, namespace_uri, node_id)
           < std::tie(o.server_index, o.namespace_uri, o.node_id);
}

// ---------- QualifiedName ----------

std::string QualifiedName::to_string() const {
    if (namespace_index == 0) return name;
    return std::to_string(namespace_index) + ":" + name;
}

// ---------- DiagnosticInfo ----------

DiagnosticInfo::DiagnosticInfo(const DiagnosticInfo& o)
    : symbolic_id(o.symbolic_id),
      namespace_uri(o.namespace_uri),
      locale(o.locale),
      localized_text(o.localized_text),
      additional_info(o.additional_info),
      inner_status_code(o.inner_status_code) {
    // Copy the chain iteratively so a long chain cannot exhaust the stack.
    DiagnosticInfo* dst = this;
    for (const DiagnosticInfo* src = o.inner_diagnostic_info.get(); src;
         src = src->inner_diagnostic_info.get()) {
        auto copy = std::make_unique<DiagnosticInfo>();
        copy->symbolic_id = src->symbolic_id;
        copy->namespace_uri = src->namespace_uri;
        copy->locale = src->locale;
        copy->localized_text = src->localized_text;
        copy->additional_info = src->additional_info;
        copy->inner_status_code = src->inner_status_code;
        dst->inner_diagnostic_info = std::move(copy);
        dst = dst->inner_diagnostic_info.get();
    }
}

DiagnosticInfo& DiagnosticInfo::operator=(const DiagnosticInfo& o) {
    if (this != &o) {
        DiagnosticInfo copy(o);
        *this = std::move(copy);
    }
    return *this;
}

bool DiagnosticInfo::is_null() const {
    return symbolic_id == -1 && namespace_uri == -1 && locale == -1 && localized_text == -1
           && additional_info.empty() && inner_status_code.code == status::Good
           && !inner_diagnostic_info;
}

size_t DiagnosticInfo::depth() const {
    size_t n = 0;
    for (auto* p = inner_diagnostic_info.get(); p; p = p->inner_diagnostic_info.get()) ++n;
    return n;
}

bool DiagnosticInfo::operator==(const DiagnosticInfo& o) const {
    const DiagnosticInfo* a = this;
    const DiagnosticInfo* b = &o;
    while (a && b) {
        if (a->symbolic_id != b->symbolic_id || a->namespace_uri != b->namespace_uri
            || a->locale != b->locale || a->localized_text != b->localized_text
            || a->additional_info != b->additional_info
            || a->inner_status_code != b->inner_status_code) {
            return false;
        }
        a = a->inner_diagnostic_info.get();
        b = b->inner_diagnostic_info.get();
    }
    return a == nullptr && b == nullptr;
}

} // namespace ua
