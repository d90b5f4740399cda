#pragma once
#include "error.hpp"
#include <array>
#include <chrono>
#include <cstdint>
#include <initializer_list>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace ua {

// ---------- BuiltInType ----------

/// Wire ids 1..25 are shared by all encodings. Enumeration is never put on
/// the wire; enumerated values travel as Int32.
enum class BuiltInType : uint8_t {
    Null            = 0,
    Boolean         = 1,
    SByte           = 2,
    Byte            = 3,
    Int16           = 4,
    UInt16          = 5,
    Int32           = 6,
    UInt32          = 7,
    Int64           = 8,
    UInt64          = 9,
    Float           = 10,
    Double          = 11,
    String          = 12,
    DateTime        = 13,
    Guid            = 14,
    ByteString      = 15,
    XmlElement      = 16,
    NodeId          = 17,
    ExpandedNodeId  = 18,
    StatusCode      = 19,
    QualifiedName   = 20,
    LocalizedText   = 21,
    ExtensionObject = 22,
    DataValue       = 23,
    Variant         = 24,
    DiagnosticInfo  = 25,
    Enumeration     = 29
};

constexpr uint8_t MAX_BUILTIN_TYPE_ID = 25;

std::string_view builtin_type_name(BuiltInType type);
std::optional<BuiltInType> builtin_type_from_name(std::string_view name);

// ---------- DateTime ----------

/// 100-nanosecond ticks since 1601-01-01T00:00:00Z. Zero is the minimum and
/// doubles as the "not set" value.
struct DateTime {
    int64_t ticks = 0;

    /// 9999-12-31T23:59:59.9999999Z
    static constexpr int64_t MAX_TICKS = 2650467743999999999LL;
    static constexpr int64_t TICKS_PER_SECOND = 10000000LL;
    /// Ticks between 1601-01-01 and 1970-01-01.
    static constexpr int64_t UNIX_EPOCH_TICKS = 116444736000000000LL;

    static constexpr DateTime min() { return DateTime{0}; }
    static constexpr DateTime max() { return DateTime{MAX_TICKS}; }

    static DateTime now();
    /// Midnight UTC of the current day.
    static DateTime today();
    static DateTime from_time_point(std::chrono::system_clock::time_point tp);
    /// Civil UTC time; returns min() for dates before 1601.
    static DateTime from_civil(int year, unsigned month, unsigned day,
                               unsigned hour = 0, unsigned minute = 0, unsigned second = 0,
                               int64_t fraction_ticks = 0);

    std::chrono::system_clock::time_point to_time_point() const;

    bool is_min() const { return ticks <= 0; }
    bool is_max() const { return ticks >= MAX_TICKS; }

    /// ISO 8601 with up to seven fractional digits, always UTC ("Z").
    std::string to_iso8601() const;
    /// Accepts a trailing "Z" or a numeric offset. Values outside the
    /// representable range are clamped to min()/max().
    static std::optional<DateTime> parse_iso8601(std::string_view text);

    bool operator==(const DateTime& o) const { return ticks == o.ticks; }
    bool operator!=(const DateTime& o) const { return ticks != o.ticks; }
    bool operator<(const DateTime& o) const { return ticks < o.ticks; }
};

// ---------- Guid ----------

struct Guid {
    uint32_t data1 = 0;
    uint16_t data2 = 0;
    uint16_t data3 = 0;
    std::array<uint8_t, 8> data4{};

    bool is_null() const;
    /// Lower-case "xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx".
    std::string to_string() const;
    /// Accepts the canonical form with optional surrounding braces.
    static std::optional<Guid> parse(std::string_view text);

    bool operator==(const Guid& o) const {
        return data1 == o.data1 && data2 == o.data2 && data3 == o.data3 && data4 == o.data4;
    }
    bool operator!=(const Guid& o) const { return !(*this == o); }
    bool operator<(const Guid& o) const;
};

// ---------- ByteString / XmlElement ----------

/// Opaque octets. An empty ByteString and a null ByteString are the same value.
struct ByteString {
    std::vector<uint8_t> data;

    ByteString() = default;
    ByteString(std::vector<uint8_t> d) : data(std::move(d)) {}
    ByteString(std::initializer_list<uint8_t> bytes) : data(bytes) {}
    ByteString(const uint8_t* bytes, size_t size) : data(bytes, bytes + size) {}

    static ByteString from_string(std::string_view text) {
        return ByteString(reinterpret_cast<const uint8_t*>(text.data()), text.size());
    }

    size_t size() const { return data.size(); }
    bool empty() const { return data.empty(); }
    const uint8_t* bytes() const { return data.data(); }

    bool operator==(const ByteString& o) const { return data == o.data; }
    bool operator!=(const ByteString& o) const { return data != o.data; }
    bool operator<(const ByteString& o) const { return data < o.data; }
};

/// A serialized XML fragment with a single root element.
struct XmlElement {
    std::string xml;

    bool empty() const { return xml.empty(); }
    bool operator==(const XmlElement& o) const { return xml == o.xml; }
    bool operator!=(const XmlElement& o) const { return xml != o.xml; }
};

// ---------- NodeId ----------

enum class IdType : uint8_t { Numeric = 0, String = 1, Guid = 2, Opaque = 3 };

struct NodeId {
    uint16_t namespace_index = 0;
    std::variant<uint32_t, std::string, Guid, ByteString> identifier{uint32_t{0}};

    NodeId() = default;
    NodeId(uint16_t ns, uint32_t id) : namespace_index(ns), identifier(id) {}
    NodeId(uint16_t ns, std::string id) : namespace_index(ns), identifier(std::move(id)) {}
    NodeId(uint16_t ns, Guid id) : namespace_index(ns), identifier(id) {}
    NodeId(uint16_t ns, ByteString id) : namespace_index(ns), identifier(std::move(id)) {}

    IdType id_type() const { return static_cast<IdType>(identifier.index()); }

    /// Namespace 0 with a numeric zero, an empty string, a null Guid or an
    /// empty ByteString.
    bool is_null() const;

    /// "ns=1;i=5", "s=Foo", "ns=2;g=...", "b=base64".
    std::string to_string() const;
    /// Inverse of to_string(); throws UaError(BadNodeIdInvalid).
    static NodeId parse(std::string_view text);

    bool operator==(const NodeId& o) const {
        return namespace_index == o.namespace_index && identifier == o.identifier;
    }
    bool operator!=(const NodeId& o) const { return !(*this == o); }
    bool operator<(const NodeId& o) const;
};

/// Formats only the identifier part ("i=5", "s=Foo", ...).
std::string format_identifier(const NodeId& id);

// ---------- ExpandedNodeId ----------

struct ExpandedNodeId {
    NodeId node_id;
    /// When non-empty, overrides node_id.namespace_index.
    std::string namespace_uri;
    uint32_t server_index = 0;

    ExpandedNodeId() = default;
    ExpandedNodeId(NodeId id) : node_id(std::move(id)) {}
    ExpandedNodeId(NodeId id, std::string uri, uint32_t server = 0)
        : node_id(std::move(id)), namespace_uri(std::move(uri)), server_index(server) {}

    bool is_null() const { return node_id.is_null() && namespace_uri.empty() && server_index == 0; }
    bool is_absolute() const { return !namespace_uri.empty() || server_index != 0; }
    bool is_local() const { return server_index == 0; }

    /// "svr=1;nsu=http://x/;s=Foo" with the optional parts left out.
    std::string to_string() const;
    /// Inverse of to_string(); throws UaError(BadNodeIdInvalid).
    static ExpandedNodeId parse(std::string_view text);

    bool operator==(const ExpandedNodeId& o) const {
        return node_id == o.node_id && namespace_uri == o.namespace_uri
               && server_index == o.server_index;
    }
    bool operator!=(const ExpandedNodeId& o) const { return !(*this == o); }
    bool operator<(const ExpandedNodeId& o) const;
};

// ---------- QualifiedName / LocalizedText ----------

struct QualifiedName {
    uint16_t namespace_index = 0;
    std::string name;

    bool is_null() const { return namespace_index == 0 && name.empty(); }
    /// "1:Name", or "Name" in namespace 0.
    std::string to_string() const;

    bool operator==(const QualifiedName& o) const {
        return namespace_index == o.namespace_index && name == o.name;
    }
    bool operator!=(const QualifiedName& o) const { return !(*this == o); }
};

struct LocalizedText {
    std::string locale;
    std::string text;

    bool is_null() const { return locale.empty() && text.empty(); }

    bool operator==(const LocalizedText& o) const {
        return locale == o.locale && text == o.text;
    }
    bool operator!=(const LocalizedText& o) const { return !(*this == o); }
};

// ---------- DiagnosticInfo ----------

/// Indices refer to the string table of the enclosing response; -1 means absent.
struct DiagnosticInfo {
    int32_t symbolic_id = -1;
    int32_t namespace_uri = -1;
    int32_t locale = -1;
    int32_t localized_text = -1;
    std::string additional_info;
    StatusCode inner_status_code;
    std::unique_ptr<DiagnosticInfo> inner_diagnostic_info;

    DiagnosticInfo() = default;
    DiagnosticInfo(const DiagnosticInfo& o);
    DiagnosticInfo(DiagnosticInfo&&) noexcept = default;
    DiagnosticInfo& operator=(const DiagnosticInfo& o);
    DiagnosticInfo& operator=(DiagnosticInfo&&) noexcept = default;
    ~DiagnosticInfo() = default;

    bool is_null() const;
    /// Number of inner links below this record.
    size_t depth() const;

    bool operator==(const DiagnosticInfo& o) const;
    bool operator!=(const DiagnosticInfo& o) const { return !(*this == o); }
};

} // namespace ua
