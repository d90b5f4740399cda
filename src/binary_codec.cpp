#include "ua/binary_codec.hpp"
#include "text_util.hpp"
#include <spdlog/spdlog.h>
#include <cstring>
#include <limits>
#include <type_traits>
#include <utility>

namespace ua {

namespace {

// NodeId encoding byte
constexpr uint8_t NODEID_TWO_BYTE = 0x00;
constexpr uint8_t NODEID_FOUR_BYTE = 0x01;
constexpr uint8_t NODEID_NUMERIC = 0x02;
constexpr uint8_t NODEID_STRING = 0x03;
constexpr uint8_t NODEID_GUID = 0x04;
constexpr uint8_t NODEID_BYTE_STRING = 0x05;
constexpr uint8_t NODEID_SERVER_INDEX_FLAG = 0x40;
constexpr uint8_t NODEID_NAMESPACE_URI_FLAG = 0x80;

// Variant encoding byte
constexpr uint8_t VARIANT_TYPE_MASK = 0x3F;
constexpr uint8_t VARIANT_DIMENSIONS_FLAG = 0x40;
constexpr uint8_t VARIANT_ARRAY_FLAG = 0x80;

// DataValue encoding mask
constexpr uint8_t DV_VALUE = 0x01;
constexpr uint8_t DV_STATUS = 0x02;
constexpr uint8_t DV_SOURCE_TIMESTAMP = 0x04;
constexpr uint8_t DV_SERVER_TIMESTAMP = 0x08;
constexpr uint8_t DV_SOURCE_PICOSECONDS = 0x10;
constexpr uint8_t DV_SERVER_PICOSECONDS = 0x20;

// DiagnosticInfo encoding mask
constexpr uint8_t DI_SYMBOLIC_ID = 0x01;
constexpr uint8_t DI_NAMESPACE_URI = 0x02;
constexpr uint8_t DI_LOCALIZED_TEXT = 0x04;
constexpr uint8_t DI_LOCALE = 0x08;
constexpr uint8_t DI_ADDITIONAL_INFO = 0x10;
constexpr uint8_t DI_INNER_STATUS_CODE = 0x20;
constexpr uint8_t DI_INNER_DIAGNOSTIC_INFO = 0x40;

// LocalizedText encoding mask
constexpr uint8_t LT_LOCALE = 0x01;
constexpr uint8_t LT_TEXT = 0x02;

// ExtensionObject body encoding
constexpr uint8_t EO_NO_BODY = 0x00;
constexpr uint8_t EO_BINARY_BODY = 0x01;
constexpr uint8_t EO_XML_BODY = 0x02;

} // anonymous namespace

// ==================== BinaryEncoder ====================

BinaryEncoder::BinaryEncoder(MessageContext& context)
    : IEncoder(context), guard_(context.limits) {
    buffer_.reserve(256);
}

template <typename T>
void BinaryEncoder::write_le(T value) {
    static_assert(std::is_trivially_copyable_v<T>, "raw write needs a trivial type");
    uint8_t bytes[sizeof(T)];
    std::memcpy(bytes, &value, sizeof(T));
#if __BYTE_ORDER__ == __ORDER_BIG_ENDIAN__
    for (size_t i = 0; i < sizeof(T) / 2; ++i) std::swap(bytes[i], bytes[sizeof(T) - 1 - i]);
#endif
    buffer_.insert(buffer_.end(), bytes, bytes + sizeof(T));
}

void BinaryEncoder::write_raw(const uint8_t* data, size_t size) {
    buffer_.insert(buffer_.end(), data, data + size);
}

void BinaryEncoder::write_length(size_t length) {
    if (length > static_cast<size_t>(std::numeric_limits<int32_t>::max())) {
        throw EncodingLimitsExceeded("Length does not fit an Int32 prefix");
    }
    write_le<int32_t>(static_cast<int32_t>(length));
}

void BinaryEncoder::write_boolean(std::string_view, bool value) { write_le<uint8_t>(value ? 1 : 0); }
void BinaryEncoder::write_sbyte(std::string_view, int8_t value) { write_le(value); }
void BinaryEncoder::write_byte(std::string_view, uint8_t value) { write_le(value); }
void BinaryEncoder::write_int16(std::string_view, int16_t value) { write_le(value); }
void BinaryEncoder::write_uint16(std::string_view, uint16_t value) { write_le(value); }
void BinaryEncoder::write_int32(std::string_view, int32_t value) { write_le(value); }
void BinaryEncoder::write_uint32(std::string_view, uint32_t value) { write_le(value); }
void BinaryEncoder::write_int64(std::string_view, int64_t value) { write_le(value); }
void BinaryEncoder::write_uint64(std::string_view, uint64_t value) { write_le(value); }
void BinaryEncoder::write_float(std::string_view, float value) { write_le(value); }
void BinaryEncoder::write_double(std::string_view, double value) { write_le(value); }

void BinaryEncoder::write_string(std::string_view, const std::string& value) {
    if (value.empty()) {
        write_le<int32_t>(-1);
        return;
    }
    guard_.check_string_length(value.size());
    write_length(value.size());
    write_raw(reinterpret_cast<const uint8_t*>(value.data()), value.size());
}

void BinaryEncoder::write_datetime(std::string_view, DateTime value) {
    if (value.ticks <= 0) {
        write_le<int64_t>(0);
    } else if (value.ticks >= DateTime::MAX_TICKS) {
        write_le<int64_t>(std::numeric_limits<int64_t>::max());
    } else {
        write_le<int64_t>(value.ticks);
    }
}

void BinaryEncoder::write_guid(std::string_view, const Guid& value) {
    write_le(value.data1);
    write_le(value.data2);
    write_le(value.data3);
    write_raw(value.data4.data(), value.data4.size());
}

void BinaryEncoder::write_byte_string(std::string_view, const ByteString& value) {
    if (value.empty()) {
        write_le<int32_t>(-1);
        return;
    }
    guard_.check_byte_string_length(value.size());
    write_length(value.size());
    write_raw(value.bytes(), value.size());
}

void BinaryEncoder::write_xml_element(std::string_view, const XmlElement& value) {
    // Same layout as a UTF-8 ByteString.
    if (value.empty()) {
        write_le<int32_t>(-1);
        return;
    }
    guard_.check_byte_string_length(value.xml.size());
    write_length(value.xml.size());
    write_raw(reinterpret_cast<const uint8_t*>(value.xml.data()), value.xml.size());
}

void BinaryEncoder::write_node_id_body(const NodeId& value, uint8_t flags) {
    switch (value.id_type()) {
        case IdType::Numeric: {
            uint32_t id = std::get<uint32_t>(value.identifier);
            if (value.namespace_index == 0 && id <= 0xFF) {
                write_le<uint8_t>(NODEID_TWO_BYTE | flags);
                write_le<uint8_t>(static_cast<uint8_t>(id));
            } else if (value.namespace_index <= 0xFF && id <= 0xFFFF) {
                write_le<uint8_t>(NODEID_FOUR_BYTE | flags);
                write_le<uint8_t>(static_cast<uint8_t>(value.namespace_index));
                write_le<uint16_t>(static_cast<uint16_t>(id));
            } else {
                write_le<uint8_t>(NODEID_NUMERIC | flags);
                write_le<uint16_t>(value.namespace_index);
                write_le<uint32_t>(id);
            }
            break;
        }
        case IdType::String:
            write_le<uint8_t>(NODEID_STRING | flags);
            write_le<uint16_t>(value.namespace_index);
            write_string({}, std::get<std::string>(value.identifier));
            break;
        case IdType::Guid:
            write_le<uint8_t>(NODEID_GUID | flags);
            write_le<uint16_t>(value.namespace_index);
            write_guid({}, std::get<Guid>(value.identifier));
            break;
        case IdType::Opaque:
            write_le<uint8_t>(NODEID_BYTE_STRING | flags);
            write_le<uint16_t>(value.namespace_index);
            write_byte_string({}, std::get<ByteString>(value.identifier));
            break;
    }
}

void BinaryEncoder::write_node_id(std::string_view, const NodeId& value) {
    write_node_id_body(value, 0);
}

void BinaryEncoder::write_expanded_node_id(std::string_view, const ExpandedNodeId& value) {
    uint8_t flags = 0;
    if (!value.namespace_uri.empty()) flags |= NODEID_NAMESPACE_URI_FLAG;
    if (value.server_index != 0) flags |= NODEID_SERVER_INDEX_FLAG;
    write_node_id_body(value.node_id, flags);
    if (flags & NODEID_NAMESPACE_URI_FLAG) write_string({}, value.namespace_uri);
    if (flags & NODEID_SERVER_INDEX_FLAG) write_le<uint32_t>(value.server_index);
}

void BinaryEncoder::write_status_code(std::string_view, StatusCode value) {
    write_le<uint32_t>(value.code);
}

void BinaryEncoder::write_qualified_name(std::string_view, const QualifiedName& value) {
    write_le<uint16_t>(value.namespace_index);
    write_string({}, value.name);
}

void BinaryEncoder::write_localized_text(std::string_view, const LocalizedText& value) {
    uint8_t mask = 0;
    if (!value.locale.empty()) mask |= LT_LOCALE;
    if (!value.text.empty()) mask |= LT_TEXT;
    write_le(mask);
    if (mask & LT_LOCALE) write_string({}, value.locale);
    if (mask & LT_TEXT) write_string({}, value.text);
}

void BinaryEncoder::write_extension_object(std::string_view, const ExtensionObject& value) {
    auto nesting = guard_.enter();

    if (const IEncodeable* body = value.encodeable()) {
        write_node_id({}, context_.to_node_id(body->binary_encoding_id()));
        write_le<uint8_t>(EO_BINARY_BODY);
        // Length is back-patched once the body is written.
        size_t length_pos = buffer_.size();
        write_le<int32_t>(0);
        size_t start = buffer_.size();
        {
            NamespaceScope<IEncoder> scope(*this, context_.namespace_uri_of(body->type_id()));
            body->encode(*this);
        }
        size_t length = buffer_.size() - start;
        if (length > static_cast<size_t>(std::numeric_limits<int32_t>::max())) {
            throw EncodingLimitsExceeded("ExtensionObject body too large");
        }
        auto len32 = static_cast<int32_t>(length);
        uint8_t bytes[4];
        std::memcpy(bytes, &len32, 4);
#if __BYTE_ORDER__ == __ORDER_BIG_ENDIAN__
        std::swap(bytes[0], bytes[3]);
        std::swap(bytes[1], bytes[2]);
#endif
        std::memcpy(buffer_.data() + length_pos, bytes, 4);
        return;
    }

    write_node_id({}, context_.to_node_id(value.type_id));
    switch (value.encoding()) {
        case ExtensionObjectEncoding::None:
            write_le<uint8_t>(EO_NO_BODY);
            break;
        case ExtensionObjectEncoding::Binary: {
            // Always a length, never the -1 null: a present body may be empty.
            const auto& body = std::get<ByteString>(value.body);
            guard_.check_byte_string_length(body.size());
            write_le<uint8_t>(EO_BINARY_BODY);
            write_length(body.size());
            write_raw(body.bytes(), body.size());
            break;
        }
        case ExtensionObjectEncoding::Xml:
            write_le<uint8_t>(EO_XML_BODY);
            write_xml_element({}, std::get<XmlElement>(value.body));
            break;
        case ExtensionObjectEncoding::Json:
            throw EncodingError("ExtensionObject with an undecoded JSON body has no binary form");
        case ExtensionObjectEncoding::EncodeableObject:
            break;
    }
}

void BinaryEncoder::write_data_value(std::string_view, const DataValue& value) {
    auto nesting = guard_.enter();
    uint8_t mask = 0;
    if (!value.value.is_null()) mask |= DV_VALUE;
    if (value.status.code != status::Good) mask |= DV_STATUS;
    if (!value.source_timestamp.is_min()) mask |= DV_SOURCE_TIMESTAMP;
    if (value.source_picoseconds != 0) mask |= DV_SOURCE_PICOSECONDS;
    if (!value.server_timestamp.is_min()) mask |= DV_SERVER_TIMESTAMP;
    if (value.server_picoseconds != 0) mask |= DV_SERVER_PICOSECONDS;
    write_le(mask);
    if (mask & DV_VALUE) write_variant({}, value.value);
    if (mask & DV_STATUS) write_status_code({}, value.status);
    if (mask & DV_SOURCE_TIMESTAMP) write_datetime({}, value.source_timestamp);
    if (mask & DV_SOURCE_PICOSECONDS) write_le<uint16_t>(value.source_picoseconds);
    if (mask & DV_SERVER_TIMESTAMP) write_datetime({}, value.server_timestamp);
    if (mask & DV_SERVER_PICOSECONDS) write_le<uint16_t>(value.server_picoseconds);
}

void BinaryEncoder::write_elements(const Variant& values) {
    std::visit([this](const auto& vec) {
        using Vec = std::decay_t<decltype(vec)>;
        if constexpr (!std::is_same_v<Vec, std::monostate>) {
            using T = typename Vec::value_type;
            guard_.check_array_length(vec.size());
            write_length(vec.size());
            for (size_t i = 0; i < vec.size(); ++i) {
                write<T>({}, vec[i]);
            }
        }
    }, values.storage());
}

void BinaryEncoder::write_variant(std::string_view, const Variant& value) {
    if (value.is_null()) {
        write_le<uint8_t>(0);
        return;
    }
    auto nesting = guard_.enter();
    auto type = static_cast<uint8_t>(value.type());
    if (value.is_scalar()) {
        if (value.type() == BuiltInType::Variant) {
            throw EncodingError("A Variant cannot directly contain a scalar Variant");
        }
        write_le<uint8_t>(type);
        std::visit([this](const auto& vec) {
            using Vec = std::decay_t<decltype(vec)>;
            if constexpr (!std::is_same_v<Vec, std::monostate>) {
                using T = typename Vec::value_type;
                write<T>({}, vec[0]);
            }
        }, value.storage());
        return;
    }
    uint8_t mask = type | VARIANT_ARRAY_FLAG;
    if (value.is_matrix()) mask |= VARIANT_DIMENSIONS_FLAG;
    write_le(mask);
    write_elements(value);
    if (value.is_matrix()) {
        write_length(value.dimensions().size());
        for (int32_t d : value.dimensions()) write_le<int32_t>(d);
    }
}

void BinaryEncoder::write_diagnostic_info(std::string_view, const DiagnosticInfo& value) {
    write_diagnostic_info(value, 0);
}

void BinaryEncoder::write_diagnostic_info(const DiagnosticInfo& value, size_t depth) {
    guard_.check_diagnostic_depth(depth);
    uint8_t mask = 0;
    if (value.symbolic_id >= 0) mask |= DI_SYMBOLIC_ID;
    if (value.namespace_uri >= 0) mask |= DI_NAMESPACE_URI;
    if (value.locale >= 0) mask |= DI_LOCALE;
    if (value.localized_text >= 0) mask |= DI_LOCALIZED_TEXT;
    if (!value.additional_info.empty()) mask |= DI_ADDITIONAL_INFO;
    if (value.inner_status_code.code != status::Good) mask |= DI_INNER_STATUS_CODE;
    if (value.inner_diagnostic_info) mask |= DI_INNER_DIAGNOSTIC_INFO;
    write_le(mask);
    if (mask & DI_SYMBOLIC_ID) write_le<int32_t>(value.symbolic_id);
    if (mask & DI_NAMESPACE_URI) write_le<int32_t>(value.namespace_uri);
    if (mask & DI_LOCALE) write_le<int32_t>(value.locale);
    if (mask & DI_LOCALIZED_TEXT) write_le<int32_t>(value.localized_text);
    if (mask & DI_ADDITIONAL_INFO) write_string({}, value.additional_info);
    if (mask & DI_INNER_STATUS_CODE) write_status_code({}, value.inner_status_code);
    if (mask & DI_INNER_DIAGNOSTIC_INFO) write_diagnostic_info(*value.inner_diagnostic_info, depth + 1);
}

void BinaryEncoder::write_encodeable(std::string_view, const IEncodeable& value) {
    auto nesting = guard_.enter();
    NamespaceScope<IEncoder> scope(*this, context_.namespace_uri_of(value.type_id()));
    value.encode(*this);
}

void BinaryEncoder::write_enumerated(std::string_view, int32_t value, std::string_view) {
    write_le(value);
}

void BinaryEncoder::write_array(std::string_view, const Variant& values) {
    if (values.is_null()) {
        write_le<int32_t>(-1);
        return;
    }
    if (values.is_matrix()) {
        throw EncodingError("write_array() takes a one-dimensional array");
    }
    if (!values.is_array()) {
        throw EncodingError("write_array() requires an array Variant");
    }
    write_elements(values);
}

// ==================== BinaryDecoder ====================

BinaryDecoder::BinaryDecoder(const uint8_t* data, size_t size, MessageContext& context)
    : IDecoder(context), data_(data), end_(size), guard_(context.limits) {}

const uint8_t* BinaryDecoder::take(size_t size) {
    if (size > end_ - pos_) {
        throw DecodingError("Unexpected end of data: need " + std::to_string(size)
                            + " bytes, " + std::to_string(end_ - pos_) + " left");
    }
    const uint8_t* p = data_ + pos_;
    pos_ += size;
    return p;
}

template <typename T>
T BinaryDecoder::read_le() {
    static_assert(std::is_trivially_copyable_v<T>, "raw read needs a trivial type");
    uint8_t bytes[sizeof(T)];
    std::memcpy(bytes, take(sizeof(T)), sizeof(T));
#if __BYTE_ORDER__ == __ORDER_BIG_ENDIAN__
    for (size_t i = 0; i < sizeof(T) / 2; ++i) std::swap(bytes[i], bytes[sizeof(T) - 1 - i]);
#endif
    T value;
    std::memcpy(&value, bytes, sizeof(T));
    return value;
}

std::optional<size_t> BinaryDecoder::read_length() {
    int32_t length = read_le<int32_t>();
    if (length < 0) return std::nullopt;
    return static_cast<size_t>(length);
}

bool BinaryDecoder::read_boolean(std::string_view) { return read_le<uint8_t>() != 0; }
int8_t BinaryDecoder::read_sbyte(std::string_view) { return read_le<int8_t>(); }
uint8_t BinaryDecoder::read_byte(std::string_view) { return read_le<uint8_t>(); }
int16_t BinaryDecoder::read_int16(std::string_view) { return read_le<int16_t>(); }
uint16_t BinaryDecoder::read_uint16(std::string_view) { return read_le<uint16_t>(); }
int32_t BinaryDecoder::read_int32(std::string_view) { return read_le<int32_t>(); }
uint32_t BinaryDecoder::read_uint32(std::string_view) { return read_le<uint32_t>(); }
int64_t BinaryDecoder::read_int64(std::string_view) { return read_le<int64_t>(); }
uint64_t BinaryDecoder::read_uint64(std::string_view) { return read_le<uint64_t>(); }
float BinaryDecoder::read_float(std::string_view) { return read_le<float>(); }
double BinaryDecoder::read_double(std::string_view) { return read_le<double>(); }

std::string BinaryDecoder::read_string(std::string_view) {
    auto length = read_length();
    if (!length) return {};
    guard_.check_string_length(*length);
    const uint8_t* p = take(*length);
    std::string value(reinterpret_cast<const char*>(p), *length);
    if (!detail::is_valid_utf8(value)) {
        throw DecodingError("String is not valid UTF-8");
    }
    return value;
}

DateTime BinaryDecoder::read_datetime(std::string_view) {
    int64_t ticks = read_le<int64_t>();
    if (ticks <= 0) return DateTime::min();
    if (ticks >= DateTime::MAX_TICKS) return DateTime::max();
    return DateTime{ticks};
}

Guid BinaryDecoder::read_guid(std::string_view) {
    Guid g;
    g.data1 = read_le<uint32_t>();
    g.data2 = read_le<uint16_t>();
    g.data3 = read_le<uint16_t>();
    std::memcpy(g.data4.data(), take(8), 8);
    return g;
}

ByteString BinaryDecoder::read_byte_string(std::string_view) {
    auto length = read_length();
    if (!length) return {};
    guard_.check_byte_string_length(*length);
    const uint8_t* p = take(*length);
    return ByteString(p, *length);
}

XmlElement BinaryDecoder::read_xml_element(std::string_view) {
    auto length = read_length();
    if (!length) return {};
    guard_.check_byte_string_length(*length);
    const uint8_t* p = take(*length);
    XmlElement value{std::string(reinterpret_cast<const char*>(p), *length)};
    if (!detail::is_valid_utf8(value.xml)) {
        throw DecodingError("XmlElement is not valid UTF-8");
    }
    return value;
}

NodeId BinaryDecoder::read_node_id_body(uint8_t encoding) {
    switch (encoding & 0x3F) {
        case NODEID_TWO_BYTE:
            return NodeId(0, static_cast<uint32_t>(read_le<uint8_t>()));
        case NODEID_FOUR_BYTE: {
            auto ns = read_le<uint8_t>();
            auto id = read_le<uint16_t>();
            return NodeId(ns, static_cast<uint32_t>(id));
        }
        case NODEID_NUMERIC: {
            auto ns = read_le<uint16_t>();
            auto id = read_le<uint32_t>();
            return NodeId(ns, id);
        }
        case NODEID_STRING: {
            auto ns = read_le<uint16_t>();
            return NodeId(ns, read_string({}));
        }
        case NODEID_GUID: {
            auto ns = read_le<uint16_t>();
            return NodeId(ns, read_guid({}));
        }
        case NODEID_BYTE_STRING: {
            auto ns = read_le<uint16_t>();
            return NodeId(ns, read_byte_string({}));
        }
        default:
            throw DecodingError("Invalid NodeId encoding byte " + std::to_string(encoding));
    }
}

NodeId BinaryDecoder::read_node_id(std::string_view) {
    auto encoding = read_le<uint8_t>();
    if (encoding & (NODEID_NAMESPACE_URI_FLAG | NODEID_SERVER_INDEX_FLAG)) {
        throw DecodingError("NodeId carries ExpandedNodeId flags");
    }
    return read_node_id_body(encoding);
}

ExpandedNodeId BinaryDecoder::read_expanded_node_id(std::string_view) {
    auto encoding = read_le<uint8_t>();
    ExpandedNodeId result(read_node_id_body(encoding));
    if (encoding & NODEID_NAMESPACE_URI_FLAG) {
        result.namespace_uri = read_string({});
    }
    if (encoding & NODEID_SERVER_INDEX_FLAG) {
        result.server_index = read_le<uint32_t>();
    }
    return result;
}

StatusCode BinaryDecoder::read_status_code(std::string_view) {
    return StatusCode(read_le<uint32_t>());
}

QualifiedName BinaryDecoder::read_qualified_name(std::string_view) {
    QualifiedName q;
    q.namespace_index = read_le<uint16_t>();
    q.name = read_string({});
    return q;
}

LocalizedText BinaryDecoder::read_localized_text(std::string_view) {
    LocalizedText t;
    auto mask = read_le<uint8_t>();
    if (mask & LT_LOCALE) t.locale = read_string({});
    if (mask & LT_TEXT) t.text = read_string({});
    return t;
}

ExtensionObject BinaryDecoder::read_extension_object(std::string_view) {
    auto nesting = guard_.enter();
    ExpandedNodeId type_id(read_node_id({}));
    auto encoding = read_le<uint8_t>();

    switch (encoding) {
        case EO_NO_BODY:
            return ExtensionObject(type_id, std::monostate{});
        case EO_XML_BODY:
            return ExtensionObject(type_id, read_xml_element({}));
        case EO_BINARY_BODY:
            break;
        default:
            throw DecodingError("Invalid ExtensionObject encoding " + std::to_string(encoding));
    }

    auto length = read_length();
    if (!length) return ExtensionObject(type_id, std::monostate{});
    guard_.check_byte_string_length(*length);
    if (*length > end_ - pos_) {
        throw DecodingError("ExtensionObject body runs past the end of data");
    }

    // pos_ is at the first body byte here; the opaque fallback re-reads from it.
    const size_t body_start = pos_;
    auto encodeable = context_.create(EncodingType::Binary, type_id);
    if (encodeable) {
        size_t saved_end = end_;
        end_ = body_start + *length;
        {
            NamespaceScope<IDecoder> scope(*this, context_.namespace_uri_of(encodeable->type_id()));
            encodeable->decode(*this);
        }
        bool complete = pos_ == end_;
        end_ = saved_end;
        if (complete) {
            return ExtensionObject(std::shared_ptr<const IEncodeable>(std::move(encodeable)));
        }
        spdlog::warn("ExtensionObject {}: decoder consumed {} of {} body bytes, keeping body opaque",
                     type_id.to_string(), pos_ - body_start, *length);
        pos_ = body_start;
    } else {
        spdlog::debug("ExtensionObject {}: type not registered, keeping body opaque", type_id.to_string());
    }
    const uint8_t* body = take(*length);
    return ExtensionObject(type_id, ByteString(body, *length));
}

DataValue BinaryDecoder::read_data_value(std::string_view) {
    auto nesting = guard_.enter();
    DataValue dv;
    auto mask = read_le<uint8_t>();
    if (mask & DV_VALUE) dv.value = read_variant({});
    if (mask & DV_STATUS) dv.status = read_status_code({});
    if (mask & DV_SOURCE_TIMESTAMP) dv.source_timestamp = read_datetime({});
    if (mask & DV_SOURCE_PICOSECONDS) dv.source_picoseconds = read_le<uint16_t>();
    if (mask & DV_SERVER_TIMESTAMP) dv.server_timestamp = read_datetime({});
    if (mask & DV_SERVER_PICOSECONDS) dv.server_picoseconds = read_le<uint16_t>();
    return dv;
}

Variant BinaryDecoder::read_elements(BuiltInType type, size_t count) {
    guard_.check_array_length(count);
    // Every element occupies at least one byte.
    if (count > end_ - pos_) {
        throw DecodingError("Array length exceeds the remaining data");
    }
    return visit_builtin_type(type, [&](auto tag) {
        using T = typename decltype(tag)::type;
        std::vector<T> values;
        values.reserve(count);
        for (size_t i = 0; i < count; ++i) {
            values.push_back(read<T>({}));
        }
        return Variant::from_array(std::move(values));
    });
}

Variant BinaryDecoder::read_variant(std::string_view) {
    auto mask = read_le<uint8_t>();
    auto type_id = static_cast<uint8_t>(mask & VARIANT_TYPE_MASK);
    if (type_id == 0) {
        if (mask != 0) throw DecodingError("Null Variant with array flags");
        return {};
    }
    if (type_id > MAX_BUILTIN_TYPE_ID) {
        throw DecodingError("Variant type id " + std::to_string(type_id) + " out of range");
    }
    auto nesting = guard_.enter();
    auto type = static_cast<BuiltInType>(type_id);

    if (!(mask & VARIANT_ARRAY_FLAG)) {
        if (mask & VARIANT_DIMENSIONS_FLAG) {
            throw DecodingError("Scalar Variant with dimensions");
        }
        if (type == BuiltInType::Variant) {
            throw DecodingError("A Variant cannot directly contain a scalar Variant");
        }
        return visit_builtin_type(type, [&](auto tag) {
            using T = typename decltype(tag)::type;
            if constexpr (std::is_same_v<T, Variant>) {
                return Variant();
            } else {
                return Variant(read<T>({}));
            }
        });
    }

    auto length = read_length();
    Variant array = read_elements(type, length.value_or(0));
    if (!(mask & VARIANT_DIMENSIONS_FLAG)) return array;

    auto dim_count = read_length();
    if (!dim_count || *dim_count == 0) {
        throw DecodingError("Matrix without dimensions");
    }
    guard_.check_array_length(*dim_count);
    if (*dim_count > (end_ - pos_) / 4) {
        throw DecodingError("Dimension count exceeds the remaining data");
    }
    std::vector<int32_t> dims;
    dims.reserve(*dim_count);
    for (size_t i = 0; i < *dim_count; ++i) dims.push_back(read_le<int32_t>());
    auto expected = matrix_element_count(dims);
    if (!expected || *expected != array.size()) {
        throw DecodingError("Matrix dimensions do not match the element count");
    }
    if (dims.size() == 1) return array;
    Variant::Storage storage = array.storage();
    return Variant::from_storage(std::move(storage), true, std::move(dims));
}

DiagnosticInfo BinaryDecoder::read_diagnostic_info(std::string_view) {
    return read_diagnostic_info(size_t{0});
}

DiagnosticInfo BinaryDecoder::read_diagnostic_info(size_t depth) {
    guard_.check_diagnostic_depth(depth);
    DiagnosticInfo info;
    auto mask = read_le<uint8_t>();
    if (mask & DI_SYMBOLIC_ID) info.symbolic_id = read_le<int32_t>();
    if (mask & DI_NAMESPACE_URI) info.namespace_uri = read_le<int32_t>();
    if (mask & DI_LOCALE) info.locale = read_le<int32_t>();
    if (mask & DI_LOCALIZED_TEXT) info.localized_text = read_le<int32_t>();
    if (mask & DI_ADDITIONAL_INFO) info.additional_info = read_string({});
    if (mask & DI_INNER_STATUS_CODE) info.inner_status_code = read_status_code({});
    if (mask & DI_INNER_DIAGNOSTIC_INFO) {
        info.inner_diagnostic_info = std::make_unique<DiagnosticInfo>(read_diagnostic_info(depth + 1));
    }
    return info;
}

void BinaryDecoder::read_encodeable(std::string_view, IEncodeable& value) {
    auto nesting = guard_.enter();
    NamespaceScope<IDecoder> scope(*this, context_.namespace_uri_of(value.type_id()));
    value.decode(*this);
}

int32_t BinaryDecoder::read_enumerated(std::string_view) {
    return read_le<int32_t>();
}

Variant BinaryDecoder::read_array(std::string_view, BuiltInType type) {
    auto length = read_length();
    if (!length) return {};
    return read_elements(type, *length);
}

} // namespace ua
