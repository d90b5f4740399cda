#pragma once
#include "context.hpp"
#include "encodeable.hpp"
#include "variant.hpp"
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace ua {

/// Field-by-field writer implemented by every wire format. Field names are
/// ignored by the binary format and name elements or keys in XML and JSON.
class IEncoder {
public:
    explicit IEncoder(MessageContext& context) : context_(context) {}
    virtual ~IEncoder() = default;
    IEncoder(const IEncoder&) = delete;
    IEncoder& operator=(const IEncoder&) = delete;

    virtual EncodingType encoding_type() const = 0;
    MessageContext& context() { return context_; }

    /// Namespace of the structure whose fields follow. Use NamespaceScope to
    /// keep pushes and pops balanced.
    void push_namespace(std::string uri) { namespaces_.push(std::move(uri)); }
    void pop_namespace() { namespaces_.pop(); }

    virtual void write_boolean(std::string_view field, bool value) = 0;
    virtual void write_sbyte(std::string_view field, int8_t value) = 0;
    virtual void write_byte(std::string_view field, uint8_t value) = 0;
    virtual void write_int16(std::string_view field, int16_t value) = 0;
    virtual void write_uint16(std::string_view field, uint16_t value) = 0;
    virtual void write_int32(std::string_view field, int32_t value) = 0;
    virtual void write_uint32(std::string_view field, uint32_t value) = 0;
    virtual void write_int64(std::string_view field, int64_t value) = 0;
    virtual void write_uint64(std::string_view field, uint64_t value) = 0;
    virtual void write_float(std::string_view field, float value) = 0;
    virtual void write_double(std::string_view field, double value) = 0;
    virtual void write_string(std::string_view field, const std::string& value) = 0;
    virtual void write_datetime(std::string_view field, DateTime value) = 0;
    virtual void write_guid(std::string_view field, const Guid& value) = 0;
    virtual void write_byte_string(std::string_view field, const ByteString& value) = 0;
    virtual void write_xml_element(std::string_view field, const XmlElement& value) = 0;
    virtual void write_node_id(std::string_view field, const NodeId& value) = 0;
    virtual void write_expanded_node_id(std::string_view field, const ExpandedNodeId& value) = 0;
    virtual void write_status_code(std::string_view field, StatusCode value) = 0;
    virtual void write_qualified_name(std::string_view field, const QualifiedName& value) = 0;
    virtual void write_localized_text(std::string_view field, const LocalizedText& value) = 0;
    virtual void write_extension_object(std::string_view field, const ExtensionObject& value) = 0;
    virtual void write_data_value(std::string_view field, const DataValue& value) = 0;
    virtual void write_variant(std::string_view field, const Variant& value) = 0;
    virtual void write_diagnostic_info(std::string_view field, const DiagnosticInfo& value) = 0;

    /// Nested structure written inline, without an ExtensionObject envelope.
    virtual void write_encodeable(std::string_view field, const IEncodeable& value) = 0;
    /// symbol is used by the text encodings that print enumeration names.
    virtual void write_enumerated(std::string_view field, int32_t value, std::string_view symbol = {}) = 0;
    /// One-dimensional array held by a Variant. A null Variant writes a null
    /// array. Throws EncodingError for a matrix.
    virtual void write_array(std::string_view field, const Variant& values) = 0;

    template <typename T>
    void write_array(std::string_view field, const std::vector<T>& values) {
        write_array(field, Variant::from_array(values));
    }

    /// Dispatches to the write_* method for T.
    template <typename T>
    void write(std::string_view field, const T& value);

protected:
    const std::string& current_namespace(const std::string& fallback) const {
        return namespaces_.current(fallback);
    }
    size_t namespace_depth() const { return namespaces_.depth(); }

    MessageContext& context_;

private:
    NamespaceStack namespaces_;
};

/// Field-by-field reader implemented by every wire format. Reads must follow
/// the order of the matching writes.
class IDecoder {
public:
    explicit IDecoder(MessageContext& context) : context_(context) {}
    virtual ~IDecoder() = default;
    IDecoder(const IDecoder&) = delete;
    IDecoder& operator=(const IDecoder&) = delete;

    virtual EncodingType encoding_type() const = 0;
    MessageContext& context() { return context_; }

    void push_namespace(std::string uri) { namespaces_.push(std::move(uri)); }
    void pop_namespace() { namespaces_.pop(); }

    virtual bool read_boolean(std::string_view field) = 0;
    virtual int8_t read_sbyte(std::string_view field) = 0;
    virtual uint8_t read_byte(std::string_view field) = 0;
    virtual int16_t read_int16(std::string_view field) = 0;
    virtual uint16_t read_uint16(std::string_view field) = 0;
    virtual int32_t read_int32(std::string_view field) = 0;
    virtual uint32_t read_uint32(std::string_view field) = 0;
    virtual int64_t read_int64(std::string_view field) = 0;
    virtual uint64_t read_uint64(std::string_view field) = 0;
    virtual float read_float(std::string_view field) = 0;
    virtual double read_double(std::string_view field) = 0;
    virtual std::string read_string(std::string_view field) = 0;
    virtual DateTime read_datetime(std::string_view field) = 0;
    virtual Guid read_guid(std::string_view field) = 0;
    virtual ByteString read_byte_string(std::string_view field) = 0;
    virtual XmlElement read_xml_element(std::string_view field) = 0;
    virtual NodeId read_node_id(std::string_view field) = 0;
    virtual ExpandedNodeId read_expanded_node_id(std::string_view field) = 0;
    virtual StatusCode read_status_code(std::string_view field) = 0;
    virtual QualifiedName read_qualified_name(std::string_view field) = 0;
    virtual LocalizedText read_localized_text(std::string_view field) = 0;
    virtual ExtensionObject read_extension_object(std::string_view field) = 0;
    virtual DataValue read_data_value(std::string_view field) = 0;
    virtual Variant read_variant(std::string_view field) = 0;
    virtual DiagnosticInfo read_diagnostic_info(std::string_view field) = 0;

    virtual void read_encodeable(std::string_view field, IEncodeable& value) = 0;
    virtual int32_t read_enumerated(std::string_view field) = 0;
    /// Null Variant for a null array, otherwise a 1-D array of the given type.
    virtual Variant read_array(std::string_view field, BuiltInType type) = 0;

    template <typename T>
    std::vector<T> read_array(std::string_view field) {
        Variant v = read_array(field, BuiltInTypeOf<T>::value);
        if (v.is_null()) return {};
        return v.array<T>();
    }

    /// Dispatches to the read_* method for T.
    template <typename T>
    T read(std::string_view field);

protected:
    const std::string& current_namespace(const std::string& fallback) const {
        return namespaces_.current(fallback);
    }
    size_t namespace_depth() const { return namespaces_.depth(); }

    MessageContext& context_;

private:
    NamespaceStack namespaces_;
};

template <typename T>
void IEncoder::write(std::string_view field, const T& value) {
    if constexpr (std::is_same_v<T, bool>) write_boolean(field, value);
    else if constexpr (std::is_same_v<T, int8_t>) write_sbyte(field, value);
    else if constexpr (std::is_same_v<T, uint8_t>) write_byte(field, value);
    else if constexpr (std::is_same_v<T, int16_t>) write_int16(field, value);
    else if constexpr (std::is_same_v<T, uint16_t>) write_uint16(field, value);
    else if constexpr (std::is_same_v<T, int32_t>) write_int32(field, value);
    else if constexpr (std::is_same_v<T, uint32_t>) write_uint32(field, value);
    else if constexpr (std::is_same_v<T, int64_t>) write_int64(field, value);
    else if constexpr (std::is_same_v<T, uint64_t>) write_uint64(field, value);
    else if constexpr (std::is_same_v<T, float>) write_float(field, value);
    else if constexpr (std::is_same_v<T, double>) write_double(field, value);
    else if constexpr (std::is_same_v<T, std::string>) write_string(field, value);
    else if constexpr (std::is_same_v<T, DateTime>) write_datetime(field, value);
    else if constexpr (std::is_same_v<T, Guid>) write_guid(field, value);
    else if constexpr (std::is_same_v<T, ByteString>) write_byte_string(field, value);
    else if constexpr (std::is_same_v<T, XmlElement>) write_xml_element(field, value);
    else if constexpr (std::is_same_v<T, NodeId>) write_node_id(field, value);
    else if constexpr (std::is_same_v<T, ExpandedNodeId>) write_expanded_node_id(field, value);
    else if constexpr (std::is_same_v<T, StatusCode>) write_status_code(field, value);
    else if constexpr (std::is_same_v<T, QualifiedName>) write_qualified_name(field, value);
    else if constexpr (std::is_same_v<T, LocalizedText>) write_localized_text(field, value);
    else if constexpr (std::is_same_v<T, ExtensionObject>) write_extension_object(field, value);
    else if constexpr (std::is_same_v<T, DataValue>) write_data_value(field, value);
    else if constexpr (std::is_same_v<T, Variant>) write_variant(field, value);
    else if constexpr (std::is_same_v<T, DiagnosticInfo>) write_diagnostic_info(field, value);
    else static_assert(!sizeof(T*), "not a built-in type");
}

template <typename T>
T IDecoder::read(std::string_view field) {
    if constexpr (std::is_same_v<T, bool>) return read_boolean(field);
    else if constexpr (std::is_same_v<T, int8_t>) return read_sbyte(field);
    else if constexpr (std::is_same_v<T, uint8_t>) return read_byte(field);
    else if constexpr (std::is_same_v<T, int16_t>) return read_int16(field);
    else if constexpr (std::is_same_v<T, uint16_t>) return read_uint16(field);
    else if constexpr (std::is_same_v<T, int32_t>) return read_int32(field);
    else if constexpr (std::is_same_v<T, uint32_t>) return read_uint32(field);
    else if constexpr (std::is_same_v<T, int64_t>) return read_int64(field);
    else if constexpr (std::is_same_v<T, uint64_t>) return read_uint64(field);
    else if constexpr (std::is_same_v<T, float>) return read_float(field);
    else if constexpr (std::is_same_v<T, double>) return read_double(field);
    else if constexpr (std::is_same_v<T, std::string>) return read_string(field);
    else if constexpr (std::is_same_v<T, DateTime>) return read_datetime(field);
    else if constexpr (std::is_same_v<T, Guid>) return read_guid(field);
    else if constexpr (std::is_same_v<T, ByteString>) return read_byte_string(field);
    else if constexpr (std::is_same_v<T, XmlElement>) return read_xml_element(field);
    else if constexpr (std::is_same_v<T, NodeId>) return read_node_id(field);
    else if constexpr (std::is_same_v<T, ExpandedNodeId>) return read_expanded_node_id(field);
    else if constexpr (std::is_same_v<T, StatusCode>) return read_status_code(field);
    else if constexpr (std::is_same_v<T, QualifiedName>) return read_qualified_name(field);
    else if constexpr (std::is_same_v<T, LocalizedText>) return read_localized_text(field);
    else if constexpr (std::is_same_v<T, ExtensionObject>) return read_extension_object(field);
    else if constexpr (std::is_same_v<T, DataValue>) return read_data_value(field);
    else if constexpr (std::is_same_v<T, Variant>) return read_variant(field);
    else if constexpr (std::is_same_v<T, DiagnosticInfo>) return read_diagnostic_info(field);
    else static_assert(!sizeof(T*), "not a built-in type");
}

} // namespace ua
