#pragma once
#include "encoder.hpp"
#include "limits.hpp"
#include <cstdint>
#include <vector>

namespace ua {

/// OPC UA Binary: little-endian, length-prefixed, no field names.
class BinaryEncoder : public IEncoder {
public:
    explicit BinaryEncoder(MessageContext& context);

    EncodingType encoding_type() const override { return EncodingType::Binary; }

    void write_boolean(std::string_view field, bool value) override;
    void write_sbyte(std::string_view field, int8_t value) override;
    void write_byte(std::string_view field, uint8_t value) override;
    void write_int16(std::string_view field, int16_t value) override;
    void write_uint16(std::string_view field, uint16_t value) override;
    void write_int32(std::string_view field, int32_t value) override;
    void write_uint32(std::string_view field, uint32_t value) override;
    void write_int64(std::string_view field, int64_t value) override;
    void write_uint64(std::string_view field, uint64_t value) override;
    void write_float(std::string_view field, float value) override;
    void write_double(std::string_view field, double value) override;
    void write_string(std::string_view field, const std::string& value) override;
    void write_datetime(std::string_view field, DateTime value) override;
    void write_guid(std::string_view field, const Guid& value) override;
    void write_byte_string(std::string_view field, const ByteString& value) override;
    void write_xml_element(std::string_view field, const XmlElement& value) override;
    void write_node_id(std::string_view field, const NodeId& value) override;
    void write_expanded_node_id(std::string_view field, const ExpandedNodeId& value) override;
    void write_status_code(std::string_view field, StatusCode value) override;
    void write_qualified_name(std::string_view field, const QualifiedName& value) override;
    void write_localized_text(std::string_view field, const LocalizedText& value) override;
    void write_extension_object(std::string_view field, const ExtensionObject& value) override;
    void write_data_value(std::string_view field, const DataValue& value) override;
    void write_variant(std::string_view field, const Variant& value) override;
    void write_diagnostic_info(std::string_view field, const DiagnosticInfo& value) override;
    void write_encodeable(std::string_view field, const IEncodeable& value) override;
    void write_enumerated(std::string_view field, int32_t value, std::string_view symbol = {}) override;
    void write_array(std::string_view field, const Variant& values) override;
    using IEncoder::write_array;

    const std::vector<uint8_t>& buffer() const { return buffer_; }
    std::vector<uint8_t> release() { return std::move(buffer_); }
    size_t position() const { return buffer_.size(); }

private:
    template <typename T> void write_le(T value);
    void write_raw(const uint8_t* data, size_t size);
    void write_length(size_t length);
    void write_node_id_body(const NodeId& value, uint8_t flags);
    void write_elements(const Variant& values);
    void write_diagnostic_info(const DiagnosticInfo& value, size_t depth);

    std::vector<uint8_t> buffer_;
    LimitsGuard guard_;
};

/// Reads OPC UA Binary from a caller-owned buffer.
class BinaryDecoder : public IDecoder {
public:
    BinaryDecoder(const uint8_t* data, size_t size, MessageContext& context);
    BinaryDecoder(const std::vector<uint8_t>& data, MessageContext& context)
        : BinaryDecoder(data.data(), data.size(), context) {}

    EncodingType encoding_type() const override { return EncodingType::Binary; }

    bool read_boolean(std::string_view field) override;
    int8_t read_sbyte(std::string_view field) override;
    uint8_t read_byte(std::string_view field) override;
    int16_t read_int16(std::string_view field) override;
    uint16_t read_uint16(std::string_view field) override;
    int32_t read_int32(std::string_view field) override;
    uint32_t read_uint32(std::string_view field) override;
    int64_t read_int64(std::string_view field) override;
    uint64_t read_uint64(std::string_view field) override;
    float read_float(std::string_view field) override;
    double read_double(std::string_view field) override;
    std::string read_string(std::string_view field) override;
    DateTime read_datetime(std::string_view field) override;
    Guid read_guid(std::string_view field) override;
    ByteString read_byte_string(std::string_view field) override;
    XmlElement read_xml_element(std::string_view field) override;
    NodeId read_node_id(std::string_view field) override;
    ExpandedNodeId read_expanded_node_id(std::string_view field) override;
    StatusCode read_status_code(std::string_view field) override;
    QualifiedName read_qualified_name(std::string_view field) override;
    LocalizedText read_localized_text(std::string_view field) override;
    ExtensionObject read_extension_object(std::string_view field) override;
    DataValue read_data_value(std::string_view field) override;
    Variant read_variant(std::string_view field) override;
    DiagnosticInfo read_diagnostic_info(std::string_view field) override;
    void read_encodeable(std::string_view field, IEncodeable& value) override;
    int32_t read_enumerated(std::string_view field) override;
    Variant read_array(std::string_view field, BuiltInType type) override;
    using IDecoder::read_array;

    size_t position() const { return pos_; }
    size_t remaining() const { return end_ - pos_; }

private:
    template <typename T> T read_le();
    const uint8_t* take(size_t size);
    /// Int32 length prefix; nullopt for a negative (null) length.
    std::optional<size_t> read_length();
    NodeId read_node_id_body(uint8_t encoding);
    Variant read_elements(BuiltInType type, size_t count);
    DiagnosticInfo read_diagnostic_info(size_t depth);

    const uint8_t* data_;
    size_t pos_ = 0;
    size_t end_;
    LimitsGuard guard_;
};

} // namespace ua
