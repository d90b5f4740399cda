#pragma once
#include "encoder.hpp"
#include "limits.hpp"
#include "version.hpp"
#include <libxml/tree.h>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace ua {

struct XmlDocDeleter {
    void operator()(xmlDoc* doc) const { xmlFreeDoc(doc); }
};
using XmlDocPtr = std::unique_ptr<xmlDoc, XmlDocDeleter>;

/// OPC UA XML: built-in values live in the Types.xsd namespace, structure
/// fields in the namespace of the structure being written.
class XmlEncoder : public IEncoder {
public:
    explicit XmlEncoder(MessageContext& context, const std::string& root_name = "ExtensionObject");

    EncodingType encoding_type() const override { return EncodingType::Xml; }

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

    /// Writes TypeId and Body directly under the root element.
    void write_root(const ExtensionObject& value);

    /// Serialized document, UTF-8 with an XML declaration.
    std::string to_string() const;

private:
    /// Type-specific content of a value written into an existing element.
    template <typename T> void write_content(xmlNodePtr node, const T& value);
    xmlNodePtr add_element(xmlNodePtr parent, std::string_view name, const std::string& ns_uri,
                           const std::string* text = nullptr);
    xmlNodePtr add_field(std::string_view name, const std::string* text = nullptr);
    xmlNodePtr add_builtin(xmlNodePtr parent, std::string_view name, const std::string* text = nullptr);
    template <typename T> void write_field(std::string_view field, const T& value);
    void write_list(xmlNodePtr node, const Variant& values);
    void write_variant_content(xmlNodePtr node, const Variant& value);
    void write_extension_object_content(xmlNodePtr node, const ExtensionObject& value);
    void write_diagnostic_info_content(xmlNodePtr node, const DiagnosticInfo& value, size_t depth);

    XmlDocPtr doc_;
    xmlNodePtr current_;
    LimitsGuard guard_;
    int prefix_counter_ = 0;
};

/// Reads OPC UA XML. Fields are matched by local name in document order;
/// unknown elements are skipped.
class XmlDecoder : public IDecoder {
public:
    XmlDecoder(std::string_view xml, MessageContext& context);

    EncodingType encoding_type() const override { return EncodingType::Xml; }

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

    /// Local name of the document element.
    std::string root_name() const;
    /// Reads TypeId and Body directly under the root element.
    ExtensionObject read_root();

private:
    struct Frame {
        xmlNodePtr parent;
        xmlNodePtr cursor;
    };

    /// Next element child named name, scanning forward from the cursor.
    /// Returns nullptr when absent and not required.
    xmlNodePtr next_field(std::string_view name, bool required);
    template <typename T> T read_field(std::string_view field);
    template <typename T> T read_content(xmlNodePtr node);
    Variant read_list(xmlNodePtr node, BuiltInType type);
    Variant read_variant_content(xmlNodePtr node);
    ExtensionObject read_extension_object_content(xmlNodePtr node);
    DiagnosticInfo read_diagnostic_info_content(xmlNodePtr node, size_t depth);

    XmlDocPtr doc_;
    std::vector<Frame> frames_;
    LimitsGuard guard_;
};

} // namespace ua
