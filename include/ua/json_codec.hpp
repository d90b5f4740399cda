#pragma once
#include "encoder.hpp"
#include "limits.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace ua {

enum class JsonEncoding { Reversible, NonReversible, Compact, Verbose };

std::string_view json_encoding_name(JsonEncoding encoding);
std::optional<JsonEncoding> json_encoding_from_name(std::string_view name);

/// What distinguishes the four JSON encodings. One engine reads these flags
/// instead of branching on the encoding itself.
struct JsonEncodingPolicy {
    /// Emit Type/UaType on Variants and TypeId/UaTypeId on ExtensionObjects.
    bool tag_ambiguous_values = true;
    /// Variant as bare body, LocalizedText as text, NodeId as display string.
    bool use_display_strings = false;
    /// UaType/UaTypeId/UaEncoding/UaBody names and string-form ids.
    bool short_field_names = false;
    /// Symbol next to StatusCodes, "Name_Value" for enumerations.
    bool verbose_extra_fields = false;
    bool include_default_values = false;
    bool include_default_number_values = true;

    static JsonEncodingPolicy for_encoding(JsonEncoding encoding);
};

struct JsonEncoderOptions {
    JsonEncoding encoding = JsonEncoding::Reversible;
    /// Overrides the encoding's default when set.
    std::optional<bool> include_default_values;
    std::optional<bool> include_default_number_values;
    /// Write namespace URIs instead of indices in Reversible NodeIds.
    bool force_namespace_uri = false;
    /// Root is an array; each top-level write appends one element.
    bool top_level_is_array = false;
};

class JsonEncoder : public IEncoder {
public:
    using json = nlohmann::ordered_json;

    explicit JsonEncoder(MessageContext& context, JsonEncoderOptions options = {});

    EncodingType encoding_type() const override { return EncodingType::Json; }

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

    /// Writes the ExtensionObject's members directly into the root object.
    void write_root(const ExtensionObject& value);

    const JsonEncodingPolicy& policy() const { return policy_; }
    const json& document() const { return root_; }
    std::string to_string() const;

private:
    void put(std::string_view field, json value);
    /// True when a default value must be left out of the current object.
    bool omit(std::string_view field, bool is_default, bool numeric) const;

    template <typename T> json to_json_value(const T& value);
    /// Writes value under field unless the policy omits it as a default.
    template <typename T> void write_field(std::string_view field, const T& value, bool numeric);
    json node_id_to_json(const NodeId& value);
    json expanded_node_id_to_json(const ExpandedNodeId& value);
    json status_code_to_json(StatusCode value) const;
    json qualified_name_to_json(const QualifiedName& value);
    json localized_text_to_json(const LocalizedText& value) const;
    json elements_to_json(const Variant& values);
    json variant_to_json(const Variant& value);
    void variant_members(json& object, const Variant& value);
    json data_value_to_json(const DataValue& value);
    json extension_object_to_json(const ExtensionObject& value);
    json encodeable_to_json(const IEncodeable& value);
    json diagnostic_info_to_json(const DiagnosticInfo& value, size_t depth);
    /// Text form with the namespace written as a URI where one is known.
    std::string display_form(const NodeId& value) const;

    JsonEncoderOptions options_;
    JsonEncodingPolicy policy_;
    json root_;
    std::vector<json*> stack_;
    LimitsGuard guard_;
};

/// Reads Reversible, Compact or Verbose JSON. NonReversible output carries no
/// type information and is rejected with NotSupportedError.
class JsonDecoder : public IDecoder {
public:
    using json = nlohmann::ordered_json;

    /// Parses text; malformed JSON raises DecodingError.
    JsonDecoder(std::string_view text, MessageContext& context,
                JsonEncoding encoding = JsonEncoding::Reversible);

    EncodingType encoding_type() const override { return EncodingType::Json; }

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

    /// Reads the root object as an ExtensionObject.
    ExtensionObject read_root();

    const json& document() const { return root_; }

private:
    struct Frame {
        const json* node;
        size_t next_index;
    };

    /// Value of a field in the current object, or the next element when the
    /// current node is an array. nullptr when absent or JSON null.
    const json* field_value(std::string_view field);
    template <typename T> T read_field(std::string_view field);

    template <typename T> T from_json_value(const json& value);
    NodeId node_id_from_json(const json& value);
    ExpandedNodeId expanded_node_id_from_json(const json& value);
    StatusCode status_code_from_json(const json& value) const;
    QualifiedName qualified_name_from_json(const json& value);
    LocalizedText localized_text_from_json(const json& value) const;
    Variant elements_from_json(const json& values, BuiltInType type);
    Variant variant_from_json(const json& value);
    Variant variant_from_members(const json& object, const char* type_key, const char* body_key);
    DataValue data_value_from_json(const json& value);
    ExtensionObject extension_object_from_json(const json& value);
    void encodeable_from_json(const json& value, IEncodeable& target);
    DiagnosticInfo diagnostic_info_from_json(const json& value, size_t depth);
    uint16_t namespace_index_from_json(const json& value);

    JsonEncoding encoding_;
    JsonEncodingPolicy policy_;
    json root_;
    std::vector<Frame> stack_;
    LimitsGuard guard_;
};

} // namespace ua
