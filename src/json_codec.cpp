#include "ua/json_codec.hpp"
#include "text_util.hpp"
#include <simdjson.h>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cfloat>
#include <cmath>
#include <limits>

namespace ua {

using json = nlohmann::ordered_json;

namespace {

constexpr const char* MIN_DATETIME_TEXT = "0001-01-01T00:00:00Z";
constexpr const char* MAX_DATETIME_TEXT = "9999-12-31T23:59:59Z";

/// Longest JSON string a field may carry: a String, or the base64 text of a
/// ByteString. Zero when either limit is disabled.
size_t text_ceiling(const EncodingLimits& limits) {
    if (limits.max_string_length == 0 || limits.max_byte_string_length == 0) return 0;
    size_t base64 = (size_t{limits.max_byte_string_length} + 2) / 3 * 4;
    return std::max<size_t>(limits.max_string_length, base64);
}

/// Builds the ordered_json tree from a simdjson on-demand document. Container
/// depth, array size and string size are bounded while walking, so a hostile
/// document is refused before it is materialized.
class DocumentBuilder {
public:
    explicit DocumentBuilder(const EncodingLimits& limits)
        : guard_(limits),
          max_text_(text_ceiling(limits)),
          // One codec nesting level spans a few JSON containers (Variant, Body, ...).
          max_depth_(limits.max_encoding_nesting_levels == 0
                         ? 0
                         : size_t{limits.max_encoding_nesting_levels} * 4 + 1) {}

    json build(simdjson::ondemand::value val) {
        switch (val.type()) {
            case simdjson::ondemand::json_type::object: {
                Container scope(*this);
                json obj = json::object();
                for (auto field : val.get_object()) {
                    std::string_view key = field.unescaped_key();
                    check_text(key.size());
                    obj[std::string(key)] = build(field.value());
                }
                return obj;
            }
            case simdjson::ondemand::json_type::array: {
                Container scope(*this);
                json arr = json::array();
                for (auto elem : val.get_array()) {
                    guard_.check_array_length(arr.size() + 1);
                    arr.push_back(build(elem.value()));
                }
                return arr;
            }
            case simdjson::ondemand::json_type::string: {
                std::string_view sv = val.get_string();
                check_text(sv.size());
                return json(std::string(sv));
            }
            case simdjson::ondemand::json_type::number:
                return number(val);
            case simdjson::ondemand::json_type::boolean:
                return json(val.get_bool().value());
            case simdjson::ondemand::json_type::null:
                return json(nullptr);
            default:
                break;
        }
        throw DecodingError("Unexpected JSON value type");
    }

private:
    class Container {
    public:
        explicit Container(DocumentBuilder& builder) : builder_(builder) {
            if (builder_.max_depth_ != 0 && builder_.depth_ >= builder_.max_depth_) {
                throw EncodingLimitsExceeded("JSON document nesting exceeds "
                                             + std::to_string(builder_.max_depth_) + " levels");
            }
            ++builder_.depth_;
        }
        ~Container() { --builder_.depth_; }
        Container(const Container&) = delete;
        Container& operator=(const Container&) = delete;

    private:
        DocumentBuilder& builder_;
    };

    void check_text(size_t size) const {
        if (max_text_ != 0 && size > max_text_) {
            throw EncodingLimitsExceeded("JSON string of " + std::to_string(size)
                                         + " bytes exceeds the limit of " + std::to_string(max_text_));
        }
    }

    // Integers keep their exact value; everything else is a double.
    static json number(simdjson::ondemand::value val) {
        auto as_int = val.get_int64();
        if (as_int.error() == simdjson::SUCCESS) return json(as_int.value());
        auto as_uint = val.get_uint64();
        if (as_uint.error() == simdjson::SUCCESS) return json(as_uint.value());
        return json(val.get_double().value());
    }

    LimitsGuard guard_;
    size_t max_text_;
    size_t max_depth_;
    size_t depth_ = 0;
};

json parse_json(std::string_view text, const EncodingLimits& limits) {
    simdjson::ondemand::parser parser;
    simdjson::padded_string padded(text.data(), text.size());

    simdjson::ondemand::document doc;
    auto error = parser.iterate(padded).get(doc);
    if (error) {
        throw DecodingError(std::string("JSON parse error: ") + simdjson::error_message(error));
    }

    try {
        auto val = doc.get_value();
        if (val.error()) {
            throw DecodingError(std::string("JSON parse error: ") + simdjson::error_message(val.error()));
        }
        json j = DocumentBuilder(limits).build(val.value());
        if (!doc.at_end()) throw DecodingError("Trailing content after the JSON document");
        return j;
    } catch (const simdjson::simdjson_error& e) {
        throw DecodingError(std::string("JSON parse error: ") + e.what());
    }
}

template <typename T>
bool is_default(const T& value) {
    if constexpr (std::is_same_v<T, bool>) {
        return !value;
    } else if constexpr (std::is_arithmetic_v<T>) {
        return value == T{};
    } else if constexpr (std::is_same_v<T, std::string> || std::is_same_v<T, ByteString>
                         || std::is_same_v<T, XmlElement>) {
        return value.empty();
    } else if constexpr (std::is_same_v<T, DateTime>) {
        return value.is_min();
    } else if constexpr (std::is_same_v<T, StatusCode>) {
        return value.code == status::Good;
    } else {
        return value.is_null();
    }
}

std::string float_text(double value) {
    if (std::isnan(value)) return "NaN";
    return value > 0 ? "Infinity" : "-Infinity";
}

template <typename T>
T integer_from_json(const json& v) {
    if (v.is_string()) {
        auto parsed = detail::parse_integer<T>(v.get_ref<const std::string&>());
        if (!parsed) throw DecodingError("Invalid integer '" + v.get_ref<const std::string&>() + "'");
        return *parsed;
    }
    if (v.is_number_unsigned()) {
        uint64_t u = v.get<uint64_t>();
        if (u > static_cast<uint64_t>(std::numeric_limits<T>::max())) {
            throw DecodingError("Integer value out of range");
        }
        return static_cast<T>(u);
    }
    if (v.is_number_integer()) {
        int64_t s = v.get<int64_t>();
        if constexpr (std::is_unsigned_v<T>) {
            if (s < 0 || static_cast<uint64_t>(s) > std::numeric_limits<T>::max()) {
                throw DecodingError("Integer value out of range");
            }
        } else {
            if (s < std::numeric_limits<T>::min() || s > std::numeric_limits<T>::max()) {
                throw DecodingError("Integer value out of range");
            }
        }
        return static_cast<T>(s);
    }
    throw DecodingError("Expected an integer, got " + std::string(v.type_name()));
}

const std::string& string_from_json(const json& v, const char* what) {
    if (!v.is_string()) throw DecodingError(std::string("Expected a string for ") + what);
    return v.get_ref<const std::string&>();
}

const json* member(const json& object, const char* key) {
    auto it = object.find(key);
    if (it == object.end() || it->is_null()) return nullptr;
    return &*it;
}

/// Regroups a flat element list into nested arrays, outermost dimension first.
json nest_elements(const json& flat, const std::vector<int32_t>& dims, size_t level, size_t& offset) {
    json out = json::array();
    for (int32_t i = 0; i < dims[level]; ++i) {
        if (level + 1 == dims.size()) {
            out.push_back(flat[offset++]);
        } else {
            out.push_back(nest_elements(flat, dims, level + 1, offset));
        }
    }
    return out;
}

/// Pops a pointer stack entry pushed for a nested object.
template <typename Stack>
struct StackGuard {
    Stack& stack;
    ~StackGuard() { stack.pop_back(); }
};

} // anonymous namespace

std::string_view json_encoding_name(JsonEncoding encoding) {
    switch (encoding) {
        case JsonEncoding::Reversible:    return "Reversible";
        case JsonEncoding::NonReversible: return "NonReversible";
        case JsonEncoding::Compact:       return "Compact";
        case JsonEncoding::Verbose:       return "Verbose";
    }
    return {};
}

std::optional<JsonEncoding> json_encoding_from_name(std::string_view name) {
    for (auto e : {JsonEncoding::Reversible, JsonEncoding::NonReversible, JsonEncoding::Compact,
                   JsonEncoding::Verbose}) {
        if (json_encoding_name(e) == name) return e;
    }
    return std::nullopt;
}

JsonEncodingPolicy JsonEncodingPolicy::for_encoding(JsonEncoding encoding) {
    JsonEncodingPolicy p;
    switch (encoding) {
        case JsonEncoding::Reversible:
            break;
        case JsonEncoding::Compact:
            p.short_field_names = true;
            p.include_default_number_values = false;
            break;
        case JsonEncoding::Verbose:
            p.short_field_names = true;
            p.verbose_extra_fields = true;
            p.include_default_values = true;
            p.include_default_number_values = true;
            break;
        case JsonEncoding::NonReversible:
            p.tag_ambiguous_values = false;
            p.use_display_strings = true;
            p.verbose_extra_fields = true;
            p.include_default_values = true;
            p.include_default_number_values = true;
            break;
    }
    return p;
}

// ==================== JsonEncoder ====================

JsonEncoder::JsonEncoder(MessageContext& context, JsonEncoderOptions options)
    : IEncoder(context),
      options_(options),
      policy_(JsonEncodingPolicy::for_encoding(options.encoding)),
      root_(options.top_level_is_array ? json::array() : json::object()),
      guard_(context.limits) {
    if (options_.include_default_values) policy_.include_default_values = *options_.include_default_values;
    if (options_.include_default_number_values) {
        policy_.include_default_number_values = *options_.include_default_number_values;
    }
    stack_.push_back(&root_);
}

void JsonEncoder::put(std::string_view field, json value) {
    json& target = *stack_.back();
    if (target.is_array()) {
        target.push_back(std::move(value));
    } else {
        target[std::string(field)] = std::move(value);
    }
}

bool JsonEncoder::omit(std::string_view field, bool is_default, bool numeric) const {
    if (!is_default || field.empty() || stack_.back()->is_array()) return false;
    return numeric ? !policy_.include_default_number_values : !policy_.include_default_values;
}

std::string JsonEncoder::display_form(const NodeId& value) const {
    return context_.to_absolute(ExpandedNodeId(value)).to_string();
}

template <typename T>
json JsonEncoder::to_json_value(const T& value) {
    if constexpr (std::is_same_v<T, bool>) {
        return value;
    } else if constexpr (std::is_same_v<T, int64_t> || std::is_same_v<T, uint64_t>) {
        return std::to_string(value);
    } else if constexpr (std::is_integral_v<T> && std::is_signed_v<T>) {
        return static_cast<int64_t>(value);
    } else if constexpr (std::is_integral_v<T>) {
        return static_cast<uint64_t>(value);
    } else if constexpr (std::is_same_v<T, float>) {
        if (!std::isfinite(value)) return float_text(value);
        return *detail::parse_double(detail::format_float(value));
    } else if constexpr (std::is_same_v<T, double>) {
        if (!std::isfinite(value)) return float_text(value);
        return value;
    } else if constexpr (std::is_same_v<T, std::string>) {
        guard_.check_string_length(value.size());
        return value;
    } else if constexpr (std::is_same_v<T, DateTime>) {
        if (value.is_min()) return MIN_DATETIME_TEXT;
        if (value.is_max()) return MAX_DATETIME_TEXT;
        return value.to_iso8601();
    } else if constexpr (std::is_same_v<T, Guid>) {
        return value.to_string();
    } else if constexpr (std::is_same_v<T, ByteString>) {
        guard_.check_byte_string_length(value.size());
        return detail::base64_encode(value.bytes(), value.size());
    } else if constexpr (std::is_same_v<T, XmlElement>) {
        guard_.check_byte_string_length(value.xml.size());
        return value.xml;
    } else if constexpr (std::is_same_v<T, NodeId>) {
        return node_id_to_json(value);
    } else if constexpr (std::is_same_v<T, ExpandedNodeId>) {
        return expanded_node_id_to_json(value);
    } else if constexpr (std::is_same_v<T, StatusCode>) {
        return status_code_to_json(value);
    } else if constexpr (std::is_same_v<T, QualifiedName>) {
        return qualified_name_to_json(value);
    } else if constexpr (std::is_same_v<T, LocalizedText>) {
        return localized_text_to_json(value);
    } else if constexpr (std::is_same_v<T, ExtensionObject>) {
        return extension_object_to_json(value);
    } else if constexpr (std::is_same_v<T, DataValue>) {
        return data_value_to_json(value);
    } else if constexpr (std::is_same_v<T, Variant>) {
        return variant_to_json(value);
    } else if constexpr (std::is_same_v<T, DiagnosticInfo>) {
        return diagnostic_info_to_json(value, 0);
    } else {
        static_assert(!sizeof(T*), "not a built-in type");
    }
}

json JsonEncoder::node_id_to_json(const NodeId& value) {
    if (policy_.short_field_names || policy_.use_display_strings) return display_form(value);

    json obj = json::object();
    if (value.id_type() != IdType::Numeric) obj["IdType"] = static_cast<int>(value.id_type());
    std::visit([&](const auto& id) {
        using Id = std::decay_t<decltype(id)>;
        if constexpr (std::is_same_v<Id, uint32_t>) {
            obj["Id"] = id;
        } else {
            obj["Id"] = to_json_value(id);
        }
    }, value.identifier);
    if (value.namespace_index != 0) {
        auto uri = context_.namespace_uris.uri_at(value.namespace_index);
        if (options_.force_namespace_uri && uri && !uri->empty()) {
            obj["Namespace"] = *uri;
        } else {
            obj["Namespace"] = value.namespace_index;
        }
    }
    return obj;
}

json JsonEncoder::expanded_node_id_to_json(const ExpandedNodeId& value) {
    if (policy_.use_display_strings) return context_.to_absolute(value).to_string();
    if (policy_.short_field_names) return value.to_string();

    ExpandedNodeId id = options_.force_namespace_uri ? context_.to_absolute(value) : value;
    json obj = json::object();
    if (id.node_id.id_type() != IdType::Numeric) obj["IdType"] = static_cast<int>(id.node_id.id_type());
    std::visit([&](const auto& ident) {
        using Id = std::decay_t<decltype(ident)>;
        if constexpr (std::is_same_v<Id, uint32_t>) {
            obj["Id"] = ident;
        } else {
            obj["Id"] = to_json_value(ident);
        }
    }, id.node_id.identifier);
    if (!id.namespace_uri.empty()) {
        obj["Namespace"] = id.namespace_uri;
    } else if (id.node_id.namespace_index != 0) {
        obj["Namespace"] = id.node_id.namespace_index;
    }
    if (id.server_index != 0) obj["ServerUri"] = id.server_index;
    return obj;
}

json JsonEncoder::status_code_to_json(StatusCode value) const {
    if (!policy_.short_field_names && !policy_.verbose_extra_fields) return value.code;
    json obj = json::object();
    if (value.code != status::Good || policy_.include_default_number_values) obj["Code"] = value.code;
    if (policy_.verbose_extra_fields) {
        auto symbol = status_symbol(value);
        if (!symbol.empty()) obj["Symbol"] = std::string(symbol);
    }
    return obj;
}

json JsonEncoder::qualified_name_to_json(const QualifiedName& value) {
    guard_.check_string_length(value.name.size());
    if (policy_.short_field_names || policy_.use_display_strings) return value.to_string();
    json obj = json::object();
    if (!value.name.empty()) obj["Name"] = value.name;
    if (value.namespace_index != 0) {
        auto uri = context_.namespace_uris.uri_at(value.namespace_index);
        if (options_.force_namespace_uri && uri && !uri->empty()) {
            obj["Uri"] = *uri;
        } else {
            obj["Uri"] = value.namespace_index;
        }
    }
    return obj;
}

json JsonEncoder::localized_text_to_json(const LocalizedText& value) const {
    guard_.check_string_length(value.text.size());
    if (policy_.use_display_strings) return value.text;
    json obj = json::object();
    if (!value.locale.empty()) obj["Locale"] = value.locale;
    if (!value.text.empty()) obj["Text"] = value.text;
    return obj;
}

json JsonEncoder::elements_to_json(const Variant& values) {
    guard_.check_array_length(values.size());
    json arr = json::array();
    std::visit([&](const auto& vec) {
        using Vec = std::decay_t<decltype(vec)>;
        if constexpr (!std::is_same_v<Vec, std::monostate>) {
            for (size_t i = 0; i < vec.size(); ++i) {
                const auto& element = vec[i];
                arr.push_back(to_json_value(element));
            }
        }
    }, values.storage());
    return arr;
}

void JsonEncoder::variant_members(json& object, const Variant& value) {
    const char* type_key = policy_.short_field_names ? "UaType" : "Type";
    const char* body_key = policy_.short_field_names ? "Value" : "Body";
    object[type_key] = static_cast<int>(value.type());
    if (value.is_scalar()) {
        std::visit([&](const auto& vec) {
            using Vec = std::decay_t<decltype(vec)>;
            if constexpr (!std::is_same_v<Vec, std::monostate>) {
                const auto& scalar = vec[0];
                object[body_key] = to_json_value(scalar);
            }
        }, value.storage());
        return;
    }
    object[body_key] = elements_to_json(value);
    if (value.is_matrix()) object["Dimensions"] = value.dimensions();
}

json JsonEncoder::variant_to_json(const Variant& value) {
    if (value.is_null()) return policy_.use_display_strings ? json(nullptr) : json::object();
    if (value.is_scalar() && value.type() == BuiltInType::Variant) {
        throw EncodingError("A Variant cannot directly contain a scalar Variant");
    }
    auto nesting = guard_.enter();

    if (policy_.tag_ambiguous_values) {
        json obj = json::object();
        variant_members(obj, value);
        return obj;
    }

    if (value.is_scalar()) {
        json out;
        std::visit([&](const auto& vec) {
            using Vec = std::decay_t<decltype(vec)>;
            if constexpr (!std::is_same_v<Vec, std::monostate>) {
                const auto& scalar = vec[0];
                out = to_json_value(scalar);
            }
        }, value.storage());
        return out;
    }
    json flat = elements_to_json(value);
    if (!value.is_matrix()) return flat;
    size_t offset = 0;
    return nest_elements(flat, value.dimensions(), 0, offset);
}

json JsonEncoder::data_value_to_json(const DataValue& value) {
    auto nesting = guard_.enter();
    json obj = json::object();
    if (!value.value.is_null()) {
        if (policy_.short_field_names) {
            if (value.value.is_scalar() && value.value.type() == BuiltInType::Variant) {
                throw EncodingError("A Variant cannot directly contain a scalar Variant");
            }
            variant_members(obj, value.value);
        } else {
            obj["Value"] = variant_to_json(value.value);
        }
    }
    auto add = [&](const char* key, const auto& v, bool numeric) {
        if (!omit(key, is_default(v), numeric)) obj[key] = to_json_value(v);
    };
    add("StatusCode", value.status, false);
    add("SourceTimestamp", value.source_timestamp, false);
    add("SourcePicoseconds", value.source_picoseconds, true);
    add("ServerTimestamp", value.server_timestamp, false);
    add("ServerPicoseconds", value.server_picoseconds, true);
    return obj;
}

json JsonEncoder::encodeable_to_json(const IEncodeable& value) {
    auto nesting = guard_.enter();
    json obj = json::object();
    stack_.push_back(&obj);
    {
        StackGuard<std::vector<json*>> pop{stack_};
        value.encode(*this);
    }
    return obj;
}

json JsonEncoder::extension_object_to_json(const ExtensionObject& value) {
    if (value.is_null()) return policy_.use_display_strings ? json(nullptr) : json::object();
    auto nesting = guard_.enter();
    const char* type_key = policy_.short_field_names ? "UaTypeId" : "TypeId";
    const char* encoding_key = policy_.short_field_names ? "UaEncoding" : "Encoding";
    const char* body_key = policy_.short_field_names ? "UaBody" : "Body";

    if (const IEncodeable* body = value.encodeable()) {
        json fields = encodeable_to_json(*body);
        if (policy_.use_display_strings) return fields;
        json obj = json::object();
        obj[type_key] = node_id_to_json(context_.to_node_id(body->json_encoding_id()));
        if (policy_.short_field_names) {
            for (auto it = fields.begin(); it != fields.end(); ++it) obj[it.key()] = std::move(it.value());
        } else {
            obj[body_key] = std::move(fields);
        }
        return obj;
    }

    json body;
    int encoding = 0;
    switch (value.encoding()) {
        case ExtensionObjectEncoding::Binary:
            body = to_json_value(std::get<ByteString>(value.body));
            encoding = 1;
            break;
        case ExtensionObjectEncoding::Xml:
            body = to_json_value(std::get<XmlElement>(value.body));
            encoding = 2;
            break;
        case ExtensionObjectEncoding::Json:
            try {
                body = json::parse(std::get<JsonBody>(value.body).json);
            } catch (const json::parse_error& e) {
                throw EncodingError(std::string("ExtensionObject JSON body is not valid JSON: ") + e.what());
            }
            break;
        case ExtensionObjectEncoding::None:
        case ExtensionObjectEncoding::EncodeableObject:
            break;
    }
    if (policy_.use_display_strings) return body;

    json obj = json::object();
    if (!value.type_id.is_null()) obj[type_key] = node_id_to_json(context_.to_node_id(value.type_id));
    if (encoding != 0) obj[encoding_key] = encoding;
    if (body.is_null()) return obj;
    if (policy_.short_field_names && encoding == 0 && body.is_object()) {
        for (auto it = body.begin(); it != body.end(); ++it) obj[it.key()] = std::move(it.value());
    } else {
        obj[body_key] = std::move(body);
    }
    return obj;
}

json JsonEncoder::diagnostic_info_to_json(const DiagnosticInfo& value, size_t depth) {
    guard_.check_diagnostic_depth(depth);
    json obj = json::object();
    if (value.symbolic_id >= 0) obj["SymbolicId"] = value.symbolic_id;
    if (value.namespace_uri >= 0) obj["NamespaceUri"] = value.namespace_uri;
    if (value.locale >= 0) obj["Locale"] = value.locale;
    if (value.localized_text >= 0) obj["LocalizedText"] = value.localized_text;
    if (!value.additional_info.empty()) obj["AdditionalInfo"] = to_json_value(value.additional_info);
    if (value.inner_status_code.code != status::Good) {
        obj["InnerStatusCode"] = status_code_to_json(value.inner_status_code);
    }
    if (value.inner_diagnostic_info) {
        obj["InnerDiagnosticInfo"] = diagnostic_info_to_json(*value.inner_diagnostic_info, depth + 1);
    }
    return obj;
}

template <typename T>
void JsonEncoder::write_field(std::string_view field, const T& value, bool numeric) {
    if (omit(field, is_default(value), numeric)) return;
    put(field, to_json_value(value));
}

void JsonEncoder::write_boolean(std::string_view field, bool value) { write_field(field, value, false); }
void JsonEncoder::write_sbyte(std::string_view field, int8_t value) { write_field(field, value, true); }
void JsonEncoder::write_byte(std::string_view field, uint8_t value) { write_field(field, value, true); }
void JsonEncoder::write_int16(std::string_view field, int16_t value) { write_field(field, value, true); }
void JsonEncoder::write_uint16(std::string_view field, uint16_t value) { write_field(field, value, true); }
void JsonEncoder::write_int32(std::string_view field, int32_t value) { write_field(field, value, true); }
void JsonEncoder::write_uint32(std::string_view field, uint32_t value) { write_field(field, value, true); }
void JsonEncoder::write_int64(std::string_view field, int64_t value) { write_field(field, value, true); }
void JsonEncoder::write_uint64(std::string_view field, uint64_t value) { write_field(field, value, true); }
void JsonEncoder::write_float(std::string_view field, float value) { write_field(field, value, true); }
void JsonEncoder::write_double(std::string_view field, double value) { write_field(field, value, true); }
void JsonEncoder::write_string(std::string_view field, const std::string& value) { write_field(field, value, false); }
void JsonEncoder::write_datetime(std::string_view field, DateTime value) { write_field(field, value, false); }
void JsonEncoder::write_guid(std::string_view field, const Guid& value) { write_field(field, value, false); }
void JsonEncoder::write_byte_string(std::string_view field, const ByteString& value) { write_field(field, value, false); }
void JsonEncoder::write_xml_element(std::string_view field, const XmlElement& value) { write_field(field, value, false); }
void JsonEncoder::write_node_id(std::string_view field, const NodeId& value) { write_field(field, value, false); }
void JsonEncoder::write_expanded_node_id(std::string_view field, const ExpandedNodeId& value) { write_field(field, value, false); }
void JsonEncoder::write_status_code(std::string_view field, StatusCode value) { write_field(field, value, false); }
void JsonEncoder::write_qualified_name(std::string_view field, const QualifiedName& value) { write_field(field, value, false); }
void JsonEncoder::write_localized_text(std::string_view field, const LocalizedText& value) { write_field(field, value, false); }
void JsonEncoder::write_extension_object(std::string_view field, const ExtensionObject& value) { write_field(field, value, false); }
void JsonEncoder::write_data_value(std::string_view field, const DataValue& value) { write_field(field, value, false); }
void JsonEncoder::write_variant(std::string_view field, const Variant& value) { write_field(field, value, false); }
void JsonEncoder::write_diagnostic_info(std::string_view field, const DiagnosticInfo& value) { write_field(field, value, false); }

void JsonEncoder::write_encodeable(std::string_view field, const IEncodeable& value) {
    put(field, encodeable_to_json(value));
}

void JsonEncoder::write_enumerated(std::string_view field, int32_t value, std::string_view symbol) {
    if (omit(field, value == 0, true)) return;
    if (policy_.verbose_extra_fields && !symbol.empty()) {
        put(field, std::string(symbol) + "_" + std::to_string(value));
    } else {
        put(field, value);
    }
}

void JsonEncoder::write_array(std::string_view field, const Variant& values) {
    if (values.is_matrix() || (!values.is_null() && !values.is_array())) {
        throw EncodingError("write_array() takes a one-dimensional array");
    }
    if (values.size() == 0) {
        if (!omit(field, true, false)) put(field, json::array());
        return;
    }
    put(field, elements_to_json(values));
}

void JsonEncoder::write_root(const ExtensionObject& value) {
    json obj = extension_object_to_json(value);
    if (root_.is_array()) {
        root_.push_back(std::move(obj));
    } else {
        root_ = std::move(obj);
    }
}

std::string JsonEncoder::to_string() const {
    return root_.dump();
}

// ==================== JsonDecoder ====================

JsonDecoder::JsonDecoder(std::string_view text, MessageContext& context, JsonEncoding encoding)
    : IDecoder(context),
      encoding_(encoding),
      policy_(JsonEncodingPolicy::for_encoding(encoding)),
      guard_(context.limits) {
    if (encoding == JsonEncoding::NonReversible) {
        throw NotSupportedError("NonReversible JSON cannot be decoded");
    }
    root_ = parse_json(text, context.limits);
    stack_.push_back({&root_, 0});
}

const json* JsonDecoder::field_value(std::string_view field) {
    Frame& frame = stack_.back();
    if (frame.node->is_array()) {
        if (frame.next_index >= frame.node->size()) return nullptr;
        const json& v = (*frame.node)[frame.next_index++];
        return v.is_null() ? nullptr : &v;
    }
    if (!frame.node->is_object()) return nullptr;
    auto it = frame.node->find(std::string(field));
    if (it == frame.node->end() || it->is_null()) return nullptr;
    return &*it;
}

template <typename T>
T JsonDecoder::read_field(std::string_view field) {
    const json* v = field_value(field);
    if (!v) return T{};
    return from_json_value<T>(*v);
}

template <typename T>
T JsonDecoder::from_json_value(const json& value) {
    if constexpr (std::is_same_v<T, bool>) {
        if (!value.is_boolean()) throw DecodingError("Expected a Boolean");
        return value.get<bool>();
    } else if constexpr (std::is_integral_v<T>) {
        return integer_from_json<T>(value);
    } else if constexpr (std::is_same_v<T, float> || std::is_same_v<T, double>) {
        double d;
        if (value.is_number()) {
            d = value.get<double>();
        } else if (value.is_string()) {
            const auto& text = value.get_ref<const std::string&>();
            auto parsed = detail::parse_double(text);
            if (!parsed) throw DecodingError("Invalid floating point value '" + text + "'");
            d = *parsed;
        } else {
            throw DecodingError("Expected a number");
        }
        if constexpr (std::is_same_v<T, float>) {
            if (std::isfinite(d) && std::fabs(d) > FLT_MAX) throw DecodingError("Float value out of range");
        }
        return static_cast<T>(d);
    } else if constexpr (std::is_same_v<T, std::string>) {
        const auto& text = string_from_json(value, "String");
        guard_.check_string_length(text.size());
        return text;
    } else if constexpr (std::is_same_v<T, DateTime>) {
        const auto& text = string_from_json(value, "DateTime");
        auto parsed = DateTime::parse_iso8601(text);
        if (!parsed) throw DecodingError("Invalid DateTime value '" + text + "'");
        return *parsed;
    } else if constexpr (std::is_same_v<T, Guid>) {
        const auto& text = string_from_json(value, "Guid");
        auto parsed = Guid::parse(text);
        if (!parsed) throw DecodingError("Invalid Guid value '" + text + "'");
        return *parsed;
    } else if constexpr (std::is_same_v<T, ByteString>) {
        const std::string& text = string_from_json(value, "ByteString");
        guard_.check_byte_string_length(detail::base64_decoded_size(text));
        auto bytes = detail::base64_decode(text);
        if (!bytes) throw DecodingError("Invalid base64 content");
        return ByteString(std::move(*bytes));
    } else if constexpr (std::is_same_v<T, XmlElement>) {
        const auto& text = string_from_json(value, "XmlElement");
        guard_.check_byte_string_length(text.size());
        return XmlElement{text};
    } else if constexpr (std::is_same_v<T, NodeId>) {
        return node_id_from_json(value);
    } else if constexpr (std::is_same_v<T, ExpandedNodeId>) {
        return expanded_node_id_from_json(value);
    } else if constexpr (std::is_same_v<T, StatusCode>) {
        return status_code_from_json(value);
    } else if constexpr (std::is_same_v<T, QualifiedName>) {
        return qualified_name_from_json(value);
    } else if constexpr (std::is_same_v<T, LocalizedText>) {
        return localized_text_from_json(value);
    } else if constexpr (std::is_same_v<T, ExtensionObject>) {
        return extension_object_from_json(value);
    } else if constexpr (std::is_same_v<T, DataValue>) {
        return data_value_from_json(value);
    } else if constexpr (std::is_same_v<T, Variant>) {
        return variant_from_json(value);
    } else if constexpr (std::is_same_v<T, DiagnosticInfo>) {
        return diagnostic_info_from_json(value, 0);
    } else {
        static_assert(!sizeof(T*), "not a built-in type");
    }
}

uint16_t JsonDecoder::namespace_index_from_json(const json& value) {
    if (value.is_string()) {
        const auto& uri = value.get_ref<const std::string&>();
        if (uri.empty()) return 0;
        uint32_t index = context_.namespace_uris.get_or_append(uri);
        if (index > UINT16_MAX) throw DecodingError("Namespace table exceeds 65535 entries");
        return static_cast<uint16_t>(index);
    }
    return integer_from_json<uint16_t>(value);
}

namespace {

/// Identifier of a JSON NodeId object, by its IdType member.
template <typename Decoder>
NodeId node_id_body(const json& value, Decoder&& decode_id) {
    int id_type = 0;
    if (const json* t = member(value, "IdType")) id_type = integer_from_json<int>(*t);
    NodeId id;
    const json* v = member(value, "Id");
    switch (id_type) {
        case 0:
            id.identifier = v ? integer_from_json<uint32_t>(*v) : uint32_t{0};
            break;
        case 1:
            id.identifier = v ? decode_id(*v, IdType::String) : NodeId(0, std::string()).identifier;
            break;
        case 2:
            id.identifier = v ? decode_id(*v, IdType::Guid) : NodeId(0, Guid{}).identifier;
            break;
        case 3:
            id.identifier = v ? decode_id(*v, IdType::Opaque) : NodeId(0, ByteString()).identifier;
            break;
        default:
            throw DecodingError("Invalid NodeId IdType " + std::to_string(id_type));
    }
    return id;
}

} // anonymous namespace

NodeId JsonDecoder::node_id_from_json(const json& value) {
    if (value.is_string()) {
        ExpandedNodeId e;
        try {
            e = ExpandedNodeId::parse(value.get_ref<const std::string&>());
        } catch (const UaError& err) {
            throw DecodingError(err.what());
        }
        if (e.server_index != 0) throw DecodingError("NodeId cannot refer to another server");
        return context_.to_node_id(e);
    }
    if (!value.is_object()) throw DecodingError("Expected a NodeId object or string");

    auto decode_id = [this](const json& v, IdType type) -> decltype(NodeId::identifier) {
        switch (type) {
            case IdType::String: return from_json_value<std::string>(v);
            case IdType::Guid: return from_json_value<Guid>(v);
            default: return from_json_value<ByteString>(v);
        }
    };
    NodeId id = node_id_body(value, decode_id);
    if (const json* ns = member(value, "Namespace")) id.namespace_index = namespace_index_from_json(*ns);
    return id;
}

ExpandedNodeId JsonDecoder::expanded_node_id_from_json(const json& value) {
    if (value.is_string()) {
        try {
            return ExpandedNodeId::parse(value.get_ref<const std::string&>());
        } catch (const UaError& err) {
            throw DecodingError(err.what());
        }
    }
    if (!value.is_object()) throw DecodingError("Expected an ExpandedNodeId object or string");

    auto decode_id = [this](const json& v, IdType type) -> decltype(NodeId::identifier) {
        switch (type) {
            case IdType::String: return from_json_value<std::string>(v);
            case IdType::Guid: return from_json_value<Guid>(v);
            default: return from_json_value<ByteString>(v);
        }
    };
    ExpandedNodeId id(node_id_body(value, decode_id));
    if (const json* ns = member(value, "Namespace")) {
        if (ns->is_string()) {
            id.namespace_uri = ns->get<std::string>();
        } else {
            id.node_id.namespace_index = integer_from_json<uint16_t>(*ns);
        }
    }
    if (const json* server = member(value, "ServerUri")) {
        if (server->is_string()) {
            id.server_index = context_.server_uris.get_or_append(server->get<std::string>());
        } else {
            id.server_index = integer_from_json<uint32_t>(*server);
        }
    }
    return id;
}

StatusCode JsonDecoder::status_code_from_json(const json& value) const {
    if (value.is_object()) {
        const json* code = member(value, "Code");
        return code ? StatusCode(integer_from_json<uint32_t>(*code)) : StatusCode{};
    }
    return StatusCode(integer_from_json<uint32_t>(value));
}

QualifiedName JsonDecoder::qualified_name_from_json(const json& value) {
    QualifiedName q;
    if (value.is_string()) {
        const auto& text = value.get_ref<const std::string&>();
        guard_.check_string_length(text.size());
        auto colon = text.find(':');
        if (colon != std::string::npos && colon > 0) {
            if (auto ns = detail::parse_integer<uint16_t>(std::string_view(text).substr(0, colon))) {
                q.namespace_index = *ns;
                q.name = text.substr(colon + 1);
                return q;
            }
        }
        q.name = text;
        return q;
    }
    if (!value.is_object()) throw DecodingError("Expected a QualifiedName object or string");
    if (const json* name = member(value, "Name")) q.name = from_json_value<std::string>(*name);
    if (const json* uri = member(value, "Uri")) q.namespace_index = namespace_index_from_json(*uri);
    return q;
}

LocalizedText JsonDecoder::localized_text_from_json(const json& value) const {
    LocalizedText t;
    if (value.is_string()) {
        t.text = value.get<std::string>();
    } else if (value.is_object()) {
        if (const json* locale = member(value, "Locale")) t.locale = string_from_json(*locale, "Locale");
        if (const json* text = member(value, "Text")) t.text = string_from_json(*text, "Text");
    } else {
        throw DecodingError("Expected a LocalizedText object or string");
    }
    guard_.check_string_length(t.text.size());
    return t;
}

Variant JsonDecoder::elements_from_json(const json& values, BuiltInType type) {
    if (!values.is_array()) throw DecodingError("Expected an array");
    guard_.check_array_length(values.size());
    return visit_builtin_type(type, [&](auto tag) {
        using T = typename decltype(tag)::type;
        std::vector<T> out;
        out.reserve(values.size());
        for (const auto& element : values) {
            if (element.is_null()) {
                out.push_back(T{});
            } else {
                out.push_back(from_json_value<T>(element));
            }
        }
        return Variant::from_array(std::move(out));
    });
}

Variant JsonDecoder::variant_from_members(const json& object, const char* type_key, const char* body_key) {
    const json* type_value = member(object, type_key);
    if (!type_value) return {};
    auto nesting = guard_.enter();
    int32_t type_id = integer_from_json<int32_t>(*type_value);
    if (type_id < 1 || type_id > MAX_BUILTIN_TYPE_ID) {
        throw DecodingError("Invalid Variant type " + std::to_string(type_id));
    }
    auto type = static_cast<BuiltInType>(type_id);
    const json* body = member(object, body_key);

    if (body && body->is_array()) {
        Variant flat = elements_from_json(*body, type);
        const json* dims_value = member(object, "Dimensions");
        if (!dims_value) return flat;
        if (!dims_value->is_array()) throw DecodingError("Variant Dimensions must be an array");
        guard_.check_array_length(dims_value->size());
        std::vector<int32_t> dims;
        for (const auto& d : *dims_value) dims.push_back(integer_from_json<int32_t>(d));
        auto expected = matrix_element_count(dims);
        if (!expected || *expected != flat.size()) {
            throw DecodingError("Matrix dimensions do not match the element count");
        }
        if (dims.size() == 1) return flat;
        return Variant::from_storage(Variant::Storage(flat.storage()), true, std::move(dims));
    }

    if (type == BuiltInType::Variant) {
        throw DecodingError("A Variant cannot directly contain a scalar Variant");
    }
    return visit_builtin_type(type, [&](auto tag) {
        using T = typename decltype(tag)::type;
        if constexpr (std::is_same_v<T, Variant>) {
            return Variant();
        } else {
            return Variant(body ? from_json_value<T>(*body) : T{});
        }
    });
}

Variant JsonDecoder::variant_from_json(const json& value) {
    if (!value.is_object()) throw DecodingError("Expected a Variant object");
    if (policy_.short_field_names) return variant_from_members(value, "UaType", "Value");
    return variant_from_members(value, "Type", "Body");
}

DataValue JsonDecoder::data_value_from_json(const json& value) {
    if (!value.is_object()) throw DecodingError("Expected a DataValue object");
    auto nesting = guard_.enter();
    DataValue dv;
    if (policy_.short_field_names) {
        dv.value = variant_from_members(value, "UaType", "Value");
    } else if (const json* v = member(value, "Value")) {
        dv.value = variant_from_json(*v);
    }
    if (const json* v = member(value, "StatusCode")) dv.status = status_code_from_json(*v);
    if (const json* v = member(value, "SourceTimestamp")) dv.source_timestamp = from_json_value<DateTime>(*v);
    if (const json* v = member(value, "SourcePicoseconds")) dv.source_picoseconds = integer_from_json<uint16_t>(*v);
    if (const json* v = member(value, "ServerTimestamp")) dv.server_timestamp = from_json_value<DateTime>(*v);
    if (const json* v = member(value, "ServerPicoseconds")) dv.server_picoseconds = integer_from_json<uint16_t>(*v);
    return dv;
}

void JsonDecoder::encodeable_from_json(const json& value, IEncodeable& target) {
    if (!value.is_object()) throw DecodingError("Expected a structure object");
    auto nesting = guard_.enter();
    stack_.push_back({&value, 0});
    StackGuard<std::vector<Frame>> pop{stack_};
    target.decode(*this);
}

ExtensionObject JsonDecoder::extension_object_from_json(const json& value) {
    if (!value.is_object()) throw DecodingError("Expected an ExtensionObject object");
    auto nesting = guard_.enter();
    const bool short_names = policy_.short_field_names;
    const char* type_key = short_names ? "UaTypeId" : "TypeId";
    const char* encoding_key = short_names ? "UaEncoding" : "Encoding";
    const char* body_key = short_names ? "UaBody" : "Body";

    ExpandedNodeId type_id;
    if (const json* t = member(value, type_key)) type_id = node_id_from_json(*t);
    int encoding = 0;
    if (const json* e = member(value, encoding_key)) encoding = integer_from_json<int>(*e);

    const json* body = member(value, body_key);
    json inline_fields;
    if (short_names && !body && encoding == 0) {
        inline_fields = json::object();
        for (auto it = value.begin(); it != value.end(); ++it) {
            if (it.key() != type_key && it.key() != encoding_key) inline_fields[it.key()] = it.value();
        }
        if (!inline_fields.empty()) body = &inline_fields;
    }

    switch (encoding) {
        case 0:
            break;
        case 1:
            if (!body) return ExtensionObject(type_id, ByteString());
            return ExtensionObject(type_id, from_json_value<ByteString>(*body));
        case 2:
            if (!body) return ExtensionObject(type_id, XmlElement());
            return ExtensionObject(type_id, from_json_value<XmlElement>(*body));
        default:
            throw DecodingError("Invalid ExtensionObject encoding " + std::to_string(encoding));
    }

    auto encodeable = context_.create(EncodingType::Json, type_id);
    if (encodeable) {
        static const json empty = json::object();
        encodeable_from_json(body ? *body : empty, *encodeable);
        return ExtensionObject(std::shared_ptr<const IEncodeable>(std::move(encodeable)));
    }
    if (!body) return ExtensionObject(type_id, std::monostate{});
    spdlog::debug("ExtensionObject {}: type not registered, keeping JSON body", type_id.to_string());
    std::string text = body->dump();
    guard_.check_byte_string_length(text.size());
    return ExtensionObject(type_id, JsonBody{std::move(text)});
}

DiagnosticInfo JsonDecoder::diagnostic_info_from_json(const json& value, size_t depth) {
    guard_.check_diagnostic_depth(depth);
    if (!value.is_object()) throw DecodingError("Expected a DiagnosticInfo object");
    DiagnosticInfo info;
    if (const json* v = member(value, "SymbolicId")) info.symbolic_id = integer_from_json<int32_t>(*v);
    if (const json* v = member(value, "NamespaceUri")) info.namespace_uri = integer_from_json<int32_t>(*v);
    if (const json* v = member(value, "Locale")) info.locale = integer_from_json<int32_t>(*v);
    if (const json* v = member(value, "LocalizedText")) info.localized_text = integer_from_json<int32_t>(*v);
    if (const json* v = member(value, "AdditionalInfo")) info.additional_info = from_json_value<std::string>(*v);
    if (const json* v = member(value, "InnerStatusCode")) info.inner_status_code = status_code_from_json(*v);
    if (const json* v = member(value, "InnerDiagnosticInfo")) {
        info.inner_diagnostic_info = std::make_unique<DiagnosticInfo>(diagnostic_info_from_json(*v, depth + 1));
    }
    return info;
}

bool JsonDecoder::read_boolean(std::string_view field) { return read_field<bool>(field); }
int8_t JsonDecoder::read_sbyte(std::string_view field) { return read_field<int8_t>(field); }
uint8_t JsonDecoder::read_byte(std::string_view field) { return read_field<uint8_t>(field); }
int16_t JsonDecoder::read_int16(std::string_view field) { return read_field<int16_t>(field); }
uint16_t JsonDecoder::read_uint16(std::string_view field) { return read_field<uint16_t>(field); }
int32_t JsonDecoder::read_int32(std::string_view field) { return read_field<int32_t>(field); }
uint32_t JsonDecoder::read_uint32(std::string_view field) { return read_field<uint32_t>(field); }
int64_t JsonDecoder::read_int64(std::string_view field) { return read_field<int64_t>(field); }
uint64_t JsonDecoder::read_uint64(std::string_view field) { return read_field<uint64_t>(field); }
float JsonDecoder::read_float(std::string_view field) { return read_field<float>(field); }
double JsonDecoder::read_double(std::string_view field) { return read_field<double>(field); }
std::string JsonDecoder::read_string(std::string_view field) { return read_field<std::string>(field); }
DateTime JsonDecoder::read_datetime(std::string_view field) { return read_field<DateTime>(field); }
Guid JsonDecoder::read_guid(std::string_view field) { return read_field<Guid>(field); }
ByteString JsonDecoder::read_byte_string(std::string_view field) { return read_field<ByteString>(field); }
XmlElement JsonDecoder::read_xml_element(std::string_view field) { return read_field<XmlElement>(field); }
NodeId JsonDecoder::read_node_id(std::string_view field) { return read_field<NodeId>(field); }
ExpandedNodeId JsonDecoder::read_expanded_node_id(std::string_view field) {
    return read_field<ExpandedNodeId>(field);
}
StatusCode JsonDecoder::read_status_code(std::string_view field) { return read_field<StatusCode>(field); }
QualifiedName JsonDecoder::read_qualified_name(std::string_view field) {
    return read_field<QualifiedName>(field);
}
LocalizedText JsonDecoder::read_localized_text(std::string_view field) {
    return read_field<LocalizedText>(field);
}
ExtensionObject JsonDecoder::read_extension_object(std::string_view field) {
    return read_field<ExtensionObject>(field);
}
DataValue JsonDecoder::read_data_value(std::string_view field) { return read_field<DataValue>(field); }
Variant JsonDecoder::read_variant(std::string_view field) { return read_field<Variant>(field); }
DiagnosticInfo JsonDecoder::read_diagnostic_info(std::string_view field) {
    return read_field<DiagnosticInfo>(field);
}

void JsonDecoder::read_encodeable(std::string_view field, IEncodeable& value) {
    static const json empty = json::object();
    const json* v = field_value(field);
    encodeable_from_json(v ? *v : empty, value);
}

int32_t JsonDecoder::read_enumerated(std::string_view field) {
    const json* v = field_value(field);
    if (!v) return 0;
    if (v->is_string()) {
        std::string_view text = v->get_ref<const std::string&>();
        auto underscore = text.rfind('_');
        if (underscore != std::string_view::npos) text = text.substr(underscore + 1);
        auto parsed = detail::parse_integer<int32_t>(text);
        if (!parsed) throw DecodingError("Invalid enumeration value '" + v->get<std::string>() + "'");
        return *parsed;
    }
    return integer_from_json<int32_t>(*v);
}

Variant JsonDecoder::read_array(std::string_view field, BuiltInType type) {
    const json* v = field_value(field);
    if (!v) return {};
    return elements_from_json(*v, type);
}

ExtensionObject JsonDecoder::read_root() {
    if (root_.is_array()) {
        Frame& frame = stack_.front();
        if (frame.next_index >= root_.size()) throw DecodingError("No more elements in the JSON document");
        return extension_object_from_json(root_[frame.next_index++]);
    }
    return extension_object_from_json(root_);
}

} // namespace ua
