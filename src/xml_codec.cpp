#include "ua/xml_codec.hpp"
#include "text_util.hpp"
#include <libxml/parser.h>
#include <spdlog/spdlog.h>
#include <cfloat>
#include <climits>
#include <cmath>
#include <cstdint>

namespace ua {

namespace {

const std::string TYPES_NS(XML_TYPES_NAMESPACE);

const xmlChar* xc(const std::string& s) {
    return reinterpret_cast<const xmlChar*>(s.c_str());
}

std::string local_name(xmlNodePtr node) {
    return reinterpret_cast<const char*>(node->name);
}

bool is_element(xmlNodePtr node) {
    return node && node->type == XML_ELEMENT_NODE;
}

xmlNodePtr first_element(xmlNodePtr parent) {
    for (xmlNodePtr n = parent->children; n; n = n->next) {
        if (is_element(n)) return n;
    }
    return nullptr;
}

xmlNodePtr next_element(xmlNodePtr node) {
    for (xmlNodePtr n = node->next; n; n = n->next) {
        if (is_element(n)) return n;
    }
    return nullptr;
}

xmlNodePtr child_named(xmlNodePtr parent, std::string_view name) {
    for (xmlNodePtr n = first_element(parent); n; n = next_element(n)) {
        if (name == reinterpret_cast<const char*>(n->name)) return n;
    }
    return nullptr;
}

std::string text_of(xmlNodePtr node) {
    xmlChar* content = xmlNodeGetContent(node);
    if (!content) return {};
    std::string text(reinterpret_cast<const char*>(content));
    xmlFree(content);
    return text;
}

std::string trimmed(const std::string& s) {
    size_t b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return {};
    size_t e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

/// Element namespace for the fields of a structure.
std::string structure_namespace(const MessageContext& context, const IEncodeable& value) {
    std::string uri = context.namespace_uri_of(value.type_id());
    if (uri.empty() || uri == OPCUA_NAMESPACE_URI) return TYPES_NS;
    return uri;
}

/// Serializes one element, with the namespace declarations it depends on,
/// as a standalone fragment.
std::string serialize_element(xmlNodePtr node) {
    XmlDocPtr tmp(xmlNewDoc(reinterpret_cast<const xmlChar*>("1.0")));
    xmlNodePtr copy = xmlDocCopyNode(node, tmp.get(), 1);
    if (!copy) throw DecodingError("Failed to copy XML element");
    xmlDocSetRootElement(tmp.get(), copy);
    xmlBufferPtr buf = xmlBufferCreate();
    xmlNodeDump(buf, tmp.get(), copy, 0, 0);
    std::string out(reinterpret_cast<const char*>(xmlBufferContent(buf)));
    xmlBufferFree(buf);
    return out;
}

XmlDocPtr parse_document(std::string_view xml) {
    if (xml.size() > static_cast<size_t>(INT_MAX)) {
        throw DecodingError("XML document too large");
    }
    xmlDocPtr doc = xmlReadMemory(xml.data(), static_cast<int>(xml.size()), nullptr, "UTF-8",
                                  XML_PARSE_NONET | XML_PARSE_NOERROR | XML_PARSE_NOWARNING);
    if (!doc) throw DecodingError("Malformed XML document");
    XmlDocPtr owned(doc);
    if (!xmlDocGetRootElement(doc)) throw DecodingError("XML document has no root element");
    return owned;
}

template <typename T>
T parse_number(const std::string& text, std::string_view what) {
    auto v = detail::parse_integer<T>(text);
    if (!v) throw DecodingError("Invalid " + std::string(what) + " value '" + text + "'");
    return *v;
}

} // anonymous namespace

// ==================== XmlEncoder ====================

XmlEncoder::XmlEncoder(MessageContext& context, const std::string& root_name)
    : IEncoder(context),
      doc_(xmlNewDoc(reinterpret_cast<const xmlChar*>("1.0"))),
      guard_(context.limits) {
    xmlNodePtr root = xmlNewDocNode(doc_.get(), nullptr, xc(root_name), nullptr);
    xmlDocSetRootElement(doc_.get(), root);
    xmlSetNs(root, xmlNewNs(root, xc(TYPES_NS), nullptr));
    current_ = root;
}

xmlNodePtr XmlEncoder::add_element(xmlNodePtr parent, std::string_view name, const std::string& ns_uri,
                                   const std::string* text) {
    std::string n(name);
    xmlNodePtr node = xmlNewChild(parent, nullptr, xc(n), nullptr);
    xmlNsPtr ns = xmlSearchNsByHref(doc_.get(), node, xc(ns_uri));
    if (!ns) {
        std::string prefix = "s" + std::to_string(++prefix_counter_);
        ns = xmlNewNs(node, xc(ns_uri), xc(prefix));
    }
    xmlSetNs(node, ns);
    if (text) xmlNodeAddContent(node, xc(*text));
    return node;
}

xmlNodePtr XmlEncoder::add_field(std::string_view name, const std::string* text) {
    return add_element(current_, name, current_namespace(TYPES_NS), text);
}

xmlNodePtr XmlEncoder::add_builtin(xmlNodePtr parent, std::string_view name, const std::string* text) {
    return add_element(parent, name, TYPES_NS, text);
}

template <typename T>
void XmlEncoder::write_field(std::string_view field, const T& value) {
    write_content(add_field(field), value);
}

template <typename T>
void XmlEncoder::write_content(xmlNodePtr node, const T& value) {
    std::string text;
    if constexpr (std::is_same_v<T, bool>) {
        text = value ? "true" : "false";
    } else if constexpr (std::is_integral_v<T> && std::is_signed_v<T>) {
        text = std::to_string(static_cast<int64_t>(value));
    } else if constexpr (std::is_integral_v<T>) {
        text = std::to_string(static_cast<uint64_t>(value));
    } else if constexpr (std::is_same_v<T, float>) {
        text = detail::format_float(value);
    } else if constexpr (std::is_same_v<T, double>) {
        text = detail::format_double(value);
    } else if constexpr (std::is_same_v<T, std::string>) {
        guard_.check_string_length(value.size());
        text = value;
    } else if constexpr (std::is_same_v<T, DateTime>) {
        text = value.to_iso8601();
    } else if constexpr (std::is_same_v<T, Guid>) {
        std::string s = value.to_string();
        add_builtin(node, "String", &s);
        return;
    } else if constexpr (std::is_same_v<T, ByteString>) {
        guard_.check_byte_string_length(value.size());
        text = detail::base64_encode(value.bytes(), value.size());
    } else if constexpr (std::is_same_v<T, XmlElement>) {
        if (value.empty()) return;
        guard_.check_byte_string_length(value.xml.size());
        XmlDocPtr fragment(xmlReadMemory(value.xml.data(), static_cast<int>(value.xml.size()), nullptr,
                                         "UTF-8", XML_PARSE_NONET | XML_PARSE_NOERROR | XML_PARSE_NOWARNING));
        if (!fragment || !xmlDocGetRootElement(fragment.get())) {
            throw EncodingError("XmlElement is not well-formed XML");
        }
        xmlNodePtr copy = xmlDocCopyNode(xmlDocGetRootElement(fragment.get()), doc_.get(), 1);
        xmlAddChild(node, copy);
        return;
    } else if constexpr (std::is_same_v<T, NodeId>) {
        // nsu= form when the table knows the index, so a reader with another
        // table still lands in the right namespace.
        std::string s = context_.to_absolute(ExpandedNodeId(value)).to_string();
        add_builtin(node, "Identifier", &s);
        return;
    } else if constexpr (std::is_same_v<T, ExpandedNodeId>) {
        std::string s = value.to_string();
        add_builtin(node, "Identifier", &s);
        return;
    } else if constexpr (std::is_same_v<T, StatusCode>) {
        std::string s = std::to_string(value.code);
        add_builtin(node, "Code", &s);
        return;
    } else if constexpr (std::is_same_v<T, QualifiedName>) {
        if (value.namespace_index != 0) {
            std::string s = std::to_string(value.namespace_index);
            add_builtin(node, "NamespaceIndex", &s);
        }
        if (!value.name.empty()) {
            guard_.check_string_length(value.name.size());
            add_builtin(node, "Name", &value.name);
        }
        if (value.namespace_index != 0) {
            auto uri = context_.namespace_uris.uri_at(value.namespace_index);
            if (uri && !uri->empty()) add_builtin(node, "NamespaceUri", &*uri);
        }
        return;
    } else if constexpr (std::is_same_v<T, LocalizedText>) {
        if (!value.locale.empty()) add_builtin(node, "Locale", &value.locale);
        if (!value.text.empty()) {
            guard_.check_string_length(value.text.size());
            add_builtin(node, "Text", &value.text);
        }
        return;
    } else if constexpr (std::is_same_v<T, ExtensionObject>) {
        write_extension_object_content(node, value);
        return;
    } else if constexpr (std::is_same_v<T, DataValue>) {
        auto nesting = guard_.enter();
        if (!value.value.is_null()) {
            write_variant_content(add_builtin(node, "Value"), value.value);
        }
        if (value.status.code != status::Good) write_content(add_builtin(node, "StatusCode"), value.status);
        if (!value.source_timestamp.is_min()) {
            write_content(add_builtin(node, "SourceTimestamp"), value.source_timestamp);
        }
        if (value.source_picoseconds != 0) {
            write_content(add_builtin(node, "SourcePicoseconds"), value.source_picoseconds);
        }
        if (!value.server_timestamp.is_min()) {
            write_content(add_builtin(node, "ServerTimestamp"), value.server_timestamp);
        }
        if (value.server_picoseconds != 0) {
            write_content(add_builtin(node, "ServerPicoseconds"), value.server_picoseconds);
        }
        return;
    } else if constexpr (std::is_same_v<T, Variant>) {
        write_variant_content(node, value);
        return;
    } else if constexpr (std::is_same_v<T, DiagnosticInfo>) {
        write_diagnostic_info_content(node, value, 0);
        return;
    } else {
        static_assert(!sizeof(T*), "not a built-in type");
    }
    xmlNodeAddContent(node, xc(text));
}

void XmlEncoder::write_list(xmlNodePtr node, const Variant& values) {
    guard_.check_array_length(values.size());
    std::string name(builtin_type_name(values.type()));
    std::visit([&](const auto& vec) {
        using Vec = std::decay_t<decltype(vec)>;
        if constexpr (!std::is_same_v<Vec, std::monostate>) {
            for (size_t i = 0; i < vec.size(); ++i) {
                const auto& element = vec[i];
                write_content(add_builtin(node, name), element);
            }
        }
    }, values.storage());
}

void XmlEncoder::write_variant_content(xmlNodePtr node, const Variant& value) {
    if (value.is_null()) return;
    auto nesting = guard_.enter();
    xmlNodePtr holder = add_builtin(node, "Value");
    std::string name(builtin_type_name(value.type()));

    if (value.is_scalar()) {
        if (value.type() == BuiltInType::Variant) {
            throw EncodingError("A Variant cannot directly contain a scalar Variant");
        }
        xmlNodePtr element = add_builtin(holder, name);
        std::visit([&](const auto& vec) {
            using Vec = std::decay_t<decltype(vec)>;
            if constexpr (!std::is_same_v<Vec, std::monostate>) {
                const auto& scalar = vec[0];
                write_content(element, scalar);
            }
        }, value.storage());
        return;
    }
    if (value.is_matrix()) {
        xmlNodePtr matrix = add_builtin(holder, "Matrix");
        xmlNodePtr dims = add_builtin(matrix, "Dimensions");
        for (int32_t d : value.dimensions()) {
            std::string s = std::to_string(d);
            add_builtin(dims, "Int32", &s);
        }
        write_list(add_builtin(matrix, "Elements"), value);
        return;
    }
    write_list(add_builtin(holder, "ListOf" + name), value);
}

void XmlEncoder::write_extension_object_content(xmlNodePtr node, const ExtensionObject& value) {
    auto nesting = guard_.enter();
    if (const IEncodeable* body = value.encodeable()) {
        write_content(add_builtin(node, "TypeId"), context_.to_node_id(body->xml_encoding_id()));
        xmlNodePtr holder = add_builtin(node, "Body");
        std::string ns = structure_namespace(context_, *body);
        xmlNodePtr element = add_element(holder, body->type_name(), ns);
        xmlNodePtr saved = current_;
        current_ = element;
        {
            NamespaceScope<IEncoder> scope(*this, ns);
            body->encode(*this);
        }
        current_ = saved;
        return;
    }

    write_content(add_builtin(node, "TypeId"), context_.to_node_id(value.type_id));
    switch (value.encoding()) {
        case ExtensionObjectEncoding::None:
            break;
        case ExtensionObjectEncoding::Binary:
            write_content(add_builtin(add_builtin(node, "Body"), "ByteString"),
                          std::get<ByteString>(value.body));
            break;
        case ExtensionObjectEncoding::Xml:
            write_content(add_builtin(node, "Body"), std::get<XmlElement>(value.body));
            break;
        case ExtensionObjectEncoding::Json:
            throw EncodingError("ExtensionObject with an undecoded JSON body has no XML form");
        case ExtensionObjectEncoding::EncodeableObject:
            break;
    }
}

void XmlEncoder::write_diagnostic_info_content(xmlNodePtr node, const DiagnosticInfo& value, size_t depth) {
    guard_.check_diagnostic_depth(depth);
    if (value.symbolic_id >= 0) write_content(add_builtin(node, "SymbolicId"), value.symbolic_id);
    if (value.namespace_uri >= 0) write_content(add_builtin(node, "NamespaceUri"), value.namespace_uri);
    if (value.locale >= 0) write_content(add_builtin(node, "Locale"), value.locale);
    if (value.localized_text >= 0) write_content(add_builtin(node, "LocalizedText"), value.localized_text);
    if (!value.additional_info.empty()) {
        write_content(add_builtin(node, "AdditionalInfo"), value.additional_info);
    }
    if (value.inner_status_code.code != status::Good) {
        write_content(add_builtin(node, "InnerStatusCode"), value.inner_status_code);
    }
    if (value.inner_diagnostic_info) {
        write_diagnostic_info_content(add_builtin(node, "InnerDiagnosticInfo"),
                                      *value.inner_diagnostic_info, depth + 1);
    }
}

void XmlEncoder::write_boolean(std::string_view field, bool value) { write_field(field, value); }
void XmlEncoder::write_sbyte(std::string_view field, int8_t value) { write_field(field, value); }
void XmlEncoder::write_byte(std::string_view field, uint8_t value) { write_field(field, value); }
void XmlEncoder::write_int16(std::string_view field, int16_t value) { write_field(field, value); }
void XmlEncoder::write_uint16(std::string_view field, uint16_t value) { write_field(field, value); }
void XmlEncoder::write_int32(std::string_view field, int32_t value) { write_field(field, value); }
void XmlEncoder::write_uint32(std::string_view field, uint32_t value) { write_field(field, value); }
void XmlEncoder::write_int64(std::string_view field, int64_t value) { write_field(field, value); }
void XmlEncoder::write_uint64(std::string_view field, uint64_t value) { write_field(field, value); }
void XmlEncoder::write_float(std::string_view field, float value) { write_field(field, value); }
void XmlEncoder::write_double(std::string_view field, double value) { write_field(field, value); }
void XmlEncoder::write_string(std::string_view field, const std::string& value) { write_field(field, value); }
void XmlEncoder::write_datetime(std::string_view field, DateTime value) { write_field(field, value); }
void XmlEncoder::write_guid(std::string_view field, const Guid& value) { write_field(field, value); }
void XmlEncoder::write_byte_string(std::string_view field, const ByteString& value) { write_field(field, value); }
void XmlEncoder::write_xml_element(std::string_view field, const XmlElement& value) { write_field(field, value); }
void XmlEncoder::write_node_id(std::string_view field, const NodeId& value) { write_field(field, value); }
void XmlEncoder::write_expanded_node_id(std::string_view field, const ExpandedNodeId& value) {
    write_field(field, value);
}
void XmlEncoder::write_status_code(std::string_view field, StatusCode value) { write_field(field, value); }
void XmlEncoder::write_qualified_name(std::string_view field, const QualifiedName& value) {
    write_field(field, value);
}
void XmlEncoder::write_localized_text(std::string_view field, const LocalizedText& value) {
    write_field(field, value);
}
void XmlEncoder::write_extension_object(std::string_view field, const ExtensionObject& value) {
    write_field(field, value);
}
void XmlEncoder::write_data_value(std::string_view field, const DataValue& value) { write_field(field, value); }
void XmlEncoder::write_variant(std::string_view field, const Variant& value) { write_field(field, value); }
void XmlEncoder::write_diagnostic_info(std::string_view field, const DiagnosticInfo& value) {
    write_field(field, value);
}

void XmlEncoder::write_encodeable(std::string_view field, const IEncodeable& value) {
    auto nesting = guard_.enter();
    xmlNodePtr node = add_field(field);
    xmlNodePtr saved = current_;
    current_ = node;
    {
        NamespaceScope<IEncoder> scope(*this, structure_namespace(context_, value));
        value.encode(*this);
    }
    current_ = saved;
}

void XmlEncoder::write_enumerated(std::string_view field, int32_t value, std::string_view symbol) {
    std::string text = std::to_string(value);
    if (!symbol.empty()) text = std::string(symbol) + "_" + text;
    add_field(field, &text);
}

void XmlEncoder::write_array(std::string_view field, const Variant& values) {
    if (values.is_null()) {
        add_field(field);
        return;
    }
    if (values.is_matrix() || !values.is_array()) {
        throw EncodingError("write_array() takes a one-dimensional array");
    }
    write_list(add_field(field), values);
}

void XmlEncoder::write_root(const ExtensionObject& value) {
    write_extension_object_content(xmlDocGetRootElement(doc_.get()), value);
}

std::string XmlEncoder::to_string() const {
    xmlChar* mem = nullptr;
    int size = 0;
    xmlDocDumpMemoryEnc(doc_.get(), &mem, &size, "UTF-8");
    if (!mem) throw EncodingError("Failed to serialize XML document");
    std::string out(reinterpret_cast<const char*>(mem), static_cast<size_t>(size));
    xmlFree(mem);
    return out;
}

// ==================== XmlDecoder ====================

namespace {

/// Pops the decoder frame pushed for a nested structure.
template <typename Frames>
struct FrameGuard {
    Frames& frames;
    ~FrameGuard() { frames.pop_back(); }
};

} // anonymous namespace

XmlDecoder::XmlDecoder(std::string_view xml, MessageContext& context)
    : IDecoder(context), doc_(parse_document(xml)), guard_(context.limits) {
    xmlNodePtr root = xmlDocGetRootElement(doc_.get());
    frames_.push_back({root, root->children});
}

std::string XmlDecoder::root_name() const {
    return local_name(xmlDocGetRootElement(doc_.get()));
}

xmlNodePtr XmlDecoder::next_field(std::string_view name, bool required) {
    Frame& frame = frames_.back();
    for (xmlNodePtr n = frame.cursor; n; n = n->next) {
        if (is_element(n) && name == reinterpret_cast<const char*>(n->name)) {
            frame.cursor = n->next;
            return n;
        }
    }
    if (required) {
        throw DecodingError("Missing element <" + std::string(name) + "> in <"
                            + local_name(frame.parent) + ">");
    }
    return nullptr;
}

template <typename T>
T XmlDecoder::read_field(std::string_view field) {
    return read_content<T>(next_field(field, true));
}

template <typename T>
T XmlDecoder::read_content(xmlNodePtr node) {
    if constexpr (std::is_same_v<T, bool>) {
        std::string text = trimmed(text_of(node));
        if (text == "true" || text == "1") return true;
        if (text == "false" || text == "0") return false;
        throw DecodingError("Invalid Boolean value '" + text + "'");
    } else if constexpr (std::is_integral_v<T>) {
        return parse_number<T>(text_of(node), "integer");
    } else if constexpr (std::is_same_v<T, float> || std::is_same_v<T, double>) {
        std::string text = text_of(node);
        auto v = detail::parse_double(text);
        if (!v) throw DecodingError("Invalid floating point value '" + text + "'");
        if constexpr (std::is_same_v<T, float>) {
            if (std::isfinite(*v) && std::fabs(*v) > FLT_MAX) {
                throw DecodingError("Float value out of range");
            }
        }
        return static_cast<T>(*v);
    } else if constexpr (std::is_same_v<T, std::string>) {
        std::string text = text_of(node);
        guard_.check_string_length(text.size());
        return text;
    } else if constexpr (std::is_same_v<T, DateTime>) {
        std::string text = trimmed(text_of(node));
        if (text.empty()) return DateTime::min();
        auto v = DateTime::parse_iso8601(text);
        if (!v) throw DecodingError("Invalid DateTime value '" + text + "'");
        return *v;
    } else if constexpr (std::is_same_v<T, Guid>) {
        xmlNodePtr s = child_named(node, "String");
        if (!s) return Guid{};
        std::string text = trimmed(text_of(s));
        auto v = Guid::parse(text);
        if (!v) throw DecodingError("Invalid Guid value '" + text + "'");
        return *v;
    } else if constexpr (std::is_same_v<T, ByteString>) {
        std::string text = text_of(node);
        guard_.check_byte_string_length(detail::base64_decoded_size(text));
        auto bytes = detail::base64_decode(text);
        if (!bytes) throw DecodingError("Invalid base64 content");
        return ByteString(std::move(*bytes));
    } else if constexpr (std::is_same_v<T, XmlElement>) {
        xmlNodePtr element = first_element(node);
        if (!element) return XmlElement{};
        XmlElement value{serialize_element(element)};
        guard_.check_byte_string_length(value.xml.size());
        return value;
    } else if constexpr (std::is_same_v<T, NodeId> || std::is_same_v<T, ExpandedNodeId>) {
        xmlNodePtr id = child_named(node, "Identifier");
        if (!id) return T{};
        std::string text = trimmed(text_of(id));
        if (text.empty()) return T{};
        ExpandedNodeId parsed;
        try {
            parsed = ExpandedNodeId::parse(text);
        } catch (const UaError& e) {
            throw DecodingError(e.what());
        }
        if constexpr (std::is_same_v<T, NodeId>) {
            if (parsed.server_index != 0) throw DecodingError("NodeId cannot refer to another server");
            return context_.to_node_id(parsed);
        } else {
            return parsed;
        }
    } else if constexpr (std::is_same_v<T, StatusCode>) {
        xmlNodePtr code = child_named(node, "Code");
        if (!code) return StatusCode{};
        return StatusCode(parse_number<uint32_t>(text_of(code), "StatusCode"));
    } else if constexpr (std::is_same_v<T, QualifiedName>) {
        QualifiedName q;
        if (xmlNodePtr uri = child_named(node, "NamespaceUri")) {
            std::string text = trimmed(text_of(uri));
            if (text.empty()) throw DecodingError("Empty QualifiedName NamespaceUri");
            uint32_t index = context_.namespace_uris.get_or_append(text);
            if (index > UINT16_MAX) throw DecodingError("Namespace table exceeds 65535 entries");
            q.namespace_index = static_cast<uint16_t>(index);
        } else if (xmlNodePtr ns = child_named(node, "NamespaceIndex")) {
            q.namespace_index = parse_number<uint16_t>(text_of(ns), "NamespaceIndex");
        }
        if (xmlNodePtr name = child_named(node, "Name")) q.name = read_content<std::string>(name);
        return q;
    } else if constexpr (std::is_same_v<T, LocalizedText>) {
        LocalizedText t;
        if (xmlNodePtr locale = child_named(node, "Locale")) t.locale = read_content<std::string>(locale);
        if (xmlNodePtr text = child_named(node, "Text")) t.text = read_content<std::string>(text);
        return t;
    } else if constexpr (std::is_same_v<T, ExtensionObject>) {
        return read_extension_object_content(node);
    } else if constexpr (std::is_same_v<T, DataValue>) {
        auto nesting = guard_.enter();
        DataValue dv;
        if (xmlNodePtr n = child_named(node, "Value")) dv.value = read_variant_content(n);
        if (xmlNodePtr n = child_named(node, "StatusCode")) dv.status = read_content<StatusCode>(n);
        if (xmlNodePtr n = child_named(node, "SourceTimestamp")) dv.source_timestamp = read_content<DateTime>(n);
        if (xmlNodePtr n = child_named(node, "SourcePicoseconds")) {
            dv.source_picoseconds = read_content<uint16_t>(n);
        }
        if (xmlNodePtr n = child_named(node, "ServerTimestamp")) dv.server_timestamp = read_content<DateTime>(n);
        if (xmlNodePtr n = child_named(node, "ServerPicoseconds")) {
            dv.server_picoseconds = read_content<uint16_t>(n);
        }
        return dv;
    } else if constexpr (std::is_same_v<T, Variant>) {
        return read_variant_content(node);
    } else if constexpr (std::is_same_v<T, DiagnosticInfo>) {
        return read_diagnostic_info_content(node, 0);
    } else {
        static_assert(!sizeof(T*), "not a built-in type");
    }
}

Variant XmlDecoder::read_list(xmlNodePtr node, BuiltInType type) {
    std::string name(builtin_type_name(type));
    size_t count = 0;
    for (xmlNodePtr n = first_element(node); n; n = next_element(n)) {
        if (name == reinterpret_cast<const char*>(n->name)) ++count;
    }
    guard_.check_array_length(count);
    return visit_builtin_type(type, [&](auto tag) {
        using T = typename decltype(tag)::type;
        std::vector<T> values;
        values.reserve(count);
        for (xmlNodePtr n = first_element(node); n; n = next_element(n)) {
            if (name == reinterpret_cast<const char*>(n->name)) values.push_back(read_content<T>(n));
        }
        return Variant::from_array(std::move(values));
    });
}

Variant XmlDecoder::read_variant_content(xmlNodePtr node) {
    xmlNodePtr holder = child_named(node, "Value");
    if (!holder) return {};
    xmlNodePtr element = first_element(holder);
    if (!element) return {};
    auto nesting = guard_.enter();
    std::string name = local_name(element);

    auto type_of = [](std::string_view type_name) {
        auto type = builtin_type_from_name(type_name);
        if (!type || *type == BuiltInType::Null || *type == BuiltInType::Enumeration) {
            throw DecodingError("Unknown Variant element type '" + std::string(type_name) + "'");
        }
        return *type;
    };

    if (name == "Matrix") {
        xmlNodePtr dims_node = child_named(element, "Dimensions");
        xmlNodePtr elements = child_named(element, "Elements");
        if (!dims_node || !elements) throw DecodingError("Matrix without Dimensions or Elements");
        std::vector<int32_t> dims;
        for (xmlNodePtr d = first_element(dims_node); d; d = next_element(d)) {
            guard_.check_array_length(dims.size() + 1);
            dims.push_back(parse_number<int32_t>(text_of(d), "dimension"));
        }
        xmlNodePtr first = first_element(elements);
        if (!first) throw DecodingError("Matrix without elements");
        BuiltInType type = type_of(local_name(first));
        Variant flat = read_list(elements, type);
        auto expected = matrix_element_count(dims);
        if (!expected || *expected != flat.size()) {
            throw DecodingError("Matrix dimensions do not match the element count");
        }
        if (dims.size() == 1) return flat;
        return Variant::from_storage(Variant::Storage(flat.storage()), true, std::move(dims));
    }

    if (name.compare(0, 6, "ListOf") == 0) {
        return read_list(element, type_of(std::string_view(name).substr(6)));
    }

    BuiltInType type = type_of(name);
    if (type == BuiltInType::Variant) {
        throw DecodingError("A Variant cannot directly contain a scalar Variant");
    }
    return visit_builtin_type(type, [&](auto tag) {
        using T = typename decltype(tag)::type;
        if constexpr (std::is_same_v<T, Variant>) {
            return Variant();
        } else {
            return Variant(read_content<T>(element));
        }
    });
}

ExtensionObject XmlDecoder::read_extension_object_content(xmlNodePtr node) {
    auto nesting = guard_.enter();
    ExpandedNodeId type_id;
    if (xmlNodePtr tid = child_named(node, "TypeId")) type_id = read_content<NodeId>(tid);

    xmlNodePtr holder = child_named(node, "Body");
    if (!holder) return ExtensionObject(type_id, std::monostate{});
    xmlNodePtr element = first_element(holder);
    if (!element) return ExtensionObject(type_id, XmlElement{});

    bool types_ns = element->ns && element->ns->href && TYPES_NS == reinterpret_cast<const char*>(element->ns->href);
    if (types_ns && local_name(element) == "ByteString") {
        return ExtensionObject(type_id, read_content<ByteString>(element));
    }

    auto encodeable = context_.create(EncodingType::Xml, type_id);
    if (!encodeable) {
        spdlog::debug("ExtensionObject {}: type not registered, keeping XML body", type_id.to_string());
        XmlElement body{serialize_element(element)};
        guard_.check_byte_string_length(body.xml.size());
        return ExtensionObject(type_id, std::move(body));
    }

    frames_.push_back({element, element->children});
    FrameGuard<std::vector<Frame>> pop{frames_};
    NamespaceScope<IDecoder> scope(*this, structure_namespace(context_, *encodeable));
    encodeable->decode(*this);
    return ExtensionObject(std::shared_ptr<const IEncodeable>(std::move(encodeable)));
}

DiagnosticInfo XmlDecoder::read_diagnostic_info_content(xmlNodePtr node, size_t depth) {
    guard_.check_diagnostic_depth(depth);
    DiagnosticInfo info;
    if (xmlNodePtr n = child_named(node, "SymbolicId")) info.symbolic_id = read_content<int32_t>(n);
    if (xmlNodePtr n = child_named(node, "NamespaceUri")) info.namespace_uri = read_content<int32_t>(n);
    if (xmlNodePtr n = child_named(node, "Locale")) info.locale = read_content<int32_t>(n);
    if (xmlNodePtr n = child_named(node, "LocalizedText")) info.localized_text = read_content<int32_t>(n);
    if (xmlNodePtr n = child_named(node, "AdditionalInfo")) info.additional_info = read_content<std::string>(n);
    if (xmlNodePtr n = child_named(node, "InnerStatusCode")) info.inner_status_code = read_content<StatusCode>(n);
    if (xmlNodePtr n = child_named(node, "InnerDiagnosticInfo")) {
        info.inner_diagnostic_info = std::make_unique<DiagnosticInfo>(read_diagnostic_info_content(n, depth + 1));
    }
    return info;
}

bool XmlDecoder::read_boolean(std::string_view field) { return read_field<bool>(field); }
int8_t XmlDecoder::read_sbyte(std::string_view field) { return read_field<int8_t>(field); }
uint8_t XmlDecoder::read_byte(std::string_view field) { return read_field<uint8_t>(field); }
int16_t XmlDecoder::read_int16(std::string_view field) { return read_field<int16_t>(field); }
uint16_t XmlDecoder::read_uint16(std::string_view field) { return read_field<uint16_t>(field); }
int32_t XmlDecoder::read_int32(std::string_view field) { return read_field<int32_t>(field); }
uint32_t XmlDecoder::read_uint32(std::string_view field) { return read_field<uint32_t>(field); }
int64_t XmlDecoder::read_int64(std::string_view field) { return read_field<int64_t>(field); }
uint64_t XmlDecoder::read_uint64(std::string_view field) { return read_field<uint64_t>(field); }
float XmlDecoder::read_float(std::string_view field) { return read_field<float>(field); }
double XmlDecoder::read_double(std::string_view field) { return read_field<double>(field); }
std::string XmlDecoder::read_string(std::string_view field) { return read_field<std::string>(field); }
DateTime XmlDecoder::read_datetime(std::string_view field) { return read_field<DateTime>(field); }
Guid XmlDecoder::read_guid(std::string_view field) { return read_field<Guid>(field); }
ByteString XmlDecoder::read_byte_string(std::string_view field) { return read_field<ByteString>(field); }
XmlElement XmlDecoder::read_xml_element(std::string_view field) { return read_field<XmlElement>(field); }
NodeId XmlDecoder::read_node_id(std::string_view field) { return read_field<NodeId>(field); }
ExpandedNodeId XmlDecoder::read_expanded_node_id(std::string_view field) {
    return read_field<ExpandedNodeId>(field);
}
StatusCode XmlDecoder::read_status_code(std::string_view field) { return read_field<StatusCode>(field); }
QualifiedName XmlDecoder::read_qualified_name(std::string_view field) { return read_field<QualifiedName>(field); }
LocalizedText XmlDecoder::read_localized_text(std::string_view field) { return read_field<LocalizedText>(field); }
ExtensionObject XmlDecoder::read_extension_object(std::string_view field) {
    return read_field<ExtensionObject>(field);
}
DataValue XmlDecoder::read_data_value(std::string_view field) { return read_field<DataValue>(field); }
Variant XmlDecoder::read_variant(std::string_view field) { return read_field<Variant>(field); }
DiagnosticInfo XmlDecoder::read_diagnostic_info(std::string_view field) {
    return read_field<DiagnosticInfo>(field);
}

void XmlDecoder::read_encodeable(std::string_view field, IEncodeable& value) {
    xmlNodePtr node = next_field(field, true);
    auto nesting = guard_.enter();
    frames_.push_back({node, node->children});
    FrameGuard<std::vector<Frame>> pop{frames_};
    NamespaceScope<IDecoder> scope(*this, structure_namespace(context_, value));
    value.decode(*this);
}

int32_t XmlDecoder::read_enumerated(std::string_view field) {
    std::string text = trimmed(text_of(next_field(field, true)));
    auto underscore = text.rfind('_');
    if (underscore != std::string::npos) text = text.substr(underscore + 1);
    return parse_number<int32_t>(text, "enumeration");
}

Variant XmlDecoder::read_array(std::string_view field, BuiltInType type) {
    xmlNodePtr node = next_field(field, true);
    if (!first_element(node)) return {};
    return read_list(node, type);
}

ExtensionObject XmlDecoder::read_root() {
    return read_extension_object_content(xmlDocGetRootElement(doc_.get()));
}

} // namespace ua
