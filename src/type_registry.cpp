#include "ua/type_registry.hpp"
#include "ua/version.hpp"
#include <spdlog/spdlog.h>

namespace ua {

std::string_view encoding_type_name(EncodingType type) {
    switch (type) {
        case EncodingType::Binary: return "Binary";
        case EncodingType::Xml:    return "Xml";
        case EncodingType::Json:   return "Json";
    }
    return {};
}

std::string TypeRegistry::key_of(const ExpandedNodeId& id) {
    if (!id.namespace_uri.empty()) {
        return "nsu=" + id.namespace_uri + ";" + format_identifier(id.node_id);
    }
    if (id.node_id.namespace_index == 0) {
        return "nsu=" + std::string(OPCUA_NAMESPACE_URI) + ";" + format_identifier(id.node_id);
    }
    return id.node_id.to_string();
}

void TypeRegistry::add(EncodingType format, const ExpandedNodeId& encoding_id, EncodeableFactory factory) {
    if (encoding_id.is_null()) return;
    auto key = std::make_pair(format, key_of(encoding_id));
    if (factories_.count(key)) {
        spdlog::debug("TypeRegistry: replacing {} factory for {}", encoding_type_name(format), key.second);
    }
    factories_[std::move(key)] = std::move(factory);
}

std::optional<EncodeableFactory> TypeRegistry::resolve(EncodingType format,
                                                       const ExpandedNodeId& encoding_id) const {
    auto it = factories_.find(std::make_pair(format, key_of(encoding_id)));
    if (it == factories_.end()) return std::nullopt;
    return it->second;
}

std::unique_ptr<IEncodeable> TypeRegistry::create(EncodingType format,
                                                  const ExpandedNodeId& encoding_id) const {
    auto factory = resolve(format, encoding_id);
    if (!factory) return nullptr;
    return (*factory)();
}

} // namespace ua
