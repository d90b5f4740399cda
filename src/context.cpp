#include "ua/context.hpp"
#include "ua/version.hpp"
#include <algorithm>
#include <stdexcept>

namespace ua {

// ---------- UriTable ----------

UriTable UriTable::namespaces(const std::string& application_uri) {
    return UriTable({std::string(OPCUA_NAMESPACE_URI), application_uri});
}

uint32_t UriTable::get_or_append(const std::string& uri) {
    if (uri.empty()) {
        throw std::invalid_argument("Namespace URI must not be empty");
    }
    if (auto index = index_of(uri)) return *index;
    uris_.push_back(uri);
    return static_cast<uint32_t>(uris_.size() - 1);
}

std::optional<uint32_t> UriTable::index_of(const std::string& uri) const {
    auto it = std::find(uris_.begin(), uris_.end(), uri);
    if (it == uris_.end() || uri.empty()) return std::nullopt;
    return static_cast<uint32_t>(it - uris_.begin());
}

std::optional<std::string> UriTable::uri_at(uint32_t index) const {
    if (index >= uris_.size()) return std::nullopt;
    return uris_[index];
}

// ---------- NamespaceStack ----------

void NamespaceStack::pop() {
    if (stack_.empty()) {
        throw InvariantViolation("pop_namespace() without a matching push_namespace()");
    }
    stack_.pop_back();
}

const std::string& NamespaceStack::current(const std::string& fallback) const {
    return stack_.empty() ? fallback : stack_.back();
}

// ---------- MessageContext ----------

MessageContext::MessageContext()
    : namespace_uris(UriTable::namespaces()),
      registry(std::make_shared<TypeRegistry>()) {}

MessageContext::MessageContext(UriTable namespace_uris, std::shared_ptr<const TypeRegistry> registry,
                               EncodingLimits limits)
    : namespace_uris(std::move(namespace_uris)),
      registry(registry ? std::move(registry) : std::make_shared<TypeRegistry>()),
      limits(limits) {}

NodeId MessageContext::to_node_id(const ExpandedNodeId& id) {
    if (id.namespace_uri.empty()) return id.node_id;
    NodeId local = id.node_id;
    uint32_t index = namespace_uris.get_or_append(id.namespace_uri);
    if (index > UINT16_MAX) {
        throw EncodingError("Namespace table exceeds 65535 entries");
    }
    local.namespace_index = static_cast<uint16_t>(index);
    return local;
}

ExpandedNodeId MessageContext::to_absolute(const ExpandedNodeId& id) const {
    if (!id.namespace_uri.empty() || id.node_id.namespace_index == 0) return id;
    auto uri = namespace_uris.uri_at(id.node_id.namespace_index);
    if (!uri || uri->empty()) return id;
    ExpandedNodeId result = id;
    result.namespace_uri = *uri;
    result.node_id.namespace_index = 0;
    return result;
}

std::string MessageContext::namespace_uri_of(const ExpandedNodeId& id) const {
    if (!id.namespace_uri.empty()) return id.namespace_uri;
    return namespace_uris.uri_at(id.node_id.namespace_index).value_or(std::string());
}

std::unique_ptr<IEncodeable> MessageContext::create(EncodingType format,
                                                    const ExpandedNodeId& encoding_id) const {
    if (!registry) return nullptr;
    return registry->create(format, to_absolute(encoding_id));
}

} // namespace ua
