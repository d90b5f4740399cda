#pragma once
#include "builtin_types.hpp"
#include "limits.hpp"
#include "type_registry.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace ua {

/// Index <-> URI table. A namespace table starts with the OPC UA core URI at
/// index 0 and an application slot at index 1.
class UriTable {
public:
    UriTable() = default;
    explicit UriTable(std::vector<std::string> uris) : uris_(std::move(uris)) {}

    /// Table for namespaces: {OPC UA core, application_uri}.
    static UriTable namespaces(const std::string& application_uri = "");

    /// Index of uri, appending it when absent. Throws std::invalid_argument
    /// for an empty uri.
    uint32_t get_or_append(const std::string& uri);
    std::optional<uint32_t> index_of(const std::string& uri) const;
    /// URI at index, or nullopt when out of range.
    std::optional<std::string> uri_at(uint32_t index) const;

    size_t size() const { return uris_.size(); }
    const std::vector<std::string>& uris() const { return uris_; }

private:
    std::vector<std::string> uris_;
};

/// Stack of namespace URIs that qualify the field elements of the structure
/// currently being encoded. Empty means the Types.xsd namespace.
class NamespaceStack {
public:
    void push(std::string uri) { stack_.push_back(std::move(uri)); }
    /// Throws InvariantViolation when there is nothing to pop.
    void pop();

    /// Innermost URI, or fallback when the stack is empty.
    const std::string& current(const std::string& fallback) const;
    size_t depth() const { return stack_.size(); }

private:
    std::vector<std::string> stack_;
};

/// Tables and services shared by one encode or decode call.
class MessageContext {
public:
    MessageContext();
    MessageContext(UriTable namespace_uris, std::shared_ptr<const TypeRegistry> registry,
                   EncodingLimits limits = {});

    UriTable namespace_uris;
    UriTable server_uris;
    std::shared_ptr<const TypeRegistry> registry;
    EncodingLimits limits;

    /// Resolves namespace_uri to a local index (appending when new) and drops it.
    NodeId to_node_id(const ExpandedNodeId& id);
    /// Replaces the local index by its URI when the table knows it; index 0 is
    /// left as is.
    ExpandedNodeId to_absolute(const ExpandedNodeId& id) const;
    /// URI of the namespace an id lives in; empty when the index is unknown.
    std::string namespace_uri_of(const ExpandedNodeId& id) const;

    /// Looks up a factory through the registry, if any.
    std::unique_ptr<IEncodeable> create(EncodingType format, const ExpandedNodeId& encoding_id) const;
};

/// Pushes a namespace on construction and pops it on scope exit, including
/// during unwinding.
template <typename Codec>
class NamespaceScope {
public:
    NamespaceScope(Codec& codec, std::string uri) : codec_(codec) {
        codec_.push_namespace(std::move(uri));
    }
    ~NamespaceScope() { codec_.pop_namespace(); }
    NamespaceScope(const NamespaceScope&) = delete;
    NamespaceScope& operator=(const NamespaceScope&) = delete;

private:
    Codec& codec_;
};

} // namespace ua
