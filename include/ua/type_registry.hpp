#pragma once
#include "encodeable.hpp"
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <utility>

namespace ua {

enum class EncodingType { Binary, Xml, Json };

std::string_view encoding_type_name(EncodingType type);

using EncodeableFactory = std::function<std::unique_ptr<IEncodeable>()>;

/// Maps (wire format, encoding id) to a constructor for the structured type.
/// Populate it once, then share it read-only between any number of codecs.
class TypeRegistry {
public:
    /// Registers one encoding id. Ids in namespace 0 and ids carrying the
    /// OPC UA namespace URI are the same key. A later add() for the same key
    /// replaces the earlier one.
    void add(EncodingType format, const ExpandedNodeId& encoding_id, EncodeableFactory factory);

    /// Registers T under its binary, XML and JSON encoding ids.
    template <typename T>
    void add_type() {
        T prototype;
        EncodeableFactory factory = [] { return std::make_unique<T>(); };
        add(EncodingType::Binary, prototype.binary_encoding_id(), factory);
        add(EncodingType::Xml, prototype.xml_encoding_id(), factory);
        add(EncodingType::Json, prototype.json_encoding_id(), factory);
    }

    /// Factory for an id, or nullopt when the type is unknown.
    [[nodiscard]] std::optional<EncodeableFactory> resolve(EncodingType format,
                                                           const ExpandedNodeId& encoding_id) const;

    /// resolve() followed by construction; nullptr when unknown.
    [[nodiscard]] std::unique_ptr<IEncodeable> create(EncodingType format,
                                                      const ExpandedNodeId& encoding_id) const;

    size_t size() const { return factories_.size(); }

private:
    static std::string key_of(const ExpandedNodeId& id);

    std::map<std::pair<EncodingType, std::string>, EncodeableFactory> factories_;
};

} // namespace ua
