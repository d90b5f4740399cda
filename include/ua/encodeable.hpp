#pragma once
#include "builtin_types.hpp"
#include <memory>
#include <string>

namespace ua {

class IEncoder;
class IDecoder;

/// A structured type that any codec can serialize field by field.
class IEncodeable {
public:
    virtual ~IEncodeable() = default;

    /// DataType node id.
    virtual ExpandedNodeId type_id() const = 0;
    virtual ExpandedNodeId binary_encoding_id() const = 0;
    virtual ExpandedNodeId xml_encoding_id() const = 0;
    /// Defaults to type_id(), which is what JSON bodies carry.
    virtual ExpandedNodeId json_encoding_id() const { return type_id(); }

    /// Element name used by the XML codec.
    virtual std::string type_name() const = 0;

    virtual void encode(IEncoder& encoder) const = 0;
    virtual void decode(IDecoder& decoder) = 0;

    virtual bool is_equal(const IEncodeable& other) const = 0;
    virtual std::unique_ptr<IEncodeable> clone() const = 0;
};

/// Supplies clone() and is_equal() from the derived type's copy constructor
/// and operator==.
template <typename Derived>
class Encodeable : public IEncodeable {
public:
    bool is_equal(const IEncodeable& other) const override {
        auto* o = dynamic_cast<const Derived*>(&other);
        return o != nullptr && static_cast<const Derived&>(*this) == *o;
    }

    std::unique_ptr<IEncodeable> clone() const override {
        return std::make_unique<Derived>(static_cast<const Derived&>(*this));
    }
};

} // namespace ua
