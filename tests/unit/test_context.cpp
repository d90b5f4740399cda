#include <gtest/gtest.h>
#include "ua/context.hpp"
#include "ua/binary_codec.hpp"
#include "test_fixtures.hpp"
#include <stdexcept>

using namespace ua;
using namespace ua::test;

// ---- UriTable ----

TEST(UriTableTest, NamespacesStartWithCore) {
    auto table = UriTable::namespaces(APP_NAMESPACE);
    ASSERT_EQ(table.size(), 2u);
    EXPECT_EQ(table.uri_at(0), std::string(OPCUA_NAMESPACE_URI));
    EXPECT_EQ(table.uri_at(1), APP_NAMESPACE);
    EXPECT_FALSE(table.uri_at(2).has_value());
}

TEST(UriTableTest, GetOrAppendIsStable) {
    auto table = UriTable::namespaces(APP_NAMESPACE);
    EXPECT_EQ(table.get_or_append("urn:a"), 2u);
    EXPECT_EQ(table.get_or_append("urn:b"), 3u);
    EXPECT_EQ(table.get_or_append("urn:a"), 2u);
    EXPECT_EQ(table.index_of(APP_NAMESPACE), 1u);
    EXPECT_THROW(table.get_or_append(""), std::invalid_argument);
}

// ---- NamespaceStack ----

TEST(NamespaceStackTest, PushPop) {
    NamespaceStack stack;
    const std::string fallback = "fallback";
    EXPECT_EQ(stack.current(fallback), fallback);
    stack.push("urn:a");
    stack.push("urn:b");
    EXPECT_EQ(stack.current(fallback), "urn:b");
    stack.pop();
    EXPECT_EQ(stack.current(fallback), "urn:a");
    stack.pop();
    EXPECT_EQ(stack.depth(), 0u);
}

TEST(NamespaceStackTest, UnbalancedPopIsInvariantViolation) {
    NamespaceStack stack;
    EXPECT_THROW(stack.pop(), InvariantViolation);
}

TEST(NamespaceScopeTest, PopsDuringUnwinding) {
    MessageContext context = make_context();
    BinaryEncoder encoder(context);
    try {
        NamespaceScope<IEncoder> outer(encoder, "urn:a");
        NamespaceScope<IEncoder> inner(encoder, "urn:b");
        throw std::runtime_error("abort mid-structure");
    } catch (const std::runtime_error&) {
    }
    // Both scopes popped; one more pop must fail.
    EXPECT_THROW(encoder.pop_namespace(), InvariantViolation);
}

namespace {

// Fails halfway through its fields.
struct Truncating : Encodeable<Truncating> {
    ExpandedNodeId type_id() const override { return ExpandedNodeId(NodeId(0, 6001u), TEST_NAMESPACE); }
    ExpandedNodeId binary_encoding_id() const override {
        return ExpandedNodeId(NodeId(0, 6002u), TEST_NAMESPACE);
    }
    ExpandedNodeId xml_encoding_id() const override {
        return ExpandedNodeId(NodeId(0, 6003u), TEST_NAMESPACE);
    }
    std::string type_name() const override { return "Truncating"; }
    void encode(IEncoder& e) const override {
        e.write_int32("A", 1);
        e.write_string("B", std::string(100, 'x'));
    }
    void decode(IDecoder& d) override {
        d.read_int32("A");
        d.read_string("B");
    }
    bool operator==(const Truncating&) const { return true; }
};

} // anonymous namespace

TEST(NamespaceScopeTest, EncoderReusableAfterFailedStructure) {
    EncodingLimits limits;
    limits.max_string_length = 10;
    MessageContext context = make_context(make_registry(), limits);
    BinaryEncoder encoder(context);
    EXPECT_THROW(encoder.write_encodeable("", Truncating{}), EncodingLimitsExceeded);
    EXPECT_THROW(encoder.pop_namespace(), InvariantViolation);
}

// ---- MessageContext ----

TEST(MessageContextTest, ToNodeIdResolvesUri) {
    MessageContext context = make_context();
    auto local = context.to_node_id(ExpandedNodeId(NodeId(0, "X"), TEST_NAMESPACE));
    EXPECT_EQ(local, NodeId(2, "X"));

    auto appended = context.to_node_id(ExpandedNodeId(NodeId(0, 1u), "urn:new"));
    EXPECT_EQ(appended.namespace_index, 3);
    EXPECT_EQ(context.namespace_uris.uri_at(3), "urn:new");

    EXPECT_EQ(context.to_node_id(ExpandedNodeId(NodeId(5, 9u))), NodeId(5, 9u));
}

TEST(MessageContextTest, ToAbsoluteUsesTable) {
    MessageContext context = make_context();
    auto abs = context.to_absolute(ExpandedNodeId(NodeId(2, 7u)));
    EXPECT_EQ(abs.namespace_uri, TEST_NAMESPACE);
    EXPECT_EQ(abs.node_id, NodeId(0, 7u));

    // Namespace 0 and unknown indices stay as they are.
    EXPECT_EQ(context.to_absolute(ExpandedNodeId(NodeId(0, 7u))), ExpandedNodeId(NodeId(0, 7u)));
    EXPECT_EQ(context.to_absolute(ExpandedNodeId(NodeId(9, 7u))), ExpandedNodeId(NodeId(9, 7u)));
}

TEST(MessageContextTest, NamespaceUriOf) {
    MessageContext context = make_context();
    EXPECT_EQ(context.namespace_uri_of(ExpandedNodeId(NodeId(2, 1u))), TEST_NAMESPACE);
    EXPECT_EQ(context.namespace_uri_of(ExpandedNodeId(NodeId(0, 1u), "urn:explicit")), "urn:explicit");
    EXPECT_EQ(context.namespace_uri_of(ExpandedNodeId(NodeId(42, 1u))), "");
}

TEST(MessageContextTest, CreateThroughRegistry) {
    MessageContext context = make_context();
    auto obj = context.create(EncodingType::Binary, ExpandedNodeId(NodeId(2, 5002u)));
    ASSERT_NE(obj, nullptr);
    EXPECT_EQ(obj->type_name(), "SensorReading");
    EXPECT_FALSE(context.create(EncodingType::Xml, ExpandedNodeId(NodeId(2, 5002u))));
}
