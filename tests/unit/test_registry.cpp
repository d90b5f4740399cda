#include <gtest/gtest.h>
#include "ua/type_registry.hpp"
#include "ua/version.hpp"
#include "test_fixtures.hpp"

using namespace ua;
using namespace ua::test;

TEST(TypeRegistryTest, AddTypeRegistersAllEncodings) {
    auto registry = make_registry();
    EXPECT_EQ(registry->size(), 6u);

    ExpandedNodeId binary_id(NodeId(0, 5002u), TEST_NAMESPACE);
    ExpandedNodeId xml_id(NodeId(0, 5003u), TEST_NAMESPACE);
    ExpandedNodeId json_id(NodeId(0, 5001u), TEST_NAMESPACE);
    EXPECT_TRUE(registry->resolve(EncodingType::Binary, binary_id).has_value());
    EXPECT_TRUE(registry->resolve(EncodingType::Xml, xml_id).has_value());
    EXPECT_TRUE(registry->resolve(EncodingType::Json, json_id).has_value());
}

TEST(TypeRegistryTest, LookupIsPerFormat) {
    auto registry = make_registry();
    ExpandedNodeId binary_id(NodeId(0, 5002u), TEST_NAMESPACE);
    EXPECT_FALSE(registry->resolve(EncodingType::Xml, binary_id).has_value());
    EXPECT_FALSE(registry->create(EncodingType::Json, binary_id));
}

TEST(TypeRegistryTest, CreateBuildsFreshInstances) {
    auto registry = make_registry();
    ExpandedNodeId id(NodeId(0, 5012u), TEST_NAMESPACE);
    auto a = registry->create(EncodingType::Binary, id);
    auto b = registry->create(EncodingType::Binary, id);
    ASSERT_NE(a, nullptr);
    ASSERT_NE(b, nullptr);
    EXPECT_NE(a.get(), b.get());
    EXPECT_EQ(a->type_name(), "Envelope");
}

TEST(TypeRegistryTest, CoreNamespaceAliases) {
    TypeRegistry registry;
    registry.add(EncodingType::Binary, ExpandedNodeId(NodeId(0, 862u)),
                 [] { return std::make_unique<SensorReading>(); });
    EXPECT_TRUE(registry.resolve(EncodingType::Binary,
                                 ExpandedNodeId(NodeId(0, 862u), std::string(OPCUA_NAMESPACE_URI)))
                    .has_value());
}

TEST(TypeRegistryTest, IndexAndUriFormsAreDistinctKeys) {
    // The registry stores ids as given; MessageContext resolves indices first.
    auto registry = make_registry();
    EXPECT_FALSE(registry->resolve(EncodingType::Binary, ExpandedNodeId(NodeId(2, 5002u))).has_value());
}

TEST(TypeRegistryTest, LaterAddReplaces) {
    TypeRegistry registry;
    ExpandedNodeId id(NodeId(0, 1u), TEST_NAMESPACE);
    registry.add(EncodingType::Binary, id, [] { return std::make_unique<SensorReading>(); });
    registry.add(EncodingType::Binary, id, [] { return std::make_unique<Envelope>(); });
    EXPECT_EQ(registry.size(), 1u);
    EXPECT_EQ(registry.create(EncodingType::Binary, id)->type_name(), "Envelope");
}

TEST(TypeRegistryTest, NullIdIsIgnored) {
    TypeRegistry registry;
    registry.add(EncodingType::Binary, ExpandedNodeId(), [] { return std::make_unique<SensorReading>(); });
    EXPECT_EQ(registry.size(), 0u);
}

TEST(TypeRegistryTest, EncodingTypeNames) {
    EXPECT_EQ(encoding_type_name(EncodingType::Binary), "Binary");
    EXPECT_EQ(encoding_type_name(EncodingType::Xml), "Xml");
    EXPECT_EQ(encoding_type_name(EncodingType::Json), "Json");
}
