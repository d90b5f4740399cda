#include <gtest/gtest.h>
#include "ua/json_codec.hpp"
#include "test_fixtures.hpp"
#include <cmath>
#include <limits>

using namespace ua;
using namespace ua::test;
using json = nlohmann::ordered_json;

namespace {

JsonEncoderOptions options_for(JsonEncoding encoding) {
    JsonEncoderOptions options;
    options.encoding = encoding;
    return options;
}

std::string encode_root(MessageContext& context, const ExtensionObject& eo,
                        JsonEncoderOptions options = {}) {
    JsonEncoder encoder(context, options);
    encoder.write_root(eo);
    return encoder.to_string();
}

Envelope round_trip(const Envelope& original, JsonEncoding encoding) {
    MessageContext context = make_context();
    std::string text = encode_root(context, ExtensionObject(std::make_shared<Envelope>(original)),
                                   options_for(encoding));
    JsonDecoder decoder(text, context, encoding);
    ExtensionObject eo = decoder.read_root();
    const Envelope* decoded = eo.body_as<Envelope>();
    if (!decoded) {
        ADD_FAILURE() << "no Envelope in " << text;
        return {};
    }
    return *decoded;
}

} // anonymous namespace

// ---- Encoding policy ----

TEST(JsonEncodingTest, NamesRoundTrip) {
    for (auto e : {JsonEncoding::Reversible, JsonEncoding::NonReversible, JsonEncoding::Compact,
                   JsonEncoding::Verbose}) {
        EXPECT_TRUE(json_encoding_from_name(json_encoding_name(e)) == e) << json_encoding_name(e);
    }
    EXPECT_FALSE(json_encoding_from_name("Pretty").has_value());
}

TEST(JsonEncodingTest, PolicyDefaults) {
    auto reversible = JsonEncodingPolicy::for_encoding(JsonEncoding::Reversible);
    EXPECT_FALSE(reversible.include_default_values);
    EXPECT_TRUE(reversible.include_default_number_values);
    EXPECT_FALSE(reversible.short_field_names);

    auto compact = JsonEncodingPolicy::for_encoding(JsonEncoding::Compact);
    EXPECT_TRUE(compact.short_field_names);
    EXPECT_FALSE(compact.include_default_values);
    EXPECT_FALSE(compact.include_default_number_values);

    auto verbose = JsonEncodingPolicy::for_encoding(JsonEncoding::Verbose);
    EXPECT_TRUE(verbose.verbose_extra_fields);
    EXPECT_TRUE(verbose.include_default_values);

    auto nr = JsonEncodingPolicy::for_encoding(JsonEncoding::NonReversible);
    EXPECT_FALSE(nr.tag_ambiguous_values);
    EXPECT_TRUE(nr.use_display_strings);
}

// ---- Reversible shapes ----

TEST(JsonEncoderTest, ReversibleScalarShapes) {
    MessageContext context = make_context();
    JsonEncoder encoder(context);
    encoder.write_int32("I", 5);
    encoder.write_int64("L", -123);
    encoder.write_uint64("U", 18446744073709551615ULL);
    encoder.write_double("N", std::numeric_limits<double>::quiet_NaN());
    encoder.write_float("F", std::numeric_limits<float>::infinity());
    encoder.write_byte_string("B", ByteString{1, 2, 3});
    encoder.write_status_code("S", StatusCode(status::BadDataLost));
    encoder.write_node_id("Numeric", NodeId(0, 85u));
    encoder.write_node_id("Text", NodeId(2, "X"));
    encoder.write_qualified_name("Q", QualifiedName{2, "Q"});
    encoder.write_localized_text("T", LocalizedText{"en", "hi"});

    const json& doc = encoder.document();
    EXPECT_EQ(doc["I"], 5);
    EXPECT_EQ(doc["L"], "-123");
    EXPECT_EQ(doc["U"], "18446744073709551615");
    EXPECT_EQ(doc["N"], "NaN");
    EXPECT_EQ(doc["F"], "Infinity");
    EXPECT_EQ(doc["B"], "AQID");
    EXPECT_EQ(doc["S"], 2157772800u);
    EXPECT_EQ(doc["Numeric"], json::parse(R"({"Id":85})"));
    EXPECT_EQ(doc["Text"], json::parse(R"({"IdType":1,"Id":"X","Namespace":2})"));
    EXPECT_EQ(doc["Q"], json::parse(R"({"Name":"Q","Uri":2})"));
    EXPECT_EQ(doc["T"], json::parse(R"({"Locale":"en","Text":"hi"})"));
}

TEST(JsonEncoderTest, ForceNamespaceUri) {
    MessageContext context = make_context();
    JsonEncoderOptions options;
    options.force_namespace_uri = true;
    JsonEncoder encoder(context, options);
    encoder.write_node_id("N", NodeId(2, 7u));
    encoder.write_qualified_name("Q", QualifiedName{2, "Q"});
    encoder.write_expanded_node_id("E", ExpandedNodeId(NodeId(2, 7u)));
    EXPECT_EQ(encoder.document()["N"], json::parse(R"({"Id":7,"Namespace":"urn:uacodec:test"})"));
    EXPECT_EQ(encoder.document()["Q"], json::parse(R"({"Name":"Q","Uri":"urn:uacodec:test"})"));
    EXPECT_EQ(encoder.document()["E"], json::parse(R"({"Id":7,"Namespace":"urn:uacodec:test"})"));
}

TEST(JsonEncoderTest, ReversibleVariantAndExpandedNodeId) {
    MessageContext context = make_context();
    JsonEncoder encoder(context);
    encoder.write_variant("V", Variant(int32_t{5}));
    encoder.write_variant("M", Variant::from_matrix(Matrix<int32_t>::from_rows({{1, 2}, {3, 4}})));
    encoder.write_expanded_node_id("E", ExpandedNodeId(NodeId(0, "Pump"), "urn:other:server", 3));

    const json& doc = encoder.document();
    EXPECT_EQ(doc["V"], json::parse(R"({"Type":6,"Body":5})"));
    EXPECT_EQ(doc["M"], json::parse(R"({"Type":6,"Body":[1,2,3,4],"Dimensions":[2,2]})"));
    EXPECT_EQ(doc["E"], json::parse(R"({"IdType":1,"Id":"Pump","Namespace":"urn:other:server","ServerUri":3})"));
}

TEST(JsonEncoderTest, ReversibleDefaults) {
    MessageContext context = make_context();
    JsonEncoder encoder(context);
    encoder.write_int32("Zero", 0);
    encoder.write_boolean("False", false);
    encoder.write_string("Empty", "");
    encoder.write_datetime("Never", DateTime::min());
    encoder.write_variant("Null", Variant());
    encoder.write_array("NoItems", Variant());

    const json& doc = encoder.document();
    EXPECT_EQ(doc, json::parse(R"({"Zero":0})"));
}

TEST(JsonEncoderTest, DefaultOverrides) {
    MessageContext context = make_context();
    JsonEncoderOptions options;
    options.include_default_values = true;
    options.include_default_number_values = false;
    JsonEncoder encoder(context, options);
    encoder.write_int32("Zero", 0);
    encoder.write_string("Empty", "");
    encoder.write_datetime("Never", DateTime::min());
    encoder.write_array("NoItems", Variant());
    EXPECT_EQ(encoder.document(), json::parse(R"({"Empty":"","Never":"0001-01-01T00:00:00Z","NoItems":[]})"));
}

TEST(JsonEncoderTest, ReversibleExtensionObjectShape) {
    MessageContext context = make_context();
    auto reading = std::make_shared<SensorReading>();
    reading->handle = 9;
    auto doc = json::parse(encode_root(context, ExtensionObject(reading)));
    EXPECT_EQ(doc["TypeId"], json::parse(R"({"Id":5001,"Namespace":2})"));
    EXPECT_FALSE(doc.contains("Encoding"));
    EXPECT_EQ(doc["Body"]["Handle"], 9);

    JsonEncoder encoder(context);
    encoder.write_extension_object("Opaque", ExtensionObject(NodeId(2, 99u), ByteString{1, 2, 3}));
    EXPECT_EQ(encoder.document()["Opaque"],
              json::parse(R"({"TypeId":{"Id":99,"Namespace":2},"Encoding":1,"Body":"AQID"})"));
}

// ---- Compact and Verbose shapes ----

TEST(JsonEncoderTest, CompactShapes) {
    MessageContext context = make_context();
    JsonEncoder encoder(context, options_for(JsonEncoding::Compact));
    encoder.write_int32("Zero", 0);
    encoder.write_node_id("N", NodeId(2, "X"));
    encoder.write_node_id("Core", NodeId(0, 85u));
    encoder.write_expanded_node_id("E", ExpandedNodeId(NodeId(4, 1u)));
    encoder.write_qualified_name("Q", QualifiedName{2, "Q"});
    encoder.write_status_code("S", StatusCode(status::BadDataLost));
    encoder.write_variant("V", Variant(int32_t{5}));
    encoder.write_enumerated("Mode", 2, "Automatic");

    const json& doc = encoder.document();
    EXPECT_FALSE(doc.contains("Zero"));
    EXPECT_EQ(doc["N"], "nsu=urn:uacodec:test;s=X");
    EXPECT_EQ(doc["Core"], "i=85");
    EXPECT_EQ(doc["E"], "ns=4;i=1");
    EXPECT_EQ(doc["Q"], "2:Q");
    EXPECT_EQ(doc["S"], json::parse(R"({"Code":2157772800})"));
    EXPECT_EQ(doc["V"], json::parse(R"({"UaType":6,"Value":5})"));
    EXPECT_EQ(doc["Mode"], 2);
}

TEST(JsonEncoderTest, CompactExtensionObjectInlinesFields) {
    MessageContext context = make_context();
    auto reading = std::make_shared<SensorReading>();
    reading->handle = 9;
    auto doc = json::parse(encode_root(context, ExtensionObject(reading), options_for(JsonEncoding::Compact)));
    EXPECT_EQ(doc, json::parse(R"({"UaTypeId":"nsu=urn:uacodec:test;i=5001","Handle":9})"));
}

TEST(JsonEncoderTest, CompactDataValueInlinesVariant) {
    MessageContext context = make_context();
    JsonEncoder encoder(context, options_for(JsonEncoding::Compact));
    DataValue dv;
    dv.value = Variant(uint32_t{7});
    dv.status = StatusCode(status::BadDataLost);
    encoder.write_data_value("D", dv);
    EXPECT_EQ(encoder.document()["D"],
              json::parse(R"({"UaType":7,"Value":7,"StatusCode":{"Code":2157772800}})"));
}

TEST(JsonEncoderTest, VerboseShapes) {
    MessageContext context = make_context();
    JsonEncoder encoder(context, options_for(JsonEncoding::Verbose));
    encoder.write_int32("Zero", 0);
    encoder.write_string("Empty", "");
    encoder.write_status_code("S", StatusCode(status::BadDataLost));
    encoder.write_enumerated("Mode", 2, "Automatic");

    const json& doc = encoder.document();
    EXPECT_EQ(doc["Zero"], 0);
    EXPECT_EQ(doc["Empty"], "");
    EXPECT_EQ(doc["S"], json::parse(R"({"Code":2157772800,"Symbol":"BadDataLost"})"));
    EXPECT_EQ(doc["Mode"], "Automatic_2");
}

// ---- NonReversible ----

TEST(JsonEncoderTest, NonReversibleShapes) {
    MessageContext context = make_context();
    JsonEncoder encoder(context, options_for(JsonEncoding::NonReversible));
    encoder.write_variant("V", Variant(int32_t{5}));
    encoder.write_variant("M", Variant::from_matrix(Matrix<int32_t>::from_rows({{1, 2, 3}, {4, 5, 6}})));
    encoder.write_variant("Null", Variant());
    encoder.write_localized_text("T", LocalizedText{"en", "hi"});
    encoder.write_node_id("N", NodeId(2, "X"));
    encoder.write_status_code("S", StatusCode(status::BadDataLost));

    const json& doc = encoder.document();
    EXPECT_EQ(doc["V"], 5);
    EXPECT_EQ(doc["M"], json::parse("[[1,2,3],[4,5,6]]"));
    EXPECT_TRUE(doc.contains("Null"));
    EXPECT_TRUE(doc["Null"].is_null());
    EXPECT_EQ(doc["T"], "hi");
    EXPECT_EQ(doc["N"], "nsu=urn:uacodec:test;s=X");
    EXPECT_EQ(doc["S"], json::parse(R"({"Code":2157772800,"Symbol":"BadDataLost"})"));
}

TEST(JsonEncoderTest, NonReversibleExtensionObjectIsBodyOnly) {
    MessageContext context = make_context();
    auto reading = std::make_shared<SensorReading>(sample_reading());
    auto doc = json::parse(encode_root(context, ExtensionObject(reading), options_for(JsonEncoding::NonReversible)));
    EXPECT_FALSE(doc.contains("TypeId"));
    EXPECT_FALSE(doc.contains("UaTypeId"));
    EXPECT_EQ(doc["Handle"], 42);
    EXPECT_EQ(doc["DisplayName"], "Temperature");
}

TEST(JsonDecoderTest, NonReversibleIsNotSupported) {
    MessageContext context = make_context();
    try {
        JsonDecoder decoder("{}", context, JsonEncoding::NonReversible);
        FAIL() << "expected NotSupportedError";
    } catch (const NotSupportedError& e) {
        EXPECT_EQ(e.status.code, status::BadNotSupported);
    }
}

// ---- Errors ----

TEST(JsonEncoderTest, InvalidJsonBody) {
    MessageContext context = make_context();
    JsonEncoder encoder(context);
    EXPECT_THROW(encoder.write_extension_object("E", ExtensionObject(NodeId(2, 1u), JsonBody{"{bad"})),
                 EncodingError);
}

TEST(JsonEncoderTest, DiagnosticInfoDepth) {
    MessageContext context = make_context();
    JsonEncoder encoder(context);
    EXPECT_NO_THROW(encoder.write_diagnostic_info("Ok", diagnostic_chain(5)));
    EXPECT_THROW(encoder.write_diagnostic_info("Deep", diagnostic_chain(6)), EncodingLimitsExceeded);
}

TEST(JsonDecoderTest, MalformedInput) {
    MessageContext context = make_context();
    EXPECT_THROW(JsonDecoder("{\"a\":", context), DecodingError);
    EXPECT_THROW(JsonDecoder("not json", context), DecodingError);
}

TEST(JsonDecoderTest, AbsentFieldsTakeDefaults) {
    MessageContext context = make_context();
    JsonDecoder decoder("{\"Other\":1,\"Null\":null}", context);
    EXPECT_EQ(decoder.read_int32("Missing"), 0);
    EXPECT_EQ(decoder.read_string("Missing"), "");
    EXPECT_FALSE(decoder.read_boolean("Null"));
    EXPECT_TRUE(decoder.read_variant("Missing").is_null());
    EXPECT_TRUE(decoder.read_datetime("Missing").is_min());
    EXPECT_TRUE(decoder.read_array("Missing", BuiltInType::Int32).is_null());
}

TEST(JsonDecoderTest, IntegersAcceptStrings) {
    MessageContext context = make_context();
    JsonDecoder decoder(R"({"A":"42","B":"-9007199254740993","C":12})", context);
    EXPECT_EQ(decoder.read_int32("A"), 42);
    EXPECT_EQ(decoder.read_int64("B"), -9007199254740993LL);
    EXPECT_EQ(decoder.read_int64("C"), 12);
}

TEST(JsonDecoderTest, IntegerRangeAndTypeChecks) {
    MessageContext context = make_context();
    JsonDecoder decoder(R"({"A":300,"B":-1,"C":"x","D":true,"E":1})", context);
    EXPECT_THROW(decoder.read_byte("A"), DecodingError);
    EXPECT_THROW(decoder.read_uint32("B"), DecodingError);
    EXPECT_THROW(decoder.read_int32("C"), DecodingError);
    EXPECT_THROW(decoder.read_int32("D"), DecodingError);
    EXPECT_THROW(decoder.read_boolean("E"), DecodingError);
}

TEST(JsonDecoderTest, FloatSpecialValues) {
    MessageContext context = make_context();
    JsonDecoder decoder(R"({"N":"NaN","P":"Infinity","M":"-Infinity","F":1e300})", context);
    EXPECT_TRUE(std::isnan(decoder.read_double("N")));
    EXPECT_TRUE(std::isinf(decoder.read_double("P")));
    EXPECT_LT(decoder.read_float("M"), 0.0f);
    EXPECT_THROW(decoder.read_float("F"), DecodingError);
}

TEST(JsonDecoderTest, InvalidVariantType) {
    MessageContext context = make_context();
    JsonDecoder decoder(R"({"V":{"Type":26,"Body":1},"W":{"Type":0}})", context);
    EXPECT_THROW(decoder.read_variant("V"), DecodingError);
    EXPECT_THROW(decoder.read_variant("W"), DecodingError);
}

TEST(JsonDecoderTest, MatrixDimensionMismatch) {
    MessageContext context = make_context();
    JsonDecoder decoder(R"({"M":{"Type":6,"Body":[1,2,3],"Dimensions":[2,2]}})", context);
    EXPECT_THROW(decoder.read_variant("M"), DecodingError);
}

TEST(JsonDecoderTest, NodeIdForms) {
    MessageContext context = make_context();
    JsonDecoder decoder(
        R"({"A":{"Id":85},"B":{"IdType":1,"Id":"X","Namespace":"urn:uacodec:test"},"C":"ns=2;s=X","D":{"IdType":9,"Id":1}})",
        context);
    EXPECT_EQ(decoder.read_node_id("A"), NodeId(0, 85u));
    EXPECT_EQ(decoder.read_node_id("B"), NodeId(2, "X"));
    EXPECT_EQ(decoder.read_node_id("C"), NodeId(2, "X"));
    EXPECT_THROW(decoder.read_node_id("D"), DecodingError);
}

TEST(JsonDecoderTest, UnknownNamespaceUriIsAppended) {
    MessageContext context = make_context();
    JsonDecoder decoder(R"({"A":{"Id":1,"Namespace":"urn:fresh"}})", context);
    EXPECT_EQ(decoder.read_node_id("A"), NodeId(3, 1u));
    EXPECT_EQ(context.namespace_uris.uri_at(3).value_or(""), "urn:fresh");
}

TEST(JsonDecoderTest, StringLimit) {
    EncodingLimits limits;
    limits.max_string_length = 3;
    MessageContext context = make_context(make_registry(), limits);
    JsonDecoder decoder(R"({"S":"abcd"})", context);
    EXPECT_THROW(decoder.read_string("S"), EncodingLimitsExceeded);
}

TEST(JsonDecoderTest, ByteStringLimitCheckedOnEncodedSize) {
    EncodingLimits limits;
    limits.max_byte_string_length = 4;
    MessageContext context = make_context(make_registry(), limits);
    JsonDecoder decoder(R"({"A":"AQIDBA==","B":"AQIDBAU="})", context);
    EXPECT_EQ(decoder.read_byte_string("A"), (ByteString{1, 2, 3, 4}));
    EXPECT_THROW(decoder.read_byte_string("B"), EncodingLimitsExceeded);
}

TEST(JsonDecoderTest, OversizedDocumentStringRejectedWhileParsing) {
    EncodingLimits limits;
    limits.max_string_length = 3;
    limits.max_byte_string_length = 3;
    MessageContext context = make_context(make_registry(), limits);
    EXPECT_NO_THROW(JsonDecoder(R"({"S":"abcd"})", context));
    EXPECT_THROW(JsonDecoder(R"({"S":"abcde"})", context), EncodingLimitsExceeded);
    EXPECT_THROW(JsonDecoder(R"({"abcdefgh":1})", context), EncodingLimitsExceeded);
}

TEST(JsonDecoderTest, OversizedDocumentArrayRejectedWhileParsing) {
    EncodingLimits limits;
    limits.max_array_length = 3;
    MessageContext context = make_context(make_registry(), limits);
    EXPECT_NO_THROW(JsonDecoder(R"({"A":[1,2,3]})", context));
    EXPECT_THROW(JsonDecoder(R"({"A":[1,2,3,4]})", context), EncodingLimitsExceeded);
}

namespace {

/// A Reversible Variant holding an array of one Variant, levels deep.
std::string nested_variants(size_t levels) {
    std::string text;
    for (size_t i = 0; i < levels; ++i) text += R"({"Type":24,"Body":[)";
    text += R"({"Type":6,"Body":1})";
    for (size_t i = 0; i < levels; ++i) text += "]}";
    return text;
}

} // anonymous namespace

TEST(JsonDecoderTest, NestedVariantsWithinLimit) {
    MessageContext context = make_context();
    JsonDecoder decoder("{\"V\":" + nested_variants(20) + "}", context);
    Variant v = decoder.read_variant("V");
    for (int i = 0; i < 20; ++i) {
        ASSERT_EQ(v.type(), BuiltInType::Variant);
        ASSERT_EQ(v.size(), 1u);
        Variant inner = v.array<Variant>().front();
        v = inner;
    }
    EXPECT_EQ(v, Variant(int32_t{1}));
}

TEST(JsonDecoderTest, NestedVariantsHitNestingLimit) {
    MessageContext context = make_context();
    JsonDecoder decoder("{\"V\":" + nested_variants(250) + "}", context);
    EXPECT_THROW(decoder.read_variant("V"), EncodingLimitsExceeded);
}

TEST(JsonDecoderTest, DeepDocumentRejectedWhileParsing) {
    MessageContext context = make_context();
    EXPECT_THROW(JsonDecoder("{\"V\":" + nested_variants(2000) + "}", context), EncodingLimitsExceeded);
    EXPECT_THROW(JsonDecoder(std::string(5000, '[') + std::string(5000, ']'), context), EncodingLimitsExceeded);
}

// ---- Round trips ----

TEST(JsonCodecTest, ReversibleRoundTrip) {
    Envelope original = sample_envelope();
    EXPECT_EQ(round_trip(original, JsonEncoding::Reversible), original);
}

TEST(JsonCodecTest, CompactRoundTrip) {
    Envelope original = sample_envelope();
    EXPECT_EQ(round_trip(original, JsonEncoding::Compact), original);
}

TEST(JsonCodecTest, VerboseRoundTrip) {
    Envelope original = sample_envelope();
    EXPECT_EQ(round_trip(original, JsonEncoding::Verbose), original);
}

TEST(JsonCodecTest, DefaultValuedStructureRoundTrip) {
    Envelope original;
    original.reading.name = "only a name";
    EXPECT_EQ(round_trip(original, JsonEncoding::Compact), original);
    EXPECT_EQ(round_trip(original, JsonEncoding::Reversible), original);
}

TEST(JsonCodecTest, ReencodeIsIdempotent) {
    MessageContext context = make_context();
    std::string first = encode_root(context, ExtensionObject(std::make_shared<Envelope>(sample_envelope())));
    JsonDecoder decoder(first, context);
    std::string second = encode_root(context, decoder.read_root());
    EXPECT_EQ(first, second);
}

TEST(JsonCodecTest, UnknownExtensionObjectKeptAsJson) {
    MessageContext full = make_context();
    std::string text = encode_root(full, ExtensionObject(std::make_shared<SensorReading>(sample_reading())));

    MessageContext empty = make_empty_context();
    JsonDecoder decoder(text, empty);
    ExtensionObject opaque = decoder.read_root();
    EXPECT_EQ(opaque.encoding(), ExtensionObjectEncoding::Json);
    EXPECT_EQ(opaque.type_id, ExpandedNodeId(NodeId(2, 5001u)));

    EXPECT_EQ(encode_root(empty, opaque), text);
}

TEST(JsonCodecTest, EmptyBinaryBodyKeepsEncoding) {
    MessageContext context = make_context();
    ExtensionObject eo(NodeId(2, 99u), ByteString{});
    std::string text = encode_root(context, eo);
    JsonDecoder decoder(text, context);
    ExtensionObject decoded = decoder.read_root();
    EXPECT_EQ(decoded.encoding(), ExtensionObjectEncoding::Binary) << text;
    EXPECT_EQ(decoded, eo);
    EXPECT_EQ(encode_root(context, decoded), text);
}

TEST(JsonCodecTest, TopLevelArray) {
    MessageContext context = make_context();
    JsonEncoderOptions options;
    options.top_level_is_array = true;
    JsonEncoder encoder(context, options);
    auto first = std::make_shared<SensorReading>();
    first->handle = 1;
    auto second = std::make_shared<SensorReading>();
    second->handle = 2;
    encoder.write_root(ExtensionObject(first));
    encoder.write_root(ExtensionObject(second));
    ASSERT_TRUE(encoder.document().is_array());
    EXPECT_EQ(encoder.document().size(), 2u);

    JsonDecoder decoder(encoder.to_string(), context);
    EXPECT_EQ(decoder.read_root().body_as<SensorReading>()->handle, 1);
    EXPECT_EQ(decoder.read_root().body_as<SensorReading>()->handle, 2);
    EXPECT_THROW(decoder.read_root(), DecodingError);
}

TEST(JsonCodecTest, ArrayOfVariantsRoundTrip) {
    MessageContext context = make_context();
    auto v = Variant::from_array(std::vector<Variant>{Variant(int32_t{1}), Variant("two"),
                                                      Variant(QualifiedName{1, "q"})});
    JsonEncoder encoder(context);
    encoder.write_variant("V", v);
    JsonDecoder decoder(encoder.to_string(), context);
    EXPECT_EQ(decoder.read_variant("V"), v);
}
