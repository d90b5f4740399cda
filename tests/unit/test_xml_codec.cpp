#include <gtest/gtest.h>
#include "ua/xml_codec.hpp"
#include "test_fixtures.hpp"

using namespace ua;
using namespace ua::test;

namespace {

const std::string TYPES_XMLNS = "xmlns=\"" + std::string(XML_TYPES_NAMESPACE) + "\"";

struct Point : Encodeable<Point> {
    int32_t x = 0;
    int32_t y = 0;

    ExpandedNodeId type_id() const override { return ExpandedNodeId(NodeId(0, 6101u), TEST_NAMESPACE); }
    ExpandedNodeId binary_encoding_id() const override {
        return ExpandedNodeId(NodeId(0, 6102u), TEST_NAMESPACE);
    }
    ExpandedNodeId xml_encoding_id() const override {
        return ExpandedNodeId(NodeId(0, 6103u), TEST_NAMESPACE);
    }
    std::string type_name() const override { return "Point"; }
    void encode(IEncoder& e) const override {
        e.write_int32("X", x);
        e.write_int32("Y", y);
    }
    void decode(IDecoder& d) override {
        x = d.read_int32("X");
        y = d.read_int32("Y");
    }
    bool operator==(const Point& o) const { return x == o.x && y == o.y; }
};

MessageContext point_context() {
    auto registry = make_registry();
    registry->add_type<Point>();
    return make_context(registry);
}

std::string point_document(const std::string& body) {
    return "<ExtensionObject " + TYPES_XMLNS + "><TypeId><Identifier>ns=2;i=6103</Identifier></TypeId>"
           "<Body><Point xmlns=\"urn:uacodec:test\">" + body + "</Point></Body></ExtensionObject>";
}

std::string encode_root(MessageContext& context, const ExtensionObject& eo) {
    XmlEncoder encoder(context);
    encoder.write_root(eo);
    return encoder.to_string();
}

} // anonymous namespace

// ---- Document shape ----

TEST(XmlEncoderTest, RootCarriesTypeIdAndBody) {
    MessageContext context = point_context();
    auto point = std::make_shared<Point>();
    point->x = 3;
    point->y = -4;
    std::string xml = encode_root(context, ExtensionObject(point));

    EXPECT_NE(xml.find("<ExtensionObject " + TYPES_XMLNS + ">"), std::string::npos) << xml;
    EXPECT_NE(xml.find("<TypeId><Identifier>nsu=urn:uacodec:test;i=6103</Identifier></TypeId>"), std::string::npos)
        << xml;
    EXPECT_NE(xml.find("<Body><s1:Point xmlns:s1=\"urn:uacodec:test\"><s1:X>3</s1:X><s1:Y>-4</s1:Y></s1:Point></Body>"),
              std::string::npos)
        << xml;
}

TEST(XmlEncoderTest, BuiltInSubElementsUseTypesNamespace) {
    MessageContext context = make_context();
    std::string xml = encode_root(context, ExtensionObject(std::make_shared<SensorReading>(sample_reading())));

    EXPECT_NE(xml.find("<s1:Id><String>72962b91-fa75-4ae6-8d28-b404dc7daf63</String></s1:Id>"),
              std::string::npos)
        << xml;
    EXPECT_NE(xml.find("<s1:Source><Identifier>nsu=urn:uacodec:app;s=Boiler.Temperature</Identifier></s1:Source>"),
              std::string::npos);
    EXPECT_NE(xml.find("<s1:Mode>Automatic_2</s1:Mode>"), std::string::npos);
    EXPECT_NE(xml.find("<s1:Samples><UInt32>1</UInt32><UInt32>2</UInt32>"), std::string::npos);
    EXPECT_NE(xml.find("<s1:Name>Boiler \"A\" &lt;main&gt;</s1:Name>"), std::string::npos) << xml;
    EXPECT_NE(xml.find("<s1:Status><Code>1083375616</Code></s1:Status>"), std::string::npos);
}

TEST(XmlEncoderTest, MatrixLayout) {
    MessageContext context = make_context();
    XmlEncoder encoder(context, "Root");
    encoder.write_variant("V", Variant::from_matrix(Matrix<int32_t>::from_rows({{1, 2}, {3, 4}})));
    std::string xml = encoder.to_string();
    EXPECT_NE(xml.find("<V><Value><Matrix><Dimensions><Int32>2</Int32><Int32>2</Int32></Dimensions>"
                       "<Elements><Int32>1</Int32><Int32>2</Int32><Int32>3</Int32><Int32>4</Int32>"
                       "</Elements></Matrix></Value></V>"),
              std::string::npos)
        << xml;
}

TEST(XmlEncoderTest, JsonBodyHasNoXmlForm) {
    MessageContext context = make_context();
    XmlEncoder encoder(context, "Root");
    EXPECT_THROW(encoder.write_extension_object("E", ExtensionObject(NodeId(2, 1u), JsonBody{"{}"})),
                 EncodingError);
}

TEST(XmlEncoderTest, MalformedXmlElementRejected) {
    MessageContext context = make_context();
    XmlEncoder encoder(context, "Root");
    EXPECT_THROW(encoder.write_xml_element("X", XmlElement{"<open>"}), EncodingError);
}

// ---- Decoding ----

TEST(XmlDecoderTest, SkipsUnknownElements) {
    MessageContext context = point_context();
    XmlDecoder decoder(point_document("<Comment>ignored</Comment><X>3</X><Extra/><Y>4</Y><Trailer/>"),
                       context);
    ExtensionObject eo = decoder.read_root();
    const Point* point = eo.body_as<Point>();
    ASSERT_NE(point, nullptr);
    EXPECT_EQ(point->x, 3);
    EXPECT_EQ(point->y, 4);
}

TEST(XmlDecoderTest, MissingFieldIsDecodingError) {
    MessageContext context = point_context();
    XmlDecoder decoder(point_document("<X>3</X>"), context);
    EXPECT_THROW(decoder.read_root(), DecodingError);
}

TEST(XmlDecoderTest, FieldsAreReadInDocumentOrder) {
    MessageContext context = point_context();
    XmlDecoder decoder(point_document("<Y>4</Y><X>3</X>"), context);
    EXPECT_THROW(decoder.read_root(), DecodingError);
}

TEST(XmlDecoderTest, MalformedDocument) {
    MessageContext context = make_context();
    EXPECT_THROW(XmlDecoder("<Root><A>1</Root>", context), DecodingError);
    EXPECT_THROW(XmlDecoder("", context), DecodingError);
}

TEST(XmlDecoderTest, InvalidScalarText) {
    MessageContext context = make_context();
    {
        XmlDecoder decoder("<Root><A>abc</A></Root>", context);
        EXPECT_THROW(decoder.read_int32("A"), DecodingError);
    }
    {
        XmlDecoder decoder("<Root><A>300</A></Root>", context);
        EXPECT_THROW(decoder.read_byte("A"), DecodingError);
    }
    {
        XmlDecoder decoder("<Root><A>maybe</A></Root>", context);
        EXPECT_THROW(decoder.read_boolean("A"), DecodingError);
    }
}

TEST(XmlDecoderTest, BooleanAcceptsDigits) {
    MessageContext context = make_context();
    XmlDecoder decoder("<Root><A>1</A><B> false </B></Root>", context);
    EXPECT_TRUE(decoder.read_boolean("A"));
    EXPECT_FALSE(decoder.read_boolean("B"));
}

TEST(XmlDecoderTest, AbsentBuiltInPartsTakeDefaults) {
    MessageContext context = make_context();
    XmlDecoder decoder("<Root><Q/><T><Text>hi</Text></T><S/><N/></Root>", context);
    EXPECT_EQ(decoder.read_qualified_name("Q"), QualifiedName{});
    EXPECT_EQ(decoder.read_localized_text("T"), (LocalizedText{"", "hi"}));
    EXPECT_EQ(decoder.read_status_code("S"), StatusCode(status::Good));
    EXPECT_TRUE(decoder.read_node_id("N").is_null());
}

TEST(XmlDecoderTest, EmptyAndNullArraysBothDecodeNull) {
    MessageContext context = make_context();
    XmlEncoder encoder(context, "Root");
    encoder.write_array("A", Variant());
    encoder.write_array("B", std::vector<int32_t>{});
    XmlDecoder decoder(encoder.to_string(), context);
    EXPECT_TRUE(decoder.read_array("A", BuiltInType::Int32).is_null());
    EXPECT_TRUE(decoder.read_array("B", BuiltInType::Int32).is_null());
}

TEST(XmlDecoderTest, StringLimit) {
    EncodingLimits limits;
    limits.max_string_length = 3;
    MessageContext context = make_context(make_registry(), limits);
    XmlDecoder decoder("<Root><A>abcd</A></Root>", context);
    EXPECT_THROW(decoder.read_string("A"), EncodingLimitsExceeded);
}

// ---- Round trips ----

TEST(XmlCodecTest, EnvelopeRoundTrip) {
    MessageContext context = make_context();
    Envelope original = sample_envelope();
    std::string xml = encode_root(context, ExtensionObject(std::make_shared<Envelope>(original)));

    XmlDecoder decoder(xml, context);
    EXPECT_EQ(decoder.root_name(), "ExtensionObject");
    ExtensionObject eo = decoder.read_root();
    const Envelope* decoded = eo.body_as<Envelope>();
    ASSERT_NE(decoded, nullptr) << xml;
    EXPECT_EQ(decoded->reading, original.reading);
    EXPECT_EQ(decoded->payload, original.payload);
    EXPECT_EQ(decoded->value, original.value);
    EXPECT_EQ(decoded->data, original.data);
    EXPECT_EQ(decoded->diagnostics, original.diagnostics);
    EXPECT_EQ(decoded->target, original.target);
    EXPECT_EQ(decoded->note, original.note);
}

TEST(XmlCodecTest, ReencodeIsIdempotent) {
    MessageContext context = make_context();
    std::string first = encode_root(context, ExtensionObject(std::make_shared<Envelope>(sample_envelope())));
    XmlDecoder decoder(first, context);
    std::string second = encode_root(context, decoder.read_root());
    EXPECT_EQ(first, second);
}

TEST(XmlCodecTest, ByteStringBodyRoundTrip) {
    MessageContext context = make_context();
    ExtensionObject eo(NodeId(2, 99u), ByteString{1, 2, 3});
    XmlEncoder encoder(context, "Root");
    encoder.write_extension_object("E", eo);
    std::string xml = encoder.to_string();
    EXPECT_NE(xml.find("<Body><ByteString>AQID</ByteString></Body>"), std::string::npos) << xml;

    XmlDecoder decoder(xml, context);
    EXPECT_EQ(decoder.read_extension_object("E"), eo);
}

TEST(XmlCodecTest, UnknownBodyKeptAsXml) {
    MessageContext full = make_context();
    SensorReading reading = sample_reading();
    std::string xml = encode_root(full, ExtensionObject(std::make_shared<SensorReading>(reading)));

    MessageContext empty = make_empty_context();
    XmlDecoder decoder(xml, empty);
    ExtensionObject opaque = decoder.read_root();
    ASSERT_EQ(opaque.encoding(), ExtensionObjectEncoding::Xml);
    EXPECT_EQ(opaque.type_id, ExpandedNodeId(NodeId(2, 5003u)));

    // Nothing was lost: a context that knows the type can still read it.
    std::string forwarded = encode_root(empty, opaque);
    XmlDecoder reader(forwarded, full);
    ExtensionObject eo = reader.read_root();
    ASSERT_NE(eo.body_as<SensorReading>(), nullptr) << forwarded;
    EXPECT_EQ(*eo.body_as<SensorReading>(), reading);
}

TEST(XmlCodecTest, EmptyBodiesKeepTheirEncoding) {
    MessageContext context = make_context();
    ExtensionObject binary(NodeId(2, 99u), ByteString{});
    ExtensionObject xml_body(NodeId(2, 99u), XmlElement{});
    XmlEncoder encoder(context, "Root");
    encoder.write_extension_object("A", binary);
    encoder.write_extension_object("B", xml_body);

    XmlDecoder decoder(encoder.to_string(), context);
    ExtensionObject a = decoder.read_extension_object("A");
    ExtensionObject b = decoder.read_extension_object("B");
    EXPECT_EQ(a.encoding(), ExtensionObjectEncoding::Binary);
    EXPECT_EQ(a, binary);
    EXPECT_EQ(b.encoding(), ExtensionObjectEncoding::Xml);
    EXPECT_EQ(b, xml_body);
}

TEST(XmlCodecTest, NamespacesResolveThroughUriTable) {
    MessageContext writer = make_context();
    XmlEncoder encoder(writer, "Root");
    encoder.write_node_id("Test", NodeId(2, "Pump"));
    encoder.write_node_id("App", NodeId(1, 7u));
    encoder.write_node_id("Unknown", NodeId(9, 5u));
    encoder.write_qualified_name("Name", QualifiedName{2, "Speed"});
    encoder.write_qualified_name("Plain", QualifiedName{0, "Core"});
    std::string xml = encoder.to_string();
    EXPECT_NE(xml.find("<Identifier>nsu=urn:uacodec:test;s=Pump</Identifier>"), std::string::npos) << xml;
    EXPECT_NE(xml.find("<Identifier>ns=9;i=5</Identifier>"), std::string::npos) << xml;
    EXPECT_NE(xml.find("<NamespaceUri>urn:uacodec:test</NamespaceUri>"), std::string::npos) << xml;

    // Same URIs at other indexes, plus one the reader has never seen.
    MessageContext reader(UriTable({std::string(OPCUA_NAMESPACE_URI), TEST_NAMESPACE, "urn:other"}),
                          make_registry());
    XmlDecoder decoder(xml, reader);
    EXPECT_EQ(decoder.read_node_id("Test"), NodeId(1, "Pump"));
    EXPECT_EQ(decoder.read_node_id("App"), NodeId(3, 7u));
    EXPECT_EQ(decoder.read_node_id("Unknown"), NodeId(9, 5u));
    EXPECT_EQ(decoder.read_qualified_name("Name"), (QualifiedName{1, "Speed"}));
    EXPECT_EQ(decoder.read_qualified_name("Plain"), (QualifiedName{0, "Core"}));
    EXPECT_EQ(reader.namespace_uris.uri_at(3).value_or(""), APP_NAMESPACE);
}

TEST(XmlDecoderTest, NodeIdWithServerIndexRejected) {
    MessageContext context = make_context();
    XmlDecoder decoder("<Root><N><Identifier>svr=1;i=5</Identifier></N></Root>", context);
    EXPECT_THROW(decoder.read_node_id("N"), DecodingError);
}

TEST(XmlCodecTest, ScalarVariantsRoundTrip) {
    MessageContext context = make_context();
    std::vector<Variant> values{
        Variant(true), Variant(int8_t{-8}), Variant(uint64_t{18446744073709551615ULL}),
        Variant(2.5), Variant("text"), Variant(DateTime::from_civil(2020, 5, 6, 7, 8, 9)),
        Variant(ByteString{9, 8, 7}), Variant(NodeId(3, "n")), Variant(StatusCode(status::BadNoData)),
        Variant(QualifiedName{1, "q"}), Variant(LocalizedText{"de", "Hallo"}),
        Variant::from_array(std::vector<std::string>{"a", "b"})};
    XmlEncoder encoder(context, "Root");
    for (const auto& v : values) encoder.write_variant("V", v);
    XmlDecoder decoder(encoder.to_string(), context);
    for (const auto& v : values) {
        EXPECT_EQ(decoder.read_variant("V"), v);
    }
}

TEST(XmlCodecTest, DiagnosticInfoDepth) {
    MessageContext context = make_context();
    XmlEncoder ok(context, "Root");
    EXPECT_NO_THROW(ok.write_diagnostic_info("D", diagnostic_chain(5)));
    XmlEncoder too_deep(context, "Root");
    EXPECT_THROW(too_deep.write_diagnostic_info("D", diagnostic_chain(6)), EncodingLimitsExceeded);

    XmlDecoder decoder(ok.to_string(), context);
    EXPECT_EQ(decoder.read_diagnostic_info("D"), diagnostic_chain(5));
}
