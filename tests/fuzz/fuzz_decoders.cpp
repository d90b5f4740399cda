/// libFuzzer entry point over the three decoders. The first byte picks the
/// format; the rest is decoded with default limits and an empty registry,
/// so every ExtensionObject body stays opaque. DecodingError and
/// EncodingLimitsExceeded are the accepted decode failures. Whatever decodes
/// is re-encoded with every encoder, and the same-format output must decode
/// again without error.

#include <ua/ua.hpp>
#include <spdlog/spdlog.h>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace {

std::vector<uint8_t> encode_binary(ua::MessageContext& context, const ua::ExtensionObject& eo) {
    ua::BinaryEncoder encoder(context);
    encoder.write_extension_object("", eo);
    return encoder.release();
}

std::string encode_xml(ua::MessageContext& context, const ua::ExtensionObject& eo) {
    ua::XmlEncoder encoder(context);
    encoder.write_root(eo);
    return encoder.to_string();
}

std::string encode_json(ua::MessageContext& context, const ua::ExtensionObject& eo, ua::JsonEncoding encoding) {
    ua::JsonEncoderOptions options;
    options.encoding = encoding;
    ua::JsonEncoder encoder(context, options);
    encoder.write_root(eo);
    return encoder.to_string();
}

/// Cross-format encodes may legitimately refuse a body kept in another
/// format's representation; that refusal is an EncodingError.
template <typename F>
void encode_allowing_refusal(F&& encode) {
    try {
        encode();
    } catch (const ua::EncodingError&) {
    } catch (const ua::EncodingLimitsExceeded&) {
    }
}

void reencode_everywhere(ua::MessageContext& context, const ua::ExtensionObject& eo) {
    encode_allowing_refusal([&] { (void)encode_binary(context, eo); });
    encode_allowing_refusal([&] { (void)encode_xml(context, eo); });
    for (auto encoding : {ua::JsonEncoding::Reversible, ua::JsonEncoding::NonReversible,
                          ua::JsonEncoding::Compact, ua::JsonEncoding::Verbose}) {
        encode_allowing_refusal([&] { (void)encode_json(context, eo, encoding); });
    }
}

} // anonymous namespace

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    static const bool quiet = [] {
        spdlog::set_level(spdlog::level::off);
        return true;
    }();
    (void)quiet;

    if (size < 1) return 0;
    const uint8_t selector = data[0];
    ++data;
    --size;

    ua::MessageContext context(ua::UriTable::namespaces("urn:fuzz"), std::make_shared<ua::TypeRegistry>());
    std::string_view text(reinterpret_cast<const char*>(data), size);

    ua::ExtensionObject decoded;
    try {
        switch (selector % 4) {
            case 0: {
                ua::BinaryDecoder decoder(data, size, context);
                decoded = decoder.read_extension_object("");
                break;
            }
            case 1: {
                ua::BinaryDecoder decoder(data, size, context);
                ua::Variant v = decoder.read_variant("");
                (void)decoder.read_data_value("");
                (void)decoder.read_diagnostic_info("");
                ua::BinaryEncoder encoder(context);
                encoder.write_variant("", v);
                auto bytes = encoder.release();
                ua::BinaryDecoder again(bytes, context);
                (void)again.read_variant("");
                return 0;
            }
            case 2: {
                ua::XmlDecoder decoder(text, context);
                decoded = decoder.read_root();
                break;
            }
            default: {
                ua::JsonDecoder decoder(text, context);
                decoded = decoder.read_root();
                break;
            }
        }
    } catch (const ua::DecodingError&) {
        return 0;
    } catch (const ua::EncodingLimitsExceeded&) {
        return 0;
    }

    reencode_everywhere(context, decoded);

    // Same-format round trip of accepted input must succeed.
    switch (selector % 4) {
        case 0: {
            auto bytes = encode_binary(context, decoded);
            ua::BinaryDecoder again(bytes, context);
            (void)again.read_extension_object("");
            break;
        }
        case 2: {
            std::string xml = encode_xml(context, decoded);
            ua::XmlDecoder again(xml, context);
            (void)again.read_root();
            break;
        }
        default: {
            std::string json = encode_json(context, decoded, ua::JsonEncoding::Reversible);
            ua::JsonDecoder again(json, context);
            (void)again.read_root();
            break;
        }
    }
    return 0;
}
