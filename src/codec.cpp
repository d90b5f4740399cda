#include "ua/codec.hpp"
#include "ua/binary_codec.hpp"
#include "ua/xml_codec.hpp"
#include <spdlog/spdlog.h>
#include <new>
#include <string>
#include <string_view>

namespace ua {

namespace {

std::vector<uint8_t> to_bytes(const std::string& text) {
    return std::vector<uint8_t>(text.begin(), text.end());
}

/// Non-owning handle so a caller's message can sit in an ExtensionObject.
std::shared_ptr<const IEncodeable> borrow(const IEncodeable& message) {
    return std::shared_ptr<const IEncodeable>(std::shared_ptr<const IEncodeable>(), &message);
}

std::unique_ptr<IEncodeable> take_body(const ExtensionObject& envelope) {
    const IEncodeable* body = envelope.encodeable();
    if (!body) {
        throw DecodingError("Unknown message type " + envelope.type_id.to_string());
    }
    return body->clone();
}

std::unique_ptr<IEncodeable> decode_body(const uint8_t* data, size_t size, MessageContext& context,
                                         EncodingType format, JsonEncoding json_encoding) {
    std::string_view text(reinterpret_cast<const char*>(data), size);
    switch (format) {
        case EncodingType::Binary: {
            BinaryDecoder decoder(data, size, context);
            NodeId encoding_id = decoder.read_node_id("");
            auto message = context.create(EncodingType::Binary, encoding_id);
            if (!message) {
                throw DecodingError("Unknown message type " + encoding_id.to_string());
            }
            decoder.read_encodeable("", *message);
            if (decoder.remaining() != 0) {
                throw DecodingError(std::to_string(decoder.remaining()) + " trailing bytes after message");
            }
            return message;
        }
        case EncodingType::Xml: {
            XmlDecoder decoder(text, context);
            return take_body(decoder.read_root());
        }
        case EncodingType::Json: {
            JsonDecoder decoder(text, context, json_encoding);
            return take_body(decoder.read_root());
        }
    }
    throw NotSupportedError("Unknown encoding type");
}

} // anonymous namespace

std::vector<uint8_t> Codec::encode_message(const IEncodeable& message, MessageContext& context,
                                           EncodingType format, JsonEncoderOptions json_options) {
    std::vector<uint8_t> bytes;
    try {
        switch (format) {
            case EncodingType::Binary: {
                BinaryEncoder encoder(context);
                encoder.write_node_id("", context.to_node_id(message.binary_encoding_id()));
                encoder.write_encodeable("", message);
                bytes = encoder.release();
                break;
            }
            case EncodingType::Xml: {
                XmlEncoder encoder(context);
                encoder.write_root(ExtensionObject(borrow(message)));
                bytes = to_bytes(encoder.to_string());
                break;
            }
            case EncodingType::Json: {
                JsonEncoder encoder(context, json_options);
                encoder.write_root(ExtensionObject(borrow(message)));
                bytes = to_bytes(encoder.to_string());
                break;
            }
        }
    } catch (const UaError&) {
        throw;
    } catch (const InvariantViolation&) {
        throw;
    } catch (const std::bad_alloc&) {
        throw EncodingLimitsExceeded("Out of memory while encoding " + message.type_name());
    } catch (const std::exception& e) {
        throw EncodingError(std::string("Failed to encode ") + message.type_name() + ": " + e.what());
    }

    LimitsGuard(context.limits).check_message_size(bytes.size());
    return bytes;
}

std::unique_ptr<IEncodeable> Codec::decode_message(const uint8_t* data, size_t size,
                                                   MessageContext& context, EncodingType format,
                                                   const std::optional<ExpandedNodeId>& expected_type,
                                                   JsonEncoding json_encoding) {
    LimitsGuard(context.limits).check_message_size(size);

    std::unique_ptr<IEncodeable> message;
    try {
        message = decode_body(data, size, context, format, json_encoding);
    } catch (const UaError&) {
        throw;
    } catch (const InvariantViolation&) {
        throw;
    } catch (const std::bad_alloc&) {
        throw EncodingLimitsExceeded("Out of memory while decoding a " + std::string(encoding_type_name(format))
                                     + " message");
    } catch (const std::exception& e) {
        throw DecodingError(std::string("Malformed ") + std::string(encoding_type_name(format))
                            + " message: " + e.what());
    }

    if (expected_type
        && context.to_absolute(*expected_type) != context.to_absolute(message->type_id())) {
        throw DecodingError("Expected " + expected_type->to_string() + " but decoded "
                            + message->type_name());
    }
    spdlog::debug("Decoded {} message {}", encoding_type_name(format), message->type_name());
    return message;
}

} // namespace ua
