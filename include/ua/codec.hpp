#pragma once
#include "context.hpp"
#include "encodeable.hpp"
#include "json_codec.hpp"
#include <cstdint>
#include <memory>
#include <optional>
#include <vector>

namespace ua {

/// Whole-message entry points. A message is framed with its encoding id so
/// the receiver can find the type through the registry:
///   Binary  NodeId followed by the body
///   XML     <ExtensionObject> with TypeId and Body
///   JSON    the ExtensionObject form of the selected JSON encoding
class Codec {
public:
    /// Throws EncodingError, EncodingLimitsExceeded (including
    /// max_message_size) or NotSupportedError.
    [[nodiscard]] static std::vector<uint8_t> encode_message(
        const IEncodeable& message, MessageContext& context, EncodingType format,
        JsonEncoderOptions json_options = {});

    /// Throws DecodingError or EncodingLimitsExceeded and never returns a
    /// partially decoded message. An unregistered top-level type, or one that
    /// differs from expected_type, is a DecodingError.
    [[nodiscard]] static std::unique_ptr<IEncodeable> decode_message(
        const uint8_t* data, size_t size, MessageContext& context, EncodingType format,
        const std::optional<ExpandedNodeId>& expected_type = std::nullopt,
        JsonEncoding json_encoding = JsonEncoding::Reversible);

    [[nodiscard]] static std::unique_ptr<IEncodeable> decode_message(
        const std::vector<uint8_t>& data, MessageContext& context, EncodingType format,
        const std::optional<ExpandedNodeId>& expected_type = std::nullopt,
        JsonEncoding json_encoding = JsonEncoding::Reversible) {
        return decode_message(data.data(), data.size(), context, format, expected_type, json_encoding);
    }
};

} // namespace ua
