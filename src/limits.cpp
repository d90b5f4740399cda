#include "ua/limits.hpp"
#include <string>

namespace ua {

void to_json(nlohmann::json& j, const EncodingLimits& l) {
    j = {
        {"maxStringLength", l.max_string_length},
        {"maxByteStringLength", l.max_byte_string_length},
        {"maxArrayLength", l.max_array_length},
        {"maxMessageSize", l.max_message_size},
        {"maxEncodingNestingLevels", l.max_encoding_nesting_levels},
        {"maxInnerDiagnosticDepth", l.max_inner_diagnostic_depth},
    };
}

void from_json(const nlohmann::json& j, EncodingLimits& l) {
    if (j.contains("maxStringLength")) l.max_string_length = j.at("maxStringLength").get<uint32_t>();
    if (j.contains("maxByteStringLength")) l.max_byte_string_length = j.at("maxByteStringLength").get<uint32_t>();
    if (j.contains("maxArrayLength")) l.max_array_length = j.at("maxArrayLength").get<uint32_t>();
    if (j.contains("maxMessageSize")) l.max_message_size = j.at("maxMessageSize").get<uint32_t>();
    if (j.contains("maxEncodingNestingLevels"))
        l.max_encoding_nesting_levels = j.at("maxEncodingNestingLevels").get<uint32_t>();
    if (j.contains("maxInnerDiagnosticDepth"))
        l.max_inner_diagnostic_depth = j.at("maxInnerDiagnosticDepth").get<uint32_t>();
}

namespace {

void check(uint32_t limit, size_t value, const char* what) {
    if (limit != 0 && value > limit) {
        throw EncodingLimitsExceeded(std::string(what) + " " + std::to_string(value)
                                     + " exceeds the limit of " + std::to_string(limit));
    }
}

} // anonymous namespace

void LimitsGuard::check_string_length(size_t length) const {
    check(limits_.max_string_length, length, "String length");
}

void LimitsGuard::check_byte_string_length(size_t length) const {
    check(limits_.max_byte_string_length, length, "ByteString length");
}

void LimitsGuard::check_array_length(size_t length) const {
    check(limits_.max_array_length, length, "Array length");
}

void LimitsGuard::check_message_size(size_t size) const {
    check(limits_.max_message_size, size, "Message size");
}

void LimitsGuard::check_diagnostic_depth(size_t depth) const {
    if (depth > limits_.max_inner_diagnostic_depth) {
        throw EncodingLimitsExceeded("DiagnosticInfo nesting " + std::to_string(depth)
                                     + " exceeds the limit of "
                                     + std::to_string(limits_.max_inner_diagnostic_depth));
    }
}

LimitsGuard::Nesting::Nesting(LimitsGuard& guard) : guard_(guard) {
    if (guard_.limits_.max_encoding_nesting_levels != 0
        && guard_.nesting_ >= guard_.limits_.max_encoding_nesting_levels) {
        throw EncodingLimitsExceeded("Maximum nesting level of "
                                     + std::to_string(guard_.limits_.max_encoding_nesting_levels)
                                     + " exceeded");
    }
    ++guard_.nesting_;
}

} // namespace ua
