#include "ua/error.hpp"
#include <array>
#include <utility>

namespace ua {

namespace {

struct StatusEntry {
    uint32_t code;
    std::string_view symbol;
};

constexpr std::array<StatusEntry, 39> STATUS_TABLE{{
    {status::Good, "Good"},
    {status::Uncertain, "Uncertain"},
    {status::Bad, "Bad"},
    {status::BadUnexpectedError, "BadUnexpectedError"},
    {status::BadInternalError, "BadInternalError"},
    {status::BadOutOfMemory, "BadOutOfMemory"},
    {status::BadResourceUnavailable, "BadResourceUnavailable"},
    {status::BadCommunicationError, "BadCommunicationError"},
    {status::BadEncodingError, "BadEncodingError"},
    {status::BadDecodingError, "BadDecodingError"},
    {status::BadEncodingLimitsExceeded, "BadEncodingLimitsExceeded"},
    {status::BadUnknownResponse, "BadUnknownResponse"},
    {status::BadTimeout, "BadTimeout"},
    {status::BadServiceUnsupported, "BadServiceUnsupported"},
    {status::BadShutdown, "BadShutdown"},
    {status::BadNothingToDo, "BadNothingToDo"},
    {status::BadTooManyOperations, "BadTooManyOperations"},
    {status::BadDataTypeIdUnknown, "BadDataTypeIdUnknown"},
    {status::BadWaitingForInitialData, "BadWaitingForInitialData"},
    {status::BadNodeIdInvalid, "BadNodeIdInvalid"},
    {status::BadNodeIdUnknown, "BadNodeIdUnknown"},
    {status::BadAttributeIdInvalid, "BadAttributeIdInvalid"},
    {status::BadDataEncodingInvalid, "BadDataEncodingInvalid"},
    {status::BadDataEncodingUnsupported, "BadDataEncodingUnsupported"},
    {status::BadNotReadable, "BadNotReadable"},
    {status::BadNotWritable, "BadNotWritable"},
    {status::BadOutOfRange, "BadOutOfRange"},
    {status::BadNotSupported, "BadNotSupported"},
    {status::BadNotFound, "BadNotFound"},
    {status::BadTypeMismatch, "BadTypeMismatch"},
    {status::BadNoData, "BadNoData"},
    {status::BadDataLost, "BadDataLost"},
    {status::BadRequestTooLarge, "BadRequestTooLarge"},
    {status::BadResponseTooLarge, "BadResponseTooLarge"},
    {status::UncertainLastUsableValue, "UncertainLastUsableValue"},
    {status::UncertainSensorNotAccurate, "UncertainSensorNotAccurate"},
    {status::GoodClamped, "GoodClamped"},
    {status::GoodNoData, "GoodNoData"},
    {status::GoodMoreData, "GoodMoreData"},
}};

} // anonymous namespace

std::string_view status_symbol(StatusCode code) {
    uint32_t bits = code.code_bits();
    for (const auto& entry : STATUS_TABLE) {
        if (entry.code == bits) return entry.symbol;
    }
    return {};
}

std::optional<StatusCode> status_from_symbol(std::string_view symbol) {
    for (const auto& entry : STATUS_TABLE) {
        if (entry.symbol == symbol) return StatusCode(entry.code);
    }
    return std::nullopt;
}

} // namespace ua
