#pragma once
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <optional>

namespace ua {

/// 32-bit OPC UA result code. The top two bits carry the severity.
struct StatusCode {
    uint32_t code = 0;

    constexpr StatusCode() = default;
    constexpr StatusCode(uint32_t c) : code(c) {}

    constexpr bool is_good() const      { return (code & 0xC0000000u) == 0; }
    constexpr bool is_uncertain() const { return (code & 0xC0000000u) == 0x40000000u; }
    constexpr bool is_bad() const       { return (code & 0x80000000u) != 0; }

    /// Code without the info bits.
    constexpr uint32_t code_bits() const { return code & 0xFFFF0000u; }

    constexpr bool operator==(const StatusCode& o) const { return code == o.code; }
    constexpr bool operator!=(const StatusCode& o) const { return code != o.code; }
};

namespace status {
    constexpr uint32_t Good                         = 0x00000000;
    constexpr uint32_t Uncertain                    = 0x40000000;
    constexpr uint32_t Bad                          = 0x80000000;
    constexpr uint32_t BadUnexpectedError           = 0x80010000;
    constexpr uint32_t BadInternalError             = 0x80020000;
    constexpr uint32_t BadOutOfMemory               = 0x80030000;
    constexpr uint32_t BadResourceUnavailable       = 0x80040000;
    constexpr uint32_t BadCommunicationError        = 0x80050000;
    constexpr uint32_t BadEncodingError             = 0x80060000;
    constexpr uint32_t BadDecodingError             = 0x80070000;
    constexpr uint32_t BadEncodingLimitsExceeded    = 0x80080000;
    constexpr uint32_t BadUnknownResponse           = 0x80090000;
    constexpr uint32_t BadTimeout                   = 0x800A0000;
    constexpr uint32_t BadServiceUnsupported        = 0x800B0000;
    constexpr uint32_t BadShutdown                  = 0x800C0000;
    constexpr uint32_t BadNothingToDo               = 0x800F0000;
    constexpr uint32_t BadTooManyOperations         = 0x80100000;
    constexpr uint32_t BadDataTypeIdUnknown         = 0x80110000;
    constexpr uint32_t BadWaitingForInitialData     = 0x80320000;
    constexpr uint32_t BadNodeIdInvalid             = 0x80330000;
    constexpr uint32_t BadNodeIdUnknown             = 0x80340000;
    constexpr uint32_t BadAttributeIdInvalid        = 0x80350000;
    constexpr uint32_t BadDataEncodingInvalid       = 0x80380000;
    constexpr uint32_t BadDataEncodingUnsupported   = 0x80390000;
    constexpr uint32_t BadNotReadable               = 0x803A0000;
    constexpr uint32_t BadNotWritable               = 0x803B0000;
    constexpr uint32_t BadOutOfRange                = 0x803C0000;
    constexpr uint32_t BadNotSupported              = 0x803D0000;
    constexpr uint32_t BadNotFound                  = 0x803E0000;
    constexpr uint32_t BadTypeMismatch              = 0x80740000;
    constexpr uint32_t BadNoData                    = 0x809B0000;
    constexpr uint32_t BadDataLost                  = 0x809D0000;
    constexpr uint32_t BadRequestTooLarge           = 0x80B80000;
    constexpr uint32_t BadResponseTooLarge          = 0x80B90000;
    constexpr uint32_t UncertainLastUsableValue     = 0x40900000;
    constexpr uint32_t UncertainSensorNotAccurate   = 0x40930000;
    constexpr uint32_t GoodClamped                  = 0x00300000;
    constexpr uint32_t GoodNoData                   = 0x00A50000;
    constexpr uint32_t GoodMoreData                 = 0x00A60000;
} // namespace status

/// Symbolic name of a status code (info bits ignored), empty if unknown.
std::string_view status_symbol(StatusCode code);

/// Reverse lookup of status_symbol().
std::optional<StatusCode> status_from_symbol(std::string_view symbol);

/// Base of every recoverable codec failure.
class UaError : public std::runtime_error {
public:
    StatusCode status;
    UaError(StatusCode status, const std::string& msg)
        : std::runtime_error(msg), status(status) {}
};

/// Malformed, truncated or inconsistent wire data.
class DecodingError : public UaError {
public:
    explicit DecodingError(const std::string& msg)
        : UaError(status::BadDecodingError, msg) {}
};

/// A value cannot be represented in the active wire format.
class EncodingError : public UaError {
public:
    explicit EncodingError(const std::string& msg)
        : UaError(status::BadEncodingError, msg) {}
};

/// A length or nesting ceiling from EncodingLimits was hit.
class EncodingLimitsExceeded : public UaError {
public:
    explicit EncodingLimitsExceeded(const std::string& msg)
        : UaError(status::BadEncodingLimitsExceeded, msg) {}
};

/// The requested format/variant combination is not available.
class NotSupportedError : public UaError {
public:
    explicit NotSupportedError(const std::string& msg)
        : UaError(status::BadNotSupported, msg) {}
};

/// Programming error: unbalanced namespace scopes, malformed Matrix, etc.
class InvariantViolation : public std::logic_error {
public:
    using std::logic_error::logic_error;
};

} // namespace ua
