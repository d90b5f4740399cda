#pragma once
#include "error.hpp"
#include <nlohmann/json.hpp>
#include <cstddef>
#include <cstdint>

namespace ua {

/// Ceilings applied to every encode and decode. Zero disables a length limit.
struct EncodingLimits {
    uint32_t max_string_length = 65535;
    uint32_t max_byte_string_length = 1048560;
    uint32_t max_array_length = 65535;
    uint32_t max_message_size = 2097152;
    uint32_t max_encoding_nesting_levels = 200;
    uint32_t max_inner_diagnostic_depth = 5;
};

void to_json(nlohmann::json& j, const EncodingLimits& l);
void from_json(const nlohmann::json& j, EncodingLimits& l);

/// Length and depth bookkeeping owned by one encoder or decoder.
/// All checks throw EncodingLimitsExceeded.
class LimitsGuard {
public:
    explicit LimitsGuard(const EncodingLimits& limits) : limits_(limits) {}

    const EncodingLimits& limits() const { return limits_; }

    void check_string_length(size_t length) const;
    void check_byte_string_length(size_t length) const;
    void check_array_length(size_t length) const;
    void check_message_size(size_t size) const;
    /// depth counts inner links, the outermost record being 0.
    void check_diagnostic_depth(size_t depth) const;

    size_t nesting_level() const { return nesting_; }

    /// Increments the nesting level for the lifetime of the scope.
    class Nesting {
    public:
        explicit Nesting(LimitsGuard& guard);
        ~Nesting() { --guard_.nesting_; }
        Nesting(const Nesting&) = delete;
        Nesting& operator=(const Nesting&) = delete;

    private:
        LimitsGuard& guard_;
    };

    [[nodiscard]] Nesting enter() { return Nesting(*this); }

private:
    EncodingLimits limits_;
    size_t nesting_ = 0;
};

} // namespace ua
