#include "ua/variant.hpp"
#include "ua/encodeable.hpp"
#include <limits>

namespace ua {

// ---------- ExtensionObject ----------

ExtensionObject::ExtensionObject(std::shared_ptr<const IEncodeable> encodeable)
    : body(std::move(encodeable)) {
    if (auto* e = std::get<std::shared_ptr<const IEncodeable>>(body).get()) {
        type_id = e->type_id();
    }
}

ExtensionObjectEncoding ExtensionObject::encoding() const {
    switch (body.index()) {
        // An empty payload is still a body and keeps its encoding byte.
        case 1: return ExtensionObjectEncoding::Binary;
        case 2: return ExtensionObjectEncoding::Xml;
        case 3: return ExtensionObjectEncoding::Json;
        case 4: return std::get<std::shared_ptr<const IEncodeable>>(body)
                           ? ExtensionObjectEncoding::EncodeableObject
                           : ExtensionObjectEncoding::None;
        default: return ExtensionObjectEncoding::None;
    }
}

const IEncodeable* ExtensionObject::encodeable() const {
    auto* p = std::get_if<std::shared_ptr<const IEncodeable>>(&body);
    return p ? p->get() : nullptr;
}

bool ExtensionObject::operator==(const ExtensionObject& o) const {
    if (type_id != o.type_id) return false;
    const IEncodeable* a = encodeable();
    const IEncodeable* b = o.encodeable();
    if (a || b) {
        return a && b && a->is_equal(*b);
    }
    if (encoding() == ExtensionObjectEncoding::None && o.encoding() == ExtensionObjectEncoding::None) {
        return true;
    }
    return body == o.body;
}

// ---------- Matrix ----------

std::optional<size_t> matrix_element_count(const std::vector<int32_t>& dimensions) {
    if (dimensions.empty()) return std::nullopt;
    uint64_t product = 1;
    for (int32_t d : dimensions) {
        if (d <= 0) return std::nullopt;
        product *= static_cast<uint64_t>(d);
        if (product > static_cast<uint64_t>(std::numeric_limits<int32_t>::max())) return std::nullopt;
    }
    return static_cast<size_t>(product);
}

// ---------- Variant ----------

Variant::Variant() = default;
Variant::Variant(const Variant& o) = default;
Variant::Variant(Variant&& o) noexcept = default;
Variant& Variant::operator=(const Variant& o) = default;
Variant& Variant::operator=(Variant&& o) noexcept = default;
Variant::~Variant() = default;

Variant Variant::from_storage(Storage storage, bool is_array, std::vector<int32_t> dimensions) {
    Variant v;
    size_t count = std::visit([](const auto& s) -> size_t {
        if constexpr (std::is_same_v<std::decay_t<decltype(s)>, std::monostate>) {
            return 0;
        } else {
            return s.size();
        }
    }, storage);
    if (storage.index() == 0) return v;
    if (!is_array && count != 1) {
        throw InvariantViolation("A scalar Variant holds exactly one element");
    }
    if (!is_array && storage.index() == static_cast<size_t>(BuiltInType::Variant)) {
        throw InvariantViolation("A scalar Variant cannot hold another Variant");
    }
    if (!dimensions.empty()) {
        if (!is_array) {
            throw InvariantViolation("Only arrays carry dimensions");
        }
        auto expected = matrix_element_count(dimensions);
        if (!expected || *expected != count) {
            throw InvariantViolation("Variant dimensions do not match its element count");
        }
        if (dimensions.size() == 1) dimensions.clear();
    }
    v.storage_ = std::move(storage);
    v.is_array_ = is_array;
    v.dimensions_ = std::move(dimensions);
    return v;
}

int32_t Variant::value_rank() const {
    if (!is_array_) return -1;
    if (!dimensions_.empty()) return static_cast<int32_t>(dimensions_.size());
    return 1;
}

size_t Variant::size() const {
    return std::visit([](const auto& s) -> size_t {
        if constexpr (std::is_same_v<std::decay_t<decltype(s)>, std::monostate>) {
            return 0;
        } else {
            return s.size();
        }
    }, storage_);
}

bool Variant::operator==(const Variant& o) const {
    return is_array_ == o.is_array_ && dimensions_ == o.dimensions_ && storage_ == o.storage_;
}

} // namespace ua
