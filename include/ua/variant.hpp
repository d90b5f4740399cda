#pragma once
#include "builtin_types.hpp"
#include <cstddef>
#include <memory>
#include <optional>
#include <type_traits>
#include <variant>
#include <vector>

namespace ua {

class IEncodeable;
class Variant;
struct DataValue;

// ---------- ExtensionObject ----------

enum class ExtensionObjectEncoding : uint8_t {
    None = 0,
    Binary = 1,
    Xml = 2,
    Json = 3,
    EncodeableObject = 4
};

/// Body of an ExtensionObject whose type is carried as a JSON object text.
struct JsonBody {
    std::string json;

    bool operator==(const JsonBody& o) const { return json == o.json; }
};

/// Envelope for a structured value. The body is either absent, an opaque
/// payload tagged with the encoding it arrived in, or a decoded object.
class ExtensionObject {
public:
    using Body = std::variant<std::monostate, ByteString, XmlElement, JsonBody,
                              std::shared_ptr<const IEncodeable>>;

    ExpandedNodeId type_id;
    Body body;

    ExtensionObject() = default;
    ExtensionObject(ExpandedNodeId type_id, Body body)
        : type_id(std::move(type_id)), body(std::move(body)) {}
    /// Wraps a decoded object; type_id is taken from the object.
    explicit ExtensionObject(std::shared_ptr<const IEncodeable> encodeable);

    ExtensionObjectEncoding encoding() const;
    bool is_null() const { return type_id.is_null() && encoding() == ExtensionObjectEncoding::None; }

    const IEncodeable* encodeable() const;

    template <typename T>
    const T* body_as() const { return dynamic_cast<const T*>(encodeable()); }

    bool operator==(const ExtensionObject& o) const;
    bool operator!=(const ExtensionObject& o) const { return !(*this == o); }
};

// ---------- Type mapping ----------

template <typename T> struct BuiltInTypeOf;
template <> struct BuiltInTypeOf<bool>            { static constexpr BuiltInType value = BuiltInType::Boolean; };
template <> struct BuiltInTypeOf<int8_t>          { static constexpr BuiltInType value = BuiltInType::SByte; };
template <> struct BuiltInTypeOf<uint8_t>         { static constexpr BuiltInType value = BuiltInType::Byte; };
template <> struct BuiltInTypeOf<int16_t>         { static constexpr BuiltInType value = BuiltInType::Int16; };
template <> struct BuiltInTypeOf<uint16_t>        { static constexpr BuiltInType value = BuiltInType::UInt16; };
template <> struct BuiltInTypeOf<int32_t>         { static constexpr BuiltInType value = BuiltInType::Int32; };
template <> struct BuiltInTypeOf<uint32_t>        { static constexpr BuiltInType value = BuiltInType::UInt32; };
template <> struct BuiltInTypeOf<int64_t>         { static constexpr BuiltInType value = BuiltInType::Int64; };
template <> struct BuiltInTypeOf<uint64_t>        { static constexpr BuiltInType value = BuiltInType::UInt64; };
template <> struct BuiltInTypeOf<float>           { static constexpr BuiltInType value = BuiltInType::Float; };
template <> struct BuiltInTypeOf<double>          { static constexpr BuiltInType value = BuiltInType::Double; };
template <> struct BuiltInTypeOf<std::string>     { static constexpr BuiltInType value = BuiltInType::String; };
template <> struct BuiltInTypeOf<DateTime>        { static constexpr BuiltInType value = BuiltInType::DateTime; };
template <> struct BuiltInTypeOf<Guid>            { static constexpr BuiltInType value = BuiltInType::Guid; };
template <> struct BuiltInTypeOf<ByteString>      { static constexpr BuiltInType value = BuiltInType::ByteString; };
template <> struct BuiltInTypeOf<XmlElement>      { static constexpr BuiltInType value = BuiltInType::XmlElement; };
template <> struct BuiltInTypeOf<NodeId>          { static constexpr BuiltInType value = BuiltInType::NodeId; };
template <> struct BuiltInTypeOf<ExpandedNodeId>  { static constexpr BuiltInType value = BuiltInType::ExpandedNodeId; };
template <> struct BuiltInTypeOf<StatusCode>      { static constexpr BuiltInType value = BuiltInType::StatusCode; };
template <> struct BuiltInTypeOf<QualifiedName>   { static constexpr BuiltInType value = BuiltInType::QualifiedName; };
template <> struct BuiltInTypeOf<LocalizedText>   { static constexpr BuiltInType value = BuiltInType::LocalizedText; };
template <> struct BuiltInTypeOf<ExtensionObject> { static constexpr BuiltInType value = BuiltInType::ExtensionObject; };
template <> struct BuiltInTypeOf<DataValue>       { static constexpr BuiltInType value = BuiltInType::DataValue; };
template <> struct BuiltInTypeOf<Variant>         { static constexpr BuiltInType value = BuiltInType::Variant; };
template <> struct BuiltInTypeOf<DiagnosticInfo>  { static constexpr BuiltInType value = BuiltInType::DiagnosticInfo; };

template <typename T, typename = void>
struct is_builtin : std::false_type {};
template <typename T>
struct is_builtin<T, std::void_t<decltype(BuiltInTypeOf<T>::value)>> : std::true_type {};
template <typename T>
constexpr bool is_builtin_v = is_builtin<T>::value;

template <typename T> struct TypeTag { using type = T; };

/// Calls f(TypeTag<T>{}) with the C++ type backing a wire type id.
/// Throws DecodingError for ids that have no value representation.
template <typename F>
decltype(auto) visit_builtin_type(BuiltInType type, F&& f);

// ---------- Matrix ----------

/// Product of the dimensions, or nullopt when a dimension is not positive or
/// the product overflows Int32.
std::optional<size_t> matrix_element_count(const std::vector<int32_t>& dimensions);

/// Row-major multi-dimensional array with at least two dimensions.
template <typename T>
class Matrix {
public:
    /// Throws InvariantViolation when the element count does not equal the
    /// product of the dimensions.
    Matrix(std::vector<T> elements, std::vector<int32_t> dimensions)
        : elements_(std::move(elements)), dimensions_(std::move(dimensions)) {
        if (dimensions_.size() < 2) {
            throw InvariantViolation("Matrix requires at least two dimensions");
        }
        auto count = matrix_element_count(dimensions_);
        if (!count || *count != elements_.size()) {
            throw InvariantViolation("Matrix element count does not match its dimensions");
        }
    }

    /// Builds a 2-D matrix from rows of equal length.
    static Matrix from_rows(const std::vector<std::vector<T>>& rows) {
        if (rows.empty() || rows.front().empty()) {
            throw InvariantViolation("Matrix rows must not be empty");
        }
        std::vector<T> flat;
        flat.reserve(rows.size() * rows.front().size());
        for (const auto& row : rows) {
            if (row.size() != rows.front().size()) {
                throw InvariantViolation("Matrix rows must all have the same length");
            }
            flat.insert(flat.end(), row.begin(), row.end());
        }
        return Matrix(std::move(flat), {static_cast<int32_t>(rows.size()),
                                        static_cast<int32_t>(rows.front().size())});
    }

    /// Jagged view of the first dimension; each entry holds the flattened
    /// remaining dimensions.
    std::vector<std::vector<T>> rows() const {
        std::vector<std::vector<T>> out;
        size_t stride = elements_.size() / static_cast<size_t>(dimensions_.front());
        for (size_t i = 0; i < static_cast<size_t>(dimensions_.front()); ++i) {
            out.emplace_back(elements_.begin() + static_cast<std::ptrdiff_t>(i * stride),
                             elements_.begin() + static_cast<std::ptrdiff_t>((i + 1) * stride));
        }
        return out;
    }

    /// Element at a full index, one entry per dimension.
    T at(const std::vector<int32_t>& index) const {
        if (index.size() != dimensions_.size()) {
            throw std::out_of_range("Matrix index rank mismatch");
        }
        size_t offset = 0;
        for (size_t d = 0; d < dimensions_.size(); ++d) {
            if (index[d] < 0 || index[d] >= dimensions_[d]) {
                throw std::out_of_range("Matrix index out of range");
            }
            offset = offset * static_cast<size_t>(dimensions_[d]) + static_cast<size_t>(index[d]);
        }
        return elements_[offset];
    }

    const std::vector<T>& elements() const { return elements_; }
    const std::vector<int32_t>& dimensions() const { return dimensions_; }

    bool operator==(const Matrix& o) const {
        return elements_ == o.elements_ && dimensions_ == o.dimensions_;
    }

private:
    std::vector<T> elements_;
    std::vector<int32_t> dimensions_;
};

// ---------- Variant ----------

/// Self-describing value: a scalar, a 1-D array or a matrix of one built-in
/// type. The storage alternative index equals the wire type id, so elements
/// are homogeneous by construction.
class Variant {
public:
    using Storage = std::variant<
        std::monostate,
        std::vector<bool>,
        std::vector<int8_t>,
        std::vector<uint8_t>,
        std::vector<int16_t>,
        std::vector<uint16_t>,
        std::vector<int32_t>,
        std::vector<uint32_t>,
        std::vector<int64_t>,
        std::vector<uint64_t>,
        std::vector<float>,
        std::vector<double>,
        std::vector<std::string>,
        std::vector<DateTime>,
        std::vector<Guid>,
        std::vector<ByteString>,
        std::vector<XmlElement>,
        std::vector<NodeId>,
        std::vector<ExpandedNodeId>,
        std::vector<StatusCode>,
        std::vector<QualifiedName>,
        std::vector<LocalizedText>,
        std::vector<ExtensionObject>,
        std::vector<DataValue>,
        std::vector<Variant>,
        std::vector<DiagnosticInfo>>;

    Variant();
    Variant(const Variant& o);
    Variant(Variant&& o) noexcept;
    Variant& operator=(const Variant& o);
    Variant& operator=(Variant&& o) noexcept;
    ~Variant();

    /// Scalar of any built-in type except Variant.
    template <typename T,
              typename = std::enable_if_t<is_builtin_v<std::decay_t<T>>
                                          && !std::is_same_v<std::decay_t<T>, Variant>>>
    Variant(T&& value) {
        std::vector<std::decay_t<T>> one;
        one.push_back(std::forward<T>(value));
        storage_ = std::move(one);
    }

    Variant(const char* text) : Variant(std::string(text)) {}

    template <typename T>
    static Variant from_array(std::vector<T> values) {
        static_assert(is_builtin_v<T>, "not a built-in type");
        Variant v;
        v.storage_ = std::move(values);
        v.is_array_ = true;
        return v;
    }

    template <typename T>
    static Variant from_matrix(const Matrix<T>& matrix) {
        Variant v = from_array(matrix.elements());
        v.dimensions_ = matrix.dimensions();
        return v;
    }

    /// Array or matrix from raw storage. Throws InvariantViolation when the
    /// dimensions do not describe the element count.
    static Variant from_storage(Storage storage, bool is_array, std::vector<int32_t> dimensions = {});

    static Variant from_enum(int32_t value) { return Variant(value); }

    BuiltInType type() const { return static_cast<BuiltInType>(storage_.index()); }
    bool is_null() const { return storage_.index() == 0; }
    bool is_scalar() const { return !is_null() && !is_array_; }
    bool is_array() const { return is_array_; }
    bool is_matrix() const { return is_array_ && dimensions_.size() >= 2; }

    /// -1 for scalars, 1 for arrays, the dimension count for matrices.
    int32_t value_rank() const;
    /// Empty unless the value is a matrix.
    const std::vector<int32_t>& dimensions() const { return dimensions_; }
    /// Number of elements; 1 for a scalar, 0 for null.
    size_t size() const;

    template <typename T>
    const T* get_if() const {
        auto* vec = std::get_if<std::vector<T>>(&storage_);
        if (!vec || is_array_ || vec->empty()) return nullptr;
        return &vec->front();
    }

    /// Scalar value; throws UaError(BadTypeMismatch) for another type or shape.
    template <typename T>
    T get() const {
        auto* vec = std::get_if<std::vector<T>>(&storage_);
        if (!vec || is_array_ || vec->empty()) {
            throw UaError(status::BadTypeMismatch, "Variant does not hold the requested scalar");
        }
        return vec->front();
    }

    /// Flattened elements of an array or matrix.
    template <typename T>
    const std::vector<T>& array() const {
        auto* vec = std::get_if<std::vector<T>>(&storage_);
        if (!vec || !is_array_) {
            throw UaError(status::BadTypeMismatch, "Variant does not hold the requested array");
        }
        return *vec;
    }

    template <typename T>
    Matrix<T> matrix() const {
        if (!is_matrix()) {
            throw UaError(status::BadTypeMismatch, "Variant does not hold a matrix");
        }
        return Matrix<T>(array<T>(), dimensions_);
    }

    const Storage& storage() const { return storage_; }

    bool operator==(const Variant& o) const;
    bool operator!=(const Variant& o) const { return !(*this == o); }

private:
    Storage storage_;
    bool is_array_ = false;
    std::vector<int32_t> dimensions_;
};

// ---------- DataValue ----------

struct DataValue {
    Variant value;
    StatusCode status;
    DateTime source_timestamp;
    uint16_t source_picoseconds = 0;
    DateTime server_timestamp;
    uint16_t server_picoseconds = 0;

    bool is_null() const {
        return value.is_null() && status.code == status::Good && source_timestamp.is_min()
               && server_timestamp.is_min() && source_picoseconds == 0 && server_picoseconds == 0;
    }

    bool operator==(const DataValue& o) const {
        return value == o.value && status == o.status
               && source_timestamp == o.source_timestamp
               && source_picoseconds == o.source_picoseconds
               && server_timestamp == o.server_timestamp
               && server_picoseconds == o.server_picoseconds;
    }
    bool operator!=(const DataValue& o) const { return !(*this == o); }
};

// ---------- visit_builtin_type ----------

template <typename F>
decltype(auto) visit_builtin_type(BuiltInType type, F&& f) {
    switch (type) {
        case BuiltInType::Boolean:         return f(TypeTag<bool>{});
        case BuiltInType::SByte:           return f(TypeTag<int8_t>{});
        case BuiltInType::Byte:            return f(TypeTag<uint8_t>{});
        case BuiltInType::Int16:           return f(TypeTag<int16_t>{});
        case BuiltInType::UInt16:          return f(TypeTag<uint16_t>{});
        case BuiltInType::Enumeration:
        case BuiltInType::Int32:           return f(TypeTag<int32_t>{});
        case BuiltInType::UInt32:          return f(TypeTag<uint32_t>{});
        case BuiltInType::Int64:           return f(TypeTag<int64_t>{});
        case BuiltInType::UInt64:          return f(TypeTag<uint64_t>{});
        case BuiltInType::Float:           return f(TypeTag<float>{});
        case BuiltInType::Double:          return f(TypeTag<double>{});
        case BuiltInType::String:          return f(TypeTag<std::string>{});
        case BuiltInType::DateTime:        return f(TypeTag<DateTime>{});
        case BuiltInType::Guid:            return f(TypeTag<Guid>{});
        case BuiltInType::ByteString:      return f(TypeTag<ByteString>{});
        case BuiltInType::XmlElement:      return f(TypeTag<XmlElement>{});
        case BuiltInType::NodeId:          return f(TypeTag<NodeId>{});
        case BuiltInType::ExpandedNodeId:  return f(TypeTag<ExpandedNodeId>{});
        case BuiltInType::StatusCode:      return f(TypeTag<StatusCode>{});
        case BuiltInType::QualifiedName:   return f(TypeTag<QualifiedName>{});
        case BuiltInType::LocalizedText:   return f(TypeTag<LocalizedText>{});
        case BuiltInType::ExtensionObject: return f(TypeTag<ExtensionObject>{});
        case BuiltInType::DataValue:       return f(TypeTag<DataValue>{});
        case BuiltInType::Variant:         return f(TypeTag<Variant>{});
        case BuiltInType::DiagnosticInfo:  return f(TypeTag<DiagnosticInfo>{});
        case BuiltInType::Null:
            break;
    }
    throw DecodingError("Unsupported built-in type id " + std::to_string(static_cast<int>(type)));
}

} // namespace ua
