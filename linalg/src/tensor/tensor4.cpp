#include "tensor/tensor4.hpp"
#include "tensor/exceptions.hpp"
#include "number/exceptions.hpp"

#include <algorithm>
#include <functional>
#include <numeric>
#include <ostream>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace linalg {
namespace tensor {

using number::Number;
using number::DivisionByZeroException;

namespace {

void hash_combine(std::size_t& seed, std::size_t value) {
    seed ^= value + static_cast<std::size_t>(0x9e3779b97f4a7c15ULL) + (seed << 6) + (seed >> 2);
}

} // anonymous namespace

// =============================================================================
// Constructors
// =============================================================================

Tensor4::Tensor4() : TensorBase(4), data_{} {}

Tensor4::Tensor4(Data data) : TensorBase(4), data_(std::move(data)) {
    validate_rectangular(data_);
}

void Tensor4::validate_rectangular(const Data& data) {
    if (data.empty()) {
        return;
    }

    const size_type width = data[0].size();
    const size_type depth = width > 0 ? data[0][0].size() : 0;
    const size_type depth2 = depth > 0 ? data[0][0][0].size() : 0;

    for (const auto& row : data) {
        if (row.size() != width) {
            throw std::invalid_argument("All rows must have the same width");
        }
        for (const auto& column : row) {
            if (column.size() != depth) {
                throw std::invalid_argument("All columns must have the same depth");
            }
            for (const auto& slice : column) {
                if (slice.size() != depth2) {
                    throw std::invalid_argument("All slices must have the same depth2");
                }
            }
        }
    }
}

// =============================================================================
// Generation
// =============================================================================

Tensor4 Tensor4::generate(size_type length, size_type width,
                          size_type depth, size_type depth2,
                          const Generator& generator) {
    const Shape shape = {
        {"length", length},
        {"width", width},
        {"depth", depth},
        {"depth2", depth2},
    };
    return TensorBase::generate(shape, generator).to_tensor4();
}

// =============================================================================
// Shape Information
// =============================================================================

Tensor4::size_type Tensor4::length() const noexcept {
    return data_.size();
}

Tensor4::size_type Tensor4::width() const noexcept {
    return data_.empty() ? 0 : data_[0].size();
}

Tensor4::size_type Tensor4::depth() const noexcept {
    return width() == 0 ? 0 : data_[0][0].size();
}

Tensor4::size_type Tensor4::depth2() const noexcept {
    return depth() == 0 ? 0 : data_[0][0][0].size();
}

// Extents describe materialized storage, so the product cannot overflow
Tensor4::size_type Tensor4::items_count() const {
    return length() * width() * depth() * depth2();
}

Tensor4::Shape Tensor4::shape() const {
    return {
        {"length", length()},
        {"width", width()},
        {"depth", depth()},
        {"depth2", depth2()},
    };
}

// =============================================================================
// Element Access
// =============================================================================

void Tensor4::check_index(const char* axis, size_type index, size_type size) {
    if (index < 1 || index > size) {
        throw IndexOutOfRangeException(axis, index, size);
    }
}

void Tensor4::check_coordinates(size_type length, size_type width,
                                size_type depth, size_type depth2) const {
    check_index("length", length, this->length());
    check_index("width", width, this->width());
    check_index("depth", depth, this->depth());
    check_index("depth2", depth2, this->depth2());
}

Tensor4::value_type Tensor4::item_at(size_type length, size_type width,
                                     size_type depth, size_type depth2) const {
    check_coordinates(length, width, depth, depth2);
    return data_[length - 1][width - 1][depth - 1][depth2 - 1];
}

Tensor4::value_type Tensor4::set_item(size_type length, size_type width,
                                      size_type depth, size_type depth2,
                                      value_type value) {
    check_coordinates(length, width, depth, depth2);
    data_[length - 1][width - 1][depth - 1][depth2 - 1] = value;
    return value;
}

// =============================================================================
// Functional Traversal
// =============================================================================

Tensor4 Tensor4::map(const Mapper& f) const {
    Data mapped = data_;
    for (auto& row : mapped) {
        for (auto& column : row) {
            for (auto& slice : column) {
                std::transform(slice.begin(), slice.end(), slice.begin(), f);
            }
        }
    }
    return Tensor4(std::move(mapped));
}

std::vector<Tensor4::value_type> Tensor4::to_list() const {
    std::vector<value_type> list;
    list.reserve(items_count());
    for (const auto& row : data_) {
        for (const auto& column : row) {
            for (const auto& slice : column) {
                list.insert(list.end(), slice.begin(), slice.end());
            }
        }
    }
    return list;
}

Tensor4::value_type Tensor4::reduce(const Reducer& f) const {
    const std::vector<value_type> list = to_list();
    if (list.empty()) {
        throw std::invalid_argument("reduce: tensor has no elements");
    }
    return std::accumulate(list.begin() + 1, list.end(), list.front(), f);
}

bool Tensor4::any(const Predicate& f) const {
    const std::vector<value_type> list = to_list();
    return std::any_of(list.begin(), list.end(), f);
}

bool Tensor4::every(const Predicate& f) const {
    const std::vector<value_type> list = to_list();
    return std::all_of(list.begin(), list.end(), f);
}

Tensor4 Tensor4::copy() const {
    return Tensor4(data_);
}

// =============================================================================
// Element-wise Arithmetic
// =============================================================================

void Tensor4::check_same_shape(const Tensor4& other, const char* op_name) const {
    if (!shapes_equal(shape(), other.shape())) {
        throw ShapeMismatchException(
            std::string(op_name) + ": shapes must match, got " +
            shape_to_string(shape()) + " and " + shape_to_string(other.shape()));
    }
}

Tensor4 Tensor4::elementwise(const Tensor4& other, const char* op_name,
                             const Reducer& f) const {
    check_same_shape(other, op_name);

    Tensor4 result = copy();
    for (size_type l = 1; l <= length(); ++l) {
        for (size_type w = 1; w <= width(); ++w) {
            for (size_type d = 1; d <= depth(); ++d) {
                for (size_type dd = 1; dd <= depth2(); ++dd) {
                    result.set_item(l, w, d, dd,
                        f(result.item_at(l, w, d, dd), other.item_at(l, w, d, dd)));
                }
            }
        }
    }
    return result;
}

Tensor4 Tensor4::operator+(const Tensor4& other) const {
    return elementwise(other, "add",
                       [](value_type a, value_type b) { return a + b; });
}

Tensor4 Tensor4::operator-(const Tensor4& other) const {
    check_same_shape(other, "subtract");
    return *this + -other;
}

Tensor4 Tensor4::operator-() const {
    return map([](value_type v) { return -v; });
}

Tensor4 Tensor4::operator*(value_type scalar) const {
    return map([scalar](value_type v) { return v * scalar; });
}

Tensor4 Tensor4::operator*(const Tensor4& other) const {
    return elementwise(other, "multiply",
                       [](value_type a, value_type b) { return a * b; });
}

Tensor4 Tensor4::operator*(const Number& other) const {
    return *this * other.data();
}

Tensor4 Tensor4::operator*(const Operand& other) const {
    if (const auto* scalar = std::get_if<value_type>(&other)) {
        return *this * *scalar;
    }
    if (const auto* tensor = std::get_if<Tensor4>(&other)) {
        return *this * *tensor;
    }
    if (const auto* number = std::get_if<Number>(&other)) {
        return *this * *number;
    }
    throw UnsupportedOperandException("multiply: operand holds no value");
}

Tensor4 Tensor4::operator/(value_type scalar) const {
    if (scalar == 0.0) {
        throw DivisionByZeroException();
    }
    return *this * (1.0 / scalar);
}

Tensor4 Tensor4::operator/(const Number& other) const {
    if (other.is_zero()) {
        throw DivisionByZeroException();
    }
    return *this * (1.0 / other.data());
}

Tensor4 Tensor4::operator/(const Operand& other) const {
    if (const auto* scalar = std::get_if<value_type>(&other)) {
        return *this / *scalar;
    }
    if (const auto* number = std::get_if<Number>(&other)) {
        return *this / *number;
    }
    if (std::holds_alternative<Tensor4>(other)) {
        throw UnsupportedOperandException("divide: division by a tensor is not supported");
    }
    throw UnsupportedOperandException("divide: operand holds no value");
}

Tensor4 operator*(Tensor4::value_type scalar, const Tensor4& tensor) {
    return tensor * scalar;
}

Tensor4 operator*(const Number& scalar, const Tensor4& tensor) {
    return tensor * scalar;
}

// =============================================================================
// Equality and Hashing
// =============================================================================

bool Tensor4::operator==(const Tensor4& other) const {
    if (!shapes_equal(shape(), other.shape())) {
        return false;
    }
    return to_list() == other.to_list();
}

std::size_t Tensor4::hash() const {
    std::size_t seed = 0;
    hash_combine(seed, std::hash<size_type>{}(length()));
    hash_combine(seed, std::hash<size_type>{}(width()));
    hash_combine(seed, std::hash<size_type>{}(depth()));
    hash_combine(seed, std::hash<size_type>{}(depth2()));
    for (const auto& row : data_) {
        for (const auto& column : row) {
            for (const auto& slice : column) {
                for (value_type value : slice) {
                    // 0.0 and -0.0 compare equal, so they must hash equal
                    hash_combine(seed, std::hash<value_type>{}(value == 0.0 ? 0.0 : value));
                }
            }
        }
    }
    return seed;
}

// =============================================================================
// Debug Output
// =============================================================================

std::string Tensor4::to_string() const {
    std::ostringstream oss;
    oss << "[";
    for (size_t l = 0; l < data_.size(); ++l) {
        if (l > 0) oss << ", ";
        oss << "[";
        for (size_t w = 0; w < data_[l].size(); ++w) {
            if (w > 0) oss << ", ";
            oss << "[";
            for (size_t d = 0; d < data_[l][w].size(); ++d) {
                if (d > 0) oss << ", ";
                oss << "[";
                const auto& slice = data_[l][w][d];
                for (size_t dd = 0; dd < slice.size(); ++dd) {
                    if (dd > 0) oss << ", ";
                    oss << slice[dd];
                }
                oss << "]";
            }
            oss << "]";
        }
        oss << "]";
    }
    oss << "]";
    return oss.str();
}

std::ostream& operator<<(std::ostream& os, const Tensor4& tensor) {
    return os << tensor.to_string();
}

} // namespace tensor
} // namespace linalg
