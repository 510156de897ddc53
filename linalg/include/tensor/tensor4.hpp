#ifndef LINALG_TENSOR_TENSOR4_HPP
#define LINALG_TENSOR_TENSOR4_HPP

#include "tensor_base.hpp"
#include "../number/number.hpp"

#include <cstddef>
#include <functional>
#include <iosfwd>
#include <string>
#include <variant>
#include <vector>

namespace linalg {
namespace tensor {

/// Dense rank-4 tensor with value semantics.
///
/// Storage is nested outer-to-inner as length (rows) -> width (columns)
/// -> depth -> depth2. Axis sizes are always read back from the storage.
/// Public coordinates are 1-based and inclusive; storage is 0-based.
///
/// Arithmetic never mutates its operands: each operator works on a copy of
/// the left operand. set_item is the only in-place mutation.
class Tensor4 : public TensorBase {
public:
    using Data = std::vector<std::vector<std::vector<std::vector<value_type>>>>;
    // Right operand of * and /
    using Operand = std::variant<value_type, Tensor4, number::Number>;

    // Empty tensor (all axes 0)
    Tensor4();

    // Takes the nested data by value: pass an rvalue to hand over ownership.
    // Throws std::invalid_argument if any axis is jagged.
    explicit Tensor4(Data data);

    Tensor4(const Tensor4&) = default;
    Tensor4(Tensor4&&) noexcept = default;
    Tensor4& operator=(const Tensor4&) = default;
    Tensor4& operator=(Tensor4&&) noexcept = default;
    ~Tensor4() override = default;

    /// Generates a tensor of the given sizes. The generator receives the
    /// sequential cell index (0, 1, 2, ...) in length -> width -> depth ->
    /// depth2 order.
    static Tensor4 generate(size_type length, size_type width,
                            size_type depth, size_type depth2,
                            const Generator& generator);

    // Shape information
    size_type length() const noexcept;
    size_type width() const noexcept;
    size_type depth() const noexcept;
    size_type depth2() const noexcept;
    size_type items_count() const override;
    Shape shape() const override;

    // Deep copy of the nested storage
    Data data() const { return data_; }

    /// Value at 1-based coordinates.
    /// Throws IndexOutOfRangeException if any coordinate is outside [1, size].
    value_type item_at(size_type length, size_type width,
                       size_type depth, size_type depth2) const;

    /// Stores value at 1-based coordinates and returns it.
    /// Same range contract as item_at.
    value_type set_item(size_type length, size_type width,
                        size_type depth, size_type depth2, value_type value);

    // Functional traversal, all in nesting order
    Tensor4 map(const Mapper& f) const;
    value_type reduce(const Reducer& f) const override;
    bool any(const Predicate& f) const override;
    bool every(const Predicate& f) const override;
    std::vector<value_type> to_list() const override;

    Tensor4 copy() const;

    // Elementwise arithmetic; binary forms throw ShapeMismatchException
    Tensor4 operator+(const Tensor4& other) const;
    Tensor4 operator-(const Tensor4& other) const;
    Tensor4 operator-() const;

    Tensor4 operator*(value_type scalar) const;
    Tensor4 operator*(const Tensor4& other) const;
    Tensor4 operator*(const number::Number& other) const;
    Tensor4 operator*(const Operand& other) const;

    // Division by a scalar or Number only. Throws DivisionByZeroException on
    // a zero divisor and UnsupportedOperandException for a tensor divisor.
    Tensor4 operator/(value_type scalar) const;
    Tensor4 operator/(const number::Number& other) const;
    Tensor4 operator/(const Operand& other) const;

    // Structural comparison: same shape, then every value in nesting order
    bool operator==(const Tensor4& other) const;
    bool operator!=(const Tensor4& other) const { return !(*this == other); }

    // Equal tensors hash equal
    std::size_t hash() const;

    // Debug representation, e.g. [[[[0, 1]]]]
    std::string to_string() const override;

private:
    Data data_;

    static void validate_rectangular(const Data& data);
    static void check_index(const char* axis, size_type index, size_type size);

    void check_coordinates(size_type length, size_type width,
                           size_type depth, size_type depth2) const;
    void check_same_shape(const Tensor4& other, const char* op_name) const;

    // Copies this tensor and combines each cell with the matching cell of other
    Tensor4 elementwise(const Tensor4& other, const char* op_name,
                        const Reducer& f) const;
};

Tensor4 operator*(Tensor4::value_type scalar, const Tensor4& tensor);
Tensor4 operator*(const number::Number& scalar, const Tensor4& tensor);

std::ostream& operator<<(std::ostream& os, const Tensor4& tensor);

} // namespace tensor
} // namespace linalg

namespace std {

template<>
struct hash<linalg::tensor::Tensor4> {
    std::size_t operator()(const linalg::tensor::Tensor4& tensor) const {
        return tensor.hash();
    }
};

} // namespace std

#endif // LINALG_TENSOR_TENSOR4_HPP
