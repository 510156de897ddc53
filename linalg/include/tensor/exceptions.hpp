#ifndef LINALG_TENSOR_EXCEPTIONS_HPP
#define LINALG_TENSOR_EXCEPTIONS_HPP

#include <cstddef>
#include <stdexcept>
#include <string>

namespace linalg {
namespace tensor {

// A 1-based coordinate fell outside [1, axis_size]
class IndexOutOfRangeException : public std::out_of_range {
public:
    IndexOutOfRangeException(const std::string& axis, std::size_t index, std::size_t size)
        : std::out_of_range("Tensor index out of range on axis '" + axis + "': " +
                            std::to_string(index) + " not in [1, " +
                            std::to_string(size) + "]"),
          axis_(axis), index_(index), size_(size) {}

    const std::string& axis() const noexcept { return axis_; }
    std::size_t index() const noexcept { return index_; }
    std::size_t size() const noexcept { return size_; }

private:
    std::string axis_;
    std::size_t index_;
    std::size_t size_;
};

// Operands of a binary elementwise operator have different shapes
class ShapeMismatchException : public std::invalid_argument {
public:
    explicit ShapeMismatchException(const std::string& message)
        : std::invalid_argument(message) {}
};

// Right operand kind is not accepted by the operator
class UnsupportedOperandException : public std::invalid_argument {
public:
    explicit UnsupportedOperandException(const std::string& message)
        : std::invalid_argument(message) {}
};

} // namespace tensor
} // namespace linalg

#endif // LINALG_TENSOR_EXCEPTIONS_HPP
