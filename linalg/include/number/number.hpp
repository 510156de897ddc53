#ifndef LINALG_NUMBER_NUMBER_HPP
#define LINALG_NUMBER_NUMBER_HPP

#include <string>

namespace linalg {
namespace number {

/// Scalar wrapper usable as an arithmetic operand next to plain numbers.
class Number {
public:
    using value_type = double;

    Number() : data_(0.0) {}
    explicit Number(value_type value) : data_(value) {}

    Number(const Number&) = default;
    Number(Number&&) noexcept = default;
    Number& operator=(const Number&) = default;
    Number& operator=(Number&&) noexcept = default;

    // Wrapped numeric value
    value_type data() const noexcept { return data_; }

    bool is_zero() const noexcept { return data_ == 0.0; }

    bool operator==(const Number& other) const noexcept { return data_ == other.data_; }
    bool operator!=(const Number& other) const noexcept { return !(*this == other); }

    std::string to_string() const;

private:
    value_type data_;
};

} // namespace number
} // namespace linalg

#endif // LINALG_NUMBER_NUMBER_HPP
