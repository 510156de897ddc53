#ifndef LINALG_NUMBER_EXCEPTIONS_HPP
#define LINALG_NUMBER_EXCEPTIONS_HPP

#include <stdexcept>
#include <string>

namespace linalg {
namespace number {

/// Thrown when a scalar or wrapped-scalar divisor is zero.
class DivisionByZeroException : public std::domain_error {
public:
    DivisionByZeroException()
        : std::domain_error("Division by zero") {}

    explicit DivisionByZeroException(const std::string& message)
        : std::domain_error(message) {}
};

} // namespace number
} // namespace linalg

#endif // LINALG_NUMBER_EXCEPTIONS_HPP
