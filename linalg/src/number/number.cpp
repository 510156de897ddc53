#include "number/number.hpp"
#include <sstream>

namespace linalg {
namespace number {

std::string Number::to_string() const {
    std::ostringstream oss;
    oss << data_;
    return oss.str();
}

} // namespace number
} // namespace linalg
