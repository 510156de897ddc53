#include "tensor/tensor_base.hpp"
#include "tensor/tensor4.hpp"

#include <algorithm>
#include <limits>
#include <numeric>
#include <sstream>
#include <stdexcept>

namespace linalg {
namespace tensor {

// =============================================================================
// TensorBase Helpers
// =============================================================================

TensorBase::size_type TensorBase::shape_size(const Shape& shape) {
    size_type total = 1;
    for (const auto& axis : shape) {
        if (axis.second != 0 &&
            total > std::numeric_limits<size_type>::max() / axis.second) {
            throw std::invalid_argument(
                "Shape size overflows size_type: " + shape_to_string(shape));
        }
        total *= axis.second;
    }
    return total;
}

bool TensorBase::shapes_equal(const Shape& a, const Shape& b) {
    return a == b;
}

std::string TensorBase::shape_to_string(const Shape& shape) {
    std::ostringstream oss;
    oss << "{";
    for (size_t i = 0; i < shape.size(); ++i) {
        if (i > 0) oss << ", ";
        oss << shape[i].first << ": " << shape[i].second;
    }
    oss << "}";
    return oss.str();
}

// =============================================================================
// Generation
// =============================================================================

GeneratedTensor TensorBase::generate(const Shape& shape, const Generator& generator) {
    if (!generator) {
        throw std::invalid_argument("generate: generator function is empty");
    }

    // Flat storage in nesting order means the n-th cell is simply index n
    const size_type total = shape_size(shape);
    std::vector<value_type> values;
    values.reserve(total);
    for (size_type i = 0; i < total; ++i) {
        values.push_back(generator(i));
    }

    return GeneratedTensor(shape, std::move(values));
}

// =============================================================================
// GeneratedTensor
// =============================================================================

GeneratedTensor::GeneratedTensor(Shape shape, std::vector<value_type> values)
    : TensorBase(shape.size()), shape_(std::move(shape)), values_(std::move(values)) {
    if (values_.size() != shape_size(shape_)) {
        throw std::invalid_argument(
            "Data size does not match shape: expected " +
            std::to_string(shape_size(shape_)) + ", got " +
            std::to_string(values_.size()));
    }
}

GeneratedTensor::value_type GeneratedTensor::reduce(const Reducer& f) const {
    if (values_.empty()) {
        throw std::invalid_argument("reduce: tensor has no elements");
    }
    return std::accumulate(values_.begin() + 1, values_.end(), values_.front(), f);
}

bool GeneratedTensor::any(const Predicate& f) const {
    return std::any_of(values_.begin(), values_.end(), f);
}

bool GeneratedTensor::every(const Predicate& f) const {
    return std::all_of(values_.begin(), values_.end(), f);
}

GeneratedTensor GeneratedTensor::map(const Mapper& f) const {
    std::vector<value_type> mapped(values_.size());
    std::transform(values_.begin(), values_.end(), mapped.begin(), f);
    return GeneratedTensor(shape_, std::move(mapped));
}

std::string GeneratedTensor::to_string() const {
    std::ostringstream oss;
    oss << "GeneratedTensor(shape=" << shape_to_string(shape_) << ", data=[";
    for (size_t i = 0; i < values_.size(); ++i) {
        if (i > 0) oss << ", ";
        oss << values_[i];
    }
    oss << "])";
    return oss.str();
}

Tensor4 GeneratedTensor::to_tensor4() const {
    static const char* const AXES[] = {"length", "width", "depth", "depth2"};

    if (rank() != 4) {
        throw std::invalid_argument(
            "to_tensor4: expected rank 4, got rank " + std::to_string(rank()));
    }
    for (size_type i = 0; i < 4; ++i) {
        if (shape_[i].first != AXES[i]) {
            throw std::invalid_argument(
                "to_tensor4: unexpected axis layout " + shape_to_string(shape_));
        }
    }

    const size_type length = shape_[0].second;
    const size_type width = shape_[1].second;
    const size_type depth = shape_[2].second;
    const size_type depth2 = shape_[3].second;

    // A zero-sized axis hides the extents nested below it
    if (length == 0 || width == 0 || depth == 0 || depth2 == 0) {
        throw std::invalid_argument("Tensor dimensions cannot be zero");
    }

    Tensor4::Data data(length,
        std::vector<std::vector<std::vector<value_type>>>(width,
            std::vector<std::vector<value_type>>(depth,
                std::vector<value_type>(depth2, 0.0))));

    size_type offset = 0;
    for (auto& row : data) {
        for (auto& column : row) {
            for (auto& slice : column) {
                for (auto& value : slice) {
                    value = values_[offset++];
                }
            }
        }
    }

    return Tensor4(std::move(data));
}

} // namespace tensor
} // namespace linalg
