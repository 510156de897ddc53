#ifndef LINALG_TENSOR_TENSOR_BASE_HPP
#define LINALG_TENSOR_TENSOR_BASE_HPP

#include <cstddef>
#include <functional>
#include <string>
#include <utility>
#include <vector>

namespace linalg {
namespace tensor {

class Tensor4;
class GeneratedTensor;

/// Capability set shared by every tensor rank.
/// Each rank provides one concrete implementation; values are float64 and
/// always traversed in nesting order (outermost axis varies slowest).
class TensorBase {
public:
    // Type aliases
    using value_type = double;
    using size_type = std::size_t;
    // Ordered mapping from axis name to axis size
    using Shape = std::vector<std::pair<std::string, size_type>>;

    using Generator = std::function<value_type(size_type)>;
    using Mapper = std::function<value_type(value_type)>;
    using Reducer = std::function<value_type(value_type, value_type)>;
    using Predicate = std::function<bool(value_type)>;

    explicit TensorBase(size_type rank) : rank_(rank) {}

    TensorBase(const TensorBase&) = default;
    TensorBase(TensorBase&&) noexcept = default;
    TensorBase& operator=(const TensorBase&) = default;
    TensorBase& operator=(TensorBase&&) noexcept = default;
    virtual ~TensorBase() = default;

    size_type rank() const noexcept { return rank_; }

    virtual size_type items_count() const = 0;
    virtual Shape shape() const = 0;

    // Folds f left-to-right over all values, throws on an empty tensor
    virtual value_type reduce(const Reducer& f) const = 0;
    virtual bool any(const Predicate& f) const = 0;
    virtual bool every(const Predicate& f) const = 0;

    // Flattened values in nesting order
    virtual std::vector<value_type> to_list() const = 0;

    virtual std::string to_string() const = 0;

    /// Builds a dense tensor of the given shape. The generator is called
    /// once per cell with a sequential index starting at 0, in nesting order.
    static GeneratedTensor generate(const Shape& shape, const Generator& generator);

    // Product of all axis sizes (1 for a rank-0 shape)
    static size_type shape_size(const Shape& shape);

    static bool shapes_equal(const Shape& a, const Shape& b);

    static std::string shape_to_string(const Shape& shape);

private:
    size_type rank_;
};

/// Rank-agnostic result of TensorBase::generate.
/// Values are stored flat in nesting order.
class GeneratedTensor : public TensorBase {
public:
    GeneratedTensor(Shape shape, std::vector<value_type> values);

    size_type items_count() const override { return values_.size(); }
    Shape shape() const override { return shape_; }

    value_type reduce(const Reducer& f) const override;
    bool any(const Predicate& f) const override;
    bool every(const Predicate& f) const override;
    std::vector<value_type> to_list() const override { return values_; }
    std::string to_string() const override;

    GeneratedTensor map(const Mapper& f) const;

    // Converts into a Tensor4; shape must be (length, width, depth, depth2)
    Tensor4 to_tensor4() const;

private:
    Shape shape_;
    std::vector<value_type> values_;
};

} // namespace tensor
} // namespace linalg

#endif // LINALG_TENSOR_TENSOR_BASE_HPP
