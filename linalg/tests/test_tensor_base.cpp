#include "../include/tensor/tensor_base.hpp"
#include "../include/tensor/tensor4.hpp"
#include "../include/number/number.hpp"
#include <iostream>
#include <cassert>
#include <limits>
#include <stdexcept>
#include <string>
#include <vector>

using namespace linalg::tensor;
using linalg::number::Number;

// =============================================================================
// Generation Protocol
// =============================================================================

void test_generate_any_rank() {
    std::cout << "Testing generation for arbitrary ranks..." << std::endl;

    TensorBase::Shape shape = {{"rows", 2}, {"cols", 3}};
    GeneratedTensor g = TensorBase::generate(shape, [](TensorBase::size_type i) {
        return static_cast<double>(i * 10);
    });

    assert(g.rank() == 2);
    assert(g.items_count() == 6);
    assert(g.shape() == shape);
    std::vector<double> expected = {0.0, 10.0, 20.0, 30.0, 40.0, 50.0};
    assert(g.to_list() == expected);

    GeneratedTensor halved = g.map([](double v) { return v / 2.0; });
    assert(halved.shape() == shape);
    assert(halved.reduce([](double a, double b) { return a + b; }) == 75.0);
    assert(halved.every([](double v) { return v <= 25.0; }));
    assert(!halved.any([](double v) { return v < 0.0; }));

    std::cout << "  Generation for arbitrary ranks: PASSED" << std::endl;
}

void test_generated_to_tensor4() {
    std::cout << "Testing conversion to Tensor4..." << std::endl;

    TensorBase::Shape shape = {{"length", 2}, {"width", 1}, {"depth", 2}, {"depth2", 2}};
    GeneratedTensor g = TensorBase::generate(shape, [](TensorBase::size_type i) {
        return static_cast<double>(i);
    });

    Tensor4 t = g.to_tensor4();
    assert(t.shape() == shape);
    assert(t.to_list() == g.to_list());
    assert(t.item_at(2, 1, 1, 2) == 5.0);

    std::cout << "  Conversion to Tensor4: PASSED" << std::endl;
}

void test_to_tensor4_rejects_other_layouts() {
    std::cout << "Testing conversion rejects other layouts..." << std::endl;

    GeneratedTensor rank3 = TensorBase::generate(
        {{"length", 1}, {"width", 1}, {"depth", 1}},
        [](TensorBase::size_type) { return 1.0; });

    bool threw_rank = false;
    try {
        rank3.to_tensor4();
    } catch (const std::invalid_argument&) {
        threw_rank = true;
    }
    assert(threw_rank);

    GeneratedTensor swapped = TensorBase::generate(
        {{"width", 1}, {"length", 1}, {"depth", 1}, {"depth2", 1}},
        [](TensorBase::size_type) { return 1.0; });

    bool threw_axes = false;
    try {
        swapped.to_tensor4();
    } catch (const std::invalid_argument&) {
        threw_axes = true;
    }
    assert(threw_axes);

    // Sizes below an empty axis cannot be kept by nested storage
    GeneratedTensor empty_width = TensorBase::generate(
        {{"length", 2}, {"width", 0}, {"depth", 3}, {"depth2", 4}},
        [](TensorBase::size_type) { return 1.0; });
    assert(empty_width.items_count() == 0);

    bool threw_zero = false;
    try {
        empty_width.to_tensor4();
    } catch (const std::invalid_argument&) {
        threw_zero = true;
    }
    assert(threw_zero);

    std::cout << "  Conversion rejects other layouts: PASSED" << std::endl;
}

void test_generated_tensor_validation() {
    std::cout << "Testing generated tensor validation..." << std::endl;

    bool threw_size = false;
    try {
        GeneratedTensor g({{"n", 3}}, {1.0, 2.0});
    } catch (const std::invalid_argument&) {
        threw_size = true;
    }
    assert(threw_size);

    bool threw_generator = false;
    try {
        TensorBase::generate({{"n", 3}}, TensorBase::Generator{});
    } catch (const std::invalid_argument&) {
        threw_generator = true;
    }
    assert(threw_generator);

    GeneratedTensor empty({{"n", 0}}, {});
    bool threw_reduce = false;
    try {
        empty.reduce([](double a, double b) { return a + b; });
    } catch (const std::invalid_argument&) {
        threw_reduce = true;
    }
    assert(threw_reduce);
    assert(empty.every([](double) { return false; }));

    size_t generator_calls = 0;
    bool threw_overflow = false;
    try {
        TensorBase::generate(
            {{"a", std::numeric_limits<TensorBase::size_type>::max()}, {"b", 2}},
            [&generator_calls](TensorBase::size_type) {
                ++generator_calls;
                return 0.0;
            });
    } catch (const std::invalid_argument&) {
        threw_overflow = true;
    }
    assert(threw_overflow);
    assert(generator_calls == 0);

    std::cout << "  Generated tensor validation: PASSED" << std::endl;
}

void test_polymorphic_access() {
    std::cout << "Testing access through TensorBase..." << std::endl;

    Tensor4 t = Tensor4::generate(1, 2, 1, 2, [](Tensor4::size_type i) {
        return static_cast<double>(i) + 1.0;
    });
    const TensorBase& base = t;

    assert(base.rank() == 4);
    assert(base.items_count() == 4);
    assert(base.reduce([](double a, double b) { return a * b; }) == 24.0);
    assert(base.to_string() == t.to_string());
    assert(TensorBase::shape_to_string(base.shape()) ==
           "{length: 1, width: 2, depth: 1, depth2: 2}");

    std::cout << "  Access through TensorBase: PASSED" << std::endl;
}

// =============================================================================
// Number
// =============================================================================

void test_number() {
    std::cout << "Testing Number..." << std::endl;

    Number zero;
    Number half(0.5);

    assert(zero.is_zero());
    assert(!half.is_zero());
    assert(half.data() == 0.5);
    assert(half == Number(0.5));
    assert(half != zero);
    assert(half.to_string() == "0.5");

    std::cout << "  Number: PASSED" << std::endl;
}

int main() {
    std::cout << "=== Tensor Base Test Suite ===" << std::endl << std::endl;

    test_generate_any_rank();
    test_generated_to_tensor4();
    test_to_tensor4_rejects_other_layouts();
    test_generated_tensor_validation();
    test_polymorphic_access();
    test_number();

    std::cout << std::endl << "=== All tests PASSED ===" << std::endl;
    return 0;
}
