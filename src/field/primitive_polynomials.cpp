#include "field/primitive_polynomials.hpp"
#include "field/field_error.hpp"
#include <string>

namespace binext {

const std::map<uint64_t, std::vector<uint32_t>>& primitive_polynomial_catalog() {
    static const std::map<uint64_t, std::vector<uint32_t>> catalog = {
        {4, {0, 1, 2}},
        {8, {0, 1, 3}},
        {16, {0, 1, 4}},
        {32, {0, 2, 5}},
        {64, {0, 1, 6}},
        {128, {0, 3, 7}},
        {256, {0, 2, 3, 4, 8}},
    };
    return catalog;
}

bool has_default_primitive_polynomial(uint64_t order) {
    const auto& catalog = primitive_polynomial_catalog();
    return catalog.find(order) != catalog.end();
}

const std::vector<uint32_t>& default_primitive_polynomial(uint64_t order) {
    const auto& catalog = primitive_polynomial_catalog();
    auto it = catalog.find(order);
    if (it == catalog.end()) {
        throw FieldError(FieldError::Type::UnsupportedFieldOrder,
                         "no default primitive polynomial for field order " + std::to_string(order));
    }
    return it->second;
}

} // namespace binext
