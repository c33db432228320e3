#pragma once

#include <cstdint>
#include <map>
#include <vector>

namespace binext {

/**
 * Built-in catalog of primitive polynomials over GF(2)
 *
 * Maps a field order q = 2^m to the exponents (ascending) of the nonzero
 * coefficients of a primitive polynomial of degree m, as tabulated in
 * Lin & Costello, Appendix B.
 *
 *   4:   x^2 + x + 1
 *   8:   x^3 + x + 1
 *   16:  x^4 + x + 1
 *   32:  x^5 + x^2 + 1
 *   64:  x^6 + x + 1
 *   128: x^7 + x^3 + 1
 *   256: x^8 + x^4 + x^3 + x^2 + 1
 */
const std::map<uint64_t, std::vector<uint32_t>>& primitive_polynomial_catalog();

bool has_default_primitive_polynomial(uint64_t order);

// Throws FieldError(UnsupportedFieldOrder) for orders outside the catalog
const std::vector<uint32_t>& default_primitive_polynomial(uint64_t order);

} // namespace binext
