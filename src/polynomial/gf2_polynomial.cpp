#include "polynomial/gf2_polynomial.hpp"
#include "field/field_element.hpp"
#include <algorithm>
#include <sstream>
#include <stdexcept>

namespace binext {

Gf2Polynomial::Gf2Polynomial(std::vector<uint8_t> coefficients) {
    for (uint8_t c : coefficients) {
        if (c > 1) {
            throw std::invalid_argument("GF(2) coefficient must be 0 or 1, got " + std::to_string(c));
        }
    }
    auto first_nonzero = std::find(coefficients.begin(), coefficients.end(), uint8_t{1});
    coeffs_.assign(first_nonzero, coefficients.end());
}

Gf2Polynomial Gf2Polynomial::from_positions(const std::vector<uint32_t>& positions) {
    if (positions.empty()) {
        return Gf2Polynomial();
    }
    uint32_t degree = *std::max_element(positions.begin(), positions.end());
    std::vector<uint8_t> coeffs(degree + 1, 0);
    for (uint32_t p : positions) {
        coeffs[degree - p] ^= 1;
    }
    return Gf2Polynomial(std::move(coeffs));
}

std::vector<uint32_t> Gf2Polynomial::positions() const {
    std::vector<uint32_t> out;
    const size_t n = coeffs_.size();
    for (size_t i = n; i-- > 0;) {
        if (coeffs_[i]) {
            out.push_back(static_cast<uint32_t>(n - 1 - i));
        }
    }
    return out;
}

FieldElement Gf2Polynomial::evaluate(const FieldElement& x) const {
    const FieldElement zero = FieldElement::zero(x.tables());
    const FieldElement one = FieldElement::one(x.tables());

    // Horner: result = result * x + c, highest degree first
    FieldElement result = zero;
    for (uint8_t c : coeffs_) {
        result = result * x + (c ? one : zero);
    }
    return result;
}

std::string Gf2Polynomial::to_string() const {
    if (coeffs_.empty()) {
        return "0";
    }
    std::ostringstream oss;
    bool first = true;
    const size_t deg = degree();
    for (size_t i = 0; i < coeffs_.size(); ++i) {
        if (!coeffs_[i]) continue;
        size_t power = deg - i;
        if (!first) oss << " + ";
        first = false;
        if (power == 0) {
            oss << "1";
        } else if (power == 1) {
            oss << "x";
        } else {
            oss << "x^" << power;
        }
    }
    return oss.str();
}

std::ostream& operator<<(std::ostream& os, const Gf2Polynomial& poly) {
    os << poly.to_string();
    return os;
}

} // namespace binext
