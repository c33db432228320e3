#include "field/field_element.hpp"
#include "field/field_error.hpp"
#include "common/debug_control.hpp"

namespace binext {

std::vector<FieldElement> FieldElement::conjugates() const {
    const Power* start = std::get_if<Power>(&value_);
    if (!start) {
        return {*this};
    }

    // Frobenius map x -> x^2 doubles the exponent
    const uint64_t n = tables_->group_order();
    std::vector<FieldElement> orbit;
    uint32_t conj = start->exponent;
    do {
        orbit.push_back(FieldElement(tables_, Power{conj}));
        conj = static_cast<uint32_t>((2ULL * conj) % n);
    } while (conj != start->exponent);
    return orbit;
}

Gf2Polynomial FieldElement::minimal_polynomial() const {
    if (is_zero()) {
        return Gf2Polynomial({1, 0});
    }
    if (is_one()) {
        return Gf2Polynomial({1, 1});
    }

    // Degree equals the orbit length; leading and constant terms are fixed to 1
    const size_t degree = conjugates().size();
    const size_t interior = degree - 1;
    const uint64_t candidates = 1ULL << interior;

    BINEXT_DEBUG_COUT("[minpoly] " << to_string() << ": " << degree << " conjugates" << std::endl);

    std::vector<uint8_t> coeffs(degree + 1, 0);
    coeffs.front() = 1;
    coeffs.back() = 1;
    for (uint64_t pattern = 0; pattern < candidates; ++pattern) {
        for (size_t j = 0; j < interior; ++j) {
            coeffs[1 + j] = static_cast<uint8_t>((pattern >> (interior - 1 - j)) & 1ULL);
        }
        Gf2Polynomial candidate(coeffs);
        FieldElement result = candidate.evaluate(*this);
        BINEXT_DEBUG_COUT("[minpoly]   " << candidate << " -> " << result << std::endl);
        if (result == 0) {
            return candidate;
        }
    }

    throw FieldError(FieldError::Type::InvariantViolation,
                     "no minimal polynomial of degree " + std::to_string(degree) + " for " +
                         to_string() + " (primitive polynomial " +
                         tables_->polynomial_string() + ")");
}

std::vector<uint32_t> FieldElement::minpoly(bool as_positions) const {
    Gf2Polynomial mp = minimal_polynomial();
    if (as_positions) {
        return mp.positions();
    }
    const auto& coeffs = mp.coefficients();
    return std::vector<uint32_t>(coeffs.begin(), coeffs.end());
}

} // namespace binext
