#include "field/field_tables.hpp"
#include "field/field_error.hpp"
#include "common/debug_control.hpp"
#include <algorithm>
#include <chrono>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace binext {

FieldTables::FieldTables(const FieldSpecifier& spec) {
    std::vector<uint32_t> exponents = spec.resolve_exponents();
    primitive_polynomial_ = polynomial_bitmask(exponents);

    // m = floor(log2(g))
    m_ = 0;
    while ((primitive_polynomial_ >> (m_ + 1)) != 0) {
        ++m_;
    }
    q_ = 1ULL << m_;

    auto start = std::chrono::high_resolution_clock::now();
    build_tables();
    auto end = std::chrono::high_resolution_clock::now();
    double build_ms = std::chrono::duration<double, std::milli>(end - start).count();
    BINEXT_PROFILE_COUT("[tables] GF(" << q_ << ") built in " << build_ms << " ms" << std::endl);
}

uint64_t FieldTables::polynomial_bitmask(const std::vector<uint32_t>& exponents) {
    if (exponents.empty()) {
        throw FieldError(FieldError::Type::InvalidPrimitivePolynomial, "empty exponent list");
    }
    uint32_t top = *std::max_element(exponents.begin(), exponents.end());
    if (top == 0) {
        throw FieldError(FieldError::Type::InvalidPrimitivePolynomial,
                         "polynomial must have degree at least 1");
    }
    if (top > MAX_DEGREE) {
        throw FieldError(FieldError::Type::InvalidPrimitivePolynomial,
                         "degree " + std::to_string(top) + " exceeds supported maximum " +
                             std::to_string(MAX_DEGREE));
    }

    uint64_t mask = 0;
    for (uint32_t e : exponents) {
        uint64_t bit = 1ULL << e;
        if (mask & bit) {
            throw FieldError(FieldError::Type::InvalidPrimitivePolynomial,
                             "exponent " + std::to_string(e) + " listed more than once");
        }
        mask |= bit;
    }
    if ((mask & 1ULL) == 0) {
        throw FieldError(FieldError::Type::InvalidPrimitivePolynomial,
                         "polynomial has no constant term");
    }
    return mask;
}

void FieldTables::build_tables() {
    const uint32_t nonzero = static_cast<uint32_t>(q_ - 1);
    const uint32_t mask = nonzero;
    const uint32_t low_terms = static_cast<uint32_t>(primitive_polynomial_ & mask);

    power_to_poly_.resize(nonzero);
    poly_to_power_.assign(q_, NO_POWER);

    // Walk alpha^0, alpha^1, ... multiplying by x and reducing mod g(x)
    uint32_t a = 1;
    for (uint32_t n = 0; n < nonzero; ++n) {
        power_to_poly_[n] = a;
        poly_to_power_[a] = n;
        BINEXT_DEBUG_COUT(std::setw(3) << n << " " << std::setw(3) << a << "  "
                          << format_poly(a) << std::endl);
        a <<= 1;
        if (a & q_) {
            a = (a & mask) ^ low_terms;
        }
    }
}

uint32_t FieldTables::power_to_poly(uint32_t exponent) const {
    if (exponent >= power_to_poly_.size()) {
        throw std::out_of_range("exponent " + std::to_string(exponent) +
                                " outside [0, " + std::to_string(q_ - 2) + "]");
    }
    return power_to_poly_[exponent];
}

std::optional<uint32_t> FieldTables::poly_to_power(uint32_t poly) const {
    if (poly >= poly_to_power_.size()) {
        throw std::out_of_range("polynomial value " + std::to_string(poly) +
                                " has more than " + std::to_string(m_) + " bits");
    }
    uint32_t power = poly_to_power_[poly];
    if (power == NO_POWER) {
        return std::nullopt;
    }
    return power;
}

std::vector<uint32_t> FieldTables::polynomial_exponents() const {
    std::vector<uint32_t> exponents;
    for (uint32_t i = 0; i <= m_; ++i) {
        if ((primitive_polynomial_ >> i) & 1ULL) {
            exponents.push_back(i);
        }
    }
    return exponents;
}

std::string FieldTables::polynomial_string() const {
    std::ostringstream oss;
    bool first = true;
    for (int i = static_cast<int>(m_); i >= 0; --i) {
        if (!((primitive_polynomial_ >> i) & 1ULL)) continue;
        if (!first) oss << " + ";
        first = false;
        if (i == 0) {
            oss << "1";
        } else if (i == 1) {
            oss << "x";
        } else {
            oss << "x^" << i;
        }
    }
    return oss.str();
}

std::string FieldTables::format_poly(uint32_t poly) const {
    std::string s;
    s.reserve(m_);
    for (int i = static_cast<int>(m_) - 1; i >= 0; --i) {
        s += ((poly >> i) & 1u) ? '1' : '0';
    }
    return s;
}

} // namespace binext
