#pragma once

#include <cstdint>
#include <ostream>
#include <string>
#include <vector>

namespace binext {

class FieldElement;

/**
 * Polynomial with coefficients in GF(2)
 *
 * Coefficients are stored highest degree first, matching the tables in
 * Lin & Costello:
 *   {1, 0, 1, 1}  ->  x^3 + x + 1
 *
 * Leading zero coefficients are stripped on construction, so degree() is
 * always the true degree (the zero polynomial has no coefficients).
 */
class Gf2Polynomial {
public:
    Gf2Polynomial() = default;
    explicit Gf2Polynomial(std::vector<uint8_t> coefficients);

    // Build from the exponents of the nonzero coefficients, e.g. {0, 1, 3}
    static Gf2Polynomial from_positions(const std::vector<uint32_t>& positions);

    const std::vector<uint8_t>& coefficients() const { return coeffs_; }
    bool is_zero() const { return coeffs_.empty(); }
    size_t degree() const { return coeffs_.empty() ? 0 : coeffs_.size() - 1; }

    // Exponents of the nonzero coefficients, ascending
    std::vector<uint32_t> positions() const;

    // Evaluate at a field element with Horner's method
    FieldElement evaluate(const FieldElement& x) const;

    std::string to_string() const;

    bool operator==(const Gf2Polynomial& rhs) const { return coeffs_ == rhs.coeffs_; }
    bool operator!=(const Gf2Polynomial& rhs) const { return coeffs_ != rhs.coeffs_; }

    friend std::ostream& operator<<(std::ostream& os, const Gf2Polynomial& poly);

private:
    std::vector<uint8_t> coeffs_;
};

} // namespace binext
