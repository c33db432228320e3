#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace binext {

/**
 * FieldSpecifier - how a caller names a field GF(2^m)
 *
 * Either a field order q (looked up in the primitive polynomial catalog) or
 * an explicit primitive polynomial, given as the exponents of its nonzero
 * coefficients (e.g. {0, 1, 4} for x^4 + x + 1).
 */
class FieldSpecifier {
public:
    enum class Kind {
        Order,
        Polynomial
    };

    static FieldSpecifier from_order(uint64_t order) {
        return FieldSpecifier(Kind::Order, order, {});
    }

    static FieldSpecifier from_exponents(std::vector<uint32_t> exponents) {
        return FieldSpecifier(Kind::Polynomial, 0, std::move(exponents));
    }

    Kind kind() const { return kind_; }
    uint64_t order() const { return order_; }
    const std::vector<uint32_t>& exponents() const { return exponents_; }

    // Exponent list of the primitive polynomial; catalog lookup for Kind::Order
    std::vector<uint32_t> resolve_exponents() const;

    std::string to_string() const;

private:
    FieldSpecifier(Kind kind, uint64_t order, std::vector<uint32_t> exponents)
        : kind_(kind), order_(order), exponents_(std::move(exponents)) {}

    Kind kind_;
    uint64_t order_;
    std::vector<uint32_t> exponents_;
};

} // namespace binext
