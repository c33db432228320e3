#pragma once

#include "field/field_specifier.hpp"
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace binext {

/**
 * FieldTables - lookup tables for one binary extension field GF(2^m)
 *
 * Built from a primitive polynomial g(x) of degree m. Nonzero elements are
 * powers of the primitive element alpha (a root of g); each table row maps
 * an exponent n in [0, q-2] to the polynomial (vector) form of alpha^n,
 * stored as an integer whose bit i is the coefficient of x^i.
 *
 * The zero element has no exponent. It is represented out of band: its
 * polynomial form is 0 and poly_to_power(0) returns std::nullopt.
 *
 * Tables are filled once in the constructor and never modified, so one
 * instance can be shared read-only by any number of elements and threads.
 */
class FieldTables {
public:
    // Largest supported extension degree m (tables hold 2^m entries)
    static constexpr uint32_t MAX_DEGREE = 24;

    explicit FieldTables(const FieldSpecifier& spec);

    static std::shared_ptr<const FieldTables> create(const FieldSpecifier& spec) {
        return std::make_shared<FieldTables>(spec);
    }

    // Accessors
    uint64_t primitive_polynomial() const { return primitive_polynomial_; }
    uint32_t degree() const { return m_; }
    uint64_t order() const { return q_; }
    uint32_t group_order() const { return static_cast<uint32_t>(q_ - 1); }

    // Antilog: polynomial form of alpha^exponent, exponent in [0, q-2]
    uint32_t power_to_poly(uint32_t exponent) const;

    // Discrete log: exponent n with alpha^n == poly, std::nullopt for 0
    std::optional<uint32_t> poly_to_power(uint32_t poly) const;

    bool same_field(const FieldTables& other) const { return q_ == other.q_; }

    // Exponents of the nonzero coefficients of g(x), ascending
    std::vector<uint32_t> polynomial_exponents() const;

    // g(x) written out, e.g. "x^4 + x + 1"
    std::string polynomial_string() const;

    // m-bit binary string of a polynomial value, MSB first
    std::string format_poly(uint32_t poly) const;

private:
    static constexpr uint32_t NO_POWER = 0xFFFFFFFFu;

    uint64_t primitive_polynomial_;
    uint32_t m_;
    uint64_t q_;
    std::vector<uint32_t> power_to_poly_;  // Anti-log table: exponent -> polynomial form
    std::vector<uint32_t> poly_to_power_;  // Log table: polynomial form -> exponent

    static uint64_t polynomial_bitmask(const std::vector<uint32_t>& exponents);
    void build_tables();
};

using FieldTablesPtr = std::shared_ptr<const FieldTables>;

} // namespace binext
