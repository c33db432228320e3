#pragma once

#include "field/field_tables.hpp"
#include "polynomial/gf2_polynomial.hpp"
#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <variant>
#include <vector>

namespace binext {

// Additive identity; has no exponent
struct Zero {
    bool operator==(const Zero&) const { return true; }
};

// alpha^exponent with exponent in [0, q-2]
struct Power {
    uint32_t exponent;
    bool operator==(const Power& rhs) const { return exponent == rhs.exponent; }
};

using ElementValue = std::variant<Zero, Power>;

/**
 * FieldElement - element of GF(2^m) in exponent representation
 *
 * Holds a Zero / Power value plus a shared handle to the immutable
 * FieldTables of its field. Every operation returns a new element.
 * Binary operations require both operands to come from fields of the same
 * order and throw FieldError(FieldMismatch) otherwise.
 */
class FieldElement {
public:
    // alpha^0 == 1
    explicit FieldElement(FieldTablesPtr tables);

    // alpha^exponent (reduced mod q-1, negative exponents wrap), std::nullopt for zero
    FieldElement(std::optional<int64_t> exponent, FieldTablesPtr tables);

    // Same, building the field tables from a specifier
    FieldElement(std::optional<int64_t> exponent, const FieldSpecifier& spec);

    // Factory methods
    static FieldElement zero(FieldTablesPtr tables);
    static FieldElement one(FieldTablesPtr tables);
    static FieldElement alpha(FieldTablesPtr tables);
    static FieldElement from_poly(uint32_t poly, FieldTablesPtr tables);

    // Inverse of to_string(): "0", "1", "a", "a^<int>", optionally followed by " GF(<q>)"
    static FieldElement parse(const std::string& text, FieldTablesPtr tables);

    // Accessors
    const ElementValue& value() const { return value_; }
    bool is_zero() const { return std::holds_alternative<Zero>(value_); }
    bool is_one() const;
    std::optional<uint32_t> exponent() const;
    uint32_t poly() const;
    const FieldTables& field() const { return *tables_; }
    const FieldTablesPtr& tables() const { return tables_; }
    uint64_t order() const { return tables_->order(); }

    // Arithmetic operations
    FieldElement operator+(const FieldElement& rhs) const;
    FieldElement operator-(const FieldElement& rhs) const;
    FieldElement operator*(const FieldElement& rhs) const;
    FieldElement operator/(const FieldElement& rhs) const;
    // Division by alpha^exponent
    FieldElement operator/(int64_t exponent) const;

    FieldElement inverse() const;
    FieldElement pow(int64_t k) const;

    // Comparison
    bool operator==(const FieldElement& rhs) const;
    bool operator!=(const FieldElement& rhs) const { return !(*this == rhs); }
    // Literal 0 matches the zero element, literal 1 matches alpha^0
    bool operator==(int64_t literal) const;
    bool operator!=(int64_t literal) const { return !(*this == literal); }

    // m coefficients of the polynomial form, MSB first
    std::vector<uint8_t> vec() const;

    // e, e^2, e^4, ... up to (not including) the return to e
    std::vector<FieldElement> conjugates() const;

    // Lowest degree monic polynomial over GF(2) with this element as a root
    Gf2Polynomial minimal_polynomial() const;

    // Coefficients MSB first, or the ascending exponents of nonzero coefficients
    std::vector<uint32_t> minpoly(bool as_positions = false) const;

    // "0", "1" or "a^<exponent>", with " GF(<q>)" appended when with_field is set
    std::string to_string(bool with_field = true) const;

    friend std::ostream& operator<<(std::ostream& os, const FieldElement& elem);

private:
    FieldElement(FieldTablesPtr tables, ElementValue value);

    void check_same_field(const FieldElement& rhs, const char* op) const;
    FieldElement with_exponent(int64_t exponent) const;

    static uint32_t reduce_exponent(int64_t exponent, uint32_t group_order);

    FieldTablesPtr tables_;
    ElementValue value_;
};

} // namespace binext
