#pragma once

#include "field/field_element.hpp"
#include "field/field_tables.hpp"
#include "polynomial/gf2_polynomial.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <string>
#include <vector>

namespace binext {
namespace report {

/**
 * Field reports
 *
 * Summaries built on top of element arithmetic: the minimal polynomial table
 * (as in Lin & Costello, Appendix B), addition/multiplication tables over the
 * nonzero elements, and text / JSON renderings of both.
 */

struct MinpolyEntry {
    uint32_t exponent;          // smallest odd i with alpha^i a root
    Gf2Polynomial polynomial;
};

using CayleyTable = std::vector<std::vector<FieldElement>>;

// alpha^0, alpha^1, ..., alpha^(q-2)
std::vector<FieldElement> nonzero_elements(const FieldTablesPtr& tables);

// Distinct minimal polynomials of alpha^i for odd i, until their degrees sum to q-2
std::vector<MinpolyEntry> minpoly_table(const FieldTablesPtr& tables);

// Row i, column j: alpha^i + alpha^j
CayleyTable addition_table(const FieldTablesPtr& tables);

// Row i, column j: alpha^i * alpha^j
CayleyTable multiplication_table(const FieldTablesPtr& tables);

// Text renderings
std::string format_field_summary(const FieldTables& tables);
std::string format_minpoly_table(const std::vector<MinpolyEntry>& entries);
std::string format_cayley_table(const FieldTablesPtr& tables, const CayleyTable& table);
std::string format_element(const FieldElement& elem);

// JSON renderings
nlohmann::json field_to_json(const FieldTables& tables);
nlohmann::json minpoly_table_to_json(const std::vector<MinpolyEntry>& entries);
nlohmann::json cayley_table_to_json(const CayleyTable& table);
nlohmann::json element_to_json(const FieldElement& elem);

} // namespace report
} // namespace binext
