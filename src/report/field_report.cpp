#include "report/field_report.hpp"
#include "common/debug_control.hpp"
#include <tbb/blocked_range.h>
#include <tbb/parallel_for.h>
#include <algorithm>
#include <chrono>
#include <iomanip>
#include <sstream>

namespace binext {
namespace report {

namespace {

std::string positions_string(const std::vector<uint32_t>& positions) {
    std::ostringstream oss;
    oss << "[";
    for (size_t i = 0; i < positions.size(); ++i) {
        if (i > 0) oss << ", ";
        oss << positions[i];
    }
    oss << "]";
    return oss.str();
}

template<typename T>
std::string list_string(const std::vector<T>& values) {
    std::ostringstream oss;
    oss << "[";
    for (size_t i = 0; i < values.size(); ++i) {
        if (i > 0) oss << ", ";
        oss << static_cast<uint32_t>(values[i]);
    }
    oss << "]";
    return oss.str();
}

CayleyTable build_cayley_table(const FieldTablesPtr& tables, bool multiply) {
    const std::vector<FieldElement> elements = nonzero_elements(tables);
    const size_t n = elements.size();

    CayleyTable table(n);
    tbb::parallel_for(size_t(0), n, [&](size_t i) {
        auto& row = table[i];
        row.reserve(n);
        for (size_t j = 0; j < n; ++j) {
            row.push_back(multiply ? elements[i] * elements[j] : elements[i] + elements[j]);
        }
    });
    return table;
}

} // namespace

std::vector<FieldElement> nonzero_elements(const FieldTablesPtr& tables) {
    std::vector<FieldElement> elements;
    const uint32_t n = tables->group_order();
    elements.reserve(n);
    for (uint32_t i = 0; i < n; ++i) {
        elements.emplace_back(static_cast<int64_t>(i), tables);
    }
    return elements;
}

std::vector<MinpolyEntry> minpoly_table(const FieldTablesPtr& tables) {
    auto start = std::chrono::high_resolution_clock::now();
    const uint32_t n = tables->group_order();
    const uint64_t target = tables->order() - 2;

    // alpha^i and alpha^j share a minimal polynomial iff they are conjugates,
    // so the first odd member of each conjugate orbit starts a new entry
    std::vector<bool> covered(n, false);
    std::vector<uint32_t> leaders;
    uint64_t degree_sum = 0;
    for (uint32_t i = 1; i + 2 < tables->order(); i += 2) {
        if (covered[i]) continue;
        uint32_t conj = i;
        uint64_t orbit_len = 0;
        do {
            covered[conj] = true;
            conj = static_cast<uint32_t>((2ULL * conj) % n);
            ++orbit_len;
        } while (conj != i);
        leaders.push_back(i);
        degree_sum += orbit_len;
        if (degree_sum >= target) break;
    }

    std::vector<MinpolyEntry> entries(leaders.size());
    tbb::parallel_for(tbb::blocked_range<size_t>(0, leaders.size()),
                      [&](const tbb::blocked_range<size_t>& range) {
        for (size_t k = range.begin(); k != range.end(); ++k) {
            FieldElement elem(static_cast<int64_t>(leaders[k]), tables);
            entries[k] = MinpolyEntry{leaders[k], elem.minimal_polynomial()};
        }
    });

    auto end = std::chrono::high_resolution_clock::now();
    double duration_ms = std::chrono::duration<double, std::milli>(end - start).count();
    BINEXT_PROFILE_COUT("[report] minpoly table for GF(" << tables->order() << "): "
                        << entries.size() << " entries in " << duration_ms << " ms" << std::endl);
    return entries;
}

CayleyTable addition_table(const FieldTablesPtr& tables) {
    return build_cayley_table(tables, false);
}

CayleyTable multiplication_table(const FieldTablesPtr& tables) {
    return build_cayley_table(tables, true);
}

std::string format_field_summary(const FieldTables& tables) {
    std::ostringstream oss;
    oss << "GF(" << tables.order() << "), m = " << tables.degree()
        << ", primitive polynomial " << tables.polynomial_string()
        << " " << positions_string(tables.polynomial_exponents()) << "\n";
    oss << "power  poly  vector\n";
    oss << "    0     0  " << tables.format_poly(0) << "\n";
    for (uint32_t n = 0; n < tables.group_order(); ++n) {
        uint32_t poly = tables.power_to_poly(n);
        std::string label = n == 0 ? "1" : "a^" + std::to_string(n);
        oss << std::setw(5) << label << " " << std::setw(5) << poly << "  "
            << tables.format_poly(poly) << "\n";
    }
    return oss.str();
}

std::string format_minpoly_table(const std::vector<MinpolyEntry>& entries) {
    std::ostringstream oss;
    for (size_t k = 0; k < entries.size(); ++k) {
        oss << std::setw(3) << entries[k].exponent << ": " << std::left << std::setw(30)
            << positions_string(entries[k].polynomial.positions()) << std::right;
        if (k % 2 == 1) {
            oss << "\n";
        }
    }
    if (entries.size() % 2 == 1) {
        oss << "\n";
    }
    return oss.str();
}

std::string format_cayley_table(const FieldTablesPtr& tables, const CayleyTable& table) {
    const std::vector<FieldElement> headers = nonzero_elements(tables);

    size_t width = 1;
    for (const auto& h : headers) {
        width = std::max(width, h.to_string(false).size());
    }
    for (const auto& row : table) {
        for (const auto& cell : row) {
            width = std::max(width, cell.to_string(false).size());
        }
    }
    width += 1;

    std::ostringstream oss;
    oss << std::setw(static_cast<int>(width)) << "";
    for (const auto& h : headers) {
        oss << std::setw(static_cast<int>(width)) << h.to_string(false);
    }
    oss << "\n";
    for (size_t i = 0; i < table.size(); ++i) {
        oss << std::setw(static_cast<int>(width)) << headers[i].to_string(false);
        for (const auto& cell : table[i]) {
            oss << std::setw(static_cast<int>(width)) << cell.to_string(false);
        }
        oss << "\n";
    }
    return oss.str();
}

std::string format_element(const FieldElement& elem) {
    std::vector<std::string> conj;
    for (const auto& c : elem.conjugates()) {
        conj.push_back(c.to_string(false));
    }
    Gf2Polynomial mp = elem.minimal_polynomial();

    std::ostringstream oss;
    oss << "element:    " << elem << "\n";
    oss << "vector:     " << list_string(elem.vec()) << "\n";
    oss << "conjugates: ";
    for (size_t i = 0; i < conj.size(); ++i) {
        if (i > 0) oss << ", ";
        oss << conj[i];
    }
    oss << "\n";
    oss << "minpoly:    " << list_string(mp.coefficients()) << "  " << mp << "\n";
    oss << "positions:  " << positions_string(mp.positions()) << "\n";
    return oss.str();
}

nlohmann::json field_to_json(const FieldTables& tables) {
    nlohmann::json json;
    json["order"] = tables.order();
    json["degree"] = tables.degree();
    json["primitive_polynomial"] = tables.polynomial_exponents();
    json["primitive_polynomial_string"] = tables.polynomial_string();

    std::vector<uint32_t> power_to_poly;
    power_to_poly.reserve(tables.group_order());
    for (uint32_t n = 0; n < tables.group_order(); ++n) {
        power_to_poly.push_back(tables.power_to_poly(n));
    }
    json["power_to_poly"] = power_to_poly;
    return json;
}

nlohmann::json minpoly_table_to_json(const std::vector<MinpolyEntry>& entries) {
    nlohmann::json json = nlohmann::json::array();
    for (const auto& entry : entries) {
        nlohmann::json item;
        item["exponent"] = entry.exponent;
        item["positions"] = entry.polynomial.positions();
        item["polynomial"] = entry.polynomial.to_string();
        json.push_back(item);
    }
    return json;
}

nlohmann::json cayley_table_to_json(const CayleyTable& table) {
    nlohmann::json json = nlohmann::json::array();
    for (const auto& row : table) {
        std::vector<std::string> cells;
        cells.reserve(row.size());
        for (const auto& cell : row) {
            cells.push_back(cell.to_string(false));
        }
        json.push_back(cells);
    }
    return json;
}

nlohmann::json element_to_json(const FieldElement& elem) {
    nlohmann::json json;
    json["element"] = elem.to_string(false);
    json["order"] = elem.order();
    if (auto e = elem.exponent()) {
        json["exponent"] = *e;
    } else {
        json["exponent"] = nullptr;
    }

    std::vector<uint32_t> vec;
    for (uint8_t bit : elem.vec()) {
        vec.push_back(bit);
    }
    json["vector"] = vec;

    std::vector<std::string> conj;
    for (const auto& c : elem.conjugates()) {
        conj.push_back(c.to_string(false));
    }
    json["conjugates"] = conj;
    json["minpoly"] = elem.minpoly(false);
    json["minpoly_positions"] = elem.minpoly(true);
    return json;
}

} // namespace report
} // namespace binext
