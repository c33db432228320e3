#include <gtest/gtest.h>
#include "report/field_report.hpp"
#include <iomanip>
#include <sstream>

using namespace binext;
using namespace binext::report;

class FieldReportTest : public ::testing::Test {
protected:
    void SetUp() override {
        gf4 = FieldTables::create(FieldSpecifier::from_order(4));
        gf8 = FieldTables::create(FieldSpecifier::from_order(8));
        gf16 = FieldTables::create(FieldSpecifier::from_order(16));
    }

    static std::vector<uint32_t> entry_exponents(const std::vector<MinpolyEntry>& entries) {
        std::vector<uint32_t> out;
        for (const auto& e : entries) {
            out.push_back(e.exponent);
        }
        return out;
    }

    FieldTablesPtr gf4;
    FieldTablesPtr gf8;
    FieldTablesPtr gf16;
};

TEST_F(FieldReportTest, NonzeroElements) {
    auto elements = nonzero_elements(gf8);
    ASSERT_EQ(elements.size(), 7u);
    for (uint32_t i = 0; i < 7; ++i) {
        EXPECT_EQ(elements[i], FieldElement(static_cast<int64_t>(i), gf8));
    }
}

TEST_F(FieldReportTest, MinpolyTableGf16) {
    auto entries = minpoly_table(gf16);
    EXPECT_EQ(entry_exponents(entries), (std::vector<uint32_t>{1, 3, 5, 7}));
    EXPECT_EQ(entries[0].polynomial.positions(), (std::vector<uint32_t>{0, 1, 4}));
    EXPECT_EQ(entries[1].polynomial.positions(), (std::vector<uint32_t>{0, 1, 2, 3, 4}));
    EXPECT_EQ(entries[2].polynomial.positions(), (std::vector<uint32_t>{0, 1, 2}));
    EXPECT_EQ(entries[3].polynomial.positions(), (std::vector<uint32_t>{0, 3, 4}));
}

TEST_F(FieldReportTest, MinpolyTableSmallFields) {
    EXPECT_EQ(entry_exponents(minpoly_table(gf4)), (std::vector<uint32_t>{1}));
    EXPECT_EQ(entry_exponents(minpoly_table(gf8)), (std::vector<uint32_t>{1, 3}));
}

TEST_F(FieldReportTest, MinpolyTableGf256) {
    auto gf256 = FieldTables::create(FieldSpecifier::from_order(256));
    auto entries = minpoly_table(gf256);

    // Degrees of the kept polynomials cover all q-2 elements other than 0 and 1
    size_t degree_sum = 0;
    std::vector<Gf2Polynomial> seen;
    for (const auto& e : entries) {
        EXPECT_EQ(e.exponent % 2, 1u);
        EXPECT_TRUE(e.polynomial.evaluate(FieldElement(e.exponent, gf256)).is_zero());
        for (const auto& s : seen) {
            EXPECT_NE(s, e.polynomial);
        }
        seen.push_back(e.polynomial);
        degree_sum += e.polynomial.degree();
    }
    EXPECT_EQ(degree_sum, 254u);
    EXPECT_EQ(entries.front().polynomial.positions(), (std::vector<uint32_t>{0, 2, 3, 4, 8}));
}

TEST_F(FieldReportTest, FormatMinpolyTable) {
    std::ostringstream expected;
    expected << "  1: " << std::left << std::setw(30) << "[0, 1, 3]"
             << std::right << "  3: " << std::left << std::setw(30) << "[0, 2, 3]" << "\n";
    EXPECT_EQ(format_minpoly_table(minpoly_table(gf8)), expected.str());

    std::ostringstream odd;
    odd << "  1: " << std::left << std::setw(30) << "[0, 1, 2]" << "\n";
    EXPECT_EQ(format_minpoly_table(minpoly_table(gf4)), odd.str());
}

TEST_F(FieldReportTest, AdditionTable) {
    auto table = addition_table(gf8);
    ASSERT_EQ(table.size(), 7u);
    for (uint32_t i = 0; i < 7; ++i) {
        ASSERT_EQ(table[i].size(), 7u);
        for (uint32_t j = 0; j < 7; ++j) {
            FieldElement a(static_cast<int64_t>(i), gf8);
            FieldElement b(static_cast<int64_t>(j), gf8);
            EXPECT_EQ(table[i][j], a + b);
        }
        EXPECT_TRUE(table[i][i].is_zero());
    }
}

TEST_F(FieldReportTest, MultiplicationTable) {
    auto table = multiplication_table(gf16);
    ASSERT_EQ(table.size(), 15u);
    for (uint32_t i = 0; i < 15; ++i) {
        for (uint32_t j = 0; j < 15; ++j) {
            EXPECT_EQ(table[i][j].exponent(), std::optional<uint32_t>((i + j) % 15));
        }
    }
}

TEST_F(FieldReportTest, FormatAdditionTableGf4) {
    const std::string expected =
        "       1 a^1 a^2\n"
        "   1   0 a^2 a^1\n"
        " a^1 a^2   0   1\n"
        " a^2 a^1   1   0\n";
    EXPECT_EQ(format_cayley_table(gf4, addition_table(gf4)), expected);
}

TEST_F(FieldReportTest, FormatFieldSummary) {
    std::string summary = format_field_summary(*gf8);
    EXPECT_NE(summary.find("GF(8), m = 3, primitive polynomial x^3 + x + 1 [0, 1, 3]"),
              std::string::npos);
    EXPECT_NE(summary.find("  a^3     3  011"), std::string::npos);
    EXPECT_NE(summary.find("  a^6     5  101"), std::string::npos);
}

TEST_F(FieldReportTest, FormatElement) {
    std::string text = format_element(FieldElement::alpha(gf8));
    EXPECT_NE(text.find("element:    a^1 GF(8)"), std::string::npos);
    EXPECT_NE(text.find("vector:     [0, 1, 0]"), std::string::npos);
    EXPECT_NE(text.find("conjugates: a^1, a^2, a^4"), std::string::npos);
    EXPECT_NE(text.find("minpoly:    [1, 0, 1, 1]  x^3 + x + 1"), std::string::npos);
    EXPECT_NE(text.find("positions:  [0, 1, 3]"), std::string::npos);
}

TEST_F(FieldReportTest, FieldJson) {
    auto json = field_to_json(*gf16);
    EXPECT_EQ(json["order"].get<uint64_t>(), 16u);
    EXPECT_EQ(json["degree"].get<uint32_t>(), 4u);
    EXPECT_EQ(json["primitive_polynomial"].get<std::vector<uint32_t>>(),
              (std::vector<uint32_t>{0, 1, 4}));
    auto power_to_poly = json["power_to_poly"].get<std::vector<uint32_t>>();
    ASSERT_EQ(power_to_poly.size(), 15u);
    EXPECT_EQ(power_to_poly[0], 1u);
    EXPECT_EQ(power_to_poly[4], 3u);
}

TEST_F(FieldReportTest, ElementJson) {
    auto json = element_to_json(FieldElement(5, gf16));
    EXPECT_EQ(json["element"].get<std::string>(), "a^5");
    EXPECT_EQ(json["exponent"].get<uint32_t>(), 5u);
    EXPECT_EQ(json["vector"].get<std::vector<uint32_t>>(), (std::vector<uint32_t>{0, 1, 1, 0}));
    EXPECT_EQ(json["conjugates"].get<std::vector<std::string>>(),
              (std::vector<std::string>{"a^5", "a^10"}));
    EXPECT_EQ(json["minpoly"].get<std::vector<uint32_t>>(), (std::vector<uint32_t>{1, 1, 1}));
    EXPECT_EQ(json["minpoly_positions"].get<std::vector<uint32_t>>(),
              (std::vector<uint32_t>{0, 1, 2}));

    auto zero = element_to_json(FieldElement::zero(gf16));
    EXPECT_TRUE(zero["exponent"].is_null());
    EXPECT_EQ(zero["element"].get<std::string>(), "0");
}

TEST_F(FieldReportTest, MinpolyAndCayleyJson) {
    auto json = minpoly_table_to_json(minpoly_table(gf8));
    ASSERT_EQ(json.size(), 2u);
    EXPECT_EQ(json[1]["exponent"].get<uint32_t>(), 3u);
    EXPECT_EQ(json[1]["polynomial"].get<std::string>(), "x^3 + x^2 + 1");

    auto table = cayley_table_to_json(multiplication_table(gf4));
    ASSERT_EQ(table.size(), 3u);
    EXPECT_EQ(table[2][2].get<std::string>(), "a^1");
}
