#include <gtest/gtest.h>
#include "field/field_element.hpp"
#include "field/field_error.hpp"
#include "field/primitive_polynomials.hpp"

using namespace binext;

class MinimalPolynomialTest : public ::testing::Test {
protected:
    void SetUp() override {
        gf8 = FieldTables::create(FieldSpecifier::from_order(8));
        gf16 = FieldTables::create(FieldSpecifier::from_order(16));
    }

    static std::vector<uint32_t> exponents_of(const std::vector<FieldElement>& elements) {
        std::vector<uint32_t> out;
        for (const auto& e : elements) {
            out.push_back(e.exponent().value_or(0xFFFFFFFFu));
        }
        return out;
    }

    FieldTablesPtr gf8;
    FieldTablesPtr gf16;
};

// Conjugates
TEST_F(MinimalPolynomialTest, ConjugatesOfAlpha) {
    EXPECT_EQ(exponents_of(FieldElement(1, gf16).conjugates()),
              (std::vector<uint32_t>{1, 2, 4, 8}));
}

TEST_F(MinimalPolynomialTest, ConjugatesWrapModuloGroupOrder) {
    EXPECT_EQ(exponents_of(FieldElement(3, gf16).conjugates()),
              (std::vector<uint32_t>{3, 6, 12, 9}));
    EXPECT_EQ(exponents_of(FieldElement(5, gf16).conjugates()),
              (std::vector<uint32_t>{5, 10}));
    EXPECT_EQ(exponents_of(FieldElement(7, gf16).conjugates()),
              (std::vector<uint32_t>{7, 14, 13, 11}));
}

TEST_F(MinimalPolynomialTest, ConjugatesOfZeroAndOne) {
    auto zero_orbit = FieldElement::zero(gf16).conjugates();
    ASSERT_EQ(zero_orbit.size(), 1u);
    EXPECT_TRUE(zero_orbit[0].is_zero());

    auto one_orbit = FieldElement::one(gf16).conjugates();
    ASSERT_EQ(one_orbit.size(), 1u);
    EXPECT_TRUE(one_orbit[0].is_one());
}

TEST_F(MinimalPolynomialTest, ConjugateOrbitClosesAndDividesDegree) {
    for (const auto& entry : primitive_polynomial_catalog()) {
        auto tables = FieldTables::create(FieldSpecifier::from_order(entry.first));
        const uint32_t m = tables->degree();
        for (uint32_t i = 0; i < tables->group_order(); ++i) {
            FieldElement e(static_cast<int64_t>(i), tables);
            auto orbit = e.conjugates();
            ASSERT_FALSE(orbit.empty());
            EXPECT_EQ(orbit.front(), e);
            EXPECT_EQ(orbit.back().pow(2), e);
            EXPECT_EQ(m % orbit.size(), 0u) << e;
            for (size_t k = 1; k < orbit.size(); ++k) {
                EXPECT_EQ(orbit[k], orbit[k - 1].pow(2));
                EXPECT_NE(orbit[k], e);
            }
        }
    }
}

// Minimal polynomials
TEST_F(MinimalPolynomialTest, AlphaInGf8IsPrimitivePolynomial) {
    FieldElement alpha = FieldElement::alpha(gf8);
    EXPECT_EQ(alpha.minpoly(), (std::vector<uint32_t>{1, 0, 1, 1}));
    EXPECT_EQ(alpha.minpoly(true), (std::vector<uint32_t>{0, 1, 3}));
    EXPECT_EQ(alpha.minimal_polynomial().to_string(), "x^3 + x + 1");
}

TEST_F(MinimalPolynomialTest, CubeInGf8) {
    FieldElement e(3, gf8);
    EXPECT_EQ(e.minpoly(), (std::vector<uint32_t>{1, 1, 0, 1}));
    EXPECT_EQ(e.minpoly(true), (std::vector<uint32_t>{0, 2, 3}));
}

TEST_F(MinimalPolynomialTest, FixedPolynomialsForZeroAndOne) {
    EXPECT_EQ(FieldElement::zero(gf16).minpoly(), (std::vector<uint32_t>{1, 0}));
    EXPECT_EQ(FieldElement::zero(gf16).minpoly(true), (std::vector<uint32_t>{1}));
    EXPECT_EQ(FieldElement::one(gf16).minpoly(), (std::vector<uint32_t>{1, 1}));
    EXPECT_EQ(FieldElement::one(gf16).minpoly(true), (std::vector<uint32_t>{0, 1}));
}

TEST_F(MinimalPolynomialTest, Gf16Table) {
    // Lin & Costello, Appendix B, m = 4
    EXPECT_EQ(FieldElement(1, gf16).minpoly(true), (std::vector<uint32_t>{0, 1, 4}));
    EXPECT_EQ(FieldElement(3, gf16).minpoly(true), (std::vector<uint32_t>{0, 1, 2, 3, 4}));
    EXPECT_EQ(FieldElement(5, gf16).minpoly(true), (std::vector<uint32_t>{0, 1, 2}));
    EXPECT_EQ(FieldElement(7, gf16).minpoly(true), (std::vector<uint32_t>{0, 3, 4}));
}

TEST_F(MinimalPolynomialTest, ConjugatesShareMinimalPolynomial) {
    for (uint32_t i = 1; i < gf16->group_order(); ++i) {
        FieldElement e(static_cast<int64_t>(i), gf16);
        Gf2Polynomial mp = e.minimal_polynomial();
        for (const auto& c : e.conjugates()) {
            EXPECT_EQ(c.minimal_polynomial(), mp) << e << " vs " << c;
        }
    }
}

TEST_F(MinimalPolynomialTest, RootPropertyAndDegree) {
    for (const auto& entry : primitive_polynomial_catalog()) {
        auto tables = FieldTables::create(FieldSpecifier::from_order(entry.first));
        std::vector<FieldElement> elements{FieldElement::zero(tables)};
        for (uint32_t i = 0; i < tables->group_order(); ++i) {
            elements.emplace_back(static_cast<int64_t>(i), tables);
        }
        for (const auto& e : elements) {
            Gf2Polynomial mp = e.minimal_polynomial();
            EXPECT_TRUE(mp.evaluate(e).is_zero()) << e;
            EXPECT_EQ(mp.degree(), e.conjugates().size()) << e;
            EXPECT_EQ(mp.coefficients().front(), 1u);
        }
    }
}

TEST_F(MinimalPolynomialTest, PrimitiveElementRecoversFieldPolynomial) {
    for (const auto& entry : primitive_polynomial_catalog()) {
        auto tables = FieldTables::create(FieldSpecifier::from_order(entry.first));
        EXPECT_EQ(FieldElement::alpha(tables).minpoly(true), entry.second)
            << "GF(" << entry.first << ")";
    }
}

// x^4 + x^2 + 1 = (x^2 + x + 1)^2 is not primitive: alpha has order 6 and
// no candidate vanishes at a^10
TEST_F(MinimalPolynomialTest, NonPrimitivePolynomialExhaustsSearch) {
    auto tables = FieldTables::create(FieldSpecifier::from_exponents({0, 2, 4}));
    FieldElement a10(10, tables);
    try {
        a10.minimal_polynomial();
        FAIL() << "expected InvariantViolation";
    } catch (const FieldError& e) {
        EXPECT_EQ(e.get_type(), FieldError::Type::InvariantViolation);
    }
}
