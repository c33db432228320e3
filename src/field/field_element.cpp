#include "field/field_element.hpp"
#include "field/field_error.hpp"
#include <cctype>
#include <sstream>
#include <stdexcept>

namespace binext {

namespace {

std::string trim(const std::string& s) {
    size_t begin = 0;
    size_t end = s.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(s[begin]))) ++begin;
    while (end > begin && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(begin, end - begin);
}

// Whole-string signed integer; std::nullopt if text is not exactly one integer
std::optional<int64_t> parse_integer(const std::string& text) {
    // Plain decimal only: stoll would also take leading blanks and '+'
    size_t first_digit = (!text.empty() && text[0] == '-') ? 1 : 0;
    if (first_digit >= text.size() || !std::isdigit(static_cast<unsigned char>(text[first_digit]))) {
        return std::nullopt;
    }
    try {
        size_t pos = 0;
        long long v = std::stoll(text, &pos, 10);
        if (pos != text.size()) {
            return std::nullopt;
        }
        return static_cast<int64_t>(v);
    } catch (const std::invalid_argument&) {
        return std::nullopt;
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

} // namespace

FieldElement::FieldElement(FieldTablesPtr tables)
    : FieldElement(std::optional<int64_t>(0), std::move(tables)) {}

FieldElement::FieldElement(std::optional<int64_t> exponent, FieldTablesPtr tables)
    : tables_(std::move(tables)), value_(Zero{}) {
    if (!tables_) {
        throw std::invalid_argument("FieldElement requires field tables");
    }
    if (exponent) {
        value_ = Power{reduce_exponent(*exponent, tables_->group_order())};
    }
}

FieldElement::FieldElement(std::optional<int64_t> exponent, const FieldSpecifier& spec)
    : FieldElement(exponent, FieldTables::create(spec)) {}

FieldElement::FieldElement(FieldTablesPtr tables, ElementValue value)
    : tables_(std::move(tables)), value_(value) {}

FieldElement FieldElement::zero(FieldTablesPtr tables) {
    return FieldElement(std::nullopt, std::move(tables));
}

FieldElement FieldElement::one(FieldTablesPtr tables) {
    return FieldElement(0, std::move(tables));
}

FieldElement FieldElement::alpha(FieldTablesPtr tables) {
    return FieldElement(1, std::move(tables));
}

FieldElement FieldElement::from_poly(uint32_t poly, FieldTablesPtr tables) {
    if (!tables) {
        throw std::invalid_argument("FieldElement requires field tables");
    }
    std::optional<uint32_t> power = tables->poly_to_power(poly);
    if (!power) {
        return FieldElement(std::move(tables), Zero{});
    }
    return FieldElement(std::move(tables), Power{*power});
}

FieldElement FieldElement::parse(const std::string& text, FieldTablesPtr tables) {
    if (!tables) {
        throw std::invalid_argument("FieldElement requires field tables");
    }
    std::string body = trim(text);

    size_t gf = body.find(" GF(");
    if (gf != std::string::npos) {
        size_t close = body.find(')', gf);
        if (close == std::string::npos || close + 1 != body.size()) {
            throw std::invalid_argument("malformed field suffix in '" + text + "'");
        }
        std::optional<int64_t> q = parse_integer(body.substr(gf + 4, close - gf - 4));
        if (!q || *q <= 0) {
            throw std::invalid_argument("malformed field order in '" + text + "'");
        }
        if (static_cast<uint64_t>(*q) != tables->order()) {
            throw FieldError(FieldError::Type::FieldMismatch,
                             "'" + text + "' is not an element of GF(" +
                                 std::to_string(tables->order()) + ")");
        }
        body = trim(body.substr(0, gf));
    }

    if (body == "0") {
        return zero(std::move(tables));
    }
    if (body == "1") {
        return one(std::move(tables));
    }
    if (body == "a") {
        return alpha(std::move(tables));
    }
    if (body.rfind("a^", 0) == 0) {
        std::string exp_text = body.substr(2);
        std::optional<int64_t> exponent = parse_integer(exp_text);
        if (!exponent) {
            throw FieldError(FieldError::Type::InvalidExponentType,
                             "exponent must be an integer, got '" + exp_text + "'");
        }
        return FieldElement(*exponent, std::move(tables));
    }
    throw std::invalid_argument("cannot parse field element '" + text + "'");
}

uint32_t FieldElement::reduce_exponent(int64_t exponent, uint32_t group_order) {
    int64_t n = static_cast<int64_t>(group_order);
    int64_t r = exponent % n;
    if (r < 0) {
        r += n;
    }
    return static_cast<uint32_t>(r);
}

FieldElement FieldElement::with_exponent(int64_t exponent) const {
    return FieldElement(tables_, Power{reduce_exponent(exponent, tables_->group_order())});
}

void FieldElement::check_same_field(const FieldElement& rhs, const char* op) const {
    if (!tables_->same_field(*rhs.tables_)) {
        throw FieldError(FieldError::Type::FieldMismatch,
                         std::string("cannot ") + op + " elements of GF(" +
                             std::to_string(order()) + ") and GF(" +
                             std::to_string(rhs.order()) + ")");
    }
}

bool FieldElement::is_one() const {
    const Power* p = std::get_if<Power>(&value_);
    return p && p->exponent == 0;
}

std::optional<uint32_t> FieldElement::exponent() const {
    if (const Power* p = std::get_if<Power>(&value_)) {
        return p->exponent;
    }
    return std::nullopt;
}

uint32_t FieldElement::poly() const {
    if (const Power* p = std::get_if<Power>(&value_)) {
        return tables_->power_to_poly(p->exponent);
    }
    return 0;
}

FieldElement FieldElement::operator+(const FieldElement& rhs) const {
    check_same_field(rhs, "add");
    // Characteristic 2: coefficient-wise addition is XOR
    return from_poly(poly() ^ rhs.poly(), tables_);
}

FieldElement FieldElement::operator-(const FieldElement& rhs) const {
    check_same_field(rhs, "subtract");
    return from_poly(poly() ^ rhs.poly(), tables_);
}

FieldElement FieldElement::operator*(const FieldElement& rhs) const {
    check_same_field(rhs, "multiply");
    const Power* a = std::get_if<Power>(&value_);
    const Power* b = std::get_if<Power>(&rhs.value_);
    if (!a || !b) {
        return FieldElement(tables_, Zero{});
    }
    return with_exponent(static_cast<int64_t>(a->exponent) + b->exponent);
}

FieldElement FieldElement::operator/(const FieldElement& rhs) const {
    check_same_field(rhs, "divide");
    const Power* b = std::get_if<Power>(&rhs.value_);
    if (!b) {
        throw FieldError(FieldError::Type::DivisionByZero,
                         "cannot divide " + to_string() + " by 0");
    }
    const Power* a = std::get_if<Power>(&value_);
    if (!a) {
        return *this;
    }
    return with_exponent(static_cast<int64_t>(a->exponent) - b->exponent);
}

FieldElement FieldElement::operator/(int64_t exponent) const {
    const Power* a = std::get_if<Power>(&value_);
    if (!a) {
        return *this;
    }
    uint32_t divisor = reduce_exponent(exponent, tables_->group_order());
    return with_exponent(static_cast<int64_t>(a->exponent) - divisor);
}

FieldElement FieldElement::inverse() const {
    const Power* a = std::get_if<Power>(&value_);
    if (!a) {
        throw FieldError(FieldError::Type::DivisionByZero, "0 has no multiplicative inverse");
    }
    return with_exponent(-static_cast<int64_t>(a->exponent));
}

FieldElement FieldElement::pow(int64_t k) const {
    const Power* a = std::get_if<Power>(&value_);
    if (!a) {
        return *this;
    }
    // Reduce k first so the product stays within 64 bits
    uint64_t n = tables_->group_order();
    uint64_t k_mod = reduce_exponent(k, tables_->group_order());
    return FieldElement(tables_, Power{static_cast<uint32_t>((a->exponent * k_mod) % n)});
}

bool FieldElement::operator==(const FieldElement& rhs) const {
    return tables_->same_field(*rhs.tables_) && value_ == rhs.value_;
}

bool FieldElement::operator==(int64_t literal) const {
    if (literal == 0) {
        return is_zero();
    }
    if (literal == 1) {
        return is_one();
    }
    return false;
}

std::vector<uint8_t> FieldElement::vec() const {
    uint32_t p = poly();
    uint32_t m = tables_->degree();
    std::vector<uint8_t> bits(m);
    for (uint32_t i = 0; i < m; ++i) {
        bits[i] = static_cast<uint8_t>((p >> (m - 1 - i)) & 1u);
    }
    return bits;
}

std::string FieldElement::to_string(bool with_field) const {
    std::ostringstream oss;
    if (const Power* p = std::get_if<Power>(&value_)) {
        if (p->exponent == 0) {
            oss << "1";
        } else {
            oss << "a^" << p->exponent;
        }
    } else {
        oss << "0";
    }
    if (with_field) {
        oss << " GF(" << order() << ")";
    }
    return oss.str();
}

std::ostream& operator<<(std::ostream& os, const FieldElement& elem) {
    os << elem.to_string();
    return os;
}

} // namespace binext
