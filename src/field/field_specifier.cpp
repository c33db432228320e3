#include "field/field_specifier.hpp"
#include "field/primitive_polynomials.hpp"
#include <sstream>

namespace binext {

std::vector<uint32_t> FieldSpecifier::resolve_exponents() const {
    if (kind_ == Kind::Order) {
        return default_primitive_polynomial(order_);
    }
    return exponents_;
}

std::string FieldSpecifier::to_string() const {
    std::ostringstream oss;
    if (kind_ == Kind::Order) {
        oss << "GF(" << order_ << ")";
        return oss.str();
    }
    oss << "[";
    for (size_t i = 0; i < exponents_.size(); ++i) {
        if (i > 0) oss << ", ";
        oss << exponents_[i];
    }
    oss << "]";
    return oss.str();
}

} // namespace binext
