#pragma once

#include <stdexcept>
#include <string>

namespace binext {

// Error raised by field construction and element arithmetic
class FieldError : public std::runtime_error {
public:
    enum class Type {
        UnsupportedFieldOrder,
        InvalidPrimitivePolynomial,
        FieldMismatch,
        DivisionByZero,
        InvalidExponentType,
        InvariantViolation
    };

private:
    Type type_;

public:
    FieldError(Type type, const std::string& detail)
        : std::runtime_error(make_message(type, detail)), type_(type) {}

    Type get_type() const { return type_; }

    static const char* type_name(Type type) {
        switch (type) {
            case Type::UnsupportedFieldOrder:
                return "UnsupportedFieldOrder";
            case Type::InvalidPrimitivePolynomial:
                return "InvalidPrimitivePolynomial";
            case Type::FieldMismatch:
                return "FieldMismatch";
            case Type::DivisionByZero:
                return "DivisionByZero";
            case Type::InvalidExponentType:
                return "InvalidExponentType";
            case Type::InvariantViolation:
                return "InvariantViolation";
        }
        return "Unknown";
    }

private:
    static std::string make_message(Type type, const std::string& detail) {
        std::string msg = type_name(type);
        if (!detail.empty()) {
            msg += ": " + detail;
        }
        return msg;
    }
};

} // namespace binext
