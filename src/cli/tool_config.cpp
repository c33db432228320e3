#include "cli/tool_config.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <sstream>
#include <stdexcept>

namespace binext {
namespace cli {

namespace {

uint64_t parse_unsigned(const std::string& text, const std::string& what) {
    if (text.empty() || !std::all_of(text.begin(), text.end(), [](char ch) {
            return std::isdigit(static_cast<unsigned char>(ch)) != 0;
        })) {
        throw std::invalid_argument(what + " must be a non-negative integer, got '" + text + "'");
    }
    try {
        return std::stoull(text, nullptr, 10);
    } catch (const std::out_of_range&) {
        throw std::invalid_argument(what + " out of range: '" + text + "'");
    }
}

} // namespace

uint64_t parse_field_order(const std::string& text) {
    uint64_t order = parse_unsigned(text, "field order");
    if (order == 0) {
        throw std::invalid_argument("field order must be positive");
    }
    return order;
}

std::vector<uint32_t> parse_exponent_list(const std::string& text) {
    std::string normalized = text;
    for (char& ch : normalized) {
        if (ch == ',' || ch == '[' || ch == ']') ch = ' ';
    }
    std::istringstream iss(normalized);
    std::vector<uint32_t> out;
    std::string tok;
    while (iss >> tok) {
        uint64_t v = parse_unsigned(tok, "polynomial exponent");
        if (v > 0xFFFFFFFFULL) {
            throw std::invalid_argument("polynomial exponent out of range: '" + tok + "'");
        }
        out.push_back(static_cast<uint32_t>(v));
    }
    if (out.empty()) {
        throw std::invalid_argument("empty exponent list '" + text + "'");
    }
    return out;
}

size_t threads_from_env() {
    const char* env = std::getenv("BINEXT_THREADS");
    if (!env || !*env) {
        return 0;
    }
    return static_cast<size_t>(parse_unsigned(env, "BINEXT_THREADS"));
}

ToolConfig ToolConfig::from_args(int argc, const char* const argv[]) {
    ToolConfig config;
    config.threads = threads_from_env();

    auto require_value = [&](int& i, const std::string& arg) -> std::string {
        if (i + 1 >= argc) {
            throw std::invalid_argument(arg + " requires an argument");
        }
        return argv[++i];
    };

    bool field_given = false;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            config.help = true;
        } else if (arg == "--order" || arg == "-q") {
            if (field_given) {
                throw std::invalid_argument("only one of --order / --poly may be given");
            }
            config.field = FieldSpecifier::from_order(parse_field_order(require_value(i, arg)));
            field_given = true;
        } else if (arg == "--poly" || arg == "-g") {
            if (field_given) {
                throw std::invalid_argument("only one of --order / --poly may be given");
            }
            config.field = FieldSpecifier::from_exponents(parse_exponent_list(require_value(i, arg)));
            field_given = true;
        } else if (arg == "--element" || arg == "-e") {
            config.elements.push_back(require_value(i, arg));
        } else if (arg == "--tables") {
            config.show_tables = true;
        } else if (arg == "--minpoly-table") {
            config.minpoly_table = true;
        } else if (arg == "--add-table") {
            config.add_table = true;
        } else if (arg == "--mul-table") {
            config.mul_table = true;
        } else if (arg == "--json") {
            config.json = true;
        } else if (arg == "--threads") {
            config.threads = static_cast<size_t>(parse_unsigned(require_value(i, arg), "thread count"));
        } else {
            throw std::invalid_argument("unknown option: " + arg);
        }
    }
    return config;
}

void print_usage(std::ostream& os, const char* program) {
    os << "Usage: " << program << " [OPTIONS]" << std::endl;
    os << std::endl;
    os << "Field (default: --order 16):" << std::endl;
    os << "  --order, -q Q        Field order from the built-in catalog (4..256)" << std::endl;
    os << "  --poly, -g E0,E1,..  Primitive polynomial as exponents, e.g. 0,1,4" << std::endl;
    os << std::endl;
    os << "Reports:" << std::endl;
    os << "  --element, -e TEXT   Describe an element (0, 1, a, a^N); repeatable" << std::endl;
    os << "  --tables             Power / polynomial / vector table" << std::endl;
    os << "  --minpoly-table      Minimal polynomials of the odd powers of alpha" << std::endl;
    os << "  --add-table          Addition table of the nonzero elements" << std::endl;
    os << "  --mul-table          Multiplication table of the nonzero elements" << std::endl;
    os << "  --json               Emit JSON instead of text" << std::endl;
    os << "  --threads N          Maximum TBB worker threads" << std::endl;
    os << "  --help, -h           Show this help message" << std::endl;
    os << std::endl;
    os << "Environment Variables:" << std::endl;
    os << "  BINEXT_THREADS  Maximum TBB worker threads" << std::endl;
    os << "  BINEXT_DEBUG    Enable debug output" << std::endl;
    os << "  BINEXT_PROFILE  Enable timing output" << std::endl;
    os << "  Debug and timing output go to stdout; leave them unset with --json" << std::endl;
}

} // namespace cli
} // namespace binext
