#pragma once

#include "field/field_specifier.hpp"
#include <cstddef>
#include <ostream>
#include <string>
#include <vector>

namespace binext {
namespace cli {

/**
 * Command line configuration for the binext tool
 *
 * Usage:
 *   binext [--order Q | --poly E0,E1,...] [--element TEXT]...
 *          [--tables] [--minpoly-table] [--add-table] [--mul-table] [--json]
 *
 * Environment Variables:
 *   BINEXT_THREADS - Maximum number of TBB worker threads (default: auto)
 *   BINEXT_DEBUG   - Enable debug output
 *   BINEXT_PROFILE - Enable timing output
 */
struct ToolConfig {
    FieldSpecifier field = FieldSpecifier::from_order(16);
    std::vector<std::string> elements;
    bool show_tables = false;
    bool minpoly_table = false;
    bool add_table = false;
    bool mul_table = false;
    bool json = false;
    bool help = false;
    size_t threads = 0;  // 0: let TBB decide

    // Throws std::invalid_argument on unknown options or malformed values
    static ToolConfig from_args(int argc, const char* const argv[]);

    // Default action when no report is requested: field summary
    bool any_report() const {
        return show_tables || minpoly_table || add_table || mul_table || !elements.empty();
    }
};

// "16" -> 16; rejects anything but a positive decimal integer
uint64_t parse_field_order(const std::string& text);

// "0,1,4" or "[0, 1, 4]" -> {0, 1, 4}
std::vector<uint32_t> parse_exponent_list(const std::string& text);

// Reads BINEXT_THREADS; 0 when unset
size_t threads_from_env();

void print_usage(std::ostream& os, const char* program);

} // namespace cli
} // namespace binext
