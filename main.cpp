/**
 * binext - Binary Extension Field Tool
 *
 * Builds GF(2^m) from a catalog order or an explicit primitive polynomial and
 * prints element descriptions, the log/antilog table, the minimal polynomial
 * table and addition/multiplication tables.
 *
 * Usage:
 *   ./binext --order 16 --minpoly-table
 *   ./binext --poly 0,1,4 --element a^3 --element a^5 --json
 */

#include <iostream>
#include <memory>
#include <nlohmann/json.hpp>
#include <tbb/global_control.h>

#include "cli/tool_config.hpp"
#include "field/field_element.hpp"
#include "field/field_tables.hpp"
#include "report/field_report.hpp"

using namespace binext;

int main(int argc, char* argv[]) {
    try {
        cli::ToolConfig config = cli::ToolConfig::from_args(argc, argv);
        if (config.help) {
            cli::print_usage(std::cout, argv[0]);
            return 0;
        }

        std::unique_ptr<tbb::global_control> thread_limit;
        if (config.threads > 0) {
            thread_limit = std::make_unique<tbb::global_control>(
                tbb::global_control::max_allowed_parallelism, config.threads);
        }

        FieldTablesPtr tables = FieldTables::create(config.field);

        std::vector<FieldElement> elements;
        for (const auto& text : config.elements) {
            elements.push_back(FieldElement::parse(text, tables));
        }

        if (config.json) {
            nlohmann::json out;
            out["field"] = report::field_to_json(*tables);
            if (!elements.empty()) {
                out["elements"] = nlohmann::json::array();
                for (const auto& elem : elements) {
                    out["elements"].push_back(report::element_to_json(elem));
                }
            }
            if (config.minpoly_table) {
                out["minpoly_table"] = report::minpoly_table_to_json(report::minpoly_table(tables));
            }
            if (config.add_table) {
                out["addition_table"] = report::cayley_table_to_json(report::addition_table(tables));
            }
            if (config.mul_table) {
                out["multiplication_table"] =
                    report::cayley_table_to_json(report::multiplication_table(tables));
            }
            std::cout << out.dump(2) << std::endl;
            return 0;
        }

        if (!config.any_report()) {
            config.show_tables = true;
        }

        if (config.show_tables) {
            std::cout << report::format_field_summary(*tables) << std::endl;
        }
        for (const auto& elem : elements) {
            std::cout << report::format_element(elem) << std::endl;
        }
        if (config.minpoly_table) {
            std::cout << "=== Minimal polynomials, GF(" << tables->order() << ") ===" << std::endl;
            std::cout << report::format_minpoly_table(report::minpoly_table(tables)) << std::endl;
        }
        if (config.add_table) {
            std::cout << "=== Addition table, GF(" << tables->order() << ") ===" << std::endl;
            std::cout << report::format_cayley_table(tables, report::addition_table(tables)) << std::endl;
        }
        if (config.mul_table) {
            std::cout << "=== Multiplication table, GF(" << tables->order() << ") ===" << std::endl;
            std::cout << report::format_cayley_table(tables, report::multiplication_table(tables))
                      << std::endl;
        }
    } catch (const std::invalid_argument& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        cli::print_usage(std::cerr, argv[0]);
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
