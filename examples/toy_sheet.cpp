#include <cellexpr/builtins.hpp>
#include <cellexpr/config.hpp>
#include <cellexpr/errors.hpp>
#include <cellexpr/eval.hpp>
#include <cellexpr/grid_stub.hpp>
#include <cellexpr/parser.hpp>

#include <iostream>
#include <memory>
#include <string>

#include <spdlog/spdlog.h>

int main() {
    using namespace cellexpr;

    Config cfg;
    cfg.log_level = spdlog::level::info;
    configure_logging(cfg);

    // A small workbook: quantities and prices, plus a lookup sheet.
    MemoryWorkbook wb;
    MemorySheet& orders = wb.add_sheet("Orders");
    orders.set("A1", Value::text("widget"));
    orders.set("A2", Value::text("gadget"));
    orders.set("A3", Value::text("gizmo"));
    orders.set("B1", Value::number(4));
    orders.set("B2", Value::number(10));
    orders.set("B3", Value::number(1));
    orders.set("C1", Value::number(2.5));
    orders.set("C2", Value::number(1.25));
    orders.set("C3", Value::number(40));

    MemorySheet& rates = wb.add_sheet("Rates");
    rates.set("A1", Value::number(0.2));

    Environment env;
    register_builtins(env);
    env.set_default(std::make_shared<WorkbookObject>(wb));

    // Unqualified references go to the active sheet (Orders).
    WorkbookScope book(wb, nullptr, cfg.detect_cycles);
    ScopeStack stack(cfg.detect_cycles);
    auto base = stack.push(env);
    auto cells = stack.push(book);

    Parser parser(cfg.mode);
    const char* formulas[] = {
        "=B1 * C1",
        "sum(B1:B3)",
        "sumif(B1:B3 > 2)",
        "countif(C1:C3 >= 2)",
        "round(sum(C1:C3) * (1 + Rates!A1), 2)",
        "upper(left(A2, 3)) & '-' & len(A3)",
        "if(max(B1:B3) > 5, 'bulk', 'retail')",
        "typeof(sheets)",
        "1 / (B3 - 1)",
        "missing(1)",
        "1 +",
    };

    for (const char* text : formulas) {
        try {
            auto expr = parser.parse(text);
            Value v = evaluate(*expr, stack);
            std::cout << to_string(*expr) << " => " << display(v) << "\n";
        } catch (const ParseError& e) {
            std::cout << text << " => parse error: " << e.what() << "\n";
        } catch (const EvalError& e) {
            std::cout << text << " => eval error: " << e.what() << "\n";
        }
    }

    // Copy B1*C1 one row down, as filling a column would.
    auto first = parser.parse("B1 * C1");
    auto moved = clone_with_offset(*first, 1, 0);
    std::cout << to_string(*moved) << " => " << display(evaluate(*moved, stack)) << "\n";
    return 0;
}
