#pragma once

/**
 * @file result_helpers.h
 * @brief Early-return macros for Result<T>
 */

#include <utility>
#include <codegraph/core/types.h>

/**
 * @def CODEGRAPH_TRY(expr)
 * @brief Evaluate expression and return its error early
 *
 * @code
 * Result<void> doWork() {
 *     CODEGRAPH_TRY(step1());
 *     CODEGRAPH_TRY(step2());
 *     return {};
 * }
 * @endcode
 */
#define CODEGRAPH_TRY(expr)                                                                        \
    do {                                                                                           \
        auto _cg_try_result = (expr);                                                              \
        if (!_cg_try_result.has_value()) {                                                         \
            return _cg_try_result.error();                                                         \
        }                                                                                          \
    } while (0)

/**
 * @def CODEGRAPH_TRY_UNWRAP(var, expr)
 * @brief Declare @p var from the value of a Result, returning its error early
 *
 * @code
 * Result<int64_t> countRows(Database& db) {
 *     CODEGRAPH_TRY_UNWRAP(stmt, db.prepare("SELECT COUNT(*) FROM symbols"));
 *     CODEGRAPH_TRY_UNWRAP(hasRow, stmt.step());
 *     return hasRow ? stmt.getInt64(0) : 0;
 * }
 * @endcode
 */
#define CODEGRAPH_TRY_UNWRAP(var, expr)                                                            \
    auto _cg_res_##var = (expr);                                                                   \
    if (!_cg_res_##var.has_value()) {                                                              \
        return _cg_res_##var.error();                                                              \
    }                                                                                              \
    auto var = std::move(_cg_res_##var).value()
