// SPDX-License-Identifier: MIT
#pragma once

/**
 * @file parallel.hpp
 * @brief Parallelization macros for OpenMP or sequential execution
 *
 * Usage:
 *   STRIKEOPT_PRAGMA_PARALLEL_FOR_STATIC
 *   for (int64_t i = 0; i < n; ++i) { ... }
 *
 * Without OpenMP every macro expands to nothing and the loops run in order.
 */

#if defined(_OPENMP)
    #define STRIKEOPT_PRAGMA_PARALLEL_FOR_STATIC        _Pragma("omp parallel for schedule(static)")
#else
    #define STRIKEOPT_PRAGMA_PARALLEL_FOR_STATIC
#endif

/**
 * Notes:
 *
 * 1. _Pragma is used instead of #pragma so the directives can live in macros.
 *
 * 2. Loops under these macros must write to disjoint slots. Any reduction that
 *    depends on ordering (e.g. first-wins tie-breaks) belongs after the loop.
 */
