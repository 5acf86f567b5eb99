// SPDX-License-Identifier: MIT
/**
 * @file strikeopt_trace.h
 * @brief USDT (User Statically-Defined Tracing) probes for strikeopt
 *
 * This header provides zero-overhead tracing points that can be dynamically
 * enabled at runtime using tools like bpftrace, systemtap, or perf.
 *
 * When tracing is disabled (default), probes compile to single NOP instructions.
 * When enabled via tracing tools, probes capture structured data without
 * modifying the library binary.
 *
 * Example usage with bpftrace:
 *   # Watch every sweep
 *   sudo bpftrace -e 'usdt:./strike_optimizer:strikeopt:sweep_* { ... }'
 *
 *   # Which candidates were dropped and why
 *   sudo bpftrace -e 'usdt:./strike_optimizer:strikeopt:candidate_excluded
 *       { printf("idx=%d code=%d\n", arg0, arg2); }'
 */

#ifndef STRIKEOPT_TRACE_H
#define STRIKEOPT_TRACE_H

#include <stddef.h>

/**
 * USDT Configuration
 *
 * On Linux with systemtap-sdt-dev installed, use sys/sdt.h
 * Otherwise, define no-op macros for compatibility
 */
#ifdef HAVE_SYSTEMTAP_SDT
#include <sys/sdt.h>
#else
// Fallback: define empty macros when SDT is not available
#define DTRACE_PROBE(provider, probe) do {} while(0)
#define DTRACE_PROBE1(provider, probe, arg1) do {} while(0)
#define DTRACE_PROBE2(provider, probe, arg1, arg2) do {} while(0)
#define DTRACE_PROBE3(provider, probe, arg1, arg2, arg3) do {} while(0)
#define DTRACE_PROBE4(provider, probe, arg1, arg2, arg3, arg4) do {} while(0)
#endif

/**
 * Provider name for all strikeopt probes
 */
#define STRIKEOPT_PROVIDER strikeopt

/**
 * Module identifiers, passed as the first parameter to the error probes
 */
#define MODULE_PRICING          1
#define MODULE_STRIKE_OPTIMIZER 2
#define MODULE_VALIDATION       3

/**
 * ============================================================================
 * Strike Sweep Probes
 * ============================================================================
 */

/**
 * Fired when a sweep begins
 * @param sample_count: Number of candidate strikes
 * @param min_strike: First candidate
 * @param max_strike: Last candidate
 * @param option_type: 0 = CALL, 1 = PUT
 */
#define STRIKEOPT_TRACE_SWEEP_START(sample_count, min_strike, max_strike, option_type) \
    DTRACE_PROBE4(STRIKEOPT_PROVIDER, sweep_start, sample_count, min_strike, max_strike, option_type)

/**
 * Fired when a candidate is dropped from the sweep
 * @param index: Candidate index in the grid
 * @param value: Offending value (premium or ratio)
 * @param error_code: NumericErrorCode as integer
 */
#define STRIKEOPT_TRACE_CANDIDATE_EXCLUDED(index, value, error_code) \
    DTRACE_PROBE3(STRIKEOPT_PROVIDER, candidate_excluded, index, value, error_code)

/**
 * Fired when the running best improves
 * @param index: Candidate index in the grid
 * @param strike: Candidate strike
 * @param profit_ratio: New best profit ratio
 */
#define STRIKEOPT_TRACE_NEW_BEST(index, strike, profit_ratio) \
    DTRACE_PROBE3(STRIKEOPT_PROVIDER, new_best, index, strike, profit_ratio)

/**
 * Fired when a sweep completes
 * @param best_strike: Selected strike (0 if no valid candidate)
 * @param best_profit_ratio: Selected profit ratio
 * @param valid_count: Candidates that took part in the comparison
 * @param excluded_count: Candidates dropped as degenerate
 */
#define STRIKEOPT_TRACE_SWEEP_COMPLETE(best_strike, best_profit_ratio, valid_count, excluded_count) \
    DTRACE_PROBE4(STRIKEOPT_PROVIDER, sweep_complete, best_strike, best_profit_ratio, \
                  valid_count, excluded_count)

/**
 * ============================================================================
 * Validation and Error Probes
 * ============================================================================
 */

/**
 * Fired when input validation fails
 * @param module_id: Module identifier
 * @param error_code: NumericErrorCode as integer
 * @param value: Offending value
 */
#define STRIKEOPT_TRACE_VALIDATION_ERROR(module_id, error_code, value) \
    DTRACE_PROBE3(STRIKEOPT_PROVIDER, validation_error, module_id, error_code, value)

/**
 * Fired when the pricing formula degenerates on valid inputs
 * @param error_code: NumericErrorCode as integer
 * @param strike: Strike being priced
 * @param value: Offending intermediate (denominator or premium)
 */
#define STRIKEOPT_TRACE_PRICING_ERROR(error_code, strike, value) \
    DTRACE_PROBE4(STRIKEOPT_PROVIDER, pricing_error, MODULE_PRICING, error_code, strike, value)

#endif // STRIKEOPT_TRACE_H
