/*
 * ULIDKIT COMMUNITY LICENSE
 * Version 1.0, February 2026
 *
 * Copyright (c) 2026 Ananda Firmansyah.
 *
 * This source code is licensed under the UlidKit Community License.
 * You may not use this file except in compliance with the License.
 */

/**
 * @file main_test.cpp
 * @brief Central orchestrator for the UlidKit test suite.
 *
 * @details
 * Aggregates unit and integration tests across all subsystems:
 * Infrastructure, Codec, Generation, Validation, Sort, Stream and the
 * Command Handler.
 */

#include "framework.hpp"
#include "ulidkit/infra/logger.hpp"

#include <iostream>

// ============================================================================
// Forward Declarations
// ============================================================================
// The following test functions are implemented in their respective
// translation units (e.g., infra_test.cpp, codec_test.cpp, etc.).

// Infrastructure Subsystem (infra_test.cpp)
void test_string_trim();
void test_string_trim_empty();
void test_string_case_folding();
void test_string_to_hex();
void test_string_iso8601();
void test_string_quote();
void test_logger_parse_level();
void test_logger_threshold();
void test_scheduler_submit();
void test_scheduler_drains_on_shutdown();
void test_manual_clock();
void test_system_clock();
void test_fixed_entropy();
void test_secure_entropy();

// Codec Subsystem (codec_test.cpp)
void test_codec_known_vector_decode();
void test_codec_known_vector_encode();
void test_codec_boundaries();
void test_codec_round_trip();
void test_codec_alphabet_closure();
void test_codec_order_equivalence();
void test_codec_case_insensitive();
void test_codec_decode_errors();
void test_ulid_byte_layout();

// Generation Subsystem (generator_test.cpp)
void test_generate_uses_injected_sources();
void test_generate_default_sources();
void test_monotonic_batch_increments();
void test_monotonic_batch_forced_overflow();
void test_monotonic_exhaustion();
void test_monotonic_batch_clamps_rollback();
void test_randomness_increment();
void test_entropy_failure_reported();
void test_shared_rollback_report();
void test_shared_rollback_use_latest();
void test_shared_batch_is_atomic();
void test_shared_concurrent_callers();
void test_shared_overflow_is_not_rollback();

// Validation Subsystem (validator_test.cpp)
void test_validate_scenarios();
void test_validate_detailed();
void test_parse_fields();
void test_parse_errors();
void test_inspect_age();
void test_inspect_helpers();

// Sort Engine (sort_test.cpp)
void test_sort_modes_agree();
void test_sort_idempotent();
void test_sort_mixed_case();
void test_sort_stable();
void test_sort_malformed_fails_atomically();
void test_sort_trivial_inputs();
void test_sort_records_by_column();
void test_sort_records_missing_column();

// Stream Engine (stream_test.cpp)
void test_stream_preserves_order();
void test_stream_continue_on_error_cardinality();
void test_stream_fail_fast();
void test_stream_fail_fast_parallel_lowest_index();
void test_stream_cancellation();
void test_stream_edge_cases();
void test_stream_operations();
void test_stream_record_items();
void test_generate_stream_monotonic_across_chunks();
void test_generate_stream_force_unique();
void test_generate_stream_exhaustion();

// Command Handler (handler_test.cpp)
void test_handle_generate();
void test_handle_generate_limits();
void test_handle_generate_monotonic();
void test_handle_generate_stream();
void test_handle_validate();
void test_handle_parse_and_inspect();
void test_handle_sort();
void test_handle_stream();
void test_handle_stream_parallel_order();
void test_handle_invalid_requests();

/**
 * @brief Test Suite Execution Entry Point.
 *
 * @return
 * - 0: All tests passed (Success).
 * - 1: One or more assertions failed (Exit failure for CI pipelines).
 */
int main()
{
    std::cout << "\033[36mInitiating UlidKit Test Suite...\033[0m" << std::endl;

    // Error responses are logged by the handler; keep the run readable.
    ulidkit::infra::Logger::set_level(ulidkit::infra::LogLevel::FATAL);

    // --- 1. Infrastructure Subsystem Tests ---
    RUN_TEST(test_string_trim);
    RUN_TEST(test_string_trim_empty);
    RUN_TEST(test_string_case_folding);
    RUN_TEST(test_string_to_hex);
    RUN_TEST(test_string_iso8601);
    RUN_TEST(test_string_quote);
    RUN_TEST(test_logger_parse_level);
    RUN_TEST(test_logger_threshold);
    RUN_TEST(test_scheduler_submit);
    RUN_TEST(test_scheduler_drains_on_shutdown);
    RUN_TEST(test_manual_clock);
    RUN_TEST(test_system_clock);
    RUN_TEST(test_fixed_entropy);
    RUN_TEST(test_secure_entropy);

    // --- 2. Codec Subsystem Tests ---
    RUN_TEST(test_codec_known_vector_decode);
    RUN_TEST(test_codec_known_vector_encode);
    RUN_TEST(test_codec_boundaries);
    RUN_TEST(test_codec_round_trip);
    RUN_TEST(test_codec_alphabet_closure);
    RUN_TEST(test_codec_order_equivalence);
    RUN_TEST(test_codec_case_insensitive);
    RUN_TEST(test_codec_decode_errors);
    RUN_TEST(test_ulid_byte_layout);

    // --- 3. Generation Subsystem Tests ---
    RUN_TEST(test_generate_uses_injected_sources);
    RUN_TEST(test_generate_default_sources);
    RUN_TEST(test_monotonic_batch_increments);
    RUN_TEST(test_monotonic_batch_forced_overflow);
    RUN_TEST(test_monotonic_exhaustion);
    RUN_TEST(test_monotonic_batch_clamps_rollback);
    RUN_TEST(test_randomness_increment);
    RUN_TEST(test_entropy_failure_reported);
    RUN_TEST(test_shared_rollback_report);
    RUN_TEST(test_shared_rollback_use_latest);
    RUN_TEST(test_shared_batch_is_atomic);
    RUN_TEST(test_shared_concurrent_callers);
    RUN_TEST(test_shared_overflow_is_not_rollback);

    // --- 4. Validation Subsystem Tests ---
    RUN_TEST(test_validate_scenarios);
    RUN_TEST(test_validate_detailed);
    RUN_TEST(test_parse_fields);
    RUN_TEST(test_parse_errors);
    RUN_TEST(test_inspect_age);
    RUN_TEST(test_inspect_helpers);

    // --- 5. Sort Engine Tests ---
    RUN_TEST(test_sort_modes_agree);
    RUN_TEST(test_sort_idempotent);
    RUN_TEST(test_sort_mixed_case);
    RUN_TEST(test_sort_stable);
    RUN_TEST(test_sort_malformed_fails_atomically);
    RUN_TEST(test_sort_trivial_inputs);
    RUN_TEST(test_sort_records_by_column);
    RUN_TEST(test_sort_records_missing_column);

    // --- 6. Stream Engine Tests ---
    RUN_TEST(test_stream_preserves_order);
    RUN_TEST(test_stream_continue_on_error_cardinality);
    RUN_TEST(test_stream_fail_fast);
    RUN_TEST(test_stream_fail_fast_parallel_lowest_index);
    RUN_TEST(test_stream_cancellation);
    RUN_TEST(test_stream_edge_cases);
    RUN_TEST(test_stream_operations);
    RUN_TEST(test_stream_record_items);
    RUN_TEST(test_generate_stream_monotonic_across_chunks);
    RUN_TEST(test_generate_stream_force_unique);
    RUN_TEST(test_generate_stream_exhaustion);

    // --- 7. Command Handler Tests ---
    RUN_TEST(test_handle_generate);
    RUN_TEST(test_handle_generate_limits);
    RUN_TEST(test_handle_generate_monotonic);
    RUN_TEST(test_handle_generate_stream);
    RUN_TEST(test_handle_validate);
    RUN_TEST(test_handle_parse_and_inspect);
    RUN_TEST(test_handle_sort);
    RUN_TEST(test_handle_stream);
    RUN_TEST(test_handle_stream_parallel_order);
    RUN_TEST(test_handle_invalid_requests);

    // Render the final results summary to stdout.
    ulidkit::test::print_summary();

    // Signal exit status: Non-zero if failures occurred.
    return (ulidkit::test::failed_count == 0) ? 0 : 1;
}
