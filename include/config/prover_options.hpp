#pragma once

#include "types/b_field_element.hpp"
#include "parallel/executor.hpp"
#include "chacha12_rng.hpp"
#include <string>

namespace starkcomp {

/**
 * ProverOptions - knobs of the composition prover
 *
 * Resolved from defaults, then an optional JSON document, then environment:
 * - STARKCOMP_VERIFY: "1"/"true" turns degree verification on, "0"/"false" off
 * - STARKCOMP_EXECUTOR: sequential | tbb | openmp | taskflow
 * - STARKCOMP_NUM_FRAGMENTS: fragment count, 0 to derive it from the executor
 *
 * JSON keys mirror the field names; "domain_offset" is a u64, "seed" a
 * 64-character hex string.
 */
struct ProverOptions {
    // 0 derives the count from the executor's concurrency
    size_t num_fragments = 0;
    size_t min_fragment_size = 16;
    bool verification_mode = false;
    parallel::ExecutorKind executor = parallel::ExecutorKind::Tbb;
    BFieldElement domain_offset = BFieldElement::generator();
    ChaCha12Rng::Seed seed{};

    static ProverOptions from_json_string(const std::string& json_text);
    static ProverOptions from_file(const std::string& path);

    // Overrides fields from STARKCOMP_* environment variables
    ProverOptions& apply_environment();

    // Throws std::invalid_argument on inconsistent values
    void validate() const;

    /**
     * Number of fragments for a table of num_rows rows: the configured count,
     * or the largest power of two not above the executor concurrency (times
     * four, to smooth out imbalance) that keeps fragments at least
     * min_fragment_size long.
     */
    size_t resolve_num_fragments(size_t num_rows, size_t concurrency) const;

    std::string to_json_string() const;
};

} // namespace starkcomp
