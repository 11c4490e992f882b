#pragma once

#include "types/b_field_element.hpp"
#include "types/x_field_element.hpp"
#include "air/constraint_divisor.hpp"
#include "constraints/composition_poly.hpp"
#include "parallel/executor.hpp"
#include <optional>
#include <vector>

namespace starkcomp {

// Fragments smaller than this make dispatch overhead dominate the fill work
constexpr size_t MIN_FRAGMENT_SIZE = 16;

template<typename E>
class EvaluationTableFragment;

/**
 * ConstraintEvaluationTable - constraint evaluations over the evaluation domain
 *
 * One column per divisor: column 0 holds the combined transition constraint
 * evaluations, the remaining columns hold boundary constraints combined by
 * common divisor. Columns are filled through fragments (disjoint row ranges
 * that can be written from different threads) and the table is then consumed
 * into a composition polynomial.
 *
 * With verification enabled the table also keeps the raw evaluation of each
 * individual transition constraint, and consuming it checks that their
 * degrees are the ones the arithmetization declared. This is a development
 * aid; it interpolates every transition constraint and is far too slow for
 * production proving.
 *
 * Lifecycle: construct, fragments() once, write every row exactly once, drop
 * the fragments, then into_composition_poly() on an rvalue. Fragments point
 * into the table's storage and must not outlive the fill phase.
 */
template<typename E>
class ConstraintEvaluationTable {
public:
    /**
     * Allocates divisors.size() zero-initialized columns of domain_size rows.
     */
    ConstraintEvaluationTable(
        size_t domain_size,
        BFieldElement domain_offset,
        size_t trace_length,
        std::vector<ConstraintDivisor> divisors,
        size_t min_fragment_size = MIN_FRAGMENT_SIZE);

    /**
     * Verification mode: additionally allocates one base field column per
     * transition constraint, expected_degrees[i] being the degree the
     * arithmetization declares for constraint i.
     */
    ConstraintEvaluationTable(
        size_t domain_size,
        BFieldElement domain_offset,
        size_t trace_length,
        std::vector<ConstraintDivisor> divisors,
        std::vector<size_t> expected_degrees,
        size_t min_fragment_size = MIN_FRAGMENT_SIZE);

    ConstraintEvaluationTable(const ConstraintEvaluationTable&) = delete;
    ConstraintEvaluationTable& operator=(const ConstraintEvaluationTable&) = delete;
    ConstraintEvaluationTable(ConstraintEvaluationTable&&) = default;
    ConstraintEvaluationTable& operator=(ConstraintEvaluationTable&&) = default;

    size_t num_rows() const { return num_rows_; }
    size_t num_columns() const { return divisors_.size(); }
    size_t trace_length() const { return trace_length_; }
    BFieldElement domain_offset() const { return domain_offset_; }
    const std::vector<ConstraintDivisor>& divisors() const { return divisors_; }
    bool verification_enabled() const { return verification_.has_value(); }
    size_t num_transition_columns() const;

    /**
     * Splits every column into num_fragments equal contiguous row ranges.
     *
     * Throws std::invalid_argument (leaving the table untouched) if
     * num_fragments is zero, does not divide the row count, or yields
     * fragments shorter than the minimum fragment size. Throws
     * std::logic_error if the table was already fragmented or consumed.
     */
    std::vector<EvaluationTableFragment<E>> fragments(size_t num_fragments);

    /**
     * Divides every column by its divisor, sums the quotients and
     * interpolates the sum over the coset into coefficient form.
     *
     * In verification mode, transition constraint degrees and then the
     * degree of every column after division are checked first, and a
     * ProverError is thrown on mismatch (the table is then left intact).
     */
    CompositionPoly<E> into_composition_poly(parallel::Executor& executor) &&;
    CompositionPoly<E> into_composition_poly() &&;

    // Gives up the table's columns once filling is over
    std::vector<std::vector<E>> into_columns() &&;

    /**
     * Interpolates each transition constraint column and compares measured
     * degrees with the expected ones, then checks the evaluation domain is
     * the size those degrees require. Throws ProverError on mismatch and
     * std::logic_error when verification is disabled.
     */
    void validate_transition_degrees() const;

    /**
     * Divides each column by its divisor on its own and interpolates the
     * quotient. A column whose quotient is above its bound was not divisible,
     * meaning a constraint does not hold on the trace. Bounds: column 0 may
     * reach the highest declared transition degree minus its divisor degree,
     * other columns trace_length - 1 minus theirs. Throws ProverError on any
     * excess and std::logic_error when verification is disabled.
     */
    void validate_column_degrees(parallel::Executor& executor) const;

    // Per-column quotient degree bounds used by validate_column_degrees()
    std::vector<size_t> expected_column_degrees() const;

private:
    struct TransitionVerification {
        std::vector<std::vector<BFieldElement>> evaluations;
        std::vector<size_t> expected_degrees;
    };

    ConstraintEvaluationTable(
        size_t domain_size,
        BFieldElement domain_offset,
        size_t trace_length,
        std::vector<ConstraintDivisor> divisors,
        std::optional<std::vector<size_t>> expected_degrees,
        size_t min_fragment_size);

    void ensure_not_consumed() const;

    std::vector<std::vector<E>> evaluations_;
    std::vector<ConstraintDivisor> divisors_;
    BFieldElement domain_offset_;
    size_t trace_length_;
    size_t num_rows_;
    size_t min_fragment_size_;
    std::optional<TransitionVerification> verification_;
    bool fragmented_ = false;
    bool consumed_ = false;
};

/**
 * EvaluationTableFragment - write-only view of rows [offset, offset + num_rows)
 * across every column of a table
 *
 * Rows are addressed relative to the fragment. Fragments of one table never
 * share a row, so each can be filled by its own worker without locking.
 */
template<typename E>
class EvaluationTableFragment {
public:
    // Row at which the fragment starts in the table
    size_t offset() const { return offset_; }
    size_t num_rows() const { return num_rows_; }
    size_t num_columns() const { return columns_.size(); }
    bool has_transition_evaluations() const { return verification_; }

    /**
     * Writes row_data[c] into column c at row row_idx of this fragment.
     * Throws std::out_of_range on a bad row index or row width.
     */
    void update_row(size_t row_idx, const std::vector<E>& row_data);

    // Verification mode only; writes one value per transition constraint
    void update_transition_evaluations(size_t row_idx, const std::vector<BFieldElement>& row_data);

private:
    friend class ConstraintEvaluationTable<E>;

    EvaluationTableFragment(
        size_t offset,
        size_t num_rows,
        std::vector<E*> columns,
        std::vector<BFieldElement*> t_columns,
        bool verification)
        : offset_(offset)
        , num_rows_(num_rows)
        , columns_(std::move(columns))
        , t_columns_(std::move(t_columns))
        , verification_(verification) {}

    size_t offset_;
    size_t num_rows_;
    std::vector<E*> columns_;
    std::vector<BFieldElement*> t_columns_;
    bool verification_;
};

extern template class ConstraintEvaluationTable<BFieldElement>;
extern template class ConstraintEvaluationTable<XFieldElement>;
extern template class EvaluationTableFragment<BFieldElement>;
extern template class EvaluationTableFragment<XFieldElement>;

} // namespace starkcomp
