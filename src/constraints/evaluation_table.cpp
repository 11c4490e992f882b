#include "constraints/evaluation_table.hpp"
#include "constraints/divisor_accumulation.hpp"
#include "constraints/prover_error.hpp"
#include "common/debug_control.hpp"
#include "domain/stark_domain.hpp"
#include "ntt/ntt.hpp"
#include "polynomial/polynomial.hpp"
#include <algorithm>
#include <stdexcept>
#include <string>
#include <utility>

namespace starkcomp {

template<typename E>
ConstraintEvaluationTable<E>::ConstraintEvaluationTable(
    size_t domain_size,
    BFieldElement domain_offset,
    size_t trace_length,
    std::vector<ConstraintDivisor> divisors,
    size_t min_fragment_size)
    : ConstraintEvaluationTable(domain_size, domain_offset, trace_length, std::move(divisors),
                                std::nullopt, min_fragment_size) {}

template<typename E>
ConstraintEvaluationTable<E>::ConstraintEvaluationTable(
    size_t domain_size,
    BFieldElement domain_offset,
    size_t trace_length,
    std::vector<ConstraintDivisor> divisors,
    std::vector<size_t> expected_degrees,
    size_t min_fragment_size)
    : ConstraintEvaluationTable(domain_size, domain_offset, trace_length, std::move(divisors),
                                std::optional<std::vector<size_t>>(std::move(expected_degrees)),
                                min_fragment_size) {}

template<typename E>
ConstraintEvaluationTable<E>::ConstraintEvaluationTable(
    size_t domain_size,
    BFieldElement domain_offset,
    size_t trace_length,
    std::vector<ConstraintDivisor> divisors,
    std::optional<std::vector<size_t>> expected_degrees,
    size_t min_fragment_size)
    : divisors_(std::move(divisors))
    , domain_offset_(domain_offset)
    , trace_length_(trace_length)
    , num_rows_(domain_size)
    , min_fragment_size_(min_fragment_size) {
    if (divisors_.empty()) {
        throw std::invalid_argument("Constraint evaluation table needs at least one divisor");
    }
    if (!is_power_of_two(domain_size)) {
        throw std::invalid_argument("Constraint evaluation domain size must be a power of 2");
    }
    if (!is_power_of_two(trace_length)) {
        throw std::invalid_argument("Trace length must be a power of 2");
    }
    if (domain_offset.is_zero()) {
        throw std::invalid_argument("Domain offset must be non-zero");
    }
    if (min_fragment_size == 0) {
        throw std::invalid_argument("Minimum fragment size must be at least 1");
    }
    // unsupported divisors are rejected before any storage exists
    for (const auto& divisor : divisors_) {
        validate_divisor_shape(divisor, domain_size);
    }

    evaluations_.assign(divisors_.size(), std::vector<E>(domain_size, E()));

    if (expected_degrees) {
        TransitionVerification verification;
        verification.evaluations.assign(
            expected_degrees->size(), std::vector<BFieldElement>(domain_size, BFieldElement::zero()));
        verification.expected_degrees = std::move(*expected_degrees);
        verification_ = std::move(verification);
    }
}

template<typename E>
size_t ConstraintEvaluationTable<E>::num_transition_columns() const {
    return verification_ ? verification_->evaluations.size() : 0;
}

template<typename E>
void ConstraintEvaluationTable<E>::ensure_not_consumed() const {
    if (consumed_) {
        throw std::logic_error("Constraint evaluation table has already been consumed");
    }
}

template<typename E>
std::vector<EvaluationTableFragment<E>> ConstraintEvaluationTable<E>::fragments(size_t num_fragments) {
    ensure_not_consumed();
    if (fragmented_) {
        throw std::logic_error("Constraint evaluation table has already been fragmented");
    }
    if (num_fragments == 0) {
        throw std::invalid_argument("Number of fragments must be at least 1");
    }

    const size_t fragment_size = num_rows_ / num_fragments;
    if (fragment_size < min_fragment_size_) {
        throw std::invalid_argument(
            "fragment size must be at least " + std::to_string(min_fragment_size_) +
            ", but was " + std::to_string(fragment_size));
    }
    if (fragment_size * num_fragments != num_rows_) {
        throw std::invalid_argument(
            "number of fragments " + std::to_string(num_fragments) +
            " does not divide the table's " + std::to_string(num_rows_) + " rows");
    }

    std::vector<EvaluationTableFragment<E>> result;
    result.reserve(num_fragments);
    for (size_t i = 0; i < num_fragments; ++i) {
        const size_t offset = i * fragment_size;

        std::vector<E*> columns;
        columns.reserve(evaluations_.size());
        for (auto& column : evaluations_) {
            columns.push_back(column.data() + offset);
        }

        std::vector<BFieldElement*> t_columns;
        if (verification_) {
            t_columns.reserve(verification_->evaluations.size());
            for (auto& column : verification_->evaluations) {
                t_columns.push_back(column.data() + offset);
            }
        }

        result.push_back(EvaluationTableFragment<E>(
            offset, fragment_size, std::move(columns), std::move(t_columns), verification_.has_value()));
    }

    fragmented_ = true;
    STARKCOMP_DEBUG_PRINT("Evaluation table: %zu rows x %zu columns split into %zu fragments of %zu rows\n",
                          num_rows_, num_columns(), num_fragments, fragment_size);
    return result;
}

template<typename E>
void ConstraintEvaluationTable<E>::validate_transition_degrees() const {
    ensure_not_consumed();
    if (!verification_) {
        throw std::logic_error("Transition degree validation requires verification mode");
    }

    // measure the degree of every transition constraint by interpolating it
    std::vector<size_t> actual_degrees;
    actual_degrees.reserve(verification_->evaluations.size());
    size_t max_degree = 0;
    for (const auto& evaluations : verification_->evaluations) {
        std::vector<BFieldElement> poly = evaluations;
        NTT::interpolate_with_offset(poly, domain_offset_);
        const size_t degree = degree_of(poly);
        actual_degrees.push_back(degree);
        max_degree = std::max(max_degree, degree);
    }

    if (verification_->expected_degrees != actual_degrees) {
        throw ProverError(ProverError::Kind::MismatchedTransitionDegrees,
                          verification_->expected_degrees, actual_degrees);
    }

    // the domain must be exactly as large as the highest degree requires
    const size_t expected_domain_size = next_power_of_two(std::max(max_degree, trace_length_ + 1));
    if (expected_domain_size != num_rows_) {
        throw ProverError(ProverError::Kind::MismatchedDomainSize, {expected_domain_size}, {num_rows_});
    }
}

template<typename E>
std::vector<size_t> ConstraintEvaluationTable<E>::expected_column_degrees() const {
    ensure_not_consumed();
    if (!verification_) {
        throw std::logic_error("Column degree validation requires verification mode");
    }

    // column 0 combines transition constraints, every other column combines
    // assertions against trace columns of degree at most trace_length - 1
    std::vector<size_t> expected;
    expected.reserve(divisors_.size());
    for (size_t i = 0; i < divisors_.size(); ++i) {
        size_t numerator_degree = trace_length_ - 1;
        if (i == 0) {
            const auto& degrees = verification_->expected_degrees;
            numerator_degree = degrees.empty() ? 0 : *std::max_element(degrees.begin(), degrees.end());
        }
        const size_t divisor_degree = divisors_[i].degree();
        expected.push_back(numerator_degree > divisor_degree ? numerator_degree - divisor_degree : 0);
    }
    return expected;
}

template<typename E>
void ConstraintEvaluationTable<E>::validate_column_degrees(parallel::Executor& executor) const {
    const std::vector<size_t> expected = expected_column_degrees();

    std::vector<size_t> actual;
    actual.reserve(evaluations_.size());
    bool exceeded = false;
    for (size_t i = 0; i < evaluations_.size(); ++i) {
        std::vector<E> quotient(num_rows_, E());
        accumulate_column(evaluations_[i], divisors_[i], domain_offset_, quotient, executor);
        NTT::interpolate_with_offset(quotient, domain_offset_);
        actual.push_back(degree_of(quotient));
        exceeded = exceeded || actual.back() > expected[i];
        STARKCOMP_DEBUG_COUT("  column " << i << " divided by " << divisors_[i].to_string()
                             << " has degree " << actual.back() << " (bound " << expected[i] << ")" << std::endl);
    }

    if (exceeded) {
        throw ProverError(ProverError::Kind::MismatchedColumnDegrees, expected, actual);
    }
}

template<typename E>
CompositionPoly<E> ConstraintEvaluationTable<E>::into_composition_poly(parallel::Executor& executor) && {
    ensure_not_consumed();

    if (verification_) {
        validate_transition_degrees();
        validate_column_degrees(executor);
    }

    std::vector<std::vector<E>> columns = std::move(evaluations_);
    evaluations_.clear();
    verification_.reset();
    consumed_ = true;

    // divide each column by its divisor and add all quotients together
    std::vector<E> combined(num_rows_, E());
    for (size_t i = 0; i < columns.size(); ++i) {
        accumulate_column(columns[i], divisors_[i], domain_offset_, combined, executor);
        std::vector<E>().swap(columns[i]);
    }

    // combined holds evaluations of the composition polynomial over the coset
    NTT::interpolate_with_offset(combined, domain_offset_);

    return CompositionPoly<E>(std::move(combined), trace_length_);
}

template<typename E>
CompositionPoly<E> ConstraintEvaluationTable<E>::into_composition_poly() && {
    parallel::SequentialExecutor executor;
    return std::move(*this).into_composition_poly(executor);
}

template<typename E>
std::vector<std::vector<E>> ConstraintEvaluationTable<E>::into_columns() && {
    ensure_not_consumed();
    consumed_ = true;
    verification_.reset();
    std::vector<std::vector<E>> columns = std::move(evaluations_);
    evaluations_.clear();
    return columns;
}

template<typename E>
void EvaluationTableFragment<E>::update_row(size_t row_idx, const std::vector<E>& row_data) {
    if (row_idx >= num_rows_) {
        throw std::out_of_range(
            "row " + std::to_string(row_idx) + " outside fragment of " + std::to_string(num_rows_) + " rows");
    }
    if (row_data.size() != columns_.size()) {
        throw std::out_of_range(
            "row has " + std::to_string(row_data.size()) + " values, table has " +
            std::to_string(columns_.size()) + " columns");
    }
    for (size_t c = 0; c < columns_.size(); ++c) {
        columns_[c][row_idx] = row_data[c];
    }
}

template<typename E>
void EvaluationTableFragment<E>::update_transition_evaluations(
    size_t row_idx,
    const std::vector<BFieldElement>& row_data
) {
    if (!verification_) {
        throw std::logic_error("Transition evaluations are only recorded in verification mode");
    }
    if (row_idx >= num_rows_) {
        throw std::out_of_range(
            "row " + std::to_string(row_idx) + " outside fragment of " + std::to_string(num_rows_) + " rows");
    }
    if (row_data.size() != t_columns_.size()) {
        throw std::out_of_range(
            "row has " + std::to_string(row_data.size()) + " transition values, table tracks " +
            std::to_string(t_columns_.size()) + " constraints");
    }
    for (size_t c = 0; c < t_columns_.size(); ++c) {
        t_columns_[c][row_idx] = row_data[c];
    }
}

template class ConstraintEvaluationTable<BFieldElement>;
template class ConstraintEvaluationTable<XFieldElement>;
template class EvaluationTableFragment<BFieldElement>;
template class EvaluationTableFragment<XFieldElement>;

} // namespace starkcomp
