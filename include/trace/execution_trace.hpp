#pragma once

#include "types/b_field_element.hpp"
#include "domain/stark_domain.hpp"
#include <functional>
#include <vector>

namespace starkcomp {

class LdeTrace;

/**
 * ExecutionTrace - column-major table of base field registers over time
 */
class ExecutionTrace {
public:
    ExecutionTrace(size_t width, size_t length);

    size_t width() const { return columns_.size(); }
    size_t length() const { return length_; }

    BFieldElement get(size_t column, size_t step) const;
    void set(size_t column, size_t step, BFieldElement value);
    const std::vector<BFieldElement>& column(size_t index) const;

    /**
     * Fills the trace row by row: init writes step 0, update(step, state)
     * turns the state of step into the state of step + 1.
     */
    void fill(
        const std::function<void(std::vector<BFieldElement>&)>& init,
        const std::function<void(size_t, std::vector<BFieldElement>&)>& update);

    /**
     * Low-degree extension onto the constraint evaluation domain: every
     * column is interpolated over the trace domain and evaluated over the
     * (blown up, shifted) evaluation domain.
     */
    LdeTrace extend(const StarkDomain& domain) const;

private:
    std::vector<std::vector<BFieldElement>> columns_;
    size_t length_;
};

/**
 * LdeTrace - trace columns evaluated over the constraint evaluation domain
 *
 * Row j corresponds to the point offset * g^j; the trace step following it is
 * row j + blowup (wrapping around the domain).
 */
class LdeTrace {
public:
    LdeTrace(std::vector<std::vector<BFieldElement>> columns, size_t blowup);

    size_t width() const { return columns_.size(); }
    size_t num_rows() const { return columns_.empty() ? 0 : columns_[0].size(); }
    size_t blowup() const { return blowup_; }

    BFieldElement get(size_t column, size_t row) const { return columns_[column][row]; }

    // Copies row (mod num_rows) into out, which must have width() entries
    void read_row_into(size_t row, std::vector<BFieldElement>& out) const;

    size_t next_row(size_t row) const { return (row + blowup_) % num_rows(); }

private:
    std::vector<std::vector<BFieldElement>> columns_;
    size_t blowup_;
};

} // namespace starkcomp
