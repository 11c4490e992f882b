#pragma once

#include "types/b_field_element.hpp"
#include <string>

namespace starkcomp {

/**
 * Assertion - a boundary constraint pinning one trace column to a value
 *
 * A single assertion binds the column at one step. A periodic assertion binds
 * it at first_step, first_step + stride, first_step + 2*stride, ... up to the
 * end of the trace.
 */
class Assertion {
public:
    static Assertion single(size_t column, size_t step, BFieldElement value);
    static Assertion periodic(size_t column, size_t first_step, size_t stride, BFieldElement value);

    size_t column() const { return column_; }
    size_t first_step() const { return first_step_; }
    // 0 for a single assertion
    size_t stride() const { return stride_; }
    BFieldElement value() const { return value_; }

    bool is_single() const { return stride_ == 0; }

    // Number of trace steps the assertion binds
    size_t num_steps(size_t trace_length) const;

    /**
     * Throws std::invalid_argument if the assertion does not fit a trace of
     * the given width and length.
     */
    void validate(size_t trace_width, size_t trace_length) const;

    std::string to_string() const;

private:
    Assertion(size_t column, size_t first_step, size_t stride, BFieldElement value)
        : column_(column), first_step_(first_step), stride_(stride), value_(value) {}

    size_t column_;
    size_t first_step_;
    size_t stride_;
    BFieldElement value_;
};

} // namespace starkcomp
