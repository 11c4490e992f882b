#include "trace/execution_trace.hpp"
#include "ntt/ntt.hpp"
#include <stdexcept>
#include <string>

namespace starkcomp {

ExecutionTrace::ExecutionTrace(size_t width, size_t length)
    : columns_(width, std::vector<BFieldElement>(length, BFieldElement::zero()))
    , length_(length) {
    if (width == 0) {
        throw std::invalid_argument("Execution trace must have at least one column");
    }
    if (!is_power_of_two(length)) {
        throw std::invalid_argument(
            "Execution trace length must be a power of 2, got " + std::to_string(length));
    }
}

BFieldElement ExecutionTrace::get(size_t column, size_t step) const {
    return columns_.at(column).at(step);
}

void ExecutionTrace::set(size_t column, size_t step, BFieldElement value) {
    columns_.at(column).at(step) = value;
}

const std::vector<BFieldElement>& ExecutionTrace::column(size_t index) const {
    return columns_.at(index);
}

void ExecutionTrace::fill(
    const std::function<void(std::vector<BFieldElement>&)>& init,
    const std::function<void(size_t, std::vector<BFieldElement>&)>& update
) {
    std::vector<BFieldElement> state(width(), BFieldElement::zero());
    init(state);
    for (size_t step = 0; step < length_; ++step) {
        for (size_t c = 0; c < width(); ++c) {
            columns_[c][step] = state[c];
        }
        if (step + 1 < length_) {
            update(step, state);
        }
    }
}

LdeTrace ExecutionTrace::extend(const StarkDomain& domain) const {
    if (domain.trace_length() != length_) {
        throw std::invalid_argument("Domain trace length does not match the execution trace");
    }

    std::vector<std::vector<BFieldElement>> extended;
    extended.reserve(width());
    for (const auto& column : columns_) {
        std::vector<BFieldElement> coeffs = NTT::interpolate(column);
        extended.push_back(NTT::evaluate_on_coset(coeffs, domain.ce_domain_size(), domain.offset()));
    }

    return LdeTrace(std::move(extended), domain.ce_blowup_factor());
}

LdeTrace::LdeTrace(std::vector<std::vector<BFieldElement>> columns, size_t blowup)
    : columns_(std::move(columns))
    , blowup_(blowup) {
    if (blowup == 0) {
        throw std::invalid_argument("LDE blowup must be at least 1");
    }
}

void LdeTrace::read_row_into(size_t row, std::vector<BFieldElement>& out) const {
    const size_t r = row % num_rows();
    for (size_t c = 0; c < columns_.size(); ++c) {
        out[c] = columns_[c][r];
    }
}

} // namespace starkcomp
