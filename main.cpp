#include <chrono>
#include <fstream>
#include <iostream>
#include <string>
#include <nlohmann/json.hpp>

#include "config/prover_options.hpp"
#include "constraints/composition_coefficients.hpp"
#include "constraints/composition_prover.hpp"
#include "constraints/prover_error.hpp"
#include "examples/fibonacci_air.hpp"
#include "parallel/thread_coordination.h"

using namespace starkcomp;

namespace {

struct CommandLine {
    size_t length = 1024;
    std::string config_path;
    std::string output_path;
};

void print_usage(const char* program) {
    std::cerr << "Usage:\n";
    std::cerr << "  " << program << " [--length <n>] [--config <options.json>] [--output <report.json>]\n";
    std::cerr << "    --length  Fibonacci sequence length, a power of 2 >= 16 (default 1024)\n";
    std::cerr << "    --config  prover options (num_fragments, min_fragment_size, verification_mode,\n";
    std::cerr << "              executor, domain_offset, seed); STARKCOMP_* environment overrides apply\n";
    std::cerr << "    --output  where to write the JSON report (default: stdout)\n";
}

CommandLine parse_command_line(int argc, char* argv[]) {
    CommandLine cmd;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (i + 1 >= argc) {
            throw std::invalid_argument("Missing value for " + arg);
        }
        const std::string value = argv[++i];
        if (arg == "--length") {
            size_t consumed = 0;
            cmd.length = static_cast<size_t>(std::stoull(value, &consumed, 10));
            if (consumed != value.size()) {
                throw std::invalid_argument("--length must be an integer, got " + value);
            }
        } else if (arg == "--config") {
            cmd.config_path = value;
        } else if (arg == "--output") {
            cmd.output_path = value;
        } else {
            throw std::invalid_argument("Unknown argument: " + arg);
        }
    }
    return cmd;
}

nlohmann::json xfe_to_json(const XFieldElement& x) {
    return nlohmann::json::array({x.coeff(0).value(), x.coeff(1).value(), x.coeff(2).value()});
}

} // namespace

/**
 * Proves knowledge of a Fibonacci term up to the composition polynomial and
 * reports its shape.
 */
int main(int argc, char* argv[]) {
    CommandLine cmd;
    try {
        cmd = parse_command_line(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        print_usage(argv[0]);
        return 1;
    }

    try {
        parallel::initialize_thread_coordination();

        ProverOptions options = cmd.config_path.empty()
            ? ProverOptions()
            : ProverOptions::from_file(cmd.config_path);
        options.apply_environment();

        std::cerr << "Building Fibonacci trace of " << cmd.length << " terms..." << std::endl;
        ExecutionTrace trace = build_fibonacci_trace(cmd.length);
        const BFieldElement result = compute_fibonacci_term(cmd.length);
        FibonacciAir air(trace.length(), result);

        std::cerr << "Computing composition polynomial (" << parallel::to_string(options.executor)
                  << " executor, verification " << (options.verification_mode ? "on" : "off") << ")..."
                  << std::endl;
        auto start = std::chrono::high_resolution_clock::now();
        CompositionProver<XFieldElement> prover(options);
        CompositionPoly<XFieldElement> poly = prover.build_composition_poly(air, trace);
        auto end = std::chrono::high_resolution_clock::now();
        const double elapsed_ms = std::chrono::duration<double, std::milli>(end - start).count();

        // out-of-domain sample point derived from the seed, as a verifier would draw it
        ChaCha12Rng rng(options.seed);
        const XFieldElement z = draw_element<XFieldElement>(rng);

        nlohmann::json report;
        report["sequence_length"] = cmd.length;
        report["result"] = result.value();
        report["trace_length"] = air.trace_length();
        report["trace_width"] = air.trace_width();
        report["ce_blowup_factor"] = air.context().ce_blowup_factor();
        report["ce_domain_size"] = air.context().ce_domain_size();
        report["num_assertions"] = air.get_assertions().size();
        report["composition_degree"] = poly.degree();
        report["num_columns"] = poly.num_columns();
        report["column_degree"] = poly.column_degree();
        report["ood_point"] = xfe_to_json(z);
        report["ood_value"] = xfe_to_json(poly.evaluate_at(z));
        report["options"] = nlohmann::json::parse(options.to_json_string());
        report["elapsed_ms"] = elapsed_ms;

        if (cmd.output_path.empty()) {
            std::cout << report.dump(2) << std::endl;
        } else {
            std::ofstream out(cmd.output_path);
            if (!out.is_open()) {
                throw std::runtime_error("Could not open output file: " + cmd.output_path);
            }
            out << report.dump(2) << std::endl;
            std::cerr << "Report saved to: " << cmd.output_path << std::endl;
        }

        std::cerr << "\n✓ Composition polynomial of degree " << poly.degree()
                  << " split into " << poly.num_columns() << " columns" << std::endl;
        return 0;

    } catch (const ProverError& e) {
        std::cerr << "Integrity check failed (" << to_string(e.kind()) << "): " << e.what() << std::endl;
        return 2;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
