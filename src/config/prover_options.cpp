#include "config/prover_options.hpp"
#include "domain/stark_domain.hpp"
#include <algorithm>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <nlohmann/json.hpp>

namespace starkcomp {

namespace {

ChaCha12Rng::Seed parse_seed(const std::string& hex) {
    if (hex.size() != 64) {
        throw std::invalid_argument("seed must be 64 hex characters");
    }
    ChaCha12Rng::Seed seed{};
    for (size_t i = 0; i < seed.size(); ++i) {
        const std::string byte = hex.substr(2 * i, 2);
        size_t consumed = 0;
        unsigned long value = 0;
        try {
            value = std::stoul(byte, &consumed, 16);
        } catch (const std::logic_error&) {
            throw std::invalid_argument("seed contains a non-hex byte: " + byte);
        }
        if (consumed != 2) {
            throw std::invalid_argument("seed contains a non-hex byte: " + byte);
        }
        seed[i] = static_cast<uint8_t>(value);
    }
    return seed;
}

std::string format_seed(const ChaCha12Rng::Seed& seed) {
    std::ostringstream oss;
    for (uint8_t byte : seed) {
        oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(byte);
    }
    return oss.str();
}

bool parse_bool_env(const char* name, const char* value) {
    if (strcmp(value, "1") == 0 || strcmp(value, "true") == 0) return true;
    if (strcmp(value, "0") == 0 || strcmp(value, "false") == 0) return false;
    throw std::invalid_argument(std::string(name) + " must be 0, 1, true or false");
}

} // namespace

ProverOptions ProverOptions::from_json_string(const std::string& json_text) {
    ProverOptions options;
    nlohmann::json json;
    try {
        json = nlohmann::json::parse(json_text);
    } catch (const nlohmann::json::parse_error& e) {
        throw std::invalid_argument(std::string("Invalid prover options JSON: ") + e.what());
    }
    if (!json.is_object()) {
        throw std::invalid_argument("Prover options JSON must be an object");
    }

    try {
        if (json.contains("num_fragments")) {
            options.num_fragments = json["num_fragments"].get<size_t>();
        }
        if (json.contains("min_fragment_size")) {
            options.min_fragment_size = json["min_fragment_size"].get<size_t>();
        }
        if (json.contains("verification_mode")) {
            options.verification_mode = json["verification_mode"].get<bool>();
        }
        if (json.contains("executor")) {
            options.executor = parallel::parse_executor_kind(json["executor"].get<std::string>());
        }
        if (json.contains("domain_offset")) {
            options.domain_offset = BFieldElement(json["domain_offset"].get<uint64_t>());
        }
        if (json.contains("seed")) {
            options.seed = parse_seed(json["seed"].get<std::string>());
        }
    } catch (const nlohmann::json::type_error& e) {
        throw std::invalid_argument(std::string("Invalid prover options field: ") + e.what());
    }

    options.validate();
    return options;
}

ProverOptions ProverOptions::from_file(const std::string& path) {
    std::ifstream f(path);
    if (!f.is_open()) {
        throw std::runtime_error("Could not open prover options: " + path);
    }
    std::stringstream buffer;
    buffer << f.rdbuf();
    return from_json_string(buffer.str());
}

ProverOptions& ProverOptions::apply_environment() {
    if (const char* verify = std::getenv("STARKCOMP_VERIFY")) {
        verification_mode = parse_bool_env("STARKCOMP_VERIFY", verify);
    }
    if (const char* executor_name = std::getenv("STARKCOMP_EXECUTOR")) {
        executor = parallel::parse_executor_kind(executor_name);
    }
    if (const char* fragments = std::getenv("STARKCOMP_NUM_FRAGMENTS")) {
        char* end = nullptr;
        unsigned long long value = std::strtoull(fragments, &end, 10);
        if (end == fragments || *end != '\0') {
            throw std::invalid_argument("STARKCOMP_NUM_FRAGMENTS must be a non-negative integer");
        }
        num_fragments = static_cast<size_t>(value);
    }
    validate();
    return *this;
}

void ProverOptions::validate() const {
    if (min_fragment_size == 0) {
        throw std::invalid_argument("min_fragment_size must be at least 1");
    }
    if (domain_offset.is_zero()) {
        throw std::invalid_argument("domain_offset must be non-zero");
    }
    if (num_fragments != 0 && !is_power_of_two(num_fragments)) {
        throw std::invalid_argument("num_fragments must be 0 or a power of 2");
    }
}

size_t ProverOptions::resolve_num_fragments(size_t num_rows, size_t concurrency) const {
    if (num_fragments != 0) {
        return num_fragments;
    }
    size_t target = next_power_of_two(std::max<size_t>(1, concurrency) * 4);
    while (target > 1 && num_rows / target < min_fragment_size) {
        target /= 2;
    }
    return target;
}

std::string ProverOptions::to_json_string() const {
    nlohmann::json json;
    json["num_fragments"] = num_fragments;
    json["min_fragment_size"] = min_fragment_size;
    json["verification_mode"] = verification_mode;
    json["executor"] = parallel::to_string(executor);
    json["domain_offset"] = domain_offset.value();
    json["seed"] = format_seed(seed);
    return json.dump(2);
}

} // namespace starkcomp
