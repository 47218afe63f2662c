// Regenerates tests/golden/vectors_v1.json from the current implementation.
// A diff against the committed file is a consensus-breaking change.
//
// Usage: coinjecture-vectors [output-path]   (stdout when omitted)

#include "coinjecture/codec.hpp"
#include "coinjecture/commitment.hpp"
#include "coinjecture/log.hpp"
#include "coinjecture/merkle.hpp"
#include "coinjecture/verify.hpp"
#include <nlohmann/json.hpp>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <limits>
#include <string>
#include <utility>
#include <vector>

using namespace coinjecture;
using nlohmann::ordered_json;
using crypto::utils::to_hex;

namespace {

crypto::Hash256 filled(uint8_t value) {
    crypto::Hash256 hash;
    hash.fill(value);
    return hash;
}

crypto::Bytes counting_bytes(size_t count) {
    crypto::Bytes bytes(count);
    for (size_t i = 0; i < count; ++i) {
        bytes[i] = static_cast<uint8_t>(i);
    }
    return bytes;
}

ordered_json sha256_vectors() {
    ordered_json entries = ordered_json::array();
    const std::string abc = "abc";
    const std::string name = "COINjecture";
    for (const auto& input : {crypto::Bytes{}, crypto::Bytes(abc.begin(), abc.end()),
                              crypto::Bytes(name.begin(), name.end()), counting_bytes(256)}) {
        ordered_json entry;
        entry["input"] = to_hex(input);
        entry["digest"] = to_hex(crypto::SHA256::hash(input));
        entries.push_back(entry);
    }
    return entries;
}

ordered_json merkle_vectors() {
    std::vector<crypto::Hash256> all = {filled(0x11), filled(0x22), filled(0x33), filled(0x44), filled(0x55)};
    ordered_json entries = ordered_json::array();
    for (size_t count : {0, 1, 2, 3, 5}) {
        std::vector<crypto::Hash256> leaves(all.begin(), all.begin() + count);
        ordered_json entry;
        entry["leaves"] = ordered_json::array();
        for (const auto& leaf : leaves) {
            entry["leaves"].push_back(to_hex(leaf));
        }
        entry["root"] = to_hex(merkle::compute_merkle_root(leaves));
        entries.push_back(entry);
    }
    return entries;
}

bool header_vectors(ordered_json& entries) {
    auto genesis = block::BlockHeader::genesis();
    auto genesis_hash = codec::compute_header_hash(genesis);
    if (!genesis_hash) {
        return false;
    }

    block::BlockHeader first;
    first.block_index = 1;
    first.timestamp = 1609459260;
    first.parent_hash = *genesis_hash;
    first.merkle_root = merkle::compute_merkle_root({filled(0x11), filled(0x22)});
    first.miner_address = filled(0xAA);
    first.commitment = filled(0xBB);
    first.difficulty_target = 1000;
    first.nonce = 42;
    const std::string tag = "coinjecture";
    first.extra_data.assign(tag.begin(), tag.end());

    block::BlockHeader extremes;
    extremes.block_index = std::numeric_limits<uint64_t>::max();
    extremes.timestamp = -1;
    extremes.parent_hash = filled(0xFF);
    extremes.merkle_root = filled(0x01);
    extremes.miner_address = filled(0x02);
    extremes.commitment = filled(0x03);
    extremes.difficulty_target = std::numeric_limits<uint64_t>::max();
    extremes.nonce = std::numeric_limits<uint64_t>::max();
    extremes.extra_data = counting_bytes(params::MAX_EXTRA_DATA_SIZE);

    entries = ordered_json::array();
    const std::pair<const char*, const block::BlockHeader*> headers[] = {
        {"genesis", &genesis}, {"block_1", &first}, {"extremes", &extremes},
    };
    for (const auto& item : headers) {
        codec::CodecError error = codec::CodecError::InvalidField;
        auto encoded = codec::encode_header(*item.second, &error);
        if (!encoded) {
            std::cerr << item.first << ": " << codec::to_string(error) << std::endl;
            return false;
        }
        ordered_json entry;
        entry["name"] = item.first;
        entry["header"] = ordered_json::parse(codec::header_to_json(*item.second));
        entry["encoded"] = to_hex(*encoded);
        entry["hash"] = to_hex(crypto::SHA256::hash(*encoded));
        entries.push_back(entry);
    }
    return true;
}

ordered_json problem_json(const verify::Problem& problem) {
    ordered_json value;
    value["problem_type"] = static_cast<uint32_t>(problem.problem_type);
    value["tier"] = static_cast<uint32_t>(problem.tier);
    value["elements"] = problem.elements;
    value["target"] = problem.target;
    value["timestamp"] = problem.timestamp;
    return value;
}

ordered_json solution_json(const verify::Solution& solution) {
    ordered_json value;
    value["indices"] = solution.indices;
    value["timestamp"] = solution.timestamp;
    return value;
}

struct VerifyCase {
    const char* name;
    std::vector<int64_t> elements;
    int64_t target;
    params::HardwareTier tier;
    std::vector<uint32_t> indices;
    uint64_t max_ops;
};

verify::Problem make_problem(const VerifyCase& item) {
    verify::Problem problem;
    problem.tier = item.tier;
    problem.elements = item.elements;
    problem.target = item.target;
    problem.timestamp = 1609459260;
    return problem;
}

verify::Solution make_solution(const std::vector<uint32_t>& indices) {
    verify::Solution solution;
    solution.indices = indices;
    solution.timestamp = 1609459261;
    return solution;
}

ordered_json verify_vectors() {
    using params::HardwareTier;
    const int64_t max = std::numeric_limits<int64_t>::max();
    const std::vector<VerifyCase> cases = {
        {"valid_pair", {3, 7, 11}, 18, HardwareTier::Mobile, {1, 2}, 10000},
        {"wrong_sum", {3, 7, 11}, 18, HardwareTier::Mobile, {0, 1}, 10000},
        {"duplicate_index", {3, 7, 11}, 18, HardwareTier::Mobile, {0, 0}, 10000},
        {"out_of_range_index", {3, 7, 11}, 18, HardwareTier::Mobile, {0, 5}, 10000},
        {"budget_exceeded", {3, 7, 11}, 18, HardwareTier::Mobile, {1, 2}, 1},
        {"empty_solution_zero_target", {3, 7, 11}, 0, HardwareTier::Mobile, {}, 10000},
        {"empty_solution_nonzero_target", {3, 7, 11}, 18, HardwareTier::Mobile, {}, 10000},
        {"overflow", {max, 1}, 0, HardwareTier::Desktop, {0, 1}, 100000},
        {"negative_elements", {-5, 10, 3}, 5, HardwareTier::Mobile, {0, 1}, 10000},
        {"empty_problem", {}, 0, HardwareTier::Mobile, {}, 10000},
        {"too_few_for_tier", {1}, 1, HardwareTier::Desktop, {0}, 100000},
    };

    ordered_json entries = ordered_json::array();
    for (const auto& item : cases) {
        auto problem = make_problem(item);
        auto solution = make_solution(item.indices);
        verify::VerifyBudget budget;
        budget.max_ops = item.max_ops;

        verify::VerifyError error = verify::VerifyError::InvalidInput;
        auto result = verify::verify_solution(problem, solution, budget, &error);

        ordered_json entry;
        entry["name"] = item.name;
        entry["problem"] = problem_json(problem);
        entry["solution"] = solution_json(solution);
        entry["max_ops"] = item.max_ops;
        if (result) {
            entry["expect"] = {{"valid", result->valid}, {"ops_used", result->ops_used}};
        } else {
            entry["expect"] = {{"error", error == verify::VerifyError::BudgetExceeded
                                             ? "budget_exceeded" : "invalid_input"}};
        }
        entries.push_back(entry);
    }
    return entries;
}

ordered_json commitment_vectors(const crypto::Hash256& parent_hash) {
    VerifyCase item{"valid_pair", {3, 7, 11}, 18, params::HardwareTier::Mobile, {1, 2}, 10000};
    auto problem = make_problem(item);
    auto solution = make_solution(item.indices);
    auto miner_salt = filled(0xCC);
    const uint64_t block_index = 1;

    auto epoch_salt = commitment::compute_epoch_salt(parent_hash, block_index);
    auto problem_hash = commitment::compute_problem_hash(problem);
    auto solution_hash = commitment::compute_solution_hash(solution);

    ordered_json entry;
    entry["parent_hash"] = to_hex(parent_hash);
    entry["block_index"] = block_index;
    entry["problem"] = problem_json(problem);
    entry["solution"] = solution_json(solution);
    entry["miner_salt"] = to_hex(miner_salt);
    entry["epoch_salt"] = to_hex(epoch_salt);
    entry["problem_hash"] = to_hex(problem_hash);
    entry["solution_hash"] = to_hex(solution_hash);
    entry["commitment"] = to_hex(commitment::compute_commitment(epoch_salt, problem_hash,
                                                                solution_hash, miner_salt));
    return ordered_json::array({entry});
}

} // namespace

int main(int argc, char** argv) {
    if (const char* level = std::getenv("COINJ_LOG_LEVEL")) {
        coinjecture::log::LogLevel parsed;
        if (coinjecture::log::parse_level(level, parsed)) {
            coinjecture::log::set_level(parsed);
        } else {
            std::cerr << "unknown COINJ_LOG_LEVEL '" << level << "'" << std::endl;
        }
    }

    ordered_json headers;
    if (!header_vectors(headers)) {
        return 1;
    }
    auto genesis_hash = crypto::utils::hash256_from_hex(headers.at(0).at("hash").get<std::string>());
    if (!genesis_hash) {
        return 1;
    }

    ordered_json vectors;
    vectors["format"] = 1;
    vectors["sha256"] = sha256_vectors();
    vectors["merkle"] = merkle_vectors();
    vectors["headers"] = headers;
    vectors["verify"] = verify_vectors();
    vectors["commitment"] = commitment_vectors(*genesis_hash);

    const std::string text = vectors.dump(2) + "\n";
    if (argc > 1) {
        std::ofstream out(argv[1]);
        if (!out || !(out << text)) {
            std::cerr << "cannot write " << argv[1] << std::endl;
            return 1;
        }
        std::cerr << "wrote " << argv[1] << " (coinjecture " << params::version() << ")" << std::endl;
    } else {
        std::cout << text;
    }
    return 0;
}
