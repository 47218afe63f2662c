#include "coinjecture/commitment.hpp"
#include "coinjecture/serialize.hpp"

namespace coinjecture::commitment {

using namespace serialize;

Hash256 compute_epoch_salt(const Hash256& parent_hash, uint64_t block_index) {
    Bytes data;
    data.reserve(32 + 8);
    write_hash(data, parent_hash);
    write_u64_le(data, block_index);
    return crypto::SHA256::hash(data);
}

Hash256 compute_problem_hash(const Problem& problem) {
    Bytes data;
    data.reserve(1 + 1 + 4 + problem.elements.size() * 8 + 8 + 8);

    write_u8(data, static_cast<uint8_t>(problem.problem_type));
    write_u8(data, static_cast<uint8_t>(problem.tier));
    write_u32_le(data, static_cast<uint32_t>(problem.elements.size()));
    for (int64_t element : problem.elements) {
        write_i64_le(data, element);
    }
    write_i64_le(data, problem.target);
    write_i64_le(data, problem.timestamp);

    return crypto::SHA256::hash(data);
}

Hash256 compute_solution_hash(const Solution& solution) {
    Bytes data;
    data.reserve(4 + solution.indices.size() * 4 + 8);

    write_u32_le(data, static_cast<uint32_t>(solution.indices.size()));
    for (uint32_t index : solution.indices) {
        write_u32_le(data, index);
    }
    write_i64_le(data, solution.timestamp);

    return crypto::SHA256::hash(data);
}

Hash256 compute_commitment(const Hash256& epoch_salt, const Hash256& problem_hash,
                           const Hash256& solution_hash, const Hash256& miner_salt) {
    crypto::SHA256::Hasher hasher;
    hasher.update(epoch_salt);
    hasher.update(problem_hash);
    hasher.update(solution_hash);
    hasher.update(miner_salt);
    return hasher.finalize();
}

Hash256 commit(const Hash256& parent_hash, uint64_t block_index, const Problem& problem,
               const Solution& solution, const Hash256& miner_salt) {
    return compute_commitment(compute_epoch_salt(parent_hash, block_index),
                              compute_problem_hash(problem),
                              compute_solution_hash(solution),
                              miner_salt);
}

bool verify_commitment(const BlockHeader& header, const Problem& problem,
                       const Solution& solution, const Hash256& miner_salt) {
    Hash256 expected = commit(header.parent_hash, header.block_index, problem, solution, miner_salt);
    return crypto::utils::secure_compare(expected, header.commitment);
}

} // namespace coinjecture::commitment
