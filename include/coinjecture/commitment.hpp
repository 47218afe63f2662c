#pragma once

#include "coinjecture/block.hpp"
#include "coinjecture/verify.hpp"

namespace coinjecture::commitment {

using block::BlockHeader;
using crypto::Hash256;
using verify::Problem;
using verify::Solution;

/// SHA256(parent_hash || u64le(block_index)); binds a puzzle to one chain position
Hash256 compute_epoch_salt(const Hash256& parent_hash, uint64_t block_index);

/// SHA256(u8 type || u8 tier || u32le count || i64le elements || i64le target || i64le timestamp)
Hash256 compute_problem_hash(const Problem& problem);

/// SHA256(u32le count || u32le indices || i64le timestamp)
Hash256 compute_solution_hash(const Solution& solution);

Hash256 compute_commitment(const Hash256& epoch_salt, const Hash256& problem_hash,
                           const Hash256& solution_hash, const Hash256& miner_salt);

/// Commitment a miner places in a header at the given chain position
Hash256 commit(const Hash256& parent_hash, uint64_t block_index, const Problem& problem,
               const Solution& solution, const Hash256& miner_salt);

/**
 * @brief Check that header.commitment opens to the revealed tuple
 *
 * The epoch salt is taken from the header's own parent_hash and block_index.
 * The comparison is constant time.
 */
bool verify_commitment(const BlockHeader& header, const Problem& problem,
                       const Solution& solution, const Hash256& miner_salt);

} // namespace coinjecture::commitment
