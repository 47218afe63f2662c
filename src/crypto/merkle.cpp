#include "coinjecture/merkle.hpp"
#include <array>
#include <algorithm>

namespace coinjecture::merkle {

using crypto::SHA256;

Hash256 hash_pair(const Hash256& left, const Hash256& right) {
    std::array<uint8_t, 64> combined;
    std::copy(left.begin(), left.end(), combined.begin());
    std::copy(right.begin(), right.end(), combined.begin() + 32);
    return SHA256::hash(combined.data(), combined.size());
}

Hash256 compute_merkle_root(const std::vector<Hash256>& leaves) {
    if (leaves.empty()) {
        return Hash256{}; // Zero hash: no transactions
    }
    if (leaves.size() == 1) {
        return leaves[0];
    }

    // Reduce in place; level i+1 overwrites the front of level i
    std::vector<Hash256> level(leaves);
    size_t count = level.size();

    while (count > 1) {
        size_t next = 0;
        for (size_t i = 0; i < count; i += 2) {
            const Hash256& left = level[i];
            const Hash256& right = (i + 1 < count) ? level[i + 1] : level[i];
            level[next++] = hash_pair(left, right);
        }
        count = next;
    }

    return level[0];
}

// Merkle Tree Implementation
MerkleTree::MerkleTree(const std::vector<Hash256>& leaf_hashes) {
    if (leaf_hashes.empty()) {
        return;
    }

    levels_.push_back(leaf_hashes);
    build_tree();
}

Hash256 MerkleTree::get_root() const {
    if (levels_.empty() || levels_.back().empty()) {
        return Hash256{}; // Zero hash
    }
    return levels_.back()[0];
}

size_t MerkleTree::leaf_count() const {
    return levels_.empty() ? 0 : levels_[0].size();
}

size_t MerkleTree::depth() const {
    return levels_.empty() ? 0 : levels_.size() - 1;
}

size_t MerkleTree::depth_for(size_t tree_size) {
    size_t depth = 0;
    while (tree_size > 1) {
        tree_size = (tree_size + 1) / 2;
        ++depth;
    }
    return depth;
}

void MerkleTree::build_tree() {
    while (levels_.back().size() > 1) {
        const auto& current_level = levels_.back();
        std::vector<Hash256> next_level;
        next_level.reserve((current_level.size() + 1) / 2);

        for (size_t i = 0; i < current_level.size(); i += 2) {
            // Odd number of elements, duplicate the last one
            const Hash256& right = (i + 1 < current_level.size()) ? current_level[i + 1]
                                                                   : current_level[i];
            next_level.push_back(hash_pair(current_level[i], right));
        }

        levels_.push_back(std::move(next_level));
    }
}

std::vector<Hash256> MerkleTree::get_proof(size_t leaf_index) const {
    std::vector<Hash256> proof;

    if (levels_.empty() || leaf_index >= levels_[0].size()) {
        return proof;
    }

    size_t current_index = leaf_index;

    for (size_t level = 0; level + 1 < levels_.size(); ++level) {
        const auto& current_level = levels_[level];

        size_t sibling_index = (current_index % 2 == 0) ? current_index + 1 : current_index - 1;

        if (sibling_index < current_level.size()) {
            proof.push_back(current_level[sibling_index]);
        } else {
            // Odd number of nodes, duplicate the current node
            proof.push_back(current_level[current_index]);
        }

        current_index /= 2;
    }

    return proof;
}

bool MerkleTree::verify_proof(const Hash256& leaf_hash, const std::vector<Hash256>& proof,
                              const Hash256& root, size_t leaf_index, size_t tree_size) {
    if (tree_size == 0 || leaf_index >= tree_size) {
        return false;
    }
    if (proof.size() != depth_for(tree_size)) {
        return false;
    }

    Hash256 current_hash = leaf_hash;
    size_t current_index = leaf_index;
    size_t level_size = tree_size;

    for (const auto& proof_hash : proof) {
        if (current_index % 2 == 0) {
            // A left child without a right sibling is paired with itself
            if (current_index + 1 >= level_size && proof_hash != current_hash) {
                return false;
            }
            current_hash = hash_pair(current_hash, proof_hash);
        } else {
            current_hash = hash_pair(proof_hash, current_hash);
        }
        current_index /= 2;
        level_size = (level_size + 1) / 2;
    }

    return current_hash == root;
}

} // namespace coinjecture::merkle
