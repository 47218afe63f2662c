#pragma once

#include "coinjecture/crypto.hpp"
#include <vector>
#include <cstddef>

namespace coinjecture::merkle {

using crypto::Hash256;

/// Merkle root over an ordered list of leaf hashes.
///
/// Empty input yields the all-zero hash, a single leaf is returned unchanged,
/// and each level is reduced pairwise with SHA256(left || right). An odd
/// level pairs its last entry with itself.
Hash256 compute_merkle_root(const std::vector<Hash256>& leaves);

/// SHA256(left || right), the interior node of the tree
Hash256 hash_pair(const Hash256& left, const Hash256& right);

/**
 * @brief Merkle tree with every level retained, for inclusion proofs
 */
class MerkleTree {
public:
    explicit MerkleTree(const std::vector<Hash256>& leaf_hashes);

    Hash256 get_root() const;
    size_t leaf_count() const;
    size_t depth() const;

    /// Sibling hashes from the leaf up to (excluding) the root.
    /// Empty when leaf_index is out of range.
    std::vector<Hash256> get_proof(size_t leaf_index) const;

    static bool verify_proof(const Hash256& leaf_hash, const std::vector<Hash256>& proof,
                             const Hash256& root, size_t leaf_index, size_t tree_size);

    /// Number of levels above the leaves for a tree of tree_size leaves
    static size_t depth_for(size_t tree_size);

private:
    std::vector<std::vector<Hash256>> levels_;
    void build_tree();
};

} // namespace coinjecture::merkle
