
#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <unordered_map>
#include <vector>

#include "boost/container_hash/hash.hpp"
#include "domain/region_graph.hh"
#include "wise_enum.h"

namespace kami::domain {

// EXACT signatures are equal if and only if the two graphs are isomorphic by a mapping that
// preserves colors. FUZZY signatures are equal for isomorphic graphs but may also be equal for
// graphs that are not. A search that deduplicates with FUZZY signatures may skip a state it has
// never seen, and so may return a longer solution than necessary.
WISE_ENUM_CLASS(SignatureMode, EXACT, FUZZY)

struct Signature {
    std::uint64_t hash;
    // Distinguishes non-isomorphic graphs that share a hash. Always zero for fuzzy signatures.
    int isomorphism_class;

    bool operator==(const Signature &other) const = default;
};

// Remembers every graph that has been given an exact signature so that graphs with colliding
// refinement hashes can be told apart. Entries are never invalidated, so one cache can be shared
// between independent searches. All member functions are safe to call concurrently.
class SignatureCache {
   public:
    // Returns the isomorphism class of `graph` among the graphs seen with the same hash, recording
    // it as a new class if it matches none of them.
    int isomorphism_class(const std::uint64_t hash, const RegionGraph &graph,
                          const std::vector<std::uint64_t> &labels, const int num_rounds);

    // The number of distinct isomorphism classes recorded
    int size() const;

   private:
    struct CanonicalGraph {
        std::vector<Color> colors;
        std::vector<std::vector<int>> neighbors;
        std::vector<std::uint64_t> labels;
        int num_rounds;
    };

    static bool are_isomorphic(const CanonicalGraph &a, const CanonicalGraph &b);

    mutable std::mutex mutex_;
    std::unordered_map<std::uint64_t, std::vector<CanonicalGraph>> graphs_from_hash_;
    int size_ = 0;
};

struct Refinement {
    // One label per live region, in ascending id order
    std::vector<std::uint64_t> labels;
    int num_rounds;
};

// Iterated color refinement. A region's label is updated to the hash of its current label and the
// sorted labels of its neighbors. Stops when a round no longer splits any class of equally
// labeled regions, after `max_rounds` rounds, or after as many rounds as there are regions.
Refinement refine_labels(const RegionGraph &graph, const int max_rounds);

// Hash of the multiset of labels
std::uint64_t hash_labels(const std::vector<std::uint64_t> &labels);

Signature exact_signature(const RegionGraph &graph, SignatureCache &cache);

// A single round of refinement: each region contributes its color and the colors of its
// neighbors.
Signature fuzzy_signature(const RegionGraph &graph);

Signature compute_signature(const RegionGraph &graph, const SignatureMode mode,
                            SignatureCache &cache);

}  // namespace kami::domain

namespace std {
template <>
struct hash<kami::domain::Signature> {
    size_t operator()(const kami::domain::Signature &signature) const {
        size_t seed = 0;
        boost::hash_combine(seed, signature.hash);
        boost::hash_combine(seed, signature.isomorphism_class);
        return seed;
    }
};
}  // namespace std
