#ifndef CLADENAMER_TAXONOMY_RANK_H
#define CLADENAMER_TAXONOMY_RANK_H

#include <array>
#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "cln/error.h"

namespace cln {

// The ranks below the domain, highest first. The enumerator values are the
//  positions used for all rank-order comparisons.
enum Rank {
    RANK_PHYLUM = 0,
    RANK_CLASS,
    RANK_ORDER,
    RANK_FAMILY,
    RANK_GENUS,
    RANK_SPECIES
};

constexpr std::size_t NUM_RANKS = 6;

extern const std::array<Rank, NUM_RANKS> all_ranks;
extern const std::map<Rank, std::string, std::less<>> rank_enum_to_name;
extern const std::map<std::string, Rank, std::less<>> rank_name_to_enum;

inline std::size_t rank_index(Rank r) {
    return static_cast<std::size_t>(r);
}

inline Rank rank_from_index(std::size_t i) {
    if (i >= NUM_RANKS) {
        throw CLNError() << "Rank index " << i << " is out of range.";
    }
    return all_ranks[i];
}

inline const std::string & rank_to_string(Rank r) {
    return rank_enum_to_name.at(r);
}

// The single letter used in clade names: 'p' for phylum, ... 's' for species.
inline char rank_letter(Rank r) {
    return rank_to_string(r)[0];
}

// "p__", "c__", ...
std::string rank_prefix(Rank r);

// Throws UnrecognizedNoveltyLabelError if `s` is not a rank name.
Rank string_to_rank(std::string_view s);

// Parses the novelty annotations written by the tree annotation step,
//  e.g. "Genus (0.82-0.95]" or "Species/Strain (0.95-1]". The rank name is
//  the first word, up to any '/', compared case-insensitively.
Rank parse_novelty_label(const std::string & label);

// The ranks from `first` (inclusive) to `last` (exclusive).
std::vector<Rank> rank_range(Rank first, Rank last);

} // namespace cln
#endif
