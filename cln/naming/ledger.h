#ifndef CLADENAMER_NAMING_LEDGER_H
#define CLADENAMER_NAMING_LEDGER_H

#include <map>
#include <string>
#include <unordered_map>

#include "cln/cln_base_includes.h"
#include "cln/taxonomy/rank.h"

namespace cln {

// The clade names claimed by each anchor node. An entry is never replaced once written:
//  later genomes passing through the node reuse it.
class NodeTaxonomyLedger {
    public:
    using RankNames = std::map<Rank, std::string>;

    // nullptr if nothing has been anchored at `nd`.
    const RankNames * find(NodeId nd) const {
        auto i = entries.find(nd);
        if (i == entries.end()) {
            return nullptr;
        }
        return &(i->second);
    }
    // false (and no change) if `nd` already anchors rank `r`.
    bool add(NodeId nd, Rank r, const std::string & clade) {
        return entries[nd].emplace(r, clade).second;
    }
    // true if every rank anchored at `nd` lies strictly below `r`.
    bool only_lower_ranks(NodeId nd, Rank r) const {
        const auto * names = find(nd);
        if (names == nullptr) {
            return true;
        }
        for (const auto & rn : *names) {
            if (rank_index(rn.first) <= rank_index(r)) {
                return false;
            }
        }
        return true;
    }
    std::size_t size() const {
        return entries.size();
    }
    const std::unordered_map<NodeId, RankNames> & get_entries() const {
        return entries;
    }
    private:
    std::unordered_map<NodeId, RankNames> entries;
};

} // namespace cln
#endif
