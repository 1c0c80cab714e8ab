#ifndef CLADENAMER_NAMING_NAME_CLADES_H
#define CLADENAMER_NAMING_NAME_CLADES_H

#include <array>
#include <optional>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

#include "cln/cln_base_includes.h"
#include "cln/genome_quality.h"
#include "cln/naming/ledger.h"
#include "cln/naming/naming_tables.h"
#include "cln/novelty.h"
#include "cln/taxonomy/rank.h"
#include "cln/taxonomy/red_cutoffs.h"
#include "cln/tree_table.h"

namespace cln {

struct EmptySlot {};

struct NamedSlot {
    std::optional<NodeId> node;
    std::string name;
};

// The genome's taxonomy above this rank comes from the reference taxonomy of `node`.
struct ReferenceSlot {
    NodeId node;
};

using RankSlot = std::variant<EmptySlot, NamedSlot, ReferenceSlot>;

// A node whose ranks have not been settled yet: a closer-to-median ancestor may still take them.
struct PendingCandidate {
    NodeId node;
    std::vector<Rank> ranks;
};

// The state carried up one genome's ancestor chain.
struct WalkState {
    std::array<RankSlot, NUM_RANKS> slots;
    std::optional<PendingCandidate> pending;

    bool is_empty(Rank r) const {
        return std::holds_alternative<EmptySlot>(slots[rank_index(r)]);
    }
    RankSlot & slot(Rank r) {
        return slots[rank_index(r)];
    }
    const RankSlot & slot(Rank r) const {
        return slots[rank_index(r)];
    }
    // The highest (closest to phylum) rank holding a name or reference.
    std::optional<Rank> highest_filled() const;
};

// Renders the slots as "<domain>;p__..;..;s__..". A reference slot restarts the
//  string at its node id.
std::string render_taxonomy(const std::string & domain, const WalkState & state);

// Takes every rank anchored at `nd` by earlier genomes, replacing whatever the
//  walk had put in those slots.
void take_claimed_names(NodeId nd, const NodeTaxonomyLedger::RankNames & claimed, WalkState & state);

enum class WalkStep {
    CONTINUE,
    STOP
};

// Names one genome at a time. The ledger and the clade founders carry over from
//  one genome to the next, so genomes must be passed in rank_query_genomes order.
class CladeNamer {
    public:
    CladeNamer(const TreeTable & t, const RankCutoffTable & c);

    void name_genome(const RankedGenome & rg);

    NamingResult & get_result() {
        return result;
    }
    const NodeTaxonomyLedger & get_ledger() const {
        return ledger;
    }
    private:
    const NoveltyInterval & interval_of(NodeId nd);
    const std::optional<NoveltyInterval> & interval_if_resolvable(NodeId nd);
    bool has_vying_sibling(NodeId nd, Rank label, const std::optional<PendingCandidate> & pending);
    WalkStep visit_ancestor(const std::string & genome, NodeId anc, WalkState & state);
    void name_pending(const std::string & genome, const PendingCandidate & pending, WalkState & state);
    bool inherit_from_founder(const std::string & genome, WalkState & state);
    void fill_remaining(const std::string & genome,
                        const std::vector<NodeId> & ancestors,
                        bool fill_all,
                        WalkState & state);
    std::optional<NodeId> backfill_anchor(const std::vector<NodeId> & ancestors, Rank r);
    void record_naming(std::optional<NodeId> nd, const std::string & clade, const std::string & genome);

    const TreeTable & tree;
    const RankCutoffTable & cutoffs;
    const std::string domain;
    NodeTaxonomyLedger ledger;
    NamingResult result;
    std::unordered_map<NodeId, std::optional<NoveltyInterval>> interval_cache;
    std::unordered_map<std::string, std::string> clade_founder;
    std::unordered_map<std::string, std::size_t> genome_row;
};

// Names the query genomes of `tree`, in the order of rank_query_genomes.
NamingResult name_clades(const TreeTable & tree,
                         const GenomeMetadataMap & metadata,
                         const RankCutoffTable & cutoffs);

} // namespace cln
#endif
