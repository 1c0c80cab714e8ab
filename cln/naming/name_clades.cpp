#include <cctype>
#include <unordered_map>
#include "cln/naming/name_clades.h"
#include "cln/util.h"

using std::string;
using std::vector;

namespace cln {

std::optional<Rank> WalkState::highest_filled() const {
    for (auto r : all_ranks) {
        if (not is_empty(r)) {
            return r;
        }
    }
    return std::nullopt;
}

string render_taxonomy(const string & domain, const WalkState & state) {
    string taxonomy = domain;
    for (const auto & s : state.slots) {
        if (const auto * ref = std::get_if<ReferenceSlot>(&s)) {
            taxonomy = std::to_string(ref->node);
        } else if (const auto * named = std::get_if<NamedSlot>(&s)) {
            taxonomy += ";";
            taxonomy += named->name;
        }
    }
    return taxonomy;
}

void take_claimed_names(NodeId nd, const NodeTaxonomyLedger::RankNames & claimed, WalkState & state) {
    for (const auto & rn : claimed) {
        state.slot(rn.first) = NamedSlot{nd, rn.second};
    }
}

namespace {

string genus_local_name(const string & genus_clade) {
    const auto pos = genus_clade.find(rank_prefix(RANK_GENUS));
    if (pos == string::npos) {
        throw CLNError() << "Genus name \"" << genus_clade << "\" lacks the \""
                         << rank_prefix(RANK_GENUS) << "\" prefix.";
    }
    return genus_clade.substr(pos + 1);
}

} // namespace

CladeNamer::CladeNamer(const TreeTable & t, const RankCutoffTable & c)
    :tree(t),
    cutoffs(c),
    domain(domain_to_string(c.get_domain())) {
}

const std::optional<NoveltyInterval> & CladeNamer::interval_if_resolvable(NodeId nd) {
    auto i = interval_cache.find(nd);
    if (i == interval_cache.end()) {
        i = interval_cache.emplace(nd, find_interval(tree, nd)).first;
    }
    return i->second;
}

const NoveltyInterval & CladeNamer::interval_of(NodeId nd) {
    const auto & interval = interval_if_resolvable(nd);
    if (not interval) {
        resolve_interval(tree, nd); // throws with the reason
        CLN_UNREACHABLE;
    }
    return *interval;
}

// Internal children of `nd` (other than the pending node) that also originate `label`.
bool CladeNamer::has_vying_sibling(NodeId nd, Rank label, const std::optional<PendingCandidate> & pending) {
    for (auto c : tree.children_of(nd)) {
        if (pending and pending->node == c) {
            continue;
        }
        if (tree.node_from_id(c).has_genome()) {
            continue;
        }
        const auto & ci = interval_if_resolvable(c);
        if (ci and ci->first_rank() == label) {
            return true;
        }
    }
    return false;
}

void CladeNamer::record_naming(std::optional<NodeId> nd, const string & clade, const string & genome) {
    result.nodes.push_back(NodeNaming{nd, clade, genome});
    clade_founder.emplace(clade, genome);
}

void CladeNamer::name_pending(const string & genome, const PendingCandidate & pending, WalkState & state) {
    for (auto r : pending.ranks) {
        if (r == RANK_SPECIES or not state.is_empty(r)) {
            continue;
        }
        const auto clade = rank_prefix(r) + genome;
        LOG(DEBUG) << "  " << clade << " anchored at node " << pending.node;
        state.slot(r) = NamedSlot{pending.node, clade};
        record_naming(pending.node, clade, genome);
        ledger.add(pending.node, r, clade);
    }
}

WalkStep CladeNamer::visit_ancestor(const string & genome, NodeId anc, WalkState & state) {
    const auto & interval = interval_of(anc);
    const auto ranks = interval.ranks();
    LOG(TRACE) << "  visiting node " << anc << " (" << ranks.size() << " ranks)";
    bool skip = false;
    if (interval.get_kind() == IntervalKind::SAME_RANK) {
        const auto label = interval.get_self_label();
        if (has_vying_sibling(anc, label, state.pending)
            and cutoffs.closer_to_median(label, tree.red_of(anc), tree.branch_red(anc))) {
            LOG(TRACE) << "  node " << anc << " yields " << rank_to_string(label) << " to its children";
            skip = true;
        }
    }
    if (state.pending) {
        auto & pending = *state.pending;
        BOOST_ASSERT(not pending.ranks.empty());
        bool name_it = true;
        const bool same_boundary = (interval.is_reference()
                                    ? pending.ranks[0] == interval.get_self_label()
                                    : pending.ranks[0] == ranks[0]);
        if (same_boundary) {
            if (cutoffs.closer_to_median(pending.ranks[0], tree.branch_red(pending.node), tree.branch_red(anc))) {
                skip = not interval.is_reference();
            } else {
                pending.ranks.erase(pending.ranks.begin());
                name_it = pending.ranks.size() > 1;
            }
        }
        if (name_it) {
            name_pending(genome, pending, state);
        }
        state.pending.reset();
    }
    if (skip) {
        return WalkStep::CONTINUE;
    }
    if (const auto * claimed = ledger.find(anc)) {
        LOG(TRACE) << "  node " << anc << " was named by an earlier genome";
        take_claimed_names(anc, *claimed, state);
        return WalkStep::STOP;
    }
    if (interval.is_reference()) {
        const auto label = interval.get_self_label();
        auto boundary = rank_index(label);
        if (not cutoffs.closer_to_median(label, tree.red_of(anc), tree.branch_red(anc))) {
            boundary += 1;
        }
        if (boundary > 0) {
            state.slot(rank_from_index(boundary - 1)) = ReferenceSlot{anc};
        }
        LOG(TRACE) << "  reached reference node " << anc;
        return WalkStep::STOP;
    }
    state.pending = PendingCandidate{anc, ranks};
    return WalkStep::CONTINUE;
}

// Copies the ranks above the highest filled rank from the taxonomy of the
//  genome that first named that clade. Returns false if there is nothing to copy from.
bool CladeNamer::inherit_from_founder(const string & genome, WalkState & state) {
    const auto highest = state.highest_filled();
    if (not highest or *highest == RANK_PHYLUM) {
        return true;
    }
    const auto * named = std::get_if<NamedSlot>(&state.slot(*highest));
    if (named == nullptr) {
        return true;
    }
    auto founder = clade_founder.find(named->name);
    if (founder == clade_founder.end()) {
        throw CLNError() << "Clade \"" << named->name << "\" has no founding genome.";
    }
    auto row = genome_row.find(founder->second);
    if (row == genome_row.end()) {
        LOG(DEBUG) << "  " << genome << " founded " << named->name << " during this walk";
        return false;
    }
    const auto & founder_taxonomy = result.genomes[row->second].taxonomy;
    const auto prefix = founder_taxonomy.substr(0, founder_taxonomy.find(";" + named->name));
    const auto words = split_string(prefix, ';');
    const auto highest_index = rank_index(*highest);
    std::size_t i = 0;
    for (auto w = words.rbegin(); w != words.rend(); ++w, ++i) {
        if (starts_with(*w, "d__")) {
            continue;
        }
        if (i + 1 > highest_index) {
            break;
        }
        auto & s = state.slots[highest_index - 1 - i];
        if (!w->empty() and isdigit(static_cast<unsigned char>((*w)[0]))) {
            long ref_node;
            if (!char_ptr_to_long(w->c_str(), &ref_node)) {
                throw CLNError() << "Expecting a node id in the taxonomy of " << founder->second << ". Found \"" << *w << "\"";
            }
            s = ReferenceSlot{ref_node};
        } else {
            s = NamedSlot{std::nullopt, *w};
        }
    }
    return true;
}

// The lowest ancestor that may anchor rank `r`: its branch spans `r`, it is not a
//  reference node, and it anchors nothing at or above `r` yet.
std::optional<NodeId> CladeNamer::backfill_anchor(const vector<NodeId> & ancestors, Rank r) {
    for (auto anc : ancestors) {
        const auto & interval = interval_if_resolvable(anc);
        if (not interval or interval->is_reference()) {
            continue;
        }
        if (interval->spans(r) and ledger.only_lower_ranks(anc, r)) {
            return anc;
        }
    }
    return std::nullopt;
}

void CladeNamer::fill_remaining(const string & genome,
                                const vector<NodeId> & ancestors,
                                bool fill_all,
                                WalkState & state) {
    std::array<bool, NUM_RANKS> fill;
    fill.fill(fill_all);
    std::size_t lowest_prenamed = 0;
    bool any_prenamed = false;
    for (auto r : all_ranks) {
        if (not state.is_empty(r)) {
            lowest_prenamed = rank_index(r);
            any_prenamed = true;
        }
    }
    string species_name;
    for (auto r : all_ranks) {
        string clade;
        auto & s = state.slot(r);
        if (std::holds_alternative<ReferenceSlot>(s)) {
            fill.fill(true);
            continue;
        }
        if (const auto * named = std::get_if<NamedSlot>(&s)) {
            for (auto t : all_ranks) {
                fill[rank_index(t)] = (named->name.find(rank_prefix(t)) == string::npos);
            }
            clade = named->name;
        } else if (fill[rank_index(r)]) {
            if (r == RANK_SPECIES) {
                if (species_name.empty()) {
                    continue;
                }
                clade = species_name;
            } else {
                clade = rank_prefix(r) + genome;
            }
            const bool between_named = any_prenamed and rank_index(r) < lowest_prenamed;
            std::optional<NodeId> anchor;
            if (r != RANK_SPECIES and between_named) {
                anchor = backfill_anchor(ancestors, r);
            }
            if (anchor) {
                ledger.add(*anchor, r, clade);
            }
            LOG(DEBUG) << "  " << clade << " filled" << (anchor ? " at node " + std::to_string(*anchor) : string());
            s = NamedSlot{anchor, clade};
            record_naming(anchor, clade, genome);
        }
        if (r == RANK_GENUS and not clade.empty()) {
            species_name = "s" + genus_local_name(clade) + " " + genome;
        }
    }
}

void CladeNamer::name_genome(const RankedGenome & rg) {
    const auto & genome = rg.genome;
    LOG(DEBUG) << "Determining taxonomy for " << genome;
    const auto & ancestors = tree.ancestors(rg.node);
    WalkState state;
    for (auto anc : ancestors) {
        if (visit_ancestor(genome, anc, state) == WalkStep::STOP) {
            break;
        }
    }
    bool fill_all = not state.highest_filled().has_value();
    if (not fill_all and not inherit_from_founder(genome, state)) {
        fill_all = true;
    }
    fill_remaining(genome, ancestors, fill_all, state);
    const auto taxonomy = render_taxonomy(domain, state);
    LOG(DEBUG) << genome << " -> " << taxonomy;
    genome_row[genome] = result.genomes.size();
    result.genomes.push_back(GenomeTaxonomy{genome, taxonomy});
}

NamingResult name_clades(const TreeTable & tree,
                         const GenomeMetadataMap & metadata,
                         const RankCutoffTable & cutoffs) {
    const auto ranked = rank_query_genomes(tree, metadata);
    CladeNamer namer(tree, cutoffs);
    for (const auto & rg : ranked) {
        namer.name_genome(rg);
    }
    auto & result = namer.get_result();
    sort_by_clade(result.nodes);
    LOG(INFO) << result.genomes.size() << " genomes named, " << result.nodes.size() << " clade names assigned";
    return std::move(result);
}

} // namespace cln
