#include "cln/novelty.h"

using std::vector;

namespace cln {

namespace {
Rank required_label(const TreeNode & nd, NodeId for_node) {
    if (not nd.novelty) {
        throw UnrecognizedNoveltyLabelError("", std::string("Node ")
                                                + std::to_string(nd.node)
                                                + " has no novelty label, which is needed to resolve the interval of node "
                                                + std::to_string(for_node) + ".");
    }
    return *nd.novelty;
}
}

NoveltyInterval NoveltyInterval::rank_range(Rank parent_label, Rank self_label) {
    if (parent_label == self_label) {
        return same_rank(self_label);
    }
    if (rank_index(parent_label) > rank_index(self_label)) {
        throw CLNError() << "A branch labelled \"" << rank_to_string(self_label)
                         << "\" lies below a branch labelled \"" << rank_to_string(parent_label)
                         << "\", so it spans no ranks.";
    }
    return NoveltyInterval(IntervalKind::RANK_RANGE, parent_label, self_label);
}

vector<Rank> NoveltyInterval::ranks() const {
    switch (kind) {
        case IntervalKind::SAME_RANK:
            return {self_label};
        case IntervalKind::RANK_RANGE:
            return cln::rank_range(*parent_label, self_label);
        case IntervalKind::REFERENCE:
            return {};
    }
    CLN_UNREACHABLE;
}

bool NoveltyInterval::spans(Rank r) const {
    if (not parent_label) {
        return false;
    }
    return rank_index(*parent_label) <= rank_index(r) and rank_index(r) <= rank_index(self_label);
}

std::optional<NoveltyInterval> find_interval(const TreeTable & tree, NodeId node) {
    const auto & nd = tree.node_from_id(node);
    if (not nd.novelty) {
        return std::nullopt;
    }
    if (nd.is_reference()) {
        return NoveltyInterval::reference(*nd.novelty);
    }
    const auto & par = tree.node_from_id(nd.parent);
    if (not par.novelty or rank_index(*par.novelty) > rank_index(*nd.novelty)) {
        return std::nullopt;
    }
    return NoveltyInterval::rank_range(*par.novelty, *nd.novelty);
}

NoveltyInterval resolve_interval(const TreeTable & tree, NodeId node) {
    auto interval = find_interval(tree, node);
    if (interval) {
        return *interval;
    }
    // report why the interval could not be found
    const auto & nd = tree.node_from_id(node);
    const auto self_label = required_label(nd, node);
    const auto parent_label = required_label(tree.node_from_id(nd.parent), node);
    return NoveltyInterval::rank_range(parent_label, self_label);
}

} // namespace cln
