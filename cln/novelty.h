#ifndef CLADENAMER_NOVELTY_H
#define CLADENAMER_NOVELTY_H

#include <optional>
#include <vector>

#include "cln/cln_base_includes.h"
#include "cln/taxonomy/rank.h"
#include "cln/tree_table.h"

namespace cln {

enum class IntervalKind {
    SAME_RANK,  // the branch spans the single rank of its label
    RANK_RANGE, // the branch may originate any rank in [parent label, own label)
    REFERENCE   // a reference-only subtree: defer to the reference taxonomy
};

// The ranks that the branch above a node could originate.
class NoveltyInterval {
    public:
    static NoveltyInterval same_rank(Rank r) {
        return NoveltyInterval(IntervalKind::SAME_RANK, r, r);
    }
    static NoveltyInterval rank_range(Rank parent_label, Rank self_label);
    static NoveltyInterval reference(Rank self_label) {
        return NoveltyInterval(IntervalKind::REFERENCE, std::nullopt, self_label);
    }

    IntervalKind get_kind() const {
        return kind;
    }
    bool is_reference() const {
        return kind == IntervalKind::REFERENCE;
    }
    // Absent for REFERENCE intervals.
    const std::optional<Rank> & get_parent_label() const {
        return parent_label;
    }
    Rank get_self_label() const {
        return self_label;
    }
    // The first rank this branch could originate. Absent for REFERENCE intervals.
    std::optional<Rank> first_rank() const {
        return parent_label;
    }
    // [label] for SAME_RANK, [parent label, self label) for RANK_RANGE, empty for REFERENCE.
    std::vector<Rank> ranks() const;
    // true if `r` lies between the parent and self labels, both inclusive.
    bool spans(Rank r) const;

    private:
    NoveltyInterval(IntervalKind k, std::optional<Rank> p, Rank s)
        :kind(k),
        parent_label(p),
        self_label(s) {
    }
    IntervalKind kind;
    std::optional<Rank> parent_label;
    Rank self_label;
};

// Absent if a label needed for `node` is missing, or if the parent label
//  lies below the node's own label.
std::optional<NoveltyInterval> find_interval(const TreeTable & tree, NodeId node);
// As find_interval, but throws UnrecognizedNoveltyLabelError for a missing
//  label and CLNError for an inverted pair of labels.
NoveltyInterval resolve_interval(const TreeTable & tree, NodeId node);

} // namespace cln
#endif
