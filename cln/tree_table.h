#ifndef CLADENAMER_TREE_TABLE_H
#define CLADENAMER_TREE_TABLE_H

#include <iostream>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "cln/cln_base_includes.h"
#include "cln/error.h"
#include "cln/taxonomy/rank.h"

namespace cln {

// The reference_group value carried by nodes whose subtree holds only reference genomes.
extern const std::string reference_group_tag;
// The magset value of reference genomes.
extern const std::string reference_magset_tag;

// One row of the annotated tree table.
struct TreeNode {
    NodeId node = 0;
    NodeId parent = 0;
    std::optional<double> red;
    std::optional<Rank> novelty;
    std::optional<std::string> novelty_text;
    std::optional<std::string> reference_group;
    std::optional<std::string> genome;
    std::optional<std::string> magset;

    bool is_root() const {
        return node == parent;
    }
    // A node without a group is treated like one whose subtree is reference-only.
    bool is_reference() const {
        return (not reference_group) or (*reference_group == reference_group_tag);
    }
    bool has_genome() const {
        return genome.has_value();
    }
    bool is_query_genome() const {
        return genome and magset and (*magset != reference_magset_tag);
    }
};

// Arena of tree rows addressed by node id. Children lists are kept in row
//  order. Ancestor chains are computed on first request and cached.
class TreeTable {
    public:
    void add_node(TreeNode nd);
    // Throws MissingNodeError for the first row (in row order) whose parent has no row.
    void check_parents() const;

    bool has_node(NodeId id) const {
        return node_index.count(id) > 0;
    }
    // Throws MissingNodeError.
    const TreeNode & node_from_id(NodeId id) const;
    std::size_t index_from_id(NodeId id) const;

    NodeId parent_of(NodeId id) const {
        return node_from_id(id).parent;
    }
    // From the immediate parent up to and including the root. Empty for a root.
    const std::vector<NodeId> & ancestors(NodeId id) const;
    // Row order, without the self-loop of a root.
    const std::vector<NodeId> & children_of(NodeId id) const;
    // Pre-order, not including `id` itself.
    std::vector<NodeId> descendants(NodeId id) const;

    // The RED of the node itself. Throws if the row has none.
    double red_of(NodeId id) const;
    // The RED at the top of the branch leading to `id`: the parent's RED, or 0 for a root.
    double branch_red(NodeId id) const;

    const std::vector<TreeNode> & get_nodes() const {
        return nodes;
    }
    std::size_t size() const {
        return nodes.size();
    }
    private:
    std::vector<TreeNode> nodes;
    std::unordered_map<NodeId, std::size_t> node_index;
    std::unordered_map<NodeId, std::vector<NodeId>> children;
    mutable std::unordered_map<NodeId, std::vector<NodeId>> ancestor_cache;
};

TreeTable read_tree_table(std::istream & inp, const std::string & table_name);
TreeTable read_tree_table(const std::string & filepath);

} // namespace cln
#endif
