#include "cln/tree_table.h"
#include "cln/tsv.h"
#include "cln/util.h"

using std::string;
using std::vector;

namespace cln {

const string reference_group_tag = "gtdb";
const string reference_magset_tag = "GTDB";

namespace {
const vector<NodeId> no_nodes;
}

void TreeTable::add_node(TreeNode nd) {
    if (has_node(nd.node)) {
        throw CLNError() << "Node " << nd.node << " occurs more than once in the tree table.";
    }
    const auto id = nd.node;
    const auto par = nd.parent;
    node_index[id] = nodes.size();
    nodes.push_back(std::move(nd));
    if (par != id) {
        children[par].push_back(id);
    }
    ancestor_cache.clear();
}

void TreeTable::check_parents() const {
    for (const auto & nd : nodes) {
        if (not has_node(nd.parent)) {
            throw MissingNodeError(nd.parent);
        }
    }
}

std::size_t TreeTable::index_from_id(NodeId id) const {
    auto i = node_index.find(id);
    if (i == node_index.end()) {
        throw MissingNodeError(id);
    }
    return i->second;
}

const TreeNode & TreeTable::node_from_id(NodeId id) const {
    return nodes[index_from_id(id)];
}

const vector<NodeId> & TreeTable::ancestors(NodeId id) const {
    auto cached = ancestor_cache.find(id);
    if (cached != ancestor_cache.end()) {
        return cached->second;
    }
    vector<NodeId> chain;
    const TreeNode * curr = &node_from_id(id);
    while (not curr->is_root()) {
        if (chain.size() >= nodes.size()) {
            throw CLNError() << "The ancestors of node " << id << " form a cycle that does not end at a root.";
        }
        chain.push_back(curr->parent);
        curr = &node_from_id(curr->parent);
    }
    LOG(TRACE) << "node " << id << " has " << chain.size() << " ancestors";
    return ancestor_cache.emplace(id, std::move(chain)).first->second;
}

const vector<NodeId> & TreeTable::children_of(NodeId id) const {
    auto c = children.find(id);
    if (c == children.end()) {
        return no_nodes;
    }
    return c->second;
}

vector<NodeId> TreeTable::descendants(NodeId id) const {
    vector<NodeId> des;
    vector<NodeId> to_visit;
    const auto & c = children_of(id);
    to_visit.assign(c.rbegin(), c.rend());
    while (not to_visit.empty()) {
        const auto nd = to_visit.back();
        to_visit.pop_back();
        des.push_back(nd);
        const auto & nc = children_of(nd);
        to_visit.insert(to_visit.end(), nc.rbegin(), nc.rend());
    }
    return des;
}

double TreeTable::red_of(NodeId id) const {
    const auto & nd = node_from_id(id);
    if (not nd.red) {
        throw CLNError() << "Node " << id << " has no RED value.";
    }
    return *nd.red;
}

double TreeTable::branch_red(NodeId id) const {
    const auto & nd = node_from_id(id);
    if (nd.is_root()) {
        return 0.0;
    }
    return red_of(nd.parent);
}

TreeTable read_tree_table(std::istream & inp, const string & table_name) {
    string line;
    if (!getline(inp, line)) {
        throw CLNError() << "The tree table " << table_name << " is empty.";
    }
    const TsvHeader header(line, table_name);
    const auto parent_col = header.require({"parent"});
    const auto node_col = header.require({"node"});
    const auto group_col = header.find({"nongtdb_group", "reference_group"});
    const auto genome_col = header.find({"genome"});
    const auto magset_col = header.find({"magset"});
    const auto red_col = header.find({"RED"});
    const auto novelty_col = header.find({"novelty_red", "novelty_label"});
    TreeTable tree;
    unsigned int line_num = 1;
    while (getline(inp, line)) {
        ++line_num;
        if (strip_surrounding_whitespace(line).empty()) {
            continue;
        }
        const auto words = split_tsv_line(line);
        if (words.size() != header.size()) {
            throw CLNError() << "Expecting " << header.size() << " fields in each row of " << table_name
                             << ". Found " << words.size() << " on line " << line_num;
        }
        TreeNode nd;
        nd.parent = parse_long_field(words[parent_col], "parent", table_name, line_num);
        nd.node = parse_long_field(words[node_col], "node", table_name, line_num);
        nd.reference_group = field_or_null(words, group_col);
        nd.genome = field_or_null(words, genome_col);
        nd.magset = field_or_null(words, magset_col);
        const auto red = field_or_null(words, red_col);
        if (red) {
            nd.red = parse_double_field(*red, "RED", table_name, line_num);
        }
        nd.novelty_text = field_or_null(words, novelty_col);
        if (nd.novelty_text) {
            try {
                nd.novelty = parse_novelty_label(*nd.novelty_text);
            } catch (UnrecognizedNoveltyLabelError & x) {
                x.prepend(table_name + " line " + std::to_string(line_num) + ": ");
                throw;
            }
        }
        tree.add_node(std::move(nd));
    }
    tree.check_parents();
    LOG(INFO) << tree.size() << " nodes read from " << table_name;
    return tree;
}

TreeTable read_tree_table(const string & filepath) {
    std::ifstream inp;
    if (!open_utf8_file(filepath, inp)) {
        throw CLNError() << "Could not open the tree table \"" << filepath << "\".";
    }
    return read_tree_table(inp, filepath);
}

} // namespace cln
