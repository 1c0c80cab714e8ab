#include "cln/naming/fill_taxonomy.h"
#include "cln/taxonomy/rank.h"
#include "cln/tsv.h"
#include "cln/util.h"

using std::string;
using std::vector;

namespace cln {

ReferenceTaxonomyMap read_reference_taxonomy(std::istream & inp, const string & table_name) {
    ReferenceTaxonomyMap ret;
    unsigned int line_num = 1;
    for (string next_line; getline(inp, next_line); ++line_num) {
        if (strip_surrounding_whitespace(next_line).empty()) {
            continue;
        }
        const auto words = split_tsv_line(next_line);
        if (words.size() != 2) {
            throw CLNError() << "Expecting one tab in each line of " << table_name
                             << ". Problem with line " << line_num << ": \"" << next_line << "\".";
        }
        const auto genome = strip_surrounding_whitespace(words[0]);
        if (contains(ret, genome)) {
            throw CLNError() << "Repeated genome in " << table_name << ": \"" << genome << "\" on line " << line_num;
        }
        ret[genome] = strip_surrounding_whitespace(words[1]);
    }
    LOG(INFO) << ret.size() << " reference taxonomies read from " << table_name;
    return ret;
}

ReferenceTaxonomyMap read_reference_taxonomy(const string & filepath) {
    std::ifstream inp;
    if (!open_utf8_file(filepath, inp)) {
        throw CLNError() << "Could not open the reference taxonomy \"" << filepath << "\".";
    }
    return read_reference_taxonomy(inp, filepath);
}

namespace {

// The part of the reference taxonomies below `nd` that precedes the last
//  ";<limit>", taking the most common one (ties to the smallest string).
string majority_prefix(const TreeTable & tree,
                       NodeId nd,
                       const string & limit,
                       const ReferenceTaxonomyMap & reference) {
    std::map<string, unsigned> counts;
    const string marker = ";" + limit;
    for (auto d : tree.descendants(nd)) {
        const auto & des = tree.node_from_id(d);
        if (not des.genome) {
            continue;
        }
        auto ref = reference.find(*des.genome);
        if (ref == reference.end()) {
            continue;
        }
        const auto pos = ref->second.rfind(marker);
        if (pos == string::npos) {
            continue;
        }
        counts[ref->second.substr(0, pos)] += 1;
    }
    if (counts.empty()) {
        throw NoReferenceDescendantError(nd);
    }
    auto best = counts.begin();
    for (auto c = counts.begin(); c != counts.end(); ++c) {
        if (c->second > best->second) {
            best = c;
        }
    }
    LOG(DEBUG) << "node " << nd << ": " << best->first << " (" << best->second << " of " << counts.size() << " prefixes)";
    return best->first;
}

}

NamingResult fill_taxonomy(const TreeTable & tree,
                           const NamingResult & named,
                           const ReferenceTaxonomyMap & reference) {
    NamingResult result;
    result.nodes = named.nodes;
    std::map<std::pair<NodeId, string>, string> node_prefix;
    const string domain_prefix = "d__";
    const auto genus_prefix = rank_prefix(RANK_GENUS);
    std::size_t num_completed = 0;
    for (const auto & gt : named.genomes) {
        if (starts_with(gt.taxonomy, domain_prefix)) {
            result.genomes.push_back(gt);
            continue;
        }
        const auto sep = gt.taxonomy.find(';');
        const auto node_word = gt.taxonomy.substr(0, sep);
        string lower_ranks = (sep == string::npos ? string() : gt.taxonomy.substr(sep + 1));
        NodeId nd;
        if (!char_ptr_to_long(node_word.c_str(), &nd)) {
            throw CLNError() << "Expecting the taxonomy of " << gt.genome << " to start with a domain or a node id. Found \"" << gt.taxonomy << "\"";
        }
        if (not tree.has_node(nd)) {
            throw MissingNodeError(nd);
        }
        const auto key = std::make_pair(nd, lower_ranks.substr(0, 3));
        auto cached = node_prefix.find(key);
        if (cached == node_prefix.end()) {
            cached = node_prefix.emplace(key, majority_prefix(tree, nd, key.second, reference)).first;
        }
        const auto & prefix = cached->second;
        if (lower_ranks.empty()) {
            const auto pos = prefix.find(genus_prefix);
            if (pos == string::npos) {
                throw CLNError() << "The reference taxonomy \"" << prefix << "\" of node " << nd
                                 << " has no genus from which to name a species for " << gt.genome << ".";
            }
            lower_ranks = "s" + prefix.substr(pos + 1) + " " + gt.genome;
            result.nodes.push_back(NodeNaming{std::nullopt, lower_ranks, gt.genome});
        }
        LOG(DEBUG) << gt.genome << " completed from node " << nd;
        result.genomes.push_back(GenomeTaxonomy{gt.genome, prefix + ";" + lower_ranks});
        ++num_completed;
    }
    sort_by_clade(result.nodes);
    LOG(INFO) << num_completed << " taxonomies completed from the reference taxonomy";
    return result;
}

} // namespace cln
