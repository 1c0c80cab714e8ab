#include <algorithm>
#include <fstream>
#include "cln/naming/naming_tables.h"
#include "cln/error.h"
#include "cln/tsv.h"
#include "cln/util.h"

using std::string;
using std::vector;

namespace cln {

std::ostream & operator<<(std::ostream & out, const GenomeTaxonomy & gt) {
    out << gt.genome << '\t' << gt.taxonomy;
    return out;
}

std::ostream & operator<<(std::ostream & out, const NodeNaming & nn) {
    if (nn.node) {
        out << *nn.node;
    }
    out << '\t' << nn.clade << '\t' << nn.genome_rep;
    return out;
}

void sort_by_clade(vector<NodeNaming> & nodes) {
    std::stable_sort(nodes.begin(), nodes.end(),
                     [](const NodeNaming & a, const NodeNaming & b) {
                         return a.clade < b.clade;
                     });
}

void write_genome_taxonomy(std::ostream & out, const vector<GenomeTaxonomy> & genomes) {
    out << "genome\ttaxonomy\n";
    for (const auto & gt : genomes) {
        out << gt << '\n';
    }
}

void write_node_names(std::ostream & out, const vector<NodeNaming> & nodes) {
    out << "node\tclade\tgenome_rep\n";
    for (const auto & nn : nodes) {
        out << nn << '\n';
    }
}

namespace {
// Rows of a table with a header, each with `num_fields` fields.
vector<vector<string>> read_rows(const string & filepath, const string & what, std::size_t num_fields) {
    std::ifstream inp;
    if (!open_utf8_file(filepath, inp)) {
        throw CLNError() << "Could not open the " << what << " table \"" << filepath << "\".";
    }
    vector<vector<string>> rows;
    string line;
    unsigned int line_num = 1;
    if (!getline(inp, line)) {
        return rows;
    }
    while (getline(inp, line)) {
        ++line_num;
        if (strip_surrounding_whitespace(line).empty()) {
            continue;
        }
        auto words = split_tsv_line(line);
        if (words.size() != num_fields) {
            throw CLNError() << "Expecting " << num_fields << " fields in each row of " << filepath
                             << ". Found " << words.size() << " on line " << line_num;
        }
        rows.push_back(std::move(words));
    }
    return rows;
}

std::ofstream open_output(const string & filepath) {
    std::ofstream out(filepath);
    if (!out.good()) {
        throw CLNError() << "Could not open \"" << filepath << "\" for writing.";
    }
    return out;
}
}

vector<GenomeTaxonomy> read_genome_taxonomy(const string & filepath) {
    vector<GenomeTaxonomy> genomes;
    for (const auto & words : read_rows(filepath, "genome taxonomy", 2)) {
        genomes.push_back(GenomeTaxonomy{words[0], words[1]});
    }
    return genomes;
}

vector<NodeNaming> read_node_names(const string & filepath) {
    vector<NodeNaming> nodes;
    unsigned int row_num = 0;
    for (const auto & words : read_rows(filepath, "node name", 3)) {
        ++row_num;
        NodeNaming nn;
        if (!words[0].empty()) {
            nn.node = parse_long_field(words[0], "node", filepath, row_num + 1);
        }
        nn.clade = words[1];
        nn.genome_rep = words[2];
        nodes.push_back(nn);
    }
    return nodes;
}

void write_genome_taxonomy(const string & filepath, const vector<GenomeTaxonomy> & genomes) {
    auto out = open_output(filepath);
    write_genome_taxonomy(out, genomes);
    LOG(INFO) << genomes.size() << " genome taxonomies written to " << filepath;
}

void write_node_names(const string & filepath, const vector<NodeNaming> & nodes) {
    auto out = open_output(filepath);
    write_node_names(out, nodes);
    LOG(INFO) << nodes.size() << " clade names written to " << filepath;
}

} // namespace cln
