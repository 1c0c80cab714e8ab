#ifndef CLADENAMER_NAMING_NAMING_TABLES_H
#define CLADENAMER_NAMING_NAMING_TABLES_H

#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "cln/cln_base_includes.h"

namespace cln {

struct GenomeTaxonomy {
    std::string genome;
    // Either a domain-prefixed taxonomy, or a node id followed by the ranks
    //  named below it (awaiting the reference completion pass).
    std::string taxonomy;
};

struct NodeNaming {
    std::optional<NodeId> node; // absent for clades not anchored at a tree node
    std::string clade;
    std::string genome_rep;
};

struct NamingResult {
    std::vector<GenomeTaxonomy> genomes;
    std::vector<NodeNaming> nodes;
};

inline bool operator==(const GenomeTaxonomy & a, const GenomeTaxonomy & b) {
    return a.genome == b.genome && a.taxonomy == b.taxonomy;
}
inline bool operator!=(const GenomeTaxonomy & a, const GenomeTaxonomy & b) {
    return !(a == b);
}
inline bool operator==(const NodeNaming & a, const NodeNaming & b) {
    return a.node == b.node && a.clade == b.clade && a.genome_rep == b.genome_rep;
}
inline bool operator!=(const NodeNaming & a, const NodeNaming & b) {
    return !(a == b);
}
std::ostream & operator<<(std::ostream & out, const GenomeTaxonomy & gt);
std::ostream & operator<<(std::ostream & out, const NodeNaming & nn);

// Stable sort by clade name.
void sort_by_clade(std::vector<NodeNaming> & nodes);

// Readers for tables in the layout of the writers below.
std::vector<GenomeTaxonomy> read_genome_taxonomy(const std::string & filepath);
std::vector<NodeNaming> read_node_names(const std::string & filepath);

void write_genome_taxonomy(std::ostream & out, const std::vector<GenomeTaxonomy> & genomes);
void write_node_names(std::ostream & out, const std::vector<NodeNaming> & nodes);
void write_genome_taxonomy(const std::string & filepath, const std::vector<GenomeTaxonomy> & genomes);
void write_node_names(const std::string & filepath, const std::vector<NodeNaming> & nodes);

} // namespace cln
#endif
