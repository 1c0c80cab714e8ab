#ifndef CLADENAMER_NAMING_FILL_TAXONOMY_H
#define CLADENAMER_NAMING_FILL_TAXONOMY_H

#include <iostream>
#include <map>
#include <string>
#include <unordered_map>

#include "cln/cln_base_includes.h"
#include "cln/naming/naming_tables.h"
#include "cln/tree_table.h"

namespace cln {

// genome id -> full reference taxonomy ("d__...;p__...;...;s__...")
using ReferenceTaxonomyMap = std::unordered_map<std::string, std::string>;

ReferenceTaxonomyMap read_reference_taxonomy(std::istream & inp, const std::string & table_name);
ReferenceTaxonomyMap read_reference_taxonomy(const std::string & filepath);

// Completes the taxonomies that name_clades left at a reference node, using
//  the most common reference taxonomy among the node's descendants. Genome
//  rows keep their order; the node table is re-sorted by clade.
NamingResult fill_taxonomy(const TreeTable & tree,
                           const NamingResult & named,
                           const ReferenceTaxonomyMap & reference);

} // namespace cln
#endif
