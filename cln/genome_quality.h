#ifndef CLADENAMER_GENOME_QUALITY_H
#define CLADENAMER_GENOME_QUALITY_H

#include <iostream>
#include <map>
#include <string>
#include <vector>

#include "cln/cln_base_includes.h"
#include "cln/tree_table.h"

namespace cln {

struct GenomeMetadata {
    double completeness = 0.0;
    double contamination = 0.0;
};

using GenomeMetadataMap = std::map<std::string, GenomeMetadata>;

struct RankedGenome {
    std::string genome;
    NodeId node = 0;
    double quality = 0.0;
    std::size_t order = 0;
};

inline double genome_quality(const GenomeMetadata & md) {
    return md.completeness - 5.0 * md.contamination;
}

GenomeMetadataMap read_genome_metadata(std::istream & inp, const std::string & table_name);
GenomeMetadataMap read_genome_metadata(const std::string & filepath);

// The query genomes of `tree` in naming order: quality descending, then
//  genome id descending. Throws MissingMetadataError.
std::vector<RankedGenome> rank_query_genomes(const TreeTable & tree, const GenomeMetadataMap & metadata);

} // namespace cln
#endif
