#include <algorithm>
#include "cln/genome_quality.h"
#include "cln/tsv.h"
#include "cln/util.h"

using std::string;
using std::vector;

namespace cln {

GenomeMetadataMap read_genome_metadata(std::istream & inp, const string & table_name) {
    string line;
    if (!getline(inp, line)) {
        throw CLNError() << "The genome metadata table " << table_name << " is empty.";
    }
    const TsvHeader header(line, table_name);
    const auto genome_col = header.require({"genome_id", "ID", "Name"});
    const auto completeness_col = header.require({"completeness", "checkm2_completeness", "Completeness"});
    const auto contamination_col = header.require({"contamination", "checkm2_contamination", "Contamination"});
    GenomeMetadataMap ret;
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
        const auto genome = strip_surrounding_whitespace(words[genome_col]);
        if (genome.empty()) {
            throw CLNError() << "Empty genome id in " << table_name << " on line " << line_num;
        }
        if (contains(ret, genome)) {
            throw CLNError() << "Repeated genome in " << table_name << ": \"" << genome << "\" on line " << line_num;
        }
        GenomeMetadata md;
        md.completeness = parse_double_field(words[completeness_col], "completeness", table_name, line_num);
        md.contamination = parse_double_field(words[contamination_col], "contamination", table_name, line_num);
        ret[genome] = md;
    }
    LOG(INFO) << ret.size() << " genome metadata records read from " << table_name;
    return ret;
}

GenomeMetadataMap read_genome_metadata(const string & filepath) {
    std::ifstream inp;
    if (!open_utf8_file(filepath, inp)) {
        throw CLNError() << "Could not open the genome metadata table \"" << filepath << "\".";
    }
    return read_genome_metadata(inp, filepath);
}

vector<RankedGenome> rank_query_genomes(const TreeTable & tree, const GenomeMetadataMap & metadata) {
    vector<RankedGenome> ranked;
    for (const auto & nd : tree.get_nodes()) {
        if (not nd.is_query_genome()) {
            continue;
        }
        auto md = metadata.find(*nd.genome);
        if (md == metadata.end()) {
            throw MissingMetadataError(*nd.genome);
        }
        RankedGenome rg;
        rg.genome = *nd.genome;
        rg.node = nd.node;
        rg.quality = genome_quality(md->second);
        ranked.push_back(rg);
    }
    std::sort(ranked.begin(), ranked.end(),
              [](const RankedGenome & a, const RankedGenome & b) {
                  if (a.quality != b.quality) {
                      return a.quality > b.quality;
                  }
                  return a.genome > b.genome;
              });
    for (std::size_t i = 0; i < ranked.size(); ++i) {
        ranked[i].order = i;
    }
    LOG(INFO) << ranked.size() << " query genomes ranked by quality";
    return ranked;
}

} // namespace cln
