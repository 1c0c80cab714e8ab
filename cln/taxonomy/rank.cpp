#include "cln/taxonomy/rank.h"
#include "cln/util.h"

using std::string;
using std::vector;

namespace cln {

const std::array<Rank, NUM_RANKS> all_ranks = {
    RANK_PHYLUM,
    RANK_CLASS,
    RANK_ORDER,
    RANK_FAMILY,
    RANK_GENUS,
    RANK_SPECIES
};

const std::map<Rank, string, std::less<>> rank_enum_to_name = 
    {   {RANK_PHYLUM, "phylum"},
        {RANK_CLASS, "class"},
        {RANK_ORDER, "order"},
        {RANK_FAMILY, "family"},
        {RANK_GENUS, "genus"},
        {RANK_SPECIES, "species"}
    };

const std::map<string, Rank, std::less<>> rank_name_to_enum = 
    {   {"phylum", RANK_PHYLUM},
        {"class", RANK_CLASS},
        {"order", RANK_ORDER},
        {"family", RANK_FAMILY},
        {"genus", RANK_GENUS},
        {"species", RANK_SPECIES}
    };

string rank_prefix(Rank r) {
    string p(1, rank_letter(r));
    p += "__";
    return p;
}

Rank string_to_rank(std::string_view s) {
    auto rank = rank_name_to_enum.find(s);
    if (rank == rank_name_to_enum.end()) {
        throw UnrecognizedNoveltyLabelError(string(s));
    }
    return rank->second;
}

Rank parse_novelty_label(const string & label) {
    const auto words = split_string(label);
    if (words.empty()) {
        throw UnrecognizedNoveltyLabelError(label);
    }
    auto name = words[0];
    const auto slash = name.find('/');
    if (slash != string::npos) {
        name = name.substr(0, slash);
    }
    name = to_lower(name);
    auto rank = rank_name_to_enum.find(name);
    if (rank == rank_name_to_enum.end()) {
        throw UnrecognizedNoveltyLabelError(label);
    }
    return rank->second;
}

vector<Rank> rank_range(Rank first, Rank last) {
    vector<Rank> r;
    for (auto i = rank_index(first); i < rank_index(last); ++i) {
        r.push_back(all_ranks[i]);
    }
    return r;
}

} // namespace cln
