#ifndef CLADENAMER_TAXONOMY_RED_CUTOFFS_H
#define CLADENAMER_TAXONOMY_RED_CUTOFFS_H

#include <array>
#include <string>
#include <vector>

#include "cln/taxonomy/rank.h"

namespace cln {

enum Domain {
    DOMAIN_BACTERIA,
    DOMAIN_ARCHAEA
};

// "d__Bacteria" or "d__Archaea". Anything else throws.
Domain string_to_domain(const std::string & s);
const std::string & domain_to_string(Domain d);

// Median RED of phylum..genus (GTDB r220), species fixed at 1.0.
class RankCutoffTable {
    public:
    static constexpr std::size_t NUM_CONFIGURABLE = 5;
    static constexpr double SPECIES_MEDIAN = 1.0;

    explicit RankCutoffTable(Domain d);
    // `medians` must hold exactly one value for each of phylum, class, order, family and genus.
    RankCutoffTable(Domain d, const std::vector<double> & medians);

    double median(Rank r) const {
        if (r == RANK_SPECIES) {
            return SPECIES_MEDIAN;
        }
        return medians[rank_index(r)];
    }
    Domain get_domain() const {
        return domain;
    }
    std::vector<double> configurable_medians() const {
        return std::vector<double>(medians.begin(), medians.end());
    }
    // true if `candidate_red` is strictly closer to the median of `r` than `other_red` is.
    bool closer_to_median(Rank r, double candidate_red, double other_red) const;

    static const std::array<double, NUM_CONFIGURABLE> & default_medians(Domain d);
    static std::vector<double> parse_medians(const std::vector<std::string> & words);

    private:
    Domain domain;
    std::array<double, NUM_CONFIGURABLE> medians;
};

} // namespace cln
#endif
