#include <cmath>
#include "cln/taxonomy/red_cutoffs.h"
#include "cln/util.h"

using std::string;
using std::vector;

namespace cln {

namespace {
const std::array<double, RankCutoffTable::NUM_CONFIGURABLE> bacteria_medians = {
    0.3280941769231098,
    0.449727838796469,
    0.6083500718998613,
    0.7576141066814935,
    0.9220350796053899
};

const std::array<double, RankCutoffTable::NUM_CONFIGURABLE> archaea_medians = {
    0.2128708845277663,
    0.35878546884559126,
    0.5316295929627715,
    0.7250725361353227,
    0.9069458981600348
};

const string bacteria_name = "d__Bacteria";
const string archaea_name = "d__Archaea";
}

Domain string_to_domain(const string & s) {
    if (s == bacteria_name) {
        return DOMAIN_BACTERIA;
    }
    if (s == archaea_name) {
        return DOMAIN_ARCHAEA;
    }
    throw CLNError() << "Domain \"" << s << "\" not recognized. Expecting \""
                     << bacteria_name << "\" or \"" << archaea_name << "\".";
}

const string & domain_to_string(Domain d) {
    return (d == DOMAIN_BACTERIA ? bacteria_name : archaea_name);
}

const std::array<double, RankCutoffTable::NUM_CONFIGURABLE> & RankCutoffTable::default_medians(Domain d) {
    return (d == DOMAIN_BACTERIA ? bacteria_medians : archaea_medians);
}

RankCutoffTable::RankCutoffTable(Domain d)
    :domain(d),
    medians(default_medians(d)) {
}

RankCutoffTable::RankCutoffTable(Domain d, const vector<double> & m)
    :domain(d) {
    if (m.size() != NUM_CONFIGURABLE) {
        throw CLNError() << "Expecting " << NUM_CONFIGURABLE
                         << " RED cutoffs (phylum, class, order, family, genus), but "
                         << m.size() << " were given.";
    }
    std::copy(m.begin(), m.end(), medians.begin());
}

bool RankCutoffTable::closer_to_median(Rank r, double candidate_red, double other_red) const {
    const auto m = median(r);
    return std::fabs(candidate_red - m) < std::fabs(other_red - m);
}

vector<double> RankCutoffTable::parse_medians(const vector<string> & words) {
    vector<double> m;
    for (const auto & w : words) {
        for (const auto & ws_word : split_string(w)) {
            for (const auto & t : split_string(ws_word, ',')) {
                if (t.empty()) {
                    continue;
                }
                double d;
                if (!char_ptr_to_double(t.c_str(), &d)) {
                    throw CLNError() << "Expecting a numeric RED cutoff. Found: \"" << t << "\"";
                }
                m.push_back(d);
            }
        }
    }
    return m;
}

} // namespace cln
