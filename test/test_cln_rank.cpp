#include <cmath>
#include "cln/taxonomy/rank.h"
#include "cln/taxonomy/red_cutoffs.h"
#include "cln/test_harness.h"
using namespace cln;

char testNoveltyLabels(const TestHarness &) {
    const std::vector<std::pair<std::string, Rank> > labels{
        {"Phylum (0-0.28]", RANK_PHYLUM},
        {"Class (0.28-0.43]", RANK_CLASS},
        {"Order (0.43-0.62]", RANK_ORDER},
        {"Family (0.62-0.82]", RANK_FAMILY},
        {"Genus (0.82-0.95]", RANK_GENUS},
        {"Species/Strain (0.95-1]", RANK_SPECIES},
        {"genus", RANK_GENUS},
        {"  FAMILY  ", RANK_FAMILY}
    };
    for (const auto & lr : labels) {
        if (parse_novelty_label(lr.first) != lr.second) {
            std::cerr << "\"" << lr.first << "\" parsed as " << rank_to_string(parse_novelty_label(lr.first)) << '\n';
            return 'F';
        }
    }
    return '.';
}

char testUnrecognizedNoveltyLabel(const TestHarness &) {
    for (const auto & label : {"", "Domain (0-0.1]", "Strain/Species", "Kingdom"}) {
        try {
            parse_novelty_label(label);
            std::cerr << "no exception for \"" << label << "\"\n";
            return 'F';
        } catch (const UnrecognizedNoveltyLabelError & x) {
            if (x.label != label) {
                return 'F';
            }
        }
    }
    try {
        string_to_rank("subspecies");
        return 'F';
    } catch (const UnrecognizedNoveltyLabelError &) {
    }
    return '.';
}

char testRankRange(const TestHarness &) {
    std::vector<Rank> expected{RANK_CLASS, RANK_ORDER, RANK_FAMILY};
    if (!test_vec_element_equality(expected, rank_range(RANK_CLASS, RANK_GENUS))) {
        return 'F';
    }
    if (!rank_range(RANK_GENUS, RANK_GENUS).empty() || !rank_range(RANK_SPECIES, RANK_PHYLUM).empty()) {
        return 'F';
    }
    return '.';
}

char testRankPrefixes(const TestHarness &) {
    std::vector<std::string> expected{"p__", "c__", "o__", "f__", "g__", "s__"};
    std::vector<std::string> obtained;
    for (auto r : all_ranks) {
        obtained.push_back(rank_prefix(r));
        if (rank_from_index(rank_index(r)) != r) {
            return 'F';
        }
    }
    try {
        rank_from_index(NUM_RANKS);
        return 'F';
    } catch (const CLNError &) {
    }
    return (test_vec_element_equality(expected, obtained) ? '.' : 'F');
}

char testDefaultCutoffs(const TestHarness &) {
    RankCutoffTable bac(DOMAIN_BACTERIA);
    RankCutoffTable arc(string_to_domain("d__Archaea"));
    if (std::fabs(bac.median(RANK_PHYLUM) - 0.3280941769231098) > 1e-12
        || std::fabs(bac.median(RANK_GENUS) - 0.9220350796053899) > 1e-12
        || std::fabs(arc.median(RANK_CLASS) - 0.35878546884559126) > 1e-12
        || bac.median(RANK_SPECIES) != 1.0
        || arc.median(RANK_SPECIES) != 1.0) {
        return 'F';
    }
    if (domain_to_string(arc.get_domain()) != "d__Archaea" || domain_to_string(bac.get_domain()) != "d__Bacteria") {
        return 'F';
    }
    // 0.4 lies at 0.049 from the class median and 0.072 from the phylum median
    if (!bac.closer_to_median(RANK_CLASS, 0.4, 0.3) || bac.closer_to_median(RANK_PHYLUM, 0.4, 0.3)) {
        return 'F';
    }
    if (bac.closer_to_median(RANK_GENUS, 0.9, 0.9)) {
        return 'F';
    }
    return '.';
}

char testUnknownDomain(const TestHarness &) {
    for (const auto & d : {"d__Eukaryota", "Bacteria", ""}) {
        try {
            string_to_domain(d);
            return 'F';
        } catch (const CLNError &) {
        }
    }
    return '.';
}

char testCutoffOverride(const TestHarness &) {
    auto m = RankCutoffTable::parse_medians({"0.1,0.2", "0.3", "0.4, 0.5"});
    std::vector<double> expected{0.1, 0.2, 0.3, 0.4, 0.5};
    if (!test_vec_element_equality(expected, m)) {
        return 'F';
    }
    RankCutoffTable t(DOMAIN_ARCHAEA, m);
    if (t.median(RANK_ORDER) != 0.3 || t.median(RANK_SPECIES) != 1.0) {
        return 'F';
    }
    if (!test_vec_element_equality(expected, t.configurable_medians())) {
        return 'F';
    }
    for (const auto & bad : {std::vector<double>{0.1, 0.2, 0.3, 0.4}, std::vector<double>{0.1, 0.2, 0.3, 0.4, 0.5, 0.6}}) {
        try {
            RankCutoffTable x(DOMAIN_BACTERIA, bad);
            return 'F';
        } catch (const CLNError &) {
        }
    }
    try {
        RankCutoffTable::parse_medians({"0.1", "zero"});
        return 'F';
    } catch (const CLNError &) {
    }
    return '.';
}

int main(int argc, char *argv[]) {
    TestHarness th(argc, argv);
    TestsVec tests{TestFn("testNoveltyLabels", testNoveltyLabels)
                   , TestFn("testUnrecognizedNoveltyLabel", testUnrecognizedNoveltyLabel)
                   , TestFn("testRankRange", testRankRange)
                   , TestFn("testRankPrefixes", testRankPrefixes)
                   , TestFn("testDefaultCutoffs", testDefaultCutoffs)
                   , TestFn("testUnknownDomain", testUnknownDomain)
                   , TestFn("testCutoffOverride", testCutoffOverride)
                  };
    return th.run_tests(tests);
}
