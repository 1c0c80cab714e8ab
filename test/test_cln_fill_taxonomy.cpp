#include <sstream>
#include "cln/tree_table.h"
#include "cln/genome_quality.h"
#include "cln/taxonomy/red_cutoffs.h"
#include "cln/naming/naming_tables.h"
#include "cln/naming/name_clades.h"
#include "cln/naming/fill_taxonomy.h"
#include "cln/util.h"
#include "cln/test_harness.h"
using namespace cln;

char testFillFromReference(const TestHarness & th) {
    std::ifstream inp;
    if (!th.open_test_file("fill_taxonomy/tree.tsv", inp)) {
        return 'U';
    }
    const auto tree = read_tree_table(th.get_filepath("fill_taxonomy/tree.tsv"));
    NamingResult named;
    named.genomes = read_genome_taxonomy(th.get_filepath("fill_taxonomy/genome_taxonomy.tsv"));
    named.nodes = read_node_names(th.get_filepath("fill_taxonomy/node_names.tsv"));
    const auto reference = read_reference_taxonomy(th.get_filepath("fill_taxonomy/reference_taxonomy.tsv"));
    const auto filled = fill_taxonomy(tree, named, reference);
    const auto expected_genomes = read_genome_taxonomy(th.get_filepath("fill_taxonomy/expected_genomes.tsv"));
    const auto expected_nodes = read_node_names(th.get_filepath("fill_taxonomy/expected_nodes.tsv"));
    bool ok = test_vec_element_equality(expected_genomes, filled.genomes);
    ok = test_vec_element_equality(expected_nodes, filled.nodes) && ok;
    return (ok ? '.' : 'F');
}

// Naming followed by completion leaves no taxonomy at a bare node id.
class TestNameThenFill {
        const std::string dir;
        const Domain domain;
    public:
        TestNameThenFill(const std::string & d, Domain dom)
            :dir(d),
            domain(dom) {
        }
        char runTest(const TestHarness & th) const {
            std::ifstream inp;
            if (!th.open_test_file(dir + "/reference_taxonomy.tsv", inp)) {
                return 'U';
            }
            const auto tree = read_tree_table(th.get_filepath(dir + "/tree.tsv"));
            const auto metadata = read_genome_metadata(th.get_filepath(dir + "/metadata.tsv"));
            const auto reference = read_reference_taxonomy(th.get_filepath(dir + "/reference_taxonomy.tsv"));
            const auto named = name_clades(tree, metadata, RankCutoffTable(domain));
            const auto filled = fill_taxonomy(tree, named, reference);
            for (const auto & gt : filled.genomes) {
                if (!starts_with(gt.taxonomy, domain_to_string(domain) + ";")) {
                    std::cerr << "  " << dir << ": " << gt << '\n';
                    return 'F';
                }
            }
            const auto expected_genomes = read_genome_taxonomy(th.get_filepath(dir + "/expected_filled_genomes.tsv"));
            const auto expected_nodes = read_node_names(th.get_filepath(dir + "/expected_filled_nodes.tsv"));
            bool ok = test_vec_element_equality(expected_genomes, filled.genomes);
            ok = test_vec_element_equality(expected_nodes, filled.nodes) && ok;
            return (ok ? '.' : 'F');
        }
};

namespace {
const char * mixed_tree =
    "parent\tnode\tnongtdb_group\tgenome\tmagset\tRED\tnovelty_red\n"
    "10\t1\tgtdb\tGB_1\tNA\tNA\tNA\n"
    "10\t2\tgtdb\tGB_2\tNA\tNA\tNA\n"
    "10\t3\tgtdb\tGB_3\tNA\tNA\tNA\n"
    "10\t4\tnongtdb\tbin_a\tbinchicken\tNA\tNA\n"
    "20\t5\tnongtdb\tbin_b\tbinchicken\tNA\tNA\n"
    "20\t10\tgtdb\tNA\tNA\t0.7\tFamily (0.62-0.82]\n"
    "20\t20\tgtdb\tNA\tNA\t0.3\tPhylum (0-0.28]\n";

const char * mixed_reference =
    "GB_1\td__Bacteria;p__P;c__C;o__O2;f__F2;g__G2;s__G2 one\n"
    "GB_2\td__Bacteria;p__P;c__C;o__O1;f__F1;g__G1;s__G1 two\n"
    "GB_3\td__Bacteria;p__P;c__C;o__O1;f__F1;g__G1;s__G1 three\n";

TreeTable mixed_table() {
    std::istringstream inp(mixed_tree);
    return read_tree_table(inp, "mixed");
}

ReferenceTaxonomyMap mixed_map() {
    std::istringstream inp(mixed_reference);
    return read_reference_taxonomy(inp, "reference");
}
}

char testMajorityPrefix(const TestHarness &) {
    NamingResult named;
    named.genomes.push_back(GenomeTaxonomy{"bin_a", "10;g__bin_a;s__bin_a bin_a"});
    named.genomes.push_back(GenomeTaxonomy{"bin_c", "d__Bacteria;p__X;c__X;o__X;f__X;g__X;s__X bin_c"});
    named.nodes.push_back(NodeNaming{NodeId{4}, "g__bin_a", "bin_a"});
    const auto filled = fill_taxonomy(mixed_table(), named, mixed_map());
    std::vector<GenomeTaxonomy> expected{
        {"bin_a", "d__Bacteria;p__P;c__C;o__O1;f__F1;g__bin_a;s__bin_a bin_a"},
        {"bin_c", "d__Bacteria;p__X;c__X;o__X;f__X;g__X;s__X bin_c"}
    };
    if (!test_vec_element_equality(expected, filled.genomes)) {
        return 'F';
    }
    return (test_vec_element_equality(named.nodes, filled.nodes) ? '.' : 'F');
}

// A tie between two prefixes goes to the smaller string.
char testMajorityTie(const TestHarness &) {
    std::istringstream inp("GB_1\td__Bacteria;p__P;c__C;o__O2;f__F2;g__G2;s__G2 one\n"
                           "GB_2\td__Bacteria;p__P;c__C;o__O1;f__F1;g__G1;s__G1 two\n");
    const auto reference = read_reference_taxonomy(inp, "tied");
    NamingResult named;
    named.genomes.push_back(GenomeTaxonomy{"bin_b", "10"});
    const auto filled = fill_taxonomy(mixed_table(), named, reference);
    std::vector<GenomeTaxonomy> expected{
        {"bin_b", "d__Bacteria;p__P;c__C;o__O1;f__F1;g__G1;s__G1 bin_b"}
    };
    std::vector<NodeNaming> expected_nodes{NodeNaming{std::nullopt, "s__G1 bin_b", "bin_b"}};
    if (!test_vec_element_equality(expected, filled.genomes)) {
        return 'F';
    }
    return (test_vec_element_equality(expected_nodes, filled.nodes) ? '.' : 'F');
}

char testNoReferenceDescendant(const TestHarness &) {
    NamingResult named;
    named.genomes.push_back(GenomeTaxonomy{"bin_a", "4;g__bin_a;s__bin_a bin_a"});
    try {
        fill_taxonomy(mixed_table(), named, mixed_map());
        return 'F';
    } catch (const NoReferenceDescendantError & x) {
        if (x.node_id != 4) {
            return 'F';
        }
    }
    named.genomes[0].taxonomy = "77;g__bin_a;s__bin_a bin_a";
    try {
        fill_taxonomy(mixed_table(), named, mixed_map());
        return 'F';
    } catch (const MissingNodeError & x) {
        return (x.node_id == 77 ? '.' : 'F');
    }
}

char testBadReferenceTable(const TestHarness &) {
    for (const auto & table : {"GB_1\td__Bacteria\nGB_1\td__Bacteria\n", "GB_1 d__Bacteria\n", "GB_1\ta\tb\n"}) {
        std::istringstream inp(table);
        try {
            read_reference_taxonomy(inp, "bad");
            return 'F';
        } catch (const CLNError &) {
        }
    }
    return '.';
}

int main(int argc, char *argv[]) {
    TestHarness th(argc, argv);
    TestsVec tests{TestFn("testFillFromReference", testFillFromReference)
                   , TestFn("testMajorityPrefix", testMajorityPrefix)
                   , TestFn("testMajorityTie", testMajorityTie)
                   , TestFn("testNoReferenceDescendant", testNoReferenceDescendant)
                   , TestFn("testBadReferenceTable", testBadReferenceTable)
                  };
    for (const auto & sc : {std::make_pair("reference_full", DOMAIN_BACTERIA),
                            std::make_pair("reference_truncate", DOMAIN_ARCHAEA),
                            std::make_pair("reference_truncate_early", DOMAIN_ARCHAEA)}) {
        TestNameThenFill t(sc.first, sc.second);
        tests.push_back(TestFn(std::string("test_name_then_fill_") + sc.first,
                               [t](const TestHarness & h) { return t.runTest(h); }));
    }
    return th.run_tests(tests);
}
