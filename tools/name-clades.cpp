#include <iostream>
#include <fstream>
#include <exception>
#include <string>
#include <set>
#include <vector>
#include <boost/program_options.hpp>
#include <boost/filesystem/operations.hpp>
#include <nlohmann/json.hpp>

#include "cln/error.h"
#include "cln/cli.h"
#include "cln/config_file.h"
#include "cln/util.h"
#include "cln/tree_table.h"
#include "cln/genome_quality.h"
#include "cln/taxonomy/red_cutoffs.h"
#include "cln/naming/naming_tables.h"
#include "cln/naming/name_clades.h"
#include "cln/naming/fill_taxonomy.h"

using namespace cln;

using std::string;
using std::vector;
using std::set;
using std::cerr;
using std::endl;
using std::optional;
using json = nlohmann::json;

namespace po = boost::program_options;
namespace fs = boost::filesystem;
using po::variables_map;

static const string config_section = "name-clades";

void check_output_dir(const string & out_dir) {
    if (fs::exists(out_dir) and not fs::is_directory(out_dir)) {
        throw CLNError() << "Output path \"" << out_dir << "\" exists and is not a directory.";
    }
}

CommandLine parse_cmd_line(int argc, char* argv[]) {
    using namespace po;

    options_description inputs("Input options");
    inputs.add_options()
        ("tree-df", value<string>(), "Filepath to the annotated tree table (TSV)")
        ("metadata", value<string>(), "Filepath to the genome metadata table (TSV)")
        ("gtdb", value<string>(), "Filepath to the reference taxonomy (genome<TAB>taxonomy, no header)")
        ;

    options_description naming("Naming options");
    naming.add_options()
        ("config,c", value<string>(), "INI config file with a [name-clades] section")
        ("domain", value<string>(), "d__Bacteria (default) or d__Archaea")
        ("red-cutoffs", value<vector<string>>()->multitoken(), "Median RED of phylum, class, order, family and genus")
        ;

    options_description output("Output options");
    output.add_options()
        ("output", value<string>()->notifier(check_output_dir), "Directory for genome_taxonomy.tsv and node_names.tsv")
        ("json,j", value<string>(), "filepath to an output JSON run summary")
        ;

    CommandLineOptions options;
    options.usage = "Usage: name-clades --tree-df <tsv> --metadata <tsv> --gtdb <tsv> --output <dir> [OPTIONS]\n"
                    "Name the novel clades of an annotated tree and assign a taxonomy to each query genome.";
    options.visible.add(inputs).add(naming).add(output).add(general_options());
    options.required = {"tree-df", "metadata", "gtdb", "output"};
    return parse_command_line(argc, argv, options);
}

vector<string> config_files(const variables_map & args) {
    vector<string> files;
    if (args.count("config")) {
        files.push_back(args["config"].as<string>());
    }
    if (auto dot = dot_cladenamer()) {
        files.push_back(*dot);
    }
    return files;
}

RankCutoffTable cutoffs_from_args(const variables_map & args) {
    auto files = config_files(args);
    string domain_name = "d__Bacteria";
    if (args.count("domain")) {
        domain_name = args["domain"].as<string>();
    } else if (auto from_config = load_config(files, config_section, "domain")) {
        domain_name = strip_surrounding_whitespace(*from_config);
    }
    Domain domain = string_to_domain(domain_name);
    optional<vector<double>> medians;
    if (args.count("red-cutoffs")) {
        medians = RankCutoffTable::parse_medians(args["red-cutoffs"].as<vector<string>>());
    } else if (auto from_config = load_config(files, config_section, "red_cutoffs")) {
        medians = RankCutoffTable::parse_medians(vector<string>{*from_config});
    }
    if (medians) {
        return RankCutoffTable(domain, *medians);
    }
    return RankCutoffTable(domain);
}

bool awaits_reference(const GenomeTaxonomy & gt) {
    return not starts_with(gt.taxonomy, "d__");
}

void write_summary(std::ofstream & out,
                   const RankCutoffTable & cutoffs,
                   const NamingResult & named,
                   const NamingResult & completed) {
    std::size_t num_terminated = 0;
    set<string> reference_nodes;
    for (const auto & gt : named.genomes) {
        if (awaits_reference(gt)) {
            ++num_terminated;
            reference_nodes.insert(gt.taxonomy.substr(0, gt.taxonomy.find(';')));
        }
    }
    json document;
    document["genomes"] = completed.genomes.size();
    document["named_nodes"] = completed.nodes.size();
    document["reference_terminated"] = num_terminated;
    document["completed_from_reference"] = reference_nodes.size();
    document["domain"] = domain_to_string(cutoffs.get_domain());
    json medians = json::array();
    for (auto m : cutoffs.configurable_medians()) {
        medians.push_back(m);
    }
    document["red_cutoffs"] = medians;
    out << document.dump(1) << std::endl;
}

int main(int argc, char* argv[]) {
    std::ios::sync_with_stdio(false);
    std::ofstream jlogf;
    std::ofstream * json_log = nullptr;
    try {
        const CommandLine cl = parse_cmd_line(argc, argv);
        if (cl.help_shown) {
            return 0;
        }
        const variables_map & args = cl.args;
        if (args.count("json")) {
            string jf = args["json"].as<string>();
            jlogf.open(jf);
            if (!jlogf.good()) {
                throw CLNError() << "Could not open JSON log file at \"" << jf << "\"";
            }
            json_log = &jlogf;
        }
        const string tree_fp = args["tree-df"].as<string>();
        const string metadata_fp = args["metadata"].as<string>();
        const string reference_fp = args["gtdb"].as<string>();
        const string out_dir = args["output"].as<string>();
        const RankCutoffTable cutoffs = cutoffs_from_args(args);

        LOG(INFO) << "reading tree table from " << tree_fp;
        const TreeTable tree = read_tree_table(tree_fp);
        LOG(INFO) << "reading genome metadata from " << metadata_fp;
        const GenomeMetadataMap metadata = read_genome_metadata(metadata_fp);
        LOG(INFO) << "reading reference taxonomy from " << reference_fp;
        const ReferenceTaxonomyMap reference = read_reference_taxonomy(reference_fp);

        LOG(INFO) << "naming clades for domain " << domain_to_string(cutoffs.get_domain());
        const NamingResult named = name_clades(tree, metadata, cutoffs);
        LOG(INFO) << "completing reference-terminated taxonomies";
        const NamingResult completed = fill_taxonomy(tree, named, reference);

        if (not fs::exists(out_dir)) {
            fs::create_directories(out_dir);
        }
        const fs::path out_path(out_dir);
        write_genome_taxonomy((out_path / "genome_taxonomy.tsv").string(), completed.genomes);
        write_node_names((out_path / "node_names.tsv").string(), completed.nodes);
        if (json_log) {
            write_summary(*json_log, cutoffs, named, completed);
        }
    } catch (std::exception& e) {
        cerr << "name-clades: Error! " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
