#include "cln/cli.h"
#include <fstream>
#include <iostream>
#include <boost/tokenizer.hpp>
#include "cln/error.h"
#include "cln/util.h"

///////////////////////////////////////////////////////////////
#pragma clang diagnostic push
#pragma clang diagnostic ignored  "-Wglobal-constructors"
#pragma clang diagnostic ignored  "-Wexit-time-destructors"
INITIALIZE_EASYLOGGINGPP
#pragma clang diagnostic pop
///////////////////////////////////////////////////////////////

namespace po = boost::program_options;
using std::string;
using std::vector;

namespace cln {

po::options_description general_options() {
    po::options_description general("General options");
    general.add_options()
        ("help,h", "Print this message and exit")
        ("response-file,f", po::value<string>(), "Read further arguments from file <arg>")
        ("quiet,q", "Disable all logging")
        ("verbose,v", "Log the taxonomy decisions made for each genome")
        ("trace,t", "Log every ancestor visited (very noisy)")
        ;
    return general;
}

LogVerbosity verbosity_from_args(const po::variables_map & vm) {
    if (vm.count("quiet")) {
        if (vm.count("verbose") or vm.count("trace")) {
            throw CLNError() << "-q cannot be combined with -v or -t.";
        }
        return LogVerbosity::QUIET;
    }
    if (vm.count("trace")) {
        return LogVerbosity::TRACE;
    }
    return (vm.count("verbose") ? LogVerbosity::VERBOSE : LogVerbosity::NORMAL);
}

void configure_logging(LogVerbosity verbosity) {
    el::Configurations conf;
    conf.setToDefault();
    const auto enabled = [&conf](el::Level level, bool on) {
        conf.set(level, el::ConfigurationType::Enabled, (on ? "true" : "false"));
    };
    if (verbosity == LogVerbosity::QUIET) {
        enabled(el::Level::Global, false);
    } else {
        enabled(el::Level::Debug, verbosity != LogVerbosity::NORMAL);
        enabled(el::Level::Trace, verbosity == LogVerbosity::TRACE);
    }
    el::Loggers::reconfigureLogger("default", conf);
}

vector<string> read_response_file(const string & filepath) {
    std::ifstream inp;
    if (!open_utf8_file(filepath, inp)) {
        throw CLNError() << "Could not open the response file \"" << filepath << "\".";
    }
    const boost::char_separator<char> sep(" \t\r");
    vector<string> words;
    for (string line; getline(inp, line);) {
        if (starts_with(strip_surrounding_whitespace(line), "#")) {
            continue;
        }
        boost::tokenizer<boost::char_separator<char>> tok(line, sep);
        words.insert(words.end(), tok.begin(), tok.end());
    }
    return words;
}

CommandLine parse_command_line(int argc,
                               char * argv[],
                               const CommandLineOptions & options,
                               std::ostream & help_out) {
    po::options_description all;
    all.add(options.visible).add(options.hidden);
    CommandLine cl;
    po::store(po::command_line_parser(argc, argv).options(all).positional(options.positional).run(), cl.args);
    if (cl.args.count("response-file")) {
        const auto words = read_response_file(cl.args["response-file"].as<string>());
        // store() keeps values that are already set, so argv wins
        po::store(po::command_line_parser(words).options(all).positional(options.positional).run(), cl.args);
    }
    if (cl.args.count("help")) {
        help_out << options.usage << "\n\n" << options.visible << "\n";
        cl.help_shown = true;
        return cl;
    }
    po::notify(cl.args);
    for (const auto & name : options.required) {
        if (not cl.args.count(name)) {
            throw CLNError() << "The --" << name << " option is required.";
        }
    }
    cl.verbosity = verbosity_from_args(cl.args);
    configure_logging(cl.verbosity);
    return cl;
}

} // namespace cln
