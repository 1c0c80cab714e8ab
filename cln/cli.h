#if !defined CLADENAMER_CLI_H
#define CLADENAMER_CLI_H
#include <string>
#include <vector>
#include "cln/cln_base_includes.h"
#include <boost/program_options.hpp>

namespace cln {

enum class LogVerbosity {
    QUIET,   // -q: nothing is logged
    NORMAL,  // INFO and above
    VERBOSE, // -v: adds DEBUG (per-genome decisions)
    TRACE    // -t: adds TRACE (per-ancestor walk steps)
};

// What an executable accepts. `required` names options that must be given
//  unless help was requested.
struct CommandLineOptions {
    std::string usage;
    boost::program_options::options_description visible;
    boost::program_options::options_description hidden;
    boost::program_options::positional_options_description positional;
    std::vector<std::string> required;
};

struct CommandLine {
    bool help_shown = false;
    LogVerbosity verbosity = LogVerbosity::NORMAL;
    boost::program_options::variables_map args;
};

// -h, -f <file>, -q, -v and -t.
boost::program_options::options_description general_options();

// Throws CLNError if -q is combined with -v or -t.
LogVerbosity verbosity_from_args(const boost::program_options::variables_map & vm);
void configure_logging(LogVerbosity verbosity);

// Whitespace separated words of a response file. Lines starting with '#' are skipped.
std::vector<std::string> read_response_file(const std::string & filepath);

// Words given on the command line take precedence over those of the response
//  file. With -h the usage is written to `help_out` and nothing else is checked.
CommandLine parse_command_line(int argc,
                               char * argv[],
                               const CommandLineOptions & options,
                               std::ostream & help_out = std::cout);

} // namespace cln
#endif
