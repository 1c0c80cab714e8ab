#include "cln/test_harness.h"
#include "cln/cli.h"

namespace po = boost::program_options;
using std::string;
using std::vector;

namespace cln {

TestHarness::TestHarness(int argc, char *argv[])
    :initFailed(true) {
    CommandLineOptions options;
    options.usage = string("Usage: ") + argv[0] + " [OPTIONS] path/to/a/data/dir";
    options.visible.add(general_options());
    options.hidden.add_options()
        ("data-dir", po::value<vector<string>>(), "directory holding the test tables")
        ;
    options.positional.add("data-dir", -1);
    options.required.push_back("data-dir");
    try {
        const auto cl = parse_command_line(argc, argv, options, std::cerr);
        if (cl.help_shown) {
            return;
        }
        const auto & dirs = cl.args["data-dir"].as<vector<string>>();
        if (dirs.size() != 1) {
            std::cerr << "path to data file dir is required as the only argument.\n";
        } else {
            dataDir = dirs[0];
            initFailed = false;
        }
    } catch (const std::exception & x) {
        std::cerr << argv[0] << ": " << x.what() << '\n';
    }
}

int TestHarness::run_tests(const TestsVec & tests) {
    if (this->initFailed) {
        std::cerr << "ERROR: " << tests.size() << " unavailable due to incorrect initialization of the TestHarness.\n";
        return static_cast<int>(tests.size());
    }
    std::vector<std::string> failures;
    for (const auto & tpIt : tests) {
        const auto & fn = tpIt.second;
        char resp;
        try {
            resp = fn(*this);
        } catch (std::exception & x) {
            std::cerr << "exception in " << tpIt.first << ": " << x.what() << '\n';
            resp = 'E';
        }
        std::cerr << resp;
        if (resp != '.') {
            failures.push_back(tpIt.first);
        }
    }
    std::cerr << '\n';
    for (const auto & f : failures) {
        std::cerr << f << '\n';
    }
    if (!failures.empty()) {
        std::cerr << "FAILED " << failures.size() << "/" << tests.size() << " tests.\n";
    }
    return static_cast<int>(failures.size());
}

} // namespace cln
