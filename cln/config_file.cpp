#include "cln/config_file.h"
#include <cstdlib>
#include <regex>
#include <fstream>
#include "cln/error.h"
#include <boost/property_tree/ini_parser.hpp>
#include <boost/filesystem/operations.hpp>

namespace fs = boost::filesystem;

using std::string;
using std::size_t;
using std::vector;
using std::optional;
using boost::property_tree::ptree;

namespace cln {

// Expands %(key)s references to other keys of the same section, and %% to %.
optional<string> interpolate(const ptree& pt, const string& section_name, const string& key) {
    static std::regex KEYCRE ("%\\(([^)]+)\\)s");
    if (not pt.get_child_optional(section_name)) {
        return {};
    }
    const ptree& section = pt.get_child(section_name);
    if (not section.get_optional<string>(key)) {
        return {};
    }
    string value = section.get<string>(key);
    for (int i = 0; i < 20 and value.find('%') != string::npos; i++) {
        string expanded;
        size_t p1 = 0U;
        size_t p2 = 0U;
        while (p1 < value.size()) {
            p2 = value.find('%', p1);
            if (p2 == string::npos) {
                p2 = value.size();
            }
            expanded += value.substr(p1, p2 - p1);
            if (p2 == value.size()) {
                break;
            }
            if (p2 + 1 >= value.size()) {
                throw CLNError() << "Found '%' at end of config value for '" << key << "'";
            }
            char c = value[p2 + 1];
            if (c == '%') {
                expanded += "%";
                p1 = p2 + 2;
            } else if (c == '(') {
                std::cmatch m;
                bool matched = std::regex_search(value.c_str() + p2, value.c_str() + value.size(), m, KEYCRE,
                                                 std::regex_constants::match_continuous);
                if (not matched) {
                    throw CLNError() << "Bad interpolation variable reference: '" << value.substr(p2) << "'";
                }
                string name = m[1];
                if (not section.get_optional<string>(name)) {
                    throw CLNError() << "Reference to undefined key '" << name << "' in " << key << " = " << value;
                }
                expanded += section.get<string>(name);
                p1 = p2 + m.length(0);
            } else {
                throw CLNError() << "Bad interpolation variable reference: '" << value.substr(p2) << "'";
            }
        }
        value = expanded;
    }
    return value;
}

optional<string> load_config(const string& filename, const string& section, const string& name) {
    if (not fs::exists(filename)) {
        throw CLNError() << "Config file '" << filename << "' does not exist.";
    }
    ptree pt;
    try {
        boost::property_tree::ini_parser::read_ini(filename, pt);
    } catch (const boost::property_tree::ini_parser_error & x) {
        throw CLNError() << "Could not parse config file '" << filename << "': " << x.message()
                         << " (line " << x.line() << ")";
    }
    return interpolate(pt, section, name);
}

optional<string> load_config(const vector<string>& filenames, const string& section, const string& name) {
    for (const auto& filename: filenames) {
        auto result = load_config(filename, section, name);
        if (result) {
            return result;
        }
    }
    return {};
}

optional<string> dot_cladenamer() {
    auto homedir = std::getenv("HOME");
    if (not homedir) {
        return {};
    }
    string path = homedir;
    path += "/.cladenamer";
    std::ifstream test(path);
    if (not test) {
        return {};
    }
    return path;
}

} // namespace cln
