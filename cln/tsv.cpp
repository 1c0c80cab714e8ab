#include "cln/tsv.h"
#include "cln/util.h"

using std::string;
using std::vector;

namespace cln {

TsvHeader::TsvHeader(const string & header_line, const string & tname)
    :names(split_tsv_line(header_line)),
    table_name(tname) {
    for (std::size_t i = 0; i < names.size(); ++i) {
        const auto n = strip_surrounding_whitespace(names[i]);
        names[i] = n;
        if (name_to_index.count(n) == 0) {
            name_to_index[n] = i;
        }
    }
}

std::optional<std::size_t> TsvHeader::find(const vector<string> & aliases) const {
    for (const auto & a : aliases) {
        auto i = name_to_index.find(a);
        if (i != name_to_index.end()) {
            return i->second;
        }
    }
    return std::nullopt;
}

std::size_t TsvHeader::require(const vector<string> & aliases) const {
    auto i = find(aliases);
    if (not i) {
        throw CLNError() << "Expecting a \"" << join_strings(aliases, "\" or \"")
                         << "\" column in the header of " << table_name << ".";
    }
    return *i;
}

vector<string> split_tsv_line(const string & line) {
    if (!line.empty() && line.back() == '\r') {
        return split_string(line.substr(0, line.length() - 1), '\t');
    }
    return split_string(line, '\t');
}

std::optional<string> field_or_null(const vector<string> & words, std::optional<std::size_t> col) {
    if (not col or *col >= words.size()) {
        return std::nullopt;
    }
    const auto w = strip_surrounding_whitespace(words[*col]);
    if (w.empty() or w == "NA") {
        return std::nullopt;
    }
    return w;
}

long parse_long_field(const string & word,
                      const string & column,
                      const string & table_name,
                      unsigned int line_num) {
    long v;
    const auto w = strip_surrounding_whitespace(word);
    if (!char_ptr_to_long(w.c_str(), &v)) {
        throw CLNError() << "Expecting an integer in the \"" << column << "\" column of "
                         << table_name << ". Found \"" << word << "\" on line " << line_num;
    }
    return v;
}

double parse_double_field(const string & word,
                          const string & column,
                          const string & table_name,
                          unsigned int line_num) {
    double v;
    const auto w = strip_surrounding_whitespace(word);
    if (!char_ptr_to_double(w.c_str(), &v)) {
        throw CLNError() << "Expecting a number in the \"" << column << "\" column of "
                         << table_name << ". Found \"" << word << "\" on line " << line_num;
    }
    return v;
}

} // namespace cln
