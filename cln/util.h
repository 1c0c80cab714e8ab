#ifndef CLADENAMER_UTIL_H
#define CLADENAMER_UTIL_H

#include <iostream>
#include <fstream>
#include <string>
#include <map>
#include <set>
#include <vector>
#include <algorithm>
#include <iterator>
#include <optional>
#include "cln/cln_base_includes.h"
#include "cln/error.h"

namespace cln {

bool open_utf8_file(const std::string &filepath, std::ifstream & inp);

bool char_ptr_to_long(const char *c, long *n);
bool char_ptr_to_double(const char *c, double *n);
std::size_t find_first_graph_index(const std::string & s);
std::size_t find_last_graph_index(const std::string & s);
std::string strip_surrounding_whitespace(const std::string &n);
std::string to_lower(std::string s);
// w/o delimiter split_string splits on whitespace and does not return empty 
//  elements. With the delimiter, consecutive delimiters will lead to an empty string
std::vector<std::string> split_string(const std::string &s);
std::vector<std::string> split_string(const std::string &s, const char delimiter);
std::string join_strings(const std::vector<std::string> & words, const std::string & sep);
bool starts_with(const std::string & s, const std::string & prefix);

template<typename T, typename U>
bool contains(const T & container, const U & key);

template<typename T, typename U>
inline bool contains(const T & container, const U & key) {
    return container.find(key) != container.end();
}

inline std::size_t find_first_graph_index(const std::string & s) {
    std::size_t pos = 0U;
    for (const auto & c : s) {
        if (isgraph(c)) {
            return pos;
        }
        ++pos;
    }
    return std::string::npos;
}

inline std::size_t find_last_graph_index(const std::string & s) {
    auto pos = s.length();
    while (pos > 0) {
        --pos;
        if (isgraph(s[pos])) {
            return pos;
        }
    }
    return std::string::npos;
}

inline std::string strip_surrounding_whitespace(const std::string &n) {
    const auto s = find_first_graph_index(n);
    if (s == std::string::npos) {
        return std::string();
    }
    const auto e = find_last_graph_index(n);
    BOOST_ASSERT(e != std::string::npos);
    return n.substr(s, 1 + e - s);
}

inline bool starts_with(const std::string & s, const std::string & prefix) {
    return s.compare(0, prefix.length(), prefix) == 0;
}

} // namespace cln
#endif
