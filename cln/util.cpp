#include <cctype>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

#include "cln/util.h"

namespace cln {

bool open_utf8_file(const std::string &filepath, std::ifstream & inp) {
    inp.open(filepath);
    return inp.good();
}

/*!
    Returns true if `o` points to a string that represents a long (and `o` has no other characters than the long).
    if n is not NULL, then when the function returns true, *n will be the long.
*/
bool char_ptr_to_long(const char *o, long *n) {
    if (o == nullptr or *o == '\0') {
        return false;
    }
    if (strchr("0123456789-+", *o) != nullptr) {
        char * pEnd;
        const long i = strtol(o, &pEnd, 10);
        if (*pEnd != '\0') {
            return false;
        }
        if (n != NULL) {
            *n = i;
        }
        return true;
    }
    return false;
}

// Same contract as char_ptr_to_long. Leading whitespace and the empty string are rejected.
bool char_ptr_to_double(const char *o, double *n) {
    if (o == nullptr or *o == '\0' or isspace(*o)) {
        return false;
    }
    char * pEnd;
    const double d = strtod(o, &pEnd);
    if (*pEnd != '\0') {
        return false;
    }
    if (n != NULL) {
        *n = d;
    }
    return true;
}

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

// splits a string by whitespace and push the graphical strings to the back of r.
//  Leading and trailing whitespace is lost ( there will be no empty strings added
//      to the list.
std::vector<std::string> split_string(const std::string &s) {
    std::vector<std::string> r;
    std::string word;
    for (const auto & c : s) {
        if (isgraph(c)) {
            word.append(1, c);
        } else if (not word.empty()) {
            r.push_back(word);
            word.clear();
        }
    }
    if (not word.empty()) {
        r.push_back(word);
    }
    return r;
}

std::vector<std::string> split_string(const std::string &s, const char delimiter) {
    if (s.empty()) {
        return {};
    }
    std::vector<std::string> r;
    r.push_back({});
    for (const auto & c : s) {
        if (c == delimiter) {
            r.push_back({});
        } else {
            r.back().append(1, c);
        }
    }
    return r;
}

std::string join_strings(const std::vector<std::string> & words, const std::string & sep) {
    std::string r;
    bool first = true;
    for (const auto & w : words) {
        if (not first) {
            r += sep;
        }
        r += w;
        first = false;
    }
    return r;
}

}//namespace cln
