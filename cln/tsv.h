#ifndef CLADENAMER_TSV_H
#define CLADENAMER_TSV_H

#include <iostream>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "cln/error.h"

namespace cln {

// Column lookup for a tab-separated table with a header line.
class TsvHeader {
    public:
    TsvHeader(const std::string & header_line, const std::string & table_name);

    // Index of the first of `aliases` present in the header.
    std::optional<std::size_t> find(const std::vector<std::string> & aliases) const;
    // As find, but throws if none of `aliases` is present.
    std::size_t require(const std::vector<std::string> & aliases) const;
    std::size_t size() const {
        return names.size();
    }
    const std::string & get_table_name() const {
        return table_name;
    }
    private:
    std::vector<std::string> names;
    std::unordered_map<std::string, std::size_t> name_to_index;
    std::string table_name;
};

// Splits one line of a table on tabs. A trailing '\r' is removed first.
std::vector<std::string> split_tsv_line(const std::string & line);

// "NA" and empty fields are null. An absent column reads as null.
std::optional<std::string> field_or_null(const std::vector<std::string> & words,
                                         std::optional<std::size_t> col);

long parse_long_field(const std::string & word,
                      const std::string & column,
                      const std::string & table_name,
                      unsigned int line_num);

double parse_double_field(const std::string & word,
                          const std::string & column,
                          const std::string & table_name,
                          unsigned int line_num);

} // namespace cln
#endif
