#ifndef CLADENAMER_ERROR_H
#define CLADENAMER_ERROR_H
#include <string>
#include <exception>
#include <sstream>

namespace cln {

class CLNError : public std::exception {
    protected:
    std::string message;
    public:
    const char * what() const noexcept {
        return message.c_str();
    }
    template <typename T> CLNError& operator<<(const T&);
    void prepend(const std::string& s) {
        message = s + message;
    }
    CLNError() noexcept {}
    CLNError(const std::string & msg) noexcept :message(msg) {}
};

template <typename T>
CLNError& CLNError::operator<<(const T& t) {
  std::ostringstream oss;
  oss << message << t;
  message = oss.str();
  return *this;
}

// A parent id in the tree table that has no row of its own.
class MissingNodeError : public CLNError {
    public:
    const long node_id;
    explicit MissingNodeError(long nd)
        :CLNError(),
        node_id(nd) {
        *this << "Node " << nd << " is referenced in the tree but has no row of its own.";
    }
};

class MissingMetadataError : public CLNError {
    public:
    const std::string genome;
    explicit MissingMetadataError(const std::string & g)
        :CLNError(),
        genome(g) {
        *this << "Genome \"" << g << "\" is not present in the genome metadata.";
    }
};

// A reference-terminated node with no reference-classified leaf below it.
class NoReferenceDescendantError : public CLNError {
    public:
    const long node_id;
    explicit NoReferenceDescendantError(long nd)
        :CLNError(),
        node_id(nd) {
        *this << "No reference taxonomy found among the descendants of node " << nd << ".";
    }
};

class UnrecognizedNoveltyLabelError : public CLNError {
    public:
    const std::string label;
    explicit UnrecognizedNoveltyLabelError(const std::string & lab)
        :CLNError(),
        label(lab) {
        *this << "Novelty label \"" << lab << "\" does not name a recognized rank.";
    }
    UnrecognizedNoveltyLabelError(const std::string & lab, const std::string & context)
        :CLNError(),
        label(lab) {
        *this << context;
    }
};

} //namespace cln
#endif
