#ifndef LATTICE_ERRORS_H
#define LATTICE_ERRORS_H

#include <stdexcept>
#include <string>

// Operation called on an object that is not in a state to answer it
// (unplaced link, correction on a pruned chain)
class InvalidStateError : public std::logic_error {
public:
    explicit InvalidStateError(const std::string& what) : std::logic_error(what) {}
};

// Explicit append would revisit a site or detach from the chain ends.
// The chain is left untouched when this is thrown.
class SelfIntersectionError : public std::runtime_error {
public:
    explicit SelfIntersectionError(const std::string& what) : std::runtime_error(what) {}
};

#endif
