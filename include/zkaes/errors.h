// errors.h
#pragma once
#include <stdexcept>
#include <string>

namespace zkaes {

// Caller handed us malformed input (wrong key length, bad hex, ...).
class InputError : public std::invalid_argument {
public:
    explicit InputError(const std::string& what) : std::invalid_argument(what) {}
};

// A constraint was declared inconsistently. Always a bug in circuit construction.
class SynthesisError : public std::logic_error {
public:
    explicit SynthesisError(const std::string& what) : std::logic_error(what) {}
};

} // namespace zkaes
