#pragma once
// ComboErrors.hpp
// Exception types thrown by the lexicon index, the initials codec and the combo search.
// Everything derives from ComboError so transports can map one base type to a client error.

#include <stdexcept>
#include <string>

class ComboError : public std::runtime_error {
public:
    explicit ComboError(const std::string& message) : std::runtime_error(message) {}

    // Short machine readable tag ("invalid_parameter", ...)
    virtual const char* kind() const noexcept { return "combo_error"; }
};

// Malformed beam width, result count, branch limit or target unit
class InvalidParameterError : public ComboError {
public:
    explicit InvalidParameterError(const std::string& message) : ComboError(message) {}
    const char* kind() const noexcept override { return "invalid_parameter"; }
};

// Raised for an empty target when the empty-target policy is Reject
class EmptyTargetError : public ComboError {
public:
    explicit EmptyTargetError(const std::string& message) : ComboError(message) {}
    const char* kind() const noexcept override { return "empty_target"; }
};

// A character that cannot be turned into an initial-unit
class UnsupportedCharacterError : public ComboError {
public:
    UnsupportedCharacterError(const std::string& message, char32_t code_point)
        : ComboError(message), code_point_(code_point) {}

    const char* kind() const noexcept override { return "unsupported_character"; }
    char32_t code_point() const noexcept { return code_point_; }

private:
    char32_t code_point_;
};

// Two records for the same (word, source) pair disagree and the policy forbids merging them
class DuplicateSourceConflictError : public ComboError {
public:
    DuplicateSourceConflictError(const std::string& word, const std::string& source)
        : ComboError("conflicting duplicate entry for word '" + word + "' from source '" + source + "'"),
          word_(word), source_(source) {}

    const char* kind() const noexcept override { return "duplicate_source_conflict"; }
    const std::string& word() const noexcept { return word_; }
    const std::string& source() const noexcept { return source_; }

private:
    std::string word_;
    std::string source_;
};
