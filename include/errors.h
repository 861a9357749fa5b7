// include/errors.h
#pragma once
#include <stdexcept>
#include <string>

// Bad digits / period / algorithm / window / retention. Thrown at construction.
class InvalidParameter : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

// Base32 input contains a character outside the alphabet.
class InvalidCharacter : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Credential store could not produce the secret for a principal.
class SecretUnavailable : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Disk state (replay records, secret files) could not be read, locked or written.
class PersistenceFailure : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};
