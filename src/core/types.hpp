#pragma once

#include <string>
#include <map>
#include <vector>
#include <utility>

// Result type for operations that can fail
template <typename T>
struct Result {
    bool success;
    T value;
    std::string error;

    static Result<T> Ok(T val) {
        return {true, std::move(val), ""};
    }

    static Result<T> Err(const std::string& err) {
        return {false, T{}, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Specialization for void
template <>
struct Result<void> {
    bool success;
    std::string error;

    static Result<void> Ok() {
        return {true, ""};
    }

    static Result<void> Err(const std::string& err) {
        return {false, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Variable name -> value, used both as a resolution source and as the
// final substitution set handed to the materializer.
using VariableMap = std::map<std::string, std::string>;

// Ordered key/value list where declaration order matters for display
// (template variables, config listing).
using OrderedPairs = std::vector<std::pair<std::string, std::string>>;
