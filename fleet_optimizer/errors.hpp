#pragma once
#include <stdexcept>
#include <string>

// Request could not be decoded or breaks a data model invariant.
struct ValidationError : std::runtime_error {
    explicit ValidationError(const std::string& what) : std::runtime_error(what) {}
};

// Unexpected failure inside assignment or sequencing.
struct ComputationError : std::runtime_error {
    explicit ComputationError(const std::string& what) : std::runtime_error(what) {}
};
