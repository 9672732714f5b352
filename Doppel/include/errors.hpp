//
// errors.hpp
// Exception types shared by the hashing pipeline, index I/O and search engine
//

#pragma once

#include <stdexcept>
#include <string>

namespace doppel {

// A single file could not be decoded or fingerprinted. Always recovered by the pipeline.
class DecodeError : public std::runtime_error {
public:
    explicit DecodeError(const std::string& message) : std::runtime_error(message) {}
};

// Persisted index content that cannot be trusted (bad JSON, bad fingerprint text).
class IndexFormatError : public std::runtime_error {
public:
    explicit IndexFormatError(const std::string& message) : std::runtime_error(message) {}
};

class OperationCancelled : public std::runtime_error {
public:
    OperationCancelled() : std::runtime_error("Operation cancelled by user.") {}
};

} // namespace doppel
