#pragma once
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>

class SourceIoError : public std::runtime_error {
public:
    explicit SourceIoError(const std::string& message) : std::runtime_error(message) {}
};

// Finite-length, seekable byte store. read() returns 0 only once the store is exhausted.
// Implementations report failures by throwing SourceIoError.
class ByteSource {
public:
    virtual ~ByteSource() = default;

    virtual uint64_t length() const = 0;
    virtual void seek(uint64_t offset) = 0;
    virtual size_t read(char* buffer, size_t size) = 0;
};
