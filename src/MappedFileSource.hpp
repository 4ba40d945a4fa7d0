#pragma once
#include <string>
#include <boost/interprocess/file_mapping.hpp>
#include "ByteSource.hpp"

// Read-only file source that maps one window per read instead of the whole file,
// so memory stays bounded by the chunk size. A truncation seen before a read
// shortens that read. Truncation between the size check and the copy still
// raises SIGBUS; there is no portable way to turn that into an error.
class MappedFileSource : public ByteSource {
public:
    explicit MappedFileSource(const std::string& path);

    uint64_t length() const override;
    void seek(uint64_t offset) override;
    size_t read(char* buffer, size_t size) override;

    const std::string& path() const;
    uint64_t position() const;

private:
    std::string filePath;
    boost::interprocess::file_mapping fileMapping;
    uint64_t cursor;
};
