#include "MappedFileSource.hpp"
#include <algorithm>
#include <cstring>
#include <filesystem>
#include <system_error>
#include <boost/interprocess/exceptions.hpp>
#include <boost/interprocess/mapped_region.hpp>

namespace {

boost::interprocess::file_mapping open_mapping(const std::string& path) {
    try {
        return boost::interprocess::file_mapping(path.c_str(), boost::interprocess::read_only);
    } catch (const boost::interprocess::interprocess_exception& e) {
        throw SourceIoError("cannot open '" + path + "': " + e.what());
    }
}

}

MappedFileSource::MappedFileSource(const std::string& path)
    : filePath(path),
      fileMapping(open_mapping(path)),
      cursor(0) {}

uint64_t MappedFileSource::length() const {
    // Queried on every call so a file truncated mid-run shows up as a short read
    std::error_code ec;
    auto size = std::filesystem::file_size(filePath, ec);
    if (ec) {
        throw SourceIoError("cannot stat '" + filePath + "': " + ec.message());
    }
    return static_cast<uint64_t>(size);
}

void MappedFileSource::seek(uint64_t offset) {
    auto total = length();
    if (offset > total) {
        throw SourceIoError("seek to offset " + std::to_string(offset) + " is past the end of '" + filePath + "' (" + std::to_string(total) + " bytes)");
    }
    cursor = offset;
}

size_t MappedFileSource::read(char* buffer, size_t size) {
    if (size == 0) {
        return 0;
    }
    auto total = length();
    if (cursor >= total) {
        return 0;
    }
    auto window = static_cast<size_t>(std::min<uint64_t>(size, total - cursor));
    try {
        boost::interprocess::mapped_region region(fileMapping, boost::interprocess::read_only,
                                                  static_cast<boost::interprocess::offset_t>(cursor), window);
        std::memcpy(buffer, region.get_address(), window);
    } catch (const boost::interprocess::interprocess_exception& e) {
        throw SourceIoError("cannot map " + std::to_string(window) + " bytes at offset " + std::to_string(cursor) + " of '" + filePath + "': " + e.what());
    }
    cursor += window;
    return window;
}

const std::string& MappedFileSource::path() const {
    return filePath;
}

uint64_t MappedFileSource::position() const {
    return cursor;
}
