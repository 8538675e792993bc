#pragma once
#include <string>
#include <memory>
#include <boost/interprocess/file_mapping.hpp>
#include <boost/interprocess/mapped_region.hpp>

// Read-only mapping of a whole file. Empty files are not mapped (data() is nullptr, size() is 0).
class MemorySegment {
public:
    explicit MemorySegment(const std::string& path);
    ~MemorySegment();

    MemorySegment(const MemorySegment&) = delete;
    MemorySegment& operator=(const MemorySegment&) = delete;

    const std::string& path() const;
    size_t size() const;
    const char* data() const;

private:
    std::string filePath;
    std::unique_ptr<boost::interprocess::file_mapping> fileMapping;
    std::unique_ptr<boost::interprocess::mapped_region> region;
    size_t segmentSize;
};
