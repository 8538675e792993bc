#include "MemorySegment.hpp"
#include <filesystem>
#include <boost/interprocess/file_mapping.hpp>
#include <boost/interprocess/mapped_region.hpp>

MemorySegment::MemorySegment(const std::string& path)
    : filePath(path),
      segmentSize(0) {
    // mapped_region refuses zero-length mappings
    if (std::filesystem::file_size(path) == 0) {
        return;
    }
    fileMapping = std::make_unique<boost::interprocess::file_mapping>(path.c_str(), boost::interprocess::read_only);
    region = std::make_unique<boost::interprocess::mapped_region>(*fileMapping, boost::interprocess::read_only);
    segmentSize = region->get_size();
}

MemorySegment::~MemorySegment() {}

const std::string& MemorySegment::path() const {
    return filePath;
}

size_t MemorySegment::size() const {
    return segmentSize;
}

const char* MemorySegment::data() const {
    return region ? static_cast<const char*>(region->get_address()) : nullptr;
}
