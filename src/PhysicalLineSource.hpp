#pragma once
#include <istream>
#include <memory>
#include <string>
#include "MemorySegment.hpp"

// Produces raw physical lines, terminators stripped. Once readLine() returned false it keeps
// returning false without touching the underlying input again.
class PhysicalLineSource {
public:
    virtual ~PhysicalLineSource() = default;
    virtual bool readLine(std::string& line) = 0;
};

// Reads from a stream. The stream is borrowed unless ownership is handed over. A stream that already
// has failbit or badbit set is rejected with std::ios_base::failure. Characters are taken from the
// stream buffer directly, so the stream's exception mask does not apply to end of input.
class StreamLineSource : public PhysicalLineSource {
public:
    explicit StreamLineSource(std::istream& in);
    explicit StreamLineSource(std::unique_ptr<std::istream> owned);

    bool readLine(std::string& line) override;

private:
    std::unique_ptr<std::istream> owned_;
    std::istream& in_;
    bool exhausted_ = false;
};

// Reads from a memory-mapped file.
class MappedLineSource : public PhysicalLineSource {
public:
    explicit MappedLineSource(std::shared_ptr<const MemorySegment> segment);

    bool readLine(std::string& line) override;

    // True if the file starts with a UTF-8 byte order mark (skipped, never part of a line).
    bool hasUtf8Bom() const;

private:
    std::shared_ptr<const MemorySegment> segment_;
    size_t pos_ = 0;
    bool bom_ = false;
};
