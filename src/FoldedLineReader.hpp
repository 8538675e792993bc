#pragma once
#include <istream>
#include <locale>
#include <memory>
#include <optional>
#include <string>
#include "PhysicalLineSource.hpp"

/**
 * Reads logical lines from vCard/iCalendar style text, transparently unfolding lines that were
 * folded across several physical lines.
 *
 * Two folding styles are understood:
 *  - standard: a continuation line starts with one space or tab, which is removed;
 *  - quoted-printable: a value whose first line has QUOTED-PRINTABLE before the first colon and
 *    ends with '=' continues on following lines for as long as they end with '=' (Outlook style,
 *    continuation lines are not indented).
 *
 * Blank physical lines are skipped outside quoted-printable values but still counted, so
 * currentLineNumber() always reports the 1-based physical line where a logical line started.
 *
 * Not thread safe. Stream errors are thrown as std::ios_base::failure.
 */
class FoldedLineReader {
public:
    // Borrows the stream. Without an explicit encoding the codeset of the stream's locale is used.
    // Throws std::ios_base::failure if the stream already has failbit or badbit set.
    explicit FoldedLineReader(std::istream& in, std::optional<std::string> encoding = std::nullopt);

    // Reads a literal block of text.
    explicit FoldedLineReader(const std::string& text, std::optional<std::string> encoding = std::nullopt);

    // Reads a mapped file. A UTF-8 byte order mark sets the encoding to "UTF-8" when none is given.
    explicit FoldedLineReader(std::shared_ptr<const MemorySegment> segment, std::optional<std::string> encoding = std::nullopt);

    // Reads from any line source.
    explicit FoldedLineReader(std::unique_ptr<PhysicalLineSource> source, std::optional<std::string> encoding = std::nullopt);

    // Next unfolded line, or std::nullopt at end of stream.
    std::optional<std::string> readLogicalLine();

    // Starting line number of the last logical line read; 0 before the first one.
    size_t currentLineNumber() const;

    const std::optional<std::string>& encoding() const;

private:
    enum class FoldStyle {
        Standard,
        QuotedPrintable
    };

    struct PendingLine {
        std::string text;
        size_t lineNumber;
    };

    bool nextPhysicalLine(std::string& line);
    bool nextNonBlankPhysicalLine(std::string& line);
    void unfoldStandard(std::string& unfolded);
    void unfoldQuotedPrintable(std::string& unfolded);

    std::unique_ptr<PhysicalLineSource> source_;
    std::optional<std::string> encoding_;
    std::optional<PendingLine> lookahead_;
    size_t physicalLineCount_ = 0;
    size_t logicalLineStart_ = 0;
};

// Codeset part of a locale name ("en_US.UTF-8@euro" -> "UTF-8"); nullopt for "C", "POSIX" and friends.
std::optional<std::string> encoding_from_locale(const std::locale& loc);
