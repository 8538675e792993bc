#include "FoldedLineReader.hpp"
#include <locale>
#include <sstream>
#include <stdexcept>
#include <utility>
#include "LineUtils.hpp"

std::optional<std::string> encoding_from_locale(const std::locale& loc) {
    std::string name = loc.name();
    size_t dot = name.find('.');
    if (dot == std::string::npos) {
        return std::nullopt;
    }
    size_t end = name.find_first_of("@;", dot + 1);
    std::string codeset = name.substr(dot + 1, end == std::string::npos ? std::string::npos : end - dot - 1);
    if (codeset.empty()) {
        return std::nullopt;
    }
    return codeset;
}

FoldedLineReader::FoldedLineReader(std::istream& in, std::optional<std::string> encoding)
    : source_(std::make_unique<StreamLineSource>(in)),
      encoding_(encoding ? std::move(encoding) : encoding_from_locale(in.getloc())) {}

FoldedLineReader::FoldedLineReader(const std::string& text, std::optional<std::string> encoding)
    : source_(std::make_unique<StreamLineSource>(std::make_unique<std::istringstream>(text))),
      encoding_(std::move(encoding)) {}

FoldedLineReader::FoldedLineReader(std::shared_ptr<const MemorySegment> segment, std::optional<std::string> encoding)
    : encoding_(std::move(encoding)) {
    auto mapped = std::make_unique<MappedLineSource>(std::move(segment));
    if (!encoding_ && mapped->hasUtf8Bom()) {
        encoding_ = "UTF-8";
    }
    source_ = std::move(mapped);
}

FoldedLineReader::FoldedLineReader(std::unique_ptr<PhysicalLineSource> source, std::optional<std::string> encoding)
    : source_(std::move(source)),
      encoding_(std::move(encoding)) {
    if (!source_) {
        throw std::invalid_argument("FoldedLineReader requires a line source");
    }
}

size_t FoldedLineReader::currentLineNumber() const {
    return logicalLineStart_;
}

const std::optional<std::string>& FoldedLineReader::encoding() const {
    return encoding_;
}

bool FoldedLineReader::nextPhysicalLine(std::string& line) {
    if (!source_->readLine(line)) {
        return false;
    }
    ++physicalLineCount_;
    return true;
}

// Some producers (iPhones among them) put empty lines between folded lines. They are dropped here
// so they cannot break a standard fold, but they still count towards the line numbers.
bool FoldedLineReader::nextNonBlankPhysicalLine(std::string& line) {
    while (nextPhysicalLine(line)) {
        if (!line.empty()) {
            return true;
        }
    }
    return false;
}

std::optional<std::string> FoldedLineReader::readLogicalLine() {
    std::string unfolded;
    if (lookahead_) {
        unfolded = std::move(lookahead_->text);
        logicalLineStart_ = lookahead_->lineNumber;
        lookahead_.reset();
    } else {
        if (!nextNonBlankPhysicalLine(unfolded)) {
            return std::nullopt;
        }
        logicalLineStart_ = physicalLineCount_;
    }

    FoldStyle style = is_quoted_printable_fold_start(unfolded) ? FoldStyle::QuotedPrintable : FoldStyle::Standard;
    switch (style) {
    case FoldStyle::QuotedPrintable:
        unfoldQuotedPrintable(unfolded);
        break;
    case FoldStyle::Standard:
        unfoldStandard(unfolded);
        break;
    }
    return unfolded;
}

void FoldedLineReader::unfoldStandard(std::string& unfolded) {
    std::string line;
    while (nextNonBlankPhysicalLine(line)) {
        if (!is_folded_line(line)) {
            // first line of the next logical line
            lookahead_ = PendingLine{std::move(line), physicalLineCount_};
            return;
        }
        unfolded.append(line, 1, std::string::npos);
    }
}

/*
 * Outlook folds QUOTED-PRINTABLE values by ending each line with '=' instead of indenting the
 * next one:
 *
 *   NOTE;QUOTED-PRINTABLE: This is an=0D=0A=
 *   annoyingly formatted=0D=0A=
 *   note=
 *
 *   END:VCARD
 *
 * The empty line above END still belongs to NOTE because "note=" ends with '='. Blank lines are
 * therefore read as-is here, and the value ends with the first line that has no trailing '='.
 */
void FoldedLineReader::unfoldQuotedPrintable(std::string& unfolded) {
    unfolded.pop_back();

    std::string line;
    while (nextPhysicalLine(line)) {
        // some writers still indent the continuation
        if (is_folded_line(line)) {
            line.erase(0, 1);
        }

        bool endsInEquals = !line.empty() && line.back() == '=';
        if (endsInEquals) {
            line.pop_back();
        }
        unfolded += line;

        if (!endsInEquals) {
            return;
        }
    }
}
