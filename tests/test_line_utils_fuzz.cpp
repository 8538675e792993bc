#include <iostream>
#include <fstream>
#include <filesystem>
#include <memory>
#include <sstream>
#include <string>
#include <vector>
#include <random>
#include "../src/LineUtils.hpp"
#include "../src/FoldedLineReader.hpp"

#define ASSERT_TRUE(cond) if(!(cond)) { std::cerr << "Assertion failed: " << #cond << " at " << __FILE__ << ":" << __LINE__ << std::endl; return 1; }

struct Logical {
    std::string text;
    size_t line;
    bool operator==(const Logical& other) const { return text == other.text && line == other.line; }
};

// Reference implementation: splits on \n, \r and \r\n; a trailing terminator adds no line
static std::vector<std::string> reference_split(const std::string& s) {
    std::vector<std::string> lines;
    std::string cur;
    bool pending = false;
    size_t i = 0;
    while (i < s.size()) {
        char c = s[i++];
        if (c == '\n' || c == '\r') {
            if (c == '\r' && i < s.size() && s[i] == '\n') ++i;
            lines.push_back(cur);
            cur.clear();
            pending = false;
        } else {
            cur.push_back(c);
            pending = true;
        }
    }
    if (pending) lines.push_back(cur);
    return lines;
}

static bool indented(const std::string& line) {
    return !line.empty() && (line[0] == ' ' || line[0] == '\t');
}

// Reference unfolding over an index into the physical lines
static std::vector<Logical> reference_unfold(const std::vector<std::string>& lines) {
    std::vector<Logical> out;
    size_t i = 0;
    auto skip_blank = [&]() { while (i < lines.size() && lines[i].empty()) ++i; };
    skip_blank();
    while (i < lines.size()) {
        Logical l{lines[i], i + 1};
        ++i;
        if (is_quoted_printable_fold_start(l.text)) {
            l.text.pop_back();
            while (i < lines.size()) {
                std::string p = lines[i++];
                if (indented(p)) p.erase(0, 1);
                bool more = !p.empty() && p.back() == '=';
                if (more) p.pop_back();
                l.text += p;
                if (!more) break;
            }
        } else {
            while (true) {
                skip_blank();
                if (i < lines.size() && indented(lines[i])) {
                    l.text += lines[i].substr(1);
                    ++i;
                } else {
                    break;
                }
            }
        }
        out.push_back(l);
        skip_blank();
    }
    return out;
}

static std::vector<Logical> unfold_all(FoldedLineReader& reader) {
    std::vector<Logical> out;
    while (auto line = reader.readLogicalLine()) {
        out.push_back({*line, reader.currentLineNumber()});
    }
    // must stay at end of stream
    if (reader.readLogicalLine()) out.push_back({"<resurrected>", 0});
    return out;
}

int main() {
    auto tmpFile = std::filesystem::temp_directory_path() / "vcard_unfold_fuzz.vcf";
    try {
        // Repeatable RNG
        std::mt19937 rng(123456);
        std::uniform_int_distribution<int> len_d(0, 60);
        static const std::vector<std::string> pieces = {
            "NOTE", ";QUOTED-PRINTABLE", ";quoted-printable", ";ENCODING=QUOTED-PRINTABLE", ":", "=", "==",
            " ", "\t", "\n", "\n", "\r", "\r\n", "\r\n", "x", "AB", "=0D=0A"};
        std::uniform_int_distribution<size_t> piece_d(0, pieces.size() - 1);

        for (int iter = 0; iter < 2000; ++iter) {
            int len = len_d(rng);
            std::string s;
            for (int i = 0; i < len; ++i) {
                s += pieces[piece_d(rng)];
            }

            // physical lines: buffer scanner, stream reader and reference agree
            std::vector<std::string> expected_lines = reference_split(s);
            std::vector<std::string> buffer_lines;
            size_t pos = 0, start_byte = 0, bytes_len = 0;
            while (next_line_range(s.data(), s.size(), pos, start_byte, bytes_len)) {
                buffer_lines.push_back(s.substr(start_byte, bytes_len));
            }
            std::vector<std::string> stream_lines;
            std::istringstream iss(s);
            std::string line;
            while (read_physical_line(iss, line)) {
                stream_lines.push_back(line);
            }
            if (buffer_lines != expected_lines || stream_lines != expected_lines) {
                std::cerr << "Physical line mismatch at iter=" << iter << " len=" << s.size() << std::endl;
                return 1;
            }

            // logical lines: text reader matches the reference
            std::vector<Logical> expected = reference_unfold(expected_lines);
            FoldedLineReader textReader(s);
            std::vector<Logical> actual = unfold_all(textReader);
            if (actual != expected) {
                std::cerr << "Logical line mismatch at iter=" << iter << ": expected " << expected.size()
                          << " lines, got " << actual.size() << std::endl;
                return 1;
            }

            // and so does the mapped file reader, on a sample of inputs
            if (iter % 20 == 0) {
                {
                    std::ofstream ofs(tmpFile, std::ios::binary);
                    ofs.write(s.data(), s.size());
                }
                FoldedLineReader fileReader(std::make_shared<const MemorySegment>(tmpFile.string()));
                ASSERT_TRUE(unfold_all(fileReader) == expected);
            }
        }

        // A specifically crafted CRLF card (common case)
        std::string crlf = "BEGIN:VCARD\r\nFN:A\r\n B\r\nEND:VCARD\r\n";
        FoldedLineReader reader(crlf);
        std::vector<Logical> expected = {{"BEGIN:VCARD", 1}, {"FN:AB", 2}, {"END:VCARD", 4}};
        ASSERT_TRUE(unfold_all(reader) == expected);

    } catch (const std::exception &e) {
        std::cerr << "Exception: " << e.what() << std::endl;
        return 1;
    }
    std::filesystem::remove(tmpFile);
    std::cout << "All fuzz tests passed" << std::endl;
    return 0;
}
