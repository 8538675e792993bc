#include "LineUtils.hpp"
#include <cstddef>
#include <ios>
#include <streambuf>
#include <string>
#include <boost/algorithm/string/find.hpp>
#include <boost/range/iterator_range.hpp>

bool next_line_range(const char* data, size_t total_size, size_t &pos, size_t &start_byte, size_t &bytes_len) {
	start_byte = pos;
	bytes_len = 0;
	if (pos >= total_size) {
		return false;
	}

	// advance to the end of current line (consume characters until newline)
	while (pos < total_size && data[pos] != '\n' && data[pos] != '\r') ++pos;
	bytes_len = pos - start_byte;

	// consume one terminator: \n, \r or \r\n (a \n\r pair is two terminators)
	if (pos < total_size) {
		char ch = data[pos++];
		if (ch == '\r' && pos < total_size && data[pos] == '\n') {
			++pos;
		}
	}
	return true;
}

// Reads straight from the stream buffer so the stream's exception mask never turns a plain end of
// input into an error. Only a failing buffer (or a stream already in a failed state) is an error.
bool read_physical_line(std::istream& is, std::string& line) {
	line.clear();
	if (is.fail()) {
		throw std::ios_base::failure("stream is in a failed state");
	}
	std::streambuf* buf = is.rdbuf();
	if (!buf) {
		throw std::ios_base::failure("stream has no buffer");
	}

	typedef std::istream::traits_type traits;
	try {
		bool any = false;
		while (true) {
			traits::int_type c = buf->sbumpc();
			if (traits::eq_int_type(c, traits::eof())) {
				// last line without terminator still counts
				return any;
			}
			any = true;
			char ch = traits::to_char_type(c);
			if (ch == '\n') {
				return true;
			}
			if (ch == '\r') {
				if (traits::eq_int_type(buf->sgetc(), traits::to_int_type('\n'))) {
					buf->sbumpc();
				}
				return true;
			}
			line.push_back(ch);
		}
	} catch (const std::ios_base::failure&) {
		throw;
	} catch (const std::exception& e) {
		throw std::ios_base::failure(std::string("stream read failure: ") + e.what());
	}
}

bool is_folded_line(const std::string& line) {
	if (line.empty()) {
		return false;
	}
	char first = line[0];
	return first == ' ' || first == '\t';
}

bool is_quoted_printable_fold_start(const std::string& line) {
	size_t colon = line.find(':');
	if (colon == std::string::npos) {
		return false;
	}
	// the trailing '=' must come after the first colon
	if (line.size() < colon + 2 || line.back() != '=') {
		return false;
	}
	auto head = boost::make_iterator_range(line.begin(), line.begin() + colon);
	return !boost::algorithm::ifind_first(head, "QUOTED-PRINTABLE").empty();
}
