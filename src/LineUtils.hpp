#pragma once
#include <cstddef>
#include <istream>
#include <string>

// Helper: find the next physical line in a buffer starting at 'pos'. On success 'start_byte'/'bytes_len'
// describe the line without its terminator and 'pos' is moved past the terminator. Returns false at EOF.
// Terminators are \n, \r and \r\n.
bool next_line_range(const char* data, size_t total_size, size_t &pos, size_t &start_byte, size_t &bytes_len);

// Same rules as next_line_range, over a stream. The stream's state and exception mask are left alone;
// end of input is reported by returning false. Throws std::ios_base::failure if the stream is already
// failed (failbit or badbit) or its buffer throws.
bool read_physical_line(std::istream& is, std::string& line);

// A folded (continuation) line starts with a space or a horizontal tab.
bool is_folded_line(const std::string& line);

// First line of a value folded with trailing '=' (QUOTED-PRINTABLE parameter before the first colon,
// and a '=' ending the line after that colon). Case-insensitive.
bool is_quoted_printable_fold_start(const std::string& line);
