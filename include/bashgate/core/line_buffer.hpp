/*
 * bashgate C++17 - Line Buffer
 *
 * Splits the stdin byte stream into request lines. A line longer than the
 * limit is dropped whole: its bytes are skipped up to and including the
 * next newline, so the tail of it never reaches the dispatcher.
 */
#ifndef bashgate_CORE_LINE_BUFFER_HPP
#define bashgate_CORE_LINE_BUFFER_HPP

#include <string>
#include <vector>
#include <cstddef>

namespace bashgate {

class LineBuffer {
public:
    explicit LineBuffer(size_t max_line_bytes);

    // Append raw bytes; every completed line is pushed onto `lines` without
    // its newline. Returns how many oversized lines were dropped.
    size_t feed(const char* data, size_t n, std::vector<std::string>& lines);

    // Unterminated text left at end of input. False when there is none or
    // when it belongs to a line already being dropped.
    bool take_rest(std::string& line);

    bool discarding() const { return discarding_; }

private:
    size_t max_line_bytes_;
    std::string pending_;
    bool discarding_;
};

} // namespace bashgate

#endif // bashgate_CORE_LINE_BUFFER_HPP
