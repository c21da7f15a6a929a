/*
 * bashgate C++17 - Line Buffer Implementation
 */
#include <bashgate/core/line_buffer.hpp>
#include <bashgate/core/utils.hpp>

#include <cstring>

namespace bashgate {

LineBuffer::LineBuffer(size_t max_line_bytes)
    : max_line_bytes_(max_line_bytes)
    , discarding_(false)
{}

size_t LineBuffer::feed(const char* data, size_t n, std::vector<std::string>& lines) {
    size_t dropped = 0;
    size_t start = 0;

    while (start < n) {
        const void* hit = memchr(data + start, '\n', n - start);
        size_t end = hit ? static_cast<size_t>(static_cast<const char*>(hit) - data) : n;

        if (discarding_) {
            if (hit) {
                discarding_ = false;
            }
        } else {
            pending_.append(data + start, end - start);
            if (pending_.size() > max_line_bytes_) {
                std::string().swap(pending_);
                ++dropped;
                discarding_ = (hit == NULL);
            } else if (hit) {
                lines.push_back(pending_);
                pending_.clear();
            }
        }

        start = end + 1;
    }

    return dropped;
}

bool LineBuffer::take_rest(std::string& line) {
    if (discarding_ || trim(pending_).empty()) {
        pending_.clear();
        return false;
    }
    line.swap(pending_);
    pending_.clear();
    return true;
}

} // namespace bashgate
