#include <peek/extraction/line_splitter.h>

namespace peek::extraction {

std::vector<std::string> splitLines(std::string_view text) {
    LineStitcher stitcher;
    auto lines = stitcher.feed(text);
    for (auto& line : stitcher.finish()) {
        lines.push_back(std::move(line));
    }
    return lines;
}

std::vector<std::string> LineStitcher::feed(std::string_view text) {
    std::vector<std::string> lines;
    if (text.empty()) {
        return lines;
    }

    // pending_ holds no terminator except possibly a trailing '\r'; resume the scan there
    size_t i = pending_.size();
    if (i > 0 && pending_.back() == '\r') {
        --i;
    }
    pending_.append(text);

    size_t start = 0;
    while (i < pending_.size()) {
        const char c = pending_[i];
        if (c == '\n') {
            lines.emplace_back(pending_, start, i - start);
            start = ++i;
        } else if (c == '\r') {
            if (i + 1 == pending_.size()) {
                break; // may be the first half of a CRLF split across chunks
            }
            lines.emplace_back(pending_, start, i - start);
            i += (pending_[i + 1] == '\n') ? 2 : 1;
            start = i;
        } else {
            ++i;
        }
    }

    if (start > 0) {
        pending_.erase(0, start);
    }
    return lines;
}

std::vector<std::string> LineStitcher::finish() {
    std::vector<std::string> lines;
    if (pending_.empty()) {
        return lines;
    }
    if (pending_.back() == '\r') {
        pending_.pop_back();
    }
    lines.push_back(std::move(pending_));
    pending_.clear();
    return lines;
}

} // namespace peek::extraction
