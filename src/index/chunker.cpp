#include <sift/chunker.hpp>

#include <algorithm>

namespace sift {

namespace {

size_t trimmed_length(const std::string& s, size_t begin, size_t end) {
    auto is_space = [](char c) {
        return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
    };
    while (begin < end && is_space(s[begin])) ++begin;
    while (end > begin && is_space(s[end - 1])) --end;
    return end - begin;
}

} // namespace

std::string make_chunk_id(const std::string& source, size_t offset) {
    return source + "::off" + std::to_string(offset);
}

std::vector<Chunk> chunk_text(const std::string& source, const std::string& content,
                              const ChunkConfig& cfg) {
    std::vector<Chunk> out;
    if (cfg.size == 0) return out;
    size_t step = cfg.size > cfg.overlap ? cfg.size - cfg.overlap : 1;

    int line = 1;
    size_t line_pos = 0;        // content[0, line_pos) already counted
    for (size_t offset = 0; offset < content.size(); offset += step) {
        line += static_cast<int>(std::count(content.begin() + static_cast<long>(line_pos),
                                            content.begin() + static_cast<long>(offset), '\n'));
        line_pos = offset;

        size_t end = std::min(content.size(), offset + cfg.size);
        if (trimmed_length(content, offset, end) < cfg.min_chars) continue;

        Chunk c;
        c.chunk_id = make_chunk_id(source, offset);
        c.source = source;
        c.content = content.substr(offset, end - offset);
        c.offset = offset;
        c.line = line;
        out.push_back(std::move(c));
    }
    return out;
}

std::map<std::string, std::string> chunk_map(const std::vector<Chunk>& chunks) {
    std::map<std::string, std::string> out;
    for (const auto& c : chunks) out[c.chunk_id] = c.content;
    return out;
}

} // namespace sift
