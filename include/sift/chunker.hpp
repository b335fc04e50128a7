#pragma once

#include <sift/config.hpp>

#include <cstddef>
#include <map>
#include <string>
#include <vector>

namespace sift {

struct Chunk {
    std::string chunk_id;       // "<source>::off<offset>"
    std::string source;
    std::string content;
    size_t offset = 0;          // byte offset of the window in the source
    int line = 1;               // 1-based line of the window start
};

std::string make_chunk_id(const std::string& source, size_t offset);

// Fixed windows of cfg.size bytes advancing by (size - overlap). Windows whose
// trimmed length is below cfg.min_chars are dropped.
std::vector<Chunk> chunk_text(const std::string& source, const std::string& content,
                              const ChunkConfig& cfg);

// chunk_id -> content, the shape the dense index consumes.
std::map<std::string, std::string> chunk_map(const std::vector<Chunk>& chunks);

} // namespace sift
