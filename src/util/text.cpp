#include <sift/text.hpp>

#include <algorithm>
#include <cctype>
#include <unordered_set>

namespace sift {

static bool is_word_char(unsigned char c) {
    return std::isalnum(c) || c == '_';
}

std::string to_lower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::vector<std::string> tokenize(std::string_view text) {
    std::vector<std::string> out;
    size_t i = 0;
    while (i < text.size()) {
        while (i < text.size() && !is_word_char(static_cast<unsigned char>(text[i]))) ++i;
        size_t start = i;
        while (i < text.size() && is_word_char(static_cast<unsigned char>(text[i]))) ++i;
        if (i - start >= 2) {
            out.push_back(to_lower(text.substr(start, i - start)));
        }
    }
    return out;
}

std::vector<std::string> unique_tokens(std::string_view text) {
    std::vector<std::string> out;
    std::unordered_set<std::string> seen;
    for (auto& tok : tokenize(text)) {
        if (seen.insert(tok).second) out.push_back(std::move(tok));
    }
    return out;
}

bool looks_binary(std::string_view content) {
    auto head = content.substr(0, std::min(content.size(), kBinarySniffBytes));
    return head.find('\0') != std::string_view::npos;
}

std::vector<std::string> split_lines(std::string_view content) {
    std::vector<std::string> lines;
    size_t start = 0;
    while (start < content.size()) {
        size_t nl = content.find('\n', start);
        size_t end = (nl == std::string_view::npos) ? content.size() : nl;
        std::string_view line = content.substr(start, end - start);
        if (!line.empty() && line.back() == '\r') line.remove_suffix(1);
        lines.emplace_back(line);
        if (nl == std::string_view::npos) break;
        start = nl + 1;
    }
    return lines;
}

size_t find_ci(std::string_view haystack, std::string_view lower_needle, size_t from) {
    if (lower_needle.empty()) return from <= haystack.size() ? from : std::string_view::npos;
    if (lower_needle.size() > haystack.size()) return std::string_view::npos;
    for (size_t i = from; i + lower_needle.size() <= haystack.size(); ++i) {
        size_t j = 0;
        while (j < lower_needle.size() &&
               std::tolower(static_cast<unsigned char>(haystack[i + j])) ==
                   static_cast<unsigned char>(lower_needle[j])) {
            ++j;
        }
        if (j == lower_needle.size()) return i;
    }
    return std::string_view::npos;
}

} // namespace sift
