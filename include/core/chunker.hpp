#pragma once

#include <cstddef>
#include <deque>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace docshield {

/**
 * @brief Single-pass lazy sequence of chunks for one text block
 *
 * Produced by TextChunker::chunk(). Each call to next() returns the next
 * chunk until the sequence is exhausted; it cannot be rewound.
 */
class ChunkStream {
public:
    ChunkStream(std::string text, size_t max_chars);

    [[nodiscard]] std::optional<std::string> next();

private:
    void consume_paragraph(const std::string& para);
    void flush_buffer();

    std::vector<std::string> paragraphs_;
    size_t next_paragraph_ = 0;
    size_t max_chars_;

    // Paragraphs waiting to be joined into one chunk
    std::vector<std::string> buffer_;
    size_t buffer_chars_ = 0;

    // Chunks produced but not yet handed out
    std::deque<std::string> ready_;
};

/**
 * @brief Paragraph-aware splitter with a hard length cap
 *
 * Normalizes line endings, splits on blank lines and packs paragraphs into
 * chunks of at most max_chars code points, joined by a blank line.
 * Paragraphs longer than max_chars are cut into max_chars-sized pieces.
 */
class TextChunker {
public:
    static constexpr std::string_view kParagraphSeparator = "\n\n";
    static constexpr size_t kDefaultMaxChars = 4000;

    /**
     * @throws std::invalid_argument if max_chars is 0
     */
    explicit TextChunker(size_t max_chars = kDefaultMaxChars);

    [[nodiscard]] ChunkStream chunk(std::string text) const;

    /// Drains chunk() into a vector
    [[nodiscard]] std::vector<std::string> chunk_all(std::string text) const;

    [[nodiscard]] size_t max_chars() const { return max_chars_; }

private:
    size_t max_chars_;
};

} // namespace docshield
