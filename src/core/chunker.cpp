#include "core/chunker.hpp"
#include "core/utils.hpp"

#include <stdexcept>

namespace docshield {

namespace {

constexpr size_t kSeparatorChars = TextChunker::kParagraphSeparator.size();

std::vector<std::string> split_paragraphs(std::string text) {
    std::vector<std::string> paragraphs;
    if (text.empty()) {
        return paragraphs;
    }

    text = utils::replace_all(std::move(text), "\r\n", "\n");
    text = utils::replace_all(std::move(text), "\r", "\n");

    const std::string_view view(text);
    size_t pos = 0;
    while (pos <= view.size()) {
        size_t next = view.find(TextChunker::kParagraphSeparator, pos);
        if (next == std::string_view::npos) next = view.size();

        auto para = utils::trim(view.substr(pos, next - pos));
        if (!para.empty()) {
            paragraphs.push_back(std::move(para));
        }
        pos = next + kSeparatorChars;
    }
    return paragraphs;
}

} // anonymous namespace

// ============================================================================
// ChunkStream
// ============================================================================

ChunkStream::ChunkStream(std::string text, size_t max_chars)
    : paragraphs_(split_paragraphs(std::move(text))),
      max_chars_(max_chars) {}

std::optional<std::string> ChunkStream::next() {
    while (ready_.empty()) {
        if (next_paragraph_ < paragraphs_.size()) {
            consume_paragraph(paragraphs_[next_paragraph_]);
            paragraphs_[next_paragraph_].clear();
            ++next_paragraph_;
            continue;
        }
        if (!buffer_.empty()) {
            flush_buffer();
            continue;
        }
        return std::nullopt;
    }

    auto chunk = std::move(ready_.front());
    ready_.pop_front();
    return chunk;
}

void ChunkStream::consume_paragraph(const std::string& para) {
    const size_t para_chars = utils::utf8_length(para);

    if (para_chars > max_chars_) {
        // Hard split, bypassing the buffer. Cuts land on code point boundaries.
        const std::string_view view(para);
        size_t start = 0;
        while (start < view.size()) {
            const auto rest = view.substr(start);
            const size_t len = utils::utf8_byte_offset(rest, max_chars_);
            const auto piece = rest.substr(0, len);
            if (!utils::is_blank(piece)) {
                if (!buffer_.empty()) {
                    flush_buffer();
                }
                ready_.emplace_back(piece);
            }
            start += len;
        }
        return;
    }

    const size_t separator = buffer_.empty() ? 0 : kSeparatorChars;
    if (buffer_chars_ + para_chars + separator > max_chars_) {
        flush_buffer();
    }

    buffer_chars_ += para_chars + (buffer_chars_ > 0 ? kSeparatorChars : 0);
    buffer_.push_back(para);
}

void ChunkStream::flush_buffer() {
    if (buffer_.empty()) {
        return;
    }

    std::string joined;
    joined.reserve(buffer_chars_);
    for (size_t i = 0; i < buffer_.size(); ++i) {
        if (i > 0) joined.append(TextChunker::kParagraphSeparator);
        joined.append(buffer_[i]);
    }

    auto chunk = utils::trim(joined);
    if (!chunk.empty()) {
        ready_.push_back(std::move(chunk));
    }

    buffer_.clear();
    buffer_chars_ = 0;
}

// ============================================================================
// TextChunker
// ============================================================================

TextChunker::TextChunker(size_t max_chars)
    : max_chars_(max_chars) {
    if (max_chars_ == 0) {
        throw std::invalid_argument("TextChunker: max_chars must be at least 1");
    }
}

ChunkStream TextChunker::chunk(std::string text) const {
    return ChunkStream(std::move(text), max_chars_);
}

std::vector<std::string> TextChunker::chunk_all(std::string text) const {
    std::vector<std::string> chunks;
    auto stream = chunk(std::move(text));
    while (auto piece = stream.next()) {
        chunks.push_back(std::move(*piece));
    }
    return chunks;
}

} // namespace docshield
