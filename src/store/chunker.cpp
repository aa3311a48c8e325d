#include "mycelic/chunker.hpp"

#include "mycelic/text.hpp"

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <utility>

namespace mycelic {
namespace {

struct Piece {
  std::string text;
  std::string_view separator;
};

bool IsContinuationByte(char ch) {
  return (static_cast<unsigned char>(ch) & 0xC0) == 0x80;
}

std::vector<std::string> SplitParagraphs(std::string_view content) {
  std::vector<std::string> out{};
  std::size_t pos = 0;
  while (true) {
    const auto next = content.find("\n\n", pos);
    auto paragraph = Trim(content.substr(pos, next == std::string_view::npos ? std::string_view::npos : next - pos));
    if (!paragraph.empty()) {
      out.push_back(std::move(paragraph));
    }
    if (next == std::string_view::npos) {
      break;
    }
    pos = next + 2;
  }
  return out;
}

// A sentence ends at '.', '!' or '?' followed by whitespace or the end.
std::vector<std::string> SplitSentences(std::string_view content) {
  std::vector<std::string> out{};
  std::size_t start = 0;
  for (std::size_t i = 0; i < content.size(); ++i) {
    const char ch = content[i];
    if (ch != '.' && ch != '!' && ch != '?') {
      continue;
    }
    if (i + 1 < content.size() && std::isspace(static_cast<unsigned char>(content[i + 1])) == 0) {
      continue;
    }
    auto sentence = Trim(content.substr(start, i + 1 - start));
    if (!sentence.empty()) {
      out.push_back(std::move(sentence));
    }
    start = i + 1;
  }
  auto rest = Trim(content.substr(std::min(start, content.size())));
  if (!rest.empty()) {
    out.push_back(std::move(rest));
  }
  return out;
}

// Cuts text longer than max into max-byte slices on UTF-8 boundaries.
void AppendSliced(std::vector<Piece>& out, std::string text, std::size_t max, std::string_view separator) {
  if (text.size() <= max) {
    out.push_back(Piece{.text = std::move(text), .separator = separator});
    return;
  }
  std::size_t pos = 0;
  while (pos < text.size()) {
    std::size_t end = std::min(text.size(), pos + max);
    while (end < text.size() && end > pos && IsContinuationByte(text[end])) {
      --end;
    }
    if (end == pos) {
      end = std::min(text.size(), pos + max);
    }
    out.push_back(Piece{.text = text.substr(pos, end - pos), .separator = end == text.size() ? separator : std::string_view()});
    pos = end;
  }
}

void AppendSentences(std::vector<Piece>& out, std::string_view text, std::size_t max, std::string_view last_separator) {
  const auto sentences = SplitSentences(text);
  for (std::size_t i = 0; i < sentences.size(); ++i) {
    AppendSliced(out, sentences[i], max, i + 1 < sentences.size() ? std::string_view(" ") : last_separator);
  }
}

std::string OverlapSuffix(const std::string& text, std::size_t overlap) {
  if (text.size() <= overlap) {
    return text;
  }
  std::size_t start = text.size() - overlap;
  while (start < text.size() && IsContinuationByte(text[start])) {
    ++start;
  }
  return text.substr(start);
}

}  // namespace

bool ShouldChunk(std::string_view content, const ChunkingConfig& config) {
  return config.enabled && content.size() > static_cast<std::size_t>(config.min_chunk_size);
}

std::vector<Chunk> ChunkContent(std::string_view content, const ChunkingConfig& config) {
  if (!ShouldChunk(content, config)) {
    return {};
  }
  const auto max = static_cast<std::size_t>(config.max_chunk_size);
  const auto overlap = static_cast<std::size_t>(config.overlap_size);

  std::vector<Piece> pieces{};
  const auto paragraphs = SplitParagraphs(content);
  if (paragraphs.size() > 1) {
    for (std::size_t i = 0; i < paragraphs.size(); ++i) {
      const std::string_view separator = i + 1 < paragraphs.size() ? "\n\n" : "";
      if (paragraphs[i].size() > max) {
        AppendSentences(pieces, paragraphs[i], max, separator);
      } else {
        pieces.push_back(Piece{.text = paragraphs[i], .separator = separator});
      }
    }
  } else {
    AppendSentences(pieces, content, max, "");
  }

  std::vector<Chunk> chunks{};
  std::string current{};
  const auto emit = [&]() {
    auto text = Trim(current);
    if (!text.empty()) {
      chunks.push_back(Chunk{.content = std::move(text), .index = static_cast<int>(chunks.size())});
    }
  };
  for (const auto& piece : pieces) {
    const auto length = piece.text.size() + piece.separator.size();
    if (!current.empty() && current.size() + length > max) {
      emit();
      current = OverlapSuffix(current, overlap);
      if (current.size() + length > max) {
        current.clear();
      }
    }
    current.append(piece.text);
    current.append(piece.separator);
  }
  emit();
  return chunks;
}

}  // namespace mycelic
