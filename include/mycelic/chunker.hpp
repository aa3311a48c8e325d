#pragma once

#include "mycelic/config.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace mycelic {

struct Chunk {
  std::string content;
  int index = 0;
  // 1 is the paragraph level; the whole memory is level 0.
  int level = 1;
};

[[nodiscard]] bool ShouldChunk(std::string_view content, const ChunkingConfig& config);

// Packs paragraphs (blank-line separated) into chunks of at most
// max_chunk_size bytes, falling back to sentences when there is a single
// paragraph or a paragraph is too long on its own, and to UTF-8-safe slices
// for a sentence longer than a chunk. A chunk starts with the last
// overlap_size bytes of its predecessor when they fit. Empty when the content
// does not need chunking.
std::vector<Chunk> ChunkContent(std::string_view content, const ChunkingConfig& config);

}  // namespace mycelic
