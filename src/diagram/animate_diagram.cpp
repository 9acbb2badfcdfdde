#include "diagram/animate_diagram.hpp"

#include <string>
#include <string_view>

#include "diagram/layout.hpp"
#include "util/logging.hpp"
#include "util/utf8.hpp"

namespace glyphseed::diagram {

namespace {

constexpr std::size_t kFrameMarkerRow = 1;
constexpr std::size_t kEndMarkerRow = 0;

}  // namespace

bool AnimateDiagram::IsEmpty() const {
  for (const auto& frame : frames_) {
    if (!frame.IsEmpty()) {
      return false;
    }
  }
  return true;
}

bool AnimateDiagram::Encode(std::vector<std::uint8_t>* out, DiagramError* error) const {
  if (IsEmpty()) {
    return Fail(error, DiagramError::kEmptyDiagram);
  }
  std::string chars;
  std::vector<IndicesBlock> blocks;
  blocks.reserve(frames_.size());
  for (auto it = frames_.rbegin(); it != frames_.rend(); ++it) {
    IndicesBlock indices{};
    if (!it->AppendCells(&chars, indices.data())) {
      return Fail(error, DiagramError::kInvalidParameter);
    }
    indices[kFrameMarkerRow] |= kMarkerBit;
    blocks.push_back(indices);
  }
  blocks.front()[kEndMarkerRow] |= kMarkerBit;

  std::vector<std::uint8_t> secret(chars.begin(), chars.end());
  for (const auto& block : blocks) {
    secret.insert(secret.end(), block.begin(), block.end());
  }
  AppendChecksum(&secret);
  *out = std::move(secret);
  return true;
}

bool AnimateDiagram::Decode(std::span<const std::uint8_t> secret,
                            AnimateDiagram* out,
                            DiagramError* error) {
  if (secret.size() <= kIndicesBytes + kChecksumBytes) {
    return Fail(error, DiagramError::kInvalidLength);
  }
  std::span<const std::uint8_t> body;
  if (!SplitChecksum(secret, &body)) {
    return Fail(error, DiagramError::kInvalidChecksum);
  }

  // Walking backwards from the checksum yields the blocks in playback order;
  // the end marker closes the sequence.
  std::vector<IndicesBlock> blocks;
  std::size_t end = body.size();
  while (true) {
    if (end < kIndicesBytes) {
      return Fail(error, DiagramError::kInvalidLength);
    }
    const IndicesBlock block = ReadIndicesBlock(body.subspan(end - kIndicesBytes, kIndicesBytes));
    end -= kIndicesBytes;
    if (!(block[kFrameMarkerRow] & kMarkerBit)) {
      return Fail(error, DiagramError::kInvalidVersion);
    }
    for (std::size_t row = 2; row < block.size(); ++row) {
      if (block[row] & kMarkerBit) {
        return Fail(error, DiagramError::kInvalidVersion);
      }
    }
    blocks.push_back(block);
    if (block[kEndMarkerRow] & kMarkerBit) {
      break;
    }
  }

  const auto prefix = body.first(end);
  std::u32string chars;
  if (!util::DecodeUtf8(std::string_view(reinterpret_cast<const char*>(prefix.data()),
                                         prefix.size()),
                        &chars)) {
    return Fail(error, DiagramError::kInvalidUtf8);
  }
  std::size_t marked = 0;
  for (const auto& block : blocks) {
    marked += CountMarkedCells(block);
  }
  if (marked != chars.size()) {
    return Fail(error, DiagramError::kInvalidParameter);
  }
  if (marked == 0) {
    return Fail(error, DiagramError::kEmptyDiagram);
  }

  // The character pool is in wire order, which is the reverse of playback.
  std::vector<SimpleDiagram> frames(blocks.size());
  std::size_t next = 0;
  for (std::size_t i = blocks.size(); i-- > 0;) {
    const IndicesBlock& block = blocks[i];
    SimpleDiagram& frame = frames[i];
    ForEachCellInSecretOrder([&](std::size_t row, std::size_t col) {
      if (IsCellMarked(block, row, col)) {
        frame.cells_[row][col] = chars[next++];
      }
    });
  }
  util::LogPrint(util::LogLevel::kDebug, "diagram",
                 "decoded animate diagram with " + std::to_string(frames.size()) + " frames");
  out->frames_ = std::move(frames);
  return true;
}

}  // namespace glyphseed::diagram
