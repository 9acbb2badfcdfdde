#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

#include "diagram/diagram_error.hpp"
#include "diagram/simple_diagram.hpp"

namespace glyphseed::diagram {

// An ordered sequence of single-character frames played back in order.
//
// Wire layout: [UTF-8 characters of every frame][7 indices bytes per frame]
// [1 checksum byte]. Frames are written last-frame-first; each block has the
// top bit of indices[1] set, and the block of the final frame additionally
// sets the top bit of indices[0] to end the sequence.
class AnimateDiagram {
 public:
  AnimateDiagram() = default;
  explicit AnimateDiagram(std::vector<SimpleDiagram> frames) : frames_(std::move(frames)) {}

  const std::vector<SimpleDiagram>& frames() const { return frames_; }
  std::size_t frame_count() const { return frames_.size(); }
  const SimpleDiagram& frame(std::size_t index) const { return frames_.at(index); }
  SimpleDiagram& frame(std::size_t index) { return frames_.at(index); }

  void AddFrame(SimpleDiagram frame) { frames_.push_back(std::move(frame)); }

  // True when there are no frames or every frame is empty.
  bool IsEmpty() const;

  bool Encode(std::vector<std::uint8_t>* out, DiagramError* error = nullptr) const;

  static bool Decode(std::span<const std::uint8_t> secret,
                     AnimateDiagram* out,
                     DiagramError* error = nullptr);

  bool operator==(const AnimateDiagram&) const = default;

 private:
  std::vector<SimpleDiagram> frames_;
};

}  // namespace glyphseed::diagram
