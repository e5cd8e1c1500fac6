#pragma once

#include <cstddef>
#include <string_view>
#include <vector>

namespace tracksync::diff {

enum class OpTag {
  kEqual,
  kReplace,
  kDelete,
  kInsert,
};

std::string_view OpTagName(OpTag tag);

// a[a_begin, a_end) becomes b[b_begin, b_end)
struct Opcode {
  OpTag       tag;
  std::size_t a_begin;
  std::size_t a_end;
  std::size_t b_begin;
  std::size_t b_end;

  bool operator==(const Opcode&) const = default;
};

/*
  Ratcliff/Obershelp alignment of two symbol sequences, producing the
  same opcodes as Python's difflib.SequenceMatcher without junk
  heuristics. Callers map their elements to symbols first, equal
  elements to equal symbols.
*/
class SequenceMatcher {
 public:
  SequenceMatcher(std::vector<std::size_t> a, std::vector<std::size_t> b);

  struct Match {
    std::size_t a;
    std::size_t b;
    std::size_t size;
  };

  // Longest common block inside a[alo, ahi) and b[blo, bhi); earliest wins ties.
  Match LongestMatch(std::size_t alo, std::size_t ahi, std::size_t blo, std::size_t bhi) const;

  // Ordered, non-adjacent blocks, terminated by {len(a), len(b), 0}.
  std::vector<Match> MatchingBlocks() const;

  std::vector<Opcode> Opcodes() const;

 private:
  std::vector<std::size_t> a_;
  std::vector<std::size_t> b_;

  // symbol -> ascending positions in b
  std::vector<std::vector<std::size_t>> b2j_;
};

} // namespace tracksync::diff
