#include "sequence_matcher.hpp"

#include <algorithm>
#include <tuple>
#include <unordered_map>

namespace tracksync::diff {

std::string_view OpTagName(OpTag tag) {
  switch (tag) {
    case OpTag::kEqual:
      return "equal";
    case OpTag::kReplace:
      return "replace";
    case OpTag::kDelete:
      return "delete";
    case OpTag::kInsert:
      return "insert";
  }
  return "unknown";
}

SequenceMatcher::SequenceMatcher(std::vector<std::size_t> a, std::vector<std::size_t> b)
    : a_(std::move(a)), b_(std::move(b)) {
  std::size_t symbols = 0;
  for (auto s : a_) symbols = std::max(symbols, s + 1);
  for (auto s : b_) symbols = std::max(symbols, s + 1);

  b2j_.resize(symbols);
  for (std::size_t j = 0; j < b_.size(); ++j) {
    b2j_[b_[j]].push_back(j);
  }
}

SequenceMatcher::Match SequenceMatcher::LongestMatch(std::size_t alo, std::size_t ahi, std::size_t blo,
                                                     std::size_t bhi) const {
  Match best{alo, blo, 0};

  // j2len[j] = length of the match ending at a[i-1], b[j]
  std::unordered_map<std::size_t, std::size_t> j2len;
  for (std::size_t i = alo; i < ahi; ++i) {
    std::unordered_map<std::size_t, std::size_t> next;
    for (auto j : b2j_[a_[i]]) {
      if (j < blo) {
        continue;
      }
      if (j >= bhi) {
        break;
      }
      std::size_t k = 1;
      if (j > 0) {
        auto it = j2len.find(j - 1);
        if (it != j2len.end()) {
          k = it->second + 1;
        }
      }
      next[j] = k;
      if (k > best.size) {
        best = {i + 1 - k, j + 1 - k, k};
      }
    }
    j2len = std::move(next);
  }
  return best;
}

std::vector<SequenceMatcher::Match> SequenceMatcher::MatchingBlocks() const {
  std::vector<Match> blocks;

  std::vector<std::tuple<std::size_t, std::size_t, std::size_t, std::size_t>> queue{{0, a_.size(), 0, b_.size()}};
  while (!queue.empty()) {
    auto [alo, ahi, blo, bhi] = queue.back();
    queue.pop_back();

    auto match = LongestMatch(alo, ahi, blo, bhi);
    if (match.size == 0) {
      continue;
    }
    blocks.push_back(match);
    if (alo < match.a && blo < match.b) {
      queue.emplace_back(alo, match.a, blo, match.b);
    }
    if (match.a + match.size < ahi && match.b + match.size < bhi) {
      queue.emplace_back(match.a + match.size, ahi, match.b + match.size, bhi);
    }
  }

  std::sort(blocks.begin(), blocks.end(), [](const Match& l, const Match& r) {
    return std::tie(l.a, l.b, l.size) < std::tie(r.a, r.b, r.size);
  });

  // collapse adjacent blocks
  std::vector<Match> result;
  Match              current{0, 0, 0};
  for (const auto& block : blocks) {
    if (current.a + current.size == block.a && current.b + current.size == block.b) {
      current.size += block.size;
    } else {
      if (current.size) {
        result.push_back(current);
      }
      current = block;
    }
  }
  if (current.size) {
    result.push_back(current);
  }
  result.push_back({a_.size(), b_.size(), 0});
  return result;
}

std::vector<Opcode> SequenceMatcher::Opcodes() const {
  std::vector<Opcode> result;
  std::size_t         i = 0;
  std::size_t         j = 0;
  for (const auto& block : MatchingBlocks()) {
    if (i < block.a && j < block.b) {
      result.push_back({OpTag::kReplace, i, block.a, j, block.b});
    } else if (i < block.a) {
      result.push_back({OpTag::kDelete, i, block.a, j, block.b});
    } else if (j < block.b) {
      result.push_back({OpTag::kInsert, i, block.a, j, block.b});
    }
    i = block.a + block.size;
    j = block.b + block.size;
    if (block.size) {
      result.push_back({OpTag::kEqual, block.a, i, block.b, j});
    }
  }
  return result;
}

} // namespace tracksync::diff
