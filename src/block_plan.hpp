#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

struct Block {
  std::uint64_t offset = 0;
  std::uint64_t length = 0;
  std::size_t index = 0;
};

using BlockPlan = std::vector<Block>;

// Contiguous, non-overlapping blocks covering [0, file_size); every block is
// `block_size` long except possibly the last. Throws std::invalid_argument
// for a zero block size.
BlockPlan make_block_plan(std::uint64_t file_size, std::uint64_t block_size);
