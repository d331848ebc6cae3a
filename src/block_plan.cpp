#include "block_plan.hpp"

#include <algorithm>
#include <stdexcept>

BlockPlan make_block_plan(std::uint64_t file_size, std::uint64_t block_size) {
  if(block_size == 0) {
    throw std::invalid_argument("block size must be positive");
  }
  BlockPlan plan;
  plan.reserve(static_cast<std::size_t>((file_size + block_size - 1) / block_size));
  std::uint64_t offset = 0;
  while(offset < file_size) {
    Block block;
    block.offset = offset;
    block.length = std::min(block_size, file_size - offset);
    block.index = plan.size();
    plan.push_back(block);
    offset += block.length;
  }
  return plan;
}
