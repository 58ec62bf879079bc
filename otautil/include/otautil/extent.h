/*
 * Copyright (C) 2017 The Android Open Source Project
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *      http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#pragma once

#include <stddef.h>
#include <stdint.h>

#include <string>
#include <vector>

// A contiguous run of fixed-size blocks, i.e. blocks [start_block, start_block + num_blocks).
struct BlockExtent {
  BlockExtent() : start_block(0), num_blocks(0) {}

  BlockExtent(uint64_t start_block, uint64_t num_blocks)
      : start_block(start_block), num_blocks(num_blocks) {}

  // Returns the byte offset of the first block for the given block size.
  uint64_t ByteOffset(size_t block_size) const {
    return start_block * block_size;
  }

  // Returns the number of bytes covered by the extent for the given block size.
  uint64_t ByteLength(size_t block_size) const {
    return num_blocks * block_size;
  }

  bool operator==(const BlockExtent& other) const {
    return start_block == other.start_block && num_blocks == other.num_blocks;
  }

  bool operator!=(const BlockExtent& other) const {
    return !(*this == other);
  }

  uint64_t start_block;
  uint64_t num_blocks;
};

// An ordered list of extents. The order is significant: data read from (or written to) the extents
// is laid out contiguously in list order.
class ExtentList {
 public:
  ExtentList() : blocks_(0) {}

  explicit ExtentList(std::vector<BlockExtent>&& extents);

  // Appends the given extent. Returns false on an empty extent, or if the total number of blocks
  // (or the end block of the extent) would overflow.
  bool PushBack(BlockExtent extent);

  // Clears all the extents from the list.
  void Clear();

  // Returns "start+count,start+count,..." for logging.
  std::string ToString() const;

  // Returns whether the extents tile the blocks [0, blocks()) in order, i.e. each extent starts
  // where the previous one ended. This is diagnostic only.
  bool IsContiguous() const;

  // Returns the number of bytes covered by all the extents for the given block size.
  uint64_t ByteLength(size_t block_size) const {
    return blocks_ * block_size;
  }

  // Returns the number of extents in this list.
  size_t size() const {
    return extents_.size();
  }

  // Returns the total number of blocks in this list.
  uint64_t blocks() const {
    return blocks_;
  }

  std::vector<BlockExtent>::const_iterator begin() const {
    return extents_.begin();
  }

  std::vector<BlockExtent>::const_iterator end() const {
    return extents_.end();
  }

  // Returns whether the list is valid (i.e. non-empty).
  explicit operator bool() const {
    return !extents_.empty();
  }

  const BlockExtent& operator[](size_t i) const {
    return extents_[i];
  }

  bool operator==(const ExtentList& other) const {
    return extents_ == other.extents_;
  }

  bool operator!=(const ExtentList& other) const {
    return extents_ != other.extents_;
  }

 private:
  std::vector<BlockExtent> extents_;
  uint64_t blocks_;
};
