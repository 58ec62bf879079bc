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

#include "otautil/extent.h"

#include <inttypes.h>
#include <stdint.h>

#include <string>
#include <utility>
#include <vector>

#include <android-base/logging.h>
#include <android-base/stringprintf.h>
#include <android-base/strings.h>

ExtentList::ExtentList(std::vector<BlockExtent>&& extents) {
  blocks_ = 0;
  for (const auto& extent : extents) {
    if (!PushBack(extent)) {
      Clear();
      return;
    }
  }
}

bool ExtentList::PushBack(BlockExtent extent) {
  if (extent.num_blocks == 0) {
    LOG(ERROR) << "Empty extent at block " << extent.start_block;
    return false;
  }
  if (extent.start_block > UINT64_MAX - extent.num_blocks) {
    LOG(ERROR) << "Extent end overflow: " << extent.start_block << "+" << extent.num_blocks;
    return false;
  }
  if (blocks_ > UINT64_MAX - extent.num_blocks) {
    LOG(ERROR) << "ExtentList size overflow";
    return false;
  }

  extents_.push_back(extent);
  blocks_ += extent.num_blocks;
  return true;
}

void ExtentList::Clear() {
  extents_.clear();
  blocks_ = 0;
}

std::string ExtentList::ToString() const {
  std::vector<std::string> pieces;
  for (const auto& extent : extents_) {
    pieces.push_back(android::base::StringPrintf("%" PRIu64 "+%" PRIu64, extent.start_block,
                                                 extent.num_blocks));
  }
  return android::base::Join(pieces, ',');
}

bool ExtentList::IsContiguous() const {
  uint64_t blocks = 0;
  for (const auto& extent : extents_) {
    if (extent.start_block != blocks) {
      return false;
    }
    blocks += extent.num_blocks;
  }
  return true;
}
