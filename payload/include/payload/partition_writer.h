/*
 * Copyright (C) 2014 The Android Open Source Project
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

#include "otautil/error_code.h"
#include "payload/payload_file.h"
#include "update_metadata.pb.h"

// Per-run settings shared by every partition worker.
struct ExtractOptions {
  PayloadFile payload;
  // Offset of the data section, relative to the start of the payload.
  uint64_t data_offset = 0;
  size_t block_size = 0;
  std::string out_dir;
  std::string old_dir;
  // Differential mode: prior images are read from |old_dir|/<name>.img.
  bool differential = false;
};

enum class PartitionState {
  kPending,
  kRunning,
  kCompleted,
  kFailed,
};

const char* PartitionStateString(PartitionState state);

struct PartitionResult {
  std::string name;
  PartitionState state = PartitionState::kPending;
  CauseCode cause = kNoCause;
  std::string message;

  explicit operator bool() const {
    return state == PartitionState::kCompleted;
  }
};

// Returns the path of the image for |partition| under |dir|.
std::string PartitionImagePath(const std::string& dir, const std::string& partition);

// Reconstructs |partition| into <out_dir>/<name>.img by applying its operations in order. Stops
// at the first failing operation; the partially written image is left in place.
PartitionResult ExtractPartition(const chromeos_update_engine::PartitionUpdate& partition,
                                 const ExtractOptions& options);
