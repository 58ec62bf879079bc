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

#include <google/protobuf/repeated_field.h>

#include "otautil/error_code.h"
#include "otautil/extent.h"
#include "update_metadata.pb.h"

// The handles and geometry an operation is applied with. The descriptors are borrowed.
struct OperationParameters {
  // The payload, and the absolute offset of its data section within |payload_fd|.
  int payload_fd = -1;
  uint64_t data_offset = 0;
  // The image being reconstructed. Writes go to block-aligned offsets and may grow the file.
  int target_fd = -1;
  // The prior image for differential operations, or -1 if there is none.
  int source_fd = -1;
  size_t block_size = 0;
};

// Converts the extents of an operation. Returns false if any extent is empty or overflows.
bool ParseExtents(const google::protobuf::RepeatedPtrField<chromeos_update_engine::Extent>& extents,
                  ExtentList* list);

// Returns a printable name for the operation type value, e.g. "SOURCE_BSDIFF".
std::string OperationTypeName(int type);

// Reads the operation data from the payload, verifies its SHA-256 when the operation carries one,
// and then produces the destination blocks according to the operation type.
CauseCode PerformInstallOperation(const OperationParameters& params,
                                  const chromeos_update_engine::InstallOperation& op);
