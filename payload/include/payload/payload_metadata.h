/*
 * Copyright (C) 2019 The Android Open Source Project
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
#include <sys/types.h>

#include <string>

#include "otautil/error_code.h"
#include "update_metadata.pb.h"

static constexpr char kPayloadMagic[] = "CrAU";
static constexpr uint64_t kSupportedPayloadVersion = 2;

// magic (4) + version (8) + manifest size (8).
static constexpr size_t kPayloadHeaderBaseSize = 20;
// The base header + metadata signature size (4), for version 2.
static constexpr size_t kPayloadHeaderSize = 24;

struct PayloadHeader {
  uint64_t version = 0;
  uint64_t manifest_size = 0;
  uint32_t metadata_signature_size = 0;
  size_t header_size = 0;

  // Offset of the operation data, relative to the start of the payload.
  uint64_t data_offset() const {
    return header_size + manifest_size + metadata_signature_size;
  }
};

// Parses the fixed-size header at the start of a payload. |size| must cover kPayloadHeaderSize
// bytes. Returns kInvalidHeader on a bad magic, an unsupported version, or too few bytes.
CauseCode ParsePayloadHeader(const uint8_t* data, size_t size, PayloadHeader* header);

// Reads and parses the header and the manifest of the payload starting at |payload_offset| in
// |fd|. The metadata signature is skipped.
CauseCode ReadPayloadMetadata(int fd, off64_t payload_offset, PayloadHeader* header,
                              chromeos_update_engine::DeltaArchiveManifest* manifest);

// Finds the partition named |name| in |manifest|. Returns kPartitionNotFound if there is none.
CauseCode FindPartition(const chromeos_update_engine::DeltaArchiveManifest& manifest,
                        const std::string& name,
                        const chromeos_update_engine::PartitionUpdate** partition);
