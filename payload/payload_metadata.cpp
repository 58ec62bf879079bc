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

#include "payload/payload_metadata.h"

#include <endian.h>
#include <string.h>
#include <sys/stat.h>

#include <algorithm>
#include <string>

#include <android-base/file.h>
#include <android-base/logging.h>
#include <android-base/memory.h>

#include "otautil/print_hex.h"

using chromeos_update_engine::DeltaArchiveManifest;
using chromeos_update_engine::PartitionUpdate;

static inline uint64_t ReadBE64(const uint8_t* address) {
  return be64toh(android::base::get_unaligned<uint64_t>(address));
}

static inline uint32_t ReadBE32(const uint8_t* address) {
  return be32toh(android::base::get_unaligned<uint32_t>(address));
}

CauseCode ParsePayloadHeader(const uint8_t* data, size_t size, PayloadHeader* header) {
  if (size < kPayloadHeaderBaseSize) {
    LOG(ERROR) << "Payload too short for a header: " << size << " bytes";
    return kInvalidHeader;
  }
  if (memcmp(data, kPayloadMagic, 4) != 0) {
    LOG(ERROR) << "Invalid magic header, not an OTA payload: " << print_hex(data, 4);
    return kInvalidHeader;
  }

  header->version = ReadBE64(data + 4);
  if (header->version != kSupportedPayloadVersion) {
    LOG(ERROR) << "Unsupported file format version: " << header->version;
    return kInvalidHeader;
  }
  header->manifest_size = ReadBE64(data + 12);

  header->metadata_signature_size = 0;
  header->header_size = kPayloadHeaderBaseSize;
  if (header->version > 1) {
    if (size < kPayloadHeaderSize) {
      LOG(ERROR) << "Payload too short for a version " << header->version << " header: " << size
                 << " bytes";
      return kInvalidHeader;
    }
    header->metadata_signature_size = ReadBE32(data + kPayloadHeaderBaseSize);
    header->header_size = kPayloadHeaderSize;
  }
  return kNoCause;
}

CauseCode ReadPayloadMetadata(int fd, off64_t payload_offset, PayloadHeader* header,
                              DeltaArchiveManifest* manifest) {
  struct stat sb;
  if (fstat(fd, &sb) == -1) {
    PLOG(ERROR) << "Failed to stat payload";
    return kFreadFailure;
  }
  uint64_t available = 0;
  if (sb.st_size > payload_offset) {
    available = sb.st_size - payload_offset;
  }

  uint8_t buffer[kPayloadHeaderSize];
  size_t header_read = std::min<uint64_t>(available, kPayloadHeaderSize);
  if (!android::base::ReadFullyAtOffset(fd, buffer, header_read, payload_offset)) {
    PLOG(ERROR) << "Failed to read payload header";
    return kFreadFailure;
  }
  if (CauseCode cause = ParsePayloadHeader(buffer, header_read, header); cause != kNoCause) {
    return cause;
  }

  // Reject sizes that run past the end of the file before allocating anything.
  if (header->manifest_size > available ||
      header->metadata_signature_size > available - header->manifest_size ||
      header->data_offset() > available) {
    LOG(ERROR) << "Manifest (" << header->manifest_size << " bytes) and metadata signature ("
               << header->metadata_signature_size << " bytes) exceed the " << available
               << "-byte payload";
    return kInvalidHeader;
  }

  std::string manifest_bytes(header->manifest_size, '\0');
  if (!android::base::ReadFullyAtOffset(fd, manifest_bytes.data(), manifest_bytes.size(),
                                        payload_offset + header->header_size)) {
    PLOG(ERROR) << "Failed to read " << header->manifest_size << " bytes of manifest";
    return kFreadFailure;
  }
  if (!manifest->ParseFromString(manifest_bytes)) {
    LOG(ERROR) << "Failed to parse the payload manifest";
    return kManifestParseFailure;
  }
  if (manifest->block_size() == 0) {
    LOG(ERROR) << "Invalid block size 0 in the payload manifest";
    return kManifestParseFailure;
  }

  LOG(INFO) << "Payload version " << header->version << ", manifest " << header->manifest_size
            << " bytes, block size " << manifest->block_size() << ", "
            << manifest->partitions_size() << " partitions";
  return kNoCause;
}

CauseCode FindPartition(const DeltaArchiveManifest& manifest, const std::string& name,
                        const PartitionUpdate** partition) {
  for (const auto& p : manifest.partitions()) {
    if (p.partition_name() == name) {
      *partition = &p;
      return kNoCause;
    }
  }
  return kPartitionNotFound;
}
