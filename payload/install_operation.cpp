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

#include "payload/install_operation.h"

#include <errno.h>
#include <stdint.h>
#include <string.h>
#include <sys/stat.h>
#include <sys/types.h>

#include <algorithm>
#include <string>
#include <vector>

#include <android-base/file.h>
#include <android-base/logging.h>
#include <openssl/sha.h>

#include "applypatch/applypatch.h"
#include "otautil/print_hex.h"

using chromeos_update_engine::Extent;
using chromeos_update_engine::InstallOperation;

// Upper bound of the zero buffer used by ZERO operations.
static constexpr size_t kMaxZeroBufferSize = 1024 * 1024;

/**
 * ExtentWriter writes a stream of data to the destination specified by the given ExtentList. The
 * data fills the extents in list order; each extent starts at its block-aligned byte offset.
 */
class ExtentWriter {
 public:
  ExtentWriter(int fd, const ExtentList& tgt, size_t block_size)
      : fd_(fd),
        tgt_(tgt),
        block_size_(block_size),
        next_extent_(0),
        current_offset_(0),
        current_extent_left_(0),
        bytes_written_(0) {
    CHECK_NE(tgt.size(), static_cast<size_t>(0));
  }

  bool Finished() const {
    return next_extent_ == tgt_.size() && current_extent_left_ == 0;
  }

  uint64_t AvailableSpace() const {
    return tgt_.ByteLength(block_size_) - bytes_written_;
  }

  // Returns the number of bytes written; a short count indicates a failure.
  size_t Write(const uint8_t* data, size_t size) {
    size_t written = 0;
    while (size > 0) {
      // Move to the next extent as needed.
      if (current_extent_left_ == 0) {
        if (next_extent_ >= tgt_.size()) {
          LOG(ERROR) << "extent write overrun; can't write " << size << " more bytes to "
                     << tgt_.ToString();
          break;
        }
        const BlockExtent& extent = tgt_[next_extent_++];
        current_offset_ = extent.ByteOffset(block_size_);
        current_extent_left_ = extent.ByteLength(block_size_);
      }

      size_t write_now = std::min<uint64_t>(size, current_extent_left_);
      if (!android::base::WriteFullyAtOffset(fd_, data, write_now, current_offset_)) {
        PLOG(ERROR) << "Failed to write " << write_now << " bytes at offset " << current_offset_;
        break;
      }

      data += write_now;
      size -= write_now;

      current_offset_ += write_now;
      current_extent_left_ -= write_now;
      written += write_now;
    }

    bytes_written_ += written;
    return written;
  }

 private:
  // The output file descriptor.
  int fd_;
  // The destination extents for the data.
  const ExtentList& tgt_;
  size_t block_size_;
  // The next extent that we should write to.
  size_t next_extent_;
  // The byte offset of the next write within the current extent.
  uint64_t current_offset_;
  // The number of bytes to write before moving to the next extent.
  uint64_t current_extent_left_;
  // Total bytes written by the writer.
  uint64_t bytes_written_;
};

bool ParseExtents(const google::protobuf::RepeatedPtrField<Extent>& extents, ExtentList* list) {
  list->Clear();
  for (const auto& extent : extents) {
    if (!list->PushBack(BlockExtent(extent.start_block(), extent.num_blocks()))) {
      list->Clear();
      return false;
    }
  }
  return true;
}

std::string OperationTypeName(int type) {
  if (!InstallOperation::Type_IsValid(type)) {
    return "UNKNOWN";
  }
  return InstallOperation::Type_Name(static_cast<InstallOperation::Type>(type));
}

// Fails unless [offset, offset + length) lies within the file behind |fd|.
static CauseCode CheckReadRange(int fd, uint64_t offset, uint64_t length, const char* what) {
  struct stat sb;
  if (fstat(fd, &sb) == -1) {
    PLOG(ERROR) << "Failed to stat " << what;
    return kFreadFailure;
  }
  uint64_t file_size = sb.st_size;
  if (offset > file_size || length > file_size - offset) {
    LOG(ERROR) << "Reading " << length << " bytes at " << offset << " runs past the end of "
               << what << " (" << file_size << " bytes)";
    return kFreadFailure;
  }
  return kNoCause;
}

// Reads the data blob of |op| into |data| and checks it against the declared hash.
static CauseCode ReadOperationData(const OperationParameters& params, const InstallOperation& op,
                                   std::vector<uint8_t>* data) {
  if (op.data_offset() > UINT64_MAX - params.data_offset) {
    LOG(ERROR) << "Operation data offset overflow: " << op.data_offset();
    return kFreadFailure;
  }
  uint64_t offset = params.data_offset + op.data_offset();
  if (CauseCode cause = CheckReadRange(params.payload_fd, offset, op.data_length(), "payload");
      cause != kNoCause) {
    return cause;
  }

  data->resize(op.data_length());
  if (!data->empty() &&
      !android::base::ReadFullyAtOffset(params.payload_fd, data->data(), data->size(), offset)) {
    PLOG(ERROR) << "Failed to read " << data->size() << " bytes of operation data at " << offset;
    return kFreadFailure;
  }

  const std::string& expected = op.data_sha256_hash();
  if (!expected.empty()) {
    uint8_t digest[SHA256_DIGEST_LENGTH];
    SHA256(data->data(), data->size(), digest);
    if (expected.size() != SHA256_DIGEST_LENGTH ||
        memcmp(expected.data(), digest, SHA256_DIGEST_LENGTH) != 0) {
      LOG(ERROR) << "Operation data hash mismatch (expected "
                 << print_hex(reinterpret_cast<const uint8_t*>(expected.data()), expected.size())
                 << ", read " << print_hex(digest, SHA256_DIGEST_LENGTH) << ")";
      return kHashMismatch;
    }
  }
  return kNoCause;
}

static CauseCode ReadBlocks(const ExtentList& src, size_t block_size, int fd,
                            std::vector<uint8_t>* buffer) {
  for (const auto& extent : src) {
    if (extent.start_block + extent.num_blocks > UINT64_MAX / block_size) {
      LOG(ERROR) << "Source extent " << extent.start_block << "+" << extent.num_blocks
                 << " overflows a byte offset";
      return kFreadFailure;
    }
    if (CauseCode cause = CheckReadRange(fd, extent.ByteOffset(block_size),
                                         extent.ByteLength(block_size), "old image");
        cause != kNoCause) {
      return cause;
    }
  }

  buffer->resize(src.ByteLength(block_size));
  size_t p = 0;
  for (const auto& extent : src) {
    uint64_t offset = extent.ByteOffset(block_size);
    size_t size = extent.ByteLength(block_size);
    if (!android::base::ReadFullyAtOffset(fd, buffer->data() + p, size, offset)) {
      PLOG(ERROR) << "Failed to read " << size << " bytes of source data at " << offset;
      return kFreadFailure;
    }
    p += size;
  }
  return kNoCause;
}

// Writes |data| across the destination extents in order.
static CauseCode WriteBlocks(const ExtentList& tgt, size_t block_size, int fd,
                             const std::vector<uint8_t>& data) {
  ExtentWriter writer(fd, tgt, block_size);
  if (writer.Write(data.data(), data.size()) != data.size()) {
    return kFwriteFailure;
  }
  if (!writer.Finished()) {
    LOG(WARNING) << "Target extents " << tgt.ToString() << " not fully written: missing "
                 << writer.AvailableSpace() << " bytes";
  }
  return kNoCause;
}

// Writes all of |data| contiguously from the start of the first destination extent.
static CauseCode WriteAtFirstExtent(const ExtentList& tgt, size_t block_size, int fd,
                                   const std::vector<uint8_t>& data) {
  uint64_t offset = tgt[0].ByteOffset(block_size);
  if (data.size() != tgt.ByteLength(block_size)) {
    LOG(DEBUG) << "  writing " << data.size() << " bytes for " << tgt.ByteLength(block_size)
               << " bytes of target extents " << tgt.ToString();
  }
  if (!data.empty() && !android::base::WriteFullyAtOffset(fd, data.data(), data.size(), offset)) {
    PLOG(ERROR) << "Failed to write " << data.size() << " bytes at offset " << offset;
    return kFwriteFailure;
  }
  return kNoCause;
}

static CauseCode LoadTargetExtents(const InstallOperation& op, ExtentList* tgt) {
  if (!ParseExtents(op.dst_extents(), tgt) || !*tgt) {
    LOG(ERROR) << "Missing or invalid target extents for " << OperationTypeName(op.type());
    return kInvalidExtents;
  }
  return kNoCause;
}

// Loads the source blocks of a differential operation from the old image.
static CauseCode LoadSourceBlocks(const OperationParameters& params, const InstallOperation& op,
                                  std::vector<uint8_t>* buffer) {
  if (params.source_fd == -1) {
    LOG(ERROR) << OperationTypeName(op.type()) << " supported only for differential OTA";
    return kMissingOldImage;
  }

  ExtentList src;
  if (!ParseExtents(op.src_extents(), &src) || !src) {
    LOG(ERROR) << "Missing or invalid source extents for " << OperationTypeName(op.type());
    return kInvalidExtents;
  }
  if (!src.IsContiguous()) {
    LOG(DEBUG) << "Non-contiguous source extents: " << src.ToString();
  }
  return ReadBlocks(src, params.block_size, params.source_fd, buffer);
}

using Decompressor = CauseCode (*)(const uint8_t*, size_t, std::vector<uint8_t>*);

static CauseCode PerformOperationReplace(const OperationParameters& params,
                                         const InstallOperation& op,
                                         const std::vector<uint8_t>& data,
                                         Decompressor decompress) {
  ExtentList tgt;
  if (CauseCode cause = LoadTargetExtents(op, &tgt); cause != kNoCause) {
    return cause;
  }

  if (decompress == nullptr) {
    return WriteAtFirstExtent(tgt, params.block_size, params.target_fd, data);
  }

  std::vector<uint8_t> decompressed;
  if (CauseCode cause = decompress(data.data(), data.size(), &decompressed); cause != kNoCause) {
    LOG(ERROR) << "Failed to decompress " << data.size() << " bytes for "
               << OperationTypeName(op.type());
    return cause;
  }
  return WriteAtFirstExtent(tgt, params.block_size, params.target_fd, decompressed);
}

static CauseCode PerformOperationZero(const OperationParameters& params,
                                      const InstallOperation& op) {
  ExtentList tgt;
  if (CauseCode cause = LoadTargetExtents(op, &tgt); cause != kNoCause) {
    return cause;
  }

  std::vector<uint8_t> zeros(std::min<uint64_t>(tgt.ByteLength(params.block_size),
                                                kMaxZeroBufferSize));
  for (const auto& extent : tgt) {
    uint64_t offset = extent.ByteOffset(params.block_size);
    uint64_t remain = extent.ByteLength(params.block_size);
    while (remain > 0) {
      size_t write_now = std::min<uint64_t>(remain, zeros.size());
      if (!android::base::WriteFullyAtOffset(params.target_fd, zeros.data(), write_now, offset)) {
        PLOG(ERROR) << "Failed to write " << write_now << " zero bytes at " << offset;
        return kFwriteFailure;
      }
      offset += write_now;
      remain -= write_now;
    }
  }
  return kNoCause;
}

static CauseCode PerformOperationSourceCopy(const OperationParameters& params,
                                            const InstallOperation& op) {
  std::vector<uint8_t> buffer;
  if (CauseCode cause = LoadSourceBlocks(params, op, &buffer); cause != kNoCause) {
    return cause;
  }

  ExtentList tgt;
  if (CauseCode cause = LoadTargetExtents(op, &tgt); cause != kNoCause) {
    return cause;
  }
  return WriteBlocks(tgt, params.block_size, params.target_fd, buffer);
}

static CauseCode PerformOperationSourceBsdiff(const OperationParameters& params,
                                              const InstallOperation& op,
                                              const std::vector<uint8_t>& patch) {
  std::vector<uint8_t> buffer;
  if (CauseCode cause = LoadSourceBlocks(params, op, &buffer); cause != kNoCause) {
    return cause;
  }

  ExtentList tgt;
  if (CauseCode cause = LoadTargetExtents(op, &tgt); cause != kNoCause) {
    return cause;
  }

  BSDiffPatch parsed;
  if (CauseCode cause = ReadBSDiffPatch(patch.data(), patch.size(), &parsed); cause != kNoCause) {
    LOG(ERROR) << "Failed to read bsdiff patch of " << patch.size() << " bytes.";
    return cause;
  }
  if (static_cast<uint64_t>(parsed.new_size) > tgt.ByteLength(params.block_size)) {
    LOG(ERROR) << "bsdiff patch produces " << parsed.new_size << " bytes, but the target extents "
               << tgt.ToString() << " hold only " << tgt.ByteLength(params.block_size);
    return kPatchOverrun;
  }

  std::vector<uint8_t> patched;
  if (CauseCode cause = ApplyBSDiffPatch(buffer.data(), buffer.size(), parsed, &patched);
      cause != kNoCause) {
    LOG(ERROR) << "Failed to apply bsdiff patch.";
    return cause;
  }
  LOG(DEBUG) << "  patched " << buffer.size() << " source bytes to " << patched.size()
             << " bytes in " << tgt.ToString();
  return WriteBlocks(tgt, params.block_size, params.target_fd, patched);
}

CauseCode PerformInstallOperation(const OperationParameters& params, const InstallOperation& op) {
  CHECK_NE(params.block_size, static_cast<size_t>(0));

  std::vector<uint8_t> data;
  if (CauseCode cause = ReadOperationData(params, op, &data); cause != kNoCause) {
    return cause;
  }

  switch (op.type()) {
    case InstallOperation::REPLACE:
      return PerformOperationReplace(params, op, data, nullptr);
    case InstallOperation::REPLACE_BZ:
      return PerformOperationReplace(params, op, data, BZ2Decompress);
    case InstallOperation::REPLACE_XZ:
      return PerformOperationReplace(params, op, data, XZDecompress);
    case InstallOperation::ZSTD:
      return PerformOperationReplace(params, op, data, ZstdDecompress);
    case InstallOperation::ZERO:
      return PerformOperationZero(params, op);
    case InstallOperation::SOURCE_COPY:
      return PerformOperationSourceCopy(params, op);
    case InstallOperation::SOURCE_BSDIFF:
    case InstallOperation::BROTLI_BSDIFF:
      return PerformOperationSourceBsdiff(params, op, data);
    default:
      LOG(ERROR) << "Unsupported type = " << op.type() << " (" << OperationTypeName(op.type())
                 << ")";
      return kUnsupportedOperationType;
  }
}
