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

#ifndef _PAYLOAD_TEST_UTIL_H
#define _PAYLOAD_TEST_UTIL_H

#include <endian.h>
#include <stdint.h>
#include <string.h>

#include <algorithm>
#include <string>
#include <utility>
#include <vector>

#include <android-base/file.h>
#include <android-base/logging.h>
#include <brotli/encode.h>
#include <bsdiff/bsdiff.h>
#include <bzlib.h>
#include <lzma.h>
#include <openssl/sha.h>
#include <zstd.h>

#include "applypatch/applypatch.h"
#include "update_metadata.pb.h"

using ExtentPairs = std::vector<std::pair<uint64_t, uint64_t>>;

inline std::string CompressBZ2(const std::string& data) {
  unsigned int size = data.size() + data.size() / 100 + 600;
  std::string out(size, '\0');
  CHECK_EQ(BZ_OK, BZ2_bzBuffToBuffCompress(out.data(), &size, const_cast<char*>(data.data()),
                                           data.size(), 9, 0, 0));
  out.resize(size);
  return out;
}

inline std::string DecompressBZ2(const std::string& data) {
  std::string out(data.size() * 8 + 1024, '\0');
  while (true) {
    unsigned int size = out.size();
    int ret = BZ2_bzBuffToBuffDecompress(out.data(), &size, const_cast<char*>(data.data()),
                                         data.size(), 0, 0);
    if (ret == BZ_OK) {
      out.resize(size);
      return out;
    }
    CHECK_EQ(BZ_OUTBUFF_FULL, ret);
    out.resize(out.size() * 2);
  }
}

inline std::string CompressBrotli(const std::string& data) {
  size_t size = std::max<size_t>(BrotliEncoderMaxCompressedSize(data.size()), 64);
  std::string out(size, '\0');
  CHECK(BrotliEncoderCompress(BROTLI_DEFAULT_QUALITY, BROTLI_DEFAULT_WINDOW, BROTLI_MODE_GENERIC,
                              data.size(), reinterpret_cast<const uint8_t*>(data.data()), &size,
                              reinterpret_cast<uint8_t*>(out.data())));
  out.resize(size);
  return out;
}

inline std::string CompressXZ(const std::string& data) {
  std::string out(lzma_stream_buffer_bound(data.size()), '\0');
  size_t out_pos = 0;
  CHECK_EQ(LZMA_OK, lzma_easy_buffer_encode(6, LZMA_CHECK_CRC64, nullptr,
                                            reinterpret_cast<const uint8_t*>(data.data()),
                                            data.size(), reinterpret_cast<uint8_t*>(out.data()),
                                            &out_pos, out.size()));
  out.resize(out_pos);
  return out;
}

inline std::string CompressZstd(const std::string& data) {
  std::string out(ZSTD_compressBound(data.size()), '\0');
  size_t size = ZSTD_compress(out.data(), out.size(), data.data(), data.size(), 3);
  CHECK(!ZSTD_isError(size)) << ZSTD_getErrorName(size);
  out.resize(size);
  return out;
}

// Compresses one BSDF2 sub-stream with the given algorithm id.
inline std::string CompressStream(uint8_t alg, const std::string& data) {
  switch (alg) {
    case kCompressorBZ2:
      return CompressBZ2(data);
    case kCompressorBrotli:
      return CompressBrotli(data);
    default:
      return data;
  }
}

inline std::string Sha256(const std::string& data) {
  uint8_t digest[SHA256_DIGEST_LENGTH];
  SHA256(reinterpret_cast<const uint8_t*>(data.data()), data.size(), digest);
  return std::string(reinterpret_cast<const char*>(digest), SHA256_DIGEST_LENGTH);
}

// bsdiff's sign-magnitude little-endian integer encoding.
inline std::string offtout(int64_t x) {
  uint64_t y = x < 0 ? -static_cast<uint64_t>(x) : static_cast<uint64_t>(x);
  std::string buf(8, '\0');
  for (size_t i = 0; i < 8; i++) {
    buf[i] = static_cast<char>((y >> (8 * i)) & 0xff);
  }
  if (x < 0) {
    buf[7] = static_cast<char>(buf[7] | 0x80);
  }
  return buf;
}

inline int64_t offtin(const std::string& buf, size_t pos) {
  const uint8_t* p = reinterpret_cast<const uint8_t*>(buf.data()) + pos;
  int64_t y = p[7] & 0x7f;
  for (int i = 6; i >= 0; i--) {
    y = y * 256 + p[i];
  }
  return (p[7] & 0x80) ? -y : y;
}

// The uncompressed streams of a bsdiff patch.
struct PatchStreams {
  std::vector<ControlEntry> control;
  std::string diff;
  std::string extra;
  int64_t new_size = 0;
};

inline std::string EncodeControl(const std::vector<ControlEntry>& control) {
  std::string out;
  for (const auto& entry : control) {
    out += offtout(entry.copy_length) + offtout(entry.extra_length) + offtout(entry.seek_offset);
  }
  return out;
}

// Serializes |streams| with the given magic, compressing each stream with its algorithm id.
inline std::string BuildPatch(const std::string& magic, uint8_t alg_control, uint8_t alg_diff,
                              uint8_t alg_extra, const PatchStreams& streams) {
  std::string control = CompressStream(alg_control, EncodeControl(streams.control));
  std::string diff = CompressStream(alg_diff, streams.diff);
  std::string extra = CompressStream(alg_extra, streams.extra);
  return magic + offtout(control.size()) + offtout(diff.size()) + offtout(streams.new_size) +
         control + diff + extra;
}

inline std::string BuildBSDF2Patch(uint8_t alg_control, uint8_t alg_diff, uint8_t alg_extra,
                                   const PatchStreams& streams) {
  std::string magic = "BSDF2";
  magic += static_cast<char>(alg_control);
  magic += static_cast<char>(alg_diff);
  magic += static_cast<char>(alg_extra);
  return BuildPatch(magic, alg_control, alg_diff, alg_extra, streams);
}

// Splits a "BSDIFF40" patch, as written by bsdiff::bsdiff(), into its uncompressed streams.
inline PatchStreams SplitLegacyPatch(const std::string& patch) {
  CHECK_GE(patch.size(), kBSDiffHeaderSize);
  CHECK_EQ(0, patch.compare(0, 8, "BSDIFF40"));
  int64_t control_len = offtin(patch, 8);
  int64_t diff_len = offtin(patch, 16);

  PatchStreams streams;
  streams.new_size = offtin(patch, 24);
  std::string control = DecompressBZ2(patch.substr(kBSDiffHeaderSize, control_len));
  CHECK_EQ(static_cast<size_t>(0), control.size() % 24);
  for (size_t i = 0; i < control.size(); i += 24) {
    streams.control.push_back(
        ControlEntry{ offtin(control, i), offtin(control, i + 8), offtin(control, i + 16) });
  }
  streams.diff = DecompressBZ2(patch.substr(kBSDiffHeaderSize + control_len, diff_len));
  streams.extra = DecompressBZ2(patch.substr(kBSDiffHeaderSize + control_len + diff_len));
  return streams;
}

// Produces a reference patch with bsdiff::bsdiff(), in the legacy "BSDIFF40" format.
inline std::string GenerateLegacyPatch(const std::string& old_data, const std::string& new_data) {
  TemporaryFile patch_file;
  CHECK_EQ(0, bsdiff::bsdiff(reinterpret_cast<const uint8_t*>(old_data.data()), old_data.size(),
                             reinterpret_cast<const uint8_t*>(new_data.data()), new_data.size(),
                             patch_file.path, nullptr));
  std::string patch;
  CHECK(android::base::ReadFileToString(patch_file.path, &patch));
  return patch;
}

inline std::string EncodeBE64(uint64_t value) {
  uint64_t be = htobe64(value);
  return std::string(reinterpret_cast<const char*>(&be), sizeof(be));
}

inline std::string EncodeBE32(uint32_t value) {
  uint32_t be = htobe32(value);
  return std::string(reinterpret_cast<const char*>(&be), sizeof(be));
}

// Serializes a version 2 payload: the header, |manifest|, |signature| and then the operation data.
inline std::string BuildPayload(const chromeos_update_engine::DeltaArchiveManifest& manifest,
                                const std::string& data, const std::string& signature = "") {
  std::string manifest_bytes;
  CHECK(manifest.SerializeToString(&manifest_bytes));
  return std::string("CrAU") + EncodeBE64(2) + EncodeBE64(manifest_bytes.size()) +
         EncodeBE32(signature.size()) + manifest_bytes + signature + data;
}

inline void AddExtents(const ExtentPairs& extents,
                       google::protobuf::RepeatedPtrField<chromeos_update_engine::Extent>* field) {
  for (const auto& [start_block, num_blocks] : extents) {
    auto* extent = field->Add();
    extent->set_start_block(start_block);
    extent->set_num_blocks(num_blocks);
  }
}

// Appends an operation to |partition| whose data blob is appended to |data|. The SHA-256 of the
// blob is recorded unless |with_hash| is false.
inline chromeos_update_engine::InstallOperation* AddOperation(
    chromeos_update_engine::PartitionUpdate* partition,
    chromeos_update_engine::InstallOperation::Type type, const std::string& blob,
    const ExtentPairs& dst_extents, const ExtentPairs& src_extents, std::string* data,
    bool with_hash = true) {
  auto* op = partition->add_operations();
  op->set_type(type);
  if (!blob.empty()) {
    op->set_data_offset(data->size());
    op->set_data_length(blob.size());
    if (with_hash) {
      op->set_data_sha256_hash(Sha256(blob));
    }
    data->append(blob);
  }
  AddExtents(dst_extents, op->mutable_dst_extents());
  AddExtents(src_extents, op->mutable_src_extents());
  return op;
}

#endif  // _PAYLOAD_TEST_UTIL_H
