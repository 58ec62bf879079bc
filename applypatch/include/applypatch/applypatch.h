/*
 * Copyright (C) 2008 The Android Open Source Project
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

#ifndef _APPLYPATCH_H
#define _APPLYPATCH_H

#include <stddef.h>
#include <stdint.h>

#include <vector>

#include "otautil/error_code.h"

// Compression algorithm ids of the BSDF2 sub-streams.
enum BSDiffCompressor : uint8_t {
  kCompressorNone = 0,
  kCompressorBZ2 = 1,
  kCompressorBrotli = 2,
};

// decompress.cpp

// Decompresses one sub-stream of a bsdiff patch with the given algorithm id (see
// BSDiffCompressor), replacing the contents of |out|. Returns kUnsupportedCodec for an unknown id.
CauseCode DecompressStream(uint8_t alg, const uint8_t* data, size_t size, std::vector<uint8_t>* out);

// Whole-buffer decoders. Each call owns its decoder state, so they are safe to call from
// concurrent workers. An empty input decodes to an empty output.
CauseCode BZ2Decompress(const uint8_t* data, size_t size, std::vector<uint8_t>* out);
CauseCode BrotliDecompress(const uint8_t* data, size_t size, std::vector<uint8_t>* out);
// Decodes a complete .xz (or legacy .lzma) stream.
CauseCode XZDecompress(const uint8_t* data, size_t size, std::vector<uint8_t>* out);
// Decodes exactly one Zstandard frame; trailing bytes are ignored.
CauseCode ZstdDecompress(const uint8_t* data, size_t size, std::vector<uint8_t>* out);

// bsdf2.cpp

// One step of the bsdiff reconstruction program.
struct ControlEntry {
  int64_t copy_length;
  int64_t extra_length;
  int64_t seek_offset;
};

// A parsed bsdiff patch, with all the sub-streams decompressed.
struct BSDiffPatch {
  int64_t new_size = 0;
  std::vector<ControlEntry> control;
  std::vector<uint8_t> diff;
  std::vector<uint8_t> extra;
};

// Magic (8 bytes) followed by three 8-byte lengths.
static constexpr size_t kBSDiffHeaderSize = 32;

// Parses the legacy "BSDIFF40" patch (all streams bzip2) or the "BSDF2" patch (per-stream
// algorithm ids in bytes 5-7) in (patch_data, patch_size) into |patch|.
CauseCode ReadBSDiffPatch(const uint8_t* patch_data, size_t patch_size, BSDiffPatch* patch);

// bspatch.cpp

void ShowBSDiffLicense();

// Reconstructs the new data from the source data (old_data, old_size) and a parsed patch. On
// success |new_data| holds exactly patch.new_size bytes.
CauseCode ApplyBSDiffPatch(const uint8_t* old_data, size_t old_size, const BSDiffPatch& patch,
                           std::vector<uint8_t>* new_data);

// Parses the bsdiff patch in (patch_data, patch_size) and applies it to (old_data, old_size).
// Nothing is written to |new_data| unless the patch parses.
CauseCode ApplyBSDiffPatch(const uint8_t* old_data, size_t old_size, const uint8_t* patch_data,
                           size_t patch_size, std::vector<uint8_t>* new_data);

#endif
