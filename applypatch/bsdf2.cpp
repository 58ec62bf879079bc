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

// The patch container is laid out as follows:
//
//   offset 0:  "BSDIFF40", or "BSDF2" followed by the control, diff and extra compressor ids
//   offset 8:  length of the compressed control stream
//   offset 16: length of the compressed diff stream
//   offset 24: length of the new file
//   offset 32: compressed control stream, then compressed diff stream, then the compressed
//              extra stream up to the end of the patch
//
// The control stream is a sequence of (copy length, extra length, seek offset) triplets.

#include <stdint.h>
#include <string.h>

#include <vector>

#include <android-base/logging.h>

#include "applypatch/applypatch.h"
#include "otautil/print_hex.h"

static constexpr const char kLegacyMagic[] = "BSDIFF40";
static constexpr const char kBSDF2Magic[] = "BSDF2";
static constexpr size_t kControlEntrySize = 24;

// Integers in a bsdiff patch are stored little-endian in sign-magnitude form.
static int64_t offtin(const uint8_t* buf) {
  int64_t y = buf[7] & 0x7F;
  for (int i = 6; i >= 0; i--) {
    y = y * 256 + buf[i];
  }
  if (buf[7] & 0x80) {
    y = -y;
  }
  return y;
}

CauseCode ReadBSDiffPatch(const uint8_t* patch_data, size_t patch_size, BSDiffPatch* patch) {
  if (patch_size < 8) {
    LOG(ERROR) << "Patch too short to contain a magic: " << patch_size << " bytes";
    return kTruncatedPatch;
  }

  uint8_t alg_control;
  uint8_t alg_diff;
  uint8_t alg_extra;
  if (memcmp(patch_data, kLegacyMagic, 8) == 0) {
    alg_control = alg_diff = alg_extra = kCompressorBZ2;
  } else if (memcmp(patch_data, kBSDF2Magic, 5) == 0) {
    alg_control = patch_data[5];
    alg_diff = patch_data[6];
    alg_extra = patch_data[7];
  } else {
    LOG(ERROR) << "Incorrect bsdiff/BSDF2 magic: " << print_hex(patch_data, 8);
    return kInvalidPatchMagic;
  }

  if (patch_size < kBSDiffHeaderSize) {
    LOG(ERROR) << "Patch too short to contain a header: " << patch_size << " bytes";
    return kTruncatedPatch;
  }

  int64_t control_len = offtin(patch_data + 8);
  int64_t diff_len = offtin(patch_data + 16);
  int64_t new_size = offtin(patch_data + 24);
  if (control_len < 0 || diff_len < 0 || new_size < 0) {
    LOG(ERROR) << "Corrupt patch header: control " << control_len << ", diff " << diff_len
               << ", new size " << new_size;
    return kTruncatedPatch;
  }

  size_t remaining = patch_size - kBSDiffHeaderSize;
  if (static_cast<uint64_t>(control_len) > remaining ||
      static_cast<uint64_t>(diff_len) > remaining - control_len) {
    LOG(ERROR) << "Patch declares " << control_len << " control bytes and " << diff_len
               << " diff bytes, but only " << remaining << " bytes follow the header";
    return kTruncatedPatch;
  }

  const uint8_t* control_start = patch_data + kBSDiffHeaderSize;
  const uint8_t* diff_start = control_start + control_len;
  const uint8_t* extra_start = diff_start + diff_len;
  size_t extra_len = remaining - control_len - diff_len;

  std::vector<uint8_t> control;
  if (CauseCode cause = DecompressStream(alg_control, control_start, control_len, &control);
      cause != kNoCause) {
    LOG(ERROR) << "Failed to decompress the control stream";
    return cause;
  }
  if (control.size() % kControlEntrySize != 0) {
    LOG(ERROR) << "Control stream of " << control.size() << " bytes is not a whole number of "
               << "entries";
    return kTruncatedPatch;
  }

  patch->control.clear();
  patch->control.reserve(control.size() / kControlEntrySize);
  for (size_t i = 0; i < control.size(); i += kControlEntrySize) {
    patch->control.push_back(ControlEntry{ offtin(control.data() + i),
                                           offtin(control.data() + i + 8),
                                           offtin(control.data() + i + 16) });
  }

  if (CauseCode cause = DecompressStream(alg_diff, diff_start, diff_len, &patch->diff);
      cause != kNoCause) {
    LOG(ERROR) << "Failed to decompress the diff stream";
    return cause;
  }
  if (CauseCode cause = DecompressStream(alg_extra, extra_start, extra_len, &patch->extra);
      cause != kNoCause) {
    LOG(ERROR) << "Failed to decompress the extra stream";
    return cause;
  }

  patch->new_size = new_size;
  LOG(DEBUG) << "bsdiff patch: " << patch->control.size() << " control entries, "
             << patch->diff.size() << " diff bytes, " << patch->extra.size()
             << " extra bytes, new size " << new_size;
  return kNoCause;
}
