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

// The reconstruction loop follows bspatch.c from the bsdiff-4.3 distribution; the differences
// are that the patch streams are already decompressed in memory, and that every cursor is bounds
// checked instead of tolerating reads outside the old data.  Running payload_dumper with the
// --license option will display the bsdiff license notice.

#include <stdint.h>
#include <stdio.h>
#include <string.h>

#include <vector>

#include <android-base/logging.h>
#include <openssl/sha.h>

#include "applypatch/applypatch.h"
#include "otautil/print_hex.h"

void ShowBSDiffLicense() {
    puts("The bsdiff algorithm used herein is:\n"
         "\n"
         "Copyright 2003-2005 Colin Percival\n"
         "All rights reserved\n"
         "\n"
         "Redistribution and use in source and binary forms, with or without\n"
         "modification, are permitted providing that the following conditions\n"
         "are met:\n"
         "1. Redistributions of source code must retain the above copyright\n"
         "   notice, this list of conditions and the following disclaimer.\n"
         "2. Redistributions in binary form must reproduce the above copyright\n"
         "   notice, this list of conditions and the following disclaimer in the\n"
         "   documentation and/or other materials provided with the distribution.\n"
         "\n"
         "THIS SOFTWARE IS PROVIDED BY THE AUTHOR ``AS IS'' AND ANY EXPRESS OR\n"
         "IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE IMPLIED\n"
         "WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE\n"
         "ARE DISCLAIMED.  IN NO EVENT SHALL THE AUTHOR BE LIABLE FOR ANY\n"
         "DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR CONSEQUENTIAL\n"
         "DAMAGES (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF SUBSTITUTE GOODS\n"
         "OR SERVICES; LOSS OF USE, DATA, OR PROFITS; OR BUSINESS INTERRUPTION)\n"
         "HOWEVER CAUSED AND ON ANY THEORY OF LIABILITY, WHETHER IN CONTRACT,\n"
         "STRICT LIABILITY, OR TORT (INCLUDING NEGLIGENCE OR OTHERWISE) ARISING\n"
         "IN ANY WAY OUT OF THE USE OF THIS SOFTWARE, EVEN IF ADVISED OF THE\n"
         "POSSIBILITY OF SUCH DAMAGE.\n"
         "\n------------------\n\n"
         "This program uses Julian R Seward's \"libbzip2\" library, available\n"
         "from http://www.bzip.org/, and the Brotli library, available from\n"
         "https://github.com/google/brotli.\n"
        );
}

CauseCode ApplyBSDiffPatch(const uint8_t* old_data, size_t old_size, const BSDiffPatch& patch,
                           std::vector<uint8_t>* new_data) {
  CHECK_GE(patch.new_size, 0);
  uint64_t new_size = patch.new_size;
  // Every output byte comes from either the diff or the extra stream.
  if (new_size > patch.diff.size() + patch.extra.size()) {
    LOG(ERROR) << "Patch declares " << new_size << " output bytes, but carries only "
               << patch.diff.size() << " diff and " << patch.extra.size() << " extra bytes";
    return kPatchOverrun;
  }
  new_data->assign(new_size, 0);

  int64_t old_pos = 0;
  uint64_t new_pos = 0;
  size_t diff_pos = 0;
  size_t extra_pos = 0;
  for (size_t i = 0; i < patch.control.size(); i++) {
    const ControlEntry& entry = patch.control[i];
    if (entry.copy_length < 0 || entry.extra_length < 0) {
      LOG(ERROR) << "Negative length in control entry " << i << ": copy " << entry.copy_length
                 << ", extra " << entry.extra_length;
      return kPatchOverrun;
    }

    // Add the diff bytes to the aligned old bytes.
    uint64_t copy_len = entry.copy_length;
    if (copy_len > new_size - new_pos) {
      LOG(ERROR) << "Control entry " << i << " copies " << copy_len << " bytes past the end of "
                 << new_size << " output bytes";
      return kPatchOverrun;
    }
    if (copy_len > patch.diff.size() - diff_pos) {
      LOG(ERROR) << "Control entry " << i << " reads past the end of the diff stream";
      return kPatchOverrun;
    }
    if (copy_len > 0 && (old_pos < 0 || static_cast<uint64_t>(old_pos) > old_size ||
                         copy_len > old_size - old_pos)) {
      LOG(ERROR) << "Control entry " << i << " reads " << copy_len << " bytes at old offset "
                 << old_pos << ", outside " << old_size << " source bytes";
      return kPatchOverrun;
    }
    uint8_t* out = new_data->data() + new_pos;
    const uint8_t* diff = patch.diff.data() + diff_pos;
    const uint8_t* old = old_data + old_pos;
    for (uint64_t j = 0; j < copy_len; j++) {
      out[j] = static_cast<uint8_t>(diff[j] + old[j]);
    }
    new_pos += copy_len;
    diff_pos += copy_len;
    old_pos += copy_len;

    // Copy the extra bytes verbatim.
    uint64_t extra_len = entry.extra_length;
    if (extra_len > new_size - new_pos) {
      LOG(ERROR) << "Control entry " << i << " writes " << extra_len << " extra bytes past the "
                 << "end of " << new_size << " output bytes";
      return kPatchOverrun;
    }
    if (extra_len > patch.extra.size() - extra_pos) {
      LOG(ERROR) << "Control entry " << i << " reads past the end of the extra stream";
      return kPatchOverrun;
    }
    if (extra_len > 0) {
      memcpy(new_data->data() + new_pos, patch.extra.data() + extra_pos, extra_len);
    }
    new_pos += extra_len;
    extra_pos += extra_len;

    if ((entry.seek_offset > 0 && old_pos > INT64_MAX - entry.seek_offset) ||
        (entry.seek_offset < 0 && old_pos < INT64_MIN - entry.seek_offset)) {
      LOG(ERROR) << "Control entry " << i << " seeks out of range: " << entry.seek_offset;
      return kPatchOverrun;
    }
    old_pos += entry.seek_offset;
  }

  if (new_pos != new_size) {
    LOG(ERROR) << "bspatch produced " << new_pos << " bytes, expected " << new_size;
    return kPatchOverrun;
  }
  return kNoCause;
}

CauseCode ApplyBSDiffPatch(const uint8_t* old_data, size_t old_size, const uint8_t* patch_data,
                           size_t patch_size, std::vector<uint8_t>* new_data) {
  BSDiffPatch patch;
  CauseCode result = ReadBSDiffPatch(patch_data, patch_size, &patch);
  if (result == kNoCause) {
    result = ApplyBSDiffPatch(old_data, old_size, patch, new_data);
  }
  if (result != kNoCause) {
    LOG(ERROR) << "bspatch failed, result: " << result;
    // Print the SHA-256 of the patch in the case of a data error.
    if (result == kPatchOverrun || result == kTruncatedPatch || result == kDecompressionFailure) {
      uint8_t digest[SHA256_DIGEST_LENGTH];
      SHA256(patch_data, patch_size, digest);
      LOG(ERROR) << "Patch may be corrupted, size: " << patch_size
                 << ", SHA-256: " << print_hex(digest, SHA256_DIGEST_LENGTH);
    }
  }
  return result;
}
