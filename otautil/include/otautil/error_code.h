/*
 * Copyright (C) 2016 The Android Open Source Project
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

#ifndef _ERROR_CODE_H_
#define _ERROR_CODE_H_

#include <ostream>

enum CauseCode {
  kNoCause = -1,
  // Payload envelope.
  kInvalidHeader = 100,
  kManifestParseFailure,
  kPartitionNotFound,
  // Per-operation failures.
  kHashMismatch,
  kMissingOldImage,
  kUnsupportedOperationType,
  kInvalidExtents,
  kDecompressionFailure,
  // Embedded bsdiff / BSDF2 patches.
  kInvalidPatchMagic,
  kTruncatedPatch,
  kPatchOverrun,
  kUnsupportedCodec,
  // I/O.
  kFileOpenFailure,
  kFreadFailure,
  kFwriteFailure,
};

// Returns the name of the given cause, e.g. "HashMismatch".
const char* CauseCodeString(CauseCode cause);

std::ostream& operator<<(std::ostream& os, CauseCode cause);

#endif // _ERROR_CODE_H_
