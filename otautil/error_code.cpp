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

#include "otautil/error_code.h"

const char* CauseCodeString(CauseCode cause) {
  switch (cause) {
    case kNoCause:
      return "NoCause";
    case kInvalidHeader:
      return "InvalidHeader";
    case kManifestParseFailure:
      return "ManifestParseFailure";
    case kPartitionNotFound:
      return "PartitionNotFound";
    case kHashMismatch:
      return "HashMismatch";
    case kMissingOldImage:
      return "MissingOldImage";
    case kUnsupportedOperationType:
      return "UnsupportedOperationType";
    case kInvalidExtents:
      return "InvalidExtents";
    case kDecompressionFailure:
      return "DecompressionFailure";
    case kInvalidPatchMagic:
      return "InvalidPatchMagic";
    case kTruncatedPatch:
      return "TruncatedPatch";
    case kPatchOverrun:
      return "PatchOverrun";
    case kUnsupportedCodec:
      return "UnsupportedCodec";
    case kFileOpenFailure:
      return "FileOpenFailure";
    case kFreadFailure:
      return "FreadFailure";
    case kFwriteFailure:
      return "FwriteFailure";
  }
  return "Unknown";
}

std::ostream& operator<<(std::ostream& os, CauseCode cause) {
  return os << CauseCodeString(cause);
}
