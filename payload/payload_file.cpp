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

#include "payload/payload_file.h"

#include <fcntl.h>
#include <string.h>
#include <sys/stat.h>
#include <unistd.h>

#include <string>

#include <android-base/file.h>
#include <android-base/logging.h>
#include <android-base/unique_fd.h>
#include <ziparchive/zip_archive.h>

static constexpr const char* kPayloadEntryName = "payload.bin";
static constexpr uint8_t kZipLocalFileSignature[] = { 'P', 'K', 0x03, 0x04 };

CauseCode PayloadFile::Locate(const std::string& path, PayloadFile* payload) {
  android::base::unique_fd fd(TEMP_FAILURE_RETRY(open(path.c_str(), O_RDONLY | O_CLOEXEC)));
  if (fd == -1) {
    PLOG(ERROR) << "Failed to open " << path;
    return kFileOpenFailure;
  }

  struct stat sb;
  if (fstat(fd.get(), &sb) == -1) {
    PLOG(ERROR) << "Failed to stat " << path;
    return kFileOpenFailure;
  }
  uint64_t file_size = sb.st_size;

  uint8_t signature[sizeof(kZipLocalFileSignature)];
  if (file_size < sizeof(signature) ||
      !android::base::ReadFullyAtOffset(fd.get(), signature, sizeof(signature), 0) ||
      memcmp(signature, kZipLocalFileSignature, sizeof(signature)) != 0) {
    *payload = PayloadFile(path, 0, file_size);
    return kNoCause;
  }

  ZipArchiveHandle zip;
  if (int err = OpenArchive(path.c_str(), &zip); err != 0) {
    LOG(ERROR) << "Failed to open package " << path << ": " << ErrorCodeString(err);
    CloseArchive(zip);
    return kFileOpenFailure;
  }

  ZipEntry entry;
  if (int err = FindEntry(zip, kPayloadEntryName, &entry); err != 0) {
    LOG(ERROR) << "Failed to find " << kPayloadEntryName << " in " << path << ": "
               << ErrorCodeString(err);
    CloseArchive(zip);
    return kFileOpenFailure;
  }
  CloseArchive(zip);

  // The payload is read in place, which requires the entry to be stored uncompressed.
  if (entry.method != kCompressStored) {
    LOG(ERROR) << kPayloadEntryName << " in " << path << " is compressed (method "
               << entry.method << "); only stored payloads are supported";
    return kFileOpenFailure;
  }
  if (static_cast<uint64_t>(entry.offset) > file_size ||
      entry.uncompressed_length > file_size - entry.offset) {
    LOG(ERROR) << "Invalid " << kPayloadEntryName << " offset " << entry.offset << " in " << path;
    return kFileOpenFailure;
  }

  LOG(INFO) << "Found " << kPayloadEntryName << " at offset " << entry.offset << " in " << path;
  *payload = PayloadFile(path, entry.offset, entry.uncompressed_length);
  return kNoCause;
}

android::base::unique_fd PayloadFile::Open() const {
  return android::base::unique_fd(TEMP_FAILURE_RETRY(open(path_.c_str(), O_RDONLY | O_CLOEXEC)));
}
