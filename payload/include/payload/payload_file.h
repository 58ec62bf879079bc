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

#include <stdint.h>
#include <sys/types.h>

#include <string>
#include <utility>

#include <android-base/unique_fd.h>

#include "otautil/error_code.h"

// The location of a payload: either a raw payload file, or the stored "payload.bin" entry of an
// OTA package. The object itself holds no open handle; every reader calls Open() to get its own
// descriptor, so concurrent workers never share a file offset.
class PayloadFile {
 public:
  PayloadFile() : offset_(0), size_(0) {}

  PayloadFile(std::string path, off64_t offset, uint64_t size)
      : path_(std::move(path)), offset_(offset), size_(size) {}

  // Resolves the payload at |path|. A zip package must contain an uncompressed payload.bin.
  static CauseCode Locate(const std::string& path, PayloadFile* payload);

  // Opens a new read-only descriptor on the underlying file. Returns -1 (with errno set) on
  // failure.
  android::base::unique_fd Open() const;

  const std::string& path() const {
    return path_;
  }

  // Offset of the payload within the underlying file.
  off64_t offset() const {
    return offset_;
  }

  // Size of the payload: the file size for a raw payload, or the length of the zip entry.
  uint64_t size() const {
    return size_;
  }

  explicit operator bool() const {
    return !path_.empty();
  }

 private:
  std::string path_;
  off64_t offset_;
  uint64_t size_;
};
