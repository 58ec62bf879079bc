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

#include "payload/partition_writer.h"

#include <fcntl.h>
#include <unistd.h>

#include <string>

#include <android-base/logging.h>
#include <android-base/stringprintf.h>
#include <android-base/unique_fd.h>

#include "payload/install_operation.h"

using chromeos_update_engine::PartitionUpdate;

static constexpr int kProgressInterval = 10;

const char* PartitionStateString(PartitionState state) {
  switch (state) {
    case PartitionState::kPending:
      return "pending";
    case PartitionState::kRunning:
      return "running";
    case PartitionState::kCompleted:
      return "completed";
    case PartitionState::kFailed:
      return "failed";
  }
  return "unknown";
}

std::string PartitionImagePath(const std::string& dir, const std::string& partition) {
  return dir + "/" + partition + ".img";
}

static PartitionResult& Fail(PartitionResult& result, CauseCode cause, const std::string& message) {
  result.state = PartitionState::kFailed;
  result.cause = cause;
  result.message = message;
  LOG(ERROR) << result.name << ": " << message;
  return result;
}

PartitionResult ExtractPartition(const PartitionUpdate& partition, const ExtractOptions& options) {
  PartitionResult result;
  result.name = partition.partition_name();
  result.state = PartitionState::kRunning;

  LOG(INFO) << "Processing " << result.name << " partition...";

  android::base::unique_fd payload_fd = options.payload.Open();
  if (payload_fd == -1) {
    return Fail(result, kFileOpenFailure, "failed to open " + options.payload.path());
  }

  std::string out_path = PartitionImagePath(options.out_dir, result.name);
  android::base::unique_fd target_fd(
      TEMP_FAILURE_RETRY(open(out_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644)));
  if (target_fd == -1) {
    PLOG(ERROR) << "Failed to open " << out_path;
    return Fail(result, kFileOpenFailure, "failed to open " + out_path);
  }

  android::base::unique_fd source_fd;
  if (options.differential) {
    std::string old_path = PartitionImagePath(options.old_dir, result.name);
    source_fd.reset(TEMP_FAILURE_RETRY(open(old_path.c_str(), O_RDONLY | O_CLOEXEC)));
    if (source_fd == -1) {
      // Operations that need the old image fail when they run.
      PLOG(WARNING) << "Original image " << old_path << " not available for differential OTA";
    }
  }

  OperationParameters params;
  params.payload_fd = payload_fd.get();
  params.data_offset = options.payload.offset() + options.data_offset;
  params.target_fd = target_fd.get();
  params.source_fd = source_fd.get();
  params.block_size = options.block_size;

  int total = partition.operations_size();
  for (int i = 0; i < total; i++) {
    const auto& op = partition.operations(i);
    if (CauseCode cause = PerformInstallOperation(params, op); cause != kNoCause) {
      return Fail(result, cause,
                  android::base::StringPrintf("operation %d (type %d, %s) failed: %s", i,
                                              static_cast<int>(op.type()),
                                              OperationTypeName(op.type()).c_str(),
                                              CauseCodeString(cause)));
    }
    int completed = i + 1;
    if (completed % kProgressInterval == 0 || completed == total) {
      LOG(INFO) << "  " << result.name << ": " << completed << "/" << total
                << " operations completed";
    }
  }

  if (fsync(target_fd.get()) == -1) {
    PLOG(ERROR) << "Failed to fsync " << out_path;
    return Fail(result, kFwriteFailure, "failed to sync " + out_path);
  }
  if (close(target_fd.release()) == -1) {
    PLOG(ERROR) << "Failed to close " << out_path;
    return Fail(result, kFwriteFailure, "failed to close " + out_path);
  }

  result.state = PartitionState::kCompleted;
  LOG(INFO) << "Finished processing " << result.name;
  return result;
}
