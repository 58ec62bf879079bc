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

#include "payload_dumper_modes.h"

#include <getopt.h>
#include <stdio.h>
#include <unistd.h>

#include <filesystem>
#include <functional>
#include <string>
#include <system_error>
#include <vector>

#include <android-base/logging.h>
#include <android-base/parseint.h>
#include <android-base/strings.h>
#include <android-base/unique_fd.h>

#include "applypatch/applypatch.h"
#include "payload/partition_writer.h"
#include "payload/payload_file.h"
#include "payload/payload_metadata.h"
#include "payload/worker_pool.h"

using chromeos_update_engine::DeltaArchiveManifest;
using chromeos_update_engine::PartitionUpdate;

static void ListPartitions(const DeltaArchiveManifest& manifest) {
  printf("Available partitions in payload:\n");
  for (int i = 0; i < manifest.partitions_size(); i++) {
    const auto& partition = manifest.partitions(i);
    printf("  %d. %s (%d operations", i + 1, partition.partition_name().c_str(),
           partition.operations_size());
    if (partition.has_new_partition_info()) {
      printf(", %llu bytes", static_cast<unsigned long long>(partition.new_partition_info().size()));
    }
    printf(")\n");
  }
}

// Picks the partitions named in |images|, a comma-separated list, or all of them if it's empty.
// Names not in the manifest are logged and skipped.
static std::vector<const PartitionUpdate*> SelectPartitions(const DeltaArchiveManifest& manifest,
                                                            const std::string& images) {
  std::vector<const PartitionUpdate*> selected;
  if (images.empty()) {
    for (const auto& partition : manifest.partitions()) {
      selected.push_back(&partition);
    }
    return selected;
  }

  for (const auto& name : android::base::Split(images, ",")) {
    if (name.empty()) {
      continue;
    }
    const PartitionUpdate* partition;
    if (FindPartition(manifest, name, &partition) != kNoCause) {
      LOG(ERROR) << "Partition " << name << " not found in payload!";
      continue;
    }
    selected.push_back(partition);
  }
  return selected;
}

static int ExtractMode(const std::string& payload_path, const std::string& out_dir,
                       const std::string& old_dir, bool differential, const std::string& images,
                       bool list_only, size_t workers) {
  PayloadFile payload;
  if (CauseCode cause = PayloadFile::Locate(payload_path, &payload); cause != kNoCause) {
    LOG(ERROR) << "Failed to locate payload in " << payload_path << ": " << cause;
    return 2;
  }

  PayloadHeader header;
  DeltaArchiveManifest manifest;
  {
    android::base::unique_fd fd = payload.Open();
    if (fd == -1) {
      PLOG(ERROR) << "Failed to open " << payload_path;
      return 2;
    }
    if (CauseCode cause = ReadPayloadMetadata(fd.get(), payload.offset(), &header, &manifest);
        cause != kNoCause) {
      LOG(ERROR) << "Invalid payload " << payload_path << ": " << cause;
      return 2;
    }
  }

  if (list_only) {
    ListPartitions(manifest);
    return 0;
  }

  std::error_code ec;
  std::filesystem::create_directories(out_dir, ec);
  if (ec) {
    LOG(ERROR) << "Failed to create " << out_dir << ": " << ec.message();
    return 2;
  }

  ExtractOptions options;
  options.payload = payload;
  options.data_offset = header.data_offset();
  options.block_size = manifest.block_size();
  options.out_dir = out_dir;
  options.old_dir = old_dir;
  options.differential = differential;

  std::vector<std::function<PartitionResult()>> tasks;
  for (const PartitionUpdate* partition : SelectPartitions(manifest, images)) {
    tasks.emplace_back([partition, &options]() { return ExtractPartition(*partition, options); });
  }
  if (tasks.empty()) {
    LOG(ERROR) << "No partition to extract";
    return 1;
  }

  LOG(INFO) << "Starting extraction of " << tasks.size() << " partitions with " << workers
            << " workers";
  bool failed = false;
  for (const auto& result : RunInWorkerPool(tasks, workers)) {
    if (result) {
      LOG(INFO) << "Successfully extracted " << result.name;
    } else {
      LOG(ERROR) << result.name << " failed: " << result.message;
      failed = true;
    }
  }
  return failed ? 1 : 0;
}

static void Usage() {
  printf(
      "Usage: \n"
      "  payload_dumper [--out <dir>] [--diff [--old <dir>]] [--images <name>[,<name>...]]\n"
      "                 [--workers <n>] <payload.bin|ota.zip>\n\n"
      "    --out <dir>      directory for the extracted images (default: output)\n"
      "    --diff           apply a differential payload on top of the images in --old\n"
      "    --old <dir>      directory holding the original images (default: old)\n"
      "    --images <list>  comma-separated partitions to extract (default: all)\n"
      "    --workers <n>    number of partitions extracted in parallel (default: CPU count)\n\n"
      "list partitions\n"
      "  payload_dumper --list <payload.bin|ota.zip>\n\n"
      "show license\n"
      "  payload_dumper --license\n"
      "\n\n");
}

int payload_dumper_modes(int argc, char* argv[]) {
  static constexpr struct option OPTIONS[]{
    // clang-format off
    { "diff", no_argument, nullptr, 0 },
    { "images", required_argument, nullptr, 0 },
    { "license", no_argument, nullptr, 0 },
    { "list", no_argument, nullptr, 0 },
    { "old", required_argument, nullptr, 0 },
    { "out", required_argument, nullptr, 0 },
    { "workers", required_argument, nullptr, 0 },
    { nullptr, 0, nullptr, 0 },
    // clang-format on
  };

  std::string out_dir = "output";
  std::string old_dir = "old";
  std::string images;
  bool differential = false;
  bool list_only = false;
  size_t workers = DefaultWorkerCount();

  optind = 1;

  int arg;
  int option_index;
  while ((arg = getopt_long(argc, argv, "", OPTIONS, &option_index)) != -1) {
    switch (arg) {
      case 0: {
        std::string option = OPTIONS[option_index].name;
        if (option == "diff") {
          differential = true;
        } else if (option == "images") {
          images = optarg;
        } else if (option == "license") {
          ShowBSDiffLicense();
          return 0;
        } else if (option == "list") {
          list_only = true;
        } else if (option == "old") {
          old_dir = optarg;
        } else if (option == "out") {
          out_dir = optarg;
        } else if (option == "workers") {
          if (!android::base::ParseUint(optarg, &workers) || workers == 0) {
            LOG(ERROR) << "Invalid worker count: " << optarg;
            Usage();
            return 2;
          }
        }
        break;
      }
      case '?':
      default:
        LOG(ERROR) << "Invalid argument";
        Usage();
        return 2;
    }
  }

  if (optind + 1 != argc) {
    LOG(ERROR) << "Expected exactly one payload path";
    Usage();
    return 2;
  }

  return ExtractMode(argv[optind], out_dir, old_dir, differential, images, list_only, workers);
}
