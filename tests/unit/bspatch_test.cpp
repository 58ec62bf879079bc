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

#include <stdint.h>

#include <string>
#include <utility>
#include <vector>

#include <gtest/gtest.h>

#include "applypatch/applypatch.h"
#include "common/payload_test_util.h"

static CauseCode ApplyPatch(const std::string& old_data, const std::string& patch,
                            std::string* new_data) {
  std::vector<uint8_t> out;
  CauseCode cause = ApplyBSDiffPatch(reinterpret_cast<const uint8_t*>(old_data.data()),
                                     old_data.size(),
                                     reinterpret_cast<const uint8_t*>(patch.data()), patch.size(),
                                     &out);
  new_data->assign(out.begin(), out.end());
  return cause;
}

static CauseCode ReadPatch(const std::string& patch_data, BSDiffPatch* patch) {
  return ReadBSDiffPatch(reinterpret_cast<const uint8_t*>(patch_data.data()), patch_data.size(),
                         patch);
}

static PatchStreams RawStreams(std::vector<ControlEntry> control, const std::string& diff,
                               const std::string& extra, int64_t new_size) {
  PatchStreams streams;
  streams.control = std::move(control);
  streams.diff = diff;
  streams.extra = extra;
  streams.new_size = new_size;
  return streams;
}

static void GenerateImages(std::string* old_data, std::string* new_data) {
  old_data->clear();
  for (int i = 0; i < 2048; i++) {
    *old_data += "record " + std::to_string(i) + ": " + std::string(i % 13, 'a' + i % 26) + "\n";
  }
  // Shift, edit and extend the old content so that the patch needs copy, extra and seek steps.
  *new_data = "header v2\n" + old_data->substr(1000, 20000);
  for (size_t i = 0; i < new_data->size(); i += 97) {
    (*new_data)[i] = static_cast<char>((*new_data)[i] + 1);
  }
  *new_data += std::string(3000, 'z') + old_data->substr(0, 5000);
}

TEST(BSDiffPatchTest, ReadBSDiffPatch_invalid_magic) {
  BSDiffPatch patch;
  ASSERT_EQ(kInvalidPatchMagic, ReadPatch("XXXXXXXX" + std::string(24, '\0'), &patch));
  ASSERT_EQ(kInvalidPatchMagic, ReadPatch("BSDIFF41" + std::string(24, '\0'), &patch));
  ASSERT_EQ(kInvalidPatchMagic, ReadPatch("BSDF3" + std::string(27, '\0'), &patch));
}

TEST(BSDiffPatchTest, ApplyBSDiffPatch_invalid_magic_leaves_output_alone) {
  std::vector<uint8_t> out{ 'o', 'l', 'd' };
  std::string patch = "XXXXXXXX" + std::string(24, '\0');
  uint8_t old_data[] = { 'a' };
  ASSERT_EQ(kInvalidPatchMagic,
            ApplyBSDiffPatch(old_data, sizeof(old_data),
                             reinterpret_cast<const uint8_t*>(patch.data()), patch.size(), &out));
  ASSERT_EQ((std::vector<uint8_t>{ 'o', 'l', 'd' }), out);
}

TEST(BSDiffPatchTest, ReadBSDiffPatch_truncated) {
  BSDiffPatch patch;
  // Too short for the magic.
  ASSERT_EQ(kTruncatedPatch, ReadPatch("BSDF2", &patch));
  // Magic only.
  ASSERT_EQ(kTruncatedPatch, ReadPatch(std::string("BSDF2\0\0\0", 8), &patch));

  // The declared control and diff lengths exceed the patch.
  std::string header = std::string("BSDF2\0\0\0", 8) + offtout(100) + offtout(0) + offtout(0);
  ASSERT_EQ(kTruncatedPatch, ReadPatch(header + std::string(10, '\0'), &patch));
  header = std::string("BSDF2\0\0\0", 8) + offtout(24) + offtout(100) + offtout(0);
  ASSERT_EQ(kTruncatedPatch, ReadPatch(header + std::string(24 + 99, '\0'), &patch));

  // Negative lengths.
  header = std::string("BSDF2\0\0\0", 8) + offtout(-24) + offtout(0) + offtout(0);
  ASSERT_EQ(kTruncatedPatch, ReadPatch(header + std::string(24, '\0'), &patch));
  header = std::string("BSDF2\0\0\0", 8) + offtout(0) + offtout(0) + offtout(-1);
  ASSERT_EQ(kTruncatedPatch, ReadPatch(header, &patch));

  // A control stream that isn't a whole number of triplets.
  header = std::string("BSDF2\0\0\0", 8) + offtout(25) + offtout(0) + offtout(0);
  ASSERT_EQ(kTruncatedPatch, ReadPatch(header + std::string(25, '\0'), &patch));
}

TEST(BSDiffPatchTest, ReadBSDiffPatch_unsupported_codec) {
  BSDiffPatch patch;
  std::string patch_data = std::string("BSDF2\x03\0\0", 8) + offtout(0) + offtout(0) + offtout(0);
  ASSERT_EQ(kUnsupportedCodec, ReadPatch(patch_data, &patch));
}

TEST(BSDiffPatchTest, ReadBSDiffPatch_streams) {
  PatchStreams streams = RawStreams({ { 4, 3, 2 }, { 2, 0, -5 } }, "diffxx", "XYZ", 9);
  BSDiffPatch patch;
  ASSERT_EQ(kNoCause, ReadPatch(BuildBSDF2Patch(kCompressorNone, kCompressorBZ2,
                                                kCompressorBrotli, streams),
                                &patch));
  ASSERT_EQ(9, patch.new_size);
  ASSERT_EQ(static_cast<size_t>(2), patch.control.size());
  ASSERT_EQ(4, patch.control[0].copy_length);
  ASSERT_EQ(3, patch.control[0].extra_length);
  ASSERT_EQ(2, patch.control[0].seek_offset);
  ASSERT_EQ(2, patch.control[1].copy_length);
  ASSERT_EQ(0, patch.control[1].extra_length);
  ASSERT_EQ(-5, patch.control[1].seek_offset);
  ASSERT_EQ("diffxx", std::string(patch.diff.begin(), patch.diff.end()));
  ASSERT_EQ("XYZ", std::string(patch.extra.begin(), patch.extra.end()));
}

TEST(BSDiffPatchTest, ApplyBSDiffPatch_copy_extra_seek) {
  // Copy "abcd" + 1, insert "XYZ", skip "ef" and copy "gh" unchanged.
  std::string diff = { 1, 1, 1, 1, 0, 0 };
  std::string patch = BuildBSDF2Patch(kCompressorNone, kCompressorNone, kCompressorNone,
                                      RawStreams({ { 4, 3, 2 }, { 2, 0, 0 } }, diff, "XYZ", 9));
  std::string new_data;
  ASSERT_EQ(kNoCause, ApplyPatch("abcdefghij", patch, &new_data));
  ASSERT_EQ("bcdeXYZgh", new_data);
}

TEST(BSDiffPatchTest, ApplyBSDiffPatch_wraparound_add) {
  std::string diff = { static_cast<char>(0xff), static_cast<char>(0x80) };
  std::string patch = BuildBSDF2Patch(kCompressorNone, kCompressorNone, kCompressorNone,
                                      RawStreams({ { 2, 0, 0 } }, diff, "", 2));
  std::string new_data;
  ASSERT_EQ(kNoCause, ApplyPatch(std::string("\x61\x90", 2), patch, &new_data));
  ASSERT_EQ(std::string("\x60\x10", 2), new_data);
}

TEST(BSDiffPatchTest, ApplyBSDiffPatch_negative_seek) {
  std::string patch =
      BuildBSDF2Patch(kCompressorNone, kCompressorNone, kCompressorNone,
                      RawStreams({ { 2, 0, -2 }, { 2, 0, 0 } }, std::string(4, '\0'), "", 4));
  std::string new_data;
  ASSERT_EQ(kNoCause, ApplyPatch("ab", patch, &new_data));
  ASSERT_EQ("abab", new_data);
}

TEST(BSDiffPatchTest, ApplyBSDiffPatch_empty_output) {
  std::string patch = BuildBSDF2Patch(kCompressorBZ2, kCompressorBZ2, kCompressorBZ2,
                                      RawStreams({}, "", "", 0));
  std::string new_data = "stale";
  ASSERT_EQ(kNoCause, ApplyPatch("abc", patch, &new_data));
  ASSERT_EQ("", new_data);
}

TEST(BSDiffPatchTest, ApplyBSDiffPatch_overrun) {
  auto apply = [](const std::string& old_data, const PatchStreams& streams) {
    std::string new_data;
    return ApplyPatch(old_data,
                      BuildBSDF2Patch(kCompressorNone, kCompressorNone, kCompressorNone, streams),
                      &new_data);
  };
  std::string zeros(8, '\0');

  // Copy past the end of the output.
  ASSERT_EQ(kPatchOverrun, apply("abcdefgh", RawStreams({ { 8, 0, 0 } }, zeros, "", 4)));
  // Copy past the end of the diff stream.
  ASSERT_EQ(kPatchOverrun,
            apply("abcdefgh", RawStreams({ { 8, 0, 0 } }, std::string(2, '\0'), "", 8)));
  // Copy past the end of the old data.
  ASSERT_EQ(kPatchOverrun, apply("abcd", RawStreams({ { 8, 0, 0 } }, zeros, "", 8)));
  // Seek before the start of the old data, then copy.
  ASSERT_EQ(kPatchOverrun,
            apply("abcdefgh", RawStreams({ { 2, 0, -4 }, { 2, 0, 0 } }, zeros, "", 4)));
  // Extra bytes past the end of the extra stream.
  ASSERT_EQ(kPatchOverrun, apply("abcdefgh", RawStreams({ { 0, 4, 0 } }, "", "XY", 4)));
  // Extra bytes past the end of the output.
  ASSERT_EQ(kPatchOverrun, apply("abcdefgh", RawStreams({ { 0, 4, 0 } }, "", "WXYZ", 2)));
  // Negative lengths.
  ASSERT_EQ(kPatchOverrun, apply("abcdefgh", RawStreams({ { -1, 0, 0 } }, zeros, "", 0)));
  ASSERT_EQ(kPatchOverrun, apply("abcdefgh", RawStreams({ { 0, -1, 0 } }, zeros, "", 0)));
  // The control entries produce fewer bytes than declared.
  ASSERT_EQ(kPatchOverrun, apply("abcdefgh", RawStreams({ { 4, 0, 0 } }, zeros, "", 8)));
}

TEST(BSDiffPatchTest, ApplyBSDiffPatch_huge_declared_size) {
  const uint8_t old_data[] = { 'a', 'b', 'c', 'd' };
  BSDiffPatch patch;
  patch.new_size = INT64_MAX;
  std::vector<uint8_t> out;
  ASSERT_EQ(kPatchOverrun, ApplyBSDiffPatch(old_data, sizeof(old_data), patch, &out));

  std::string new_data;
  ASSERT_EQ(kPatchOverrun,
            ApplyPatch("abcd",
                       BuildBSDF2Patch(kCompressorNone, kCompressorNone, kCompressorNone,
                                       RawStreams({ { 4, 0, 0 } }, std::string(4, '\0'), "",
                                                  1LL << 62)),
                       &new_data));
}

TEST(BSDiffPatchTest, ApplyBSDiffPatch_legacy_reference_patch) {
  std::string old_data;
  std::string new_data;
  GenerateImages(&old_data, &new_data);

  std::string patch = GenerateLegacyPatch(old_data, new_data);
  ASSERT_EQ("BSDIFF40", patch.substr(0, 8));

  std::string patched;
  ASSERT_EQ(kNoCause, ApplyPatch(old_data, patch, &patched));
  ASSERT_EQ(new_data, patched);
}

TEST(BSDiffPatchTest, ApplyBSDiffPatch_BSDF2_reference_patch_all_compressors) {
  std::string old_data;
  std::string new_data;
  GenerateImages(&old_data, &new_data);
  PatchStreams streams = SplitLegacyPatch(GenerateLegacyPatch(old_data, new_data));

  for (uint8_t alg_control : { kCompressorNone, kCompressorBZ2, kCompressorBrotli }) {
    for (uint8_t alg_diff : { kCompressorNone, kCompressorBZ2, kCompressorBrotli }) {
      for (uint8_t alg_extra : { kCompressorNone, kCompressorBZ2, kCompressorBrotli }) {
        SCOPED_TRACE(std::to_string(alg_control) + "," + std::to_string(alg_diff) + "," +
                     std::to_string(alg_extra));
        std::string patched;
        ASSERT_EQ(kNoCause,
                  ApplyPatch(old_data, BuildBSDF2Patch(alg_control, alg_diff, alg_extra, streams),
                             &patched));
        ASSERT_EQ(new_data, patched);
      }
    }
  }
}
