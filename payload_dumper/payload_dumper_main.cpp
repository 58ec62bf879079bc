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

#include <android-base/logging.h>

#include "payload_dumper_modes.h"

// This program (payload_dumper) extracts the partition images carried by an A/B OTA payload,
// either a bare payload.bin or an OTA package holding one. Differential payloads are applied on
// top of the prior images found in the --old directory.
//
// See the comments to payload_dumper_modes() function.

int main(int argc, char** argv) {
  android::base::InitLogging(argv, &android::base::StderrLogger);
  return payload_dumper_modes(argc, argv);
}
