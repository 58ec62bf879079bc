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

#ifndef _PAYLOAD_DUMPER_MODES_H
#define _PAYLOAD_DUMPER_MODES_H

// Runs the payload_dumper command line. Returns 0 on success, 1 if any partition failed to
// extract, and 2 on usage errors or an unreadable payload.
int payload_dumper_modes(int argc, char* argv[]);

#endif
