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

#pragma once

#include <stddef.h>

#include <algorithm>
#include <atomic>
#include <functional>
#include <future>
#include <mutex>
#include <thread>
#include <utility>
#include <vector>

inline size_t DefaultWorkerCount() {
  return std::thread::hardware_concurrency() ?: 4;
}

// Runs |tasks| on up to |max_workers| threads. Each worker repeatedly claims the next unstarted
// task until none remain. Returns one result per task, in the order the tasks finished.
// Tasks report failure through their Result and must not throw.
template <typename Result>
std::vector<Result> RunInWorkerPool(const std::vector<std::function<Result()>>& tasks,
                                    size_t max_workers) {
  std::vector<Result> results;
  if (tasks.empty()) {
    return results;
  }

  size_t worker_count = std::min(std::max<size_t>(max_workers, 1), tasks.size());
  std::atomic<size_t> next_task(0);
  std::mutex results_lock;
  results.reserve(tasks.size());

  auto worker_func = [&tasks, &next_task, &results, &results_lock]() {
    for (size_t i = next_task++; i < tasks.size(); i = next_task++) {
      Result result = tasks[i]();
      std::lock_guard<std::mutex> lock(results_lock);
      results.push_back(std::move(result));
    }
  };

  std::vector<std::future<void>> workers;
  for (size_t n = 0; n < worker_count; n++) {
    workers.emplace_back(std::async(std::launch::async, worker_func));
  }
  for (auto& w : workers) {
    w.get();
  }
  return results;
}
