/*
 * Copyright (c) 2025 dingodb.com, Inc. All Rights Reserved
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#ifndef TRACETREE_TEST_UNIT_HELPER_TEMP_DIR_H_
#define TRACETREE_TEST_UNIT_HELPER_TEMP_DIR_H_

#include <stdlib.h>

#include <filesystem>
#include <string>

#include "glog/logging.h"

namespace tracetree {
namespace test {

// A fresh directory under the system temp dir, removed on destruction.
class TempDir {
 public:
  TempDir() {
    std::string tmpl =
        (std::filesystem::temp_directory_path() / "tracetree_test_XXXXXX")
            .string();
    char* dir = ::mkdtemp(tmpl.data());
    CHECK(dir != nullptr) << "mkdtemp fail: " << tmpl;
    path_ = dir;
  }

  ~TempDir() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
  }

  TempDir(const TempDir&) = delete;
  TempDir& operator=(const TempDir&) = delete;

  const std::string& Path() const { return path_; }

  std::string File(const std::string& name) const {
    return (std::filesystem::path(path_) / name).string();
  }

 private:
  std::string path_;
};

}  // namespace test
}  // namespace tracetree

#endif  // TRACETREE_TEST_UNIT_HELPER_TEMP_DIR_H_
