/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "common/file.hpp"

#include <fstream>

OUTCOME_CPP_DEFINE_CATEGORY(drand::common, FileError, e) {
  using E = drand::common::FileError;
  switch (e) {
    case E::kCannotRead:
      return "Cannot read file";
  }
  return "unknown FileError error code";
}

namespace drand::common {
  outcome::result<std::string> readFile(const boost::filesystem::path &path) {
    std::ifstream file{path.c_str(), std::ios::binary | std::ios::ate};
    if (file.good()) {
      std::string result;
      result.resize(file.tellg());
      file.seekg(0, std::ios::beg);
      if (file.read(result.data(), static_cast<ptrdiff_t>(result.size()))
              .good()) {
        return result;
      }
    }
    return FileError::kCannotRead;
  }
}  // namespace drand::common
