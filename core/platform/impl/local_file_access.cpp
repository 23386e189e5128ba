/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "platform/impl/local_file_access.hpp"

#include <boost/filesystem/operations.hpp>
#include <fstream>

#include "platform/file_access_error.hpp"

namespace vegam::platform {
  namespace fs = boost::filesystem;

  namespace {
    class LocalFileWriter : public FileWriter {
     public:
      explicit LocalFileWriter(std::ofstream file) : file_{std::move(file)} {}

      outcome::result<void> write(BytesIn bytes) override {
        if (!file_.is_open()
            || !file_
                    .write(common::span::bytestr(bytes.data()),
                           static_cast<std::streamsize>(bytes.size()))
                    .good()) {
          return FileAccessError::kWriteError;
        }
        return outcome::success();
      }

      outcome::result<void> close() override {
        if (!file_.is_open()) {
          return outcome::success();
        }
        file_.close();
        if (file_.fail()) {
          return FileAccessError::kWriteError;
        }
        return outcome::success();
      }

     private:
      std::ofstream file_;
    };
  }  // namespace

  LocalFileAccess::LocalFileAccess()
      : logger_{common::createLogger("FileAccess")} {}

  outcome::result<std::string> LocalFileAccess::fileName(
      const std::string &path) const {
    auto name{fs::path{path}.filename()};
    if (name.empty() || name == "." || name == "..") {
      return FileAccessError::kReadError;
    }
    return name.string();
  }

  outcome::result<uint64_t> LocalFileAccess::fileSize(
      const std::string &path) const {
    boost::system::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
      return FileAccessError::kReadError;
    }
    auto size{fs::file_size(path, ec)};
    if (ec) {
      logger_->warn("file_size {}: {}", path, ec.message());
      return FileAccessError::kReadError;
    }
    return size;
  }

  outcome::result<Bytes> LocalFileAccess::readAll(
      const std::string &path) const {
    boost::system::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
      logger_->warn("{} is not a regular file", path);
      return FileAccessError::kReadError;
    }
    std::ifstream file{path, std::ios::binary | std::ios::ate};
    auto size{file.tellg()};
    if (!file.good() || size < 0) {
      logger_->warn("cannot open {} for reading", path);
      return FileAccessError::kReadError;
    }
    Bytes result;
    result.resize(static_cast<size_t>(size));
    file.seekg(0, std::ios::beg);
    if (!file.read(common::span::bytestr(result.data()),
                   static_cast<std::streamsize>(result.size()))) {
      return FileAccessError::kReadError;
    }
    return result;
  }

  outcome::result<std::unique_ptr<FileWriter>> LocalFileAccess::openForWrite(
      const std::string &path) const {
    fs::path fs_path{path};
    boost::system::error_code ec;
    if (fs_path.has_parent_path()) {
      fs::create_directories(fs_path.parent_path(), ec);
      if (ec) {
        logger_->warn("create_directories {}: {}",
                      fs_path.parent_path().string(),
                      ec.message());
        return FileAccessError::kWriteError;
      }
    }
    std::ofstream file{path, std::ios::binary | std::ios::trunc};
    if (!file.good()) {
      logger_->warn("cannot open {} for writing", path);
      return FileAccessError::kWriteError;
    }
    return std::make_unique<LocalFileWriter>(std::move(file));
  }
}  // namespace vegam::platform
