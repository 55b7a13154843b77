/* @file FileLogger.cpp
 * @brief buffered fwrite wrapper with RAII close
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <cerrno>
#include <cstring> // for strerror
#include <iostream>
#include <utility>

// bangbang headers
#include "io/FileLogger.hpp"

using namespace bangbang::io;

FileLogger::~FileLogger() { close(); }

FileLogger::FileLogger(FileLogger&& other) noexcept
    : fp_{ std::exchange(other.fp_, nullptr) }, buffer_{ std::move(other.buffer_) } {}

FileLogger& FileLogger::operator=(FileLogger&& other) noexcept {
  if (this != &other) {
    close();
    fp_ = std::exchange(other.fp_, nullptr);
    buffer_ = std::move(other.buffer_);
  }
  return *this;
}

bool FileLogger::open(const std::string& path) {
  close();

  fp_ = std::fopen(path.c_str(), "w");
  if (fp_ == nullptr) {
    std::cerr << "Error " << errno << " from fopen(" << path << "): " << strerror(errno) << "\n";
    return false;
  }
  buffer_.clear();
  buffer_.reserve(kChunkSize);
  return true;
}

bool FileLogger::write(const std::string& text) {
  if (fp_ == nullptr)
    return false;

  buffer_.insert(buffer_.end(), text.begin(), text.end());
  if (buffer_.size() < kChunkSize)
    return true;
  return flush();
}

bool FileLogger::flush() {
  if (fp_ == nullptr)
    return false;

  std::size_t total = 0;
  while (total < buffer_.size()) {
    const std::size_t chunk = std::min(kChunkSize, buffer_.size() - total);
    const std::size_t written = std::fwrite(buffer_.data() + total, 1, chunk, fp_);
    total += written;
    if (written != chunk) {
      std::cerr << "Error " << errno << " from fwrite: " << strerror(errno) << "\n";
      buffer_.erase(buffer_.begin(), buffer_.begin() + static_cast<std::ptrdiff_t>(total));
      return false;
    }
  }
  buffer_.clear();

  if (std::fflush(fp_) != 0) {
    std::cerr << "Error " << errno << " from fflush: " << strerror(errno) << "\n";
    return false;
  }
  return true;
}

void FileLogger::close() {
  if (fp_ == nullptr)
    return;

  const bool flushed = flush();
  if (std::fclose(fp_) != 0)
    std::cerr << "Error " << errno << " from fclose: " << strerror(errno) << "\n";
  else if (!flushed)
    std::cerr << "FileLogger: closed with unflushed data\n";
  fp_ = nullptr;
  buffer_.clear();
}
