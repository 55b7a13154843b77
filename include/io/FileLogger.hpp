#pragma once
/** @file  FileLogger.hpp
 *  @brief Buffered line writer for the run log on SD-card or host FS.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <cstddef>
#include <cstdio>
#include <string>
#include <vector>

namespace bangbang {
  namespace io {

    /**
 * @class FileLogger
 * @brief RAII wrapper that opens a file, buffers writes, and flushes on demand.
 *
 *  * Buffer is pushed to disk with `std::fwrite` in 4 kB chunks.
 *  * I/O failures are reported on std::cerr and via the bool returns.
 */
    class FileLogger {
    public:
      static constexpr std::size_t kChunkSize = 4096;

      FileLogger() = default;
      ~FileLogger(); ///< flush + fclose

      //---public API------------------------------------------------------
      /** Truncates/creates \p path. @returns false if it cannot be opened writable. */
      bool open(const std::string& path);

      /** Queues text (caller includes trailing '\n'); flushes once a chunk is full.
       *  @returns false if not open or an implied flush failed. */
      bool write(const std::string& text);

      /** Force-flush buffer to disk; returns true on success. */
      bool flush();

      void close();

      bool isOpen() const { return fp_ != nullptr; }

      //---non-copyable, move-enabled---------------------------------------
      FileLogger(const FileLogger&) = delete;
      FileLogger& operator=(const FileLogger&) = delete;
      FileLogger(FileLogger&& other) noexcept;
      FileLogger& operator=(FileLogger&& other) noexcept;

    private:
      std::FILE* fp_{ nullptr };
      std::vector<char> buffer_;
    };

  } // namespace io
} // namespace bangbang
