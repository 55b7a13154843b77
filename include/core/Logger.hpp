#pragma once
/** @file  Logger.hpp
 *  @brief Asynchronous CSV transition logger (runs its own worker thread).
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <atomic>
#include <cstddef>
#include <memory>
#include <string>
#include <thread>

#include "core/LogEvent.hpp"
#include "io/FileLogger.hpp"

namespace bangbang {
  namespace core {

    template <typename T> class RingBuffer; // forward decl to avoid heavy include

    /**
 * @class Logger
 * @brief EventSink that queues controller events and writes them as CSV.
 *
 *  * `log()` / `onEvent()` never block: full ring -> event dropped + counted.
 *  * Single producer: attach it to one controller thread at a time.
 *  * CSV columns: timestamp_ms,event,from,to,detail
 */
    class Logger : public EventSink {

    public:
      static constexpr std::size_t kDefaultCapacity = 256;

      explicit Logger(std::size_t capacity = kDefaultCapacity);
      ~Logger() override; ///< finishRun() if still running

      // --- public API ---
      /// open \p csvPath + launch worker thread; throws `std::runtime_error` on open failure
      void startNewRun(const std::string& csvPath);
      void log(const LogEvent& event) noexcept; ///< enqueue event (non-blocking)
      void finishRun();                         ///< drain + flush + join worker thread

      void onEvent(const LogEvent& event) noexcept override { log(event); }

      bool running() const { return running_.load(); }
      std::size_t dropped() const;

      /// One CSV row, no trailing newline.
      static std::string formatLine(const LogEvent& event);

      Logger(const Logger&) = delete;
      Logger& operator=(const Logger&) = delete;

    private:
      void workerLoop();
      bool drain();

      std::size_t capacity_;
      io::FileLogger csvFile_;
      std::unique_ptr<RingBuffer<LogEvent>> buffer_;
      std::thread worker_;
      std::atomic<bool> running_{ false };
    };

  } // namespace core
} // namespace bangbang
