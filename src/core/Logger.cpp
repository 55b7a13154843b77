/* @file Logger.cpp
 * @brief worker thread drains the event ring into a CSV file
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <chrono>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <system_error>

// bangbang headers
#include "core/Logger.hpp"
#include "core/RingBuffer.hpp"

using namespace bangbang::core;

namespace {
  constexpr auto kPollInterval = std::chrono::milliseconds{ 10 };
  constexpr const char* kCsvHeader = "timestamp_ms,event,from,to,detail\n";
} // namespace

Logger::Logger(std::size_t capacity) : capacity_{ capacity } {}

Logger::~Logger() { finishRun(); }

void Logger::startNewRun(const std::string& csvPath) {
  if (running_)
    finishRun();

  if (!csvFile_.open(csvPath))
    throw std::runtime_error("[Logger] cannot open run log: " + csvPath);
  if (!csvFile_.write(kCsvHeader)) {
    csvFile_.close();
    throw std::runtime_error("[Logger] cannot write run log header: " + csvPath);
  }

  // the ring outlives runs so a late producer never sees it freed
  if (!buffer_)
    buffer_ = std::make_unique<RingBuffer<LogEvent>>(capacity_);

  running_ = true;
  try {
    worker_ = std::thread([this] { workerLoop(); });
  } catch (const std::system_error& e) {
    running_ = false;
    csvFile_.close();
    throw std::runtime_error(std::string("[Logger] cannot start worker thread: ") + e.what());
  }
}

void Logger::log(const LogEvent& event) noexcept {
  if (!running_.load(std::memory_order_acquire) || !buffer_)
    return;
  buffer_->tryPush(event);
}

void Logger::finishRun() {
  if (!running_.exchange(false))
    return;

  if (worker_.joinable())
    worker_.join();

  if (!drain())
    std::cerr << "[Logger] final drain failed, run log is incomplete\n";
  csvFile_.close();
}

std::size_t Logger::dropped() const { return buffer_ ? buffer_->dropped() : 0; }

std::string Logger::formatLine(const LogEvent& event) {
  std::ostringstream os;
  os << event.timestamp.count() << ',' << toString(event.kind) << ',' << toString(event.from)
     << ',' << toString(event.to) << ',' << event.detail;
  return os.str();
}

void Logger::workerLoop() {
  while (running_.load(std::memory_order_acquire)) {
    if (!drain())
      std::cerr << "[Logger] write to run log failed\n";
    std::this_thread::sleep_for(kPollInterval);
  }
}

bool Logger::drain() {
  bool ok = true;
  while (auto event = buffer_->tryPop())
    ok = csvFile_.write(formatLine(*event) + '\n') && ok;
  return csvFile_.flush() && ok;
}
