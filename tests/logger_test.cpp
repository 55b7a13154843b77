// bangbang-Prod headers
#include "core/Logger.hpp"
#include "core/RingBuffer.hpp"
#include "core/TimedOnOff.hpp"

// bangbang-Fake headers
#include "FakeTimeSource.hpp"

// GTest headers
#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace bangbang::test {

  using namespace std::chrono_literals;
  using core::LogEvent;
  using core::Logger;
  using core::RingBuffer;
  using core::State;

  TEST(ring_buffer, fifo_order_and_drop_counting) {
    RingBuffer<int> ring(2);
    EXPECT_TRUE(ring.empty());
    EXPECT_EQ(ring.capacity(), 2u);

    EXPECT_TRUE(ring.tryPush(1));
    EXPECT_TRUE(ring.tryPush(2));
    EXPECT_FALSE(ring.tryPush(3));
    EXPECT_EQ(ring.dropped(), 1u);

    EXPECT_EQ(ring.tryPop(), 1);
    EXPECT_TRUE(ring.tryPush(4));
    EXPECT_EQ(ring.tryPop(), 2);
    EXPECT_EQ(ring.tryPop(), 4);
    EXPECT_FALSE(ring.tryPop());
    EXPECT_TRUE(ring.empty());
  }

  TEST(logger, formats_csv_row) {
    LogEvent e{ 1234ms, LogEvent::Kind::Denied, State::Off, State::On, 66 };
    EXPECT_EQ(Logger::formatLine(e), "1234,denied,off,on,66");
  }

  class LoggerTest : public ::testing::Test {
  protected:
    void SetUp() override {
      path = std::filesystem::temp_directory_path() /
             ("bangbang_logger_" +
              std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()) + ".csv");
    }
    void TearDown() override { std::filesystem::remove(path); }

    std::string contents() const {
      std::ifstream in(path);
      std::stringstream ss;
      ss << in.rdbuf();
      return ss.str();
    }

    std::filesystem::path path;
  };

  TEST_F(LoggerTest, ignores_events_outside_a_run) {
    Logger log;
    log.log(LogEvent{});
    EXPECT_FALSE(log.running());
    EXPECT_EQ(log.dropped(), 0u);
  }

  TEST_F(LoggerTest, writes_controller_decisions_as_csv) {
    FakeTimeSource clock;
    core::TimedOnOff ctl(State::Off, core::DwellPolicy::symmetric(10ms), clock);

    Logger log;
    log.startNewRun(path.string());
    EXPECT_TRUE(log.running());
    ctl.attachSink(&log);

    clock.set(3ms);
    EXPECT_TRUE(ctl.bang());
    clock.set(10ms);
    EXPECT_FALSE(ctl.bang());

    log.finishRun();
    EXPECT_FALSE(log.running());

    EXPECT_EQ(contents(), "timestamp_ms,event,from,to,detail\n"
                          "3,denied,off,on,7\n"
                          "10,committed,off,on,0\n");
  }

  TEST_F(LoggerTest, full_ring_drops_instead_of_blocking) {
    Logger log(1);
    log.startNewRun(path.string());
    // the worker may or may not drain in between; at least the extra pushes
    // must not block and every event is either written or counted
    for (int i = 0; i < 50; ++i)
      log.log(LogEvent{ std::chrono::milliseconds{ i }, LogEvent::Kind::Committed, State::Off,
                        State::On, 0 });
    log.finishRun();

    std::istringstream rows(contents());
    std::string line;
    std::size_t written = 0;
    while (std::getline(rows, line))
      ++written;
    EXPECT_EQ(written - 1 + log.dropped(), 50u);
  }

  TEST_F(LoggerTest, unwritable_path_throws) {
    Logger log;
    EXPECT_THROW(log.startNewRun("/nonexistent-dir/bangbang/run.csv"), std::runtime_error);
    EXPECT_FALSE(log.running());
  }

  TEST_F(LoggerTest, failed_start_leaves_logger_reusable) {
    Logger log;
    EXPECT_THROW(log.startNewRun("/nonexistent-dir/bangbang/run.csv"), std::runtime_error);
    EXPECT_FALSE(log.running());

    // an event logged while stopped is neither queued nor counted
    log.log(LogEvent{});
    EXPECT_EQ(log.dropped(), 0u);

    log.startNewRun(path.string());
    EXPECT_TRUE(log.running());
    log.log(LogEvent{ 5ms, LogEvent::Kind::Committed, State::On, State::Off, 0 });
    log.finishRun();
    EXPECT_FALSE(log.running());
    EXPECT_EQ(contents(), "timestamp_ms,event,from,to,detail\n5,committed,on,off,0\n");
  }

} // namespace bangbang::test
