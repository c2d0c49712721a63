/**
 * @file test_connection.cpp
 * @brief Unit tests for the display connection handle
 */

#include "fake_transport.h"

#include <clipwatch/connection.h>
#include <clipwatch/watcher.h>
#include <gtest/gtest.h>

using namespace clipwatch;
using namespace clipwatch::fake;

class ConnectionTest : public ::testing::Test {
protected:
  std::shared_ptr<FakeDisplay> display = std::make_shared<FakeDisplay>();

  std::unique_ptr<ConnectionHandle> open_connection() {
    auto conn = ConnectionHandle::open(make_fake_transport(display));
    EXPECT_TRUE(conn.is_ok());
    return std::move(conn).value();
  }
};

// ============================================================================
// Opening
// ============================================================================

TEST_F(ConnectionTest, OpenCreatesProxyWindowAndTransferProperty) {
  auto conn = open_connection();

  EXPECT_TRUE(conn->is_open());
  EXPECT_EQ(conn->window(), kProxyWindow);
  EXPECT_EQ(conn->transfer_property(), display->atom(kTransferPropertyName));
}

TEST_F(ConnectionTest, OpenWithoutTransportFails) {
  auto conn = ConnectionHandle::open(nullptr);
  ASSERT_TRUE(conn.is_error());
  EXPECT_EQ(conn.error().code, ErrorCode::ConnectionError);
}

TEST_F(ConnectionTest, WindowFailureClosesTransport) {
  display->fail_create_window = true;

  auto conn = ConnectionHandle::open(make_fake_transport(display));
  ASSERT_TRUE(conn.is_error());
  EXPECT_EQ(conn.error().code, ErrorCode::ConnectionError);
  EXPECT_EQ(display->close_calls, 1);
  EXPECT_EQ(display->destroy_window_calls, 0);
}

TEST_F(ConnectionTest, PropertyFailureDestroysWindow) {
  display->fail_intern.insert(kTransferPropertyName);

  auto conn = ConnectionHandle::open(make_fake_transport(display));
  ASSERT_TRUE(conn.is_error());
  EXPECT_EQ(conn.error().code, ErrorCode::ConnectionError);
  EXPECT_EQ(display->destroy_window_calls, 1);
  EXPECT_EQ(display->close_calls, 1);
}

// ============================================================================
// Teardown
// ============================================================================

TEST_F(ConnectionTest, CloseReleasesEverything) {
  auto conn = open_connection();
  conn->close();

  EXPECT_FALSE(conn->is_open());
  EXPECT_EQ(display->delete_property_calls, 1);
  EXPECT_EQ(display->destroy_window_calls, 1);
  EXPECT_EQ(display->destroyed_window, kProxyWindow);
  EXPECT_EQ(display->close_calls, 1);
}

TEST_F(ConnectionTest, CloseTwiceThenDestroyTearsDownOnce) {
  auto conn = open_connection();
  conn->close();
  conn->close();
  conn.reset();

  EXPECT_EQ(display->destroy_window_calls, 1);
  EXPECT_EQ(display->close_calls, 1);
}

TEST_F(ConnectionTest, DestructorTearsDown) {
  {
    auto conn = open_connection();
  }
  EXPECT_EQ(display->destroy_window_calls, 1);
  EXPECT_EQ(display->close_calls, 1);
}

TEST_F(ConnectionTest, TeardownOnceAfterEventStreamEnds) {
  auto conn = open_connection();
  {
    ClipboardWatcher watcher(*conn, [](const ClipboardRecord &) {
      return Result<void>::ok();
    });
    auto result = watcher.run();
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().code, ErrorCode::ConnectionLost);
  }
  EXPECT_EQ(display->close_calls, 0);

  conn.reset();
  EXPECT_EQ(display->delete_property_calls, 1);
  EXPECT_EQ(display->destroy_window_calls, 1);
  EXPECT_EQ(display->close_calls, 1);
}

TEST_F(ConnectionTest, TeardownOnceAfterTermination) {
  display->end_of_stream = ErrorCode::Terminated;
  display->offer_text(atom_names::kUtf8String, "pending");
  display->change_owner();

  auto conn = open_connection();
  {
    ClipboardWatcher watcher(*conn, [](const ClipboardRecord &) {
      return Result<void>::ok();
    });
    auto result = watcher.run();
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().code, ErrorCode::Terminated);
  }
  conn->close();
  conn.reset();

  EXPECT_EQ(display->destroy_window_calls, 1);
  EXPECT_EQ(display->close_calls, 1);
}

TEST_F(ConnectionTest, TeardownOnceWhenTerminatedMidConversion) {
  display->end_of_stream = ErrorCode::Terminated;
  display->withhold_replies = true;
  display->offer_text(atom_names::kUtf8String, "never delivered");
  display->change_owner();

  auto conn = open_connection();
  {
    int sink_calls = 0;
    ClipboardWatcher watcher(*conn, [&sink_calls](const ClipboardRecord &) {
      ++sink_calls;
      return Result<void>::ok();
    });
    auto result = watcher.run();
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().code, ErrorCode::Terminated);
    EXPECT_EQ(watcher.state(), WatcherState::Idle);
    EXPECT_EQ(sink_calls, 0);
  }
  ASSERT_EQ(display->conversions.size(), 1u);
  EXPECT_EQ(display->conversions[0], "TARGETS");
  EXPECT_EQ(display->close_calls, 0);

  conn.reset();

  // One delete before the TARGETS request, one at teardown
  EXPECT_EQ(display->delete_property_calls, 2);
  EXPECT_EQ(display->destroy_window_calls, 1);
  EXPECT_EQ(display->close_calls, 1);
}
