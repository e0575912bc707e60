#include <gtest/gtest.h>

#include <algorithm>
#include <chrono>
#include <thread>
#include <vector>

#include "agent/agent.hpp"
#include "agent/handle.hpp"
#include "fake_engine.hpp"

using namespace ferry;
using namespace ferry::testing;
using namespace std::chrono_literals;

namespace {

std::shared_ptr<Handle> spawn_fake(const std::shared_ptr<FakeScript>& script, AgentConfig config = {}) {
  return Handle::spawn(config, [script] { return std::make_unique<FakeEngine>(script); });
}

ResponseFuture submit(Handle& handle, Request request, std::size_t buffer_size = 64 * 1024) {
  auto [handler, future] = RequestHandler::create(std::move(request.body), buffer_size);
  request.body = RequestBody();
  handle.submit(Transfer{std::move(request), std::move(handler)});
  return std::move(future);
}

}  // namespace

// --- AgentTest ---

TEST(AgentTest, ExecutesTransfer) {
  auto script = std::make_shared<FakeScript>();
  FakeResponse canned;
  canned.header_lines = {"Content-Type: text/plain", "X-Request: a"};
  canned.body = "hello world";
  script->respond("http://a.test/", canned);

  auto handle = spawn_fake(script);
  auto result = submit(*handle, Request::get("http://a.test/")).get();

  ASSERT_TRUE(result.ok()) << result.error->message();
  Response& response = *result.value;
  EXPECT_EQ(response.status(), 200);
  EXPECT_EQ(response.version(), HttpVersion::Http11);
  EXPECT_EQ(response.headers().get("content-type"), "text/plain");
  EXPECT_EQ(response.text(), "hello world");
}

TEST(AgentTest, HeldTransferStaysPending) {
  auto script = std::make_shared<FakeScript>();
  FakeResponse canned;
  canned.held = true;
  script->respond("http://slow.test/", canned);

  auto handle = spawn_fake(script);
  auto future = submit(*handle, Request::get("http://slow.test/"));

  // 响应头还没到
  EXPECT_FALSE(future.wait_for(50ms));
  EXPECT_FALSE(future.is_ready());

  script->release();
  ASSERT_TRUE(future.wait_for(5s));
  EXPECT_TRUE(future.get().ok());
}

TEST(AgentTest, ConcurrentTransfersGetDistinctTokens) {
  auto script = std::make_shared<FakeScript>();
  constexpr int kCount = 32;

  for (int i = 0; i < kCount; ++i) {
    FakeResponse canned;
    canned.body = "body-" + std::to_string(i);
    canned.held = true;
    script->respond("http://host" + std::to_string(i) + ".test/", canned);
  }

  auto handle = spawn_fake(script);

  std::vector<ResponseFuture> futures;
  for (int i = 0; i < kCount; ++i) {
    futures.push_back(submit(*handle, Request::get("http://host" + std::to_string(i) + ".test/")));
  }

  // All of them are in flight at the same time
  for (int i = 0; i < kCount; ++i) {
    ASSERT_TRUE(script->wait_for_event("add:" + std::to_string(i)));
  }
  EXPECT_EQ(script->max_active.load(), kCount);

  script->release();

  for (int i = 0; i < kCount; ++i) {
    auto result = futures[i].get();
    ASSERT_TRUE(result.ok());
    // No data from other transfers
    EXPECT_EQ(result.value->text(), "body-" + std::to_string(i));
  }

  // Completion is counted before the agent goes back to sleep
  for (int i = 0; i < 100 && handle->stats().completed.load() < kCount; ++i) {
    std::this_thread::sleep_for(10ms);
  }
  EXPECT_EQ(handle->stats().started.load(), static_cast<uint64_t>(kCount));
  EXPECT_EQ(handle->stats().completed.load(), static_cast<uint64_t>(kCount));
}

TEST(AgentTest, DelayedRequestBodyPausesFirst) {
  auto script = std::make_shared<FakeScript>();
  FakeResponse canned;
  canned.echo = true;
  script->respond("http://upload.test/", canned);

  auto handle = spawn_fake(script);

  auto [reader, writer] = make_pipe();
  auto future = submit(*handle, Request::post("http://upload.test/", RequestBody::from_reader(std::move(reader))));

  // Nothing to read yet, so the engine is told to pause
  ASSERT_TRUE(script->wait_for_event("read-pause:0"));
  EXPECT_FALSE(script->has_event("read-bytes:0"));

  // With the only transfer paused the agent sleeps instead of spinning
  uint64_t polls_before = handle->stats().polls.load();
  std::this_thread::sleep_for(200ms);
  EXPECT_LE(handle->stats().polls.load() - polls_before, 2u);
  EXPECT_FALSE(script->has_event("read-bytes:0"));

  // Satisfying the read fires the request waker, which resumes the transfer
  writer.write("delayed payload");
  writer.close();

  auto result = future.get();
  ASSERT_TRUE(result.ok());
  EXPECT_EQ(result.value->text(), "delayed payload");

  auto events = script->events();
  auto pause = std::find(events.begin(), events.end(), "read-pause:0");
  auto unpause = std::find(events.begin(), events.end(), "unpause-read:0");
  auto bytes = std::find(events.begin(), events.end(), "read-bytes:0");
  ASSERT_NE(unpause, events.end());
  ASSERT_NE(bytes, events.end());
  EXPECT_LT(pause, unpause);
  EXPECT_LT(unpause, bytes);
}

TEST(AgentTest, ResponseBackpressurePausesWrites) {
  auto script = std::make_shared<FakeScript>();
  FakeResponse canned;
  canned.body = std::string(4096, 'x');
  canned.chunk_size = 256;
  script->respond("http://big.test/", canned);

  auto handle = spawn_fake(script);
  auto result = submit(*handle, Request::get("http://big.test/"), 512).get();
  ASSERT_TRUE(result.ok());

  // The buffer fills up before anyone reads
  ASSERT_TRUE(script->wait_for_event("write-pause:0"));

  EXPECT_EQ(result.value->text(), canned.body);
  EXPECT_TRUE(script->has_event("unpause-write:0"));
}

TEST(AgentTest, DroppedFutureAbortsTransfer) {
  auto script = std::make_shared<FakeScript>();
  FakeResponse canned;
  canned.held = true;
  script->respond("http://drop.test/", canned);

  auto handle = spawn_fake(script);
  {
    auto future = submit(*handle, Request::get("http://drop.test/"));
    ASSERT_TRUE(script->wait_for_event("add:0"));
  }

  script->release();

  // The header callback sees the cancellation and asks the engine to abort;
  // the transfer is then removed normally
  EXPECT_TRUE(script->wait_for_event("abort:0"));
  EXPECT_TRUE(script->wait_for_event("remove:0"));
}

TEST(AgentTest, DroppedBodyAbortsTransfer) {
  auto script = std::make_shared<FakeScript>();
  FakeResponse canned;
  canned.body = std::string(8192, 'y');
  canned.chunk_size = 1024;
  script->respond("http://body.test/", canned);

  auto handle = spawn_fake(script);
  {
    auto result = submit(*handle, Request::get("http://body.test/"), 1024).get();
    ASSERT_TRUE(result.ok());
    // Response and body dropped unread
  }

  EXPECT_TRUE(script->wait_for_event("abort:0"));
  EXPECT_TRUE(script->wait_for_event("remove:0"));
}

TEST(AgentTest, TruncatedBodyReportsConnectionAborted) {
  auto script = std::make_shared<FakeScript>();
  FakeResponse canned;
  canned.header_lines = {"Content-Length: 100"};
  canned.body = "only part";
  canned.error = Error(ErrorKind::ResponseBodyError, "transfer closed with outstanding read data remaining");
  script->respond("http://short.test/", canned);

  auto handle = spawn_fake(script);
  auto result = submit(*handle, Request::get("http://short.test/")).get();
  ASSERT_TRUE(result.ok());

  char buf[64];
  std::string got;
  try {
    while (std::size_t n = result.value->body().read(buf, sizeof(buf))) {
      got.append(buf, n);
    }
    FAIL() << "expected a read error";
  } catch (const std::system_error& e) {
    EXPECT_EQ(e.code(), std::errc::connection_aborted);
  }
  EXPECT_EQ(got, "only part");
}

TEST(AgentTest, CompleteBodyReadsCleanly) {
  auto script = std::make_shared<FakeScript>();
  FakeResponse canned;
  canned.body = std::string(1000, 'z');
  script->respond("http://full.test/", canned);

  auto handle = spawn_fake(script);
  auto result = submit(*handle, Request::get("http://full.test/")).get();
  ASSERT_TRUE(result.ok());

  uint64_t total = 0;
  EXPECT_NO_THROW(total = result.value->body().consume());
  EXPECT_EQ(total, 1000u);
}

TEST(AgentTest, HandleDropResolvesOutstanding) {
  auto script = std::make_shared<FakeScript>();
  FakeResponse canned;
  canned.held = true;
  script->respond("http://never.test/", canned);

  auto handle = spawn_fake(script);
  auto future = submit(*handle, Request::get("http://never.test/"));
  ASSERT_TRUE(script->wait_for_event("add:0"));

  // Joins the agent thread
  handle.reset();

  ASSERT_TRUE(future.wait_for(1s));
  auto result = future.get();
  ASSERT_TRUE(result.failed());
  EXPECT_EQ(result.error->kind(), ErrorKind::Aborted);
}

TEST(AgentTest, RejectedTransferFailsAlone) {
  auto script = std::make_shared<FakeScript>();
  FakeResponse slow;
  slow.body = "still here";
  slow.held = true;
  script->respond("http://slow.test/", slow);

  FakeResponse bad;
  bad.reject = Error(ErrorKind::Engine, "curl_easy_setopt(CURLOPT_HTTP_VERSION): Unsupported protocol");
  script->respond("http://bad.test/", bad);

  FakeResponse fine;
  fine.body = "fine";
  script->respond("http://fine.test/", fine);

  auto handle = spawn_fake(script);
  auto pending = submit(*handle, Request::get("http://slow.test/"));
  ASSERT_TRUE(script->wait_for_event("add:0"));

  // 单个请求被拒绝，只影响它自己
  auto rejected = submit(*handle, Request::get("http://bad.test/")).get();
  ASSERT_TRUE(rejected.failed());
  EXPECT_EQ(rejected.error->kind(), ErrorKind::Engine);
  EXPECT_NE(rejected.error->message().find("Unsupported protocol"), std::string::npos);

  EXPECT_FALSE(pending.is_ready());
  EXPECT_EQ(handle->stats().rejected.load(), 1u);

  // The agent keeps accepting work
  auto later = submit(*handle, Request::get("http://fine.test/")).get();
  ASSERT_TRUE(later.ok()) << later.error->message();
  EXPECT_EQ(later.value->text(), "fine");

  script->release();
  ASSERT_TRUE(pending.wait_for(5s));
  auto result = pending.get();
  ASSERT_TRUE(result.ok()) << result.error->message();
  EXPECT_EQ(result.value->text(), "still here");
}

TEST(AgentTest, EngineFailureSurfacesAsAgentError) {
  auto script = std::make_shared<FakeScript>();
  script->fail_add = true;

  auto handle = spawn_fake(script);

  // The first transfer kills the agent; its future still resolves
  auto future = submit(*handle, Request::get("http://fail.test/"));
  auto result = future.get();
  ASSERT_TRUE(result.failed());
  EXPECT_EQ(result.error->kind(), ErrorKind::Aborted);

  std::string message;
  for (int i = 0; i < 100 && message.empty(); ++i) {
    try {
      auto next = submit(*handle, Request::get("http://fail.test/"));
      std::this_thread::sleep_for(10ms);
    } catch (const AgentError& e) {
      message = e.what();
    }
  }

  EXPECT_NE(message.find("agent thread terminated with error"), std::string::npos);
  EXPECT_NE(message.find("engine refused transfer"), std::string::npos);
}

TEST(AgentTest, EngineFactoryFailureIsRethrown) {
  AgentConfig config;
  EXPECT_THROW(Handle::spawn(config, []() -> std::unique_ptr<Engine> { throw std::runtime_error("no engine"); }),
               std::runtime_error);
}

// --- AgentLoopTest ---
// 直接驱动 Agent，可以向它发送任意消息

TEST(AgentLoopTest, UnpauseForUnknownTokenIsIgnored) {
  auto script = std::make_shared<FakeScript>();
  auto channel = std::make_shared<Channel<Message>>();
  auto stats = std::make_shared<AgentStats>();
  auto selector = std::make_unique<Selector>();
  Waker waker = selector->waker();

  std::thread thread([&, selector = std::move(selector)]() mutable {
    Agent agent(AgentConfig{}, std::make_unique<FakeEngine>(script), std::move(selector), channel, stats);
    agent.run();
  });

  channel->send(Message::unpause_read(42));
  channel->send(Message::unpause_write(7));

  auto [handler, future] = RequestHandler::create(RequestBody());
  channel->send(Message::execute(Transfer{Request::get("http://ok.test/"), std::move(handler)}));
  waker.wake();

  // The agent survived and still runs transfers
  auto result = future.get();
  EXPECT_TRUE(result.ok());

  channel->send(Message::close());
  waker.wake();
  thread.join();

  // Unknown tokens never reached the engine
  EXPECT_FALSE(script->has_event("unpause-read:42"));
  EXPECT_FALSE(script->has_event("unpause-write:7"));
  EXPECT_GE(stats->messages.load(), 4u);
}

TEST(AgentLoopTest, ClosedChannelStopsAgent) {
  auto script = std::make_shared<FakeScript>();
  auto channel = std::make_shared<Channel<Message>>();
  auto stats = std::make_shared<AgentStats>();

  std::thread thread([&]() {
    Agent agent(AgentConfig{}, std::make_unique<FakeEngine>(script), std::make_unique<Selector>(), channel, stats);
    agent.run();
  });

  // No close message: the disconnect alone ends the loop
  channel->close();
  thread.join();
  SUCCEED();
}
