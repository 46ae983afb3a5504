#include <gtest/gtest.h>

#include <thread>

#include "core/errors.h"
#include "io/request_pacer.h"
#include "io/scpi_client.h"
#include "test_support.h"

using namespace testing_support;
using std::chrono::milliseconds;
using Reply = FakeInstrument::Reply;

namespace {
std::string block_response(const std::string& header, const std::string& data, const std::string& tail) {
  return header + data + tail;
}
} // namespace

TEST(ScpiClient, parse_number) {
  EXPECT_DOUBLE_EQ(parse_scpi_number("TDIV 1.00E-03S"), 1e-3);
  EXPECT_DOUBLE_EQ(parse_scpi_number("C1:VDIV 2.00E-01V"), 0.2);
  EXPECT_DOUBLE_EQ(parse_scpi_number("C2:OFST -1.50E+00V"), -1.5);
  EXPECT_DOUBLE_EQ(parse_scpi_number("C1:VDIV 5.00E-02V\r\n"), 0.05);
  EXPECT_DOUBLE_EQ(parse_scpi_number("42"), 42.0) << "bare number";

  EXPECT_THROW(parse_scpi_number(""), ConnectionError);
  EXPECT_THROW(parse_scpi_number("TDIV"), ConnectionError);
  EXPECT_THROW(parse_scpi_number("TDIV fast"), ConnectionError);
  EXPECT_THROW(parse_scpi_number("TDIV INF"), ConnectionError);
  EXPECT_THROW(parse_scpi_number("TDIV 1E999S"), ConnectionError) << "overflows to infinity";
}

TEST(ScpiClient, async_queries_keep_order) {
  Scheduler sched;
  FakeInstrument fake(sched.executor(), [](const std::string& line) -> std::optional<Reply> {
    if (line == "A?") return Reply{"resp-A\n", milliseconds(30)};
    if (line == "B?") return Reply{"resp-B\n"};
    if (line == "C?") return Reply{"resp-C\r\n"};
    return std::nullopt;
  });
  ScpiClient client(sched.executor(), "127.0.0.1", fake.port());
  RequestPacer pacer(sched.executor());
  pacer.update(1e-3, 14);

  std::string a, b, c;
  std::vector<std::string> finished;
  auto query_a = [&]() -> asio::awaitable<void> {
    a = co_await client.asyncQuery("A?");
    finished.push_back("A");
  };
  auto query_b = [&]() -> asio::awaitable<void> {
    b = co_await client.asyncQuery("B?");
    finished.push_back("B");
  };
  auto paced_c = [&]() -> asio::awaitable<void> {
    co_await pacer.wait();
    co_await pacer.wait();  // pending for ~56 ms while A and B are on the wire
    c = co_await client.asyncQuery("C?");
    finished.push_back("C");
  };
  auto closer = [&]() -> asio::awaitable<void> {
    while (finished.size() < 3) co_await sleep_for(milliseconds(1));
    client.close();
  };

  asio::co_spawn(sched.executor(), fake.serve(), asio::detached);
  asio::co_spawn(sched.executor(), paced_c(), asio::detached);
  asio::co_spawn(sched.executor(), query_a(), asio::detached);
  asio::co_spawn(sched.executor(), query_b(), asio::detached);
  asio::co_spawn(sched.executor(), closer(), asio::detached);
  sched.run();

  EXPECT_EQ(a, "resp-A");
  EXPECT_EQ(b, "resp-B") << "B must not receive A's late answer";
  EXPECT_EQ(c, "resp-C") << "terminator stripped";
  EXPECT_EQ(finished, (std::vector<std::string>{"A", "B", "C"}));
  EXPECT_EQ(fake.received(), (std::vector<std::string>{"A?", "B?", "C?"}));
}

TEST(ScpiClient, waiting_caller_served_before_back_to_back_requests) {
  Scheduler sched;
  FakeInstrument fake(sched.executor(), [](const std::string& line) -> std::optional<Reply> {
    if (line == "H0?") return Reply{"h0\n", milliseconds(30)};
    return Reply{"ok\n"};
  });
  ScpiClient client(sched.executor(), "127.0.0.1", fake.port());
  bool hog_done = false, other_done = false;

  // no suspension between one response and the next request
  auto hog = [&]() -> asio::awaitable<void> {
    co_await client.asyncQuery("H0?");
    co_await client.asyncQuery("H1?");
    co_await client.asyncQuery("H2?");
    hog_done = true;
  };
  auto other = [&]() -> asio::awaitable<void> {
    while (!client.busy()) co_await Scheduler::yield();
    co_await client.asyncQuery("O?");
    other_done = true;
  };
  auto closer = [&]() -> asio::awaitable<void> {
    while (!hog_done || !other_done) co_await sleep_for(milliseconds(1));
    client.close();
  };

  asio::co_spawn(sched.executor(), fake.serve(), asio::detached);
  asio::co_spawn(sched.executor(), hog(), asio::detached);
  asio::co_spawn(sched.executor(), other(), asio::detached);
  asio::co_spawn(sched.executor(), closer(), asio::detached);
  sched.run();

  EXPECT_EQ(fake.received(), (std::vector<std::string>{"H0?", "O?", "H1?", "H2?"}));
  EXPECT_FALSE(client.busy());
}

TEST(ScpiClient, commands_have_no_response) {
  Scheduler sched;
  FakeInstrument fake(sched.executor(), [](const std::string& line) -> std::optional<Reply> {
    if (line == "TDIV?") return Reply{"TDIV 5.00E-04S\n"};
    return std::nullopt;
  });
  ScpiClient client(sched.executor(), "127.0.0.1", fake.port());
  std::string tdiv;

  auto task = [&]() -> asio::awaitable<void> {
    co_await client.asyncConnect();
    EXPECT_TRUE(client.isOpen());
    co_await client.asyncSend("TDIV 500US");
    tdiv = co_await client.asyncQuery("TDIV?");
    client.close();
  };
  asio::co_spawn(sched.executor(), fake.serve(), asio::detached);
  run_to_completion(sched, task());

  EXPECT_EQ(tdiv, "TDIV 5.00E-04S");
  EXPECT_EQ(fake.received(), (std::vector<std::string>{"TDIV 500US", "TDIV?"}));
}

TEST(ScpiClient, blocking_calls) {
  asio::io_context server_ctx;
  FakeInstrument fake(server_ctx.get_executor(), [](const std::string& line) -> std::optional<Reply> {
    if (line == "*IDN?") return Reply{"Siglent Technologies,SDS1202X-E,SDS1EBAC0L0098,7.6.1.15\n"};
    if (line == "TDIV?") return Reply{"TDIV 1.00E-03S\n"};
    return std::nullopt;
  });
  const int port = fake.port();
  asio::co_spawn(server_ctx, fake.serve(), asio::detached);
  std::thread server([&] { server_ctx.run(); });

  Scheduler sched;  // never run; blocking calls do not need it
  ScpiClient client(sched.executor(), "127.0.0.1", port);
  std::string idn, tdiv;
  try {
    idn = client.query("*IDN?");
    client.send("TDIV 1MS");
    tdiv = client.query("TDIV?");
  } catch (const std::exception& e) {
    ADD_FAILURE() << e.what();
  }
  client.close();
  server.join();

  EXPECT_EQ(idn, "Siglent Technologies,SDS1202X-E,SDS1EBAC0L0098,7.6.1.15");
  EXPECT_EQ(tdiv, "TDIV 1.00E-03S");
  EXPECT_EQ(fake.received(), (std::vector<std::string>{"*IDN?", "TDIV 1MS", "TDIV?"}));
}

TEST(ScpiClient, blocking_call_while_async_outstanding) {
  Scheduler sched;
  FakeInstrument fake(sched.executor(), [](const std::string& line) -> std::optional<Reply> {
    if (line == "SLOW?") return Reply{"done\n", milliseconds(30)};
    return Reply{"unexpected\n"};
  });
  ScpiClient client(sched.executor(), "127.0.0.1", fake.port());
  std::string slow;

  auto slow_query = [&]() -> asio::awaitable<void> {
    slow = co_await client.asyncQuery("SLOW?");
  };
  auto intruder = [&]() -> asio::awaitable<void> {
    while (!client.busy()) co_await Scheduler::yield();
    EXPECT_THROW(client.query("X?"), std::logic_error);
    EXPECT_THROW(client.send("X"), std::logic_error);
    EXPECT_THROW(client.connect(), std::logic_error);
    while (client.busy()) co_await sleep_for(milliseconds(1));
    client.close();
  };
  asio::co_spawn(sched.executor(), fake.serve(), asio::detached);
  asio::co_spawn(sched.executor(), slow_query(), asio::detached);
  asio::co_spawn(sched.executor(), intruder(), asio::detached);
  sched.run();

  EXPECT_EQ(slow, "done");
  EXPECT_EQ(fake.received(), (std::vector<std::string>{"SLOW?"})) << "nothing else hit the wire";
}

TEST(ScpiClient, block_query) {
  Scheduler sched;
  const std::string samples("\x01\x02\xff\x00", 4);
  FakeInstrument fake(sched.executor(), [&](const std::string& line) -> std::optional<Reply> {
    if (line == "C1:WF? DAT2") return Reply{block_response("C1:WF DAT2,#9000000004", samples, "\n\n")};
    if (line == "C1:VDIV?") return Reply{"C1:VDIV 2.00E-01V\n"};
    if (line == "SHORT?") return Reply{block_response("#13", "abc", "\n")};
    return std::nullopt;
  });
  ScpiClient client(sched.executor(), "127.0.0.1", fake.port());
  std::vector<uint8_t> wf, shortblock;
  std::string vdiv;

  auto task = [&]() -> asio::awaitable<void> {
    wf = co_await client.asyncQueryBlock("C1:WF? DAT2", 2);
    vdiv = co_await client.asyncQuery("C1:VDIV?");
    shortblock = co_await client.asyncQueryBlock("SHORT?");
    client.close();
  };
  asio::co_spawn(sched.executor(), fake.serve(), asio::detached);
  run_to_completion(sched, task());

  EXPECT_EQ(wf, (std::vector<uint8_t>{0x01, 0x02, 0xff, 0x00}));
  EXPECT_EQ(vdiv, "C1:VDIV 2.00E-01V") << "trailer consumed with the block";
  EXPECT_EQ(shortblock, (std::vector<uint8_t>{'a', 'b', 'c'}));
}

TEST(ScpiClient, malformed_block_header) {
  Scheduler sched;
  FakeInstrument fake(sched.executor(), [](const std::string&) -> std::optional<Reply> {
    return Reply{"WF #x1234\n"};
  });
  ScpiClient client(sched.executor(), "127.0.0.1", fake.port());
  bool threw = false;

  auto task = [&]() -> asio::awaitable<void> {
    try {
      co_await client.asyncQueryBlock("WF?");
    } catch (const ConnectionError&) {
      threw = true;
    }
  };
  asio::co_spawn(sched.executor(), fake.serve(), asio::detached);
  run_to_completion(sched, task());

  EXPECT_TRUE(threw);
  EXPECT_FALSE(client.isOpen());
}

TEST(ScpiClient, connection_refused) {
  Scheduler sched;
  const int port = unused_port(sched.context());
  ScpiClient client(sched.executor(), "127.0.0.1", port);

  EXPECT_THROW(client.connect(), ConnectionError);
  EXPECT_FALSE(client.isOpen());

  bool threw = false;
  auto task = [&]() -> asio::awaitable<void> {
    try {
      co_await client.asyncQuery("*IDN?");
    } catch (const ConnectionError&) {
      threw = true;
    }
  };
  run_to_completion(sched, task());
  EXPECT_TRUE(threw);
  EXPECT_FALSE(client.busy()) << "wire released after the failure";
}

TEST(ScpiClient, peer_closes_mid_query) {
  Scheduler sched;
  FakeInstrument fake(sched.executor(), [](const std::string& line) -> std::optional<Reply> {
    if (line == "OK?") return Reply{"ok\n"};
    return Reply{"", milliseconds(0), true};
  });
  ScpiClient client(sched.executor(), "127.0.0.1", fake.port());
  std::string first;
  int failures = 0;

  auto task = [&]() -> asio::awaitable<void> {
    first = co_await client.asyncQuery("OK?");
    try {
      co_await client.asyncQuery("DIE?");
    } catch (const ConnectionError&) {
      ++failures;
    }
    EXPECT_FALSE(client.isOpen());
    // the next request opens a new connection, which is refused now
    try {
      co_await client.asyncQuery("OK?");
    } catch (const ConnectionError&) {
      ++failures;
    }
  };
  asio::co_spawn(sched.executor(), fake.serve(), asio::detached);
  run_to_completion(sched, task());

  EXPECT_EQ(first, "ok");
  EXPECT_EQ(failures, 2);
  EXPECT_FALSE(client.busy());
}
