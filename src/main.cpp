#include <algorithm>
#include <csignal>
#include <exception>
#include <functional>
#include <iostream>
#include <memory>
#include <string>
#include <variant>
#include <utility>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/steady_timer.hpp>
#include <json/json.h>
#include "config/config.h"
#include "core/errors.h"
#include "core/loop_manager.h"
#include "core/scheduler.h"

namespace {

// One JSON line per packet; the payload is summarized, not dumped.
Json::Value summarize(const Packet& p) {
  Json::Value j(Json::objectValue);
  j["seq"] = Json::UInt64(p.seq);
  if (p.channel) j["channel"] = *p.channel;
  if (p.monotonic_ts_ns) j["t_ns"] = Json::UInt64(*p.monotonic_ts_ns);

  if (const auto* tr = std::get_if<Trace>(&p.payload)) {
    j["points"] = Json::UInt64(tr->y.size());
    if (!tr->y.empty()) {
      double lo = tr->y.front(), hi = tr->y.front();
      for (double v : tr->y) { lo = std::min(lo, v); hi = std::max(hi, v); }
      j["min"] = lo;
      j["max"] = hi;
    }
  } else {
    j["bytes"] = Json::UInt64(std::get<std::vector<uint8_t>>(p.payload).size());
  }
  return j;
}

}

int main(int argc, char** argv) {
  std::string cfgPath = "./config/default.yaml";
  bool quiet = false;

  for (int i=1;i<argc;++i){
    std::string a = argv[i];
    if(a=="--config" && i+1<argc) cfgPath = argv[++i];
    else if(a=="--quiet") quiet = true;
  }

  AppConfig appcfg;
  try {
    appcfg = load_app_config(cfgPath);
  } catch (const ConfigurationError& e) {
    std::cerr << "[App] " << e.what() << std::endl;
    return 2;
  }

  Scheduler sched(scheduler_kind_from_string(appcfg.scheduler));
  LoopManager loops(sched);
  try {
    loops.configure(appcfg.loops);
  } catch (const ConfigurationError& e) {
    std::cerr << "[App] " << e.what() << std::endl;
    return 2;
  }

  boost::asio::signal_set signals(sched.context(), SIGINT, SIGTERM);
  signals.async_wait([&](const boost::system::error_code& ec, int signo) {
    if (ec) return;
    std::cout << "[App] signal " << signo << ", stopping" << std::endl;
    loops.stopAll();
  });

  Json::StreamWriterBuilder wb;
  wb["indentation"] = "";

  loops.startAll([&](Packet p) -> boost::asio::awaitable<void> {
    if (!quiet) std::cout << Json::writeString(wb, summarize(p)) << std::endl;
    co_return;
  });

  // the signal wait would keep the scheduler alive after the last loop ends
  auto watch = std::make_shared<boost::asio::steady_timer>(sched.context());
  std::function<void()> poll = [&, watch]() {
    watch->expires_after(std::chrono::milliseconds(200));
    watch->async_wait([&, watch](const boost::system::error_code& ec) {
      if (ec) return;
      if (loops.running() == 0) {
        signals.cancel();
        return;
      }
      poll();
    });
  };
  poll();

  sched.run();

  std::cout << "[App] final status " << Json::writeString(wb, loops.listAsJson()) << std::endl;
  return 0;
}
