#include "loop_manager.h"
#include "core/errors.h"
#include "sources/SourceFactory.h"

#include <iostream>
#include <stdexcept>

LoopManager::LoopManager(Scheduler& sched) : sched_(sched) {
}

LoopManager::~LoopManager() {
  stopAll();
}

LoopOptions LoopManager::to_loop_options(const LoopConfig& c) {
  LoopOptions o;
  o.id = c.id;
  o.max_queue_size = c.max_queue_size;
  o.add_timestamp = c.add_timestamp;
  o.yields = c.yields;
  o.report_rate = c.report_rate;
  o.report_interval = std::chrono::milliseconds(c.report_interval_ms);
  return o;
}

void LoopManager::configure(const std::vector<LoopConfig>& cfgs) {
  if (running() > 0) {
    throw std::logic_error("[LoopManager] configure() while loops are running");
  }

  std::vector<Entry> next;
  for (const auto& c : cfgs) {
    validate_loop_config(c);
    if (!c.enabled) {
      std::cout << "[LoopManager] skipped disabled loop id=" << c.id << std::endl;
      continue;
    }
    Entry e;
    e.cfg = c;
    e.source = create_source(c, sched_.executor());
    next.push_back(std::move(e));
  }
  loops_ = std::move(next);
  std::cout << "[LoopManager] configured loops=" << loops_.size() << std::endl;
}

void LoopManager::startAll(AcquisitionLoop::Consumer consumer, RateReporter::Sink rate_sink) {
  for (auto& e : loops_) {
    if (e.loop) continue;
    LoopOptions opts = to_loop_options(e.cfg);
    opts.rate_sink = rate_sink;
    e.loop = std::make_unique<AcquisitionLoop>(sched_, std::move(e.source), opts, consumer);

    const std::string id = e.loop->id();
    e.loop->start([id](std::exception_ptr err) {
      if (!err) return;
      try {
        std::rethrow_exception(err);
      } catch (const std::exception& ex) {
        std::cerr << "[LoopManager] loop id=" << id << " ended with error: " << ex.what() << std::endl;
      }
    });
    std::cout << "[LoopManager] started loop id=" << id << std::endl;
  }
}

void LoopManager::stopAll() {
  for (auto& e : loops_) {
    if (e.loop && e.loop->state() != AcquisitionLoop::State::stopped) e.loop->stop();
  }
}

AcquisitionLoop* LoopManager::find(const std::string& id) {
  for (auto& e : loops_) {
    if (e.cfg.id == id) return e.loop.get();
  }
  return nullptr;
}

std::size_t LoopManager::running() const {
  std::size_t n = 0;
  for (const auto& e : loops_) {
    if (e.loop && e.loop->state() == AcquisitionLoop::State::running) ++n;
  }
  return n;
}

Json::Value LoopManager::listAsJson() const {
  Json::Value arr(Json::arrayValue);
  for (const auto& e : loops_) {
    if (e.loop) {
      arr.append(e.loop->statusAsJson());
    } else {
      Json::Value s(Json::objectValue);
      s["id"] = e.cfg.id;
      s["source"] = e.source ? e.source->name() : "";
      s["state"] = "configured";
      arr.append(s);
    }
  }
  return arr;
}
