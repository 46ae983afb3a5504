#pragma once

#include <functional>
#include <memory>
#include <string>
#include <vector>
#include <json/json.h>
#include "config/config.h"
#include "core/acquisition_loop.h"
#include "core/scheduler.h"

/**
 * Owns one AcquisitionLoop per enabled LoopConfig, all on one scheduler.
 *
 * Loops share nothing but the scheduler and the consumer callback: each has
 * its own channel and session, and an error in one stops only that loop.
 */
class LoopManager {
public:
  explicit LoopManager(Scheduler& sched);
  ~LoopManager();

  // Builds the loops. Throws ConfigurationError before anything is started.
  void configure(const std::vector<LoopConfig>& cfgs);
  void startAll(AcquisitionLoop::Consumer consumer = {}, RateReporter::Sink rate_sink = {});
  void stopAll();

  AcquisitionLoop* find(const std::string& id);
  std::size_t size() const { return loops_.size(); }
  std::size_t running() const;

  Json::Value listAsJson() const;

  static LoopOptions to_loop_options(const LoopConfig& c);

private:
  struct Entry {
    LoopConfig cfg;
    std::unique_ptr<IDataSource> source;  // handed to the loop on start
    std::unique_ptr<AcquisitionLoop> loop;
  };

  Scheduler& sched_;
  std::vector<Entry> loops_;
};
