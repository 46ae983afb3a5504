#pragma once
#include <optional>
#include <string>
#include <vector>

struct LoopConfig {
  std::string id{""};
  std::string type{"siglent_sds"};   // "siglent_sds" | "fm_sine"
  std::string host{"192.168.1.10"};
  int port{5025};
  bool enabled{true};

  std::vector<int> channels{1};      // 1-based scope channels, fetched in this order
  int max_queue_size{1};             // 0 = unbounded
  std::optional<bool> yields;        // unset -> the source's own capability
  bool add_timestamp{false};

  bool report_rate{false};
  int report_interval_ms{1000};

  double pacing_factor{4.0};
  int divisions{14};
};

struct AppConfig {
  std::string scheduler{"standard"}; // "standard" | "single_threaded"
  std::vector<LoopConfig> loops;
};

// Both throw ConfigurationError on unreadable YAML or invalid values.
AppConfig load_app_config(const std::string& path);
AppConfig parse_app_config(const std::string& yaml_text);

void validate_loop_config(const LoopConfig& c);
std::string dump_app_config(const AppConfig& cfg);
