#include "config.h"
#include "core/errors.h"
#include <yaml-cpp/yaml.h>
#include <algorithm>
#include <iostream>

namespace {

const std::vector<std::string> kSourceTypes{"siglent_sds", "fm_sine"};

void parse_endpoint(const std::string& endpoint, LoopConfig& c) {
  // split "host:port" into host and port
  auto colon_pos = endpoint.find(":");
  if (colon_pos == std::string::npos) {
    c.host = endpoint;
    return;
  }
  c.host = endpoint.substr(0, colon_pos);
  const std::string port = endpoint.substr(colon_pos + 1);
  try {
    std::size_t used = 0;
    c.port = std::stoi(port, &used);
    if (used != port.size()) throw std::invalid_argument(port);
  } catch (const std::exception&) {
    throw ConfigurationError("invalid endpoint '" + endpoint + "'");
  }
}

LoopConfig parse_loop(const YAML::Node& s) {
  LoopConfig c;

  if (s["id"])       c.id      = s["id"].as<std::string>(c.id);
  if (s["type"])     c.type    = s["type"].as<std::string>(c.type);
  if (s["endpoint"]) parse_endpoint(s["endpoint"].as<std::string>(""), c);
  if (s["host"])     c.host    = s["host"].as<std::string>(c.host);
  if (s["port"])     c.port    = s["port"].as<int>(c.port);
  if (s["enabled"])  c.enabled = s["enabled"].as<bool>(c.enabled);

  if (auto ch = s["channels"]) {
    c.channels.clear();
    if (ch.IsSequence()) {
      for (const auto& n : ch) c.channels.push_back(n.as<int>());
    } else {
      c.channels.push_back(ch.as<int>());
    }
  }

  if (s["max_queue_size"]) c.max_queue_size = s["max_queue_size"].as<int>(c.max_queue_size);
  if (s["yields"])         c.yields         = s["yields"].as<bool>();
  if (s["add_timestamp"])  c.add_timestamp  = s["add_timestamp"].as<bool>(c.add_timestamp);

  // report_rate: true | false | <interval ms>
  if (auto r = s["report_rate"]) {
    bool on = false;
    if (YAML::convert<bool>::decode(r, on)) {
      c.report_rate = on;
    } else {
      c.report_rate = true;
      c.report_interval_ms = r.as<int>();
    }
  }
  if (s["report_interval_ms"]) c.report_interval_ms = s["report_interval_ms"].as<int>(c.report_interval_ms);

  if (s["pacing_factor"]) c.pacing_factor = s["pacing_factor"].as<double>(c.pacing_factor);
  if (s["divisions"])     c.divisions     = s["divisions"].as<int>(c.divisions);

  return c;
}

AppConfig parse_root(const YAML::Node& y) {
  AppConfig cfg;
  if (y["scheduler"]) cfg.scheduler = y["scheduler"].as<std::string>(cfg.scheduler);
  if (cfg.scheduler != "standard" && cfg.scheduler != "single_threaded") {
    throw ConfigurationError("unknown scheduler '" + cfg.scheduler + "'");
  }

  if (y["loops"] && y["loops"].IsSequence()) {
    for (const auto& s : y["loops"]) {
      LoopConfig c = parse_loop(s);
      if (c.id.empty()) c.id = c.type + "_" + std::to_string(cfg.loops.size());
      validate_loop_config(c);
      cfg.loops.push_back(std::move(c));
    }
  }

  std::vector<std::string> ids;
  for (const auto& c : cfg.loops) {
    if (std::find(ids.begin(), ids.end(), c.id) != ids.end()) {
      throw ConfigurationError("duplicate loop id '" + c.id + "'");
    }
    ids.push_back(c.id);
  }
  return cfg;
}

}

void validate_loop_config(const LoopConfig& c) {
  const std::string where = "loop '" + c.id + "': ";
  if (std::find(kSourceTypes.begin(), kSourceTypes.end(), c.type) == kSourceTypes.end()) {
    throw ConfigurationError(where + "unknown type '" + c.type + "'");
  }
  if (c.max_queue_size < 0) {
    throw ConfigurationError(where + "max_queue_size must be >= 0");
  }
  if (c.report_interval_ms <= 0) {
    throw ConfigurationError(where + "report_interval_ms must be > 0");
  }
  if (!(c.pacing_factor > 0.0)) {
    throw ConfigurationError(where + "pacing_factor must be > 0");
  }
  if (c.divisions <= 0) {
    throw ConfigurationError(where + "divisions must be > 0");
  }
  if (c.type == "siglent_sds") {
    if (c.host.empty() || c.port <= 0 || c.port > 65535) {
      throw ConfigurationError(where + "invalid endpoint " + c.host + ":" + std::to_string(c.port));
    }
    if (c.channels.empty()) {
      throw ConfigurationError(where + "at least one channel is required");
    }
    for (int ch : c.channels) {
      if (ch < 1 || ch > 4) {
        throw ConfigurationError(where + "channel out of range: " + std::to_string(ch));
      }
    }
  }
}

AppConfig load_app_config(const std::string& path) {
  YAML::Node y;
  try {
    y = YAML::LoadFile(path);
  } catch (const YAML::Exception& e) {
    throw ConfigurationError("cannot read " + path + ": " + e.what());
  }
  try {
    AppConfig cfg = parse_root(y);
    std::cout << "[Config] loaded " << path << " loops=" << cfg.loops.size() << std::endl;
    return cfg;
  } catch (const YAML::Exception& e) {
    throw ConfigurationError(path + ": " + e.what());
  }
}

AppConfig parse_app_config(const std::string& yaml_text) {
  try {
    return parse_root(YAML::Load(yaml_text));
  } catch (const YAML::Exception& e) {
    throw ConfigurationError(e.what());
  }
}

std::string dump_app_config(const AppConfig& cfg) {
  YAML::Emitter out;
  out << YAML::BeginMap;
  out << YAML::Key << "scheduler" << YAML::Value << cfg.scheduler;

  out << YAML::Key << "loops" << YAML::Value << YAML::BeginSeq;
  for (const auto& c : cfg.loops) {
    out << YAML::BeginMap;
    out << YAML::Key << "id" << YAML::Value << c.id;
    out << YAML::Key << "type" << YAML::Value << c.type;
    out << YAML::Key << "endpoint" << YAML::Value << (c.host + ":" + std::to_string(c.port));
    out << YAML::Key << "enabled" << YAML::Value << c.enabled;
    out << YAML::Key << "channels" << YAML::Value << YAML::Flow << c.channels;
    out << YAML::Key << "max_queue_size" << YAML::Value << c.max_queue_size;
    if (c.yields) out << YAML::Key << "yields" << YAML::Value << *c.yields;
    out << YAML::Key << "add_timestamp" << YAML::Value << c.add_timestamp;
    out << YAML::Key << "report_rate" << YAML::Value << c.report_rate;
    out << YAML::Key << "report_interval_ms" << YAML::Value << c.report_interval_ms;
    out << YAML::Key << "pacing_factor" << YAML::Value << c.pacing_factor;
    out << YAML::Key << "divisions" << YAML::Value << c.divisions;
    out << YAML::EndMap;
  }
  out << YAML::EndSeq;

  out << YAML::EndMap;
  return std::string(out.c_str());
}
