#include <cstdlib>
#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include "routegate/adaptation.hpp"
#include "routegate/audit.hpp"
#include "routegate/clock.hpp"
#include "routegate/config.hpp"
#include "routegate/decision_engine.hpp"
#include "routegate/hash.hpp"
#include "routegate/jsonlite.hpp"
#include "routegate/observability.hpp"
#include "routegate/policy.hpp"
#include "routegate/usage_ledger.hpp"
#include "routegate/version.hpp"

namespace {

namespace jl = routegate::jsonlite;

std::optional<std::string> read_file(const std::string &path) {
  std::ifstream ifs(path, std::ios::binary);
  if (!ifs)
    return std::nullopt;
  return std::string((std::istreambuf_iterator<char>(ifs)),
                     std::istreambuf_iterator<char>());
}

void print_error(routegate::ErrorCode code, const std::string &detail) {
  std::cout << "{\"ok\":false,\"error_code\":\"" << routegate::to_string(code)
            << "\",\"detail\":\"" << jl::escape(detail) << "\"}\n";
}

// "--name value" lookup anywhere after the command words.
std::string flag(int argc, char **argv, const std::string &name,
                 const std::string &def = "") {
  for (int i = 1; i + 1 < argc; ++i)
    if (name == argv[i])
      return argv[i + 1];
  return def;
}

bool has_flag(int argc, char **argv, const std::string &name) {
  for (int i = 1; i < argc; ++i)
    if (name == argv[i])
      return true;
  return false;
}

std::optional<double> flag_double(int argc, char **argv,
                                  const std::string &name) {
  const std::string v = flag(argc, argv, name);
  if (v.empty())
    return std::nullopt;
  char *end = nullptr;
  const double d = std::strtod(v.c_str(), &end);
  if (end == v.c_str() || *end != '\0')
    return std::nullopt;
  return d;
}

uint64_t flag_u64(int argc, char **argv, const std::string &name,
                  uint64_t def) {
  const std::string v = flag(argc, argv, name);
  if (v.empty())
    return def;
  return std::strtoull(v.c_str(), nullptr, 10);
}

routegate::ModelRef parse_ref(const std::string &s) {
  routegate::ModelRef ref;
  const auto colon = s.find(':');
  if (colon == std::string::npos) {
    ref.model = s;
  } else {
    ref.provider = s.substr(0, colon);
    ref.model = s.substr(colon + 1);
  }
  return ref;
}

std::string object_text(const jl::Object &obj) {
  jl::Value v;
  v.v = obj;
  return jl::to_json(v);
}

// ---------------------------------------------------------------------------
// Scenario replay
//
// {"steps":[{"op":"policy","org":"o","policy":{...}},
//           {"op":"route","org":"o","task":"chat","tokens_in":100,...},
//           {"op":"report","latency_ms":800,"success":true,...},
//           {"op":"sample","provider":"openai","model":"gpt-4o","count":10,...},
//           {"op":"advance","ms":60000},
//           {"op":"adapt","org":"o"},
//           {"op":"cancel"}]}
//
// "report"/"cancel" without "reservation_id" apply to the most recent
// admitted route.
// ---------------------------------------------------------------------------
struct ScenarioRun {
  bool ok{true};
  routegate::ErrorCode error{routegate::ErrorCode::none};
  std::string detail;
  std::vector<std::string> results;
};

routegate::RouteRequest route_from_step(const jl::Object &step,
                                        routegate::ErrorCode *error) {
  routegate::RouteRequest req;
  req.organization_id = jl::get_string(step, "org");
  const auto task = routegate::parse_task_category(
      jl::get_string(step, "task", "chat"));
  if (!task) {
    *error = routegate::ErrorCode::unknown_task_category;
    return req;
  }
  req.task = *task;
  req.tokens_in = jl::get_u64(step, "tokens_in", 0);
  req.tokens_out = jl::get_u64(step, "tokens_out", 0);
  if (jl::has_key(step, "max_cost_usd"))
    req.constraints.max_cost_usd = jl::get_double(step, "max_cost_usd");
  if (jl::has_key(step, "min_perf"))
    req.constraints.min_perf = jl::get_double(step, "min_perf");
  req.constraints.force_cheapest = jl::get_bool(step, "force_cheapest", false);
  if (jl::has_key(step, "estimated_cost_usd"))
    req.estimated_cost_usd = jl::get_double(step, "estimated_cost_usd");
  if (jl::has_key(step, "prompt"))
    req.prompt = jl::get_string(step, "prompt");
  req.system_prompt = jl::get_string(step, "system_prompt");
  if (jl::has_key(step, "temperature"))
    req.temperature = jl::get_double(step, "temperature");
  if (jl::has_key(step, "max_tokens"))
    req.max_tokens = jl::get_u64(step, "max_tokens");
  *error = routegate::ErrorCode::none;
  return req;
}

ScenarioRun run_scenario(const std::string &text,
                         routegate::RoutingEngine &engine,
                         routegate::AdaptationEngine &adaptation,
                         routegate::ManualClock &clock) {
  ScenarioRun run;
  std::optional<jl::JsonError> err;
  const auto doc = jl::parse(text, &err);
  if (err) {
    run.ok = false;
    run.error = err->code == "json_duplicate_key"
                    ? routegate::ErrorCode::json_duplicate_key
                    : routegate::ErrorCode::json_parse_error;
    run.detail = err->message;
    return run;
  }
  const jl::Array *steps = jl::get_array(doc, "steps");
  if (!steps) {
    run.ok = false;
    run.error = routegate::ErrorCode::json_parse_error;
    run.detail = "scenario has no \"steps\" array";
    return run;
  }

  std::string last_reservation;
  for (size_t i = 0; i < steps->size(); ++i) {
    const auto *step = std::get_if<jl::Object>(&(*steps)[i].v);
    if (!step) {
      run.ok = false;
      run.error = routegate::ErrorCode::json_parse_error;
      run.detail = "step " + std::to_string(i) + " is not an object";
      return run;
    }
    const std::string op = jl::get_string(*step, "op");

    if (op == "policy") {
      const jl::Object *doc_obj = jl::get_object(*step, "policy");
      auto parsed = routegate::policy_from_json(doc_obj ? object_text(*doc_obj)
                                                        : std::string("{}"));
      if (!parsed.ok) {
        run.results.push_back(parsed.to_json());
        continue;
      }
      run.results.push_back(
          engine.upsert_policy(jl::get_string(*step, "org"), parsed.policy)
              .to_json());
    } else if (op == "route") {
      routegate::ErrorCode code;
      const auto req = route_from_step(*step, &code);
      if (code != routegate::ErrorCode::none) {
        run.results.push_back("{\"ok\":false,\"error_code\":\"" +
                              routegate::to_string(code) + "\"}");
        continue;
      }
      const auto d = engine.route_request(req);
      if (d.ok && !d.reservation_id.empty())
        last_reservation = d.reservation_id;
      run.results.push_back(d.to_json());
    } else if (op == "report") {
      routegate::OutcomeReport rep;
      rep.reservation_id =
          jl::get_string(*step, "reservation_id", last_reservation);
      if (jl::has_key(*step, "actual_cost_usd"))
        rep.actual_cost_usd = jl::get_double(*step, "actual_cost_usd");
      rep.latency_ms = jl::get_double(*step, "latency_ms", 0.0);
      rep.success = jl::get_bool(*step, "success", true);
      rep.timed_out = jl::get_bool(*step, "timed_out", false);
      if (jl::has_key(*step, "ref"))
        rep.ref = parse_ref(jl::get_string(*step, "ref"));
      if (jl::has_key(*step, "completion"))
        rep.completion = jl::get_string(*step, "completion");
      run.results.push_back(engine.report_outcome(rep).to_json());
    } else if (op == "cancel") {
      run.results.push_back(
          engine
              .cancel(jl::get_string(*step, "reservation_id", last_reservation))
              .to_json());
    } else if (op == "sample") {
      routegate::TelemetrySample s;
      s.organization_id = jl::get_string(*step, "org");
      s.ref.provider = jl::get_string(*step, "provider");
      s.ref.model = jl::get_string(*step, "model");
      s.latency_ms = jl::get_double(*step, "latency_ms", 0.0);
      s.success = jl::get_bool(*step, "success", true);
      s.cost_usd = jl::get_double(*step, "cost_usd", 0.0);
      const uint64_t count = jl::get_u64(*step, "count", 1);
      for (uint64_t n = 0; n < count; ++n)
        engine.telemetry().record(s);
      run.results.push_back("{\"ok\":true,\"op\":\"sample\",\"recorded\":" +
                            std::to_string(count) + "}");
    } else if (op == "advance") {
      clock.advance_ms(jl::get_u64(*step, "ms", 0));
      run.results.push_back("{\"ok\":true,\"op\":\"advance\",\"unix_ms\":" +
                            std::to_string(clock.unix_ms()) + "}");
    } else if (op == "adapt") {
      std::ostringstream o;
      o << "{\"ok\":true,\"op\":\"adapt\",\"events\":[";
      const auto events = adaptation.tick(jl::get_string(*step, "org"));
      for (size_t e = 0; e < events.size(); ++e)
        o << (e ? "," : "") << events[e].to_json();
      o << "]}";
      run.results.push_back(o.str());
    } else {
      run.ok = false;
      run.error = routegate::ErrorCode::json_parse_error;
      run.detail = "step " + std::to_string(i) + ": unknown op \"" + op + "\"";
      return run;
    }
  }
  return run;
}

void usage() {
  std::cerr
      << "usage: routegate [--state DIR] [--config FILE] [--scenario FILE] "
         "<command>\n"
         "  version | health | config show\n"
         "  policy get|set|summary --org ORG [--in FILE]\n"
         "  route --org ORG --task TASK --tokens-in N --tokens-out N\n"
         "        [--max-cost USD] [--min-perf Q] [--force-cheapest] "
         "[--prompt TEXT]\n"
         "  report --reservation ID --latency MS [--cost USD] [--failure]\n"
         "  cache stats|cleanup | circuit status\n"
         "  decisions history|stats --org ORG | decisions explain --id ID\n"
         "  telemetry health | telemetry summary [--period 1h|24h|7d|30d]\n"
         "  simulate --scenario FILE\n";
}

} // namespace

int main(int argc, char **argv) {
  std::vector<std::string> words;
  for (int i = 1; i < argc; ++i) {
    const std::string a = argv[i];
    if (a.rfind("--", 0) == 0) {
      // Boolean flags take no value.
      if (a != "--force-cheapest" && a != "--failure" && a != "--timeout")
        ++i;
      continue;
    }
    words.push_back(a);
  }
  if (words.empty()) {
    usage();
    return 1;
  }
  const std::string cmd = words[0];
  const std::string sub = words.size() > 1 ? words[1] : "";

  if (cmd == "version") {
    std::cout << routegate::version::manifest_to_json(
                     routegate::version::current_manifest(PROJECT_VERSION))
              << "\n";
    return 0;
  }

  // Engine configuration: defaults, then environment, then --config.
  std::string warnings;
  routegate::EngineConfig cfg = routegate::EngineConfig::from_env(
      routegate::EngineConfig::defaults(), &warnings);
  if (!warnings.empty())
    std::cerr << "{\"config_warnings\":\"" << jl::escape(warnings) << "\"}\n";
  const std::string config_path = flag(argc, argv, "--config");
  if (!config_path.empty()) {
    auto loaded = routegate::load_engine_config(config_path, cfg);
    if (!loaded.ok) {
      std::cout << loaded.to_json() << "\n";
      return 2;
    }
    cfg = loaded.config;
  }

  if (cmd == "config" && sub == "show") {
    std::cout << cfg.to_json() << "\n";
    return 0;
  }

  // A scenario runs on a manual clock so replays are reproducible.
  const std::string scenario_path = flag(argc, argv, "--scenario");
  std::shared_ptr<routegate::ManualClock> manual;
  routegate::EngineDeps deps;
  if (!scenario_path.empty()) {
    manual = std::make_shared<routegate::ManualClock>();
    deps.clock = manual;
  }
  const std::string state_dir = flag(argc, argv, "--state");
  if (!state_dir.empty())
    deps.policy_backend =
        std::make_shared<routegate::FilePolicyBackend>(state_dir);

  routegate::RoutingEngine engine(cfg, deps);
  routegate::AdaptationEngine adaptation(cfg.adaptation, engine);

  if (!scenario_path.empty()) {
    const auto text = read_file(scenario_path);
    if (!text) {
      print_error(routegate::ErrorCode::io_error,
                  "cannot read scenario " + scenario_path);
      return 2;
    }
    const auto run = run_scenario(*text, engine, adaptation, *manual);
    if (!run.ok) {
      print_error(run.error, run.detail);
      return 2;
    }
    if (cmd == "simulate") {
      std::cout << "{\"ok\":true,\"steps\":[";
      for (size_t i = 0; i < run.results.size(); ++i)
        std::cout << (i ? "," : "") << run.results[i];
      std::cout << "],\"router_stats\":"
                << routegate::global_router_stats().to_json() << "}\n";
      return 0;
    }
  } else if (cmd == "simulate") {
    print_error(routegate::ErrorCode::config_invalid,
                "simulate requires --scenario FILE");
    return 2;
  }

  if (cmd == "health") {
    const auto h = routegate::hash_runtime_info();
    std::cout << "{\"hash_primitive\":\"" << h.primitive
              << "\",\"hash_backend\":\"" << h.backend
              << "\",\"hash_version\":\"" << h.version
              << "\",\"hash_available\":"
              << (h.blake3_available ? "true" : "false");
    std::cout << ",\"compression_capabilities\":[\"identity\"";
#if defined(ROUTEGATE_WITH_ZSTD)
    std::cout << ",\"zstd\"";
#endif
    std::cout << "]";
    std::cout << ",\"policy_backend\":\""
              << engine.policies().backend().backend_id() << "\""
              << ",\"catalog_models\":" << engine.catalog().size()
              << ",\"audit_enabled\":"
              << (routegate::global_audit_log().enabled() ? "true" : "false")
              << ",\"router_stats\":"
              << routegate::global_router_stats().to_json() << "}\n";
    return 0;
  }

  if (cmd == "policy") {
    const std::string org = flag(argc, argv, "--org");
    if (org.empty()) {
      print_error(routegate::ErrorCode::config_invalid, "--org is required");
      return 2;
    }
    if (sub == "get") {
      const auto r = engine.get_policy(org);
      std::cout << r.to_json() << "\n";
      return r.ok ? 0 : 2;
    }
    if (sub == "set") {
      const auto text = read_file(flag(argc, argv, "--in"));
      if (!text) {
        print_error(routegate::ErrorCode::io_error, "cannot read --in file");
        return 2;
      }
      auto parsed = routegate::policy_from_json(*text);
      if (!parsed.ok) {
        std::cout << parsed.to_json() << "\n";
        return 2;
      }
      const auto r = engine.upsert_policy(org, parsed.policy);
      std::cout << r.to_json() << "\n";
      return r.ok ? 0 : 2;
    }
    if (sub == "summary") {
      const auto r = engine.get_policy(org);
      if (!r.ok) {
        std::cout << r.to_json() << "\n";
        return 2;
      }
      std::cout << routegate::policy_summary_json(r.policy, engine.usage(org))
                << "\n";
      return 0;
    }
  }

  if (cmd == "route") {
    routegate::RouteRequest req;
    req.organization_id = flag(argc, argv, "--org");
    const auto task = routegate::parse_task_category(
        flag(argc, argv, "--task", "chat"));
    if (!task) {
      print_error(routegate::ErrorCode::unknown_task_category,
                  flag(argc, argv, "--task"));
      return 2;
    }
    req.task = *task;
    req.tokens_in = flag_u64(argc, argv, "--tokens-in", 0);
    req.tokens_out = flag_u64(argc, argv, "--tokens-out", 0);
    req.constraints.max_cost_usd = flag_double(argc, argv, "--max-cost");
    req.constraints.min_perf = flag_double(argc, argv, "--min-perf");
    req.constraints.force_cheapest = has_flag(argc, argv, "--force-cheapest");
    req.estimated_cost_usd = flag_double(argc, argv, "--estimate");
    if (has_flag(argc, argv, "--prompt"))
      req.prompt = flag(argc, argv, "--prompt");
    const auto d = engine.route_request(req);
    std::cout << d.to_json() << "\n";
    return d.ok ? 0 : 2;
  }

  if (cmd == "report") {
    routegate::OutcomeReport rep;
    rep.reservation_id = flag(argc, argv, "--reservation");
    rep.actual_cost_usd = flag_double(argc, argv, "--cost");
    rep.latency_ms = flag_double(argc, argv, "--latency").value_or(0.0);
    rep.success = !has_flag(argc, argv, "--failure");
    rep.timed_out = has_flag(argc, argv, "--timeout");
    const auto r = engine.report_outcome(rep);
    std::cout << r.to_json() << "\n";
    return r.ok ? 0 : 2;
  }

  if (cmd == "cache" && sub == "stats") {
    std::cout << engine.cache().stats().to_json() << "\n";
    return 0;
  }
  if (cmd == "cache" && sub == "cleanup") {
    std::cout << "{\"removed\":" << engine.cache().cleanup_expired() << "}\n";
    return 0;
  }

  if (cmd == "circuit" && sub == "status") {
    const auto states = engine.circuits().states();
    std::cout << "{\"circuits\":[";
    for (size_t i = 0; i < states.size(); ++i)
      std::cout << (i ? "," : "") << states[i].to_json();
    std::cout << "]}\n";
    return 0;
  }

  if (cmd == "decisions") {
    const std::string org = flag(argc, argv, "--org");
    if (sub == "history") {
      routegate::DecisionFilter filter;
      filter.limit = static_cast<size_t>(flag_u64(argc, argv, "--limit", 50));
      const auto list = engine.decisions().history(org, filter);
      std::cout << "{\"decisions\":[";
      for (size_t i = 0; i < list.size(); ++i)
        std::cout << (i ? "," : "") << list[i].to_json();
      std::cout << "]}\n";
      return 0;
    }
    if (sub == "explain") {
      const std::string id = flag(argc, argv, "--id");
      const auto ex = engine.decisions().explain(id);
      if (!ex) {
        std::cout << "{\"ok\":false,\"detail\":\"no decision "
                  << jl::escape(id) << "\"}\n";
        return 2;
      }
      std::cout << ex->to_json() << "\n";
      return 0;
    }
    if (sub == "stats") {
      std::cout << engine.decisions().stats(org).to_json() << "\n";
      return 0;
    }
  }

  if (cmd == "telemetry" && sub == "health") {
    const auto report = engine.circuits().health_report();
    std::cout << "{\"models\":[";
    for (size_t i = 0; i < report.size(); ++i)
      std::cout << (i ? "," : "") << report[i].to_json();
    std::cout << "]}\n";
    return 0;
  }
  if (cmd == "telemetry" && sub == "summary") {
    const auto period =
        routegate::parse_summary_period(flag(argc, argv, "--period", "24h"));
    if (!period) {
      print_error(routegate::ErrorCode::config_invalid,
                  "--period must be 1h, 24h, 7d or 30d");
      return 2;
    }
    std::cout << engine.telemetry().summary(*period).to_json() << "\n";
    return 0;
  }

  usage();
  return 1;
}
