#include "trace.h"

#include "util.h"

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <sstream>
#include <string>

namespace tasker {

namespace {

std::tm make_utc_tm(std::time_t time) {
  std::tm result{};

#if defined(_WIN32)
  gmtime_s(&result, &time);
#else
  gmtime_r(&time, &result);
#endif

  return result;
}

std::string format_timestamp(std::chrono::system_clock::time_point tp) {
  auto const seconds{ std::chrono::time_point_cast<std::chrono::seconds>(tp) };
  auto const millis{
    std::chrono::duration_cast<std::chrono::milliseconds>(tp - seconds).count()
  };

  std::time_t const timestamp{ std::chrono::system_clock::to_time_t(seconds) };
  std::tm const utc_tm{ make_utc_tm(timestamp) };

  char base[32]{};
  if (std::strftime(base, sizeof base, "%Y-%m-%dT%H:%M:%S", &utc_tm) == 0) { return {}; }

  char buffer[64]{};
  int const written{ std::snprintf(buffer,
                                   sizeof buffer,
                                   "%s.%03lldZ",
                                   base,
                                   static_cast<long long>(millis)) };
  if (written <= 0) { return {}; }

  return std::string{ buffer, static_cast<std::size_t>(written) };
}

void append_json_string(std::string &out, std::string_view value) {
  for (char const ch : value) {
    switch (ch) {
      case '\\': out.append("\\\\"); break;
      case '"': out.append("\\\""); break;
      case '\b': out.append("\\b"); break;
      case '\f': out.append("\\f"); break;
      case '\n': out.append("\\n"); break;
      case '\r': out.append("\\r"); break;
      case '\t': out.append("\\t"); break;
      default:
        if (static_cast<unsigned char>(ch) < 0x20) {
          char escape[7]{};
          std::snprintf(escape,
                        sizeof escape,
                        "\\u%04x",
                        static_cast<unsigned int>(static_cast<unsigned char>(ch)));
          out.append(escape);
        } else {
          out.push_back(ch);
        }
        break;
    }
  }
}

void append_kv(std::string &out, char const *key, std::string_view value) {
  out.push_back(',');
  out.push_back('"');
  out.append(key);
  out.append("\":\"");
  append_json_string(out, value);
  out.push_back('"');
}

void append_kv(std::string &out, char const *key, std::int64_t value) {
  out.push_back(',');
  out.push_back('"');
  out.append(key);
  out.append("\":");
  out.append(std::to_string(value));
}

}  // namespace

#define TRACE_NAME(type) \
  [](trace_events::type const &) -> std::string_view { return #type; }

std::string_view trace_event_name(trace_event_t const &event) {
  return std::visit(match{
                        TRACE_NAME(task_file_loaded),
                        TRACE_NAME(task_collected),
                        TRACE_NAME(node_collected),
                        TRACE_NAME(node_cache_insert),
                        TRACE_NAME(node_cache_hit),
                        TRACE_NAME(collection_failed),
                    },
                    event);
}

#undef TRACE_NAME

std::string trace_event_to_string(trace_event_t const &event) {
  return std::visit(
      match{
          [](trace_events::task_file_loaded const &value) {
            std::ostringstream oss;
            oss << "task_file_loaded path=" << value.path << " tasks=" << value.tasks;
            return oss.str();
          },
          [](trace_events::task_collected const &value) {
            std::ostringstream oss;
            oss << "task_collected task=" << value.task
                << " dependencies=" << value.dependencies
                << " products=" << value.products;
            return oss.str();
          },
          [](trace_events::node_collected const &value) {
            std::ostringstream oss;
            oss << "node_collected task=" << value.task
                << " reference=" << value.reference << " node=" << value.node
                << " collector=" << value.collector;
            return oss.str();
          },
          [](trace_events::node_cache_insert const &value) {
            return "node_cache_insert path=" + value.path;
          },
          [](trace_events::node_cache_hit const &value) {
            return "node_cache_hit path=" + value.path;
          },
          [](trace_events::collection_failed const &value) {
            std::ostringstream oss;
            oss << "collection_failed task=" << value.task << " path=" << value.path
                << " reason=" << value.reason;
            return oss.str();
          },
      },
      event);
}

std::string trace_event_to_json(trace_event_t const &event) {
  std::string output;
  output.reserve(256);

  output.append("{\"ts\":\"");
  output.append(format_timestamp(std::chrono::system_clock::now()));
  output.append("\",\"event\":\"");
  output.append(trace_event_name(event));
  output.push_back('"');

  std::visit(match{
                 [&](trace_events::task_file_loaded const &value) {
                   append_kv(output, "path", value.path);
                   append_kv(output, "tasks", value.tasks);
                 },
                 [&](trace_events::task_collected const &value) {
                   append_kv(output, "task", value.task);
                   append_kv(output, "dependencies", value.dependencies);
                   append_kv(output, "products", value.products);
                 },
                 [&](trace_events::node_collected const &value) {
                   append_kv(output, "task", value.task);
                   append_kv(output, "reference", value.reference);
                   append_kv(output, "node", value.node);
                   append_kv(output, "collector", value.collector);
                 },
                 [&](trace_events::node_cache_insert const &value) {
                   append_kv(output, "path", value.path);
                 },
                 [&](trace_events::node_cache_hit const &value) {
                   append_kv(output, "path", value.path);
                 },
                 [&](trace_events::collection_failed const &value) {
                   append_kv(output, "task", value.task);
                   append_kv(output, "path", value.path);
                   append_kv(output, "reason", value.reason);
                 },
             },
             event);

  output.push_back('}');
  return output;
}

}  // namespace tasker
