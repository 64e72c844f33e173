#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace tasker {

namespace trace_events {

struct task_file_loaded {
  std::string path;
  std::int64_t tasks;
};

struct task_collected {
  std::string task;
  std::int64_t dependencies;
  std::int64_t products;
};

struct node_collected {
  std::string task;
  std::string reference;
  std::string node;
  std::string collector;
};

struct node_cache_insert {
  std::string path;
};

struct node_cache_hit {
  std::string path;
};

struct collection_failed {
  std::string task;
  std::string path;
  std::string reason;
};

}  // namespace trace_events

using trace_event_t = std::variant<trace_events::task_file_loaded,
                                   trace_events::task_collected,
                                   trace_events::node_collected,
                                   trace_events::node_cache_insert,
                                   trace_events::node_cache_hit,
                                   trace_events::collection_failed>;

std::string_view trace_event_name(trace_event_t const &event);
std::string trace_event_to_string(trace_event_t const &event);
std::string trace_event_to_json(trace_event_t const &event);

namespace tui {
extern bool g_trace_enabled;
void trace(trace_event_t event);

inline bool trace_enabled() { return g_trace_enabled; }
}  // namespace tui

}  // namespace tasker

#define TASKER_TRACE_UNLIKELY [[unlikely]]

#define TASKER_TRACE_EMIT(event_expr) \
  do { \
    if (::tasker::tui::g_trace_enabled) TASKER_TRACE_UNLIKELY { \
        ::tasker::tui::trace event_expr; \
      } \
  } while (0)

#define TASKER_TRACE_TASK_FILE_LOADED(path_value, tasks_value) \
  TASKER_TRACE_EMIT((::tasker::trace_events::task_file_loaded{ \
      .path = (path_value), \
      .tasks = (tasks_value), \
  }))

#define TASKER_TRACE_TASK_COLLECTED(task_value, dependencies_value, products_value) \
  TASKER_TRACE_EMIT((::tasker::trace_events::task_collected{ \
      .task = (task_value), \
      .dependencies = (dependencies_value), \
      .products = (products_value), \
  }))

#define TASKER_TRACE_NODE_COLLECTED(task_value, \
                                    reference_value, \
                                    node_value, \
                                    collector_value) \
  TASKER_TRACE_EMIT((::tasker::trace_events::node_collected{ \
      .task = (task_value), \
      .reference = (reference_value), \
      .node = (node_value), \
      .collector = (collector_value), \
  }))

#define TASKER_TRACE_NODE_CACHE_INSERT(path_value) \
  TASKER_TRACE_EMIT((::tasker::trace_events::node_cache_insert{ \
      .path = (path_value), \
  }))

#define TASKER_TRACE_NODE_CACHE_HIT(path_value) \
  TASKER_TRACE_EMIT((::tasker::trace_events::node_cache_hit{ \
      .path = (path_value), \
  }))

#define TASKER_TRACE_COLLECTION_FAILED(task_value, path_value, reason_value) \
  TASKER_TRACE_EMIT((::tasker::trace_events::collection_failed{ \
      .task = (task_value), \
      .path = (path_value), \
      .reason = (reason_value), \
  }))
