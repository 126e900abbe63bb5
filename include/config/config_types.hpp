#pragma once

#include "access/pg_user_directory.hpp"
#include "cache/access_cache.hpp"
#include "conversation/conversation_store.hpp"
#include "core/types.hpp"
#include "executor/tool_executor.hpp"
#include "fallback/fallback_policy.hpp"
#include "router/intent_router.hpp"
#include "router/interpreter_client.hpp"
#include "tools/tool_registry.hpp"
#include "trace/file_sink.hpp"
#include "trace/trace_recorder.hpp"
#include "validator/validator.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace reviewgate {

// ============================================================================
// Server / Logging / Data (mirror the TOML sections)
// ============================================================================

struct ServerConfig {
    std::string host = "0.0.0.0";
    uint16_t port = 8080;
    size_t threads = 4;
    size_t max_message_length = 4000;
    size_t default_trace_limit = 50;
    size_t max_trace_limit = 500;
};

struct LoggingConfig {
    std::string level = "info";
};

struct DataConfig {
    std::string csv_path = "data/reviews.csv";
};

struct DatabaseConfig {
    bool enabled = false;                   // false = users come from [[users]]
    PgUserDirectory::Config postgres;
};

struct TraceConfig {
    TraceRecorder::Config recorder;
    bool file_enabled = true;
    FileSink::Config file;
};

// ============================================================================
// Top-level configuration
// ============================================================================

struct AppConfig {
    ServerConfig server;
    LoggingConfig logging;
    HttpInterpreterClient::Config interpreter;
    IntentRouter::Config router;
    Validator::Config validator;
    FallbackPolicy::Config fallback;
    ToolExecutor::Config metrics;
    AccessCache::Config cache;
    TraceConfig trace;
    ConversationStore::Config conversations;
    DataConfig data;
    DatabaseConfig database;
    std::vector<UserRecord> users;
    ToolRegistry::Config tools;
};

} // namespace reviewgate
