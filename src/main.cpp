#include "access/access_model.hpp"
#include "access/pg_user_directory.hpp"
#include "access/user_directory.hpp"
#include "cache/access_cache.hpp"
#include "config/config_loader.hpp"
#include "conversation/conversation_store.hpp"
#include "core/pipeline.hpp"
#include "core/utils.hpp"
#include "data/review_loader.hpp"
#include "executor/tool_executor.hpp"
#include "fallback/fallback_policy.hpp"
#include "router/intent_router.hpp"
#include "router/interpreter_client.hpp"
#include "server/http_server.hpp"
#include "tools/tool_registry.hpp"
#include "trace/file_sink.hpp"
#include "trace/trace_recorder.hpp"
#include "validator/validator.hpp"

#include <csignal>
#include <format>
#include <memory>

using namespace reviewgate;

// Global instances for signal handling
std::shared_ptr<HttpServer> g_server;

void signal_handler(int signal) {
    utils::log::info(std::format("Received signal {}, shutting down...", signal));
    if (g_server) {
        g_server->stop();
    }
}

int main(int argc, char* argv[]) {
    try {
        utils::log::info("reviewgate starting...");

        std::signal(SIGINT, signal_handler);
        std::signal(SIGTERM, signal_handler);

        std::string config_file = "config/reviewgate.toml";
        if (argc > 1) {
            config_file = argv[1];
        }

        utils::log::info(std::format("[1/6] Loading configuration from {}", config_file));
        auto config_result = ConfigLoader::load_from_file(config_file);
        if (!config_result.success) {
            utils::log::error(config_result.error_message);
            return 1;
        }
        const auto& cfg = config_result.config;
        utils::log::set_level(utils::log::parse_level(cfg.logging.level));

        // Review corpus
        utils::log::info(std::format("[2/6] Loading reviews from {}", cfg.data.csv_path));
        auto loaded = ReviewLoader::load_csv(cfg.data.csv_path);
        if (!loaded.success) {
            utils::log::error(std::format("Review load failed: {}", loaded.error_message));
            return 1;
        }
        if (!loaded.missing_columns.empty()) {
            utils::log::warn(std::format("Review CSV is missing columns: {}",
                                         utils::join(loaded.missing_columns, ", ")));
        }
        if (!loaded.extra_columns.empty()) {
            utils::log::info(std::format("Review CSV has extra columns: {}",
                                         utils::join(loaded.extra_columns, ", ")));
        }
        utils::log::info(std::format(
            "Reviews: {} records, {} rows over {} categories ({} bad rating, {} bad date, {} no category)",
            loaded.stats.records, loaded.stats.rows, loaded.stats.categories,
            loaded.stats.dropped_rating, loaded.stats.dropped_date, loaded.stats.dropped_no_category));
        auto source = std::make_shared<InMemoryReviewSource>(std::move(loaded.rows));

        // Users and grants
        utils::log::info("[3/6] Initializing user directory");
        std::shared_ptr<IUserDirectory> directory;
        if (cfg.database.enabled) {
            directory = std::make_shared<PgUserDirectory>(cfg.database.postgres);
            utils::log::info("User directory: PostgreSQL");
        } else {
            auto in_memory = std::make_shared<InMemoryUserDirectory>(cfg.users);
            in_memory->set_catalog(source);
            directory = in_memory;
            utils::log::info(std::format("User directory: in-memory ({} users)", cfg.users.size()));
        }
        auto access = std::make_shared<AccessModel>(directory, source);

        // Decision core
        utils::log::info("[4/6] Building tool registry, router and validator");
        auto registry = std::make_shared<const ToolRegistry>(cfg.tools);
        auto client = std::make_shared<HttpInterpreterClient>(cfg.interpreter);
        auto router = std::make_shared<IntentRouter>(client, registry, cfg.router);
        auto validator = std::make_shared<Validator>(registry, access, cfg.validator);
        auto fallback = std::make_shared<FallbackPolicy>(access, cfg.fallback);
        auto cache = std::make_shared<AccessCache>(cfg.cache);
        auto executor = std::make_shared<ToolExecutor>(access, source, cache, cfg.metrics);

        // Trace
        utils::log::info("[5/6] Opening trace recorder");
        auto trace = std::make_shared<TraceRecorder>(access, cfg.trace.recorder);
        if (cfg.trace.file_enabled) {
            trace->add_sink(std::make_unique<FileSink>(cfg.trace.file));
        }

        PipelineComponents components;
        components.access = access;
        components.router = router;
        components.validator = validator;
        components.fallback = fallback;
        components.executor = executor;
        components.trace = trace;
        components.conversations = std::make_shared<ConversationStore>(cfg.conversations);
        components.history_window = cfg.router.history_window;
        auto pipeline = std::make_shared<TurnPipeline>(std::move(components));

        utils::log::info("[6/6] Starting HTTP server");
        g_server = std::make_shared<HttpServer>(pipeline, cfg.server);
        g_server->start();

        trace->shutdown();
        const auto cache_stats = cache->get_stats();
        const auto pipeline_stats = pipeline->get_stats();
        utils::log::info(std::format("Shutdown: {} turns ({} fallbacks, {} failed), cache {} hits / {} misses",
            pipeline_stats.total_turns, pipeline_stats.fallbacks, pipeline_stats.failed,
            cache_stats.hits, cache_stats.misses));

    } catch (const std::exception& e) {
        utils::log::error(std::format("Fatal: {}", e.what()));
        return 1;
    }

    return 0;
}
