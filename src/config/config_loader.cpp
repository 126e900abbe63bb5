#include "config/config_loader.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <format>
#include <limits>
#include <set>
#include <stdexcept>
#include <unordered_set>

using namespace std::string_literals;

namespace reviewgate {

// ============================================================================
// TOML Parsing Helpers (env expansion, includes, merging)
// ============================================================================

namespace {

/**
 * @brief Expand ${VAR_NAME} patterns with environment variables.
 */
std::string expand_env_vars(const std::string& input) {
    if (input.find("${") == std::string::npos) return input;

    std::string result;
    result.reserve(input.size());
    size_t i = 0;
    while (i < input.size()) {
        if (i + 1 < input.size() && input[i] == '$' && input[i + 1] == '{') {
            const size_t close = input.find('}', i + 2);
            if (close == std::string::npos) {
                throw std::runtime_error(
                    std::format("Unclosed env var substitution at position {}", i));
            }
            const std::string var_name = input.substr(i + 2, close - i - 2);
            if (const char* env_val = std::getenv(var_name.c_str())) result += env_val;
            i = close + 1;
        } else {
            result += input[i++];
        }
    }
    return result;
}

void expand_node(toml::node& node);

void expand_table(toml::table& tbl) {
    for (auto& [key, val] : tbl) expand_node(val);
}

void expand_node(toml::node& node) {
    if (auto* s = node.as_string()) {
        auto expanded = expand_env_vars(s->get());
        if (expanded != s->get()) *s = std::move(expanded);
    } else if (auto* t = node.as_table()) {
        expand_table(*t);
    } else if (auto* a = node.as_array()) {
        for (auto& elem : *a) expand_node(elem);
    }
}

/**
 * @brief Deep-merge two tables. Overlay wins for scalars; arrays concatenate.
 */
void merge_tables(toml::table& base, const toml::table& overlay) {
    for (const auto& [key, val] : overlay) {
        if (val.is_table() && base.contains(key) && base[key].is_table()) {
            merge_tables(*base[key].as_table(), *val.as_table());
        } else if (val.is_array() && base.contains(key) && base[key].is_array()) {
            auto& base_arr = *base[key].as_array();
            for (const auto& elem : *val.as_array()) {
                base_arr.push_back(elem);
            }
        } else {
            base.insert_or_assign(key, val);
        }
    }
}

void resolve_includes(toml::table& root, const std::string& base_dir,
                      std::unordered_set<std::string>& visited, const int depth) {
    if (depth > 10) {
        throw std::runtime_error("Config include depth exceeds 10 (circular include?)");
    }
    auto inc_node = root["include"];
    if (!inc_node) return;

    std::vector<std::string> paths;
    if (inc_node.is_string()) {
        paths.emplace_back(inc_node.as_string()->get());
    } else if (const auto* arr = inc_node.as_array()) {
        for (const auto& item : *arr) {
            if (item.is_string()) paths.emplace_back(item.as_string()->get());
        }
    }
    root.erase("include");

    namespace fs = std::filesystem;
    for (const auto& rel_path : paths) {
        const std::string abs_path = fs::canonical(fs::path(base_dir) / rel_path).string();
        if (!visited.insert(abs_path).second) {
            throw std::runtime_error(std::format("Circular config include detected: {}", abs_path));
        }

        auto included = toml::parse_file(abs_path);
        resolve_includes(included, fs::path(abs_path).parent_path().string(), visited, depth + 1);

        // Including file wins over included
        merge_tables(included, root);
        root = std::move(included);
    }
}

toml::table parse_toml_string(const std::string& content) {
    auto result = toml::parse(content);
    expand_table(result);
    return result;
}

toml::table parse_toml_file(const std::string& file_path) {
    namespace fs = std::filesystem;
    auto result = toml::parse_file(file_path);

    std::unordered_set<std::string> visited;
    visited.insert(fs::canonical(file_path).string());
    resolve_includes(result, fs::path(file_path).parent_path().string(), visited, 0);

    expand_table(result);
    return result;
}

// ---- Extraction helpers ----------------------------------------------------

std::vector<std::string> toml_string_array(const toml::table& tbl, const std::string_view key) {
    std::vector<std::string> result;
    if (const auto* arr = tbl[key].as_array()) {
        result.reserve(arr->size());
        for (const auto& elem : *arr) {
            if (const auto* s = elem.as_string()) result.emplace_back(s->get());
        }
    }
    return result;
}

std::chrono::milliseconds toml_ms(const toml::table& tbl, std::string_view key,
                                  std::chrono::milliseconds fallback) {
    return std::chrono::milliseconds(tbl[key].value_or(static_cast<int64_t>(fallback.count())));
}

std::optional<int64_t> toml_optional_int(const toml::table& tbl, std::string_view key) {
    if (const auto* v = tbl[key].as_integer()) return v->get();
    return std::nullopt;
}

} // anonymous namespace

// ============================================================================
// Section extractors
// ============================================================================

ServerConfig ConfigLoader::extract_server(const toml::table& root) {
    ServerConfig cfg;
    const auto* server = root["server"].as_table();
    if (!server) return cfg;
    const auto& s = *server;

    cfg.host = s["host"].value_or("0.0.0.0"s);
    cfg.port = static_cast<uint16_t>(s["port"].value_or(8080));
    cfg.threads = static_cast<size_t>(s["threads"].value_or(4));
    cfg.max_message_length = static_cast<size_t>(s["max_message_length"].value_or(4000));
    cfg.default_trace_limit = static_cast<size_t>(s["default_trace_limit"].value_or(50));
    cfg.max_trace_limit = static_cast<size_t>(s["max_trace_limit"].value_or(500));
    return cfg;
}

LoggingConfig ConfigLoader::extract_logging(const toml::table& root) {
    LoggingConfig cfg;
    if (const auto* l = root["logging"].as_table()) {
        cfg.level = (*l)["level"].value_or("info"s);
    }
    return cfg;
}

HttpInterpreterClient::Config ConfigLoader::extract_interpreter(const toml::table& root) {
    HttpInterpreterClient::Config cfg;
    const auto* tbl = root["interpreter"].as_table();
    if (!tbl) return cfg;
    const auto& t = *tbl;

    cfg.provider = utils::to_lower(t["provider"].value_or(cfg.provider));
    cfg.endpoint = t["endpoint"].value_or(cfg.endpoint);
    cfg.api_key = t["api_key"].value_or(""s);
    cfg.model = t["model"].value_or(cfg.model);
    cfg.temperature = t["temperature"].value_or(cfg.temperature);
    cfg.max_tokens = t["max_tokens"].value_or(cfg.max_tokens);
    cfg.max_requests_per_minute = static_cast<uint32_t>(
        t["max_requests_per_minute"].value_or(static_cast<int64_t>(cfg.max_requests_per_minute)));
    return cfg;
}

IntentRouter::Config ConfigLoader::extract_router(const toml::table& root) {
    IntentRouter::Config cfg;
    const auto* tbl = root["router"].as_table();
    if (!tbl) return cfg;
    const auto& t = *tbl;

    cfg.history_window = static_cast<size_t>(t["history_window"].value_or(6));
    cfg.max_categories = static_cast<size_t>(t["max_categories"].value_or(200));

    auto& r = cfg.retry;
    r.max_attempts = static_cast<uint32_t>(t["max_attempts"].value_or(3));
    r.base_delay = toml_ms(t, "base_delay_ms", r.base_delay);
    r.max_delay = toml_ms(t, "max_delay_ms", r.max_delay);
    r.attempt_timeout = toml_ms(t, "attempt_timeout_ms", r.attempt_timeout);
    r.overall_deadline = toml_ms(t, "overall_deadline_ms", r.overall_deadline);
    return cfg;
}

Validator::Config ConfigLoader::extract_validator(const toml::table& root) {
    Validator::Config cfg;
    if (const auto* t = root["validator"].as_table()) {
        cfg.min_confidence = (*t)["min_confidence"].value_or(cfg.min_confidence);
    }
    return cfg;
}

FallbackPolicy::Config ConfigLoader::extract_fallback(const toml::table& root) {
    FallbackPolicy::Config cfg;
    const auto* tbl = root["fallback"].as_table();
    if (!tbl) return cfg;

    cfg.default_top_n = (*tbl)["default_top_n"].value_or(cfg.default_top_n);
    if (const auto* m = (*tbl)["default_metric"].as_string()) {
        const auto metric = parse_metric(utils::to_lower(m->get()));
        if (!metric) {
            throw std::runtime_error(std::format("fallback.default_metric: unknown metric '{}'", m->get()));
        }
        cfg.default_metric = *metric;
    }
    return cfg;
}

ToolExecutor::Config ConfigLoader::extract_metrics(const toml::table& root) {
    ToolExecutor::Config cfg;
    const auto* tbl = root["metrics"].as_table();
    if (!tbl) return cfg;
    const auto& t = *tbl;

    cfg.nps.promoter_min = t["promoter_min"].value_or(cfg.nps.promoter_min);
    cfg.nps.detractor_max = t["detractor_max"].value_or(cfg.nps.detractor_max);
    cfg.top_terms = static_cast<size_t>(t["top_terms"].value_or(static_cast<int64_t>(cfg.top_terms)));
    return cfg;
}

AccessCache::Config ConfigLoader::extract_cache(const toml::table& root) {
    AccessCache::Config cfg;
    const auto* tbl = root["cache"].as_table();
    if (!tbl) return cfg;
    const auto& t = *tbl;

    cfg.enabled = t["enabled"].value_or(true);
    cfg.max_entries = static_cast<size_t>(t["max_entries"].value_or(5000));
    cfg.num_shards = static_cast<size_t>(t["num_shards"].value_or(16));
    cfg.ttl = std::chrono::seconds(t["ttl_seconds"].value_or(300));
    return cfg;
}

TraceConfig ConfigLoader::extract_trace(const toml::table& root) {
    TraceConfig cfg;
    const auto* tbl = root["trace"].as_table();
    if (!tbl) return cfg;
    const auto& t = *tbl;

    cfg.recorder.memory_window = static_cast<size_t>(t["memory_window"].value_or(1000));
    cfg.file_enabled = t["file_enabled"].value_or(true);
    cfg.file.output_file = t["output_file"].value_or(cfg.file.output_file);
    cfg.file.max_file_size_bytes = static_cast<size_t>(
        t["max_file_size_mb"].value_or(50)) * 1024 * 1024;
    cfg.file.max_files = t["max_files"].value_or(10);
    cfg.file.size_based_rotation = t["size_based_rotation"].value_or(true);
    cfg.file.time_based_rotation = t["time_based_rotation"].value_or(false);
    cfg.file.rotation_interval = std::chrono::hours(t["rotation_interval_hours"].value_or(24));
    return cfg;
}

DataConfig ConfigLoader::extract_data(const toml::table& root) {
    DataConfig cfg;
    if (const auto* t = root["data"].as_table()) {
        cfg.csv_path = (*t)["csv_path"].value_or(cfg.csv_path);
    }
    return cfg;
}

DatabaseConfig ConfigLoader::extract_database(const toml::table& root) {
    DatabaseConfig cfg;
    const auto* tbl = root["database"].as_table();
    if (!tbl) return cfg;

    cfg.enabled = (*tbl)["enabled"].value_or(false);
    cfg.postgres.connection_string = (*tbl)["connection_string"].value_or(""s);
    cfg.postgres.query_timeout_ms = static_cast<uint32_t>((*tbl)["query_timeout_ms"].value_or(5000));
    return cfg;
}

std::vector<UserRecord> ConfigLoader::extract_users(const toml::table& root) {
    std::vector<UserRecord> result;
    const auto* arr = root["users"].as_array();
    if (!arr) return result;
    result.reserve(arr->size());

    for (const auto& elem : *arr) {
        const auto* u = elem.as_table();
        if (!u) continue;

        UserRecord user;
        user.id = (*u)["id"].value_or(int64_t{0});
        user.name = (*u)["name"].value_or(""s);
        user.api_key = (*u)["api_key"].value_or(""s);
        user.active = (*u)["active"].value_or(true);

        const std::string role_str = (*u)["role"].value_or("analyst"s);
        const auto role = parse_role(utils::to_lower(role_str));
        if (!role) {
            throw std::runtime_error(std::format("users[{}].role: unknown role '{}'", user.id, role_str));
        }
        user.role = *role;

        for (auto& c : toml_string_array(*u, "categories")) {
            auto trimmed = utils::trim(c);
            if (!trimmed.empty()) user.categories.insert(std::move(trimmed));
        }
        result.push_back(std::move(user));
    }
    return result;
}

ToolRegistry::Config ConfigLoader::extract_tools(const toml::table& root) {
    ToolRegistry::Config cfg;
    const auto* tools = root["tools"].as_table();
    if (!tools) return cfg;

    // [tools.<tool>] <param> = { min = .., max = .., default = .. }
    for (const auto& [tool_name, tool_node] : *tools) {
        const auto* params = tool_node.as_table();
        if (!params) continue;
        for (const auto& [param_name, param_node] : *params) {
            const auto* bounds = param_node.as_table();
            if (!bounds) continue;

            ParamOverride ov;
            ov.tool = std::string(tool_name.str());
            ov.param = std::string(param_name.str());
            ov.min_value = toml_optional_int(*bounds, "min");
            ov.max_value = toml_optional_int(*bounds, "max");
            ov.default_value = toml_optional_int(*bounds, "default");
            cfg.overrides.push_back(std::move(ov));
        }
    }
    return cfg;
}

AppConfig ConfigLoader::extract_all_sections(const toml::table& root) {
    AppConfig config;
    config.server = extract_server(root);
    config.logging = extract_logging(root);
    config.interpreter = extract_interpreter(root);
    config.router = extract_router(root);
    config.validator = extract_validator(root);
    config.fallback = extract_fallback(root);
    config.metrics = extract_metrics(root);
    config.cache = extract_cache(root);
    config.trace = extract_trace(root);
    config.data = extract_data(root);
    config.database = extract_database(root);
    config.users = extract_users(root);
    config.tools = extract_tools(root);

    if (const auto* conv = root["conversations"].as_table()) {
        // Negative counts land on 0 and are reported by validation
        config.conversations.max_turns_per_conversation =
            static_cast<size_t>(std::max<int64_t>(0, (*conv)["max_turns"].value_or(int64_t{200})));
        config.conversations.max_conversations_per_user =
            static_cast<size_t>(std::max<int64_t>(0, (*conv)["max_per_user"].value_or(int64_t{50})));
    }
    return config;
}

ConfigLoader::LoadResult ConfigLoader::validate_and_return(AppConfig config) {
    const auto errors = validate_config(config);
    if (!errors.empty()) {
        std::string combined = "Config validation failed:";
        for (const auto& err : errors) { combined += "\n  - "; combined += err; }
        return LoadResult::error(std::move(combined));
    }
    return LoadResult::ok(std::move(config));
}

// ---- Public API ------------------------------------------------------------

ConfigLoader::LoadResult ConfigLoader::load_from_file(const std::string& config_path) {
    try {
        const auto tbl = parse_toml_file(config_path);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to load config: {}", e.what()));
    }
}

ConfigLoader::LoadResult ConfigLoader::load_from_string(const std::string& toml_content) {
    try {
        const auto tbl = parse_toml_string(toml_content);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to parse config: {}", e.what()));
    }
}

// ============================================================================
// Config Validation
// ============================================================================

std::vector<std::string> ConfigLoader::validate_config(const AppConfig& config) {
    std::vector<std::string> errors;

    if (config.server.port == 0) {
        errors.emplace_back("server.port must be 1-65535");
    }
    if (config.server.threads == 0) {
        errors.emplace_back("server.threads must be at least 1");
    }

    if (config.interpreter.provider != "openai" && config.interpreter.provider != "anthropic") {
        errors.push_back(std::format("interpreter.provider must be 'openai' or 'anthropic', got '{}'",
                                     config.interpreter.provider));
    }

    const auto& retry = config.router.retry;
    if (retry.max_attempts == 0) {
        errors.emplace_back("router.max_attempts must be at least 1");
    }
    if (retry.base_delay.count() < 0 || retry.max_delay < retry.base_delay) {
        errors.emplace_back("router.base_delay_ms must be >= 0 and <= router.max_delay_ms");
    }
    if (retry.attempt_timeout.count() <= 0 || retry.overall_deadline.count() <= 0) {
        errors.emplace_back("router.attempt_timeout_ms and router.overall_deadline_ms must be positive");
    }

    if (config.validator.min_confidence < 0.0 || config.validator.min_confidence > 1.0) {
        errors.push_back(std::format("validator.min_confidence must be within [0, 1], got {}",
                                     config.validator.min_confidence));
    }

    const auto& nps = config.metrics.nps;
    if (nps.promoter_min < 1 || nps.promoter_min > 5 ||
        nps.detractor_max < 1 || nps.detractor_max > 5 ||
        nps.detractor_max >= nps.promoter_min) {
        errors.push_back(std::format(
            "metrics: need 1 <= detractor_max < promoter_min <= 5, got {} / {}",
            nps.detractor_max, nps.promoter_min));
    }

    if (config.cache.num_shards == 0) {
        errors.emplace_back("cache.num_shards must be at least 1");
    }

    if (config.conversations.max_turns_per_conversation < 1) {
        errors.emplace_back("conversations.max_turns must be at least 1");
    }
    if (config.conversations.max_conversations_per_user < 1) {
        errors.emplace_back("conversations.max_per_user must be at least 1");
    }

    const ToolRegistry builtin;
    for (const auto& ov : config.tools.overrides) {
        const auto* schema = builtin.lookup(std::string_view(ov.tool));
        if (!schema) {
            errors.push_back(std::format("tools.{}: unknown tool", ov.tool));
            continue;
        }
        const auto* spec = schema->find(ov.param);
        if (!spec || spec->kind != ParamKind::INT) {
            errors.push_back(std::format("tools.{}.{}: not an integer parameter", ov.tool, ov.param));
            continue;
        }
        bool in_range = true;
        for (const auto& bound : {ov.min_value, ov.max_value, ov.default_value}) {
            if (bound && (*bound < std::numeric_limits<int>::min() ||
                          *bound > std::numeric_limits<int>::max())) {
                in_range = false;
            }
        }
        if (!in_range) {
            errors.push_back(std::format("tools.{}.{}: bounds must fit a 32-bit integer", ov.tool, ov.param));
            continue;
        }
        if (ov.min_value.value_or(spec->min_value) > ov.max_value.value_or(spec->max_value)) {
            errors.push_back(std::format("tools.{}.{}: min exceeds max", ov.tool, ov.param));
        }
    }

    if (errors.empty()) {
        const ToolRegistry effective(config.tools);
        const auto* top_n = effective.int_param(ToolName::METRICS_TOP_CATEGORIES, "top_n");
        if (top_n && (config.fallback.default_top_n < top_n->min_value ||
                      config.fallback.default_top_n > top_n->max_value)) {
            errors.push_back(std::format("fallback.default_top_n must be within [{}, {}], got {}",
                                         top_n->min_value, top_n->max_value,
                                         config.fallback.default_top_n));
        }
    }

    if (config.database.enabled && config.database.postgres.connection_string.empty()) {
        errors.emplace_back("database.connection_string required when database.enabled is true");
    }

    std::set<UserId> ids;
    std::set<std::string> keys;
    for (const auto& u : config.users) {
        if (u.id <= 0) {
            errors.push_back(std::format("users: id must be positive (user '{}')", u.name));
        } else if (!ids.insert(u.id).second) {
            errors.push_back(std::format("users: duplicate id {}", u.id));
        }
        if (u.api_key.empty()) {
            errors.push_back(std::format("users[{}].api_key must not be empty", u.id));
        } else if (!keys.insert(u.api_key).second) {
            errors.push_back(std::format("users[{}].api_key is shared with another user", u.id));
        }
    }

    return errors;
}

} // namespace reviewgate
