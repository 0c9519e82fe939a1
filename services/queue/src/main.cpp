#include <iostream>
#include <string>
#include <map>
#include <memory>
#include <cstring>
#include <csignal>
#include <unistd.h>
#include <microhttpd.h>
#include <nlohmann/json.hpp>
#include "../include/job_queue.hpp"
#include "../include/service_config.hpp"
#include "../../engine/include/stub_engine.hpp"
#include "../../engine/include/zlib_engine.hpp"
#include "../../swarm/include/agent_swarm.hpp"
#include "../../events/include/event_emitter.hpp"
#include "../../../shared/cpp/common/include/errors.hpp"
#include "../../../shared/cpp/common/include/log.hpp"
#include "../../../shared/cpp/common/include/util.hpp"

using json = nlohmann::json;

#if MHD_VERSION >= 0x00097002
using MhdResult = enum MHD_Result;
#else
using MhdResult = int;
#endif

static std::shared_ptr<EventEmitter> g_emitter;
static std::shared_ptr<AgentSwarm> g_swarm;
static std::shared_ptr<JobQueue> g_queue;
static volatile std::sig_atomic_t g_stop = 0;

struct ConnInfo {
    std::string method;
    std::string url;
    std::string body;
};

static MhdResult send_response(struct MHD_Connection* conn, unsigned int status, const std::string& body,
                               const char* ctype = "application/json") {
    struct MHD_Response* resp = MHD_create_response_from_buffer(body.size(), (void*)body.data(), MHD_RESPMEM_MUST_COPY);
    if (!resp) return MHD_NO;
    MHD_add_response_header(resp, MHD_HTTP_HEADER_CONTENT_TYPE, ctype);
    MhdResult ret = MHD_queue_response(conn, status, resp);
    MHD_destroy_response(resp);
    return ret;
}

static MhdResult send_json(struct MHD_Connection* conn, unsigned int status, const json& body) {
    return send_response(conn, status, body.dump());
}

static MhdResult send_error(struct MHD_Connection* conn, unsigned int status, const std::string& message) {
    return send_json(conn, status, json{{"error", message}});
}

static std::map<std::string, std::string> parse_query(struct MHD_Connection* conn) {
    std::map<std::string, std::string> out;
    MHD_get_connection_values(conn, MHD_GET_ARGUMENT_KIND,
        [](void* cls, enum MHD_ValueKind, const char* key, const char* val) -> MhdResult {
            auto* m = static_cast<std::map<std::string, std::string>*>(cls);
            (*m)[key ? key : ""] = val ? val : "";
            return MHD_YES;
        }, &out);
    return out;
}

static std::size_t query_size(const std::map<std::string, std::string>& q, const char* key, std::size_t def) {
    auto it = q.find(key);
    if (it == q.end() || it->second.empty()) return def;
    try {
        return static_cast<std::size_t>(std::stoull(it->second));
    } catch (const std::exception&) {
        throw ValidationError(std::string(key) + " must be a non-negative integer");
    }
}

// "/jobs/<id>/<action>" -> {id, action}; action is empty for "/jobs/<id>".
static bool split_resource(const std::string& path, const std::string& prefix, std::string& id, std::string& action) {
    if (path.rfind(prefix, 0) != 0) return false;
    std::string rest = path.substr(prefix.size());
    auto slash = rest.find('/');
    id = rest.substr(0, slash);
    action = slash == std::string::npos ? "" : rest.substr(slash + 1);
    return !id.empty();
}

static json agents_json() {
    const auto now = SteadyClock::now();
    json arr = json::array();
    for (const auto& a : g_swarm->agents()) arr.push_back(agent_to_json(a, now));
    return arr;
}

static MhdResult route(struct MHD_Connection* connection, const ConnInfo& ci) {
    const std::string& path = ci.url;
    std::string id, action;

    if (ci.method == "POST" && path == "/jobs") {
        auto parsed = job_request_from_json(json::parse(ci.body));
        std::string job_id = g_queue->submit(parsed.first, parsed.second);
        // retention may already have dropped a job that finished this fast
        auto job = g_queue->get(job_id);
        return send_json(connection, MHD_HTTP_CREATED, job ? job_to_json(*job) : json{{"id", job_id}});
    }
    if (ci.method == "POST" && path == "/jobs/data") {
        auto parsed = data_job_request_from_params(parse_query(connection), ci.body);
        std::string job_id = g_queue->submit(parsed.first, parsed.second);
        auto job = g_queue->get(job_id);
        return send_json(connection, MHD_HTTP_CREATED, job ? job_to_json(*job) : json{{"id", job_id}});
    }
    if (ci.method == "GET" && path == "/jobs") {
        auto q = parse_query(connection);
        std::optional<JobStatus> status;
        auto it = q.find("status");
        if (it != q.end() && !it->second.empty()) {
            status = job_status_from_name(it->second);
            if (!status) throw ValidationError("unknown status '" + it->second + "'");
        }
        auto user = q.find("user_id");
        const std::string user_id = user == q.end() ? std::string() : user->second;
        json jobs = json::array();
        for (const auto& j : g_queue->list(status, query_size(q, "limit", 100), user_id)) jobs.push_back(job_to_json(j));
        return send_json(connection, MHD_HTTP_OK, json{{"jobs", jobs}, {"stats", stats_to_json(g_queue->stats())}});
    }
    if (split_resource(path, "/jobs/", id, action)) {
        if (ci.method == "GET" && action.empty()) {
            auto job = g_queue->get(id);
            if (!job) throw NotFoundError("job " + id + " not found");
            return send_json(connection, MHD_HTTP_OK, job_to_json(*job));
        }
        if (ci.method == "GET" && action == "output") {
            auto job = g_queue->get(id);
            if (!job) throw NotFoundError("job " + id + " not found");
            if (!job->output_data) {
                throw InvalidStateError("job " + id + " has no output data (" + job_status_name(job->status) + ")");
            }
            return send_response(connection, MHD_HTTP_OK, *job->output_data, "application/octet-stream");
        }
        if (ci.method == "POST" && (action == "cancel" || action == "pause" || action == "resume")) {
            if (action == "cancel") g_queue->cancel(id);
            else if (action == "pause") g_queue->pause(id);
            else g_queue->resume(id);
            auto job = g_queue->get(id);
            return send_json(connection, MHD_HTTP_OK, job ? job_to_json(*job) : json{{"id", id}});
        }
    }
    if (ci.method == "GET" && path == "/agents") {
        return send_json(connection, MHD_HTTP_OK, json{{"agents", agents_json()}});
    }
    if (split_resource(path, "/agents/", id, action) && ci.method == "POST") {
        if (action == "offline") g_swarm->mark_offline(id);
        else if (action == "online") g_swarm->mark_online(id);
        else if (action == "reset") g_swarm->reset(id);
        else return send_error(connection, MHD_HTTP_NOT_FOUND, "not found");
        auto agent = g_swarm->agent(id);
        if (!agent) throw NotFoundError("unknown agent: " + id);
        return send_json(connection, MHD_HTTP_OK, agent_to_json(*agent, SteadyClock::now()));
    }
    if (ci.method == "GET" && path == "/health") {
        return send_json(connection, MHD_HTTP_OK, json{
            {"swarm", health_to_json(g_swarm->swarm_health())},
            {"queue", stats_to_json(g_queue->stats())}
        });
    }
    if (ci.method == "GET" && path == "/events") {
        auto q = parse_query(connection);
        const auto since = query_size(q, "since", 0);
        json events = json::array();
        for (const auto& ev : g_emitter->get_since(since, query_size(q, "limit", 100))) events.push_back(event_to_json(ev));
        return send_json(connection, MHD_HTTP_OK, json{{"events", events}, {"last_sequence", g_emitter->last_sequence()}});
    }
    return send_error(connection, MHD_HTTP_NOT_FOUND, "not found");
}

static MhdResult handler(void* /*cls*/, struct MHD_Connection* connection, const char* url, const char* method,
                         const char* /*version*/, const char* upload_data, size_t* upload_data_size, void** con_cls) {
    ConnInfo* ci = static_cast<ConnInfo*>(*con_cls);
    if (!ci) {
        ci = new ConnInfo{method, url, {}};
        *con_cls = ci;
        return MHD_YES;
    }

    if (0 == strcmp(method, MHD_HTTP_METHOD_POST)) {
        if (*upload_data_size) {
            ci->body.append(upload_data, *upload_data_size);
            *upload_data_size = 0;
            return MHD_YES;
        }
    }

    try {
        return route(connection, *ci);
    } catch (const json::exception& e) {
        return send_error(connection, MHD_HTTP_BAD_REQUEST, std::string("invalid JSON: ") + e.what());
    } catch (const ValidationError& e) {
        return send_error(connection, MHD_HTTP_BAD_REQUEST, e.what());
    } catch (const NotFoundError& e) {
        return send_error(connection, MHD_HTTP_NOT_FOUND, e.what());
    } catch (const InvalidStateError& e) {
        return send_error(connection, MHD_HTTP_CONFLICT, e.what());
    } catch (const std::exception& e) {
        log_error("compressord", ci->method + " " + ci->url + ": " + e.what());
        return send_error(connection, MHD_HTTP_INTERNAL_SERVER_ERROR, e.what());
    }
}

static void request_completed(void* /*cls*/, struct MHD_Connection* /*conn*/, void** con_cls,
                              enum MHD_RequestTerminationCode /*toe*/) {
    delete static_cast<ConnInfo*>(*con_cls);
    *con_cls = nullptr;
}

static std::shared_ptr<EngineAdapter> make_engine(const std::string& name) {
    if (name == "stub") return std::make_shared<StubEngine>();
    return std::make_shared<ZlibEngine>();
}

int main(int argc, char** argv) {
    std::string config_path = getenv_or("COMPRESSOR_CONFIG", "");
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else {
            std::cerr << "usage: compressord [--config <file.json>]" << std::endl;
            return 2;
        }
    }

    ServiceConfig config;
    try {
        config = config_path.empty() ? service_config_from_json(json::object()) : load_service_config(config_path);
        apply_env_overrides(config);
    } catch (const CompressError& e) {
        std::cerr << "[compressord] Invalid configuration: " << e.what() << std::endl;
        return 1;
    }
    log_set_level(config.log_level);

    g_emitter = std::make_shared<EventEmitter>(config.history_size);
    set_default_emitter(g_emitter);
    try {
        g_swarm = std::make_shared<AgentSwarm>(config.swarm, g_emitter);
        g_swarm->initialize(config.agents);
        g_queue = std::make_shared<JobQueue>(config.queue, g_swarm, make_engine(config.engine), g_emitter);
    } catch (const CompressError& e) {
        std::cerr << "[compressord] Startup failed: " << e.what() << std::endl;
        return 1;
    }
    g_queue->start();

    log_info("compressord", "Starting HTTP server on port " + std::to_string(config.port) + " (engine " +
             config.engine + ", " + std::to_string(config.agents.size()) + " agents)");
    struct MHD_Daemon* d = MHD_start_daemon(MHD_USE_AUTO | MHD_USE_INTERNAL_POLLING_THREAD, config.port, nullptr, nullptr,
                                            &handler, nullptr,
                                            MHD_OPTION_NOTIFY_COMPLETED, &request_completed, nullptr,
                                            MHD_OPTION_END);
    if (!d) {
        log_error("compressord", "Failed to start HTTP server");
        g_queue->stop();
        return 1;
    }
    std::signal(SIGTERM, [](int) { g_stop = 1; });
    std::signal(SIGINT, [](int) { g_stop = 1; });
    while (!g_stop) pause();

    log_info("compressord", "Shutting down");
    MHD_stop_daemon(d);
    g_queue->stop();
    g_queue.reset();
    g_emitter->flush();
    return 0;
}
