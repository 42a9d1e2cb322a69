#include <iostream>
#include <string>
#include <map>
#include <memory>
#include <cstring>
#include <csignal>
#include <cstdint>
#include <vector>
#include <pthread.h>
#include <curl/curl.h>
#include <microhttpd.h>
#include <nlohmann/json.hpp>
#include "config.hpp"
#include "coordinator.hpp"
#include "errors.hpp"
#include "http_notifier.hpp"
#include "json_codec.hpp"
#include "log.hpp"

using json = nlohmann::json;

#if MHD_VERSION >= 0x00097002
using MhdResult = enum MHD_Result;
#else
using MhdResult = int;
#endif

static std::unique_ptr<Coordinator> g_coordinator;

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

static MhdResult send_error(struct MHD_Connection* conn, unsigned int status, const std::string& msg) {
    return send_response(conn, status, json({{"error", msg}}).dump());
}

static std::map<std::string,std::string> parse_query(struct MHD_Connection* conn) {
    std::map<std::string,std::string> out;
    MHD_get_connection_values(conn, MHD_GET_ARGUMENT_KIND,
        [](void* cls, enum MHD_ValueKind, const char* key, const char* val) -> MhdResult {
            auto* m = static_cast<std::map<std::string,std::string>*>(cls);
            (*m)[key ? key : ""] = val ? val : "";
            return MHD_YES;
        }, &out);
    return out;
}

// "/tasks/<id>/complete" -> {"tasks", "<id>", "complete"}
static std::vector<std::string> split_path(const std::string& path) {
    std::vector<std::string> parts;
    std::size_t pos = 0;
    while (pos < path.size()) {
        std::size_t next = path.find('/', pos);
        if (next == std::string::npos) next = path.size();
        if (next > pos) parts.push_back(path.substr(pos, next - pos));
        pos = next + 1;
    }
    return parts;
}

static json parse_body(const std::string& body) {
    if (body.empty()) return json::object();
    return json::parse(body);
}

static MhdResult route(struct MHD_Connection* connection, const ConnInfo& ci) {
    Coordinator& c = *g_coordinator;
    const std::string& m = ci.method;
    auto parts = split_path(ci.url);

    if (m == "GET" && ci.url == "/status") {
        return send_response(connection, MHD_HTTP_OK, status_to_json(c.status()).dump());
    }
    if (m == "POST" && ci.url == "/tick") {
        std::size_t n = c.schedule_tick();
        return send_response(connection, MHD_HTTP_OK, json({{"assigned", n}}).dump());
    }
    if (m == "POST" && ci.url == "/agents") {
        Agent a = c.register_agent(agent_from_spec(agent_spec_from_json(parse_body(ci.body))));
        return send_response(connection, MHD_HTTP_OK, agent_to_json(a).dump());
    }
    if (parts.size() == 2 && parts[0] == "agents" && m == "GET") {
        auto a = c.find_agent(parts[1]);
        if (!a) return send_error(connection, MHD_HTTP_NOT_FOUND, "unknown agent: " + parts[1]);
        return send_response(connection, MHD_HTTP_OK, agent_to_json(*a).dump());
    }
    if (parts.size() == 3 && parts[0] == "agents" && parts[2] == "status" && m == "POST") {
        auto j = parse_body(ci.body);
        auto st = parse_agent_status(j.value("status", std::string()));
        if (!st) return send_error(connection, MHD_HTTP_BAD_REQUEST, "status must be idle|working|waiting|error|completed");
        Agent a = c.transition_agent(parts[1], *st);
        return send_response(connection, MHD_HTTP_OK, agent_to_json(a).dump());
    }
    if (m == "POST" && ci.url == "/tasks") {
        auto j = parse_body(ci.body);
        std::string title = j.value("title", std::string());
        std::string id = c.create_task(title, j.value("description", std::string()),
                                       priority_from_json(j, "priority"),
                                       string_set_from_json(j, "dependencies"),
                                       string_set_from_json(j, "required_capabilities"),
                                       j.value("id", std::string()));
        return send_response(connection, MHD_HTTP_OK, json({{"id", id}}).dump());
    }
    if (m == "GET" && ci.url == "/tasks/blocked") {
        json arr = json::array();
        for (const auto& b : c.blocked_tasks()) arr.push_back(blocked_to_json(b));
        return send_response(connection, MHD_HTTP_OK, json({{"blocked", arr}}).dump());
    }
    if (parts.size() == 2 && parts[0] == "tasks" && m == "GET") {
        auto t = c.find_task(parts[1]);
        if (!t) return send_error(connection, MHD_HTTP_NOT_FOUND, "unknown task: " + parts[1]);
        return send_response(connection, MHD_HTTP_OK, task_to_json(*t).dump());
    }
    if (parts.size() == 3 && parts[0] == "tasks" && m == "POST") {
        const std::string& id = parts[1];
        const std::string& action = parts[2];
        auto j = parse_body(ci.body);
        if (action == "start") c.start_task(id);
        else if (action == "complete") c.complete_task(id, j.value("result", std::string()));
        else if (action == "fail") c.fail_task(id, j.value("error", std::string("failed")));
        else if (action == "cancel") c.cancel_task(id);
        else return send_error(connection, MHD_HTTP_NOT_FOUND, "not found");
        auto t = c.find_task(id);
        return send_response(connection, MHD_HTTP_OK, t ? task_to_json(*t).dump() : json({{"ok", true}}).dump());
    }
    if (m == "POST" && ci.url == "/messages") {
        Message msg = c.post_message(message_from_json(parse_body(ci.body)));
        return send_response(connection, MHD_HTTP_OK, json({{"id", msg.id}}).dump());
    }
    if (m == "GET" && ci.url == "/messages") {
        auto q = parse_query(connection);
        auto it = q.find("agent");
        if (it == q.end() || it->second.empty()) {
            return send_error(connection, MHD_HTTP_BAD_REQUEST, "agent query parameter required");
        }
        std::int64_t since_ms = 0;
        auto s = q.find("since");
        if (s != q.end() && !s->second.empty()) since_ms = std::stoll(s->second);
        json arr = json::array();
        for (const auto& msg : c.messages_since(it->second, from_epoch_ms(since_ms))) {
            arr.push_back(message_to_json(msg));
        }
        return send_response(connection, MHD_HTTP_OK, json({{"messages", arr}}).dump());
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
    } catch (const DuplicateAgent& e) {
        return send_error(connection, MHD_HTTP_CONFLICT, e.what());
    } catch (const InvalidTransition& e) {
        return send_error(connection, MHD_HTTP_CONFLICT, e.what());
    } catch (const UnknownTask& e) {
        return send_error(connection, MHD_HTTP_NOT_FOUND, e.what());
    } catch (const UnknownAgent& e) {
        return send_error(connection, MHD_HTTP_NOT_FOUND, e.what());
    } catch (const std::exception& e) {
        return send_error(connection, MHD_HTTP_BAD_REQUEST, e.what());
    }
}

static void request_completed(void* /*cls*/, struct MHD_Connection* /*conn*/, void** con_cls,
                              enum MHD_RequestTerminationCode /*toe*/) {
    delete static_cast<ConnInfo*>(*con_cls);
    *con_cls = nullptr;
}

static void usage() {
    std::cerr << "coordinator_service usage:\n"
              << "  [--port N] [--observability <url>] [--max-agents N] [--timeout-minutes N]\n"
              << "  [--health-interval S] [--max-retries N] [--retention-hours N]\n"
              << "  [--log-level DEBUG|INFO|WARN|ERROR|OFF] [--session <id>] [--no-auto-assign]\n";
}

int main(int argc, char** argv) {
    CoordinatorConfig cfg;
    try {
        cfg = load_config_from_env();
        apply_cli_args(cfg, argc, argv);
    } catch (const ConfigError& e) {
        std::cerr << "[coordinator] " << e.what() << std::endl;
        usage();
        return 2;
    }
    set_log_level(*parse_log_level(cfg.log_level));

    // Blocked before any thread starts so only sigwait below sees them.
    sigset_t sigs;
    sigemptyset(&sigs);
    sigaddset(&sigs, SIGINT);
    sigaddset(&sigs, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &sigs, nullptr);

    curl_global_init(CURL_GLOBAL_DEFAULT);
    std::shared_ptr<Notifier> notifier;
    std::shared_ptr<HttpNotifier> http_notifier;
    if (cfg.observability_server.empty()) {
        notifier = std::make_shared<NullNotifier>();
    } else {
        HttpNotifierOptions opts;
        opts.server = cfg.observability_server;
        opts.session_id = cfg.session_id;
        http_notifier = std::make_shared<HttpNotifier>(opts);
        notifier = http_notifier;
        log_info("Sending events to " + cfg.observability_server + "/events");
    }
    g_coordinator = std::make_unique<Coordinator>(cfg, notifier);
    g_coordinator->start();

    log_info("Starting HTTP server on port " + std::to_string(cfg.coordination_port) + "...");
    struct MHD_Daemon* d = MHD_start_daemon(MHD_USE_AUTO | MHD_USE_INTERNAL_POLLING_THREAD,
                                            (uint16_t)cfg.coordination_port, nullptr, nullptr, &handler, nullptr,
                                            MHD_OPTION_NOTIFY_COMPLETED, &request_completed, nullptr,
                                            MHD_OPTION_END);
    if (!d) {
        log_error("Failed to start HTTP server");
        g_coordinator.reset();
        curl_global_cleanup();
        return 1;
    }

    int sig = 0;
    sigwait(&sigs, &sig);
    log_info("Shutting down (signal " + std::to_string(sig) + ")");

    MHD_stop_daemon(d);
    g_coordinator.reset();
    if (http_notifier && http_notifier->dropped()) {
        log_warn(std::to_string(http_notifier->dropped()) + " events dropped on queue overflow");
    }
    http_notifier.reset();
    notifier.reset();
    curl_global_cleanup();
    return 0;
}
