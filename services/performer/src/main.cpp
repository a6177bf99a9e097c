#include <iostream>
#include <string>
#include <cstring>
#include <csignal>
#include <cstdint>
#include <stdexcept>
#include <unistd.h>
#include <curl/curl.h>
#include <microhttpd.h>
#include "../include/config.hpp"
#include "../include/log.hpp"
#include "../include/pipeline.hpp"
#include "../include/routes.hpp"

#if MHD_VERSION >= 0x00097002
using MhdResult = enum MHD_Result;
#else
using MhdResult = int;
#endif

static volatile std::sig_atomic_t g_stop = 0;

struct ConnInfo {
    std::string method;
    std::string url;
    std::string body;
    bool too_large{false};
};

static MhdResult send_response(struct MHD_Connection* conn, int status, const std::string& body, const char* ctype) {
    struct MHD_Response* resp = MHD_create_response_from_buffer(body.size(), (void*)body.data(), MHD_RESPMEM_MUST_COPY);
    if (!resp) return MHD_NO;
    MHD_add_response_header(resp, MHD_HTTP_HEADER_CONTENT_TYPE, ctype);
    MhdResult ret = MHD_queue_response(conn, status, resp);
    MHD_destroy_response(resp);
    return ret;
}

static MhdResult handler(void* cls, struct MHD_Connection* connection, const char* url, const char* method,
                         const char* /*version*/, const char* upload_data, size_t* upload_data_size, void** con_cls) {
    const TaskPipeline* pipeline = static_cast<const TaskPipeline*>(cls);
    ConnInfo* ci = static_cast<ConnInfo*>(*con_cls);
    if (!ci) {
        ci = new ConnInfo{method, url, {}, false};
        *con_cls = ci;
        return MHD_YES;
    }

    if (*upload_data_size) {
        // keep draining an oversized body, but stop buffering it
        if (!ci->too_large && ci->body.size() + *upload_data_size <= kMaxRequestBody) {
            ci->body.append(upload_data, *upload_data_size);
        } else {
            ci->too_large = true;
            ci->body.clear();
        }
        *upload_data_size = 0;
        return MHD_YES;
    }

    if (ci->too_large) {
        return send_response(connection, 413,
                             "{\"error\":{\"message\":\"request body too large\"}}", "application/json");
    }
    HttpReply reply = route_request(*pipeline, ci->method, ci->url, ci->body);
    return send_response(connection, reply.status, reply.body, reply.content_type.c_str());
}

static void request_completed(void* /*cls*/, struct MHD_Connection* /*connection*/, void** con_cls,
                              enum MHD_RequestTerminationCode /*toe*/) {
    delete static_cast<ConnInfo*>(*con_cls);
    *con_cls = nullptr;
}

static void usage() {
    std::cerr << "performer usage:\n"
              << "  performer [--port N] [--log-level debug|info|warn|error]\n"
              << "environment:\n"
              << "  AZURE_OPENAI_KEY, AZURE_OPENAI_ENDPOINT (required for tasks to pass intake)\n"
              << "  PERFORMER_TIMEOUT_MS, PERFORMER_MAX_TOKENS, PERFORMER_TEMPERATURE,\n"
              << "  PERFORMER_PORT, PERFORMER_CONNECTION_TIMEOUT_S, PERFORMER_LOG_LEVEL\n";
}

int main(int argc, char** argv) {
    PerformerConfig cfg;
    try {
        cfg = load_config(process_env());
        for (int i = 1; i < argc; ++i) {
            std::string a = argv[i];
            if (a == "--port" && i + 1 < argc) {
                cfg.server.port = std::stoi(argv[++i]);
                if (cfg.server.port < 1 || cfg.server.port > 65535) throw std::invalid_argument("--port out of range");
            } else if (a == "--log-level" && i + 1 < argc) {
                auto lvl = parse_log_level(argv[++i]);
                if (!lvl) { usage(); return 2; }
                cfg.log_level = *lvl;
            } else {
                usage();
                return a == "--help" ? 0 : 2;
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "[performer] Invalid configuration: " << e.what() << "\n";
        return 2;
    }
    set_log_level(cfg.log_level);

    if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
        std::cerr << "[performer] curl_global_init failed" << std::endl;
        return 1;
    }
    if (auto err = check_dispatcher_config(cfg.dispatcher)) {
        log_warn("performer", "Inference configuration incomplete; tasks will be rejected", {{"reason", err->message}});
    }

    TaskPipeline pipeline = make_pipeline(cfg.dispatcher);

    log_info("performer", "Starting HTTP server", {
        {"port", std::to_string(cfg.server.port)},
        {"timeoutMs", std::to_string(cfg.dispatcher.timeout.count())},
    });
    struct MHD_Daemon* d = MHD_start_daemon(
        MHD_USE_THREAD_PER_CONNECTION | MHD_USE_INTERNAL_POLLING_THREAD | MHD_USE_ERROR_LOG,
        (uint16_t)cfg.server.port, nullptr, nullptr, &handler, &pipeline,
        MHD_OPTION_NOTIFY_COMPLETED, &request_completed, nullptr,
        MHD_OPTION_CONNECTION_TIMEOUT, (unsigned int)cfg.server.connection_timeout_s,
        MHD_OPTION_END);
    if (!d) {
        log_error("performer", "Failed to start HTTP server", {{"port", std::to_string(cfg.server.port)}});
        curl_global_cleanup();
        return 1;
    }
    std::signal(SIGTERM, [](int){ g_stop = 1; });
    std::signal(SIGINT, [](int){ g_stop = 1; });
    while (!g_stop) pause();
    log_info("performer", "Shutting down");
    MHD_stop_daemon(d);
    curl_global_cleanup();
    return 0;
}
