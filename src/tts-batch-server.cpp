#include "server-routes.h"
#include "service-config.h"
#include "tts-log.h"
#include "tts-service.h"

#include <httplib.h>

#include <cstdio>

int main(int argc, char ** argv) {
    server_config cfg;
    std::string err;
    if (!parse_server_args(argc, argv, cfg, err)) {
        if (!err.empty()) {
            std::fprintf(stderr, "error: %s\n\n", err.c_str());
        }
        print_server_usage(argv[0]);
        return 1;
    }

    tts_log_set_level(cfg.service.log_level);

    TTS_LOG_INFO("config: models_dir=%s fallback_dir=%s default_model=%s models=%zu max_models=%d cache=%s coalesce=%s\n",
            cfg.service.models_dir.c_str(),
            cfg.service.fallback_dir.empty() ? "-" : cfg.service.fallback_dir.c_str(),
            cfg.service.default_model.c_str(),
            cfg.service.available_models.size(),
            cfg.service.max_models,
            cache_mode_to_cstr(cfg.service.cache),
            cfg.service.coalesce ? "on" : "off");
    if (cfg.user_token.empty()) {
        TTS_LOG_WARN("no user token configured, requests are not authenticated\n");
    }

    tts_service svc;
    if (!tts_service_init(svc, cfg.service, err)) {
        TTS_LOG_ERROR("init failed: %s\n", err.c_str());
        return 1;
    }

    httplib::Server server;
    const size_t n_threads = (size_t) cfg.n_http_threads;
    server.new_task_queue = [n_threads]() { return new httplib::ThreadPool(n_threads); };

    install_routes(server, cfg, *svc.orch, *svc.registry);

    TTS_LOG_INFO("tts-batch-server listening on http://%s:%d\n", cfg.host.c_str(), cfg.port);
    if (!server.listen(cfg.host, cfg.port)) {
        TTS_LOG_ERROR("failed to listen on %s:%d\n", cfg.host.c_str(), cfg.port);
        return 1;
    }

    return 0;
}
