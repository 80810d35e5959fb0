#include "gateway_config.h"
#include "gateway_handler.h"
#include "gateway_server.h"
#include "../admission/admission_controller.h"
#include "../cache/cache_manager.h"
#include "../events/event_bus.h"
#include "../events/subscription_router.h"
#include "../loader/memory_entity_source.h"
#include "../loader/script_entity_source.h"
#include "../shared/event_loop.h"
#include "../shared/logging.h"
#include "../shared/text_util.h"
#include "../store/memory_kv_store.h"
#include "../store/resp_kv_store.h"

#include <csignal>
#include <cstdlib>
#include <cstring>
#include <memory>
#include <string>
#include <string_view>
#include <unistd.h>

static int g_signal_write_fd = -1;

static void signal_handler(int)
{
    if (g_signal_write_fd >= 0)
    {
        char c = 1;
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wunused-result"
        write(g_signal_write_fd, &c, 1);
#pragma GCC diagnostic pop
    }
}

static void print_usage(const char* argv0)
{
    std::fprintf(stderr,
        "usage: %s [-c config.lua] [-p port] [--log-level debug|info|warn|error]\n"
        "  INTELGATE_CONFIG names the config file when -c is not given\n", argv0);
}

struct cli_options
{
    std::string config_path;
    int port = 0;
    std::string log_level;
};

static bool parse_cli(int argc, char** argv, cli_options& out)
{
    for (int i = 1; i < argc; ++i)
    {
        std::string_view arg = argv[i];
        switch (fnv1a(arg))
        {
            case fnv1a("-c"):
            case fnv1a("--config"):
                if (i + 1 >= argc) return false;
                out.config_path = argv[++i];
                break;
            case fnv1a("-p"):
            case fnv1a("--port"):
            {
                int64_t port = 0;
                if (i + 1 >= argc || !parse_int64(argv[++i], port) || port <= 0 || port > 65535)
                    return false;
                out.port = static_cast<int>(port);
                break;
            }
            case fnv1a("--log-level"):
                if (i + 1 >= argc) return false;
                out.log_level = argv[++i];
                break;
            default:
                return false;
        }
    }
    return true;
}

int main(int argc, char** argv)
{
    cli_options cli;
    if (!parse_cli(argc, argv, cli))
    {
        print_usage(argv[0]);
        return 2;
    }

    if (cli.config_path.empty())
    {
        const char* env = std::getenv("INTELGATE_CONFIG");
        if (env && env[0])
            cli.config_path = env;
    }

    gateway_config cfg;
    if (!cli.config_path.empty() && !load_gateway_config(cli.config_path, cfg))
        return 1;

    if (cfg.level_set)
        logger::g_level = cfg.level;
    if (!cli.log_level.empty())
    {
        log_level level;
        if (!logger::parse_level(cli.log_level, level))
        {
            print_usage(argv[0]);
            return 2;
        }
        logger::g_level = level;
    }
    if (cli.port > 0)
        cfg.port = static_cast<uint16_t>(cli.port);

    // Shared store
    std::unique_ptr<kv_store> store;
    memory_kv_store* memory_store = nullptr;
    if (cfg.store == store_resp)
    {
        auto resp = std::make_unique<resp_kv_store>(cfg.resp);
        if (!resp->ping())
            LOG_WARNF("store %s:%u unreachable at startup, running degraded",
                      cfg.resp.host.c_str(), static_cast<unsigned>(cfg.resp.port));
        store = std::move(resp);
    }
    else
    {
        auto mem = std::make_unique<memory_kv_store>();
        memory_store = mem.get();
        store = std::move(mem);
    }

    cache_policy policy;
    apply_cache_config(cfg, policy);
    for (const auto& type : policy.uncovered_derived_types())
        LOG_WARNF("cache: derived type '%s' has no invalidation pattern", type.c_str());

    cache_manager cache(*store, std::move(policy), cfg.key_prefix);

    // Entity source
    std::unique_ptr<entity_source> source;
    if (!cfg.source_script.empty())
    {
        auto script = std::make_unique<script_entity_source>();
        if (!script->load_script(cfg.source_script))
            return 1;
        source = std::move(script);
    }
    else
    {
        LOG_WARN("no source script configured, serving an empty in-memory source");
        source = std::make_unique<memory_entity_source>();
    }

    subscription_router router(cfg.subscription_queue);
    event_bus bus(router, &cache);

    rate_limiter limiter(*store, wall_clock_source::instance(), cfg.key_prefix);
    apply_rate_config(cfg, limiter);

    cost_schema schema = cost_schema::defaults();
    apply_cost_config(cfg, schema);
    admission_controller admission(limiter, std::move(schema), cfg.cost);

    gateway_handler handler(gateway_services{
        *source, &cache, router, bus, admission, cfg.loader, cfg.subscription_queue});

    event_loop loop;
    if (!loop.init())
    {
        LOG_ERROR("failed to init event loop");
        return 1;
    }

    gateway_server server(loop, handler, cfg.port);
    if (!server.start())
        return 1;

    if (memory_store)
    {
        server.add_periodic(cfg.sweep_ms, [memory_store]() {
            auto expired = memory_store->sweep_expired();
            if (!expired.empty())
                LOG_DEBUGF("store: swept %zu expired keys", expired.size());
        });
    }

    g_signal_write_fd = loop.get_signal_write_fd();

    // Broken pipes surface as CQE results
    signal(SIGPIPE, SIG_IGN);

    struct sigaction sa{};
    sa.sa_handler = signal_handler;
    sigemptyset(&sa.sa_mask);

    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);
    sigaction(SIGHUP, &sa, nullptr);

    LOG_INFO("intelgate started");

    loop.run();

    server.stop();
    g_signal_write_fd = -1;

    LOG_INFO("intelgate stopped");
    return 0;
}
