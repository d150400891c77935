#include <chrono>
#include <condition_variable>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <iterator>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "app/session.hpp"
#include "transport/loopback_transport.hpp"
#include "util/config.hpp"
#include "util/exitcodes.hpp"
#include "util/log.hpp"

namespace
{

// --------------------------------------------------------------------
// CLI usage
// --------------------------------------------------------------------
static void print_usage()
{
    std::fprintf(stderr, "Usage:\n"
                         "  chunkcast-loopback <file> [--topology relay|direct] [--viewers N]\n"
                         "                     [--timeout SECONDS]\n"
                         "\n"
                         "Streams <file> from one broadcaster to N in-process viewers and\n"
                         "checks every copy byte for byte. Tuning via CHUNKCAST_* env vars.\n");
}

static bool read_file(const std::string &path, proto::Bytes &out)
{
    std::ifstream ifs(path, std::ios::binary);
    if (!ifs)
        return false;
    out.assign(std::istreambuf_iterator<char>(ifs), std::istreambuf_iterator<char>());
    return !ifs.bad();
}

static std::string base_name(const std::string &path)
{
    auto pos = path.find_last_of('/');
    return pos == std::string::npos ? path : path.substr(pos + 1);
}

// Completion bookkeeping shared by the viewer callbacks
struct Results
{
    std::mutex                mu;
    std::condition_variable   cv;
    std::size_t               done{0};
    std::size_t               matched{0};
    std::vector<std::string>  errors;
};

}  // namespace

int main(int argc, char **argv)
{
    auto cfg = config::from_env();
    config::apply_log_level(cfg);

    std::string   path;
    std::uint64_t viewers = 1;
    std::uint64_t timeout = 60;

    for (int i = 1; i < argc; ++i)
    {
        std::string a = argv[i];
        if (a == "-h" || a == "--help")
        {
            print_usage();
            return exitc::ok;
        }
        if (a == "--topology" && i + 1 < argc)
        {
            if (!config::parse_topology(argv[++i], cfg.topology))
            {
                print_usage();
                std::fprintf(stderr, "error: unknown topology '%s'\n", argv[i]);
                return exitc::bad_args;
            }
            continue;
        }
        if (a == "--viewers" && i + 1 < argc)
        {
            if (!config::parse_uint(argv[++i], 1, 32, viewers))
            {
                print_usage();
                std::fprintf(stderr, "error: --viewers expects 1..32\n");
                return exitc::bad_args;
            }
            continue;
        }
        if (a == "--timeout" && i + 1 < argc)
        {
            if (!config::parse_uint(argv[++i], 1, 3600, timeout))
            {
                print_usage();
                std::fprintf(stderr, "error: --timeout expects 1..3600 seconds\n");
                return exitc::bad_args;
            }
            continue;
        }
        if (!a.empty() && a[0] == '-')
        {
            print_usage();
            std::fprintf(stderr, "error: unknown option '%s'\n", a.c_str());
            return exitc::bad_args;
        }
        if (!path.empty())
        {
            print_usage();
            return exitc::bad_args;
        }
        path = a;
    }
    if (path.empty())
    {
        print_usage();
        return exitc::bad_args;
    }

    proto::Bytes bytes;
    if (!read_file(path, bytes))
    {
        LOG_ERROR("cannot read %s", path.c_str());
        return exitc::io_error;
    }

    config::log_summary(cfg);
    LOG_SYSTEM("Asset: %s (%zu bytes), viewers=%llu", path.c_str(), bytes.size(),
               (unsigned long long)viewers);

    transport::LoopbackHub hub(cfg.topology);

    transport::LoopbackTransport bt(hub);
    auto bsess = app::Session::broadcast(bt, bytes, base_name(path), cfg);
    if (!bsess)
    {
        LOG_ERROR("broadcaster failed to start");
        return exitc::io_error;
    }

    Results                                                   res;
    std::vector<std::unique_ptr<transport::LoopbackTransport>> vts;
    std::vector<std::unique_ptr<app::Session>>                 vsess;
    for (std::uint64_t i = 0; i < viewers; ++i)
    {
        app::ViewerCallbacks cbs;
        cbs.on_complete = [&res, &bytes](const proto::Bytes &got) {
            std::lock_guard<std::mutex> lk(res.mu);
            res.done++;
            if (got == bytes)
                res.matched++;
            res.cv.notify_all();
        };
        cbs.on_error = [&res](const std::string &err) {
            std::lock_guard<std::mutex> lk(res.mu);
            res.done++;
            res.errors.push_back(err);
            res.cv.notify_all();
        };

        vts.push_back(std::make_unique<transport::LoopbackTransport>(hub));
        auto s = app::Session::view(*vts.back(), bsess->ticket(), cfg, std::move(cbs));
        if (!s)
        {
            LOG_ERROR("viewer %llu failed to join", (unsigned long long)i);
            return exitc::io_error;
        }
        vsess.push_back(std::move(s));
    }

    bool finished = false;
    {
        std::unique_lock<std::mutex> lk(res.mu);
        finished = res.cv.wait_for(lk, std::chrono::seconds(timeout),
                                   [&] { return res.done >= viewers; });
    }

    // viewers first: their timers must not outlive the broadcaster's transport
    for (auto &s : vsess)
        s->close();
    bsess->close();

    const auto st = bsess->broadcaster()->stats();
    LOG_SYSTEM("Broadcaster: %u chunks sent, %u metadata, %u invalid requests, %llu send failures",
               st.chunks_sent, st.metadata_sent, st.invalid_requests,
               (unsigned long long)st.send_failures);

    std::lock_guard<std::mutex> lk(res.mu);
    if (!finished)
    {
        LOG_ERROR("timeout: %zu/%llu viewers finished", res.done, (unsigned long long)viewers);
        return exitc::timeout;
    }
    for (const auto &e : res.errors)
        LOG_ERROR("viewer failed: %s", e.c_str());
    if (res.matched != viewers)
    {
        LOG_ERROR("%zu/%llu copies match the source", res.matched, (unsigned long long)viewers);
        return exitc::mismatch;
    }
    LOG_SYSTEM("OK: %llu viewers received %zu bytes intact", (unsigned long long)viewers,
               bytes.size());
    return exitc::ok;
}
