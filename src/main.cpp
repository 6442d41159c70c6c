#include "cfg/cfg_exception.hpp"
#include "cfg/settings.hpp"
#include "flake/flake_generator.hpp"
#include "flake/flake_id.hpp"
#include "logger/spdlog_init.hpp"
#include "seed/flake_seed.hpp"
#include "seed/seed_exception.hpp"
#include "utils/string.hpp"
#include <boost/exception/diagnostic_information.hpp>
#include <cstdint>
#include <cstdlib>
#include <fmt/core.h>
#include <iostream>
#include <optional>
#include <spdlog/spdlog.h>
#include <string>
#include <thread>
#include <unistd.h>
#include <vector>

using namespace std;
using namespace fractalflake;

static void print_help()
{
    cout << "\nfractalflake\n\n"
            "Options:\n"
            "  -h         This message\n"
            "  -c <file>  Path to configuration file\n"
            "  -s         Fetch the epoch from the coordinator before generating\n"
            "  -t <id>    Thread id of the first worker (default 0)\n"
            "  -w <n>     Number of workers, one generator each (default 1)\n"
            "             Thread ids -t .. -t + n - 1 must stay below 32\n"
            "  -n <count> Identifiers per worker (default 1)\n"
            "  -e         Store time elapsed since the epoch instead of Unix time\n"
            "  -d <id>    Decode an identifier and exit\n"
         << endl;
}


static optional<uint64_t> parse_count(const char *optval, const char *what)
{
    auto value = utils::string::parse_unsigned<uint64_t>(optval);
    if (!value)
        cerr << "Invalid " << what << ": " << optval << endl;
    return value;
}


static void run_workers(const seed::flake_seed &resolved, uint64_t first_thread, uint64_t workers,
                        uint64_t count, flake::timestamp_mode mode)
{
    // seal up front so construction errors surface here, not inside a worker
    vector<flake::flake_generator> generators;
    generators.reserve(workers);
    for (uint64_t i = 0; i < workers; ++i)
        generators.push_back(seed::seal(resolved, first_thread + i, mode));

    vector<vector<uint64_t>> results(workers);
    vector<thread> threads;
    threads.reserve(workers);
    for (uint64_t i = 0; i < workers; ++i) {
        threads.emplace_back([&gen = generators[i], &out = results[i], count]() {
            out.reserve(count);
            for (uint64_t n = 0; n < count; ++n)
                out.push_back(gen.generate());
        });
    }

    for (auto &t: threads)
        t.join();

    for (const auto &ids: results)
        for (const auto id: ids)
            cout << id << '\n';
    cout.flush();

    spdlog::info("Generated {} identifier(s) on {} worker(s)", workers * count, workers);
}


int main(int argc, char *argv[])
{
    int ch = 0;
    const char *config_file = nullptr;
    bool do_sync = false;
    uint64_t first_thread = 0;
    uint64_t workers = 1;
    uint64_t count = 1;
    auto mode = flake::timestamp_mode::unix_time;
    optional<uint64_t> decode_id;

    if (argc == 1) {
        print_help();
        return EXIT_FAILURE;
    }

    while ((ch = getopt(argc, argv, "hc:st:w:n:ed:")) != -1) {
        optional<uint64_t> value;
        switch (ch) {
        case 'c':
            config_file = optarg;
            break;
        case 's':
            do_sync = true;
            break;
        case 't':
            if (!(value = parse_count(optarg, "thread id")))
                return EXIT_FAILURE;
            first_thread = *value;
            break;
        case 'w':
            if (!(value = parse_count(optarg, "worker count")) || *value == 0)
                return EXIT_FAILURE;
            workers = *value;
            break;
        case 'n':
            if (!(value = parse_count(optarg, "identifier count")))
                return EXIT_FAILURE;
            count = *value;
            break;
        case 'e':
            mode = flake::timestamp_mode::since_epoch;
            break;
        case 'd':
            if (!(decode_id = parse_count(optarg, "identifier")))
                return EXIT_FAILURE;
            break;
        case 'h':
        case '?':
        default:
            print_help();
            return EXIT_FAILURE;
        }
    }

    if (decode_id) {
        cout << flake::to_string(flake::decompose(*decode_id)) << endl;
        return EXIT_SUCCESS;
    }

    if (!flake::thread_ids_fit(first_thread, workers)) {
        cerr << "Thread ids " << first_thread << ".." << first_thread + workers - 1 << " do not fit in "
             << flake::THREAD_ID_BITS << " bits" << endl;
        print_help();
        return EXIT_FAILURE;
    }

    if (config_file == nullptr) {
        print_help();
        return EXIT_FAILURE;
    }

    try {
        const auto settings = cfg::load_settings_file(config_file);
        logging::init_spdlog(settings);

        auto resolved = seed::load_file(config_file);
        if (do_sync)
            seed::sync(resolved, settings.sync_timeout);
        else if (resolved.epoch == 0)
            spdlog::warn("No epoch configured and no sync requested; using epoch 0");

        run_workers(resolved, first_thread, workers, count, mode);
        return EXIT_SUCCESS;
    } catch (const cfg::cfg_exception &e) {
        spdlog::error("Configuration file error: {}", e.what());
    } catch (const seed::sync_exception &e) {
        spdlog::error("Coordinator sync failed: {}", e.what());
    } catch (const boost::exception &e) {
        spdlog::error("Boost exception caught: {}", boost::diagnostic_information(e));
    } catch (const exception &e) {
        spdlog::error("Exception caught: {}", e.what());
    }

    return EXIT_FAILURE;
}
