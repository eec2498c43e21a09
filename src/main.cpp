#include "batch_request.hpp"
#include "cmdb_client.hpp"
#include "host_query.hpp"
#include "models.hpp"
#include "notify.hpp"
#include "util.hpp"

#include <nlohmann/json.hpp>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

struct Config {
    std::string endpoint        = "http://localhost:8080";
    std::string appCode;
    std::string appSecret;
    std::string username        = "admin";
    std::string mode            = "topo";
    std::int64_t bizId          = 0;
    std::string supplierAccount = "0";
    std::vector<std::string> fields;
    std::vector<std::string> ipList;
    std::string receiverGroup;
    std::string moreReceiver;
    int         pageSize        = cmdb_fetch::kDefaultPageLimit;
    std::size_t poolSize        = cmdb_fetch::WorkerPool::defaultThreadCount();
    int         timeoutMs       = 30000;
    bool        verbose         = false;
};

static void printUsage() {
    std::cout
        << "Usage: cmdb_fetch [options]\n\n"
        << "Options:\n"
        << "  --endpoint URL          ESB gateway root     (default: http://localhost:8080)\n"
        << "  --app-code CODE         bk_app_code\n"
        << "  --app-secret SECRET     bk_app_secret\n"
        << "  --username NAME         bk_username          (default: admin)\n"
        << "  --mode MODE             topo | hosts | receivers (default: topo)\n"
        << "  --biz-id N              Business ID\n"
        << "  --supplier-account S    Supplier account     (default: 0)\n"
        << "  --fields A,B,...        Host fields to return\n"
        << "  --ip IP1,IP2,...        Only hosts with these inner IPs\n"
        << "  --receiver-group G,...  Maintainers,ProductPm,Developer,Tester\n"
        << "  --more-receiver N,...   Extra receivers\n"
        << "  --page-size N           Records per page     (default: 500)\n"
        << "  --pool-size N           Concurrent requests  (default: CPU count)\n"
        << "  --timeout-ms N          HTTP timeout in ms   (default: 30000)\n"
        << "  --verbose               Enable verbose diagnostics\n"
        << "  --help, -h              Show this message\n";
}

static std::vector<std::string> nonEmptyList(const std::string& csv) {
    std::vector<std::string> items;
    for (auto& item : cmdb_fetch::splitAndTrim(csv)) {
        if (!item.empty()) items.push_back(std::move(item));
    }
    return items;
}

static int positiveOption(const std::string& option, const std::string& value) {
    try {
        return cmdb_fetch::parsePositiveInt(option, value);
    } catch (const std::invalid_argument& e) {
        std::cerr << e.what() << "\n\n";
        printUsage();
        std::exit(1);
    }
}

static Config parseArgs(int argc, char* argv[]) {
    Config cfg;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        const bool hasValue = i + 1 < argc;

        if (arg == "--endpoint" && hasValue) {
            cfg.endpoint = argv[++i];
        } else if (arg == "--app-code" && hasValue) {
            cfg.appCode = argv[++i];
        } else if (arg == "--app-secret" && hasValue) {
            cfg.appSecret = argv[++i];
        } else if (arg == "--username" && hasValue) {
            cfg.username = argv[++i];
        } else if (arg == "--mode" && hasValue) {
            cfg.mode = argv[++i];
        } else if (arg == "--biz-id" && hasValue) {
            cfg.bizId = std::stoll(argv[++i]);
        } else if (arg == "--supplier-account" && hasValue) {
            cfg.supplierAccount = argv[++i];
        } else if (arg == "--fields" && hasValue) {
            cfg.fields = nonEmptyList(argv[++i]);
        } else if (arg == "--ip" && hasValue) {
            cfg.ipList = nonEmptyList(argv[++i]);
        } else if (arg == "--receiver-group" && hasValue) {
            cfg.receiverGroup = argv[++i];
        } else if (arg == "--more-receiver" && hasValue) {
            cfg.moreReceiver = argv[++i];
        } else if (arg == "--page-size" && hasValue) {
            cfg.pageSize = positiveOption(arg, argv[++i]);
        } else if (arg == "--pool-size" && hasValue) {
            cfg.poolSize = static_cast<std::size_t>(positiveOption(arg, argv[++i]));
        } else if (arg == "--timeout-ms" && hasValue) {
            cfg.timeoutMs = positiveOption(arg, argv[++i]);
        } else if (arg == "--verbose") {
            cfg.verbose = true;
        } else if (arg == "--help" || arg == "-h") {
            printUsage();
            std::exit(0);
        } else {
            std::cerr << "Unknown argument: " << arg << "\n\n";
            printUsage();
            std::exit(1);
        }
    }

    if (cfg.mode != "topo" && cfg.mode != "hosts" && cfg.mode != "receivers") {
        std::cerr << "Unknown mode: " << cfg.mode << "\n\n";
        printUsage();
        std::exit(1);
    }
    return cfg;
}

int main(int argc, char* argv[]) {
    try {
        Config cfg = parseArgs(argc, argv);

        if (cfg.verbose) {
            std::cerr
                << "=== cmdb_fetch ===\n"
                << "Endpoint:   " << cfg.endpoint  << "\n"
                << "Mode:       " << cfg.mode      << "\n"
                << "Biz ID:     " << cfg.bizId     << "\n"
                << "Page size:  " << cfg.pageSize  << "\n"
                << "Pool size:  " << cfg.poolSize  << "\n"
                << "Timeout:    " << cfg.timeoutMs << " ms\n"
                << "==================\n\n";
        }

        cmdb_fetch::EsbClient client(cfg.endpoint, cfg.appCode, cfg.appSecret,
                                     cfg.username, cfg.timeoutMs);
        client.setVerbose(cfg.verbose);

        if (cfg.mode == "receivers") {
            const auto result = cmdb_fetch::resolveNotifyReceivers(
                client, cfg.bizId, cfg.supplierAccount,
                cfg.receiverGroup, cfg.moreReceiver);
            std::cout << nlohmann::json(result).dump(2) << "\n";
            return result.result ? 0 : 1;
        }

        cmdb_fetch::FetchContext context;
        context.defaultLimit = cfg.pageSize;
        context.poolSize     = cfg.poolSize;
        context.verbose      = cfg.verbose;
        cmdb_fetch::BatchRequester requester(context);

        cmdb_fetch::HostQuery query;
        query.bizId           = cfg.bizId;
        query.supplierAccount = cfg.supplierAccount;
        query.fields          = cfg.fields;
        query.ipList          = cfg.ipList;

        nlohmann::json output;
        if (cfg.mode == "topo") {
            output = cmdb_fetch::fetchBusinessHostTopo(client, requester, query);
        } else {
            output = cmdb_fetch::fetchBusinessHosts(client, requester, query);
        }

        std::cout << output.dump(2) << "\n";

        if (cfg.verbose) {
            std::cerr << "\n=== Summary ===\n"
                      << "Records:    " << output.size() << "\n"
                      << "===============\n";
        }
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << "\n";
        return 1;
    }
}
