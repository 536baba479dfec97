/*
 * This file is part of PowerGuard Actuator (PGuard).
 *
 * Copyright (c) 2025 Ian Anthony R. Tancinco
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program.  If not, see <https://www.gnu.org/licenses/>.
 */

#include "context.h"
#include "config.h"
#include "executor.h"
#include "capability_prober.h"
#include "outcome_ledger.h"
#include "batch_codec.h"
#include "ipc_server.h"
#include "ipc_client.h"
#include "logger.h"
#include "utils.h"
#include <csignal>
#include <iostream>
#include <string>
#include <vector>
#include <pthread.h>

using json = nlohmann::json;

static void PrintUsage()
{
    std::cout <<
        "PowerGuard Actuator (pguard)\n\n"
        "Usage: pguard [--config <path>] <command> [args]\n\n"
        "Commands:\n"
        "  run                        Run the daemon (stop with SIGINT/SIGTERM)\n"
        "  execute <batch.json>       Execute one instruction batch and print the results\n"
        "  history [--day|--hour] [--offset <minutes>]\n"
        "                             Print recorded outcomes, newest first\n"
        "  probe                      Probe every capability domain and print the tiers\n"
        "  invalidate <domain|all>    Tell a running daemon that permissions changed\n\n"
        "Domains: idle_state, background_transfer, process_termination, wake_source,\n"
        "         cpu_throttle, usage_alert\n";
}

static json ReportToJson(const ProbeReport& report)
{
    json j;
    j["domain"] = DomainName(report.domain);
    j["tier"] = TierName(report.tier);
    j["mechanism"] = report.mechanism;
    json attempts = json::array();
    for (const auto& [mech, verdict] : report.attempts) {
        attempts.push_back({ { "mechanism", mech }, { "verdict", VerdictName(verdict) } });
    }
    j["attempts"] = attempts;
    return j;
}

static int RunDaemon(PGuardContext& ctx)
{
    auto& cfg = ctx.conf.engine;
    ctx.subs.ipc = std::make_unique<IpcServer>(cfg.ResolvedSocketPath(), cfg.ipcAllowedUids,
                                               *ctx.subs.executor, *ctx.subs.prober, *ctx.subs.ledger);
    if (!ctx.subs.ipc->Initialize()) {
        std::cerr << "pguard: cannot listen on " << cfg.ResolvedSocketPath() << "\n";
        return 1;
    }

    sigset_t waitSet;
    sigemptyset(&waitSet);
    sigaddset(&waitSet, SIGINT);
    sigaddset(&waitSet, SIGTERM);

    int sig = 0;
    while (ctx.isRunning.load()) {
        if (sigwait(&waitSet, &sig) == 0) {
            Log("[MAIN] Signal " + std::to_string(sig) + " received. Shutting down.");
            break;
        }
    }
    return 0;
}

static int RunExecute(PGuardContext& ctx, const std::string& file)
{
    auto text = ReadSmallFile(file, 16 << 20);
    if (!text) {
        std::cerr << "pguard: cannot read " << file << "\n";
        return 2;
    }

    std::vector<ActionableRecord> records;
    std::string error;
    if (!ParseBatch(*text, records, error)) {
        std::cerr << "pguard: " << file << ": " << error << "\n";
        return 2;
    }

    auto results = ctx.subs.executor->ExecuteBatch(records);
    std::cout << DumpJson(ResultsToJson(results), 2) << "\n";
    return 0;
}

static int RunHistory(PGuardContext& ctx, const std::vector<std::string>& args)
{
    std::string group = "none";
    int offset = 0;
    for (size_t i = 0; i < args.size(); ++i) {
        if (args[i] == "--day") group = "day";
        else if (args[i] == "--hour") group = "hour";
        else if (args[i] == "--offset" && i + 1 < args.size()) {
            auto v = ParseInteger(args[++i]);
            if (!v) {
                std::cerr << "pguard: invalid offset\n";
                return 2;
            }
            offset = static_cast<int>(*v);
        }
    }

    auto& ledger = *ctx.subs.ledger;
    if (group == "none") {
        for (const auto& e : ledger.Entries()) {
            const auto& r = e.result;
            std::cout << FormatEpochMs(r.completedAt, offset, "%Y-%m-%d %H:%M:%S") << "  "
                      << StatusName(r.status) << "  " << r.actionableId << "  " << r.type
                      << (r.target.empty() ? "" : " " + r.target) << "  " << r.detail << "\n";
        }
        return 0;
    }

    auto groups = group == "day" ? ledger.GroupByDay(offset) : ledger.GroupByHour(offset);
    for (const auto& g : groups) {
        std::cout << g.label << " (" << g.entries.size() << ")\n";
        for (const auto& e : g.entries) {
            const auto& r = e.result;
            std::cout << "  " << FormatEpochMs(r.completedAt, offset, "%H:%M:%S") << "  "
                      << StatusName(r.status) << "  " << r.actionableId << "  " << r.type
                      << (r.target.empty() ? "" : " " + r.target) << "  " << r.detail << "\n";
        }
    }
    return 0;
}

static int RunProbe(PGuardContext& ctx)
{
    json arr = json::array();
    for (size_t i = 0; i < CAPABILITY_DOMAIN_COUNT; ++i) {
        auto domain = static_cast<CapabilityDomain>(i);
        ctx.subs.prober->Probe(domain);
        if (auto report = ctx.subs.prober->Cached(domain)) arr.push_back(ReportToJson(*report));
    }
    std::cout << DumpJson(arr, 2) << "\n";
    return 0;
}

int main(int argc, char** argv)
{
    std::filesystem::path configPath;
    std::vector<std::string> positional;

    for (int i = 1; i < argc; i++)
    {
        std::string arg = argv[i];
        if (arg == "--help" || arg == "-h")
        {
            PrintUsage();
            return 0;
        }
        else if (arg == "--config" && i + 1 < argc) configPath = argv[++i];
        else positional.push_back(arg);
    }

    if (positional.empty())
    {
        PrintUsage();
        return 2;
    }
    if (configPath.empty()) configPath = ConfigManager::GetConfigPath();

    const std::string command = positional[0];
    const std::vector<std::string> args(positional.begin() + 1, positional.end());

    // Talks to the daemon; no local subsystems needed
    if (command == "invalidate")
    {
        if (args.empty()) {
            std::cerr << "pguard: invalidate needs a domain or 'all'\n";
            return 2;
        }
        if (args[0] != "all" && !ParseDomain(args[0])) {
            std::cerr << "pguard: unknown domain '" << args[0] << "'\n";
            return 2;
        }
        EngineConfig cfg;
        if (!ConfigManager::Load(configPath, cfg)) {
            Log("[MAIN] Config unavailable; using the default socket path");
        }
        auto resp = IpcClient::SendInvalidate(cfg.ResolvedSocketPath(), args[0]);
        if (!resp.success) {
            std::cerr << "pguard: " << resp.message << "\n";
            return resp.denied ? 3 : 1;
        }
        return 0;
    }

    if (command != "run" && command != "execute" && command != "history" && command != "probe")
    {
        std::cerr << "pguard: unknown command '" << command << "'\n";
        PrintUsage();
        return 2;
    }

    // Block termination signals before any thread starts so sigwait() owns them
    if (command == "run")
    {
        sigset_t blockSet;
        sigemptyset(&blockSet);
        sigaddset(&blockSet, SIGINT);
        sigaddset(&blockSet, SIGTERM);
        pthread_sigmask(SIG_BLOCK, &blockSet, nullptr);
    }

    auto& ctx = PGuardContext::Get();
    if (!ctx.Initialize(configPath))
    {
        std::cerr << "pguard: initialization failed\n";
        return 1;
    }

    int rc = 0;
    if (command == "run") rc = RunDaemon(ctx);
    else if (command == "execute")
    {
        if (args.empty()) {
            std::cerr << "pguard: execute needs a batch file\n";
            rc = 2;
        } else {
            rc = RunExecute(ctx, args[0]);
        }
    }
    else if (command == "history") rc = RunHistory(ctx, args);
    else if (command == "probe") rc = RunProbe(ctx);

    ctx.Shutdown();
    return rc;
}
