// Copyright (C) 2025 Category Labs, Inc.
//
// This program is free software: you can redistribute it and/or modify
// it under the terms of the GNU General Public License as published by
// the Free Software Foundation, either version 3 of the License, or
// (at your option) any later version.
//
// This program is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
// GNU General Public License for more details.
//
// You should have received a copy of the GNU General Public License
// along with this program.  If not, see <http://www.gnu.org/licenses/>.

#include "metastake/replay.hpp"

#include <metastake/core/address.hpp>
#include <metastake/core/int.hpp>
#include <metastake/core/log_level_map.hpp>
#include <metastake/core/metastake_exception.hpp>
#include <metastake/staking/asset_book.hpp>
#include <metastake/staking/collaborators.hpp>
#include <metastake/staking/events.hpp>
#include <metastake/staking/ledger_config.hpp>
#include <metastake/staking/staking_contract.hpp>
#include <metastake/staking/state.hpp>

#include <CLI/CLI.hpp>

#include <nlohmann/json.hpp>

#include <quill/LogLevel.h>
#include <quill/Quill.h>
#include <quill/detail/LogMacros.h>
#include <quill/handlers/FileHandler.h>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>

namespace fs = std::filesystem;

using namespace metastake;
using namespace metastake::staking;

int main(int const argc, char const *argv[])
{
    CLI::App cli{"metastake"};
    cli.option_defaults()->always_capture_default();

    fs::path config_path;
    fs::path ops_path;
    fs::path trace_log;
    std::string custody_hex = "0x00000000000000000000000000000000c0570d10";
    uint64_t genesis_height = 0;
    auto log_level = quill::LogLevel::Info;

    cli.add_option("--config", config_path, "ledger config file")
        ->required()
        ->check(CLI::ExistingFile);
    cli.add_option("--ops", ops_path, "operations to replay")
        ->check(CLI::ExistingFile);
    cli.add_option(
        "--genesis_height",
        genesis_height,
        "height at which the configured pools are added");
    cli.add_option(
        "--custody", custody_hex, "address holding staked and reward assets");
    cli.add_option("--log_level", log_level, "level of logging")
        ->transform(CLI::CheckedTransformer(log_level_map, CLI::ignore_case));
    cli.add_option("--trace_log", trace_log, "path to event trace file");

    try {
        cli.parse(argc, argv);
    }
    catch (CLI::CallForHelp const &e) {
        return cli.exit(e);
    }
    catch (CLI::ParseError const &e) {
        return cli.exit(e);
    }

    auto stdout_handler = quill::stdout_handler();
    stdout_handler->set_pattern(
        "%(ascii_time) [%(thread)] %(filename):%(lineno) LOG_%(level_name)\t"
        "%(message)",
        "%Y-%m-%d %H:%M:%S.%Qns",
        quill::Timezone::GmtTime);
    quill::Config cfg;
    cfg.default_handlers.emplace_back(stdout_handler);
    quill::configure(cfg);
    quill::start(true);
    quill::get_root_logger()->set_log_level(log_level);

    try {
        auto const custody = address_from_hex(custody_hex);
        METASTAKE_ASSERT_THROW(
            custody.has_value(), "--custody: invalid address");

        auto const config = read_ledger_config(config_path);

        std::unique_ptr<EventSink> event_sink;
        if (!trace_log.empty()) {
            quill::FileHandlerConfig handler_cfg;
            handler_cfg.set_pattern("%(message)", "");
            auto *const event_tracer = quill::create_logger(
                "event_trace", quill::file_handler(trace_log, handler_cfg));
            event_sink = std::make_unique<LoggingEventSink>(event_tracer);
        }
        else {
            event_sink = std::make_unique<NullEventSink>();
        }

        RoleAuthorizer authorizer;
        for (auto const &admin : config.admins) {
            authorizer.grant_all(admin);
        }
        PauseSwitches pause{authorizer};
        AssetBook book{custody.value()};
        State state;
        StakingContract contract{
            state,
            Collaborators{
                .authorizer = authorizer,
                .pause_flags = pause,
                .stake_transfer = book,
                .reward_transfer = book,
                .event_sink = *event_sink},
            config.shortfall_policy};

        Address const admin =
            config.admins.empty() ? Address{} : config.admins.front();
        auto const applied =
            apply_ledger_config(contract, config, admin, genesis_height);
        if (applied.has_error()) {
            LOG_ERROR(
                "could not apply ledger config {}: {}",
                config_path.string(),
                applied.error().message().c_str());
            return 1;
        }

        Replay replay{contract, pause, book};
        if (!ops_path.empty()) {
            replay.run(ops_path);
        }
        auto const &stats = replay.stats();
        LOG_INFO(
            "replayed {} ops, {} rejected", stats.applied, stats.rejected);

        for (size_t pool_id = 0; pool_id < contract.pool_length(); ++pool_id) {
            auto const pool = contract.pool(pool_id).value();
            LOG_INFO(
                "pool {} stake_asset={} weight={} total_staked={} "
                "last_settled_height={}",
                pool_id,
                to_hex(pool.stake_asset),
                intx::to_string(pool.weight),
                intx::to_string(pool.total_staked),
                pool.last_settled_height);
        }
        for (auto const &[pool_id, user] : replay.positions()) {
            auto const pending =
                contract.pending_reward(pool_id, user, stats.last_height);
            auto const staked = contract.staking_balance(pool_id, user);
            if (pending.has_error() || staked.has_error()) {
                continue;
            }
            LOG_INFO(
                "pool {} user {} staked={} pending_reward={} at height {}",
                pool_id,
                to_hex(user),
                intx::to_string(staked.value()),
                intx::to_string(pending.value()),
                stats.last_height);
        }
    }
    catch (MetastakeException const &e) {
        e.print();
        return 1;
    }
    catch (nlohmann::json::exception const &e) {
        LOG_ERROR("malformed input: {}", e.what());
        return 1;
    }

    return 0;
}
