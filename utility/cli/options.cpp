// Copyright 2025 The XMBL Team
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//    http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#include "options.h"

#include <boost/filesystem.hpp>
#include <fstream>
#include <map>

using namespace std;

namespace xmbl
{
    namespace cli
    {
        const char* HELP = "help";
        const char* HELP_FULL = "help,h";
        const char* VERSION = "version";
        const char* VERSION_FULL = "version,v";
        const char* LOG_LEVEL = "log_level";
        const char* FILE_LOG_LEVEL = "file_log_level";
        const char* LOG_ERROR = "error";
        const char* LOG_WARNING = "warning";
        const char* LOG_INFO = "info";
        const char* LOG_DEBUG = "debug";
        const char* LOG_VERBOSE = "verbose";
        const char* LOG_DIR = "log_dir";
        const char* CONFIG_FILE_PATH = "config_file";
        const char* COMMAND = "command";
        // ledger
        const char* STORAGE = "storage";
        const char* UNIT_SCALE = "unit_scale";
        const char* FEE_BPS = "fee_bps";
        const char* MIN_DISTRIBUTION = "min_distribution";
        // command arguments
        const char* OWNER = "owner";
        const char* TO = "to";
        const char* AMOUNT = "amount";
        const char* SHARE_ID = "share_id";
        const char* SHARE_IDS = "share_ids";
        const char* COUNT = "count";
        const char* EVENT_KIND = "kind";
        const char* LIMIT = "limit";
        const char* TARGET = "target";
        // commands
        const char* CMD_INFO = "info";
        const char* CMD_QUOTE = "quote";
        const char* CMD_DEPOSIT = "deposit";
        const char* CMD_MINT = "mint";
        const char* CMD_DISTRIBUTE = "distribute";
        const char* CMD_CLAIM = "claim";
        const char* CMD_CLAIM_BATCH = "claim_batch";
        const char* CMD_WITHDRAW = "withdraw";
        const char* CMD_TRANSFER = "transfer";
        const char* CMD_SHARES = "shares";
        const char* CMD_SHARE = "share";
        const char* CMD_HISTORY = "history";
        const char* CMD_VERIFY = "verify";
        const char* CMD_PAUSE = "pause";
        const char* CMD_RESUME = "resume";
        // pause targets
        const char* TARGET_DEPOSITS = "deposits";
        const char* TARGET_DISTRIBUTIONS = "distributions";
    }

    pair<po::options_description, po::options_description> createOptionsDescription(const std::string& configFile)
    {
        po::options_description general_options("General options");
        general_options.add_options()
            (cli::HELP_FULL, "list all available options and commands")
            (cli::VERSION_FULL, "print project version")
            (cli::LOG_LEVEL, po::value<string>(), "set log level [error|warning|info(default)|debug|verbose]")
            (cli::FILE_LOG_LEVEL, po::value<string>(), "set file log level [error|warning|info|debug(default)|verbose]")
            (cli::LOG_DIR, po::value<string>()->default_value("logs"), "directory for the log files")
            (cli::CONFIG_FILE_PATH, po::value<string>()->default_value(configFile), "path to the config file");

        po::options_description ledger_options("Ledger options");
        ledger_options.add_options()
            (cli::STORAGE, po::value<string>()->default_value("xmbl-ledger.db"), "ledger database path")
            (cli::UNIT_SCALE, po::value<string>()->default_value("10000000000"), "reference units per curve step, applied when the database is created")
            (cli::FEE_BPS, po::value<uint32_t>()->default_value(100), "issuance fee in basis points, applied when the database is created")
            (cli::MIN_DISTRIBUTION, po::value<string>()->default_value("0"), "reject distributions below this amount (0 = no threshold)");

        po::options_description command_options("Command options");
        command_options.add_options()
            (cli::COMMAND, po::value<string>(), "command to execute")
            (cli::OWNER, po::value<string>(), "holder id (depositor, caller or transfer source)")
            (cli::TO, po::value<string>(), "transfer target holder id")
            (cli::AMOUNT, po::value<string>(), "amount in reference units")
            (cli::SHARE_ID, po::value<uint64_t>(), "share id")
            (cli::SHARE_IDS, po::value<string>(), "comma separated share ids")
            (cli::COUNT, po::value<uint64_t>(), "number of units to mint from a meta share")
            (cli::EVENT_KIND, po::value<string>(), "history filter [ShareIssued|UnitsMintedFromMeta|YieldDistributed|YieldClaimed|ShareWithdrawn|ShareTransferred]")
            (cli::LIMIT, po::value<uint32_t>()->default_value(20), "max history records (0 = all)")
            (cli::TARGET, po::value<string>(), "pause/resume target [deposits|distributions]");

        po::options_description options{ "Allowed options" };
        po::options_description visible_options{ "Allowed options" };

        options.add(general_options);
        options.add(ledger_options);
        options.add(command_options);

        visible_options.add(general_options);
        visible_options.add(ledger_options);
        visible_options.add(command_options);

        return { options, visible_options };
    }

    boost::optional<std::string> ReadCfgFromFile(po::variables_map& vm, const po::options_description& desc, const char* szFile)
    {
        const auto fullPath = boost::filesystem::system_complete(szFile).string();
        std::ifstream cfg(fullPath);
        if (!cfg)
            return boost::none;

        po::store(po::parse_config_file(cfg, desc), vm);
        return fullPath;
    }

    po::variables_map getOptions(int argc, char* argv[], const po::options_description& options)
    {
        po::variables_map vm;
        po::positional_options_description positional;
        po::command_line_parser parser(argc, argv);
        parser.options(options);
        parser.style(po::command_line_style::default_style ^ po::command_line_style::allow_guessing);
        positional.add(cli::COMMAND, 1);
        parser.positional(positional);
        po::store(parser.run(), vm); // value stored first is preferred

        ReadCfgFromFile(vm, options, vm[cli::CONFIG_FILE_PATH].as<std::string>().c_str());

        return vm;
    }

    int getLogLevel(const std::string &dstLog, const po::variables_map& vm, int defaultValue)
    {
        const map<std::string, int> logLevels
        {
            { cli::LOG_ERROR, LOG_LEVEL_ERROR },
            { cli::LOG_WARNING, LOG_LEVEL_WARNING },
            { cli::LOG_INFO, LOG_LEVEL_INFO },
            { cli::LOG_DEBUG, LOG_LEVEL_DEBUG },
            { cli::LOG_VERBOSE, LOG_LEVEL_VERBOSE }
        };

        if (vm.count(dstLog))
        {
            auto level = vm[dstLog].as<string>();
            if (auto it = logLevels.find(level); it != logLevels.end())
            {
                return it->second;
            }
        }

        return defaultValue;
    }
}
