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
#pragma once

#include <boost/optional.hpp>
#include <boost/program_options.hpp>
#include "utility/logger.h"

namespace xmbl
{
    namespace po = boost::program_options;
    namespace cli
    {
        extern const char* HELP;
        extern const char* HELP_FULL;
        extern const char* VERSION;
        extern const char* VERSION_FULL;
        extern const char* LOG_LEVEL;
        extern const char* FILE_LOG_LEVEL;
        extern const char* LOG_ERROR;
        extern const char* LOG_WARNING;
        extern const char* LOG_INFO;
        extern const char* LOG_DEBUG;
        extern const char* LOG_VERBOSE;
        extern const char* LOG_DIR;
        extern const char* CONFIG_FILE_PATH;
        extern const char* COMMAND;
        // ledger
        extern const char* STORAGE;
        extern const char* UNIT_SCALE;
        extern const char* FEE_BPS;
        extern const char* MIN_DISTRIBUTION;
        // command arguments
        extern const char* OWNER;
        extern const char* TO;
        extern const char* AMOUNT;
        extern const char* SHARE_ID;
        extern const char* SHARE_IDS;
        extern const char* COUNT;
        extern const char* EVENT_KIND;
        extern const char* LIMIT;
        extern const char* TARGET;
        // commands
        extern const char* CMD_INFO;
        extern const char* CMD_QUOTE;
        extern const char* CMD_DEPOSIT;
        extern const char* CMD_MINT;
        extern const char* CMD_DISTRIBUTE;
        extern const char* CMD_CLAIM;
        extern const char* CMD_CLAIM_BATCH;
        extern const char* CMD_WITHDRAW;
        extern const char* CMD_TRANSFER;
        extern const char* CMD_SHARES;
        extern const char* CMD_SHARE;
        extern const char* CMD_HISTORY;
        extern const char* CMD_VERIFY;
        extern const char* CMD_PAUSE;
        extern const char* CMD_RESUME;
        // pause targets
        extern const char* TARGET_DEPOSITS;
        extern const char* TARGET_DISTRIBUTIONS;
    }

    // all options, and the visible subset for the help screen
    std::pair<po::options_description, po::options_description> createOptionsDescription(const std::string& configFile);

    // command line first, then the config file. Value stored first is preferred
    po::variables_map getOptions(int argc, char* argv[], const po::options_description& options);

    boost::optional<std::string> ReadCfgFromFile(po::variables_map&, const po::options_description&, const char* szFile);

    int getLogLevel(const std::string &dstLog, const po::variables_map& vm, int defaultValue = LOG_LEVEL_INFO);
}
