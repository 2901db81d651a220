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

#include "vault/vault.h"
#include "core/ledger_error.h"
#include "utility/cli/options.h"
#include "utility/helpers.h"
#include "utility/string_helpers.h"
#include "utility/logger.h"

#include <boost/filesystem.hpp>
#include <boost/format.hpp>
#include <boost/lexical_cast.hpp>
#include <algorithm>
#include <iostream>
#include <sstream>

#ifndef PROJECT_VERSION
#	define PROJECT_VERSION "dev"
#endif

#define APP_NAME "xmbl-ledger"

using namespace std;
using namespace xmbl;

namespace
{
    const char kDefaultConfigFile[] = APP_NAME ".cfg";
    const char kErrorCommandNotSpecified[] = "Command not specified";
    const char kErrorCommandUnknown[] = "Unknown command: %1%";
    const char kTimeFormat[] = "%Y-%m-%d %H:%M:%S";

    using CommandFunc = int (*)(Vault&, const po::variables_map&);
    struct Command
    {
        std::string name;
        CommandFunc handler;
        std::string description;
    };

    void printHelp(const Command* begin, const Command* end, const po::options_description& options)
    {
        cout << "\nUSAGE: " << APP_NAME << " <command> [options]\n\n";
        cout << "COMMANDS:\n";
        for (auto it = begin; it != end; ++it)
            cout << boost::format("  %-16s%s\n") % it->name % it->description;

        cout << std::endl << options << std::endl;
    }

    const std::string& GetRequired(const po::variables_map& vm, const char* szName)
    {
        if (!vm.count(szName))
            throw po::required_option(szName);
        return vm[szName].as<string>();
    }

    Amount ParseAmount(const std::string& s)
    {
        Amount res;
        if (!AmountFromString(res, s))
            throw po::invalid_option_value(s);
        return res;
    }

    Amount GetAmount(const po::variables_map& vm, const char* szName)
    {
        return ParseAmount(GetRequired(vm, szName));
    }

    uint64_t GetU64(const po::variables_map& vm, const char* szName)
    {
        if (!vm.count(szName))
            throw po::required_option(szName);
        return vm[szName].as<uint64_t>();
    }

    std::vector<ShareID> GetShareIDs(const po::variables_map& vm)
    {
        std::vector<ShareID> vRes;
        for (const auto& s : string_helpers::split(GetRequired(vm, cli::SHARE_IDS), ','))
        {
            if (!string_helpers::is_decimal(s))
                throw po::invalid_option_value(s);

            try {
                vRes.push_back(boost::lexical_cast<ShareID>(s));
            }
            catch (const boost::bad_lexical_cast&) {
                throw po::invalid_option_value(s);
            }
        }
        return vRes;
    }

    void PrintShare(const Share& s)
    {
        cout << boost::format("share %1%: owner=%2% kind=%3% deposit=%4% yield=%5%")
            % s.m_ID
            % s.m_Owner
            % Share::get_KindName(s.get_Kind())
            % s.m_DepositValue
            % s.m_AccruedYield;

        const Share::Meta* pMeta = s.get_Meta();
        if (pMeta)
            cout << boost::format(" remaining=%1%/%2% next_position=%3%") % pMeta->m_Remaining % pMeta->m_Reserved % pMeta->m_NextPosition;

        cout << endl;
    }

    int ShowInfo(Vault& vault, const po::variables_map&)
    {
        const Ledger& l = vault.get_Ledger();
        Ledger::Totals t = l.get_Totals();
        const Curve::Params& pars = l.get_CurveParams();

        cout << "Units issued:       " << t.m_UnitsIssued << '\n'
             << "Next share id:      " << t.m_NextShareID << '\n'
             << "Live shares:        " << l.get_ShareCount() << '\n'
             << "Value locked:       " << t.m_ValueLocked << '\n'
             << "Next unit price:    " << Curve::get_Price(pars, t.m_UnitsIssued) << '\n'
             << "Curve:              scale=" << pars.m_UnitScale << " fee_bps=" << pars.m_FeeBps << '\n'
             << "Deposits:           " << (t.m_DepositsPaused ? "paused" : "active") << '\n'
             << "Distributions:      " << (t.m_DistributionsPaused ? "paused" : "active") << endl;
        return 0;
    }

    int Quote(Vault& vault, const po::variables_map& vm)
    {
        Issuance::Plan plan = vault.get_Ledger().QuoteIssue(GetAmount(vm, cli::AMOUNT));
        cout << boost::format("units=%1% cost=%2% refund=%3% meta=%4%")
            % plan.m_Units % plan.m_TotalCost % plan.m_Refund % (plan.IsMeta() ? "yes" : "no") << endl;
        return 0;
    }

    int Deposit(Vault& vault, const po::variables_map& vm)
    {
        Ledger::IssueResult res = vault.Deposit(GetRequired(vm, cli::OWNER), GetAmount(vm, cli::AMOUNT));
        cout << boost::format("share=%1% units=%2% cost=%3% refund=%4% meta=%5%")
            % res.m_ShareID % res.m_Plan.m_Units % res.m_Plan.m_TotalCost % res.m_Plan.m_Refund % (res.m_Plan.IsMeta() ? "yes" : "no") << endl;
        return 0;
    }

    int Mint(Vault& vault, const po::variables_map& vm)
    {
        std::vector<ShareID> vIDs = vault.MintFromMeta(GetU64(vm, cli::SHARE_ID), GetU64(vm, cli::COUNT), GetRequired(vm, cli::OWNER));

        cout << "minted:";
        for (ShareID id : vIDs)
            cout << ' ' << id;
        cout << endl;
        return 0;
    }

    int Distribute(Vault& vault, const po::variables_map& vm)
    {
        Distribution::Result res = vault.Distribute(GetAmount(vm, cli::AMOUNT));
        cout << boost::format("credited=%1% residual=%2% shares=%3%") % res.m_Credited % res.m_Residual % res.m_Credits.size() << endl;
        return 0;
    }

    int Claim(Vault& vault, const po::variables_map& vm)
    {
        Amount val = vault.Claim(GetU64(vm, cli::SHARE_ID), GetRequired(vm, cli::OWNER));
        cout << "claimed=" << val << endl;
        return 0;
    }

    int ClaimBatch(Vault& vault, const po::variables_map& vm)
    {
        Amount val = vault.ClaimMultiple(GetShareIDs(vm), GetRequired(vm, cli::OWNER));
        cout << "claimed=" << val << endl;
        return 0;
    }

    int Withdraw(Vault& vault, const po::variables_map& vm)
    {
        Ledger::WithdrawResult res = vault.Withdraw(GetU64(vm, cli::SHARE_ID), GetRequired(vm, cli::OWNER));
        cout << boost::format("returned=%1% yield=%2%") % res.m_DepositValue % res.m_YieldPaid << endl;
        return 0;
    }

    int Transfer(Vault& vault, const po::variables_map& vm)
    {
        ShareID id = GetU64(vm, cli::SHARE_ID);
        vault.Transfer(id, GetRequired(vm, cli::OWNER), GetRequired(vm, cli::TO));
        cout << "share " << id << " transferred" << endl;
        return 0;
    }

    int ShowShares(Vault& vault, const po::variables_map& vm)
    {
        const Ledger& l = vault.get_Ledger();
        const std::string& owner = GetRequired(vm, cli::OWNER);

        for (ShareID id : l.get_HolderShares(owner))
        {
            Share s;
            if (l.FindShare(id, s))
                PrintShare(s);
        }

        cout << "total deposit=" << l.get_HolderTotalDeposit(owner) << endl;
        return 0;
    }

    int ShowShare(Vault& vault, const po::variables_map& vm)
    {
        ShareID id = GetU64(vm, cli::SHARE_ID);

        Share s;
        if (!vault.get_Ledger().FindShare(id, s))
            LedgerException::Throw(LedgerError::ShareNotFound, "id=" + std::to_string(id));

        PrintShare(s);
        return 0;
    }

    int ShowHistory(Vault& vault, const po::variables_map& vm)
    {
        Event::Type::Enum eType = Event::Type::ShareIssued;
        const Event::Type::Enum* pType = nullptr;

        if (vm.count(cli::EVENT_KIND))
        {
            const std::string& sKind = vm[cli::EVENT_KIND].as<string>();
            if (!Event::Type::FromName(eType, sKind))
                throw po::invalid_option_value(sKind);
            pType = &eType;
        }

        std::vector<VaultDB::EventRecord> vRecs;
        vault.History(vRecs, pType, vm[cli::LIMIT].as<uint32_t>());

        for (const auto& r : vRecs)
        {
            cout << boost::format("#%1% %2% %3%") % r.m_Seq % format_timestamp(kTimeFormat, r.m_Time, false) % Event::Type::get_Name(r.m_Type);
            if (r.m_ShareID)
                cout << " share=" << r.m_ShareID;
            if (!r.m_Owner.empty())
                cout << " owner=" << r.m_Owner;
            cout << " amount=" << r.m_Amount;
            if (!r.m_Body.empty())
                cout << ' ' << r.m_Body;
            cout << " hash=" << to_hex(r.m_Hash.data(), 8);
            cout << '\n';
        }

        cout << vRecs.size() << " record(s)" << endl;
        return 0;
    }

    int Verify(Vault& vault, const po::variables_map&)
    {
        uint64_t nBadSeq = 0;
        if (!vault.VerifyEventChain(nBadSeq))
        {
            cout << "event chain broken at #" << nBadSeq << endl;
            return -1;
        }

        cout << "event chain ok" << endl;
        return 0;
    }

    int SetPaused(Vault& vault, const po::variables_map& vm, bool bPause)
    {
        const std::string& sTarget = GetRequired(vm, cli::TARGET);

        if (sTarget == cli::TARGET_DEPOSITS)
            vault.SetDepositsPaused(bPause);
        else if (sTarget == cli::TARGET_DISTRIBUTIONS)
            vault.SetDistributionsPaused(bPause);
        else
            throw po::invalid_option_value(sTarget);

        cout << sTarget << (bPause ? " paused" : " resumed") << endl;
        return 0;
    }

    int Pause(Vault& vault, const po::variables_map& vm)
    {
        return SetPaused(vault, vm, true);
    }

    int Resume(Vault& vault, const po::variables_map& vm)
    {
        return SetPaused(vault, vm, false);
    }

    Vault::Config GetVaultConfig(const po::variables_map& vm)
    {
        Vault::Config cfg;
        cfg.m_Curve.m_UnitScale = ParseAmount(vm[cli::UNIT_SCALE].as<string>());
        cfg.m_Curve.m_FeeBps = vm[cli::FEE_BPS].as<uint32_t>();
        cfg.m_MinDistribution = ParseAmount(vm[cli::MIN_DISTRIBUTION].as<string>());
        return cfg;
    }
}

int main(int argc, char* argv[])
{
    const Command commands[] =
    {
        {cli::CMD_INFO,         ShowInfo,       "print ledger totals and the current unit price"},
        {cli::CMD_QUOTE,        Quote,          "calculate what a deposit would buy, without changing anything"},
        {cli::CMD_DEPOSIT,      Deposit,        "issue a share (or a meta share) for a deposit"},
        {cli::CMD_MINT,         Mint,           "mint units from a meta share"},
        {cli::CMD_DISTRIBUTE,   Distribute,     "distribute yield across all shares"},
        {cli::CMD_CLAIM,        Claim,          "claim accrued yield of a share"},
        {cli::CMD_CLAIM_BATCH,  ClaimBatch,     "claim accrued yield of several shares"},
        {cli::CMD_WITHDRAW,     Withdraw,       "withdraw a share, returning its deposit value"},
        {cli::CMD_TRANSFER,     Transfer,       "transfer a share to another holder"},
        {cli::CMD_SHARES,       ShowShares,     "print the shares of a holder"},
        {cli::CMD_SHARE,        ShowShare,      "print a share"},
        {cli::CMD_HISTORY,      ShowHistory,    "print ledger events, newest first"},
        {cli::CMD_VERIFY,       Verify,         "verify the event log hash chain"},
        {cli::CMD_PAUSE,        Pause,          "pause deposits or distributions"},
        {cli::CMD_RESUME,       Resume,         "resume deposits or distributions"},
    };

    try
    {
        auto [options, visibleOptions] = createOptionsDescription(kDefaultConfigFile);

        po::variables_map vm;
        try
        {
            vm = getOptions(argc, argv, options);
        }
        catch (const po::error& e)
        {
            cout << e.what() << std::endl;
            printHelp(begin(commands), end(commands), visibleOptions);

            return -1;
        }

        if (vm.count(cli::HELP))
        {
            printHelp(begin(commands), end(commands), visibleOptions);

            return 0;
        }

        if (vm.count(cli::VERSION))
        {
            cout << PROJECT_VERSION << endl;
            return 0;
        }

        int logLevel = getLogLevel(cli::LOG_LEVEL, vm, LOG_LEVEL_WARNING);
        int fileLogLevel = getLogLevel(cli::FILE_LOG_LEVEL, vm, LOG_LEVEL_DEBUG);

        const auto path = boost::filesystem::system_complete(vm[cli::LOG_DIR].as<string>());
        auto logger = Logger::create(logLevel, logLevel, fileLogLevel, "xmbl_ledger_", path.string());
        LOG_INFO() << "xmbl-ledger " << PROJECT_VERSION << ", log " << logger->get_file_path();

        try
        {
            po::notify(vm);

            if (vm.count(cli::COMMAND) == 0)
            {
                LOG_ERROR() << kErrorCommandNotSpecified;
                printHelp(begin(commands), end(commands), visibleOptions);
                return -1;
            }

            auto command = vm[cli::COMMAND].as<string>();

            auto cit = find_if(begin(commands), end(commands), [&command](const auto& p) {return p.name == command; });
            if (cit == end(commands))
            {
                LOG_ERROR() << boost::format(kErrorCommandUnknown) % command;
                return -1;
            }

            Vault vault;
            vault.Open(vm[cli::STORAGE].as<string>().c_str(), GetVaultConfig(vm));

            return cit->handler(vault, vm);
        }
        catch (const LedgerException& e)
        {
            cout << "Error: " << e.what() << endl;
            return 1;
        }
        catch (const VaultDBUpgradeException& e)
        {
            LOG_ERROR() << e.what();
            return -1;
        }
        catch (const CorruptionException& e)
        {
            cout << "Ledger storage failure: " << e.m_sErr << endl;
            return -1;
        }
        catch (const po::error& e)
        {
            LOG_ERROR() << e.what();
            return -1;
        }
        catch (const std::exception& e)
        {
            LOG_ERROR() << e.what();
            return -1;
        }
    }
    catch (const std::exception& e)
    {
        std::cout << e.what() << std::endl;
    }

    return -1;
}
