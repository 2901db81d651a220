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

#include "db.h"
#include <memory>
#include <mutex>

namespace xmbl {

// Ledger backed by the sqlite file. Each operation is applied to the in-memory ledger, and its effect
// (touched shares, totals, event records) is committed in a single db transaction.
class Vault
	:private Ledger::IObserver
{
public:

	struct Config
	{
		Curve::Params m_Curve; // used only when the db is created
		Amount m_MinDistribution = 0; // 0 = no threshold
	};

	Vault();
	~Vault();

	void Open(const char* szPath, const Config&);
	bool IsOpen() const { return !!m_pLedger; }

	// Queries go directly to the ledger
	const Ledger& get_Ledger() const;

	Ledger::IssueResult Deposit(const OwnerID&, const Amount&);
	std::vector<ShareID> MintFromMeta(ShareID, uint64_t nUnits, const OwnerID& caller);
	Distribution::Result Distribute(const Amount& totalYield);
	Amount Claim(ShareID, const OwnerID& caller);
	Amount ClaimMultiple(const std::vector<ShareID>&, const OwnerID& caller);
	Ledger::WithdrawResult Withdraw(ShareID, const OwnerID& caller);
	void Transfer(ShareID, const OwnerID& from, const OwnerID& to);
	void SetDepositsPaused(bool);
	void SetDistributionsPaused(bool);

	void History(std::vector<VaultDB::EventRecord>&, const Event::Type::Enum* pType = nullptr, uint32_t nLimit = 0);
	// sqlite integrity check, then the hash chain. Returns false with the first bad seq if the chain is broken
	bool VerifyEventChain(uint64_t& nBadSeq);

private:

	std::mutex m_Mutex;
	VaultDB m_DB;
	std::unique_ptr<Ledger> m_pLedger;
	Config m_Cfg;
	std::vector<Event::Any> m_vPending;

	void OnEvent(const Event::Any&) override;

	Ledger& get_LedgerStrict();
	void CommitPending();
};

} // namespace xmbl
