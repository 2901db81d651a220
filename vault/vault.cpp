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

#include "vault.h"
#include "core/ledger_error.h"
#include "utility/helpers.h"
#include "utility/logger.h"
#include <set>

namespace xmbl {

Vault::Vault()
{
}

Vault::~Vault()
{
	if (m_pLedger)
		m_pLedger->set_Observer(nullptr);
}

void Vault::Open(const char* szPath, const Config& cfg)
{
	std::unique_lock<std::mutex> scope(m_Mutex);

	if (m_pLedger)
		throw std::runtime_error("vault already open");

	m_DB.Open(szPath);
	m_Cfg = cfg;

	VaultDB::Transaction t(m_DB);

	Curve::Params pars;
	if (m_DB.get_CurveParams(pars))
	{
		if ((pars.m_UnitScale != cfg.m_Curve.m_UnitScale) || (pars.m_FeeBps != cfg.m_Curve.m_FeeBps))
			LOG_WARNING() << "Configured curve differs from the stored one, using stored: scale=" << pars.m_UnitScale << " fee_bps=" << pars.m_FeeBps;
		m_Cfg.m_Curve = pars;
	}
	else
	{
		cfg.m_Curve.TestValid();
		m_DB.set_CurveParams(cfg.m_Curve);

		Ledger::Totals tot;
		m_DB.SaveTotals(tot);
	}

	Ledger::Snapshot snap;
	m_DB.LoadTotals(snap.m_Totals);
	m_DB.EnumShares(snap.m_vShares);

	t.Commit();

	std::unique_ptr<Ledger> pLedger(new Ledger(m_Cfg.m_Curve));
	pLedger->Import(snap);
	pLedger->set_Observer(this);
	m_pLedger = std::move(pLedger);

	LOG_INFO() << "Vault opened: " << szPath << ", shares=" << snap.m_vShares.size() << " events=" << m_DB.get_EventCount();
}

const Ledger& Vault::get_Ledger() const
{
	if (!m_pLedger)
		throw std::runtime_error("vault not open");
	return *m_pLedger;
}

Ledger& Vault::get_LedgerStrict()
{
	if (!m_pLedger)
		throw std::runtime_error("vault not open");
	return *m_pLedger;
}

void Vault::OnEvent(const Event::Any& evt)
{
	m_vPending.push_back(evt);
}

void Vault::CommitPending()
{
	Ledger& l = get_LedgerStrict();

	std::vector<ShareID> vTouched;
	for (const auto& evt : m_vPending)
		Event::get_TouchedShares(evt, vTouched);

	std::set<ShareID> setTouched(vTouched.begin(), vTouched.end());

	VaultDB::Transaction t(m_DB);

	for (ShareID id : setTouched)
	{
		Share s;
		if (l.FindShare(id, s))
			m_DB.ShareSave(s);
		else
			m_DB.ShareDel(id);
	}

	m_DB.SaveTotals(l.get_Totals());

	Timestamp ts = local_timestamp_msec();
	for (const auto& evt : m_vPending)
		m_DB.EventInsert(evt, ts);

	t.Commit();

	LOG_DEBUG() << "Committed " << m_vPending.size() << " events, " << setTouched.size() << " shares";
	m_vPending.clear();
}

Ledger::IssueResult Vault::Deposit(const OwnerID& owner, const Amount& amount)
{
	std::unique_lock<std::mutex> scope(m_Mutex);
	m_vPending.clear();

	Ledger::IssueResult res = get_LedgerStrict().Issue(owner, amount);
	CommitPending();
	return res;
}

std::vector<ShareID> Vault::MintFromMeta(ShareID id, uint64_t nUnits, const OwnerID& caller)
{
	std::unique_lock<std::mutex> scope(m_Mutex);
	m_vPending.clear();

	std::vector<ShareID> vRes = get_LedgerStrict().MintFromMeta(id, nUnits, caller);
	CommitPending();
	return vRes;
}

Distribution::Result Vault::Distribute(const Amount& totalYield)
{
	std::unique_lock<std::mutex> scope(m_Mutex);
	m_vPending.clear();

	// same rejection order as the ledger: pause first
	if (get_LedgerStrict().get_Totals().m_DistributionsPaused)
		LedgerException::Throw(LedgerError::DistributionsPaused);

	if (totalYield && (totalYield < m_Cfg.m_MinDistribution))
		LedgerException::Throw(LedgerError::BelowDistributionThreshold,
			"amount=" + AmountToString(totalYield) + " min=" + AmountToString(m_Cfg.m_MinDistribution));

	Distribution::Result res = get_LedgerStrict().Distribute(totalYield);
	CommitPending();
	return res;
}

Amount Vault::Claim(ShareID id, const OwnerID& caller)
{
	std::unique_lock<std::mutex> scope(m_Mutex);
	m_vPending.clear();

	Amount res = get_LedgerStrict().Claim(id, caller);
	CommitPending();
	return res;
}

Amount Vault::ClaimMultiple(const std::vector<ShareID>& vIDs, const OwnerID& caller)
{
	std::unique_lock<std::mutex> scope(m_Mutex);
	m_vPending.clear();

	Amount res = get_LedgerStrict().ClaimMultiple(vIDs, caller);
	CommitPending();
	return res;
}

Ledger::WithdrawResult Vault::Withdraw(ShareID id, const OwnerID& caller)
{
	std::unique_lock<std::mutex> scope(m_Mutex);
	m_vPending.clear();

	Ledger::WithdrawResult res = get_LedgerStrict().Withdraw(id, caller);
	CommitPending();
	return res;
}

void Vault::Transfer(ShareID id, const OwnerID& from, const OwnerID& to)
{
	std::unique_lock<std::mutex> scope(m_Mutex);
	m_vPending.clear();

	get_LedgerStrict().Transfer(id, from, to);
	CommitPending();
}

void Vault::SetDepositsPaused(bool b)
{
	std::unique_lock<std::mutex> scope(m_Mutex);
	m_vPending.clear();

	get_LedgerStrict().SetDepositsPaused(b);
	CommitPending();
}

void Vault::SetDistributionsPaused(bool b)
{
	std::unique_lock<std::mutex> scope(m_Mutex);
	m_vPending.clear();

	get_LedgerStrict().SetDistributionsPaused(b);
	CommitPending();
}

void Vault::History(std::vector<VaultDB::EventRecord>& vRes, const Event::Type::Enum* pType, uint32_t nLimit)
{
	std::unique_lock<std::mutex> scope(m_Mutex);
	get_LedgerStrict();
	m_DB.EnumEvents(vRes, pType, nLimit);
}

bool Vault::VerifyEventChain(uint64_t& nBadSeq)
{
	std::unique_lock<std::mutex> scope(m_Mutex);
	get_LedgerStrict();
	m_DB.CheckIntegrity(); // throws on a damaged file
	return m_DB.VerifyEventChain(nBadSeq);
}

} // namespace xmbl
