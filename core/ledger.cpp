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

#include "ledger.h"
#include "ledger_error.h"
#include "utility/common.h"
#include "utility/logger.h"

namespace xmbl
{
	Ledger::Ledger(const Curve::Params& pars)
		:m_Curve(pars)
	{
		m_Curve.TestValid();
	}

	void Ledger::TestOwner(const OwnerID& owner)
	{
		if (owner.empty())
			LedgerException::Throw(LedgerError::InvalidOwner, "empty owner id");
	}

	Share& Ledger::get_ShareStrict(ShareID id)
	{
		auto it = m_Shares.find(id);
		if (m_Shares.end() == it)
			LedgerException::Throw(LedgerError::ShareNotFound, "id=" + std::to_string(id));

		return it->second;
	}

	void Ledger::AddShare(Share&& s)
	{
		ShareID id = s.m_ID;

		// holder totals are bounded by the value locked, which was already checked
		Holder& h = m_Holders[s.m_Owner];
		h.m_Shares.insert(id);
		h.m_TotalDeposit += s.m_DepositValue;

		m_Shares[id] = std::move(s);
	}

	void Ledger::RemoveFromHolder(const Share& s)
	{
		auto it = m_Holders.find(s.m_Owner);
		if (m_Holders.end() == it)
			CorruptionException::Throw(("share not indexed by holder: " + std::to_string(s.m_ID)).c_str());

		Holder& h = it->second;
		h.m_Shares.erase(s.m_ID);
		h.m_TotalDeposit -= s.m_DepositValue;

		if (h.m_Shares.empty())
			m_Holders.erase(it);
	}

	void Ledger::Publish(const Event::Any& evt)
	{
		if (m_pObserver)
			m_pObserver->OnEvent(evt);
	}

	Issuance::Plan Ledger::QuoteIssue(const Amount& amount) const
	{
		std::unique_lock<std::mutex> scope(m_Mutex);

		if (!amount)
			LedgerException::Throw(LedgerError::InvalidDepositAmount, "zero amount");

		return Issuance::Calculate(m_Curve, amount, m_Totals.m_UnitsIssued);
	}

	Ledger::IssueResult Ledger::Issue(const OwnerID& owner, const Amount& amount)
	{
		std::unique_lock<std::mutex> scope(m_Mutex);

		if (m_Totals.m_DepositsPaused)
			LedgerException::Throw(LedgerError::DepositsPaused);

		TestOwner(owner);

		if (!amount)
			LedgerException::Throw(LedgerError::InvalidDepositAmount, "zero amount");

		IssueResult res;
		res.m_Plan = Issuance::Calculate(m_Curve, amount, m_Totals.m_UnitsIssued);

		Totals t = m_Totals;
		Strict::Add(t.m_UnitsIssued, res.m_Plan.m_Units);
		res.m_ShareID = t.m_NextShareID;
		Strict::Add(t.m_NextShareID, 1);
		Strict::Add(t.m_ValueLocked, res.m_Plan.m_TotalCost);

		Share s;
		s.m_ID = res.m_ShareID;
		s.m_Owner = owner;
		s.m_DepositValue = res.m_Plan.m_TotalCost;

		if (res.m_Plan.IsMeta())
		{
			Share::Meta m;
			m.m_Remaining = res.m_Plan.m_Units;
			m.m_NextPosition = res.m_Plan.m_StartPosition;
			m.m_Reserved = res.m_Plan.m_Units;
			s.m_State = m;
		}

		// no more failures past this point
		m_Totals = t;
		AddShare(std::move(s));

		LOG_INFO() << "Share " << res.m_ShareID << " issued to " << owner << ", units=" << res.m_Plan.m_Units
			<< " cost=" << res.m_Plan.m_TotalCost << " refund=" << res.m_Plan.m_Refund;

		Event::ShareIssued evt;
		evt.m_ShareID = res.m_ShareID;
		evt.m_Owner = owner;
		evt.m_DepositValue = res.m_Plan.m_TotalCost;
		evt.m_IsMeta = res.m_Plan.IsMeta();
		evt.m_MetaUnitsReserved = evt.m_IsMeta ? res.m_Plan.m_Units : 0;
		evt.m_Refund = res.m_Plan.m_Refund;
		Publish(evt);

		return res;
	}

	std::vector<ShareID> Ledger::MintFromMeta(ShareID id, uint64_t nUnits, const OwnerID& caller)
	{
		std::unique_lock<std::mutex> scope(m_Mutex);

		Share& s = get_ShareStrict(id);
		if (s.m_Owner != caller)
			LedgerException::Throw(LedgerError::NotMetaOwner, "id=" + std::to_string(id));

		Share::Meta* pMeta = s.get_Meta();
		if (!pMeta)
			LedgerException::Throw(LedgerError::NotAMetaShare, "id=" + std::to_string(id) + " kind=" + Share::get_KindName(s.get_Kind()));

		if (!nUnits || (nUnits > pMeta->m_Remaining))
			LedgerException::Throw(LedgerError::InvalidMintCount, "requested=" + std::to_string(nUnits) + " remaining=" + std::to_string(pMeta->m_Remaining));

		Totals t = m_Totals;
		Event::UnitsMintedFromMeta evt;
		evt.m_MetaShareID = id;
		evt.m_Owner = caller;

		std::vector<Share> vNew;
		vNew.reserve(static_cast<size_t>(nUnits));

		for (uint64_t i = 0; i < nUnits; i++)
		{
			vNew.emplace_back();
			Share& x = vNew.back();

			x.m_ID = t.m_NextShareID;
			Strict::Add(t.m_NextShareID, 1);
			x.m_Owner = caller;
			// next + remaining never exceeds the issued count
			x.m_DepositValue = Curve::get_Price(m_Curve, pMeta->m_NextPosition + i);

			Strict::Add(evt.m_MintedValue, x.m_DepositValue);
			evt.m_vNewShareIDs.push_back(x.m_ID);
		}

		Strict::Add(t.m_ValueLocked, evt.m_MintedValue);

		// apply
		pMeta->m_Remaining -= nUnits;
		pMeta->m_NextPosition += nUnits;

		if (!pMeta->m_Remaining)
		{
			Share::ClosedMeta cm;
			cm.m_Reserved = pMeta->m_Reserved;
			s.m_State = cm; // pMeta is invalid now
			evt.m_MetaClosed = true;
		}

		m_Totals = t;
		for (Share& x : vNew)
			AddShare(std::move(x));

		LOG_INFO() << "Minted " << nUnits << " units from meta share " << id << ", owner=" << caller
			<< " value=" << evt.m_MintedValue << (evt.m_MetaClosed ? ", meta closed" : "");

		Publish(evt);
		return evt.m_vNewShareIDs;
	}

	Distribution::Result Ledger::Distribute(const Amount& totalYield)
	{
		std::unique_lock<std::mutex> scope(m_Mutex);

		if (m_Totals.m_DistributionsPaused)
			LedgerException::Throw(LedgerError::DistributionsPaused);

		std::vector<Distribution::Stake> vStakes;
		vStakes.reserve(m_Holders.size());

		for (const auto& v : m_Holders)
		{
			vStakes.emplace_back();
			Distribution::Stake& st = vStakes.back();
			st.m_Owner = v.first;
			st.m_TotalDeposit = v.second.m_TotalDeposit;

			for (ShareID id : v.second.m_Shares)
			{
				auto it = m_Shares.find(id);
				if (m_Shares.end() == it)
					CorruptionException::Throw(("holder index refers to missing share: " + std::to_string(id)).c_str());
				if (it->second.m_DepositValue)
					st.m_vShares.push_back(id);
			}
		}

		Distribution::Result res = Distribution::Calculate(totalYield, vStakes);

		std::vector<std::pair<Share*, Amount> > vUpd;
		vUpd.reserve(res.m_Credits.size());

		for (const auto& v : res.m_Credits)
		{
			Share& s = m_Shares.find(v.first)->second;
			vUpd.emplace_back(&s, s.m_AccruedYield);
			Strict::Add(vUpd.back().second, v.second);
		}

		for (auto& v : vUpd)
			v.first->m_AccruedYield = v.second;

		LOG_INFO() << "Distributed " << res.m_Credited << " of " << totalYield << " across " << res.m_Credits.size()
			<< " shares, residual=" << res.m_Residual;

		Event::YieldDistributed evt;
		evt.m_TotalAmount = totalYield;
		evt.m_Credits = res.m_Credits;
		evt.m_Residual = res.m_Residual;
		Publish(evt);

		return res;
	}

	Amount Ledger::Claim(ShareID id, const OwnerID& caller)
	{
		std::unique_lock<std::mutex> scope(m_Mutex);

		Share& s = get_ShareStrict(id);
		if (s.m_Owner != caller)
			LedgerException::Throw(LedgerError::NotShareOwner, "id=" + std::to_string(id));

		if (!s.m_AccruedYield)
			LedgerException::Throw(LedgerError::NothingToClaim, "id=" + std::to_string(id));

		Event::YieldClaimed evt;
		evt.m_ShareID = id;
		evt.m_Owner = caller;
		evt.m_Amount = s.m_AccruedYield;

		s.m_AccruedYield = 0;

		LOG_INFO() << "Claimed " << evt.m_Amount << " from share " << id << ", owner=" << caller;

		Publish(evt);
		return evt.m_Amount;
	}

	Amount Ledger::ClaimMultiple(const std::vector<ShareID>& vIDs, const OwnerID& caller)
	{
		std::unique_lock<std::mutex> scope(m_Mutex);

		// duplicates are claimed once
		std::set<ShareID> setIDs(vIDs.begin(), vIDs.end());

		std::vector<Share*> vClaim;
		Amount total = 0;

		for (ShareID id : setIDs)
		{
			auto it = m_Shares.find(id);
			if (m_Shares.end() == it)
				continue;

			Share& s = it->second;
			if ((s.m_Owner != caller) || !s.m_AccruedYield)
				continue;

			Strict::Add(total, s.m_AccruedYield);
			vClaim.push_back(&s);
		}

		if (!total)
			LedgerException::Throw(LedgerError::NoYieldToClaim, "owner=" + caller);

		std::vector<Event::YieldClaimed> vEvts;
		vEvts.reserve(vClaim.size());

		for (Share* pS : vClaim)
		{
			vEvts.emplace_back();
			Event::YieldClaimed& evt = vEvts.back();
			evt.m_ShareID = pS->m_ID;
			evt.m_Owner = caller;
			evt.m_Amount = pS->m_AccruedYield;

			pS->m_AccruedYield = 0;
		}

		LOG_INFO() << "Claimed " << total << " from " << vClaim.size() << " shares, owner=" << caller;

		for (const auto& evt : vEvts)
			Publish(evt);

		return total;
	}

	Ledger::WithdrawResult Ledger::Withdraw(ShareID id, const OwnerID& caller)
	{
		std::unique_lock<std::mutex> scope(m_Mutex);

		auto it = m_Shares.find(id);
		if (m_Shares.end() == it)
			LedgerException::Throw(LedgerError::ShareNotFound, "id=" + std::to_string(id));

		const Share& s = it->second;
		if (s.m_Owner != caller)
			LedgerException::Throw(LedgerError::NotShareOwner, "id=" + std::to_string(id));

		Amount tvl = m_Totals.m_ValueLocked;
		Strict::Sub(tvl, s.m_DepositValue);

		WithdrawResult res;
		res.m_DepositValue = s.m_DepositValue;
		res.m_YieldPaid = s.m_AccruedYield;

		RemoveFromHolder(s);
		m_Shares.erase(it);
		m_Totals.m_ValueLocked = tvl;

		LOG_INFO() << "Share " << id << " withdrawn by " << caller << ", value=" << res.m_DepositValue << " yield=" << res.m_YieldPaid;

		if (res.m_YieldPaid)
		{
			Event::YieldClaimed evt;
			evt.m_ShareID = id;
			evt.m_Owner = caller;
			evt.m_Amount = res.m_YieldPaid;
			Publish(evt);
		}

		Event::ShareWithdrawn evt;
		evt.m_ShareID = id;
		evt.m_Owner = caller;
		evt.m_DepositValue = res.m_DepositValue;
		Publish(evt);

		return res;
	}

	void Ledger::Transfer(ShareID id, const OwnerID& from, const OwnerID& to)
	{
		std::unique_lock<std::mutex> scope(m_Mutex);

		Share& s = get_ShareStrict(id);
		if (s.m_Owner != from)
			LedgerException::Throw(LedgerError::NotShareOwner, "id=" + std::to_string(id));

		TestOwner(to);

		if (from == to)
			return;

		RemoveFromHolder(s);
		s.m_Owner = to;

		Holder& h = m_Holders[to];
		h.m_Shares.insert(id);
		h.m_TotalDeposit += s.m_DepositValue;

		LOG_INFO() << "Share " << id << " transferred " << from << " -> " << to;

		Event::ShareTransferred evt;
		evt.m_ShareID = id;
		evt.m_From = from;
		evt.m_To = to;
		Publish(evt);
	}

	void Ledger::SetDepositsPaused(bool b)
	{
		std::unique_lock<std::mutex> scope(m_Mutex);
		m_Totals.m_DepositsPaused = b;
		LOG_INFO() << "Deposits " << (b ? "paused" : "resumed");
	}

	void Ledger::SetDistributionsPaused(bool b)
	{
		std::unique_lock<std::mutex> scope(m_Mutex);
		m_Totals.m_DistributionsPaused = b;
		LOG_INFO() << "Distributions " << (b ? "paused" : "resumed");
	}

	bool Ledger::FindShare(ShareID id, Share& s) const
	{
		std::unique_lock<std::mutex> scope(m_Mutex);

		auto it = m_Shares.find(id);
		if (m_Shares.end() == it)
			return false;

		s = it->second;
		return true;
	}

	std::vector<ShareID> Ledger::get_HolderShares(const OwnerID& owner) const
	{
		std::unique_lock<std::mutex> scope(m_Mutex);

		std::vector<ShareID> vRes;
		auto it = m_Holders.find(owner);
		if (m_Holders.end() != it)
			vRes.assign(it->second.m_Shares.begin(), it->second.m_Shares.end());

		return vRes;
	}

	Amount Ledger::get_HolderTotalDeposit(const OwnerID& owner) const
	{
		std::unique_lock<std::mutex> scope(m_Mutex);

		auto it = m_Holders.find(owner);
		return (m_Holders.end() == it) ? Amount(0) : it->second.m_TotalDeposit;
	}

	Ledger::Totals Ledger::get_Totals() const
	{
		std::unique_lock<std::mutex> scope(m_Mutex);
		return m_Totals;
	}

	size_t Ledger::get_ShareCount() const
	{
		std::unique_lock<std::mutex> scope(m_Mutex);
		return m_Shares.size();
	}

	Ledger::Snapshot Ledger::Export() const
	{
		std::unique_lock<std::mutex> scope(m_Mutex);

		Snapshot res;
		res.m_Totals = m_Totals;
		res.m_vShares.reserve(m_Shares.size());

		for (const auto& v : m_Shares)
			res.m_vShares.push_back(v.second);

		return res;
	}

	void Ledger::Import(const Snapshot& snap)
	{
		const Totals& t = snap.m_Totals;
		if (!t.m_NextShareID)
			CorruptionException::Throw("next share id is zero");

		std::map<ShareID, Share> mapShares;
		std::map<OwnerID, Holder> mapHolders;
		Amount tvl = 0;

		for (const Share& s : snap.m_vShares)
		{
			std::string sID = std::to_string(s.m_ID);

			if (!s.m_ID || (s.m_ID >= t.m_NextShareID))
				CorruptionException::Throw(("share id out of range: " + sID).c_str());

			if (s.m_Owner.empty())
				CorruptionException::Throw(("share without owner: " + sID).c_str());

			const Share::Meta* pMeta = s.get_Meta();
			if (pMeta)
			{
				if (!pMeta->m_Remaining || (pMeta->m_Remaining > pMeta->m_Reserved) ||
					(pMeta->m_NextPosition > t.m_UnitsIssued) || (pMeta->m_Remaining > t.m_UnitsIssued - pMeta->m_NextPosition))
					CorruptionException::Throw(("inconsistent meta share: " + sID).c_str());
			}

			if (!mapShares.emplace(s.m_ID, s).second)
				CorruptionException::Throw(("duplicate share id: " + sID).c_str());

			try {
				Strict::Add(tvl, s.m_DepositValue);
			}
			catch (const LedgerException&) {
				CorruptionException::Throw("deposit values overflow");
			}

			Holder& h = mapHolders[s.m_Owner];
			h.m_Shares.insert(s.m_ID);
			h.m_TotalDeposit += s.m_DepositValue; // bounded by tvl
		}

		if (tvl != t.m_ValueLocked)
			CorruptionException::Throw("value locked mismatch");

		std::unique_lock<std::mutex> scope(m_Mutex);

		m_Shares.swap(mapShares);
		m_Holders.swap(mapHolders);
		m_Totals = t;

		LOG_INFO() << "Ledger state imported, shares=" << m_Shares.size() << " units=" << m_Totals.m_UnitsIssued << " tvl=" << m_Totals.m_ValueLocked;
	}

} // namespace xmbl
