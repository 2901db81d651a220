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

#include "issuance.h"
#include "distribution.h"
#include "events.h"
#include <map>
#include <set>
#include <mutex>

namespace xmbl
{
	// Issuance & distribution ledger. All the operations are serialized by the internal mutex,
	// and either succeed completely or throw LedgerException leaving the state untouched.
	class Ledger
	{
	public:

		// Invoked under the ledger lock after the state change is complete. Must not call back into the ledger
		struct IObserver
		{
			virtual void OnEvent(const Event::Any&) = 0;
		};

		struct IssueResult
		{
			ShareID m_ShareID = 0;
			Issuance::Plan m_Plan;
		};

		struct WithdrawResult
		{
			Amount m_DepositValue = 0;
			Amount m_YieldPaid = 0;
		};

		struct Holder
		{
			std::set<ShareID> m_Shares;
			Amount m_TotalDeposit = 0;
		};

		struct Totals
		{
			uint64_t m_UnitsIssued = 0;
			ShareID m_NextShareID = 1;
			Amount m_ValueLocked = 0;
			bool m_DepositsPaused = false;
			bool m_DistributionsPaused = false;
		};

		struct Snapshot
		{
			Totals m_Totals;
			std::vector<Share> m_vShares; // ascending ids
		};

		explicit Ledger(const Curve::Params& = Curve::Params());

		void set_Observer(IObserver* p) { m_pObserver = p; }
		const Curve::Params& get_CurveParams() const { return m_Curve; }

		IssueResult Issue(const OwnerID&, const Amount&);
		Issuance::Plan QuoteIssue(const Amount&) const;
		std::vector<ShareID> MintFromMeta(ShareID, uint64_t nUnits, const OwnerID& caller);

		Distribution::Result Distribute(const Amount& totalYield);
		Amount Claim(ShareID, const OwnerID& caller);
		Amount ClaimMultiple(const std::vector<ShareID>&, const OwnerID& caller);

		WithdrawResult Withdraw(ShareID, const OwnerID& caller);
		void Transfer(ShareID, const OwnerID& from, const OwnerID& to);

		void SetDepositsPaused(bool);
		void SetDistributionsPaused(bool);

		bool FindShare(ShareID, Share&) const;
		std::vector<ShareID> get_HolderShares(const OwnerID&) const;
		Amount get_HolderTotalDeposit(const OwnerID&) const;
		Totals get_Totals() const;
		size_t get_ShareCount() const;

		Snapshot Export() const;
		// Replaces the whole state. Inconsistent snapshot is a CorruptionException
		void Import(const Snapshot&);

	private:

		mutable std::mutex m_Mutex;
		Curve::Params m_Curve;
		IObserver* m_pObserver = nullptr;

		std::map<ShareID, Share> m_Shares;
		std::map<OwnerID, Holder> m_Holders;
		Totals m_Totals;

		Share& get_ShareStrict(ShareID);
		static void TestOwner(const OwnerID&);
		void AddShare(Share&&);
		void RemoveFromHolder(const Share&);
		void Publish(const Event::Any&);
	};

} // namespace xmbl
