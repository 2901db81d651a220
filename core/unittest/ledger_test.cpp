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

#include "core/ledger.h"
#include "core/ledger_error.h"
#include "utility/common.h"
#include <algorithm>
#include <limits>
#include <thread>
#include <stdio.h>

int g_TestsFailed = 0;

void TestFailed(const char* szExpr, uint32_t nLine)
{
	printf("Test failed! Line=%u, Expression: %s\n", nLine, szExpr);
	g_TestsFailed++;
	fflush(stdout);
}

#define verify_test(x) \
	do { \
		if (!(x)) \
			TestFailed(#x, __LINE__); \
	} while (false)

#define fail_test(msg) TestFailed(msg, __LINE__)

namespace xmbl
{
	template <typename TFunc>
	bool ThrowsLedgerError(LedgerError::Enum e, TFunc&& f)
	{
		try {
			f();
		}
		catch (const LedgerException& ex) {
			return ex.get_Code() == e;
		}
		return false;
	}

	const uint64_t s_Price0 = 10100000000ULL;

	// price(n) = n + 1
	Curve::Params get_PlainCurve()
	{
		Curve::Params pars;
		pars.m_UnitScale = 1;
		pars.m_FeeBps = 0;
		return pars;
	}

	struct EventLog
		:public Ledger::IObserver
	{
		std::vector<Event::Any> m_vEvents;

		void OnEvent(const Event::Any& evt) override
		{
			m_vEvents.push_back(evt);
		}

		template <typename T>
		const T* get_At(size_t i) const
		{
			return (i < m_vEvents.size()) ? std::get_if<T>(&m_vEvents[i]) : nullptr;
		}
	};

	bool IsEqual(const Share& a, const Share& b)
	{
		if ((a.m_ID != b.m_ID) || (a.m_Owner != b.m_Owner) || (a.m_DepositValue != b.m_DepositValue) ||
			(a.m_AccruedYield != b.m_AccruedYield) || (a.get_Kind() != b.get_Kind()))
			return false;

		const Share::Meta* pA = a.get_Meta();
		const Share::Meta* pB = b.get_Meta();
		if (pA)
			return (pA->m_Remaining == pB->m_Remaining) && (pA->m_NextPosition == pB->m_NextPosition) && (pA->m_Reserved == pB->m_Reserved);

		return true;
	}

	bool IsEqual(const Ledger::Snapshot& a, const Ledger::Snapshot& b)
	{
		if ((a.m_Totals.m_UnitsIssued != b.m_Totals.m_UnitsIssued) ||
			(a.m_Totals.m_NextShareID != b.m_Totals.m_NextShareID) ||
			(a.m_Totals.m_ValueLocked != b.m_Totals.m_ValueLocked) ||
			(a.m_Totals.m_DepositsPaused != b.m_Totals.m_DepositsPaused) ||
			(a.m_Totals.m_DistributionsPaused != b.m_Totals.m_DistributionsPaused) ||
			(a.m_vShares.size() != b.m_vShares.size()))
			return false;

		for (size_t i = 0; i < a.m_vShares.size(); i++)
			if (!IsEqual(a.m_vShares[i], b.m_vShares[i]))
				return false;

		return true;
	}

	void TestDirectIssue()
	{
		Ledger l;
		EventLog log;
		l.set_Observer(&log);

		Ledger::IssueResult res = l.Issue("alice", s_Price0);
		verify_test(res.m_ShareID == 1);
		verify_test(res.m_Plan.m_Units == 1);
		verify_test(res.m_Plan.m_TotalCost == s_Price0);
		verify_test(res.m_Plan.m_Refund == 0);

		Share s;
		verify_test(l.FindShare(1, s));
		verify_test(s.m_Owner == "alice");
		verify_test(s.m_DepositValue == s_Price0);
		verify_test(s.m_AccruedYield == 0);
		verify_test(s.get_Kind() == Share::Kind::Ordinary);
		verify_test(!s.IsMeta());

		Ledger::Totals t = l.get_Totals();
		verify_test(t.m_UnitsIssued == 1);
		verify_test(t.m_NextShareID == 2);
		verify_test(t.m_ValueLocked == s_Price0);

		verify_test(log.m_vEvents.size() == 1);
		const Event::ShareIssued* pEvt = log.get_At<Event::ShareIssued>(0);
		verify_test(pEvt && (pEvt->m_ShareID == 1) && (pEvt->m_Owner == "alice") && !pEvt->m_IsMeta && (pEvt->m_DepositValue == s_Price0));

		// next unit costs twice as much, the same amount is not enough anymore
		verify_test(ThrowsLedgerError(LedgerError::InsufficientDeposit, [&]() { l.Issue("bob", s_Price0); }));

		// almost enough for 2 more units: buys one, the rest is refunded
		res = l.Issue("bob", 5 * s_Price0 - 1);
		verify_test(res.m_ShareID == 2);
		verify_test(res.m_Plan.m_Units == 1);
		verify_test(res.m_Plan.m_TotalCost == 2 * s_Price0);
		verify_test(res.m_Plan.m_Refund == 3 * s_Price0 - 1);

		verify_test(l.get_HolderTotalDeposit("alice") == s_Price0);
		verify_test(l.get_HolderTotalDeposit("bob") == 2 * s_Price0);
		verify_test(l.get_HolderTotalDeposit("carol") == 0);
		verify_test(l.get_Totals().m_ValueLocked == 3 * s_Price0);

		Issuance::Plan plan = l.QuoteIssue(3 * s_Price0);
		verify_test(plan.m_Units == 1);
		verify_test(plan.m_StartPosition == 2);
		verify_test(l.get_Totals().m_UnitsIssued == 2); // quote changes nothing
	}

	void TestIssueRejected()
	{
		Ledger l;
		EventLog log;
		l.set_Observer(&log);

		verify_test(ThrowsLedgerError(LedgerError::InsufficientDeposit, [&]() { l.Issue("alice", s_Price0 - 1); }));
		verify_test(ThrowsLedgerError(LedgerError::InvalidDepositAmount, [&]() { l.Issue("alice", 0); }));
		verify_test(ThrowsLedgerError(LedgerError::InvalidOwner, [&]() { l.Issue("", s_Price0); }));
		verify_test(ThrowsLedgerError(LedgerError::InvalidDepositAmount, [&]() { l.QuoteIssue(0); }));

		Ledger::Totals t = l.get_Totals();
		verify_test(t.m_UnitsIssued == 0);
		verify_test(t.m_NextShareID == 1);
		verify_test(t.m_ValueLocked == 0);
		verify_test(!l.get_ShareCount());
		verify_test(log.m_vEvents.empty());

		verify_test(ThrowsLedgerError(LedgerError::InvalidCurveParams, [&]() {
			Curve::Params pars;
			pars.m_UnitScale = 0;
			Ledger l2(pars);
		}));
	}

	void TestMetaIssue()
	{
		Ledger l;
		EventLog log;
		l.set_Observer(&log);

		// exactly 3 units
		Ledger::IssueResult res = l.Issue("bob", 6 * s_Price0);
		verify_test(res.m_ShareID == 1);
		verify_test(res.m_Plan.m_Units == 3);
		verify_test(res.m_Plan.IsMeta());

		Share s;
		verify_test(l.FindShare(1, s));
		verify_test(s.IsMeta());
		verify_test(s.m_DepositValue == 6 * s_Price0);

		const Share::Meta* pMeta = s.get_Meta();
		verify_test(pMeta && (pMeta->m_Remaining == 3) && (pMeta->m_NextPosition == 0) && (pMeta->m_Reserved == 3));

		// positions are reserved upfront
		verify_test(l.get_Totals().m_UnitsIssued == 3);
		verify_test(l.get_Totals().m_NextShareID == 2);

		const Event::ShareIssued* pIss = log.get_At<Event::ShareIssued>(0);
		verify_test(pIss && pIss->m_IsMeta && (pIss->m_MetaUnitsReserved == 3));

		// someone else deposits meanwhile, continues after the reserved block
		res = l.Issue("alice", 4 * s_Price0);
		verify_test(res.m_ShareID == 2);
		verify_test(res.m_Plan.m_StartPosition == 3);
		verify_test(res.m_Plan.m_TotalCost == 4 * s_Price0);

		std::vector<ShareID> vIDs = l.MintFromMeta(1, 2, "bob");
		verify_test(vIDs.size() == 2);
		verify_test((vIDs[0] == 3) && (vIDs[1] == 4));

		verify_test(l.FindShare(3, s) && (s.m_DepositValue == s_Price0) && (s.m_Owner == "bob") && !s.IsMeta());
		verify_test(l.FindShare(4, s) && (s.m_DepositValue == 2 * s_Price0));

		verify_test(l.FindShare(1, s));
		pMeta = s.get_Meta();
		verify_test(pMeta && (pMeta->m_Remaining == 1) && (pMeta->m_NextPosition == 2));

		const Event::UnitsMintedFromMeta* pMint = log.get_At<Event::UnitsMintedFromMeta>(2);
		verify_test(pMint && (pMint->m_MetaShareID == 1) && (pMint->m_vNewShareIDs == vIDs) && !pMint->m_MetaClosed);
		verify_test(pMint && (pMint->m_MintedValue == 3 * s_Price0));

		vIDs = l.MintFromMeta(1, 1, "bob");
		verify_test((vIDs.size() == 1) && (vIDs[0] == 5));
		verify_test(l.FindShare(5, s) && (s.m_DepositValue == 3 * s_Price0));

		// closed, the record stays
		verify_test(l.FindShare(1, s));
		verify_test(s.get_Kind() == Share::Kind::ClosedMeta);
		verify_test(!s.IsMeta());
		verify_test(s.m_DepositValue == 6 * s_Price0);

		pMint = log.get_At<Event::UnitsMintedFromMeta>(3);
		verify_test(pMint && pMint->m_MetaClosed);

		// units were minted lazily, the issued count didn't change
		verify_test(l.get_Totals().m_UnitsIssued == 4);

		// minted values add up to the meta deposit
		Amount sum = 0;
		for (ShareID id = 3; id <= 5; id++)
		{
			verify_test(l.FindShare(id, s));
			sum += s.m_DepositValue;
		}
		verify_test(sum == 6 * s_Price0);

		// both the meta record and its units are counted
		verify_test(l.get_HolderTotalDeposit("bob") == 12 * s_Price0);
		verify_test(l.get_Totals().m_ValueLocked == 16 * s_Price0);

		std::vector<ShareID> vBob = l.get_HolderShares("bob");
		verify_test((vBob.size() == 4) && (vBob[0] == 1) && (vBob[3] == 5));

		verify_test(ThrowsLedgerError(LedgerError::NotAMetaShare, [&]() { l.MintFromMeta(1, 1, "bob"); }));
	}

	void TestMetaRejected()
	{
		Ledger l;
		l.Issue("bob", 6 * s_Price0); // meta, 3 units
		l.Issue("alice", 4 * s_Price0); // ordinary

		EventLog log;
		l.set_Observer(&log);

		Ledger::Snapshot snap0 = l.Export();

		verify_test(ThrowsLedgerError(LedgerError::ShareNotFound, [&]() { l.MintFromMeta(99, 1, "bob"); }));
		verify_test(ThrowsLedgerError(LedgerError::NotMetaOwner, [&]() { l.MintFromMeta(1, 1, "alice"); }));
		verify_test(ThrowsLedgerError(LedgerError::NotAMetaShare, [&]() { l.MintFromMeta(2, 1, "alice"); }));
		verify_test(ThrowsLedgerError(LedgerError::InvalidMintCount, [&]() { l.MintFromMeta(1, 0, "bob"); }));
		verify_test(ThrowsLedgerError(LedgerError::InvalidMintCount, [&]() { l.MintFromMeta(1, 4, "bob"); }));

		verify_test(IsEqual(snap0, l.Export()));
		verify_test(log.m_vEvents.empty());

		// all at once
		std::vector<ShareID> vIDs = l.MintFromMeta(1, 3, "bob");
		verify_test((vIDs.size() == 3) && (vIDs[0] == 3) && (vIDs[2] == 5));
	}

	void TestMetaAfterTransfer()
	{
		Ledger l;
		l.Issue("bob", 6 * s_Price0);
		l.MintFromMeta(1, 1, "bob");

		l.Transfer(1, "bob", "carol");

		// only the current owner may mint, the new units go to it
		verify_test(ThrowsLedgerError(LedgerError::NotMetaOwner, [&]() { l.MintFromMeta(1, 1, "bob"); }));

		std::vector<ShareID> vIDs = l.MintFromMeta(1, 2, "carol");
		verify_test(vIDs.size() == 2);

		Share s;
		verify_test(l.FindShare(vIDs[0], s) && (s.m_Owner == "carol") && (s.m_DepositValue == 2 * s_Price0));
		verify_test(l.get_HolderShares("bob").size() == 1);
		verify_test(l.get_HolderTotalDeposit("carol") == 6 * s_Price0 + 5 * s_Price0);
	}

	void TestDistributeAndClaim()
	{
		Ledger l(get_PlainCurve());
		EventLog log;
		l.set_Observer(&log);

		verify_test(ThrowsLedgerError(LedgerError::NoActiveDeposits, [&]() { l.Distribute(10); }));

		verify_test(l.Issue("alice", 1).m_ShareID == 1); // value 1
		verify_test(l.Issue("bob", 2).m_ShareID == 2); // value 2
		verify_test(l.Issue("alice", 3).m_ShareID == 3); // value 3

		log.m_vEvents.clear();

		verify_test(ThrowsLedgerError(LedgerError::InvalidYieldAmount, [&]() { l.Distribute(0); }));

		// alice 4/6, bob 2/6
		Distribution::Result res = l.Distribute(12);
		verify_test(res.m_Credited == 12);
		verify_test(res.m_Residual == 0);
		verify_test(res.m_Credits.size() == 3);
		verify_test(res.m_Credits[1] == 4);
		verify_test(res.m_Credits[2] == 4);
		verify_test(res.m_Credits[3] == 4);

		// alice 28/6 = 4 -> 2 per share, bob 14/6 = 2
		res = l.Distribute(7);
		verify_test(res.m_Credited == 6);
		verify_test(res.m_Residual == 1);

		const Event::YieldDistributed* pEvt = log.get_At<Event::YieldDistributed>(1);
		verify_test(pEvt && (pEvt->m_TotalAmount == 7) && (pEvt->m_Residual == 1) && (pEvt->m_Credits.size() == 3));

		Share s;
		verify_test(l.FindShare(1, s) && (s.m_AccruedYield == 6));
		verify_test(l.FindShare(2, s) && (s.m_AccruedYield == 6));
		verify_test(l.FindShare(3, s) && (s.m_AccruedYield == 6));

		log.m_vEvents.clear();

		verify_test(ThrowsLedgerError(LedgerError::NotShareOwner, [&]() { l.Claim(2, "alice"); }));
		verify_test(ThrowsLedgerError(LedgerError::ShareNotFound, [&]() { l.Claim(99, "alice"); }));

		verify_test(l.Claim(1, "alice") == 6);
		verify_test(ThrowsLedgerError(LedgerError::NothingToClaim, [&]() { l.Claim(1, "alice"); }));
		verify_test(l.FindShare(1, s) && (s.m_AccruedYield == 0));

		const Event::YieldClaimed* pClaim = log.get_At<Event::YieldClaimed>(0);
		verify_test(pClaim && (pClaim->m_ShareID == 1) && (pClaim->m_Owner == "alice") && (pClaim->m_Amount == 6));
		verify_test(log.m_vEvents.size() == 1);

		// zero, foreign, duplicate and unknown ids are skipped
		std::vector<ShareID> vIDs = { 1, 2, 3, 3, 99 };
		verify_test(l.ClaimMultiple(vIDs, "alice") == 6);
		verify_test(log.m_vEvents.size() == 2);
		verify_test(l.FindShare(3, s) && (s.m_AccruedYield == 0));
		verify_test(l.FindShare(2, s) && (s.m_AccruedYield == 6));

		verify_test(ThrowsLedgerError(LedgerError::NoYieldToClaim, [&]() { l.ClaimMultiple(vIDs, "alice"); }));
		verify_test(ThrowsLedgerError(LedgerError::NoYieldToClaim, [&]() { l.ClaimMultiple(std::vector<ShareID>(), "bob"); }));

		vIDs = { 2 };
		verify_test(l.ClaimMultiple(vIDs, "bob") == 6);
		verify_test(log.m_vEvents.size() == 3);

		// pause blocks distribution only
		l.SetDistributionsPaused(true);
		verify_test(ThrowsLedgerError(LedgerError::DistributionsPaused, [&]() { l.Distribute(100); }));
		verify_test(l.Issue("carol", 4).m_ShareID == 4);
		l.SetDistributionsPaused(false);

		res = l.Distribute(100);
		verify_test(res.m_Credits.size() == 4);
	}

	void TestWithdraw()
	{
		Ledger l(get_PlainCurve());
		EventLog log;
		l.set_Observer(&log);

		l.Issue("alice", 1); // id 1, value 1
		l.Issue("bob", 2); // id 2, value 2
		l.Distribute(3); // 1 to alice, 2 to bob

		log.m_vEvents.clear();

		verify_test(ThrowsLedgerError(LedgerError::NotShareOwner, [&]() { l.Withdraw(1, "bob"); }));
		verify_test(ThrowsLedgerError(LedgerError::ShareNotFound, [&]() { l.Withdraw(7, "bob"); }));
		verify_test(log.m_vEvents.empty());

		Ledger::WithdrawResult res = l.Withdraw(1, "alice");
		verify_test(res.m_DepositValue == 1);
		verify_test(res.m_YieldPaid == 1);

		// pending yield is paid out first
		verify_test(log.m_vEvents.size() == 2);
		const Event::YieldClaimed* pClaim = log.get_At<Event::YieldClaimed>(0);
		verify_test(pClaim && (pClaim->m_ShareID == 1) && (pClaim->m_Amount == 1));
		const Event::ShareWithdrawn* pWd = log.get_At<Event::ShareWithdrawn>(1);
		verify_test(pWd && (pWd->m_ShareID == 1) && (pWd->m_Owner == "alice") && (pWd->m_DepositValue == 1));

		Share s;
		verify_test(!l.FindShare(1, s));
		verify_test(l.get_HolderShares("alice").empty());
		verify_test(l.get_HolderTotalDeposit("alice") == 0);
		verify_test(l.get_Totals().m_ValueLocked == 2);
		verify_test(l.get_Totals().m_UnitsIssued == 2); // positions stay consumed

		verify_test(ThrowsLedgerError(LedgerError::ShareNotFound, [&]() { l.Withdraw(1, "alice"); }));

		// ids are not reused
		verify_test(l.Issue("alice", 3).m_ShareID == 3);

		// no yield pending - no claim event
		log.m_vEvents.clear();
		res = l.Withdraw(3, "alice");
		verify_test(res.m_YieldPaid == 0);
		verify_test(log.m_vEvents.size() == 1);

		// meta share, the reserved units are gone with it
		l.Issue("dave", 4 + 5 + 6);
		Ledger::Totals t = l.get_Totals();
		verify_test(t.m_UnitsIssued == 6);
		res = l.Withdraw(4, "dave");
		verify_test(res.m_DepositValue == 15);
		verify_test(l.get_Totals().m_UnitsIssued == 6);
		verify_test(l.get_Totals().m_ValueLocked == 2);
	}

	void TestTransfer()
	{
		Ledger l(get_PlainCurve());
		EventLog log;
		l.set_Observer(&log);

		l.Issue("alice", 1); // id 1
		l.Issue("bob", 2); // id 2
		l.Distribute(3);

		log.m_vEvents.clear();

		verify_test(ThrowsLedgerError(LedgerError::ShareNotFound, [&]() { l.Transfer(5, "bob", "carol"); }));
		verify_test(ThrowsLedgerError(LedgerError::NotShareOwner, [&]() { l.Transfer(2, "alice", "carol"); }));
		verify_test(ThrowsLedgerError(LedgerError::InvalidOwner, [&]() { l.Transfer(2, "bob", ""); }));

		// no-op
		l.Transfer(2, "bob", "bob");
		verify_test(log.m_vEvents.empty());

		l.Transfer(2, "bob", "carol");
		verify_test(log.m_vEvents.size() == 1);
		const Event::ShareTransferred* pEvt = log.get_At<Event::ShareTransferred>(0);
		verify_test(pEvt && (pEvt->m_ShareID == 2) && (pEvt->m_From == "bob") && (pEvt->m_To == "carol"));

		verify_test(l.get_HolderShares("bob").empty());
		verify_test(l.get_HolderTotalDeposit("bob") == 0);
		verify_test(l.get_HolderTotalDeposit("carol") == 2);
		verify_test(l.get_Totals().m_ValueLocked == 3);

		// accrued yield goes with the share
		verify_test(ThrowsLedgerError(LedgerError::NotShareOwner, [&]() { l.Claim(2, "bob"); }));
		verify_test(l.Claim(2, "carol") == 2);

		// grouping follows the new owner: carol now holds 2 of 3
		l.Transfer(1, "alice", "carol");
		Distribution::Result res = l.Distribute(7);
		// carol: 7*3/3 = 7, split in 2 -> 3 each
		verify_test(res.m_Credited == 6);
		verify_test(res.m_Residual == 1);
	}

	void TestPauseDeposits()
	{
		Ledger l(get_PlainCurve());
		l.Issue("alice", 1);
		l.Distribute(5);

		l.SetDepositsPaused(true);
		verify_test(l.get_Totals().m_DepositsPaused);
		verify_test(ThrowsLedgerError(LedgerError::DepositsPaused, [&]() { l.Issue("alice", 100); }));

		// everything else keeps working
		verify_test(l.Claim(1, "alice") == 5);
		l.Distribute(5);
		verify_test(l.Withdraw(1, "alice").m_YieldPaid == 5);

		l.SetDepositsPaused(false);
		verify_test(l.Issue("alice", 2).m_ShareID == 2);
	}

	void TestOverflow()
	{
		Amount maxVal = std::numeric_limits<Amount>::max();

		Ledger l(get_PlainCurve());
		l.Issue("alice", 1); // value 1
		l.Issue("bob", 2); // value 2

		EventLog log;
		l.set_Observer(&log);
		Ledger::Snapshot snap0 = l.Export();

		// yield * holderDeposit exceeds 256 bits for bob
		verify_test(ThrowsLedgerError(LedgerError::ArithmeticOverflow, [&]() { l.Distribute(maxVal); }));
		verify_test(IsEqual(snap0, l.Export()));
		verify_test(log.m_vEvents.empty());

		// accrued yield can't wrap
		Ledger l1(get_PlainCurve());
		l1.Issue("alice", 1);
		l1.Distribute(maxVal);

		Ledger::Snapshot snap1 = l1.Export();
		verify_test(snap1.m_vShares[0].m_AccruedYield == maxVal);
		verify_test(ThrowsLedgerError(LedgerError::ArithmeticOverflow, [&]() { l1.Distribute(1); }));
		verify_test(IsEqual(snap1, l1.Export()));

		// steep curve: price(n) = (n + 1) * 2^254
		Curve::Params pars;
		pars.m_UnitScale = Amount(1) << 254;
		pars.m_FeeBps = 0;

		Ledger l2(pars);
		Ledger::IssueResult res = l2.Issue("alice", maxVal);
		verify_test(res.m_Plan.m_Units == 2);
		verify_test(res.m_Plan.m_TotalCost == 3 * pars.m_UnitScale);
		verify_test(res.m_Plan.m_Refund == maxVal - 3 * pars.m_UnitScale);

		// the 3rd unit alone is affordable, but the value locked would exceed 256 bits
		Ledger::Snapshot snap2 = l2.Export();
		verify_test(ThrowsLedgerError(LedgerError::ArithmeticOverflow, [&]() { l2.Issue("bob", maxVal); }));
		verify_test(IsEqual(snap2, l2.Export()));

		// 78-digit deposits on the default curve are planned without walking the units
		Ledger l3;
		verify_test(ThrowsLedgerError(LedgerError::ArithmeticOverflow, [&]() { l3.QuoteIssue(maxVal); }));
		verify_test(ThrowsLedgerError(LedgerError::ArithmeticOverflow, [&]() { l3.Issue("alice", maxVal); }));
		verify_test(!l3.get_ShareCount());

		Amount big;
		verify_test(AmountFromString(big, "1000000000000000000000000000000000000000000000"));
		res = l3.Issue("alice", big);
		verify_test(res.m_Plan.m_Units == 444994159489984788ULL);
		verify_test(res.m_Plan.IsMeta());
		verify_test(l3.get_Totals().m_UnitsIssued == 444994159489984788ULL);
		verify_test(l3.get_Totals().m_ValueLocked == res.m_Plan.m_TotalCost);

		Issuance::Plan plan = l3.QuoteIssue(big);
		verify_test(plan.m_StartPosition == 444994159489984788ULL);
		verify_test(plan.m_Units && (plan.m_Units < res.m_Plan.m_Units));
	}

	void TestExportImport()
	{
		Ledger l;
		l.Issue("bob", 6 * s_Price0);
		l.Issue("alice", 4 * s_Price0);
		l.MintFromMeta(1, 1, "bob");
		l.Distribute(1000000);
		l.Withdraw(2, "alice");
		l.SetDistributionsPaused(true);

		Ledger::Snapshot snap = l.Export();
		verify_test(snap.m_vShares.size() == 2);

		Ledger l2;
		l2.Import(snap);
		verify_test(IsEqual(snap, l2.Export()));
		verify_test(l2.get_HolderTotalDeposit("bob") == l.get_HolderTotalDeposit("bob"));
		verify_test(l2.get_HolderShares("bob") == l.get_HolderShares("bob"));
		verify_test(ThrowsLedgerError(LedgerError::DistributionsPaused, [&]() { l2.Distribute(1); }));

		// continues where the source stopped
		std::vector<ShareID> vIDs = l2.MintFromMeta(1, 2, "bob");
		verify_test((vIDs.size() == 2) && (vIDs[0] == 4));

		struct Corrupt
		{
			static bool Test(Ledger& l, const Ledger::Snapshot& snap)
			{
				try {
					l.Import(snap);
				}
				catch (const CorruptionException&) {
					return true;
				}
				return false;
			}
		};

		Ledger l3;
		Ledger::Snapshot bad = snap;
		bad.m_Totals.m_ValueLocked += 1;
		verify_test(Corrupt::Test(l3, bad));

		bad = snap;
		bad.m_vShares.push_back(bad.m_vShares[0]);
		bad.m_Totals.m_ValueLocked += bad.m_vShares[0].m_DepositValue;
		verify_test(Corrupt::Test(l3, bad));

		bad = snap;
		bad.m_Totals.m_NextShareID = bad.m_vShares.back().m_ID;
		verify_test(Corrupt::Test(l3, bad));

		bad = snap;
		bad.m_vShares[0].m_Owner.clear();
		verify_test(Corrupt::Test(l3, bad));

		bad = snap;
		Share::Meta* pMeta = bad.m_vShares[0].get_Meta();
		verify_test(pMeta != nullptr);
		if (pMeta)
		{
			pMeta->m_Remaining = pMeta->m_Reserved + 1;
			verify_test(Corrupt::Test(l3, bad));

			pMeta->m_Remaining = 2;
			pMeta->m_NextPosition = bad.m_Totals.m_UnitsIssued - 1; // would run past the issued positions
			verify_test(Corrupt::Test(l3, bad));
		}

		// failed import leaves the ledger as it was
		verify_test(!l3.get_ShareCount());
		verify_test(l3.get_Totals().m_NextShareID == 1);
	}

	void TestConcurrentIssue()
	{
		Ledger l;

		const uint32_t nThreads = 4;
		const uint32_t nPerThread = 25;
		const Amount amount = Amount(1000000000000000ULL);

		std::vector<Ledger::IssueResult> vRes(nThreads * nPerThread);
		std::vector<std::thread> vThreads;

		for (uint32_t iThread = 0; iThread < nThreads; iThread++)
		{
			vThreads.emplace_back([&l, &vRes, &amount, iThread, nPerThread]()
			{
				std::string sOwner = "holder" + std::to_string(iThread);
				for (uint32_t i = 0; i < nPerThread; i++)
					vRes[iThread * nPerThread + i] = l.Issue(sOwner, amount);
			});
		}

		for (auto& t : vThreads)
			t.join();

		// each deposit took a contiguous block of positions right after the previous one
		std::sort(vRes.begin(), vRes.end(), [](const Ledger::IssueResult& a, const Ledger::IssueResult& b) {
			return a.m_ShareID < b.m_ShareID;
		});

		uint64_t nPos = 0;
		Amount tvl = 0;
		for (size_t i = 0; i < vRes.size(); i++)
		{
			verify_test(vRes[i].m_ShareID == i + 1);
			verify_test(vRes[i].m_Plan.m_StartPosition == nPos);
			verify_test(vRes[i].m_Plan.m_TotalCost + vRes[i].m_Plan.m_Refund == amount);
			nPos += vRes[i].m_Plan.m_Units;
			tvl += vRes[i].m_Plan.m_TotalCost;
		}

		Ledger::Totals t = l.get_Totals();
		verify_test(t.m_UnitsIssued == nPos);
		verify_test(t.m_ValueLocked == tvl);
		verify_test(t.m_NextShareID == nThreads * nPerThread + 1);

		Amount sumHolders = 0;
		for (uint32_t iThread = 0; iThread < nThreads; iThread++)
		{
			std::string sOwner = "holder" + std::to_string(iThread);
			verify_test(l.get_HolderShares(sOwner).size() == nPerThread);
			sumHolders += l.get_HolderTotalDeposit(sOwner);
		}
		verify_test(sumHolders == tvl);
	}
}

void TestAll()
{
	xmbl::TestDirectIssue();
	xmbl::TestIssueRejected();
	xmbl::TestMetaIssue();
	xmbl::TestMetaRejected();
	xmbl::TestMetaAfterTransfer();
	xmbl::TestDistributeAndClaim();
	xmbl::TestWithdraw();
	xmbl::TestTransfer();
	xmbl::TestPauseDeposits();
	xmbl::TestOverflow();
	xmbl::TestExportImport();
	xmbl::TestConcurrentIssue();
}

int main()
{
	try
	{
		TestAll();
	}
	catch (const std::exception & ex)
	{
		printf("Expression: %s\n", ex.what());
		g_TestsFailed++;
	}

	return g_TestsFailed ? -1 : 0;
}
