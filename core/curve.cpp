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

#include "curve.h"
#include "ledger_error.h"
#include <limits>
#include <utility>

namespace xmbl
{
	namespace
	{
		// Unbounded, for sums that may exceed 256 bits before they are compared
		typedef boost::multiprecision::cpp_int Wide;

		// sum of floor((a*i + b) / m) for i in [0, n)
		Wide FloorSum(Wide n, Wide m, Wide a, Wide b)
		{
			Wide res = 0;
			while (true)
			{
				if (a >= m)
				{
					res += n * (n - 1) / 2 * (a / m);
					a %= m;
				}

				if (b >= m)
				{
					res += n * (b / m);
					b %= m;
				}

				Wide yMax = a * n + b;
				if (yMax < m)
					break;

				n = yMax / m;
				b = yMax % m;
				std::swap(m, a);
			}

			return res;
		}

		Wide get_CostWide(const Curve::Params& pars, const Wide& nStart, const Wide& nCount)
		{
			// units at 1-based positions nStart+1 .. nStart+nCount
			Wide scale(pars.m_UnitScale);
			Wide res = scale * (nCount * nStart + nCount * (nCount + 1) / 2);

			// fee of each unit is truncated on its own
			Wide feeStep = scale * pars.m_FeeBps;
			res += FloorSum(nCount, Curve::s_BpsDenominator, feeStep, feeStep * (nStart + 1));

			return res;
		}

		const Wide& get_AmountMax()
		{
			static const Wide s_Max(std::numeric_limits<Amount>::max());
			return s_Max;
		}
	}

	bool Curve::Params::IsValid() const
	{
		return (m_UnitScale > 0) && (m_FeeBps < s_BpsDenominator);
	}

	void Curve::Params::TestValid() const
	{
		if (!IsValid())
			LedgerException::Throw(LedgerError::InvalidCurveParams, "scale=" + AmountToString(m_UnitScale) + " fee_bps=" + std::to_string(m_FeeBps));
	}

	Amount Curve::get_Price(const Params& pars, uint64_t nTotalIssued)
	{
		// 1-based position of the next unit. Computed in 256 bits, can't overflow
		Amount n = Amount(nTotalIssued) + 1;

		Amount base = Strict::Mul(n, pars.m_UnitScale);
		Amount fee = Strict::Mul(base, Amount(pars.m_FeeBps)) / s_BpsDenominator;

		Strict::Add(base, fee);
		return base;
	}

	Amount Curve::get_Cost(const Params& pars, uint64_t nStart, uint64_t nCount)
	{
		uint64_t nEnd = nStart;
		Strict::Add(nEnd, nCount);

		Wide res = get_CostWide(pars, nStart, nCount);
		if (res > get_AmountMax())
			LedgerException::Throw(LedgerError::ArithmeticOverflow, "cost of " + std::to_string(nCount) + " units at " + std::to_string(nStart));

		return Amount(res);
	}

	uint64_t Curve::get_AffordableUnits(const Params& pars, uint64_t nStart, const Amount& amount)
	{
		pars.TestValid();

		const Wide wAmount(amount);
		const uint64_t nPositionsLeft = std::numeric_limits<uint64_t>::max() - nStart;

		// each unit costs at least the scale
		Amount nUpper = amount / pars.m_UnitScale;

		uint64_t nHi;
		if (nUpper > nPositionsLeft)
		{
			if (get_CostWide(pars, nStart, Wide(nPositionsLeft) + 1) <= wAmount)
				LedgerException::Throw(LedgerError::ArithmeticOverflow, "position counter, amount=" + AmountToString(amount));
			nHi = nPositionsLeft;
		}
		else
			nHi = nUpper.convert_to<uint64_t>();

		// cost is strictly increasing in the count
		uint64_t nLo = 0;
		while (nLo < nHi)
		{
			uint64_t nMid = nHi - (nHi - nLo) / 2;
			if (get_CostWide(pars, nStart, nMid) <= wAmount)
				nLo = nMid;
			else
				nHi = nMid - 1;
		}

		return nLo;
	}

} // namespace xmbl
