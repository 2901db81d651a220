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

#include "distribution.h"
#include "ledger_error.h"

namespace xmbl
{
	namespace Distribution
	{
		Result Calculate(const Amount& totalYield, const std::vector<Stake>& vStakes)
		{
			if (!totalYield)
				LedgerException::Throw(LedgerError::InvalidYieldAmount, "zero yield");

			Amount totalDeposit = 0;
			for (const Stake& s : vStakes)
				Strict::Add(totalDeposit, s.m_TotalDeposit);

			if (!totalDeposit)
				LedgerException::Throw(LedgerError::NoActiveDeposits);

			Result res;

			for (const Stake& s : vStakes)
			{
				if (s.m_vShares.empty())
					continue;

				Amount holderPortion = Strict::Mul(totalYield, s.m_TotalDeposit) / totalDeposit;
				Amount perShare = holderPortion / s.m_vShares.size();
				if (!perShare)
					continue;

				for (ShareID id : s.m_vShares)
				{
					Strict::Add(res.m_Credits[id], perShare);
					Strict::Add(res.m_Credited, perShare);
				}
			}

			res.m_Residual = totalYield;
			Strict::Sub(res.m_Residual, res.m_Credited);

			return res;
		}

		Result Calculate(const Amount& totalYield, const std::vector<Share>& vShares)
		{
			std::map<OwnerID, Stake> mapStakes;

			for (const Share& x : vShares)
			{
				if (!x.m_DepositValue)
					continue;

				Stake& s = mapStakes[x.m_Owner];
				s.m_Owner = x.m_Owner;
				Strict::Add(s.m_TotalDeposit, x.m_DepositValue);
				s.m_vShares.push_back(x.m_ID);
			}

			std::vector<Stake> vStakes;
			vStakes.reserve(mapStakes.size());
			for (auto& v : mapStakes)
				vStakes.push_back(std::move(v.second));

			return Calculate(totalYield, vStakes);
		}
	}

} // namespace xmbl
