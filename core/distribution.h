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

#include "share.h"
#include <map>
#include <vector>

namespace xmbl
{
	namespace Distribution
	{
		// One holder's weight. Only shares with non-zero deposit value are listed
		struct Stake
		{
			OwnerID m_Owner;
			Amount m_TotalDeposit = 0;
			std::vector<ShareID> m_vShares;
		};

		struct Result
		{
			std::map<ShareID, Amount> m_Credits; // non-zero credits only
			Amount m_Credited = 0;
			Amount m_Residual = 0; // truncation loss, not redistributed
		};

		// Holder gets totalYield * holderDeposit / totalDeposit, then it's split evenly across the holder's shares.
		// Both divisions truncate.
		Result Calculate(const Amount& totalYield, const std::vector<Stake>&);

		// Groups the shares by owner first
		Result Calculate(const Amount& totalYield, const std::vector<Share>&);
	}

} // namespace xmbl
