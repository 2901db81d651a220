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

#include "curve.h"

namespace xmbl
{
	namespace Issuance
	{
		struct Plan
		{
			uint64_t m_StartPosition = 0;
			uint64_t m_Units = 0;
			Amount m_TotalCost = 0;
			Amount m_Refund = 0; // never retained by the ledger

			bool IsMeta() const { return m_Units > 1; }
		};

		// Buys the most whole units along the curve, starting at nTotalIssued, without exceeding the amount.
		// Throws InsufficientDeposit if not even the first unit is affordable. Doesn't touch any state
		Plan Calculate(const Curve::Params&, const Amount& amount, uint64_t nTotalIssued);
	}

} // namespace xmbl
