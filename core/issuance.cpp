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

#include "issuance.h"
#include "ledger_error.h"

namespace xmbl
{
	namespace Issuance
	{
		Plan Calculate(const Curve::Params& pars, const Amount& amount, uint64_t nTotalIssued)
		{
			Plan plan;
			plan.m_StartPosition = nTotalIssued;
			plan.m_Units = Curve::get_AffordableUnits(pars, nTotalIssued, amount);

			if (!plan.m_Units)
				LedgerException::Throw(LedgerError::InsufficientDeposit,
					"amount=" + AmountToString(amount) + " price=" + AmountToString(Curve::get_Price(pars, nTotalIssued)));

			// never exceeds the amount
			plan.m_TotalCost = Curve::get_Cost(pars, nTotalIssued, plan.m_Units);

			plan.m_Refund = amount;
			Strict::Sub(plan.m_Refund, plan.m_TotalCost);

			return plan;
		}
	}

} // namespace xmbl
