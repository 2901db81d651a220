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

#include "amount.h"

namespace xmbl
{
	// Linear bonding curve with a flat fee. The price of a unit depends only on its issuance position
	struct Curve
	{
		static constexpr uint32_t s_BpsDenominator = 10000;

		struct Params
		{
			Amount m_UnitScale = Amount(10000000000ULL); // 1 satoshi = 1e10 wei-equivalent
			uint32_t m_FeeBps = 100; // 1%

			bool IsValid() const;
			void TestValid() const; // throws InvalidCurveParams
		};

		// Price of the next unit when nTotalIssued units were already issued
		static Amount get_Price(const Params&, uint64_t nTotalIssued);

		// Sum of prices of nCount consecutive units, starting at position nStart. Exact, including the per-unit fee truncation
		static Amount get_Cost(const Params&, uint64_t nStart, uint64_t nCount);

		// Largest number of consecutive units starting at nStart whose total cost doesn't exceed the amount.
		// Throws ArithmeticOverflow if the amount covers more units than the position counter can hold
		static uint64_t get_AffordableUnits(const Params&, uint64_t nStart, const Amount&);
	};

} // namespace xmbl
