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

#include <stdexcept>
#include <string>

namespace xmbl
{
	struct LedgerError
	{
		enum Enum
		{
			InsufficientDeposit,
			NotMetaOwner,
			NotAMetaShare,
			InvalidMintCount,
			InvalidYieldAmount,
			NoActiveDeposits,
			NotShareOwner,
			NothingToClaim,
			NoYieldToClaim,
			ArithmeticOverflow,
			InvalidDepositAmount,
			InvalidOwner,
			ShareNotFound,
			DepositsPaused,
			DistributionsPaused,
			BelowDistributionThreshold,
			InvalidCurveParams,

			count
		};

		static const char* get_Name(Enum);
	};

	// Per-call precondition or invariant failure. The ledger stays usable and unmodified
	class LedgerException
		:public std::runtime_error
	{
		LedgerError::Enum m_Code;

	public:
		LedgerException(LedgerError::Enum, const std::string& sDetails);

		LedgerError::Enum get_Code() const { return m_Code; }

		[[noreturn]] static void Throw(LedgerError::Enum, const std::string& sDetails = std::string());
	};

} // namespace xmbl
