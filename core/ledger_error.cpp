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

#include "ledger_error.h"
#include "utility/logger.h"

namespace xmbl
{
	const char* LedgerError::get_Name(Enum e)
	{
		switch (e)
		{
#define THE_MACRO(name) case name: return #name;
		THE_MACRO(InsufficientDeposit)
		THE_MACRO(NotMetaOwner)
		THE_MACRO(NotAMetaShare)
		THE_MACRO(InvalidMintCount)
		THE_MACRO(InvalidYieldAmount)
		THE_MACRO(NoActiveDeposits)
		THE_MACRO(NotShareOwner)
		THE_MACRO(NothingToClaim)
		THE_MACRO(NoYieldToClaim)
		THE_MACRO(ArithmeticOverflow)
		THE_MACRO(InvalidDepositAmount)
		THE_MACRO(InvalidOwner)
		THE_MACRO(ShareNotFound)
		THE_MACRO(DepositsPaused)
		THE_MACRO(DistributionsPaused)
		THE_MACRO(BelowDistributionThreshold)
		THE_MACRO(InvalidCurveParams)
#undef THE_MACRO

		default:
			break;
		}

		return "Unknown";
	}

	static std::string FormatLedgerError(LedgerError::Enum e, const std::string& sDetails)
	{
		std::string s = LedgerError::get_Name(e);
		if (!sDetails.empty())
		{
			s += ": ";
			s += sDetails;
		}
		return s;
	}

	LedgerException::LedgerException(LedgerError::Enum e, const std::string& sDetails)
		:std::runtime_error(FormatLedgerError(e, sDetails))
		,m_Code(e)
	{
	}

	void LedgerException::Throw(LedgerError::Enum e, const std::string& sDetails)
	{
		LedgerException exc(e, sDetails);
		LOG_WARNING() << "Ledger op rejected, " << exc.what();
		throw exc;
	}

} // namespace xmbl
