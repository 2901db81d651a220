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
	namespace Event
	{
		struct Type
		{
			// values are persisted, don't renumber
			enum Enum
			{
				ShareIssued = 1,
				UnitsMintedFromMeta,
				YieldDistributed,
				YieldClaimed,
				ShareWithdrawn,
				ShareTransferred,
			};

			static const char* get_Name(Enum);
			static bool FromName(Enum&, const std::string&);
			static bool IsValid(uint32_t);
		};

		struct ShareIssued
		{
			ShareID m_ShareID = 0;
			OwnerID m_Owner;
			Amount m_DepositValue = 0;
			bool m_IsMeta = false;
			uint64_t m_MetaUnitsReserved = 0; // 0 if not meta
			Amount m_Refund = 0;
		};

		struct UnitsMintedFromMeta
		{
			ShareID m_MetaShareID = 0;
			std::vector<ShareID> m_vNewShareIDs;
			OwnerID m_Owner;
			Amount m_MintedValue = 0; // sum of the new shares' deposit values
			bool m_MetaClosed = false;
		};

		struct YieldDistributed
		{
			Amount m_TotalAmount = 0;
			std::map<ShareID, Amount> m_Credits;
			Amount m_Residual = 0;
		};

		struct YieldClaimed
		{
			ShareID m_ShareID = 0;
			OwnerID m_Owner;
			Amount m_Amount = 0;
		};

		struct ShareWithdrawn
		{
			ShareID m_ShareID = 0;
			OwnerID m_Owner;
			Amount m_DepositValue = 0;
		};

		struct ShareTransferred
		{
			ShareID m_ShareID = 0;
			OwnerID m_From;
			OwnerID m_To;
		};

		typedef std::variant<
			ShareIssued,
			UnitsMintedFromMeta,
			YieldDistributed,
			YieldClaimed,
			ShareWithdrawn,
			ShareTransferred
		> Any;

		Type::Enum get_Type(const Any&);

		// Flattened form used by the audit log. ShareID is 0 and owner is empty for ledger-wide events
		ShareID get_ShareID(const Any&);
		OwnerID get_Owner(const Any&);
		Amount get_Amount(const Any&);
		std::string get_Body(const Any&);

		// ids of the shares whose stored state the event changes (created, modified or removed)
		void get_TouchedShares(const Any&, std::vector<ShareID>&);
	}

} // namespace xmbl
