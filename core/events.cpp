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

#include "events.h"
#include <sstream>

namespace xmbl
{
	namespace Event
	{
		const char* Type::get_Name(Enum e)
		{
			switch (e)
			{
#define THE_MACRO(name) case name: return #name;
			THE_MACRO(ShareIssued)
			THE_MACRO(UnitsMintedFromMeta)
			THE_MACRO(YieldDistributed)
			THE_MACRO(YieldClaimed)
			THE_MACRO(ShareWithdrawn)
			THE_MACRO(ShareTransferred)
#undef THE_MACRO

			default:
				break;
			}
			return "Unknown";
		}

		bool Type::IsValid(uint32_t n)
		{
			return (n >= ShareIssued) && (n <= ShareTransferred);
		}

		bool Type::FromName(Enum& e, const std::string& s)
		{
			for (uint32_t n = ShareIssued; n <= ShareTransferred; n++)
			{
				if (s == get_Name(static_cast<Enum>(n)))
				{
					e = static_cast<Enum>(n);
					return true;
				}
			}
			return false;
		}

		Type::Enum get_Type(const Any& evt)
		{
			// variant alternatives follow the Type order
			return static_cast<Type::Enum>(evt.index() + Type::ShareIssued);
		}

		namespace
		{
			struct Flattener
			{
				ShareID m_ShareID = 0;
				OwnerID m_Owner;
				Amount m_Amount = 0;
				std::ostringstream m_os;

				void operator()(const ShareIssued& x)
				{
					m_ShareID = x.m_ShareID;
					m_Owner = x.m_Owner;
					m_Amount = x.m_DepositValue;
					m_os << "meta=" << (x.m_IsMeta ? 1 : 0);
					if (x.m_IsMeta)
						m_os << " reserved=" << x.m_MetaUnitsReserved;
					m_os << " refund=" << x.m_Refund;
				}

				void operator()(const UnitsMintedFromMeta& x)
				{
					m_ShareID = x.m_MetaShareID;
					m_Owner = x.m_Owner;
					m_Amount = x.m_MintedValue;
					m_os << "new=";
					for (size_t i = 0; i < x.m_vNewShareIDs.size(); i++)
					{
						if (i)
							m_os << ',';
						m_os << x.m_vNewShareIDs[i];
					}
					m_os << " closed=" << (x.m_MetaClosed ? 1 : 0);
				}

				void operator()(const YieldDistributed& x)
				{
					m_Amount = x.m_TotalAmount;
					m_os << "credits=";
					bool bFirst = true;
					for (const auto& v : x.m_Credits)
					{
						if (!bFirst)
							m_os << ';';
						bFirst = false;
						m_os << v.first << ':' << v.second;
					}
					m_os << " residual=" << x.m_Residual;
				}

				void operator()(const YieldClaimed& x)
				{
					m_ShareID = x.m_ShareID;
					m_Owner = x.m_Owner;
					m_Amount = x.m_Amount;
				}

				void operator()(const ShareWithdrawn& x)
				{
					m_ShareID = x.m_ShareID;
					m_Owner = x.m_Owner;
					m_Amount = x.m_DepositValue;
				}

				void operator()(const ShareTransferred& x)
				{
					m_ShareID = x.m_ShareID;
					m_Owner = x.m_To;
					m_os << "from=" << x.m_From << " to=" << x.m_To;
				}
			};

			struct TouchedCollector
			{
				std::vector<ShareID>& m_vRes;

				void operator()(const ShareIssued& x) { m_vRes.push_back(x.m_ShareID); }
				void operator()(const YieldClaimed& x) { m_vRes.push_back(x.m_ShareID); }
				void operator()(const ShareWithdrawn& x) { m_vRes.push_back(x.m_ShareID); }
				void operator()(const ShareTransferred& x) { m_vRes.push_back(x.m_ShareID); }

				void operator()(const UnitsMintedFromMeta& x)
				{
					m_vRes.push_back(x.m_MetaShareID);
					m_vRes.insert(m_vRes.end(), x.m_vNewShareIDs.begin(), x.m_vNewShareIDs.end());
				}

				void operator()(const YieldDistributed& x)
				{
					for (const auto& v : x.m_Credits)
						m_vRes.push_back(v.first);
				}
			};
		}

		ShareID get_ShareID(const Any& evt)
		{
			Flattener f;
			std::visit(f, evt);
			return f.m_ShareID;
		}

		OwnerID get_Owner(const Any& evt)
		{
			Flattener f;
			std::visit(f, evt);
			return f.m_Owner;
		}

		Amount get_Amount(const Any& evt)
		{
			Flattener f;
			std::visit(f, evt);
			return f.m_Amount;
		}

		std::string get_Body(const Any& evt)
		{
			Flattener f;
			std::visit(f, evt);
			return f.m_os.str();
		}

		void get_TouchedShares(const Any& evt, std::vector<ShareID>& vRes)
		{
			TouchedCollector c{ vRes };
			std::visit(c, evt);
		}
	}

} // namespace xmbl
