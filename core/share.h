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
#include <variant>

namespace xmbl
{
	struct Share
	{
		// single issued unit
		struct Ordinary {};

		// reserved block of curve positions, individual units not minted yet
		struct Meta
		{
			uint64_t m_Remaining = 0;
			uint64_t m_NextPosition = 0;
			uint64_t m_Reserved = 0; // units reserved at creation
		};

		// meta-share whose units are all minted. Kept for its historical deposit value
		struct ClosedMeta
		{
			uint64_t m_Reserved = 0;
		};

		typedef std::variant<Ordinary, Meta, ClosedMeta> State;

		struct Kind {
			enum Enum {
				Ordinary,
				Meta,
				ClosedMeta,

				count
			};
		};

		ShareID m_ID = 0;
		OwnerID m_Owner;
		Amount m_DepositValue = 0; // set once at creation
		Amount m_AccruedYield = 0;
		State m_State;

		Kind::Enum get_Kind() const { return static_cast<Kind::Enum>(m_State.index()); }
		static const char* get_KindName(Kind::Enum);

		bool IsMeta() const { return std::holds_alternative<Meta>(m_State); }
		const Meta* get_Meta() const { return std::get_if<Meta>(&m_State); }
		Meta* get_Meta() { return std::get_if<Meta>(&m_State); }
	};

} // namespace xmbl
