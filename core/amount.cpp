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

#include "amount.h"
#include "ledger_error.h"
#include "utility/string_helpers.h"
#include <stdexcept>

namespace xmbl
{
	namespace Strict
	{
		void Add(Amount& a, const Amount& b)
		{
			try {
				a += b;
			}
			catch (const std::overflow_error&) {
				LedgerException::Throw(LedgerError::ArithmeticOverflow, "addition exceeds 256 bits");
			}
		}

		void Sub(Amount& a, const Amount& b)
		{
			if (a < b)
				LedgerException::Throw(LedgerError::ArithmeticOverflow, "subtraction underflow");
			a -= b;
		}

		Amount Mul(const Amount& a, const Amount& b)
		{
			try {
				return a * b;
			}
			catch (const std::overflow_error&) {
				LedgerException::Throw(LedgerError::ArithmeticOverflow, "multiplication exceeds 256 bits");
			}
			return Amount(0); // unreachable
		}

		void Add(uint64_t& a, uint64_t b)
		{
			uint64_t x = a + b;
			if (x < b)
				LedgerException::Throw(LedgerError::ArithmeticOverflow, "counter overflow");
			a = x;
		}
	}

	bool AmountFromString(Amount& out, const std::string& s)
	{
		// 2^256 has 78 decimal digits
		if (!string_helpers::is_decimal(s) || (s.size() > 78))
			return false;

		try {
			Amount x(s);
			out = x;
		}
		catch (const std::overflow_error&) {
			return false;
		}
		catch (const std::runtime_error&) {
			return false;
		}

		return true;
	}

	std::string AmountToString(const Amount& x)
	{
		return x.str();
	}

} // namespace xmbl
