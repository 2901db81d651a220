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

#include <boost/multiprecision/cpp_int.hpp>
#include <string>
#include <stdint.h>

namespace xmbl
{
	// Reference-unit amounts (wei-equivalent). Checked: overflow and negative results throw instead of wrapping
	typedef boost::multiprecision::checked_uint256_t Amount;

	typedef uint64_t ShareID;
	typedef std::string OwnerID;

	// All of the following report overflow as LedgerError::ArithmeticOverflow
	namespace Strict
	{
		void Add(Amount& a, const Amount& b);
		void Sub(Amount& a, const Amount& b); // also fails if a < b
		Amount Mul(const Amount& a, const Amount& b);

		void Add(uint64_t& a, uint64_t b);
	}

	// decimal only, no sign, no exponent. Returns false if malformed or doesn't fit
	bool AmountFromString(Amount& out, const std::string& s);
	std::string AmountToString(const Amount&);

} // namespace xmbl
