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

#include <assert.h>
#include <cstdint>
#include <string>
#include <vector>
#include <stdint.h>
#include <string.h>

#ifndef XMBL_VERIFY
#	ifdef  NDEBUG
#		define XMBL_VERIFY(x) ((void)(x))
#	else //  NDEBUG
#		define XMBL_VERIFY(x) assert(x)
#	endif //  NDEBUG
#endif // verify

#ifndef _countof
#	define _countof(_Array) (sizeof(_Array) / sizeof(_Array[0]))
#endif // _countof

namespace xmbl
{
	typedef uint64_t Timestamp;

	bool DeleteFile(const char*);

	struct CorruptionException
	{
		std::string m_sErr;
		// indicates critical unrecoverable corruption of the persisted ledger. Not derived from std::exception, and should not be caught in the intermediate scopes.
		// Should trigger a controlled shutdown of the app
		static void Throw(const char*);
	};
}
