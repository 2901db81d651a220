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

#include "common.h"
#include "logger.h"

#ifndef WIN32
#	include <unistd.h>
#endif // WIN32

namespace xmbl
{
#ifdef WIN32

	bool DeleteFile(const char* sz)
	{
		return !_unlink(sz);
	}

#else // WIN32

	bool DeleteFile(const char* sz)
	{
		return !unlink(sz);
	}

#endif // WIN32

	void CorruptionException::Throw(const char* sz)
	{
		std::string s = "Corruption: ";
		s += sz;

		LOG_CRITICAL() << s;

		CorruptionException exc;
		exc.m_sErr = std::move(s);
		throw exc;
	}
}
