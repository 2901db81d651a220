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

#include "share.h"

namespace xmbl
{
	const char* Share::get_KindName(Kind::Enum e)
	{
		switch (e)
		{
		case Kind::Ordinary: return "ordinary";
		case Kind::Meta: return "meta";
		case Kind::ClosedMeta: return "closed-meta";
		default:
			break;
		}
		return "unknown";
	}

} // namespace xmbl
