// Copyright (C) 2011 Red Hat, Inc. All rights reserved.
//
// This file is part of the thin-provisioning-tools source.
//
// thin-provisioning-tools is free software: you can redistribute it
// and/or modify it under the terms of the GNU General Public License
// as published by the Free Software Foundation, either version 3 of
// the License, or (at your option) any later version.
//
// thin-provisioning-tools is distributed in the hope that it will be
// useful, but WITHOUT ANY WARRANTY; without even the implied warranty
// of MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
// GNU General Public License for more details.
//
// You should have received a copy of the GNU General Public License along
// with thin-provisioning-tools.  If not, see
// <http://www.gnu.org/licenses/>.

#include "base/endian_utils.h"

using namespace base;

//----------------------------------------------------------------

namespace {
	le64 *word_for(void *bits, uint64_t b) {
		return reinterpret_cast<le64 *>(bits) + (b >> 6);
	}

	uint64_t mask_for(uint64_t b) {
		return 1ull << (b & 63);
	}
}

bool
base::test_bit_le(void const *bits, uint64_t b)
{
	le64 const *w = word_for(const_cast<void *>(bits), b);
	return (to_cpu<uint64_t>(*w) & mask_for(b)) != 0;
}

void
base::set_bit_le(void *bits, uint64_t b)
{
	le64 *w = word_for(bits, b);
	*w = to_disk<le64>(to_cpu<uint64_t>(*w) | mask_for(b));
}

void
base::clear_bit_le(void *bits, uint64_t b)
{
	le64 *w = word_for(bits, b);
	*w = to_disk<le64>(to_cpu<uint64_t>(*w) & ~mask_for(b));
}

//----------------------------------------------------------------
