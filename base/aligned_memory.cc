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

#include "base/aligned_memory.h"

#include <new>
#include <stdlib.h>
#include <string.h>

using namespace base;

//----------------------------------------------------------------

aligned_memory::aligned_memory(size_t len, size_t alignment)
	: data_(NULL),
	  len_(len)
{
	if (posix_memalign(&data_, alignment, len))
		throw std::bad_alloc();
}

aligned_memory::~aligned_memory()
{
	free(data_);
}

void
aligned_memory::zero()
{
	memset(data_, 0, len_);
}

//----------------------------------------------------------------
