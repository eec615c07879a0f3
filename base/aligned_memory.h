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

#ifndef BASE_ALIGNED_MEMORY_H
#define BASE_ALIGNED_MEMORY_H

#include <boost/noncopyable.hpp>
#include <stddef.h>

//----------------------------------------------------------------

namespace base {
	// A buffer suitable for O_DIRECT io.
	class aligned_memory : boost::noncopyable {
	public:
		aligned_memory(size_t len, size_t alignment);
		~aligned_memory();

		void *data() const {
			return data_;
		}

		size_t size() const {
			return len_;
		}

		void zero();

	private:
		void *data_;
		size_t len_;
	};
}

//----------------------------------------------------------------

#endif
