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

#ifndef SPACE_MAP_H
#define SPACE_MAP_H

#include "persistent-data/block.h"

#include <boost/optional.hpp>
#include <boost/shared_ptr.hpp>

//----------------------------------------------------------------

namespace persistent_data {
	typedef uint32_t ref_t;

	// Reference counts for a range of blocks.  A block with a zero
	// count is free.
	class space_map {
	public:
		typedef boost::shared_ptr<space_map> ptr;
		typedef boost::optional<block_address> maybe_block;

		virtual ~space_map() {};

		virtual block_address get_nr_blocks() const = 0;
		virtual block_address get_nr_free() const = 0;
		virtual ref_t get_count(block_address b) const = 0;
		virtual void set_count(block_address b, ref_t c) = 0;

		virtual void inc(block_address b, ref_t count = 1) = 0;

		// Throws invariant_error rather than let a count go
		// below zero.
		virtual void dec(block_address b, ref_t count = 1) = 0;

		// The lowest numbered free block in [begin, end).
		virtual maybe_block find_free(block_address begin, block_address end) = 0;

		// deliberately not virtual
		maybe_block new_block() {
			maybe_block mb = find_free(0, get_nr_blocks());
			if (mb)
				inc(*mb);

			return mb;
		}
	};
}

//----------------------------------------------------------------

#endif
