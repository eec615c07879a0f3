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

#include "persistent-data/space-maps/core.h"

#include "base/math_utils.h"
#include "persistent-data/errors.h"

#include <algorithm>
#include <map>
#include <sstream>
#include <vector>

using namespace base;
using namespace persistent_data;
using namespace std;

//----------------------------------------------------------------

namespace {
	block_address const ENTRIES_PER_WORD = 4 * sizeof(uint64_t);
	ref_t const OVERFLOW_COUNT = 3;

	class core_map : public space_map {
	public:
		explicit core_map(block_address nr_blocks);

		virtual block_address get_nr_blocks() const;
		virtual block_address get_nr_free() const;
		virtual ref_t get_count(block_address b) const;
		virtual void set_count(block_address b, ref_t c);
		virtual void inc(block_address b, ref_t count);
		virtual void dec(block_address b, ref_t count);
		virtual maybe_block find_free(block_address begin, block_address end);

	private:
		void check_block(block_address b) const;
		ref_t get_count_(block_address b) const;
		void set_count_(block_address b, ref_t c);
		ref_t lookup_bits(block_address b) const;
		void set_bits(block_address b, ref_t c);

		block_address nr_blocks_;
		block_address nr_free_;

		// every block below this is known to be allocated
		block_address search_start_;

		vector<uint64_t> bits_;
		map<block_address, ref_t> overflow_;
	};

	core_map::core_map(block_address nr_blocks)
		: nr_blocks_(nr_blocks),
		  nr_free_(nr_blocks),
		  search_start_(0),
		  bits_(div_up<block_address>(nr_blocks, ENTRIES_PER_WORD), 0) {
	}

	block_address
	core_map::get_nr_blocks() const {
		return nr_blocks_;
	}

	block_address
	core_map::get_nr_free() const {
		return nr_free_;
	}

	ref_t
	core_map::get_count(block_address b) const {
		check_block(b);
		return get_count_(b);
	}

	void
	core_map::set_count(block_address b, ref_t c) {
		check_block(b);
		set_count_(b, c);
	}

	void
	core_map::inc(block_address b, ref_t count) {
		check_block(b);
		set_count_(b, get_count_(b) + count);
	}

	void
	core_map::dec(block_address b, ref_t count) {
		check_block(b);

		ref_t old = get_count_(b);
		if (old < count) {
			ostringstream out;
			out << "reference count underflow (block " << b
			    << ", count " << old << ", dec " << count << ")";
			throw invariant_error(out.str());
		}

		set_count_(b, old - count);
	}

	core_map::maybe_block
	core_map::find_free(block_address begin, block_address end) {
		if (end > nr_blocks_)
			end = nr_blocks_;

		for (block_address b = std::max(begin, search_start_); b < end; b++)
			if (!lookup_bits(b))
				return maybe_block(b);

		return maybe_block();
	}

	void
	core_map::check_block(block_address b) const {
		if (b >= nr_blocks_) {
			ostringstream out;
			out << "space map block out of bounds ("
			    << b << " >= " << nr_blocks_ << ")";
			throw invariant_error(out.str());
		}
	}

	ref_t
	core_map::get_count_(block_address b) const {
		ref_t c = lookup_bits(b);
		if (c != OVERFLOW_COUNT)
			return c;

		map<block_address, ref_t>::const_iterator it = overflow_.find(b);
		if (it == overflow_.end())
			throw invariant_error("core space map overflow entry missing");

		return it->second;
	}

	void
	core_map::set_count_(block_address b, ref_t c) {
		ref_t old = get_count_(b);

		if (c >= OVERFLOW_COUNT) {
			set_bits(b, OVERFLOW_COUNT);
			overflow_[b] = c;
		} else {
			if (old >= OVERFLOW_COUNT)
				overflow_.erase(b);
			set_bits(b, c);
		}

		if (old == 0 && c > 0) {
			nr_free_--;
			if (b == search_start_)
				while (search_start_ < nr_blocks_ && lookup_bits(search_start_))
					search_start_++;

		} else if (old > 0 && c == 0) {
			nr_free_++;
			if (b < search_start_)
				search_start_ = b;
		}
	}

	ref_t
	core_map::lookup_bits(block_address b) const {
		block_address word = b / ENTRIES_PER_WORD;
		block_address shift = (b % ENTRIES_PER_WORD) * 2;

		return (bits_[word] >> shift) & 3;
	}

	void
	core_map::set_bits(block_address b, ref_t c) {
		block_address word = b / ENTRIES_PER_WORD;
		block_address shift = (b % ENTRIES_PER_WORD) * 2;

		uint64_t w = bits_[word] & ~(3ull << shift);
		bits_[word] = w | (static_cast<uint64_t>(c) << shift);
	}
}

//----------------------------------------------------------------

space_map::ptr
persistent_data::create_core_map(block_address nr_blocks)
{
	return space_map::ptr(new core_map(nr_blocks));
}

//----------------------------------------------------------------
