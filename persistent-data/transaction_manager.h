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

#ifndef TRANSACTION_MANAGER_H
#define TRANSACTION_MANAGER_H

#include "persistent-data/block.h"
#include "persistent-data/space_map.h"

#include <boost/noncopyable.hpp>
#include <boost/shared_ptr.hpp>

//----------------------------------------------------------------

namespace persistent_data {
	// Pairs a block manager with the space map that owns its
	// blocks.  Nothing is ever shadowed: new nodes are always
	// written to freshly allocated blocks.
	class transaction_manager : boost::noncopyable {
	public:
		typedef boost::shared_ptr<transaction_manager> ptr;
		typedef block_manager::read_ref read_ref;
		typedef block_manager::write_ref write_ref;
		typedef bcache::validator::ptr validator;

		transaction_manager(block_manager::ptr bm,
				    space_map::ptr sm);

		// Allocates the lowest free block and returns it zeroed.
		// Throws out_of_space_error if the space map is full.
		write_ref new_block(validator v);

		read_ref read_lock(block_address b, validator v);

		space_map::ptr get_sm() {
			return sm_;
		}

		block_manager::ptr get_bm() {
			return bm_;
		}

		void prefetch(block_address b) {
			bm_->prefetch(b);
		}

	private:
		block_manager::ptr bm_;
		space_map::ptr sm_;
	};
}

//----------------------------------------------------------------

#endif
