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

#ifndef THIN_MERGE_METADATA_H
#define THIN_MERGE_METADATA_H

#include "persistent-data/block.h"
#include "persistent-data/space_map.h"
#include "persistent-data/transaction_manager.h"
#include "thin-merge/superblock.h"

#include <boost/shared_ptr.hpp>

//----------------------------------------------------------------

namespace thin_merge {
	// Low level access to one metadata device, either an existing
	// one to be read, or a fresh one being assembled.
	struct metadata {
		typedef boost::shared_ptr<metadata> ptr;

		// Opens existing metadata for reading.  With
		// use_metadata_snap the superblock at the live
		// superblock's metadata_snap location is used instead,
		// carrying the live data space map root.  No space maps
		// are loaded, so nothing may be allocated.
		metadata(persistent_data::block_manager::ptr bm, bool use_metadata_snap);

		// Fresh metadata covering the device (up to the limit
		// of the metadata space map), with only the superblock
		// allocated.  The data space map is created once the
		// data device size is known.
		explicit metadata(persistent_data::block_manager::ptr bm);

		// Checks the structures the superblock refers to, so a
		// damaged input is rejected before any output is
		// written.
		void check() const;

		// Writes both space maps, then the superblock.
		void commit();

		persistent_data::block_address get_nr_data_blocks() const;

		persistent_data::block_manager::ptr bm_;
		persistent_data::transaction_manager::ptr tm_;
		superblock_detail::superblock sb_;

		persistent_data::space_map::ptr metadata_sm_;
		persistent_data::space_map::ptr data_sm_;

	private:
		bool from_metadata_snap_;

		void check_root(char const *what, persistent_data::block_address b) const;
	};
}

//----------------------------------------------------------------

#endif
