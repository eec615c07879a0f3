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

#ifndef SPACE_MAP_DISK_H
#define SPACE_MAP_DISK_H

#include "persistent-data/space_map.h"
#include "persistent-data/transaction_manager.h"
#include "persistent-data/space-maps/disk_structures.h"

//----------------------------------------------------------------

namespace persistent_data {
	size_t const SPACE_MAP_ROOT_SIZE = 128;

	sm_disk_detail::sm_root read_sm_root(void const *raw);
	void write_sm_root(sm_disk_detail::sm_root const &root, void *raw);

	// The data space map keeps its bitmap index in a btree, the
	// metadata space map in a single index block.  Both keep
	// counts above two in a btree of uint32 counts.

	// Checks the index structures and every bitmap they point at,
	// without decoding the counts.
	void check_disk_sm(transaction_manager &tm, sm_disk_detail::sm_root const &root);
	void check_metadata_sm(transaction_manager &tm, sm_disk_detail::sm_root const &root);

	// Decodes an on disk space map into a core map.
	space_map::ptr load_disk_sm(transaction_manager &tm, sm_disk_detail::sm_root const &root);
	space_map::ptr load_metadata_sm(transaction_manager &tm, sm_disk_detail::sm_root const &root);

	// Writes the counts held in sm as a fresh on disk space map,
	// allocating from tm's (metadata) space map.  The data space
	// map must be written before the metadata one, since writing
	// it allocates metadata blocks.
	sm_disk_detail::sm_root write_disk_sm(transaction_manager &tm, space_map const &sm);

	// tm's own space map is written.  Blocks allocated to hold it
	// are accounted for in what is written.
	sm_disk_detail::sm_root write_metadata_sm(transaction_manager &tm);
}

//----------------------------------------------------------------

#endif
