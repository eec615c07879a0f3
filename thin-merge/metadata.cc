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

#include "thin-merge/metadata.h"

#include "persistent-data/errors.h"
#include "persistent-data/space-maps/core.h"
#include "persistent-data/space-maps/disk.h"
#include "thin-merge/device_tree.h"
#include "thin-merge/mapping_tree.h"

#include <algorithm>
#include <sstream>
#include <stdexcept>
#include <string.h>

using namespace base;
using namespace persistent_data;
using namespace thin_merge;
using namespace superblock_detail;
using namespace std;

//----------------------------------------------------------------

metadata::metadata(block_manager::ptr bm, bool use_metadata_snap)
	: bm_(bm),
	  tm_(new transaction_manager(bm, space_map::ptr())),
	  sb_(read_superblock(*bm)),
	  from_metadata_snap_(use_metadata_snap)
{
	if (use_metadata_snap) {
		if (!sb_.metadata_snap_)
			throw runtime_error("no current metadata snap");

		superblock snap = read_superblock(*bm, sb_.metadata_snap_);

		// A metadata snapshot doesn't track the data space map,
		// so take the live one.
		::memcpy(snap.data_space_map_root_, sb_.data_space_map_root_,
			 sizeof(snap.data_space_map_root_));
		sb_ = snap;
	}
}

metadata::metadata(block_manager::ptr bm)
	: bm_(bm),
	  from_metadata_snap_(false)
{
	block_address nr_blocks = std::min<block_address>(bm->get_nr_blocks(),
							  sm_disk_detail::MAX_METADATA_BLOCKS);
	metadata_sm_ = create_core_map(nr_blocks);
	metadata_sm_->inc(SUPERBLOCK_LOCATION);
	tm_.reset(new transaction_manager(bm, metadata_sm_));
}

void
metadata::check_root(char const *what, block_address b) const
{
	if (b >= bm_->get_nr_blocks()) {
		ostringstream out;
		out << what << " root " << b << " beyond the end of the metadata device ("
		    << bm_->get_nr_blocks() << " blocks)";
		throw corrupt_metadata_error(out.str(), b);
	}
}

void
metadata::check() const
{
	if (sb_.metadata_nr_blocks_ > bm_->get_nr_blocks()) {
		ostringstream out;
		out << "superblock claims " << sb_.metadata_nr_blocks_
		    << " metadata blocks, but the device holds only " << bm_->get_nr_blocks();
		throw corrupt_metadata_error(out.str());
	}

	check_root("mapping tree", sb_.data_mapping_root_);
	check_root("device details tree", sb_.device_details_root_);

	sm_disk_detail::sm_root data_root = read_sm_root(sb_.data_space_map_root_);
	check_root("data space map index", data_root.bitmap_root_);
	check_root("data space map ref count", data_root.ref_count_root_);
	check_disk_sm(*tm_, data_root);

	// The metadata space map of a metadata snapshot is frozen
	// at the time the snapshot was taken, its blocks may have
	// been reused since.
	if (!from_metadata_snap_) {
		sm_disk_detail::sm_root metadata_root = read_sm_root(sb_.metadata_space_map_root_);
		check_root("metadata space map index", metadata_root.bitmap_root_);
		check_root("metadata space map ref count", metadata_root.ref_count_root_);
		check_metadata_sm(*tm_, metadata_root);
	}

	device_tree_detail::device_map details = read_device_details(*tm_, sb_.device_details_root_);
	mapping_tree_detail::device_roots roots = read_device_roots(*tm_, sb_.data_mapping_root_);

	mapping_tree_detail::device_roots::const_iterator it;
	for (it = roots.begin(); it != roots.end(); ++it) {
		if (!details.count(it->first)) {
			ostringstream out;
			out << "device " << it->first << " has a mapping tree but no details";
			throw corrupt_metadata_error(out.str());
		}

		check_root("device mapping tree", it->second);
	}
}

void
metadata::commit()
{
	if (!data_sm_)
		throw invariant_error("no data space map to commit");

	sm_disk_detail::sm_root data_root = write_disk_sm(*tm_, *data_sm_);
	write_sm_root(data_root, sb_.data_space_map_root_);

	sm_disk_detail::sm_root metadata_root = write_metadata_sm(*tm_);
	write_sm_root(metadata_root, sb_.metadata_space_map_root_);

	sb_.blocknr_ = SUPERBLOCK_LOCATION;
	sb_.metadata_block_size_ = METADATA_BLOCK_SIZE;
	sb_.metadata_nr_blocks_ = metadata_sm_->get_nr_blocks();

	bm_->flush();
	write_superblock(*bm_, sb_);
}

block_address
metadata::get_nr_data_blocks() const
{
	return read_sm_root(sb_.data_space_map_root_).nr_blocks_;
}

//----------------------------------------------------------------
