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

#ifndef THIN_MERGE_DEVICE_TREE_H
#define THIN_MERGE_DEVICE_TREE_H

#include "persistent-data/data-structures/btree.h"

#include <map>

//----------------------------------------------------------------

namespace thin_merge {
	namespace device_tree_detail {
		using namespace base;
		using namespace persistent_data;

		struct device_details_disk {
			le64 mapped_blocks_;
			le64 transaction_id_;  /* when created */
			le32 creation_time_;
			le32 snapshotted_time_;
		} __attribute__ ((packed));

		struct device_details {
			device_details();

			uint64_t mapped_blocks_;
			uint64_t transaction_id_;  /* when created */
			uint32_t creation_time_;
			uint32_t snapshotted_time_;
		};

		struct device_details_traits {
			typedef device_details_disk disk_type;
			typedef device_details value_type;
			typedef no_op_ref_counter<device_details> ref_counter;

			static void unpack(device_details_disk const &disk, device_details &value);
			static void pack(device_details const &value, device_details_disk &disk);
		};

		typedef std::map<uint64_t, device_details> device_map;
	}

	typedef persistent_data::btree<1, device_tree_detail::device_details_traits> device_tree;

	// Reads every record in the device details tree.
	device_tree_detail::device_map read_device_details(persistent_data::transaction_manager &tm,
							   persistent_data::block_address root);
}

//----------------------------------------------------------------

#endif
