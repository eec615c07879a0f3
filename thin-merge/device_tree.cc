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

#include "thin-merge/device_tree.h"

using namespace persistent_data;
using namespace thin_merge;
using namespace device_tree_detail;

//----------------------------------------------------------------

namespace {
	class details_collector : public device_tree::visitor {
	public:
		details_collector(device_map &devs)
			: devs_(devs) {
		}

		virtual bool visit_internal(node_location const &l,
					    device_tree::internal_node const &n) {
			return true;
		}

		virtual bool visit_internal_leaf(node_location const &l,
						 device_tree::internal_node const &n) {
			return true;
		}

		virtual bool visit_leaf(node_location const &l,
					device_tree::leaf_node const &n) {
			for (unsigned i = 0; i < n.get_nr_entries(); i++)
				devs_.insert(std::make_pair(n.key_at(i), n.value_at(i)));

			return true;
		}

	private:
		device_map &devs_;
	};
}

//----------------------------------------------------------------

namespace thin_merge {
	namespace device_tree_detail {
		device_details::device_details()
			: mapped_blocks_(0),
			  transaction_id_(0),
			  creation_time_(0),
			  snapshotted_time_(0) {
		}

		void
		device_details_traits::unpack(device_details_disk const &disk, device_details &value)
		{
			value.mapped_blocks_ = to_cpu<uint64_t>(disk.mapped_blocks_);
			value.transaction_id_ = to_cpu<uint64_t>(disk.transaction_id_);
			value.creation_time_ = to_cpu<uint32_t>(disk.creation_time_);
			value.snapshotted_time_ = to_cpu<uint32_t>(disk.snapshotted_time_);
		}

		void
		device_details_traits::pack(device_details const &value, device_details_disk &disk)
		{
			disk.mapped_blocks_ = to_disk<le64>(value.mapped_blocks_);
			disk.transaction_id_ = to_disk<le64>(value.transaction_id_);
			disk.creation_time_ = to_disk<le32>(value.creation_time_);
			disk.snapshotted_time_ = to_disk<le32>(value.snapshotted_time_);
		}
	}
}

device_map
thin_merge::read_device_details(transaction_manager &tm, block_address root)
{
	device_map devs;
	details_collector v(devs);
	device_tree tree(tm, root);
	tree.visit_depth_first(v);
	return devs;
}

//----------------------------------------------------------------
