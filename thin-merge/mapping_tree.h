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

#ifndef THIN_MERGE_MAPPING_TREE_H
#define THIN_MERGE_MAPPING_TREE_H

#include "persistent-data/data-structures/btree.h"
#include "persistent-data/data-structures/ref_counter.h"

#include <map>
#include <vector>

//----------------------------------------------------------------

namespace thin_merge {
	namespace mapping_tree_detail {
		using namespace persistent_data;

		struct block_time {
			block_time()
				: block_(0),
				  time_(0) {
			}

			block_time(uint64_t b, uint32_t t)
				: block_(b),
				  time_(t) {
			}

			uint64_t block_;
			uint32_t time_;
		};

		inline bool operator ==(block_time const &lhs, block_time const &rhs) {
			return lhs.block_ == rhs.block_ && lhs.time_ == rhs.time_;
		}

		inline bool operator !=(block_time const &lhs, block_time const &rhs) {
			return !(lhs == rhs);
		}

		// Takes a reference on the data block of every mapping
		// written.
		class block_time_ref_counter : public ref_counter<block_time> {
		public:
			explicit block_time_ref_counter(space_map::ptr data_sm);
			virtual void inc(block_time const &bt);

		private:
			space_map::ptr data_sm_;
		};

		// The data block is held in the top 40 bits, the time in
		// the bottom 24.
		struct block_traits {
			typedef base::le64 disk_type;
			typedef block_time value_type;
			typedef block_time_ref_counter ref_counter;

			static void unpack(disk_type const &disk, value_type &value);
			static void pack(value_type const &value, disk_type &disk);
		};

		uint32_t const MAX_TIME = (1u << 24) - 1;

		typedef std::map<uint64_t, block_address> device_roots;
		typedef std::vector<block_address> leaf_list;
	}

	// The top level maps a device id to the root of that device's
	// mapping tree.
	typedef persistent_data::btree<1, persistent_data::block_traits> dev_tree;
	typedef persistent_data::btree<1, mapping_tree_detail::block_traits> single_mapping_tree;

	mapping_tree_detail::device_roots read_device_roots(persistent_data::transaction_manager &tm,
							    persistent_data::block_address root);

	// Lists the leaves of device mapping trees in key order, reading
	// only the internal nodes.  Internal nodes are remembered, so
	// a subtree shared with a tree already collected is not read
	// again.
	class leaf_collector {
	public:
		explicit leaf_collector(persistent_data::transaction_manager &tm);

		mapping_tree_detail::leaf_list collect(persistent_data::block_address root);

		// Internal nodes found to be shared between the
		// collected trees.
		unsigned get_nr_shared() const {
			return nr_shared_;
		}

	private:
		void walk(persistent_data::block_address b,
			  boost::optional<uint64_t> lo,
			  boost::optional<uint64_t> hi,
			  unsigned depth,
			  mapping_tree_detail::leaf_list &leaves);

		persistent_data::transaction_manager &tm_;
		bcache::validator::ptr validator_;
		std::map<persistent_data::block_address, mapping_tree_detail::leaf_list> memo_;
		unsigned nr_shared_;
	};
}

//----------------------------------------------------------------

#endif
