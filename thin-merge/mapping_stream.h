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

#ifndef THIN_MERGE_MAPPING_STREAM_H
#define THIN_MERGE_MAPPING_STREAM_H

#include "thin-merge/mapping_tree.h"

#include <boost/noncopyable.hpp>
#include <vector>

//----------------------------------------------------------------

namespace thin_merge {
	struct mapping {
		mapping()
			: vblock_(0) {
		}

		mapping(uint64_t vblock, mapping_tree_detail::block_time const &bt)
			: vblock_(vblock),
			  bt_(bt) {
		}

		uint64_t vblock_;
		mapping_tree_detail::block_time bt_;
	};

	// The mappings of one device, in virtual block order, read
	// from a list of leaves.  Leaves are read in batches and only
	// decoded when the stream reaches them, so a whole leaf can be
	// skipped without decoding it.
	class mapping_stream : private boost::noncopyable {
	public:
		mapping_stream(persistent_data::transaction_manager &tm,
			       mapping_tree_detail::leaf_list const &leaves,
			       unsigned batch_size);

		bool more_mappings();
		mapping const &get_mapping();
		void step();

		// True if no entries of the current leaf have been
		// consumed.
		bool at_leaf_start() const;
		persistent_data::block_address current_leaf() const;

		// Decodes the current leaf if needed.
		std::vector<mapping> const &leaf_entries();
		void skip_leaf();

	private:
		bool at_end() const;
		void ensure_loaded();
		void load_leaf();

		persistent_data::transaction_manager &tm_;
		bcache::validator::ptr validator_;
		mapping_tree_detail::leaf_list leaves_;
		unsigned batch_size_;

		unsigned leaf_index_;
		unsigned entry_index_;
		unsigned prefetched_;

		bool loaded_;
		std::vector<mapping> entries_;
		boost::optional<uint64_t> last_key_;
	};
}

//----------------------------------------------------------------

#endif
