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

#ifndef THIN_MERGE_MERGE_H
#define THIN_MERGE_MERGE_H

#include "base/nested_output.h"
#include "persistent-data/block.h"

#include <boost/optional.hpp>
#include <string>
#include <stdint.h>

//----------------------------------------------------------------

namespace thin_merge {
	struct merge_options {
		merge_options();

		std::string input_;
		std::string output_;

		uint64_t origin_;
		// Without a snapshot the origin is copied on its own.
		boost::optional<uint64_t> snapshot_;

		bool use_metadata_snap_;

		// Publish the merged device under the snapshot's id and
		// details rather than the origin's.
		bool rebase_;

		bcache::engine_type engine_;
		unsigned queue_depth_;
		bool quiet_;
	};

	// Writes fresh metadata to the output holding a single device:
	// the snapshot's mappings laid over the origin's.  The input is
	// checked before anything is written.  Errors are thrown as the
	// exceptions declared in persistent-data/errors.h, and leave the
	// output unusable.
	void merge_thins(merge_options const &opts, base::nested_output &out);

	// A lower bound on the metadata blocks needed to hold one device
	// with nr_mappings mappings.
	persistent_data::block_address
	estimate_metadata_blocks(uint64_t nr_mappings,
				 persistent_data::block_address nr_data_blocks,
				 persistent_data::block_address nr_metadata_blocks);
}

//----------------------------------------------------------------

#endif
