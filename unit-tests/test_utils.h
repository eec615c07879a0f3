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

#ifndef UNIT_TESTS_TEST_UTILS_H
#define UNIT_TESTS_TEST_UTILS_H

#include "persistent-data/block.h"
#include "persistent-data/space_map.h"
#include "persistent-data/transaction_manager.h"
#include "thin-merge/device_tree.h"
#include "thin-merge/mapping_tree.h"
#include "thin-merge/superblock.h"

#include <boost/optional.hpp>
#include <boost/optional/optional_io.hpp>
#include <map>
#include <ostream>
#include <string>
#include <vector>

//----------------------------------------------------------------

namespace test {
	using namespace persistent_data;

	typedef std::map<uint64_t, thin_merge::mapping_tree_detail::block_time> mapping_map;

	// A zero filled file of nr_blocks metadata blocks, removed
	// when the test finishes.
	class temp_file {
	public:
		temp_file(std::string const &name_base, block_address nr_blocks);
		~temp_file();

		std::string const &get_path() const;

	private:
		static std::string gen_path(std::string const &base);

		std::string path_;
	};

	block_manager::ptr open_temp_bm(temp_file const &file,
					block_manager::mode m = block_manager::READ_WRITE);

	transaction_manager::ptr open_temporary_tm(block_manager::ptr bm);

	// nr consecutive mappings, starting at vbegin -> dbegin.
	mapping_map make_run(uint64_t vbegin, uint64_t dbegin, unsigned nr, uint32_t time = 0);

	// Flips one byte of a block, bypassing any validator.
	void corrupt_block(temp_file const &file, block_address b, unsigned offset);

	bool files_identical(std::string const &lhs, std::string const &rhs);
	bool file_is_zeroed(std::string const &path);

	//--------------------------------

	// Describes thin metadata and writes it with the restore
	// emitter.  Named mappings are shared by the devices that
	// include them.
	class metadata_builder {
	public:
		metadata_builder(block_address nr_data_blocks = 16384);

		metadata_builder &named(std::string const &name, mapping_map const &m);

		metadata_builder &device(uint32_t dev, mapping_map const &m,
					 uint64_t trans_id = 0,
					 uint32_t creation_time = 0,
					 uint32_t snap_time = 0);

		// The named mapping comes first, followed by tail.
		metadata_builder &device_sharing(uint32_t dev, std::string const &name,
						 mapping_map const &tail,
						 uint64_t trans_id = 0);

		void write(block_manager::ptr bm, uint64_t trans_id = 1, uint32_t time = 1);

	private:
		struct device_desc {
			device_desc()
				: trans_id_(0),
				  creation_time_(0),
				  snap_time_(0) {
			}

			boost::optional<std::string> shared_;
			mapping_map mappings_;
			uint64_t trans_id_;
			uint32_t creation_time_;
			uint32_t snap_time_;
		};

		block_address nr_data_blocks_;
		std::map<std::string, mapping_map> named_;
		std::map<uint32_t, device_desc> devices_;
	};

	// Writes a copy of the live superblock to location and points
	// the live superblock at it.
	void take_metadata_snap(block_manager::ptr bm, block_address location);

	// Points the live superblock's trees at the superblock itself,
	// so only a metadata snapshot is readable.
	void break_live_roots(block_manager::ptr bm);

	//--------------------------------

	// Readers for checking a metadata image.
	thin_merge::superblock_detail::superblock read_sb(block_manager::ptr bm);
	mapping_map read_mappings(block_manager::ptr bm, uint64_t dev);
	thin_merge::device_tree_detail::device_map read_details(block_manager::ptr bm);
	thin_merge::mapping_tree_detail::device_roots read_roots(block_manager::ptr bm);
	space_map::ptr read_data_sm(block_manager::ptr bm);
	space_map::ptr read_metadata_sm(block_manager::ptr bm);
}

namespace thin_merge {
	namespace mapping_tree_detail {
		inline std::ostream &operator <<(std::ostream &out, block_time const &bt) {
			return out << "(" << bt.block_ << ", " << bt.time_ << ")";
		}
	}
}

//----------------------------------------------------------------

#endif
