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

#include "gmock/gmock.h"
#include "persistent-data/errors.h"
#include "thin-merge/superblock.h"
#include "unit-tests/test_utils.h"

#include <string.h>

using namespace base;
using namespace persistent_data;
using namespace std;
using namespace test;
using namespace testing;
using namespace thin_merge;

//----------------------------------------------------------------

namespace {
	block_address const NR_BLOCKS = 16;

	class SuperblockTests : public Test {
	public:
		SuperblockTests()
			: file_("superblock", NR_BLOCKS) {
		}

		superblock_detail::superblock make_sb() {
			superblock_detail::superblock sb;
			sb.time_ = 7;
			sb.trans_id_ = 42;
			sb.data_mapping_root_ = 3;
			sb.device_details_root_ = 4;
			sb.data_block_size_ = 128;
			sb.metadata_nr_blocks_ = NR_BLOCKS;
			sb.flags_ = 1;
			for (unsigned i = 0; i < sizeof(sb.uuid_); i++)
				sb.uuid_[i] = i;
			return sb;
		}

		void write(superblock_detail::superblock const &sb) {
			block_manager::ptr bm = open_temp_bm(file_);
			write_superblock(*bm, sb);
		}

		superblock_detail::superblock read(block_address location = 0) {
			block_manager::ptr bm = open_temp_bm(file_, block_manager::READ_ONLY);
			return read_superblock(*bm, location);
		}

		temp_file file_;
	};
}

//----------------------------------------------------------------

TEST_F(SuperblockTests, fields_survive_a_write)
{
	write(make_sb());
	superblock_detail::superblock sb = read();

	ASSERT_THAT(sb.magic_, Eq(superblock_detail::SUPERBLOCK_MAGIC));
	ASSERT_THAT(sb.version_, Eq(superblock_detail::METADATA_VERSION));
	ASSERT_THAT(sb.blocknr_, Eq(0u));
	ASSERT_THAT(sb.time_, Eq(7u));
	ASSERT_THAT(sb.trans_id_, Eq(42u));
	ASSERT_THAT(sb.data_mapping_root_, Eq(3u));
	ASSERT_THAT(sb.device_details_root_, Eq(4u));
	ASSERT_THAT(sb.data_block_size_, Eq(128u));
	ASSERT_THAT(sb.metadata_block_size_, Eq(8u));
	ASSERT_THAT(sb.metadata_nr_blocks_, Eq(NR_BLOCKS));
	ASSERT_THAT(sb.flags_, Eq(1u));
	ASSERT_THAT(sb.uuid_[15], Eq(15));
}

TEST_F(SuperblockTests, bad_checksum_is_detected)
{
	write(make_sb());
	corrupt_block(file_, 0, 200);

	ASSERT_THROW(read(), checksum_error);
}

TEST_F(SuperblockTests, bad_magic_is_corrupt)
{
	superblock_detail::superblock sb = make_sb();
	sb.magic_ = 12345;
	write(sb);

	ASSERT_THROW(read(), corrupt_metadata_error);
}

TEST_F(SuperblockTests, version_one_is_accepted)
{
	superblock_detail::superblock sb = make_sb();
	sb.version_ = 1;
	write(sb);

	ASSERT_THAT(read().version_, Eq(1u));
}

TEST_F(SuperblockTests, unknown_version_is_rejected)
{
	superblock_detail::superblock sb = make_sb();
	sb.version_ = 3;
	write(sb);
	ASSERT_THROW(read(), version_error);

	sb.version_ = 0;
	write(sb);
	ASSERT_THROW(read(), version_error);
}

TEST_F(SuperblockTests, metadata_block_size_must_be_4k)
{
	superblock_detail::superblock sb = make_sb();
	sb.metadata_block_size_ = 16;
	write(sb);

	ASSERT_THROW(read(), corrupt_metadata_error);
}

TEST_F(SuperblockTests, location_beyond_the_device)
{
	write(make_sb());
	ASSERT_THROW(read(NR_BLOCKS), corrupt_metadata_error);
}

TEST_F(SuperblockTests, zeroed_superblock_fails_checksum)
{
	ASSERT_THROW(read(), checksum_error);
}

//----------------------------------------------------------------
