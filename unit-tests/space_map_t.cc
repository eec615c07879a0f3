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
#include "persistent-data/space-maps/core.h"
#include "persistent-data/space-maps/disk.h"
#include "persistent-data/space-maps/disk_structures.h"
#include "unit-tests/test_utils.h"

#include <string.h>

using namespace base;
using namespace persistent_data;
using namespace std;
using namespace test;
using namespace testing;

//----------------------------------------------------------------

namespace {
	block_address const NR_BLOCKS = 1024;
	block_address const NR_DATA_BLOCKS = sm_disk_detail::ENTRIES_PER_BLOCK * 3 + 100;

	class CoreMapTests : public Test {
	public:
		CoreMapTests()
			: sm_(create_core_map(NR_BLOCKS)) {
		}

		space_map::ptr sm_;
	};

	class DiskMapTests : public Test {
	public:
		DiskMapTests()
			: file_("space_map", NR_BLOCKS) {
			open();
		}

		void open() {
			bm_ = open_temp_bm(file_);
			tm_ = open_temporary_tm(bm_);
		}

		void reopen() {
			bm_->flush();
			tm_.reset();
			bm_.reset();
			open();
		}

		// A mix of free, single, double and overflowed counts.
		space_map::ptr populated_map() {
			space_map::ptr sm = create_core_map(NR_DATA_BLOCKS);
			for (block_address b = 0; b < NR_DATA_BLOCKS; b += 7)
				sm->set_count(b, 1);

			sm->set_count(1, 2);
			sm->set_count(2, 3);
			sm->set_count(NR_DATA_BLOCKS - 1, 1000);
			sm->set_count(sm_disk_detail::ENTRIES_PER_BLOCK * 2 + 5, 70000);
			return sm;
		}

		void expect_same(space_map const &lhs, space_map const &rhs) {
			ASSERT_THAT(lhs.get_nr_blocks(), Eq(rhs.get_nr_blocks()));
			ASSERT_THAT(lhs.get_nr_free(), Eq(rhs.get_nr_free()));
			for (block_address b = 0; b < lhs.get_nr_blocks(); b++)
				ASSERT_THAT(lhs.get_count(b), Eq(rhs.get_count(b)));
		}

		temp_file file_;
		block_manager::ptr bm_;
		transaction_manager::ptr tm_;
	};
}

//----------------------------------------------------------------

TEST_F(CoreMapTests, test_get_nr_blocks)
{
	ASSERT_THAT(sm_->get_nr_blocks(), Eq(NR_BLOCKS));
}

TEST_F(CoreMapTests, test_get_nr_free)
{
	ASSERT_THAT(sm_->get_nr_free(), Eq(NR_BLOCKS));

	for (unsigned i = 0; i < NR_BLOCKS; i++) {
		space_map::maybe_block mb = sm_->new_block();
		ASSERT_TRUE(!!mb);
		ASSERT_THAT(sm_->get_nr_free(), Eq(NR_BLOCKS - i - 1));
	}

	for (unsigned i = 0; i < NR_BLOCKS; i++) {
		sm_->dec(i);
		ASSERT_THAT(sm_->get_nr_free(), Eq(i + 1));
	}
}

TEST_F(CoreMapTests, test_runs_out_of_space)
{
	for (unsigned i = 0; i < NR_BLOCKS; i++)
		sm_->new_block();

	ASSERT_FALSE(sm_->new_block());
}

TEST_F(CoreMapTests, allocation_takes_the_lowest_free_block)
{
	for (unsigned i = 0; i < 10; i++)
		ASSERT_THAT(sm_->new_block(), Eq(space_map::maybe_block(i)));

	sm_->dec(3);
	sm_->dec(7);
	ASSERT_THAT(sm_->new_block(), Eq(space_map::maybe_block(3)));
	ASSERT_THAT(sm_->new_block(), Eq(space_map::maybe_block(7)));
	ASSERT_THAT(sm_->new_block(), Eq(space_map::maybe_block(10)));
}

TEST_F(CoreMapTests, find_free_respects_the_range)
{
	ASSERT_THAT(sm_->find_free(100, 200), Eq(space_map::maybe_block(100)));

	for (block_address b = 100; b < 200; b++)
		sm_->inc(b);

	ASSERT_FALSE(sm_->find_free(100, 200));
}

TEST_F(CoreMapTests, test_inc_and_dec)
{
	block_address b = 63;

	for (unsigned i = 0; i < 50; i++) {
		ASSERT_THAT(sm_->get_count(b), Eq(i));
		sm_->inc(b);
	}

	for (unsigned i = 50; i > 0; i--) {
		ASSERT_THAT(sm_->get_count(b), Eq(i));
		sm_->dec(b);
	}

	ASSERT_THAT(sm_->get_nr_free(), Eq(NR_BLOCKS));
}

TEST_F(CoreMapTests, test_set_count)
{
	sm_->set_count(43, 5);
	ASSERT_THAT(sm_->get_count(43), Eq(5u));

	sm_->set_count(43, 0);
	ASSERT_THAT(sm_->get_count(43), Eq(0u));
	ASSERT_THAT(sm_->get_nr_free(), Eq(NR_BLOCKS));
}

TEST_F(CoreMapTests, underflow_is_an_invariant_error)
{
	ASSERT_THROW(sm_->dec(12), invariant_error);

	sm_->inc(12);
	ASSERT_THROW(sm_->dec(12, 2), invariant_error);
	ASSERT_THAT(sm_->get_count(12), Eq(1u));
}

TEST_F(CoreMapTests, out_of_range_is_an_invariant_error)
{
	ASSERT_THROW(sm_->inc(NR_BLOCKS), invariant_error);
	ASSERT_THROW(sm_->get_count(NR_BLOCKS), invariant_error);
}

//----------------------------------------------------------------

TEST_F(DiskMapTests, data_space_map_round_trip)
{
	space_map::ptr sm = populated_map();

	sm_disk_detail::sm_root root = write_disk_sm(*tm_, *sm);
	ASSERT_THAT(root.nr_blocks_, Eq(NR_DATA_BLOCKS));
	ASSERT_THAT(root.nr_allocated_, Eq(NR_DATA_BLOCKS - sm->get_nr_free()));

	reopen();
	check_disk_sm(*tm_, root);
	expect_same(*load_disk_sm(*tm_, root), *sm);
}

TEST_F(DiskMapTests, sm_root_round_trip)
{
	sm_disk_detail::sm_root root;
	root.nr_blocks_ = 123456;
	root.nr_allocated_ = 789;
	root.bitmap_root_ = 17;
	root.ref_count_root_ = 18;

	unsigned char raw[SPACE_MAP_ROOT_SIZE];
	memset(raw, 0, sizeof(raw));
	write_sm_root(root, raw);

	sm_disk_detail::sm_root copy = read_sm_root(raw);
	ASSERT_THAT(copy.nr_blocks_, Eq(123456u));
	ASSERT_THAT(copy.nr_allocated_, Eq(789u));
	ASSERT_THAT(copy.bitmap_root_, Eq(17u));
	ASSERT_THAT(copy.ref_count_root_, Eq(18u));
}

TEST_F(DiskMapTests, metadata_space_map_accounts_for_itself)
{
	space_map::ptr sm = tm_->get_sm();
	for (unsigned i = 0; i < 20; i++)
		sm->new_block();
	sm->inc(5, 4);

	sm_disk_detail::sm_root root = write_metadata_sm(*tm_);
	reopen();

	check_metadata_sm(*tm_, root);
	space_map::ptr loaded = load_metadata_sm(*tm_, root);

	ASSERT_THAT(loaded->get_count(5), Eq(5u));
	ASSERT_THAT(loaded->get_count(root.bitmap_root_), Eq(1u));
	ASSERT_THAT(loaded->get_count(root.ref_count_root_), Eq(1u));
	ASSERT_THAT(loaded->get_nr_blocks() - loaded->get_nr_free(), Eq(root.nr_allocated_));
}

TEST_F(DiskMapTests, corrupt_bitmap_is_detected)
{
	sm_disk_detail::sm_root root = write_disk_sm(*tm_, *populated_map());
	bm_->flush();

	// the first block allocated holds the first bitmap
	tm_.reset();
	bm_.reset();
	corrupt_block(file_, 0, 100);
	open();

	ASSERT_THROW(check_disk_sm(*tm_, root), checksum_error);
}

TEST_F(DiskMapTests, index_must_cover_the_device)
{
	sm_disk_detail::sm_root root = write_disk_sm(*tm_, *populated_map());
	root.nr_blocks_ += sm_disk_detail::ENTRIES_PER_BLOCK;

	reopen();
	ASSERT_THROW(check_disk_sm(*tm_, root), corrupt_metadata_error);
}

//----------------------------------------------------------------
