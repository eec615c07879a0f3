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
#include "persistent-data/block.h"
#include "persistent-data/errors.h"
#include "unit-tests/test_utils.h"

#include <stdlib.h>
#include <string.h>

using namespace base;
using namespace persistent_data;
using namespace std;
using namespace test;
using namespace testing;

//----------------------------------------------------------------

namespace {
	block_address const NR_BLOCKS = 64;

	void check_all_bytes(block_manager::read_ref const &rr, int v) {
		unsigned char const *data = reinterpret_cast<unsigned char const *>(rr.data());
		for (unsigned b = 0; b < MD_BLOCK_SIZE; b++)
			ASSERT_THAT(data[b], Eq(static_cast<unsigned char>(v)));
	}

	struct zero_validator : public bcache::validator {
		virtual void check(void const *raw, block_address location) const {
			unsigned char const *data = reinterpret_cast<unsigned char const *>(raw);
			for (unsigned b = 0; b < MD_BLOCK_SIZE; b++)
				if (data[b] != 0)
					throw runtime_error("validator check zero");
		}

		virtual bool check_raw(void const *raw) const {
			unsigned char const *data = reinterpret_cast<unsigned char const *>(raw);
			for (unsigned b = 0; b < MD_BLOCK_SIZE; b++)
				if (data[b] != 0)
					return false;
			return true;
		}

		virtual void prepare(void *raw, block_address location) const {
			unsigned char *data = reinterpret_cast<unsigned char *>(raw);
			for (unsigned b = 0; b < MD_BLOCK_SIZE; b++)
				data[b] = 0;
		}
	};

	class validator_mock : public bcache::validator {
	public:
		typedef boost::shared_ptr<validator_mock> ptr;

		MOCK_CONST_METHOD2(check, void(void const *, block_address));
		MOCK_CONST_METHOD1(check_raw, bool(void const *));
		MOCK_CONST_METHOD2(prepare, void(void *, block_address));
	};

	class BlockTests : public Test {
	public:
		BlockTests()
			: file_("block", NR_BLOCKS),
			  bm_(open_temp_bm(file_)) {
		}

		void reopen() {
			bm_->flush();
			bm_.reset();
			bm_ = open_temp_bm(file_);
		}

		temp_file file_;
		block_manager::ptr bm_;
	};
}

//----------------------------------------------------------------

TEST(BlockManagerTests, bad_path)
{
	ASSERT_THROW(block_manager("/bogus/bogus/bogus", 1234, block_manager::READ_WRITE),
		     io_error);
}

TEST_F(BlockTests, out_of_range_access)
{
	ASSERT_THROW(bm_->read_lock(NR_BLOCKS), io_error);
}

TEST_F(BlockTests, read_lock_all_blocks)
{
	for (unsigned i = 0; i < NR_BLOCKS; i++)
		bm_->read_lock(i);
}

TEST_F(BlockTests, writes_persist)
{
	for (unsigned i = 0; i < NR_BLOCKS; i++) {
		block_manager::write_ref wr = bm_->write_lock(i);
		::memset(wr.data(), i, MD_BLOCK_SIZE);
	}

	reopen();

	for (unsigned i = 0; i < NR_BLOCKS; i++) {
		block_manager::read_ref rr = bm_->read_lock(i);
		check_all_bytes(rr, i % 256);
	}
}

TEST_F(BlockTests, write_lock_zero_zeroes)
{
	{
		block_manager::write_ref wr = bm_->write_lock(23);
		::memset(wr.data(), 0xff, MD_BLOCK_SIZE);
	}

	reopen();
	check_all_bytes(bm_->write_lock_zero(23), 0);
}

TEST_F(BlockTests, read_validator_works)
{
	bcache::validator::ptr v(new zero_validator());
	bm_->write_lock_zero(0);
	bm_->read_lock(0, v);
}

TEST_F(BlockTests, write_validator_works)
{
	bcache::validator::ptr v(new zero_validator());

	{
		block_manager::write_ref wr = bm_->write_lock(0, v);
		::memset(wr.data(), 23, MD_BLOCK_SIZE);
	}

	// prepare runs on the way to disk
	reopen();
	check_all_bytes(bm_->read_lock(0), 0);
}

TEST_F(BlockTests, locks_are_counted)
{
	ASSERT_THAT(bm_->get_nr_locked(), Eq(0u));
	{
		block_manager::read_ref rr1 = bm_->read_lock(0);
		block_manager::read_ref rr2 = bm_->read_lock(1);
		block_manager::write_ref wr = bm_->write_lock(2);
		ASSERT_THAT(bm_->get_nr_locked(), Eq(3u));
	}
	ASSERT_THAT(bm_->get_nr_locked(), Eq(0u));
}

TEST_F(BlockTests, cannot_have_two_superblocks)
{
	block_manager::write_ref superblock = bm_->superblock_zero(0);
	ASSERT_THROW(bm_->superblock_zero(1), invariant_error);
}

TEST_F(BlockTests, can_have_subsequent_superblocks)
{
	{ block_manager::write_ref superblock = bm_->superblock_zero(0); }
	{ block_manager::write_ref superblock = bm_->superblock_zero(0); }
}

TEST_F(BlockTests, superblocks_can_change_address)
{
	{ block_manager::write_ref superblock = bm_->superblock_zero(0); }
	{ block_manager::write_ref superblock = bm_->superblock_zero(1); }
}

TEST_F(BlockTests, superblock_must_be_last)
{
	block_manager::read_ref rr = bm_->read_lock(63);
	ASSERT_THROW(bm_->superblock_zero(0), invariant_error);
}

TEST_F(BlockTests, references_can_be_copied)
{
	block_manager::write_ref wr1 = bm_->write_lock(0);
	block_manager::write_ref wr2(wr1);
	ASSERT_THAT(bm_->get_nr_locked(), Eq(1u));
}

TEST_F(BlockTests, concurrent_read_locks)
{
	block_manager::read_ref rr = bm_->read_lock(0);
	bm_->read_lock(0);
}

TEST_F(BlockTests, prefetched_blocks_can_be_read)
{
	vector<block_address> blocks;
	for (block_address b = 0; b < NR_BLOCKS; b += 2)
		blocks.push_back(b);

	bm_->prefetch(blocks);
	for (block_address b = 0; b < NR_BLOCKS; b++)
		check_all_bytes(bm_->read_lock(b), 0);
}

//----------------------------------------------------------------

namespace {
	class ValidatorTests : public BlockTests {
	public:
		ValidatorTests()
			: vmock(new validator_mock) {
		}

		void expect_check(validator_mock::ptr v) {
			EXPECT_CALL(*v, check(_, Eq(0ull))).Times(1);
		}

		void expect_no_check(validator_mock::ptr v) {
			EXPECT_CALL(*v, check(_, Eq(0ull))).Times(0);
		}

		void expect_prepare(validator_mock::ptr v) {
			EXPECT_CALL(*v, prepare(_, Eq(0ull))).Times(1);
		}

		void expect_no_prepare(validator_mock::ptr v) {
			EXPECT_CALL(*v, prepare(_, Eq(0ull))).Times(0);
		}

		validator_mock::ptr vmock;
	};

	class my_error : public runtime_error {
	public:
		my_error(string const &msg)
			: runtime_error(msg) {
		}
	};
}

//--------------------------------

TEST_F(ValidatorTests, check_on_read_lock)
{
	expect_check(vmock);
	expect_no_prepare(vmock);
	block_manager::read_ref rr = bm_->read_lock(0, vmock);
}

TEST_F(ValidatorTests, check_only_called_once_on_read_lock)
{
	expect_check(vmock);
	expect_no_prepare(vmock);

	{
		block_manager::read_ref rr = bm_->read_lock(0, vmock);
	}

	block_manager::read_ref rr = bm_->read_lock(0, vmock);
}

TEST_F(ValidatorTests, validator_can_be_changed_by_read_lock)
{
	{
		block_manager::read_ref rr = bm_->read_lock(0);
	}

	expect_check(vmock);
	expect_no_prepare(vmock);
	block_manager::read_ref rr = bm_->read_lock(0, vmock);
}

TEST_F(ValidatorTests, check_and_prepare_on_write_lock)
{
	expect_check(vmock);
	expect_prepare(vmock);

	{
		block_manager::write_ref wr = bm_->write_lock(0, vmock);
	}

	bm_->flush();
}

TEST_F(ValidatorTests, no_check_but_prepare_on_write_lock_zero)
{
	expect_no_check(vmock);
	expect_prepare(vmock);

	{
		block_manager::write_ref wr = bm_->write_lock_zero(0, vmock);
	}

	bm_->flush();
}

TEST_F(ValidatorTests, no_check_but_prepare_on_superblock_zero)
{
	expect_no_check(vmock);
	expect_prepare(vmock);

	{
		block_manager::write_ref wr = bm_->superblock_zero(0, vmock);
	}

	bm_->flush();
}

TEST_F(ValidatorTests, validator_check_failure_gets_passed_up)
{
	EXPECT_CALL(*vmock, check(_, Eq(0ull))).Times(1).WillOnce(Throw(my_error("bang!")));
	expect_no_prepare(vmock);

	ASSERT_THROW(bm_->read_lock(0, vmock), my_error);
	ASSERT_THAT(bm_->get_nr_locked(), Eq(0u));
}

//----------------------------------------------------------------
