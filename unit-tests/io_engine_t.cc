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
#include "base/aligned_memory.h"
#include "block-cache/io_engine.h"
#include "persistent-data/errors.h"
#include "unit-tests/test_utils.h"

#include <set>
#include <string.h>

using namespace base;
using namespace bcache;
using namespace std;
using namespace test;
using namespace testing;

//----------------------------------------------------------------

namespace {
	unsigned const MAX_IO = 64;
	unsigned const IO_ALIGNMENT = 4096;

	// 32 blocks
	unsigned const NR_SECTORS = 32 * 8;

	// Every test runs against both engines.
	class IOEngineTests : public TestWithParam<engine_type> {
	public:
		IOEngineTests()
			: file_("io_engine", 32),
			  buffer_(4096, IO_ALIGNMENT),
			  engine_(create_io_engine(GetParam(), MAX_IO)) {
		}

		bool complete_one(unsigned context) {
			boost::optional<io_engine::wait_result> wr = engine_->wait();
			if (!wr)
				throw runtime_error("no io completed");

			if (wr->second != context)
				throw runtime_error("wrong context");

			return wr->first;
		}

		temp_file file_;
		aligned_memory buffer_;
		unique_ptr<io_engine> engine_;
	};
}

//----------------------------------------------------------------

TEST_P(IOEngineTests, open_and_close)
{
	io_engine::handle src = engine_->open_file(file_.get_path(), io_engine::M_READ_ONLY);
	io_engine::handle dest = engine_->open_file(file_.get_path(), io_engine::M_READ_WRITE,
						    io_engine::NON_EXCLUSIVE);
	ASSERT_TRUE(src != dest);
	engine_->close_file(src);
	engine_->close_file(dest);
}

TEST_P(IOEngineTests, opening_a_missing_file_fails)
{
	ASSERT_THROW(engine_->open_file("./no-such-file.tmp", io_engine::M_READ_ONLY), io_error);
}

TEST_P(IOEngineTests, closing_an_unknown_handle_fails)
{
	ASSERT_THROW(engine_->close_file(12345), invariant_error);
}

TEST_P(IOEngineTests, nothing_to_wait_for)
{
	ASSERT_FALSE(engine_->wait());
}

TEST_P(IOEngineTests, you_can_read_a_read_only_handle)
{
	io_engine::handle h = engine_->open_file(file_.get_path(), io_engine::M_READ_ONLY);
	ASSERT_TRUE(engine_->issue_io(h, io_engine::D_READ, 0, 8, buffer_.data(), 123));
	ASSERT_TRUE(complete_one(123));
	engine_->close_file(h);
}

TEST_P(IOEngineTests, you_cannot_write_to_a_read_only_handle)
{
	io_engine::handle h = engine_->open_file(file_.get_path(), io_engine::M_READ_ONLY);

	// aio refuses the write at submission, the sync engine when
	// it completes
	if (engine_->issue_io(h, io_engine::D_WRITE, 0, 8, buffer_.data(), 0))
		ASSERT_FALSE(complete_one(0));
	else
		ASSERT_FALSE(engine_->wait());

	engine_->close_file(h);
}

TEST_P(IOEngineTests, writes_can_be_read_back)
{
	io_engine::handle h = engine_->open_file(file_.get_path(), io_engine::M_READ_WRITE);

	memset(buffer_.data(), 0xa5, buffer_.size());
	ASSERT_TRUE(engine_->issue_io(h, io_engine::D_WRITE, 16, 24, buffer_.data(), 1));
	ASSERT_TRUE(complete_one(1));
	engine_->flush(h);

	buffer_.zero();
	ASSERT_TRUE(engine_->issue_io(h, io_engine::D_READ, 16, 24, buffer_.data(), 2));
	ASSERT_TRUE(complete_one(2));

	unsigned char const *data = reinterpret_cast<unsigned char const *>(buffer_.data());
	for (unsigned i = 0; i < buffer_.size(); i++)
		ASSERT_THAT(data[i], Eq(0xa5));

	engine_->close_file(h);
}

TEST_P(IOEngineTests, completions_carry_their_context)
{
	aligned_memory other(4096, IO_ALIGNMENT);
	io_engine::handle h = engine_->open_file(file_.get_path(), io_engine::M_READ_ONLY);

	ASSERT_TRUE(engine_->issue_io(h, io_engine::D_READ, 0, 8, buffer_.data(), 7));
	ASSERT_TRUE(engine_->issue_io(h, io_engine::D_READ, 8, 16, other.data(), 9));
	ASSERT_TRUE(complete_one(7));
	ASSERT_TRUE(complete_one(9));
	ASSERT_FALSE(engine_->wait());

	engine_->close_file(h);
}

TEST_P(IOEngineTests, a_batch_completes_by_context)
{
	unsigned const nr = 16;

	io_engine::handle h = engine_->open_file(file_.get_path(), io_engine::M_READ_WRITE);
	aligned_memory batch(nr * 4096, IO_ALIGNMENT);
	unsigned char *data = reinterpret_cast<unsigned char *>(batch.data());

	for (unsigned i = 0; i < nr; i++) {
		memset(data + i * 4096, i + 1, 4096);
		ASSERT_TRUE(engine_->issue_io(h, io_engine::D_WRITE, i * 8, i * 8 + 8,
					      data + i * 4096, 100 + i));
	}

	set<unsigned> written;
	for (unsigned i = 0; i < nr; i++) {
		boost::optional<io_engine::wait_result> wr = engine_->wait();
		ASSERT_TRUE(!!wr);
		ASSERT_TRUE(wr->first);
		written.insert(wr->second);
	}
	ASSERT_THAT(written.size(), Eq(nr));
	ASSERT_THAT(*written.begin(), Eq(100u));
	ASSERT_THAT(*written.rbegin(), Eq(100u + nr - 1));

	batch.zero();
	for (unsigned i = 0; i < nr; i++)
		ASSERT_TRUE(engine_->issue_io(h, io_engine::D_READ, i * 8, i * 8 + 8,
					      data + i * 4096, i));

	for (unsigned i = 0; i < nr; i++) {
		boost::optional<io_engine::wait_result> wr = engine_->wait();
		ASSERT_TRUE(!!wr);
		ASSERT_TRUE(wr->first);
		ASSERT_THAT(data[wr->second * 4096], Eq(wr->second + 1));
		ASSERT_THAT(data[wr->second * 4096 + 4095], Eq(wr->second + 1));
	}

	engine_->close_file(h);
}

TEST_P(IOEngineTests, final_block_read_succeeds)
{
	io_engine::handle h = engine_->open_file(file_.get_path(), io_engine::M_READ_ONLY);
	ASSERT_TRUE(engine_->issue_io(h, io_engine::D_READ, NR_SECTORS - 8, NR_SECTORS,
				      buffer_.data(), 0));
	ASSERT_TRUE(complete_one(0));
	engine_->close_file(h);
}

TEST_P(IOEngineTests, out_of_bounds_read_fails)
{
	io_engine::handle h = engine_->open_file(file_.get_path(), io_engine::M_READ_ONLY);
	ASSERT_TRUE(engine_->issue_io(h, io_engine::D_READ, NR_SECTORS, NR_SECTORS + 8,
				      buffer_.data(), 0));
	ASSERT_FALSE(complete_one(0));
	engine_->close_file(h);
}

TEST_P(IOEngineTests, out_of_bounds_write_succeeds)
{
	io_engine::handle h = engine_->open_file(file_.get_path(), io_engine::M_READ_WRITE);
	ASSERT_TRUE(engine_->issue_io(h, io_engine::D_WRITE, NR_SECTORS, NR_SECTORS + 8,
				      buffer_.data(), 0));
	ASSERT_TRUE(complete_one(0));
	engine_->close_file(h);
}

INSTANTIATE_TEST_SUITE_P(Engines, IOEngineTests, Values(SYNC_IO, ASYNC_IO));

//----------------------------------------------------------------
