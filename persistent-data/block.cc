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

#include "persistent-data/block.h"

#include "persistent-data/errors.h"

#include <algorithm>
#include <iostream>
#include <stdlib.h>

using namespace persistent_data;

//----------------------------------------------------------------

namespace {
	unsigned const DEFAULT_CACHE_BLOCKS = 4096;

	unsigned choose_cache_size(block_address nr_blocks, unsigned queue_depth) {
		// room for two full prefetch batches on top of the locks
		uint64_t min_blocks = 4 * static_cast<uint64_t>(queue_depth);
		uint64_t n = std::max<uint64_t>(DEFAULT_CACHE_BLOCKS, min_blocks);
		return static_cast<unsigned>(std::min<uint64_t>(n, std::max<block_address>(nr_blocks, 1)));
	}

	io_engine::mode engine_mode(block_manager::mode m) {
		return (m == block_manager::READ_ONLY) ?
			io_engine::M_READ_ONLY : io_engine::M_READ_WRITE;
	}
}

//----------------------------------------------------------------

block_manager::read_ref::read_ref(block_cache::block &b)
	: b_(b)
{
}

block_manager::read_ref::read_ref(read_ref const &rhs)
	: b_(rhs.b_)
{
	b_.get();
}

block_manager::read_ref::~read_ref()
{
	b_.put();
}

block_address
block_manager::read_ref::get_location() const
{
	return b_.get_index();
}

void const *
block_manager::read_ref::data() const
{
	return b_.get_data();
}

//--------------------------------

block_manager::write_ref::write_ref(block_cache::block &b)
	: read_ref(b),
	  ref_count_(NULL)
{
}

block_manager::write_ref::write_ref(block_cache::block &b, unsigned &ref_count)
	: read_ref(b),
	  ref_count_(&ref_count)
{
	if (*ref_count_)
		throw base::invariant_error("superblock already locked");

	(*ref_count_)++;
}

block_manager::write_ref::write_ref(write_ref const &rhs)
	: read_ref(rhs),
	  ref_count_(rhs.ref_count_)
{
	if (ref_count_)
		(*ref_count_)++;
}

block_manager::write_ref::~write_ref()
{
	if (ref_count_) {
		if (!*ref_count_) {
			std::cerr << "write_ref ref_count going below zero";
			::exit(1);
		}

		(*ref_count_)--;
	}
}

void *
block_manager::write_ref::data()
{
	return read_ref::b_.get_data();
}

//----------------------------------------------------------------

block_manager::block_manager(std::string const &path,
			     block_address nr_blocks,
			     mode m,
			     bool excl,
			     engine_type e,
			     unsigned queue_depth)
	: engine_(create_io_engine(e, queue_depth)),
	  handle_(engine_->open_file(path, engine_mode(m),
				     excl ? io_engine::EXCLUSIVE : io_engine::NON_EXCLUSIVE)),
	  bc_(*engine_, handle_, MD_BLOCK_SIZE >> SECTOR_SHIFT, nr_blocks,
	      choose_cache_size(nr_blocks, queue_depth)),
	  superblock_ref_count_(0)
{
}

block_manager::read_ref
block_manager::read_lock(block_address location, validator::ptr v) const
{
	block_cache::block &b = bc_.get(location, 0, v);
	return read_ref(b);
}

block_manager::write_ref
block_manager::write_lock(block_address location, validator::ptr v)
{
	block_cache::block &b = bc_.get(location, block_cache::GF_DIRTY, v);
	return write_ref(b);
}

block_manager::write_ref
block_manager::write_lock_zero(block_address location, validator::ptr v)
{
	block_cache::block &b = bc_.get(location, block_cache::GF_ZERO, v);
	return write_ref(b);
}

block_manager::write_ref
block_manager::superblock_zero(block_address location, validator::ptr v)
{
	if (bc_.get_nr_locked() > 0)
		throw base::invariant_error("attempt to lock superblock while other locks are still held");

	block_cache::block &b = bc_.get(location, block_cache::GF_ZERO, v);
	return write_ref(b, superblock_ref_count_);
}

block_address
block_manager::get_nr_blocks() const
{
	return bc_.get_nr_blocks();
}

void
block_manager::prefetch(block_address b) const
{
	bc_.prefetch(std::vector<block_address>(1, b));
}

void
block_manager::prefetch(std::vector<block_address> const &blocks) const
{
	bc_.prefetch(blocks);
}

void
block_manager::flush() const
{
	bc_.flush();
}

unsigned
block_manager::get_nr_locked() const
{
	return bc_.get_nr_locked();
}

//----------------------------------------------------------------
