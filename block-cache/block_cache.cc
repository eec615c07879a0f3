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

#include "block-cache/block_cache.h"

#include "persistent-data/errors.h"

#include <algorithm>
#include <sstream>
#include <string.h>
#include <typeinfo>

using namespace base;
using namespace bcache;
using namespace std;

//----------------------------------------------------------------

namespace {
	size_t const IO_ALIGNMENT = 4096;

	bool by_index(block_cache::block const *lhs, block_cache::block const *rhs) {
		return lhs->get_index() < rhs->get_index();
	}
}

//----------------------------------------------------------------

block_cache::block::block(block_cache &bc, block_address index, size_t len)
	: bc_(bc),
	  index_(index),
	  data_(len, IO_ALIGNMENT),
	  ref_count_(0),
	  dirty_(false),
	  checked_(false),
	  v_(new noop_validator())
{
}

void
block_cache::block::put()
{
	if (!ref_count_)
		throw invariant_error("bad put");

	if (!--ref_count_)
		bc_.nr_locked_--;
}

//----------------------------------------------------------------

block_cache::block_cache(io_engine &engine, io_engine::handle h,
			 sector_t block_size, uint64_t nr_blocks,
			 unsigned nr_cache_blocks)
	: engine_(engine),
	  handle_(h),
	  block_size_(block_size),
	  nr_blocks_(nr_blocks),
	  nr_cache_blocks_(std::max<unsigned>(nr_cache_blocks, 1)),
	  nr_locked_(0)
{
}

uint64_t
block_cache::get_nr_blocks() const
{
	return nr_blocks_;
}

unsigned
block_cache::get_nr_locked() const
{
	return nr_locked_;
}

unsigned
block_cache::get_nr_cached() const
{
	return blocks_.size();
}

block_cache::block &
block_cache::get(block_address index, unsigned flags, validator::ptr v)
{
	check_index(index);

	block *b = lookup(index);
	if (b)
		hit(index);

	else {
		make_room(1);
		b = &insert(index);

		if (!(flags & GF_ZERO)) {
			vector<block *> bs(1, b);
			read_blocks(bs);
		}
	}

	if (flags & GF_ZERO) {
		memset(b->get_data(), 0, block_size_ << SECTOR_SHIFT);
		b->checked_ = true;
		b->v_ = v;
		b->dirty_ = true;

	} else
		validate(*b, v);

	if (flags & GF_DIRTY)
		b->dirty_ = true;

	b->get();
	return *b;
}

void
block_cache::prefetch(vector<block_address> const &indexes)
{
	vector<block_address> missing;
	for (vector<block_address>::const_iterator it = indexes.begin(); it != indexes.end(); ++it) {
		check_index(*it);
		if (!lookup(*it) && find(missing.begin(), missing.end(), *it) == missing.end())
			missing.push_back(*it);
	}

	if (missing.empty())
		return;

	if (missing.size() > nr_cache_blocks_ / 2)
		missing.resize(std::max<unsigned>(nr_cache_blocks_ / 2, 1));

	make_room(missing.size());

	vector<block *> bs;
	for (vector<block_address>::const_iterator it = missing.begin(); it != missing.end(); ++it)
		bs.push_back(&insert(*it));

	vector<block *> failed = run_io(bs, io_engine::D_READ);
	for (vector<block *>::const_iterator it = failed.begin(); it != failed.end(); ++it)
		erase((*it)->get_index());
}

void
block_cache::flush()
{
	vector<block *> dirty;
	for (block_map::iterator it = blocks_.begin(); it != blocks_.end(); ++it)
		if (it->second.b->is_dirty())
			dirty.push_back(it->second.b.get());

	write_blocks(dirty);
	engine_.flush(handle_);
}

//----------------------------------------------------------------

void
block_cache::check_index(block_address index) const
{
	if (index >= nr_blocks_) {
		ostringstream out;
		out << "block out of bounds ("
		    << index << " >= " << nr_blocks_ << ")";
		throw io_error(out.str());
	}
}

block_cache::block *
block_cache::lookup(block_address index)
{
	block_map::iterator it = blocks_.find(index);
	return (it == blocks_.end()) ? NULL : it->second.b.get();
}

block_cache::block &
block_cache::insert(block_address index)
{
	entry e;
	e.b.reset(new block(*this, index, block_size_ << SECTOR_SHIFT));
	e.lru = lru_.insert(lru_.end(), index);

	block &b = *e.b;
	blocks_.insert(make_pair(index, std::move(e)));
	return b;
}

void
block_cache::erase(block_address index)
{
	block_map::iterator it = blocks_.find(index);
	if (it == blocks_.end())
		return;

	lru_.erase(it->second.lru);
	blocks_.erase(it);
}

void
block_cache::hit(block_address index)
{
	entry &e = blocks_.find(index)->second;
	lru_.splice(lru_.end(), lru_, e.lru);
}

// Evicts the least recently used unlocked blocks until there is
// space for count new ones, writing back any that are dirty.
void
block_cache::make_room(unsigned count)
{
	if (blocks_.size() + count <= nr_cache_blocks_)
		return;

	unsigned needed = blocks_.size() + count - nr_cache_blocks_;
	unsigned target = std::max<unsigned>(needed, nr_cache_blocks_ / 8);

	vector<block *> victims;
	for (lru_list::iterator it = lru_.begin(); it != lru_.end() && victims.size() < target; ++it) {
		block &b = *blocks_.find(*it)->second.b;
		if (!b.ref_count_)
			victims.push_back(&b);
	}

	if (victims.size() < needed)
		throw invariant_error("block cache full, too many blocks locked");

	vector<block *> dirty;
	for (vector<block *>::const_iterator it = victims.begin(); it != victims.end(); ++it)
		if ((*it)->is_dirty())
			dirty.push_back(*it);

	write_blocks(dirty);

	for (vector<block *>::const_iterator it = victims.begin(); it != victims.end(); ++it)
		erase((*it)->get_index());
}

void
block_cache::validate(block &b, validator::ptr v)
{
	// Dirty data hasn't been prepared yet, so it can't be checked.
	if (b.dirty_) {
		b.v_ = v;
		return;
	}

	if (!b.checked_ || typeid(*b.v_) != typeid(*v)) {
		v->check(b.get_data(), b.index_);
		b.checked_ = true;
		b.v_ = v;
	}
}

void
block_cache::read_blocks(vector<block *> const &blocks)
{
	vector<block *> failed = run_io(blocks, io_engine::D_READ);
	if (failed.empty())
		return;

	block_address index = failed.front()->get_index();
	for (vector<block *>::const_iterator it = failed.begin(); it != failed.end(); ++it)
		erase((*it)->get_index());

	ostringstream out;
	out << "read failed (block " << index << ")";
	throw io_error(out.str());
}

void
block_cache::write_blocks(vector<block *> const &blocks)
{
	if (blocks.empty())
		return;

	vector<block *> sorted(blocks);
	sort(sorted.begin(), sorted.end(), by_index);

	for (vector<block *>::const_iterator it = sorted.begin(); it != sorted.end(); ++it)
		(*it)->v_->prepare((*it)->get_data(), (*it)->get_index());

	vector<block *> failed = run_io(sorted, io_engine::D_WRITE);
	if (!failed.empty()) {
		ostringstream out;
		out << "write failed (block " << failed.front()->get_index() << ")";
		throw io_error(out.str());
	}

	for (vector<block *>::const_iterator it = sorted.begin(); it != sorted.end(); ++it) {
		(*it)->dirty_ = false;
		(*it)->checked_ = true;
	}
}

// Keeps up to the engine's queue depth in flight.  The context of
// each io is its position in the blocks vector, so completions may
// arrive in any order.  Returns the blocks whose io failed.
vector<block_cache::block *>
block_cache::run_io(vector<block *> const &blocks, io_engine::dir d)
{
	vector<block *> failed;
	unsigned max_io = std::max<unsigned>(engine_.get_max_io(), 1);
	unsigned next = 0, in_flight = 0;

	while (next < blocks.size() || in_flight) {
		while (next < blocks.size() && in_flight < max_io) {
			block &b = *blocks[next];
			sector_t begin = b.index_ * block_size_;

			if (!engine_.issue_io(handle_, d, begin, begin + block_size_,
					      b.get_data(), next)) {
				if (in_flight)
					break;

				failed.push_back(&b);
			} else
				in_flight++;

			next++;
		}

		if (in_flight) {
			boost::optional<io_engine::wait_result> wr = engine_.wait();
			if (!wr)
				throw invariant_error("io engine lost an in flight io");

			in_flight--;
			if (!wr->first)
				failed.push_back(blocks.at(wr->second));
		}
	}

	return failed;
}

//----------------------------------------------------------------
