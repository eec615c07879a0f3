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

#include "thin-merge/mapping_stream.h"

#include "persistent-data/errors.h"
#include "persistent-data/validators.h"

#include <algorithm>
#include <sstream>

using namespace base;
using namespace persistent_data;
using namespace thin_merge;
using namespace std;

//----------------------------------------------------------------

mapping_stream::mapping_stream(transaction_manager &tm,
			       mapping_tree_detail::leaf_list const &leaves,
			       unsigned batch_size)
	: tm_(tm),
	  validator_(create_btree_node_validator()),
	  leaves_(leaves),
	  batch_size_(std::max(batch_size, 1u)),
	  leaf_index_(0),
	  entry_index_(0),
	  prefetched_(0),
	  loaded_(false)
{
}

bool
mapping_stream::more_mappings()
{
	ensure_loaded();
	return !at_end();
}

mapping const &
mapping_stream::get_mapping()
{
	ensure_loaded();
	if (at_end())
		throw invariant_error("mapping stream exhausted");

	return entries_[entry_index_];
}

void
mapping_stream::step()
{
	ensure_loaded();
	if (at_end())
		return;

	if (++entry_index_ >= entries_.size())
		skip_leaf();
}

bool
mapping_stream::at_leaf_start() const
{
	return !at_end() && entry_index_ == 0;
}

block_address
mapping_stream::current_leaf() const
{
	if (at_end())
		throw invariant_error("mapping stream exhausted");

	return leaves_[leaf_index_];
}

vector<mapping> const &
mapping_stream::leaf_entries()
{
	if (at_end())
		throw invariant_error("mapping stream exhausted");

	if (!loaded_)
		load_leaf();

	return entries_;
}

void
mapping_stream::skip_leaf()
{
	if (at_end())
		return;

	leaf_index_++;
	entry_index_ = 0;
	loaded_ = false;
	entries_.clear();
}

bool
mapping_stream::at_end() const
{
	return leaf_index_ >= leaves_.size();
}

void
mapping_stream::ensure_loaded()
{
	while (!at_end() && !loaded_) {
		load_leaf();
		if (entries_.empty())
			skip_leaf();
	}
}

void
mapping_stream::load_leaf()
{
	using namespace btree_detail;

	if (leaf_index_ >= prefetched_) {
		unsigned end = std::min<unsigned>(leaf_index_ + batch_size_, leaves_.size());
		vector<block_address> batch(leaves_.begin() + leaf_index_, leaves_.begin() + end);
		tm_.get_bm()->prefetch(batch);
		prefetched_ = end;
	}

	block_address b = leaves_[leaf_index_];
	transaction_manager::read_ref rr = tm_.read_lock(b, validator_);
	node_ref<mapping_tree_detail::block_traits> n =
		to_node<mapping_tree_detail::block_traits>(rr);

	if (n.get_type() != LEAF) {
		ostringstream out;
		out << "expected a mapping tree leaf (block " << b << ")";
		throw corrupt_metadata_error(out.str(), b);
	}

	n.check_header();
	n.check_keys(boost::optional<uint64_t>(), boost::optional<uint64_t>());

	unsigned nr_entries = n.get_nr_entries();
	if (nr_entries && last_key_ && n.key_at(0) <= *last_key_) {
		ostringstream out;
		out << "mapping tree leaves out of order: key " << n.key_at(0)
		    << " follows key " << *last_key_ << " (block " << b << ")";
		throw corrupt_metadata_error(out.str(), b);
	}

	entries_.clear();
	entries_.reserve(nr_entries);
	for (unsigned i = 0; i < nr_entries; i++)
		entries_.push_back(mapping(n.key_at(i), n.value_at(i)));

	if (nr_entries)
		last_key_ = n.key_at(nr_entries - 1);

	loaded_ = true;
}

//----------------------------------------------------------------
