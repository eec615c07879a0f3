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

#include "thin-merge/mapping_tree.h"

#include "persistent-data/errors.h"
#include "persistent-data/validators.h"

#include <sstream>

using namespace base;
using namespace persistent_data;
using namespace thin_merge;
using namespace mapping_tree_detail;
using namespace std;

//----------------------------------------------------------------

namespace {
	// Far deeper than any real tree, only here to stop a loop in
	// corrupt metadata.
	unsigned const MAX_DEPTH = 32;

	class root_collector : public dev_tree::visitor {
	public:
		root_collector(device_roots &roots)
			: roots_(roots) {
		}

		virtual bool visit_internal(node_location const &l,
					    dev_tree::internal_node const &n) {
			return true;
		}

		virtual bool visit_internal_leaf(node_location const &l,
						 dev_tree::internal_node const &n) {
			return true;
		}

		virtual bool visit_leaf(node_location const &l,
					dev_tree::leaf_node const &n) {
			for (unsigned i = 0; i < n.get_nr_entries(); i++)
				roots_.insert(make_pair(n.key_at(i), n.value_at(i)));

			return true;
		}

	private:
		device_roots &roots_;
	};
}

//----------------------------------------------------------------

namespace thin_merge {
	namespace mapping_tree_detail {
		block_time_ref_counter::block_time_ref_counter(space_map::ptr data_sm)
			: data_sm_(data_sm)
		{
		}

		void
		block_time_ref_counter::inc(block_time const &bt)
		{
			data_sm_->inc(bt.block_);
		}

		void
		block_traits::unpack(disk_type const &disk, value_type &value)
		{
			uint64_t v = to_cpu<uint64_t>(disk);
			value.block_ = v >> 24;
			value.time_ = v & MAX_TIME;
		}

		void
		block_traits::pack(value_type const &value, disk_type &disk)
		{
			uint64_t v = (value.block_ << 24) | (value.time_ & MAX_TIME);
			disk = base::to_disk<base::le64>(v);
		}
	}
}

//----------------------------------------------------------------

device_roots
thin_merge::read_device_roots(transaction_manager &tm, block_address root)
{
	device_roots roots;
	root_collector v(roots);
	dev_tree tree(tm, root);
	tree.visit_depth_first(v);
	return roots;
}

//----------------------------------------------------------------

leaf_collector::leaf_collector(transaction_manager &tm)
	: tm_(tm),
	  validator_(create_btree_node_validator()),
	  nr_shared_(0)
{
}

leaf_list
leaf_collector::collect(block_address root)
{
	leaf_list leaves;
	walk(root, boost::optional<uint64_t>(), boost::optional<uint64_t>(), 0, leaves);
	return leaves;
}

void
leaf_collector::walk(block_address b,
		     boost::optional<uint64_t> lo,
		     boost::optional<uint64_t> hi,
		     unsigned depth,
		     leaf_list &leaves)
{
	map<block_address, leaf_list>::const_iterator it = memo_.find(b);
	if (it != memo_.end()) {
		nr_shared_++;
		leaves.insert(leaves.end(), it->second.begin(), it->second.end());
		return;
	}

	block_address nr_blocks = tm_.get_bm()->get_nr_blocks();
	if (b >= nr_blocks) {
		ostringstream out;
		out << "mapping tree node " << b << " beyond the end of the metadata device";
		throw corrupt_metadata_error(out.str(), b);
	}

	if (depth > MAX_DEPTH) {
		ostringstream out;
		out << "mapping tree too deep (block " << b << ")";
		throw corrupt_metadata_error(out.str(), b);
	}

	transaction_manager::read_ref rr = tm_.read_lock(b, validator_);
	btree_detail::node_ref<persistent_data::block_traits> n =
		btree_detail::to_node<persistent_data::block_traits>(rr);

	if (n.get_type() == btree_detail::LEAF) {
		// Only a root can be reached as a leaf here, the leaves
		// below an internal node are never read.
		leaves.push_back(b);
		return;
	}

	n.check_header();
	n.check_keys(lo, hi);

	unsigned nr_entries = n.get_nr_entries();
	if (!nr_entries) {
		ostringstream out;
		out << "empty internal node (block " << b << ")";
		throw corrupt_metadata_error(out.str(), b);
	}

	vector<block_address> children;
	for (unsigned i = 0; i < nr_entries; i++) {
		block_address child = n.value_at(i);
		if (child >= nr_blocks) {
			ostringstream out;
			out << "child pointer " << child << " out of range"
			    << " (block " << b << ", entry " << i << ")";
			throw corrupt_metadata_error(out.str(), b);
		}
		children.push_back(child);
	}

	// Every child sits at the same height, so the first one tells
	// us whether they are leaves.  Leaf types are checked again
	// when the leaves are read.
	bool children_are_leaves;
	{
		transaction_manager::read_ref first = tm_.read_lock(children[0], validator_);
		children_are_leaves =
			btree_detail::to_node<persistent_data::block_traits>(first).get_type() == btree_detail::LEAF;
	}

	leaf_list subtree;
	if (children_are_leaves)
		subtree = children;

	else {
		tm_.get_bm()->prefetch(children);

		for (unsigned i = 0; i < nr_entries; i++) {
			boost::optional<uint64_t> child_hi = hi;
			if (i + 1 < nr_entries)
				child_hi = n.key_at(i + 1);

			walk(children[i], n.key_at(i), child_hi, depth + 1, subtree);
		}
	}

	leaves.insert(leaves.end(), subtree.begin(), subtree.end());
	memo_.insert(make_pair(b, subtree));
}

//----------------------------------------------------------------
