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
#include "persistent-data/data-structures/btree.h"
#include "persistent-data/data-structures/btree_builder.h"
#include "persistent-data/data-structures/simple_traits.h"
#include "persistent-data/errors.h"
#include "persistent-data/validators.h"
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

	typedef btree<1, uint64_traits> uint64_tree;

	class key_collector : public uint64_tree::visitor {
	public:
		key_collector()
			: nr_internal_(0) {
		}

		virtual bool visit_internal(node_location const &l,
					    uint64_tree::internal_node const &n) {
			nr_internal_++;
			return true;
		}

		virtual bool visit_internal_leaf(node_location const &l,
						 uint64_tree::internal_node const &n) {
			return true;
		}

		virtual bool visit_leaf(node_location const &l,
					uint64_tree::leaf_node const &n) {
			for (unsigned i = 0; i < n.get_nr_entries(); i++)
				keys_.push_back(n.key_at(i));
			return true;
		}

		vector<uint64_t> keys_;
		unsigned nr_internal_;
	};

	class BtreeTests : public Test {
	public:
		BtreeTests()
			: file_("btree", NR_BLOCKS) {
			open();
		}

		void open() {
			bm_ = open_temp_bm(file_);
			tm_ = open_temporary_tm(bm_);
		}

		void close() {
			bm_->flush();
			tm_.reset();
			bm_.reset();
		}

		// key i -> value i * 3, for keys [0, nr) step 2
		block_address build(unsigned nr) {
			no_op_ref_counter<uint64_t> rc;
			btree_builder<uint64_traits> builder(*tm_, rc);
			for (unsigned i = 0; i < nr; i += 2)
				builder.push_value(i, i * 3);

			return builder.complete();
		}

		// A hand built node, so it can break the rules.
		block_address write_node(btree_detail::node_type t,
					 vector<pair<uint64_t, uint64_t> > const &entries) {
			transaction_manager::write_ref wr = tm_->new_block(create_btree_node_validator());
			btree_detail::node_ref<uint64_traits> n = btree_detail::to_node<uint64_traits>(wr);
			n.init(t);
			for (unsigned i = 0; i < entries.size(); i++)
				n.push_back(entries[i].first, entries[i].second);

			return wr.get_location();
		}

		void walk(block_address root) {
			key_collector v;
			uint64_tree tree(*tm_, root);
			tree.visit_depth_first(v);
		}

		temp_file file_;
		block_manager::ptr bm_;
		transaction_manager::ptr tm_;
	};
}

//----------------------------------------------------------------

TEST_F(BtreeTests, empty_tree_has_no_values)
{
	uint64_tree tree(*tm_, build(0));
	uint64_t key[1] = {0};
	ASSERT_FALSE(tree.lookup(key));
}

TEST_F(BtreeTests, lookups_in_a_single_leaf)
{
	uint64_tree tree(*tm_, build(100));

	for (uint64_t k = 0; k < 100; k++) {
		uint64_t key[1] = {k};
		uint64_tree::maybe_value v = tree.lookup(key);

		if (k % 2) {
			ASSERT_FALSE(v);
		} else {
			ASSERT_TRUE(!!v);
			ASSERT_THAT(*v, Eq(k * 3));
		}
	}
}

TEST_F(BtreeTests, lookups_across_several_levels)
{
	uint64_tree tree(*tm_, build(200000));

	uint64_t key[1];
	for (uint64_t k = 0; k < 200000; k += 2) {
		key[0] = k;
		ASSERT_THAT(tree.lookup(key), Eq(uint64_tree::maybe_value(k * 3)));
	}

	key[0] = 200001;
	ASSERT_FALSE(tree.lookup(key));
}

TEST_F(BtreeTests, walk_visits_keys_in_order)
{
	block_address root = build(20000);

	key_collector v;
	uint64_tree tree(*tm_, root);
	tree.visit_depth_first(v);

	ASSERT_THAT(v.keys_.size(), Eq(10000u));
	for (unsigned i = 0; i < v.keys_.size(); i++)
		ASSERT_THAT(v.keys_[i], Eq(i * 2u));

	ASSERT_THAT(v.nr_internal_, Gt(0u));
}

TEST_F(BtreeTests, keys_out_of_order_in_a_leaf)
{
	vector<pair<uint64_t, uint64_t> > entries;
	entries.push_back(make_pair(5, 1));
	entries.push_back(make_pair(3, 2));

	ASSERT_THROW(walk(write_node(btree_detail::LEAF, entries)), corrupt_metadata_error);
}

TEST_F(BtreeTests, child_beyond_the_device)
{
	vector<pair<uint64_t, uint64_t> > entries;
	entries.push_back(make_pair(0, NR_BLOCKS + 10));

	ASSERT_THROW(walk(write_node(btree_detail::INTERNAL, entries)), corrupt_metadata_error);
}

TEST_F(BtreeTests, child_keys_must_lie_within_the_parent_range)
{
	vector<pair<uint64_t, uint64_t> > left;
	left.push_back(make_pair(0, 0));
	left.push_back(make_pair(150, 0));
	block_address l = write_node(btree_detail::LEAF, left);

	vector<pair<uint64_t, uint64_t> > right;
	right.push_back(make_pair(100, 0));
	block_address r = write_node(btree_detail::LEAF, right);

	vector<pair<uint64_t, uint64_t> > parent;
	parent.push_back(make_pair(0, l));
	parent.push_back(make_pair(100, r));

	ASSERT_THROW(walk(write_node(btree_detail::INTERNAL, parent)), corrupt_metadata_error);
}

TEST_F(BtreeTests, checksum_failure_is_reported_with_the_location)
{
	block_address root = build(100);
	close();
	corrupt_block(file_, root, 200);
	open();

	try {
		walk(root);
		FAIL() << "walk succeeded over a corrupt node";

	} catch (checksum_error const &e) {
		ASSERT_THAT(e.get_location(), Eq(boost::optional<uint64_t>(root)));
	}
}

TEST_F(BtreeTests, misplaced_node_is_rejected)
{
	block_address root = build(100);
	close();

	// copy the node to another block
	{
		block_manager::ptr bm = open_temp_bm(file_);
		{
			block_manager::read_ref src = bm->read_lock(root);
			block_manager::write_ref dest = bm->write_lock(root + 1);
			::memcpy(dest.data(), src.data(), MD_BLOCK_SIZE);
		}
		bm->flush();
	}

	open();
	ASSERT_THROW(walk(root + 1), corrupt_metadata_error);
}

//----------------------------------------------------------------
