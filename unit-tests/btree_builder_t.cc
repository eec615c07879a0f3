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
#include "unit-tests/test_utils.h"

using namespace base;
using namespace persistent_data;
using namespace std;
using namespace test;
using namespace testing;

//----------------------------------------------------------------

namespace {
	block_address const NR_BLOCKS = 1024;

	typedef btree<1, uint64_traits> uint64_tree;

	class ref_counter_mock : public ref_counter<uint64_t> {
	public:
		MOCK_METHOD1(inc, void(uint64_t const &));
	};

	// Records the size of every leaf, in key order.
	class leaf_sizes : public uint64_tree::visitor {
	public:
		virtual bool visit_internal(node_location const &l,
					    uint64_tree::internal_node const &n) {
			return true;
		}

		virtual bool visit_internal_leaf(node_location const &l,
						 uint64_tree::internal_node const &n) {
			return true;
		}

		virtual bool visit_leaf(node_location const &l,
					uint64_tree::leaf_node const &n) {
			sizes_.push_back(n.get_nr_entries());
			blocks_.push_back(n.get_location());
			return true;
		}

		vector<unsigned> sizes_;
		vector<block_address> blocks_;
	};

	class BtreeBuilderTests : public Test {
	public:
		BtreeBuilderTests()
			: file_("btree_builder", NR_BLOCKS),
			  bm_(open_temp_bm(file_)),
			  tm_(open_temporary_tm(bm_)),
			  max_entries_(btree_detail::node_ref<uint64_traits>::calc_max_entries()) {
		}

		leaf_sizes walk(block_address root) {
			leaf_sizes v;
			uint64_tree tree(*tm_, root);
			tree.visit_depth_first(v);
			return v;
		}

		block_address build(unsigned nr) {
			no_op_ref_counter<uint64_t> rc;
			btree_builder<uint64_traits> builder(*tm_, rc);
			for (unsigned i = 0; i < nr; i++)
				builder.push_value(i, i);

			return builder.complete();
		}

		temp_file file_;
		block_manager::ptr bm_;
		transaction_manager::ptr tm_;
		unsigned max_entries_;
	};
}

//----------------------------------------------------------------

TEST_F(BtreeBuilderTests, max_entries_for_64bit_values)
{
	ASSERT_THAT(max_entries_, Eq(252u));
}

TEST_F(BtreeBuilderTests, empty_tree_is_a_single_empty_leaf)
{
	block_address root = build(0);
	leaf_sizes v = walk(root);

	ASSERT_THAT(v.sizes_.size(), Eq(1u));
	ASSERT_THAT(v.sizes_[0], Eq(0u));
	ASSERT_THAT(tm_->get_sm()->get_count(root), Eq(1u));
}

TEST_F(BtreeBuilderTests, leaves_are_packed)
{
	leaf_sizes v = walk(build(max_entries_ * 4));

	ASSERT_THAT(v.sizes_.size(), Eq(4u));
	for (unsigned i = 0; i < v.sizes_.size(); i++)
		ASSERT_THAT(v.sizes_[i], Eq(max_entries_));
}

TEST_F(BtreeBuilderTests, last_two_leaves_are_balanced)
{
	leaf_sizes v = walk(build(max_entries_ * 3 + 1));

	ASSERT_THAT(v.sizes_.size(), Eq(4u));
	for (unsigned i = 0; i < v.sizes_.size(); i++)
		ASSERT_THAT(v.sizes_[i], Ge(max_entries_ / 2));
}

TEST_F(BtreeBuilderTests, every_block_is_counted_once)
{
	build(max_entries_ * 300);

	space_map::ptr sm = tm_->get_sm();
	for (block_address b = 0; b < sm->get_nr_blocks(); b++)
		ASSERT_THAT(sm->get_count(b), Le(1u));

	// 300 leaves, 2 internal nodes and a root
	ASSERT_THAT(sm->get_nr_blocks() - sm->get_nr_free(), Eq(303u));
}

TEST_F(BtreeBuilderTests, values_are_reference_counted)
{
	ref_counter_mock rc;
	EXPECT_CALL(rc, inc(_)).Times(1000);

	btree_builder<uint64_traits> builder(*tm_, rc);
	for (unsigned i = 0; i < 1000; i++)
		builder.push_value(i, i + 7);
	builder.complete();
}

TEST_F(BtreeBuilderTests, keys_must_increase)
{
	no_op_ref_counter<uint64_t> rc;
	btree_builder<uint64_traits> builder(*tm_, rc);
	builder.push_value(10, 0);

	ASSERT_THROW(builder.push_value(10, 0), invariant_error);
	ASSERT_THROW(builder.push_value(9, 0), invariant_error);
}

TEST_F(BtreeBuilderTests, leaves_can_be_shared)
{
	no_op_ref_counter<uint64_t> rc;

	vector<btree_detail::node_summary> shared;
	{
		btree_builder<uint64_traits> builder(*tm_, rc);
		for (unsigned i = 0; i < 600; i++)
			builder.push_value(i, i);
		shared = builder.complete_leaves();
	}

	ASSERT_THAT(shared.size(), Eq(3u));

	block_address roots[2];
	for (unsigned t = 0; t < 2; t++) {
		btree_builder<uint64_traits> builder(*tm_, rc);
		for (unsigned i = 0; i < shared.size(); i++)
			builder.push_leaf(shared[i]);

		builder.push_value(1000 + t, t);
		roots[t] = builder.complete();
	}

	leaf_sizes v0 = walk(roots[0]);
	leaf_sizes v1 = walk(roots[1]);
	ASSERT_THAT(v0.blocks_.size(), Eq(4u));
	ASSERT_THAT(v1.blocks_.size(), Eq(4u));

	for (unsigned i = 0; i < shared.size(); i++) {
		ASSERT_THAT(v0.blocks_[i], Eq(shared[i].block));
		ASSERT_THAT(v1.blocks_[i], Eq(shared[i].block));
		ASSERT_THAT(tm_->get_sm()->get_count(shared[i].block), Eq(3u));
	}

	ASSERT_THAT(v0.blocks_[3], Ne(v1.blocks_[3]));
}

TEST_F(BtreeBuilderTests, runs_out_of_space)
{
	// each value needs its own leaf once the tree is wider than
	// the device
	ASSERT_THROW(build(max_entries_ * NR_BLOCKS), out_of_space_error);
}

//----------------------------------------------------------------
