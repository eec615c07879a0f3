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
#include "persistent-data/data-structures/btree_builder.h"
#include "persistent-data/errors.h"
#include "persistent-data/space-maps/core.h"
#include "thin-merge/mapping_stream.h"
#include "thin-merge/mapping_tree.h"
#include "unit-tests/test_utils.h"

#include <algorithm>

using namespace base;
using namespace persistent_data;
using namespace std;
using namespace test;
using namespace testing;
using namespace thin_merge;
using namespace thin_merge::mapping_tree_detail;

//----------------------------------------------------------------

namespace {
	block_address const NR_BLOCKS = 1024;
	block_address const NR_DATA_BLOCKS = 16384;

	class MappingStreamTests : public Test {
	public:
		MappingStreamTests()
			: file_("mapping_stream", NR_BLOCKS),
			  bm_(open_temp_bm(file_)),
			  tm_(open_temporary_tm(bm_)),
			  data_sm_(create_core_map(NR_DATA_BLOCKS)) {
		}

		block_address build(mapping_map const &m) {
			block_time_ref_counter rc(data_sm_);
			btree_builder<mapping_tree_detail::block_traits> builder(*tm_, rc);

			mapping_map::const_iterator it;
			for (it = m.begin(); it != m.end(); ++it)
				builder.push_value(it->first, it->second);

			return builder.complete();
		}

		leaf_list leaves_of(block_address root) {
			leaf_collector lc(*tm_);
			return lc.collect(root);
		}

		mapping_map drain(mapping_stream &s) {
			mapping_map r;
			while (s.more_mappings()) {
				mapping const &m = s.get_mapping();
				r.insert(make_pair(m.vblock_, m.bt_));
				s.step();
			}
			return r;
		}

		temp_file file_;
		block_manager::ptr bm_;
		transaction_manager::ptr tm_;
		space_map::ptr data_sm_;
	};
}

//----------------------------------------------------------------

TEST_F(MappingStreamTests, mappings_come_out_in_order)
{
	mapping_map m = make_run(0, 100, 600, 3);
	leaf_list leaves = leaves_of(build(m));
	ASSERT_THAT(leaves.size(), Eq(3u));

	mapping_stream s(*tm_, leaves, 2);
	ASSERT_THAT(drain(s), Eq(m));
}

TEST_F(MappingStreamTests, empty_tree_has_no_mappings)
{
	leaf_list leaves = leaves_of(build(mapping_map()));
	ASSERT_THAT(leaves.size(), Eq(1u));

	mapping_stream s(*tm_, leaves, 1);
	ASSERT_FALSE(s.more_mappings());
	ASSERT_FALSE(s.at_leaf_start());
	ASSERT_THROW(s.get_mapping(), invariant_error);
	ASSERT_THROW(s.current_leaf(), invariant_error);
}

TEST_F(MappingStreamTests, empty_leaf_list)
{
	mapping_stream s(*tm_, leaf_list(), 4);
	ASSERT_FALSE(s.more_mappings());
}

TEST_F(MappingStreamTests, leaf_boundaries_are_visible)
{
	leaf_list leaves = leaves_of(build(make_run(0, 100, 600)));
	mapping_stream s(*tm_, leaves, 1);

	ASSERT_TRUE(s.at_leaf_start());
	ASSERT_THAT(s.current_leaf(), Eq(leaves[0]));

	s.step();
	ASSERT_FALSE(s.at_leaf_start());

	for (unsigned i = 1; i < 252; i++)
		s.step();

	ASSERT_TRUE(s.at_leaf_start());
	ASSERT_THAT(s.current_leaf(), Eq(leaves[1]));
	ASSERT_THAT(s.get_mapping().vblock_, Eq(252u));
}

TEST_F(MappingStreamTests, skip_leaf_moves_to_the_next_leaf)
{
	leaf_list leaves = leaves_of(build(make_run(0, 100, 600)));
	mapping_stream s(*tm_, leaves, 1);

	ASSERT_THAT(s.leaf_entries().size(), Eq(252u));
	ASSERT_THAT(s.leaf_entries()[0].vblock_, Eq(0u));

	s.skip_leaf();
	ASSERT_THAT(s.current_leaf(), Eq(leaves[1]));
	ASSERT_THAT(s.get_mapping().vblock_, Eq(252u));
	ASSERT_THAT(s.get_mapping().bt_, Eq(block_time(352, 0)));

	s.skip_leaf();
	s.skip_leaf();
	ASSERT_FALSE(s.more_mappings());
}

TEST_F(MappingStreamTests, leaves_out_of_order_are_corrupt)
{
	leaf_list leaves = leaves_of(build(make_run(0, 100, 600)));
	std::reverse(leaves.begin(), leaves.end());

	mapping_stream s(*tm_, leaves, 3);
	ASSERT_THROW(drain(s), corrupt_metadata_error);
}

TEST_F(MappingStreamTests, internal_node_in_leaf_list_is_corrupt)
{
	block_address root = build(make_run(0, 100, 600));

	leaf_list leaves;
	leaves.push_back(root);
	mapping_stream s(*tm_, leaves, 1);
	ASSERT_THROW(s.more_mappings(), corrupt_metadata_error);
}

TEST_F(MappingStreamTests, data_blocks_are_referenced_on_build)
{
	build(make_run(10, 500, 20));
	ASSERT_THAT(data_sm_->get_count(500), Eq(1u));
	ASSERT_THAT(data_sm_->get_count(519), Eq(1u));
	ASSERT_THAT(data_sm_->get_count(520), Eq(0u));
}

TEST_F(MappingStreamTests, collector_remembers_shared_subtrees)
{
	block_address root = build(make_run(0, 100, 600));

	leaf_collector lc(*tm_);
	leaf_list first = lc.collect(root);
	ASSERT_THAT(lc.get_nr_shared(), Eq(0u));

	leaf_list second = lc.collect(root);
	ASSERT_THAT(lc.get_nr_shared(), Eq(1u));
	ASSERT_THAT(second, Eq(first));
}

TEST_F(MappingStreamTests, collector_rejects_children_beyond_the_device)
{
	ASSERT_THROW(leaves_of(NR_BLOCKS + 5), corrupt_metadata_error);
}

//----------------------------------------------------------------
