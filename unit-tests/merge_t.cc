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
#include "thin-merge/commands.h"
#include "thin-merge/merge.h"
#include "unit-tests/test_utils.h"

#include <getopt.h>
#include <sstream>
#include <stdexcept>

using namespace base;
using namespace persistent_data;
using namespace std;
using namespace test;
using namespace testing;
using namespace thin_merge;
using namespace thin_merge::mapping_tree_detail;

//----------------------------------------------------------------

namespace {
	block_address const NR_METADATA_BLOCKS = 1024;
	block_address const NR_DATA_BLOCKS = 16384;

	uint32_t const ORIGIN = 2;
	uint32_t const SNAP = 1;

	block_time bt(uint64_t b, uint32_t t = 0) {
		return block_time(b, t);
	}

	class MergeTests : public Test {
	public:
		MergeTests()
			: input_("merge_input", NR_METADATA_BLOCKS),
			  output_("merge_output", NR_METADATA_BLOCKS),
			  log_stream_(),
			  log_(log_stream_, 2) {
			opts_.input_ = input_.get_path();
			opts_.output_ = output_.get_path();
			opts_.origin_ = ORIGIN;
			opts_.snapshot_ = SNAP;
		}

		void write_input(metadata_builder &b, uint64_t trans_id = 1, uint32_t time = 1) {
			block_manager::ptr bm = open_temp_bm(input_);
			b.write(bm, trans_id, time);
		}

		// origin {0->100, 1->101, 2->102}, snapshot {1->201, 3->103}
		void write_scenario() {
			mapping_map origin;
			origin[0] = bt(100);
			origin[1] = bt(101);
			origin[2] = bt(102);

			mapping_map snap;
			snap[1] = bt(201);
			snap[3] = bt(103);

			metadata_builder b(NR_DATA_BLOCKS);
			b.device(SNAP, snap, 20, 5, 7);
			b.device(ORIGIN, origin, 10, 3, 0);
			write_input(b, 30, 9);
		}

		void merge() {
			merge_thins(opts_, log_);
		}

		block_manager::ptr output_bm() {
			return open_temp_bm(output_, block_manager::READ_ONLY);
		}

		mapping_map output_mappings(uint64_t dev) {
			return read_mappings(output_bm(), dev);
		}

		static mapping_map expected_scenario() {
			mapping_map m;
			m[0] = bt(100);
			m[1] = bt(201);
			m[2] = bt(102);
			m[3] = bt(103);
			return m;
		}

		temp_file input_;
		temp_file output_;
		ostringstream log_stream_;
		nested_output log_;
		merge_options opts_;
	};
}

//----------------------------------------------------------------

TEST_F(MergeTests, snapshot_mappings_shadow_the_origin)
{
	write_scenario();
	merge();

	ASSERT_THAT(output_mappings(ORIGIN), Eq(expected_scenario()));
}

TEST_F(MergeTests, merge_publishes_under_the_origin_id)
{
	write_scenario();
	merge();

	mapping_tree_detail::device_roots roots = read_roots(output_bm());
	ASSERT_THAT(roots.size(), Eq(1u));
	ASSERT_THAT(roots.count(ORIGIN), Eq(1u));

	device_tree_detail::device_map details = read_details(output_bm());
	ASSERT_THAT(details.size(), Eq(1u));

	device_tree_detail::device_details const &dd = details[ORIGIN];
	ASSERT_THAT(dd.transaction_id_, Eq(10u));
	ASSERT_THAT(dd.creation_time_, Eq(3u));
	ASSERT_THAT(dd.snapshotted_time_, Eq(0u));
	ASSERT_THAT(dd.mapped_blocks_, Eq(4u));
}

TEST_F(MergeTests, rebase_publishes_under_the_snapshot_id)
{
	write_scenario();
	opts_.rebase_ = true;
	merge();

	ASSERT_THAT(output_mappings(SNAP), Eq(expected_scenario()));

	mapping_tree_detail::device_roots roots = read_roots(output_bm());
	ASSERT_THAT(roots.size(), Eq(1u));
	ASSERT_THAT(roots.count(SNAP), Eq(1u));

	device_tree_detail::device_map details = read_details(output_bm());
	ASSERT_THAT(details.size(), Eq(1u));

	device_tree_detail::device_details const &dd = details[SNAP];
	ASSERT_THAT(dd.transaction_id_, Eq(20u));
	ASSERT_THAT(dd.creation_time_, Eq(5u));
	ASSERT_THAT(dd.snapshotted_time_, Eq(7u));
	ASSERT_THAT(dd.mapped_blocks_, Eq(4u));
}

TEST_F(MergeTests, superblock_fields_are_carried_over)
{
	write_scenario();
	merge();

	superblock_detail::superblock sb = read_sb(output_bm());
	ASSERT_THAT(sb.trans_id_, Eq(30u));
	ASSERT_THAT(sb.time_, Eq(9u));
	ASSERT_THAT(sb.version_, Eq(2u));
	ASSERT_THAT(sb.data_block_size_, Eq(128u));
	ASSERT_THAT(sb.flags_, Eq(0u));
	ASSERT_THAT(sb.metadata_snap_, Eq(0u));
	ASSERT_THAT(sb.metadata_nr_blocks_, Eq(NR_METADATA_BLOCKS));

	ASSERT_THAT(read_data_sm(output_bm())->get_nr_blocks(), Eq(NR_DATA_BLOCKS));
}

TEST_F(MergeTests, merging_is_deterministic)
{
	temp_file second("merge_output2", NR_METADATA_BLOCKS);

	write_scenario();
	merge();

	opts_.output_ = second.get_path();
	merge();

	ASSERT_TRUE(files_identical(output_.get_path(), second.get_path()));
}

TEST_F(MergeTests, fallback_coverage_and_holes)
{
	mapping_map origin = make_run(0, 1000, 600);
	mapping_map snap = make_run(100, 5000, 50, 3);
	mapping_map more = make_run(1000, 7000, 10, 4);
	snap.insert(more.begin(), more.end());

	metadata_builder b(NR_DATA_BLOCKS);
	b.device(SNAP, snap);
	b.device(ORIGIN, origin);
	write_input(b);
	merge();

	mapping_map merged = output_mappings(ORIGIN);
	ASSERT_THAT(merged.size(), Eq(610u));

	for (uint64_t vblock = 0; vblock < 2000; vblock++) {
		if (snap.count(vblock))
			ASSERT_THAT(merged[vblock], Eq(snap[vblock]));

		else if (origin.count(vblock))
			ASSERT_THAT(merged[vblock], Eq(origin[vblock]));

		else
			ASSERT_THAT(merged.count(vblock), Eq(0u));
	}
}

TEST_F(MergeTests, time_stamps_are_preserved)
{
	mapping_map origin;
	origin[0] = bt(10, 1);
	origin[1] = bt(11, 2);

	mapping_map snap;
	snap[1] = bt(20, 3);
	snap[2] = bt(21, 4);

	metadata_builder b(NR_DATA_BLOCKS);
	b.device(SNAP, snap);
	b.device(ORIGIN, origin);
	write_input(b);
	merge();

	mapping_map merged = output_mappings(ORIGIN);
	ASSERT_THAT(merged[0], Eq(bt(10, 1)));
	ASSERT_THAT(merged[1], Eq(bt(20, 3)));
	ASSERT_THAT(merged[2], Eq(bt(21, 4)));
}

TEST_F(MergeTests, data_ref_counts_match_the_merged_tree)
{
	mapping_map origin;
	origin[0] = bt(100);
	origin[1] = bt(101);
	origin[2] = bt(102);
	origin[5] = bt(300);

	// vblock 5 maps to the same data block in both trees,
	// vblock 6 aliases data block 100
	mapping_map snap;
	snap[1] = bt(201);
	snap[5] = bt(300);
	snap[6] = bt(100);

	metadata_builder b(NR_DATA_BLOCKS);
	b.device(SNAP, snap);
	b.device(ORIGIN, origin);
	write_input(b);
	merge();

	mapping_map merged = output_mappings(ORIGIN);
	map<uint64_t, unsigned> expected;
	for (mapping_map::const_iterator it = merged.begin(); it != merged.end(); ++it)
		expected[it->second.block_]++;

	space_map::ptr sm = read_data_sm(output_bm());
	ASSERT_THAT(sm->get_count(100), Eq(2u));
	ASSERT_THAT(sm->get_count(101), Eq(0u));
	ASSERT_THAT(sm->get_count(300), Eq(1u));

	block_address nr_allocated = 0;
	for (block_address b = 0; b < sm->get_nr_blocks(); b++) {
		if (sm->get_count(b))
			nr_allocated++;

		unsigned e = expected.count(b) ? expected[b] : 0;
		ASSERT_THAT(sm->get_count(b), Eq(e));
	}

	ASSERT_THAT(nr_allocated, Eq(expected.size()));
	ASSERT_THAT(sm->get_nr_free(), Eq(NR_DATA_BLOCKS - expected.size()));
}

TEST_F(MergeTests, metadata_ref_counts_cover_the_output_trees)
{
	write_scenario();
	merge();

	block_manager::ptr bm = output_bm();
	space_map::ptr sm = read_metadata_sm(bm);
	superblock_detail::superblock sb = read_sb(bm);

	ASSERT_THAT(sm->get_count(superblock_detail::SUPERBLOCK_LOCATION), Eq(1u));
	ASSERT_THAT(sm->get_count(sb.data_mapping_root_), Eq(1u));
	ASSERT_THAT(sm->get_count(sb.device_details_root_), Eq(1u));
	ASSERT_THAT(sm->get_count(read_roots(bm)[ORIGIN]), Eq(1u));
}

TEST_F(MergeTests, copies_the_origin_without_a_snapshot)
{
	write_scenario();
	opts_.snapshot_ = boost::optional<uint64_t>();
	merge();

	mapping_map expected;
	expected[0] = bt(100);
	expected[1] = bt(101);
	expected[2] = bt(102);

	ASSERT_THAT(output_mappings(ORIGIN), Eq(expected));
	ASSERT_THAT(read_roots(output_bm()).size(), Eq(1u));
}

TEST_F(MergeTests, merging_large_trees)
{
	// several levels of internal nodes in each tree
	mapping_map origin = make_run(0, 0, 12000, 1);
	mapping_map snap = make_run(12000, 16000, 100, 2);
	for (uint64_t v = 0; v < 12000; v += 3)
		snap[v] = bt(12000 + v / 3, 2);

	metadata_builder b(NR_DATA_BLOCKS);
	b.device(SNAP, snap);
	b.device(ORIGIN, origin);
	write_input(b);
	merge();

	mapping_map merged = output_mappings(ORIGIN);
	mapping_map expected = origin;
	for (mapping_map::const_iterator it = snap.begin(); it != snap.end(); ++it)
		expected[it->first] = it->second;

	ASSERT_THAT(merged.size(), Eq(expected.size()));
	ASSERT_TRUE(merged == expected);
	ASSERT_THAT(read_details(output_bm())[ORIGIN].mapped_blocks_, Eq(expected.size()));
}

TEST_F(MergeTests, shared_leaves_are_merged_once)
{
	metadata_builder b(NR_DATA_BLOCKS);
	b.named("common", make_run(0, 0, 600));
	b.device_sharing(SNAP, "common", make_run(1000, 2000, 5, 1));
	b.device_sharing(ORIGIN, "common", make_run(1002, 3000, 10, 2));
	write_input(b);

	{
		// the shared leaves are referenced by both trees
		block_manager::ptr bm = open_temp_bm(input_, block_manager::READ_ONLY);
		space_map::ptr sm = read_metadata_sm(bm);
		mapping_tree_detail::device_roots roots = read_roots(bm);

		transaction_manager::ptr tm = open_temporary_tm(bm);
		leaf_collector collector(*tm);
		mapping_tree_detail::leaf_list origin_leaves = collector.collect(roots[ORIGIN]);
		mapping_tree_detail::leaf_list snap_leaves = collector.collect(roots[SNAP]);

		ASSERT_THAT(origin_leaves[0], Eq(snap_leaves[0]));
		ASSERT_THAT(sm->get_count(origin_leaves[0]), Eq(2u));
	}

	merge();

	mapping_map expected = make_run(0, 0, 600);
	mapping_map tail = make_run(1000, 2000, 5, 1);
	expected.insert(tail.begin(), tail.end());
	expected[1005] = bt(3003, 2);
	for (uint64_t v = 1006; v < 1012; v++)
		expected[v] = bt(3000 + v - 1002, 2);

	ASSERT_TRUE(output_mappings(ORIGIN) == expected);
	ASSERT_THAT(read_details(output_bm())[ORIGIN].mapped_blocks_, Eq(612u));

	// all three leaves of "common"
	ASSERT_THAT(log_stream_.str(), ContainsRegex("(^|[ \\n])3 leaves shared by origin and snapshot"));
}

TEST_F(MergeTests, missing_device_is_an_invariant_error)
{
	write_scenario();
	opts_.origin_ = 99;

	ASSERT_THROW(merge(), invariant_error);
}

TEST_F(MergeTests, corrupt_node_is_rejected)
{
	write_scenario();

	block_address root;
	{
		block_manager::ptr bm = open_temp_bm(input_, block_manager::READ_ONLY);
		root = read_roots(bm)[ORIGIN];
	}

	// inside the entries, past the node header
	corrupt_block(input_, root, 100);

	ASSERT_THROW(merge(), corrupt_metadata_error);
}

TEST_F(MergeTests, corrupt_details_tree_is_rejected_before_writing)
{
	write_scenario();

	block_address root;
	{
		block_manager::ptr bm = open_temp_bm(input_, block_manager::READ_ONLY);
		root = read_sb(bm).device_details_root_;
	}
	corrupt_block(input_, root, 40);

	ASSERT_THROW(merge(), corrupt_metadata_error);
	ASSERT_TRUE(file_is_zeroed(output_.get_path()));
}

TEST_F(MergeTests, undersized_output_is_rejected_before_writing)
{
	temp_file tiny("merge_tiny", 4);

	write_scenario();
	opts_.output_ = tiny.get_path();

	ASSERT_THROW(merge(), size_error);
	ASSERT_TRUE(file_is_zeroed(tiny.get_path()));
}

TEST_F(MergeTests, size_check_counts_mappings_from_both_devices)
{
	block_address const nr_data_blocks = 65536;

	// disjoint, so the merged tree holds every mapping of both
	metadata_builder b(nr_data_blocks);
	b.device(SNAP, make_run(30000, 30000, 30000));
	b.device(ORIGIN, make_run(0, 0, 30000));
	write_input(b);

	block_address needed = estimate_metadata_blocks(60000, nr_data_blocks, NR_METADATA_BLOCKS);
	ASSERT_THAT(needed, Gt(estimate_metadata_blocks(30000, nr_data_blocks, NR_METADATA_BLOCKS)));

	temp_file small("merge_small", needed - 1);
	opts_.output_ = small.get_path();

	ASSERT_THROW(merge(), size_error);
	ASSERT_TRUE(file_is_zeroed(small.get_path()));
}

TEST_F(MergeTests, failed_merge_invalidates_an_existing_output)
{
	write_scenario();
	merge();
	ASSERT_NO_THROW(read_sb(output_bm()));

	metadata_builder b(NR_DATA_BLOCKS);
	b.device(SNAP, make_run(0, 5000, 10));
	b.device(ORIGIN, make_run(0, 0, 2000));
	write_input(b);

	// a leaf the pre-merge check never reads
	block_address last_leaf;
	{
		block_manager::ptr bm = open_temp_bm(input_, block_manager::READ_ONLY);
		transaction_manager::ptr tm = open_temporary_tm(bm);
		leaf_collector collector(*tm);
		mapping_tree_detail::leaf_list leaves = collector.collect(read_roots(bm)[ORIGIN]);
		ASSERT_THAT(leaves.size(), Gt(2u));
		last_leaf = leaves.back();
	}
	corrupt_block(input_, last_leaf, 100);

	ASSERT_THROW(merge(), corrupt_metadata_error);
	ASSERT_THROW(read_sb(output_bm()), corrupt_metadata_error);
}

TEST_F(MergeTests, async_engine_writes_the_same_image)
{
	temp_file second("merge_output_async", NR_METADATA_BLOCKS);

	metadata_builder b(NR_DATA_BLOCKS);
	b.device(SNAP, make_run(500, 8000, 700, 1));
	b.device(ORIGIN, make_run(0, 0, 3000));
	write_input(b);
	merge();

	opts_.output_ = second.get_path();
	opts_.engine_ = bcache::ASYNC_IO;
	merge();

	ASSERT_TRUE(files_identical(output_.get_path(), second.get_path()));
}

TEST_F(MergeTests, size_estimate_grows_with_the_mappings)
{
	block_address small = estimate_metadata_blocks(0, NR_DATA_BLOCKS, NR_METADATA_BLOCKS);
	block_address large = estimate_metadata_blocks(100000, NR_DATA_BLOCKS, NR_METADATA_BLOCKS);

	ASSERT_THAT(small, Ge(8u));
	ASSERT_THAT(large, Gt(small + 100000 / 252));
}

TEST_F(MergeTests, merges_from_the_metadata_snapshot)
{
	write_scenario();
	{
		block_manager::ptr bm = open_temp_bm(input_);
		take_metadata_snap(bm, NR_METADATA_BLOCKS - 1);
		break_live_roots(bm);
	}

	ASSERT_THROW(merge(), corrupt_metadata_error);

	opts_.use_metadata_snap_ = true;
	merge();

	ASSERT_THAT(output_mappings(ORIGIN), Eq(expected_scenario()));
	ASSERT_THAT(read_data_sm(output_bm())->get_nr_blocks(), Eq(NR_DATA_BLOCKS));
}

TEST_F(MergeTests, metadata_snapshot_must_exist)
{
	write_scenario();
	opts_.use_metadata_snap_ = true;

	try {
		merge();
		FAIL() << "merge succeeded without a metadata snapshot";

	} catch (std::runtime_error const &e) {
		ASSERT_THAT(string(e.what()), Eq("no current metadata snap"));
	}
}

TEST_F(MergeTests, progress_is_logged_unless_disabled)
{
	write_scenario();
	merge();
	ASSERT_THAT(log_stream_.str(), HasSubstr("mappings"));

	log_stream_.str("");
	log_.disable();
	merge();
	ASSERT_TRUE(log_stream_.str().empty());
}

//----------------------------------------------------------------

namespace {
	class CommandTests : public MergeTests {
	public:
		int run(vector<string> const &args) {
			vector<char *> argv;
			for (vector<string>::const_iterator it = args.begin(); it != args.end(); ++it)
				argv.push_back(const_cast<char *>(it->c_str()));
			argv.push_back(NULL);

			optind = 0;
			thin_merge_cmd cmd;
			return cmd.run(static_cast<int>(args.size()), &argv[0]);
		}

		vector<string> base_args() {
			vector<string> args;
			args.push_back("thin_merge");
			args.push_back("-q");
			args.push_back("-i");
			args.push_back(input_.get_path());
			args.push_back("-o");
			args.push_back(output_.get_path());
			args.push_back("--origin");
			args.push_back("2");
			args.push_back("--snapshot");
			args.push_back("1");
			return args;
		}
	};
}

TEST_F(CommandTests, successful_merge_exits_with_zero)
{
	write_scenario();

	ASSERT_THAT(run(base_args()), Eq(0));
	ASSERT_THAT(output_mappings(ORIGIN), Eq(expected_scenario()));
}

TEST_F(CommandTests, rebase_option)
{
	write_scenario();

	vector<string> args = base_args();
	args.push_back("--rebase");

	ASSERT_THAT(run(args), Eq(0));
	ASSERT_THAT(output_mappings(SNAP), Eq(expected_scenario()));
}

TEST_F(CommandTests, failure_exits_with_one)
{
	write_scenario();

	block_address root;
	{
		block_manager::ptr bm = open_temp_bm(input_, block_manager::READ_ONLY);
		root = read_roots(bm)[ORIGIN];
	}
	corrupt_block(input_, root, 100);

	ASSERT_THAT(run(base_args()), Eq(1));
}

TEST_F(CommandTests, queue_depth_must_fit_an_unsigned)
{
	write_scenario();

	vector<string> args = base_args();
	args.push_back("--queue-depth");
	args.push_back("4294967296");

	ASSERT_EXIT(run(args), ExitedWithCode(1), "Queue depth must be between 1 and 4294967295");
}

TEST_F(CommandTests, missing_origin_is_a_usage_error)
{
	write_scenario();

	vector<string> args;
	args.push_back("thin_merge");
	args.push_back("-i");
	args.push_back(input_.get_path());
	args.push_back("-o");
	args.push_back(output_.get_path());

	ASSERT_THAT(run(args), Eq(1));
}

//----------------------------------------------------------------
