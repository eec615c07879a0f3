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

#include "thin-merge/merge.h"

#include "base/math_utils.h"
#include "persistent-data/errors.h"
#include "persistent-data/file_utils.h"
#include "persistent-data/space-maps/disk_structures.h"
#include "thin-merge/device_tree.h"
#include "thin-merge/emitter.h"
#include "thin-merge/mapping_stream.h"
#include "thin-merge/mapping_tree.h"
#include "thin-merge/metadata.h"
#include "thin-merge/restore_emitter.h"

#include <algorithm>
#include <sstream>

using namespace base;
using namespace persistent_data;
using namespace std;
using namespace thin_merge;

//----------------------------------------------------------------

namespace {
	using namespace mapping_tree_detail;

	// Coalesces mappings into runs of adjacent virtual blocks
	// mapped to adjacent data blocks with the same time.
	class run_builder {
	public:
		explicit run_builder(emitter::ptr e)
			: e_(e),
			  origin_start_(0),
			  dest_start_(0),
			  time_(0),
			  len_(0),
			  in_range_(false),
			  nr_mappings_(0) {
		}

		void add_mapping(mapping const &m) {
			if (!in_range_)
				start_mapping(m);

			else if (m.vblock_ == origin_start_ + len_ &&
				 m.bt_.block_ == dest_start_ + len_ &&
				 time_ == m.bt_.time_)
				len_++;

			else {
				end_mapping();
				start_mapping(m);
			}

			nr_mappings_++;
		}

		void complete() {
			end_mapping();
		}

		uint64_t get_nr_mappings() const {
			return nr_mappings_;
		}

	private:
		void start_mapping(mapping const &m) {
			origin_start_ = m.vblock_;
			dest_start_ = m.bt_.block_;
			time_ = m.bt_.time_;
			len_ = 1;
			in_range_ = true;
		}

		void end_mapping() {
			if (in_range_) {
				if (len_ == 1)
					e_->single_map(origin_start_, dest_start_, time_);
				else
					e_->range_map(origin_start_, dest_start_, time_, len_);

				in_range_ = false;
			}
		}

		emitter::ptr e_;
		block_address origin_start_;
		block_address dest_start_;
		uint32_t time_;
		block_address len_;
		bool in_range_;
		uint64_t nr_mappings_;
	};

	void add_leaf(run_builder &rb, vector<mapping> const &entries) {
		vector<mapping>::const_iterator it;
		for (it = entries.begin(); it != entries.end(); ++it)
			rb.add_mapping(*it);
	}

	// Walks both streams in lock step.  Where both hold a
	// mapping for a block the snapshot's wins.  Returns the
	// number of leaves found shared by the two streams.
	unsigned merge_mappings(mapping_stream &origin, mapping_stream &snap, run_builder &rb) {
		unsigned nr_shared = 0;

		for (;;) {
			if (origin.at_leaf_start() && snap.at_leaf_start() &&
			    origin.current_leaf() == snap.current_leaf()) {
				add_leaf(rb, snap.leaf_entries());
				origin.skip_leaf();
				snap.skip_leaf();
				nr_shared++;
				continue;
			}

			bool origin_more = origin.more_mappings();
			bool snap_more = snap.more_mappings();

			if (!origin_more && !snap_more)
				break;

			if (!snap_more) {
				rb.add_mapping(origin.get_mapping());
				origin.step();

			} else if (!origin_more) {
				rb.add_mapping(snap.get_mapping());
				snap.step();

			} else {
				uint64_t o = origin.get_mapping().vblock_;
				uint64_t s = snap.get_mapping().vblock_;

				if (o < s) {
					rb.add_mapping(origin.get_mapping());
					origin.step();

				} else if (s < o) {
					rb.add_mapping(snap.get_mapping());
					snap.step();

				} else {
					rb.add_mapping(snap.get_mapping());
					origin.step();
					snap.step();
				}
			}
		}

		return nr_shared;
	}

	void copy_mappings(mapping_stream &origin, run_builder &rb) {
		while (origin.more_mappings()) {
			rb.add_mapping(origin.get_mapping());
			origin.step();
		}
	}

	block_address lookup_root(device_roots const &roots, uint64_t dev) {
		device_roots::const_iterator it = roots.find(dev);
		if (it == roots.end()) {
			ostringstream out;
			out << "unable to find mapping tree for device " << dev;
			throw invariant_error(out.str());
		}

		return it->second;
	}

	device_tree_detail::device_details
	lookup_details(device_tree_detail::device_map const &details, uint64_t dev) {
		device_tree_detail::device_map::const_iterator it = details.find(dev);
		if (it == details.end()) {
			ostringstream out;
			out << "unable to find details for device " << dev;
			throw invariant_error(out.str());
		}

		return it->second;
	}

	block_address nr_tree_nodes(block_address nr_entries, block_address max_entries) {
		block_address level = std::max<block_address>(div_up(nr_entries, max_entries), 1);
		block_address total = level;

		while (level > 1) {
			level = div_up(level, max_entries);
			total += level;
		}

		return total;
	}
}

//----------------------------------------------------------------

merge_options::merge_options()
	: origin_(0),
	  use_metadata_snap_(false),
	  rebase_(false),
	  engine_(SYNC_IO),
	  queue_depth_(DEFAULT_QUEUE_DEPTH),
	  quiet_(false)
{
}

block_address
thin_merge::estimate_metadata_blocks(uint64_t nr_mappings,
				     block_address nr_data_blocks,
				     block_address nr_metadata_blocks)
{
	using namespace sm_disk_detail;

	block_address mapping_entries =
		btree_detail::node_ref<mapping_tree_detail::block_traits>::calc_max_entries();
	block_address index_entries =
		btree_detail::node_ref<index_entry_traits>::calc_max_entries();

	block_address data_bitmaps = div_up(nr_data_blocks, ENTRIES_PER_BLOCK);
	block_address metadata_bitmaps = div_up(nr_metadata_blocks, ENTRIES_PER_BLOCK);

	// superblock, device details and top level trees
	block_address total = 3;
	total += nr_tree_nodes(nr_mappings, mapping_entries);

	// bitmaps, index and ref count trees
	total += data_bitmaps + nr_tree_nodes(data_bitmaps, index_entries) + 1;
	total += metadata_bitmaps + 1 + 1;

	return total;
}

void
thin_merge::merge_thins(merge_options const &opts, nested_output &out)
{
	block_manager::ptr in_bm = open_bm(opts.input_, block_manager::READ_ONLY,
					   !opts.use_metadata_snap_,
					   opts.engine_, opts.queue_depth_);
	metadata::ptr in(new metadata(in_bm, opts.use_metadata_snap_));

	if (opts.use_metadata_snap_)
		out << "reading metadata snapshot at block " << in->sb_.blocknr_ << end_message();
	else
		out << "reading live superblock" << end_message();

	{
		nested_output::nest _(out);
		out << "transaction id " << in->sb_.trans_id_
		    << ", time " << in->sb_.time_
		    << ", data block size " << in->sb_.data_block_size_ << end_message();
	}

	in->check();

	device_tree_detail::device_map details = read_device_details(*in->tm_, in->sb_.device_details_root_);
	device_roots roots = read_device_roots(*in->tm_, in->sb_.data_mapping_root_);

	block_address origin_root = lookup_root(roots, opts.origin_);
	device_tree_detail::device_details origin_details = lookup_details(details, opts.origin_);
	uint64_t nr_mappings = origin_details.mapped_blocks_;

	uint64_t dev_id = opts.origin_;
	device_tree_detail::device_details dd = origin_details;

	block_address snap_root = 0;
	if (opts.snapshot_) {
		snap_root = lookup_root(roots, *opts.snapshot_);
		device_tree_detail::device_details snap_details = lookup_details(details, *opts.snapshot_);
		// the merged tree holds at most the mappings of both
		nr_mappings += snap_details.mapped_blocks_;

		if (opts.rebase_) {
			dev_id = *opts.snapshot_;
			dd = snap_details;
		}

		out << "merging snapshot " << *opts.snapshot_ << " into origin " << opts.origin_
		    << ", output device " << dev_id << end_message();
	} else
		out << "copying device " << opts.origin_ << end_message();

	block_manager::ptr out_bm = open_bm(opts.output_, block_manager::READ_WRITE,
					    true, opts.engine_, opts.queue_depth_);
	block_address nr_out = std::min<block_address>(out_bm->get_nr_blocks(),
						       sm_disk_detail::MAX_METADATA_BLOCKS);
	block_address needed = estimate_metadata_blocks(nr_mappings, in->get_nr_data_blocks(), nr_out);
	if (out_bm->get_nr_blocks() < needed) {
		ostringstream msg;
		msg << "output too small: " << out_bm->get_nr_blocks()
		    << " blocks, at least " << needed << " required";
		throw size_error(msg.str());
	}

	// Whatever superblock the output held must not survive a
	// failure once nodes start being written over its trees.
	{
		block_manager::write_ref w = out_bm->superblock_zero(superblock_detail::SUPERBLOCK_LOCATION);
	}
	out_bm->flush();

	leaf_collector collector(*in->tm_);
	leaf_list origin_leaves = collector.collect(origin_root);
	leaf_list snap_leaves;
	if (opts.snapshot_)
		snap_leaves = collector.collect(snap_root);

	{
		nested_output::nest _(out);
		out << "origin: " << origin_leaves.size() << " leaves" << end_message();
		if (opts.snapshot_) {
			out << "snapshot: " << snap_leaves.size() << " leaves, "
			    << collector.get_nr_shared() << " internal nodes shared" << end_message();
		}
	}

	metadata::ptr md(new metadata(out_bm));
	emitter::ptr e = create_restore_emitter(md);

	e->begin_superblock("", in->sb_.time_, in->sb_.trans_id_,
			    boost::optional<uint32_t>(0),
			    boost::optional<uint32_t>(in->sb_.version_),
			    in->sb_.data_block_size_,
			    in->get_nr_data_blocks(),
			    boost::optional<uint64_t>());

	e->begin_device(static_cast<uint32_t>(dev_id), dd.mapped_blocks_, dd.transaction_id_,
			dd.creation_time_, dd.snapshotted_time_);

	run_builder rb(e);
	mapping_stream origin_stream(*in->tm_, origin_leaves, opts.queue_depth_);

	if (opts.snapshot_) {
		mapping_stream snap_stream(*in->tm_, snap_leaves, opts.queue_depth_);
		unsigned nr_shared = merge_mappings(origin_stream, snap_stream, rb);

		nested_output::nest _(out);
		out << nr_shared << " leaves shared by origin and snapshot" << end_message();
	} else
		copy_mappings(origin_stream, rb);

	rb.complete();
	e->end_device();

	{
		nested_output::nest _(out);
		out << rb.get_nr_mappings() << " mappings" << end_message();
	}

	out << "writing device tree, space maps and superblock" << end_message();
	e->end_superblock();

	{
		nested_output::nest _(out);
		out << md->metadata_sm_->get_nr_blocks() - md->metadata_sm_->get_nr_free()
		    << " metadata blocks used" << end_message();
	}
}

//----------------------------------------------------------------
