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

#include "thin-merge/restore_emitter.h"

#include "persistent-data/errors.h"
#include "persistent-data/data-structures/btree_builder.h"
#include "persistent-data/space-maps/core.h"
#include "thin-merge/device_tree.h"
#include "thin-merge/mapping_tree.h"

#include <map>
#include <memory>
#include <sstream>
#include <string.h>
#include <vector>

using namespace base;
using namespace persistent_data;
using namespace std;
using namespace thin_merge;

//----------------------------------------------------------------

namespace {
	using namespace superblock_detail;

	typedef btree_builder<mapping_tree_detail::block_traits> mapping_builder;

	struct named_mapping {
		named_mapping()
			: nr_mappings_(0) {
		}

		vector<btree_detail::node_summary> leaves_;
		uint64_t nr_mappings_;
	};

	class restorer : public emitter {
	public:
		restorer(metadata::ptr md)
			: md_(md),
			  in_superblock_(false),
			  nr_data_blocks_(0) {
		}

		virtual void begin_superblock(std::string const &uuid,
					      uint64_t time,
					      uint64_t trans_id,
					      boost::optional<uint32_t> flags,
					      boost::optional<uint32_t> version,
					      uint32_t data_block_size,
					      uint64_t nr_data_blocks,
					      boost::optional<uint64_t> metadata_snap) {
			if (in_superblock_)
				throw invariant_error("superblock already begun");

			in_superblock_ = true;
			nr_data_blocks_ = nr_data_blocks;

			superblock &sb = md_->sb_;
			memset(&sb.uuid_, 0, sizeof(sb.uuid_));
			memcpy(&sb.uuid_, uuid.c_str(), std::min(sizeof(sb.uuid_), uuid.length()));
			sb.time_ = time;
			sb.trans_id_ = trans_id;
			sb.flags_ = flags ? *flags : 0;
			sb.version_ = version ? *version : 1;
			sb.data_block_size_ = data_block_size;
			sb.metadata_snap_ = metadata_snap ? *metadata_snap : 0;

			md_->data_sm_ = create_core_map(nr_data_blocks);
			rc_.reset(new mapping_tree_detail::block_time_ref_counter(md_->data_sm_));
		}

		virtual void end_superblock() {
			if (!in_superblock_)
				throw invariant_error("missing superblock");

			if (current_device_ || current_name_)
				throw invariant_error("superblock ended inside a device or named mapping");

			transaction_manager &tm = *md_->tm_;

			device_tree_detail::device_details_traits::ref_counter details_rc;
			btree_builder<device_tree_detail::device_details_traits> details(tm, details_rc);

			no_op_ref_counter<uint64_t> roots_rc;
			btree_builder<persistent_data::block_traits> roots(tm, roots_rc);

			map<uint32_t, device>::const_iterator it;
			for (it = devices_.begin(); it != devices_.end(); ++it) {
				details.push_value(it->first, it->second.details_);
				roots.push_value(it->first, it->second.root_);
			}

			md_->sb_.device_details_root_ = details.complete();
			md_->sb_.data_mapping_root_ = roots.complete();

			// The named mappings hold a reference to their leaves
			// until every device has been built.
			map<string, named_mapping>::const_iterator nit;
			for (nit = named_.begin(); nit != named_.end(); ++nit) {
				vector<btree_detail::node_summary>::const_iterator lit;
				for (lit = nit->second.leaves_.begin(); lit != nit->second.leaves_.end(); ++lit)
					md_->metadata_sm_->dec(lit->block);
			}

			md_->commit();
			in_superblock_ = false;
		}

		virtual void begin_device(uint32_t dev,
					  uint64_t mapped_blocks,
					  uint64_t trans_id,
					  uint64_t creation_time,
					  uint64_t snap_time) {
			if (!in_superblock_)
				throw invariant_error("missing superblock");

			if (current_device_ || current_name_)
				throw invariant_error("device begun inside another device or named mapping");

			if (devices_.count(dev)) {
				ostringstream out;
				out << "device " << dev << " already exists";
				throw invariant_error(out.str());
			}

			if (!devices_.empty() && dev < devices_.rbegin()->first) {
				ostringstream out;
				out << "device " << dev << " emitted out of order";
				throw invariant_error(out.str());
			}

			// mapped_blocks is recalculated from the mappings
			current_details_ = device_tree_detail::device_details();
			current_details_.transaction_id_ = trans_id;
			current_details_.creation_time_ = static_cast<uint32_t>(creation_time);
			current_details_.snapshotted_time_ = static_cast<uint32_t>(snap_time);

			current_device_ = dev;
			builder_.reset(new mapping_builder(*md_->tm_, *rc_));
		}

		virtual void end_device() {
			if (!current_device_)
				throw invariant_error("not in device");

			device d;
			d.details_ = current_details_;
			d.root_ = builder_->complete();
			devices_.insert(make_pair(*current_device_, d));

			builder_.reset();
			current_device_ = boost::optional<uint32_t>();
		}

		virtual void begin_named_mapping(std::string const &name) {
			if (!in_superblock_)
				throw invariant_error("missing superblock");

			if (current_device_ || current_name_)
				throw invariant_error("named mapping begun inside a device or named mapping");

			if (named_.count(name))
				throw invariant_error("named mapping '" + name + "' already exists");

			current_name_ = name;
			current_named_ = named_mapping();
			builder_.reset(new mapping_builder(*md_->tm_, *rc_));
		}

		virtual void end_named_mapping() {
			if (!current_name_)
				throw invariant_error("not in named mapping");

			current_named_.leaves_ = builder_->complete_leaves();
			named_.insert(make_pair(*current_name_, current_named_));

			builder_.reset();
			current_name_ = boost::optional<string>();
		}

		virtual void identifier(std::string const &name) {
			if (!current_device_)
				throw invariant_error("identifier outside of a device");

			map<string, named_mapping>::const_iterator it = named_.find(name);
			if (it == named_.end())
				throw invariant_error("unknown named mapping '" + name + "'");

			vector<btree_detail::node_summary>::const_iterator lit;
			for (lit = it->second.leaves_.begin(); lit != it->second.leaves_.end(); ++lit)
				builder_->push_leaf(*lit);

			current_details_.mapped_blocks_ += it->second.nr_mappings_;
		}

		virtual void range_map(uint64_t origin_begin, uint64_t data_begin, uint32_t time, uint64_t len) {
			for (uint64_t i = 0; i < len; i++)
				single_map(origin_begin++, data_begin++, time);
		}

		virtual void single_map(uint64_t origin_block, uint64_t data_block, uint32_t time) {
			if (!current_device_ && !current_name_)
				throw invariant_error("mapping outside of a device or named mapping");

			if (data_block >= nr_data_blocks_) {
				std::ostringstream out;
				out << "mapping beyond end of data device (" << data_block
				    << " >= " << nr_data_blocks_ << ")";
				throw corrupt_metadata_error(out.str());
			}

			if (time > mapping_tree_detail::MAX_TIME) {
				std::ostringstream out;
				out << "mapping time " << time << " too large for the on disk format";
				throw corrupt_metadata_error(out.str());
			}

			builder_->push_value(origin_block,
					     mapping_tree_detail::block_time(data_block, time));

			if (current_device_)
				current_details_.mapped_blocks_++;
			else
				current_named_.nr_mappings_++;
		}

	private:
		struct device {
			device()
				: root_(0) {
			}

			device_tree_detail::device_details details_;
			block_address root_;
		};

		metadata::ptr md_;

		bool in_superblock_;
		block_address nr_data_blocks_;
		unique_ptr<mapping_tree_detail::block_time_ref_counter> rc_;

		boost::optional<uint32_t> current_device_;
		device_tree_detail::device_details current_details_;

		boost::optional<string> current_name_;
		named_mapping current_named_;

		unique_ptr<mapping_builder> builder_;
		map<uint32_t, device> devices_;
		map<string, named_mapping> named_;
	};
}

//----------------------------------------------------------------

emitter::ptr
thin_merge::create_restore_emitter(metadata::ptr md)
{
	return emitter::ptr(new restorer(md));
}

//----------------------------------------------------------------
