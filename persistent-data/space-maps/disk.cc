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

#include "persistent-data/space-maps/disk.h"

#include "base/endian_utils.h"
#include "base/math_utils.h"
#include "persistent-data/checksum.h"
#include "persistent-data/errors.h"
#include "persistent-data/data-structures/btree.h"
#include "persistent-data/data-structures/btree_builder.h"
#include "persistent-data/space-maps/core.h"

#include <algorithm>
#include <map>
#include <sstream>
#include <string.h>
#include <vector>

using namespace base;
using namespace persistent_data;
using namespace std;
using namespace sm_disk_detail;

//----------------------------------------------------------------

namespace {
	struct bitmap_block_validator : public bcache::validator {
		virtual void check(void const *raw, block_address location) const {
			bitmap_header const *data = reinterpret_cast<bitmap_header const *>(raw);
			if (checksum(data) != to_cpu<uint32_t>(data->csum)) {
				ostringstream out;
				out << "bad checksum in space map bitmap (block " << location << ")";
				throw checksum_error(out.str(), location);
			}

			if (to_cpu<uint64_t>(data->blocknr) != location) {
				ostringstream out;
				out << "bad block nr in space map bitmap (block " << location << ")";
				throw corrupt_metadata_error(out.str(), location);
			}
		}

		virtual bool check_raw(void const *raw) const {
			bitmap_header const *data = reinterpret_cast<bitmap_header const *>(raw);
			return checksum(data) == to_cpu<uint32_t>(data->csum);
		}

		virtual void prepare(void *raw, block_address location) const {
			bitmap_header *data = reinterpret_cast<bitmap_header *>(raw);
			data->blocknr = to_disk<le64, uint64_t>(location);
			data->csum = to_disk<le32>(checksum(data));
		}

	private:
		static uint32_t checksum(bitmap_header const *data) {
			crc32c sum(BITMAP_CSUM_XOR);
			sum.append(&data->not_used, MD_BLOCK_SIZE - sizeof(uint32_t));
			return sum.get_sum();
		}
	};

	//--------------------------------

	// FIXME: factor out the common code in these validators
	struct index_block_validator : public bcache::validator {
		virtual void check(void const *raw, block_address location) const {
			metadata_index const *mi = reinterpret_cast<metadata_index const *>(raw);
			if (checksum(mi) != to_cpu<uint32_t>(mi->csum_)) {
				ostringstream out;
				out << "bad checksum in metadata index block (block " << location << ")";
				throw checksum_error(out.str(), location);
			}

			if (to_cpu<uint64_t>(mi->blocknr_) != location) {
				ostringstream out;
				out << "bad block nr in metadata index block (block " << location << ")";
				throw corrupt_metadata_error(out.str(), location);
			}
		}

		virtual bool check_raw(void const *raw) const {
			metadata_index const *mi = reinterpret_cast<metadata_index const *>(raw);
			return checksum(mi) == to_cpu<uint32_t>(mi->csum_);
		}

		virtual void prepare(void *raw, block_address location) const {
			metadata_index *mi = reinterpret_cast<metadata_index *>(raw);
			mi->blocknr_ = to_disk<le64, uint64_t>(location);
			mi->csum_ = to_disk<le32>(checksum(mi));
		}

	private:
		static uint32_t checksum(metadata_index const *mi) {
			crc32c sum(INDEX_CSUM_XOR);
			sum.append(&mi->padding_, MD_BLOCK_SIZE - sizeof(uint32_t));
			return sum.get_sum();
		}
	};

	//--------------------------------

	void *bitmap_data(transaction_manager::write_ref &wr) {
		bitmap_header *h = reinterpret_cast<bitmap_header *>(wr.data());
		return h + 1;
	}

	void const *bitmap_data(transaction_manager::read_ref const &rr) {
		bitmap_header const *h = reinterpret_cast<bitmap_header const *>(rr.data());
		return h + 1;
	}

	ref_t lookup_entry(void const *bits, block_address b) {
		ref_t result = test_bit_le(bits, b * 2 + 1) ? 1 : 0;
		result |= test_bit_le(bits, b * 2) ? 2 : 0;
		return result;
	}

	void set_entry(void *bits, block_address b, ref_t c) {
		if (c == 1 || c == 3)
			set_bit_le(bits, b * 2 + 1);

		if (c == 2 || c == 3)
			set_bit_le(bits, b * 2);
	}

	block_address nr_bitmaps(block_address nr_blocks) {
		return div_up<block_address>(nr_blocks, ENTRIES_PER_BLOCK);
	}

	block_address entries_in_bitmap(block_address nr_blocks, block_address index) {
		block_address begin = index * ENTRIES_PER_BLOCK;
		return std::min<block_address>(ENTRIES_PER_BLOCK, nr_blocks - begin);
	}

	//--------------------------------

	class index_collector : public btree<1, index_entry_traits>::visitor {
	public:
		virtual bool visit_internal(node_location const &l,
					    btree<1, index_entry_traits>::internal_node const &n) {
			return true;
		}

		virtual bool visit_internal_leaf(node_location const &l,
						 btree<1, index_entry_traits>::internal_node const &n) {
			return true;
		}

		virtual bool visit_leaf(node_location const &l,
					btree<1, index_entry_traits>::leaf_node const &n) {
			for (unsigned i = 0; i < n.get_nr_entries(); i++) {
				if (n.key_at(i) != entries_.size()) {
					ostringstream out;
					out << "space map index has a gap at bitmap " << entries_.size()
					    << " (block " << n.get_location() << ")";
					throw corrupt_metadata_error(out.str(), n.get_location());
				}

				entries_.push_back(n.value_at(i));
			}

			return true;
		}

		vector<index_entry> const &get_entries() const {
			return entries_;
		}

	private:
		vector<index_entry> entries_;
	};

	class overflow_collector : public btree<1, uint32_traits>::visitor {
	public:
		virtual bool visit_internal(node_location const &l,
					    btree<1, uint32_traits>::internal_node const &n) {
			return true;
		}

		virtual bool visit_internal_leaf(node_location const &l,
						 btree<1, uint32_traits>::internal_node const &n) {
			return true;
		}

		virtual bool visit_leaf(node_location const &l,
					btree<1, uint32_traits>::leaf_node const &n) {
			for (unsigned i = 0; i < n.get_nr_entries(); i++)
				counts_[n.key_at(i)] = n.value_at(i);

			return true;
		}

		map<block_address, ref_t> const &get_counts() const {
			return counts_;
		}

	private:
		map<block_address, ref_t> counts_;
	};

	//--------------------------------

	vector<index_entry>
	read_disk_index(transaction_manager &tm, sm_root const &root) {
		index_collector v;
		btree<1, index_entry_traits> index(tm, root.bitmap_root_);
		index.visit_depth_first(v);
		return v.get_entries();
	}

	vector<index_entry>
	read_metadata_index(transaction_manager &tm, sm_root const &root) {
		block_address n = nr_bitmaps(root.nr_blocks_);
		if (n > MAX_METADATA_BITMAPS) {
			ostringstream out;
			out << "metadata space map too large: " << root.nr_blocks_ << " blocks";
			throw corrupt_metadata_error(out.str());
		}

		if (root.bitmap_root_ >= tm.get_bm()->get_nr_blocks()) {
			ostringstream out;
			out << "metadata space map index " << root.bitmap_root_
			    << " beyond the end of the metadata device";
			throw corrupt_metadata_error(out.str(), root.bitmap_root_);
		}

		bcache::validator::ptr v(new index_block_validator());
		transaction_manager::read_ref rr = tm.read_lock(root.bitmap_root_, v);
		metadata_index const *mi = reinterpret_cast<metadata_index const *>(rr.data());

		vector<index_entry> entries;
		for (block_address i = 0; i < n; i++) {
			index_entry ie;
			index_entry_traits::unpack(mi->index[i], ie);
			entries.push_back(ie);
		}

		return entries;
	}

	void check_bitmaps(transaction_manager &tm, sm_root const &root,
			   vector<index_entry> const &entries) {
		if (entries.size() != nr_bitmaps(root.nr_blocks_)) {
			ostringstream out;
			out << "space map index has " << entries.size()
			    << " bitmaps, expected " << nr_bitmaps(root.nr_blocks_);
			throw corrupt_metadata_error(out.str());
		}

		block_address nr_metadata_blocks = tm.get_bm()->get_nr_blocks();
		vector<block_address> blocks;
		for (vector<index_entry>::const_iterator it = entries.begin(); it != entries.end(); ++it) {
			if (it->blocknr_ >= nr_metadata_blocks) {
				ostringstream out;
				out << "space map bitmap " << it->blocknr_
				    << " beyond the end of the metadata device";
				throw corrupt_metadata_error(out.str(), it->blocknr_);
			}
			blocks.push_back(it->blocknr_);
		}

		tm.get_bm()->prefetch(blocks);

		bcache::validator::ptr v(new bitmap_block_validator());
		for (vector<block_address>::const_iterator it = blocks.begin(); it != blocks.end(); ++it)
			tm.read_lock(*it, v);
	}

	space_map::ptr load_sm(transaction_manager &tm, sm_root const &root,
			       vector<index_entry> const &entries) {
		check_bitmaps(tm, root, entries);

		overflow_collector oc;
		btree<1, uint32_traits> ref_counts(tm, root.ref_count_root_);
		ref_counts.visit_depth_first(oc);
		map<block_address, ref_t> const &overflow = oc.get_counts();

		space_map::ptr sm = create_core_map(root.nr_blocks_);
		bcache::validator::ptr v(new bitmap_block_validator());

		for (block_address i = 0; i < entries.size(); i++) {
			transaction_manager::read_ref rr = tm.read_lock(entries[i].blocknr_, v);
			void const *bits = bitmap_data(rr);
			block_address base_block = i * ENTRIES_PER_BLOCK;
			block_address nr_entries = entries_in_bitmap(root.nr_blocks_, i);

			for (block_address b = 0; b < nr_entries; b++) {
				ref_t c = lookup_entry(bits, b);
				if (c == 3) {
					map<block_address, ref_t>::const_iterator it =
						overflow.find(base_block + b);
					if (it == overflow.end()) {
						ostringstream out;
						out << "no ref count entry for overflowed block "
						    << base_block + b;
						throw corrupt_metadata_error(out.str(), entries[i].blocknr_);
					}
					c = it->second;
				}

				if (c)
					sm->set_count(base_block + b, c);
			}
		}

		return sm;
	}

	//--------------------------------

	// Fills a zeroed bitmap block from the counts in sm.
	index_entry fill_bitmap(transaction_manager::write_ref &wr,
				space_map const &sm, block_address index) {
		void *bits = bitmap_data(wr);
		block_address base_block = index * ENTRIES_PER_BLOCK;
		block_address nr_entries = entries_in_bitmap(sm.get_nr_blocks(), index);

		index_entry ie;
		ie.blocknr_ = wr.get_location();
		ie.none_free_before_ = nr_entries;

		for (block_address b = 0; b < nr_entries; b++) {
			ref_t c = sm.get_count(base_block + b);
			if (!c) {
				ie.nr_free_++;
				if (ie.none_free_before_ == nr_entries)
					ie.none_free_before_ = b;
			}

			set_entry(bits, b, std::min<ref_t>(c, 3));
		}

		return ie;
	}

	block_address write_ref_counts(transaction_manager &tm, space_map const &sm) {
		no_op_ref_counter<uint32_t> rc;
		btree_builder<uint32_traits> builder(tm, rc);

		block_address nr_blocks = sm.get_nr_blocks();
		for (block_address b = 0; b < nr_blocks; b++) {
			ref_t c = sm.get_count(b);
			if (c > 2)
				builder.push_value(b, c);
		}

		return builder.complete();
	}

	block_address allocate(transaction_manager &tm) {
		space_map::maybe_block mb = tm.get_sm()->new_block();
		if (!mb)
			throw out_of_space_error("out of metadata space while writing the metadata space map");
		return *mb;
	}
}

//----------------------------------------------------------------

sm_root
persistent_data::read_sm_root(void const *raw)
{
	sm_root_disk d;
	::memcpy(&d, raw, sizeof(d));

	sm_root root;
	sm_root_traits::unpack(d, root);
	return root;
}

void
persistent_data::write_sm_root(sm_root const &root, void *raw)
{
	sm_root_disk d;
	sm_root_traits::pack(root, d);
	::memcpy(raw, &d, sizeof(d));
}

void
persistent_data::check_disk_sm(transaction_manager &tm, sm_root const &root)
{
	check_bitmaps(tm, root, read_disk_index(tm, root));
}

void
persistent_data::check_metadata_sm(transaction_manager &tm, sm_root const &root)
{
	check_bitmaps(tm, root, read_metadata_index(tm, root));
}

space_map::ptr
persistent_data::load_disk_sm(transaction_manager &tm, sm_root const &root)
{
	return load_sm(tm, root, read_disk_index(tm, root));
}

space_map::ptr
persistent_data::load_metadata_sm(transaction_manager &tm, sm_root const &root)
{
	return load_sm(tm, root, read_metadata_index(tm, root));
}

sm_root
persistent_data::write_disk_sm(transaction_manager &tm, space_map const &sm)
{
	bcache::validator::ptr v(new bitmap_block_validator());
	block_address nr_blocks = sm.get_nr_blocks();

	vector<index_entry> entries;
	for (block_address i = 0; i < nr_bitmaps(nr_blocks); i++) {
		transaction_manager::write_ref wr = tm.new_block(v);
		entries.push_back(fill_bitmap(wr, sm, i));
	}

	sm_root root;
	root.nr_blocks_ = nr_blocks;
	root.nr_allocated_ = nr_blocks - sm.get_nr_free();
	root.ref_count_root_ = write_ref_counts(tm, sm);

	no_op_ref_counter<index_entry> rc;
	btree_builder<index_entry_traits> index(tm, rc);
	for (block_address i = 0; i < entries.size(); i++)
		index.push_value(i, entries[i]);
	root.bitmap_root_ = index.complete();

	return root;
}

sm_root
persistent_data::write_metadata_sm(transaction_manager &tm)
{
	space_map::ptr sm = tm.get_sm();
	block_address nr_blocks = sm->get_nr_blocks();
	block_address n = nr_bitmaps(nr_blocks);

	if (n > MAX_METADATA_BITMAPS) {
		ostringstream out;
		out << "metadata space map too large: " << nr_blocks << " blocks";
		throw invariant_error(out.str());
	}

	// Allocating the index and bitmaps only takes counts from 0
	// to 1, so the overflow entries are already final here.
	sm_root root;
	root.ref_count_root_ = write_ref_counts(tm, *sm);
	root.bitmap_root_ = allocate(tm);

	vector<block_address> bitmaps;
	for (block_address i = 0; i < n; i++)
		bitmaps.push_back(allocate(tm));

	root.nr_blocks_ = nr_blocks;
	root.nr_allocated_ = nr_blocks - sm->get_nr_free();

	bcache::validator::ptr bv(new bitmap_block_validator());
	vector<index_entry> entries;
	for (block_address i = 0; i < n; i++) {
		transaction_manager::write_ref wr = tm.get_bm()->write_lock_zero(bitmaps[i], bv);
		entries.push_back(fill_bitmap(wr, *sm, i));
	}

	bcache::validator::ptr iv(new index_block_validator());
	transaction_manager::write_ref wr = tm.get_bm()->write_lock_zero(root.bitmap_root_, iv);
	metadata_index *mi = reinterpret_cast<metadata_index *>(wr.data());
	for (block_address i = 0; i < n; i++)
		index_entry_traits::pack(entries[i], mi->index[i]);

	return root;
}

//----------------------------------------------------------------
