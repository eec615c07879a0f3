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

#include "btree.h"

#include "persistent-data/errors.h"
#include "persistent-data/validators.h"

#include <sstream>
#include <string.h>

//----------------------------------------------------------------

namespace persistent_data {
	using namespace base;
	using namespace btree_detail;

	template <typename ValueTraits>
	node_ref<ValueTraits>::node_ref(block_address location, disk_node *raw)
		: location_(location),
		  raw_(raw)
	{
	}

	template <typename ValueTraits>
	block_address
	node_ref<ValueTraits>::get_block_nr() const
	{
		return to_cpu<uint64_t>(raw_->header.blocknr);
	}

	template <typename ValueTraits>
	btree_detail::node_type
	node_ref<ValueTraits>::get_type() const
	{
		uint32_t flags = to_cpu<uint32_t>(raw_->header.flags);
		if (flags & INTERNAL_NODE) {
			if (flags & LEAF_NODE) {
				std::ostringstream out;
				out << "btree node is both internal and leaf"
				    << " (block " << location_ << ")";
				throw corrupt_metadata_error(out.str(), location_);
			}
			return INTERNAL;

		} else if (flags & LEAF_NODE)
			return LEAF;
		else {
			std::ostringstream out;
			out << "unknown node type"
			    << " (block " << location_ << ")";
			throw corrupt_metadata_error(out.str(), location_);
		}
	}

	template <typename ValueTraits>
	void
	node_ref<ValueTraits>::set_type(node_type t)
	{
		uint32_t flags = 0;
		switch (t) {
		case INTERNAL:
			flags = INTERNAL_NODE;
			break;

		case LEAF:
			flags = LEAF_NODE;
			break;
		}
		raw_->header.flags = to_disk<le32>(flags);
	}

	template <typename ValueTraits>
	unsigned
	node_ref<ValueTraits>::get_nr_entries() const
	{
		return to_cpu<uint32_t>(raw_->header.nr_entries);
	}

	template <typename ValueTraits>
	void
	node_ref<ValueTraits>::set_nr_entries(unsigned n)
	{
		raw_->header.nr_entries = to_disk<le32>(static_cast<uint32_t>(n));
	}

	template <typename ValueTraits>
	unsigned
	node_ref<ValueTraits>::get_max_entries() const
	{
		return to_cpu<uint32_t>(raw_->header.max_entries);
	}

	template <typename ValueTraits>
	void
	node_ref<ValueTraits>::set_max_entries(unsigned n)
	{
		raw_->header.max_entries = to_disk<le32>(static_cast<uint32_t>(n));
	}

	template <typename ValueTraits>
	size_t
	node_ref<ValueTraits>::get_value_size() const
	{
		return to_cpu<uint32_t>(raw_->header.value_size);
	}

	template <typename ValueTraits>
	void
	node_ref<ValueTraits>::set_value_size(size_t s)
	{
		raw_->header.value_size = to_disk<le32>(static_cast<uint32_t>(s));
	}

	template <typename ValueTraits>
	void
	node_ref<ValueTraits>::init(node_type t)
	{
		set_type(t);
		set_nr_entries(0);
		set_max_entries(calc_max_entries());
		set_value_size(sizeof(typename ValueTraits::disk_type));
	}

	template <typename ValueTraits>
	uint64_t
	node_ref<ValueTraits>::key_at(unsigned i) const
	{
		check_index(i);
		return to_cpu<uint64_t>(raw_->keys[i]);
	}

	template <typename ValueTraits>
	void
	node_ref<ValueTraits>::set_key(unsigned i, uint64_t k)
	{
		raw_->keys[i] = to_disk<le64>(k);
	}

	template <typename ValueTraits>
	typename ValueTraits::value_type
	node_ref<ValueTraits>::value_at(unsigned i) const
	{
		check_index(i);

		// We have to copy because of alignment issues.
		typename ValueTraits::disk_type d;
		::memcpy(&d, value_ptr(i), sizeof(d));

		typename ValueTraits::value_type v;
		ValueTraits::unpack(d, v);
		return v;
	}

	template <typename ValueTraits>
	void
	node_ref<ValueTraits>::set_value(unsigned i,
					 typename ValueTraits::value_type const &v)
	{
		typename ValueTraits::disk_type d;
		ValueTraits::pack(v, d);
		::memcpy(value_ptr(i), &d, sizeof(d));
	}

	template <typename ValueTraits>
	void
	node_ref<ValueTraits>::push_back(uint64_t key,
					 typename ValueTraits::value_type const &v)
	{
		unsigned n = get_nr_entries();
		if (n >= get_max_entries())
			throw invariant_error("too many entries");

		set_nr_entries(n + 1);
		set_key(n, key);
		set_value(n, v);
	}

	template <typename ValueTraits>
	int
	node_ref<ValueTraits>::bsearch(uint64_t key, int want_hi) const
	{
		int lo = -1, hi = get_nr_entries();

		while(hi - lo > 1) {
			int mid = lo + ((hi - lo) / 2);
			uint64_t mid_key = key_at(mid);

			if (mid_key == key)
				return mid;

			if (mid_key < key)
				lo = mid;
			else
				hi = mid;
		}

		return want_hi ? hi : lo;
	}

	template <typename ValueTraits>
	boost::optional<unsigned>
	node_ref<ValueTraits>::exact_search(uint64_t key) const
	{
		int i = bsearch(key, 0);
		if (i < 0 || static_cast<unsigned>(i) >= get_nr_entries())
			return boost::optional<unsigned>();

		if (key != key_at(i))
			return boost::optional<unsigned>();

		return boost::optional<unsigned>(i);
	}

	template <typename ValueTraits>
	int
	node_ref<ValueTraits>::lower_bound(uint64_t key) const
	{
		return bsearch(key, 0);
	}

	template <typename ValueTraits>
	void
	node_ref<ValueTraits>::check_header() const
	{
		if (get_value_size() != sizeof(typename ValueTraits::disk_type)) {
			std::ostringstream out;
			out << "value size mismatch: expected " << sizeof(typename ValueTraits::disk_type)
			    << ", but got " << get_value_size()
			    << " (block " << location_ << ")";
			throw corrupt_metadata_error(out.str(), location_);
		}

		unsigned max = calc_max_entries();
		if (get_max_entries() > max) {
			std::ostringstream out;
			out << "max entries too large: " << get_max_entries()
			    << " > " << max << " (block " << location_ << ")";
			throw corrupt_metadata_error(out.str(), location_);
		}

		if (get_nr_entries() > get_max_entries()) {
			std::ostringstream out;
			out << "bad nr of entries: max = " << get_max_entries()
			    << ", actual = " << get_nr_entries()
			    << " (block " << location_ << ")";
			throw corrupt_metadata_error(out.str(), location_);
		}
	}

	template <typename ValueTraits>
	void
	node_ref<ValueTraits>::check_keys(boost::optional<uint64_t> lo,
					  boost::optional<uint64_t> hi) const
	{
		unsigned nr_entries = get_nr_entries();
		boost::optional<uint64_t> last;

		for (unsigned i = 0; i < nr_entries; i++) {
			uint64_t k = key_at(i);

			if (last && k <= *last) {
				std::ostringstream out;
				out << "keys out of order: " << *last << " then " << k
				    << " (block " << location_ << ")";
				throw corrupt_metadata_error(out.str(), location_);
			}

			if ((lo && k < *lo) || (hi && k >= *hi)) {
				std::ostringstream out;
				out << "key " << k << " outside the range given by the parent"
				    << " (block " << location_ << ")";
				throw corrupt_metadata_error(out.str(), location_);
			}

			last = k;
		}
	}

	template <typename ValueTraits>
	unsigned
	node_ref<ValueTraits>::calc_max_entries()
	{
		uint32_t total;

		// key + value
		size_t elt_size = sizeof(uint64_t) + sizeof(typename ValueTraits::disk_type);
		total = (MD_BLOCK_SIZE - sizeof(struct node_header)) / elt_size;
		return (total / 3) * 3; // rounds down
	}

	template <typename ValueTraits>
	void
	node_ref<ValueTraits>::check_index(unsigned i) const
	{
		if (i >= get_nr_entries()) {
			std::ostringstream out;
			out << "entry index " << i << " out of bounds"
			    << " (block " << location_ << ")";
			throw invariant_error(out.str());
		}
	}

	template <typename ValueTraits>
	void *
	node_ref<ValueTraits>::key_ptr(unsigned i) const
	{
		return raw_->keys + i;
	}

	template <typename ValueTraits>
	void *
	node_ref<ValueTraits>::value_ptr(unsigned i) const
	{
		void *value_base = &raw_->keys[to_cpu<uint32_t>(raw_->header.max_entries)];
		return static_cast<unsigned char *>(value_base) +
			sizeof(typename ValueTraits::disk_type) * i;
	}

	//--------------------------------

	template <unsigned Levels, typename ValueTraits>
	btree<Levels, ValueTraits>::btree(transaction_manager &tm,
					  block_address root)
		: tm_(tm),
		  root_(root),
		  validator_(create_btree_node_validator())
	{
	}

	template <unsigned Levels, typename ValueTraits>
	typename btree<Levels, ValueTraits>::read_ref
	btree<Levels, ValueTraits>::read_node(block_address b) const
	{
		if (b >= tm_.get_bm()->get_nr_blocks()) {
			std::ostringstream out;
			out << "btree node " << b << " beyond the end of the metadata device ("
			    << tm_.get_bm()->get_nr_blocks() << " blocks)";
			throw corrupt_metadata_error(out.str(), b);
		}

		return tm_.read_lock(b, validator_);
	}

	template <unsigned Levels, typename ValueTraits>
	typename btree<Levels, ValueTraits>::maybe_value
	btree<Levels, ValueTraits>::lookup(key const &key) const
	{
		block_address b = root_;

		for (unsigned level = 0; level < Levels; level++) {
			for (;;) {
				read_ref blk = read_node(b);
				internal_node n = to_node<block_traits>(blk);

				if (n.get_type() == INTERNAL) {
					n.check_header();
					int i = n.lower_bound(key[level]);
					if (i < 0)
						return maybe_value();
					b = n.value_at(i);
					continue;
				}

				if (level < Levels - 1) {
					n.check_header();
					boost::optional<unsigned> i = n.exact_search(key[level]);
					if (!i)
						return maybe_value();
					b = n.value_at(*i);
					break;
				}

				leaf_node leaf = to_node<ValueTraits>(blk);
				leaf.check_header();
				boost::optional<unsigned> i = leaf.exact_search(key[level]);
				if (!i)
					return maybe_value();
				return maybe_value(leaf.value_at(*i));
			}
		}

		return maybe_value();
	}

	template <unsigned Levels, typename ValueTraits>
	void
	btree<Levels, ValueTraits>::visit_depth_first(visitor &v) const
	{
		node_location loc;

		walk_tree(v, loc, root_);
		v.visit_complete();
	}

	template <unsigned Levels, typename ValueTraits>
	void
	btree<Levels, ValueTraits>::walk_tree(visitor &v,
					      node_location const &loc,
					      block_address b) const
	{
		read_ref blk = read_node(b);
		internal_node o = to_node<block_traits>(blk);

		switch (o.get_type()) {
		case INTERNAL:
			o.check_header();
			o.check_keys(loc.key, loc.hi);
			if (v.visit_internal(loc, o)) {
				unsigned nr_entries = o.get_nr_entries();
				for (unsigned i = 0; i < nr_entries; i++) {
					check_child(o, i);
					tm_.prefetch(o.value_at(i));
				}

				for (unsigned i = 0; i < nr_entries; i++) {
					node_location loc2(loc);

					loc2.inc_depth();
					loc2.key = o.key_at(i);
					if (i + 1 < nr_entries)
						loc2.hi = o.key_at(i + 1);

					walk_tree(v, loc2, o.value_at(i));
				}
			}
			break;

		case LEAF:
			if (loc.path.size() < Levels - 1) {
				o.check_header();
				o.check_keys(loc.key, loc.hi);
				if (v.visit_internal_leaf(loc, o)) {
					unsigned nr_entries = o.get_nr_entries();
					for (unsigned i = 0; i < nr_entries; i++) {
						node_location loc2(loc);

						check_child(o, i);
						loc2.push_key(o.key_at(i));
						loc2.key = boost::optional<uint64_t>();
						loc2.hi = boost::optional<uint64_t>();

						walk_tree(v, loc2, o.value_at(i));
					}
				}

			} else {
				leaf_node ov = to_node<ValueTraits>(blk);
				ov.check_header();
				ov.check_keys(loc.key, loc.hi);
				v.visit_leaf(loc, ov);
			}
			break;
		}
	}

	template <unsigned Levels, typename ValueTraits>
	void
	btree<Levels, ValueTraits>::check_child(internal_node const &n, unsigned i) const
	{
		block_address child = n.value_at(i);
		if (child >= tm_.get_bm()->get_nr_blocks()) {
			std::ostringstream out;
			out << "child pointer " << child << " out of range"
			    << " (block " << n.get_location() << ", entry " << i << ")";
			throw corrupt_metadata_error(out.str(), n.get_location());
		}
	}
}

//----------------------------------------------------------------
