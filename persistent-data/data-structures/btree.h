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

#ifndef BTREE_H
#define BTREE_H

#include "persistent-data/transaction_manager.h"
#include "persistent-data/data-structures/btree_disk_structures.h"
#include "persistent-data/data-structures/simple_traits.h"

#include <boost/noncopyable.hpp>
#include <boost/optional.hpp>
#include <vector>

//----------------------------------------------------------------

namespace persistent_data {
	namespace btree_detail {
		//------------------------------------------------
		// Class that acts as an interface over the raw little endian btree
		// node data.
		template <typename ValueTraits>
		class node_ref {
		public:
			typedef typename ValueTraits::value_type value_type;

			explicit node_ref(block_address b, disk_node *raw);

			block_address get_location() const {
				return location_;
			}

			block_address get_block_nr() const;

			// Throws corrupt_metadata_error if the flags are
			// neither, or both, of internal and leaf.
			node_type get_type() const;
			void set_type(node_type t);

			unsigned get_nr_entries() const;
			void set_nr_entries(unsigned n);

			unsigned get_max_entries() const;
			void set_max_entries(unsigned n);

			size_t get_value_size() const;
			void set_value_size(size_t);

			// Formats an empty node of the given type, with the
			// maximum number of entries for this value type.
			void init(node_type t);

			uint64_t key_at(unsigned i) const;
			void set_key(unsigned i, uint64_t k);

			value_type value_at(unsigned i) const;
			void set_value(unsigned i, value_type const &v);

			// Appends an entry, incrementing nr_entries.
			void push_back(uint64_t key, value_type const &v);

			// Various searches
			int bsearch(uint64_t key, int want_hi) const;
			boost::optional<unsigned> exact_search(uint64_t key) const;
			int lower_bound(uint64_t key) const;

			// Checks that the header describes a node of this
			// value type that fits within the block.  Must be
			// called before any entries are accessed in a node
			// read from disk.
			void check_header() const;

			// Keys must be strictly increasing, and lie within
			// [lo, hi) as given by the parent.
			void check_keys(boost::optional<uint64_t> lo,
					boost::optional<uint64_t> hi) const;

			static unsigned calc_max_entries();

		private:
			void check_index(unsigned i) const;
			void *key_ptr(unsigned i) const;
			void *value_ptr(unsigned i) const;

			block_address location_;
			disk_node *raw_;
		};

		template <typename ValueTraits>
		node_ref<ValueTraits>
		to_node(transaction_manager::read_ref const &b)
		{
			return node_ref<ValueTraits>(
				b.get_location(),
				reinterpret_cast<disk_node *>(
					const_cast<void *>(b.data())));
		}

		template <typename ValueTraits>
		node_ref<ValueTraits>
		to_node(transaction_manager::write_ref &b)
		{
			return node_ref<ValueTraits>(
				b.get_location(),
				reinterpret_cast<disk_node *>(b.data()));
		}

		// Used to keep a record of a nested btree's position.
		typedef std::vector<uint64_t> btree_path;

		// Used when visiting the nodes that make up a btree.
		struct node_location {
			node_location()
				: depth(0) {
			}

			void inc_depth() {
				depth++;
			}

			void push_key(uint64_t k) {
				path.push_back(k);
				depth = 0;
			}

			// Keys used to access this sub tree
			btree_path path;

			// in this sub tree
			unsigned depth;

			// This is the key from the parent node to this
			// node.  If this node is a root then there will be
			// no parent, and hence no key.
			boost::optional<uint64_t> key;

			// Upper bound (exclusive) on the keys in this node,
			// taken from the parent's next key.
			boost::optional<uint64_t> hi;
		};
	}

	// A read only view of an on disk btree.  Nodes are validated
	// as they are read; corruption is reported with
	// corrupt_metadata_error (or checksum_error) naming the block.
	template <unsigned Levels, typename ValueTraits>
	class btree {
	public:
		typedef boost::shared_ptr<btree<Levels, ValueTraits> > ptr;

		typedef uint64_t key[Levels];
		typedef typename ValueTraits::value_type value_type;
		typedef boost::optional<value_type> maybe_value;
		typedef transaction_manager::read_ref read_ref;
		typedef typename btree_detail::node_ref<ValueTraits> leaf_node;
		typedef typename btree_detail::node_ref<block_traits> internal_node;

		btree(transaction_manager &tm, block_address root);

		maybe_value lookup(key const &key) const;

		block_address get_root() const {
			return root_;
		}

		// Derive a class from this base class if you need to
		// inspect the individual nodes that make up a btree.
		class visitor {
		public:
			typedef boost::shared_ptr<visitor> ptr;
			typedef btree_detail::node_location node_location;

			virtual ~visitor() {}

			// The bool return values indicate whether the walk
			// should be continued into sub trees of the node (true == continue).
			virtual bool visit_internal(node_location const &l,
						    internal_node const &n) = 0;
			virtual bool visit_internal_leaf(node_location const &l,
							 internal_node const &n) = 0;
			virtual bool visit_leaf(node_location const &l,
						leaf_node const &n) = 0;

			virtual void visit_complete() {}
		};

		// Walks the tree in key order.  Every node visited has
		// had its header, key order and child pointers checked.
		void visit_depth_first(visitor &v) const;

	private:
		typedef btree_detail::node_location node_location;

		read_ref read_node(block_address b) const;
		void check_child(internal_node const &n, unsigned i) const;
		void walk_tree(visitor &v,
			       node_location const &loc,
			       block_address b) const;

		transaction_manager &tm_;
		block_address root_;
		bcache::validator::ptr validator_;
	};
}

#include "btree.tcc"

//----------------------------------------------------------------

#endif
