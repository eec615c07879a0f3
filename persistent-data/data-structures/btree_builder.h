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

#ifndef PERSISTENT_DATA_BTREE_BUILDER_H
#define PERSISTENT_DATA_BTREE_BUILDER_H

#include "persistent-data/data-structures/btree.h"
#include "persistent-data/data-structures/ref_counter.h"
#include "persistent-data/errors.h"
#include "persistent-data/validators.h"

#include <boost/noncopyable.hpp>
#include <boost/optional.hpp>
#include <deque>
#include <sstream>
#include <utility>
#include <vector>

//----------------------------------------------------------------

namespace persistent_data {
	namespace btree_detail {
		// A node that has been written, as seen by its parent.
		struct node_summary {
			node_summary()
				: key(0),
				  block(0),
				  nr_entries(0) {
			}

			node_summary(uint64_t k, block_address b, unsigned n)
				: key(k),
				  block(b),
				  nr_entries(n) {
			}

			uint64_t key;
			block_address block;
			unsigned nr_entries;
		};

		// Writes one level of a btree, left to right, into
		// freshly allocated blocks.  Up to two nodes worth of
		// entries are held back so the last two nodes can be
		// balanced.
		template <typename ValueTraits>
		class node_builder : private boost::noncopyable {
		public:
			typedef typename ValueTraits::value_type value_type;

			node_builder(transaction_manager &tm, node_type t)
				: tm_(tm),
				  type_(t),
				  validator_(create_btree_node_validator()),
				  max_entries_(node_ref<ValueTraits>::calc_max_entries()) {
			}

			void push_value(uint64_t key, value_type const &v) {
				check_order(key);

				if (values_.size() == max_entries_ * 2)
					emit_node(max_entries_);

				values_.push_back(std::make_pair(key, v));
				last_key_ = key;
			}

			// Adds a node that has already been written, eg. a
			// leaf shared with another tree.  Takes a reference
			// on the node's block.
			void push_node(node_summary const &n) {
				check_order(n.key);
				flush_values();

				tm_.get_sm()->inc(n.block);
				nodes_.push_back(n);
				last_key_ = n.key;
			}

			std::vector<node_summary> complete() {
				flush_values();

				std::vector<node_summary> r;
				r.swap(nodes_);
				last_key_ = boost::optional<uint64_t>();
				return r;
			}

		private:
			void check_order(uint64_t key) const {
				if (last_key_ && key <= *last_key_) {
					std::ostringstream out;
					out << "btree builder given key " << key
					    << " after key " << *last_key_;
					throw base::invariant_error(out.str());
				}
			}

			void flush_values() {
				if (values_.size() > max_entries_) {
					unsigned half = values_.size() / 2;
					emit_node(half);
					emit_node(values_.size());

				} else if (values_.size())
					emit_node(values_.size());
			}

			void emit_node(unsigned count) {
				transaction_manager::write_ref wr = tm_.new_block(validator_);
				node_ref<ValueTraits> n = to_node<ValueTraits>(wr);
				n.init(type_);

				for (unsigned i = 0; i < count; i++) {
					n.push_back(values_.front().first, values_.front().second);
					values_.pop_front();
				}

				nodes_.push_back(node_summary(n.key_at(0), wr.get_location(), count));
			}

			transaction_manager &tm_;
			node_type type_;
			bcache::validator::ptr validator_;
			unsigned max_entries_;

			std::deque<std::pair<uint64_t, value_type> > values_;
			std::vector<node_summary> nodes_;
			boost::optional<uint64_t> last_key_;
		};
	}

	// Builds a new btree bottom up from values (or whole leaves)
	// given in strictly increasing key order.  The ref counter is
	// told about every value pushed, but not about the values of
	// leaves pushed whole, since those are already accounted for.
	template <typename ValueTraits>
	class btree_builder : private boost::noncopyable {
	public:
		typedef typename ValueTraits::value_type value_type;
		typedef btree_detail::node_summary node_summary;

		btree_builder(transaction_manager &tm,
			      ref_counter<value_type> &rc)
			: tm_(tm),
			  rc_(rc),
			  leaves_(tm, btree_detail::LEAF) {
		}

		void push_value(uint64_t key, value_type const &v) {
			leaves_.push_value(key, v);
			rc_.inc(v);
		}

		void push_leaf(node_summary const &leaf) {
			leaves_.push_node(leaf);
		}

		// Writes any pending leaves and returns them, without
		// building the rest of the tree.  Used for leaves that
		// will be shared by several trees.
		std::vector<node_summary> complete_leaves() {
			return leaves_.complete();
		}

		// Returns the root.  An empty tree is a single empty leaf.
		block_address complete() {
			using namespace btree_detail;

			std::vector<node_summary> nodes = leaves_.complete();
			if (nodes.empty()) {
				transaction_manager::write_ref wr =
					tm_.new_block(create_btree_node_validator());
				to_node<ValueTraits>(wr).init(LEAF);
				return wr.get_location();
			}

			while (nodes.size() > 1) {
				node_builder<block_traits> parents(tm_, INTERNAL);

				std::vector<node_summary>::const_iterator it;
				for (it = nodes.begin(); it != nodes.end(); ++it)
					parents.push_value(it->key, it->block);

				nodes = parents.complete();
			}

			return nodes[0].block;
		}

	private:
		transaction_manager &tm_;
		ref_counter<value_type> &rc_;
		btree_detail::node_builder<ValueTraits> leaves_;
	};
}

//----------------------------------------------------------------

#endif
