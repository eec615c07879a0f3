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

#include "persistent-data/validators.h"

#include "persistent-data/block.h"
#include "persistent-data/checksum.h"
#include "persistent-data/errors.h"
#include "persistent-data/data-structures/btree_disk_structures.h"

#include <sstream>

using namespace base;
using namespace persistent_data;
using namespace btree_detail;

//----------------------------------------------------------------

namespace {
	uint32_t node_checksum(node_header const *n) {
		crc32c sum(BTREE_CSUM_XOR);
		sum.append(&n->flags, MD_BLOCK_SIZE - sizeof(uint32_t));
		return sum.get_sum();
	}

	struct btree_node_validator : public bcache::validator {
		virtual void check(void const *raw, block_address location) const {
			node_header const *n = reinterpret_cast<node_header const *>(raw);
			if (node_checksum(n) != to_cpu<uint32_t>(n->csum)) {
				std::ostringstream out;
				out << "bad checksum in btree node (block " << location << ")";
				throw checksum_error(out.str(), location);
			}

			if (to_cpu<uint64_t>(n->blocknr) != location) {
				std::ostringstream out;
				out << "bad block nr in btree node (block " << location
				    << ", node claims " << to_cpu<uint64_t>(n->blocknr) << ")";
				throw corrupt_metadata_error(out.str(), location);
			}
		}

		virtual bool check_raw(void const *raw) const {
			node_header const *n = reinterpret_cast<node_header const *>(raw);
			return node_checksum(n) == to_cpu<uint32_t>(n->csum);
		}

		virtual void prepare(void *raw, block_address location) const {
			node_header *n = reinterpret_cast<node_header *>(raw);
			n->blocknr = to_disk<le64, uint64_t>(location);
			n->csum = to_disk<le32>(node_checksum(n));
		}
	};
}

//----------------------------------------------------------------

bcache::validator::ptr persistent_data::create_btree_node_validator()
{
	return bcache::validator::ptr(new btree_node_validator());
}

//----------------------------------------------------------------
