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

#include "thin-merge/superblock.h"

#include "persistent-data/checksum.h"
#include "persistent-data/errors.h"

#include <sstream>
#include <string.h>

using namespace base;
using namespace persistent_data;
using namespace thin_merge;
using namespace superblock_detail;

//----------------------------------------------------------------

superblock::superblock()
	: csum_(0),
	  flags_(0),
	  blocknr_(SUPERBLOCK_LOCATION),
	  magic_(SUPERBLOCK_MAGIC),
	  version_(METADATA_VERSION),
	  time_(0),
	  trans_id_(0),
	  metadata_snap_(0),
	  data_mapping_root_(0),
	  device_details_root_(0),
	  data_block_size_(0),
	  metadata_block_size_(METADATA_BLOCK_SIZE),
	  metadata_nr_blocks_(0),
	  compat_flags_(0),
	  compat_ro_flags_(0),
	  incompat_flags_(0)
{
	::memset(uuid_, 0, sizeof(uuid_));
	::memset(data_space_map_root_, 0, sizeof(data_space_map_root_));
	::memset(metadata_space_map_root_, 0, sizeof(metadata_space_map_root_));
}

void
superblock_traits::unpack(superblock_disk const &disk, superblock &value)
{
	value.csum_ = to_cpu<uint32_t>(disk.csum_);
	value.flags_ = to_cpu<uint32_t>(disk.flags_);
	value.blocknr_ = to_cpu<uint64_t>(disk.blocknr_);

	::memcpy(value.uuid_, disk.uuid_, sizeof(value.uuid_));
	value.magic_ = to_cpu<uint64_t>(disk.magic_);
	value.version_ = to_cpu<uint32_t>(disk.version_);
	value.time_ = to_cpu<uint32_t>(disk.time_);

	value.trans_id_ = to_cpu<uint64_t>(disk.trans_id_);
	value.metadata_snap_ = to_cpu<uint64_t>(disk.metadata_snap_);

	::memcpy(value.data_space_map_root_,
		 disk.data_space_map_root_,
		 sizeof(value.data_space_map_root_));
	::memcpy(value.metadata_space_map_root_,
		 disk.metadata_space_map_root_,
		 sizeof(value.metadata_space_map_root_));

	value.data_mapping_root_ = to_cpu<uint64_t>(disk.data_mapping_root_);
	value.device_details_root_ = to_cpu<uint64_t>(disk.device_details_root_);
	value.data_block_size_ = to_cpu<uint32_t>(disk.data_block_size_);

	value.metadata_block_size_ = to_cpu<uint32_t>(disk.metadata_block_size_);
	value.metadata_nr_blocks_ = to_cpu<uint64_t>(disk.metadata_nr_blocks_);

	value.compat_flags_ = to_cpu<uint32_t>(disk.compat_flags_);
	value.compat_ro_flags_ = to_cpu<uint32_t>(disk.compat_ro_flags_);
	value.incompat_flags_ = to_cpu<uint32_t>(disk.incompat_flags_);
}

void
superblock_traits::pack(superblock const &value, superblock_disk &disk)
{
	disk.csum_ = to_disk<le32>(value.csum_);
	disk.flags_ = to_disk<le32>(value.flags_);
	disk.blocknr_ = to_disk<le64>(value.blocknr_);

	::memcpy(disk.uuid_, value.uuid_, sizeof(disk.uuid_));
	disk.magic_ = to_disk<le64>(value.magic_);
	disk.version_ = to_disk<le32>(value.version_);
	disk.time_ = to_disk<le32>(value.time_);

	disk.trans_id_ = to_disk<le64>(value.trans_id_);
	disk.metadata_snap_ = to_disk<le64>(value.metadata_snap_);

	::memcpy(disk.data_space_map_root_,
		 value.data_space_map_root_,
		 sizeof(disk.data_space_map_root_));
	::memcpy(disk.metadata_space_map_root_,
		 value.metadata_space_map_root_,
		 sizeof(disk.metadata_space_map_root_));

	disk.data_mapping_root_ = to_disk<le64>(value.data_mapping_root_);
	disk.device_details_root_ = to_disk<le64>(value.device_details_root_);
	disk.data_block_size_ = to_disk<le32>(value.data_block_size_);

	disk.metadata_block_size_ = to_disk<le32>(value.metadata_block_size_);
	disk.metadata_nr_blocks_ = to_disk<le64>(value.metadata_nr_blocks_);

	disk.compat_flags_ = to_disk<le32>(value.compat_flags_);
	disk.compat_ro_flags_ = to_disk<le32>(value.compat_ro_flags_);
	disk.incompat_flags_ = to_disk<le32>(value.incompat_flags_);
}

//----------------------------------------------------------------

namespace {
	uint32_t const SUPERBLOCK_CSUM_SEED = 160774;

	struct sb_validator : public bcache::validator {
		virtual void check(void const *raw, block_address location) const {
			superblock_disk const *sbd = reinterpret_cast<superblock_disk const *>(raw);
			if (checksum(sbd) != to_cpu<uint32_t>(sbd->csum_)) {
				std::ostringstream out;
				out << "bad checksum in superblock (block " << location << ")";
				throw checksum_error(out.str(), location);
			}
		}

		virtual bool check_raw(void const *raw) const {
			superblock_disk const *sbd = reinterpret_cast<superblock_disk const *>(raw);
			return checksum(sbd) == to_cpu<uint32_t>(sbd->csum_);
		}

		virtual void prepare(void *raw, block_address location) const {
			superblock_disk *sbd = reinterpret_cast<superblock_disk *>(raw);
			sbd->blocknr_ = to_disk<le64, uint64_t>(location);
			sbd->csum_ = to_disk<le32>(checksum(sbd));
		}

	private:
		static uint32_t checksum(superblock_disk const *sbd) {
			crc32c sum(SUPERBLOCK_CSUM_SEED);
			sum.append(&sbd->flags_, MD_BLOCK_SIZE - sizeof(uint32_t));
			return sum.get_sum();
		}
	};
}

bcache::validator::ptr
thin_merge::superblock_validator()
{
	return bcache::validator::ptr(new sb_validator);
}

//----------------------------------------------------------------

superblock
thin_merge::read_superblock(block_manager &bm, block_address location)
{
	if (location >= bm.get_nr_blocks()) {
		std::ostringstream out;
		out << "superblock location " << location
		    << " beyond the end of the metadata device";
		throw corrupt_metadata_error(out.str(), location);
	}

	superblock sb;
	{
		block_manager::read_ref r = bm.read_lock(location, superblock_validator());
		superblock_disk const *sbd = reinterpret_cast<superblock_disk const *>(r.data());
		superblock_traits::unpack(*sbd, sb);
	}

	if (sb.magic_ != SUPERBLOCK_MAGIC) {
		std::ostringstream out;
		out << "bad magic in superblock (block " << location << ")";
		throw corrupt_metadata_error(out.str(), location);
	}

	if (sb.version_ < MIN_METADATA_VERSION || sb.version_ > METADATA_VERSION) {
		std::ostringstream out;
		out << "unsupported metadata version " << sb.version_
		    << " (block " << location << ")";
		throw version_error(out.str());
	}

	if (sb.metadata_block_size_ != METADATA_BLOCK_SIZE) {
		std::ostringstream out;
		out << "bad metadata block size " << sb.metadata_block_size_
		    << " sectors (block " << location << ")";
		throw corrupt_metadata_error(out.str(), location);
	}

	return sb;
}

void
thin_merge::write_superblock(block_manager &bm, superblock const &sb)
{
	{
		block_manager::write_ref w = bm.superblock_zero(SUPERBLOCK_LOCATION,
								superblock_validator());
		superblock_disk *disk = reinterpret_cast<superblock_disk *>(w.data());
		superblock_traits::pack(sb, *disk);
	}

	bm.flush();
}

//----------------------------------------------------------------
