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

#ifndef BLOCK_H
#define BLOCK_H

#include "block-cache/block_cache.h"
#include "block-cache/io_engine.h"

#include <boost/noncopyable.hpp>
#include <boost/shared_ptr.hpp>

#include <memory>
#include <stdint.h>
#include <string>
#include <vector>

//----------------------------------------------------------------

namespace persistent_data {
	using namespace bcache;

	uint32_t const MD_BLOCK_SIZE = 4096;
	unsigned const DEFAULT_QUEUE_DEPTH = 64;

	class block_manager : private boost::noncopyable {
	public:
		typedef boost::shared_ptr<block_manager> ptr;

		enum mode {
			READ_ONLY,
			READ_WRITE
		};

		// nr_blocks is the size of the device in MD_BLOCK_SIZE
		// blocks; the caller is expected to have checked it.
		block_manager(std::string const &path,
			      block_address nr_blocks,
			      mode m,
			      bool excl = true,
			      engine_type e = SYNC_IO,
			      unsigned queue_depth = DEFAULT_QUEUE_DEPTH);

		class read_ref {
		public:
			static uint32_t const BLOCK_SIZE = MD_BLOCK_SIZE;

			explicit read_ref(block_cache::block &b);
			read_ref(read_ref const &rhs);
			virtual ~read_ref();

			block_address get_location() const;
			void const *data() const;

		protected:
			block_cache::block &b_;

		private:
			read_ref &operator =(read_ref const &rhs) = delete;
		};

		// Inherited from read_ref, since you can read a block that's write
		// locked.
		class write_ref : public read_ref {
		public:
			explicit write_ref(block_cache::block &b);
			write_ref(block_cache::block &b, unsigned &ref_count);
			write_ref(write_ref const &rhs);
			~write_ref();

			using read_ref::data;
			void *data();

		private:
			unsigned *ref_count_;
		};

		read_ref
		read_lock(block_address location,
			  validator::ptr v = validator::ptr(new noop_validator())) const;

		write_ref
		write_lock(block_address location,
			   validator::ptr v = validator::ptr(new noop_validator()));

		write_ref
		write_lock_zero(block_address location,
				validator::ptr v = validator::ptr(new noop_validator()));

		// The superblock must be the last block written.  Flush
		// everything else first, no other locks may be held, and
		// flush again once the superblock ref has been dropped.
		write_ref superblock_zero(block_address location,
					  validator::ptr v = validator::ptr(new noop_validator()));

		block_address get_nr_blocks() const;

		void prefetch(block_address b) const;
		void prefetch(std::vector<block_address> const &blocks) const;
		void flush() const;

		// For unit tests.
		unsigned get_nr_locked() const;

	private:
		std::unique_ptr<io_engine> engine_;
		io_engine::handle handle_;
		mutable block_cache bc_;
		unsigned superblock_ref_count_;
	};

	// A little utility to help build validators
	inline validator::ptr
	mk_validator(validator *v) {
		return validator::ptr(v);
	}
}

//----------------------------------------------------------------

#endif
