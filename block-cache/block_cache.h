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

#ifndef BLOCK_CACHE_H
#define BLOCK_CACHE_H

#include "base/aligned_memory.h"
#include "block-cache/io_engine.h"

#include <boost/noncopyable.hpp>
#include <boost/shared_ptr.hpp>

#include <list>
#include <map>
#include <memory>
#include <stdint.h>
#include <vector>

//----------------------------------------------------------------

namespace bcache {
	typedef uint64_t block_address;

	class validator {
	public:
		typedef boost::shared_ptr<validator> ptr;

		virtual ~validator() {}

		// Throws if the block contents are not acceptable.
		virtual void check(void const *data, block_address location) const = 0;
		virtual bool check_raw(void const *data) const = 0;

		// Called just before the block is written, eg. to
		// calculate the checksum.
		virtual void prepare(void *data, block_address location) const = 0;
	};

	class noop_validator : public validator {
	public:
		void check(void const *data, block_address location) const {}
		bool check_raw(void const *data) const {return true;}
		void prepare(void *data, block_address location) const {}
	};

	//----------------------------------------------------------------

	// A write back cache of fixed size blocks sitting on top of an
	// io_engine.  Reads and writes are batched up to the engine's
	// queue depth.  Nothing is written until a block is evicted or
	// flush() is called.
	class block_cache : private boost::noncopyable {
	public:
		class block : private boost::noncopyable {
		public:
			block_address get_index() const {
				return index_;
			}

			void *get_data() const {
				return data_.data();
			}

			void mark_dirty() {
				dirty_ = true;
			}

			bool is_dirty() const {
				return dirty_;
			}

			void get() {
				if (!ref_count_++)
					bc_.nr_locked_++;
			}

			void put();

		private:
			friend class block_cache;

			block(block_cache &bc, block_address index, size_t len);

			block_cache &bc_;
			block_address index_;
			base::aligned_memory data_;

			unsigned ref_count_;
			bool dirty_;

			// false until the validator has accepted the data
			bool checked_;
			validator::ptr v_;
		};

		//--------------------------------

		block_cache(io_engine &engine, io_engine::handle h,
			    sector_t block_size, uint64_t nr_blocks,
			    unsigned nr_cache_blocks);

		uint64_t get_nr_blocks() const;
		unsigned get_nr_locked() const;
		unsigned get_nr_cached() const;

		enum get_flags {
			GF_ZERO = (1 << 0),
			GF_DIRTY = (1 << 1)
		};

		block &get(block_address index, unsigned flags, validator::ptr v);

		// Reads the given blocks in as few batches as the queue
		// depth allows.  Validation is deferred until the block is
		// locked with get().  Read failures are not reported here,
		// a subsequent get() will retry the io.
		void prefetch(std::vector<block_address> const &indexes);

		// Writes back every dirty block, then syncs the device.
		void flush();

	private:
		typedef std::list<block_address> lru_list;
		typedef std::unique_ptr<block> block_ptr;

		struct entry {
			block_ptr b;
			lru_list::iterator lru;
		};

		typedef std::map<block_address, entry> block_map;

		void check_index(block_address index) const;
		block *lookup(block_address index);
		block &insert(block_address index);
		void erase(block_address index);
		void make_room(unsigned count);
		void hit(block_address index);
		void validate(block &b, validator::ptr v);

		void read_blocks(std::vector<block *> const &blocks);
		void write_blocks(std::vector<block *> const &blocks);
		std::vector<block *> run_io(std::vector<block *> const &blocks, io_engine::dir d);

		io_engine &engine_;
		io_engine::handle handle_;
		sector_t block_size_;
		uint64_t nr_blocks_;
		unsigned nr_cache_blocks_;

		block_map blocks_;
		lru_list lru_;
		unsigned nr_locked_;
	};
}

//----------------------------------------------------------------

#endif
