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

#ifndef BLOCK_CACHE_IO_ENGINE_H
#define BLOCK_CACHE_IO_ENGINE_H

#include "base/unique_handle.h"

#include <boost/optional.hpp>
#include <deque>
#include <libaio.h>
#include <map>
#include <memory>
#include <set>
#include <stdint.h>
#include <string>
#include <vector>

//----------------------------------------------------------------

namespace bcache {
	typedef uint64_t sector_t;

	unsigned const SECTOR_SHIFT = 9;

	// The block cache talks to the device through this interface
	// only.  The engine is chosen once, when the block manager is
	// built.
	class io_engine {
	public:
		enum mode {
			M_READ_ONLY,
			M_READ_WRITE
		};

		enum dir {
			D_READ,
			D_WRITE
		};

		enum sharing {
			EXCLUSIVE,
			NON_EXCLUSIVE
		};

		typedef unsigned handle;

		// (success, context)
		typedef std::pair<bool, unsigned> wait_result;

		io_engine() {}
		virtual ~io_engine() {}

		virtual handle open_file(std::string const &path, mode m, sharing s = EXCLUSIVE) = 0;
		virtual void close_file(handle h) = 0;

		// Returns false if there are insufficient resources to
		// queue the io.  [b, e) is a sector range, data must be
		// page aligned.
		virtual bool issue_io(handle h, dir d, sector_t b, sector_t e,
				      void *data, unsigned context) = 0;

		// Waits for a single completion.  Returns nothing if no io
		// is in flight.
		virtual boost::optional<wait_result> wait() = 0;

		// The maximum nr of ios that may be in flight at once.
		virtual unsigned get_max_io() const = 0;

		// Makes completed writes durable.
		virtual void flush(handle h) = 0;

	private:
		io_engine(io_engine const &) = delete;
		io_engine &operator =(io_engine const &) = delete;
	};

	//--------------------------------

	// Performs each io with pread/pwrite inside issue_io(), and
	// queues the result for wait().
	class sync_engine : public io_engine {
	public:
		explicit sync_engine(unsigned max_io);

		virtual handle open_file(std::string const &path, mode m, sharing s = EXCLUSIVE);
		virtual void close_file(handle h);
		virtual bool issue_io(handle h, dir d, sector_t b, sector_t e,
				      void *data, unsigned context);
		virtual boost::optional<wait_result> wait();
		virtual unsigned get_max_io() const;
		virtual void flush(handle h);

	private:
		int get_fd(handle h) const;

		unsigned max_io_;
		std::map<handle, base::unique_fd> descriptors_;
		std::deque<wait_result> completed_;
	};

	//--------------------------------

	class control_block_set {
	public:
		explicit control_block_set(unsigned nr);

		iocb *alloc(unsigned context);
		void free(iocb *cb);

		unsigned context(iocb *cb) const;

	private:
		struct cblock {
			unsigned context;
			struct iocb cb;
		};

		unsigned index_of(iocb *cb) const;

		std::set<unsigned> free_cbs_;
		std::vector<cblock> cbs_;
	};

	// Linux native aio.  Files are opened O_DIRECT.
	class aio_engine : public io_engine {
	public:
		// max_io is the maximum nr of concurrent ios expected
		explicit aio_engine(unsigned max_io);
		~aio_engine();

		virtual handle open_file(std::string const &path, mode m, sharing s = EXCLUSIVE);
		virtual void close_file(handle h);
		virtual bool issue_io(handle h, dir d, sector_t b, sector_t e,
				      void *data, unsigned context);
		virtual boost::optional<wait_result> wait();
		virtual unsigned get_max_io() const;
		virtual void flush(handle h);

	private:
		int get_fd(handle h) const;

		unsigned max_io_;
		unsigned nr_in_flight_;
		std::map<handle, base::unique_fd> descriptors_;

		io_context_t aio_context_;
		control_block_set cbs_;
	};

	//--------------------------------

	enum engine_type {
		SYNC_IO,
		ASYNC_IO
	};

	std::unique_ptr<io_engine> create_io_engine(engine_type type, unsigned max_io);
}

//----------------------------------------------------------------

#endif
