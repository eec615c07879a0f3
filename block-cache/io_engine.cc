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

#include "block-cache/io_engine.h"

#include "base/error_string.h"
#include "persistent-data/errors.h"

#include <errno.h>
#include <fcntl.h>
#include <sstream>
#include <string.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

using namespace base;
using namespace bcache;
using namespace boost;
using namespace std;

//----------------------------------------------------------------

namespace {
	unsigned const IO_ALIGNMENT = 4096;

	int open_flags(io_engine::mode m, io_engine::sharing s) {
		int flags = (m == io_engine::M_READ_ONLY) ? O_RDONLY : O_RDWR;
		if (s == io_engine::EXCLUSIVE)
			flags |= O_EXCL;
		return flags;
	}

	unique_fd open_or_throw(string const &path, int flags) {
		unique_fd fd(::open(path.c_str(), flags));
		if (!fd) {
			ostringstream out;
			out << "unable to open '" << path << "': " << error_string(errno);
			throw io_error(out.str());
		}

		return fd;
	}

	void unknown_handle(io_engine::handle h) {
		ostringstream out;
		out << "unknown io engine handle (" << h << ")";
		throw invariant_error(out.str());
	}

	void fdatasync_or_throw(int fd) {
		if (::fdatasync(fd) < 0) {
			ostringstream out;
			out << "fdatasync failed: " << error_string(errno);
			throw io_error(out.str());
		}
	}
}

//----------------------------------------------------------------

sync_engine::sync_engine(unsigned max_io)
	: max_io_(max_io)
{
}

sync_engine::handle
sync_engine::open_file(string const &path, mode m, sharing s)
{
	unique_fd fd = open_or_throw(path, open_flags(m, s));
	handle h = static_cast<handle>(fd.get());
	descriptors_[h] = std::move(fd);
	return h;
}

void
sync_engine::close_file(handle h)
{
	if (!descriptors_.erase(h))
		unknown_handle(h);
}

bool
sync_engine::issue_io(handle h, dir d, sector_t b, sector_t e, void *data, unsigned context)
{
	int fd = get_fd(h);
	size_t len = (e - b) << SECTOR_SHIFT;
	off_t offset = b << SECTOR_SHIFT;

	ssize_t r;
	do {
		r = (d == D_READ) ?
			::pread(fd, data, len, offset) :
			::pwrite(fd, data, len, offset);
	} while (r < 0 && errno == EINTR);

	completed_.push_back(make_pair(r == static_cast<ssize_t>(len), context));
	return true;
}

optional<io_engine::wait_result>
sync_engine::wait()
{
	if (completed_.empty())
		return optional<wait_result>();

	wait_result r = completed_.front();
	completed_.pop_front();
	return optional<wait_result>(r);
}

unsigned
sync_engine::get_max_io() const
{
	return max_io_;
}

void
sync_engine::flush(handle h)
{
	fdatasync_or_throw(get_fd(h));
}

int
sync_engine::get_fd(handle h) const
{
	map<handle, unique_fd>::const_iterator it = descriptors_.find(h);
	if (it == descriptors_.end())
		unknown_handle(h);

	return it->second.get();
}

//----------------------------------------------------------------

control_block_set::control_block_set(unsigned nr)
	: cbs_(nr)
{
	for (unsigned i = 0; i < nr; i++)
		free_cbs_.insert(i);
}

iocb *
control_block_set::alloc(unsigned context)
{
	if (free_cbs_.empty())
		return NULL;

	set<unsigned>::iterator it = free_cbs_.begin();
	unsigned index = *it;
	free_cbs_.erase(it);

	cblock &cb = cbs_[index];
	memset(&cb.cb, 0, sizeof(cb.cb));
	cb.cb.data = reinterpret_cast<void *>(static_cast<uintptr_t>(index));
	cb.context = context;
	return &cb.cb;
}

void
control_block_set::free(iocb *cb)
{
	free_cbs_.insert(index_of(cb));
}

unsigned
control_block_set::context(iocb *cb) const
{
	return cbs_[index_of(cb)].context;
}

unsigned
control_block_set::index_of(iocb *cb) const
{
	// iocb::data carries the slot index, see alloc()
	return static_cast<unsigned>(reinterpret_cast<uintptr_t>(cb->data));
}

//----------------------------------------------------------------

aio_engine::aio_engine(unsigned max_io)
	: max_io_(max_io),
	  nr_in_flight_(0),
	  aio_context_(0),
	  cbs_(max_io)
{
	int r = io_setup(max_io, &aio_context_);
	if (r < 0) {
		ostringstream out;
		out << "io_setup failed: " << error_string(-r);
		throw io_error(out.str());
	}
}

aio_engine::~aio_engine()
{
	io_destroy(aio_context_);
}

aio_engine::handle
aio_engine::open_file(string const &path, mode m, sharing s)
{
	unique_fd fd = open_or_throw(path, open_flags(m, s) | O_DIRECT);
	handle h = static_cast<handle>(fd.get());
	descriptors_[h] = std::move(fd);
	return h;
}

void
aio_engine::close_file(handle h)
{
	if (!descriptors_.erase(h))
		unknown_handle(h);
}

bool
aio_engine::issue_io(handle h, dir d, sector_t b, sector_t e, void *data, unsigned context)
{
	if (reinterpret_cast<uintptr_t>(data) & (IO_ALIGNMENT - 1))
		throw invariant_error("data passed to issue_io must be page aligned");

	int fd = get_fd(h);

	iocb *cb = cbs_.alloc(context);
	if (!cb)
		return false;

	cb->aio_fildes = fd;
	cb->u.c.buf = data;
	cb->u.c.offset = b << SECTOR_SHIFT;
	cb->u.c.nbytes = (e - b) << SECTOR_SHIFT;
	cb->aio_lio_opcode = (d == D_READ) ? IO_CMD_PREAD : IO_CMD_PWRITE;

	int r = io_submit(aio_context_, 1, &cb);
	if (r != 1) {
		cbs_.free(cb);
		return false;
	}

	nr_in_flight_++;
	return true;
}

optional<io_engine::wait_result>
aio_engine::wait()
{
	if (!nr_in_flight_)
		return optional<wait_result>();

	struct io_event event;
	memset(&event, 0, sizeof(event));

	int r;
	do {
		r = io_getevents(aio_context_, 1, 1, &event, NULL);
	} while (r == -EINTR);

	if (r < 0) {
		ostringstream out;
		out << "io_getevents failed: " << error_string(-r);
		throw io_error(out.str());
	}

	if (r == 0)
		return optional<wait_result>();

	nr_in_flight_--;

	iocb *cb = reinterpret_cast<iocb *>(event.obj);
	unsigned context = cbs_.context(cb);
	bool success = event.res == cb->u.c.nbytes;
	cbs_.free(cb);

	return optional<wait_result>(make_pair(success, context));
}

unsigned
aio_engine::get_max_io() const
{
	return max_io_;
}

void
aio_engine::flush(handle h)
{
	fdatasync_or_throw(get_fd(h));
}

int
aio_engine::get_fd(handle h) const
{
	map<handle, unique_fd>::const_iterator it = descriptors_.find(h);
	if (it == descriptors_.end())
		unknown_handle(h);

	return it->second.get();
}

//----------------------------------------------------------------

unique_ptr<io_engine>
bcache::create_io_engine(engine_type type, unsigned max_io)
{
	switch (type) {
	case SYNC_IO:
		return unique_ptr<io_engine>(new sync_engine(max_io));

	case ASYNC_IO:
		return unique_ptr<io_engine>(new aio_engine(max_io));
	}

	throw invariant_error("unknown io engine type");
}

//----------------------------------------------------------------
