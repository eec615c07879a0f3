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

#include "base/file_utils.h"

#include "base/error_string.h"
#include "base/unique_handle.h"
#include "persistent-data/errors.h"

#include <errno.h>
#include <fcntl.h>
#include <linux/fs.h>
#include <sstream>
#include <sys/ioctl.h>
#include <sys/stat.h>
#include <unistd.h>

using namespace base;
using namespace std;

//----------------------------------------------------------------

namespace {
	void syscall_failed(string const &call, string const &path) {
		ostringstream out;
		out << path << ": syscall '" << call << "' failed: " << error_string(errno);
		throw io_error(out.str());
	}

	bool is_usable(struct stat const &info) {
		return S_ISREG(info.st_mode) || S_ISBLK(info.st_mode);
	}
}

//----------------------------------------------------------------

bool
file_utils::file_exists(string const &path)
{
	struct stat info;

	if (::stat(path.c_str(), &info)) {
		if (errno == ENOENT)
			return false;

		syscall_failed("stat", path);
	}

	return is_usable(info);
}

void
file_utils::check_file_exists(string const &path)
{
	struct stat info;

	if (::stat(path.c_str(), &info))
		syscall_failed("stat", path);

	if (!is_usable(info)) {
		ostringstream out;
		out << path << ": Not a block device or regular file";
		throw io_error(out.str());
	}
}

uint64_t
file_utils::get_file_length(string const &path)
{
	struct stat info;

	if (::stat(path.c_str(), &info))
		syscall_failed("stat", path);

	if (S_ISREG(info.st_mode))
		return static_cast<uint64_t>(info.st_size);

	if (!S_ISBLK(info.st_mode)) {
		ostringstream out;
		out << path << ": Not a block device or regular file";
		throw io_error(out.str());
	}

	unique_fd fd(::open(path.c_str(), O_RDONLY));
	if (!fd)
		syscall_failed("open", path);

	uint64_t nr_bytes;
	if (::ioctl(fd.get(), BLKGETSIZE64, &nr_bytes))
		syscall_failed("ioctl BLKGETSIZE64", path);

	return nr_bytes;
}

//----------------------------------------------------------------
