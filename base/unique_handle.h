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

#ifndef BASE_UNIQUE_HANDLE_H
#define BASE_UNIQUE_HANDLE_H

#include <unistd.h>

//----------------------------------------------------------------

namespace base {
	// Owns a file descriptor and closes it when it goes out of
	// scope.  Movable, not copyable.
	class unique_fd {
	public:
		unique_fd()
			: fd_(-1) {
		}

		explicit unique_fd(int fd)
			: fd_(fd) {
		}

		unique_fd(unique_fd &&rhs)
			: fd_(rhs.release()) {
		}

		unique_fd &operator =(unique_fd &&rhs) {
			reset(rhs.release());
			return *this;
		}

		~unique_fd() {
			reset();
		}

		int get() const {
			return fd_;
		}

		int release() {
			int fd = fd_;
			fd_ = -1;
			return fd;
		}

		void reset(int fd = -1) {
			if (fd_ >= 0)
				::close(fd_);
			fd_ = fd;
		}

		explicit operator bool() const {
			return fd_ >= 0;
		}

	private:
		unique_fd(unique_fd const &) = delete;
		unique_fd &operator =(unique_fd const &) = delete;

		int fd_;
	};
}

//----------------------------------------------------------------

#endif
