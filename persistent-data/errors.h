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

#ifndef PERSISTENT_DATA_ERRORS_H
#define PERSISTENT_DATA_ERRORS_H

#include <boost/optional.hpp>
#include <stdexcept>
#include <stdint.h>
#include <string>

//----------------------------------------------------------------

namespace base {
	// Device or file access failed: open, short transfer, out of range
	// block, failed submission.
	class io_error : public std::runtime_error {
	public:
		explicit io_error(std::string const &what)
			: std::runtime_error(what) {
		}
	};

	// A device is too small for the metadata it must hold.
	class size_error : public std::runtime_error {
	public:
		explicit size_error(std::string const &what)
			: std::runtime_error(what) {
		}
	};

	class corrupt_metadata_error : public std::runtime_error {
	public:
		explicit corrupt_metadata_error(std::string const &what)
			: std::runtime_error(what) {
		}

		corrupt_metadata_error(std::string const &what, uint64_t location)
			: std::runtime_error(what),
			  location_(location) {
		}

		// The block that failed to decode, if known.
		boost::optional<uint64_t> const &get_location() const {
			return location_;
		}

	private:
		boost::optional<uint64_t> location_;
	};

	class checksum_error : public corrupt_metadata_error {
	public:
		explicit checksum_error(std::string const &what)
			: corrupt_metadata_error(what) {
		}

		checksum_error(std::string const &what, uint64_t location)
			: corrupt_metadata_error(what, location) {
		}
	};

	class version_error : public std::runtime_error {
	public:
		explicit version_error(std::string const &what)
			: std::runtime_error(what) {
		}
	};

	class out_of_space_error : public std::runtime_error {
	public:
		explicit out_of_space_error(std::string const &what)
			: std::runtime_error(what) {
		}
	};

	// Internal consistency violation, eg. a reference count going
	// below zero.  Always a bug or a bad request, never a data
	// condition.
	class invariant_error : public std::runtime_error {
	public:
		explicit invariant_error(std::string const &what)
			: std::runtime_error(what) {
		}
	};
}

//----------------------------------------------------------------

#endif
