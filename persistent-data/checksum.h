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

#ifndef PERSISTENT_DATA_CHECKSUM_H
#define PERSISTENT_DATA_CHECKSUM_H

#include <boost/crc.hpp>
#include <stdint.h>

//----------------------------------------------------------------

namespace base {
	// crc32c as used by the kernel's dm-persistent-data, with the
	// per block type xor applied to the result.
	class crc32c {
	public:
		explicit crc32c(uint32_t xor_value);

		void append(void const *buffer, unsigned len);
		uint32_t get_sum() const;

	private:
		typedef boost::crc_optimal<32, 0x1EDC6F41, 0xffffffff, 0, true, true> crc_type;

		uint32_t xor_value_;
		crc_type crc_;
	};
}

//----------------------------------------------------------------

#endif
