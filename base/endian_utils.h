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

#ifndef BASE_ENDIAN_H
#define BASE_ENDIAN_H

#include <endian.h>
#include <stdint.h>
#include <boost/static_assert.hpp>

//----------------------------------------------------------------

namespace base {

	// Wrapper types for on disk little endian fields.  They are
	// not assignable to or from the cpu types, all traffic
	// goes through to_cpu() and to_disk().
	struct le32 {
		explicit le32(uint32_t v = 0)
			: v_(v) {
		}

		uint32_t v_;
	} __attribute__((packed));

	struct le64 {
		explicit le64(uint64_t v = 0)
			: v_(v) {
		}

		uint64_t v_;
	} __attribute__((packed));

	BOOST_STATIC_ASSERT(sizeof(le32) == 4);
	BOOST_STATIC_ASSERT(sizeof(le64) == 8);

	//--------------------------------

	template <typename CPUType, typename DiskType>
	CPUType	to_cpu(DiskType const &d) {
		BOOST_STATIC_ASSERT(sizeof(d) == 0);
	}

	template <typename DiskType, typename CPUType>
	DiskType to_disk(CPUType const &v) {
		BOOST_STATIC_ASSERT(sizeof(v) == 0);
	}

	template <>
	inline uint32_t to_cpu<uint32_t, le32>(le32 const &d) {
		return le32toh(d.v_);
	}

	template <>
	inline le32 to_disk<le32, uint32_t>(uint32_t const &v) {
		return le32(htole32(v));
	}

	template <>
	inline uint64_t to_cpu<uint64_t, le64>(le64 const &d) {
		return le64toh(d.v_);
	}

	template <>
	inline le64 to_disk<le64, uint64_t>(uint64_t const &v) {
		return le64(htole64(v));
	}

	//--------------------------------

	// Bit addressing over an array of le64 words, bit 0 is the
	// least significant bit of the first word.
	bool test_bit_le(void const *bits, uint64_t b);
	void set_bit_le(void *bits, uint64_t b);
	void clear_bit_le(void *bits, uint64_t b);
}

//----------------------------------------------------------------

#endif
