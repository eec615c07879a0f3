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

#ifndef PERSISTENT_DATA_FILE_UTILS_H
#define PERSISTENT_DATA_FILE_UTILS_H

#include "persistent-data/block.h"

#include <string>

//----------------------------------------------------------------

namespace persistent_data {
	block_address get_nr_blocks(std::string const &path, uint32_t block_size = MD_BLOCK_SIZE);

	// Throws size_error if the device cannot hold even a
	// superblock.
	block_manager::ptr open_bm(std::string const &dev_path,
				   block_manager::mode m,
				   bool excl = true,
				   engine_type e = SYNC_IO,
				   unsigned queue_depth = DEFAULT_QUEUE_DEPTH);
}

//----------------------------------------------------------------

#endif
