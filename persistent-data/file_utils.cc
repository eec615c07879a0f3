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

#include "persistent-data/file_utils.h"

#include "base/file_utils.h"
#include "base/math_utils.h"
#include "persistent-data/errors.h"

#include <sstream>

using namespace base;
using namespace bcache;
using namespace persistent_data;
using namespace std;

//----------------------------------------------------------------

block_address
persistent_data::get_nr_blocks(string const &path, uint32_t block_size)
{
	return div_down<block_address>(file_utils::get_file_length(path),
				       block_size);
}

block_manager::ptr
persistent_data::open_bm(string const &dev_path, block_manager::mode m,
			 bool excl, engine_type e, unsigned queue_depth)
{
	file_utils::check_file_exists(dev_path);

	block_address nr_blocks = get_nr_blocks(dev_path);
	if (!nr_blocks) {
		ostringstream out;
		out << dev_path << " is too small to hold a superblock";
		throw size_error(out.str());
	}

	return block_manager::ptr(new block_manager(dev_path, nr_blocks, m, excl, e, queue_depth));
}

//----------------------------------------------------------------
