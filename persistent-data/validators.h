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

#ifndef PERSISTENT_DATA_VALIDATORS_H
#define PERSISTENT_DATA_VALIDATORS_H

#include "block-cache/block_cache.h"

//----------------------------------------------------------------

namespace persistent_data {
	// Checks the checksum and the self referencing block number of
	// a btree node.  Failures are reported as checksum_error with
	// the location attached.
	bcache::validator::ptr create_btree_node_validator();
}

//----------------------------------------------------------------

#endif
