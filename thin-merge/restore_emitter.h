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

#ifndef THIN_MERGE_RESTORE_EMITTER_H
#define THIN_MERGE_RESTORE_EMITTER_H

#include "thin-merge/emitter.h"
#include "thin-merge/metadata.h"

//----------------------------------------------------------------

namespace thin_merge {
	// Assembles fresh metadata from the emitted devices.  Trees are
	// built bottom up as mappings arrive, so devices and mappings
	// must be emitted in increasing order.  Everything is written
	// by end_superblock(), with the superblock last.
	emitter::ptr create_restore_emitter(metadata::ptr md);
}

//----------------------------------------------------------------

#endif
