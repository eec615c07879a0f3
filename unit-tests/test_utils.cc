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

#include "unit-tests/test_utils.h"

#include "persistent-data/file_utils.h"
#include "persistent-data/space-maps/core.h"
#include "persistent-data/space-maps/disk.h"
#include "thin-merge/emitter.h"
#include "thin-merge/mapping_stream.h"
#include "thin-merge/metadata.h"
#include "thin-merge/restore_emitter.h"

#include <fcntl.h>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

using namespace persistent_data;
using namespace std;
using namespace test;
using namespace thin_merge;
using namespace thin_merge::superblock_detail;

//----------------------------------------------------------------

namespace {
	string read_file(string const &path) {
		ifstream in(path.c_str(), ios::in | ios::binary);
		if (!in)
			throw runtime_error("couldn't open " + path);

		return string(istreambuf_iterator<char>(in), istreambuf_iterator<char>());
	}

	void emit_mappings(emitter::ptr e, mapping_map const &m) {
		mapping_map::const_iterator it;
		for (it = m.begin(); it != m.end(); ++it)
			e->single_map(it->first, it->second.block_, it->second.time_);
	}
}

//----------------------------------------------------------------

temp_file::temp_file(string const &name_base, block_address nr_blocks)
	: path_(gen_path(name_base))
{
	int fd = ::open(path_.c_str(), O_CREAT | O_TRUNC | O_RDWR, 0666);
	if (fd < 0)
		throw runtime_error("couldn't open file");

	if (::ftruncate(fd, nr_blocks * MD_BLOCK_SIZE)) {
		::close(fd);
		throw runtime_error("couldn't size file");
	}

	::close(fd);
}

temp_file::~temp_file()
{
	::unlink(path_.c_str());
}

string const &
temp_file::get_path() const
{
	return path_;
}

string
temp_file::gen_path(string const &base)
{
	return string("./") + base + string(".tmp");
}

//----------------------------------------------------------------

block_manager::ptr
test::open_temp_bm(temp_file const &file, block_manager::mode m)
{
	return persistent_data::open_bm(file.get_path(), m);
}

transaction_manager::ptr
test::open_temporary_tm(block_manager::ptr bm)
{
	space_map::ptr sm = create_core_map(bm->get_nr_blocks());
	transaction_manager::ptr tm(new transaction_manager(bm, sm));
	return tm;
}

mapping_map
test::make_run(uint64_t vbegin, uint64_t dbegin, unsigned nr, uint32_t time)
{
	mapping_map m;
	for (unsigned i = 0; i < nr; i++)
		m[vbegin + i] = mapping_tree_detail::block_time(dbegin + i, time);

	return m;
}

void
test::corrupt_block(temp_file const &file, block_address b, unsigned offset)
{
	block_manager::ptr bm = open_temp_bm(file);
	{
		block_manager::write_ref wr = bm->write_lock(b);
		unsigned char *data = reinterpret_cast<unsigned char *>(wr.data());
		data[offset] ^= 0xff;
	}
	bm->flush();
}

bool
test::files_identical(string const &lhs, string const &rhs)
{
	return read_file(lhs) == read_file(rhs);
}

bool
test::file_is_zeroed(string const &path)
{
	string data = read_file(path);
	return data.find_first_not_of('\0') == string::npos;
}

//----------------------------------------------------------------

metadata_builder::metadata_builder(block_address nr_data_blocks)
	: nr_data_blocks_(nr_data_blocks)
{
}

metadata_builder &
metadata_builder::named(string const &name, mapping_map const &m)
{
	named_[name] = m;
	return *this;
}

metadata_builder &
metadata_builder::device(uint32_t dev, mapping_map const &m,
			 uint64_t trans_id, uint32_t creation_time, uint32_t snap_time)
{
	device_desc d;
	d.mappings_ = m;
	d.trans_id_ = trans_id;
	d.creation_time_ = creation_time;
	d.snap_time_ = snap_time;
	devices_[dev] = d;
	return *this;
}

metadata_builder &
metadata_builder::device_sharing(uint32_t dev, string const &name,
				 mapping_map const &tail, uint64_t trans_id)
{
	device_desc d;
	d.shared_ = name;
	d.mappings_ = tail;
	d.trans_id_ = trans_id;
	devices_[dev] = d;
	return *this;
}

void
metadata_builder::write(block_manager::ptr bm, uint64_t trans_id, uint32_t time)
{
	metadata::ptr md(new metadata(bm));
	emitter::ptr e = create_restore_emitter(md);

	e->begin_superblock("", time, trans_id,
			    boost::optional<uint32_t>(),
			    boost::optional<uint32_t>(METADATA_VERSION),
			    128, nr_data_blocks_,
			    boost::optional<uint64_t>());

	map<string, mapping_map>::const_iterator nit;
	for (nit = named_.begin(); nit != named_.end(); ++nit) {
		e->begin_named_mapping(nit->first);
		emit_mappings(e, nit->second);
		e->end_named_mapping();
	}

	map<uint32_t, device_desc>::const_iterator dit;
	for (dit = devices_.begin(); dit != devices_.end(); ++dit) {
		device_desc const &d = dit->second;

		e->begin_device(dit->first, 0, d.trans_id_, d.creation_time_, d.snap_time_);
		if (d.shared_)
			e->identifier(*d.shared_);
		emit_mappings(e, d.mappings_);
		e->end_device();
	}

	e->end_superblock();
}

//----------------------------------------------------------------

void
test::take_metadata_snap(block_manager::ptr bm, block_address location)
{
	superblock sb = read_superblock(*bm);

	{
		superblock copy = sb;
		copy.metadata_snap_ = 0;

		block_manager::write_ref wr = bm->write_lock_zero(location, superblock_validator());
		superblock_traits::pack(copy, *reinterpret_cast<superblock_disk *>(wr.data()));
	}
	bm->flush();

	sb.metadata_snap_ = location;
	write_superblock(*bm, sb);
}

void
test::break_live_roots(block_manager::ptr bm)
{
	superblock sb = read_superblock(*bm);
	sb.data_mapping_root_ = SUPERBLOCK_LOCATION;
	sb.device_details_root_ = SUPERBLOCK_LOCATION;
	write_superblock(*bm, sb);
}

//----------------------------------------------------------------

superblock
test::read_sb(block_manager::ptr bm)
{
	return read_superblock(*bm);
}

mapping_map
test::read_mappings(block_manager::ptr bm, uint64_t dev)
{
	metadata md(bm, false);

	mapping_tree_detail::device_roots roots = read_device_roots(*md.tm_, md.sb_.data_mapping_root_);
	mapping_tree_detail::device_roots::const_iterator it = roots.find(dev);
	if (it == roots.end())
		throw runtime_error("no such device");

	leaf_collector collector(*md.tm_);
	mapping_stream stream(*md.tm_, collector.collect(it->second), 16);

	mapping_map m;
	while (stream.more_mappings()) {
		mapping const &mp = stream.get_mapping();
		m[mp.vblock_] = mp.bt_;
		stream.step();
	}

	return m;
}

device_tree_detail::device_map
test::read_details(block_manager::ptr bm)
{
	metadata md(bm, false);
	return read_device_details(*md.tm_, md.sb_.device_details_root_);
}

mapping_tree_detail::device_roots
test::read_roots(block_manager::ptr bm)
{
	metadata md(bm, false);
	return read_device_roots(*md.tm_, md.sb_.data_mapping_root_);
}

space_map::ptr
test::read_data_sm(block_manager::ptr bm)
{
	metadata md(bm, false);
	return load_disk_sm(*md.tm_, read_sm_root(md.sb_.data_space_map_root_));
}

space_map::ptr
test::read_metadata_sm(block_manager::ptr bm)
{
	metadata md(bm, false);
	return load_metadata_sm(*md.tm_, read_sm_root(md.sb_.metadata_space_map_root_));
}

//----------------------------------------------------------------
