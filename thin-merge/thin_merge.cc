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

#include "base/nested_output.h"
#include "persistent-data/errors.h"
#include "thin-merge/commands.h"
#include "thin-merge/merge.h"
#include "version.h"

#include <boost/lexical_cast.hpp>
#include <getopt.h>
#include <limits.h>
#include <iostream>

using namespace base;
using namespace std;
using namespace thin_merge;

//----------------------------------------------------------------

namespace {
	int report(char const *kind, std::exception const &e) {
		cerr << kind << ": " << e.what() << endl;
		return 1;
	}

	int merge(merge_options const &opts) {
		nested_output out(cerr, 2);
		if (opts.quiet_)
			out.disable();

		try {
			merge_thins(opts, out);

		} catch (io_error const &e) {
			return report("IoError", e);

		} catch (size_error const &e) {
			return report("SizeError", e);

		} catch (checksum_error const &e) {
			return report("ChecksumError", e);

		} catch (corrupt_metadata_error const &e) {
			return report("CorruptMetadataError", e);

		} catch (version_error const &e) {
			return report("VersionError", e);

		} catch (out_of_space_error const &e) {
			return report("OutOfSpaceError", e);

		} catch (invariant_error const &e) {
			return report("InvariantError", e);

		} catch (std::exception const &e) {
			cerr << e.what() << endl;
			return 1;
		}

		return 0;
	}
}

//----------------------------------------------------------------

thin_merge_cmd::thin_merge_cmd()
	: command("thin_merge")
{
}

void
thin_merge_cmd::usage(std::ostream &out) const
{
	out << "Usage: " << get_name() << " [options]" << endl
	    << "Options:" << endl
	    << "  {-h|--help}" << endl
	    << "  {-i|--input} <input metadata (binary format)>" << endl
	    << "  {-o|--output} <output metadata (binary format)>" << endl
	    << "  {--origin} <device id>" << endl
	    << "  {--snapshot} <device id>" << endl
	    << "  {-m|--metadata-snap}" << endl
	    << "  {--rebase}" << endl
	    << "  {--io-engine} sync|async" << endl
	    << "  {--queue-depth} <natural>" << endl
	    << "  {-q|--quiet}" << endl
	    << "  {-V|--version}" << endl;
}

int
thin_merge_cmd::run(int argc, char **argv)
{
	int c;
	const char *shortopts = "hi:o:mqV";
	merge_options opts;
	bool have_origin = false;

	const struct option longopts[] = {
		{ "help", no_argument, NULL, 'h'},
		{ "input", required_argument, NULL, 'i' },
		{ "output", required_argument, NULL, 'o'},
		{ "origin", required_argument, NULL, 1},
		{ "snapshot", required_argument, NULL, 2},
		{ "metadata-snap", no_argument, NULL, 'm'},
		{ "rebase", no_argument, NULL, 3},
		{ "io-engine", required_argument, NULL, 4},
		{ "queue-depth", required_argument, NULL, 5},
		{ "quiet", no_argument, NULL, 'q'},
		{ "version", no_argument, NULL, 'V'},
		{ NULL, no_argument, NULL, 0 }
	};

	while ((c = getopt_long(argc, argv, shortopts, longopts, NULL)) != -1) {
		switch(c) {
		case 'h':
			usage(cout);
			return 0;

		case 'i':
			opts.input_ = optarg;
			break;

		case 'o':
			opts.output_ = optarg;
			break;

		case 1:
			opts.origin_ = parse_uint64(optarg, "origin device id");
			have_origin = true;
			break;

		case 2:
			opts.snapshot_ = parse_uint64(optarg, "snapshot device id");
			break;

		case 'm':
			opts.use_metadata_snap_ = true;
			break;

		case 3:
			opts.rebase_ = true;
			break;

		case 4:
			if (string(optarg) == "sync")
				opts.engine_ = bcache::SYNC_IO;
			else if (string(optarg) == "async")
				opts.engine_ = bcache::ASYNC_IO;
			else
				die("Unknown io engine '" + string(optarg) + "'");
			break;

		case 5: {
			uint64_t depth = parse_uint64(optarg, "queue depth");
			if (!depth || depth > UINT_MAX)
				die("Queue depth must be between 1 and " +
				    boost::lexical_cast<string>(UINT_MAX));
			opts.queue_depth_ = static_cast<unsigned>(depth);
			break;
		}

		case 'q':
			opts.quiet_ = true;
			break;

		case 'V':
			cout << THIN_MERGE_VERSION << endl;
			return 0;

		default:
			usage(cerr);
			return 1;
		}
	}

	if (argc != optind) {
		usage(cerr);
		return 1;
	}

	if (opts.input_.empty()) {
		cerr << "No input file provided." << endl << endl;
		usage(cerr);
		return 1;
	}

	if (opts.output_.empty()) {
		cerr << "No output file provided." << endl << endl;
		usage(cerr);
		return 1;
	}

	if (!have_origin) {
		cerr << "No origin device id provided." << endl << endl;
		usage(cerr);
		return 1;
	}

	if (opts.rebase_ && !opts.snapshot_) {
		cerr << "--rebase requires a snapshot device id." << endl << endl;
		usage(cerr);
		return 1;
	}

	return merge(opts);
}

//----------------------------------------------------------------
