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

#include "base/application.h"

#include <boost/lexical_cast.hpp>
#include <libgen.h>
#include <linux/limits.h>
#include <sstream>
#include <stdexcept>
#include <stdlib.h>
#include <string.h>

using namespace base;
using namespace std;

//----------------------------------------------------------------

command::command(string const &name)
	: name_(name)
{
}

void
command::die(string const &msg)
{
	cerr << msg << endl;
	usage(cerr);
	exit(1);
}

uint64_t
command::parse_uint64(string const &str, string const &desc)
{
	if (str.empty() || str[0] == '-')
		die("Couldn't parse " + desc + ": '" + str + "'");

	try {
		return boost::lexical_cast<uint64_t>(str);

	} catch (boost::bad_lexical_cast const &) {
		ostringstream out;
		out << "Couldn't parse " << desc << ": '" << str << "'";
		die(out.str());
	}

	return 0; // never get here
}

//----------------------------------------------------------------

int
application::run(int argc, char **argv)
{
	command::ptr cmd = find_cmd(get_basename(argv[0]));

	if (!cmd) {
		argc--;
		argv++;

		if (!argc) {
			usage();
			return 1;
		}

		cmd = find_cmd(argv[0]);
		if (!cmd) {
			cerr << "Unknown command '" << argv[0] << "'\n";
			usage();
			return 1;
		}
	}

	try {
		return cmd->run(argc, argv);

	} catch (std::exception const &e) {
		cerr << e.what() << "\n";
		return 1;
	}
}

command::ptr
application::find_cmd(string const &name) const
{
	list<command::ptr>::const_iterator it;
	for (it = cmds_.begin(); it != cmds_.end(); ++it)
		if ((*it)->get_name() == name)
			return *it;

	return command::ptr();
}

void
application::usage() const
{
	cerr << "Usage: <command> <args>\n"
	     << "commands:\n";

	list<command::ptr>::const_iterator it;
	for (it = cmds_.begin(); it != cmds_.end(); ++it)
		cerr << "  " << (*it)->get_name() << "\n";
}

string
application::get_basename(string const &path) const
{
	char buffer[PATH_MAX + 1];

	memset(buffer, 0, sizeof(buffer));
	strncpy(buffer, path.c_str(), PATH_MAX);

	return ::basename(buffer);
}

//----------------------------------------------------------------
