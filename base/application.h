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

#ifndef BASE_APPLICATION_H
#define BASE_APPLICATION_H

#include <iostream>
#include <list>
#include <memory>
#include <string>
#include <stdint.h>

//----------------------------------------------------------------

namespace base {
	class command {
	public:
		typedef std::shared_ptr<command> ptr;

		explicit command(std::string const &name);
		virtual ~command() {}

		// Prints msg and the usage, then exits with 1.
		void die(std::string const &msg);
		uint64_t parse_uint64(std::string const &str, std::string const &desc);

		virtual void usage(std::ostream &out) const = 0;
		virtual int run(int argc, char **argv) = 0;

		std::string const &get_name() const {
			return name_;
		}

	private:
		std::string name_;
	};

	class application {
	public:
		void add_cmd(command::ptr c) {
			cmds_.push_back(c);
		}

		// The command is chosen by the program name, or by the
		// first argument if the program name isn't a command.
		int run(int argc, char **argv);

	private:
		command::ptr find_cmd(std::string const &name) const;
		void usage() const;
		std::string get_basename(std::string const &path) const;

		std::list<command::ptr> cmds_;
	};
}

//----------------------------------------------------------------

#endif
