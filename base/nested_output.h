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

#ifndef BASE_NESTED_OUTPUT_H
#define BASE_NESTED_OUTPUT_H

#include <iostream>
#include <string>

//----------------------------------------------------------------

namespace base {
	// Terminates a message written to a nested_output.
	class end_message {};

	// Line oriented log stream with indentation, used for progress
	// and diagnostic reporting.  Everything is dropped while
	// disabled.
	class nested_output {
	public:
		nested_output(std::ostream &out, unsigned step)
			: out_(out),
			  step_(step),
			  start_of_line_(true),
			  enabled_(true) {
		}

		template <typename T>
		nested_output &operator <<(T const &t) {
			if (!enabled_)
				return *this;

			if (start_of_line_) {
				out_ << indent_;
				start_of_line_ = false;
			}

			out_ << t;
			return *this;
		}

		nested_output &operator <<(end_message const &) {
			if (enabled_) {
				out_ << std::endl;
				start_of_line_ = true;
			}

			return *this;
		}

		class nest {
		public:
			explicit nest(nested_output &out)
				: out_(out) {
				out_.indent_.append(out_.step_, ' ');
			}

			~nest() {
				out_.indent_.resize(out_.indent_.size() - out_.step_);
			}

		private:
			nested_output &out_;
		};

		void enable() {
			enabled_ = true;
		}

		void disable() {
			enabled_ = false;
		}

		bool enabled() const {
			return enabled_;
		}

	private:
		std::ostream &out_;
		unsigned step_;
		std::string indent_;
		bool start_of_line_;
		bool enabled_;
	};
}

//----------------------------------------------------------------

#endif
