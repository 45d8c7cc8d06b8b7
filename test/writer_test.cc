// -*- mode: c++; c-basic-offset: 4; indent-tabs-mode: nil; -*-
// (c) 2024 Henner Zeller <h.zeller@acm.org>
//
// This program is free software; you can redistribute it and/or modify
// it under the terms of the GNU General Public License as published by
// the Free Software Foundation version 2.
//
// This program is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
// GNU General Public License for more details.
//
// You should have received a copy of the GNU General Public License
// along with this program.  If not, see <http://gnu.org/licenses/gpl-2.0.txt>

#include "writer.h"

#include <errno.h>
#include <unistd.h>

#include <catch2/catch.hpp>
#include <string>

using namespace rasterm;

TEST_CASE("StringWriter collects output", "[writer]") {
    StringWriter out;
    REQUIRE(out.Write("foo", 3).ok());
    REQUIRE(out.WriteString("bar").ok());
    REQUIRE(out.Write("", 0).ok());
    CHECK(out.data() == "foobar");
    out.Clear();
    CHECK(out.data().empty());
}

TEST_CASE("FileDescriptorWriter writes everything", "[writer]") {
    int fds[2];
    REQUIRE(pipe(fds) == 0);
    const std::string content(10000, 'x');
    FileDescriptorWriter out(fds[1]);
    REQUIRE(out.WriteString(content).ok());
    close(fds[1]);

    std::string received;
    char buf[4096];
    ssize_t r;
    while ((r = read(fds[0], buf, sizeof(buf))) > 0) received.append(buf, r);
    close(fds[0]);
    CHECK(received == content);
}

TEST_CASE("FileDescriptorWriter reports write errors", "[writer]") {
    FileDescriptorWriter out(-1);
    const Status status = out.WriteString("hello");
    CHECK(status == ErrorCode::kIOError);
    CHECK(status.message().find("write") == 0);
}

TEST_CASE("Status messages", "[writer]") {
    CHECK(Status().ok());
    CHECK(Status().code() == ErrorCode::kOk);
    CHECK(Status(ErrorCode::kNonTTY).message() == "non tty");
    CHECK(Status(ErrorCode::kTermGraphicsNotAvailable).message() ==
          "term graphics not available");
    CHECK(Status(ErrorCode::kTermResponseTimedOut).message() ==
          "term response timed out");
    CHECK(Status(ErrorCode::kUnknownTermType).message() ==
          "unknown term type");
    CHECK(Status(ErrorCode::kEncodeError, "foo").message() == "foo");

    const Status from_errno = Status::FromErrno("open", EBADF);
    CHECK(from_errno == ErrorCode::kIOError);
    CHECK(from_errno != ErrorCode::kOk);
    CHECK(from_errno.message().find("open: ") == 0);
}
