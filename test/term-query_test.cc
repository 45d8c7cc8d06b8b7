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

#include "term-query.h"

#include <poll.h>
#include <pty.h>
#include <termios.h>
#include <unistd.h>

#include <catch2/catch.hpp>
#include <chrono>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "rasterm-time.h"

using namespace rasterm;

namespace {
// A pseudo terminal; the test plays the role of the terminal emulator on the
// master side, the code under test talks to the slave side.
class FakeTerminal {
public:
    FakeTerminal() {
        REQUIRE(openpty(&master_, &slave_, nullptr, nullptr, nullptr) == 0);
    }

    ~FakeTerminal() {
        Finish();
        if (master_ >= 0) close(master_);
        close(slave_);
    }

    int fd() const { return slave_; }

    // Once "trigger" shows up on the terminal, wait "delay" and type
    // "answer".
    void AnswerOn(const std::string &trigger, const std::string &answer,
                  std::chrono::milliseconds delay) {
        Respond(trigger, answer, delay, false);
    }

    // Once "trigger" shows up, close the master side without answering.
    void HangUpOn(const std::string &trigger) {
        Respond(trigger, "", std::chrono::milliseconds(0), true);
    }

    // Wait for the responder to finish. Returns what the terminal received.
    std::string Finish() {
        if (responder_.joinable()) responder_.join();
        std::lock_guard<std::mutex> l(lock_);
        return seen_;
    }

    struct termios Settings() const {
        struct termios t;
        REQUIRE(tcgetattr(slave_, &t) == 0);
        return t;
    }

private:
    void Respond(const std::string &trigger, const std::string &answer,
                 std::chrono::milliseconds delay, bool hang_up) {
        responder_ = std::thread([this, trigger, answer, delay, hang_up]() {
            const auto deadline =
                std::chrono::steady_clock::now() + std::chrono::seconds(3);
            while (std::chrono::steady_clock::now() < deadline) {
                struct pollfd p = {master_, POLLIN, 0};
                if (poll(&p, 1, 20) <= 0) continue;
                char buf[256];
                const ssize_t r = read(master_, buf, sizeof(buf));
                if (r <= 0) return;
                std::lock_guard<std::mutex> l(lock_);
                seen_.append(buf, r);
                if (seen_.find(trigger) == std::string::npos) continue;
                std::this_thread::sleep_for(delay);
                if (hang_up) {
                    close(master_);
                    master_ = -1;
                    return;
                }
                if (write(master_, answer.data(), answer.size()) < 0) return;
                return;
            }
        });
    }

    int master_ = -1;
    int slave_  = -1;
    std::thread responder_;
    std::mutex lock_;
    std::string seen_;
};

void RequireSameSettings(const struct termios &a, const struct termios &b) {
    CHECK(a.c_iflag == b.c_iflag);
    CHECK(a.c_oflag == b.c_oflag);
    CHECK(a.c_lflag == b.c_lflag);
    CHECK(a.c_cflag == b.c_cflag);
    CHECK(a.c_cc[VMIN] == b.c_cc[VMIN]);
    CHECK(a.c_cc[VTIME] == b.c_cc[VTIME]);
}
}  // namespace

TEST_CASE("Device attributes are all decimal numbers in order", "[query]") {
    const std::string reply = "\x1b[?62;1;2;4;6;9;15;22c";
    const std::vector<int> attrs =
        ParseDeviceAttributes(reply.data(), reply.size());
    REQUIRE(attrs == std::vector<int>({62, 1, 2, 4, 6, 9, 15, 22}));
    CHECK(HasSixelAttribute(attrs));
}

TEST_CASE("VT100 style reply does not announce sixel", "[query]") {
    const std::string reply = "\x1b[?1;2c";
    const std::vector<int> attrs =
        ParseDeviceAttributes(reply.data(), reply.size());
    REQUIRE(attrs == std::vector<int>({1, 2}));
    CHECK_FALSE(HasSixelAttribute(attrs));
}

TEST_CASE("Terminal id 4 at first position is not sixel", "[query]") {
    // VT132 reports itself as 4.
    const std::string reply = "\x1b[?4;6c";
    CHECK_FALSE(
        HasSixelAttribute(ParseDeviceAttributes(reply.data(), reply.size())));
    CHECK_FALSE(HasSixelAttribute({}));
}

TEST_CASE("Garbage between numbers is ignored", "[query]") {
    const std::string reply = "xx12\x1b\x1b[6;;007R?3";
    CHECK(ParseDeviceAttributes(reply.data(), reply.size()) ==
          std::vector<int>({12, 6, 7, 3}));
    CHECK(ParseDeviceAttributes("", 0).empty());
}

TEST_CASE("Query on non-terminal fails with NonTTY", "[query]") {
    int pipe_fds[2];
    REQUIRE(pipe(pipe_fds) == 0);
    std::string response = "stale";
    const Status status =
        TermRequestResponse(pipe_fds[0], pipe_fds[1], "\x1b[0c", &response);
    CHECK(status == ErrorCode::kNonTTY);
    CHECK(response.empty());
    CHECK_FALSE(DetectSixelSupport(pipe_fds[0], pipe_fds[1]));
    close(pipe_fds[0]);
    close(pipe_fds[1]);
}

TEST_CASE("Silent terminal is nudged with cursor position request",
          "[query][pty]") {
    FakeTerminal terminal;
    const struct termios before = terminal.Settings();

    // Only the cursor position request is answered, never the DA query.
    terminal.AnswerOn("\x1b[6n", "\x1b[24;80R", std::chrono::milliseconds(0));

    const Time start;
    std::vector<int> attrs;
    const Status status =
        QueryDeviceAttributes(terminal.fd(), terminal.fd(), &attrs);
    const Duration elapsed = Time::Now() - start;
    const std::string seen = terminal.Finish();

    REQUIRE(status.ok());
    CHECK(attrs == std::vector<int>({24, 80}));
    CHECK(seen == std::string("\x1b[0c") + "\x1b\x1b[6n");
    CHECK(elapsed.milliseconds() >= kTermResponseTimeout.milliseconds());
    CHECK(elapsed.milliseconds() < 1000);
    RequireSameSettings(before, terminal.Settings());
}

TEST_CASE("Slow device attributes reply is accepted", "[query][pty]") {
    FakeTerminal terminal;
    const struct termios before = terminal.Settings();
    terminal.AnswerOn("\x1b[0c", "\x1b[?62;1;2;4;6;9;15;22c",
                      std::chrono::milliseconds(200));

    CHECK(DetectSixelSupport(terminal.fd(), terminal.fd()));
    terminal.Finish();
    RequireSameSettings(before, terminal.Settings());
}

TEST_CASE("Reply before the timeout is not considered", "[query][pty]") {
    FakeTerminal terminal;
    const struct termios before = terminal.Settings();
    terminal.AnswerOn("\x1b[0c", "\x1b[?62;4c", std::chrono::milliseconds(0));

    std::string response = "stale";
    const Status status =
        TermRequestResponse(terminal.fd(), terminal.fd(), "\x1b[0c", &response);
    const std::string seen = terminal.Finish();
    CHECK(status.ok());
    CHECK(response.empty());
    CHECK(seen == "\x1b[0c");  // No nudge needed.
    RequireSameSettings(before, terminal.Settings());
}

TEST_CASE("Terminal that never replies times out", "[query][pty]") {
    FakeTerminal terminal;
    terminal.HangUpOn("\x1b\x1b[6n");

    const Time start;
    std::string response = "stale";
    const Status status =
        TermRequestResponse(terminal.fd(), terminal.fd(), "\x1b[0c", &response);
    const Duration elapsed = Time::Now() - start;
    const std::string seen = terminal.Finish();

    CHECK(status == ErrorCode::kTermResponseTimedOut);
    CHECK(status.message() == "term response timed out");
    CHECK(response.empty());
    CHECK(seen == std::string("\x1b[0c") + "\x1b\x1b[6n");
    CHECK(elapsed.milliseconds() >= kTermResponseTimeout.milliseconds());
    CHECK(elapsed.milliseconds() < kTermResponseTimeout.milliseconds() + 500);
}

TEST_CASE("No sixel if the terminal never replies", "[query][pty]") {
    FakeTerminal terminal;
    terminal.HangUpOn("\x1b\x1b[6n");
    CHECK_FALSE(DetectSixelSupport(terminal.fd(), terminal.fd()));
    terminal.Finish();
}
