#include "RawSocketUtils.hpp"
#include "TestHeaders.hpp"

using namespace pv;

TEST_CASE("RawSocketUtils writeAll delivers every byte", "[RawSocketUtils]") {
  int fds[2];
  REQUIRE(::pipe(fds) == 0);

  // Bigger than a pipe buffer, so the writer has to wait on the reader
  const size_t size = 1024 * 1024;
  string payload(size, 'X');
  std::thread writer([&]() {
    RawSocketUtils::writeAll(fds[1], payload.data(), payload.size());
    ::close(fds[1]);
  });

  string received;
  while (true) {
    char buf[4096];
    ssize_t rc = ::read(fds[0], buf, sizeof(buf));
    if (rc <= 0) {
      break;
    }
    received.append(buf, rc);
  }
  writer.join();
  ::close(fds[0]);
  REQUIRE(received == payload);
}

TEST_CASE("RawSocketUtils writeAll rejects bad descriptors",
          "[RawSocketUtils]") {
  const string payload = "test";
  REQUIRE_THROWS(RawSocketUtils::writeAll(-1, payload.data(), payload.size()));

  int fds[2];
  REQUIRE(::pipe(fds) == 0);
  ::close(fds[0]);
  REQUIRE_THROWS(
      RawSocketUtils::writeAll(fds[1], payload.data(), payload.size()));
  ::close(fds[1]);
}

TEST_CASE("RawSocketUtils writeAll accepts an empty buffer",
          "[RawSocketUtils]") {
  int fds[2];
  REQUIRE(::pipe(fds) == 0);
  RawSocketUtils::writeAll(fds[1], "", 0);
  ::close(fds[0]);
  ::close(fds[1]);
}

TEST_CASE("RawSocketUtils readAvailable", "[RawSocketUtils]") {
  int fds[2];
  REQUIRE(::pipe(fds) == 0);
  RawSocketUtils::setNonBlocking(fds[0]);
  bool eof = true;

  SECTION("Nothing available") {
    REQUIRE(RawSocketUtils::readAvailable(fds[0], 64, &eof).empty());
    REQUIRE(!eof);
    ::close(fds[1]);
  }

  SECTION("Bounded by maxBytes") {
    RawSocketUtils::writeAll(fds[1], "abcdefgh", 8);
    REQUIRE(RawSocketUtils::readAvailable(fds[0], 5, &eof) == "abcde");
    REQUIRE(!eof);
    REQUIRE(RawSocketUtils::readAvailable(fds[0], 5, &eof) == "fgh");
    ::close(fds[1]);
  }

  SECTION("Reports end of file") {
    ::close(fds[1]);
    REQUIRE(RawSocketUtils::readAvailable(fds[0], 64, &eof).empty());
    REQUIRE(eof);
  }

  ::close(fds[0]);
}

TEST_CASE("RawSocketUtils setCloseOnExec", "[RawSocketUtils]") {
  int fds[2];
  REQUIRE(::pipe(fds) == 0);
  RawSocketUtils::setCloseOnExec(fds[0]);
  REQUIRE((fcntl(fds[0], F_GETFD) & FD_CLOEXEC) != 0);
  REQUIRE((fcntl(fds[1], F_GETFD) & FD_CLOEXEC) == 0);
  ::close(fds[0]);
  ::close(fds[1]);
}
