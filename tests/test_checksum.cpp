#include <catch2/catch.hpp>

#include <algorithm>
#include <string>

#include "TestSupport.hpp"
#include "text/Checksum.hpp"

using gtos_test::Session;

namespace {
    template <typename Sum>
    Sum feed(const std::string& data, std::size_t chunk) {
        Sum s;
        for (std::size_t i = 0; i < data.size(); i += chunk) {
            s.update(data.data() + i, std::min(chunk, data.size() - i));
        }
        return s;
    }

    std::string digest_of(DigestKind kind, const std::string& data) {
        Digest d(kind);
        d.update(data.data(), data.size());
        return d.hex();
    }
}

TEST_CASE("Crc32 matches POSIX cksum", "[checksum]") {
    CHECK(feed<Crc32>("hello\n", 64).value() == 3015617425u);
    CHECK(feed<Crc32>("123456789", 64).value() == 930766865u);
    CHECK(Crc32().value() == 4294967295u);
    CHECK(feed<Crc32>("123456789", 2).value() == 930766865u);
    CHECK(feed<Crc32>("hello\n", 64).size() == 6);
}

TEST_CASE("Sum16 adds bytes modulo 65536", "[checksum]") {
    CHECK(feed<Sum16>("hello\n", 3).value() == 542);
    CHECK(feed<Sum16>(std::string(300, '\xff'), 7).value() == (300u * 255u) % 65536u);
    CHECK(Sum16().value() == 0);
}

TEST_CASE("EVP digests", "[checksum]") {
    CHECK(digest_of(DigestKind::Md5, "") == "d41d8cd98f00b204e9800998ecf8427e");
    CHECK(digest_of(DigestKind::Md5, "hello\n") == "b1946ac92492d2347c6235b4d2611184");
    CHECK(digest_of(DigestKind::Sha1, "abc") == "a9993e364706816aba3e25717850c26c9cd0d89d");
    CHECK(digest_of(DigestKind::Sha256, "abc") ==
          "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    CHECK(std::string(Digest::name(DigestKind::Sha1)) == "sha1");
}

TEST_CASE("checksum commands are deterministic", "[checksum][commands]") {
    Session s;
    s.write("/empty.txt", "");
    s.write("/hello.txt", "hello\n");
    s.write("/copy.txt", "hello\n");

    CHECK(s.run("md5sum empty.txt") == "d41d8cd98f00b204e9800998ecf8427e  empty.txt\n");
    CHECK(s.run("cksum hello.txt") == "3015617425 6 hello.txt\n");
    CHECK(s.run("sum hello.txt") == "542 6 hello.txt\n");

    auto a = s.run("sha256sum hello.txt");
    auto b = s.run("sha256sum copy.txt");
    CHECK(a.substr(0, 64) == b.substr(0, 64));
    CHECK(s.run("sha256sum hello.txt") == a);

    s.run("md5sum nothing.txt");
    CHECK(s.status == 1);
}
