// Copyright (c) 2025 The PeerLink Developers
// Distributed under the MIT software license

#include <catch2/catch_test_macros.hpp>
#include "util/sha256.hpp"
#include <filesystem>
#include <fstream>

using namespace peerlink::util;

namespace {

const std::string EMPTY_HASH = "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855";
const std::string ABC_HASH = "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad";

std::vector<uint8_t> Bytes(const std::string& s) { return std::vector<uint8_t>(s.begin(), s.end()); }

} // namespace

TEST_CASE("SHA-256 known vectors", "[util][sha256]") {
    CHECK(Sha256Hex(std::vector<uint8_t>{}) == EMPTY_HASH);
    CHECK(Sha256Hex(Bytes("abc")) == ABC_HASH);
    CHECK(Sha256Hex(Bytes("abcdbcdecdefdefgefghfghighijhijkijkljklmklmnlmnomnopnopq")) ==
          "248d6a61d20638b8e5c026930c3e6039a33ce45964ff2167f6ecedd419db06c1");
}

TEST_CASE("SHA-256 incremental hashing", "[util][sha256]") {
    Sha256Hasher hasher;
    hasher.Update(Bytes("a"));
    hasher.Update(Bytes(""));
    hasher.Update(Bytes("bc"));
    REQUIRE(hasher.FinalizeHex() == ABC_HASH);

    // Finalize resets the hasher
    REQUIRE(hasher.FinalizeHex() == EMPTY_HASH);

    hasher.Update(Bytes("garbage"));
    hasher.Reset();
    hasher.Update(Bytes("abc"));
    REQUIRE(hasher.FinalizeHex() == ABC_HASH);
}

TEST_CASE("SHA-256 of a file", "[util][sha256]") {
    auto path = std::filesystem::temp_directory_path() / "peerlink_sha256_test.bin";
    {
        std::ofstream out(path, std::ios::binary);
        out << "abc";
    }
    auto hash = Sha256File(path);
    REQUIRE(hash.has_value());
    REQUIRE(*hash == ABC_HASH);
    std::filesystem::remove(path);

    REQUIRE_FALSE(Sha256File(path).has_value());
}

TEST_CASE("HexStr", "[util][sha256]") {
    const uint8_t bytes[] = {0x00, 0x0f, 0xa0, 0xff};
    CHECK(HexStr(bytes, sizeof(bytes)) == "000fa0ff");
    CHECK(HexStr(bytes, 0).empty());
}
