#include "test_support.hpp"

#include <huginn/sharder.hpp>

using namespace huginn;

TEST_CASE("compute_hash is truncated sha256 hex") {
  const std::string abc =
      "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad";
  REQUIRE(compute_hash("abc", 64) == abc);
  REQUIRE(compute_hash("abc", 16) == abc.substr(0, 16));
  REQUIRE(compute_hash("", 16) == "e3b0c44298fc1c14");
}

TEST_CASE("hash length is clamped to 16..64") {
  REQUIRE(clamp_hash_length(0) == 16);
  REQUIRE(clamp_hash_length(-5) == 16);
  REQUIRE(clamp_hash_length(40) == 40);
  REQUIRE(clamp_hash_length(1000) == 64);

  REQUIRE(compute_hash("src/a.x", 8).size() == 16);
  REQUIRE(compute_hash("src/a.x", 100).size() == 64);
}

TEST_CASE("shorter hash is a prefix of the longer one") {
  for (const char* key : {"src/a.x", "README.md", "deep/nested/path/file.cpp"}) {
    auto h16 = compute_hash(key, 16);
    auto h32 = compute_hash(key, 32);
    auto h64 = compute_hash(key, 64);
    REQUIRE(h32.compare(0, 16, h16) == 0);
    REQUIRE(h64.compare(0, 32, h32) == 0);
  }
}

TEST_CASE("shard path layout") {
  const std::filesystem::path root = "/tmp/proj/issues";
  auto h = compute_hash("src/a.x", 16);
  auto p = shard_path(root, h);
  REQUIRE(p == root / ".index" / h.substr(0, 3) / h);
  REQUIRE(index_dir(root) == root / ".index");
}

TEST_CASE("shard name filter") {
  REQUIRE(is_shard_name("0123456789abcdef"));
  REQUIRE(is_shard_name(std::string(64, 'f')));
  REQUIRE_FALSE(is_shard_name("0123456789abcde"));            // 15
  REQUIRE_FALSE(is_shard_name(std::string(65, 'a')));
  REQUIRE_FALSE(is_shard_name("0123456789ABCDEF"));
  REQUIRE_FALSE(is_shard_name("0123456789abcdef.tmp"));
  REQUIRE_FALSE(is_shard_name(".gitignore"));
}

TEST_CASE("hash length argument parsing") {
  REQUIRE(parse_hash_length("32") == 32);
  REQUIRE(parse_hash_length("8") == 8); // clamp решает дальше
  REQUIRE(parse_hash_length("-3") == -3);

  REQUIRE_FALSE(parse_hash_length("").has_value());
  REQUIRE_FALSE(parse_hash_length("32x").has_value());
  REQUIRE_FALSE(parse_hash_length("abc").has_value());
  // не должно молча свернуться в 16
  REQUIRE_FALSE(parse_hash_length("4294967312").has_value());
  REQUIRE_FALSE(parse_hash_length("99999999999999999999999").has_value());
}
