// ==============================================================================
// test_identity_gtest.cpp - Тесты отпечатков (GoogleTest)
// ==============================================================================

#include "turbosort/identity.hpp"

#include "test_support.hpp"

#include <chrono>
#include <gtest/gtest.h>
#include <string>

namespace turbosort::identity::test {

namespace fs = std::filesystem;

class IdentityFsTest : public turbosort::test::TempDirTest {};

// ==============================================================================
// FNV-1a 64
// ==============================================================================

TEST(IdentityTest, Fingerprint_KnownVectors) {
    EXPECT_EQ(fingerprint(""), "cbf29ce484222325");
    EXPECT_EQ(fingerprint("a"), "af63dc4c8601ec8c");
}

TEST(IdentityTest, ToHex_PadsToSixteenDigits) {
    EXPECT_EQ(to_hex(0), "0000000000000000");
    EXPECT_EQ(to_hex(0xABCULL), "0000000000000abc");
}

TEST(IdentityTest, Fnv1a64_IncrementalMatchesSingleShot) {
    Fnv1a64 h;
    h.update("hello ");
    h.update("world");
    EXPECT_EQ(to_hex(h.digest()), fingerprint("hello world"));
}

// ==============================================================================
// Составные отпечатки
// ==============================================================================

TEST(IdentityTest, LocalIdentity_SensitiveToEveryComponent) {
    std::string base = local_identity("/src/a.txt", 10, 1000);

    EXPECT_EQ(base, local_identity("/src/a.txt", 10, 1000));
    EXPECT_NE(base, local_identity("/src/b.txt", 10, 1000));
    EXPECT_NE(base, local_identity("/src/a.txt", 11, 1000));
    EXPECT_NE(base, local_identity("/src/a.txt", 10, 1001));
}

TEST(IdentityTest, RemoteIdentity_DependsOnKeyAndEtag) {
    EXPECT_EQ(remote_identity("k/a", "e1"), fingerprint("k/a:e1"));
    EXPECT_NE(remote_identity("k/a", "e1"), remote_identity("k/a", "e2"));
    EXPECT_NE(remote_identity("k/a", "e1"), remote_identity("k/b", "e1"));
}

// ==============================================================================
// stat_local
// ==============================================================================

TEST_F(IdentityFsTest, StatLocal_RegularFile) {
    fs::path file = test_dir_ / "data.bin";
    write_file(file, "12345");

    auto state = stat_local(file);

    ASSERT_TRUE(state.has_value());
    EXPECT_EQ(state->size, 5u);
    EXPECT_EQ(state->identity.size(), 16u);
}

TEST_F(IdentityFsTest, StatLocal_ChangesWhenMtimeChanges) {
    fs::path file = test_dir_ / "data.bin";
    write_file(file, "12345");
    auto before = stat_local(file);

    fs::last_write_time(file, fs::last_write_time(file) + std::chrono::seconds(10));
    auto after = stat_local(file);

    ASSERT_TRUE(before && after);
    EXPECT_NE(before->identity, after->identity);
}

TEST_F(IdentityFsTest, StatLocal_MissingOrDirectory_ReturnsNullopt) {
    EXPECT_FALSE(stat_local(test_dir_ / "missing").has_value());
    EXPECT_FALSE(stat_local(test_dir_).has_value());
}

}  // namespace turbosort::identity::test
