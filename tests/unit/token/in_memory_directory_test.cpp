#include <gtest/gtest.h>

#include "otpm/foundation/error_code.hpp"
#include "otpm/token/in_memory_directory.hpp"

#include <string>
#include <thread>
#include <vector>

using namespace otpm::token;
using otpm::foundation::ErrorCode;

namespace {

AttributeMap tokenAttributes(const std::string& id) {
    AttributeMap attributes;
    attributes["tokenId"] = {id};
    attributes["tokenDisabled"] = {"FALSE"};
    return attributes;
}

const std::vector<std::string> kTotpClasses = {"otpToken", "otpTokenTotp"};

}  // namespace

// =============================================================================
// Layout
// =============================================================================

TEST(DirectoryLayoutTest, ReferencesAndPrimaryKey) {
    DirectoryLayout layout;
    EXPECT_EQ(layout.userReference("alice"), "uid=alice,cn=users,cn=accounts,dc=example,dc=com");
    EXPECT_EQ(layout.tokenReference("t1"), "tokenId=t1,cn=otp,dc=example,dc=com");

    EXPECT_EQ(DirectoryLayout::primaryKey("uid=alice,cn=users"), "alice");
    EXPECT_EQ(DirectoryLayout::primaryKey("uid=bob"), "bob");
    EXPECT_FALSE(DirectoryLayout::primaryKey("alice").has_value());
    EXPECT_FALSE(DirectoryLayout::primaryKey("uid=,cn=users").has_value());
}

// =============================================================================
// Token records
// =============================================================================

TEST(InMemoryDirectoryTest, CreateReadUpdateDelete) {
    InMemoryDirectory directory;

    auto id = directory.createRecord(kTotpClasses, tokenAttributes("t1"));
    ASSERT_TRUE(id.hasValue());
    EXPECT_EQ(id.value(), "t1");

    auto read = directory.readRecord("t1");
    ASSERT_TRUE(read.hasValue());
    EXPECT_EQ(read.value().at("objectClass"), kTotpClasses);

    ASSERT_TRUE(directory.updateRecord("t1", {{"tokenDisabled", {"TRUE"}},
                                              {"description", {"laptop"}}}).hasValue());
    ASSERT_TRUE(directory.updateRecord("t1", {{"description", {}}}).hasValue());
    read = directory.readRecord("t1");
    EXPECT_EQ(read.value().at("tokenDisabled").front(), "TRUE");
    EXPECT_EQ(read.value().count("description"), 0u);

    ASSERT_TRUE(directory.deleteRecord("t1").hasValue());
    EXPECT_EQ(directory.tokenCount(), 0u);
}

TEST(InMemoryDirectoryTest, DuplicateAndMissingRecords) {
    InMemoryDirectory directory;
    ASSERT_TRUE(directory.createRecord(kTotpClasses, tokenAttributes("t1")).hasValue());

    auto duplicate = directory.createRecord(kTotpClasses, tokenAttributes("t1"));
    ASSERT_TRUE(duplicate.hasError());
    EXPECT_EQ(duplicate.error().code(), ErrorCode::TokenAlreadyExists);

    EXPECT_EQ(directory.readRecord("nope").error().code(), ErrorCode::TokenNotFound);
    EXPECT_EQ(directory.updateRecord("nope", {}).error().code(), ErrorCode::TokenNotFound);
    EXPECT_EQ(directory.deleteRecord("nope").error().code(), ErrorCode::TokenNotFound);

    auto anonymous = directory.createRecord(kTotpClasses, AttributeMap{});
    ASSERT_TRUE(anonymous.hasError());
    EXPECT_EQ(anonymous.error().code(), ErrorCode::InvalidArgument);
}

TEST(InMemoryDirectoryTest, SearchHonorsFilterAndSizeLimit) {
    InMemoryDirectory directory;
    for (auto id : {"a1", "a2", "b1"}) {
        ASSERT_TRUE(directory.createRecord(kTotpClasses, tokenAttributes(id)).hasValue());
    }

    auto all = directory.search("(objectClass=otpToken)", 0);
    ASSERT_TRUE(all.hasValue());
    EXPECT_EQ(all.value().entries.size(), 3u);
    EXPECT_FALSE(all.value().truncated);

    auto prefixed = directory.search("(tokenId=a*)", 0);
    ASSERT_TRUE(prefixed.hasValue());
    EXPECT_EQ(prefixed.value().entries.size(), 2u);

    auto limited = directory.search("(objectClass=otpToken)", 2);
    ASSERT_TRUE(limited.hasValue());
    EXPECT_EQ(limited.value().entries.size(), 2u);
    EXPECT_TRUE(limited.value().truncated);

    auto exact = directory.search("(tokenId=a*)", 2);
    ASSERT_TRUE(exact.hasValue());
    EXPECT_FALSE(exact.value().truncated);

    auto bad = directory.search("(tokenId=a", 0);
    ASSERT_TRUE(bad.hasError());
    EXPECT_EQ(bad.error().code(), ErrorCode::InvalidFilter);
}

// =============================================================================
// Identities
// =============================================================================

TEST(InMemoryDirectoryTest, ResolveIdentityByUidOrReference) {
    InMemoryDirectory directory;
    auto alice = directory.addUser("alice", "alice@EXAMPLE.COM");

    EXPECT_EQ(directory.resolveIdentity("alice").value(), alice);
    EXPECT_EQ(directory.resolveIdentity(alice).value(), alice);
    EXPECT_EQ(directory.resolveIdentity("bob").error().code(), ErrorCode::UserNotFound);
    EXPECT_EQ(directory.resolveIdentity("uid=alice,cn=elsewhere").error().code(),
              ErrorCode::UserNotFound);
    EXPECT_EQ(directory.displayIdentifier(alice), "alice");
}

TEST(InMemoryDirectoryTest, LookupAttributeOnUsersAndTokens) {
    InMemoryDirectory directory;
    auto alice = directory.addUser("alice", "alice@EXAMPLE.COM");
    ASSERT_TRUE(directory.createRecord(kTotpClasses, tokenAttributes("t1")).hasValue());

    EXPECT_EQ(directory.lookupAttribute(alice, kPrincipalAttribute).value(), "alice@EXAMPLE.COM");
    EXPECT_EQ(directory.lookupAttribute(directory.layout().tokenReference("t1"), "tokenId").value(),
              "t1");
    EXPECT_EQ(directory.lookupAttribute(alice, "mail").error().code(),
              otpm::foundation::ErrorCode::NotFound);
    EXPECT_EQ(directory.lookupAttribute("uid=ghost", "uid").error().code(),
              otpm::foundation::ErrorCode::NotFound);
}

TEST(InMemoryDirectoryTest, CurrentIdentity) {
    InMemoryDirectory directory;
    EXPECT_FALSE(directory.currentIdentity().has_value());

    directory.addUser("alice");
    directory.setCurrentUser("alice");
    auto caller = directory.currentIdentity();
    ASSERT_TRUE(caller.has_value());
    EXPECT_EQ(caller->uid, "alice");
    EXPECT_EQ(caller->reference, directory.layout().userReference("alice"));
}

TEST(InMemoryDirectoryTest, ConcurrentCreatesAreAllStored) {
    InMemoryDirectory directory;
    constexpr int kThreads = 4;
    constexpr int kPerThread = 25;

    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&directory, t] {
            for (int i = 0; i < kPerThread; ++i) {
                auto id = "t" + std::to_string(t) + "-" + std::to_string(i);
                EXPECT_TRUE(directory.createRecord(kTotpClasses, tokenAttributes(id)).hasValue());
            }
        });
    }
    for (auto& th : threads) {
        th.join();
    }
    EXPECT_EQ(directory.tokenCount(), static_cast<std::size_t>(kThreads * kPerThread));
}
