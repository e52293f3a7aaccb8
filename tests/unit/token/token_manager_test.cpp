#include <gtest/gtest.h>

#include "otpm/foundation/error_code.hpp"
#include "otpm/foundation/otp_logger.hpp"
#include "otpm/token/in_memory_directory.hpp"
#include "otpm/token/schema_resolver.hpp"
#include "otpm/token/token_manager.hpp"

#include "support/mock_logger.hpp"

#include <algorithm>
#include <chrono>
#include <memory>
#include <string>
#include <vector>

using namespace otpm::token;
using otpm::foundation::ErrorCode;
using otpm::foundation::LogCategory;
using otpm::foundation::LogLevel;
using otpm::foundation::OtpLogger;

namespace {

const std::string kKnownSecret = "JBSWY3DPEHPK3PXP";

Timestamp at(std::time_t seconds) {
    return std::chrono::system_clock::from_time_t(seconds);
}

KeyInput base32Key(const std::string& text) {
    return KeyInput{text, text};
}

}  // namespace

class TokenManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        directory_ = std::make_shared<InMemoryDirectory>();
        directory_->addUser("alice", "alice@EXAMPLE.COM");
        directory_->addUser("bob", "bob@EXAMPLE.COM");
        directory_->addUser("carol");
        directory_->setCurrentUser("alice");
        manager_ = std::make_unique<TokenManager>(ManagerConfig{}, directory_, directory_);
    }

    std::string ref(const std::string& uid) const {
        return directory_->layout().userReference(uid);
    }

    CreateResult createOrFail(const CreateRequest& request) {
        auto created = manager_->create(request);
        EXPECT_TRUE(created.hasValue())
            << (created.hasError() ? std::string(created.error().message()) : "");
        return created.hasValue() ? created.value() : CreateResult{};
    }

    std::shared_ptr<InMemoryDirectory> directory_;
    std::unique_ptr<TokenManager> manager_;
};

// =============================================================================
// Create
// =============================================================================

TEST_F(TokenManagerTest, CreateWithDefaults) {
    auto created = createOrFail({});
    const auto& token = created.token;

    EXPECT_EQ(token.id.size(), 36u);
    EXPECT_EQ(token.id[14], '4');
    ASSERT_TRUE(token.type.has_value());
    EXPECT_EQ(*token.type, TokenType::Totp);
    ASSERT_TRUE(token.params.has_value());
    EXPECT_EQ(std::get<TotpParams>(*token.params), (TotpParams{0, 30}));
    EXPECT_EQ(token.algorithm, HashAlgorithm::Sha1);
    EXPECT_EQ(token.digits, 6);
    EXPECT_EQ(token.owner, "alice");
    EXPECT_EQ(token.managers, std::vector<std::string>{"alice"});
    EXPECT_FALSE(token.disabled);

    auto raw = directory_->rawRecord(token.id);
    ASSERT_TRUE(raw.has_value());
    EXPECT_EQ(raw->at(std::string(attr::kKey)).front().size(), kKeyLength);
    EXPECT_EQ(raw->at(std::string(attr::kOwner)).front(), ref("alice"));

    const auto& uri = created.uri;
    EXPECT_EQ(uri.rfind("otpauth://totp/alice@EXAMPLE.COM:" + token.id + "?issuer=", 0), 0u);
    EXPECT_NE(uri.find("&digits=6&algorithm=SHA1&period=30"), std::string::npos);
    auto secretAt = uri.find("secret=");
    ASSERT_NE(secretAt, std::string::npos);
    EXPECT_EQ(uri.find('&', secretAt) - secretAt - 7, 32u);
}

TEST_F(TokenManagerTest, CreateHotpWithSuppliedKeyDropsTotpFields) {
    CreateRequest request;
    request.id = "t1";
    request.type = "HOTP";
    request.key = base32Key(kKnownSecret);
    request.counter = 5;
    request.timeStep = 60;
    request.digits = 8;
    request.algorithm = "sha256";

    auto created = createOrFail(request);
    EXPECT_EQ(created.token.id, "t1");
    EXPECT_EQ(created.token.type, TokenType::Hotp);
    EXPECT_EQ(std::get<HotpParams>(*created.token.params).counter, 5);
    EXPECT_EQ(created.uri,
              "otpauth://hotp/alice@EXAMPLE.COM:t1?issuer=alice%40EXAMPLE.COM&secret=" +
                  kKnownSecret + "&digits=8&algorithm=SHA256&counter=5");

    auto raw = directory_->rawRecord("t1");
    ASSERT_TRUE(raw.has_value());
    EXPECT_EQ(raw->count(std::string(attr::kTotpTimeStep)), 0u);
    EXPECT_EQ(raw->count(std::string(attr::kTotpClockOffset)), 0u);
    EXPECT_EQ(raw->at(std::string(attr::kKey)).front().size(), 10u);
}

TEST_F(TokenManagerTest, CreateRejectsMismatchedKeyConfirmation) {
    CreateRequest request;
    request.key = KeyInput{kKnownSecret, std::string("JBSWY3DPEHPK3PXQ")};

    auto created = manager_->create(request);
    ASSERT_TRUE(created.hasError());
    EXPECT_EQ(created.error().code(), ErrorCode::KeyMismatch);
    EXPECT_EQ(directory_->tokenCount(), 0u);
}

TEST_F(TokenManagerTest, CreateRejectsInvertedValidity) {
    CreateRequest request;
    request.notBefore = at(1700000000);
    request.notAfter = at(1600000000);

    auto created = manager_->create(request);
    ASSERT_TRUE(created.hasError());
    EXPECT_EQ(created.error().code(), ErrorCode::ValidationFailed);
    EXPECT_EQ(created.error().field(), "notAfter");
    EXPECT_EQ(directory_->tokenCount(), 0u);
}

TEST_F(TokenManagerTest, CreateRejectsUnknownTypeAndDuplicateId) {
    CreateRequest unknown;
    unknown.type = "sms";
    auto rejected = manager_->create(unknown);
    ASSERT_TRUE(rejected.hasError());
    EXPECT_EQ(rejected.error().code(), ErrorCode::UnknownTokenType);

    CreateRequest request;
    request.id = "dup";
    createOrFail(request);
    auto duplicate = manager_->create(request);
    ASSERT_TRUE(duplicate.hasError());
    EXPECT_EQ(duplicate.error().code(), ErrorCode::TokenAlreadyExists);
    EXPECT_EQ(directory_->tokenCount(), 1u);
}

TEST_F(TokenManagerTest, CreateRejectsUnknownOwnerOrManager) {
    CreateRequest badOwner;
    badOwner.owner = "mallory";
    auto owner = manager_->create(badOwner);
    ASSERT_TRUE(owner.hasError());
    EXPECT_EQ(owner.error().code(), ErrorCode::OwnerNotFound);
    EXPECT_EQ(owner.error().field(), "owner");

    CreateRequest badManager;
    badManager.manager = "mallory";
    auto manager = manager_->create(badManager);
    ASSERT_TRUE(manager.hasError());
    EXPECT_EQ(manager.error().code(), ErrorCode::UserNotFound);
    EXPECT_EQ(manager.error().field(), "manager");
    EXPECT_EQ(directory_->tokenCount(), 0u);
}

TEST_F(TokenManagerTest, CreateForAnotherOwnerLeavesManagersEmpty) {
    CreateRequest request;
    request.owner = "bob";

    auto created = createOrFail(request);
    EXPECT_EQ(created.token.owner, "bob");
    EXPECT_TRUE(created.token.managers.empty());
    EXPECT_NE(created.uri.find("otpauth://totp/bob@EXAMPLE.COM:"), std::string::npos);
}

TEST_F(TokenManagerTest, IssuerFallsBackToRealm) {
    CreateRequest noPrincipal;
    noPrincipal.owner = "carol";
    auto carol = createOrFail(noPrincipal);
    EXPECT_EQ(carol.uri.rfind("otpauth://totp/EXAMPLE.COM:", 0), 0u);

    directory_->setCurrentUser(std::nullopt);
    auto anonymous = createOrFail({});
    EXPECT_FALSE(anonymous.token.owner.has_value());
    EXPECT_TRUE(anonymous.token.managers.empty());
    EXPECT_EQ(anonymous.uri.rfind("otpauth://totp/EXAMPLE.COM:", 0), 0u);
}

TEST_F(TokenManagerTest, KeyMaterialNeverReachesTheLog) {
    otpm::test::ScopedMockLogger mock;
    auto& logger = OtpLogger::instance();
    std::vector<LogLevel> saved;
    for (std::size_t i = 0; i < otpm::foundation::kLogCategoryCount; ++i) {
        auto cat = static_cast<LogCategory>(i);
        saved.push_back(logger.getCategoryLevel(cat));
        logger.setCategoryLevel(cat, LogLevel::Trace);
    }

    CreateRequest request;
    request.id = "logged";
    request.key = base32Key(kKnownSecret);
    auto created = createOrFail(request);

    for (std::size_t i = 0; i < saved.size(); ++i) {
        logger.setCategoryLevel(static_cast<LogCategory>(i), saved[i]);
    }

    EXPECT_TRUE(mock->contains("token created"));
    EXPECT_FALSE(mock->contains(kKnownSecret));
    EXPECT_FALSE(mock->contains("otpauth://"));
    EXPECT_FALSE(created.uri.empty());
}

// =============================================================================
// Show / remove
// =============================================================================

TEST_F(TokenManagerTest, ShowShapesOutput) {
    CreateRequest request;
    request.id = "t1";
    request.info["description"] = "laptop";
    createOrFail(request);

    auto plain = manager_->show("t1");
    ASSERT_TRUE(plain.hasValue());
    EXPECT_EQ(plain.value().owner, "alice");
    EXPECT_EQ(plain.value().info.at("description"), "laptop");
    EXPECT_TRUE(plain.value().objectClasses.empty());

    auto raw = manager_->show("t1", OutputOptions{.raw = true});
    ASSERT_TRUE(raw.hasValue());
    EXPECT_EQ(raw.value().owner, ref("alice"));
    EXPECT_EQ(raw.value().managers, std::vector<std::string>{ref("alice")});

    auto all = manager_->show("t1", OutputOptions{.all = true});
    ASSERT_TRUE(all.hasValue());
    EXPECT_EQ(all.value().objectClasses, objectClassesFor(TokenType::Totp));

    auto missing = manager_->show("nope");
    ASSERT_TRUE(missing.hasError());
    EXPECT_EQ(missing.error().code(), ErrorCode::TokenNotFound);
}

TEST_F(TokenManagerTest, RemoveDeletesOnce) {
    CreateRequest request;
    request.id = "t1";
    createOrFail(request);

    EXPECT_TRUE(manager_->remove("t1").hasValue());
    EXPECT_EQ(manager_->show("t1").error().code(), ErrorCode::TokenNotFound);

    auto again = manager_->remove("t1");
    ASSERT_TRUE(again.hasError());
    EXPECT_EQ(again.error().code(), ErrorCode::TokenNotFound);
}

// =============================================================================
// Update
// =============================================================================

TEST_F(TokenManagerTest, EmptyUpdateIsRejected) {
    CreateRequest request;
    request.id = "t1";
    createOrFail(request);

    auto updated = manager_->update(UpdateRequest{"t1"});
    ASSERT_TRUE(updated.hasError());
    EXPECT_EQ(updated.error().code(), ErrorCode::NoModifications);
}

TEST_F(TokenManagerTest, UpdateFlagsAndInfo) {
    CreateRequest request;
    request.id = "t1";
    request.info["description"] = "laptop";
    createOrFail(request);

    UpdateRequest update{"t1"};
    update.disabled = true;
    update.info["vendor"] = "Acme";
    update.info["description"] = std::nullopt;

    auto updated = manager_->update(update);
    ASSERT_TRUE(updated.hasValue());
    EXPECT_TRUE(updated.value().disabled);
    EXPECT_EQ(updated.value().info.at("vendor"), "Acme");
    EXPECT_EQ(updated.value().info.count("description"), 0u);

    UpdateRequest unknownField{"t1"};
    unknownField.info["color"] = "red";
    auto rejected = manager_->update(unknownField);
    ASSERT_TRUE(rejected.hasError());
    EXPECT_EQ(rejected.error().code(), ErrorCode::InvalidArgument);
}

TEST_F(TokenManagerTest, OwnerChangeMovesSelfManagement) {
    CreateRequest request;
    request.id = "self";
    createOrFail(request);

    UpdateRequest update{"self"};
    update.owner = "bob";
    auto updated = manager_->update(update);
    ASSERT_TRUE(updated.hasValue());
    EXPECT_EQ(updated.value().owner, "bob");
    EXPECT_EQ(updated.value().managers, std::vector<std::string>{"bob"});
}

TEST_F(TokenManagerTest, OwnerChangeKeepsDelegatedManagement) {
    CreateRequest request;
    request.id = "delegated";
    request.manager = "carol";
    createOrFail(request);

    UpdateRequest update{"delegated"};
    update.owner = "bob";
    auto updated = manager_->update(update);
    ASSERT_TRUE(updated.hasValue());
    EXPECT_EQ(updated.value().owner, "bob");
    EXPECT_EQ(updated.value().managers, std::vector<std::string>{"carol"});

    UpdateRequest explicitManager{"delegated"};
    explicitManager.owner = "alice";
    explicitManager.manager = "bob";
    updated = manager_->update(explicitManager);
    ASSERT_TRUE(updated.hasValue());
    EXPECT_EQ(updated.value().owner, "alice");
    EXPECT_EQ(updated.value().managers, std::vector<std::string>{"bob"});
}

TEST_F(TokenManagerTest, UpdateRejectsUnknownOwner) {
    CreateRequest request;
    request.id = "t1";
    createOrFail(request);

    UpdateRequest update{"t1"};
    update.owner = "mallory";
    auto updated = manager_->update(update);
    ASSERT_TRUE(updated.hasError());
    EXPECT_EQ(updated.error().code(), ErrorCode::OwnerNotFound);
    EXPECT_EQ(manager_->show("t1").value().owner, "alice");
}

TEST_F(TokenManagerTest, PartialValidityUpdateChecksStoredBound) {
    CreateRequest request;
    request.id = "t1";
    request.notBefore = at(1600000000);
    request.notAfter = at(1700000000);
    createOrFail(request);

    UpdateRequest earlyEnd{"t1"};
    earlyEnd.notAfter = at(1500000000);
    auto rejected = manager_->update(earlyEnd);
    ASSERT_TRUE(rejected.hasError());
    EXPECT_EQ(rejected.error().code(), ErrorCode::ValidationFailed);
    EXPECT_EQ(rejected.error().field(), "notAfter");

    UpdateRequest lateStart{"t1"};
    lateStart.notBefore = at(1800000000);
    rejected = manager_->update(lateStart);
    ASSERT_TRUE(rejected.hasError());
    EXPECT_EQ(rejected.error().field(), "notBefore");

    auto unchanged = manager_->show("t1");
    EXPECT_EQ(unchanged.value().notBefore, at(1600000000));
    EXPECT_EQ(unchanged.value().notAfter, at(1700000000));

    UpdateRequest extend{"t1"};
    extend.notAfter = at(1800000000);
    auto extended = manager_->update(extend);
    ASSERT_TRUE(extended.hasValue());
    EXPECT_EQ(extended.value().notAfter, at(1800000000));
}

TEST_F(TokenManagerTest, UpdateMissingTokenFails) {
    UpdateRequest update{"nope"};
    update.disabled = true;
    auto updated = manager_->update(update);
    ASSERT_TRUE(updated.hasError());
    EXPECT_EQ(updated.error().code(), ErrorCode::TokenNotFound);
}

// =============================================================================
// Find
// =============================================================================

class TokenManagerFindTest : public TokenManagerTest {
protected:
    void SetUp() override {
        TokenManagerTest::SetUp();

        CreateRequest laptop;
        laptop.id = "a-laptop";
        laptop.info["description"] = "work laptop";
        createOrFail(laptop);

        CreateRequest phone;
        phone.id = "b-phone";
        phone.type = "hotp";
        phone.owner = "bob";
        phone.disabled = true;
        createOrFail(phone);

        CreateRequest fob;
        fob.id = "c-fob";
        fob.info["vendor"] = "Acme";
        createOrFail(fob);
    }

    static std::vector<std::string> ids(const SearchResult& result) {
        std::vector<std::string> out;
        for (const auto& token : result.tokens) {
            out.push_back(token.id);
        }
        return out;
    }
};

TEST_F(TokenManagerFindTest, EmptyRequestReturnsEverything) {
    auto found = manager_->find({});
    ASSERT_TRUE(found.hasValue());
    EXPECT_EQ(ids(found.value()), (std::vector<std::string>{"a-laptop", "b-phone", "c-fob"}));
    EXPECT_FALSE(found.value().truncated);
}

TEST_F(TokenManagerFindTest, CriteriaMatchesIdAndInfo) {
    SearchRequest byDescription;
    byDescription.criteria = "laptop";
    EXPECT_EQ(ids(manager_->find(byDescription).value()),
              std::vector<std::string>{"a-laptop"});

    SearchRequest byVendor;
    byVendor.criteria = "acme";
    EXPECT_EQ(ids(manager_->find(byVendor).value()), std::vector<std::string>{"c-fob"});
}

TEST_F(TokenManagerFindTest, TypeFilterNarrowsAndUnknownTypeIsIgnored) {
    SearchRequest hotp;
    hotp.type = "HOTP";
    EXPECT_EQ(ids(manager_->find(hotp).value()), std::vector<std::string>{"b-phone"});

    SearchRequest unknown;
    unknown.type = "sms";
    EXPECT_EQ(manager_->find(unknown).value().tokens.size(), 3u);
}

TEST_F(TokenManagerFindTest, OwnerAndDisabledFilters) {
    SearchRequest byOwner;
    byOwner.owner = "bob";
    EXPECT_EQ(ids(manager_->find(byOwner).value()), std::vector<std::string>{"b-phone"});

    SearchRequest enabled;
    enabled.disabled = false;
    EXPECT_EQ(ids(manager_->find(enabled).value()),
              (std::vector<std::string>{"a-laptop", "c-fob"}));

    SearchRequest ghost;
    ghost.owner = "mallory";
    auto rejected = manager_->find(ghost);
    ASSERT_TRUE(rejected.hasError());
    EXPECT_EQ(rejected.error().code(), ErrorCode::OwnerNotFound);
}

TEST_F(TokenManagerFindTest, SizeLimitTruncates) {
    SearchRequest request;
    request.sizeLimit = 2;
    auto found = manager_->find(request);
    ASSERT_TRUE(found.hasValue());
    EXPECT_EQ(found.value().tokens.size(), 2u);
    EXPECT_TRUE(found.value().truncated);
}

TEST_F(TokenManagerFindTest, PkeyOnlyReturnsIdsOnly) {
    auto found = manager_->find({}, OutputOptions{.all = true, .pkeyOnly = true});
    ASSERT_TRUE(found.hasValue());
    ASSERT_EQ(found.value().tokens.size(), 3u);
    for (const auto& token : found.value().tokens) {
        EXPECT_FALSE(token.id.empty());
        EXPECT_FALSE(token.owner.has_value());
        EXPECT_TRUE(token.managers.empty());
        EXPECT_TRUE(token.objectClasses.empty());
        EXPECT_FALSE(token.params.has_value());
    }
}

// =============================================================================
// Managers
// =============================================================================

TEST_F(TokenManagerTest, AddAndRemoveManagersReportPerUserFailures) {
    CreateRequest request;
    request.id = "t1";
    createOrFail(request);

    auto added = manager_->addManagers("t1", {"bob", "alice", "mallory"});
    ASSERT_TRUE(added.hasValue());
    EXPECT_EQ(added.value().completed, 1u);
    ASSERT_EQ(added.value().failed.size(), 2u);
    EXPECT_EQ(added.value().failed[0],
              (std::pair<std::string, std::string>{"alice", "This entry is already a member"}));
    EXPECT_EQ(added.value().failed[1],
              (std::pair<std::string, std::string>{"mallory", "no such entry"}));
    EXPECT_EQ(added.value().token.managers, (std::vector<std::string>{"alice", "bob"}));

    auto removed = manager_->removeManagers("t1", {"alice", "carol"});
    ASSERT_TRUE(removed.hasValue());
    EXPECT_EQ(removed.value().completed, 1u);
    ASSERT_EQ(removed.value().failed.size(), 1u);
    EXPECT_EQ(removed.value().failed[0].second, "This entry is not a member");
    EXPECT_EQ(removed.value().token.managers, std::vector<std::string>{"bob"});

    auto missing = manager_->addManagers("nope", {"bob"});
    ASSERT_TRUE(missing.hasError());
    EXPECT_EQ(missing.error().code(), ErrorCode::TokenNotFound);
}
