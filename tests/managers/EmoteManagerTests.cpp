/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#define BOOST_TEST_MODULE EmoteManagerTests
#include <boost/test/unit_test.hpp>

#include "core/ClientError.hpp"
#include "entities/EntityBuilder.hpp"
#include "managers/EmoteManager.hpp"
#include "mocks/TestGuild.hpp"
#include "utils/JsonReader.hpp"

#include <stdexcept>

using namespace Chorus;

struct EmoteManagerFixture : TestGuild {
    std::shared_ptr<Emote> emote = addEmote(Snowflake(300), "party");

    JsonValue parseBody(const std::string& body) {
        JsonReader reader;
        BOOST_REQUIRE_MESSAGE(reader.parse(body), reader.getLastError());
        return reader.getRoot();
    }
};

BOOST_FIXTURE_TEST_SUITE(EmoteManagerTestSuite, EmoteManagerFixture)

BOOST_AUTO_TEST_CASE(ManagerIsCreatedOnceAndBoundToEmote) {
    EmoteManager& manager = emote->getManager();
    BOOST_CHECK(&manager == &emote->getManager());
    BOOST_CHECK(&manager.getEmote() == emote.get());
    BOOST_CHECK(manager.getGuild() == guild);
}

BOOST_AUTO_TEST_CASE(SetNameValidatesLength) {
    EmoteManager& manager = emote->getManager();
    BOOST_CHECK_THROW(manager.setName("a"), std::invalid_argument);
    BOOST_CHECK_THROW(manager.setName(std::string(33, 'x')), std::invalid_argument);
    BOOST_CHECK(!manager.isSet(EmoteManager::NAME));

    manager.setName("ok");
    manager.setName(std::string(32, 'x'));
    BOOST_CHECK(manager.isSet(EmoteManager::NAME));
}

BOOST_AUTO_TEST_CASE(SetNameCountsCharactersNotBytes) {
    // Two code points, six bytes
    BOOST_CHECK_NO_THROW(emote->getManager().setName("\xE2\x9C\x94\xE2\x9C\x94"));
}

BOOST_AUTO_TEST_CASE(SetRolesRejectsForeignRoles) {
    auto foreign = std::make_shared<Role>(Snowflake(900), Snowflake(999), "Elsewhere", 0, 1);
    EmoteManager& manager = emote->getManager();
    BOOST_CHECK_THROW(manager.setRoles({modRole, foreign}), std::invalid_argument);
    BOOST_CHECK_THROW(manager.setRoles({nullptr}), std::invalid_argument);
    BOOST_CHECK(!manager.isSet(EmoteManager::ROLES));
}

BOOST_AUTO_TEST_CASE(SetRolesOnFakeEmoteFails) {
    auto fake = client.getEntityBuilder().createFakeEmote(Snowflake(301), "ghost", false);
    BOOST_CHECK_THROW(fake->getManager().setRoles({modRole}), StateError);
}

BOOST_AUTO_TEST_CASE(ResetClearsSelectedFields) {
    EmoteManager& manager = emote->getManager();
    manager.setName("renamed").setRoles({modRole});
    BOOST_CHECK(manager.isSet(EmoteManager::NAME | EmoteManager::ROLES));

    manager.reset(EmoteManager::NAME);
    BOOST_CHECK(!manager.isSet(EmoteManager::NAME));
    BOOST_CHECK(manager.isSet(EmoteManager::ROLES));

    manager.reset();
    BOOST_CHECK(!manager.isSet(EmoteManager::NAME | EmoteManager::ROLES));
    BOOST_CHECK_EQUAL(manager.getRequestBody(), "{}");
}

BOOST_AUTO_TEST_CASE(UpdateSendsPatchWithPendingFields) {
    requester->respondWith(200, R"({"id": "300", "name": "renamed"})");
    EmoteManager& manager = emote->getManager();
    manager.setName("renamed").setRoles({modRole, memberRole});

    RestAction<bool> action = manager.update();
    BOOST_CHECK_EQUAL(requester->getCallCount(), 0);
    BOOST_CHECK(action.complete());

    MockRequester::Call call = requester->getLastCall();
    BOOST_CHECK(call.method == Method::Patch);
    BOOST_CHECK_EQUAL(call.path, "guilds/100/emojis/300");

    JsonValue body = parseBody(call.body);
    BOOST_CHECK_EQUAL(body["name"].asString(), "renamed");
    BOOST_REQUIRE_EQUAL(body["roles"].size(), 2);
    BOOST_CHECK_EQUAL(body["roles"][0].asString(), "200");
    BOOST_CHECK_EQUAL(body["roles"][1].asString(), "201");

    // Pending changes are cleared once applied
    BOOST_CHECK(!manager.isSet(EmoteManager::NAME | EmoteManager::ROLES));
}

BOOST_AUTO_TEST_CASE(FailedUpdateKeepsPendingFields) {
    requester->respondWith(400, R"({"message": "Invalid Form Body", "code": 50035})");
    EmoteManager& manager = emote->getManager();
    manager.setName("renamed");

    try {
        static_cast<void>(manager.update().complete());
        BOOST_FAIL("Expected RemoteFailureError");
    } catch (const RemoteFailureError& e) {
        BOOST_CHECK(e.getErrorResponse() == ErrorResponse::InvalidFormBody);
    }
    BOOST_CHECK(manager.isSet(EmoteManager::NAME));
}

BOOST_AUTO_TEST_CASE(ChangesAfterBuildingUpdateStayPending) {
    requester->respondWith(200);
    EmoteManager& manager = emote->getManager();
    manager.setName("renamed").setRoles({modRole});

    RestAction<bool> action = manager.update();
    manager.setName("renamed_again");

    BOOST_CHECK(action.complete());
    JsonValue sent = parseBody(requester->getLastCall().body);
    BOOST_CHECK_EQUAL(sent["name"].asString(), "renamed");
    BOOST_CHECK_EQUAL(sent["roles"].size(), 1);

    // Only the roles went out unchanged
    BOOST_CHECK(manager.isSet(EmoteManager::NAME));
    BOOST_CHECK(!manager.isSet(EmoteManager::ROLES));
    JsonValue pending = parseBody(manager.getRequestBody());
    BOOST_CHECK_EQUAL(pending["name"].asString(), "renamed_again");
    BOOST_CHECK(!pending.hasKey("roles"));
}

BOOST_AUTO_TEST_CASE(EmptyRoleListAllowsEveryone) {
    EmoteManager& manager = emote->getManager();
    manager.setRoles({});
    JsonValue body = parseBody(manager.getRequestBody());
    BOOST_CHECK(body["roles"].isArray());
    BOOST_CHECK_EQUAL(body["roles"].size(), 0);
    BOOST_CHECK(!body.hasKey("name"));
}

BOOST_AUTO_TEST_CASE(UpdateUsesDeleteGuards) {
    EmoteManager& manager = emote->getManager();
    manager.setName("renamed");

    setSelfRoles({TestGuild::MEMBER_ROLE_ID});
    BOOST_CHECK_THROW(static_cast<void>(manager.update()), InsufficientPermissionError);

    setSelfRoles({TestGuild::MOD_ROLE_ID});
    emote->setManaged(true);
    BOOST_CHECK_THROW(static_cast<void>(manager.update()), UnsupportedOperationError);

    emote->setManaged(false);
    client.removeGuild(TestGuild::GUILD_ID);
    BOOST_CHECK_THROW(static_cast<void>(manager.update()), StateError);

    BOOST_CHECK_EQUAL(requester->getCallCount(), 0);
}

BOOST_AUTO_TEST_CASE(FakeEmoteCannotBeUpdated) {
    auto fake = client.getEntityBuilder().createFakeEmote(Snowflake(301), "ghost", false);
    BOOST_CHECK_THROW(static_cast<void>(fake->getManager().update()), StateError);
}

BOOST_AUTO_TEST_SUITE_END()
