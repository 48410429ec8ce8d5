/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#define BOOST_TEST_MODULE EmoteTests
#include <boost/test/unit_test.hpp>

#include "core/ClientError.hpp"
#include "entities/EntityBuilder.hpp"
#include "managers/EmoteManager.hpp"
#include "mocks/TestGuild.hpp"

#include <atomic>
#include <chrono>
#include <thread>
#include <type_traits>
#include <unordered_set>
#include <vector>

using namespace Chorus;

struct EmoteFixture : TestGuild {
    std::shared_ptr<Emote> emote;
    std::shared_ptr<Emote> fake;

    EmoteFixture() {
        emote = addEmote(Snowflake(300), "party");
        emote->getRoleSet().put(modRole);
        fake = client.getEntityBuilder().createFakeEmote(Snowflake(301), "ghost", false);
    }
};

BOOST_FIXTURE_TEST_SUITE(FakeEmoteTests, EmoteFixture)

BOOST_AUTO_TEST_CASE(FakeEmoteHasNoRoles) {
    BOOST_CHECK(fake->isFake());
    BOOST_CHECK(!fake->canProvideRoles());
    BOOST_CHECK_THROW(static_cast<void>(fake->getRoles()), StateError);
    BOOST_CHECK_THROW(static_cast<void>(fake->getRoleSet()), StateError);
}

BOOST_AUTO_TEST_CASE(FakeEmoteHasNoGuild) {
    BOOST_CHECK(fake->getGuild() == nullptr);
    BOOST_CHECK(!fake->getGuildId().isValid());
}

BOOST_AUTO_TEST_CASE(FakeEmoteCannotBeCloned) {
    BOOST_CHECK(fake->clone() == nullptr);
}

BOOST_AUTO_TEST_CASE(FakeEmoteKeepsNameAndFlags) {
    auto animated = client.getEntityBuilder().createFakeEmote(Snowflake(302), "spin", true);
    BOOST_CHECK_EQUAL(animated->getName(), "spin");
    BOOST_CHECK(animated->isAnimated());
    BOOST_CHECK_EQUAL(animated->getAsMention(), "<a:spin:302>");
}

BOOST_AUTO_TEST_CASE(FakeEmoteCannotInteract) {
    Member member(*guild, std::make_shared<User>(Snowflake(9), "someone", "0001"),
                  std::vector<Snowflake>{});
    BOOST_CHECK(!fake->canInteract(member));
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_FIXTURE_TEST_SUITE(RealEmoteTests, EmoteFixture)

BOOST_AUTO_TEST_CASE(RealEmoteResolvesGuild) {
    BOOST_CHECK(!emote->isFake());
    BOOST_CHECK(emote->getGuild() == guild);
    BOOST_CHECK_EQUAL(emote->getGuildId(), TestGuild::GUILD_ID);
}

BOOST_AUTO_TEST_CASE(GetRolesReturnsIndependentSnapshot) {
    std::vector<std::shared_ptr<Role>> roles = emote->getRoles();
    BOOST_REQUIRE_EQUAL(roles.size(), 1);
    BOOST_CHECK(roles[0] == modRole);

    roles.clear();
    roles.push_back(memberRole);
    BOOST_CHECK_EQUAL(emote->getRoles().size(), 1);
    BOOST_CHECK(emote->getRoles()[0] == modRole);

    // Later changes to the emote do not show up in an earlier snapshot
    std::vector<std::shared_ptr<Role>> before = emote->getRoles();
    emote->getRoleSet().put(memberRole);
    BOOST_CHECK_EQUAL(before.size(), 1);
    BOOST_CHECK_EQUAL(emote->getRoles().size(), 2);
}

BOOST_AUTO_TEST_CASE(GuildEvictionIsSeenImmediately) {
    BOOST_REQUIRE(emote->getGuild() != nullptr);
    client.removeGuild(TestGuild::GUILD_ID);
    BOOST_CHECK(emote->getGuild() == nullptr);

    client.addGuild(guild);
    BOOST_CHECK(emote->getGuild() == guild);
}

BOOST_AUTO_TEST_CASE(UserIsOptional) {
    BOOST_CHECK(!emote->hasUser());
    BOOST_CHECK_THROW(static_cast<void>(emote->getUser()), StateError);

    auto creator = std::make_shared<User>(Snowflake(5), "artist", "1234");
    emote->setUser(creator);
    BOOST_CHECK(emote->hasUser());
    BOOST_CHECK(emote->getUser() == creator);
}

BOOST_AUTO_TEST_CASE(MentionAndImageUrl) {
    BOOST_CHECK_EQUAL(emote->getAsMention(), "<:party:300>");
    BOOST_CHECK_EQUAL(emote->getImageUrl(), "https://cdn.discordapp.com/emojis/300.png");

    emote->setAnimated(true);
    BOOST_CHECK_EQUAL(emote->getAsMention(), "<a:party:300>");
    BOOST_CHECK_EQUAL(emote->getImageUrl(), "https://cdn.discordapp.com/emojis/300.gif");

    client.getConfig().set("rest", "cdn_base", std::string("https://cdn.example.com"));
    BOOST_CHECK_EQUAL(emote->getImageUrl(), "https://cdn.example.com/emojis/300.gif");
}

BOOST_AUTO_TEST_CASE(ToStringAndTimeCreated) {
    BOOST_CHECK_EQUAL(emote->toString(), "E:party(300)");

    // Timestamp bits of 300 are zero, so the emote dates from the platform epoch
    const auto created = std::chrono::duration_cast<std::chrono::milliseconds>(
        emote->getTimeCreated().time_since_epoch()).count();
    BOOST_CHECK_EQUAL(created, Snowflake::EPOCH_MS);
}

BOOST_AUTO_TEST_CASE(CanInteractRequiresMatchingRole) {
    auto user = std::make_shared<User>(Snowflake(9), "someone", "0001");
    Member moderator(*guild, user, {TestGuild::MOD_ROLE_ID});
    Member regular(*guild, user, {TestGuild::MEMBER_ROLE_ID});

    BOOST_CHECK(emote->canInteract(moderator));
    BOOST_CHECK(!emote->canInteract(regular));

    // No role restriction means everyone in the guild may use it
    auto open = addEmote(Snowflake(310), "open");
    BOOST_CHECK(open->canInteract(regular));
}

BOOST_AUTO_TEST_CASE(CanInteractRejectsOtherGuild) {
    Guild other(client, Snowflake(999), "Other", TestGuild::OWNER_ID);
    Member stranger(other, std::make_shared<User>(Snowflake(9), "someone", "0001"),
                    {TestGuild::MOD_ROLE_ID});
    BOOST_CHECK(!emote->canInteract(stranger));
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_FIXTURE_TEST_SUITE(EqualityTests, EmoteFixture)

BOOST_AUTO_TEST_CASE(SameIdIsEqualRegardlessOfName) {
    Emote first(Snowflake(400), *guild);
    Emote second(Snowflake(400), *guild);
    first.setName("same");
    second.setName("same");
    BOOST_CHECK(first == second);
    BOOST_CHECK_EQUAL(std::hash<Emote>{}(first), std::hash<Emote>{}(second));

    // A rename observed by only one side does not break identity
    second.setName("renamed");
    BOOST_CHECK(first == second);
    BOOST_CHECK_EQUAL(first.hash(), second.hash());
}

BOOST_AUTO_TEST_CASE(DifferentIdsAreNotEqual) {
    Emote first(Snowflake(400), *guild);
    Emote second(Snowflake(401), *guild);
    first.setName("same");
    second.setName("same");
    BOOST_CHECK(first != second);
}

BOOST_AUTO_TEST_CASE(FakeAndRealWithSameIdAreEqual) {
    Emote real(Snowflake(402), *guild);
    Emote detached(Snowflake(402), client);
    BOOST_CHECK(real == detached);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_FIXTURE_TEST_SUITE(CloneTests, EmoteFixture)

BOOST_AUTO_TEST_CASE(CloneCopiesIdFlagsAndUser) {
    auto creator = std::make_shared<User>(Snowflake(5), "artist", "1234");
    emote->setAnimated(true).setManaged(true).setUser(creator);

    std::shared_ptr<Emote> copy = emote->clone();
    BOOST_REQUIRE(copy != nullptr);
    BOOST_CHECK(copy.get() != emote.get());
    BOOST_CHECK_EQUAL(copy->getId(), emote->getId());
    BOOST_CHECK(*copy == *emote);
    BOOST_CHECK_EQUAL(copy->getName(), "party");
    BOOST_CHECK(copy->isAnimated());
    BOOST_CHECK(copy->isManaged());
    BOOST_CHECK(!copy->isFake());
    BOOST_CHECK(copy->getUser() == creator);
    BOOST_CHECK(copy->getGuild() == guild);
}

BOOST_AUTO_TEST_CASE(CloneIsSolelyOwnedByCaller) {
    static_assert(!std::is_default_constructible_v<Emote::CloneTag>,
                  "only Emote may construct a clone");

    std::shared_ptr<Emote> copy = emote->clone();
    BOOST_REQUIRE(copy != nullptr);
    BOOST_CHECK_EQUAL(copy.use_count(), 1);
    BOOST_CHECK(guild->getEmoteById(emote->getId()) == emote);
}

BOOST_AUTO_TEST_CASE(CloneHasIndependentRoleSet) {
    std::shared_ptr<Emote> copy = emote->clone();
    BOOST_REQUIRE(copy != nullptr);
    BOOST_CHECK_EQUAL(copy->getRoles().size(), 1);

    copy->getRoleSet().put(memberRole);
    BOOST_CHECK_EQUAL(copy->getRoles().size(), 2);
    BOOST_CHECK_EQUAL(emote->getRoles().size(), 1);

    emote->getRoleSet().remove(TestGuild::MOD_ROLE_ID);
    BOOST_CHECK(emote->getRoles().empty());
    BOOST_CHECK_EQUAL(copy->getRoles().size(), 2);
}

BOOST_AUTO_TEST_CASE(CloneIsUnaffectedByLaterChanges) {
    std::shared_ptr<Emote> copy = emote->clone();
    BOOST_REQUIRE(copy != nullptr);
    emote->setName("renamed").setAnimated(true);
    BOOST_CHECK_EQUAL(copy->getName(), "party");
    BOOST_CHECK(!copy->isAnimated());
}

BOOST_AUTO_TEST_CASE(CloneSharesGuildReference) {
    std::shared_ptr<Emote> copy = emote->clone();
    BOOST_REQUIRE(copy != nullptr);
    client.removeGuild(TestGuild::GUILD_ID);
    BOOST_CHECK(copy->getGuild() == nullptr);
    BOOST_CHECK_EQUAL(copy->getGuildId(), TestGuild::GUILD_ID);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_FIXTURE_TEST_SUITE(ConcurrencyTests, EmoteFixture)

BOOST_AUTO_TEST_CASE(ConcurrentGetManagerReturnsOneInstance) {
    constexpr int NUM_THREADS = 16;
    std::vector<EmoteManager*> seen(NUM_THREADS, nullptr);
    std::atomic<bool> start{false};
    std::vector<std::thread> threads;

    for (int i = 0; i < NUM_THREADS; ++i) {
        threads.emplace_back([&, i]() {
            while (!start.load(std::memory_order_acquire)) {
                std::this_thread::yield();
            }
            seen[i] = &emote->getManager();
        });
    }
    start.store(true, std::memory_order_release);
    for (auto& thread : threads) {
        thread.join();
    }

    for (EmoteManager* manager : seen) {
        BOOST_CHECK(manager == seen[0]);
    }
    BOOST_CHECK(&seen[0]->getEmote() == emote.get());
}

BOOST_AUTO_TEST_CASE(ConcurrentReadersSeeWholeNames) {
    const std::unordered_set<std::string> names{"party", "celebrate_hard"};
    std::atomic<bool> stop{false};
    std::atomic<int> torn{0};

    std::thread writer([&]() {
        for (int i = 0; i < 2000; ++i) {
            emote->setName(i % 2 == 0 ? "celebrate_hard" : "party");
        }
        stop.store(true, std::memory_order_release);
    });

    std::vector<std::thread> readers;
    for (int i = 0; i < 4; ++i) {
        readers.emplace_back([&]() {
            while (!stop.load(std::memory_order_acquire)) {
                if (names.count(emote->getName()) == 0) {
                    torn.fetch_add(1, std::memory_order_relaxed);
                }
            }
        });
    }

    writer.join();
    for (auto& reader : readers) {
        reader.join();
    }
    BOOST_CHECK_EQUAL(torn.load(), 0);
}

BOOST_AUTO_TEST_SUITE_END()
