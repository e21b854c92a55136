#include <gtest/gtest.h>
#include "fm/match_state.h"

using namespace fm;

static MatchSetup defaultSetup() {
    MatchSetup setup;
    setup.homeRoster = &getLisbonRoster();
    setup.awayRoster = &getPortoRoster();
    setup.homeTactics = createDefaultTactics(getLisbonRoster());
    setup.awayTactics = createDefaultTactics(getPortoRoster());
    setup.fixtureId = "test";
    return setup;
}

TEST(MatchState, CreateFromSetup) {
    MatchState state = createMatchState(defaultSetup());

    EXPECT_EQ(state.phase, MatchPhase::SCHEDULED);
    EXPECT_EQ(state.minute, 0);
    EXPECT_EQ(state.homeScore(), 0);
    EXPECT_EQ(state.awayScore(), 0);
    EXPECT_EQ(state.fixtureId, "test");
    EXPECT_EQ(state.home.onPitchCount(), 11);
    EXPECT_EQ(state.away.onPitchCount(), 11);
    EXPECT_EQ(state.home.startingLineup, state.home.tactics.lineup);
    EXPECT_TRUE(state.home.bookings.empty());
    EXPECT_TRUE(state.home.sentOff.empty());
    EXPECT_EQ(state.home.subsUsed, 0);
}

TEST(MatchState, EnergyInitialisedForLineupAndBench) {
    MatchState state = createMatchState(defaultSetup());
    EXPECT_EQ(state.home.liveEnergy.size(), 18u);
    for (const auto& kv : state.home.liveEnergy) {
        EXPECT_DOUBLE_EQ(kv.second, 100.0);
    }
}

TEST(MatchState, BaselineEnergyCarriedIn) {
    TeamRoster tired = makeSquad("Tired", 500, 70);
    for (auto& p : tired.players) p.energy = 62.5;

    MatchSetup setup = defaultSetup();
    setup.homeRoster = &tired;
    setup.homeTactics = createDefaultTactics(tired);
    MatchState state = createMatchState(setup);
    EXPECT_DOUBLE_EQ(state.home.energyOf(setup.homeTactics.lineup[0]), 62.5);
}

TEST(MatchState, RejectsSharedPlayerIds) {
    MatchSetup setup = defaultSetup();
    setup.awayRoster = &getLisbonRoster();
    setup.awayTactics = createDefaultTactics(getLisbonRoster());
    EXPECT_THROW(createMatchState(setup), SetupError);
}

TEST(MatchState, RejectsInvalidTactics) {
    MatchSetup setup = defaultSetup();
    setup.awayTactics.lineup.resize(10);
    EXPECT_THROW(createMatchState(setup), SetupError);

    MatchSetup noRoster = defaultSetup();
    noRoster.homeRoster = nullptr;
    EXPECT_THROW(createMatchState(noRoster), SetupError);
}

TEST(MatchState, SentOffLeavesPitchButKeepsSlot) {
    MatchState state = createMatchState(defaultSetup());
    int id = state.home.tactics.lineup[5];
    state.home.sentOff[id] = true;

    EXPECT_TRUE(state.home.isInLineup(id));
    EXPECT_FALSE(state.home.isOnPitch(id));
    EXPECT_EQ(state.home.onPitchCount(), 10);
    EXPECT_EQ(state.home.sentOffCount(), 1);

    int visited = 0;
    state.home.forEachOnPitch([&](const Player&) { visited++; });
    EXPECT_EQ(visited, 10);
}

TEST(MatchState, BenchExcludesUsedPlayers) {
    MatchState state = createMatchState(defaultSetup());
    int sub = state.home.tactics.substitutes[0];
    EXPECT_TRUE(state.home.isOnBench(sub));
    state.home.substitutedPlayers.insert(sub);
    EXPECT_FALSE(state.home.isOnBench(sub));
}

TEST(MatchState, GoalDifferenceFromEachSide) {
    MatchState state = createMatchState(defaultSetup());
    state.home.score = 2;
    state.away.score = 1;
    EXPECT_EQ(state.goalDifference(TeamSide::HOME), 1);
    EXPECT_EQ(state.goalDifference(TeamSide::AWAY), -1);
}
