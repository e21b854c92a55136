#include <gtest/gtest.h>
#include "fm/discipline_model.h"

using namespace fm;

static MatchState makeState() {
    MatchSetup setup;
    setup.homeRoster = &getLisbonRoster();
    setup.awayRoster = &getPortoRoster();
    setup.homeTactics = createDefaultTactics(getLisbonRoster());
    setup.awayTactics = createDefaultTactics(getPortoRoster());
    MatchState state = createMatchState(setup);
    state.phase = MatchPhase::FIRST_HALF;
    state.minute = 30;
    return state;
}

// Straight reds disabled: no severity roll is ever made
static DisciplineConfig noDirectRed() {
    DisciplineConfig config;
    config.directRedWeight = 100.0;
    return config;
}

TEST(DisciplineModel, FirstOffenceIsYellow) {
    MatchState state = makeState();
    FixedRng rng({0.0});
    FoulDecision d = maybeFoul(state, TeamSide::AWAY, 30, rng, noDirectRed(), nullptr);

    EXPECT_TRUE(d.committed);
    EXPECT_EQ(d.foulerId, state.away.tactics.lineup[0]);
    EXPECT_EQ(d.severity, CardSeverity::YELLOW);
    EXPECT_FALSE(d.secondBooking);
    EXPECT_GT(d.weight, 0.0);
    EXPECT_EQ(rng.remaining(), 0u);
}

TEST(DisciplineModel, BookedPlayerAlwaysSeesRed) {
    MatchState state = makeState();
    int booked = state.away.tactics.lineup[0];
    state.away.bookings[booked] = 1;

    DisciplineConfig config;
    config.directRedChance = 0.0;
    FixedRng rng({0.0});
    FoulDecision d = maybeFoul(state, TeamSide::AWAY, 30, rng, config, nullptr);

    EXPECT_EQ(d.foulerId, booked);
    EXPECT_EQ(d.severity, CardSeverity::RED);
    EXPECT_TRUE(d.secondBooking);
    EXPECT_EQ(rng.remaining(), 0u);
}

TEST(DisciplineModel, StraightRedNeedsHighWeight) {
    MatchState state = makeState();
    DisciplineConfig config;
    config.directRedWeight = 0.0;
    config.directRedChance = 0.5;

    FixedRng red({0.0, 0.3});
    FoulDecision d = maybeFoul(state, TeamSide::AWAY, 30, red, config, nullptr);
    EXPECT_EQ(d.severity, CardSeverity::RED);
    EXPECT_FALSE(d.secondBooking);

    FixedRng yellow({0.0, 0.7});
    d = maybeFoul(state, TeamSide::AWAY, 30, yellow, config, nullptr);
    EXPECT_EQ(d.severity, CardSeverity::YELLOW);
}

TEST(DisciplineModel, SentOffPlayersNeverSelected) {
    MatchState state = makeState();
    const auto& lineup = state.away.tactics.lineup;
    for (size_t i = 0; i + 1 < lineup.size(); ++i) {
        state.away.sentOff[lineup[i]] = true;
        state.away.bookings[lineup[i]] = 2;
    }

    FixedRng rng({0.0});
    FoulDecision d = maybeFoul(state, TeamSide::AWAY, 30, rng, noDirectRed(), nullptr);
    EXPECT_TRUE(d.committed);
    EXPECT_EQ(d.foulerId, lineup.back());
}

TEST(DisciplineModel, NobodyLeftConsumesNoDraw) {
    MatchState state = makeState();
    for (int id : state.away.tactics.lineup) state.away.sentOff[id] = true;

    FixedRng rng({});
    FoulDecision d = maybeFoul(state, TeamSide::AWAY, 30, rng, noDirectRed(), nullptr);
    EXPECT_FALSE(d.committed);
    EXPECT_EQ(d.foulerId, -1);
}

TEST(DisciplineModel, ApplyCardEscalates) {
    MatchState state = makeState();
    int id = state.home.tactics.lineup[3];

    FoulDecision yellow;
    yellow.committed = true;
    yellow.foulerId = id;
    yellow.severity = CardSeverity::YELLOW;
    applyCard(state.home, yellow);
    EXPECT_EQ(state.home.bookingsOf(id), 1);
    EXPECT_FALSE(state.home.isSentOff(id));

    FoulDecision red = yellow;
    red.severity = CardSeverity::RED;
    red.secondBooking = true;
    applyCard(state.home, red);
    EXPECT_EQ(state.home.bookingsOf(id), 2);
    EXPECT_TRUE(state.home.isSentOff(id));
    EXPECT_EQ(state.home.onPitchCount(), 10);
}

TEST(DisciplineModel, StraightRedSetsTwoBookings) {
    MatchState state = makeState();
    FoulDecision red;
    red.committed = true;
    red.foulerId = state.home.tactics.lineup[2];
    red.severity = CardSeverity::RED;
    applyCard(state.home, red);
    EXPECT_EQ(state.home.bookingsOf(red.foulerId), 2);
    EXPECT_TRUE(state.home.isSentOff(red.foulerId));
}

TEST(DisciplineModel, ApplyCardIgnoresNoFoul) {
    MatchState state = makeState();
    applyCard(state.home, FoulDecision::none());
    EXPECT_TRUE(state.home.bookings.empty());
    EXPECT_TRUE(state.home.sentOff.empty());
}

TEST(DisciplineModel, TracesSelection) {
    MatchState state = makeState();
    TraceRecorder recorder;
    FixedRng rng({0.0});
    FoulDecision d = maybeFoul(state, TeamSide::AWAY, 30, rng, noDirectRed(), &recorder);

    auto traces = recorder.ofType(TraceType::FOUL_SELECTION);
    ASSERT_EQ(traces.size(), 1u);
    EXPECT_EQ(traces[0].team, TraceTeam::AWAY);
    EXPECT_EQ(traces[0].inputs["candidates"].size(), 11u);
    EXPECT_EQ(traces[0].outcome["foulerId"].get<int>(), d.foulerId);
    EXPECT_EQ(traces[0].outcome["card"].get<std::string>(), "yellow");
}
