#include <gtest/gtest.h>
#include "fm/probability_engine.h"

using namespace fm;

static MatchState makeState(const TeamRoster& home, const TeamRoster& away,
                            Posture homePosture = Posture::BALANCED,
                            Posture awayPosture = Posture::BALANCED) {
    MatchSetup setup;
    setup.homeRoster = &home;
    setup.awayRoster = &away;
    setup.homeTactics = createDefaultTactics(home, Formation::F_4_3_3, homePosture);
    setup.awayTactics = createDefaultTactics(away, Formation::F_4_3_3, awayPosture);
    MatchState state = createMatchState(setup);
    state.phase = MatchPhase::FIRST_HALF;
    state.minute = 20;
    return state;
}

static MatchState defaultState() {
    return makeState(getLisbonRoster(), getPortoRoster());
}

// Identical attributes, so the strength difference is zero
static MatchState evenState(Posture homePosture = Posture::BALANCED,
                            Posture awayPosture = Posture::BALANCED) {
    static const TeamRoster alpha = makeSquad("Alpha", 500, 70);
    static const TeamRoster beta = makeSquad("Beta", 600, 70);
    return makeState(alpha, beta, homePosture, awayPosture);
}

// --- Possession ---

TEST(ProbabilityEngine, EvenSidesOnNeutralGround) {
    TeamRoster a = makeSquad("Alpha", 500, 70);
    TeamRoster b = makeSquad("Beta", 600, 70);
    MatchState state = makeState(a, b);

    EngineConfig config;
    config.match.neutralVenue = true;
    EXPECT_NEAR(possessionShare(state, config), 0.5, 1e-9);

    config.match.neutralVenue = false;
    EXPECT_NEAR(possessionShare(state, config), 0.58, 1e-9);
}

TEST(ProbabilityEngine, StrongerSideHasMoreBall) {
    MatchState state = makeState(getLisbonRoster(), getMinhoRoster());
    EngineConfig config;
    config.match.neutralVenue = true;
    EXPECT_GT(possessionShare(state, config), 0.5);

    MatchState reversed = makeState(getMinhoRoster(), getLisbonRoster());
    EXPECT_LT(possessionShare(reversed, config), 0.5);
}

TEST(ProbabilityEngine, PossessionClamped) {
    MatchState state = defaultState();
    for (size_t i = 1; i < state.away.tactics.lineup.size(); ++i) {
        state.away.sentOff[state.away.tactics.lineup[i]] = true;
    }
    EngineConfig config;
    EXPECT_DOUBLE_EQ(possessionShare(state, config), 0.8);
}

TEST(ProbabilityEngine, RedCardLowersStrength) {
    MatchState state = defaultState();
    double before = sideStrength(state.away);
    state.away.sentOff[state.away.tactics.lineup[4]] = true;
    EXPECT_LT(sideStrength(state.away), before);
}

// --- Trigger and categories ---

TEST(ProbabilityEngine, TriggerProbability) {
    MatchState state = defaultState();
    ProbabilityConfig config;
    EXPECT_NEAR(triggerProbability(state, TeamSide::HOME, 20, config), 0.15, 1e-9);
    EXPECT_NEAR(triggerProbability(state, TeamSide::HOME, 75, config), 0.15, 1e-9);
    EXPECT_NEAR(triggerProbability(state, TeamSide::HOME, 76, config), 0.1725, 1e-9);

    MatchState attacking = makeState(getLisbonRoster(), getPortoRoster(), Posture::ATTACKING);
    EXPECT_NEAR(triggerProbability(attacking, TeamSide::HOME, 20, config), 0.23, 1e-9);
}

TEST(ProbabilityEngine, BaseCategoryWeights) {
    MatchState state = evenState();
    std::vector<double> w = categoryWeights(state, TeamSide::HOME, ProbabilityConfig());
    ASSERT_EQ(w.size(), 5u);
    EXPECT_DOUBLE_EQ(w[0], 0.50);
    EXPECT_DOUBLE_EQ(w[1], 0.18);
    EXPECT_DOUBLE_EQ(w[2], 0.18);
    EXPECT_DOUBLE_EQ(w[3], 0.10);
    EXPECT_DOUBLE_EQ(w[4], 0.04);
}

TEST(ProbabilityEngine, TrailingSideCreatesMore) {
    MatchState state = evenState();
    ProbabilityConfig config;
    state.away.score = 1;
    EXPECT_NEAR(categoryWeights(state, TeamSide::HOME, config)[0], 0.55, 1e-9);
    state.away.score = 6;
    EXPECT_NEAR(categoryWeights(state, TeamSide::HOME, config)[0], 0.65, 1e-9);
    // Leader gets nothing extra
    EXPECT_NEAR(categoryWeights(state, TeamSide::AWAY, config)[0], 0.50, 1e-9);
}

TEST(ProbabilityEngine, PostureShiftsCategories) {
    MatchState state = evenState(Posture::ATTACKING, Posture::DEFENSIVE);
    ProbabilityConfig config;
    config.strengthCategoryWeight = 0.0;
    std::vector<double> w = categoryWeights(state, TeamSide::HOME, config);
    EXPECT_NEAR(w[0], 0.56, 1e-9);
    EXPECT_NEAR(w[1], 0.22, 1e-9);

    // Posture also moves strength by 3 each way: 6 points, shift 0.012
    w = categoryWeights(state, TeamSide::HOME, ProbabilityConfig());
    EXPECT_NEAR(w[0], 0.572, 1e-9);
    EXPECT_NEAR(w[1], 0.214, 1e-9);
    EXPECT_NEAR(w[2], 0.186, 1e-9);
}

TEST(ProbabilityEngine, StrengthMismatchShiftsCategories) {
    TeamRoster strong = makeSquad("Strong", 700, 95);
    TeamRoster weak = makeSquad("Weak", 800, 40);
    TeamRoster even = makeSquad("Even", 900, 95);
    ProbabilityConfig config;

    MatchState level = makeState(strong, even);
    std::vector<double> base = categoryWeights(level, TeamSide::HOME, config);
    EXPECT_NEAR(base[0], 0.50, 1e-9);
    EXPECT_NEAR(base[1], 0.18, 1e-9);
    EXPECT_NEAR(base[2], 0.18, 1e-9);

    MatchState mismatch = makeState(strong, weak);
    ASSERT_GT(sideStrength(mismatch.home) - sideStrength(mismatch.away), 30.0);

    // Difference is capped at 30 points, shift 0.06
    std::vector<double> w = categoryWeights(mismatch, TeamSide::HOME, config);
    EXPECT_NEAR(w[0], 0.56, 1e-9);
    EXPECT_NEAR(w[1], 0.15, 1e-9);
    EXPECT_NEAR(w[2], 0.21, 1e-9);
    EXPECT_NEAR(w[3], 0.10, 1e-9);
    EXPECT_NEAR(w[4], 0.04, 1e-9);

    std::vector<double> underdog = categoryWeights(mismatch, TeamSide::AWAY, config);
    EXPECT_NEAR(underdog[0], 0.44, 1e-9);
    EXPECT_NEAR(underdog[1], 0.21, 1e-9);
    EXPECT_NEAR(underdog[2], 0.15, 1e-9);
}

TEST(ProbabilityEngine, StrengthShiftNeverNegative) {
    TeamRoster strong = makeSquad("Strong", 700, 95);
    TeamRoster weak = makeSquad("Weak", 800, 40);
    MatchState state = makeState(strong, weak);
    ProbabilityConfig config;
    config.strengthCategoryWeight = 2.0;

    std::vector<double> w = categoryWeights(state, TeamSide::HOME, config);
    EXPECT_DOUBLE_EQ(w[1], 0.0);
    std::vector<double> underdog = categoryWeights(state, TeamSide::AWAY, config);
    EXPECT_DOUBLE_EQ(underdog[0], 0.0);
    EXPECT_DOUBLE_EQ(underdog[2], 0.0);
    EXPECT_GT(underdog[1], 0.18);
}

// --- Conversion ---

TEST(ProbabilityEngine, ConversionBaseline) {
    TeamRoster a = makeSquad("Alpha", 500, 70);
    TeamRoster b = makeSquad("Beta", 600, 70);
    MatchState state = makeState(a, b);
    EngineConfig config;

    ConversionEstimate home = calculateChanceConversion(state, TeamSide::HOME, config);
    EXPECT_NEAR(home.strengthTerm, 0.0, 1e-9);
    EXPECT_NEAR(home.tacticalTerm, 0.0, 1e-9);
    EXPECT_NEAR(home.energyTerm, 0.0, 1e-9);
    EXPECT_NEAR(home.homeTerm, 0.05, 1e-9);
    EXPECT_NEAR(home.probability, 0.35, 1e-9);

    ConversionEstimate away = calculateChanceConversion(state, TeamSide::AWAY, config);
    EXPECT_NEAR(away.probability, 0.30, 1e-9);

    config.match.neutralVenue = true;
    EXPECT_NEAR(calculateChanceConversion(state, TeamSide::HOME, config).probability, 0.30, 1e-9);
}

TEST(ProbabilityEngine, TiredDefenceConcedesMore) {
    TeamRoster a = makeSquad("Alpha", 500, 70);
    TeamRoster b = makeSquad("Beta", 600, 70);
    MatchState state = makeState(a, b);
    for (int id : state.away.tactics.lineup) state.away.liveEnergy[id] = 40.0;

    EngineConfig config;
    ConversionEstimate est = calculateChanceConversion(state, TeamSide::HOME, config);
    EXPECT_GT(est.energyTerm, 0.0);
    EXPECT_GT(est.strengthTerm, 0.0);
    EXPECT_GT(est.probability, 0.35);
}

TEST(ProbabilityEngine, ConversionClamped) {
    MatchState state = defaultState();
    EngineConfig config;
    config.probability.baseGoalConversion = 0.9;
    ConversionEstimate high = calculateChanceConversion(state, TeamSide::HOME, config);
    EXPECT_GT(high.raw, 0.6);
    EXPECT_DOUBLE_EQ(high.probability, 0.6);

    config.probability.baseGoalConversion = -0.5;
    EXPECT_DOUBLE_EQ(calculateChanceConversion(state, TeamSide::HOME, config).probability, 0.05);
}

TEST(ProbabilityEngine, PenaltyConversion) {
    ProbabilityConfig config;
    Player taker;
    taker.position = Position::ATT;
    Player keeper;
    keeper.position = Position::GK;
    // taker score 50, keeper quality 50
    EXPECT_NEAR(calculatePenaltyConversion(taker, 100.0, &keeper, 100.0, config), 0.76, 1e-9);

    Player elite = taker;
    elite.attributes.shooting = 99;
    elite.attributes.composure = 99;
    elite.attributes.positioning = 99;
    EXPECT_DOUBLE_EQ(calculatePenaltyConversion(elite, 100.0, nullptr, 0.0, config), 0.92);

    Player wall = keeper;
    wall.attributes.reflexes = 99;
    wall.attributes.diving = 99;
    wall.attributes.handling = 99;
    Player poor = taker;
    poor.attributes.shooting = 10;
    poor.attributes.composure = 10;
    poor.attributes.positioning = 10;
    EXPECT_DOUBLE_EQ(calculatePenaltyConversion(poor, 100.0, &wall, 100.0, config), 0.55);
}

TEST(ProbabilityEngine, PenaltyEstimateKeepsRawValue) {
    ProbabilityConfig config;
    Player elite;
    elite.position = Position::ATT;
    elite.attributes.shooting = 99;
    elite.attributes.composure = 99;
    elite.attributes.positioning = 99;

    PenaltyEstimate est = estimatePenaltyConversion(elite, 100.0, nullptr, 0.0, config);
    EXPECT_DOUBLE_EQ(est.keeperQuality, 0.0);
    EXPECT_NEAR(est.raw, 0.76 + 0.5 * est.takerQuality / 100.0, 1e-9);
    EXPECT_GT(est.raw, 0.92);
    EXPECT_DOUBLE_EQ(est.probability, 0.92);
}

TEST(ProbabilityEngine, PenaltyTracesUnclampedProbability) {
    TeamRoster elite = makeSquad("Elite", 700, 97);
    TeamRoster weak = makeSquad("Weak", 800, 45);
    MatchState state = makeState(elite, weak);
    TraceRecorder recorder;
    FixedRng rng({0.0, 0.0, 0.0, 0.93, 0.0});
    MinuteOutcome out = rollMinute(state, rng, EngineConfig(), &recorder);
    ASSERT_EQ(out.chanceKind, ChanceKind::PENALTY);

    const AiTraceEvent* evt = recorder.findFirst(20, TraceTeam::HOME,
                                                 TraceType::CHANCE_EVALUATION);
    ASSERT_NE(evt, nullptr);
    double takerQuality = evt->computed["takerQuality"].get<double>();
    double keeperQuality = evt->computed["keeperQuality"].get<double>();
    double raw = evt->computed["rawProbability"].get<double>();
    EXPECT_NEAR(raw, 0.76 + 0.5 * (takerQuality - keeperQuality) / 100.0, 1e-9);
    EXPECT_GT(raw, 0.92);
    EXPECT_DOUBLE_EQ(evt->computed["probability"].get<double>(), 0.92);

    const Player* taker = pickPenaltyTaker(state.home);
    const Player* keeper = goalkeeperOnPitch(state.away);
    ASSERT_NE(keeper, nullptr);
    PenaltyEstimate est = estimatePenaltyConversion(
        *taker, state.home.energyOf(taker->id), keeper, state.away.energyOf(keeper->id),
        ProbabilityConfig());
    EXPECT_NEAR(raw, est.raw, 1e-9);
}

TEST(ProbabilityEngine, PenaltyTakerIsBestOutfielder) {
    MatchState state = defaultState();
    const Player* taker = pickPenaltyTaker(state.home);
    ASSERT_NE(taker, nullptr);
    EXPECT_NE(taker->position, Position::GK);

    state.home.sentOff[taker->id] = true;
    const Player* next = pickPenaltyTaker(state.home);
    ASSERT_NE(next, nullptr);
    EXPECT_NE(next->id, taker->id);
}

TEST(ProbabilityEngine, GoalkeeperOnPitch) {
    MatchState state = defaultState();
    const Player* gk = goalkeeperOnPitch(state.away);
    ASSERT_NE(gk, nullptr);
    EXPECT_EQ(gk->id, state.away.tactics.lineup[0]);

    state.away.sentOff[gk->id] = true;
    EXPECT_EQ(goalkeeperOnPitch(state.away), nullptr);
}

// --- Scripted minutes ---
// Draw order: possession, trigger, category, [chance kind], resolution.

TEST(ProbabilityEngine, QuietMinute) {
    MatchState state = defaultState();
    FixedRng rng({0.99, 0.99});
    MinuteOutcome out = rollMinute(state, rng, EngineConfig());

    EXPECT_FALSE(out.triggered);
    EXPECT_EQ(out.attacking, TeamSide::AWAY);
    EXPECT_EQ(state.possession, TeamSide::AWAY);
    EXPECT_TRUE(out.events.empty());
    EXPECT_TRUE(state.events.empty());
    EXPECT_EQ(rng.remaining(), 0u);
}

TEST(ProbabilityEngine, OpenPlayGoalWithAssist) {
    MatchState state = defaultState();
    // goal roll 0.0, scorer 0.999 (last attacker), assist yes, assist 0.0 (first outfielder)
    FixedRng rng({0.0, 0.0, 0.0, 0.0, 0.0, 0.999, 0.0, 0.0});
    MinuteOutcome out = rollMinute(state, rng, EngineConfig());

    ASSERT_TRUE(out.triggered);
    EXPECT_EQ(out.category, EventCategory::CHANCE);
    EXPECT_EQ(out.chanceKind, ChanceKind::OPEN_PLAY);
    ASSERT_EQ(state.events.size(), 1u);
    const MatchEvent& goal = state.events[0];
    EXPECT_EQ(goal.type, MatchEventType::GOAL);
    EXPECT_EQ(goal.team, TeamSide::HOME);
    EXPECT_EQ(goal.minute, 20);
    EXPECT_EQ(goal.playerId, state.home.tactics.lineup[10]);
    EXPECT_EQ(goal.assistPlayerId, state.home.tactics.lineup[1]);
    EXPECT_EQ(state.homeScore(), 1);
    EXPECT_EQ(state.awayScore(), 0);
    EXPECT_EQ(rng.remaining(), 0u);
}

TEST(ProbabilityEngine, OpenPlayGoalWithoutAssist) {
    MatchState state = defaultState();
    FixedRng rng({0.0, 0.0, 0.0, 0.0, 0.0, 0.999, 0.99});
    rollMinute(state, rng, EngineConfig());

    ASSERT_EQ(state.events.size(), 1u);
    EXPECT_EQ(state.events[0].type, MatchEventType::GOAL);
    EXPECT_EQ(state.events[0].assistPlayerId, -1);
    EXPECT_EQ(rng.remaining(), 0u);
}

TEST(ProbabilityEngine, OpenPlayMiss) {
    MatchState state = defaultState();
    FixedRng rng({0.0, 0.0, 0.0, 0.0, 0.99, 0.999});
    rollMinute(state, rng, EngineConfig());

    ASSERT_EQ(state.events.size(), 1u);
    EXPECT_EQ(state.events[0].type, MatchEventType::CHANCE_MISSED);
    EXPECT_EQ(state.events[0].team, TeamSide::HOME);
    EXPECT_EQ(state.events[0].playerId, state.home.tactics.lineup[10]);
    EXPECT_EQ(state.homeScore(), 0);
}

TEST(ProbabilityEngine, OpenPlaySaveCreditsKeeper) {
    MatchState state = defaultState();
    // p is about 0.35 here, so 0.5 lands in the save band
    FixedRng rng({0.0, 0.0, 0.0, 0.0, 0.5});
    rollMinute(state, rng, EngineConfig());

    ASSERT_EQ(state.events.size(), 1u);
    EXPECT_EQ(state.events[0].type, MatchEventType::SAVE);
    EXPECT_EQ(state.events[0].team, TeamSide::AWAY);
    EXPECT_EQ(state.events[0].playerId, state.away.tactics.lineup[0]);
}

TEST(ProbabilityEngine, PenaltyScored) {
    MatchState state = defaultState();
    FixedRng rng({0.0, 0.0, 0.0, 0.93, 0.0});
    MinuteOutcome out = rollMinute(state, rng, EngineConfig());

    EXPECT_EQ(out.chanceKind, ChanceKind::PENALTY);
    ASSERT_EQ(state.events.size(), 1u);
    EXPECT_EQ(state.events[0].type, MatchEventType::PENALTY_SCORED);
    EXPECT_EQ(state.events[0].playerId, pickPenaltyTaker(state.home)->id);
    EXPECT_EQ(state.homeScore(), 1);
}

TEST(ProbabilityEngine, PenaltyMissed) {
    MatchState state = defaultState();
    FixedRng rng({0.0, 0.0, 0.0, 0.93, 0.999});
    rollMinute(state, rng, EngineConfig());

    ASSERT_EQ(state.events.size(), 1u);
    EXPECT_EQ(state.events[0].type, MatchEventType::PENALTY_MISSED);
    EXPECT_EQ(state.homeScore(), 0);
}

TEST(ProbabilityEngine, OwnGoalCreditedToAttackers) {
    MatchState state = defaultState();
    FixedRng rng({0.0, 0.0, 0.0, 0.99, 0.0});
    rollMinute(state, rng, EngineConfig());

    ASSERT_EQ(state.events.size(), 1u);
    const MatchEvent& og = state.events[0];
    EXPECT_EQ(og.type, MatchEventType::OWN_GOAL);
    EXPECT_EQ(og.team, TeamSide::HOME);
    EXPECT_TRUE(state.away.isInLineup(og.playerId));
    EXPECT_EQ(state.homeScore(), 1);
    EXPECT_EQ(state.awayScore(), 0);
}

TEST(ProbabilityEngine, SecondBookingSendsOff) {
    MatchState state = defaultState();
    int keeper = state.away.tactics.lineup[0];
    state.away.bookings[keeper] = 1;

    // 0.55 lands in the card band, about [0.50, 0.68)
    FixedRng rng({0.0, 0.0, 0.55, 0.0});
    MinuteOutcome out = rollMinute(state, rng, EngineConfig());

    EXPECT_EQ(out.category, EventCategory::CARD);
    ASSERT_EQ(state.events.size(), 2u);
    EXPECT_EQ(state.events[0].type, MatchEventType::FREE_KICK);
    EXPECT_EQ(state.events[0].team, TeamSide::HOME);
    EXPECT_EQ(state.events[1].type, MatchEventType::RED_CARD);
    EXPECT_EQ(state.events[1].team, TeamSide::AWAY);
    EXPECT_EQ(state.events[1].playerId, keeper);
    EXPECT_EQ(state.away.bookingsOf(keeper), 2);
    EXPECT_TRUE(state.away.isSentOff(keeper));
    EXPECT_EQ(state.away.onPitchCount(), 10);
}

TEST(ProbabilityEngine, SetPieceCorner) {
    MatchState state = defaultState();
    FixedRng rng({0.0, 0.0, 0.7, 0.0});
    MinuteOutcome out = rollMinute(state, rng, EngineConfig());

    EXPECT_EQ(out.category, EventCategory::SET_PIECE);
    ASSERT_EQ(state.events.size(), 1u);
    EXPECT_EQ(state.events[0].type, MatchEventType::CORNER);
    EXPECT_EQ(state.events[0].team, TeamSide::HOME);
}

TEST(ProbabilityEngine, SaveCategory) {
    MatchState state = defaultState();
    FixedRng rng({0.0, 0.0, 0.9});
    rollMinute(state, rng, EngineConfig());

    ASSERT_EQ(state.events.size(), 1u);
    EXPECT_EQ(state.events[0].type, MatchEventType::SAVE);
    EXPECT_EQ(state.events[0].team, TeamSide::AWAY);
    EXPECT_EQ(rng.remaining(), 0u);
}

TEST(ProbabilityEngine, InjuryCostsEnergy) {
    MatchState state = defaultState();
    FixedRng rng({0.0, 0.0, 0.98, 0.0});
    rollMinute(state, rng, EngineConfig());

    ASSERT_EQ(state.events.size(), 1u);
    EXPECT_EQ(state.events[0].type, MatchEventType::INJURY);
    int id = state.events[0].playerId;
    EXPECT_EQ(id, state.home.tactics.lineup[0]);
    EXPECT_DOUBLE_EQ(state.home.energyOf(id), 85.0);
}

TEST(ProbabilityEngine, TracesMinute) {
    MatchState state = defaultState();
    TraceRecorder recorder;
    FixedRng rng({0.0, 0.0, 0.0, 0.0, 0.99, 0.999});
    rollMinute(state, rng, EngineConfig(), &recorder);

    const AiTraceEvent* prob = recorder.findFirst(20, TraceTeam::HOME,
                                                  TraceType::EVENT_PROBABILITY);
    ASSERT_NE(prob, nullptr);
    EXPECT_TRUE(prob->outcome["triggered"].get<bool>());
    EXPECT_EQ(prob->outcome["category"].get<std::string>(), "chance");
    EXPECT_TRUE(prob->computed.contains("categoryWeights"));

    const AiTraceEvent* chance = recorder.findFirst(20, TraceTeam::HOME,
                                                    TraceType::CHANCE_EVALUATION);
    ASSERT_NE(chance, nullptr);
    EXPECT_EQ(chance->outcome["result"].get<std::string>(), "chance_missed");
    EXPECT_GE(chance->computed["probability"].get<double>(), 0.05);
    EXPECT_LE(chance->computed["probability"].get<double>(), 0.6);
}
