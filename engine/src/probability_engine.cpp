#include "fm/probability_engine.h"
#include "fm/attribute_model.h"
#include "fm/discipline_model.h"
#include "fm/weighted_draw.h"
#include <algorithm>

namespace fm {

namespace {

std::vector<RatedPlayer> ratedOnPitch(const SideState& side) {
    std::vector<RatedPlayer> rated;
    side.forEachOnPitch([&](const Player& p) {
        rated.push_back({&p, side.energyOf(p.id)});
    });
    return rated;
}

double averageEnergyModifier(const SideState& side) {
    double total = 0.0;
    int n = 0;
    side.forEachOnPitch([&](const Player& p) {
        total += energyModifier(side.energyOf(p.id));
        n++;
    });
    return n > 0 ? total / n : 0.0;
}

TacticalImpact impactFor(const MatchState& state, TeamSide s) {
    return tacticalImpact(state.side(s).tactics, state.side(opponent(s)).tactics);
}

std::string nameOf(const SideState& side, int id) {
    const Player* p = side.player(id);
    return p ? p->displayName() : std::string("unknown");
}

void pushEvent(MatchState& state, MinuteOutcome& outcome, MatchEventType type,
               TeamSide team, int playerId, int assistId, const std::string& description) {
    MatchEvent evt;
    evt.minute = state.minute;
    evt.type = type;
    evt.team = team;
    evt.playerId = playerId;
    evt.assistPlayerId = assistId;
    evt.description = description;
    state.events.push_back(evt);
    outcome.events.push_back(evt);
}

// Weighted pick over on-pitch players; excludeId skips one player (the scorer
// when drawing the assist). Returns -1 without consuming a draw if nobody is eligible.
template<typename WeightFn>
int drawPlayer(const SideState& side, RngBase& rng, int excludeId, WeightFn&& weightOf) {
    std::vector<int> ids;
    std::vector<double> weights;
    side.forEachOnPitch([&](const Player& p) {
        if (p.id == excludeId) return;
        ids.push_back(p.id);
        weights.push_back(weightOf(p, side.energyOf(p.id)));
    });
    int idx = drawWeighted(weights, rng);
    return idx < 0 ? -1 : ids[idx];
}

double ownGoalWeight(const Player& p) {
    double line = 0.5;
    switch (p.position) {
        case Position::GK:  line = 0.2; break;
        case Position::DEF: line = 3.0; break;
        case Position::MID: line = 1.5; break;
        case Position::ATT: line = 0.5; break;
    }
    return line * (1.0 + (100 - p.attributes.composure) / 100.0);
}

// --- Chance resolution ---

void resolveOpenPlay(MatchState& state, MinuteOutcome& outcome, TeamSide attacking,
                     RngBase& rng, const EngineConfig& config, TraceSink* trace) {
    const ProbabilityConfig& pc = config.probability;
    TeamSide defending = opponent(attacking);
    SideState& att = state.side(attacking);
    const SideState& def = state.side(defending);

    ConversionEstimate est = calculateChanceConversion(state, attacking, config);
    double p = est.probability;
    double saveShare = clampProbability(pc.saveShareOfMisses);
    std::vector<double> results = {p, (1.0 - p) * saveShare, (1.0 - p) * (1.0 - saveShare)};
    double roll = rng.nextDouble();
    int result = weightedIndex(results, roll);

    static const char* RESULT_NAMES[] = {"goal", "save", "chance_missed"};
    int playerId = -1;
    int assistId = -1;

    if (result == 0) {
        playerId = drawPlayer(att, rng, -1, scorerWeight);
        if (playerId >= 0 && drawChance(pc.assistProbability, rng)) {
            assistId = drawPlayer(att, rng, playerId, [](const Player& pl, double e) {
                return isOutfield(pl.position) ? assistWeight(pl, e) : 0.0;
            });
        }
        att.score++;
        std::string desc = "Goal! " + nameOf(att, playerId) + " scores";
        if (assistId >= 0) desc += " (assist " + nameOf(att, assistId) + ")";
        pushEvent(state, outcome, MatchEventType::GOAL, attacking, playerId, assistId, desc);
    } else if (result == 1) {
        const Player* keeper = goalkeeperOnPitch(def);
        playerId = keeper ? keeper->id : -1;
        pushEvent(state, outcome, MatchEventType::SAVE, defending, playerId, -1,
                  "Save by " + (keeper ? keeper->displayName() : std::string("the defence")));
    } else {
        playerId = drawPlayer(att, rng, -1, scorerWeight);
        pushEvent(state, outcome, MatchEventType::CHANCE_MISSED, attacking, playerId, -1,
                  nameOf(att, playerId) + " misses a chance");
    }

    if (trace) {
        AiTraceEvent evt;
        evt.type = TraceType::CHANCE_EVALUATION;
        evt.minute = state.minute;
        evt.team = traceTeam(attacking);
        evt.severity = result == 0 ? TraceSeverity::NOTABLE : TraceSeverity::INFO;
        evt.inputs["kind"] = toString(ChanceKind::OPEN_PLAY);
        evt.inputs["attackStrength"] = est.attackStrength;
        evt.inputs["defenceStrength"] = est.defenceStrength;
        evt.computed["strengthTerm"] = est.strengthTerm;
        evt.computed["tacticalTerm"] = est.tacticalTerm;
        evt.computed["energyTerm"] = est.energyTerm;
        evt.computed["homeTerm"] = est.homeTerm;
        evt.computed["rawProbability"] = est.raw;
        evt.computed["probability"] = est.probability;
        evt.computed["roll"] = roll;
        evt.outcome["result"] = result >= 0 ? RESULT_NAMES[result] : "none";
        evt.outcome["playerId"] = playerId;
        evt.outcome["assistPlayerId"] = assistId;
        emitTrace(trace, evt);
    }
}

void resolvePenalty(MatchState& state, MinuteOutcome& outcome, TeamSide attacking,
                    RngBase& rng, const EngineConfig& config, TraceSink* trace) {
    SideState& att = state.side(attacking);
    const SideState& def = state.side(opponent(attacking));

    const Player* taker = pickPenaltyTaker(att);
    if (!taker) return;
    const Player* keeper = goalkeeperOnPitch(def);
    double takerEnergy = att.energyOf(taker->id);
    double keeperEnergy = keeper ? def.energyOf(keeper->id) : 0.0;

    PenaltyEstimate est = estimatePenaltyConversion(*taker, takerEnergy, keeper, keeperEnergy,
                                                    config.probability);
    double roll = rng.nextDouble();
    bool scored = roll < est.probability;

    if (scored) {
        att.score++;
        pushEvent(state, outcome, MatchEventType::PENALTY_SCORED, attacking, taker->id, -1,
                  "Penalty scored by " + taker->displayName());
    } else {
        pushEvent(state, outcome, MatchEventType::PENALTY_MISSED, attacking, taker->id, -1,
                  "Penalty missed by " + taker->displayName());
    }

    if (trace) {
        AiTraceEvent evt;
        evt.type = TraceType::CHANCE_EVALUATION;
        evt.minute = state.minute;
        evt.team = traceTeam(attacking);
        evt.severity = TraceSeverity::NOTABLE;
        evt.inputs["kind"] = toString(ChanceKind::PENALTY);
        evt.inputs["takerId"] = taker->id;
        evt.inputs["takerScore"] = penaltyTakerScore(*taker);
        evt.inputs["keeperId"] = keeper ? keeper->id : -1;
        evt.computed["takerQuality"] = est.takerQuality;
        evt.computed["keeperQuality"] = est.keeperQuality;
        evt.computed["rawProbability"] = est.raw;
        evt.computed["probability"] = est.probability;
        evt.computed["roll"] = roll;
        evt.outcome["result"] = scored ? "penalty_scored" : "penalty_missed";
        evt.outcome["playerId"] = taker->id;
        emitTrace(trace, evt);
    }
}

void resolveOwnGoal(MatchState& state, MinuteOutcome& outcome, TeamSide attacking,
                    RngBase& rng, TraceSink* trace) {
    SideState& att = state.side(attacking);
    const SideState& def = state.side(opponent(attacking));

    int defenderId = drawPlayer(def, rng, -1, [](const Player& p, double) {
        return ownGoalWeight(p);
    });
    att.score++;
    pushEvent(state, outcome, MatchEventType::OWN_GOAL, attacking, defenderId, -1,
              "Own goal by " + nameOf(def, defenderId));

    if (trace) {
        AiTraceEvent evt;
        evt.type = TraceType::CHANCE_EVALUATION;
        evt.minute = state.minute;
        evt.team = traceTeam(attacking);
        evt.severity = TraceSeverity::NOTABLE;
        evt.inputs["kind"] = toString(ChanceKind::OWN_GOAL);
        evt.computed["rawProbability"] = 1.0;
        evt.computed["probability"] = 1.0;
        evt.outcome["result"] = "own_goal";
        evt.outcome["playerId"] = defenderId;
        emitTrace(trace, evt);
    }
}

// --- Other categories ---

void resolveCard(MatchState& state, MinuteOutcome& outcome, TeamSide attacking,
                 RngBase& rng, const EngineConfig& config, TraceSink* trace) {
    TeamSide defending = opponent(attacking);
    pushEvent(state, outcome, MatchEventType::FREE_KICK, attacking, -1, -1,
              "Free kick to " + std::string(toString(attacking)));

    FoulDecision foul = maybeFoul(state, defending, state.minute, rng, config.discipline, trace);
    if (!foul.committed) return;

    SideState& def = state.side(defending);
    applyCard(def, foul);
    std::string name = nameOf(def, foul.foulerId);
    if (foul.severity == CardSeverity::RED) {
        pushEvent(state, outcome, MatchEventType::RED_CARD, defending, foul.foulerId, -1,
                  foul.secondBooking ? "Second yellow, " + name + " is sent off"
                                     : "Straight red for " + name);
    } else {
        pushEvent(state, outcome, MatchEventType::YELLOW_CARD, defending, foul.foulerId, -1,
                  "Yellow card for " + name);
    }
}

void resolveSetPiece(MatchState& state, MinuteOutcome& outcome, TeamSide attacking,
                     RngBase& rng, const ProbabilityConfig& config) {
    std::vector<double> kinds = {config.cornerShare, config.freeKickShare, config.offsideShare};
    int idx = drawWeighted(kinds, rng);
    std::string team = toString(attacking);
    switch (idx) {
        case 0:
            pushEvent(state, outcome, MatchEventType::CORNER, attacking, -1, -1,
                      "Corner to " + team);
            break;
        case 1:
            pushEvent(state, outcome, MatchEventType::FREE_KICK, attacking, -1, -1,
                      "Free kick to " + team);
            break;
        case 2:
            pushEvent(state, outcome, MatchEventType::OFFSIDE, attacking, -1, -1,
                      "Offside against " + team);
            break;
        default:
            break;
    }
}

void resolveInjury(MatchState& state, MinuteOutcome& outcome, TeamSide attacking,
                   RngBase& rng, const ProbabilityConfig& config) {
    SideState& side = state.side(attacking);
    int id = drawPlayer(side, rng, -1, injuryProneness);
    if (id < 0) return;

    side.liveEnergy[id] = clampValue(side.energyOf(id) - config.injuryEnergyLoss, 0.0, 100.0);
    pushEvent(state, outcome, MatchEventType::INJURY, attacking, id, -1,
              nameOf(side, id) + " is down injured");
}

} // anonymous namespace

double sideStrength(const SideState& side) {
    return teamStrength(ratedOnPitch(side), side.tactics.posture, side.sentOffCount());
}

double possessionShare(const MatchState& state, const EngineConfig& config) {
    const ProbabilityConfig& pc = config.probability;
    double home = sideStrength(state.home);
    double away = sideStrength(state.away);
    double tactical = (impactFor(state, TeamSide::HOME).possession -
                       impactFor(state, TeamSide::AWAY).possession) * 0.5;
    double bonus = config.match.neutralVenue ? 0.0 : pc.homePossessionBonus;
    double share = 0.5 + (home - away) / 200.0 + bonus + tactical;
    return clampValue(share, pc.possessionMin, pc.possessionMax);
}

double triggerProbability(const MatchState& state, TeamSide attacking, int minute,
                          const ProbabilityConfig& config) {
    double p = config.eventProbabilityPerMinute;
    if (minute > config.lateGameMinute) p *= 1.0 + config.lateGameTriggerBoost;
    p += postureImpact(state.side(attacking).tactics.posture).creation;
    return clampProbability(p);
}

std::vector<double> categoryWeights(const MatchState& state, TeamSide attacking,
                                    const ProbabilityConfig& config) {
    std::vector<double> w(EVENT_CATEGORY_COUNT, 0.0);
    w[static_cast<int>(EventCategory::CHANCE)] = config.chanceWeight;
    w[static_cast<int>(EventCategory::CARD)] = config.cardWeight;
    w[static_cast<int>(EventCategory::SET_PIECE)] = config.setPieceWeight;
    w[static_cast<int>(EventCategory::SAVE)] = config.saveWeight;
    w[static_cast<int>(EventCategory::INJURY)] = config.injuryWeight;

    int behind = -state.goalDifference(attacking);
    if (behind > 0) {
        w[static_cast<int>(EventCategory::CHANCE)] +=
            config.trailingChanceBonusPerGoal * std::min(behind, config.trailingBonusGoalCap);
    }
    if (state.side(attacking).tactics.posture == Posture::ATTACKING) {
        w[static_cast<int>(EventCategory::CHANCE)] += config.attackingPostureChanceBonus;
    }
    if (state.side(opponent(attacking)).tactics.posture == Posture::DEFENSIVE) {
        w[static_cast<int>(EventCategory::CARD)] += config.defensivePostureCardBonus;
    }

    double diff = sideStrength(state.side(attacking)) -
                  sideStrength(state.side(opponent(attacking)));
    diff = clampValue(diff, -config.strengthCategoryCap, config.strengthCategoryCap);
    double shift = config.strengthCategoryWeight * diff / 100.0;
    w[static_cast<int>(EventCategory::CHANCE)] += shift;
    w[static_cast<int>(EventCategory::SET_PIECE)] += 0.5 * shift;
    w[static_cast<int>(EventCategory::CARD)] -= 0.5 * shift;
    for (double& x : w) x = std::max(x, 0.0);
    return w;
}

ConversionEstimate calculateChanceConversion(const MatchState& state, TeamSide attacking,
                                             const EngineConfig& config) {
    const ProbabilityConfig& pc = config.probability;
    const SideState& att = state.side(attacking);
    const SideState& def = state.side(opponent(attacking));

    ConversionEstimate est;
    est.attackStrength = sideStrength(att);
    est.defenceStrength = sideStrength(def);
    est.strengthTerm = pc.strengthDiffConversionWeight *
                       (est.attackStrength - est.defenceStrength) / 100.0;
    est.tacticalTerm = impactFor(state, attacking).creation -
                       impactFor(state, opponent(attacking)).prevention;
    est.energyTerm = pc.energyConversionWeight *
                     (averageEnergyModifier(def) - averageEnergyModifier(att));
    if (attacking == TeamSide::HOME && !config.match.neutralVenue) {
        est.homeTerm = pc.homeConversionBonus;
    }
    est.raw = pc.baseGoalConversion + est.strengthTerm + est.tacticalTerm +
              est.energyTerm + est.homeTerm;
    est.probability = clampValue(est.raw, pc.minGoalConversion, pc.maxGoalConversion);
    return est;
}

PenaltyEstimate estimatePenaltyConversion(const Player& taker, double takerEnergy,
                                          const Player* keeper, double keeperEnergy,
                                          const ProbabilityConfig& config) {
    PenaltyEstimate est;
    est.takerQuality = penaltyTakerScore(taker) * energyFactor(takerEnergy);
    est.keeperQuality = keeper ? goalkeepingQuality(*keeper, keeperEnergy) : 0.0;
    est.raw = config.penaltyBaseConversion +
              config.penaltySkillWeight * (est.takerQuality - est.keeperQuality) / 100.0;
    est.probability = clampValue(est.raw, config.penaltyMinConversion,
                                 config.penaltyMaxConversion);
    return est;
}

double calculatePenaltyConversion(const Player& taker, double takerEnergy,
                                  const Player* keeper, double keeperEnergy,
                                  const ProbabilityConfig& config) {
    return estimatePenaltyConversion(taker, takerEnergy, keeper, keeperEnergy, config).probability;
}

const Player* pickPenaltyTaker(const SideState& side) {
    const Player* best = nullptr;
    double bestScore = -1.0;
    side.forEachOnPitch([&](const Player& p) {
        if (!isOutfield(p.position)) return;
        double score = penaltyTakerScore(p) * energyFactor(side.energyOf(p.id));
        if (!best || score > bestScore || (score == bestScore && p.id < best->id)) {
            best = &p;
            bestScore = score;
        }
    });
    return best;
}

const Player* goalkeeperOnPitch(const SideState& side) {
    const Player* keeper = nullptr;
    side.forEachOnPitch([&](const Player& p) {
        if (!keeper && p.position == Position::GK) keeper = &p;
    });
    return keeper;
}

MinuteOutcome rollMinute(MatchState& state, RngBase& rng, const EngineConfig& config,
                         TraceSink* trace) {
    const ProbabilityConfig& pc = config.probability;
    MinuteOutcome outcome;

    outcome.homePossession = possessionShare(state, config);
    double possessionRoll = rng.nextDouble();
    outcome.attacking = possessionRoll < outcome.homePossession ? TeamSide::HOME : TeamSide::AWAY;
    state.possession = outcome.attacking;

    outcome.triggerProbability = triggerProbability(state, outcome.attacking, state.minute, pc);
    double triggerRoll = rng.nextDouble();
    outcome.triggered = triggerRoll < outcome.triggerProbability;

    std::vector<double> weights;
    int categoryIdx = -1;
    if (outcome.triggered) {
        weights = categoryWeights(state, outcome.attacking, pc);
        categoryIdx = drawWeighted(weights, rng);
        if (categoryIdx < 0) outcome.triggered = false;
        else outcome.category = static_cast<EventCategory>(categoryIdx);
    }

    int chanceKindIdx = -1;
    if (outcome.triggered && outcome.category == EventCategory::CHANCE) {
        double penalty = clampProbability(pc.penaltyShare);
        double ownGoal = clampProbability(pc.ownGoalShare);
        std::vector<double> kinds = {std::max(0.0, 1.0 - penalty - ownGoal), penalty, ownGoal};
        chanceKindIdx = drawWeighted(kinds, rng);
        if (chanceKindIdx >= 0) outcome.chanceKind = static_cast<ChanceKind>(chanceKindIdx);
    }

    if (trace) {
        AiTraceEvent evt;
        evt.type = TraceType::EVENT_PROBABILITY;
        evt.minute = state.minute;
        evt.team = traceTeam(outcome.attacking);
        evt.inputs["homeStrength"] = sideStrength(state.home);
        evt.inputs["awayStrength"] = sideStrength(state.away);
        evt.inputs["goalDifference"] = state.goalDifference(outcome.attacking);
        evt.computed["homePossession"] = outcome.homePossession;
        evt.computed["possessionRoll"] = possessionRoll;
        evt.computed["triggerProbability"] = outcome.triggerProbability;
        evt.computed["triggerRoll"] = triggerRoll;
        if (!weights.empty()) {
            nlohmann::json cw = nlohmann::json::object();
            for (int i = 0; i < EVENT_CATEGORY_COUNT; ++i) {
                cw[toString(static_cast<EventCategory>(i))] = weights[i];
            }
            evt.computed["categoryWeights"] = cw;
        }
        evt.outcome["attacking"] = toString(outcome.attacking);
        evt.outcome["triggered"] = outcome.triggered;
        if (outcome.triggered) {
            evt.outcome["category"] = toString(outcome.category);
            if (outcome.category == EventCategory::CHANCE) {
                evt.outcome["chanceKind"] = toString(outcome.chanceKind);
            }
        }
        emitTrace(trace, evt);
    }

    if (!outcome.triggered) return outcome;

    switch (outcome.category) {
        case EventCategory::CHANCE:
            if (outcome.chanceKind == ChanceKind::PENALTY) {
                resolvePenalty(state, outcome, outcome.attacking, rng, config, trace);
            } else if (outcome.chanceKind == ChanceKind::OWN_GOAL) {
                resolveOwnGoal(state, outcome, outcome.attacking, rng, trace);
            } else {
                resolveOpenPlay(state, outcome, outcome.attacking, rng, config, trace);
            }
            break;
        case EventCategory::CARD:
            resolveCard(state, outcome, outcome.attacking, rng, config, trace);
            break;
        case EventCategory::SET_PIECE:
            resolveSetPiece(state, outcome, outcome.attacking, rng, pc);
            break;
        case EventCategory::SAVE: {
            TeamSide defending = opponent(outcome.attacking);
            const Player* keeper = goalkeeperOnPitch(state.side(defending));
            pushEvent(state, outcome, MatchEventType::SAVE, defending,
                      keeper ? keeper->id : -1, -1,
                      "Save by " + (keeper ? keeper->displayName() : std::string("the defence")));
            break;
        }
        case EventCategory::INJURY:
            resolveInjury(state, outcome, outcome.attacking, rng, pc);
            break;
    }
    return outcome;
}

} // namespace fm
