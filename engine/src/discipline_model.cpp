#include "fm/discipline_model.h"
#include "fm/attribute_model.h"
#include "fm/weighted_draw.h"

namespace fm {

FoulDecision maybeFoul(const MatchState& state, TeamSide defendingSide, int minute,
                       RngBase& rng, const DisciplineConfig& config,
                       TraceSink* trace) {
    const SideState& side = state.side(defendingSide);

    std::vector<int> ids;
    std::vector<double> weights;
    side.forEachOnPitch([&](const Player& p) {
        ids.push_back(p.id);
        weights.push_back(foulWeight(p, side.energyOf(p.id), side.bookingsOf(p.id),
                                     minute, config));
    });

    int idx = drawWeighted(weights, rng);
    if (idx < 0) {
        if (trace) {
            AiTraceEvent evt;
            evt.type = TraceType::FOUL_SELECTION;
            evt.minute = minute;
            evt.team = traceTeam(defendingSide);
            evt.inputs["candidates"] = static_cast<int>(ids.size());
            evt.outcome["committed"] = false;
            emitTrace(trace, evt);
        }
        return FoulDecision::none();
    }

    FoulDecision decision;
    decision.committed = true;
    decision.foulerId = ids[idx];
    decision.weight = weights[idx];

    double severityRoll = -1.0;
    if (side.bookingsOf(decision.foulerId) >= 1) {
        decision.severity = CardSeverity::RED;
        decision.secondBooking = true;
    } else if (decision.weight >= config.directRedWeight) {
        severityRoll = rng.nextDouble();
        decision.severity = severityRoll < clampProbability(config.directRedChance)
                                ? CardSeverity::RED : CardSeverity::YELLOW;
    } else {
        decision.severity = CardSeverity::YELLOW;
    }

    if (trace) {
        AiTraceEvent evt;
        evt.type = TraceType::FOUL_SELECTION;
        evt.minute = minute;
        evt.team = traceTeam(defendingSide);
        evt.severity = decision.severity == CardSeverity::RED
                           ? TraceSeverity::CRITICAL : TraceSeverity::NOTABLE;
        nlohmann::json candidates = nlohmann::json::array();
        double total = 0.0;
        for (size_t i = 0; i < ids.size(); ++i) {
            candidates.push_back({{"playerId", ids[i]}, {"weight", weights[i]},
                                  {"bookings", side.bookingsOf(ids[i])}});
            total += weights[i];
        }
        evt.inputs["candidates"] = candidates;
        evt.inputs["directRedWeight"] = config.directRedWeight;
        evt.computed["totalWeight"] = total;
        evt.computed["selectedWeight"] = decision.weight;
        evt.computed["selectedShare"] = total > 0.0 ? decision.weight / total : 0.0;
        if (severityRoll >= 0.0) evt.computed["severityRoll"] = severityRoll;
        evt.outcome["committed"] = true;
        evt.outcome["foulerId"] = decision.foulerId;
        evt.outcome["card"] = toString(decision.severity);
        evt.outcome["secondBooking"] = decision.secondBooking;
        emitTrace(trace, evt);
    }
    return decision;
}

void applyCard(SideState& side, const FoulDecision& decision) {
    if (!decision.committed || decision.foulerId < 0) return;

    switch (decision.severity) {
        case CardSeverity::YELLOW:
            side.bookings[decision.foulerId] = 1;
            break;
        case CardSeverity::RED:
            side.bookings[decision.foulerId] = 2;
            side.sentOff[decision.foulerId] = true;
            break;
        case CardSeverity::NONE:
            break;
    }
}

} // namespace fm
