#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <pybind11/functional.h>

#include "fm/enums.h"
#include "fm/player.h"
#include "fm/roster.h"
#include "fm/attribute_model.h"
#include "fm/tactics.h"
#include "fm/engine_config.h"
#include "fm/match_event.h"
#include "fm/match_state.h"
#include "fm/match_engine.h"
#include "fm/match_stats.h"
#include "fm/round_simulator.h"
#include "fm/half_time_hints.h"
#include "fm/trace.h"

namespace py = pybind11;

namespace {

// nlohmann::json -> Python object through the json module
py::object toPython(const nlohmann::json& j) {
    return py::module::import("json").attr("loads")(j.dump());
}

py::dict traceToDict(const fm::AiTraceEvent& e) {
    return toPython(fm::traceToJson(e)).cast<py::dict>();
}

} // anonymous namespace

PYBIND11_MODULE(fm_engine, m) {
    m.doc() = "Football match engine - Python bindings";

    // --- Enums ---
    py::enum_<fm::TeamSide>(m, "TeamSide")
        .value("HOME", fm::TeamSide::HOME)
        .value("AWAY", fm::TeamSide::AWAY);

    py::enum_<fm::Position>(m, "Position")
        .value("GK", fm::Position::GK)
        .value("DEF", fm::Position::DEF)
        .value("MID", fm::Position::MID)
        .value("ATT", fm::Position::ATT);

    py::enum_<fm::Posture>(m, "Posture")
        .value("DEFENSIVE", fm::Posture::DEFENSIVE)
        .value("BALANCED", fm::Posture::BALANCED)
        .value("ATTACKING", fm::Posture::ATTACKING);

    py::enum_<fm::Control>(m, "Control")
        .value("AI", fm::Control::AI)
        .value("HUMAN", fm::Control::HUMAN);

    py::enum_<fm::MatchPhase>(m, "MatchPhase")
        .value("SCHEDULED", fm::MatchPhase::SCHEDULED)
        .value("FIRST_HALF", fm::MatchPhase::FIRST_HALF)
        .value("SECOND_HALF", fm::MatchPhase::SECOND_HALF)
        .value("FULL_TIME", fm::MatchPhase::FULL_TIME);

    py::enum_<fm::MatchEventType>(m, "MatchEventType")
        .value("GOAL", fm::MatchEventType::GOAL)
        .value("OWN_GOAL", fm::MatchEventType::OWN_GOAL)
        .value("PENALTY_SCORED", fm::MatchEventType::PENALTY_SCORED)
        .value("PENALTY_MISSED", fm::MatchEventType::PENALTY_MISSED)
        .value("CHANCE_MISSED", fm::MatchEventType::CHANCE_MISSED)
        .value("YELLOW_CARD", fm::MatchEventType::YELLOW_CARD)
        .value("RED_CARD", fm::MatchEventType::RED_CARD)
        .value("SUBSTITUTION", fm::MatchEventType::SUBSTITUTION)
        .value("INJURY", fm::MatchEventType::INJURY)
        .value("SAVE", fm::MatchEventType::SAVE)
        .value("CORNER", fm::MatchEventType::CORNER)
        .value("FREE_KICK", fm::MatchEventType::FREE_KICK)
        .value("OFFSIDE", fm::MatchEventType::OFFSIDE)
        .value("KICKOFF", fm::MatchEventType::KICKOFF)
        .value("HALF_TIME", fm::MatchEventType::HALF_TIME)
        .value("FULL_TIME", fm::MatchEventType::FULL_TIME);

    // --- Player / roster ---
    py::class_<fm::Player>(m, "Player")
        .def_readwrite("id", &fm::Player::id)
        .def_readwrite("name", &fm::Player::name)
        .def_readwrite("nickname", &fm::Player::nickname)
        .def_readwrite("age", &fm::Player::age)
        .def_readwrite("position", &fm::Player::position)
        .def_readwrite("energy", &fm::Player::energy)
        .def("display_name", &fm::Player::displayName)
        .def("overall", [](const fm::Player& p) { return fm::calculateOverall(p); });

    py::class_<fm::TeamRoster>(m, "TeamRoster")
        .def_readonly("id", &fm::TeamRoster::id)
        .def_readonly("name", &fm::TeamRoster::name)
        .def_readonly("short_name", &fm::TeamRoster::shortName)
        .def_readonly("players", &fm::TeamRoster::players);

    m.def("get_roster", [](const std::string& name) -> const fm::TeamRoster* {
        const fm::TeamRoster* r = fm::getRosterByName(name);
        if (!r) throw py::value_error("unknown roster: " + name);
        return r;
    }, py::return_value_policy::reference);

    // --- Tactics ---
    py::class_<fm::Tactics>(m, "Tactics")
        .def(py::init<>())
        .def_property("formation",
            [](const fm::Tactics& t) { return std::string(fm::toString(t.formation)); },
            [](fm::Tactics& t, const std::string& f) { t.formation = fm::parseFormation(f); })
        .def_readwrite("posture", &fm::Tactics::posture)
        .def_readwrite("lineup", &fm::Tactics::lineup)
        .def_readwrite("substitutes", &fm::Tactics::substitutes);

    m.def("default_tactics", [](const fm::TeamRoster& roster, const std::string& formation,
                                fm::Posture posture) {
        return fm::createDefaultTactics(roster, fm::parseFormation(formation), posture);
    }, py::arg("roster"), py::arg("formation") = "4-3-3",
       py::arg("posture") = fm::Posture::BALANCED);

    m.def("validate_tactics", &fm::validateTactics);

    // --- Config ---
    py::class_<fm::EngineConfig>(m, "EngineConfig")
        .def(py::init<>())
        .def("to_json", [](const fm::EngineConfig& c) { return fm::engineConfigToJson(c); });

    m.def("load_config", &fm::loadEngineConfig, py::arg("path"));
    m.def("load_config_from_string", &fm::loadEngineConfigFromString, py::arg("json"));

    // --- Events / state ---
    py::class_<fm::MatchEvent>(m, "MatchEvent")
        .def_readonly("minute", &fm::MatchEvent::minute)
        .def_readonly("type", &fm::MatchEvent::type)
        .def_readonly("team", &fm::MatchEvent::team)
        .def_readonly("player_id", &fm::MatchEvent::playerId)
        .def_readonly("assist_player_id", &fm::MatchEvent::assistPlayerId)
        .def_readonly("description", &fm::MatchEvent::description)
        .def("__repr__", [](const fm::MatchEvent& e) {
            return std::to_string(e.minute) + "' " + fm::toString(e.type) + " (" +
                   fm::toString(e.team) + ")";
        });

    py::class_<fm::SideState>(m, "SideState")
        .def_readonly("score", &fm::SideState::score)
        .def_readonly("subs_used", &fm::SideState::subsUsed)
        .def_readonly("control", &fm::SideState::control)
        .def_readonly("live_energy", &fm::SideState::liveEnergy)
        .def_readonly("bookings", &fm::SideState::bookings)
        .def_readonly("sent_off", &fm::SideState::sentOff)
        .def_readonly("starting_lineup", &fm::SideState::startingLineup)
        .def_property_readonly("lineup", [](const fm::SideState& s) { return s.tactics.lineup; })
        .def("is_on_pitch", &fm::SideState::isOnPitch)
        .def("is_on_bench", &fm::SideState::isOnBench);

    py::class_<fm::MatchState>(m, "MatchState")
        .def_readonly("fixture_id", &fm::MatchState::fixtureId)
        .def_readonly("minute", &fm::MatchState::minute)
        .def_readonly("phase", &fm::MatchState::phase)
        .def_readonly("possession", &fm::MatchState::possession)
        .def_readonly("stoppage_time", &fm::MatchState::stoppageTime)
        .def_readonly("home", &fm::MatchState::home)
        .def_readonly("away", &fm::MatchState::away)
        .def_readonly("events", &fm::MatchState::events)
        .def("is_finished", &fm::MatchState::isFinished);

    // --- Traces ---
    py::class_<fm::TraceRecorder>(m, "TraceRecorder")
        .def(py::init<>())
        .def("size", &fm::TraceRecorder::size)
        .def("clear", &fm::TraceRecorder::clear)
        .def("events", [](const fm::TraceRecorder& r) {
            py::list out;
            for (const auto& e : r.events()) out.append(traceToDict(e));
            return out;
        })
        .def("at_minute", [](const fm::TraceRecorder& r, int minute) {
            py::list out;
            for (const auto& e : r.atMinute(minute)) out.append(traceToDict(e));
            return out;
        });

    // --- Engine ---
    py::class_<fm::SubstitutionResult>(m, "SubstitutionResult")
        .def_readonly("success", &fm::SubstitutionResult::success)
        .def_readonly("error", &fm::SubstitutionResult::error)
        .def_readonly("event", &fm::SubstitutionResult::event);

    py::class_<fm::MatchEngine>(m, "MatchEngine")
        .def(py::init([](const fm::TeamRoster& home, const fm::TeamRoster& away,
                         const fm::Tactics& homeTactics, const fm::Tactics& awayTactics,
                         uint32_t seed, const fm::EngineConfig& config,
                         fm::Control homeControl, fm::Control awayControl,
                         fm::TraceRecorder* trace) {
            fm::MatchSetup setup;
            setup.homeRoster = &home;
            setup.awayRoster = &away;
            setup.homeTactics = homeTactics;
            setup.awayTactics = awayTactics;
            setup.homeControl = homeControl;
            setup.awayControl = awayControl;
            return new fm::MatchEngine(setup, config, seed, trace);
        }), py::arg("home"), py::arg("away"),
            py::arg("home_tactics"), py::arg("away_tactics"),
            py::arg("seed") = 42, py::arg("config") = fm::EngineConfig(),
            py::arg("home_control") = fm::Control::AI,
            py::arg("away_control") = fm::Control::AI,
            py::arg("trace") = nullptr,
            py::keep_alive<1, 2>(), py::keep_alive<1, 3>(), py::keep_alive<1, 10>())
        .def("step", &fm::MatchEngine::step)
        .def("simulate_to_end", &fm::MatchEngine::simulateToEnd)
        .def("make_substitution", &fm::MatchEngine::makeSubstitution,
             py::arg("side"), py::arg("outgoing_id"), py::arg("incoming_id"))
        .def("is_finished", &fm::MatchEngine::isFinished)
        .def("state", &fm::MatchEngine::state, py::return_value_policy::reference_internal)
        .def("events", &fm::MatchEngine::events, py::return_value_policy::reference_internal)
        .def("half_time_hints", [](const fm::MatchEngine& e, fm::TeamSide side) {
            fm::HalfTimeHints h = fm::getHalfTimeHints(e.state(), side);
            py::dict d;
            d["situation"] = fm::toString(h.situation);
            d["goal_difference"] = h.goalDifference;
            d["posture_hints"] = py::dict(py::arg("defensive") = h.defensiveHint,
                                          py::arg("balanced") = h.balancedHint,
                                          py::arg("attacking") = h.attackingHint);
            d["formation_matchup_hints"] = h.formationMatchupHints;
            return d;
        });

    // --- Stats ---
    py::class_<fm::PlayerMatchStats>(m, "PlayerMatchStats")
        .def_readonly("player_id", &fm::PlayerMatchStats::playerId)
        .def_readonly("side", &fm::PlayerMatchStats::side)
        .def_readonly("started", &fm::PlayerMatchStats::started)
        .def_readonly("minutes_played", &fm::PlayerMatchStats::minutesPlayed)
        .def_readonly("goals", &fm::PlayerMatchStats::goals)
        .def_readonly("assists", &fm::PlayerMatchStats::assists)
        .def_readonly("yellow_cards", &fm::PlayerMatchStats::yellowCards)
        .def_readonly("red_cards", &fm::PlayerMatchStats::redCards);

    m.def("player_stats", [](const fm::MatchState& state) {
        return fm::aggregatePlayerStats(state);
    });

    // simulate_round: plays home[i] vs away[i] with default tactics, returns scores
    m.def("simulate_round", [](const std::vector<std::string>& homes,
                               const std::vector<std::string>& aways,
                               uint32_t seed, int threads) {
        if (homes.size() != aways.size()) throw py::value_error("home/away size mismatch");
        std::vector<fm::MatchSetup> fixtures;
        for (size_t i = 0; i < homes.size(); ++i) {
            const fm::TeamRoster* h = fm::getRosterByName(homes[i]);
            const fm::TeamRoster* a = fm::getRosterByName(aways[i]);
            if (!h || !a) throw py::value_error("unknown roster in fixture " + std::to_string(i));
            fm::MatchSetup setup;
            setup.homeRoster = h;
            setup.awayRoster = a;
            setup.homeTactics = fm::createDefaultTactics(*h);
            setup.awayTactics = fm::createDefaultTactics(*a);
            setup.fixtureId = homes[i] + "-" + aways[i];
            fixtures.push_back(setup);
        }

        fm::RoundSimulator round(fixtures, fm::EngineConfig(), seed);
        {
            py::gil_scoped_release release;
            round.simulateAll(threads);
        }

        py::list out;
        for (const auto& r : round.results()) {
            py::dict d;
            d["fixture_id"] = r.fixtureId;
            d["home_score"] = r.homeScore;
            d["away_score"] = r.awayScore;
            out.append(d);
        }
        return out;
    }, py::arg("home"), py::arg("away"), py::arg("seed") = 42, py::arg("threads") = 1);

    // SetupError -> ValueError
    py::register_exception<fm::SetupError>(m, "SetupError", PyExc_ValueError);
}
