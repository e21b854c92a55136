#include "fm/match_engine.h"
#include "fm/match_stats.h"
#include "fm/round_simulator.h"
#include "fm/roster.h"
#include "fm/tactics.h"
#include "fm/trace.h"
#include <chrono>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <string>

using namespace fm;

namespace {

struct Options {
    std::string homeRoster = "lisbon";
    std::string awayRoster = "porto";
    std::string homeFormation = "4-3-3";
    std::string awayFormation = "4-3-3";
    std::string homePosture = "balanced";
    std::string awayPosture = "balanced";
    int games = 1;
    int threads = 1;
    uint32_t seed = 42;
    std::string configPath;
    std::string tracePath;
    bool dumpConfig = false;
    bool verbose = false;
};

const TeamRoster& getRoster(const std::string& name) {
    const TeamRoster* r = getRosterByName(name);
    if (r) return *r;
    throw SetupError("unknown roster: " + name);
}

void printUsage() {
    std::cout << "Usage: match_cli [options]\n"
              << "\nOptions:\n"
              << "  --home=R              Home roster: lisbon, porto, braga, minho (default: lisbon)\n"
              << "  --away=R              Away roster (default: porto)\n"
              << "  --home-formation=F    4-4-2, 4-3-3, 4-2-3-1, 3-5-2, 4-5-1, 5-3-2, 5-4-1, 3-4-3\n"
              << "                        (default: 4-3-3)\n"
              << "  --away-formation=F    Same options as --home-formation (default: 4-3-3)\n"
              << "  --home-posture=P      defensive, balanced, attacking (default: balanced)\n"
              << "  --away-posture=P      Same options as --home-posture (default: balanced)\n"
              << "  --games=N             Number of matches (default: 1)\n"
              << "  --threads=N           Worker threads for --games > 1 (default: 1)\n"
              << "  --seed=N              Base RNG seed (default: 42)\n"
              << "  --config=PATH         Engine config JSON file\n"
              << "  --trace=PATH          Write the decision trace as JSON lines (single match)\n"
              << "  --dump-config         Print the effective config and exit\n"
              << "  --verbose             Print the event log / per-match results\n"
              << "  --help                Show this help\n";
}

Options parseArgs(int argc, char* argv[]) {
    Options opts;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg.find("--home=") == 0) opts.homeRoster = arg.substr(7);
        else if (arg.find("--away=") == 0) opts.awayRoster = arg.substr(7);
        else if (arg.find("--home-formation=") == 0) opts.homeFormation = arg.substr(17);
        else if (arg.find("--away-formation=") == 0) opts.awayFormation = arg.substr(17);
        else if (arg.find("--home-posture=") == 0) opts.homePosture = arg.substr(15);
        else if (arg.find("--away-posture=") == 0) opts.awayPosture = arg.substr(15);
        else if (arg.find("--games=") == 0) opts.games = std::stoi(arg.substr(8));
        else if (arg.find("--threads=") == 0) opts.threads = std::stoi(arg.substr(10));
        else if (arg.find("--seed=") == 0) opts.seed = static_cast<uint32_t>(std::stoul(arg.substr(7)));
        else if (arg.find("--config=") == 0) opts.configPath = arg.substr(9);
        else if (arg.find("--trace=") == 0) opts.tracePath = arg.substr(8);
        else if (arg == "--dump-config") opts.dumpConfig = true;
        else if (arg == "--verbose") opts.verbose = true;
        else if (arg == "--help") { printUsage(); exit(0); }
        else { std::cerr << "Unknown option: " << arg << "\n"; printUsage(); exit(1); }
    }
    if (opts.games < 1) opts.games = 1;
    return opts;
}

std::string playerName(const MatchState& state, int id) {
    const Player* p = state.home.player(id);
    if (!p) p = state.away.player(id);
    return p ? p->displayName() : std::to_string(id);
}

void printEvents(const MatchState& state) {
    for (const auto& e : state.events) {
        std::cout << "  " << e.minute << "'  " << toString(e.type)
                  << " [" << toString(e.team) << "] " << e.description << "\n";
    }
}

void printPlayerStats(const MatchState& state) {
    std::cout << "\n=== Player stats ===\n";
    for (const auto& s : aggregatePlayerStats(state)) {
        if (s.goals == 0 && s.assists == 0 && s.yellowCards == 0 && s.redCards == 0 &&
            s.started) {
            continue;
        }
        std::cout << "  " << playerName(state, s.playerId)
                  << " (" << toString(s.side) << ") " << s.minutesPlayed << " min";
        if (s.goals) std::cout << ", " << s.goals << " goal(s)";
        if (s.assists) std::cout << ", " << s.assists << " assist(s)";
        if (s.yellowCards) std::cout << ", yellow";
        if (s.redCards) std::cout << ", red";
        std::cout << "\n";
    }
}

int runSingle(const MatchSetup& setup, const EngineConfig& config, const Options& opts) {
    TraceRecorder recorder;
    TraceSink* trace = opts.tracePath.empty() ? nullptr : &recorder;

    MatchEngine engine(setup, config, opts.seed, trace);
    engine.simulateToEnd();
    const MatchState& state = engine.state();

    if (opts.verbose) {
        printEvents(state);
        printPlayerStats(state);
    }

    std::cout << "\n=== Result ===\n";
    std::cout << state.home.roster->name << " " << state.homeScore() << " - "
              << state.awayScore() << " " << state.away.roster->name << "\n";
    std::cout << "Subs used: " << state.home.subsUsed << " - " << state.away.subsUsed << "\n";
    std::cout << "Sent off:  " << state.home.sentOffCount() << " - "
              << state.away.sentOffCount() << "\n";

    if (trace) {
        std::ofstream out(opts.tracePath);
        if (!out) {
            std::cerr << "Failed to open trace file: " << opts.tracePath << "\n";
            return 1;
        }
        writeTraceJsonLines(out, recorder.events());
        std::cout << "Wrote " << recorder.size() << " trace events to " << opts.tracePath << "\n";
    }
    return 0;
}

int runMany(const MatchSetup& setup, const EngineConfig& config, const Options& opts) {
    std::vector<MatchSetup> fixtures(opts.games, setup);
    for (int g = 0; g < opts.games; ++g) {
        fixtures[g].fixtureId = "game-" + std::to_string(g + 1);
    }
    if (!opts.tracePath.empty()) {
        std::cerr << "--trace is only supported for a single match, ignoring\n";
    }

    auto benchStart = std::chrono::steady_clock::now();
    RoundSimulator round(fixtures, config, opts.seed);
    round.simulateAll(opts.threads);
    auto benchEnd = std::chrono::steady_clock::now();
    double totalSec = std::chrono::duration<double>(benchEnd - benchStart).count();

    int homeWins = 0, awayWins = 0, draws = 0;
    int totalHomeScore = 0, totalAwayScore = 0;
    int g = 0;
    for (const auto& r : round.results()) {
        totalHomeScore += r.homeScore;
        totalAwayScore += r.awayScore;
        if (r.homeScore > r.awayScore) homeWins++;
        else if (r.awayScore > r.homeScore) awayWins++;
        else draws++;

        if (opts.verbose) {
            std::cout << "Game " << (++g) << ": " << r.homeScore << "-" << r.awayScore << "\n";
        }
    }

    std::cout << "\n=== Results ===\n";
    std::cout << "Home wins: " << homeWins << " (" << (100.0 * homeWins / opts.games) << "%)\n";
    std::cout << "Away wins: " << awayWins << " (" << (100.0 * awayWins / opts.games) << "%)\n";
    std::cout << "Draws:     " << draws << " (" << (100.0 * draws / opts.games) << "%)\n";
    std::cout << "Avg score: " << (1.0 * totalHomeScore / opts.games)
              << " - " << (1.0 * totalAwayScore / opts.games) << "\n";
    std::cout << "Time:      " << totalSec << "s\n";
    return 0;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    Options opts = parseArgs(argc, argv);

    try {
        EngineConfig config;
        if (!opts.configPath.empty()) {
            config = loadEngineConfig(opts.configPath);
            if (opts.verbose) std::cout << "Loaded config from " << opts.configPath << "\n";
        }
        if (opts.dumpConfig) {
            std::cout << engineConfigToJson(config) << "\n";
            return 0;
        }

        const TeamRoster& home = getRoster(opts.homeRoster);
        const TeamRoster& away = getRoster(opts.awayRoster);

        MatchSetup setup;
        setup.homeRoster = &home;
        setup.awayRoster = &away;
        setup.homeTactics = createDefaultTactics(home, parseFormation(opts.homeFormation),
                                                 parsePosture(opts.homePosture));
        setup.awayTactics = createDefaultTactics(away, parseFormation(opts.awayFormation),
                                                 parsePosture(opts.awayPosture));
        setup.fixtureId = "cli";

        std::cout << "Match: " << home.name << " (" << opts.homeFormation << ", "
                  << opts.homePosture << ") vs " << away.name << " (" << opts.awayFormation
                  << ", " << opts.awayPosture << ")\n";
        std::cout << "Games: " << opts.games << ", seed " << opts.seed << "\n";

        if (opts.games == 1) return runSingle(setup, config, opts);
        return runMany(setup, config, opts);
    } catch (const SetupError& e) {
        std::cerr << "Setup error: " << e.what() << "\n";
        return 1;
    }
}
