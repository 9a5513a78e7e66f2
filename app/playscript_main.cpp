// playscript - console runner for generated mini-game scripts
// Plays one timed round in the terminal: each line on stdin is a guess.

#include <playscript/core/config.hpp>
#include <playscript/core/logger.hpp>
#include <playscript/core/scripting/scripting.hpp>
#include <playscript/game/game_json.hpp>
#include <playscript/game/game_loop.hpp>

#include <poll.h>
#include <unistd.h>

#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>

#ifndef PLAYSCRIPT_VERSION
#define PLAYSCRIPT_VERSION "0.0.0-dev"
#endif

namespace {

using namespace playscript;

volatile std::sig_atomic_t g_running = 1;

void signal_handler(int sig) {
    (void)sig;
    g_running = 0;
}

void print_usage(const char* progname) {
    std::cout << "Usage: " << progname << " (--script <file> [--metadata <file>] | --artifacts <file>) [options]\n\n";
    std::cout << "Options:\n";
    std::cout << "  --script <file>     Lua game logic\n";
    std::cout << "  --metadata <file>   metadata.json for the script (optional)\n";
    std::cout << "  --artifacts <file>  Stored game document with metadata and logicLua\n";
    std::cout << "  --config <file>     INI configuration\n";
    std::cout << "  --duration <n>      Round length in seconds (overrides metadata)\n";
    std::cout << "  --check             Validate the script and exit\n";
    std::cout << "  --verbose           Enable verbose logging\n";
    std::cout << "  --quiet             Disable most logging\n";
    std::cout << "  --help              Show this help message\n";
    std::cout << "\nIn game:\n";
    std::cout << "  :hint  :skip  :restart  :quit\n";
    std::cout << "\nExample:\n";
    std::cout << "  " << progname << " --script logic.lua --metadata metadata.json\n";
}

struct Args {
    std::string script;
    std::string metadata;
    std::string artifacts;
    std::string config;
    int duration = 0;
    bool check = false;
    bool verbose = false;
    bool quiet = false;
    bool help = false;
};

Args parse_args(int argc, char* argv[]) {
    Args args;

    for (int i = 1; i < argc; i++) {
        const char* arg = argv[i];

        if (std::strcmp(arg, "--help") == 0 || std::strcmp(arg, "-h") == 0) {
            args.help = true;
        }
        else if (std::strcmp(arg, "--script") == 0 && i + 1 < argc) {
            args.script = argv[++i];
        }
        else if (std::strcmp(arg, "--metadata") == 0 && i + 1 < argc) {
            args.metadata = argv[++i];
        }
        else if (std::strcmp(arg, "--artifacts") == 0 && i + 1 < argc) {
            args.artifacts = argv[++i];
        }
        else if (std::strcmp(arg, "--config") == 0 && i + 1 < argc) {
            args.config = argv[++i];
        }
        else if (std::strcmp(arg, "--duration") == 0 && i + 1 < argc) {
            args.duration = std::atoi(argv[++i]);
        }
        else if (std::strcmp(arg, "--check") == 0) {
            args.check = true;
        }
        else if (std::strcmp(arg, "--verbose") == 0) {
            args.verbose = true;
        }
        else if (std::strcmp(arg, "--quiet") == 0) {
            args.quiet = true;
        }
        else {
            std::cerr << "[WARNING] Unknown argument: " << arg << "\n";
        }
    }

    return args;
}

bool read_file(const std::string& path, std::string* out) {
    std::ifstream f(path, std::ios::binary);
    if (!f.is_open()) return false;

    std::ostringstream ss;
    ss << f.rdbuf();
    *out = ss.str();
    return true;
}

bool load_game(const Args& args, std::string* source, game::GameMetadata* meta) {
    std::string err;

    if (!args.artifacts.empty()) {
        std::string text;
        if (!read_file(args.artifacts, &text)) {
            std::cerr << "[ERROR] Cannot read " << args.artifacts << "\n";
            return false;
        }
        game::GameArtifacts artifacts;
        if (!game::read_artifacts_json(text, &artifacts, &err)) {
            std::cerr << "[ERROR] " << args.artifacts << ": " << err << "\n";
            return false;
        }
        *source = std::move(artifacts.logicLua);
        *meta = std::move(artifacts.metadata);
        return true;
    }

    if (args.script.empty()) {
        std::cerr << "[ERROR] Either --script or --artifacts is required\n";
        return false;
    }
    if (!read_file(args.script, source)) {
        std::cerr << "[ERROR] Cannot read " << args.script << "\n";
        return false;
    }

    if (!args.metadata.empty()) {
        std::string text;
        if (!read_file(args.metadata, &text)) {
            std::cerr << "[ERROR] Cannot read " << args.metadata << "\n";
            return false;
        }
        if (!game::read_metadata_json(text, meta, &err)) {
            std::cerr << "[ERROR] " << args.metadata << ": " << err << "\n";
            return false;
        }
    }
    return true;
}

int run_check(const std::string& source) {
    auto result = scripting::Sandbox::validate_script(source);
    for (const auto& e : result.errors) {
        std::cout << "[ERROR] " << e << "\n";
    }
    for (const auto& w : result.warnings) {
        std::cout << "[WARNING] " << w << "\n";
    }
    std::cout << (result.valid ? "OK" : "FAILED") << "\n";
    return result.valid ? 0 : 1;
}

void print_state(const game::GameLoop& loop) {
    const auto& s = loop.state();
    std::cout << "\n[" << loop.time_remaining() << "s] Score: " << s.score;
    if (s.maxWrongGuesses > 0 && s.wrongGuesses > 0) {
        std::cout << "  Wrong: " << s.wrongGuesses << " / " << s.maxWrongGuesses;
    }
    std::cout << "\n  " << (s.currentChallenge.empty() ? "(no challenge)" : s.currentChallenge) << "\n> " << std::flush;
}

void print_summary(const game::RoundSummary& summary) {
    std::cout << "\n\nTime's up!\n";
    std::cout << "  Score:      " << summary.score << "\n";
    std::cout << "  Completed:  " << summary.challengesCompleted << "\n";
    std::cout << "  Points:     " << summary.pointsAwarded << "\n";
    for (const auto& [key, value] : summary.results) {
        if (key == game::state_keys::kScore) continue;
        std::cout << "  " << key << ": " << value.to_display_string() << "\n";
    }
    std::cout << "\n:restart to play again, :quit to exit\n> " << std::flush;
}

// Waits up to timeoutMs for a line on stdin. 1 = line read, 0 = timeout, -1 = EOF/error.
int poll_line(int timeoutMs, std::string* line) {
    pollfd pfd{};
    pfd.fd = STDIN_FILENO;
    pfd.events = POLLIN;

    int rc = ::poll(&pfd, 1, timeoutMs);
    if (rc < 0) {
        return errno == EINTR ? 0 : -1;
    }
    if (rc == 0) return 0;

    if (!std::getline(std::cin, *line)) return -1;
    return 1;
}

// 0 once the round is running, otherwise the process exit code.
int start_round(game::GameLoop& loop) {
    try {
        if (!loop.begin()) {
            std::cerr << "[ERROR] " << loop.error() << "\n";
            return 1;
        }
    } catch (const scripting::EngineFatalError& e) {
        std::cerr << "[ERROR] Scripting unavailable: " << e.what() << "\n";
        return 2;
    }
    return 0;
}

// Returns false when the session should stop; *exitCode says how.
bool handle_line(game::GameLoop& loop, const std::string& line, int* exitCode) {
    if (line == ":quit") {
        return false;
    }

    if (line == ":restart") {
        loop.reset();
        *exitCode = start_round(loop);
        if (*exitCode != 0) {
            return false;
        }
        print_state(loop);
        return true;
    }

    if (!loop.running()) {
        std::cout << "> " << std::flush;
        return true;
    }

    if (line == ":hint") {
        std::string h = loop.hint();
        std::cout << "  Hint: " << (h.empty() ? "(none)" : h) << "\n";
        print_state(loop);
        return true;
    }

    if (line == ":skip") {
        loop.skip();
        print_state(loop);
        return true;
    }

    auto outcome = loop.submit(line);
    if (outcome.correct) {
        std::cout << "  Correct! +" << outcome.points << "\n";
    } else {
        std::cout << "  Nope.\n";
    }
    print_state(loop);
    return true;
}

} // namespace

int main(int argc, char* argv[]) {
    Args args = parse_args(argc, argv);

    if (args.help) {
        std::cout << "playscript v" << PLAYSCRIPT_VERSION << "\n\n";
        print_usage(argv[0]);
        return 0;
    }

    core::Config config;
    if (!args.config.empty() && !config.load_from_file(args.config)) {
        std::cerr << "[ERROR] Cannot read config " << args.config << "\n";
        return 1;
    }

    core::LoggingConfig logging = config.logging();
    if (args.quiet) {
        logging.enabled = false;
    } else if (args.verbose) {
        logging.level = core::LogLevel::Debug;
    }
    core::Logger::instance().init(logging);

    std::string source;
    game::GameMetadata meta;
    if (!load_game(args, &source, &meta)) {
        return 1;
    }
    if (args.duration > 0) {
        meta.duration = args.duration;
    }

    if (args.check) {
        return run_check(source);
    }

    game::GameLoop loop(source, meta, game::LoopOptions::from_config(config));
    loop.set_on_round_ended([](const game::RoundSummary& summary) {
        print_summary(summary);
    });

    int exitCode = start_round(loop);
    if (exitCode != 0) {
        return exitCode;
    }

    std::cout << meta.name << " - " << meta.description << "\n";
    for (const auto& rule : meta.rules) {
        std::cout << "  * " << rule << "\n";
    }
    print_state(loop);

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    using clock = std::chrono::steady_clock;
    auto last = clock::now();

    while (g_running) {
        std::string line;
        int rc = poll_line(loop.running() ? 1000 : -1, &line);

        auto now = clock::now();
        if (loop.running()) {
            int before = loop.time_remaining();
            loop.advance(std::chrono::duration<double>(now - last).count());
            int after = loop.time_remaining();
            if (loop.running() && before != after && (after % 10 == 0 || after <= 5)) {
                std::cout << "\n  " << after << "s left\n> " << std::flush;
            }
        }
        last = now;

        if (rc < 0) {
            loop.finish();
            break;
        }
        if (rc > 0 && !handle_line(loop, line, &exitCode)) {
            break;
        }
    }

    loop.exit();
    core::Logger::instance().shutdown();
    std::cout << "\n";
    return exitCode;
}
