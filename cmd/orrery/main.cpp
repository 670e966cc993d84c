/**
 * @file main.cpp
 * @brief Orrery entry point: terminal view of the Sun/Earth/Moon system, or a headless run.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#include <ncurses.h>
#include <algorithm>
#include <chrono>
#include <thread>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <string>
#include "Logger.h"
#include "OrreryView.h"
#include "Scenario.h"
#include "SimConfig.h"
#include "Simulation.h"

static volatile sig_atomic_t g_stop = 0;
static void handle_signal(int) { g_stop = 1; }

static void init_colors_orrery();

static bool g_curses_inited = false;
static volatile sig_atomic_t g_needs_full_redraw = 0;
static void atexit_cleanup() {
    if (g_curses_inited) {
        endwin();
        g_curses_inited = false;
    }
}

// Suspend: restore tty, then stop process with default action
static void handle_sigtstp(int) {
    if (g_curses_inited) {
        def_prog_mode();
        endwin();
        g_curses_inited = false;
    }
    struct sigaction sa{}; sa.sa_handler = SIG_DFL; sigemptyset(&sa.sa_mask); sa.sa_flags = 0; sigaction(SIGTSTP, &sa, nullptr);
    raise(SIGTSTP);
}

// Resume: restore curses state and redraw
static void handle_sigcont(int) {
    struct sigaction st{}; st.sa_handler = handle_sigtstp; sigemptyset(&st.sa_mask); st.sa_flags = 0; sigaction(SIGTSTP, &st, nullptr);
    reset_prog_mode();
    refresh();
    cbreak();
    noecho();
    curs_set(0);
    keypad(stdscr, TRUE);
    nodelay(stdscr, TRUE);
    timeout(0);
    init_colors_orrery();
    clearok(stdscr, TRUE);
    refresh();
    g_curses_inited = true;
    g_needs_full_redraw = 1;
}

static void init_colors_orrery() {
    if (!has_colors()) return;
    start_color();
    use_default_colors();
    // 1: BLACK, 2: RED, 3: GREEN, 4: YELLOW, 5: BLUE, 6: MAGENTA, 7: CYAN, 8: WHITE
    init_pair(1, COLOR_BLACK, -1);
    init_pair(2, COLOR_RED, -1);
    init_pair(3, COLOR_GREEN, -1);
    init_pair(4, COLOR_YELLOW, -1);
    init_pair(5, COLOR_BLUE, -1);
    init_pair(6, COLOR_MAGENTA, -1);
    init_pair(7, COLOR_CYAN, -1);
    init_pair(8, COLOR_WHITE, -1);
}

static void print_bodies(const Simulation& sim) {
    std::printf("t=%s  steps=%llu  dropped=%.0f s  energy=%.6e J\n",
                formatSimTime(sim.simClock().simTime()).c_str(),
                (unsigned long long)sim.scheduler().totalSteps(),
                sim.scheduler().droppedSeconds(), sim.energy());
    const auto& bodies = sim.bodies();
    for (const auto& b : bodies) {
        Vector3D p = delta(WorldPos{}, b.world);
        std::printf("%-8s sector=(%lld,%lld,%lld) pos=(%.6e, %.6e, %.6e) m  v=(%.3f, %.3f, %.3f) m/s\n",
                    b.definition.name.c_str(),
                    (long long)b.world.sector.x, (long long)b.world.sector.y, (long long)b.world.sector.z,
                    p.x, p.y, p.z, b.velocity.x, b.velocity.y, b.velocity.z);
    }
}

static int run_headless(Simulation& sim, int frames) {
    const double frameDt = 1.0 / 60.0;
    for (int f = 0; f < frames && !g_stop; ++f) sim.frame(frameDt);
    print_bodies(sim);
    Logger::info("headless run complete: frames=" + std::to_string(frames));
    return 0;
}

static int run_interactive(Simulation& sim, const SimConfig& cfg) {
    struct sigaction st{}; st.sa_handler = handle_sigtstp; sigemptyset(&st.sa_mask); st.sa_flags = 0; sigaction(SIGTSTP, &st, nullptr);
    struct sigaction sc{}; sc.sa_handler = handle_sigcont; sigemptyset(&sc.sa_mask); sc.sa_flags = 0; sigaction(SIGCONT, &sc, nullptr);

    initscr();
    g_curses_inited = true;
    std::atexit(atexit_cleanup);
    cbreak();
    noecho();
    curs_set(0);
    keypad(stdscr, TRUE);
    nodelay(stdscr, TRUE);
    timeout(0);
    init_colors_orrery();

    int rows, cols; getmaxyx(stdscr, rows, cols);
    if (rows < 2 || cols < 1) { Logger::error("terminal too small"); endwin(); g_curses_inited = false; return 1; }

    OrreryView view(stdscr);
    double resumeScale = cfg.timeScale > 0.0 ? cfg.timeScale : 86400.0;

    bool done = false;
    using namespace std::chrono;
    auto last = steady_clock::now();
    while (!done) {
        if (g_stop) done = true;
        if (g_needs_full_redraw) {
            clearok(stdscr, TRUE);
            g_needs_full_redraw = 0;
        }
        auto now = steady_clock::now();
        double realDt = duration_cast<duration<double>>(now - last).count();
        last = now;
        sim.frame(realDt);
        view.draw(sim);
        doupdate();

        int ch = getch();
        switch (ch) {
            case 'q': case 'Q':
                Logger::info("quit requested"); done = true; break;
            case ' ': case 'p': case 'P':
                if (sim.simClock().isPaused()) { sim.setTimeScale(resumeScale); Logger::info("resumed"); }
                else { resumeScale = sim.simClock().timeScale(); sim.setTimeScale(0.0); Logger::info("paused"); }
                break;
            case '+': case '=':
                if (!sim.simClock().isPaused()) sim.setTimeScale(sim.simClock().timeScale() * 2.0);
                Logger::info("time scale: " + std::to_string(sim.simClock().timeScale())); break;
            case '-':
                if (!sim.simClock().isPaused()) sim.setTimeScale(sim.simClock().timeScale() * 0.5);
                Logger::info("time scale: " + std::to_string(sim.simClock().timeScale())); break;
            case '[':
                view.zoomIn(); break;
            case ']':
                view.zoomOut(); break;
            case 'f': case 'F': case '\t':
                view.cycleFocus(sim.bodyCount());
                if (sim.bodyCount() > 0) Logger::info("focus: " + sim.bodies()[view.focus()].definition.name);
                break;
            case 'w':
                sim.setWorkerCount(std::max(1, sim.workerPool().workerCount() - 1)); break;
            case 'W':
                sim.setWorkerCount(sim.workerPool().workerCount() + 1); break;
            case 'r': case 'R':
                sim.reset(makeSolarScenario(sim.gravity()));
                sim.setTimeScale(resumeScale);
                Logger::info("scenario reset"); break;
            case KEY_RESIZE:
                g_needs_full_redraw = 1; break;
            default:
                break;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(16));
    }

    endwin();
    g_curses_inited = false;
    return 0;
}

int main(int argc, char** argv) {
    Logger::initFromArgv0((argc > 0) ? argv[0] : "orrery");
    Logger::info("orrery starting");
    std::set_terminate([]{
        try {
            auto ep = std::current_exception();
            if (ep) {
                try { std::rethrow_exception(ep); }
                catch (const std::exception& e) { Logger::logException("std::terminate (orrery)", e); }
                catch (...) { Logger::logUnknownException("std::terminate (orrery)"); }
            } else {
                Logger::error("std::terminate (orrery): no active exception");
            }
        } catch (...) {}
        if (g_curses_inited) { endwin(); }
        Logger::shutdown();
        std::_Exit(1);
    });
    try {
        struct sigaction sa{};
        sa.sa_handler = handle_signal;
        sigemptyset(&sa.sa_mask);
        sa.sa_flags = 0;
        sigaction(SIGINT, &sa, nullptr);
        sigaction(SIGTERM, &sa, nullptr);

        SimConfig cfg = loadConfig(argc, argv);
        Simulation sim(cfg);
        sim.reset(makeSolarScenario(sim.gravity()));

        int rc = cfg.headlessFrames > 0 ? run_headless(sim, cfg.headlessFrames) : run_interactive(sim, cfg);
        sim.shutdown();
        Logger::info("orrery terminating");
        Logger::shutdown();
        return rc;
    } catch (const std::exception& e) {
        if (g_curses_inited) { endwin(); g_curses_inited = false; }
        Logger::logException("unhandled exception (orrery)", e);
        std::fprintf(stderr, "orrery: %s\n", e.what());
        Logger::shutdown();
        return 2;
    } catch (...) {
        if (g_curses_inited) { endwin(); g_curses_inited = false; }
        Logger::logUnknownException("unhandled exception (orrery)");
        Logger::shutdown();
        return 2;
    }
}
