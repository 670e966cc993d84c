/**
 * @file OrreryView.cpp
 * @brief ncurses rendering: floating-origin projection, body glyphs, status line.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#include "OrreryView.h"
#include "Logger.h"
#include "Simulation.h"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <cstring>

namespace {
constexpr double kMinCellMeters = 1.0e5;
constexpr double kMaxCellMeters = 1.0e13;
constexpr double kZoomFactor = 2.0;
constexpr double kMaxFormattedSeconds = 9.0e18;
}

bool projectToCell(const Vector3F& offset, double unitsPerCell, int cols, int rows, int& cx, int& cy) {
    if (!(unitsPerCell > 0.0) || cols < 1 || rows < 1) return false;
    double col = (double)offset.x / unitsPerCell * 2.0;
    double row = (double)offset.z / unitsPerCell;
    cx = cols / 2 + (int)std::lround(col);
    cy = rows / 2 + (int)std::lround(row);
    return cx >= 0 && cx < cols && cy >= 0 && cy < rows;
}

std::string formatSimTime(double seconds) {
    if (!(seconds > 0.0)) seconds = 0.0;
    // Keeps the cast to long long defined for any simTime.
    if (seconds > kMaxFormattedSeconds) seconds = kMaxFormattedSeconds;
    long long total = (long long)std::floor(seconds);
    long long days = total / 86400LL;
    total %= 86400LL;
    int hh = (int)(total / 3600LL);
    int mm = (int)((total % 3600LL) / 60LL);
    int ss = (int)(total % 60LL);
    char buf[64];
    snprintf(buf, sizeof(buf), "%lld d %02d:%02d:%02d", days, hh, mm, ss);
    return buf;
}

OrreryView::OrreryView(WINDOW* w) : win(w) {}

void OrreryView::setFocus(size_t index, size_t bodyCount) {
    if (index < bodyCount) focusIndex = index;
}

void OrreryView::cycleFocus(size_t bodyCount) {
    if (bodyCount == 0) { focusIndex = 0; return; }
    focusIndex = (focusIndex + 1) % bodyCount;
}

void OrreryView::zoomIn() {
    cellMeters = std::max(kMinCellMeters, cellMeters / kZoomFactor);
}

void OrreryView::zoomOut() {
    cellMeters = std::min(kMaxCellMeters, cellMeters * kZoomFactor);
}

WorldPos OrreryView::camera(const std::vector<Body>& bodies) const {
    if (bodies.empty()) return WorldPos{};
    return bodies[std::min(focusIndex, bodies.size() - 1)].world;
}

void OrreryView::draw(const Simulation& sim) {
    if (!win) return;
    int rows, cols; getmaxyx(win, rows, cols);
    werase(win);
    const std::string warning = Logger::lastWarning();
    const int bodyRows = warning.empty() ? rows - 1 : rows - 2;
    drawBodies(sim, bodyRows, cols);
    if (!warning.empty() && bodyRows >= 0) {
        if (has_colors()) wattron(win, COLOR_PAIR(2));
        mvwaddnstr(win, bodyRows, 0, ("! " + warning).c_str(), cols);
        if (has_colors()) wattroff(win, COLOR_PAIR(2));
    }
    drawStatusLine(sim, rows, cols);
    wnoutrefresh(win);
}

void OrreryView::drawBodies(const Simulation& sim, int rows, int cols) {
    if (rows < 1) return;
    const auto& bodies = sim.bodies();
    const WorldPos cam = camera(bodies);
    const double unitsPerCell = (double)metersToUnits(cellMeters);
    // Heaviest first so lighter bodies sharing a cell stay visible.
    std::vector<size_t> order(bodies.size());
    for (size_t i = 0; i < order.size(); ++i) order[i] = i;
    std::sort(order.begin(), order.end(), [&](size_t a, size_t b){
        return bodies[a].definition.massKg > bodies[b].definition.massKg;
    });
    for (size_t i : order) {
        const Body& b = bodies[i];
        int cx, cy;
        if (!projectToCell(worldToRender(b.world, cam), unitsPerCell, cols, rows, cx, cy)) continue;
        char glyph = b.definition.name.empty() ? '*' : b.definition.name[0];
        bool bold = (i == focusIndex);
        if (bold) wattron(win, A_BOLD);
        if (has_colors()) wattron(win, COLOR_PAIR(b.colorPair));
        mvwaddch(win, cy, cx, glyph);
        if (has_colors()) wattroff(win, COLOR_PAIR(b.colorPair));
        if (bold) wattroff(win, A_BOLD);
    }
}

void OrreryView::drawStatusLine(const Simulation& sim, int rows, int cols) {
    int y = rows - 1;
    if (y < 0) return;
    const auto& bodies = sim.bodies();
    const auto& clk = sim.simClock();
    const auto& sched = sim.scheduler();

    char focusInfo[96] = "";
    if (!bodies.empty()) {
        size_t f = std::min(focusIndex, bodies.size() - 1);
        // Speed relative to the heaviest other body, i.e. the one it orbits in the built-in scenarios.
        size_t ref = f;
        for (size_t i = 0; i < bodies.size(); ++i) {
            if (i == f) continue;
            if (ref == f || bodies[i].definition.massKg > bodies[ref].definition.massKg) ref = i;
        }
        Vector3D rel = bodies[f].velocity - (ref != f ? bodies[ref].velocity : Vector3D{});
        snprintf(focusInfo, sizeof(focusInfo), "%s v=%.3f km/s",
                 bodies[f].definition.name.c_str(), rel.length() / 1000.0);
    }

    char status[320];
    snprintf(status, sizeof(status),
             "[space]pause [-/+]speed [/]zoom [f]ocus [w/W]workers [r]eset [q]uit | T+%s x%.0f %s | %s | "
             "cell=%.2g m | workers=%d steps=%d%s dropped=%.0f s",
             formatSimTime(clk.simTime()).c_str(), clk.timeScale(), (clk.isPaused() ? "PAUSED" : "RUNNING"),
             focusInfo, cellMeters, sim.workerPool().workerCount(), sched.stepsThisFrame(),
             (sched.capHitThisFrame() ? "(cap)" : ""), sched.droppedSeconds());
    wmove(win, y, 0); wclrtoeol(win);
    int len = (int)strlen(status);
    if (len < cols) {
        mvwprintw(win, y, 0, "%s%*s", status, cols - len, "");
    } else {
        mvwaddnstr(win, y, 0, status, cols);
    }
}
