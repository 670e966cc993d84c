/**
 * @file OrreryView.h
 * @brief Top-down ncurses view of the bodies around a camera that follows a focus body.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#pragma once

#include "Body.h"
#include "WorldPos.h"

#include <cstddef>
#include <ncurses.h>
#include <string>
#include <vector>

class Simulation;

/**
 * @brief Map a render-space offset (x right, z down the screen) to a character cell.
 *
 * Terminal cells are roughly twice as tall as wide, so one cell row covers @p unitsPerCell and one column half
 * of that. The camera sits at the center of a @p cols x @p rows area. Returns false when the cell is off-screen.
 */
bool projectToCell(const Vector3F& offset, double unitsPerCell, int cols, int rows, int& cx, int& cy);

/** @brief Format simulation seconds as "D d HH:MM:SS". */
std::string formatSimTime(double seconds);

/**
 * @class OrreryView
 * @brief Draws the bodies of a Simulation and a status line into an ncurses window.
 */
class OrreryView {
public:
    explicit OrreryView(WINDOW* win);

    void setWindow(WINDOW* w) { win = w; }

    /** @brief Follow body @p index; out-of-range indices are ignored. */
    void setFocus(size_t index, size_t bodyCount);
    /** @brief Move the focus to the next body, wrapping around. */
    void cycleFocus(size_t bodyCount);
    size_t focus() const { return focusIndex; }

    void zoomIn();
    void zoomOut();
    double metersPerCell() const { return cellMeters; }

    /** @brief Camera position: the focus body's world position (origin sector when there are no bodies). */
    WorldPos camera(const std::vector<Body>& bodies) const;

    /** @brief Redraw bodies and the status line. */
    void draw(const Simulation& sim);

private:
    void drawBodies(const Simulation& sim, int rows, int cols);
    void drawStatusLine(const Simulation& sim, int rows, int cols);

    WINDOW* win{nullptr};
    size_t focusIndex{0};
    double cellMeters{5.0e9};
};
