#ifndef TOOLID_H
#define TOOLID_H

/**
 * @brief Freehand tools available on every ink surface.
 */
enum class ToolId {
    Marker = 0,     // Opaque pen
    Highlighter,    // Translucent wide pen
    Eraser,         // Removes whole strokes along its path

    Count
};

#endif // TOOLID_H
