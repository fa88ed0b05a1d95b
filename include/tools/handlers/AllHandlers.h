#ifndef ALLHANDLERS_H
#define ALLHANDLERS_H

// Include all tool handlers
#include "MarkerToolHandler.h"
#include "HighlighterToolHandler.h"
#include "EraserToolHandler.h"

#endif // ALLHANDLERS_H
