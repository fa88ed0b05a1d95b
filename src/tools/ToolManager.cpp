#include "tools/ToolManager.h"
#include "tools/handlers/AllHandlers.h"
#include "annotations/StrokeHistory.h"

#include <QtGlobal>

ToolManager::ToolManager(QObject* parent)
    : QObject(parent)
    , m_context(std::make_unique<ToolContext>())
{
    // Set up the repaint callback to emit our signal
    m_context->requestRepaint = [this]() {
        emit needsRepaint();
    };
}

ToolManager::~ToolManager() = default;

void ToolManager::registerHandler(std::unique_ptr<IToolHandler> handler) {
    if (handler) {
        ToolId id = handler->toolId();
        m_handlers[id] = std::move(handler);
    }
}

void ToolManager::registerDefaultHandlers() {
    registerHandler(std::make_unique<MarkerToolHandler>());
    registerHandler(std::make_unique<HighlighterToolHandler>());
    registerHandler(std::make_unique<EraserToolHandler>());

    if (auto* h = currentHandler()) {
        h->onActivate(m_context.get());
    }
}

void ToolManager::setCurrentTool(ToolId id) {
    if (m_currentToolId == id) {
        return;
    }

    // Deactivate current handler, dropping any half-finished gesture
    if (auto* current = currentHandler()) {
        const bool wasDrawing = current->isDrawing();
        current->cancelDrawing();
        current->onDeactivate(m_context.get());
        if (wasDrawing) {
            emit drawingFinished();
            m_context->repaint();
        }
    }

    m_currentToolId = id;

    // Activate new handler
    if (auto* newHandler = currentHandler()) {
        newHandler->onActivate(m_context.get());
    }

    emit toolChanged(m_currentToolId);
}

IToolHandler* ToolManager::currentHandler() {
    return handler(m_currentToolId);
}

const IToolHandler* ToolManager::currentHandler() const {
    auto it = m_handlers.find(m_currentToolId);
    if (it != m_handlers.end()) {
        return it->second.get();
    }
    return nullptr;
}

IToolHandler* ToolManager::handler(ToolId id) {
    auto it = m_handlers.find(id);
    if (it != m_handlers.end()) {
        return it->second.get();
    }
    return nullptr;
}

void ToolManager::handlePointerPress(const QPointF& pos) {
    if (auto* h = currentHandler()) {
        bool wasDrawing = h->isDrawing();
        h->onPointerPress(m_context.get(), pos);
        if (!wasDrawing && h->isDrawing()) {
            emit drawingStarted();
        }
    }
}

void ToolManager::handlePointerMove(const QPointF& pos) {
    if (auto* h = currentHandler()) {
        h->onPointerMove(m_context.get(), pos);
    }
}

void ToolManager::handlePointerRelease() {
    if (auto* h = currentHandler()) {
        bool wasDrawing = h->isDrawing();
        h->onPointerRelease(m_context.get());
        if (wasDrawing && !h->isDrawing()) {
            emit drawingFinished();
        }
    }
}

void ToolManager::handlePointerLeave() {
    handlePointerRelease();
}

InkStroke ToolManager::previewStroke() const {
    if (const auto* h = currentHandler()) {
        return h->previewStroke();
    }
    return InkStroke();
}

bool ToolManager::isDrawing() const {
    if (const auto* h = currentHandler()) {
        return h->isDrawing();
    }
    return false;
}

QCursor ToolManager::currentCursor() const {
    if (const auto* h = currentHandler()) {
        return h->cursor();
    }
    return Qt::CrossCursor;
}

ToolManager::CaptureState ToolManager::captureState() const {
    return isDrawing() ? CaptureState::Capturing : CaptureState::Idle;
}

void ToolManager::cancelDrawing() {
    if (auto* h = currentHandler()) {
        if (h->isDrawing()) {
            h->cancelDrawing();
            emit drawingFinished();
            m_context->repaint();
        }
    }
}

void ToolManager::setStrokeHistory(StrokeHistory* history) {
    m_context->history = history;
}

void ToolManager::setColor(const QColor& color) {
    m_context->color = color;
}

void ToolManager::setHighlighterColor(const QColor& color) {
    m_context->highlighterColor = color;
}

void ToolManager::setMarkerWidth(qreal width) {
    m_context->markerWidth = qBound(ArchiNotes::Ink::kMinStrokeWidth, width, ArchiNotes::Ink::kMaxStrokeWidth);
}

void ToolManager::setHighlighterWidth(qreal width) {
    m_context->highlighterWidth = qBound(ArchiNotes::Ink::kMinStrokeWidth, width, ArchiNotes::Ink::kMaxStrokeWidth);
}

void ToolManager::setEraserRadius(qreal radius) {
    m_context->eraserRadius = qBound(ArchiNotes::Ink::kMinEraserRadius, radius, ArchiNotes::Ink::kMaxEraserRadius);
    if (m_currentToolId == ToolId::Eraser) {
        if (auto* h = currentHandler()) {
            h->onActivate(m_context.get());
        }
    }
}

void ToolManager::setEraserPreviewColor(const QColor& color) {
    m_context->eraserPreviewColor = color;
}
