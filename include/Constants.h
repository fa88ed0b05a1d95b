#ifndef ARCHINOTES_CONSTANTS_H
#define ARCHINOTES_CONSTANTS_H

#include <QColor>
#include <QSize>

namespace ArchiNotes {

// ============================================================================
// PALETTE
// ============================================================================
namespace Palette {
inline const QColor kBlue{0x3b, 0x82, 0xf6};
inline const QColor kRed{0xef, 0x44, 0x44};
inline const QColor kGreen{0x22, 0xc5, 0x5e};
inline const QColor kYellow{0xfa, 0xcc, 0x15};     // Highlighter

// Eraser preview colors, matched to the surface backdrop
inline const QColor kPaperWhite{0xff, 0xff, 0xff};
inline const QColor kBoardBlack{0x00, 0x00, 0x00};
}  // namespace Palette

// ============================================================================
// INK (logical canvas units)
// ============================================================================
namespace Ink {
constexpr qreal kHighlighterOpacity = 0.4;
constexpr qreal kOpaque = 1.0;

constexpr qreal kMarkupMarkerWidth = 4.0;
constexpr qreal kWhiteboardMarkerWidth = 3.0;
constexpr qreal kHighlighterWidth = 20.0;

// Shared eraser reach for every surface. The markup tool and the whiteboard
// used to disagree (15 vs 30); both now start from this value.
constexpr qreal kDefaultEraserRadius = 20.0;
constexpr qreal kMinEraserRadius = 5.0;
constexpr qreal kMaxEraserRadius = 100.0;

constexpr qreal kMinStrokeWidth = 1.0;
constexpr qreal kMaxStrokeWidth = 100.0;
}  // namespace Ink

// ============================================================================
// SURFACE SIZES (logical pixels)
// ============================================================================
namespace Surface {
// Image markup fits inside 80% x 70% of a 1920x1080 display
inline constexpr QSize kMarkupMaxSize{1536, 756};
inline constexpr QSize kMarkupBlankSize{800, 600};

// Whiteboard backgrounds are capped in width only
constexpr int kWhiteboardMaxWidth = 2000;
inline constexpr QSize kWhiteboardBlankSize{1600, 160};
}  // namespace Surface

// ============================================================================
// BOUNDS
// ============================================================================
namespace Bounds {
constexpr double kMinZoom = 0.1;
constexpr double kMaxZoom = 5.0;
}  // namespace Bounds

// ============================================================================
// ENCODING & QUALITY
// ============================================================================
namespace Encoding {
constexpr int kJpegQualityDefault = 90;
constexpr int kWebPQualityDefault = 80;
constexpr int kQualityMin = 0;
constexpr int kQualityMax = 100;
}  // namespace Encoding

}  // namespace ArchiNotes

#endif // ARCHINOTES_CONSTANTS_H
