#include "annotation/AnnotationProfile.h"
#include "Constants.h"

AnnotationProfile AnnotationProfile::imageMarkup()
{
    AnnotationProfile profile;
    profile.name = QStringLiteral("markup");
    profile.defaultTool = ToolId::Marker;
    profile.defaultColor = ArchiNotes::Palette::kRed;
    profile.highlighterColor = ArchiNotes::Palette::kYellow;
    profile.markerWidth = ArchiNotes::Ink::kMarkupMarkerWidth;
    profile.highlighterWidth = ArchiNotes::Ink::kHighlighterWidth;
    profile.eraserRadius = ArchiNotes::Ink::kDefaultEraserRadius;
    profile.eraserPreviewColor = ArchiNotes::Palette::kPaperWhite;
    profile.maxLogicalSize = ArchiNotes::Surface::kMarkupMaxSize;
    profile.blankLogicalSize = ArchiNotes::Surface::kMarkupBlankSize;
    profile.keepStrokesOnBackgroundChange = false;
    return profile;
}

AnnotationProfile AnnotationProfile::whiteboard()
{
    AnnotationProfile profile;
    profile.name = QStringLiteral("whiteboard");
    profile.defaultTool = ToolId::Marker;
    profile.defaultColor = ArchiNotes::Palette::kRed;
    profile.highlighterColor = ArchiNotes::Palette::kYellow;
    profile.markerWidth = ArchiNotes::Ink::kWhiteboardMarkerWidth;
    profile.highlighterWidth = ArchiNotes::Ink::kHighlighterWidth;
    profile.eraserRadius = ArchiNotes::Ink::kDefaultEraserRadius;
    profile.eraserPreviewColor = ArchiNotes::Palette::kBoardBlack;
    profile.maxLogicalSize = QSize(ArchiNotes::Surface::kWhiteboardMaxWidth, 0);
    profile.blankLogicalSize = ArchiNotes::Surface::kWhiteboardBlankSize;
    profile.keepStrokesOnBackgroundChange = true;
    return profile;
}

bool AnnotationProfile::isValid() const
{
    return !name.isEmpty()
        && defaultColor.isValid()
        && markerWidth > 0
        && highlighterWidth > 0
        && eraserRadius > 0
        && !blankLogicalSize.isEmpty();
}
