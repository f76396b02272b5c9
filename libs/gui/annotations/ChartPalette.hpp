#pragma once
#include <QColor>

namespace Vantage::ChartPalette {

// Semantic line colors; fixed so the chart reads the same on every render.
inline QColor support()              { return QColor(0xFF, 0x00, 0x00); }  // red
inline QColor resistance()           { return QColor(0x00, 0x64, 0x00); }  // dark green
inline QColor longTrigger()          { return QColor(0x32, 0xCD, 0x32); }  // lime green
inline QColor shortTrigger()         { return QColor(0xFF, 0x63, 0x47); }  // tomato
inline QColor trailingStopRaw()      { return QColor(0x1E, 0x90, 0xFF); }  // dodger blue
inline QColor trailingStopBuffered() { return QColor(0x00, 0xBF, 0xFF); }  // deep sky blue
inline QColor positiveGreen()        { return QColor(0x00, 0x80, 0x00); }
inline QColor negativeDarkRed()      { return QColor(0x80, 0x00, 0x00); }

inline QColor closeLine()            { return QColor(75, 192, 192); }
inline QColor highLine()             { return QColor(54, 162, 235); }
inline QColor lowLine()              { return QColor(255, 99, 132); }
inline QColor band()                 { return QColor(75, 192, 192, 40); }
inline QColor grid()                 { return QColor(0, 0, 0, 25); }
inline QColor text()                 { return QColor(40, 40, 40); }

} // namespace Vantage::ChartPalette
