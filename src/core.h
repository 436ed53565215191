#pragma once
#include <QString>
#include <QStringList>
#include <QVariant>
#include <QVector>
#include <QHash>
#include <QSet>
#include <QColor>
#include <QDateTime>
#include <cstdint>
#include <functional>
#include <optional>

namespace tbx {

// ── Cell value type ──

enum class CellType : uint8_t {
    Text, Number, Boolean,
    Date, DateTime, Time, Duration,
    Percentage, Currency,
    Email, Phone, Uri, Guid
};

// ── Type metadata table (single source of truth) ──

struct TypeMeta {
    CellType    type;
    const char* name;         // serialized name: "datetime"
    const char* displayName;  // UI name: "Date & Time"
    bool        numeric;      // normalized value is a double
    bool        temporal;     // normalized value is a QDateTime
};

inline constexpr TypeMeta kTypeMeta[] = {
    // type                   name          displayName     num    temporal
    {CellType::Text,       "text",       "Text",         false, false},
    {CellType::Number,     "number",     "Number",       true,  false},
    {CellType::Boolean,    "boolean",    "Boolean",      false, false},
    {CellType::Date,       "date",       "Date",         false, true },
    {CellType::DateTime,   "datetime",   "Date & Time",  false, true },
    {CellType::Time,       "time",       "Time",         false, false},
    {CellType::Duration,   "duration",   "Duration",     false, false},
    {CellType::Percentage, "percentage", "Percentage",   true,  false},
    {CellType::Currency,   "currency",   "Currency",     true,  false},
    {CellType::Email,      "email",      "Email",        false, false},
    {CellType::Phone,      "phone",      "Phone",        false, false},
    {CellType::Uri,        "uri",        "URI",          false, false},
    {CellType::Guid,       "guid",       "GUID",         false, false},
};

inline constexpr const TypeMeta* typeMeta(CellType t) {
    for (const auto& m : kTypeMeta)
        if (m.type == t) return &m;
    return nullptr;
}

inline constexpr bool isNumericType(CellType t)  { auto* m = typeMeta(t); return m && m->numeric; }
inline constexpr bool isTemporalType(CellType t) { auto* m = typeMeta(t); return m && m->temporal; }

inline const char* typeToString(CellType t) {
    auto* m = typeMeta(t);
    return m ? m->name : "text";
}

inline QString typeDisplayName(CellType t) {
    auto* m = typeMeta(t);
    return m ? QString::fromLatin1(m->displayName) : QStringLiteral("Text");
}


// ── CellValue ──

struct CellValue {
    CellType type = CellType::Text;
    QVariant value;           // QString | double | bool | QDateTime
    QString  rawText;         // original user input
    QString  detectedFormat;  // display pattern recognised at parse time, may be empty

    bool operator==(const CellValue& o) const {
        return type == o.type && value == o.value
            && rawText == o.rawText && detectedFormat == o.detectedFormat;
    }
    bool operator!=(const CellValue& o) const { return !(*this == o); }
};

// ── Formatting ──

enum class BorderLineStyle : uint8_t { Solid, Dashed, Dotted };

struct BorderLine {
    int             width = 1;
    QColor          color;
    BorderLineStyle style = BorderLineStyle::Solid;

    bool operator==(const BorderLine& o) const {
        return width == o.width && color == o.color && style == o.style;
    }
    bool operator!=(const BorderLine& o) const { return !(*this == o); }
};

struct BorderStyle {
    std::optional<BorderLine> top;
    std::optional<BorderLine> right;
    std::optional<BorderLine> bottom;
    std::optional<BorderLine> left;

    bool operator==(const BorderStyle& o) const {
        return top == o.top && right == o.right && bottom == o.bottom && left == o.left;
    }
    bool operator!=(const BorderStyle& o) const { return !(*this == o); }
};

enum class TextAlign : uint8_t { Left, Center, Right };

// Every field is optional so the same struct doubles as a partial patch
// for GridController::format().
struct CellFormatting {
    std::optional<QString>     fontFamily;
    std::optional<int>         fontSize;
    std::optional<bool>        bold;
    std::optional<bool>        italic;
    std::optional<bool>        underline;
    std::optional<QColor>      textColor;
    std::optional<QColor>      fillColor;
    std::optional<BorderStyle> border;
    std::optional<TextAlign>   textAlign;
    std::optional<QString>     dateFormat;
    std::optional<QString>     numberFormat;

    // Overlay every field that is set in |patch|.
    void merge(const CellFormatting& patch) {
        if (patch.fontFamily)   fontFamily   = patch.fontFamily;
        if (patch.fontSize)     fontSize     = patch.fontSize;
        if (patch.bold)         bold         = patch.bold;
        if (patch.italic)       italic       = patch.italic;
        if (patch.underline)    underline    = patch.underline;
        if (patch.textColor)    textColor    = patch.textColor;
        if (patch.fillColor)    fillColor    = patch.fillColor;
        if (patch.border)       border       = patch.border;
        if (patch.textAlign)    textAlign    = patch.textAlign;
        if (patch.dateFormat)   dateFormat   = patch.dateFormat;
        if (patch.numberFormat) numberFormat = patch.numberFormat;
    }

    bool isBold() const { return bold.value_or(false); }

    bool operator==(const CellFormatting& o) const {
        return fontFamily == o.fontFamily && fontSize == o.fontSize
            && bold == o.bold && italic == o.italic && underline == o.underline
            && textColor == o.textColor && fillColor == o.fillColor
            && border == o.border && textAlign == o.textAlign
            && dateFormat == o.dateFormat && numberFormat == o.numberFormat;
    }
    bool operator!=(const CellFormatting& o) const { return !(*this == o); }
};

// ── Cell ──

struct Cell {
    CellValue                     value;
    std::optional<CellFormatting> formatting;

    bool operator==(const Cell& o) const { return value == o.value && formatting == o.formatting; }
    bool operator!=(const Cell& o) const { return !(*this == o); }
};

// ── Coordinates ──

struct GridPos {
    int row = 0;
    int col = 0;

    bool operator==(const GridPos& o) const { return row == o.row && col == o.col; }
    bool operator!=(const GridPos& o) const { return !(*this == o); }
};

// Packed (row, col) key shared by every cell-keyed hash in the engine.
inline constexpr quint64 cellKey(int row, int col) {
    return (quint64(quint32(row)) << 32) | quint64(quint32(col));
}
inline constexpr int keyRow(quint64 key) { return int(quint32(key >> 32)); }
inline constexpr int keyCol(quint64 key) { return int(quint32(key & 0xFFFFFFFFu)); }

// ── Selection ──

enum class SelectionType : uint8_t { Cell, Row, Column };

struct SelectionRange {
    GridPos anchor;   // fixed corner
    GridPos cursor;   // moving corner

    int top()    const { return qMin(anchor.row, cursor.row); }
    int bottom() const { return qMax(anchor.row, cursor.row); }
    int left()   const { return qMin(anchor.col, cursor.col); }
    int right()  const { return qMax(anchor.col, cursor.col); }

    bool operator==(const SelectionRange& o) const { return anchor == o.anchor && cursor == o.cursor; }
    bool operator!=(const SelectionRange& o) const { return !(*this == o); }
};

// ── Table region ──

enum class SortDirection : uint8_t { None, Ascending, Descending };

struct TableRegion {
    QString id;
    int     startRow  = 0;
    int     startCol  = 0;
    int     endRow    = 0;
    int     endCol    = 0;
    int     headerRow = -1;
    bool    hasHeader = false;

    int           sortColumn    = -1;
    SortDirection sortDirection = SortDirection::None;

    // column -> display strings a row must match to stay visible
    QHash<int, QSet<QString>> filters;

    int  firstDataRow() const { return hasHeader ? headerRow + 1 : startRow; }
    bool containsColumn(int col) const { return col >= startCol && col <= endCol; }
    bool containsDataRow(int row) const { return row >= firstDataRow() && row <= endRow; }
    bool isHeaderCell(int row, int col) const {
        return hasHeader && row == headerRow && containsColumn(col);
    }
};

// ── Batches ──

struct CellEntry {
    int  row = 0;
    int  col = 0;
    Cell cell;
};
using CellBatch = QVector<CellEntry>;

struct RawCellUpdate {
    int     row = 0;
    int     col = 0;
    QString text;
};

// ── Collaborator seams ──

using ValueParserFn      = std::function<CellValue(const QString& rawText)>;
using DisplayFormatterFn = std::function<QString(const CellValue& value, const CellFormatting* formatting)>;

struct ValueServices {
    ValueParserFn      parse;
    DisplayFormatterFn display;

    QString displayOf(const Cell& cell) const {
        return display(cell.value, cell.formatting ? &*cell.formatting : nullptr);
    }

    static ValueServices defaults();
};

// ── Type inference forward declarations ──

namespace infer {
    CellValue inferValue(const QString& rawText);
    QString   detectDateFormat(const QString& text);
} // namespace infer

// ── Format function forward declarations ──

namespace fmt {
    QString displayString(const CellValue& value, const CellFormatting* formatting = nullptr);
    QString formatDate(const QDateTime& dt, const QString& pattern, bool includeTime);
    QString formatNumber(double v);
    QString columnLabel(int col);
    QStringList dateFormatPatterns();
} // namespace fmt

} // namespace tbx
