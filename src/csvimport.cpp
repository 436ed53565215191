#include "csvimport.h"
#include <QFile>
#include <QFileInfo>
#include <QDebug>

namespace tbx {

// ── Table styling ──

static BorderLine line(int width, const char* color) {
    BorderLine b;
    b.width = width;
    b.color = QColor(QString::fromLatin1(color));
    b.style = BorderLineStyle::Solid;
    return b;
}

static CellFormatting headerStyle() {
    CellFormatting f;
    f.bold      = true;
    f.fillColor = QColor(QStringLiteral("#e3f2fd"));
    BorderStyle b;
    b.top    = line(1, "#1976d2");
    b.right  = line(1, "#1976d2");
    b.bottom = line(2, "#1976d2");
    b.left   = line(1, "#1976d2");
    f.border    = b;
    f.textAlign = TextAlign::Center;
    return f;
}

static CellFormatting dataStyle() {
    CellFormatting f;
    BorderStyle b;
    b.top = b.right = b.bottom = b.left = line(1, "#90caf9");
    f.border = b;
    return f;
}

// ── Parsing ──

QChar detectDelimiter(const QString& content) {
    int eol = content.indexOf(QLatin1Char('\n'));
    QString first = eol < 0 ? content : content.left(eol);
    if (first.endsWith(QLatin1Char('\r'))) first.chop(1);

    static const QChar kCandidates[] = {
        QLatin1Char(','), QLatin1Char(';'), QLatin1Char('\t'), QLatin1Char('|')
    };
    QChar best = QLatin1Char(',');
    int bestCount = 0;
    for (QChar c : kCandidates) {
        int n = first.count(c);
        if (n > bestCount) {
            bestCount = n;
            best = c;
        }
    }
    return best;
}

QStringList parseCsvRecord(const QString& content, int* pos, QChar delimiter) {
    QStringList values;
    QString current;
    bool quoted = false;
    int i = *pos;
    const int n = content.size();

    while (i < n) {
        const QChar ch = content.at(i);
        if (ch == QLatin1Char('"')) {
            if (quoted && i + 1 < n && content.at(i + 1) == QLatin1Char('"')) {
                current += QLatin1Char('"');
                i += 2;
                continue;
            }
            quoted = !quoted;
            i++;
            continue;
        }
        if (!quoted && ch == delimiter) {
            values.append(current);
            current.clear();
            i++;
            continue;
        }
        if (!quoted && (ch == QLatin1Char('\n') || ch == QLatin1Char('\r'))) {
            if (ch == QLatin1Char('\r') && i + 1 < n && content.at(i + 1) == QLatin1Char('\n'))
                i++;
            i++;
            break;
        }
        current += ch;
        i++;
    }
    values.append(current);
    *pos = i;
    return values;
}

static bool isBlankRecord(const QStringList& values) {
    return values.size() == 1 && values.first().trimmed().isEmpty();
}

CsvImportResult parseCsv(const QString& content, const CsvOptions& opts, const ValueParserFn& parse) {
    CsvImportResult result;
    const QChar delim = opts.autoDetect ? detectDelimiter(content) : opts.delimiter;
    const int startRow = qMax(0, opts.startRow);
    const int startCol = qMax(0, opts.startCol);

    QString text = content;
    if (text.startsWith(QChar(0xFEFF))) text.remove(0, 1);

    bool headerPending = opts.hasHeader;
    int written = 0;
    int widest = 0;
    int pos = 0;

    while (pos < text.size()) {
        const QStringList values = parseCsvRecord(text, &pos, delim);
        if (opts.skipEmptyLines && isBlankRecord(values))
            continue;

        const int targetRow = startRow + written;
        widest = qMax(widest, int(values.size()));

        if (headerPending) {
            headerPending = false;
            for (int c = 0; c < values.size(); c++) {
                const QString v = opts.trimValues ? values[c].trimmed() : values[c];
                result.headers.append(v);
                Cell cell;
                cell.value = parse(v);
                if (opts.applyTableStyle)
                    cell.formatting = headerStyle();
                result.cells.append({targetRow, startCol + c, cell});
            }
            written++;
            continue;
        }

        for (int c = 0; c < values.size(); c++) {
            const QString v = opts.trimValues ? values[c].trimmed() : values[c];
            if (v.isEmpty() && opts.skipEmptyLines)
                continue;
            Cell cell;
            cell.value = parse(v);
            if (opts.applyTableStyle)
                cell.formatting = dataStyle();
            result.cells.append({targetRow, startCol + c, cell});
        }
        written++;
    }

    result.rowCount = written;
    result.colCount = widest;

    if (opts.applyTableStyle && written > 0) {
        TableRegion r;
        r.startRow  = startRow;
        r.startCol  = startCol;
        r.endRow    = startRow + written - 1;
        r.endCol    = startCol + qMax(1, widest) - 1;
        r.hasHeader = opts.hasHeader;
        r.headerRow = opts.hasHeader ? startRow : -1;
        result.region = r;
    }
    return result;
}

CsvReadResult readCsvFile(const QString& path) {
    CsvReadResult r;
    QFile f(path);
    if (!f.open(QIODevice::ReadOnly)) {
        r.error = QStringLiteral("Cannot open %1: %2").arg(QFileInfo(path).fileName(), f.errorString());
        qWarning() << "CsvImport:" << r.error;
        return r;
    }
    r.content = QString::fromUtf8(f.readAll());
    r.ok = true;
    return r;
}

} // namespace tbx
