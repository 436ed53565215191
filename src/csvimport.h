#pragma once
#include "core.h"

namespace tbx {

struct CsvOptions {
    QChar delimiter      = QLatin1Char(',');
    bool  autoDetect     = false;   // pick the delimiter from the first line
    bool  hasHeader      = false;
    int   startRow       = 0;
    int   startCol       = 0;
    bool  trimValues     = true;
    bool  skipEmptyLines = true;    // also skips empty values
    bool  applyTableStyle = false;  // style cells and emit a table region
};

struct CsvImportResult {
    CellBatch                  cells;
    int                        rowCount = 0;   // records written, header included
    int                        colCount = 0;
    QStringList                headers;
    std::optional<TableRegion> region;
};

struct CsvReadResult {
    bool    ok = false;
    QString content;
    QString error;
};

// Most frequent of , ; TAB | on the first line; ',' on a tie.
QChar detectDelimiter(const QString& content);

// Quoted fields may contain the delimiter, newlines and "" escapes.
QStringList parseCsvRecord(const QString& content, int* pos, QChar delimiter);

CsvImportResult parseCsv(const QString& content, const CsvOptions& opts,
                         const ValueParserFn& parse = &infer::inferValue);

CsvReadResult readCsvFile(const QString& path);

} // namespace tbx
