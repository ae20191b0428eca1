#pragma once

#include <QtCore/QList>
#include <QtCore/QPair>
#include <QtCore/QString>
#include <QtCore/QStringList>

#include "../common/Expected.hpp"
#include "LibraryTypes.hpp"

namespace MomentNav {

struct ScanResult {
    QList<ScannedFile> files;
    QList<QPair<QString, LibraryError>> failedRoots;
};

/**
 * @brief Default directory enumeration for registered media directories
 *
 * Produces the flat file list the library consumes. Roots are walked
 * recursively in a stable (sorted) order; a missing root is reported and
 * the remaining roots are still scanned.
 */
class LibraryScanner {
public:
    explicit LibraryScanner(bool skipHiddenEntries = true);

    ScanResult scan(const QStringList& roots) const;
    Expected<QList<ScannedFile>, LibraryError> scanRoot(const QString& root) const;

private:
    bool skipHiddenEntries_;
};

} // namespace MomentNav
