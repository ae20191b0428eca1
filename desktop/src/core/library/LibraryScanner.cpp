#include "LibraryScanner.hpp"
#include "../common/Logger.hpp"

#include <QtCore/QDir>
#include <QtCore/QDirIterator>
#include <QtCore/QFileInfo>
#include <algorithm>

namespace MomentNav {

LibraryScanner::LibraryScanner(bool skipHiddenEntries)
    : skipHiddenEntries_(skipHiddenEntries) {
}

ScanResult LibraryScanner::scan(const QStringList& roots) const {
    ScanResult result;
    
    for (const QString& root : roots) {
        auto files = scanRoot(root);
        if (files.hasError()) {
            MOMENTNAV_WARN("Skipping media directory {}: {}", root.toStdString(),
                           libraryErrorToString(files.error()).toStdString());
            result.failedRoots.append(qMakePair(root, files.error()));
            continue;
        }
        result.files.append(files.value());
    }
    
    MOMENTNAV_INFO("Scanned {} media directories, {} files", 
                   roots.size() - result.failedRoots.size(), result.files.size());
    return result;
}

Expected<QList<ScannedFile>, LibraryError> LibraryScanner::scanRoot(const QString& root) const {
    QFileInfo rootInfo(root);
    if (!rootInfo.exists() || !rootInfo.isDir()) {
        return makeUnexpected(LibraryError::RootNotFound);
    }
    if (!rootInfo.isReadable()) {
        return makeUnexpected(LibraryError::RootNotReadable);
    }
    
    const QString absoluteRoot = QDir::cleanPath(rootInfo.absoluteFilePath());
    
    QDir::Filters filters = QDir::Files | QDir::Dirs | QDir::NoDotAndDotDot;
    if (!skipHiddenEntries_) {
        filters |= QDir::Hidden;
    }
    
    QStringList paths;
    QDirIterator iterator(absoluteRoot, filters, QDirIterator::Subdirectories);
    while (iterator.hasNext()) {
        const QString filePath = iterator.next();
        const QFileInfo fileInfo = iterator.fileInfo();
        if (fileInfo.isFile()) {
            paths.append(filePath);
        }
    }
    
    // QDirIterator order is filesystem dependent
    std::sort(paths.begin(), paths.end());
    
    QList<ScannedFile> files;
    files.reserve(paths.size());
    for (const QString& path : paths) {
        files.append({absoluteRoot, path});
    }
    
    MOMENTNAV_DEBUG("Found {} files under {}", files.size(), absoluteRoot.toStdString());
    return files;
}

} // namespace MomentNav
