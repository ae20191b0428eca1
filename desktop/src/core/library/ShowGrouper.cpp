#include "ShowGrouper.hpp"

#include <QtCore/QDir>
#include <QtCore/QFileInfo>

namespace MomentNav {

QString TopLevelFolderGrouper::showNameFor(const ScannedFile& file) const {
    const QString relative = QDir(file.root).relativeFilePath(file.path);
    if (relative.isEmpty() || relative.startsWith("..")) {
        return QString();
    }

    const int separator = relative.indexOf(QChar('/'));
    if (separator < 0) {
        return QFileInfo(QDir::cleanPath(file.root)).fileName();
    }
    return relative.left(separator);
}

} // namespace MomentNav
