#pragma once

#include <QtCore/QString>

#include "LibraryTypes.hpp"

namespace MomentNav {

/**
 * @brief Decides which show a scanned file belongs to
 *
 * Grouping is supplied by the caller; the library only consumes the
 * decision. An empty name leaves the file out of every show.
 */
class ShowGrouper {
public:
    virtual ~ShowGrouper() = default;
    virtual QString showNameFor(const ScannedFile& file) const = 0;
};

// Show = first folder below the media directory. Files lying directly in
// the media directory form a show named after that directory.
class TopLevelFolderGrouper : public ShowGrouper {
public:
    QString showNameFor(const ScannedFile& file) const override;
};

} // namespace MomentNav
