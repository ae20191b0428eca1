#pragma once

#include <QtCore/QString>

#include "../common/Expected.hpp"
#include "../media/MediaProbe.hpp"

namespace MomentNav {

enum class EditorError {
    UnknownEditor,
    NotReady,
    MediaNotFound,
    InvalidClipRange,
    FrameRateUnavailable,
    WriteFailed,
    StartFailed
};

QString editorErrorToString(EditorError error);

// A stretch of a media file to bring into an editor, usually one cue
struct ClipRequest {
    QString mediaPath;
    qint64 inTime = 0;      // milliseconds
    qint64 outTime = 0;     // milliseconds
    QString label;
};

/**
 * @brief Capabilities shared by every supported video editor
 *
 * One implementation exists per editor; EditorRegistry maps editor names
 * to them.
 */
class EditorIntegration {
public:
    virtual ~EditorIntegration() = default;
    
    virtual QString name() const = 0;
    virtual QString displayName() const = 0;
    
    // The editor can be started from here
    virtual bool isReady() const = 0;
    
    virtual Expected<void, EditorError> importMedia(const QString& mediaPath) = 0;
    
    // Returns the path of the clip description handed to the editor
    virtual Expected<QString, EditorError> importClip(const ClipRequest& clip) = 0;
    
    virtual Expected<FrameRate, EditorError> detectFrameRate(const QString& mediaPath) const = 0;
};

} // namespace MomentNav
