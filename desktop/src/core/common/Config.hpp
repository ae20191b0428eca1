#pragma once

#include <QtCore/QSettings>
#include <QtCore/QStandardPaths>
#include <QtCore/QString>
#include <QtCore/QStringList>
#include <QtCore/QVariant>
#include <memory>

namespace MomentNav {

class Config {
public:
    static Config& instance();
    
    void initialize(const QString& organizationName = "MomentNav",
                   const QString& applicationName = "MomentNavigator");
    
    // Settings stored in an explicit file, used by tests
    void initializeWithFile(const QString& iniFilePath);
    
    bool isInitialized() const { return settings_ != nullptr; }
    
    // General settings
    QVariant getValue(const QString& key, const QVariant& defaultValue = QVariant()) const;
    void setValue(const QString& key, const QVariant& value);
    
    // Typed convenience methods
    QString getString(const QString& key, const QString& defaultValue = QString()) const;
    QStringList getStringList(const QString& key, const QStringList& defaultValue = QStringList()) const;
    bool getBool(const QString& key, bool defaultValue = false) const;
    
    // Application-specific settings
    struct LibrarySettings {
        QStringList mediaDirectories;
        QStringList subtitleExtensions;
        QStringList videoExtensions;
        QStringList noiseTokens;
        bool skipHiddenEntries = true;
    };
    
    struct PlayerSettings {
        QString launcher = "mpc-hc";    // "mpc-hc", "mpv" or "default"
        QString executablePath;         // empty = search default locations
        bool fallbackToDefault = true;  // open with the desktop default when the player fails
    };
    
    struct EditorSettings {
        QString editor = "shotcut";
        QString executablePath;
    };
    
    struct UISettings {
        QString lastShow;
        QString lastQuery;
        QString hotkey = "Ctrl+Alt+M";
    };
    
    static QStringList defaultSubtitleExtensions();
    static QStringList defaultVideoExtensions();
    
    LibrarySettings getLibrarySettings() const;
    PlayerSettings getPlayerSettings() const;
    EditorSettings getEditorSettings() const;
    UISettings getUISettings() const;
    
    void setLibrarySettings(const LibrarySettings& settings);
    void setPlayerSettings(const PlayerSettings& settings);
    void setEditorSettings(const EditorSettings& settings);
    void setUISettings(const UISettings& settings);
    
    // Media directories are edited one at a time by the preferences UI
    bool addMediaDirectory(const QString& path);
    bool removeMediaDirectory(const QString& path);
    
    // Paths
    QString getDataPath() const;
    QString getCachePath() const;
    QString getLogFilePath() const;
    
    void sync();
    
private:
    Config() = default;
    std::unique_ptr<QSettings> settings_;
    
    void ensureDirectoriesExist();
};

} // namespace MomentNav
