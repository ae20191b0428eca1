#include "Config.hpp"
#include "Logger.hpp"
#include <QtCore/QDir>
#include <QtCore/QFileInfo>

namespace MomentNav {

Config& Config::instance() {
    static Config instance;
    return instance;
}

void Config::initialize(const QString& organizationName, const QString& applicationName) {
    settings_ = std::make_unique<QSettings>(organizationName, applicationName);
    ensureDirectoriesExist();
    MOMENTNAV_DEBUG("Config initialized for {}/{}", 
                    organizationName.toStdString(), applicationName.toStdString());
}

void Config::initializeWithFile(const QString& iniFilePath) {
    settings_ = std::make_unique<QSettings>(iniFilePath, QSettings::IniFormat);
    MOMENTNAV_DEBUG("Config initialized from {}", iniFilePath.toStdString());
}

QVariant Config::getValue(const QString& key, const QVariant& defaultValue) const {
    if (!settings_) return defaultValue;
    return settings_->value(key, defaultValue);
}

void Config::setValue(const QString& key, const QVariant& value) {
    if (settings_) {
        settings_->setValue(key, value);
    }
}

QString Config::getString(const QString& key, const QString& defaultValue) const {
    return getValue(key, defaultValue).toString();
}

QStringList Config::getStringList(const QString& key, const QStringList& defaultValue) const {
    return getValue(key, defaultValue).toStringList();
}

bool Config::getBool(const QString& key, bool defaultValue) const {
    return getValue(key, defaultValue).toBool();
}

QStringList Config::defaultSubtitleExtensions() {
    return {"srt", "txt", "vtt"};
}

QStringList Config::defaultVideoExtensions() {
    return {"mp4", "mkv", "avi", "mov", "m4v", "wmv", "webm", "mpg", "mpeg"};
}

Config::LibrarySettings Config::getLibrarySettings() const {
    LibrarySettings settings;
    settings.mediaDirectories = getStringList("library/mediaDirectories");
    settings.subtitleExtensions = getStringList("library/subtitleExtensions", defaultSubtitleExtensions());
    settings.videoExtensions = getStringList("library/videoExtensions", defaultVideoExtensions());
    // Empty means the normalizer's built-in list
    settings.noiseTokens = getStringList("library/noiseTokens");
    settings.skipHiddenEntries = getBool("library/skipHiddenEntries", true);
    return settings;
}

Config::PlayerSettings Config::getPlayerSettings() const {
    PlayerSettings settings;
    settings.launcher = getString("player/launcher", "mpc-hc");
    settings.executablePath = getString("player/executablePath");
    settings.fallbackToDefault = getBool("player/fallbackToDefault", true);
    return settings;
}

Config::EditorSettings Config::getEditorSettings() const {
    EditorSettings settings;
    settings.editor = getString("editor/name", "shotcut");
    settings.executablePath = getString("editor/executablePath");
    return settings;
}

Config::UISettings Config::getUISettings() const {
    UISettings settings;
    settings.lastShow = getString("ui/lastShow");
    settings.lastQuery = getString("ui/lastQuery");
    settings.hotkey = getString("ui/hotkey", "Ctrl+Alt+M");
    return settings;
}

void Config::setLibrarySettings(const LibrarySettings& settings) {
    setValue("library/mediaDirectories", settings.mediaDirectories);
    setValue("library/subtitleExtensions", settings.subtitleExtensions);
    setValue("library/videoExtensions", settings.videoExtensions);
    setValue("library/noiseTokens", settings.noiseTokens);
    setValue("library/skipHiddenEntries", settings.skipHiddenEntries);
}

void Config::setPlayerSettings(const PlayerSettings& settings) {
    setValue("player/launcher", settings.launcher);
    setValue("player/executablePath", settings.executablePath);
    setValue("player/fallbackToDefault", settings.fallbackToDefault);
}

void Config::setEditorSettings(const EditorSettings& settings) {
    setValue("editor/name", settings.editor);
    setValue("editor/executablePath", settings.executablePath);
}

void Config::setUISettings(const UISettings& settings) {
    setValue("ui/lastShow", settings.lastShow);
    setValue("ui/lastQuery", settings.lastQuery);
    setValue("ui/hotkey", settings.hotkey);
}

bool Config::addMediaDirectory(const QString& path) {
    const QString absolute = QDir::cleanPath(QFileInfo(path).absoluteFilePath());
    QStringList directories = getStringList("library/mediaDirectories");
    if (directories.contains(absolute)) {
        return false;
    }
    directories.append(absolute);
    setValue("library/mediaDirectories", directories);
    MOMENTNAV_INFO("Media directory added: {}", absolute.toStdString());
    return true;
}

bool Config::removeMediaDirectory(const QString& path) {
    const QString absolute = QDir::cleanPath(QFileInfo(path).absoluteFilePath());
    QStringList directories = getStringList("library/mediaDirectories");
    if (directories.removeAll(absolute) == 0) {
        return false;
    }
    setValue("library/mediaDirectories", directories);
    MOMENTNAV_INFO("Media directory removed: {}", absolute.toStdString());
    return true;
}

QString Config::getDataPath() const {
    return QStandardPaths::writableLocation(QStandardPaths::AppDataLocation);
}

QString Config::getCachePath() const {
    return QStandardPaths::writableLocation(QStandardPaths::CacheLocation);
}

QString Config::getLogFilePath() const {
    return getDataPath() + "/momentnav.log";
}

void Config::sync() {
    if (settings_) {
        settings_->sync();
    }
}

void Config::ensureDirectoriesExist() {
    const QStringList paths = {
        getDataPath(),
        getCachePath()
    };
    
    for (const QString& path : paths) {
        QDir dir;
        if (!dir.mkpath(path)) {
            MOMENTNAV_WARN("Failed to create directory: {}", path.toStdString());
        }
    }
}

} // namespace MomentNav
