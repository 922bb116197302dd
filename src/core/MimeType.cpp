#include "MimeType.h"
#include <QFileInfo>
#include <QMimeDatabase>
#include <QMimeType>
#include <QString>

namespace FileToolkit
{
    std::optional<std::string> detectMimeType(const std::string& path)
    {
        QFileInfo info(QString::fromStdString(path));
        if (!info.exists()) {
            return std::nullopt;
        }

        // Looks at both the file name and its leading bytes
        QMimeDatabase db;
        QMimeType type = db.mimeTypeForFile(info, QMimeDatabase::MatchDefault);
        if (!type.isValid() || type.name().isEmpty()) {
            return std::nullopt;
        }
        return type.name().toStdString();
    }

} // namespace FileToolkit
