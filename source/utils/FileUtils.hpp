#ifndef TODOLIST_UTILS_FILEUTILS_HPP
#define TODOLIST_UTILS_FILEUTILS_HPP

#include <QByteArray>
#include <QSaveFile>
#include <QString>

// Writes to a temporary file beside `path` and renames it over `path` on commit,
// so readers only ever see the old or the new content.
inline bool writeAtomically(const QString &path, const QByteArray &bytes,
                            QString *outError = nullptr) {
    QSaveFile file(path);

    if (!file.open(QIODevice::WriteOnly)) {
        if (outError) {
            *outError = QString("cannot open '%1' for writing: %2").arg(path, file.errorString());
        }
        return false;
    }

    if (file.write(bytes) != bytes.size()) {
        if (outError) {
            *outError = QString("write to '%1' failed: %2").arg(path, file.errorString());
        }
        file.cancelWriting();
        return false;
    }

    if (!file.commit()) {
        if (outError) {
            *outError = QString("cannot replace '%1': %2").arg(path, file.errorString());
        }
        return false;
    }

    return true;
}

#endif // TODOLIST_UTILS_FILEUTILS_HPP
