#include "SeasonManifest.hpp"
#include <QFile>
#include <QStringList>
#include <optional>
#include <utility>

using namespace mediarelay;

bool parseSeasonManifest(const QString &text, std::vector<TransferTask> &out,
                         std::string &err) {
    std::optional<std::string> series;
    std::optional<std::string> season;
    std::vector<TransferTask> tasks;
    const QStringList lines = text.split('\n');
    for (int i = 0; i < lines.size(); ++i) {
        const QString line = lines[i].trimmed();
        if (line.isEmpty())
            continue;
        if (line.startsWith('#')) {
            const QString body = line.mid(1).trimmed();
            if (body.startsWith("series:", Qt::CaseInsensitive)) {
                const QString v = body.mid(7).trimmed();
                series = v.isEmpty() ? std::nullopt
                                     : std::optional<std::string>(v.toStdString());
            } else if (body.startsWith("season:", Qt::CaseInsensitive)) {
                const QString v = body.mid(7).trimmed();
                season = v.isEmpty() ? std::nullopt
                                     : std::optional<std::string>(v.toStdString());
            }
            continue;
        }
        QString locText = line;
        QString title;
        const int bar = line.indexOf('|');
        if (bar >= 0) {
            locText = line.left(bar).trimmed();
            title = line.mid(bar + 1).trimmed();
        }
        ObjectLocator loc;
        std::string locErr;
        if (!parseLocator(locText.toStdString(), loc, locErr)) {
            err = "line " + std::to_string(i + 1) + ": " + locErr;
            return false;
        }
        TransferTask t = makeTask(loc, PriorityClass::Bulk);
        t.groupContext = series;
        t.groupDetail = season;
        if (!title.isEmpty())
            t.itemTitle = title.toStdString();
        tasks.push_back(std::move(t));
    }
    out = std::move(tasks);
    return true;
}

bool loadSeasonManifest(const QString &path, std::vector<TransferTask> &out,
                        std::string &err) {
    QFile f(path);
    if (!f.open(QIODevice::ReadOnly | QIODevice::Text)) {
        err = "Could not open manifest " + path.toStdString() + ": " +
              f.errorString().toStdString();
        return false;
    }
    return parseSeasonManifest(QString::fromUtf8(f.readAll()), out, err);
}
