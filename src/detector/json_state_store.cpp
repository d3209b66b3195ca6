#include "detector/json_state_store.hpp"

#include <utility>

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QSaveFile>

#include <nlohmann/json.hpp>

#include "common/errors.hpp"
#include "common/json_utils.hpp"

namespace driftwatch {

namespace {

QString toQtPath(const std::filesystem::path &path)
{
    return QFile::decodeName(QByteArray::fromStdString(path.string()));
}

} // namespace

JsonStateStore::JsonStateStore(std::filesystem::path path)
    : m_path(std::move(path))
{
}

std::optional<Snapshot> JsonStateStore::load()
{
    QFile file(toQtPath(m_path));
    if (!file.exists()) {
        return std::nullopt;
    }
    if (!file.open(QIODevice::ReadOnly)) {
        throw StateLoadFailure("cannot open " + m_path.string() + ": "
                               + file.errorString().toStdString());
    }

    const QByteArray data = file.readAll();
    try {
        return snapshotFromJson(nlohmann::json::parse(data.toStdString()));
    } catch (const nlohmann::json::exception &ex) {
        throw StateLoadFailure("malformed state in " + m_path.string() + ": " + ex.what());
    }
}

void JsonStateStore::save(const Snapshot &snapshot)
{
    const QString path = toQtPath(m_path);
    const QString parent = QFileInfo(path).absolutePath();
    if (!QDir().mkpath(parent)) {
        throw StateSaveFailure("cannot create state directory " + parent.toStdString());
    }

    QByteArray payload;
    try {
        payload = QByteArray::fromStdString(snapshotToJson(snapshot).dump(2));
    } catch (const nlohmann::json::exception &ex) {
        throw StateSaveFailure(std::string("cannot encode state: ") + ex.what());
    }

    QSaveFile file(path);
    if (!file.open(QIODevice::WriteOnly)) {
        throw StateSaveFailure("cannot open " + m_path.string() + ": "
                               + file.errorString().toStdString());
    }
    if (file.write(payload) != payload.size()) {
        const std::string reason = file.errorString().toStdString();
        file.cancelWriting();
        throw StateSaveFailure("cannot write " + m_path.string() + ": " + reason);
    }
    if (!file.commit()) {
        throw StateSaveFailure("cannot commit " + m_path.string() + ": "
                               + file.errorString().toStdString());
    }
}

const std::filesystem::path &JsonStateStore::location() const
{
    return m_path;
}

} // namespace driftwatch
