#include "LandmarkStream.h"

#include <QDebug>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <QJsonValue>

LandmarkStream::LandmarkStream(QObject *parent)
    : QObject(parent)
{
    connect(&socket_, &QTcpSocket::connected,
            this, &LandmarkStream::onConnected);

    connect(&socket_, &QTcpSocket::disconnected,
            this, &LandmarkStream::onDisconnected);

    connect(&socket_, &QTcpSocket::readyRead,
            this, &LandmarkStream::onReadyRead);

    connect(&socket_,
            QOverload<QAbstractSocket::SocketError>::of(&QTcpSocket::errorOccurred),
            this, &LandmarkStream::onError);
}

void LandmarkStream::setEndpoint(const QString &host, quint16 port)
{
    host_ = host;
    port_ = port;
}

void LandmarkStream::start()
{
    if (socket_.state() != QAbstractSocket::UnconnectedState)
        socket_.abort();
    buffer_.clear();
    latest_.reset();
    pending_ = false;
    emit connectionStatusChanged(
        tr("Connecting to %1:%2").arg(host_).arg(port_));
    socket_.connectToHost(host_, port_);
}

void LandmarkStream::stop()
{
    if (socket_.state() != QAbstractSocket::UnconnectedState)
    {
        socket_.disconnectFromHost();
        if (socket_.state() != QAbstractSocket::UnconnectedState)
            socket_.waitForDisconnected(1000);
    }
    latest_.reset();
    pending_ = false;
    emit connectionStatusChanged(tr("Disconnected"));
}

bool LandmarkStream::isConnected() const
{
    return socket_.state() == QAbstractSocket::ConnectedState;
}

std::optional<LandmarkFrame> LandmarkStream::nextFrame(int timeoutMs)
{
    // Bounded wait; a slow tracker costs a skipped tick, never a stall.
    if (!pending_ && timeoutMs > 0 && isConnected())
        socket_.waitForReadyRead(timeoutMs);

    if (!pending_)
        return std::nullopt;

    pending_ = false;
    return latest_;
}

void LandmarkStream::onConnected()
{
    qInfo() << "[LandmarkStream] connected to" << host_ << port_;
    emit connectionStatusChanged(
        tr("Connected to %1:%2").arg(host_).arg(port_));
}

void LandmarkStream::onDisconnected()
{
    latest_.reset();
    pending_ = false;
    emit connectionStatusChanged(tr("Disconnected"));
}

void LandmarkStream::onError(QAbstractSocket::SocketError)
{
    qWarning() << "[LandmarkStream] socket error:" << socket_.errorString();
    emit connectionStatusChanged(tr("Connection error: %1")
                                     .arg(socket_.errorString()));
}

void LandmarkStream::onReadyRead()
{
    buffer_.append(socket_.readAll());

    while (true)
    {
        const int idx = buffer_.indexOf('\n');
        if (idx < 0)
            return;

        const QByteArray line = buffer_.left(idx).trimmed();
        buffer_.remove(0, idx + 1);
        if (!line.isEmpty())
            processLine(line);
    }
}

void LandmarkStream::processLine(const QByteArray &line)
{
    LandmarkFrame frame;
    bool hasHand = false;
    QString error;

    if (!parseMessage(line, &frame, &hasHand, &error))
    {
        // Only the first few of every hundred bad lines are logged.
        if (parseErrors_++ % 100 < 3)
            qWarning() << "[LandmarkStream] dropped message:" << error;
        return;
    }

    if (hasHand)
        latest_ = frame;
    else
        latest_.reset();
    pending_ = true;
}

static bool readPoint(const QJsonValue &val, Landmark *out)
{
    if (val.isArray())
    {
        const QJsonArray arr = val.toArray();
        if (arr.size() < 2)
            return false;
        out->x = float(arr[0].toDouble());
        out->y = float(arr[1].toDouble());
        out->z = arr.size() > 2 ? float(arr[2].toDouble()) : 0.0f;
        return true;
    }

    if (val.isObject())
    {
        const QJsonObject obj = val.toObject();
        if (!obj.contains("x") || !obj.contains("y"))
            return false;
        out->x = float(obj["x"].toDouble());
        out->y = float(obj["y"].toDouble());
        out->z = float(obj["z"].toDouble(0.0));
        return true;
    }

    return false;
}

bool LandmarkStream::parseMessage(const QByteArray &line,
                                  LandmarkFrame *frame,
                                  bool *hasHand,
                                  QString *error)
{
    auto fail = [error](const QString &msg)
    {
        if (error)
            *error = msg;
        return false;
    };

    QJsonParseError err;
    const QJsonDocument doc = QJsonDocument::fromJson(line, &err);
    if (err.error != QJsonParseError::NoError)
        return fail(QStringLiteral("JSON parse error: %1").arg(err.errorString()));
    if (!doc.isObject())
        return fail(QStringLiteral("message is not a JSON object"));

    const QJsonObject root = doc.object();
    const QJsonArray handsArr = root["hands"].toArray();

    // Prefer the right hand for cursor control, fall back to the first one.
    QJsonObject chosen;
    for (const QJsonValue &val : handsArr)
    {
        const QJsonObject obj = val.toObject();
        if (chosen.isEmpty())
            chosen = obj;
        if (obj.value("handedness").toString().compare("Right", Qt::CaseInsensitive) == 0)
        {
            chosen = obj;
            break;
        }
    }

    LandmarkFrame out;
    out.sequence = quint64(root["seq"].toVariant().toULongLong());
    out.timestampMs = qint64(root["timestamp_ms"].toVariant().toLongLong());

    if (chosen.isEmpty())
    {
        if (hasHand)
            *hasHand = false;
        if (frame)
            *frame = out;
        return true;
    }

    out.handedness = chosen.value("handedness").toString();

    const QJsonArray points = chosen.value("landmarks").toArray();
    out.points.reserve(points.size());
    for (const QJsonValue &val : points)
    {
        Landmark p;
        if (!readPoint(val, &p))
            return fail(QStringLiteral("malformed landmark at index %1").arg(out.points.size()));
        out.points.append(p);
    }

    // Short or out-of-range frames are passed on; the classifier rejects them.
    if (hasHand)
        *hasHand = true;
    if (frame)
        *frame = out;
    return true;
}
