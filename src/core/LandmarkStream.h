#pragma once
#include <QByteArray>
#include <QObject>
#include <QTcpSocket>
#include <QString>

#include <optional>

#include "LandmarkSource.h"

/**
 * LandmarkStream
 * -----------------------
 * TCP client for the external hand tracker. The tracker sends one JSON
 * object per line:
 *
 *   {"seq": 12, "timestamp_ms": 1700000000000,
 *    "hands": [{"handedness": "Right", "landmarks": [[x, y, z], ...]}]}
 *
 * Only the newest message is kept; the control loop samples it once per
 * tick through nextFrame().
 */
class LandmarkStream : public QObject, public LandmarkSource
{
    Q_OBJECT

public:
    explicit LandmarkStream(QObject *parent = nullptr);

    void setEndpoint(const QString &host, quint16 port);

    void start();
    void stop();
    bool isConnected() const;

    std::optional<LandmarkFrame> nextFrame(int timeoutMs) override;

    // Parses one wire message. *hasHand is false for an empty "hands" list.
    static bool parseMessage(const QByteArray &line,
                             LandmarkFrame *frame,
                             bool *hasHand,
                             QString *error = nullptr);

signals:
    void connectionStatusChanged(const QString &status);

private slots:
    void onConnected();
    void onDisconnected();
    void onError(QAbstractSocket::SocketError socketError);
    void onReadyRead();

private:
    void processLine(const QByteArray &line);

    QTcpSocket socket_;
    QByteArray buffer_;
    QString host_ = QStringLiteral("127.0.0.1");
    quint16 port_ = 5555;

    std::optional<LandmarkFrame> latest_;
    bool pending_ = false;
    int parseErrors_ = 0;
};
