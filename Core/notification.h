//
// Created by Trixie on 04/03/2026.
//

#ifndef CHANNELSPLITTER_NOTIFICATION_H
#define CHANNELSPLITTER_NOTIFICATION_H

#include <QMutex>
#include <QQueue>
#include <QString>
#include <QVector>

struct Notification {
    enum class Kind {
        Progress,
        Info,
        Error,
        Finished
    };

    Kind kind = Kind::Info;
    QString title;
    QString message;
    int percent = 0;

    static Notification progress(int percent);
    static Notification info(const QString& title, const QString& message);
    static Notification error(const QString& title, const QString& message);
    static Notification finished();
};

// Single writer (the worker) and single reader (the GUI timer).
class NotificationQueue {
public:
    void push(const Notification& notification);
    QVector<Notification> drain();

private:
    QMutex mutex;
    QQueue<Notification> pending;
};

#endif //CHANNELSPLITTER_NOTIFICATION_H
