//
// Created by Trixie on 04/03/2026.
//

#include "notification.h"

#include <QMutexLocker>

Notification Notification::progress(int percent) {
    Notification n;
    n.kind = Kind::Progress;
    n.percent = percent;
    return n;
}

Notification Notification::info(const QString& title, const QString& message) {
    Notification n;
    n.kind = Kind::Info;
    n.title = title;
    n.message = message;
    return n;
}

Notification Notification::error(const QString& title, const QString& message) {
    Notification n;
    n.kind = Kind::Error;
    n.title = title;
    n.message = message;
    return n;
}

Notification Notification::finished() {
    Notification n;
    n.kind = Kind::Finished;
    return n;
}

void NotificationQueue::push(const Notification& notification) {
    QMutexLocker locker(&mutex);
    pending.enqueue(notification);
}

QVector<Notification> NotificationQueue::drain() {
    QMutexLocker locker(&mutex);
    QVector<Notification> drained;
    drained.reserve(pending.size());
    while (!pending.isEmpty()) {
        drained.append(pending.dequeue());
    }
    return drained;
}
