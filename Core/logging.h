//
// Created by Trixie on 05/03/2026.
//

#ifndef CHANNELSPLITTER_LOGGING_H
#define CHANNELSPLITTER_LOGGING_H

#include <QString>

// Routes Qt logging to stdout and, when it can be opened, logFilePath.
// Calling it again closes the previous log file.
void setupLogging(const QString& logFilePath);

QString defaultLogPath();

#endif //CHANNELSPLITTER_LOGGING_H
