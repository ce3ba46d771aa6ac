// JSON rendering of scheduler snapshots for the status printout.
#pragma once
#include <QJsonObject>
#include "mediarelay/TransferTypes.hpp"

QJsonObject statusToJson(const mediarelay::SchedulerStatus &st);
QJsonObject enqueueResultToJson(const mediarelay::TransferTask &task,
                                const mediarelay::EnqueueResult &r);
