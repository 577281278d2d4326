#pragma once

#include <QDateTime>
#include <QString>
#include <QUuid>

namespace fasting {
namespace data {

constexpr qint64 DefaultFastDurationSecs = 16 * 3600;
constexpr qint64 DefaultFeedDurationSecs = 8 * 3600;

struct FastingRegimen
{
    QUuid id = QUuid::createUuid();
    QString name;
    qint64 fastDuration = 0; // seconds
    qint64 feedDuration = 0; // seconds, 0 for extended fasts without refeed
    bool isActive = false;
    QDateTime createdAt;
    QDateTime updatedAt;

    double fastHours() const { return static_cast<double>(fastDuration) / 3600.0; }
    double feedHours() const { return static_cast<double>(feedDuration) / 3600.0; }
};

QString defaultRegimenName();
FastingRegimen makeDefaultRegimen(const QDateTime &now);

} // namespace data
} // namespace fasting
