#pragma once

#include <optional>
#include <vector>

#include <QDateTime>
#include <QJsonArray>
#include <QJsonObject>
#include <QString>

#include "Marker.h"
#include "Region.h"
#include "ToolkitState.h"
#include "ToolkitTemplate.h"

namespace kitcheck {

// JSON mapping for everything the stores persist. Readers are lenient: unknown enum strings fall back to
// safe defaults and absent fields keep their defaults.
namespace json {

QString formatDateTime(const QDateTime &value);
QDateTime parseDateTime(const QString &value);

QJsonObject regionToJson(const Region &region);
// Reads "roi" or "polygon" from a tool object; nullopt when neither is usable.
std::optional<Region> regionFromTool(const QJsonObject &tool);

QJsonArray markersToJson(const std::vector<Marker> &markers);
std::vector<Marker> markersFromJson(const QJsonArray &array);

QJsonObject toJson(const ToolkitTemplate &toolkitTemplate);
ToolkitTemplate templateFromJson(const QJsonObject &obj);

QJsonObject toJson(const Toolkit &toolkit);
Toolkit toolkitFromJson(const QJsonObject &obj);

QJsonObject toJson(const SlotVerdict &verdict);
SlotVerdict verdictFromJson(const QJsonObject &obj);

QJsonObject toJson(const CheckInRecord &record);
CheckInRecord recordFromJson(const QJsonObject &obj);

bool readObject(const QString &path, QJsonObject *out, QString *errorMessage = nullptr);
bool writeObject(const QString &path, const QJsonObject &obj, QString *errorMessage = nullptr);

} // namespace json

} // namespace kitcheck
