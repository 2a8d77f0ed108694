#include "JsonCodec.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QJsonValue>

namespace kitcheck {
namespace json {

namespace {

QString qs(const std::string &value)
{
    return QString::fromStdString(value);
}

std::string str(const QJsonValue &value)
{
    return value.toString().toStdString();
}

void insertIfSet(QJsonObject &obj, const QString &key, const std::string &value)
{
    if (!value.empty()) {
        obj.insert(key, qs(value));
    }
}

void insertIfValid(QJsonObject &obj, const QString &key, const QDateTime &value)
{
    if (value.isValid()) {
        obj.insert(key, formatDateTime(value));
    }
}

QJsonArray pointToJson(const cv::Point2f &pt)
{
    return QJsonArray {pt.x, pt.y};
}

std::optional<cv::Point2f> pointFromJson(const QJsonValue &value)
{
    const QJsonArray pair = value.toArray();
    if (pair.size() < 2) {
        return std::nullopt;
    }
    return cv::Point2f(static_cast<float>(pair.at(0).toDouble()), static_cast<float>(pair.at(1).toDouble()));
}

QJsonObject thresholdsToJson(const ThresholdOverrides &thresholds)
{
    QJsonObject obj;
    if (thresholds.brightness) {
        obj.insert(QLatin1String(thresholdKeyName(ThresholdKey::Brightness)), *thresholds.brightness);
    }
    if (thresholds.saturation) {
        obj.insert(QLatin1String(thresholdKeyName(ThresholdKey::Saturation)), *thresholds.saturation);
    }
    if (thresholds.edgeDensity) {
        obj.insert(QLatin1String(thresholdKeyName(ThresholdKey::EdgeDensity)), *thresholds.edgeDensity);
    }
    if (thresholds.occupiedRatio) {
        obj.insert(QLatin1String(thresholdKeyName(ThresholdKey::OccupiedRatio)), *thresholds.occupiedRatio);
    }
    if (thresholds.colorRatio) {
        obj.insert(QLatin1String(thresholdKeyName(ThresholdKey::ColorRatio)), *thresholds.colorRatio);
    }
    return obj;
}

std::optional<double> optionalNumber(const QJsonObject &nested, const QJsonObject &top, ThresholdKey key)
{
    const QString name = QLatin1String(thresholdKeyName(key));
    QJsonValue value = nested.value(name);
    if (!value.isDouble()) {
        value = top.value(name);
    }
    if (!value.isDouble()) {
        return std::nullopt;
    }
    return value.toDouble();
}

ThresholdOverrides thresholdsFromJson(const QJsonObject &obj)
{
    // Older templates carry the overrides at the top level.
    const QJsonObject nested = obj.value(QStringLiteral("thresholds")).toObject();
    ThresholdOverrides thresholds;
    thresholds.brightness = optionalNumber(nested, obj, ThresholdKey::Brightness);
    thresholds.saturation = optionalNumber(nested, obj, ThresholdKey::Saturation);
    thresholds.edgeDensity = optionalNumber(nested, obj, ThresholdKey::EdgeDensity);
    thresholds.occupiedRatio = optionalNumber(nested, obj, ThresholdKey::OccupiedRatio);
    thresholds.colorRatio = optionalNumber(nested, obj, ThresholdKey::ColorRatio);
    return thresholds;
}

// aruco_bounds only records marker centers, one per corner name.
std::vector<Marker> markersFromBounds(const QJsonObject &bounds)
{
    std::vector<Marker> markers;
    for (int id : kRegistrationMarkerIds) {
        const auto center = pointFromJson(bounds.value(QLatin1String(cornerName(id))));
        if (!center) {
            return {};
        }
        markers.push_back(Marker::fromCorners(id, {*center, *center, *center, *center}));
    }
    return markers;
}

QJsonObject signalsToJson(const RegionSignals &metrics)
{
    QJsonObject obj;
    obj.insert(QStringLiteral("brightness_ratio"), metrics.brightnessRatio);
    obj.insert(QStringLiteral("saturation_ratio"), metrics.saturationRatio);
    obj.insert(QStringLiteral("edge_density"), metrics.edgeDensity);
    obj.insert(QStringLiteral("mean_brightness"), metrics.meanBrightness);
    obj.insert(QStringLiteral("mean_saturation"), metrics.meanSaturation);
    obj.insert(QStringLiteral("pixel_count"), metrics.pixelCount);
    return obj;
}

RegionSignals signalsFromJson(const QJsonObject &obj)
{
    RegionSignals metrics;
    metrics.brightnessRatio = obj.value(QStringLiteral("brightness_ratio")).toDouble();
    metrics.saturationRatio = obj.value(QStringLiteral("saturation_ratio")).toDouble();
    metrics.edgeDensity = obj.value(QStringLiteral("edge_density")).toDouble();
    metrics.meanBrightness = obj.value(QStringLiteral("mean_brightness")).toDouble();
    metrics.meanSaturation = obj.value(QStringLiteral("mean_saturation")).toDouble();
    metrics.pixelCount = obj.value(QStringLiteral("pixel_count")).toInt();
    return metrics;
}

QJsonObject toolStateToJson(const ToolState &state)
{
    QJsonObject obj;
    obj.insert(QStringLiteral("tool_id"), qs(state.toolId));
    obj.insert(QStringLiteral("name"), qs(state.name));
    obj.insert(QStringLiteral("status"), state.status ? qs(toString(*state.status)) : QStringLiteral("unknown"));
    obj.insert(QStringLiteral("confidence"), state.confidence);
    insertIfValid(obj, QStringLiteral("last_seen"), state.lastSeen);
    return obj;
}

ToolState toolStateFromJson(const QJsonObject &obj)
{
    ToolState state;
    state.toolId = str(obj.value(QStringLiteral("tool_id")));
    state.name = str(obj.value(QStringLiteral("name")));
    state.status = slotStatusFromString(str(obj.value(QStringLiteral("status"))));
    state.confidence = obj.value(QStringLiteral("confidence")).toDouble();
    state.lastSeen = parseDateTime(obj.value(QStringLiteral("last_seen")).toString());
    return state;
}

QJsonObject registrationToJson(const RegistrationInfo &info)
{
    QJsonObject obj;
    obj.insert(QStringLiteral("markers_detected"), info.markersDetected);
    obj.insert(QStringLiteral("markers_expected"), info.markersExpected);
    obj.insert(QStringLiteral("homography_applied"), info.homographyApplied);
    obj.insert(QStringLiteral("scale_x"), info.scaleX);
    obj.insert(QStringLiteral("scale_y"), info.scaleY);
    insertIfSet(obj, QStringLiteral("fallback_reason"), info.fallbackReason);
    return obj;
}

RegistrationInfo registrationFromJson(const QJsonObject &obj)
{
    RegistrationInfo info;
    info.markersDetected = obj.value(QStringLiteral("markers_detected")).toInt();
    info.markersExpected = obj.value(QStringLiteral("markers_expected")).toInt(4);
    info.homographyApplied = obj.value(QStringLiteral("homography_applied")).toBool(false);
    info.scaleX = obj.value(QStringLiteral("scale_x")).toDouble(1.0);
    info.scaleY = obj.value(QStringLiteral("scale_y")).toDouble(1.0);
    info.fallbackReason = str(obj.value(QStringLiteral("fallback_reason")));
    return info;
}

} // namespace

QString formatDateTime(const QDateTime &value)
{
    if (!value.isValid()) {
        return {};
    }
    return value.toUTC().toString(Qt::ISODateWithMs);
}

QDateTime parseDateTime(const QString &value)
{
    if (value.isEmpty()) {
        return {};
    }
    QDateTime dt = QDateTime::fromString(value, Qt::ISODateWithMs);
    if (!dt.isValid()) {
        dt = QDateTime::fromString(value, Qt::ISODate);
    }
    if (dt.isValid()) {
        dt = dt.toUTC();
    }
    return dt;
}

QJsonObject regionToJson(const Region &region)
{
    QJsonObject obj;
    if (const auto *rect = std::get_if<RectRegion>(&region)) {
        QJsonObject roi;
        roi.insert(QStringLiteral("x"), rect->x);
        roi.insert(QStringLiteral("y"), rect->y);
        roi.insert(QStringLiteral("width"), rect->width);
        roi.insert(QStringLiteral("height"), rect->height);
        obj.insert(QStringLiteral("roi"), roi);
    } else {
        QJsonArray vertices;
        for (const cv::Point &pt : std::get<PolygonRegion>(region).vertices) {
            vertices.append(QJsonArray {pt.x, pt.y});
        }
        obj.insert(QStringLiteral("polygon"), vertices);
    }
    return obj;
}

std::optional<Region> regionFromTool(const QJsonObject &tool)
{
    const QJsonValue polygon = tool.value(QStringLiteral("polygon"));
    if (polygon.isArray()) {
        PolygonRegion region;
        for (const QJsonValue &vertex : polygon.toArray()) {
            const auto pt = pointFromJson(vertex);
            if (!pt) {
                return std::nullopt;
            }
            region.vertices.emplace_back(cvRound(pt->x), cvRound(pt->y));
        }
        return Region(region);
    }

    const QJsonValue roiValue = tool.value(QStringLiteral("roi"));
    if (!roiValue.isObject()) {
        return std::nullopt;
    }
    const QJsonObject roi = roiValue.toObject();
    RectRegion region;
    region.x = cvRound(roi.value(QStringLiteral("x")).toDouble());
    region.y = cvRound(roi.value(QStringLiteral("y")).toDouble());
    region.width = cvRound(roi.value(QStringLiteral("width")).toDouble());
    region.height = cvRound(roi.value(QStringLiteral("height")).toDouble());
    return Region(region);
}

QJsonArray markersToJson(const std::vector<Marker> &markers)
{
    QJsonArray array;
    for (const Marker &marker : markers) {
        QJsonObject obj;
        obj.insert(QStringLiteral("id"), marker.id);
        QJsonArray corners;
        for (const cv::Point2f &corner : marker.corners) {
            corners.append(pointToJson(corner));
        }
        obj.insert(QStringLiteral("corners"), corners);
        obj.insert(QStringLiteral("center"), pointToJson(marker.center));
        array.append(obj);
    }
    return array;
}

std::vector<Marker> markersFromJson(const QJsonArray &array)
{
    std::vector<Marker> markers;
    for (const QJsonValue &value : array) {
        const QJsonObject obj = value.toObject();
        const QJsonArray corners = obj.value(QStringLiteral("corners")).toArray();
        if (corners.size() != 4) {
            continue;
        }
        std::array<cv::Point2f, 4> pts {};
        bool ok = true;
        for (int i = 0; i < 4; ++i) {
            const auto pt = pointFromJson(corners.at(i));
            if (!pt) {
                ok = false;
                break;
            }
            pts[static_cast<size_t>(i)] = *pt;
        }
        if (ok) {
            markers.push_back(Marker::fromCorners(obj.value(QStringLiteral("id")).toInt(-1), pts));
        }
    }
    return markers;
}

QJsonObject toJson(const ToolkitTemplate &toolkitTemplate)
{
    QJsonObject obj;
    obj.insert(QStringLiteral("template_id"), qs(toolkitTemplate.templateId));
    obj.insert(QStringLiteral("name"), qs(toolkitTemplate.name));
    insertIfSet(obj, QStringLiteral("description"), toolkitTemplate.description);
    obj.insert(QStringLiteral("foam_color"), qs(toString(toolkitTemplate.foamColor)));
    if (toolkitTemplate.hasReferenceFrame()) {
        obj.insert(QStringLiteral("image_width"), toolkitTemplate.referenceSize.width);
        obj.insert(QStringLiteral("image_height"), toolkitTemplate.referenceSize.height);
    }
    insertIfSet(obj, QStringLiteral("reference_image"), toolkitTemplate.referenceImagePath);
    if (!toolkitTemplate.thresholds.empty()) {
        obj.insert(QStringLiteral("thresholds"), thresholdsToJson(toolkitTemplate.thresholds));
    }
    if (!toolkitTemplate.referenceMarkers.empty()) {
        obj.insert(QStringLiteral("reference_markers"), markersToJson(toolkitTemplate.referenceMarkers));
    }

    QJsonArray tools;
    for (const ToolDefinition &tool : toolkitTemplate.tools) {
        QJsonObject entry = tool.region ? regionToJson(*tool.region) : QJsonObject();
        entry.insert(QStringLiteral("tool_id"), qs(tool.toolId));
        entry.insert(QStringLiteral("name"), qs(tool.name));
        entry.insert(QStringLiteral("slot_index"), tool.slotIndex);
        insertIfSet(entry, QStringLiteral("description"), tool.description);
        tools.append(entry);
    }
    obj.insert(QStringLiteral("tools"), tools);
    return obj;
}

ToolkitTemplate templateFromJson(const QJsonObject &obj)
{
    ToolkitTemplate toolkitTemplate;
    toolkitTemplate.templateId = str(obj.value(QStringLiteral("template_id")));
    toolkitTemplate.name = str(obj.value(QStringLiteral("name")));
    toolkitTemplate.description = str(obj.value(QStringLiteral("description")));
    toolkitTemplate.foamColor = foamColorFromString(str(obj.value(QStringLiteral("foam_color"))));
    toolkitTemplate.referenceSize = cv::Size(obj.value(QStringLiteral("image_width")).toInt(0),
                                             obj.value(QStringLiteral("image_height")).toInt(0));
    toolkitTemplate.referenceImagePath = str(obj.value(QStringLiteral("reference_image")));
    toolkitTemplate.thresholds = thresholdsFromJson(obj);

    if (obj.contains(QStringLiteral("reference_markers"))) {
        toolkitTemplate.referenceMarkers = markersFromJson(obj.value(QStringLiteral("reference_markers")).toArray());
    } else if (obj.value(QStringLiteral("aruco_bounds")).isObject()) {
        toolkitTemplate.referenceMarkers = markersFromBounds(obj.value(QStringLiteral("aruco_bounds")).toObject());
    }

    const QJsonArray tools = obj.value(QStringLiteral("tools")).toArray();
    int position = 0;
    for (const QJsonValue &value : tools) {
        const QJsonObject entry = value.toObject();
        ToolDefinition tool;
        tool.toolId = str(entry.value(QStringLiteral("tool_id")));
        tool.name = str(entry.value(QStringLiteral("name")));
        tool.description = str(entry.value(QStringLiteral("description")));
        ++position;
        const int slot = entry.value(QStringLiteral("slot_index")).toInt(0);
        tool.slotIndex = slot > 0 ? slot : position;
        tool.region = regionFromTool(entry);
        toolkitTemplate.tools.push_back(tool);
    }
    return toolkitTemplate;
}

QJsonObject toJson(const Toolkit &toolkit)
{
    QJsonObject obj;
    obj.insert(QStringLiteral("toolkit_id"), qs(toolkit.toolkitId));
    obj.insert(QStringLiteral("template_id"), qs(toolkit.templateId));
    obj.insert(QStringLiteral("name"), qs(toolkit.name));
    insertIfSet(obj, QStringLiteral("description"), toolkit.description);
    obj.insert(QStringLiteral("status"), qs(toString(toolkit.status)));
    insertIfSet(obj, QStringLiteral("location"), toolkit.location);

    QJsonArray states;
    for (const ToolState &state : toolkit.toolStates) {
        states.append(toolStateToJson(state));
    }
    obj.insert(QStringLiteral("tool_states"), states);

    insertIfValid(obj, QStringLiteral("last_checkin"), toolkit.lastCheckIn);
    insertIfValid(obj, QStringLiteral("last_checkout"), toolkit.lastCheckOut);
    insertIfValid(obj, QStringLiteral("created_at"), toolkit.createdAt);
    insertIfValid(obj, QStringLiteral("updated_at"), toolkit.updatedAt);
    return obj;
}

Toolkit toolkitFromJson(const QJsonObject &obj)
{
    Toolkit toolkit;
    toolkit.toolkitId = str(obj.value(QStringLiteral("toolkit_id")));
    toolkit.templateId = str(obj.value(QStringLiteral("template_id")));
    toolkit.name = str(obj.value(QStringLiteral("name")));
    toolkit.description = str(obj.value(QStringLiteral("description")));
    toolkit.status = toolkitStatusFromString(str(obj.value(QStringLiteral("status"))));
    toolkit.location = str(obj.value(QStringLiteral("location")));
    for (const QJsonValue &value : obj.value(QStringLiteral("tool_states")).toArray()) {
        toolkit.toolStates.push_back(toolStateFromJson(value.toObject()));
    }
    toolkit.lastCheckIn = parseDateTime(obj.value(QStringLiteral("last_checkin")).toString());
    toolkit.lastCheckOut = parseDateTime(obj.value(QStringLiteral("last_checkout")).toString());
    toolkit.createdAt = parseDateTime(obj.value(QStringLiteral("created_at")).toString());
    toolkit.updatedAt = parseDateTime(obj.value(QStringLiteral("updated_at")).toString());
    return toolkit;
}

QJsonObject toJson(const SlotVerdict &verdict)
{
    QJsonObject obj;
    obj.insert(QStringLiteral("tool_id"), qs(verdict.toolId));
    obj.insert(QStringLiteral("name"), qs(verdict.name));
    obj.insert(QStringLiteral("slot_index"), verdict.slotIndex);
    obj.insert(QStringLiteral("status"), qs(toString(verdict.status)));
    obj.insert(QStringLiteral("confidence"), verdict.confidence);
    obj.insert(QStringLiteral("debug_info"), signalsToJson(verdict.metrics));
    insertIfSet(obj, QStringLiteral("note"), verdict.note);
    return obj;
}

SlotVerdict verdictFromJson(const QJsonObject &obj)
{
    SlotVerdict verdict;
    verdict.toolId = str(obj.value(QStringLiteral("tool_id")));
    verdict.name = str(obj.value(QStringLiteral("name")));
    verdict.slotIndex = obj.value(QStringLiteral("slot_index")).toInt();
    verdict.status = slotStatusFromString(str(obj.value(QStringLiteral("status")))).value_or(SlotStatus::Uncertain);
    verdict.confidence = obj.value(QStringLiteral("confidence")).toDouble();
    verdict.metrics = signalsFromJson(obj.value(QStringLiteral("debug_info")).toObject());
    verdict.note = str(obj.value(QStringLiteral("note")));
    return verdict;
}

QJsonObject toJson(const CheckInRecord &record)
{
    QJsonObject obj;
    obj.insert(QStringLiteral("checkin_id"), qs(record.checkinId));
    obj.insert(QStringLiteral("toolkit_id"), qs(record.toolkitId));
    obj.insert(QStringLiteral("template_id"), qs(record.templateId));
    obj.insert(QStringLiteral("timestamp"), formatDateTime(record.timestamp));
    obj.insert(QStringLiteral("status"), qs(toString(record.status)));

    QJsonArray tools;
    for (const SlotVerdict &verdict : record.verdicts) {
        tools.append(toJson(verdict));
    }
    obj.insert(QStringLiteral("tools"), tools);

    QJsonObject summary;
    summary.insert(QStringLiteral("total_tools"), record.summary.total);
    summary.insert(QStringLiteral("present"), record.summary.present);
    summary.insert(QStringLiteral("missing"), record.summary.missing);
    summary.insert(QStringLiteral("uncertain"), record.summary.uncertain);
    obj.insert(QStringLiteral("summary"), summary);

    obj.insert(QStringLiteral("registration"), registrationToJson(record.registration));
    insertIfSet(obj, QStringLiteral("annotated_image"), record.annotatedImagePath);
    insertIfSet(obj, QStringLiteral("thumbnail"), record.thumbnailPath);
    insertIfSet(obj, QStringLiteral("notes"), record.note);
    insertIfSet(obj, QStringLiteral("checked_in_by"), record.actor);
    return obj;
}

CheckInRecord recordFromJson(const QJsonObject &obj)
{
    CheckInRecord record;
    record.checkinId = str(obj.value(QStringLiteral("checkin_id")));
    record.toolkitId = str(obj.value(QStringLiteral("toolkit_id")));
    record.templateId = str(obj.value(QStringLiteral("template_id")));
    record.timestamp = parseDateTime(obj.value(QStringLiteral("timestamp")).toString());
    record.status = toolkitStatusFromString(str(obj.value(QStringLiteral("status"))), ToolkitStatus::Incomplete);
    for (const QJsonValue &value : obj.value(QStringLiteral("tools")).toArray()) {
        record.verdicts.push_back(verdictFromJson(value.toObject()));
    }

    const QJsonObject summary = obj.value(QStringLiteral("summary")).toObject();
    record.summary.total = summary.value(QStringLiteral("total_tools")).toInt();
    record.summary.present = summary.value(QStringLiteral("present")).toInt();
    record.summary.missing = summary.value(QStringLiteral("missing")).toInt();
    record.summary.uncertain = summary.value(QStringLiteral("uncertain")).toInt();

    record.registration = registrationFromJson(obj.value(QStringLiteral("registration")).toObject());
    record.annotatedImagePath = str(obj.value(QStringLiteral("annotated_image")));
    record.thumbnailPath = str(obj.value(QStringLiteral("thumbnail")));
    record.note = str(obj.value(QStringLiteral("notes")));
    record.actor = str(obj.value(QStringLiteral("checked_in_by")));
    return record;
}

bool readObject(const QString &path, QJsonObject *out, QString *errorMessage)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("Failed to open %1: %2").arg(path, file.errorString());
        }
        return false;
    }

    QJsonParseError parseError {};
    const QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (parseError.error != QJsonParseError::NoError) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("Invalid JSON in %1: %2").arg(path, parseError.errorString());
        }
        return false;
    }
    if (!doc.isObject()) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("%1 is not a JSON object").arg(path);
        }
        return false;
    }
    if (out) {
        *out = doc.object();
    }
    return true;
}

bool writeObject(const QString &path, const QJsonObject &obj, QString *errorMessage)
{
    const QFileInfo info(path);
    if (!QDir().mkpath(info.absolutePath())) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("Failed to create directory %1").arg(info.absolutePath());
        }
        return false;
    }

    QFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("Failed to write %1: %2").arg(path, file.errorString());
        }
        return false;
    }
    const QJsonDocument doc(obj);
    if (file.write(doc.toJson(QJsonDocument::Indented)) < 0) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("Failed to write %1: %2").arg(path, file.errorString());
        }
        return false;
    }
    file.close();
    return true;
}

} // namespace json
} // namespace kitcheck
