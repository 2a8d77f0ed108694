#include "ImageLoader.h"

#include <algorithm>

#include <QBuffer>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QImage>
#include <QImageReader>

#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

#include "Errors.h"

namespace kitcheck {

namespace {

cv::Mat fromQImage(QImage qimage)
{
    if (qimage.isNull()) {
        return cv::Mat();
    }
    qimage = qimage.convertToFormat(QImage::Format_RGB888);
    if (qimage.isNull()) {
        return cv::Mat();
    }
    cv::Mat wrapped(qimage.height(), qimage.width(), CV_8UC3, const_cast<uchar *>(qimage.bits()),
                    qimage.bytesPerLine());
    cv::Mat bgr;
    cv::cvtColor(wrapped, bgr, cv::COLOR_RGB2BGR);
    return bgr;
}

cv::Mat normalizeChannels(const cv::Mat &image)
{
    if (image.channels() == 3) {
        return image;
    }
    cv::Mat bgr;
    if (image.channels() == 1) {
        cv::cvtColor(image, bgr, cv::COLOR_GRAY2BGR);
    } else {
        cv::cvtColor(image, bgr, cv::COLOR_BGRA2BGR);
    }
    return bgr;
}

} // namespace

cv::Mat ImageLoader::decodeImage(const QByteArray &bytes) const
{
    if (bytes.isEmpty()) {
        throw DecodeError("Image payload is empty");
    }

    const cv::Mat buffer(1, static_cast<int>(bytes.size()), CV_8UC1, const_cast<char *>(bytes.constData()));
    cv::Mat image = cv::imdecode(buffer, cv::IMREAD_COLOR);
    if (!image.empty()) {
        return image;
    }

    // Formats OpenCV was built without may still be readable through Qt's plugins
    QBuffer device;
    device.setData(bytes);
    QImageReader reader(&device);
    reader.setAutoTransform(true);
    image = fromQImage(reader.read());
    if (image.empty()) {
        throw DecodeError("Could not decode image: " + reader.errorString().toStdString());
    }
    return image;
}

cv::Mat ImageLoader::imageFromPixelBuffer(const std::vector<std::uint8_t> &pixels,
                                          int width,
                                          int height,
                                          int channels) const
{
    if (width <= 0 || height <= 0) {
        throw DecodeError("Pixel buffer has invalid dimensions " + std::to_string(width) + "x" +
                          std::to_string(height));
    }
    if (channels != 1 && channels != 3 && channels != 4) {
        throw DecodeError("Unsupported channel count " + std::to_string(channels));
    }
    const size_t expected = static_cast<size_t>(width) * static_cast<size_t>(height) * static_cast<size_t>(channels);
    if (pixels.size() != expected) {
        throw DecodeError("Pixel buffer holds " + std::to_string(pixels.size()) + " bytes, expected " +
                          std::to_string(expected));
    }

    const cv::Mat wrapped(height, width, CV_8UC(channels), const_cast<std::uint8_t *>(pixels.data()));
    return normalizeChannels(wrapped.clone());
}

cv::Mat ImageLoader::loadImage(const std::string &path) const
{
    cv::Mat image = cv::imread(path, cv::IMREAD_COLOR);
    if (!image.empty()) {
        return image;
    }

    QImageReader reader(QString::fromStdString(path));
    reader.setAutoTransform(true);
    image = fromQImage(reader.read());
    if (image.empty()) {
        throw DecodeError("Failed to read image: " + path + ", error: " + reader.errorString().toStdString());
    }
    return image;
}

bool ImageLoader::saveImage(const cv::Mat &image, const QString &path, QString *errorMessage) const
{
    if (image.empty()) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("Nothing to write to %1").arg(path);
        }
        return false;
    }
    const QFileInfo info(path);
    if (!QDir().mkpath(info.absolutePath())) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("Failed to create directory %1").arg(info.absolutePath());
        }
        return false;
    }

    bool ok = false;
    try {
        ok = cv::imwrite(path.toStdString(), image);
    } catch (const cv::Exception &ex) {
        if (errorMessage) {
            *errorMessage = QString::fromStdString(ex.what());
        }
        return false;
    }
    if (!ok && errorMessage) {
        *errorMessage = QStringLiteral("Failed to write image %1").arg(path);
    }
    return ok;
}

QByteArray ImageLoader::encodePng(const cv::Mat &image) const
{
    std::vector<uchar> buffer;
    if (image.empty() || !cv::imencode(".png", image, buffer)) {
        return QByteArray();
    }
    return QByteArray(reinterpret_cast<const char *>(buffer.data()), static_cast<int>(buffer.size()));
}

cv::Mat ImageLoader::makeThumbnail(const cv::Mat &image, int maxWidth) const
{
    if (image.empty() || maxWidth <= 0 || image.cols <= maxWidth) {
        return image;
    }
    const double ratio = static_cast<double>(maxWidth) / image.cols;
    const int height = std::max(1, static_cast<int>(image.rows * ratio));
    cv::Mat thumb;
    cv::resize(image, thumb, cv::Size(maxWidth, height), 0.0, 0.0, cv::INTER_AREA);
    return thumb;
}

} // namespace kitcheck
