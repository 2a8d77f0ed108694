#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include <QByteArray>
#include <QString>

#include <opencv2/core.hpp>

namespace kitcheck {

// Image intake and output. Decoding problems are reported as DecodeError.
class ImageLoader {
public:
    ImageLoader() = default;

    // Encoded bytes (PNG, JPEG, ...) to a BGR image.
    [[nodiscard]] cv::Mat decodeImage(const QByteArray &bytes) const;

    // Raw interleaved 8-bit pixels, rows tightly packed. channels: 1 (gray), 3 (BGR) or 4 (BGRA).
    [[nodiscard]] cv::Mat imageFromPixelBuffer(const std::vector<std::uint8_t> &pixels,
                                               int width,
                                               int height,
                                               int channels) const;

    [[nodiscard]] cv::Mat loadImage(const std::string &path) const;

    bool saveImage(const cv::Mat &image, const QString &path, QString *errorMessage = nullptr) const;

    [[nodiscard]] QByteArray encodePng(const cv::Mat &image) const;

    // Shrinks to maxWidth keeping aspect ratio; narrower images are returned unchanged.
    [[nodiscard]] cv::Mat makeThumbnail(const cv::Mat &image, int maxWidth = 150) const;
};

} // namespace kitcheck
