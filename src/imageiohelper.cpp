#include "imageiohelper.h"
#include <QFile>
#include <QFileInfo>
#include <opencv2/imgcodecs.hpp>
#include <stdexcept>

void ImageIOHelper::writeImage(const QString& filePath, const cv::Mat& image,
                               const std::vector<int>& params)
{
    if (image.empty()) {
        throw std::runtime_error("Refusing to write empty image: " + filePath.toStdString());
    }

    QString suffix = QFileInfo(filePath).suffix().toLower();
    if (suffix.isEmpty()) {
        suffix = "png";
    }

    std::vector<uchar> buffer;
    if (!cv::imencode("." + suffix.toStdString(), image, buffer, params)) {
        throw std::runtime_error("Failed to encode image: " + filePath.toStdString());
    }

    QFile file(filePath);
    if (!file.open(QIODevice::WriteOnly)) {
        throw std::runtime_error("Failed to open for writing: " + filePath.toStdString() +
                                 " (" + file.errorString().toStdString() + ")");
    }

    qint64 written = file.write(reinterpret_cast<const char*>(buffer.data()),
                                static_cast<qint64>(buffer.size()));
    file.close();

    if (written != static_cast<qint64>(buffer.size())) {
        throw std::runtime_error("Short write to " + filePath.toStdString());
    }
}

cv::Mat ImageIOHelper::readImage(const QString& filePath, int flags)
{
    QFile file(filePath);
    if (!file.open(QIODevice::ReadOnly)) {
        return cv::Mat();
    }

    QByteArray fileData = file.readAll();
    file.close();

    if (fileData.isEmpty()) {
        return cv::Mat();
    }

    std::vector<uchar> buffer(fileData.begin(), fileData.end());
    return cv::imdecode(buffer, flags);
}
