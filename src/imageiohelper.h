#ifndef IMAGEIOHELPER_H
#define IMAGEIOHELPER_H

#include <QString>
#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>
#include <vector>

/**
 * Unicode-safe image I/O.
 *
 * OpenCV's cv::imwrite() and cv::imread() do not accept Unicode paths on every
 * platform, so images are encoded in memory and written through QFile.
 */
class ImageIOHelper
{
public:
    /**
     * Write an image to disk, format chosen from the file extension
     * @param filePath Destination path
     * @param image Image to save
     * @param params Encoder parameters (e.g. PNG compression level)
     * @throws std::runtime_error if encoding or writing fails
     */
    static void writeImage(const QString& filePath, const cv::Mat& image,
                           const std::vector<int>& params = std::vector<int>());

    /**
     * Read an image from disk
     * @param filePath Source path
     * @param flags OpenCV imread flags
     * @return Decoded image, empty if the file is missing or not a decodable image
     */
    static cv::Mat readImage(const QString& filePath, int flags = cv::IMREAD_COLOR);
};

#endif // IMAGEIOHELPER_H
