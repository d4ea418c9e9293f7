#ifndef IMAGE_STEGO_HPP
#define IMAGE_STEGO_HPP

#include <opencv2/core.hpp>

#include <optional>
#include <string>

// LSB text payload in an 8-bit BGR image.
// Bit stream, MSB first, one bit per channel in B,G,R pixel order:
//   "VST1" magic (32 bit) | length (32 bit, big endian) | bytes
namespace imgstego {

    // Bits available for the payload including the 64-bit header.
    size_t capacityBits(const cv::Mat& img);

    bool embedTextInImage(cv::Mat& img, const std::string& message);

    // nullopt if no payload marker is present or the header is inconsistent.
    std::optional<std::string> revealTextFromImage(const cv::Mat& img);

    // File variants. coverImagePath and stegoImagePath may be the same file.
    bool embedTextLSB(const std::string& coverImagePath,
                      const std::string& stegoImagePath,
                      const std::string& message);

    // Re-encode src as dst (e.g. a JPEG cover to a PNG the payload can live in).
    bool convertImage(const std::string& srcPath, const std::string& dstPath);

    // false only if the image cannot be read.
    bool revealTextLSB(const std::string& stegoImagePath,
                       std::optional<std::string>& outMessage);

}

#endif // IMAGE_STEGO_HPP
