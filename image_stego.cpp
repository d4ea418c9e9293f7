#include "image_stego.hpp"

#include <opencv2/imgcodecs.hpp>

#include <vector>
#include <iostream>
#include <cstdint>

namespace imgstego {

    static const uint8_t MAGIC[4] = { 'V', 'S', 'T', '1' };
    static const size_t HEADER_BITS = 64; // magic + length

    // Reads `count` bits starting at bit `pos`, MSB first.
    static uint32_t readBits(const cv::Mat& img, size_t pos, int count) {
        uint32_t value = 0;
        for (int i = 0; i < count; ++i, ++pos) {
            size_t pixel = pos / 3;
            int c = static_cast<int>(pos % 3);
            int y = static_cast<int>(pixel / img.cols);
            int x = static_cast<int>(pixel % img.cols);
            value = (value << 1) | (img.at<cv::Vec3b>(y, x)[c] & 1);
        }
        return value;
    }

    size_t capacityBits(const cv::Mat& img)
    {
        if (img.empty() || img.type() != CV_8UC3) {
            return 0;
        }
        return img.total() * 3;  // 3 channels, 1 bit each
    }

    bool embedTextInImage(cv::Mat& img, const std::string& message)
    {
        if (img.empty() || img.type() != CV_8UC3) {
            std::cerr << "[lsb] cover must be an 8-bit 3-channel image\n";
            return false;
        }

        uint32_t msgLen = static_cast<uint32_t>(message.size());
        size_t totalBits = HEADER_BITS + static_cast<size_t>(msgLen) * 8;
        size_t capacity = capacityBits(img);

        if (totalBits > capacity) {
            std::cerr << "[lsb] Message too long. Need " << totalBits
                      << " bits, capacity = " << capacity << " bits.\n";
            return false;
        }

        // 构造 bit 流
        std::vector<uint8_t> bits;
        bits.reserve(totalBits);

        for (uint8_t byte : MAGIC) {
            for (int i = 7; i >= 0; --i) {
                bits.push_back((byte >> i) & 1);
            }
        }

        // 长度（32 bit，大端）
        for (int i = 31; i >= 0; --i) {
            bits.push_back((msgLen >> i) & 1);
        }

        for (unsigned char byte : message) {
            for (int i = 7; i >= 0; --i) {
                bits.push_back((byte >> i) & 1);
            }
        }

        size_t bitIndex = 0;
        for (int y = 0; y < img.rows && bitIndex < bits.size(); ++y) {
            for (int x = 0; x < img.cols && bitIndex < bits.size(); ++x) {
                cv::Vec3b& pixel = img.at<cv::Vec3b>(y, x);
                for (int c = 0; c < 3 && bitIndex < bits.size(); ++c) {
                    uint8_t bit = bits[bitIndex++];
                    pixel[c] = (pixel[c] & 0xFE) | bit; // 清 LSB 再写
                }
            }
        }

        return true;
    }

    std::optional<std::string> revealTextFromImage(const cv::Mat& img)
    {
        size_t capacity = capacityBits(img);
        if (capacity < HEADER_BITS) {
            return std::nullopt;
        }

        for (int i = 0; i < 4; ++i) {
            if (readBits(img, static_cast<size_t>(i) * 8, 8) != MAGIC[i]) {
                return std::nullopt;
            }
        }

        uint32_t msgLen = readBits(img, 32, 32);
        size_t neededBits = HEADER_BITS + static_cast<size_t>(msgLen) * 8;
        if (neededBits > capacity) {
            std::cerr << "[lsb] header claims " << msgLen
                      << " bytes, more than the image holds\n";
            return std::nullopt;
        }

        std::string message;
        message.reserve(msgLen);

        size_t bitPos = HEADER_BITS;
        for (uint32_t b = 0; b < msgLen; ++b) {
            message.push_back(static_cast<char>(readBits(img, bitPos, 8)));
            bitPos += 8;
        }
        return message;
    }

    bool embedTextLSB(const std::string& coverImagePath,
                      const std::string& stegoImagePath,
                      const std::string& message)
    {
        cv::Mat img = cv::imread(coverImagePath, cv::IMREAD_COLOR);
        if (img.empty()) {
            std::cerr << "[embed] Failed to load image: " << coverImagePath << std::endl;
            return false;
        }

        if (!embedTextInImage(img, message)) {
            return false;
        }

        if (!cv::imwrite(stegoImagePath, img)) {
            std::cerr << "[embed] Failed to save stego image: " << stegoImagePath << std::endl;
            return false;
        }

        return true;
    }

    bool convertImage(const std::string& srcPath, const std::string& dstPath)
    {
        cv::Mat img = cv::imread(srcPath, cv::IMREAD_COLOR);
        if (img.empty()) {
            std::cerr << "[embed] Failed to load image: " << srcPath << std::endl;
            return false;
        }
        if (!cv::imwrite(dstPath, img)) {
            std::cerr << "[embed] Failed to save image: " << dstPath << std::endl;
            return false;
        }
        return true;
    }

    bool revealTextLSB(const std::string& stegoImagePath,
                       std::optional<std::string>& outMessage)
    {
        outMessage.reset();

        cv::Mat img = cv::imread(stegoImagePath, cv::IMREAD_COLOR);
        if (img.empty()) {
            std::cerr << "[extract] Failed to load image: " << stegoImagePath << std::endl;
            return false;
        }

        outMessage = revealTextFromImage(img);
        return true;
    }

} // namespace imgstego
